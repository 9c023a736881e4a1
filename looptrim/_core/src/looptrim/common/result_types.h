#pragma once

#include <cstddef>
#include <string>

namespace looptrim {

/**
 * One model produced by the modeling engine.
 *
 * quality_score is the primary ranking key (a statistical potential such
 * as DOPE, lower is better); secondary_score is reported alongside it.
 */
struct CandidateModel {
    std::string name;  // e.g. "1abc.3"
    std::string path;  // Structure file written by the engine
    double quality_score = 0.0;
    double secondary_score = 0.0;
    bool failed = false;
};

/**
 * Candidate after its numbering was transferred back from the template.
 */
struct RenumberedModel {
    std::string name;
    std::string output_path;  // <stem>_renum.pdb
    size_t num_residues = 0;
};

}  // namespace looptrim
