#pragma once

#include <string>
#include <vector>

#include "looptrim/common/result_types.h"
#include "looptrim/modules/alignment/alignment_builder.h"
#include "looptrim/modules/mapping/residue_index_mapper.h"

namespace looptrim {
namespace engine {

/**
 * Everything an engine needs to build models for one target.
 */
struct ModelingJob {
    std::string id;              // Target code; models are named <id>.<n>
    std::string alignment_path;  // <id>.ali written by the pipeline
    std::string structure_path;  // Template structure
    std::string output_dir;      // Where models and score tables go
    alignment::AlignmentRecord alignment;
};

/**
 * Structure builder and scorer.
 *
 * Implementations build model_count candidates from the alignment, placing
 * only the residues the selection predicate maps to an output index, and
 * report one CandidateModel per requested model. A model the engine could
 * not build comes back with failed set rather than being left out.
 */
class ModelingEngine {
public:
    virtual ~ModelingEngine() = default;

    virtual std::string name() const = 0;

    /**
     * @throws EngineError if the engine itself fails
     */
    virtual std::vector<CandidateModel> submit(const ModelingJob& job,
                                               const mapping::SelectionPredicate& selection,
                                               int model_count) = 0;
};

}  // namespace engine
}  // namespace looptrim
