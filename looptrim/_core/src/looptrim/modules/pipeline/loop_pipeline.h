#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "looptrim/common/result_types.h"
#include "looptrim/engine/modeling_engine.h"
#include "looptrim/modules/alignment/alignment_builder.h"
#include "looptrim/modules/loops/loop_spec.h"
#include "looptrim/modules/mapping/residue_index_mapper.h"
#include "looptrim/modules/ranking/model_ranker.h"

namespace looptrim {
namespace pipeline {

/**
 * Settings for one loop-trimming run, filled from CLI flags.
 */
struct PipelineConfig {
    std::string fasta_path;      // Full target sequence (first record is used)
    std::string id;              // Target code; names every output file
    std::string structure_path;  // Template structure
    std::string chain_id = "A";
    std::vector<std::string> loop_tokens;  // "start:end"
    std::vector<std::string> keep_tokens;  // "keep_n:keep_c"
    int model_count = 5;
    std::string output_dir = ".";
};

/**
 * Alignment and mapping state shared by every later stage.
 */
struct PreparedInputs {
    loops::LoopSet loops;
    alignment::AlignmentRecord alignment;
    mapping::ResidueIndexMapper mapper;
    std::string alignment_path;  // <out>/<id>.ali
    std::string selection_path;  // <out>/<id>.sel
};

/**
 * Everything run_pipeline() produced.
 */
struct PipelineResult {
    ranking::RankedModels ranked;
    std::vector<RenumberedModel> renumbered;
};

/**
 * Check paths and scalar settings.
 *
 * @throws ConfigError, FileNotFoundError
 */
void validate_config(const PipelineConfig& config);

/**
 * Parse loops, build the gapped alignment and the mapper, and write
 * <id>.ali and <id>.sel into the output directory.
 */
PreparedInputs prepare_inputs(const PipelineConfig& config);

/**
 * Print one line per loop and the totals of the trimmed sequence.
 */
void print_mapping_summary(const PreparedInputs& inputs, std::ostream& out);

/**
 * Prepare inputs, run the engine, rank its candidates and renumber every
 * accepted model onto template numbering. The "Top model" line and the
 * renumbering progress block go to out.
 *
 * @throws LooptrimError from any stage; nothing is caught here
 */
PipelineResult run_pipeline(const PipelineConfig& config, engine::ModelingEngine& engine,
                            std::ostream& out);

}  // namespace pipeline
}  // namespace looptrim
