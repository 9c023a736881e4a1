#include "loop_pipeline.h"

#include <filesystem>
#include <ostream>
#include <system_error>

#include "looptrim/common/logging.h"
#include "looptrim/errors/messages.h"
#include "looptrim/errors/validators.h"
#include "looptrim/io/fasta_reader.h"
#include "looptrim/io/pdb_parser.h"
#include "looptrim/modules/renumber/residue_renumberer.h"

namespace fs = std::filesystem;

namespace looptrim {
namespace pipeline {

namespace {

void ensure_output_dir(const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw errors::messages::file_write_error(dir, ec.message());
    }
}

}  // namespace

void validate_config(const PipelineConfig& config) {
    validation::validate_file_exists(config.fasta_path, "sequence file");
    validation::validate_file_exists(config.structure_path, "template structure");
    validation::validate_positive(config.model_count, "models");

    if (config.id.empty()) {
        throw errors::ConfigError("Target ID is empty", "Give the code used to name output files");
    }
    if (config.chain_id.size() != 1) {
        throw errors::ConfigError("Chain ID must be a single character",
                                  "Use e.g. --chain A", "got '" + config.chain_id + "'");
    }
}

PreparedInputs prepare_inputs(const PipelineConfig& config) {
    validate_config(config);
    ensure_output_dir(config.output_dir);

    io::FastaRecord record = io::read_first_fasta_record(config.fasta_path);
    const int sequence_length = static_cast<int>(record.sequence.size());
    common::log_info("Read " + std::to_string(sequence_length) + " residues from " +
                     config.fasta_path);

    loops::LoopSet loop_set =
        loops::parse_loop_set(config.loop_tokens, config.keep_tokens, sequence_length);

    const fs::path structure(config.structure_path);
    alignment::AlignmentIds ids;
    ids.template_id = structure.stem().string();
    ids.structure_file = structure.filename().string();
    ids.chain_id = config.chain_id;
    ids.target_id = config.id;

    alignment::AlignmentRecord aln = alignment::build_alignment(record.sequence, loop_set, ids);
    mapping::ResidueIndexMapper mapper(loop_set, sequence_length);

    const fs::path out_dir(config.output_dir);
    const std::string alignment_path = (out_dir / (config.id + ".ali")).string();
    const std::string selection_path = (out_dir / (config.id + ".sel")).string();

    alignment::write_alignment(aln, alignment_path);
    mapping::write_selection_file(selection_path, mapper.mapping_table());
    common::log_info("Wrote selection table " + selection_path);

    return PreparedInputs{std::move(loop_set), std::move(aln), std::move(mapper), alignment_path,
                          selection_path};
}

void print_mapping_summary(const PreparedInputs& inputs, std::ostream& out) {
    out << "Loops (" << inputs.loops.size() << "):\n";
    for (const auto& span : inputs.mapper.spans()) {
        const auto& loop = inputs.loops[static_cast<size_t>(span.loop_index)];
        out << "  " << (span.loop_index + 1) << ". " << loop.to_string() << ": trimmed "
            << span.first << ".." << span.last << " (" << span.length()
            << " residues), offset " << span.offset_before << " -> " << span.offset_after()
            << "\n";
    }
    out << "Original length: " << inputs.alignment.length()
        << ", trimmed length: " << inputs.alignment.retained_length()
        << ", excluded: " << inputs.mapper.excluded_count() << "\n";
}

PipelineResult run_pipeline(const PipelineConfig& config, engine::ModelingEngine& engine,
                            std::ostream& out) {
    PreparedInputs inputs = prepare_inputs(config);
    print_mapping_summary(inputs, out);

    // Check the template against the alignment before any model is built
    io::PDBParser parser;
    io::Protein template_protein = parser.parse_file(config.structure_path);
    renumber::ResidueRenumberer renumberer(inputs.alignment, template_protein,
                                           config.structure_path);

    engine::ModelingJob job;
    job.id = config.id;
    job.alignment_path = inputs.alignment_path;
    job.structure_path = config.structure_path;
    job.output_dir = config.output_dir;
    job.alignment = inputs.alignment;

    std::vector<CandidateModel> candidates =
        engine.submit(job, inputs.mapper.selection_predicate(), config.model_count);
    common::Logger::instance()
        .event(common::LogLevel::Debug, "pipeline")
        .field("engine", engine.name())
        .field("candidates", candidates.size())
        .emit();

    ranking::RankedModels ranked = ranking::rank_models(candidates);
    ranking::report_top_model(ranked, out);

    std::vector<RenumberedModel> renumbered =
        renumber::renumber_models(renumberer, ranked.accepted(), config.output_dir, out);

    return PipelineResult{std::move(ranked), std::move(renumbered)};
}

}  // namespace pipeline
}  // namespace looptrim
