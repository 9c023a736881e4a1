#include "looptrim/cli/cli.h"
#include "commands/commands.h"
#include <iostream>

using namespace looptrim::cli;

int main(int argc, char** argv) {
    App app("looptrim", "Trim long loops for homology modeling and renumber the models");
    app.require_subcommand(true);

    // ========== Global Flags ==========
    looptrim::commands::GlobalFlags flags;
    app.add_flag("-q,--quiet", flags.quiet, "Only report errors");
    app.add_flag("-v,--verbose", flags.verbose, "Log debug events from every stage");

    // ========== Prepare Subcommand ==========
    App* prepare_cmd =
        app.add_subcommand("prepare", "Write the gapped alignment and residue selection");

    looptrim::pipeline::PipelineConfig prepare_config;
    prepare_cmd->add_positional("fasta", prepare_config.fasta_path, "Full target sequence (FASTA)")
        ->check(ExistingFile());
    prepare_cmd->add_positional("id", prepare_config.id, "Target code used to name outputs");
    prepare_cmd->add_positional("pdb", prepare_config.structure_path, "Template structure (PDB)")
        ->check(ExistingFile());
    prepare_cmd->add_option("--loop", prepare_config.loop_tokens, "Loop START:END, repeatable")
        ->required()
        ->check(ColonPair("START:END"));
    prepare_cmd->add_option("--keep", prepare_config.keep_tokens, "Kept N:C residues, one per --loop")
        ->required()
        ->check(ColonPair("N:C"));
    prepare_cmd->add_option("--chain", prepare_config.chain_id, "Template chain ID (default: A)");
    prepare_cmd->add_option("-o,--out-dir", prepare_config.output_dir, "Output directory (default: .)");

    // ========== Run Subcommand ==========
    App* run_cmd = app.add_subcommand("run", "Prepare, model, rank and renumber");

    looptrim::pipeline::PipelineConfig run_config;
    std::string run_engine_cmd;
    std::string run_score_file;
    run_cmd->add_positional("fasta", run_config.fasta_path, "Full target sequence (FASTA)")
        ->check(ExistingFile());
    run_cmd->add_positional("id", run_config.id, "Target code used to name outputs");
    run_cmd->add_positional("pdb", run_config.structure_path, "Template structure (PDB)")
        ->check(ExistingFile());
    run_cmd->add_option("--loop", run_config.loop_tokens, "Loop START:END, repeatable")
        ->required()
        ->check(ColonPair("START:END"));
    run_cmd->add_option("--keep", run_config.keep_tokens, "Kept N:C residues, one per --loop")
        ->required()
        ->check(ColonPair("N:C"));
    run_cmd->add_option("--chain", run_config.chain_id, "Template chain ID (default: A)");
    run_cmd->add_option("-o,--out-dir", run_config.output_dir, "Output directory (default: .)");
    run_cmd->add_option("-n,--models", run_config.model_count, "Models to build (default: 5)")
        ->check(Range(1, 10000));
    run_cmd->add_option("--engine-cmd", run_engine_cmd,
                        "Modeling command; placeholders {alignment} {selection} {template} "
                        "{target} {structure} {models} {scores} {out_dir}; {{ }} for literal braces")
        ->required();
    run_cmd->add_option("--score-file", run_score_file,
                        "Score table written by the engine (default: <id>.scores)");

    // ========== Renumber Subcommand ==========
    App* renumber_cmd =
        app.add_subcommand("renumber", "Renumber model files onto template numbering");

    std::string renumber_alignment, renumber_template, renumber_out_dir;
    std::vector<std::string> renumber_models;
    renumber_cmd->add_positional("alignment", renumber_alignment, "Alignment written by prepare (.ali)")
        ->check(ExistingFile());
    renumber_cmd->add_positional("template", renumber_template, "Template structure (PDB)")
        ->check(ExistingFile());
    renumber_cmd->add_positional("models", renumber_models, "Model structures (PDB)")
        ->consume_remaining();
    renumber_cmd->add_option("-o,--out-dir", renumber_out_dir,
                             "Output directory (default: next to each model)");

    // ========== Version Subcommand ==========
    App* version_cmd = app.add_subcommand("version", "Show version information");

    LOOPTRIM_PARSE(app, argc, argv);

    looptrim::commands::apply_global_flags(flags);

    if (app.get_active_subcommand() == prepare_cmd) {
        return looptrim::commands::prepare(prepare_config);
    } else if (app.get_active_subcommand() == run_cmd) {
        return looptrim::commands::run(run_config, run_engine_cmd, run_score_file);
    } else if (app.get_active_subcommand() == renumber_cmd) {
        return looptrim::commands::renumber(renumber_alignment, renumber_template, renumber_models,
                                            renumber_out_dir);
    } else if (app.get_active_subcommand() == version_cmd) {
        return looptrim::commands::version();
    }

    std::cerr << "Error: No subcommand selected" << std::endl;
    return kExitUsage;
}
