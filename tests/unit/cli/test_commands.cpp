/**
 * Tests for the prepare, renumber and run subcommands on scratch files.
 */

#include "commands/commands.h"
#include "looptrim/common/logging.h"
#include "looptrim/modules/alignment/alignment_builder.h"
#include "test_utils.h"
#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace looptrim;
namespace fs = std::filesystem;

namespace {

struct Workspace {
    fs::path dir;
    std::string sequence = test::make_sequence(60);
    pipeline::PipelineConfig config;

    explicit Workspace(const std::string& name) : dir(test::scratch_dir(name)) {
        test::write_text_file(dir / "target.fasta", test::make_fasta_text("target", sequence));
        test::write_text_file(dir / "tmpl.pdb", test::make_pdb_text(sequence, 'A', 1));
        config.fasta_path = (dir / "target.fasta").string();
        config.id = "target";
        config.structure_path = (dir / "tmpl.pdb").string();
        config.loop_tokens = {"20:40"};
        config.keep_tokens = {"2:2"};
        config.output_dir = (dir / "out").string();
    }
};

}  // namespace

bool test_global_flags() {
    std::cout << "=== Test 1: Global flags set the log level ===" << std::endl;

    auto& logger = common::Logger::instance();
    commands::apply_global_flags({false, true});
    assert(logger.level() == common::LogLevel::Debug);
    commands::apply_global_flags({true, true});
    assert(logger.level() == common::LogLevel::Error);
    assert(!commands::info_enabled());
    commands::apply_global_flags({false, false});
    assert(logger.level() == common::LogLevel::Info);

    assert(commands::version() == 0);

    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_prepare_command() {
    std::cout << "=== Test 2: prepare ===" << std::endl;

    Workspace ws("commands_prepare");
    assert(commands::prepare(ws.config) == 0);
    assert(fs::exists(ws.dir / "out" / "target.ali"));
    assert(fs::exists(ws.dir / "out" / "target.sel"));

    // Overlapping loops are a configuration error, reported with exit code 1
    Workspace bad("commands_prepare_bad");
    bad.config.loop_tokens = {"20:40", "30:50"};
    bad.config.keep_tokens = {"2:2", "2:2"};
    assert(commands::prepare(bad.config) == 1);
    assert(!fs::exists(bad.dir / "out" / "target.ali"));

    // A file name longer than NAME_MAX makes std::filesystem throw its own
    // filesystem_error rather than a LooptrimError; still exit code 1
    Workspace long_name("commands_prepare_long_name");
    long_name.config.fasta_path = (long_name.dir / (std::string(300, 'a') + ".fasta")).string();
    assert(commands::prepare(long_name.config) == 1);

    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_renumber_command() {
    std::cout << "=== Test 3: renumber ===" << std::endl;

    Workspace ws("commands_renumber");
    assert(commands::prepare(ws.config) == 0);

    const std::string alignment_path = (ws.dir / "out" / "target.ali").string();
    auto record = alignment::read_alignment(alignment_path);
    const auto model_path = ws.dir / "out" / "target.1.pdb";
    test::write_text_file(model_path, test::make_pdb_text(record.target_residues(), 'A', 1));

    const std::string renum_dir = (ws.dir / "renum").string();
    fs::create_directories(renum_dir);
    assert(commands::renumber(alignment_path, ws.config.structure_path, {model_path.string()},
                              renum_dir) == 0);
    assert(fs::exists(fs::path(renum_dir) / "target.1_renum.pdb"));

    // Missing model file and missing output directory both fail cleanly
    assert(commands::renumber(alignment_path, ws.config.structure_path,
                              {(ws.dir / "out" / "target.2.pdb").string()}, renum_dir) == 1);
    assert(commands::renumber(alignment_path, ws.config.structure_path, {model_path.string()},
                              (ws.dir / "nowhere").string()) == 1);

    // No models at all, and a model path the filesystem layer rejects
    assert(commands::renumber(alignment_path, ws.config.structure_path, {}, renum_dir) == 1);
    assert(commands::renumber(alignment_path, ws.config.structure_path,
                              {(ws.dir / (std::string(300, 'm') + ".pdb")).string()},
                              renum_dir) == 1);

    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_run_command() {
    std::cout << "=== Test 4: run with a shell engine ===" << std::endl;

    Workspace ws("commands_run");
    ws.config.model_count = 2;

    // Models are the retained target residues, so copy them from a file
    // written up front
    alignment::AlignmentIds ids;
    ids.template_id = "tmpl";
    ids.structure_file = "tmpl.pdb";
    ids.target_id = "target";
    auto record = alignment::build_alignment(
        ws.sequence, loops::parse_loop_set(ws.config.loop_tokens, ws.config.keep_tokens), ids);
    const auto built = ws.dir / "built.pdb";
    test::write_text_file(built, test::make_pdb_text(record.target_residues(), 'A', 1));

    const std::string command =
        "cp " + built.string() + " {out_dir}/target.1.pdb && cp " + built.string() +
        " {out_dir}/target.2.pdb && printf 'target.1 -5 0 ok\\ntarget.2 -7 0 ok\\n' > {scores}";
    assert(commands::run(ws.config, command, "") == 0);
    assert(fs::exists(ws.dir / "out" / "target.2_renum.pdb"));
    assert(fs::exists(ws.dir / "out" / "target.1_renum.pdb"));

    assert(commands::run(ws.config, "exit 4", "") == 1);
    assert(commands::run(ws.config, "", "") == 1);

    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Command Tests" << std::endl;
    std::cout << "========================================" << std::endl << std::endl;

    int passed = 0;
    int total = 0;

    total++; if (test_global_flags()) passed++;
    total++; if (test_prepare_command()) passed++;
    total++; if (test_renumber_command()) passed++;
    total++; if (test_run_command()) passed++;

    std::cout << "========================================" << std::endl;
    std::cout << "Results: " << passed << "/" << total << " tests passed" << std::endl;
    std::cout << "========================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
