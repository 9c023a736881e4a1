/**
 * Unit tests for the command-line parser.
 */

#include "looptrim/cli/cli.h"
#include "test_utils.h"
#include <cassert>
#include <cstdio>
#include <string>
#include <vector>

using namespace looptrim::cli;
using looptrim::test::throws_as;

namespace {

// looptrim-like app: global flags, one subcommand with positionals and
// repeatable options
struct TestApp {
    App app{"looptrim", "test app"};
    App* prepare = nullptr;
    bool quiet = false;
    bool verbose = false;
    std::string fasta;
    std::string id;
    std::vector<std::string> loops;
    std::vector<std::string> keeps;
    std::string chain = "A";
    int models = 5;

    TestApp() {
        app.require_subcommand(true);
        app.add_flag("-q,--quiet", quiet, "Only report errors");
        app.add_flag("-v,--verbose", verbose, "Debug output");

        prepare = app.add_subcommand("prepare", "Write the alignment");
        prepare->add_positional("fasta", fasta, "Sequence");
        prepare->add_positional("id", id, "Target code");
        prepare->add_option("--loop", loops, "Loop START:END")->required()->check(ColonPair("START:END"));
        prepare->add_option("--keep", keeps, "Kept N:C")->required()->check(ColonPair("N:C"));
        prepare->add_option("--chain", chain, "Chain");
        prepare->add_option("-n,--models", models, "Models")->check(Range(1, 100));
    }
};

}  // namespace

void test_subcommand_parsing() {
    printf("Testing subcommand with positionals and options...\n");

    TestApp t;
    t.app.parse({"prepare", "target.fasta", "target", "--loop", "120:140", "--keep=2:2",
                 "--loop", "50:70", "--keep", "3:3", "-n", "7", "--chain=B"});

    assert(t.app.get_active_subcommand() == t.prepare);
    assert(t.fasta == "target.fasta");
    assert(t.id == "target");
    assert(t.loops == std::vector<std::string>({"120:140", "50:70"}));
    assert(t.keeps == std::vector<std::string>({"2:2", "3:3"}));
    assert(t.models == 7);
    assert(t.chain == "B");
    assert(!t.quiet && !t.verbose);

    printf("  ✓ Repeated options collected in order\n");
}

void test_global_flags() {
    printf("Testing global flags before and after the subcommand...\n");

    TestApp before;
    before.app.parse({"-q", "prepare", "a.fasta", "a", "--loop", "1:9", "--keep", "1:1"});
    assert(before.quiet);
    assert(!before.verbose);

    TestApp after;
    after.app.parse({"prepare", "a.fasta", "a", "--verbose", "--loop", "1:9", "--keep", "1:1"});
    assert(after.verbose);
    // The flag consumed no value, so the positionals are intact
    assert(after.id == "a");

    printf("  ✓ Flags take no value and work in either position\n");
}

void test_parse_errors() {
    printf("Testing parse errors...\n");

    TestApp missing_keep;
    assert(throws_as<MissingArgument>(
        [&] { missing_keep.app.parse({"prepare", "a.fasta", "a", "--loop", "1:9"}); }));

    TestApp missing_value;
    assert(throws_as<MissingArgument>(
        [&] { missing_value.app.parse({"prepare", "a.fasta", "a", "--keep", "1:1", "--loop"}); }));

    TestApp bad_pair;
    try {
        bad_pair.app.parse({"prepare", "a.fasta", "a", "--loop", "50-70", "--keep", "1:1"});
        assert(false && "expected ValidationError");
    } catch (const ValidationError& e) {
        assert(std::string(e.what()).find("Expected START:END as A:B, got '50-70'") !=
               std::string::npos);
        assert(e.get_exit_code() == 2);
    }

    TestApp out_of_range;
    assert(throws_as<ValidationError>([&] {
        out_of_range.app.parse({"prepare", "a", "b", "--loop", "1:9", "--keep", "1:1", "-n", "0"});
    }));

    TestApp not_int;
    assert(throws_as<ParseError>([&] {
        not_int.app.parse({"prepare", "a", "b", "--loop", "1:9", "--keep", "1:1", "-n", "2.5"});
    }));

    TestApp unknown;
    try {
        unknown.app.parse({"prepare", "a", "b", "--loops", "1:9"});
        assert(false && "expected UnknownArgument");
    } catch (const UnknownArgument& e) {
        assert(std::string(e.what()) == "Unknown option: --loops");
    }

    TestApp extra;
    assert(throws_as<UnknownArgument>([&] {
        extra.app.parse({"prepare", "a", "b", "c", "--loop", "1:9", "--keep", "1:1"});
    }));

    TestApp twice;
    try {
        twice.app.parse({"prepare", "a", "b", "--loop", "1:9", "--keep", "1:1", "--chain", "A",
                         "--chain", "B"});
        assert(false && "expected RepeatedOption");
    } catch (const RepeatedOption& e) {
        assert(std::string(e.what()) == "Option --chain given more than once");
        assert(e.get_exit_code() == kExitUsage);
    }

    TestApp no_subcommand;
    assert(throws_as<ParseError>([&] { no_subcommand.app.parse({"-q"}); }));

    printf("  ✓ Missing, malformed and unknown arguments rejected\n");
}

void test_help() {
    printf("Testing help...\n");

    TestApp t;
    try {
        t.app.parse({"prepare", "--help"});
        assert(false && "expected CallForHelp");
    } catch (const CallForHelp& e) {
        assert(e.get_exit_code() == 0);
    }

    const std::string help = t.prepare->help();
    assert(help.find("looptrim prepare - Write the alignment") == 0);
    assert(help.find("USAGE:\n  looptrim prepare <fasta> <id> --loop TEXT... --keep TEXT... [options]") !=
           std::string::npos);
    assert(help.find("--loop TEXT...") != std::string::npos);
    assert(help.find("(in [1, 100])") != std::string::npos);
    assert(help.find("[REQUIRED]") != std::string::npos);

    const std::string top = t.app.help();
    assert(top.find("SUBCOMMANDS:\n  prepare") != std::string::npos);
    assert(top.find("-q,--quiet") != std::string::npos);
    assert(top.find("-q,--quiet TEXT") == std::string::npos);

    assert(t.prepare->path() == "looptrim prepare");

    printf("  ✓ Help lists usage, options and validators\n");
}

void test_consume_remaining() {
    printf("Testing trailing positional list...\n");

    App app("renumber");
    std::string alignment;
    std::vector<std::string> models;
    std::string out_dir;
    app.add_positional("alignment", alignment);
    app.add_positional("models", models)->consume_remaining();
    app.add_option("-o,--out-dir", out_dir);

    app.parse({"t.ali", "m1.pdb", "-o", "renum", "m2.pdb", "m3.pdb"});
    assert(alignment == "t.ali");
    assert(models == std::vector<std::string>({"m1.pdb", "m2.pdb", "m3.pdb"}));
    assert(out_dir == "renum");

    App empty_app("renumber");
    std::string a;
    std::vector<std::string> m;
    empty_app.add_positional("alignment", a);
    empty_app.add_positional("models", m)->consume_remaining();
    assert(throws_as<MissingArgument>([&] { empty_app.parse({"t.ali"}); }));

    printf("  ✓ Remaining arguments collected\n");
}

int main() {
    printf("=== CLI Parser Tests ===\n\n");

    test_subcommand_parsing();
    test_global_flags();
    test_parse_errors();
    test_help();
    test_consume_remaining();

    printf("\n✓ All CLI parser tests passed!\n");
    return 0;
}
