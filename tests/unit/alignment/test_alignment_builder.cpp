/**
 * Unit tests for the gapped target alignment and its PIR rendering.
 */

#include "looptrim/modules/alignment/alignment_builder.h"
#include "looptrim/errors/looptrim_error.h"
#include "test_utils.h"
#include <algorithm>
#include <cassert>
#include <iostream>
#include <sstream>

using namespace looptrim;
using namespace looptrim::alignment;
using looptrim::test::throws_as;

namespace {

AlignmentIds make_ids() {
    AlignmentIds ids;
    ids.template_id = "1abc";
    ids.structure_file = "1abc.pdb";
    ids.chain_id = "A";
    ids.target_id = "1abc_trim";
    return ids;
}

}  // namespace

bool test_single_loop_gap() {
    std::cout << "=== Test 1: Single loop gap ===" << std::endl;

    const std::string seq = test::make_sequence(100);
    auto loops = loops::parse_loop_set({"50:70"}, {"3:3"});
    AlignmentRecord record = build_alignment(seq, loops, make_ids());

    assert(record.target_sequence.size() == record.template_sequence.size());
    assert(record.gap_count() == 13);
    assert(record.retained_length() == 87);

    // 1-based 54..66 are gaps, 53 and 67 are not
    for (int pos = 1; pos <= 100; ++pos) {
        bool gap = record.target_sequence[pos - 1] == kGapChar;
        assert(gap == (pos >= 54 && pos <= 66));
    }
    assert(record.target_residues() == seq.substr(0, 53) + seq.substr(66));

    std::cout << "  Gapped target: " << record.target_sequence.substr(45, 30) << std::endl;
    std::cout << "✓ PASS" << std::endl;
    return true;
}

bool test_two_loops_single_pass() {
    std::cout << "\n=== Test 2: Two loops ===" << std::endl;

    const std::string seq = test::make_sequence(160);
    auto loops = loops::parse_loop_set({"120:140", "50:70"}, {"2:2", "3:3"});
    auto spans = plan_spans(seq.size(), loops);

    // kept [0,53) gap [53,66) kept [66,122) gap [122,137) kept [137,160)
    assert(spans.size() == 5);
    assert(!spans[0].gap && spans[0].begin == 0 && spans[0].end == 53);
    assert(spans[1].gap && spans[1].begin == 53 && spans[1].length() == 13);
    assert(!spans[2].gap && spans[2].end == 122);
    assert(spans[3].gap && spans[3].begin == 122 && spans[3].length() == 15);
    assert(!spans[4].gap && spans[4].end == 160);

    std::string gapped = build_gapped_sequence(seq, loops);
    assert(gapped.size() == seq.size());
    assert(std::count(gapped.begin(), gapped.end(), kGapChar) == loops.total_trimmed());

    std::cout << "✓ PASS" << std::endl;
    return true;
}

bool test_loop_at_sequence_end() {
    std::cout << "\n=== Test 3: Loop ending at the last residue ===" << std::endl;

    const std::string seq = test::make_sequence(30);
    auto loops = loops::parse_loop_set({"10:30"}, {"1:1"});
    AlignmentRecord record = build_alignment(seq, loops, make_ids());

    // trimmed 12..28, residues 29 and 30 kept
    assert(record.gap_count() == 17);
    assert(record.target_sequence.substr(28) == seq.substr(28));
    assert(record.target_sequence[27] == kGapChar);

    assert(throws_as<errors::ConfigError>([&] {
        build_alignment(test::make_sequence(25), loops, make_ids());
    }));

    std::cout << "✓ PASS" << std::endl;
    return true;
}

bool test_pir_layout() {
    std::cout << "\n=== Test 4: PIR layout ===" << std::endl;

    const std::string seq = test::make_sequence(100);
    auto loops = loops::parse_loop_set({"50:70"}, {"3:3"});
    AlignmentRecord record = build_alignment(seq, loops, make_ids());
    const std::string pir = record.to_pir();

    std::istringstream lines(pir);
    std::string line;
    std::getline(lines, line);
    assert(line == ">P1;1abc");
    std::getline(lines, line);
    assert(line == "structureX:1abc.pdb:FIRST:A:LAST:A::::");
    std::getline(lines, line);
    assert(line.size() == 75);
    std::getline(lines, line);
    assert(line == seq.substr(75) + "*");
    std::getline(lines, line);
    assert(line == ">P1;1abc_trim");
    std::getline(lines, line);
    assert(line == "sequence:::::::::");

    std::cout << "✓ PASS" << std::endl;
    return true;
}

bool test_round_trip_through_file() {
    std::cout << "\n=== Test 5: Write and read back ===" << std::endl;

    auto dir = test::scratch_dir("alignment_builder");
    const std::string path = (dir / "1abc_trim.ali").string();

    const std::string seq = test::make_sequence(160);
    auto loops = loops::parse_loop_set({"50:70", "120:140"}, {"3:3", "2:2"});
    AlignmentRecord record = build_alignment(seq, loops, make_ids());
    write_alignment(record, path);

    AlignmentRecord loaded = read_alignment(path);
    assert(loaded.template_id == "1abc");
    assert(loaded.structure_file == "1abc.pdb");
    assert(loaded.chain_id == "A");
    assert(loaded.target_id == "1abc_trim");
    assert(loaded.template_sequence == record.template_sequence);
    assert(loaded.target_sequence == record.target_sequence);

    assert(throws_as<errors::FileNotFoundError>([&] { read_alignment((dir / "missing.ali").string()); }));
    assert(throws_as<errors::FileWriteError>([&] {
        write_alignment(record, (dir / "no_such_dir" / "x.ali").string());
    }));

    std::cout << "✓ PASS" << std::endl;
    return true;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "  Alignment Builder Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    bool ok = test_single_loop_gap() && test_two_loops_single_pass() &&
              test_loop_at_sequence_end() && test_pir_layout() && test_round_trip_through_file();

    std::cout << "\n========================================" << std::endl;
    std::cout << (ok ? "✓ All tests passed (5/5)" : "✗ Some tests failed") << std::endl;
    std::cout << "========================================" << std::endl;
    return ok ? 0 : 1;
}
