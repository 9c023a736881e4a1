/**
 * Unit tests for the PDB parser and writer.
 *
 * Tests parsing of hand-written ATOM records and that written structures
 * keep their numbering when read back.
 */

#include "looptrim/io/pdb_parser.h"
#include "looptrim/io/pdb_writer.h"
#include "looptrim/errors/looptrim_error.h"
#include "test_utils.h"
#include <cassert>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace looptrim::io;
using looptrim::test::throws_as;

static const char* kTwoResidues =
    "HEADER    TEST\n"
    "ATOM      1  N   THR A   1      17.047  14.099   3.625  1.00 13.79           N  \n"
    "ATOM      2  CA  THR A   1      16.967  12.784   4.338  1.00 10.80           C  \n"
    "ATOM      3  C   THR A   1      15.685  12.755   5.133  1.00  9.19           C  \n"
    "ATOM      4  O   THR A   1      15.268  13.825   5.594  1.00  9.85           O  \n"
    "ATOM      5  N   GLY A  27A     15.115  11.555   5.265  1.00  7.81           N  \n"
    "ATOM      6  CA  GLY A  27A     13.856  11.469   5.961  1.00  6.46           C  \n"
    "HETATM    7  O   HOH A 101      10.000  10.000  10.000  1.00 20.00           O  \n"
    "END\n";

bool test_parse_atom_records() {
    std::cout << "=== Test 1: Parse ATOM records ===" << std::endl;

    std::istringstream in(kTwoResidues);
    PDBParser parser;
    Protein protein = parser.parse_stream(in, "inline");

    assert(protein.num_chains() == 1);
    assert(protein.num_residues() == 2);

    const Chain& chain = protein.get_chain(0);
    assert(chain.chain_id == 'A');
    assert(chain.residues[0].resi == 1);
    assert(chain.residues[0].resn == "THR");
    assert(chain.residues[0].atoms.size() == 4);
    assert(chain.residues[1].resi == 27);
    assert(chain.residues[1].icode == 'A');
    assert(chain.residues[1].label() == "27A");
    assert(protein.get_sequence(0) == "TG");

    const Atom& ca = chain.residues[0].atoms[1];
    assert(ca.name == "CA");
    assert(ca.serial == 2);
    assert(std::abs(ca.coords[0] - 16.967f) < 1e-3f);
    assert(std::abs(ca.coords[2] - 4.338f) < 1e-3f);
    assert(std::abs(ca.b_factor - 10.80f) < 1e-3f);
    assert(ca.element == "C");

    assert(protein.find_chain_index('A') == 0);
    assert(protein.find_chain_index('B') == -1);

    std::cout << "  Sequence: " << protein.get_sequence(0) << std::endl;
    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_altloc_models_and_chains() {
    std::cout << "=== Test 2: Alternate locations, models, chains ===" << std::endl;

    std::istringstream in(
        "MODEL        1\n"
        "ATOM      1  N   THR A   1      17.047  14.099   3.625  1.00 13.79           N  \n"
        "ATOM      2  CB ATHR A   1      12.000  10.000   5.000  0.50  6.00           C  \n"
        "ATOM      3  CB BTHR A   1      12.500  10.500   5.500  0.50  6.00           C  \n"
        "ATOM      4  N   ALA B   5      15.115  11.555   5.265  1.00  7.81           N  \n"
        "ENDMDL\n"
        "MODEL        2\n"
        "ATOM      1  N   TRP C   1      17.047  14.099   3.625  1.00 13.79           N  \n"
        "ENDMDL\n");
    PDBParser parser;
    Protein protein = parser.parse_stream(in, "models");

    // Only the first model, with alt_loc B dropped
    assert(protein.num_chains() == 2);
    assert(protein.chain_ids() == std::vector<std::string>({"A", "B"}));
    const Residue& thr = protein.get_chain(0).residues[0];
    assert(thr.atoms.size() == 2);
    assert(thr.atoms[1].alt_loc == 'A');
    assert(std::abs(thr.atoms[1].occupancy - 0.5f) < 1e-6f);
    assert(protein.get_chain(1).residues[0].resi == 5);

    // Backbone-only keeps N/CA/C/O
    std::istringstream again(kTwoResidues);
    Protein backbone = parser.parse_stream(again, "inline", true);
    assert(backbone.get_chain(0).residues[0].atoms.size() == 4);

    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_parse_errors() {
    std::cout << "=== Test 3: Parse errors ===" << std::endl;

    PDBParser parser;
    auto dir = looptrim::test::scratch_dir("pdb_io");

    assert(throws_as<looptrim::errors::FileNotFoundError>(
        [&] { parser.parse_file((dir / "missing.pdb").string()); }));

    const auto empty = dir / "empty.pdb";
    looptrim::test::write_text_file(empty, "HEADER    NOTHING\nEND\n");
    assert(throws_as<looptrim::errors::FormatError>([&] { parser.parse_file(empty.string()); }));

    std::istringstream bad(
        "ATOM      1  N   THR A   1      xx.xxx  14.099   3.625  1.00 13.79           N  \n");
    try {
        parser.parse_stream(bad, "bad.pdb");
        assert(false && "expected FormatError");
    } catch (const looptrim::errors::FormatError& e) {
        assert(e.message().find("line 1") != std::string::npos);
    }

    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_write_and_reparse() {
    std::cout << "=== Test 4: Write then parse ===" << std::endl;

    std::istringstream in(kTwoResidues);
    PDBParser parser;
    Protein protein = parser.parse_stream(in, "inline");

    // Shift numbering the way renumbering does
    protein.chains[0].residues[0].resi = 101;
    protein.chains[0].residues[1].resi = 140;
    protein.chains[0].residues[1].icode = ' ';

    auto dir = looptrim::test::scratch_dir("pdb_writer");
    const auto path = dir / "out.pdb";
    write_pdb_file(path.string(), protein, {"renumbered from model.pdb"});

    const std::string text = looptrim::test::read_text_file(path);
    assert(text.rfind("REMARK   6 renumbered from model.pdb\n", 0) == 0);
    assert(looptrim::test::count_occurrences(text, "\nATOM  ") == 6);
    assert(looptrim::test::count_occurrences(text, "\nTER   ") == 1);
    assert(text.substr(text.size() - 4) == "END\n");

    Protein reread = parser.parse_file(path.string());
    assert(reread.num_residues() == 2);
    assert(reread.get_chain(0).residues[0].resi == 101);
    assert(reread.get_chain(0).residues[1].resi == 140);
    assert(reread.get_chain(0).residues[1].icode == ' ');
    assert(reread.get_sequence(0) == "TG");
    const Atom& o = reread.get_chain(0).residues[0].atoms[3];
    assert(o.name == "O");
    assert(std::abs(o.coords[1] - 13.825f) < 1e-3f);
    assert(std::abs(o.b_factor - 9.85f) < 1e-3f);

    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

bool test_atom_record_columns() {
    std::cout << "=== Test 5: ATOM record columns ===" << std::endl;

    Residue residue(57, 'B', "SER");
    Atom atom("OG", 1.5f, -22.25f, 103.125f);
    atom.element = "O";
    atom.b_factor = 12.5f;

    const std::string line = format_atom_record(42, atom, residue, 'A');
    assert(line.size() == 78);
    assert(line.substr(0, 6) == "ATOM  ");
    assert(line.substr(6, 5) == "   42");
    assert(line.substr(12, 4) == " OG ");
    assert(line.substr(17, 3) == "SER");
    assert(line[21] == 'A');
    assert(line.substr(22, 4) == "  57");
    assert(line[26] == 'B');
    assert(line.substr(30, 8) == "   1.500");
    assert(line.substr(38, 8) == " -22.250");
    assert(line.substr(46, 8) == " 103.125");
    assert(line.substr(54, 6) == "  1.00");
    assert(line.substr(60, 6) == " 12.50");
    assert(line.substr(76, 2) == " O");

    // Four-character names start in column 13
    Atom hydrogen("HD21", 0.0f, 0.0f, 0.0f);
    assert(format_atom_record(1, hydrogen, residue, 'A').substr(12, 4) == "HD21");

    std::cout << "✓ PASS" << std::endl << std::endl;
    return true;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "PDB I/O Tests" << std::endl;
    std::cout << "========================================" << std::endl << std::endl;

    int passed = 0;
    int total = 0;

    total++; if (test_parse_atom_records()) passed++;
    total++; if (test_altloc_models_and_chains()) passed++;
    total++; if (test_parse_errors()) passed++;
    total++; if (test_write_and_reparse()) passed++;
    total++; if (test_atom_record_columns()) passed++;

    std::cout << "========================================" << std::endl;
    std::cout << "Results: " << passed << "/" << total << " tests passed" << std::endl;
    std::cout << "========================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
