/**
 * PDB Parser - minimal fixed-column parser for ATOM records.
 *
 * Reads the first model of a PDB file into a Protein, keeping every atom
 * with its serial, occupancy, B-factor and element so the structure can be
 * written back out after renumbering.
 *
 * Usage:
 *   PDBParser parser;
 *   auto protein = parser.parse_file("1abc.pdb");
 *   std::string seq = protein.get_sequence(0);
 */

#pragma once

#include "protein_structure.h"
#include "looptrim/errors/messages.h"
#include <fstream>
#include <istream>
#include <string>
#include <string_view>

namespace looptrim {
namespace io {

/**
 * PDB file parser.
 */
class PDBParser {
public:
    /**
     * Parse PDB file and return Protein structure.
     *
     * @param filename Path to PDB file
     * @param backbone_only If true, only keep N, CA, C, O atoms
     * @return Parsed protein structure
     * @throws FileNotFoundError if the file cannot be opened
     * @throws FormatError on malformed ATOM records or when no atoms are found
     */
    Protein parse_file(const std::string& filename, bool backbone_only = false) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            throw errors::messages::file_not_found(filename, "PDB file");
        }
        Protein protein = parse_stream(file, filename, backbone_only);
        if (protein.chains.empty()) {
            throw errors::messages::no_chains_in_structure(filename);
        }
        return protein;
    }

    Protein parse_stream(std::istream& in, const std::string& source_name,
                         bool backbone_only = false) {
        Protein protein;
        std::string line;
        int line_number = 0;

        // Current parsing state
        char current_chain = '\0';
        int current_resi = -9999;
        char current_icode = ' ';

        int chain_idx = -1;
        int residue_idx = -1;

        while (std::getline(in, line)) {
            ++line_number;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }

            // Only the first model is read
            if (line.compare(0, 6, "ENDMDL") == 0) {
                break;
            }

            // Skip short lines
            if (line.size() < 54)
                continue;

            // Only process ATOM records (standard amino acids)
            std::string_view record = std::string_view(line).substr(0, 6);
            if (record != "ATOM  ")
                continue;

            // Skip alternate locations (keep only A or blank)
            char alt_loc = line[16];
            if (alt_loc != ' ' && alt_loc != 'A')
                continue;

            std::string atom_name = trim(line.substr(12, 4));
            std::string resn = trim(line.substr(17, 3));
            char chain_id = line[21];
            char icode = line[26];

            int resi = 0;
            int serial = 0;
            float x = 0.0f, y = 0.0f, z = 0.0f;
            try {
                serial = std::stoi(trim(line.substr(6, 5)));
                resi = std::stoi(trim(line.substr(22, 4)));
                x = std::stof(line.substr(30, 8));
                y = std::stof(line.substr(38, 8));
                z = std::stof(line.substr(46, 8));
            } catch (const std::logic_error&) {
                throw errors::messages::file_parse_error(
                    source_name, "PDB",
                    "malformed ATOM record at line " + std::to_string(line_number));
            }

            // Filter backbone atoms if requested
            if (backbone_only) {
                if (atom_name != "N" && atom_name != "CA" && atom_name != "C" && atom_name != "O") {
                    continue;
                }
            }

            // New chain?
            if (chain_id != current_chain) {
                protein.chains.emplace_back(chain_id);
                chain_idx++;
                current_chain = chain_id;
                current_resi = -9999;  // Reset residue tracking
                residue_idx = -1;
            }

            // New residue?
            if (resi != current_resi || icode != current_icode) {
                protein.chains[chain_idx].residues.emplace_back(resi, icode, resn);
                residue_idx++;
                current_resi = resi;
                current_icode = icode;
            }

            Atom atom(atom_name, x, y, z);
            atom.serial = serial;
            atom.alt_loc = alt_loc;
            atom.occupancy = parse_optional_float(line, 54, 1.0f);
            atom.b_factor = parse_optional_float(line, 60, 0.0f);
            atom.element = line.size() >= 78 ? trim(line.substr(76, 2)) : "";
            protein.chains[chain_idx].residues[residue_idx].atoms.push_back(std::move(atom));
        }

        return protein;
    }

private:
    // Helper to trim whitespace
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";
        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    // Occupancy and B-factor columns are often blank in engine output
    static float parse_optional_float(const std::string& line, size_t column, float fallback) {
        if (line.size() < column + 6) {
            return fallback;
        }
        std::string field = trim(line.substr(column, 6));
        if (field.empty()) {
            return fallback;
        }
        try {
            return std::stof(field);
        } catch (const std::logic_error&) {
            return fallback;
        }
    }
};

}  // namespace io
}  // namespace looptrim
