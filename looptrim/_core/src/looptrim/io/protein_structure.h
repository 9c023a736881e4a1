/**
 * Protein structure definitions shared by the PDB parser and writer.
 *
 * Only what renumbering needs is kept: identifiers, atom records and
 * coordinates are carried through unchanged, no geometry is computed.
 */

#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>
#include <stdexcept>

#include "amino_acids.h"

namespace looptrim {
namespace io {

/**
 * Single atom record.
 */
struct Atom {
    std::string name;             // Atom name (e.g., "CA", "N", "OG1")
    std::array<float, 3> coords;  // [x, y, z]
    int serial = 0;
    char alt_loc = ' ';
    float occupancy = 1.0f;
    float b_factor = 0.0f;
    std::string element;

    Atom(std::string_view atom_name, float x, float y, float z) : name(atom_name), coords{x, y, z} {
    }
};

/**
 * Single residue with residue info and atoms.
 */
struct Residue {
    int resi;                 // Residue sequence number
    char icode;               // Insertion code
    std::string resn;         // Residue name (3-letter code)
    std::vector<Atom> atoms;  // List of atoms

    Residue(int res_num, char ins_code, std::string_view res_name)
        : resi(res_num), icode(ins_code), resn(res_name) {
    }

    // One-letter code, 'X' when unknown
    char one_letter() const {
        return three_to_one(resn);
    }

    // "57" or "57A"
    std::string label() const {
        std::string out = std::to_string(resi);
        if (icode != ' ') {
            out.push_back(icode);
        }
        return out;
    }
};

/**
 * Single chain with chain ID and residues.
 */
struct Chain {
    char chain_id;                  // Chain identifier
    std::vector<Residue> residues;  // List of residues

    explicit Chain(char id) : chain_id(id) {
    }

    // Get number of residues
    size_t size() const {
        return residues.size();
    }
};

/**
 * Protein structure (single model).
 */
class Protein {
public:
    std::vector<Chain> chains;

    // Get chain by index
    const Chain& get_chain(size_t idx) const {
        if (idx >= chains.size()) {
            throw std::out_of_range("Chain index out of range");
        }
        return chains[idx];
    }

    /**
     * Get amino acid sequence for a specific chain.
     * Returns one-letter amino acid codes.
     *
     * Unknown residues are mapped to 'X'.
     */
    std::string get_sequence(size_t chain_idx) const {
        const auto& chain = get_chain(chain_idx);
        std::string sequence;
        sequence.reserve(chain.size());

        for (const auto& residue : chain.residues) {
            sequence.push_back(residue.one_letter());
        }

        return sequence;
    }

    // Get total number of chains
    size_t num_chains() const {
        return chains.size();
    }

    // Total residues over all chains
    size_t num_residues() const {
        size_t total = 0;
        for (const auto& chain : chains) {
            total += chain.size();
        }
        return total;
    }

    int find_chain_index(char chain_id) const {
        for (size_t idx = 0; idx < chains.size(); ++idx) {
            if (chains[idx].chain_id == chain_id) {
                return static_cast<int>(idx);
            }
        }
        return -1;
    }

    std::vector<std::string> chain_ids() const {
        std::vector<std::string> ids;
        ids.reserve(chains.size());
        for (const auto& chain : chains) {
            ids.emplace_back(1, chain.chain_id);
        }
        return ids;
    }
};

}  // namespace io
}  // namespace looptrim
