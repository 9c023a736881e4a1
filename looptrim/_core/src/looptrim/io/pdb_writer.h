/**
 * PDB Writer
 *
 * Writes a Protein back to fixed-column PDB format: ATOM records, one TER
 * per chain, END. Atom serials are reassigned sequentially; chain IDs,
 * residue numbers, insertion codes and coordinates are written as stored.
 */

#pragma once

#include "protein_structure.h"
#include <iosfwd>
#include <string>
#include <vector>

namespace looptrim {
namespace io {

/**
 * Write protein to a stream.
 *
 * @param out Output stream
 * @param protein Structure to write
 * @param remarks Optional REMARK lines written before the atoms
 */
void write_pdb(std::ostream& out, const Protein& protein,
               const std::vector<std::string>& remarks = {});

/**
 * Write protein to a PDB file.
 *
 * @throws FileWriteError if the file cannot be opened or written
 */
void write_pdb_file(const std::string& output_path, const Protein& protein,
                    const std::vector<std::string>& remarks = {});

/**
 * Format one ATOM record (80 columns, no newline).
 */
std::string format_atom_record(int serial, const Atom& atom, const Residue& residue,
                               char chain_id);

}  // namespace io
}  // namespace looptrim
