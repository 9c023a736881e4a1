#include "pdb_writer.h"

#include <cstdio>
#include <fstream>
#include <ostream>

#include "looptrim/errors/messages.h"

namespace looptrim {
namespace io {

namespace {

// Names shorter than four characters start in column 14
std::string padded_atom_name(const std::string& name) {
    if (name.size() >= 4) {
        return name.substr(0, 4);
    }
    return " " + name;
}

std::string format_ter_record(int serial, const Residue& residue, char chain_id) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "TER   %5d      %3s %c%4d%c",
                  serial % 100000, residue.resn.c_str(), chain_id, residue.resi, residue.icode);
    return buf;
}

}  // namespace

std::string format_atom_record(int serial, const Atom& atom, const Residue& residue,
                               char chain_id) {
    char buf[96];
    std::snprintf(buf, sizeof(buf),
                  "ATOM  %5d %-4s%c%3s %c%4d%c   %8.3f%8.3f%8.3f%6.2f%6.2f          %2s",
                  serial % 100000, padded_atom_name(atom.name).c_str(), atom.alt_loc,
                  residue.resn.c_str(), chain_id, residue.resi, residue.icode,
                  atom.coords[0], atom.coords[1], atom.coords[2], atom.occupancy,
                  atom.b_factor, atom.element.c_str());
    return buf;
}

void write_pdb(std::ostream& out, const Protein& protein, const std::vector<std::string>& remarks) {
    for (const auto& remark : remarks) {
        out << "REMARK   6 " << remark << "\n";
    }

    int serial = 1;
    for (const auto& chain : protein.chains) {
        for (const auto& residue : chain.residues) {
            for (const auto& atom : residue.atoms) {
                out << format_atom_record(serial++, atom, residue, chain.chain_id) << "\n";
            }
        }
        if (!chain.residues.empty()) {
            out << format_ter_record(serial++, chain.residues.back(), chain.chain_id) << "\n";
        }
    }
    out << "END\n";
}

void write_pdb_file(const std::string& output_path, const Protein& protein,
                    const std::vector<std::string>& remarks) {
    std::ofstream out(output_path);
    if (!out.is_open()) {
        throw errors::messages::file_write_error(output_path, "could not open for writing");
    }
    write_pdb(out, protein, remarks);
    out.close();
    if (out.fail()) {
        throw errors::messages::file_write_error(output_path, "write failed");
    }
}

}  // namespace io
}  // namespace looptrim
