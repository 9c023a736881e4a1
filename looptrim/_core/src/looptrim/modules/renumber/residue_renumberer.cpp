#include "residue_renumberer.h"

#include <filesystem>
#include <ostream>

#include "looptrim/common/logging.h"
#include "looptrim/errors/messages.h"
#include "looptrim/errors/validators.h"
#include "looptrim/io/amino_acids.h"
#include "looptrim/io/pdb_parser.h"
#include "looptrim/io/pdb_writer.h"

namespace fs = std::filesystem;

namespace looptrim {
namespace renumber {

ResidueRenumberer::ResidueRenumberer(const alignment::AlignmentRecord& record,
                                     const io::Protein& template_protein,
                                     const std::string& template_name) {
    const char chain_id = record.chain_id.empty() ? 'A' : record.chain_id[0];
    validation::validate_chain_id(template_protein.chain_ids(), std::string(1, chain_id),
                                  template_name);
    const int chain_idx = template_protein.find_chain_index(chain_id);

    const auto& chain = template_protein.get_chain(static_cast<size_t>(chain_idx));
    if (chain.size() != record.template_sequence.size()) {
        throw errors::messages::residue_count_mismatch(
            template_name + " chain " + std::string(1, chain_id), chain.size(),
            record.template_sequence.size());
    }

    for (size_t k = 0; k < chain.size(); ++k) {
        const auto& residue = chain.residues[k];
        if (!io::residue_codes_match(residue.one_letter(), record.template_sequence[k])) {
            throw errors::StructureMismatchError(
                template_name,
                "template residue " + residue.label() + " is " + residue.resn +
                    " but alignment column " + std::to_string(k + 1) + " has '" +
                    record.template_sequence[k] + "'");
        }

        const char target_code = record.target_sequence[k];
        if (target_code == alignment::kGapChar) {
            continue;
        }
        correspondence_.push_back({chain_id, residue.resi, residue.icode, target_code});
    }
}

io::Protein ResidueRenumberer::renumber(const io::Protein& model,
                                        const std::string& model_name) const {
    if (model.num_residues() != correspondence_.size()) {
        throw errors::messages::residue_count_mismatch(model_name, model.num_residues(),
                                                       correspondence_.size());
    }

    io::Protein renumbered;
    size_t k = 0;
    for (const auto& chain : model.chains) {
        for (const auto& residue : chain.residues) {
            const ResidueId& id = correspondence_[k];
            if (!io::residue_codes_match(residue.one_letter(), id.target_code)) {
                throw errors::StructureMismatchError(
                    model_name,
                    "model residue " + std::to_string(k + 1) + " is " + residue.resn +
                        " but the target sequence has '" + id.target_code + "'");
            }

            if (renumbered.chains.empty() || renumbered.chains.back().chain_id != id.chain_id) {
                renumbered.chains.emplace_back(id.chain_id);
            }
            io::Residue copy = residue;
            copy.resi = id.resi;
            copy.icode = id.icode;
            renumbered.chains.back().residues.push_back(std::move(copy));
            ++k;
        }
    }
    return renumbered;
}

std::string ResidueRenumberer::output_path_for(const std::string& model_path,
                                               const std::string& output_dir) {
    fs::path source(model_path);
    fs::path dir = output_dir.empty() ? source.parent_path() : fs::path(output_dir);
    return (dir / (source.stem().string() + "_renum.pdb")).string();
}

RenumberedModel ResidueRenumberer::renumber_file(const CandidateModel& candidate,
                                                 const std::string& output_dir) const {
    io::PDBParser parser;
    io::Protein model = parser.parse_file(candidate.path);
    io::Protein renumbered = renumber(model, candidate.name);

    RenumberedModel result;
    result.name = candidate.name;
    result.output_path = output_path_for(candidate.path, output_dir);
    result.num_residues = renumbered.num_residues();

    io::write_pdb_file(result.output_path, renumbered,
                       {"RENUMBERED FROM " + candidate.name + " ONTO TEMPLATE NUMBERING"});
    return result;
}

std::vector<RenumberedModel> renumber_models(const ResidueRenumberer& renumberer,
                                             const std::vector<CandidateModel>& models,
                                             const std::string& output_dir,
                                             std::ostream& out) {
    std::vector<RenumberedModel> results;
    results.reserve(models.size());

    const size_t total = models.size();
    out << "Renumbering " << total << " model(s):\n";
    for (size_t i = 0; i < total; ++i) {
        const auto& candidate = models[i];
        RenumberedModel result = renumberer.renumber_file(candidate, output_dir);
        out << "  [" << (i + 1) << "/" << total << "] " << candidate.name << " -> "
            << result.output_path << " (" << result.num_residues << " residues)\n";
        results.push_back(std::move(result));
    }
    out << "Renumbering complete\n";

    common::log_debug("renumbered " + std::to_string(results.size()) + " model(s)");
    return results;
}

}  // namespace renumber
}  // namespace looptrim
