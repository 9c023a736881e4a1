#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "looptrim/common/result_types.h"
#include "looptrim/io/protein_structure.h"
#include "looptrim/modules/alignment/alignment_builder.h"

namespace looptrim {
namespace renumber {

/**
 * Template residue identifiers a model residue inherits.
 */
struct ResidueId {
    char chain_id;
    int resi;
    char icode;
    char target_code;  // One-letter code the model residue must carry
};

/**
 * Transfers template residue numbering and chain IDs onto models built from
 * the trimmed target sequence.
 *
 * The correspondence comes from the alignment: the k-th non-gap column of
 * the target row is the k-th residue of every model, and that column holds
 * the template residue whose identifiers the model residue receives. Models
 * therefore keep the template's numbering, with a jump across each trimmed
 * span.
 */
class ResidueRenumberer {
public:
    /**
     * @param record Alignment the models were built from
     * @param template_protein Parsed template structure
     * @param template_name Template path for error messages
     * @throws ChainNotFoundError if the alignment's chain is missing
     * @throws StructureMismatchError if the template chain disagrees with
     *         the template row of the alignment
     */
    ResidueRenumberer(const alignment::AlignmentRecord& record,
                      const io::Protein& template_protein,
                      const std::string& template_name);

    // One entry per model residue, in model order
    const std::vector<ResidueId>& correspondence() const { return correspondence_; }

    /**
     * Return a copy of model with template identifiers.
     *
     * @throws StructureMismatchError if residue count or identities differ
     *         from the target row
     */
    io::Protein renumber(const io::Protein& model, const std::string& model_name) const;

    /**
     * Parse candidate.path, renumber and write <stem>_renum.pdb into
     * output_dir (next to the candidate when output_dir is empty).
     */
    RenumberedModel renumber_file(const CandidateModel& candidate,
                                  const std::string& output_dir) const;

    // "out/1abc.3.pdb" -> "<output_dir>/1abc.3_renum.pdb"
    static std::string output_path_for(const std::string& model_path,
                                       const std::string& output_dir);

private:
    std::vector<ResidueId> correspondence_;
};

/**
 * Renumber each model in order, printing a progress block to out.
 */
std::vector<RenumberedModel> renumber_models(const ResidueRenumberer& renumberer,
                                             const std::vector<CandidateModel>& models,
                                             const std::string& output_dir,
                                             std::ostream& out);

}  // namespace renumber
}  // namespace looptrim
