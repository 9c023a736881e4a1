#include "commands/commands.h"

#include <filesystem>
#include <exception>
#include <iostream>

#include "looptrim/errors/looptrim_error.h"
#include "looptrim/errors/validators.h"
#include "looptrim/io/pdb_parser.h"
#include "looptrim/modules/alignment/alignment_builder.h"
#include "looptrim/modules/renumber/residue_renumberer.h"

namespace looptrim {
namespace commands {

int renumber(const std::string& alignment_path, const std::string& template_path,
             const std::vector<std::string>& model_paths, const std::string& output_dir) {
    try {
        if (model_paths.empty()) {
            throw errors::ConfigError("No model structures given",
                                      "List one or more model PDB files after the template");
        }
        if (!output_dir.empty()) {
            validation::validate_directory_exists(output_dir);
        }

        alignment::AlignmentRecord record = alignment::read_alignment(alignment_path);
        io::PDBParser parser;
        io::Protein template_protein = parser.parse_file(template_path);
        renumber::ResidueRenumberer renumberer(record, template_protein, template_path);

        std::vector<CandidateModel> models;
        models.reserve(model_paths.size());
        for (const auto& path : model_paths) {
            validation::validate_file_exists(path, "model structure");
            CandidateModel model;
            model.name = std::filesystem::path(path).stem().string();
            model.path = path;
            models.push_back(std::move(model));
        }

        auto results = renumber::renumber_models(renumberer, models, output_dir, std::cout);
        print_success("Renumbered " + std::to_string(results.size()) + " model(s)");
        return 0;
    } catch (const errors::LooptrimError& e) {
        std::cerr << e.formatted() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}

}  // namespace commands
}  // namespace looptrim
