#include "looptrim_error.h"
#include <sstream>

namespace looptrim {
namespace errors {

LooptrimError::LooptrimError(ErrorCategory category, const std::string& message,
                             const std::string& suggestion, const std::string& context)
    : std::runtime_error(message),
      category_(category),
      message_(message),
      suggestion_(suggestion),
      context_(context) {}

std::string LooptrimError::formatted() const {
    std::ostringstream oss;
    oss << "[ERROR] " << category_to_string(category_) << ": " << message_;

    if (!context_.empty()) {
        oss << "\n  Context: " << context_;
    }

    if (!suggestion_.empty()) {
        oss << "\n  Suggestion: " << suggestion_;
    }

    return oss.str();
}

ParseError::ParseError(const std::string& what_parsed,
                       const std::string& token,
                       const std::string& expected)
    : LooptrimError(
        ErrorCategory::Format,
        "Cannot parse " + what_parsed + ": '" + token + "'",
        "Expected: " + expected,
        "") {}

ConfigError::ConfigError(const std::string& message,
                         const std::string& suggestion,
                         const std::string& context)
    : LooptrimError(ErrorCategory::Validation, message, suggestion, context) {}

FileNotFoundError::FileNotFoundError(const std::string& path, const std::string& file_type)
    : LooptrimError(
        ErrorCategory::FileIO,
        file_type + " not found: " + path,
        "Check that the file path exists and is readable",
        "") {}

FileWriteError::FileWriteError(const std::string& path, const std::string& reason)
    : LooptrimError(
        ErrorCategory::FileIO,
        "Cannot write to file: " + path,
        "Check that the directory exists and you have write permissions",
        reason.empty() ? "" : "Reason: " + reason) {}

FormatError::FormatError(const std::string& path, const std::string& reason)
    : LooptrimError(
        ErrorCategory::Format,
        "Format error in " + path + ": " + reason,
        "",
        "") {}

ChainNotFoundError::ChainNotFoundError(const std::string& chain_id,
                                       const std::string& structure_path,
                                       const std::vector<std::string>& available_chains)
    : LooptrimError(
        ErrorCategory::UserError,
        "Chain '" + chain_id + "' not found in " + structure_path,
        [&]() {
            if (available_chains.empty()) {
                return std::string("Structure has no chains");
            }
            std::string result = "Available chains: ";
            for (size_t i = 0; i < available_chains.size(); ++i) {
                if (i > 0) result += ", ";
                result += available_chains[i];
            }
            return result;
        }(),
        "Use a single-character chain ID (A, B, C, ...)") {}

IndexError::IndexError(int original_index, const std::string& reason)
    : LooptrimError(
        ErrorCategory::Algorithm,
        "Residue " + std::to_string(original_index) + " has no output index: " + reason,
        "Only query residues outside the trimmed span of every loop",
        "") {}

NoValidModelError::NoValidModelError(size_t num_candidates, size_t num_failed)
    : LooptrimError(
        ErrorCategory::Algorithm,
        "No valid model among " + std::to_string(num_candidates) + " candidates",
        "Inspect the modeling engine log; try more models or longer keep stretches",
        std::to_string(num_failed) + " candidate(s) reported failure") {}

StructureMismatchError::StructureMismatchError(const std::string& structure,
                                               const std::string& reason)
    : LooptrimError(
        ErrorCategory::UserError,
        "Residue correspondence failed for " + structure + ": " + reason,
        "Check that the FASTA sequence matches the template chain and the alignment file",
        "") {}

EngineError::EngineError(const std::string& command, const std::string& error_message)
    : LooptrimError(
        ErrorCategory::Algorithm,
        "Modeling engine failed: " + error_message,
        "Run the engine command by hand to see its output",
        "Command: " + command) {}

}  // namespace errors
}  // namespace looptrim
