#include "validators.h"
#include "messages.h"
#include <filesystem>

namespace fs = std::filesystem;

namespace looptrim {
namespace validation {

void validate_file_exists(const std::string& path, const std::string& file_type) {
    if (!fs::exists(path)) {
        throw errors::FileNotFoundError(path, file_type);
    }
    if (!fs::is_regular_file(path)) {
        throw errors::ConfigError(
            file_type + " is not a regular file: " + path,
            "Provide a path to a file, not a directory"
        );
    }
}

void validate_directory_exists(const std::string& path) {
    if (!fs::exists(path)) {
        throw errors::FileNotFoundError(path, "Directory");
    }
    if (!fs::is_directory(path)) {
        throw errors::ConfigError(
            "Path is not a directory: " + path,
            "Provide a path to a directory, not a file"
        );
    }
}

void validate_chain_id(const std::vector<std::string>& available_chains,
                       const std::string& chain_id,
                       const std::string& structure_path) {
    for (const auto& chain : available_chains) {
        if (chain == chain_id) {
            return;  // Found it
        }
    }

    throw errors::messages::chain_not_found(chain_id, structure_path, available_chains);
}

void validate_positive(int value, const std::string& param_name) {
    if (value <= 0) {
        throw errors::ConfigError(
            "Invalid value for " + param_name + ": " + std::to_string(value),
            "Expected: positive integer (> 0)"
        );
    }
}

}  // namespace validation
}  // namespace looptrim
