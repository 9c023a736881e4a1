#pragma once

#include "looptrim_error.h"
#include <string>
#include <vector>

namespace looptrim {
namespace validation {

/**
 * Centralized validation functions with consistent error messages.
 *
 * These functions throw specific error types (FileNotFoundError,
 * ConfigError, etc.) with helpful context and suggestions.
 */

/**
 * Validate that a file exists and is readable.
 *
 * @param path Path to the file
 * @param file_type Description of the file type for error messages
 * @throws FileNotFoundError if file doesn't exist or isn't readable
 */
void validate_file_exists(const std::string& path,
                          const std::string& file_type = "file");

/**
 * Validate that a directory exists.
 *
 * @param path Path to the directory
 * @throws FileNotFoundError if directory doesn't exist
 */
void validate_directory_exists(const std::string& path);

/**
 * Validate that a chain ID exists in the structure.
 *
 * @param available_chains List of available chain IDs
 * @param chain_id Requested chain ID
 * @param structure_path Path to structure file (for error messages)
 * @throws ChainNotFoundError if chain ID is not in the list
 */
void validate_chain_id(const std::vector<std::string>& available_chains,
                       const std::string& chain_id,
                       const std::string& structure_path);

/**
 * Validate that a value is positive.
 *
 * @throws ConfigError if value <= 0
 */
void validate_positive(int value, const std::string& param_name);

}  // namespace validation
}  // namespace looptrim
