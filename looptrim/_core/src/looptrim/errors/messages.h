#pragma once

#include "looptrim_error.h"
#include "error_categories.h"
#include <string>
#include <vector>

namespace looptrim {
namespace errors {
namespace messages {

/**
 * Pre-defined error message templates for common error scenarios.
 *
 * These functions create consistent, helpful error messages with
 * appropriate suggestions and context.
 */

// ============================================================================
// File I/O Errors
// ============================================================================

inline FileNotFoundError file_not_found(const std::string& path,
                                        const std::string& file_type = "file") {
    return FileNotFoundError(path, file_type);
}

inline FileWriteError file_write_error(const std::string& path,
                                       const std::string& reason = "") {
    return FileWriteError(path, reason);
}

inline FormatError file_parse_error(const std::string& path,
                                    const std::string& format,
                                    const std::string& error_detail) {
    return FormatError(path, "Failed to parse " + format + " file: " + error_detail);
}

// ============================================================================
// Loop Configuration Errors
// ============================================================================

inline ConfigError loop_count_mismatch(size_t num_loops, size_t num_keeps) {
    return ConfigError(
        "Got " + std::to_string(num_loops) + " loop range(s) but " +
            std::to_string(num_keeps) + " keep pair(s)",
        "Give exactly one --keep N:C for every --loop START:END");
}

inline ConfigError no_loops() {
    return ConfigError(
        "No loops specified",
        "Give at least one --loop START:END and matching --keep N:C");
}

inline ConfigError empty_trim(const std::string& loop, long long kept, long long interior) {
    return ConfigError(
        "Loop " + loop + " leaves nothing to trim",
        "Reduce keep_n/keep_c so that at least one interior residue is removed",
        "keeps " + std::to_string(kept) + " of " + std::to_string(interior) +
            " interior residues");
}

inline ConfigError loops_overlap(const std::string& first, const std::string& second) {
    return ConfigError(
        "Loops " + first + " and " + second + " overlap",
        "Loops must be disjoint: each loop must end before the next one starts");
}

inline ConfigError position_out_of_range(const std::string& loop, int sequence_length) {
    return ConfigError(
        "Loop " + loop + " lies outside the sequence",
        "Positions must be in [1, " + std::to_string(sequence_length) + "]");
}

// ============================================================================
// Structure Errors
// ============================================================================

inline ChainNotFoundError chain_not_found(const std::string& chain_id,
                                          const std::string& path,
                                          const std::vector<std::string>& available) {
    return ChainNotFoundError(chain_id, path, available);
}

inline FormatError no_chains_in_structure(const std::string& path) {
    return FormatError(path, "structure has no ATOM records");
}

inline StructureMismatchError residue_count_mismatch(const std::string& structure,
                                                     size_t actual, size_t expected) {
    return StructureMismatchError(
        structure,
        "has " + std::to_string(actual) + " residues, alignment expects " +
            std::to_string(expected));
}

}  // namespace messages
}  // namespace errors
}  // namespace looptrim
