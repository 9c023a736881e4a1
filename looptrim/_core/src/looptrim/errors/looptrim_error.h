#pragma once

#include "error_categories.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace looptrim {
namespace errors {

/**
 * Base exception class for all looptrim errors.
 *
 * Provides structured error information with category, message,
 * suggestion, and context for helpful error reporting.
 */
class LooptrimError : public std::runtime_error {
protected:
    ErrorCategory category_;
    std::string message_;
    std::string suggestion_;
    std::string context_;

public:
    LooptrimError(ErrorCategory category, const std::string& message,
                  const std::string& suggestion = "",
                  const std::string& context = "");

    virtual ~LooptrimError() = default;

    ErrorCategory category() const { return category_; }
    const std::string& message() const { return message_; }
    const std::string& suggestion() const { return suggestion_; }
    const std::string& context() const { return context_; }

    /**
     * Get fully formatted error message for display.
     * Format:
     *   [ERROR] {category}: {message}
     *   Context: {context}
     *   Suggestion: {suggestion}
     */
    std::string formatted() const;
};

/**
 * Malformed numeric or position token (e.g. "50-70", "abc:3").
 */
class ParseError : public LooptrimError {
public:
    ParseError(const std::string& what_parsed,
               const std::string& token,
               const std::string& expected);
};

/**
 * Loop/keep configuration violates an invariant: overlap, empty trim,
 * out-of-range position, mismatched list lengths.
 */
class ConfigError : public LooptrimError {
public:
    ConfigError(const std::string& message,
                const std::string& suggestion = "",
                const std::string& context = "");
};

/**
 * File I/O error - file not found, cannot read.
 */
class FileNotFoundError : public LooptrimError {
public:
    FileNotFoundError(const std::string& path,
                      const std::string& file_type = "file");
};

/**
 * File cannot be written.
 */
class FileWriteError : public LooptrimError {
public:
    FileWriteError(const std::string& path,
                   const std::string& reason = "");
};

/**
 * File format error - FASTA, PIR or PDB content cannot be parsed.
 */
class FormatError : public LooptrimError {
public:
    FormatError(const std::string& path,
                const std::string& reason);
};

/**
 * Chain not found in structure.
 */
class ChainNotFoundError : public LooptrimError {
public:
    ChainNotFoundError(const std::string& chain_id,
                       const std::string& structure_path,
                       const std::vector<std::string>& available_chains);
};

/**
 * Residue index has no mapping in the trimmed numbering.
 */
class IndexError : public LooptrimError {
public:
    IndexError(int original_index, const std::string& reason);
};

/**
 * Every candidate model failed or was filtered out.
 */
class NoValidModelError : public LooptrimError {
public:
    NoValidModelError(size_t num_candidates, size_t num_failed);
};

/**
 * Residue correspondence between template, alignment and model cannot
 * be established.
 */
class StructureMismatchError : public LooptrimError {
public:
    StructureMismatchError(const std::string& structure,
                           const std::string& reason);
};

/**
 * External modeling engine could not be run or reported failure.
 */
class EngineError : public LooptrimError {
public:
    EngineError(const std::string& command,
                const std::string& error_message);
};

}  // namespace errors
}  // namespace looptrim
