#pragma once

#include <string>

namespace looptrim {
namespace errors {

/**
 * What went wrong, as shown after "[ERROR]" in formatted() output.
 *
 *   FileIO      FileNotFoundError, FileWriteError
 *   Validation  ConfigError: loop/keep combinations, model count, target id
 *   Format      ParseError, FormatError: tokens, FASTA, PIR, PDB, score tables
 *   Algorithm   IndexError, NoValidModelError, EngineError
 *   UserError   ChainNotFoundError, StructureMismatchError
 */
enum class ErrorCategory {
    FileIO,
    Validation,
    Format,
    Algorithm,
    UserError,
};

// Validation is shown as "Configuration": every such error comes from --loop,
// --keep or another run setting
inline std::string category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::FileIO:
            return "File I/O";
        case ErrorCategory::Validation:
            return "Configuration";
        case ErrorCategory::Format:
            return "Format";
        case ErrorCategory::Algorithm:
            return "Algorithm";
        case ErrorCategory::UserError:
            return "User Error";
    }
    return "Unknown";
}

}  // namespace errors
}  // namespace looptrim
