#pragma once

#include <string>

namespace protscope {
namespace errors {

/**
 * Error categories for unified error handling across the engine, the CLI
 * and the Python bindings.
 */
enum class ErrorCategory {
    Sequence,        // Bad residue input, empty sequence
    Configuration,   // Reference table problems detected at startup
    FileIO,          // File not found, read/write errors
    Validation,      // Invalid parameters, out of range values
    Format,          // Parse errors in FASTA or reference table files
};

/**
 * Get string representation of error category for display.
 */
inline std::string category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Sequence:
            return "Sequence";
        case ErrorCategory::Configuration:
            return "Configuration";
        case ErrorCategory::FileIO:
            return "File I/O";
        case ErrorCategory::Validation:
            return "Validation";
        case ErrorCategory::Format:
            return "Format";
        default:
            return "Unknown";
    }
}

}  // namespace errors
}  // namespace protscope
