#pragma once

#include "protscope_error.h"
#include <cstddef>
#include <string>

namespace protscope {
namespace errors {
namespace messages {

/**
 * Pre-defined error message templates for common error scenarios.
 *
 * Factories return the concrete error type so callers can catch the
 * specific class.
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

// ============================================================================
// FASTA Errors
// ============================================================================

inline FormatError fasta_no_records(const std::string& path) {
    return FormatError(path, "no sequence records found", "FASTA ('>' header lines)");
}

inline FormatError fasta_empty_record(const std::string& path,
                                      const std::string& name,
                                      std::size_t line) {
    return FormatError(
        path,
        "record '" + name + "' ending at line " + std::to_string(line) + " has no residues",
        "FASTA ('>' header followed by sequence lines)");
}

// ============================================================================
// Reference Table Errors
// ============================================================================

inline FormatError reference_parse_error(const std::string& path,
                                         std::size_t line,
                                         const std::string& detail) {
    return FormatError(
        path,
        "line " + std::to_string(line) + ": " + detail,
        "label<TAB>v1 v2 ... (non-negative numbers)");
}

inline DimensionError reference_dimension_mismatch(const std::string& label,
                                                   std::size_t actual,
                                                   std::size_t expected) {
    return DimensionError(
        "reference vector '" + label + "'",
        std::to_string(actual),
        std::to_string(expected));
}

inline DimensionError embedding_dimension_mismatch(std::size_t embedding_dim,
                                                   std::size_t reference_dim) {
    return DimensionError(
        "query embedding",
        std::to_string(embedding_dim),
        std::to_string(reference_dim) + " (reference table dimension)");
}

// ============================================================================
// Validation Errors
// ============================================================================

inline ValidationError parameter_must_be_positive(const std::string& param_name,
                                                  const std::string& value) {
    return ValidationError(
        param_name,
        value,
        "positive value (> 0)"
    );
}

inline ValidationError parameter_must_be_odd(const std::string& param_name,
                                             const std::string& value) {
    return ValidationError(
        param_name,
        value,
        "odd window size (1, 3, 5, ...)"
    );
}

}  // namespace messages
}  // namespace errors
}  // namespace protscope
