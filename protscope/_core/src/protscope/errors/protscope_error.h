#pragma once

#include "error_categories.h"
#include <cstddef>
#include <stdexcept>
#include <string>

namespace protscope {
namespace errors {

/**
 * Base exception class for all protscope errors.
 *
 * Carries a category, message, suggestion and context so that the
 * presentation layer can decide how to show the failure.
 */
class ProtscopeError : public std::runtime_error {
protected:
    ErrorCategory category_;
    std::string message_;
    std::string suggestion_;
    std::string context_;

public:
    ProtscopeError(ErrorCategory category, const std::string& message,
                   const std::string& suggestion = "",
                   const std::string& context = "");

    virtual ~ProtscopeError() = default;

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
 * Raw input is empty after whitespace removal, or holds a character outside
 * the 20-letter amino-acid alphabet.
 */
class InvalidSequenceError : public ProtscopeError {
    char character_;
    std::size_t position_;
    bool has_character_;

public:
    // Empty input.
    InvalidSequenceError();

    // Offending character and its 0-based offset in the raw input.
    InvalidSequenceError(char character, std::size_t position);

    char character() const { return character_; }
    std::size_t position() const { return position_; }
    bool has_character() const { return has_character_; }
};

/**
 * An analyzer was handed an empty sequence. Unreachable through validate().
 */
class EmptySequenceError : public ProtscopeError {
public:
    explicit EmptySequenceError(const std::string& analyzer);
};

/**
 * The reference function table has no entries.
 */
class EmptyReferenceTableError : public ProtscopeError {
public:
    explicit EmptyReferenceTableError(const std::string& source = "");
};

/**
 * File not found or not readable.
 */
class FileNotFoundError : public ProtscopeError {
public:
    FileNotFoundError(const std::string& path,
                      const std::string& file_type = "file");
};

/**
 * File cannot be written.
 */
class FileWriteError : public ProtscopeError {
public:
    FileWriteError(const std::string& path,
                   const std::string& reason = "");
};

/**
 * Validation error - parameter out of range, invalid value.
 */
class ValidationError : public ProtscopeError {
public:
    ValidationError(const std::string& param_name,
                    const std::string& value,
                    const std::string& expected);

    ValidationError(const std::string& message,
                    const std::string& suggestion = "");
};

/**
 * Parse failure in a FASTA or reference table file.
 */
class FormatError : public ProtscopeError {
public:
    FormatError(const std::string& path,
                const std::string& reason,
                const std::string& expected_format = "");
};

/**
 * Vector length mismatch (embedding vs reference entry).
 */
class DimensionError : public ProtscopeError {
public:
    DimensionError(const std::string& param_name,
                   const std::string& actual,
                   const std::string& expected);
};

}  // namespace errors
}  // namespace protscope
