#include "protscope_error.h"
#include <sstream>

namespace protscope {
namespace errors {

namespace {

std::string describe_character(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (uc < 0x20 || uc >= 0x7f) {
        std::ostringstream oss;
        oss << "byte 0x" << std::hex << static_cast<int>(uc);
        return oss.str();
    }
    return std::string("'") + c + "'";
}

}  // namespace

ProtscopeError::ProtscopeError(ErrorCategory category, const std::string& message,
                               const std::string& suggestion, const std::string& context)
    : std::runtime_error(message),
      category_(category),
      message_(message),
      suggestion_(suggestion),
      context_(context) {}

std::string ProtscopeError::formatted() const {
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

InvalidSequenceError::InvalidSequenceError()
    : ProtscopeError(
        ErrorCategory::Sequence,
        "Sequence is empty",
        "Enter at least one amino-acid residue",
        ""),
      character_('\0'),
      position_(0),
      has_character_(false) {}

InvalidSequenceError::InvalidSequenceError(char character, std::size_t position)
    : ProtscopeError(
        ErrorCategory::Sequence,
        "Invalid residue " + describe_character(character) + " at position " +
            std::to_string(position + 1),
        "Use only the 20 canonical one-letter codes: ACDEFGHIKLMNPQRSTVWY",
        "Offset " + std::to_string(position) + " in the raw input"),
      character_(character),
      position_(position),
      has_character_(true) {}

EmptySequenceError::EmptySequenceError(const std::string& analyzer)
    : ProtscopeError(
        ErrorCategory::Sequence,
        analyzer + " received an empty sequence",
        "Validate raw input before analysis",
        "") {}

EmptyReferenceTableError::EmptyReferenceTableError(const std::string& source)
    : ProtscopeError(
        ErrorCategory::Configuration,
        "Reference function table has no entries",
        "Provide at least one 'label<TAB>vector' line",
        source.empty() ? "" : "Source: " + source) {}

FileNotFoundError::FileNotFoundError(const std::string& path, const std::string& file_type)
    : ProtscopeError(
        ErrorCategory::FileIO,
        file_type + " not found: " + path,
        "Check that the file path exists and is readable",
        "") {}

FileWriteError::FileWriteError(const std::string& path, const std::string& reason)
    : ProtscopeError(
        ErrorCategory::FileIO,
        "Cannot write to file: " + path,
        "Check that the directory exists and you have write permissions",
        reason.empty() ? "" : "Reason: " + reason) {}

ValidationError::ValidationError(const std::string& param_name,
                                 const std::string& value,
                                 const std::string& expected)
    : ProtscopeError(
        ErrorCategory::Validation,
        "Invalid value for " + param_name + ": " + value,
        "Expected: " + expected,
        "") {}

ValidationError::ValidationError(const std::string& message, const std::string& suggestion)
    : ProtscopeError(ErrorCategory::Validation, message, suggestion, "") {}

FormatError::FormatError(const std::string& path,
                         const std::string& reason,
                         const std::string& expected_format)
    : ProtscopeError(
        ErrorCategory::Format,
        "Format error in " + path + ": " + reason,
        expected_format.empty() ? "" : "Expected format: " + expected_format,
        "") {}

DimensionError::DimensionError(const std::string& param_name,
                               const std::string& actual,
                               const std::string& expected)
    : ProtscopeError(
        ErrorCategory::Validation,
        "Invalid length for " + param_name + ": " + actual,
        "Expected length: " + expected,
        "") {}

}  // namespace errors
}  // namespace protscope
