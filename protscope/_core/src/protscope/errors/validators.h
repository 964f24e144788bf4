#pragma once

#include "protscope_error.h"
#include <string>

namespace protscope {
namespace validation {

/**
 * Centralized parameter checks with consistent error messages.
 *
 * These functions throw specific error types (FileNotFoundError,
 * ValidationError, ...) with helpful context and suggestions.
 */

/**
 * Validate that a file exists and is a regular file.
 *
 * @param path Path to the file
 * @param file_type Description of the file type for error messages
 * @throws FileNotFoundError if file doesn't exist
 * @throws ValidationError if path is not a regular file
 */
void validate_file_exists(const std::string& path,
                          const std::string& file_type = "file");

/**
 * Validate that the parent directory of an output path exists.
 *
 * @throws FileWriteError if it does not
 */
void validate_output_path(const std::string& path);

/**
 * @throws ValidationError if value <= 0
 */
void validate_positive(int value, const std::string& param_name);

/**
 * Sliding windows are centred, so their size must be odd and positive.
 *
 * @throws ValidationError if value is even or < 1
 */
void validate_odd(int value, const std::string& param_name);

}  // namespace validation
}  // namespace protscope
