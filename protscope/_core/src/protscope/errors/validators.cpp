#include "validators.h"
#include "messages.h"
#include <filesystem>

namespace fs = std::filesystem;

namespace protscope {
namespace validation {

void validate_file_exists(const std::string& path, const std::string& file_type) {
    if (!fs::exists(path)) {
        throw errors::FileNotFoundError(path, file_type);
    }
    if (!fs::is_regular_file(path)) {
        throw errors::ValidationError(
            file_type + " is not a regular file: " + path,
            "Provide a path to a file, not a directory"
        );
    }
}

void validate_output_path(const std::string& path) {
    fs::path p(path);
    fs::path parent = p.parent_path();

    if (!parent.empty() && !fs::exists(parent)) {
        throw errors::FileWriteError(
            path,
            "Parent directory does not exist: " + parent.string()
        );
    }
}

void validate_positive(int value, const std::string& param_name) {
    if (value <= 0) {
        throw errors::messages::parameter_must_be_positive(param_name, std::to_string(value));
    }
}

void validate_odd(int value, const std::string& param_name) {
    validate_positive(value, param_name);
    if (value % 2 == 0) {
        throw errors::messages::parameter_must_be_odd(param_name, std::to_string(value));
    }
}

}  // namespace validation
}  // namespace protscope
