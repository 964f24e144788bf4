#include "validators.h"
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace protscope {
namespace cli {

namespace {

bool to_number(const std::string& value, double& out) {
    if (value.empty()) {
        return false;
    }
    char* end = nullptr;
    out = std::strtod(value.c_str(), &end);
    return end != value.c_str() && *end == '\0';
}

std::string format_bound(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

}  // namespace

Validator ExistingFile() {
    return Validator(
        [](const std::string& filename) -> std::string {
            std::ifstream file(filename);
            if (!file.good()) {
                return "File does not exist: " + filename;
            }
            return "";
        },
        "FILE(existing)");
}

Validator Range(double min, double max) {
    return Validator(
        [min, max](const std::string& value) -> std::string {
            double num = 0.0;
            if (!to_number(value, num)) {
                return "Not a valid number: " + value;
            }
            if (!(num >= min && num <= max)) {
                std::ostringstream oss;
                oss << "Value " << num << " not in range [" << min << ", " << max << "]";
                return oss.str();
            }
            return "";
        },
        "in [" + format_bound(min) + ", " + format_bound(max) + "]");
}

Validator OddNumber() {
    return Validator(
        [](const std::string& value) -> std::string {
            double num = 0.0;
            if (!to_number(value, num)) {
                return "Not a valid number: " + value;
            }
            // Window sizes are stored as int; also rejects NaN
            if (!(num >= 1.0 && num <= static_cast<double>(std::numeric_limits<int>::max()))) {
                return "Window size must be a positive odd integer: " + value;
            }
            const long n = static_cast<long>(num);
            if (static_cast<double>(n) != num || n % 2 == 0) {
                return "Window size must be a positive odd integer: " + value;
            }
            return "";
        },
        "odd");
}

}  // namespace cli
}  // namespace protscope
