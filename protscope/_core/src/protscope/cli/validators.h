#pragma once

#include <functional>
#include <string>
#include <utility>

namespace protscope {
namespace cli {

// Checks a raw argument string; returns an error message, or "" if valid
class Validator {
    std::function<std::string(const std::string&)> func_;
    std::string description_;

public:
    Validator(std::function<std::string(const std::string&)> func, const std::string& desc)
        : func_(std::move(func)), description_(desc) {
    }

    std::string operator()(const std::string& value) const {
        return func_(value);
    }

    const std::string& description() const {
        return description_;
    }
};

Validator ExistingFile();
Validator Range(double min, double max);
Validator OddNumber();

}  // namespace cli
}  // namespace protscope
