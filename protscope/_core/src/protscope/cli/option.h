#pragma once

#include "types.h"
#include "validators.h"
#include <memory>
#include <string>
#include <vector>

namespace protscope {
namespace cli {

// A named option ("-o,--output"), a valueless flag ("--quiet"), or a
// positional argument ("input")
class Option {
    std::string names_;
    std::string description_;
    std::unique_ptr<TypedValue> value_;
    std::vector<Validator> validators_;
    bool required_{false};
    bool is_flag_{false};
    bool consume_remaining_{false};
    int actual_count_{0};

    std::vector<std::string> short_names_;       // "-o"
    std::vector<std::string> long_names_;        // "--output"
    std::vector<std::string> positional_names_;  // "input"

    void parse_names();

public:
    Option(const std::string& names, const std::string& desc);

    Option* required(bool value = true);
    Option* check(const Validator& validator);
    Option* consume_remaining(bool value = true);
    Option* flag(bool value = true);

    template <typename T>
    Option* bind(T* ptr) {
        value_ = std::make_unique<TypedValueImpl<T>>(ptr);
        return this;
    }

    // Validate and store one value
    void parse(const std::string& input);
    // Record a valueless flag
    void set();

    [[nodiscard]] bool matches(const std::string& arg) const;
    [[nodiscard]] bool has_inline_value(const std::string& arg) const;
    [[nodiscard]] std::string inline_value(const std::string& arg) const;  // --name=value

    [[nodiscard]] bool is_flag() const {
        return is_flag_;
    }
    [[nodiscard]] bool consumes_remaining() const {
        return consume_remaining_;
    }
    [[nodiscard]] bool is_required() const {
        return required_;
    }
    [[nodiscard]] bool is_satisfied() const {
        return !required_ || actual_count_ > 0;
    }
    [[nodiscard]] int count() const {
        return actual_count_;
    }
    [[nodiscard]] const std::string& names() const {
        return names_;
    }
    [[nodiscard]] const std::string& description() const {
        return description_;
    }
    // Names plus type and validator hints, e.g. "--window INT (odd)"
    [[nodiscard]] std::string signature() const;
};

}  // namespace cli
}  // namespace protscope
