#pragma once

#include <cctype>
#include <cstddef>
#include <memory>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

namespace protscope {
namespace cli {

// Generic conversion from string; rejects trailing garbage ("12x")
template <typename T>
bool parse_value(const std::string& input, T& output) {
    std::istringstream ss(input);
    ss >> output;
    return !ss.fail() && ss.eof();
}

template <>
inline bool parse_value<std::string>(const std::string& input, std::string& output) {
    output = input;
    return true;
}

// Accepts true/false, yes/no, on/off, 1/0 (case-insensitive)
template <>
inline bool parse_value<bool>(const std::string& input, bool& output) {
    std::string lower = input;
    for (auto& c : lower)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lower == "true" || lower == "yes" || lower == "1" || lower == "on") {
        output = true;
        return true;
    } else if (lower == "false" || lower == "no" || lower == "0" || lower == "off") {
        output = false;
        return true;
    }
    return false;
}

// Repeated positionals append
template <>
inline bool parse_value<std::vector<std::string>>(const std::string& input,
                                                  std::vector<std::string>& output) {
    output.push_back(input);
    return true;
}

// Type-erased binding to a caller-owned variable
class TypedValue {
public:
    virtual ~TypedValue() = default;
    virtual bool parse(const std::string& input) = 0;
    virtual bool set_flag() = 0;  // store "present" for valueless flags
    virtual bool is_bool() const = 0;
    virtual std::string type_name() const = 0;
};

template <typename T>
class TypedValueImpl : public TypedValue {
    T* ptr_;

public:
    explicit TypedValueImpl(T* ptr) : ptr_(ptr) {
    }

    bool parse(const std::string& input) override {
        return parse_value(input, *ptr_);
    }

    bool set_flag() override {
        if constexpr (std::is_same<T, bool>::value) {
            *ptr_ = true;
            return true;
        } else {
            return false;
        }
    }

    bool is_bool() const override {
        return std::is_same<T, bool>::value;
    }

    std::string type_name() const override {
        if (std::is_same<T, std::string>::value)
            return "TEXT";
        if (std::is_same<T, std::vector<std::string>>::value)
            return "TEXT...";
        if (std::is_integral<T>::value && !std::is_same<T, bool>::value)
            return "INT";
        if (std::is_floating_point<T>::value)
            return "FLOAT";
        return "";
    }
};

}  // namespace cli
}  // namespace protscope
