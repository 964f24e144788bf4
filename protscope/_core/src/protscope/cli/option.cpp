#include "option.h"
#include "errors.h"
#include <sstream>

namespace protscope {
namespace cli {

Option::Option(const std::string& names, const std::string& desc)
    : names_(names), description_(desc) {
    parse_names();
}

void Option::parse_names() {
    // "-o,--output" -> short + long; "input" -> positional
    std::string current;
    std::istringstream stream(names_);

    while (std::getline(stream, current, ',')) {
        current.erase(0, current.find_first_not_of(" \t"));
        current.erase(current.find_last_not_of(" \t") + 1);

        if (current.empty())
            continue;

        if (current.size() >= 2 && current[0] == '-' && current[1] == '-') {
            long_names_.push_back(current);
        } else if (current.size() >= 2 && current[0] == '-') {
            short_names_.push_back(current);
        } else {
            positional_names_.push_back(current);
        }
    }
}

Option* Option::required(bool value) {
    required_ = value;
    return this;
}

Option* Option::check(const Validator& validator) {
    validators_.push_back(validator);
    return this;
}

Option* Option::consume_remaining(bool value) {
    consume_remaining_ = value;
    return this;
}

Option* Option::flag(bool value) {
    is_flag_ = value;
    return this;
}

void Option::parse(const std::string& input) {
    for (const auto& validator : validators_) {
        std::string error = validator(input);
        if (!error.empty()) {
            throw ValidationError(names_ + ": " + error);
        }
    }

    if (!value_) {
        throw ParseError("Option not bound to a variable: " + names_);
    }
    if (!value_->parse(input)) {
        throw ParseError("Failed to parse value '" + input + "' for option " + names_);
    }

    ++actual_count_;
}

void Option::set() {
    if (!value_ || !value_->set_flag()) {
        throw ParseError("Option " + names_ + " requires a value");
    }
    ++actual_count_;
}

bool Option::matches(const std::string& arg) const {
    for (const auto& s : short_names_) {
        if (arg == s)
            return true;
    }

    const std::string name = arg.substr(0, arg.find('='));
    for (const auto& l : long_names_) {
        if (name == l)
            return true;
    }
    return false;
}

bool Option::has_inline_value(const std::string& arg) const {
    return arg.size() > 2 && arg[0] == '-' && arg[1] == '-' &&
           arg.find('=') != std::string::npos;
}

std::string Option::inline_value(const std::string& arg) const {
    return arg.substr(arg.find('=') + 1);
}

std::string Option::signature() const {
    std::ostringstream oss;

    if (!short_names_.empty() || !long_names_.empty()) {
        bool first = true;
        for (const auto& s : short_names_) {
            oss << (first ? "" : ",") << s;
            first = false;
        }
        for (const auto& l : long_names_) {
            oss << (first ? "" : ",") << l;
            first = false;
        }
    } else if (!positional_names_.empty()) {
        oss << positional_names_[0];
    }

    if (value_ && !is_flag_ && !value_->type_name().empty()) {
        oss << " " << value_->type_name();
    }

    if (!validators_.empty()) {
        oss << " (";
        for (size_t i = 0; i < validators_.size(); ++i) {
            oss << (i > 0 ? ", " : "") << validators_[i].description();
        }
        oss << ")";
    }

    return oss.str();
}

}  // namespace cli
}  // namespace protscope
