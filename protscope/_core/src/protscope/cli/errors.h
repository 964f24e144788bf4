#pragma once

#include <stdexcept>
#include <string>

namespace protscope {
namespace cli {

// Base error class for all command-line parsing errors
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {
    }
    virtual int get_exit_code() const {
        return 1;
    }
};

// Malformed command line: unknown argument, unparseable value
class ParseError : public Error {
public:
    explicit ParseError(const std::string& msg) : Error(msg) {
    }
};

// A value parsed but failed a validator
class ValidationError : public ParseError {
public:
    explicit ValidationError(const std::string& msg) : ParseError(msg) {
    }
};

// Required option or positional not supplied
class MissingArgument : public ParseError {
public:
    explicit MissingArgument(const std::string& msg) : ParseError(msg) {
    }
};

// -h/--help (not an error, exit 0)
class CallForHelp : public Error {
public:
    CallForHelp() : Error("Help requested") {
    }
    int get_exit_code() const override {
        return 0;
    }
};

}  // namespace cli
}  // namespace protscope
