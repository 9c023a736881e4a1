#pragma once

#include <stdexcept>
#include <string>

namespace looptrim {
namespace cli {

// Exit codes of the looptrim executable. Pipeline failures
// (errors::LooptrimError) exit with kExitFailure from the command bodies.
constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// Anything wrong with the command line itself. App::exit prints it with a
// "Run 'looptrim <cmd> --help'" hint.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {
    }
    virtual int get_exit_code() const {
        return kExitUsage;
    }
};

// Value that cannot be stored, e.g. "-n 2.5" for an int option
class ParseError : public Error {
public:
    explicit ParseError(const std::string& msg) : Error(msg) {
    }
};

// "--loops" or a fourth positional to prepare
class UnknownArgument : public ParseError {
public:
    explicit UnknownArgument(const std::string& msg) : ParseError(msg) {
    }
};

// "--chain A --chain B"; only --loop and --keep repeat
class RepeatedOption : public ParseError {
public:
    explicit RepeatedOption(const std::string& option_names)
        : ParseError("Option " + option_names + " given more than once") {
    }
};

// Rejected by a Validator, e.g. "--loop 50-70" failing ColonPair
class ValidationError : public ParseError {
public:
    explicit ValidationError(const std::string& msg) : ParseError(msg) {
    }
};

// Missing --loop/--keep/--engine-cmd, positional or option value
class MissingArgument : public ParseError {
public:
    explicit MissingArgument(const std::string& msg) : ParseError(msg) {
    }
};

// -h/--help anywhere on the line
class CallForHelp : public Error {
public:
    CallForHelp() : Error("Help requested") {
    }
    int get_exit_code() const override {
        return kExitSuccess;
    }
};

}  // namespace cli
}  // namespace looptrim
