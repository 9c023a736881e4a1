#include "option.h"
#include "errors.h"
#include <sstream>

namespace looptrim {
namespace cli {

Option::Option(const std::string& names, const std::string& desc)
    : names_(names), description_(desc) {
    parse_names();
}

void Option::parse_names() {
    // "-o,--out-dir": dashes mark short and long names, anything else is a
    // positional name
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
    if (actual_count_ > 0 && !value_->is_multi()) {
        throw RepeatedOption(names_);
    }
    if (!value_->parse(input)) {
        throw ParseError("Invalid value '" + input + "' for " + names_ + " (expected " +
                         value_->type_name() + ")");
    }
    ++actual_count_;
}

void Option::set_flag() {
    parse("true");
}

bool Option::matches(const std::string& arg) const {
    for (const auto& s : short_names_) {
        if (arg == s)
            return true;
    }

    const std::string key = arg.substr(0, arg.find('='));
    for (const auto& l : long_names_) {
        if (key == l)
            return true;
    }
    return false;
}

std::optional<std::string> Option::extract_value(const std::string& arg) const {
    auto equals_pos = arg.find('=');
    if (equals_pos == std::string::npos) {
        return std::nullopt;
    }
    return arg.substr(equals_pos + 1);
}

std::string Option::signature() const {
    std::ostringstream oss;

    if (is_positional()) {
        oss << positional_names_[0];
    } else {
        bool first = true;
        for (const auto& s : short_names_) {
            oss << (first ? "" : ",") << s;
            first = false;
        }
        for (const auto& l : long_names_) {
            oss << (first ? "" : ",") << l;
            first = false;
        }
    }

    if (value_ && !is_flag_) {
        oss << " " << value_->type_name();
    }
    return oss.str();
}

}  // namespace cli
}  // namespace looptrim
