#pragma once

#include "types.h"
#include "validators.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace looptrim {
namespace cli {

// Named option, boolean flag or positional argument
class Option {
    std::string names_;  // e.g. "-o,--out-dir" or "fasta"
    std::string description_;
    std::unique_ptr<TypedValue> value_;
    std::vector<Validator> validators_;
    bool required_{false};
    bool is_flag_{false};
    bool consume_remaining_{false};
    int actual_count_{0};

    std::vector<std::string> short_names_;       // "-o"
    std::vector<std::string> long_names_;        // "--out-dir"
    std::vector<std::string> positional_names_;  // "fasta"

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

    // Validate and store one value; throws ValidationError / ParseError
    void parse(const std::string& input);

    // Flags: record presence
    void set_flag();

    [[nodiscard]] bool matches(const std::string& arg) const;

    // Value of "--name=value", nullopt when arg has no '='
    [[nodiscard]] std::optional<std::string> extract_value(const std::string& arg) const;

    [[nodiscard]] bool consumes_remaining() const {
        return consume_remaining_;
    }
    [[nodiscard]] bool is_flag() const {
        return is_flag_;
    }
    [[nodiscard]] bool is_required() const {
        return required_;
    }
    [[nodiscard]] bool is_satisfied() const {
        return !required_ || actual_count_ > 0;
    }
    [[nodiscard]] bool is_positional() const {
        return !positional_names_.empty() && short_names_.empty() && long_names_.empty();
    }

    // "-o,--out-dir TEXT" or "models TEXT..."
    [[nodiscard]] std::string signature() const;

    [[nodiscard]] const std::string& names() const {
        return names_;
    }
    [[nodiscard]] const std::string& description() const {
        return description_;
    }
    [[nodiscard]] const std::vector<Validator>& validators() const {
        return validators_;
    }
};

}  // namespace cli
}  // namespace looptrim
