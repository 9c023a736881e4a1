#pragma once

#include <functional>
#include <string>
#include <utility>

namespace looptrim {
namespace cli {

/**
 * Check run on the raw token before it is stored.
 *
 * The check returns an error message, or an empty string when the token is
 * acceptable. `description` is shown in --help next to the option.
 */
struct Validator {
    using Check = std::function<std::string(const std::string&)>;

    Validator(Check check, std::string description)
        : check(std::move(check)), description(std::move(description)) {
    }

    std::string operator()(const std::string& token) const {
        return check(token);
    }

    Check check;
    std::string description;
};

// Regular file on disk; used for the FASTA, template and alignment inputs
Validator ExistingFile();

// Numeric token within [min, max]; used for --models
Validator Range(double min, double max);

// "A:B" with something on both sides, for --loop START:END and --keep N:C.
// The integers themselves are parsed by loops::parse_int_pair.
Validator ColonPair(const std::string& what);

}  // namespace cli
}  // namespace looptrim
