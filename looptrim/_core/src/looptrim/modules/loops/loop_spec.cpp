#include "loop_spec.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>

#include "looptrim/common/logging.h"
#include "looptrim/errors/messages.h"

namespace looptrim {
namespace loops {

std::string LoopSpec::to_string() const {
    return std::to_string(start) + ":" + std::to_string(end) + " (keep " +
           std::to_string(keep_n) + ":" + std::to_string(keep_c) + ")";
}

void validate_loop_spec(const LoopSpec& loop) {
    if (loop.start < 1) {
        throw errors::ConfigError(
            "Loop " + loop.to_string() + " starts before residue 1",
            "Loop positions are 1-based");
    }
    if (loop.end <= loop.start) {
        throw errors::ConfigError(
            "Loop " + loop.to_string() + " ends before it starts",
            "Loop ranges are START:END with END > START");
    }
    if (loop.keep_n < 0 || loop.keep_c < 0) {
        throw errors::ConfigError(
            "Loop " + loop.to_string() + " has a negative keep count",
            "keep_n and keep_c must be >= 0");
    }
    // Compared in 64 bits so huge keep counts cannot wrap
    const int64_t interior = static_cast<int64_t>(loop.end) - loop.start - 1;
    const int64_t kept = static_cast<int64_t>(loop.keep_n) + loop.keep_c;
    if (kept >= interior) {
        throw errors::messages::empty_trim(loop.to_string(), kept, interior);
    }
}

LoopSet::LoopSet(std::vector<LoopSpec> loops) : loops_(std::move(loops)) {
    for (const auto& loop : loops_) {
        validate_loop_spec(loop);
    }

    std::sort(loops_.begin(), loops_.end(),
              [](const LoopSpec& a, const LoopSpec& b) { return a.start < b.start; });

    for (size_t i = 1; i < loops_.size(); ++i) {
        if (loops_[i - 1].end >= loops_[i].start) {
            throw errors::messages::loops_overlap(loops_[i - 1].to_string(),
                                                  loops_[i].to_string());
        }
    }
}

int LoopSet::total_trimmed() const {
    int total = 0;
    for (const auto& loop : loops_) {
        total += loop.trimmed_length();
    }
    return total;
}

void LoopSet::validate_against(int sequence_length) const {
    for (const auto& loop : loops_) {
        if (loop.start < 1 || loop.end > sequence_length) {
            throw errors::messages::position_out_of_range(loop.to_string(), sequence_length);
        }
    }
}

int parse_int(const std::string& token, const std::string& what) {
    const std::string expected = "a decimal integer";
    if (token.empty()) {
        throw errors::ParseError(what, token, expected);
    }

    size_t first_digit = (token[0] == '-' || token[0] == '+') ? 1 : 0;
    if (first_digit == token.size()) {
        throw errors::ParseError(what, token, expected);
    }
    for (size_t i = first_digit; i < token.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(token[i]))) {
            throw errors::ParseError(what, token, expected);
        }
    }

    try {
        return std::stoi(token);
    } catch (const std::out_of_range&) {
        throw errors::ParseError(what, token, "an integer within 32-bit range");
    }
}

std::pair<int, int> parse_int_pair(const std::string& token, const std::string& what) {
    auto colon = token.find(':');
    if (colon == std::string::npos || token.find(':', colon + 1) != std::string::npos) {
        throw errors::ParseError(what, token, "two integers separated by ':' (e.g. 50:70)");
    }
    int first = parse_int(token.substr(0, colon), what);
    int second = parse_int(token.substr(colon + 1), what);
    return {first, second};
}

LoopSet parse_loop_set(const std::vector<std::string>& loop_tokens,
                       const std::vector<std::string>& keep_tokens) {
    if (loop_tokens.size() != keep_tokens.size()) {
        throw errors::messages::loop_count_mismatch(loop_tokens.size(), keep_tokens.size());
    }
    if (loop_tokens.empty()) {
        throw errors::messages::no_loops();
    }

    std::vector<LoopSpec> specs;
    specs.reserve(loop_tokens.size());
    for (size_t i = 0; i < loop_tokens.size(); ++i) {
        auto range = parse_int_pair(loop_tokens[i], "loop range");
        auto keep = parse_int_pair(keep_tokens[i], "keep pair");

        LoopSpec spec;
        spec.start = range.first;
        spec.end = range.second;
        spec.keep_n = keep.first;
        spec.keep_c = keep.second;
        specs.push_back(spec);
    }

    LoopSet loop_set(std::move(specs));

    for (size_t i = 0; i < loop_set.size(); ++i) {
        common::Logger::instance()
            .event(common::LogLevel::Debug, "loop_parser")
            .field("loop", i + 1)
            .field("start", loop_set[i].start)
            .field("end", loop_set[i].end)
            .field("keep_n", loop_set[i].keep_n)
            .field("keep_c", loop_set[i].keep_c)
            .emit();
    }
    return loop_set;
}

LoopSet parse_loop_set(const std::vector<std::string>& loop_tokens,
                       const std::vector<std::string>& keep_tokens,
                       int sequence_length) {
    LoopSet loop_set = parse_loop_set(loop_tokens, keep_tokens);
    loop_set.validate_against(sequence_length);
    return loop_set;
}

}  // namespace loops
}  // namespace looptrim
