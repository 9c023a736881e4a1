#include "residue_index_mapper.h"

#include <fstream>

#include "looptrim/common/logging.h"
#include "looptrim/errors/messages.h"

namespace looptrim {
namespace mapping {

using common::LogLevel;
using common::Logger;

const char* role_name(ResidueRole role) {
    switch (role) {
        case ResidueRole::Core:
            return "core";
        case ResidueRole::LinkerN:
            return "linker_n";
        case ResidueRole::LinkerC:
            return "linker_c";
        case ResidueRole::Trimmed:
            return "trimmed";
        default:
            return "unknown";
    }
}

ResidueIndexMapper::ResidueIndexMapper(const loops::LoopSet& loops, int sequence_length)
    : loops_(loops), sequence_length_(sequence_length) {
    if (sequence_length_ > 0) {
        loops_.validate_against(sequence_length_);
    }

    int running_offset = 0;
    spans_.reserve(loops_.size());

    for (size_t k = 0; k < loops_.size(); ++k) {
        const auto& loop = loops_[k];
        const int loop_number = static_cast<int>(k) + 1;
        const int trimmed_start = loop.trimmed_start();
        const int trimmed_end = loop.trimmed_end();
        const int trimmed_length = trimmed_end - trimmed_start + 1;

        // Kept N-terminal stretch: start < i < trimmed_start, shifted by earlier loops only
        Logger::instance()
            .event(LogLevel::Debug, "index_mapper")
            .field("loop", loop_number)
            .field("phase", "pre-trim")
            .field("kept", std::to_string(loop.start + 1) + ".." + std::to_string(trimmed_start - 1))
            .field("running_offset", running_offset)
            .emit();

        Logger::instance()
            .event(LogLevel::Debug, "index_mapper")
            .field("loop", loop_number)
            .field("phase", "trim")
            .field("trimmed_start", trimmed_start)
            .field("trimmed_end", trimmed_end)
            .field("trimmed_length", trimmed_length)
            .emit();

        spans_.push_back({trimmed_start, trimmed_end, running_offset, static_cast<int>(k)});
        running_offset += trimmed_length;

        // Kept C-terminal stretch: trimmed_end < i < end, shifted by this loop too
        Logger::instance()
            .event(LogLevel::Debug, "index_mapper")
            .field("loop", loop_number)
            .field("phase", "post-trim")
            .field("kept", std::to_string(trimmed_end + 1) + ".." + std::to_string(loop.end - 1))
            .field("running_offset", running_offset)
            .emit();
    }
}

std::optional<int> ResidueIndexMapper::map(int original) const {
    if (original < 1 || (sequence_length_ > 0 && original > sequence_length_)) {
        return std::nullopt;
    }

    int offset = 0;
    for (const auto& span : spans_) {
        if (original < span.first) {
            break;
        }
        if (original <= span.last) {
            return std::nullopt;
        }
        offset = span.offset_after();
    }
    return original - offset;
}

int ResidueIndexMapper::map_or_throw(int original) const {
    auto output = map(original);
    if (output) {
        return *output;
    }

    for (const auto& span : spans_) {
        if (original >= span.first && original <= span.last) {
            throw errors::IndexError(
                original, "trimmed by loop " + loops_[static_cast<size_t>(span.loop_index)].to_string());
        }
    }
    throw errors::IndexError(original, "outside the sequence");
}

int ResidueIndexMapper::offset_before(int original) const {
    int offset = 0;
    for (const auto& span : spans_) {
        if (original <= span.last) {
            break;
        }
        offset = span.offset_after();
    }
    return offset;
}

ResidueRole ResidueIndexMapper::role(int original) const {
    for (const auto& loop : loops_) {
        if (!loop.contains(original)) {
            continue;
        }
        if (loop.is_trimmed(original)) {
            return ResidueRole::Trimmed;
        }
        if (original > loop.start && original < loop.trimmed_start()) {
            return ResidueRole::LinkerN;
        }
        if (original > loop.trimmed_end() && original < loop.end) {
            return ResidueRole::LinkerC;
        }
    }
    return ResidueRole::Core;
}

int ResidueIndexMapper::excluded_count() const {
    return spans_.empty() ? 0 : spans_.back().offset_after();
}

std::vector<ResidueMapping> ResidueIndexMapper::mapping_table(int sequence_length) const {
    const int length = sequence_length > 0 ? sequence_length : sequence_length_;
    std::vector<ResidueMapping> table;
    table.reserve(static_cast<size_t>(length > 0 ? length : 0));

    size_t next_span = 0;
    int offset = 0;
    for (int i = 1; i <= length; ++i) {
        while (next_span < spans_.size() && i > spans_[next_span].last) {
            offset = spans_[next_span].offset_after();
            ++next_span;
        }

        ResidueMapping row;
        row.original = i;
        row.role = role(i);
        row.loop_index = -1;
        if (row.role != ResidueRole::Core) {
            for (size_t k = 0; k < loops_.size(); ++k) {
                if (loops_[k].contains(i)) {
                    row.loop_index = static_cast<int>(k);
                    break;
                }
            }
        }
        row.output = row.role == ResidueRole::Trimmed ? -1 : i - offset;
        table.push_back(row);
    }
    return table;
}

SelectionPredicate ResidueIndexMapper::selection_predicate() const {
    ResidueIndexMapper snapshot = *this;
    return [snapshot](int original) { return snapshot.map(original); };
}

void write_selection_file(const std::string& path, const std::vector<ResidueMapping>& table) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw errors::messages::file_write_error(path, "could not open for writing");
    }

    out << "# original output role\n";
    for (const auto& row : table) {
        if (row.role == ResidueRole::Trimmed) {
            continue;
        }
        out << row.original << ' ' << row.output << ' ' << role_name(row.role) << '\n';
    }
    out.close();
    if (out.fail()) {
        throw errors::messages::file_write_error(path, "write failed");
    }
}

}  // namespace mapping
}  // namespace looptrim
