#include "alignment_builder.h"

#include <algorithm>

#include "looptrim/common/logging.h"
#include "looptrim/errors/messages.h"

namespace looptrim {
namespace alignment {

size_t AlignmentRecord::gap_count() const {
    return static_cast<size_t>(std::count(target_sequence.begin(), target_sequence.end(), kGapChar));
}

std::string AlignmentRecord::target_residues() const {
    std::string residues;
    residues.reserve(target_sequence.size());
    for (char c : target_sequence) {
        if (c != kGapChar) {
            residues.push_back(c);
        }
    }
    return residues;
}

std::vector<io::PirEntry> AlignmentRecord::to_pir_entries() const {
    io::PirEntry template_entry;
    template_entry.code = template_id;
    template_entry.description =
        "structureX:" + structure_file + ":FIRST:" + chain_id + ":LAST:" + chain_id + "::::";
    template_entry.sequence = template_sequence;

    io::PirEntry target_entry;
    target_entry.code = target_id;
    target_entry.description = "sequence:::::::::";
    target_entry.sequence = target_sequence;

    return {template_entry, target_entry};
}

std::string AlignmentRecord::to_pir() const {
    return io::format_pir(to_pir_entries());
}

AlignmentRecord AlignmentRecord::from_pir_entries(const std::vector<io::PirEntry>& entries,
                                                  const std::string& source_name) {
    const io::PirEntry* template_entry = nullptr;
    const io::PirEntry* target_entry = nullptr;
    for (const auto& entry : entries) {
        if (!template_entry && entry.description.compare(0, 9, "structure") == 0) {
            template_entry = &entry;
        } else if (!target_entry) {
            target_entry = &entry;
        }
    }

    if (!template_entry) {
        throw errors::messages::file_parse_error(source_name, "PIR", "no structure entry");
    }
    if (!target_entry) {
        throw errors::messages::file_parse_error(source_name, "PIR", "no target sequence entry");
    }
    if (template_entry->sequence.size() != target_entry->sequence.size()) {
        throw errors::messages::file_parse_error(
            source_name, "PIR",
            "template and target rows differ in length (" +
                std::to_string(template_entry->sequence.size()) + " vs " +
                std::to_string(target_entry->sequence.size()) + ")");
    }

    auto fields = template_entry->description_fields();
    AlignmentRecord record;
    record.template_id = template_entry->code;
    record.structure_file = fields.size() > 1 ? fields[1] : "";
    record.chain_id = fields.size() > 3 && !fields[3].empty() ? fields[3] : "A";
    record.target_id = target_entry->code;
    record.template_sequence = template_entry->sequence;
    record.target_sequence = target_entry->sequence;
    return record;
}

std::vector<SequenceSpan> plan_spans(size_t sequence_length, const loops::LoopSet& loops) {
    std::vector<SequenceSpan> spans;
    size_t cursor = 0;

    for (const auto& loop : loops) {
        size_t gap_begin = static_cast<size_t>(loop.start + loop.keep_n);
        size_t gap_end = static_cast<size_t>(loop.end - loop.keep_c - 1);

        if (gap_begin > cursor) {
            spans.push_back({cursor, gap_begin, false});
        }
        spans.push_back({gap_begin, gap_end, true});
        cursor = gap_end;
    }

    if (cursor < sequence_length) {
        spans.push_back({cursor, sequence_length, false});
    }
    return spans;
}

std::string build_gapped_sequence(const std::string& sequence, const loops::LoopSet& loops) {
    std::string gapped;
    gapped.reserve(sequence.size());

    for (const auto& span : plan_spans(sequence.size(), loops)) {
        if (span.gap) {
            gapped.append(span.length(), kGapChar);
        } else {
            gapped.append(sequence, span.begin, span.length());
        }
    }
    return gapped;
}

AlignmentRecord build_alignment(const std::string& template_sequence,
                                const loops::LoopSet& loops,
                                const AlignmentIds& ids) {
    loops.validate_against(static_cast<int>(template_sequence.size()));

    AlignmentRecord record;
    record.template_id = ids.template_id;
    record.structure_file = ids.structure_file;
    record.chain_id = ids.chain_id;
    record.target_id = ids.target_id;
    record.template_sequence = template_sequence;
    record.target_sequence = build_gapped_sequence(template_sequence, loops);

    for (size_t i = 0; i < loops.size(); ++i) {
        common::Logger::instance()
            .event(common::LogLevel::Debug, "alignment_builder")
            .field("loop", i + 1)
            .field("gap_begin", loops[i].trimmed_start())
            .field("gap_end", loops[i].trimmed_end())
            .field("gap_length", loops[i].trimmed_length())
            .emit();
    }
    return record;
}

void write_alignment(const AlignmentRecord& record, const std::string& path) {
    io::write_pir_file(path, record.to_pir_entries());
    common::log_info("Wrote alignment " + path + " (" + std::to_string(record.length()) +
                     " columns, " + std::to_string(record.gap_count()) + " gaps)");
}

AlignmentRecord read_alignment(const std::string& path) {
    return AlignmentRecord::from_pir_entries(io::read_pir_file(path), path);
}

}  // namespace alignment
}  // namespace looptrim
