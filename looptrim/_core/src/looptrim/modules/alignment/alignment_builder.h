#pragma once

#include <string>
#include <vector>

#include "looptrim/io/pir_alignment.h"
#include "looptrim/modules/loops/loop_spec.h"

namespace looptrim {
namespace alignment {

constexpr char kGapChar = '-';

/**
 * Identifiers written into the alignment headers.
 */
struct AlignmentIds {
    std::string template_id;     // Code of the template entry (">P1;<template_id>")
    std::string structure_file;  // Structure the template entry points at
    std::string chain_id = "A";
    std::string target_id;       // Code of the gapped target entry
};

/**
 * Two-entry modeling alignment: the full template sequence and the target
 * sequence with every loop's trimmed span replaced by gaps.
 *
 * Invariant: target_sequence.size() == template_sequence.size().
 */
struct AlignmentRecord {
    std::string template_id;
    std::string structure_file;
    std::string chain_id;
    std::string target_id;
    std::string template_sequence;
    std::string target_sequence;

    size_t length() const { return template_sequence.size(); }

    // Number of gap characters in the target
    size_t gap_count() const;

    // Target sequence with gaps removed (what the engine builds)
    std::string target_residues() const;

    size_t retained_length() const { return length() - gap_count(); }

    std::vector<io::PirEntry> to_pir_entries() const;

    // Full PIR text as written to <id>.ali
    std::string to_pir() const;

    /**
     * Rebuild a record from PIR entries: the entry whose description starts
     * with "structure" is the template, the first other entry the target.
     *
     * @throws FormatError if either entry is missing or lengths differ
     */
    static AlignmentRecord from_pir_entries(const std::vector<io::PirEntry>& entries,
                                            const std::string& source_name);
};

/**
 * Kept or gapped stretch of the template, 0-based half-open [begin, end).
 */
struct SequenceSpan {
    size_t begin;
    size_t end;
    bool gap;

    size_t length() const { return end - begin; }
};

/**
 * Partition [0, sequence_length) into ordered kept and gap spans.
 *
 * For each loop the gap span is [start + keep_n, end - keep_c - 1), i.e. the
 * 1-based trimmed span trimmed_start..trimmed_end.
 */
std::vector<SequenceSpan> plan_spans(size_t sequence_length, const loops::LoopSet& loops);

/**
 * Emit the gapped target sequence in one left-to-right pass over the spans.
 */
std::string build_gapped_sequence(const std::string& sequence, const loops::LoopSet& loops);

/**
 * Build the alignment record.
 *
 * @throws ConfigError if a loop lies outside the template sequence
 */
AlignmentRecord build_alignment(const std::string& template_sequence,
                                const loops::LoopSet& loops,
                                const AlignmentIds& ids);

/**
 * Write the record as PIR to path.
 *
 * @throws FileWriteError on failure
 */
void write_alignment(const AlignmentRecord& record, const std::string& path);

/**
 * Read a record previously written by write_alignment().
 *
 * @throws FileNotFoundError, FormatError
 */
AlignmentRecord read_alignment(const std::string& path);

}  // namespace alignment
}  // namespace looptrim
