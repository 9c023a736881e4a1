#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "looptrim/modules/loops/loop_spec.h"

namespace looptrim {
namespace mapping {

/**
 * Where an original residue ends up relative to the loops.
 */
enum class ResidueRole {
    Core,     // Outside every loop interior (loop anchors included)
    LinkerN,  // Kept N-terminal stretch of a loop
    LinkerC,  // Kept C-terminal stretch of a loop
    Trimmed,  // Removed; has no output index
};

const char* role_name(ResidueRole role);

/**
 * One row of the original -> output numbering table (both 1-based).
 */
struct ResidueMapping {
    int original;
    int output;  // -1 when role == Trimmed
    ResidueRole role;
    int loop_index;  // 0-based index into the LoopSet, -1 for core residues
};

/**
 * Trimmed span of one loop with the running offset accumulated before it.
 */
struct TrimmedSpan {
    int first;          // trimmed_start
    int last;           // trimmed_end
    int offset_before;  // Residues removed by all earlier loops
    int loop_index;

    int length() const { return last - first + 1; }
    int offset_after() const { return offset_before + length(); }
};

/**
 * Selection strategy handed to the modeling engine: original residue index
 * to output index, or nullopt for residues that are not built.
 */
using SelectionPredicate = std::function<std::optional<int>(int)>;

/**
 * Maps original (pre-trim) residue positions to positions in the trimmed
 * sequence the engine builds.
 *
 * Loops are processed in ascending start order with a running offset equal
 * to the number of residues removed so far. For loop k:
 *   - kept N-terminal residues map to i - offset(loops 1..k-1)
 *   - trimmed residues are excluded
 *   - kept C-terminal residues map to i - offset(loops 1..k)
 * Residues between loops carry the offset of every trimmed span before them.
 *
 * Example: loops 50:70 keep 3:3 and 120:140 keep 2:2 trim 54..66 (13) and
 * 123..137 (15); 70 -> 57, 122 -> 109, 138 -> 110, 135 is excluded.
 *
 * The mapper is immutable after construction; lookups are const and safe to
 * call concurrently.
 */
class ResidueIndexMapper {
public:
    /**
     * @param loops Validated, start-sorted loops
     * @param sequence_length Original sequence length, or 0 when unknown
     */
    explicit ResidueIndexMapper(const loops::LoopSet& loops, int sequence_length = 0);

    /**
     * Output index for an original position, nullopt if the residue is
     * trimmed or out of range.
     */
    std::optional<int> map(int original) const;

    /**
     * @throws IndexError if the residue has no output index
     */
    int map_or_throw(int original) const;

    bool is_retained(int original) const { return map(original).has_value(); }

    // Residues removed by trimmed spans lying entirely before original
    int offset_before(int original) const;

    ResidueRole role(int original) const;

    // Total residues excluded, equal to the gaps in the target sequence
    int excluded_count() const;

    /**
     * Full table for positions 1..sequence_length, trimmed rows included.
     * Uses the constructor's sequence length when the argument is 0.
     */
    std::vector<ResidueMapping> mapping_table(int sequence_length = 0) const;

    SelectionPredicate selection_predicate() const;

    const std::vector<TrimmedSpan>& spans() const { return spans_; }
    const loops::LoopSet& loops() const { return loops_; }
    int sequence_length() const { return sequence_length_; }

private:
    loops::LoopSet loops_;
    std::vector<TrimmedSpan> spans_;
    int sequence_length_;
};

/**
 * Write the retained rows of the table as "original output role" lines,
 * the selection file format read by external engines.
 *
 * @throws FileWriteError on failure
 */
void write_selection_file(const std::string& path, const std::vector<ResidueMapping>& table);

}  // namespace mapping
}  // namespace looptrim
