/**
 * PIR alignment reader/writer.
 *
 * PIR is the two-line-header format consumed by comparative modeling
 * engines:
 * ```
 * >P1;1abc
 * structureX:1abc.pdb:FIRST:A:LAST:A::::
 * MKVLAAGIVG...
 * ...GHHE*
 * >P1;target
 * sequence:::::::::
 * MKVLAA----...*
 * ```
 *
 * Each entry is a header line (">P1;" + code), a colon-separated
 * description line, and sequence lines terminated by '*'.
 * Sequences are wrapped at 75 characters on output.
 */

#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace looptrim {
namespace io {

/**
 * Single PIR entry.
 */
struct PirEntry {
    std::string code;         // Identifier after ">P1;"
    std::string description;  // Second header line (structureX:..., sequence:...)
    std::string sequence;     // Sequence without the terminating '*'

    // Colon-separated description fields ("structureX", file, "FIRST", chain, ...)
    std::vector<std::string> description_fields() const;
};

constexpr size_t kPirLineWidth = 75;

/**
 * Format entries as PIR text.
 */
std::string format_pir(const std::vector<PirEntry>& entries);

/**
 * Write entries to a PIR file.
 *
 * @throws FileWriteError if the file cannot be opened or written
 */
void write_pir_file(const std::string& path, const std::vector<PirEntry>& entries);

/**
 * Parse PIR entries from a stream.
 *
 * @param in Input stream
 * @param source_name Name used in error messages
 * @throws FormatError on missing description line or unterminated sequence
 */
std::vector<PirEntry> parse_pir(std::istream& in, const std::string& source_name);

/**
 * Parse PIR entries from a file.
 *
 * @throws FileNotFoundError if the file cannot be opened
 * @throws FormatError on malformed content
 */
std::vector<PirEntry> read_pir_file(const std::string& path);

}  // namespace io
}  // namespace looptrim
