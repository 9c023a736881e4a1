/**
 * FASTA sequence reader.
 *
 * Reads the template sequence the alignment is built from. Sequence lines
 * of a record are concatenated; whitespace and a trailing '*' are dropped
 * and residues are upper-cased.
 */

#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace looptrim {
namespace io {

struct FastaRecord {
    std::string name;      // Header text after '>' (empty for headerless input)
    std::string sequence;  // One-letter residue codes
};

/**
 * Parse all records from a stream.
 *
 * Lines before the first header are accepted as a headerless record.
 * Lines starting with ';' or '#' are comments.
 *
 * @throws FormatError if a sequence contains characters other than letters
 */
std::vector<FastaRecord> parse_fasta(std::istream& in, const std::string& source_name);

/**
 * Read the first record of a FASTA file.
 *
 * @throws FileNotFoundError if the file cannot be opened
 * @throws FormatError if the file has no sequence or invalid characters
 */
FastaRecord read_first_fasta_record(const std::string& path);

}  // namespace io
}  // namespace looptrim
