#include "fasta_reader.h"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "looptrim/errors/messages.h"

namespace looptrim {
namespace io {

namespace {

void finish_record(FastaRecord& record, const std::string& source_name,
                   std::vector<FastaRecord>& out) {
    // Remove whitespace and the optional terminator
    record.sequence.erase(
        std::remove_if(record.sequence.begin(), record.sequence.end(), [](char c) {
            return std::isspace(static_cast<unsigned char>(c)) || c == '*';
        }),
        record.sequence.end());

    for (char& c : record.sequence) {
        if (!std::isalpha(static_cast<unsigned char>(c))) {
            throw errors::messages::file_parse_error(
                source_name, "FASTA",
                std::string("invalid residue character '") + c + "' in record '" +
                    record.name + "'");
        }
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    out.push_back(std::move(record));
}

}  // namespace

std::vector<FastaRecord> parse_fasta(std::istream& in, const std::string& source_name) {
    std::vector<FastaRecord> records;
    FastaRecord current;
    bool have_record = false;
    std::string line;

    while (std::getline(in, line)) {
        // Remove carriage return if present
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == ';' || line[0] == '#') {
            continue;
        }

        if (line[0] == '>') {
            if (have_record) {
                finish_record(current, source_name, records);
            }
            current = FastaRecord{};
            current.name = line.substr(1);
            have_record = true;
        } else {
            current.sequence += line;
            have_record = true;
        }
    }

    if (have_record) {
        finish_record(current, source_name, records);
    }
    return records;
}

FastaRecord read_first_fasta_record(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw errors::messages::file_not_found(path, "FASTA file");
    }

    auto records = parse_fasta(in, path);
    if (records.empty() || records.front().sequence.empty()) {
        throw errors::messages::file_parse_error(path, "FASTA", "no sequence found");
    }
    return records.front();
}

}  // namespace io
}  // namespace looptrim
