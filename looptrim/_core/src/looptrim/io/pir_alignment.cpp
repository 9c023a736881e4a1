#include "pir_alignment.h"

#include <cctype>
#include <fstream>
#include <sstream>

#include "looptrim/errors/messages.h"

namespace looptrim {
namespace io {

namespace {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

void append_wrapped(std::ostream& out, const std::string& sequence) {
    // Terminator goes on the last sequence line
    std::string terminated = sequence + "*";
    for (size_t i = 0; i < terminated.size(); i += kPirLineWidth) {
        out << terminated.substr(i, kPirLineWidth) << "\n";
    }
}

}  // namespace

std::vector<std::string> PirEntry::description_fields() const {
    std::vector<std::string> fields;
    std::string current;
    std::istringstream stream(description);
    while (std::getline(stream, current, ':')) {
        fields.push_back(trim(current));
    }
    // getline drops a trailing empty field
    if (!description.empty() && description.back() == ':') {
        fields.emplace_back();
    }
    return fields;
}

std::string format_pir(const std::vector<PirEntry>& entries) {
    std::ostringstream out;
    for (const auto& entry : entries) {
        out << ">P1;" << entry.code << "\n";
        out << entry.description << "\n";
        append_wrapped(out, entry.sequence);
    }
    return out.str();
}

void write_pir_file(const std::string& path, const std::vector<PirEntry>& entries) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw errors::messages::file_write_error(path, "could not open for writing");
    }
    out << format_pir(entries);
    out.close();
    if (out.fail()) {
        throw errors::messages::file_write_error(path, "write failed");
    }
}

std::vector<PirEntry> parse_pir(std::istream& in, const std::string& source_name) {
    std::vector<PirEntry> entries;
    std::string line;
    int line_number = 0;

    while (std::getline(in, line)) {
        ++line_number;
        std::string stripped = trim(line);
        if (stripped.empty() || stripped[0] == '#') {
            continue;
        }
        if (stripped[0] != '>') {
            throw errors::messages::file_parse_error(
                source_name, "PIR",
                "expected '>P1;' header at line " + std::to_string(line_number));
        }

        PirEntry entry;
        auto semicolon = stripped.find(';');
        entry.code = trim(semicolon == std::string::npos ? stripped.substr(1)
                                                         : stripped.substr(semicolon + 1));

        if (!std::getline(in, line)) {
            throw errors::messages::file_parse_error(
                source_name, "PIR", "entry '" + entry.code + "' has no description line");
        }
        ++line_number;
        entry.description = trim(line);

        bool terminated = false;
        while (!terminated && std::getline(in, line)) {
            ++line_number;
            for (char c : line) {
                if (c == '*') {
                    terminated = true;
                    break;
                }
                if (!std::isspace(static_cast<unsigned char>(c))) {
                    entry.sequence.push_back(c);
                }
            }
        }
        if (!terminated) {
            throw errors::messages::file_parse_error(
                source_name, "PIR", "sequence of entry '" + entry.code + "' is not terminated by '*'");
        }
        entries.push_back(std::move(entry));
    }

    return entries;
}

std::vector<PirEntry> read_pir_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw errors::messages::file_not_found(path, "Alignment file");
    }
    return parse_pir(in, path);
}

}  // namespace io
}  // namespace looptrim
