#pragma once

#include <array>
#include <cctype>
#include <string>
#include <string_view>
#include <unordered_map>

namespace looptrim {
namespace io {

struct AminoAcidCode {
    const char* three;
    char one;
};

// Standard residues plus the ambiguity and rare codes modeling engines emit.
// MSE (selenomethionine) reads as M so templates with SeMet align.
inline constexpr std::array<AminoAcidCode, 27> kAminoAcidCodes = {{
    {"ALA", 'A'}, {"ARG", 'R'}, {"ASN", 'N'}, {"ASP", 'D'}, {"CYS", 'C'},
    {"GLN", 'Q'}, {"GLU", 'E'}, {"GLY", 'G'}, {"HIS", 'H'}, {"ILE", 'I'},
    {"LEU", 'L'}, {"LYS", 'K'}, {"MET", 'M'}, {"PHE", 'F'}, {"PRO", 'P'},
    {"SER", 'S'}, {"THR", 'T'}, {"TRP", 'W'}, {"TYR", 'Y'}, {"VAL", 'V'},
    {"ASX", 'B'}, {"GLX", 'Z'}, {"XAA", 'X'}, {"PYL", 'O'}, {"SEC", 'U'},
    {"XLE", 'J'}, {"MSE", 'M'},
}};

inline const std::unordered_map<std::string, char>& three_to_one_map() {
    static const std::unordered_map<std::string, char> kMap = [] {
        std::unordered_map<std::string, char> map;
        for (const auto& code : kAminoAcidCodes) {
            map.emplace(code.three, code.one);
        }
        return map;
    }();
    return kMap;
}

/**
 * Three-letter residue name to one-letter code, case-insensitive.
 * Unknown names map to 'X'.
 */
inline char three_to_one(std::string_view three_letter) {
    std::string key;
    key.reserve(three_letter.size());
    for (char c : three_letter) {
        key.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    const auto& map = three_to_one_map();
    auto it = map.find(key);
    return it != map.end() ? it->second : 'X';
}

/**
 * One-letter code to canonical three-letter name; "UNK" when unknown.
 */
inline std::string one_to_three(char one_letter) {
    char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(one_letter)));
    for (const auto& code : kAminoAcidCodes) {
        if (code.one == upper) {
            return code.three;
        }
    }
    return "UNK";
}

/**
 * Residue identity test used for sequence/structure correspondence.
 * 'X' on either side matches anything.
 */
inline bool residue_codes_match(char a, char b) {
    char ua = static_cast<char>(std::toupper(static_cast<unsigned char>(a)));
    char ub = static_cast<char>(std::toupper(static_cast<unsigned char>(b)));
    return ua == 'X' || ub == 'X' || ua == ub;
}

}  // namespace io
}  // namespace looptrim
