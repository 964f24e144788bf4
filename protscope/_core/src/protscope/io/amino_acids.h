#pragma once

#include <array>
#include <cctype>
#include <string_view>

namespace protscope {
namespace io {

constexpr int kNumAminoAcids = 20;

// Canonical one-letter codes in table order. Every per-residue table in
// tables/residue_scales.h is indexed by position in this string.
constexpr std::string_view kAlphabet = "ACDEFGHIKLMNPQRSTVWY";

/**
 * Index of an upper-case one-letter code in kAlphabet, or -1.
 */
constexpr int residue_index(char c) {
    switch (c) {
        case 'A': return 0;
        case 'C': return 1;
        case 'D': return 2;
        case 'E': return 3;
        case 'F': return 4;
        case 'G': return 5;
        case 'H': return 6;
        case 'I': return 7;
        case 'K': return 8;
        case 'L': return 9;
        case 'M': return 10;
        case 'N': return 11;
        case 'P': return 12;
        case 'Q': return 13;
        case 'R': return 14;
        case 'S': return 15;
        case 'T': return 16;
        case 'V': return 17;
        case 'W': return 18;
        case 'Y': return 19;
        default: return -1;
    }
}

constexpr bool is_canonical(char c) {
    return residue_index(c) >= 0;
}

inline char to_upper_residue(char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

/**
 * Membership test for residue class strings such as "VILMFYW".
 */
constexpr bool in_class(char residue, std::string_view members) {
    return members.find(residue) != std::string_view::npos;
}

}  // namespace io
}  // namespace protscope
