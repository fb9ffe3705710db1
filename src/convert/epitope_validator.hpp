#pragma once

#include "core/config.hpp"

#include <cctype>
#include <cstring>
#include <string>

namespace epitizer {

// True if c (either case) is one of the 20 standard amino-acid letters.
inline bool is_amino_acid(char c) {
    int up = std::toupper(static_cast<unsigned char>(c));
    if (up == 0) return false;
    return std::strchr(AMINO_ACID_ALPHABET, up) != nullptr;
}

// True if every character of seq is an amino-acid letter. Empty is invalid.
inline bool is_valid_epitope(const std::string& seq) {
    if (seq.empty()) return false;
    for (char c : seq) {
        if (!is_amino_acid(c)) return false;
    }
    return true;
}

} // namespace epitizer
