#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace epitizer {

struct TokenCandidate {
    std::string text;   // trimmed; may be empty
    uint32_t position;  // 1-based ordinal in the split input
};

// Replace "\r\n" and lone '\r' with '\n'.
std::string normalize_line_endings(const std::string& raw);

// Strip leading/trailing ASCII and Unicode (UTF-8 encoded) whitespace.
std::string trim_whitespace(const std::string& s);

// Split raw input on ',' and line breaks (any mix), trimming each field.
// Empty fields are kept so the caller can report their positions.
// A single line break at the very end of the input does not start a new field.
std::vector<TokenCandidate> split_candidates(const std::string& raw);

} // namespace epitizer
