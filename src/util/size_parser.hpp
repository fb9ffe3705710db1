#pragma once

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace epitizer {

// Parse a size string with optional decimal suffix (K, M, G), as used by
// -max_input_size. "10M" is 10,000,000 bytes.
// Returns false on parse error; "0" parses to 0 (no limit).
inline bool parse_size_string(const std::string& s, uint64_t& out) {
    if (s.empty()) return false;

    char* end = nullptr;
    double val = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || !std::isfinite(val) || val < 0) return false;

    uint64_t multiplier = 1;
    if (*end != '\0') {
        switch (*end) {
            case 'K': case 'k': multiplier = 1000; break;
            case 'M': case 'm': multiplier = 1000 * 1000; break;
            case 'G': case 'g': multiplier = 1000 * 1000 * 1000; break;
            default: return false;
        }
        if (end[1] != '\0') return false;
    }
    double bytes = val * static_cast<double>(multiplier);
    if (bytes >= 18446744073709551616.0) return false; // 2^64
    out = static_cast<uint64_t>(bytes);
    return true;
}

} // namespace epitizer
