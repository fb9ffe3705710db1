#include "convert/tokenizer.hpp"
#include "core/config.hpp"

#include <cctype>

namespace epitizer {

std::string normalize_line_endings(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); i++) {
        char c = raw[i];
        if (c == '\r') {
            out.push_back(LINE_SEPARATOR);
            if (i + 1 < raw.size() && raw[i + 1] == '\n') i++;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

// Byte length of the whitespace character starting at s[i], 0 if none.
// Besides ASCII whitespace this covers the UTF-8 encoded Unicode spaces
// U+0085, U+00A0, U+1680, U+2000-U+200A, U+2028, U+2029, U+202F, U+205F
// and U+3000, plus the ASCII separators 0x1C-0x1F.
static size_t whitespace_len_at(const std::string& s, size_t i) {
    auto byte = [&](size_t k) -> unsigned char {
        return static_cast<unsigned char>(s[k]);
    };
    size_t left = s.size() - i;
    unsigned char c = byte(i);

    if (c < 0x80) {
        return (std::isspace(c) || (c >= 0x1C && c <= 0x1F)) ? 1 : 0;
    }
    if (c == 0xC2 && left >= 2) {
        unsigned char c1 = byte(i + 1);
        return (c1 == 0x85 || c1 == 0xA0) ? 2 : 0;
    }
    if (left < 3) return 0;

    unsigned char c1 = byte(i + 1);
    unsigned char c2 = byte(i + 2);
    if (c == 0xE1 && c1 == 0x9A && c2 == 0x80) return 3;
    if (c == 0xE3 && c1 == 0x80 && c2 == 0x80) return 3;
    if (c == 0xE2 && c1 == 0x80) {
        if (c2 <= 0x8A || c2 == 0xA8 || c2 == 0xA9 || c2 == 0xAF) return 3;
        return 0;
    }
    if (c == 0xE2 && c1 == 0x81 && c2 == 0x9F) return 3;
    return 0;
}

std::string trim_whitespace(const std::string& s) {
    size_t start = 0;
    while (start < s.size()) {
        size_t n = whitespace_len_at(s, start);
        if (n == 0) break;
        start += n;
    }

    size_t end = s.size();
    while (end > start) {
        size_t n = 0;
        for (size_t len = 1; len <= 3 && len <= end - start; len++) {
            if (whitespace_len_at(s, end - len) == len) {
                n = len;
                break;
            }
        }
        if (n == 0) break;
        end -= n;
    }
    return s.substr(start, end - start);
}

std::vector<TokenCandidate> split_candidates(const std::string& raw) {
    std::vector<TokenCandidate> candidates;
    std::string text = normalize_line_endings(raw);
    if (text.empty()) return candidates;

    if (text.back() == LINE_SEPARATOR)
        text.pop_back();

    uint32_t position = 0;
    size_t field_start = 0;
    for (size_t i = 0; i <= text.size(); i++) {
        if (i < text.size() && text[i] != TOKEN_SEPARATOR && text[i] != LINE_SEPARATOR)
            continue;
        position++;
        candidates.push_back({trim_whitespace(text.substr(field_start, i - field_start)),
                              position});
        field_start = i + 1;
    }
    return candidates;
}

} // namespace epitizer
