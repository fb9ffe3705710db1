#pragma once

#include <cstdint>
#include <istream>
#include <string>

namespace epitizer {

// True if s is well-formed UTF-8 (no overlongs, surrogates or code points
// above U+10FFFF).
bool is_valid_utf8(const std::string& s);

// Read an entire stream into out. Fails when more than max_size bytes are
// available (max_size 0 = unlimited) or the text is not valid UTF-8.
// A leading UTF-8 byte order mark is dropped.
bool read_text_stream(std::istream& in, uint64_t max_size,
                      std::string& out, std::string& error_msg);

// Read an epitope list file. path can be "-" for stdin.
// Returns false with error_msg set on any failure; out is then empty.
bool read_text_input(const std::string& path, uint64_t max_size,
                     std::string& out, std::string& error_msg);

} // namespace epitizer
