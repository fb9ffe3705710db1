#pragma once

#include <cstddef>
#include <cstdint>

namespace epitizer {

// Header written before the 1-based record index: ">Epitope_1".
inline constexpr const char* DEFAULT_HEADER_PREFIX = "Epitope_";

// Default -max_input_size (10 MB). 0 disables the limit.
inline constexpr uint64_t DEFAULT_MAX_INPUT_SIZE = 10000000;
inline constexpr const char* DEFAULT_MAX_INPUT_SIZE_STR = "10M";

// The 20 standard amino-acid one-letter codes accepted by -validate.
inline constexpr const char* AMINO_ACID_ALPHABET = "ACDEFGHIKLMNPQRSTVWY";

// Number of offending sequences spelled out in an invalid-sequence error.
inline constexpr size_t MAX_LISTED_INVALID = 5;

// Token separators after line-ending normalization.
inline constexpr char TOKEN_SEPARATOR = ',';
inline constexpr char LINE_SEPARATOR = '\n';

} // namespace epitizer
