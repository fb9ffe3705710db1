#pragma once

#include "core/config.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace epitizer {

struct ConversionOptions {
    bool dedupe = false;    // drop repeated tokens, first occurrence wins
    bool validate = false;  // reject tokens with non amino-acid letters
    std::string header_prefix = DEFAULT_HEADER_PREFIX;
};

struct FastaRecord {
    std::string id;        // header text without '>', e.g. "Epitope_3"
    std::string sequence;  // the token verbatim
};

enum class WarningKind { kEmptyToken, kDuplicateToken };

struct ConversionWarning {
    WarningKind kind;
    uint32_t position;       // 1-based ordinal of the candidate token
    uint32_t first_position; // kDuplicateToken: position of the kept token
    std::string token;
    std::string message;
};

struct ConversionResult {
    std::vector<FastaRecord> records;
    std::vector<ConversionWarning> warnings;
    uint32_t candidates = 0;
    uint32_t empty_skipped = 0;
    uint32_t duplicates_removed = 0;
};

enum class ConvertErrorKind { kNone, kEmptyInput, kInvalidSequence };

struct ConvertError {
    ConvertErrorKind kind = ConvertErrorKind::kNone;
    std::string message;
    std::vector<std::string> invalid_tokens; // kInvalidSequence only
};

// Convert a comma and/or newline separated epitope list into FASTA records.
// Performs no I/O and keeps no state; safe to call from several threads.
// Returns false and fills err when no token survives (kEmptyInput) or, with
// options.validate, when a token holds a non amino-acid letter
// (kInvalidSequence). out is left empty on failure.
bool convert_epitopes(const std::string& raw,
                      const ConversionOptions& options,
                      ConversionResult& out,
                      ConvertError& err);

// Concatenated ">id\nsequence\n" blocks for all records of result.
std::string to_fasta_text(const ConversionResult& result);

const char* convert_error_name(ConvertErrorKind kind);
const char* warning_kind_name(WarningKind kind);

} // namespace epitizer
