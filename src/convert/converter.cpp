#include "convert/converter.hpp"
#include "convert/epitope_validator.hpp"
#include "convert/tokenizer.hpp"
#include "io/fasta_writer.hpp"

#include <sstream>
#include <unordered_map>
#include <utility>

namespace epitizer {

static std::string invalid_sequence_message(const std::vector<std::string>& invalid) {
    std::string msg = "Invalid epitope sequence(s) detected:\n";
    size_t listed = 0;
    for (const auto& seq : invalid) {
        if (listed == MAX_LISTED_INVALID) break;
        msg += "  " + seq + "\n";
        listed++;
    }
    if (invalid.size() > listed) {
        msg += "  ...and " + std::to_string(invalid.size() - listed) + " more\n";
    }
    msg += "Epitopes must contain only amino acid letters: ";
    msg += AMINO_ACID_ALPHABET;
    return msg;
}

bool convert_epitopes(const std::string& raw,
                      const ConversionOptions& options,
                      ConversionResult& out,
                      ConvertError& err) {
    out = ConversionResult();
    err = ConvertError();

    ConversionResult result;
    auto candidates = split_candidates(raw);
    result.candidates = static_cast<uint32_t>(candidates.size());

    // token -> position of its first surviving occurrence
    std::unordered_map<std::string, uint32_t> seen;
    std::vector<TokenCandidate> kept;
    kept.reserve(candidates.size());
    // every non-empty occurrence, duplicates included
    std::vector<std::string> invalid;

    for (auto& cand : candidates) {
        if (cand.text.empty()) {
            result.empty_skipped++;
            result.warnings.push_back({WarningKind::kEmptyToken, cand.position, 0, {},
                "empty token skipped at position " + std::to_string(cand.position)});
            continue;
        }

        if (options.validate && !is_valid_epitope(cand.text))
            invalid.push_back(cand.text);

        if (options.dedupe) {
            auto ins = seen.emplace(cand.text, cand.position);
            if (!ins.second) {
                uint32_t first = ins.first->second;
                result.duplicates_removed++;
                result.warnings.push_back({WarningKind::kDuplicateToken, cand.position, first,
                    cand.text,
                    "duplicate token '" + cand.text + "' removed at position " +
                    std::to_string(cand.position) + " (first seen at position " +
                    std::to_string(first) + ")"});
                continue;
            }
        }
        kept.push_back(std::move(cand));
    }

    if (kept.empty()) {
        err.kind = ConvertErrorKind::kEmptyInput;
        err.message = "No valid epitopes found";
        return false;
    }

    if (!invalid.empty()) {
        err.kind = ConvertErrorKind::kInvalidSequence;
        err.message = invalid_sequence_message(invalid);
        err.invalid_tokens = std::move(invalid);
        return false;
    }

    result.records.reserve(kept.size());
    for (size_t i = 0; i < kept.size(); i++) {
        result.records.push_back({options.header_prefix + std::to_string(i + 1),
                                  std::move(kept[i].text)});
    }

    out = std::move(result);
    return true;
}

std::string to_fasta_text(const ConversionResult& result) {
    std::ostringstream ss;
    write_fasta(ss, result.records);
    return ss.str();
}

const char* convert_error_name(ConvertErrorKind kind) {
    switch (kind) {
        case ConvertErrorKind::kNone: return "none";
        case ConvertErrorKind::kEmptyInput: return "EmptyInputError";
        case ConvertErrorKind::kInvalidSequence: return "InvalidSequenceError";
    }
    return "unknown";
}

const char* warning_kind_name(WarningKind kind) {
    switch (kind) {
        case WarningKind::kEmptyToken: return "empty";
        case WarningKind::kDuplicateToken: return "duplicate";
    }
    return "unknown";
}

} // namespace epitizer
