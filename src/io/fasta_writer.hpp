#pragma once

#include "convert/converter.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace epitizer {

enum class OutputFormat { kFasta, kJson };

// Parse an output format string ("fasta", "json").
// Returns true on success. On failure, out is unchanged and error_msg is set.
bool parse_output_format(const std::string& str, OutputFormat& out,
                         std::string& error_msg);

// Write records as ">id\nsequence\n" blocks.
void write_fasta(std::ostream& out, const std::vector<FastaRecord>& records);

// Write records, warnings and counters of one conversion as a JSON object.
// input_name labels the source ("-" for stdin).
void write_conversion_json(std::ostream& out, const std::string& input_name,
                           const ConversionResult& result);

// Write result in the specified format.
void write_conversion(std::ostream& out, const std::string& input_name,
                      const ConversionResult& result, OutputFormat fmt);

} // namespace epitizer
