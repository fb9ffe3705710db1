#pragma once

#include "convert/converter.hpp"
#include "io/fasta_writer.hpp"
#include "util/logger.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace epitizer {

struct RunConfig {
    ConversionOptions options;
    OutputFormat format = OutputFormat::kFasta;
    uint64_t max_input_size = DEFAULT_MAX_INPUT_SIZE; // 0 = unlimited
    int threads = 1;
};

struct BatchJob {
    std::string input_path;
    std::string output_path;
};

struct JobOutcome {
    bool ok = false;
    ConvertErrorKind error_kind = ConvertErrorKind::kNone;
    std::string error_msg;
    ConversionResult result;
};

// Convert already loaded text. input_name only labels error messages.
bool convert_text(const std::string& input_name, const std::string& text,
                  const RunConfig& cfg, JobOutcome& outcome);

// Read input_path ("-" for stdin) and convert its contents.
bool convert_input(const std::string& input_path, const RunConfig& cfg,
                   JobOutcome& outcome);

// Write result to output_path ("-" or empty for stdout).
bool write_output(const std::string& output_path, const std::string& input_name,
                  const ConversionResult& result, OutputFormat fmt,
                  std::string& error_msg);

// Map each input to <outdir>/<stem>.fasta (or .json). Fails on stdin inputs
// and on two inputs that would write the same file.
bool plan_batch_jobs(const std::vector<std::string>& inputs,
                     const std::string& outdir, OutputFormat fmt,
                     std::vector<BatchJob>& jobs, std::string& error_msg);

// Convert and write every job on up to cfg.threads workers. A failing job
// does not stop the others; outcomes are returned in job order.
std::vector<JobOutcome> run_batch(const std::vector<BatchJob>& jobs,
                                  const RunConfig& cfg);

// Log the warnings and counters of one successful conversion.
void log_conversion(const Logger& logger, const std::string& input_name,
                    const ConversionResult& result);

} // namespace epitizer
