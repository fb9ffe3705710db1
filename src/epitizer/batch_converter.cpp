#include "epitizer/batch_converter.hpp"
#include "io/text_reader.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

namespace epitizer {

bool convert_text(const std::string& input_name, const std::string& text,
                  const RunConfig& cfg, JobOutcome& outcome) {
    outcome = JobOutcome();

    if (cfg.max_input_size != 0 && text.size() > cfg.max_input_size) {
        outcome.error_msg = input_name + ": input size too large (maximum " +
                            std::to_string(cfg.max_input_size) + " bytes)";
        return false;
    }

    ConvertError err;
    if (!convert_epitopes(text, cfg.options, outcome.result, err)) {
        outcome.error_kind = err.kind;
        outcome.error_msg = input_name + ": " + err.message;
        return false;
    }
    outcome.ok = true;
    return true;
}

bool convert_input(const std::string& input_path, const RunConfig& cfg,
                   JobOutcome& outcome) {
    std::string text;
    std::string error_msg;
    if (!read_text_input(input_path, cfg.max_input_size, text, error_msg)) {
        outcome = JobOutcome();
        outcome.error_msg = error_msg;
        return false;
    }
    return convert_text(input_path == "-" ? "stdin" : input_path, text, cfg, outcome);
}

bool write_output(const std::string& output_path, const std::string& input_name,
                  const ConversionResult& result, OutputFormat fmt,
                  std::string& error_msg) {
    if (output_path.empty() || output_path == "-") {
        write_conversion(std::cout, input_name, result, fmt);
        std::cout.flush();
        if (!std::cout) {
            error_msg = "failed to write to stdout";
            return false;
        }
        return true;
    }

    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        error_msg = "cannot open output file " + output_path;
        return false;
    }
    write_conversion(out, input_name, result, fmt);
    out.close();
    if (!out) {
        error_msg = "failed to write file " + output_path;
        return false;
    }
    return true;
}

bool plan_batch_jobs(const std::vector<std::string>& inputs,
                     const std::string& outdir, OutputFormat fmt,
                     std::vector<BatchJob>& jobs, std::string& error_msg) {
    jobs.clear();
    const char* ext = (fmt == OutputFormat::kJson) ? ".json" : ".fasta";

    std::set<std::string> taken;
    for (const auto& in : inputs) {
        if (in == "-") {
            error_msg = "stdin cannot be used with -outdir";
            return false;
        }
        std::string stem = std::filesystem::path(in).stem().string();
        if (stem.empty()) stem = std::filesystem::path(in).filename().string();

        std::string out = (std::filesystem::path(outdir) / (stem + ext)).string();
        if (!taken.insert(out).second) {
            error_msg = "inputs map to the same output file " + out;
            return false;
        }
        jobs.push_back({in, out});
    }
    return true;
}

std::vector<JobOutcome> run_batch(const std::vector<BatchJob>& jobs,
                                  const RunConfig& cfg) {
    std::vector<JobOutcome> outcomes(jobs.size());

    tbb::task_arena arena(cfg.threads > 0 ? cfg.threads : 1);
    arena.execute([&] {
        tbb::parallel_for(tbb::blocked_range<size_t>(0, jobs.size()),
            [&](const tbb::blocked_range<size_t>& range) {
                for (size_t i = range.begin(); i != range.end(); ++i) {
                    JobOutcome& oc = outcomes[i];
                    if (!convert_input(jobs[i].input_path, cfg, oc)) continue;

                    std::string error_msg;
                    if (!write_output(jobs[i].output_path, jobs[i].input_path,
                                      oc.result, cfg.format, error_msg)) {
                        oc.ok = false;
                        oc.error_msg = error_msg;
                    }
                }
            });
    });

    return outcomes;
}

void log_conversion(const Logger& logger, const std::string& input_name,
                    const ConversionResult& result) {
    for (const auto& w : result.warnings) {
        logger.warn("%s: %s", input_name.c_str(), w.message.c_str());
    }
    logger.debug("%s: %u candidate token(s), %u empty, %u duplicate(s)",
                 input_name.c_str(), result.candidates,
                 result.empty_skipped, result.duplicates_removed);
    if (result.duplicates_removed > 0) {
        logger.info("%s: converted %zu epitope(s) to FASTA (%u duplicate(s) removed)",
                    input_name.c_str(), result.records.size(), result.duplicates_removed);
    } else {
        logger.info("%s: converted %zu epitope(s) to FASTA",
                    input_name.c_str(), result.records.size());
    }
}

} // namespace epitizer
