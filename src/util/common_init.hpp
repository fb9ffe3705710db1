#pragma once

#include "util/cli_parser.hpp"
#include "util/logger.hpp"

#include <cstddef>
#include <cstdio>
#include <string>
#include <thread>

// EPITIZER_VERSION is defined in the generated core/version.hpp.
// Callers must include core/version.hpp before using check_version().

namespace epitizer {

// Print "<cmd_name> <version>" to stderr if --version is present.
// Returns true if --version was handled (caller should return 0).
inline bool check_version(const CliParser& cli, const char* cmd_name) {
    if (cli.has("--version")) {
        std::fprintf(stderr, "%s %s\n", cmd_name, EPITIZER_VERSION);
        return true;
    }
    return false;
}

// Create a Logger from -v / --verbose and -quiet flags.
// -quiet keeps errors only; -v wins when both are given.
inline Logger make_logger(const CliParser& cli) {
    if (cli.has("-v") || cli.has("--verbose")) return Logger(Logger::kDebug);
    if (cli.has("-quiet")) return Logger(Logger::kError);
    return Logger(Logger::kInfo);
}

// Resolve worker count from CLI (0 or negative -> hardware_concurrency),
// never more than the number of jobs to run.
inline int resolve_threads(const CliParser& cli, size_t num_jobs,
                           const std::string& key = "-threads") {
    int n = cli.get_int(key, 0);
    if (n <= 0) {
        n = static_cast<int>(std::thread::hardware_concurrency());
        if (n <= 0) n = 1;
    }
    if (num_jobs > 0 && static_cast<size_t>(n) > num_jobs)
        n = static_cast<int>(num_jobs);
    return n;
}

} // namespace epitizer
