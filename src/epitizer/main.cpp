#include "core/config.hpp"
#include "core/version.hpp"
#include "convert/converter.hpp"
#include "epitizer/batch_converter.hpp"
#include "io/fasta_writer.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"
#include "util/size_parser.hpp"

#include <cctype>
#include <cstdio>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

using namespace epitizer;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options] [<input> ...]\n"
        "\n"
        "Convert comma and/or newline separated epitope lists to FASTA.\n"
        "\n"
        "Input (one of):\n"
        "  <input> ...              Epitope list file(s), \"-\" for stdin (default: stdin)\n"
        "  -text <string>           Convert this string directly\n"
        "\n"
        "Output:\n"
        "  -o <path>                Output file for a single input (default: stdout)\n"
        "  -outdir <dir>            Output directory, one <stem>.fasta per input\n"
        "                           (required for more than one input)\n"
        "  -outfmt <fasta|json>     Output format (default: fasta)\n"
        "\n"
        "Conversion:\n"
        "  -dedupe                  Remove duplicate epitopes (first occurrence kept)\n"
        "  -validate                Reject sequences with non amino-acid letters\n"
        "  -prefix <str>            Record header prefix (default: %s)\n"
        "  -max_input_size <size>   Input size limit, K/M/G suffixes, 0 = unlimited\n"
        "                           (default: %s)\n"
        "\n"
        "Options:\n"
        "  -threads <int>           Worker threads for -outdir (default: all cores)\n"
        "  -quiet                   Report errors only\n"
        "  -v, --verbose            Verbose output\n"
        "  --version                Print version\n"
        "  -h, --help               Show this help\n",
        prog, DEFAULT_HEADER_PREFIX, DEFAULT_MAX_INPUT_SIZE_STR);
}

static bool valid_header_prefix(const std::string& prefix) {
    for (char c : prefix) {
        unsigned char u = static_cast<unsigned char>(c);
        if (std::isspace(u) || std::iscntrl(u) || c == '>') return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "epitizer")) return 0;

    // Nothing to read: no arguments and stdin is a terminal
    if (cli.has("-h") || cli.has("--help") || (argc < 2 && isatty(STDIN_FILENO))) {
        print_usage(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    Logger logger = make_logger(cli);

    RunConfig cfg;
    cfg.options.dedupe = cli.has("-dedupe");
    cfg.options.validate = cli.has("-validate");
    cfg.options.header_prefix = cli.get_string("-prefix", DEFAULT_HEADER_PREFIX);
    if (!valid_header_prefix(cfg.options.header_prefix)) {
        std::fprintf(stderr, "Error: -prefix must not contain whitespace, control characters or '>'\n");
        return 1;
    }

    std::string error_msg;
    if (!parse_output_format(cli.get_string("-outfmt", "fasta"), cfg.format, error_msg)) {
        std::fprintf(stderr, "Error: %s\n", error_msg.c_str());
        return 1;
    }

    std::string size_str = cli.get_string("-max_input_size", DEFAULT_MAX_INPUT_SIZE_STR);
    if (!parse_size_string(size_str, cfg.max_input_size)) {
        std::fprintf(stderr, "Error: invalid -max_input_size '%s'\n", size_str.c_str());
        return 1;
    }

    std::vector<std::string> inputs = cli.positional();
    cfg.threads = resolve_threads(cli, inputs.size());
    std::string output_path = cli.get_string("-o");
    std::string outdir = cli.get_string("-outdir");

    if (cli.has("-o") && cli.has("-outdir")) {
        std::fprintf(stderr, "Error: -o and -outdir are mutually exclusive\n");
        return 1;
    }

    // Direct text entry
    if (cli.has("-text")) {
        if (!inputs.empty() || !outdir.empty()) {
            std::fprintf(stderr, "Error: -text cannot be combined with input files or -outdir\n");
            return 1;
        }
        JobOutcome oc;
        if (!convert_text("text", cli.get_string("-text"), cfg, oc)) {
            std::fprintf(stderr, "Error: %s\n", oc.error_msg.c_str());
            return 1;
        }
        log_conversion(logger, "text", oc.result);
        if (!write_output(output_path, "text", oc.result, cfg.format, error_msg)) {
            std::fprintf(stderr, "Error: %s\n", error_msg.c_str());
            return 1;
        }
        return 0;
    }

    if (inputs.empty()) inputs.push_back("-");

    if (outdir.empty()) {
        if (inputs.size() > 1) {
            std::fprintf(stderr, "Error: -outdir is required for more than one input\n");
            print_usage(argv[0]);
            return 1;
        }

        const std::string& input = inputs[0];
        std::string name = (input == "-") ? "stdin" : input;
        JobOutcome oc;
        if (!convert_input(input, cfg, oc)) {
            std::fprintf(stderr, "Error: %s\n", oc.error_msg.c_str());
            return 1;
        }
        log_conversion(logger, name, oc.result);
        if (!write_output(output_path, name, oc.result, cfg.format, error_msg)) {
            std::fprintf(stderr, "Error: %s\n", error_msg.c_str());
            return 1;
        }
        if (!output_path.empty() && output_path != "-")
            logger.info("Saved to %s", output_path.c_str());
        return 0;
    }

    // Batch mode
    std::error_code ec;
    std::filesystem::create_directories(outdir, ec);
    if (ec) {
        std::fprintf(stderr, "Error: cannot create output directory '%s': %s\n",
                     outdir.c_str(), ec.message().c_str());
        return 1;
    }

    std::vector<BatchJob> jobs;
    if (!plan_batch_jobs(inputs, outdir, cfg.format, jobs, error_msg)) {
        std::fprintf(stderr, "Error: %s\n", error_msg.c_str());
        return 1;
    }

    logger.info("Converting %zu input(s) with %d thread(s)", jobs.size(), cfg.threads);
    auto outcomes = run_batch(jobs, cfg);

    size_t failed = 0;
    for (size_t i = 0; i < jobs.size(); i++) {
        if (outcomes[i].ok) {
            log_conversion(logger, jobs[i].input_path, outcomes[i].result);
            logger.debug("Saved to %s", jobs[i].output_path.c_str());
        } else {
            logger.error("%s", outcomes[i].error_msg.c_str());
            failed++;
        }
    }

    if (failed > 0) {
        logger.error("%zu of %zu input(s) failed", failed, jobs.size());
        return 1;
    }
    logger.info("Done. %zu file(s) written to %s", jobs.size(), outdir.c_str());
    return 0;
}
