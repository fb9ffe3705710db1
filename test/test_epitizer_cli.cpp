#include "test_util.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/wait.h>

// EPITIZER_BIN is the path of the built epitizer executable, set by CMake.

static std::string g_test_dir;

static void write_file(const std::string& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary);
    f << content;
}

static std::string slurp(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

// Run epitizer and capture stdout
static std::string run_epitizer(const std::string& args) {
    std::string cmd = std::string(EPITIZER_BIN) + " " + args + " 2>/dev/null";
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return {};
    std::string result;
    char buf[4096];
    while (fgets(buf, sizeof(buf), pipe)) {
        result += buf;
    }
    pclose(pipe);
    return result;
}

static int run_epitizer_exit(const std::string& args) {
    std::string cmd = std::string(EPITIZER_BIN) + " " + args + " >/dev/null 2>&1";
    int ret = std::system(cmd.c_str());
    if (WIFEXITED(ret)) return WEXITSTATUS(ret);
    return -1;
}

static void test_text_mode() {
    std::fprintf(stderr, "-- test_text_mode\n");

    std::string out = run_epitizer("-text 'ACDEFGHIK, LMNPQRST, VWXYZZZ'");
    CHECK_STR(out, ">Epitope_1\nACDEFGHIK\n>Epitope_2\nLMNPQRST\n>Epitope_3\nVWXYZZZ\n");
    CHECK_EQ(run_epitizer_exit("-text 'ACD, LMN'"), 0);
}

static void test_text_dedupe_json() {
    std::fprintf(stderr, "-- test_text_dedupe_json\n");

    std::string out = run_epitizer("-dedupe -outfmt json -text 'ACD, ACD, LMN'");
    CHECK(out.find("{\"header\": \"Epitope_1\", \"sequence\": \"ACD\"}") != std::string::npos);
    CHECK(out.find("{\"header\": \"Epitope_2\", \"sequence\": \"LMN\"}") != std::string::npos);
    CHECK(out.find("\"duplicates_removed\": 1") != std::string::npos);
}

static void test_stdin_default() {
    std::fprintf(stderr, "-- test_stdin_default\n");

    std::string out = run_epitizer("-prefix seq < /dev/null");
    CHECK_STR(out, "");

    std::string path = g_test_dir + "/stdin.txt";
    write_file(path, "ACDEFGHIK\nLMNPQRST\nVWXYZZZ\n");
    out = run_epitizer("< " + path);
    CHECK_STR(out, ">Epitope_1\nACDEFGHIK\n>Epitope_2\nLMNPQRST\n>Epitope_3\nVWXYZZZ\n");

    out = run_epitizer("-prefix seq - < " + path);
    CHECK_STR(out, ">seq1\nACDEFGHIK\n>seq2\nLMNPQRST\n>seq3\nVWXYZZZ\n");
}

static void test_output_file() {
    std::fprintf(stderr, "-- test_output_file\n");

    std::string in = g_test_dir + "/list.txt";
    std::string out = g_test_dir + "/list.fasta";
    write_file(in, "ACD, LMN\n");
    CHECK_EQ(run_epitizer_exit(in + " -o " + out), 0);
    CHECK_STR(slurp(out), ">Epitope_1\nACD\n>Epitope_2\nLMN\n");
}

static void test_batch_outdir() {
    std::fprintf(stderr, "-- test_batch_outdir\n");

    std::string a = g_test_dir + "/a.txt";
    std::string b = g_test_dir + "/b.txt";
    std::string outdir = g_test_dir + "/batch";
    write_file(a, "ACD\n");
    write_file(b, "LMN, PQR\n");

    CHECK_EQ(run_epitizer_exit("-threads 2 -outdir " + outdir + " " + a + " " + b), 0);
    CHECK_STR(slurp(outdir + "/a.fasta"), ">Epitope_1\nACD\n");
    CHECK_STR(slurp(outdir + "/b.fasta"), ">Epitope_1\nLMN\n>Epitope_2\nPQR\n");

    // One bad input fails the run but the good one is still written
    std::string empty = g_test_dir + "/c.txt";
    write_file(empty, ",,\n");
    std::string outdir2 = g_test_dir + "/batch2";
    CHECK_EQ(run_epitizer_exit("-outdir " + outdir2 + " " + a + " " + empty), 1);
    CHECK(std::filesystem::exists(outdir2 + "/a.fasta"));
    CHECK(!std::filesystem::exists(outdir2 + "/c.fasta"));
}

static void test_conversion_errors() {
    std::fprintf(stderr, "-- test_conversion_errors\n");

    CHECK_EQ(run_epitizer_exit("-text ',,,'"), 1);
    CHECK_EQ(run_epitizer_exit("-validate -text 'ACD, VWXYZZZ'"), 1);
    CHECK_EQ(run_epitizer_exit("-validate -text 'ACD, vwy'"), 0);
    CHECK_EQ(run_epitizer_exit(g_test_dir + "/missing.txt"), 1);

    std::string big = g_test_dir + "/big.txt";
    write_file(big, std::string(2000, 'A'));
    CHECK_EQ(run_epitizer_exit("-max_input_size 1K " + big), 1);
    CHECK_EQ(run_epitizer_exit("-max_input_size 0 " + big), 0);
}

static void test_usage_errors() {
    std::fprintf(stderr, "-- test_usage_errors\n");

    std::string in = g_test_dir + "/usage.txt";
    write_file(in, "ACD\n");

    CHECK_EQ(run_epitizer_exit("-o x.fasta -outdir " + g_test_dir + "/o " + in), 1);
    CHECK_EQ(run_epitizer_exit("-text ACD " + in), 1);
    CHECK_EQ(run_epitizer_exit("-text ACD -outdir " + g_test_dir + "/o"), 1);
    CHECK_EQ(run_epitizer_exit("-prefix '>x' -text ACD"), 1);
    CHECK_EQ(run_epitizer_exit("-prefix 'a b' -text ACD"), 1);
    CHECK_EQ(run_epitizer_exit("-outfmt tab -text ACD"), 1);
    CHECK_EQ(run_epitizer_exit("-max_input_size 10X -text ACD"), 1);
    CHECK_EQ(run_epitizer_exit("-max_input_size 1e30 -text ACD"), 1);
    CHECK_EQ(run_epitizer_exit(in + " " + in), 1);
    CHECK_EQ(run_epitizer_exit("-outdir " + g_test_dir + "/o - < " + in), 1);
}

static void test_help_and_version() {
    std::fprintf(stderr, "-- test_help_and_version\n");

    CHECK_EQ(run_epitizer_exit("--version"), 0);
    CHECK_EQ(run_epitizer_exit("-h"), 0);
}

int main() {
    g_test_dir = "/tmp/epitizer_cli_test";
    std::filesystem::remove_all(g_test_dir);
    std::filesystem::create_directories(g_test_dir);

    test_text_mode();
    test_text_dedupe_json();
    test_stdin_default();
    test_output_file();
    test_batch_outdir();
    test_conversion_errors();
    test_usage_errors();
    test_help_and_version();

    std::filesystem::remove_all(g_test_dir);

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
