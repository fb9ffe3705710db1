#include "test_util.hpp"
#include "io/text_reader.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace epitizer;

static std::string g_test_dir;

static void write_file(const std::string& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary);
    f << content;
}

static void test_read_basic() {
    std::fprintf(stderr, "-- test_read_basic\n");

    std::string path = g_test_dir + "/basic.txt";
    write_file(path, "ACD, LMN\nPQR\n");

    std::string text, err;
    CHECK(read_text_input(path, 0, text, err));
    CHECK_STR(text, "ACD, LMN\nPQR\n");
}

static void test_read_strips_bom() {
    std::fprintf(stderr, "-- test_read_strips_bom\n");

    std::string path = g_test_dir + "/bom.txt";
    write_file(path, "\xEF\xBB\xBF" "ACD\nLMN\n");

    std::string text, err;
    CHECK(read_text_input(path, 0, text, err));
    CHECK_STR(text, "ACD\nLMN\n");
}

static void test_read_missing_file() {
    std::fprintf(stderr, "-- test_read_missing_file\n");

    std::string text, err;
    CHECK(!read_text_input(g_test_dir + "/nonexistent.txt", 0, text, err));
    CHECK(err.find("file not found") != std::string::npos);
    CHECK(text.empty());
}

static void test_read_directory() {
    std::fprintf(stderr, "-- test_read_directory\n");

    std::string text, err;
    CHECK(!read_text_input(g_test_dir, 0, text, err));
    CHECK(err.find("is a directory") != std::string::npos);
}

static void test_size_limit() {
    std::fprintf(stderr, "-- test_size_limit\n");

    std::string path = g_test_dir + "/big.txt";
    write_file(path, std::string(2000, 'A'));

    std::string text, err;
    CHECK(!read_text_input(path, 1000, text, err));
    CHECK(err.find("too large") != std::string::npos);
    CHECK(text.empty());

    CHECK(read_text_input(path, 2000, text, err));
    CHECK_EQ(text.size(), 2000u);

    CHECK(read_text_input(path, 0, text, err));
    CHECK_EQ(text.size(), 2000u);
}

static void test_stream_size_limit() {
    std::fprintf(stderr, "-- test_stream_size_limit\n");

    std::istringstream in(std::string(100000, 'K'));
    std::string text, err;
    CHECK(!read_text_stream(in, 99999, text, err));
    CHECK(err.find("too large") != std::string::npos);

    std::istringstream in2(std::string(100000, 'K'));
    CHECK(read_text_stream(in2, 100000, text, err));
    CHECK_EQ(text.size(), 100000u);
}

static void test_rejects_invalid_utf8() {
    std::fprintf(stderr, "-- test_rejects_invalid_utf8\n");

    std::string path = g_test_dir + "/latin1.txt";
    write_file(path, "ACD\n\xE9pitope\n");

    std::string text, err;
    CHECK(!read_text_input(path, 0, text, err));
    CHECK(err.find("UTF-8") != std::string::npos);
}

static void test_utf8_validation() {
    std::fprintf(stderr, "-- test_utf8_validation\n");

    CHECK(is_valid_utf8(""));
    CHECK(is_valid_utf8("ACDEFGHIK"));
    CHECK(is_valid_utf8("\xC3\xA9"));             // U+00E9
    CHECK(is_valid_utf8("\xE2\x9C\x93"));         // U+2713
    CHECK(is_valid_utf8("\xF0\x9F\xA7\xAC"));     // U+1F9EC
    CHECK(!is_valid_utf8("\xE9"));                // latin-1
    CHECK(!is_valid_utf8("\xC0\xAF"));            // overlong
    CHECK(!is_valid_utf8("\xED\xA0\x80"));        // surrogate
    CHECK(!is_valid_utf8("\xF4\x90\x80\x80"));    // > U+10FFFF
    CHECK(!is_valid_utf8("\xE2\x9C"));            // truncated
}

int main() {
    g_test_dir = "/tmp/epitizer_text_reader_test";
    std::filesystem::create_directories(g_test_dir);

    test_read_basic();
    test_read_strips_bom();
    test_read_missing_file();
    test_read_directory();
    test_size_limit();
    test_stream_size_limit();
    test_rejects_invalid_utf8();
    test_utf8_validation();

    std::filesystem::remove_all(g_test_dir);

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
