#include "io/text_reader.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace epitizer {

bool is_valid_utf8(const std::string& s) {
    const auto* p = reinterpret_cast<const unsigned char*>(s.data());
    const auto* end = p + s.size();

    while (p < end) {
        unsigned char c = *p;
        if (c < 0x80) {
            p++;
            continue;
        }

        int len;
        uint32_t cp;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (end - p < len) return false;
        for (int i = 1; i < len; i++) {
            if ((p[i] & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (p[i] & 0x3F);
        }

        // Overlong encodings, UTF-16 surrogates, beyond Unicode range
        if ((len == 2 && cp < 0x80) ||
            (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000))
            return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        if (cp > 0x10FFFF) return false;

        p += len;
    }
    return true;
}

static std::string format_limit(uint64_t bytes) {
    if (bytes >= 1000000 && bytes % 100000 == 0) {
        return std::to_string(bytes / 1000000) + "." +
               std::to_string((bytes % 1000000) / 100000) + " MB";
    }
    return std::to_string(bytes) + " bytes";
}

bool read_text_stream(std::istream& in, uint64_t max_size,
                      std::string& out, std::string& error_msg) {
    out.clear();

    char buf[64 * 1024];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n <= 0) break;
        if (max_size != 0 && out.size() + static_cast<uint64_t>(n) > max_size) {
            out.clear();
            error_msg = "input size too large (maximum " + format_limit(max_size) + ")";
            return false;
        }
        out.append(buf, static_cast<size_t>(n));
    }
    if (in.bad()) {
        out.clear();
        error_msg = "read error";
        return false;
    }

    if (out.size() >= 3 &&
        static_cast<unsigned char>(out[0]) == 0xEF &&
        static_cast<unsigned char>(out[1]) == 0xBB &&
        static_cast<unsigned char>(out[2]) == 0xBF) {
        out.erase(0, 3);
    }

    if (!is_valid_utf8(out)) {
        out.clear();
        error_msg = "file encoding not supported, please use UTF-8";
        return false;
    }
    return true;
}

bool read_text_input(const std::string& path, uint64_t max_size,
                     std::string& out, std::string& error_msg) {
    if (path == "-") {
        if (!read_text_stream(std::cin, max_size, out, error_msg)) {
            error_msg = "stdin: " + error_msg;
            return false;
        }
        return true;
    }

    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        error_msg = path + ": file not found";
        return false;
    }
    if (std::filesystem::is_directory(status)) {
        error_msg = path + ": is a directory";
        return false;
    }

    // Reject before reading when the size is known up front
    if (std::filesystem::is_regular_file(status) && max_size != 0) {
        auto sz = std::filesystem::file_size(path, ec);
        if (!ec && sz > max_size) {
            error_msg = path + ": input size too large (maximum " +
                        format_limit(max_size) + ")";
            return false;
        }
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        error_msg = path + ": permission denied or unreadable";
        return false;
    }
    if (!read_text_stream(file, max_size, out, error_msg)) {
        error_msg = path + ": " + error_msg;
        return false;
    }
    return true;
}

} // namespace epitizer
