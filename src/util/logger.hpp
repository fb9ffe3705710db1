#pragma once

#include <cstdarg>
#include <cstdio>
#include <vector>

namespace epitizer {

// printf-style logger writing "[LEVEL] message" lines to stderr.
class Logger {
public:
    enum Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo, std::FILE* sink = stderr)
        : level_(level), sink_(sink) {}

    void set_level(Level level) { level_ = level; }
    Level level() const { return level_; }
    bool verbose() const { return level_ >= kDebug; }

    void error(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        emit(kError, "ERROR", fmt, ap);
        va_end(ap);
    }

    void warn(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        emit(kWarn, "WARN", fmt, ap);
        va_end(ap);
    }

    void info(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        emit(kInfo, "INFO", fmt, ap);
        va_end(ap);
    }

    void debug(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        emit(kDebug, "DEBUG", fmt, ap);
        va_end(ap);
    }

private:
    Level level_;
    std::FILE* sink_;

    void emit(Level at, const char* tag, const char* fmt, va_list ap) const {
        if (level_ < at) return;
        va_list ap2;
        va_copy(ap2, ap);
        int len = std::vsnprintf(nullptr, 0, fmt, ap2);
        va_end(ap2);
        if (len < 0) return;

        std::vector<char> buf(static_cast<size_t>(len) + 1);
        std::vsnprintf(buf.data(), buf.size(), fmt, ap);
        std::fprintf(sink_, "[%s] %s\n", tag, buf.data());
    }
};

} // namespace epitizer
