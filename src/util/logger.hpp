#pragma once

#include <cstdarg>
#include <cstdio>

namespace blastbridge {

// Leveled logger writing "[LEVEL] message" lines to a stdio stream
// (stderr unless redirected). Thread-safe if fprintf is thread-safe.
class Logger {
public:
    enum Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo, std::FILE* out = stderr)
        : level_(level), out_(out) {}

    void set_level(Level level) { level_ = level; }
    Level level() const { return level_; }
    bool verbose() const { return level_ >= kDebug; }

    // Silence everything below errors (tests, quiet mode).
    void set_quiet() { level_ = kError; }

    void error(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        log_impl("ERROR", fmt, ap);
        va_end(ap);
    }

    void warn(const char* fmt, ...) const {
        if (level_ < kWarn) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("WARN", fmt, ap);
        va_end(ap);
    }

    void info(const char* fmt, ...) const {
        if (level_ < kInfo) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("INFO", fmt, ap);
        va_end(ap);
    }

    void debug(const char* fmt, ...) const {
        if (level_ < kDebug) return;
        va_list ap;
        va_start(ap, fmt);
        log_impl("DEBUG", fmt, ap);
        va_end(ap);
    }

private:
    Level level_;
    std::FILE* out_;

    void log_impl(const char* tag, const char* fmt, va_list ap) const {
        std::fprintf(out_, "[%s] ", tag);
        std::vfprintf(out_, fmt, ap);
        std::fprintf(out_, "\n");
    }
};

} // namespace blastbridge
