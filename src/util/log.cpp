#include <uidkit/log.hpp>
#include <atomic>
#include <cstdarg>
#include <cstdio>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace uidkit::log {

// Generation may run on many threads at once, so the settings are atomics.
static std::atomic<Level> s_level{Info};
static std::atomic<int> s_color{-1};  // -1 = not yet detected

static bool color_on() {
    int c = s_color.load(std::memory_order_relaxed);
    if (c < 0) {
        c = isatty(fileno(stderr)) ? 1 : 0;
        s_color.store(c, std::memory_order_relaxed);
    }
    return c == 1;
}

void set_level(Level lvl) {
    s_level.store(lvl, std::memory_order_relaxed);
}

Level get_level() {
    return s_level.load(std::memory_order_relaxed);
}

void set_color_enabled(bool enabled) {
    s_color.store(enabled ? 1 : 0, std::memory_order_relaxed);
}

bool is_color_enabled() {
    return color_on();
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

std::optional<Level> level_from_name(const std::string& name) {
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (name == level_name(lvl)) return lvl;
    }
    return std::nullopt;
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
    }
    return "";
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < get_level()) return;

    // Format into one buffer so concurrent writers do not interleave a line
    char body[1024];
    std::vsnprintf(body, sizeof(body), fmt, args);

    if (color_on()) {
        std::fprintf(stderr, "uidkit %s%s\033[0m: %s\n",
                     level_color(lvl), level_name(lvl), body);
    } else {
        std::fprintf(stderr, "uidkit %s: %s\n", level_name(lvl), body);
    }
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Error, fmt, args);
    va_end(args);
}

} // namespace uidkit::log
