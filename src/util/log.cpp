#include <pformat/log.hpp>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace pformat::log {

// Read on every log call, possibly from several threads at once
static std::atomic<Level> s_level{Warn};
static std::atomic<std::FILE*> s_output{nullptr};

enum ColorState { ColorUnknown, ColorOff, ColorOn };
static std::atomic<int> s_color{ColorUnknown};

static std::FILE* output() {
    std::FILE* out = s_output.load();
    return out ? out : stderr;
}

static bool color_on() {
    int state = s_color.load();
    if (state == ColorUnknown) {
        int detected = isatty(fileno(output())) ? ColorOn : ColorOff;
        // A concurrent set_color_enabled() wins over detection
        if (!s_color.compare_exchange_strong(state, detected)) return state == ColorOn;
        return detected == ColorOn;
    }
    return state == ColorOn;
}

void set_level(Level lvl) {
    s_level.store(lvl);
}

Level get_level() {
    return s_level.load();
}

void set_color_enabled(bool enabled) {
    s_color.store(enabled ? ColorOn : ColorOff);
}

bool is_color_enabled() {
    return color_on();
}

void set_output(std::FILE* out) {
    s_output.store(out);
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

Result<Level> parse_level(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (lower == level_name(lvl)) return Result<Level>::ok(lvl);
    }
    return PformatError{PformatError::InvalidArg,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error"};
}

bool init_from_env() {
    const char* env = std::getenv("PFORMAT_LOG");
    if (!env || !*env) return false;
    auto lvl = parse_level(env);
    if (lvl.is_err()) {
        warn("ignoring PFORMAT_LOG: %s", lvl.error().message.c_str());
        return false;
    }
    s_level.store(lvl.value());
    return true;
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
    if (lvl < s_level.load()) return;

    std::FILE* out = output();
    if (color_on()) {
        std::fprintf(out, "%spformat %s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(out, "pformat %s: ", level_name(lvl));
    }

    std::vfprintf(out, fmt, args);
    std::fprintf(out, "\n");
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

} // namespace pformat::log
