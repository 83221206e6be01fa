#include <fuid/log.hpp>
#include <cctype>
#include <cstdarg>
#include <cstdio>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace fuid::log {

static Level s_level = Info;
static FILE* s_output = nullptr;
static bool s_color_initialized = false;
static bool s_color_enabled = false;

static FILE* out_stream() {
    return s_output ? s_output : stderr;
}

static void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(out_stream()));
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

Result<Level> parse_level(const std::string& name) {
    std::string lower;
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (lower == level_name(lvl)) return Result<Level>::ok(lvl);
    }
    return FuidError(FuidError::Config,
        "unknown log level: " + name,
        "expected one of trace, debug, info, warn, error");
}

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

void set_output(FILE* out) {
    s_output = out;
}

FILE* get_output() {
    return out_stream();
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
    if (lvl < s_level) return;
    init_color();
    FILE* out = out_stream();

    if (s_color_enabled) {
        std::fprintf(out, "%s%s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(out, "%s: ", level_name(lvl));
    }

    std::vfprintf(out, fmt, args);
    std::fprintf(out, "\n");
}

#define FUID_LOG_FORWARD(lvl) \
    va_list args; \
    va_start(args, fmt); \
    log_message(lvl, fmt, args); \
    va_end(args)

void trace(const char* fmt, ...) { FUID_LOG_FORWARD(Trace); }
void debug(const char* fmt, ...) { FUID_LOG_FORWARD(Debug); }
void info(const char* fmt, ...)  { FUID_LOG_FORWARD(Info); }
void warn(const char* fmt, ...)  { FUID_LOG_FORWARD(Warn); }
void error(const char* fmt, ...) { FUID_LOG_FORWARD(Error); }

#undef FUID_LOG_FORWARD

} // namespace fuid::log
