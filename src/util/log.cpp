#include <cfgonce/log.hpp>
#include <cctype>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace cfgonce::log {

namespace {

struct LevelInfo {
    const char* name;
    const char* color;
};

// Indexed by Level
const LevelInfo kLevels[] = {
    {"trace", "\033[90m"},
    {"debug", "\033[36m"},
    {"info",  "\033[32m"},
    {"warn",  "\033[33m"},
    {"error", "\033[31m"},
};

const char* const kReset = "\033[0m";

struct Sink {
    Level threshold = Warn;
    std::FILE* stream = nullptr;  // nullptr means stderr
    std::optional<bool> color;    // unset until first needed
};

Sink& sink() {
    static Sink s;
    return s;
}

std::FILE* stream_of(const Sink& s) {
    return s.stream ? s.stream : stderr;
}

bool valid(Level lvl) {
    return lvl >= Trace && lvl <= Error;
}

} // namespace

void set_level(Level lvl) { sink().threshold = lvl; }
Level get_level() { return sink().threshold; }

bool enabled(Level lvl) {
    return lvl >= sink().threshold;
}

void set_output(std::FILE* stream) {
    sink().stream = stream;
    sink().color.reset();
}

std::FILE* get_output() { return stream_of(sink()); }

void set_color_enabled(bool enabled) { sink().color = enabled; }

bool is_color_enabled() {
    Sink& s = sink();
    if (!s.color) s.color = isatty(fileno(stream_of(s))) != 0;
    return *s.color;
}

const char* level_name(Level lvl) {
    return valid(lvl) ? kLevels[lvl].name : "unknown";
}

std::optional<Level> parse_level(const std::string& name) {
    std::string key;
    for (char c : name) key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (key == "warning") return Warn;
    for (int i = Trace; i <= Error; ++i) {
        if (key == kLevels[i].name) return static_cast<Level>(i);
    }
    return std::nullopt;
}

bool init_from_env() {
    const char* value = std::getenv("CFGONCE_LOG");
    if (!value || !*value) return false;
    if (auto lvl = parse_level(value)) {
        set_level(*lvl);
        return true;
    }
    warn("ignoring unknown CFGONCE_LOG level '%s'", value);
    return false;
}

void vwrite(Level lvl, const char* fmt, va_list args) {
    if (!valid(lvl) || !enabled(lvl)) return;
    std::FILE* out = get_output();
    if (is_color_enabled()) {
        std::fprintf(out, "cfgonce %s%s%s: ", kLevels[lvl].color, kLevels[lvl].name, kReset);
    } else {
        std::fprintf(out, "cfgonce %s: ", kLevels[lvl].name);
    }
    std::vfprintf(out, fmt, args);
    std::fputc('\n', out);
}

void write(Level lvl, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(lvl, fmt, args);
    va_end(args);
}

#define CFGONCE_LOG_AT(fn, lvl)            \
    void fn(const char* fmt, ...) {        \
        va_list args;                      \
        va_start(args, fmt);               \
        vwrite(lvl, fmt, args);            \
        va_end(args);                      \
    }

CFGONCE_LOG_AT(trace, Trace)
CFGONCE_LOG_AT(debug, Debug)
CFGONCE_LOG_AT(info, Info)
CFGONCE_LOG_AT(warn, Warn)
CFGONCE_LOG_AT(error, Error)

#undef CFGONCE_LOG_AT

} // namespace cfgonce::log
