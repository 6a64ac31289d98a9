#pragma once

#include <cstdarg>
#include <cstdio>
#include <optional>
#include <string>

// Diagnostics for the search and file operations. Quiet unless asked:
// the default level is Warn, and the library itself only logs at
// trace/debug/info.
namespace cfgonce::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// True when a message at `lvl` would be written
bool enabled(Level lvl);

// Destination stream, stderr by default. Changing it re-detects colour.
void set_output(std::FILE* stream);
std::FILE* get_output();

void set_color_enabled(bool enabled);
bool is_color_enabled();

const char* level_name(Level lvl);

// Case-insensitive level name; "warning" is accepted for Warn
std::optional<Level> parse_level(const std::string& name);

// Apply the level named by $CFGONCE_LOG. Returns true when a level was
// applied; an unknown name is reported at warn and otherwise ignored.
bool init_from_env();

// printf-style; one line per call, prefixed "cfgonce <level>: "
void write(Level lvl, const char* fmt, ...);
void vwrite(Level lvl, const char* fmt, va_list args);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

} // namespace cfgonce::log
