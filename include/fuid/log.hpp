#pragma once

#include <fuid/result.hpp>
#include <string>
#include <cstdio>

namespace fuid::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Accepts the names returned by level_name(), case-insensitively.
Result<Level> parse_level(const std::string& name);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Destination stream, stderr by default. Passing nullptr restores stderr.
void set_output(FILE* out);
FILE* get_output();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

} // namespace fuid::log
