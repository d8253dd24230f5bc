#pragma once

#include <pformat/result.hpp>
#include <string>
#include <cstdio>

namespace pformat::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Redirect log output (default stderr). Passing nullptr restores stderr.
void set_output(std::FILE* out);

// Parse "trace", "debug", "info", "warn" or "error" (case-insensitive)
Result<Level> parse_level(const std::string& name);

// Apply the level named by $PFORMAT_LOG, if set and valid.
// Returns true when the variable was applied.
bool init_from_env();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

} // namespace pformat::log
