#pragma once

#include <string>
#include <cstdio>

namespace sshcopy::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// All functions are safe to call from concurrent upload tasks; each call
// emits one whole line.
void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Parse "trace" | "debug" | "info" | "warn" | "error". Returns false and
// leaves `out` untouched for anything else.
bool parse_level(const std::string& name, Level& out);

} // namespace sshcopy::log
