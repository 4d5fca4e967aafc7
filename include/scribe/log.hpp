#pragma once

#include <scribe/result.hpp>
#include <string>
#include <cstdio>

namespace scribe::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Destination of log lines; nullptr restores stderr
void set_output(std::FILE* out);

// Color is on by default only when the output is a terminal
void set_color_enabled(bool enabled);
bool is_color_enabled();

// Prefix each line with the local wall-clock time (HH:MM:SS.mmm)
void set_timestamps_enabled(bool enabled);
bool is_timestamps_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Inverse of level_name; also accepts "warning"
Result<Level> parse_level(const std::string& name);

} // namespace scribe::log
