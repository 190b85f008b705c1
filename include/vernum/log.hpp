#pragma once

#include <vernum/result.hpp>
#include <string>

namespace vernum::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// Inverse of level_name(); used for the [log] level key of the config file
Result<Level> parse_level(const std::string& name);

} // namespace vernum::log
