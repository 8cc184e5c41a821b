#pragma once

#include <functional>
#include <string>

namespace galaxis::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void set_level(Level lvl);
Level level();

// Parses "debug", "info", "warn", "error" or "off" (case-insensitive).
// Unknown names return `def`.
Level parse_level(const std::string& name, Level def = Level::Info);

const char* level_label(Level lvl);

// Replace the output sink. Passing an empty function restores stderr.
//
// Actors log from their own threads; the sink is always invoked under the
// logger mutex so it never needs its own locking.
using Sink = std::function<void(Level, const std::string&)>;
void set_sink(Sink sink);

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

} // namespace galaxis::log
