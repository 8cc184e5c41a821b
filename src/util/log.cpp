#include "galaxis/util/log.h"

#include <atomic>
#include <iostream>
#include <mutex>

#include "galaxis/util/strings.h"

namespace galaxis::log {
namespace {
std::mutex g_mu;
std::atomic<Level> g_level{Level::Info};
Sink g_sink;

void emit(Level l, const std::string& msg) {
  const Level cur = g_level.load();
  if (cur == Level::Off || l < cur) return;
  std::lock_guard<std::mutex> lock(g_mu);
  if (g_sink) {
    g_sink(l, msg);
    return;
  }
  std::cerr << "[" << level_label(l) << "] " << msg << "\n";
}

} // namespace

void set_level(Level lvl) { g_level.store(lvl); }
Level level() { return g_level.load(); }

Level parse_level(const std::string& name, Level def) {
  const std::string n = to_lower(trim_copy(name));
  if (n == "debug") return Level::Debug;
  if (n == "info") return Level::Info;
  if (n == "warn" || n == "warning") return Level::Warn;
  if (n == "error") return Level::Error;
  if (n == "off" || n == "none") return Level::Off;
  return def;
}

const char* level_label(Level l) {
  switch (l) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    default: return "";
  }
}

void set_sink(Sink sink) {
  std::lock_guard<std::mutex> lock(g_mu);
  g_sink = std::move(sink);
}

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg) { emit(Level::Info, msg); }
void warn(const std::string& msg) { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace galaxis::log
