#include "site_env/log.hpp"
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace site {

static std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
static std::mutex g_sink_mtx;
static std::ostream* g_sink = nullptr;

static double uptime_s() {
  static const auto t0 = std::chrono::steady_clock::now();
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
}

const char* level_tag(LogLevel l) {
  switch (l) {
    case LogLevel::TRACE: return "TRACE";
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::OFF:   return "OFF";
  }
  return "?";
}

bool parse_log_level(const std::string& s, LogLevel& out) {
  for (int i = 0; i <= static_cast<int>(LogLevel::OFF); ++i) {
    LogLevel l = static_cast<LogLevel>(i);
    std::string tag = level_tag(l);
    std::string lower;
    for (char c : tag) lower += static_cast<char>(c - 'A' + 'a');
    if (s == tag || s == lower) {
      out = l;
      return true;
    }
  }
  return false;
}

void set_log_level(LogLevel l) { g_level.store(static_cast<int>(l)); }
LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

bool log_enabled(LogLevel l) {
  return l != LogLevel::OFF && static_cast<int>(l) >= g_level.load();
}

void set_log_sink(std::ostream* sink) {
  std::lock_guard<std::mutex> lock(g_sink_mtx);
  g_sink = sink;
}

LogLine::LogLine(LogLevel level, const char* component)
  : level_(level), component_(component) {}

LogLine::~LogLine() {
  std::ostringstream line;
  line << "[" << std::fixed << std::setprecision(3) << std::setw(9) << uptime_s() << "] "
       << std::left << std::setw(5) << level_tag(level_) << " "
       << component_ << ": " << buf_.str() << "\n";

  std::lock_guard<std::mutex> lock(g_sink_mtx);
  std::ostream& out = g_sink ? *g_sink : std::cerr;
  out << line.str();
  out.flush();
}

} // namespace site
