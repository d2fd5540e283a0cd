#pragma once
#include <ostream>
#include <sstream>
#include <string>

namespace site {

enum class LogLevel { TRACE=0, DEBUG=1, INFO=2, WARN=3, ERROR=4, OFF=5 };

const char* level_tag(LogLevel l);
bool parse_log_level(const std::string& s, LogLevel& out);

void set_log_level(LogLevel l);
LogLevel log_level();
bool log_enabled(LogLevel l);

// nullptr restores std::cerr. The sink must outlive any logging thread.
void set_log_sink(std::ostream* sink);

// One log line, written to the sink as a whole when destroyed.
class LogLine {
public:
  LogLine(LogLevel level, const char* component);
  ~LogLine();

  LogLine(const LogLine&) = delete;
  LogLine& operator=(const LogLine&) = delete;

  template <typename T>
  LogLine& operator<<(const T& v) {
    buf_ << v;
    return *this;
  }

private:
  LogLevel level_;
  const char* component_;
  std::ostringstream buf_;
};

} // namespace site

// AISLEGUARD_LOG(WARN, "engine") << "tick overrun " << ms << " ms";
#define AISLEGUARD_LOG(level, component)                          \
  if (!::site::log_enabled(::site::LogLevel::level)) {            \
  } else                                                          \
    ::site::LogLine(::site::LogLevel::level, component)
