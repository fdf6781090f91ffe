/**
 * @file logging.h
 * @brief Leveled diagnostic logging to stderr.
 */

#ifndef CHORDGRID_CORE_LOGGING_H
#define CHORDGRID_CORE_LOGGING_H

#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace chordgrid {

/**
 * @brief Logging level policy.
 *
 * - `Error`: the requested operation cannot be completed.
 * - `Warn`: degraded result, fallback, or data defect the caller should see.
 * - `Info`: lifecycle summaries (grid built, record loaded).
 * - `Debug`: per-beat and per-label traces.
 */
enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/// @brief Set the global log verbosity (default: Warn).
void setLogVerbosity(LogVerbosity level);

/// @brief Get the global log verbosity.
LogVerbosity getLogVerbosity();

/// @brief Map a level tag ("error", "warn", "info", "debug") to a verbosity.
constexpr LogVerbosity severityForTag(std::string_view tag) {
  if (tag == "error") return LogVerbosity::Error;
  if (tag == "warn" || tag == "warning") return LogVerbosity::Warn;
  if (tag == "info") return LogVerbosity::Info;
  return LogVerbosity::Debug;
}

/// @brief True if messages tagged with level pass the current verbosity.
inline bool shouldLog(const char* level) {
  const auto severity = severityForTag(level ? level : "");
  return static_cast<int>(severity) <= static_cast<int>(getLogVerbosity());
}

/// @brief Write one log message, one output line per message line.
void logMessage(const char* level, const std::string& message, const char* file, int line,
                const char* func);

/// @brief Stream-style logger for messages built across several statements.
class LogStream {
 public:
  LogStream(const char* level, const char* file, int line, const char* func)
      : level_(level), file_(file), line_(line), func_(func), enabled_(shouldLog(level)) {}

  LogStream(const LogStream&) = delete;
  LogStream& operator=(const LogStream&) = delete;

  template <typename T>
  LogStream& operator<<(const T& value) {
    if (enabled_) stream_ << value;
    return *this;
  }

  ~LogStream() {
    if (enabled_) logMessage(level_, stream_.str(), file_, line_, func_);
  }

 private:
  const char* level_;
  const char* file_;
  int line_;
  const char* func_;
  bool enabled_;
  std::ostringstream stream_;
};

}  // namespace chordgrid

#define CHORDGRID_LOG(level, message)                                                   \
  do {                                                                                  \
    if (::chordgrid::shouldLog(level)) {                                                \
      std::ostringstream chordgrid_log_stream_;                                         \
      chordgrid_log_stream_ << message;                                                 \
      ::chordgrid::logMessage(level, chordgrid_log_stream_.str(), __FILE__, __LINE__,   \
                              __func__);                                                \
    }                                                                                   \
  } while (0)

#define CHORDGRID_LOG_STREAM(level) ::chordgrid::LogStream(level, __FILE__, __LINE__, __func__)

#define CHORDGRID_LOG_ERROR(message) CHORDGRID_LOG("error", message)
#define CHORDGRID_LOG_WARN(message) CHORDGRID_LOG("warn", message)
#define CHORDGRID_LOG_INFO(message) CHORDGRID_LOG("info", message)
#define CHORDGRID_LOG_DEBUG(message) CHORDGRID_LOG("debug", message)

#endif  // CHORDGRID_CORE_LOGGING_H
