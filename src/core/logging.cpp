/**
 * @file logging.cpp
 * @brief Global log level and stderr sink.
 */

#include "core/logging.h"

#include <atomic>

namespace chordgrid {

namespace {

std::atomic<int> g_log_level{static_cast<int>(LogVerbosity::Warn)};

void writeLine(const std::string& label, const std::string& text, const char* file, int line,
               const char* func) {
  if (label == "error") {
    std::cerr << "[ChordGrid][" << label << "][" << file << ":" << line << " " << func << "] "
              << text << "\n";
    return;
  }
  std::cerr << "[ChordGrid][" << label << "] " << text << "\n";
}

}  // namespace

void setLogVerbosity(LogVerbosity level) {
  g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogVerbosity getLogVerbosity() {
  return static_cast<LogVerbosity>(g_log_level.load(std::memory_order_relaxed));
}

void logMessage(const char* level, const std::string& message, const char* file, int line,
                const char* func) {
  const std::string label = level ? level : "";
  if (message.empty()) {
    writeLine(label, message, file, line, func);
    return;
  }

  size_t start = 0;
  while (start < message.size()) {
    size_t end = message.find('\n', start);
    size_t len = (end == std::string::npos) ? message.size() - start : end - start;
    if (len > 0) {
      writeLine(label, message.substr(start, len), file, line, func);
    }
    if (end == std::string::npos) break;
    start = end + 1;
  }
}

}  // namespace chordgrid
