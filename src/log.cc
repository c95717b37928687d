// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#include "log.hh"

#include <cstdio>
#include <cstdlib>

#include "format.hh"

namespace tote {

std::vector<Logger> loggers = {
    [](const LogEntry& e) {
      FILE* out = e.log_level == LogLevel::Info ? stdout : stderr;
      fprintf(out, "%s\n", e.buffer.c_str());
    },
};

LogEntry::LogEntry(LogLevel log_level, const std::source_location location)
    : log_level(log_level),
      timestamp(std::chrono::system_clock::now()),
      location(location),
      buffer() {}

LogEntry::~LogEntry() {
  if (log_level == LogLevel::Ignore) {
    return;
  }

  if (log_level == LogLevel::Fatal) {
    buffer += f(" Crashing in {}:{} [{}].", location.file_name(), location.line(),
                location.function_name());
  }

  for (auto& logger : loggers) {
    logger(*this);
  }

  if (log_level == LogLevel::Fatal) {
    abort();
  }
}

const LogEntry& operator<<(const LogEntry& logger, int i) {
  logger.buffer += std::to_string(i);
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, unsigned i) {
  logger.buffer += std::to_string(i);
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, unsigned long i) {
  logger.buffer += std::to_string(i);
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, unsigned long long i) {
  logger.buffer += std::to_string(i);
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, float x) {
  logger.buffer += f("{}", x);
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, double x) {
  logger.buffer += f("{}", x);
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, std::string_view s) {
  logger.buffer += s;
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, const unsigned char* s) {
  logger.buffer += (const char*)s;
  return logger;
}

}  // namespace tote
