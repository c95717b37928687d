// SPDX-FileCopyrightText: Copyright 2025 Tote Authors
// SPDX-License-Identifier: MIT
#pragma once

#include <chrono>
#include <concepts>
#include <functional>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

// Functions for logging human-readable messages.
//
// Usage:
//
//   LOG << "regular message";
//   ERROR << "error message";
//   FATAL << "stop the execution";
//
// Logging accepts integers, floats, strings and anything with a `ToStr()` method.
//
// There is no need to add a new line character at the end of the logged message - it's added
// there automatically.

namespace tote {

enum class LogLevel { Info, Error, Fatal, Ignore };

struct LogEntry {
  LogLevel log_level;
  std::chrono::system_clock::time_point timestamp;
  std::source_location location;
  mutable std::string buffer;

  LogEntry(LogLevel, std::source_location location = std::source_location::current());
  ~LogEntry();
};

// Receives every finished log entry. The default logger prints to stdout.
using Logger = std::function<void(const LogEntry&)>;

extern std::vector<Logger> loggers;

const LogEntry& operator<<(const LogEntry&, int);
const LogEntry& operator<<(const LogEntry&, unsigned);
const LogEntry& operator<<(const LogEntry&, unsigned long);
const LogEntry& operator<<(const LogEntry&, unsigned long long);
const LogEntry& operator<<(const LogEntry&, float);
const LogEntry& operator<<(const LogEntry&, double);
const LogEntry& operator<<(const LogEntry&, std::string_view);
const LogEntry& operator<<(const LogEntry&, const unsigned char*);

template <typename T>
concept loggable = requires(const T& v) {
  { v.ToStr() } -> std::convertible_to<std::string_view>;
};

template <loggable T>
const LogEntry& operator<<(const LogEntry& logger, const T& t) {
  return logger << std::string_view(t.ToStr());
}

}  // namespace tote

#define LOG ::tote::LogEntry(::tote::LogLevel::Info)
#define ERROR ::tote::LogEntry(::tote::LogLevel::Error)
#define FATAL ::tote::LogEntry(::tote::LogLevel::Fatal)
