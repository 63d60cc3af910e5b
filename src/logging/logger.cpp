/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "logging/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace dgen {

namespace {
constexpr const char *LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

spdlog::sink_ptr make_sink(const std::string &log_file) {
  spdlog::sink_ptr sink;
  if (log_file.empty()) {
    sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  } else {
    sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file);
  }
  sink->set_pattern(LOG_PATTERN);
  return sink;
}
} // namespace

LogLevel parse_log_level(const std::string &name) {
  LogLevel level = spdlog::level::from_str(name);
  // from_str returns off for anything it does not recognise
  if (level == LogLevel::off && name != "off") {
    return LogLevel::info;
  }
  return level;
}

Logger::Logger(std::string name, const std::string &log_file, LogLevel level)
    : name_(std::move(name)), logger_(std::make_shared<spdlog::logger>(name_, make_sink(log_file))) {
  logger_->set_level(level);
  // errors and above reach disk right away, the rest on flush()
  logger_->flush_on(LogLevel::err);
}

void Logger::set_level(LogLevel level) { logger_->set_level(level); }

LogLevel Logger::level() const { return logger_->level(); }

void Logger::add_file_sink(const std::string &log_file) {
  logger_->sinks().push_back(make_sink(log_file));
}

void Logger::flush() { logger_->flush(); }

} // namespace dgen
