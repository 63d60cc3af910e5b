/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace dgen {

typedef spdlog::level::level_enum LogLevel;

/**
 * @brief Parses "trace", "debug", "info", "warn", "error", "critical" or "off".
 * Unknown names map to info.
 */
LogLevel parse_log_level(const std::string &name);

/**
 * @brief Named spdlog logger writing to the console or to a file.
 *
 * Loggers are not registered in the spdlog registry, so several instances may share a name
 * (one chunk logger per coordinator in a test process, for example).
 */
class Logger {
public:
  explicit Logger(std::string name = "dgen", const std::string &log_file = "",
                  LogLevel level = LogLevel::info);

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  void set_level(LogLevel level);
  LogLevel level() const;
  bool should_log(LogLevel level) const { return logger_->should_log(level); }

  // Also writes everything to log_file. Call before the logger is shared between threads.
  void add_file_sink(const std::string &log_file);

  void flush();

  const std::string &name() const { return name_; }

  template <typename... Args>
  void log(LogLevel level, spdlog::format_string_t<Args...> fmt, Args &&...args) {
    logger_->log(level, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args> void trace(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    log(LogLevel::trace, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args> void debug(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    log(LogLevel::debug, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args> void info(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    log(LogLevel::info, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args> void warn(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    log(LogLevel::warn, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args> void error(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    log(LogLevel::err, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args> void critical(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    log(LogLevel::critical, fmt, std::forward<Args>(args)...);
  }

private:
  std::string name_;
  std::shared_ptr<spdlog::logger> logger_;
};

// Process wide logger used by the executables and the network layer.
class GlobalLogger {
private:
  static Logger &instance() {
    static Logger global_logger("dgen");
    return global_logger;
  }

public:
  static void set_level(LogLevel level) { instance().set_level(level); }
  static void add_file_sink(const std::string &log_file) { instance().add_file_sink(log_file); }
  static void flush() { instance().flush(); }

  template <typename... Args>
  static void trace(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    instance().trace(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void debug(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    instance().debug(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void info(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    instance().info(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void warn(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    instance().warn(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void error(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    instance().error(fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void critical(spdlog::format_string_t<Args...> fmt, Args &&...args) {
    instance().critical(fmt, std::forward<Args>(args)...);
  }
};

} // namespace dgen
