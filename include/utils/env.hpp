/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "logging/logger.hpp"
#include "parser.hpp"

#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace dgen {

/**
 * @brief Typed access to settings given as environment variables.
 *
 * A KEY=VALUE file (default ./.env) supplies fallbacks: a variable set in the process environment
 * always wins over the file, so a deployment can override a checked-in .env. Lines may start with
 * `export `, `#` starts a comment line and values may be single or double quoted.
 */
class EnvLoader {
public:
  explicit EnvLoader(const std::string &file_path = "./.env") { load_env_file(file_path); }

  bool load_env_file(const std::string &file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
      GlobalLogger::debug("No .env file at {}", file_path);
      return false;
    }

    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
      ++line_number;
      line = trim(line);
      if (line.empty() || line[0] == '#') {
        continue;
      }
      if (line.rfind("export ", 0) == 0) {
        line = trim(line.substr(7));
      }

      size_t equals_pos = line.find('=');
      if (equals_pos == std::string::npos || equals_pos == 0) {
        GlobalLogger::warn("Ignoring line {} of {}: {}", line_number, file_path, line);
        continue;
      }
      file_values_[trim(line.substr(0, equals_pos))] = unquote(trim(line.substr(equals_pos + 1)));
    }
    GlobalLogger::debug("Loaded {} settings from {}", file_values_.size(), file_path);
    return true;
  }

  std::optional<std::string> raw(const std::string &name) const {
    if (const char *value = std::getenv(name.c_str())) {
      return std::string(value);
    }
    auto it = file_values_.find(name);
    if (it != file_values_.end()) {
      return it->second;
    }
    return std::nullopt;
  }

  /**
   * @throws std::invalid_argument naming the variable when its value cannot be converted.
   */
  template <typename T = std::string> T get(const std::string &name, const T &default_value) const {
    std::optional<std::string> value = raw(name);
    if (!value) {
      return default_value;
    }
    try {
      return from_str<T>(*value);
    } catch (const std::invalid_argument &e) {
      throw std::invalid_argument(name + ": " + e.what());
    }
  }

private:
  std::unordered_map<std::string, std::string> file_values_;

  static std::string trim(const std::string &str) {
    size_t begin = str.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
      return "";
    }
    size_t end = str.find_last_not_of(" \t\r");
    return str.substr(begin, end - begin + 1);
  }

  static std::string unquote(const std::string &value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
      return value.substr(1, value.size() - 2);
    }
    return value;
  }
};

class Env {
public:
  static EnvLoader &instance() {
    static EnvLoader instance;
    return instance;
  }

  template <typename T = std::string>
  static T get(const std::string &name, const T &default_value) {
    return instance().get<T>(name, default_value);
  }
};

} // namespace dgen
