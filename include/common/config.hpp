/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace dgen {

constexpr uint16_t DEFAULT_PORT = 13042;

// A file shipped to workers inside the run configuration.
struct NamedFile {
  std::string name;
  std::string contents;

  bool operator==(const NamedFile &other) const = default;

  nlohmann::json to_json() const { return nlohmann::json{{"name", name}, {"contents", contents}}; }

  static NamedFile from_json(const nlohmann::json &j) {
    return NamedFile{j.at("name").get<std::string>(), j.at("contents").get<std::string>()};
  }
};

struct IngestSettings {
  std::string host = "127.0.0.1";
  uint16_t port = 25081;
  std::string user;
  std::string auth_key;
  std::string db_name;
  bool skip = false;
  // Holds `<db_name>.json` and the table schemas registered before the run.
  std::string cfg_dir;
  bool skip_schema = false;

  bool operator==(const IngestSettings &other) const = default;

  nlohmann::json to_json() const;
  static IngestSettings from_json(const nlohmann::json &j);
};

/**
 * @brief Everything a worker needs to generate chunks. Sent once per session as the CONFIG
 * payload; `client_name` is filled in per session by the coordinator.
 */
struct RunConfiguration {
  std::string client_name;
  std::string generator_arguments;
  std::string generator_spec_name = "spec.py";
  std::string generator_spec;
  std::vector<NamedFile> partitioner_configs;
  std::vector<NamedFile> pregenerated_files;
  IngestSettings ingest;
  bool keep_csv = false;

  bool operator==(const RunConfiguration &other) const = default;

  nlohmann::json to_json() const;
  static RunConfiguration from_json(const nlohmann::json &j);
};

// Network and lifecycle settings of the coordinator.
struct ServerSettings {
  std::string host = "0.0.0.0";
  uint16_t port = DEFAULT_PORT;
  size_t io_threads = 2;
  uint32_t max_batch_size = 100;
  uint32_t session_timeout_sec = 3600;
  uint32_t checkpoint_interval_sec = 300; // 0 disables periodic checkpoints

  nlohmann::json to_json() const;
  static ServerSettings from_json(const nlohmann::json &j);
};

/**
 * @brief Coordinator configuration document.
 *
 * {
 *   "server": {"host": "0.0.0.0", "port": 13042, "io_threads": 2, "max_batch_size": 100,
 *              "session_timeout_sec": 3600, "checkpoint_interval_sec": 300},
 *   "generator": {"arguments": "--visits 10", "spec_file": "example_spec.py"},
 *   "partitioner": {"cfg_dir": "partitioner_cfg"},
 *   "pregenerated": {"dir": "pregenerated", "files": ["visit_table.csv"]},
 *   "ingest": {"host": "qserv-czar", "port": 25081, "user": "qsmaster", "auth_key": "",
 *              "db_name": "synth_db", "skip": false, "cfg_dir": "ingest_cfg",
 *              "skip_schema": false, "admin_command": "qserv-ingest-admin"},
 *   "keep_csv": false
 * }
 *
 * Every section and key is optional. Relative paths are resolved against the directory holding
 * the configuration file.
 */
struct ServerConfig {
  ServerSettings server;
  std::string generator_arguments;
  std::filesystem::path generator_spec_file;
  std::filesystem::path partitioner_cfg_dir;
  std::filesystem::path pregenerated_dir;
  std::vector<std::string> pregenerated_files;
  IngestSettings ingest;
  std::string ingest_admin_command = "qserv-ingest-admin";
  bool keep_csv = false;

  nlohmann::json to_json() const;
  static ServerConfig from_json(const nlohmann::json &j,
                                const std::filesystem::path &base_dir = {});

  /**
   * @throws std::runtime_error if the file cannot be read or is not valid JSON.
   */
  static ServerConfig load_from_file(const std::filesystem::path &path);

  /**
   * @brief Reads the generator spec, every `*.cfg` file of the partitioner directory (sorted by
   * name) and the listed pregenerated files into a run configuration.
   * @throws std::runtime_error if one of them cannot be read.
   */
  RunConfiguration build_run_configuration() const;
};

/**
 * @brief Worker settings. Defaults come from the environment (DGEN_* variables, a ./.env file
 * is honored) and are overridden by command line flags.
 */
struct WorkerConfig {
  std::string server_host = "127.0.0.1";
  uint16_t server_port = DEFAULT_PORT;
  uint32_t chunks_per_request = 1;
  size_t parallelism = 1;
  uint32_t max_consecutive_failures = 5;
  bool retry = false;
  uint32_t retry_interval_sec = 10;
  std::filesystem::path work_dir = "dgen_work";
  std::string generator_command = "datagen.py";
  std::string partitioner_command = "sph-partition";
  std::string ingest_command = "qserv-ingest";

  static WorkerConfig from_env();
};

} // namespace dgen
