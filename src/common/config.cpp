/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "common/config.hpp"

#include "utils/env.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace dgen {

namespace {

std::string read_text_file(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open file: " + path.string());
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  if (file.bad()) {
    throw std::runtime_error("Error reading file: " + path.string());
  }
  return contents.str();
}

std::filesystem::path resolve(const std::filesystem::path &base_dir, const std::string &value) {
  if (value.empty()) {
    return {};
  }
  std::filesystem::path path(value);
  if (path.is_relative() && !base_dir.empty()) {
    return base_dir / path;
  }
  return path;
}

nlohmann::json section(const nlohmann::json &j, const char *name) {
  if (j.contains(name)) {
    return j.at(name);
  }
  return nlohmann::json::object();
}

} // namespace

nlohmann::json IngestSettings::to_json() const {
  return nlohmann::json{{"host", host},         {"port", port},       {"user", user},
                        {"auth_key", auth_key}, {"db_name", db_name}, {"skip", skip},
                        {"cfg_dir", cfg_dir},   {"skip_schema", skip_schema}};
}

IngestSettings IngestSettings::from_json(const nlohmann::json &j) {
  IngestSettings settings;
  settings.host = j.value("host", settings.host);
  settings.port = j.value("port", settings.port);
  settings.user = j.value("user", settings.user);
  settings.auth_key = j.value("auth_key", settings.auth_key);
  settings.db_name = j.value("db_name", settings.db_name);
  settings.skip = j.value("skip", settings.skip);
  settings.cfg_dir = j.value("cfg_dir", settings.cfg_dir);
  settings.skip_schema = j.value("skip_schema", settings.skip_schema);
  return settings;
}

nlohmann::json RunConfiguration::to_json() const {
  nlohmann::json partitioner = nlohmann::json::array();
  for (const auto &file : partitioner_configs) {
    partitioner.push_back(file.to_json());
  }
  nlohmann::json pregenerated = nlohmann::json::array();
  for (const auto &file : pregenerated_files) {
    pregenerated.push_back(file.to_json());
  }
  return nlohmann::json{{"client_name", client_name},
                        {"generator_arguments", generator_arguments},
                        {"generator_spec_name", generator_spec_name},
                        {"generator_spec", generator_spec},
                        {"partitioner_configs", partitioner},
                        {"pregenerated_files", pregenerated},
                        {"ingest", ingest.to_json()},
                        {"keep_csv", keep_csv}};
}

RunConfiguration RunConfiguration::from_json(const nlohmann::json &j) {
  RunConfiguration config;
  config.client_name = j.at("client_name").get<std::string>();
  config.generator_arguments = j.at("generator_arguments").get<std::string>();
  config.generator_spec_name = j.at("generator_spec_name").get<std::string>();
  config.generator_spec = j.at("generator_spec").get<std::string>();
  for (const auto &file : j.at("partitioner_configs")) {
    config.partitioner_configs.push_back(NamedFile::from_json(file));
  }
  for (const auto &file : j.at("pregenerated_files")) {
    config.pregenerated_files.push_back(NamedFile::from_json(file));
  }
  config.ingest = IngestSettings::from_json(j.at("ingest"));
  config.keep_csv = j.at("keep_csv").get<bool>();
  return config;
}

nlohmann::json ServerSettings::to_json() const {
  return nlohmann::json{{"host", host},
                        {"port", port},
                        {"io_threads", io_threads},
                        {"max_batch_size", max_batch_size},
                        {"session_timeout_sec", session_timeout_sec},
                        {"checkpoint_interval_sec", checkpoint_interval_sec}};
}

ServerSettings ServerSettings::from_json(const nlohmann::json &j) {
  ServerSettings settings;
  settings.host = j.value("host", settings.host);
  settings.port = j.value("port", settings.port);
  settings.io_threads = j.value("io_threads", settings.io_threads);
  settings.max_batch_size = j.value("max_batch_size", settings.max_batch_size);
  settings.session_timeout_sec = j.value("session_timeout_sec", settings.session_timeout_sec);
  settings.checkpoint_interval_sec =
      j.value("checkpoint_interval_sec", settings.checkpoint_interval_sec);
  if (settings.max_batch_size == 0) {
    throw std::invalid_argument("server.max_batch_size must be greater than 0");
  }
  return settings;
}

nlohmann::json ServerConfig::to_json() const {
  nlohmann::json ingest_section = ingest.to_json();
  ingest_section["admin_command"] = ingest_admin_command;
  return nlohmann::json{
      {"server", server.to_json()},
      {"generator",
       {{"arguments", generator_arguments}, {"spec_file", generator_spec_file.string()}}},
      {"partitioner", {{"cfg_dir", partitioner_cfg_dir.string()}}},
      {"pregenerated", {{"dir", pregenerated_dir.string()}, {"files", pregenerated_files}}},
      {"ingest", ingest_section},
      {"keep_csv", keep_csv}};
}

ServerConfig ServerConfig::from_json(const nlohmann::json &j,
                                     const std::filesystem::path &base_dir) {
  ServerConfig config;
  config.server = ServerSettings::from_json(section(j, "server"));

  nlohmann::json generator = section(j, "generator");
  config.generator_arguments = generator.value("arguments", std::string());
  config.generator_spec_file = resolve(base_dir, generator.value("spec_file", std::string()));

  nlohmann::json partitioner = section(j, "partitioner");
  config.partitioner_cfg_dir = resolve(base_dir, partitioner.value("cfg_dir", std::string()));

  nlohmann::json pregenerated = section(j, "pregenerated");
  config.pregenerated_dir = resolve(base_dir, pregenerated.value("dir", std::string()));
  config.pregenerated_files =
      pregenerated.value("files", std::vector<std::string>());

  nlohmann::json ingest = section(j, "ingest");
  config.ingest = IngestSettings::from_json(ingest);
  config.ingest.cfg_dir = resolve(base_dir, config.ingest.cfg_dir).string();
  config.ingest_admin_command = ingest.value("admin_command", config.ingest_admin_command);
  config.keep_csv = j.value("keep_csv", false);
  return config;
}

ServerConfig ServerConfig::load_from_file(const std::filesystem::path &path) {
  std::string text = read_text_file(path);
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error &e) {
    throw std::runtime_error("Invalid configuration file " + path.string() + ": " + e.what());
  }
  try {
    return from_json(j, path.parent_path());
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error("Invalid configuration file " + path.string() + ": " + e.what());
  }
}

RunConfiguration ServerConfig::build_run_configuration() const {
  RunConfiguration run;
  run.generator_arguments = generator_arguments;
  if (!generator_spec_file.empty()) {
    run.generator_spec_name = generator_spec_file.filename().string();
    run.generator_spec = read_text_file(generator_spec_file);
  }

  if (!partitioner_cfg_dir.empty()) {
    std::error_code ec;
    std::filesystem::directory_iterator it(partitioner_cfg_dir, ec);
    if (ec) {
      throw std::runtime_error("Cannot list partitioner config directory " +
                               partitioner_cfg_dir.string() + ": " + ec.message());
    }
    std::vector<std::filesystem::path> cfg_files;
    for (const auto &entry : it) {
      if (entry.is_regular_file() && entry.path().extension() == ".cfg") {
        cfg_files.push_back(entry.path());
      }
    }
    std::sort(cfg_files.begin(), cfg_files.end());
    for (const auto &cfg : cfg_files) {
      run.partitioner_configs.push_back({cfg.filename().string(), read_text_file(cfg)});
    }
  }

  for (const auto &name : pregenerated_files) {
    std::filesystem::path file = pregenerated_dir.empty() ? std::filesystem::path(name)
                                                          : pregenerated_dir / name;
    run.pregenerated_files.push_back({file.filename().string(), read_text_file(file)});
  }

  run.ingest = ingest;
  run.keep_csv = keep_csv;
  return run;
}

WorkerConfig WorkerConfig::from_env() {
  WorkerConfig config;
  config.server_host = Env::get<std::string>("DGEN_SERVER_HOST", config.server_host);
  config.server_port = static_cast<uint16_t>(Env::get<int>("DGEN_SERVER_PORT", config.server_port));
  config.chunks_per_request =
      Env::get<uint32_t>("DGEN_CHUNKS_PER_REQUEST", config.chunks_per_request);
  config.parallelism = Env::get<size_t>("DGEN_PARALLELISM", config.parallelism);
  config.max_consecutive_failures =
      Env::get<uint32_t>("DGEN_MAX_FAILURES", config.max_consecutive_failures);
  config.retry = Env::get<bool>("DGEN_RETRY", config.retry);
  config.retry_interval_sec = Env::get<uint32_t>("DGEN_RETRY_INTERVAL", config.retry_interval_sec);
  config.work_dir = Env::get<std::string>("DGEN_WORK_DIR", config.work_dir.string());
  config.generator_command =
      Env::get<std::string>("DGEN_GENERATOR_COMMAND", config.generator_command);
  config.partitioner_command =
      Env::get<std::string>("DGEN_PARTITIONER_COMMAND", config.partitioner_command);
  config.ingest_command = Env::get<std::string>("DGEN_INGEST_COMMAND", config.ingest_command);
  return config;
}

} // namespace dgen
