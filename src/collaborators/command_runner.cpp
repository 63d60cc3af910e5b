/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "collaborators/command_runner.hpp"

#include "common/errors.hpp"
#include "logging/logger.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <stdexcept>
#include <sys/wait.h>

namespace dgen {

namespace {

constexpr size_t MAX_ERROR_OUTPUT = 2000;

std::string output_tail(const std::string &output) {
  if (output.size() <= MAX_ERROR_OUTPUT) {
    return output;
  }
  return "..." + output.substr(output.size() - MAX_ERROR_OUTPUT);
}

std::shared_ptr<const CommandRunner> or_default(std::shared_ptr<const CommandRunner> runner) {
  if (runner) {
    return runner;
  }
  return std::make_shared<CommandRunner>();
}

std::string ingest_environment(const IngestSettings &settings) {
  return "DGEN_INGEST_HOST=" + shell_quote(settings.host) +
         " DGEN_INGEST_PORT=" + std::to_string(settings.port) +
         " DGEN_INGEST_USER=" + shell_quote(settings.user) +
         " DGEN_INGEST_AUTH=" + shell_quote(settings.auth_key) + " ";
}

} // namespace

std::string shell_quote(const std::string &value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

CommandResult CommandRunner::run(const std::string &command,
                                 const std::filesystem::path &cwd) const {
  std::string line = command + " 2>&1";
  if (!cwd.empty()) {
    line = "cd " + shell_quote(cwd.string()) + " && " + line;
  }
  GlobalLogger::debug("Running: {}", line);

  FILE *pipe = popen(line.c_str(), "r");
  if (pipe == nullptr) {
    throw std::runtime_error("Failed to start shell for: " + command);
  }

  CommandResult result;
  std::array<char, 4096> chunk;
  size_t read = 0;
  while ((read = std::fread(chunk.data(), 1, chunk.size(), pipe)) > 0) {
    result.output.append(chunk.data(), read);
  }

  int status = pclose(pipe);
  if (status == -1) {
    throw std::runtime_error("Failed to wait for: " + command);
  }
  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
  GlobalLogger::debug("Exit code {} from: {}\n{}", result.exit_code, command, result.output);
  return result;
}

CommandGenerator::CommandGenerator(std::string command,
                                   std::shared_ptr<const CommandRunner> runner)
    : command_(std::move(command)), runner_(or_default(std::move(runner))) {}

GeneratedChunk CommandGenerator::generate(ChunkId id, const GeneratorSpec &spec) {
  GeneratedChunk generated;
  generated.id = id;
  generated.directory = spec.work_dir / ("chunk" + std::to_string(id));

  std::error_code ec;
  std::filesystem::remove_all(generated.directory, ec);
  std::filesystem::create_directories(generated.directory, ec);
  if (ec) {
    throw GenerationError("Cannot create " + generated.directory.string() + ": " + ec.message());
  }

  std::string command = command_ + " --chunk " + std::to_string(id);
  if (!spec.arguments.empty()) {
    command += " " + spec.arguments;
  }
  command += " " + shell_quote(std::filesystem::absolute(spec.spec_file).string());

  CommandResult result;
  try {
    result = runner_->run(command, generated.directory);
  } catch (const std::runtime_error &e) {
    throw GenerationError(e.what());
  }
  if (result.exit_code != 0) {
    throw GenerationError("Generator failed for chunk " + std::to_string(id) + " with exit code " +
                          std::to_string(result.exit_code) + ": " + output_tail(result.output));
  }

  const std::string prefix = "chunk" + std::to_string(id) + "_";
  for (const auto &entry : std::filesystem::directory_iterator(generated.directory, ec)) {
    std::string name = entry.path().filename().string();
    if (entry.is_regular_file() && name.rfind(prefix, 0) == 0 &&
        entry.path().extension() == ".csv") {
      generated.files.push_back(entry.path());
    }
  }
  if (ec) {
    throw GenerationError("Cannot list " + generated.directory.string() + ": " + ec.message());
  }
  if (generated.files.empty()) {
    throw GenerationError("Generator produced no " + prefix + "*.csv files for chunk " +
                          std::to_string(id));
  }
  std::sort(generated.files.begin(), generated.files.end());
  return generated;
}

CommandPartitioner::CommandPartitioner(std::string command,
                                       std::shared_ptr<const CommandRunner> runner)
    : command_(std::move(command)), runner_(or_default(std::move(runner))) {}

PartitionedChunk CommandPartitioner::partition(const GeneratedChunk &generated,
                                               const PartitionerConfig &config) {
  PartitionedChunk partitioned;
  partitioned.id = generated.id;
  partitioned.directory = generated.directory;

  for (const auto &cfg : config.cfg_files) {
    const std::string suffix = "_" + cfg.stem().string() + ".csv";
    std::string inputs;
    for (const auto &file : generated.files) {
      std::string name = file.filename().string();
      if (name.size() >= suffix.size() &&
          name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
        inputs += " --in " + shell_quote(std::filesystem::absolute(file).string());
      }
    }
    if (inputs.empty()) {
      GlobalLogger::debug("No {} files for chunk {}", cfg.stem().string(), generated.id);
      continue;
    }

    std::filesystem::path out_dir =
        std::filesystem::absolute(generated.directory / ("out_" + cfg.stem().string()));
    std::string command = command_ + " -c " +
                          shell_quote(std::filesystem::absolute(cfg).string()) +
                          " --mr.num-workers 1 --out.dir " + shell_quote(out_dir.string()) +
                          inputs;
    CommandResult result;
    try {
      result = runner_->run(command, generated.directory);
    } catch (const std::runtime_error &e) {
      throw PartitionError(e.what());
    }
    if (result.exit_code != 0) {
      throw PartitionError("Partitioner failed for chunk " + std::to_string(generated.id) +
                           " table " + cfg.stem().string() + ": " + output_tail(result.output));
    }

    std::error_code ec;
    for (const auto &entry : std::filesystem::recursive_directory_iterator(out_dir, ec)) {
      if (entry.is_regular_file()) {
        partitioned.files.push_back(entry.path());
      }
    }
    if (ec) {
      throw PartitionError("Cannot list " + out_dir.string() + ": " + ec.message());
    }
  }

  if (partitioned.files.empty()) {
    throw PartitionError("Partitioner produced no files for chunk " +
                         std::to_string(generated.id));
  }
  std::sort(partitioned.files.begin(), partitioned.files.end());
  return partitioned;
}

CommandIngest::CommandIngest(std::string command, std::shared_ptr<const CommandRunner> runner)
    : command_(std::move(command)), runner_(or_default(std::move(runner))) {}

void CommandIngest::publish(const std::vector<std::filesystem::path> &files,
                            const IngestSettings &settings) {
  std::string environment = ingest_environment(settings);
  for (const auto &file : files) {
    std::string command =
        environment + command_ + " " + shell_quote(settings.db_name) + " " + shell_quote(file.string());
    CommandResult result;
    try {
      result = runner_->run(command);
    } catch (const std::runtime_error &e) {
      throw IngestError(e.what());
    }
    if (result.exit_code != 0) {
      throw IngestError("Ingest of " + file.string() + " failed: " + output_tail(result.output));
    }
  }
}

CommandIngestAdmin::CommandIngestAdmin(std::string command, IngestSettings settings,
                                       std::shared_ptr<const CommandRunner> runner)
    : command_(std::move(command)), settings_(std::move(settings)),
      runner_(or_default(std::move(runner))) {}

bool CommandIngestAdmin::is_alive() {
  CommandResult result;
  try {
    result = runner_->run(ingest_environment(settings_) + command_ + " alive");
  } catch (const std::runtime_error &e) {
    throw IngestError(e.what());
  }
  if (result.exit_code != 0) {
    GlobalLogger::warn("Ingest at {}:{} is not answering: {}", settings_.host, settings_.port,
                       output_tail(result.output));
  }
  return result.exit_code == 0;
}

void CommandIngestAdmin::register_database(const std::filesystem::path &db_file) {
  run_or_throw("database " + shell_quote(db_file.string()),
               "Registering database " + db_file.string());
}

void CommandIngestAdmin::register_table(const std::filesystem::path &schema_file) {
  run_or_throw("table " + shell_quote(schema_file.string()),
               "Registering table " + schema_file.string());
}

void CommandIngestAdmin::publish_database(const std::string &db_name) {
  run_or_throw("publish " + shell_quote(db_name), "Publishing " + db_name);
}

void CommandIngestAdmin::run_or_throw(const std::string &arguments, const std::string &what) {
  CommandResult result;
  try {
    result = runner_->run(ingest_environment(settings_) + command_ + " " + arguments);
  } catch (const std::runtime_error &e) {
    throw IngestError(e.what());
  }
  if (result.exit_code != 0) {
    throw IngestError(what + " failed: " + output_tail(result.output));
  }
}

} // namespace dgen
