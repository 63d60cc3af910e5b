/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "generator.hpp"
#include "ingest.hpp"
#include "partitioner.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace dgen {

struct CommandResult {
  int exit_code = -1;
  std::string output; // stdout and stderr combined
};

// Quotes a value for use as a single /bin/sh word.
std::string shell_quote(const std::string &value);

/**
 * @brief Runs shell command lines and captures their output.
 */
class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  /**
   * @param command Shell command line.
   * @param cwd Directory to run in, the current one when empty.
   * @throws std::runtime_error if the shell cannot be started.
   */
  virtual CommandResult run(const std::string &command,
                            const std::filesystem::path &cwd = {}) const;
};

/**
 * @brief Runs `<command> --chunk <id> <arguments> <spec file>` in `<work_dir>/chunk<id>` and
 * collects the `chunk<id>_*.csv` files it leaves there.
 */
class CommandGenerator : public Generator {
public:
  explicit CommandGenerator(std::string command,
                            std::shared_ptr<const CommandRunner> runner = nullptr);

  GeneratedChunk generate(ChunkId id, const GeneratorSpec &spec) override;

private:
  std::string command_;
  std::shared_ptr<const CommandRunner> runner_;
};

/**
 * @brief Runs the spatial partitioner once per table configuration over the generated csv files
 * of that table, writing to `<chunk dir>/out_<table>`.
 */
class CommandPartitioner : public Partitioner {
public:
  explicit CommandPartitioner(std::string command,
                              std::shared_ptr<const CommandRunner> runner = nullptr);

  PartitionedChunk partition(const GeneratedChunk &generated,
                             const PartitionerConfig &config) override;

private:
  std::string command_;
  std::shared_ptr<const CommandRunner> runner_;
};

// Runs `<command> <database> <file>` for every partitioned file.
class CommandIngest : public IngestClient {
public:
  explicit CommandIngest(std::string command,
                         std::shared_ptr<const CommandRunner> runner = nullptr);

  void publish(const std::vector<std::filesystem::path> &files,
               const IngestSettings &settings) override;

private:
  std::string command_;
  std::shared_ptr<const CommandRunner> runner_;
};

/**
 * @brief Runs `<command> alive`, `<command> database <file>`, `<command> table <file>` and
 * `<command> publish <database>` with the ingest credentials in the environment.
 */
class CommandIngestAdmin : public IngestAdmin {
public:
  CommandIngestAdmin(std::string command, IngestSettings settings,
                     std::shared_ptr<const CommandRunner> runner = nullptr);

  bool is_alive() override;
  void register_database(const std::filesystem::path &db_file) override;
  void register_table(const std::filesystem::path &schema_file) override;
  void publish_database(const std::string &db_name) override;

private:
  std::string command_;
  IngestSettings settings_;
  std::shared_ptr<const CommandRunner> runner_;

  void run_or_throw(const std::string &arguments, const std::string &what);
};

} // namespace dgen
