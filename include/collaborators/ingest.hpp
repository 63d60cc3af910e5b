/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "chunk/recovery_log.hpp"
#include "common/config.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace dgen {

class IngestClient {
public:
  virtual ~IngestClient() = default;

  /**
   * @brief Publishes partitioned files into the database named by the settings.
   * @throws IngestError
   */
  virtual void publish(const std::vector<std::filesystem::path> &files,
                       const IngestSettings &settings) = 0;
};

/**
 * @brief Database level calls the coordinator makes before and after a run.
 */
class IngestAdmin {
public:
  virtual ~IngestAdmin() = default;

  virtual bool is_alive() = 0;

  // @throws IngestError
  virtual void register_database(const std::filesystem::path &db_file) = 0;

  // @throws IngestError
  virtual void register_table(const std::filesystem::path &schema_file) = 0;

  // @throws IngestError
  virtual void publish_database(const std::string &db_name) = 0;
};

/**
 * @brief Checks that ingest is reachable and registers the database and its tables.
 *
 * `<cfg_dir>/<db_name>.json` describes the database. Every other `*.json` file of cfg_dir, in
 * name order and except `*_template.json`, is a table schema. Nothing is done when ingest is
 * skipped, and only the reachability check when the schema is skipped.
 * @throws IngestError
 */
void register_ingest_schema(IngestAdmin &admin, const IngestSettings &settings);

/**
 * @brief Publishes the database once every chunk of the run completed.
 * @return true if the database was published.
 * @throws IngestError
 */
bool publish_if_complete(IngestAdmin &admin, const IngestSettings &settings,
                         const RecoverySnapshot &snapshot);

} // namespace dgen
