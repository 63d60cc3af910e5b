/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "collaborators/ingest.hpp"

#include "common/errors.hpp"
#include "logging/logger.hpp"

#include <algorithm>

namespace dgen {

namespace {
bool is_template(const std::string &name) {
  const std::string suffix = "_template.json";
  return name.size() >= suffix.size() &&
         name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}
} // namespace

void register_ingest_schema(IngestAdmin &admin, const IngestSettings &settings) {
  if (settings.skip) {
    GlobalLogger::info("Ingest skipped, not contacting {}:{}", settings.host, settings.port);
    return;
  }
  if (!admin.is_alive()) {
    throw IngestError("Failed to contact ingest at " + settings.host + ":" +
                      std::to_string(settings.port));
  }
  if (settings.skip_schema) {
    GlobalLogger::info("Skipping database and schema registration");
    return;
  }
  if (settings.cfg_dir.empty()) {
    throw IngestError("ingest.cfg_dir is required to register the database schema");
  }

  const std::filesystem::path cfg_dir(settings.cfg_dir);
  const std::string db_file_name = settings.db_name + ".json";
  const std::filesystem::path db_file = cfg_dir / db_file_name;
  if (!std::filesystem::is_regular_file(db_file)) {
    throw IngestError("Database description not found: " + db_file.string());
  }

  std::vector<std::filesystem::path> tables;
  std::error_code ec;
  for (const auto &entry : std::filesystem::directory_iterator(cfg_dir, ec)) {
    std::string name = entry.path().filename().string();
    if (entry.is_regular_file() && entry.path().extension() == ".json" && name != db_file_name &&
        !is_template(name)) {
      tables.push_back(entry.path());
    }
  }
  if (ec) {
    throw IngestError("Cannot list " + cfg_dir.string() + ": " + ec.message());
  }
  std::sort(tables.begin(), tables.end());

  GlobalLogger::info("Registering database {} from {}", settings.db_name, db_file.string());
  admin.register_database(db_file);
  for (const auto &table : tables) {
    GlobalLogger::info("Registering table schema {}", table.string());
    admin.register_table(table);
  }
}

bool publish_if_complete(IngestAdmin &admin, const IngestSettings &settings,
                         const RecoverySnapshot &snapshot) {
  if (settings.skip) {
    GlobalLogger::info("Ingest skipped, not publishing {}", settings.db_name);
    return false;
  }
  if (snapshot.completed.empty() || !snapshot.target.empty() || !snapshot.assigned.empty() ||
      !snapshot.limbo.empty()) {
    GlobalLogger::warn("Not publishing {}: {} chunks not completed", settings.db_name,
                       snapshot.target.size() + snapshot.assigned.size() + snapshot.limbo.size());
    return false;
  }
  admin.publish_database(settings.db_name);
  GlobalLogger::info("Published {}", settings.db_name);
  return true;
}

} // namespace dgen
