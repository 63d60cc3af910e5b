/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "chunk/recovery_log.hpp"

#include "common/errors.hpp"

#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace dgen {

ChunkSet RecoverySnapshot::problem_chunks() const {
  ChunkSet problems = set_difference(assigned, completed);
  problems.insert(limbo.begin(), limbo.end());
  return problems;
}

ChunkSet RecoverySnapshot::not_started() const {
  return set_difference(set_difference(target, completed), problem_chunks());
}

std::string RecoverySnapshot::report() const {
  ChunkSet problems = problem_chunks();
  std::string out = fmt::format("Problem chunk ids: {}\n", summarize_chunks(problems));
  out += "Log counts:\n";
  out += fmt::format("  Target:      {}\n", target.size());
  out += fmt::format("  Assigned:    {}\n", assigned.size());
  out += fmt::format("  Completed:   {}\n", completed.size());
  out += fmt::format("  Limbo:       {}\n", limbo.size());
  out += fmt::format("  Problem:     {}\n", problems.size());
  out += fmt::format("  Not started: {}", not_started().size());
  return out;
}

RecoveryLogStore::RecoveryLogStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path RecoveryLogStore::path_for(ChunkState state) const {
  switch (state) {
  case ChunkState::TARGET:
    return directory_ / TARGET_FILE;
  case ChunkState::ASSIGNED:
    return directory_ / ASSIGNED_FILE;
  case ChunkState::COMPLETED:
    return directory_ / COMPLETED_FILE;
  case ChunkState::LIMBO:
    return directory_ / LIMBO_FILE;
  }
  throw std::invalid_argument("Unknown chunk state");
}

RecoverySnapshot RecoveryLogStore::load(bool require_target) const {
  RecoverySnapshot snapshot;
  snapshot.target = read_set(path_for(ChunkState::TARGET), require_target);
  snapshot.assigned = read_set(path_for(ChunkState::ASSIGNED), false);
  snapshot.completed = read_set(path_for(ChunkState::COMPLETED), false);
  snapshot.limbo = read_set(path_for(ChunkState::LIMBO), false);
  return snapshot;
}

void RecoveryLogStore::save(const RecoverySnapshot &snapshot) const {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    throw PersistenceError(
        fmt::format("Cannot create log directory {}: {}", directory_.string(), ec.message()));
  }
  write_set(path_for(ChunkState::TARGET), snapshot.target);
  write_set(path_for(ChunkState::ASSIGNED), snapshot.assigned);
  write_set(path_for(ChunkState::COMPLETED), snapshot.completed);
  write_set(path_for(ChunkState::LIMBO), snapshot.limbo);
}

ChunkSet RecoveryLogStore::read_set(const std::filesystem::path &path, bool required) const {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (required) {
      throw PersistenceError("Required chunk log not found: " + path.string());
    }
    return {};
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    throw PersistenceError("Cannot open chunk log: " + path.string());
  }

  ChunkSet chunks;
  std::string line;
  size_t line_number = 0;
  while (std::getline(file, line)) {
    ++line_number;
    try {
      ChunkSet parsed = parse_chunk_list(line, '\n');
      chunks.insert(parsed.begin(), parsed.end());
    } catch (const std::invalid_argument &e) {
      throw PersistenceError(
          fmt::format("{}:{}: {}", path.string(), line_number, std::string(e.what())));
    }
  }
  if (file.bad()) {
    throw PersistenceError("Error reading chunk log: " + path.string());
  }
  return chunks;
}

void RecoveryLogStore::write_set(const std::filesystem::path &path, const ChunkSet &chunks) const {
  std::filesystem::path tmp_path = path;
  tmp_path += ".tmp";
  {
    std::ofstream file(tmp_path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
      throw PersistenceError("Cannot open chunk log for writing: " + tmp_path.string());
    }
    file << format_chunk_list(chunks, '\n');
    file.flush();
    if (!file.good()) {
      throw PersistenceError("Error writing chunk log: " + tmp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    throw PersistenceError(fmt::format("Cannot move {} into place: {}", tmp_path.string(),
                                       ec.message()));
  }
}

ChunkSet resolve_requested_range(const std::optional<std::string> &raw,
                                 const std::optional<ChunkSet> &target_log) {
  if (!raw && !target_log) {
    throw std::invalid_argument("No chunk range given: provide a raw chunk list or a target log");
  }
  if (!raw) {
    return *target_log;
  }
  ChunkSet requested = parse_chunk_list(*raw, ',');
  if (target_log) {
    return set_intersection(requested, *target_log);
  }
  return requested;
}

} // namespace dgen
