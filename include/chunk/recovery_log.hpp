/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "chunk/chunk_set.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace dgen {

/**
 * @brief Membership of the four chunk sets as recorded on disk.
 */
struct RecoverySnapshot {
  ChunkSet target;
  ChunkSet assigned;
  ChunkSet completed;
  ChunkSet limbo;

  /**
   * @brief Chunks an operator should check by hand before generating them again:
   * assigned but never completed, plus everything in limbo.
   */
  ChunkSet problem_chunks() const;

  // Target chunks that were neither completed nor ran into problems.
  ChunkSet not_started() const;

  std::string report() const;

  bool operator==(const RecoverySnapshot &other) const = default;
};

/**
 * @brief Reads and writes the four chunk log files of a run directory.
 *
 * Files hold one chunk id per line. Reading also accepts inclusive "a:b" ranges so the files can
 * be edited by hand. Saving always rewrites all four files, each through a temporary file that is
 * renamed into place, so the directory never holds a partially written set.
 */
class RecoveryLogStore {
public:
  static constexpr const char *TARGET_FILE = "target.clg";
  static constexpr const char *ASSIGNED_FILE = "assigned.clg";
  static constexpr const char *COMPLETED_FILE = "completed.clg";
  static constexpr const char *LIMBO_FILE = "limbo.clg";

  explicit RecoveryLogStore(std::filesystem::path directory);

  const std::filesystem::path &directory() const { return directory_; }

  std::filesystem::path path_for(ChunkState state) const;

  /**
   * @brief Loads all four sets. Missing assigned/completed/limbo files read as empty sets.
   * @param require_target When true a missing target file is an error.
   * @throws PersistenceError when a required file is missing or a file cannot be parsed.
   */
  RecoverySnapshot load(bool require_target = true) const;

  /**
   * @brief Overwrites the four files with the given snapshot.
   * @throws PersistenceError on any I/O failure.
   */
  void save(const RecoverySnapshot &snapshot) const;

private:
  std::filesystem::path directory_;

  ChunkSet read_set(const std::filesystem::path &path, bool required) const;
  void write_set(const std::filesystem::path &path, const ChunkSet &chunks) const;
};

/**
 * @brief Resolves the chunk ids a run was asked to generate.
 *
 * `raw` is the comma separated command line form ("0:1000,4321"). When both a raw list and a
 * target log are given the range is their intersection.
 * @throws std::invalid_argument when neither is given or the raw list cannot be parsed.
 */
ChunkSet resolve_requested_range(const std::optional<std::string> &raw,
                                 const std::optional<ChunkSet> &target_log);

} // namespace dgen
