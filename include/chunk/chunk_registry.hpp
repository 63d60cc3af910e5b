/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "chunk/chunk_set.hpp"
#include "chunk/recovery_log.hpp"
#include "logging/logger.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace dgen {

/**
 * @brief Authoritative lifecycle state of every chunk in a run.
 *
 * Each id of the requested range is in exactly one of Target, Assigned, Completed or Limbo.
 * Legal moves are Target->Assigned (take), Assigned->Completed/Limbo (report, abandon) and
 * Limbo->Target (requeue). All operations are serialized by one mutex, so the registry can be
 * shared by every session of a coordinator.
 */
class ChunkRegistry {
public:
  /**
   * @param requested_range All chunk ids of this run.
   * @param prior_completed Ids completed by an earlier run. Those inside the range start out
   * Completed, the rest of the range starts out in Target.
   * @param transition_logger Receives one debug line per transition. A console logger named
   * "chunks" is used when null.
   */
  ChunkRegistry(const ChunkSet &requested_range, const ChunkSet &prior_completed = {},
                std::shared_ptr<Logger> transition_logger = nullptr);

  ChunkRegistry(const ChunkRegistry &) = delete;
  ChunkRegistry &operator=(const ChunkRegistry &) = delete;

  // Moves up to n ids, lowest first, from Target to Assigned.
  std::vector<ChunkId> take(size_t n);

  /**
   * @brief Resolves an assigned chunk.
   * @throws UnknownChunkError if the id is not in Assigned. Nothing changes in that case.
   */
  void report(ChunkId id, ChunkOutcome outcome);

  // Moves every listed id still in Assigned to Limbo. Other ids are ignored.
  void abandon(const std::vector<ChunkId> &ids);

  // Moves every listed id currently in Limbo back to Target and returns the ones moved.
  std::vector<ChunkId> requeue(const std::vector<ChunkId> &ids);

  bool is_exhausted() const;

  size_t count(ChunkState state) const;
  ChunkSet ids(ChunkState state) const;
  std::optional<ChunkState> state_of(ChunkId id) const;

  const ChunkSet &range() const { return range_; }

  RecoverySnapshot snapshot() const;

private:
  mutable std::mutex mutex_;
  const ChunkSet range_;
  ChunkSet target_;
  ChunkSet assigned_;
  ChunkSet completed_;
  ChunkSet limbo_;
  std::shared_ptr<Logger> logger_;

  const ChunkSet &set_for(ChunkState state) const;
  void log_transition(ChunkId id, ChunkState from, ChunkState to);
};

} // namespace dgen
