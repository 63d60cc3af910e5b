/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "chunk/chunk_registry.hpp"

#include "common/errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace dgen {

ChunkRegistry::ChunkRegistry(const ChunkSet &requested_range, const ChunkSet &prior_completed,
                             std::shared_ptr<Logger> transition_logger)
    : range_(requested_range), logger_(std::move(transition_logger)) {
  if (!logger_) {
    logger_ = std::make_shared<Logger>("chunks");
  }
  completed_ = set_intersection(range_, prior_completed);
  target_ = set_difference(range_, completed_);
}

std::vector<ChunkId> ChunkRegistry::take(size_t n) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ChunkId> taken;
  taken.reserve(std::min(n, target_.size()));
  auto it = target_.begin();
  while (it != target_.end() && taken.size() < n) {
    ChunkId id = *it;
    it = target_.erase(it);
    assigned_.insert(id);
    taken.push_back(id);
    log_transition(id, ChunkState::TARGET, ChunkState::ASSIGNED);
  }
  return taken;
}

void ChunkRegistry::report(ChunkId id, ChunkOutcome outcome) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = assigned_.find(id);
  if (it == assigned_.end()) {
    throw UnknownChunkError("Report for chunk " + std::to_string(id) +
                            " which is not currently assigned");
  }
  assigned_.erase(it);
  if (outcome == ChunkOutcome::SUCCEEDED) {
    completed_.insert(id);
    log_transition(id, ChunkState::ASSIGNED, ChunkState::COMPLETED);
  } else {
    limbo_.insert(id);
    log_transition(id, ChunkState::ASSIGNED, ChunkState::LIMBO);
  }
}

void ChunkRegistry::abandon(const std::vector<ChunkId> &ids) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (ChunkId id : ids) {
    if (assigned_.erase(id) > 0) {
      limbo_.insert(id);
      log_transition(id, ChunkState::ASSIGNED, ChunkState::LIMBO);
    }
  }
}

std::vector<ChunkId> ChunkRegistry::requeue(const std::vector<ChunkId> &ids) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ChunkId> moved;
  for (ChunkId id : ids) {
    if (limbo_.erase(id) > 0) {
      target_.insert(id);
      moved.push_back(id);
      log_transition(id, ChunkState::LIMBO, ChunkState::TARGET);
    }
  }
  return moved;
}

bool ChunkRegistry::is_exhausted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return target_.empty() && assigned_.empty();
}

size_t ChunkRegistry::count(ChunkState state) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return set_for(state).size();
}

ChunkSet ChunkRegistry::ids(ChunkState state) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return set_for(state);
}

std::optional<ChunkState> ChunkRegistry::state_of(ChunkId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (target_.count(id))
    return ChunkState::TARGET;
  if (assigned_.count(id))
    return ChunkState::ASSIGNED;
  if (completed_.count(id))
    return ChunkState::COMPLETED;
  if (limbo_.count(id))
    return ChunkState::LIMBO;
  return std::nullopt;
}

RecoverySnapshot ChunkRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  RecoverySnapshot snap;
  snap.target = target_;
  snap.assigned = assigned_;
  snap.completed = completed_;
  snap.limbo = limbo_;
  return snap;
}

const ChunkSet &ChunkRegistry::set_for(ChunkState state) const {
  switch (state) {
  case ChunkState::TARGET:
    return target_;
  case ChunkState::ASSIGNED:
    return assigned_;
  case ChunkState::COMPLETED:
    return completed_;
  case ChunkState::LIMBO:
    return limbo_;
  }
  throw std::invalid_argument("Unknown chunk state");
}

void ChunkRegistry::log_transition(ChunkId id, ChunkState from, ChunkState to) {
  logger_->debug("{} {} -> {}", id, to_string(from), to_string(to));
}

} // namespace dgen
