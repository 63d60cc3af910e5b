/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "message.hpp"

#include <cstdint>
#include <mutex>
#include <string>

namespace dgen {

/**
 * @brief Accumulates the per stage timings workers send with their reports.
 *
 * Every report counts, failed ones included, since the time was spent either way. Thread safe.
 */
class TimingSummary {
public:
  TimingSummary() = default;

  TimingSummary(const TimingSummary &) = delete;
  TimingSummary &operator=(const TimingSummary &) = delete;

  void add(const ChunkTiming &timing);

  uint64_t count() const;

  ChunkTiming total() const;

  // e.g. "Timing over 4 chunks: generate 12.000s (avg 3.000s), partition ..."
  std::string report() const;

private:
  mutable std::mutex mutex_;
  uint64_t count_ = 0;
  ChunkTiming total_;
};

} // namespace dgen
