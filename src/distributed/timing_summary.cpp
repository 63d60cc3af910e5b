/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "distributed/timing_summary.hpp"

#include <fmt/format.h>

namespace dgen {

namespace {
std::string stage(const char *name, uint64_t total_us, uint64_t count) {
  double total_sec = static_cast<double>(total_us) / 1e6;
  double avg_sec = count > 0 ? total_sec / static_cast<double>(count) : 0.0;
  return fmt::format("{} {:.3f}s (avg {:.3f}s)", name, total_sec, avg_sec);
}
} // namespace

void TimingSummary::add(const ChunkTiming &timing) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++count_;
  total_.generate_us += timing.generate_us;
  total_.partition_us += timing.partition_us;
  total_.ingest_us += timing.ingest_us;
}

uint64_t TimingSummary::count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return count_;
}

ChunkTiming TimingSummary::total() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_;
}

std::string TimingSummary::report() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fmt::format("Timing over {} chunks: {}, {}, {}", count_,
                     stage("generate", total_.generate_us, count_),
                     stage("partition", total_.partition_us, count_),
                     stage("ingest", total_.ingest_us, count_));
}

} // namespace dgen
