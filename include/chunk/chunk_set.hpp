/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace dgen {

using ChunkId = int64_t;

// Ordered so that take() hands out ascending ids and saved logs are stable.
using ChunkSet = std::set<ChunkId>;

enum class ChunkState { TARGET, ASSIGNED, COMPLETED, LIMBO };

enum class ChunkOutcome : uint8_t { SUCCEEDED = 0, FAILED = 1 };

std::string to_string(ChunkState state);
std::string to_string(ChunkOutcome outcome);

// Largest number of ids a single "a:b" range may expand to.
constexpr ChunkId MAX_RANGE_SPAN = 10000000;

/**
 * @brief Parses a list of chunk ids separated by `separator`.
 *
 * Each element is either a single id or an inclusive range "a:b" (bounds may be given in
 * either order) of at most MAX_RANGE_SPAN ids. Empty and whitespace-only elements are skipped.
 * @throws std::invalid_argument on anything else.
 */
ChunkSet parse_chunk_list(const std::string &raw, char separator = '\n');

/**
 * @brief Joins ids in ascending order with `separator`, without a trailing separator.
 */
std::string format_chunk_list(const ChunkSet &chunks, char separator = '\n');

// Short human readable form for logs, e.g. "{0,1,2,...,9} (10)".
std::string summarize_chunks(const ChunkSet &chunks, size_t max_shown = 20);

ChunkSet to_chunk_set(const std::vector<ChunkId> &ids);

ChunkSet set_difference(const ChunkSet &a, const ChunkSet &b);
ChunkSet set_intersection(const ChunkSet &a, const ChunkSet &b);

} // namespace dgen
