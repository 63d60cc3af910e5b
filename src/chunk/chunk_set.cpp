/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "chunk/chunk_set.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace dgen {

namespace {
std::string trim(const std::string &str) {
  size_t begin = 0;
  while (begin < str.size() && std::isspace(static_cast<unsigned char>(str[begin]))) {
    ++begin;
  }
  size_t end = str.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
    --end;
  }
  return str.substr(begin, end - begin);
}

ChunkId parse_id(const std::string &token) {
  std::string value = trim(token);
  if (value.empty()) {
    throw std::invalid_argument("Empty chunk id");
  }
  size_t pos = 0;
  long long id = 0;
  try {
    id = std::stoll(value, &pos);
  } catch (const std::exception &) {
    throw std::invalid_argument("Invalid chunk id '" + value + "'");
  }
  if (pos != value.size() || id < 0) {
    throw std::invalid_argument("Invalid chunk id '" + value + "'");
  }
  return static_cast<ChunkId>(id);
}
} // namespace

std::string to_string(ChunkState state) {
  switch (state) {
  case ChunkState::TARGET:
    return "target";
  case ChunkState::ASSIGNED:
    return "assigned";
  case ChunkState::COMPLETED:
    return "completed";
  case ChunkState::LIMBO:
    return "limbo";
  }
  return "unknown";
}

std::string to_string(ChunkOutcome outcome) {
  return outcome == ChunkOutcome::SUCCEEDED ? "succeeded" : "failed";
}

ChunkSet parse_chunk_list(const std::string &raw, char separator) {
  ChunkSet chunks;
  std::istringstream stream(raw);
  std::string element;
  while (std::getline(stream, element, separator)) {
    std::string value = trim(element);
    if (value.empty()) {
      continue;
    }
    size_t colon = value.find(':');
    if (colon == std::string::npos) {
      chunks.insert(parse_id(value));
      continue;
    }
    if (value.find(':', colon + 1) != std::string::npos) {
      throw std::invalid_argument("Invalid chunk range '" + value + "'");
    }
    ChunkId first = parse_id(value.substr(0, colon));
    ChunkId last = parse_id(value.substr(colon + 1));
    if (first > last) {
      std::swap(first, last);
    }
    if (last - first >= MAX_RANGE_SPAN) {
      throw std::invalid_argument("Chunk range '" + value + "' spans more than " +
                                  std::to_string(MAX_RANGE_SPAN) + " ids");
    }
    for (ChunkId id = first; id < last; ++id) {
      chunks.insert(chunks.end(), id);
    }
    chunks.insert(chunks.end(), last);
  }
  return chunks;
}

std::string format_chunk_list(const ChunkSet &chunks, char separator) {
  std::string out;
  bool first = true;
  for (ChunkId id : chunks) {
    if (!first) {
      out += separator;
    }
    out += std::to_string(id);
    first = false;
  }
  return out;
}

std::string summarize_chunks(const ChunkSet &chunks, size_t max_shown) {
  std::string out = "{";
  size_t shown = 0;
  for (ChunkId id : chunks) {
    if (shown == max_shown) {
      out += ",...";
      break;
    }
    if (shown > 0) {
      out += ",";
    }
    out += std::to_string(id);
    ++shown;
  }
  out += "} (" + std::to_string(chunks.size()) + ")";
  return out;
}

ChunkSet to_chunk_set(const std::vector<ChunkId> &ids) { return ChunkSet(ids.begin(), ids.end()); }

ChunkSet set_difference(const ChunkSet &a, const ChunkSet &b) {
  ChunkSet result;
  std::set_difference(a.begin(), a.end(), b.begin(), b.end(),
                      std::inserter(result, result.end()));
  return result;
}

ChunkSet set_intersection(const ChunkSet &a, const ChunkSet &b) {
  ChunkSet result;
  std::set_intersection(a.begin(), a.end(), b.begin(), b.end(),
                        std::inserter(result, result.end()));
  return result;
}

} // namespace dgen
