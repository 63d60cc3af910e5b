/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "generator.hpp"

#include <filesystem>
#include <vector>

namespace dgen {

struct PartitionerConfig {
  std::vector<std::filesystem::path> cfg_files; // one per table, named <table>.cfg
};

struct PartitionedChunk {
  ChunkId id = 0;
  std::filesystem::path directory;
  std::vector<std::filesystem::path> files;
};

/**
 * @brief Splits generated files into the chunk and overlap files the database ingests.
 */
class Partitioner {
public:
  virtual ~Partitioner() = default;

  /**
   * @throws PartitionError
   */
  virtual PartitionedChunk partition(const GeneratedChunk &generated,
                                     const PartitionerConfig &config) = 0;
};

} // namespace dgen
