/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "chunk/chunk_set.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace dgen {

struct GeneratorSpec {
  std::string arguments;              // extra command line arguments from the run configuration
  std::filesystem::path spec_file;    // materialized generator specification
  std::filesystem::path work_dir;     // chunk directories are created below it
};

struct GeneratedChunk {
  ChunkId id = 0;
  std::filesystem::path directory;
  std::vector<std::filesystem::path> files;
};

/**
 * @brief Produces the catalog files of one chunk.
 */
class Generator {
public:
  virtual ~Generator() = default;

  /**
   * @throws GenerationError
   */
  virtual GeneratedChunk generate(ChunkId id, const GeneratorSpec &spec) = 0;
};

} // namespace dgen
