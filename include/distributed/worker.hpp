/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "channel.hpp"
#include "collaborators/generator.hpp"
#include "collaborators/ingest.hpp"
#include "collaborators/partitioner.hpp"
#include "common/config.hpp"
#include "message.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace dgen {

struct WorkerStats {
  size_t batches = 0;
  size_t succeeded = 0;
  size_t failed = 0;
  bool gave_up = false;
  bool closed_by_server = false;
};

/**
 * @brief Pulls batches of chunk ids from the coordinator and runs them through
 * generate -> partition -> ingest, reporting every outcome.
 */
class Worker {
public:
  Worker(WorkerConfig config, std::shared_ptr<Generator> generator,
         std::shared_ptr<Partitioner> partitioner, std::shared_ptr<IngestClient> ingest);

  /**
   * @brief Connects, receives the configuration and works until the coordinator has nothing
   * left, the coordinator says BYE, or too many chunks fail in a row.
   * @throws std::system_error on connection failures, ProtocolError on unexpected messages.
   */
  void run();

  /**
   * @brief Runs the collaborator pipeline for one chunk. Never throws; failures become FAILED
   * reports carrying the error text.
   */
  ChunkReport process_chunk(ChunkId id);

  const std::string &name() const { return name_; }

  const WorkerStats &stats() const { return stats_; }

  const RunConfiguration &run_configuration() const { return run_config_; }

  // Applies a configuration without a coordinator. Used by run() after CONFIG arrives.
  void configure(const RunConfiguration &run_config);

private:
  WorkerConfig config_;
  std::shared_ptr<Generator> generator_;
  std::shared_ptr<Partitioner> partitioner_;
  std::shared_ptr<IngestClient> ingest_;

  Channel channel_;
  std::string name_ = "worker";
  RunConfiguration run_config_;
  GeneratorSpec generator_spec_;
  PartitionerConfig partitioner_config_;

  WorkerStats stats_;
  uint32_t consecutive_failures_ = 0;

  void connect();
  void handshake();
  void work_loop();
  bool process_batch(const std::vector<ChunkId> &ids);
  void give_up(std::vector<ChunkReport> final_reports);
  void say_goodbye();
};

} // namespace dgen
