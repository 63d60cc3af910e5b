/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "chunk/chunk_registry.hpp"
#include "chunk/recovery_log.hpp"
#include "collaborators/ingest.hpp"
#include "common/config.hpp"
#include "logging/logger.hpp"
#include "session.hpp"
#include "timing_summary.hpp"

#include <asio.hpp>
#include <atomic>
#include <exception>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace dgen {

/**
 * @brief Hands out chunks of one run to any number of workers and keeps the recovery logs.
 *
 * One Session per accepted connection, all sharing the registry. The run finishes by itself
 * once no session is open and every chunk is resolved, or when stop() is called. Shutdown stops
 * accepting, force-closes the open sessions so their leases go to Limbo, writes the final
 * snapshot and logs the summary.
 */
class Coordinator {
public:
  /**
   * @param settings Listening address, io threads, batch cap, timeouts.
   * @param requested_range Chunk ids of this run.
   * @param prior Recovery logs of an earlier run. Its completed ids are not generated again,
   * its assigned and limbo ids are only reported.
   * @param run_config Payload sent to every worker.
   * @param log_dir Where snapshots are written. No snapshot is written when unset.
   * @param transition_logger Receives the registry transitions.
   * @param ingest_admin Registers the database before the run and publishes it once every chunk
   * completed. Ingest is left alone when unset.
   */
  Coordinator(ServerSettings settings, const ChunkSet &requested_range,
              const RecoverySnapshot &prior, std::shared_ptr<const RunConfiguration> run_config,
              std::optional<std::filesystem::path> log_dir = std::nullopt,
              std::shared_ptr<Logger> transition_logger = nullptr,
              std::shared_ptr<IngestAdmin> ingest_admin = nullptr);

  ~Coordinator();

  Coordinator(const Coordinator &) = delete;
  Coordinator &operator=(const Coordinator &) = delete;

  /**
   * @brief Registers the ingest schema, binds, starts accepting and starts the io threads.
   * Returns immediately.
   * @throws IngestError if ingest is unreachable or rejects the schema.
   * @throws std::system_error if the address cannot be bound.
   */
  void start();

  // Requests shutdown. Thread safe and idempotent.
  void stop();

  /**
   * @brief Blocks until the run has shut down.
   * @throws PersistenceError if a snapshot could not be written.
   */
  void wait();

  void run() {
    start();
    wait();
  }

  // Port actually bound, useful when the settings asked for port 0.
  uint16_t port() const { return port_.load(std::memory_order_acquire); }

  ChunkRegistry &registry() { return registry_; }

  size_t session_count() const;

  const TimingSummary &timings() const { return timings_; }

  // True once the database was published at the end of the run.
  bool published() const { return published_.load(std::memory_order_acquire); }

  // Moves Limbo chunks back to Target so they are handed out again.
  std::vector<ChunkId> requeue(const std::vector<ChunkId> &ids);

  // Registry state plus the ids of earlier runs that lie outside this run's range. Their
  // completed, assigned and limbo records are kept as they were.
  RecoverySnapshot snapshot() const;

  /**
   * @throws PersistenceError
   */
  void persist();

  std::string summary() const;

private:
  ServerSettings settings_;
  ChunkRegistry registry_;
  ChunkSet carried_completed_;
  ChunkSet carried_assigned_;
  ChunkSet carried_limbo_;
  std::shared_ptr<const RunConfiguration> run_config_;
  std::optional<RecoveryLogStore> store_;
  std::shared_ptr<IngestAdmin> ingest_admin_;
  TimingSummary timings_;

  asio::io_context io_context_;
  asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
  // serializes the acceptor, the checkpoint timer and shutdown
  asio::strand<asio::io_context::executor_type> strand_;
  asio::ip::tcp::acceptor acceptor_;
  asio::steady_timer checkpoint_timer_;
  std::vector<std::thread> io_threads_;

  std::atomic<uint16_t> port_{0};
  std::atomic<bool> started_{false};
  std::atomic<bool> shutting_down_{false};
  std::atomic<bool> finalized_{false};
  std::atomic<bool> published_{false};

  mutable std::mutex sessions_mutex_;
  std::unordered_map<Session *, std::shared_ptr<Session>> sessions_;
  uint64_t next_client_id_ = 1;

  std::mutex persist_mutex_;
  std::mutex error_mutex_;
  std::exception_ptr persistence_error_;

  void accept_connections();
  void on_session_closed(const std::shared_ptr<Session> &session);
  void begin_shutdown(const std::string &reason);
  void finalize();
  void publish();
  void arm_checkpoint();
  void record_persistence_error(std::exception_ptr error);
};

} // namespace dgen
