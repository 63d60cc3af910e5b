/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "chunk/chunk_registry.hpp"
#include "common/config.hpp"
#include "connection.hpp"
#include "message.hpp"
#include "timing_summary.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dgen {

enum class SessionState { CONNECTING, CONFIGURING, WORKING, CLOSING };

std::string to_string(SessionState state);

struct SessionOptions {
  uint32_t max_batch_size = 100;
  std::chrono::seconds timeout{3600}; // zero disables the inactivity timeout
};

/**
 * @brief Drives the protocol for one connected worker.
 *
 * CONNECTING accepts only HELLO and answers with CONFIG. The first REQUEST_BATCH acknowledges the
 * configuration and moves the session to WORKING, where batches are leased from the registry and
 * reports resolve them. Whatever the reason a session closes, chunks it still holds are abandoned
 * to Limbo before the close handler runs. All handlers run on the connection strand.
 */
class Session : public std::enable_shared_from_this<Session> {
public:
  using CloseHandler = std::function<void(const std::shared_ptr<Session> &)>;

  Session(asio::ip::tcp::socket socket, std::string name, ChunkRegistry &registry,
          TimingSummary &timings, std::shared_ptr<const RunConfiguration> run_config,
          SessionOptions options, CloseHandler on_closed);

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  void start();

  // Thread safe. Sends BYE, abandons the leases and closes the connection.
  void shutdown(const std::string &reason);

  const std::string &name() const { return name_; }

  SessionState state() const { return state_.load(std::memory_order_acquire); }

  std::vector<ChunkId> leased() const;

private:
  std::shared_ptr<Connection> connection_;
  asio::steady_timer timer_;
  std::string name_;
  ChunkRegistry &registry_;
  TimingSummary &timings_;
  std::shared_ptr<const RunConfiguration> run_config_;
  SessionOptions options_;
  CloseHandler on_closed_;

  std::atomic<SessionState> state_{SessionState::CONNECTING};
  bool close_after_write_ = false;

  mutable std::mutex leased_mutex_;
  ChunkSet leased_;

  void read_header();
  void read_body(const PacketHeader &header);
  void process_message(const Message &message);

  void handle_hello(const Message &message);
  void handle_request_batch(const Message &message);
  void apply_report(const ChunkReport &report);

  void send(Message &&message);
  void start_async_write();

  void arm_timer();
  void on_timeout();

  void close(const std::string &reason, bool send_bye);
  void close_socket();
};

} // namespace dgen
