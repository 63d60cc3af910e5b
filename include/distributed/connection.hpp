/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "packet.hpp"
#include "tbuffer.hpp"

#include <asio.hpp>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace dgen {

// A framed message waiting to be written. Shared so the bytes outlive the async write.
using WriteOperation = std::shared_ptr<TBuffer>;

/**
 * @brief Socket of one accepted peer together with the strand that serializes its handlers.
 */
struct Connection {
  asio::ip::tcp::socket socket;
  asio::strand<asio::any_io_executor> strand;

  std::deque<WriteOperation> write_queue;

  TBuffer header_buffer;
  TBuffer body_buffer;

  explicit Connection(asio::ip::tcp::socket sock)
      : socket(std::move(sock)), strand(asio::make_strand(socket.get_executor())) {}
  ~Connection() = default;

  void set_peer_id(const std::string &new_id) {
    std::lock_guard<std::mutex> lock(id_mutex);
    peer_id = new_id;
  }

  std::string get_peer_id() const {
    std::lock_guard<std::mutex> lock(id_mutex);
    return peer_id;
  }

private:
  std::string peer_id;
  mutable std::mutex id_mutex;
};

} // namespace dgen
