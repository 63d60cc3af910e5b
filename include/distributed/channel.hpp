/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "message.hpp"

#include <asio.hpp>
#include <cstdint>
#include <string>

namespace dgen {

/**
 * @brief Blocking client side of a coordinator connection.
 *
 * Network failures surface as std::system_error, malformed input as ProtocolError.
 */
class Channel {
public:
  Channel();
  ~Channel();

  Channel(const Channel &) = delete;
  Channel &operator=(const Channel &) = delete;

  void connect(const std::string &host, uint16_t port);

  bool is_open() const { return socket_.is_open(); }

  void send(const Message &message);

  Message receive();

  void close();

private:
  asio::io_context io_context_;
  asio::ip::tcp::socket socket_;
};

} // namespace dgen
