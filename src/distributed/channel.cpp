/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "distributed/channel.hpp"

#include "distributed/binary_serializer.hpp"
#include "logging/logger.hpp"

namespace dgen {

Channel::Channel() : io_context_(), socket_(io_context_) {}

Channel::~Channel() { close(); }

void Channel::connect(const std::string &host, uint16_t port) {
  close();
  asio::ip::tcp::resolver resolver(io_context_);
  auto endpoints = resolver.resolve(host, std::to_string(port));
  asio::connect(socket_, endpoints);

  std::error_code ec;
  socket_.set_option(asio::ip::tcp::no_delay(true), ec);
  if (ec) {
    GlobalLogger::debug("Failed to set TCP_NODELAY: {}", ec.message());
  }
}

void Channel::send(const Message &message) {
  TBuffer framed = BinarySerializer::encode(message);
  asio::write(socket_, asio::buffer(framed.get(), framed.size()));
}

Message Channel::receive() {
  TBuffer header_buffer;
  header_buffer.resize(PacketHeader::size());
  asio::read(socket_, asio::buffer(header_buffer.get(), header_buffer.size()));
  PacketHeader header = BinarySerializer::decode_header(header_buffer);

  TBuffer body;
  body.resize(header.length);
  body.set_endianess(header.endianess);
  asio::read(socket_, asio::buffer(body.get(), body.size()));
  return BinarySerializer::decode(body);
}

void Channel::close() {
  if (!socket_.is_open()) {
    return;
  }
  std::error_code ec;
  socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  socket_.close(ec);
}

} // namespace dgen
