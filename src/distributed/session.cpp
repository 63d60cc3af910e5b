/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "distributed/session.hpp"

#include "common/errors.hpp"
#include "distributed/binary_serializer.hpp"
#include "logging/logger.hpp"

#include <algorithm>

namespace dgen {

std::string to_string(SessionState state) {
  switch (state) {
  case SessionState::CONNECTING:
    return "CONNECTING";
  case SessionState::CONFIGURING:
    return "CONFIGURING";
  case SessionState::WORKING:
    return "WORKING";
  case SessionState::CLOSING:
    return "CLOSING";
  }
  return "UNKNOWN";
}

Session::Session(asio::ip::tcp::socket socket, std::string name, ChunkRegistry &registry,
                 TimingSummary &timings, std::shared_ptr<const RunConfiguration> run_config,
                 SessionOptions options, CloseHandler on_closed)
    : connection_(std::make_shared<Connection>(std::move(socket))),
      timer_(connection_->strand), name_(std::move(name)), registry_(registry), timings_(timings),
      run_config_(std::move(run_config)), options_(options), on_closed_(std::move(on_closed)) {
  std::error_code ec;
  auto remote = connection_->socket.remote_endpoint(ec);
  if (!ec) {
    connection_->set_peer_id(remote.address().to_string() + ":" + std::to_string(remote.port()));
  } else {
    connection_->set_peer_id(name_);
  }
}

void Session::start() {
  auto self = shared_from_this();
  asio::dispatch(connection_->strand, [self]() {
    GlobalLogger::info("Session {} started for {}", self->name_,
                       self->connection_->get_peer_id());
    self->arm_timer();
    self->read_header();
  });
}

void Session::shutdown(const std::string &reason) {
  auto self = shared_from_this();
  asio::post(connection_->strand, [self, reason]() { self->close(reason, true); });
}

std::vector<ChunkId> Session::leased() const {
  std::lock_guard<std::mutex> lock(leased_mutex_);
  return std::vector<ChunkId>(leased_.begin(), leased_.end());
}

void Session::read_header() {
  if (state() == SessionState::CLOSING)
    return;

  auto self = shared_from_this();
  connection_->header_buffer.resize(PacketHeader::size());
  asio::async_read(
      connection_->socket,
      asio::buffer(connection_->header_buffer.get(), connection_->header_buffer.size()),
      asio::bind_executor(connection_->strand, [self](std::error_code ec, std::size_t) {
        if (self->state() == SessionState::CLOSING)
          return;
        if (ec) {
          self->close(ec == asio::error::eof ? "peer disconnected" : "read error: " + ec.message(),
                      false);
          return;
        }
        PacketHeader header;
        try {
          header = BinarySerializer::decode_header(self->connection_->header_buffer);
        } catch (const ProtocolError &e) {
          GlobalLogger::warn("Session {}: {}", self->name_, e.what());
          self->close(std::string("protocol error: ") + e.what(), true);
          return;
        }
        self->read_body(header);
      }));
}

void Session::read_body(const PacketHeader &header) {
  auto self = shared_from_this();
  connection_->body_buffer.resize(header.length);
  connection_->body_buffer.set_endianess(header.endianess);
  asio::async_read(
      connection_->socket,
      asio::buffer(connection_->body_buffer.get(), connection_->body_buffer.size()),
      asio::bind_executor(connection_->strand, [self](std::error_code ec, std::size_t) {
        if (self->state() == SessionState::CLOSING)
          return;
        if (ec) {
          self->close(ec == asio::error::eof ? "peer disconnected" : "read error: " + ec.message(),
                      false);
          return;
        }
        self->arm_timer();
        try {
          Message message = BinarySerializer::decode(self->connection_->body_buffer);
          self->process_message(message);
        } catch (const ProtocolError &e) {
          GlobalLogger::warn("Session {}: {}", self->name_, e.what());
          self->close(std::string("protocol error: ") + e.what(), true);
          return;
        } catch (const std::exception &e) {
          GlobalLogger::error("Session {} failed: {}", self->name_, e.what());
          self->close(std::string("internal error: ") + e.what(), true);
          return;
        }
        self->read_header();
      }));
}

void Session::process_message(const Message &message) {
  GlobalLogger::debug("Session {} received {} from {}", name_, to_string(message.command()),
                      message.sender());
  switch (message.command()) {
  case CommandType::HELLO:
    handle_hello(message);
    break;
  case CommandType::REQUEST_BATCH:
    handle_request_batch(message);
    break;
  case CommandType::REPORT:
    if (state() == SessionState::CONNECTING) {
      throw ProtocolError("REPORT before HELLO");
    }
    apply_report(message.get<ChunkReport>());
    break;
  case CommandType::GIVE_UP: {
    if (state() == SessionState::CONNECTING) {
      throw ProtocolError("GIVE_UP before HELLO");
    }
    const auto &reports = message.get<std::vector<ChunkReport>>();
    for (const auto &report : reports) {
      apply_report(report);
    }
    close("client gave up after " + std::to_string(reports.size()) + " final reports", true);
  } break;
  case CommandType::BYE:
    close("client said goodbye", false);
    break;
  default:
    throw ProtocolError("Unexpected command " + to_string(message.command()));
  }
}

void Session::handle_hello(const Message &message) {
  if (state() != SessionState::CONNECTING) {
    throw ProtocolError("Duplicate HELLO");
  }
  GlobalLogger::info("Session {}: HELLO from {}", name_, message.sender());

  RunConfiguration config = *run_config_;
  config.client_name = name_;
  send(Message(CommandType::CONFIG, COORDINATOR_ID, config.to_json().dump()));
  state_.store(SessionState::CONFIGURING, std::memory_order_release);
}

void Session::handle_request_batch(const Message &message) {
  if (state() == SessionState::CONNECTING) {
    throw ProtocolError("REQUEST_BATCH before HELLO");
  }
  if (state() == SessionState::CONFIGURING) {
    state_.store(SessionState::WORKING, std::memory_order_release);
  }

  uint32_t requested = std::max<uint32_t>(message.get<uint32_t>(), 1);
  uint32_t granted = std::min(requested, options_.max_batch_size);
  std::vector<ChunkId> ids = registry_.take(granted);
  {
    std::lock_guard<std::mutex> lock(leased_mutex_);
    leased_.insert(ids.begin(), ids.end());
  }
  GlobalLogger::info("Session {}: asked for {}, leased {}", name_, requested,
                     summarize_chunks(to_chunk_set(ids)));
  send(Message(CommandType::BATCH, COORDINATOR_ID, std::move(ids)));
}

void Session::apply_report(const ChunkReport &report) {
  try {
    {
      std::lock_guard<std::mutex> lock(leased_mutex_);
      if (leased_.count(report.id) == 0) {
        throw UnknownChunkError("Chunk " + std::to_string(report.id) + " is not leased by " +
                                name_);
      }
    }
    registry_.report(report.id, report.outcome);
    {
      std::lock_guard<std::mutex> lock(leased_mutex_);
      leased_.erase(report.id);
    }
  } catch (const UnknownChunkError &e) {
    GlobalLogger::warn("Session {}: ignoring report: {}", name_, e.what());
    return;
  }
  timings_.add(report.timing);

  if (report.outcome == ChunkOutcome::SUCCEEDED) {
    GlobalLogger::info("Session {}: chunk {} completed", name_, report.id);
  } else {
    GlobalLogger::warn("Session {}: chunk {} failed: {}", name_, report.id, report.message);
  }
}

void Session::send(Message &&message) {
  WriteOperation framed = std::make_shared<TBuffer>(BinarySerializer::encode(message));
  bool write_in_progress = !connection_->write_queue.empty();
  connection_->write_queue.push_back(std::move(framed));
  if (!write_in_progress) {
    start_async_write();
  }
}

void Session::start_async_write() {
  if (connection_->write_queue.empty()) {
    return;
  }

  auto self = shared_from_this();
  WriteOperation current = connection_->write_queue.front();
  asio::async_write(
      connection_->socket, asio::buffer(current->get(), current->size()),
      asio::bind_executor(connection_->strand, [self, current](std::error_code ec, std::size_t) {
        if (ec) {
          self->connection_->write_queue.clear();
          self->close("write error: " + ec.message(), false);
          self->close_socket();
          return;
        }

        self->connection_->write_queue.pop_front();

        if (!self->connection_->write_queue.empty()) {
          self->start_async_write();
        } else if (self->close_after_write_) {
          self->close_socket();
        }
      }));
}

void Session::arm_timer() {
  if (options_.timeout.count() == 0 || state() == SessionState::CLOSING) {
    return;
  }
  auto self = shared_from_this();
  timer_.expires_after(options_.timeout);
  timer_.async_wait(asio::bind_executor(connection_->strand, [self](std::error_code ec) {
    if (ec == asio::error::operation_aborted) {
      return;
    }
    self->on_timeout();
  }));
}

void Session::on_timeout() {
  if (state() == SessionState::CLOSING) {
    return;
  }
  // a message completed after this wait fired re-armed the timer further out
  if (timer_.expiry() > asio::steady_timer::clock_type::now()) {
    return;
  }
  SessionTimeoutError error("Session " + name_ + " inactive for " +
                            std::to_string(options_.timeout.count()) + " s");
  GlobalLogger::warn("{}", error.what());
  close(error.what(), true);
}

void Session::close(const std::string &reason, bool send_bye) {
  if (state() == SessionState::CLOSING) {
    return;
  }
  state_.store(SessionState::CLOSING, std::memory_order_release);
  timer_.cancel();

  std::vector<ChunkId> leftovers;
  {
    std::lock_guard<std::mutex> lock(leased_mutex_);
    leftovers.assign(leased_.begin(), leased_.end());
    leased_.clear();
  }
  if (!leftovers.empty()) {
    registry_.abandon(leftovers);
    GlobalLogger::warn("Session {}: {} unreported chunks moved to limbo: {}", name_,
                       leftovers.size(), summarize_chunks(to_chunk_set(leftovers)));
  }
  GlobalLogger::info("Session {} closing: {}", name_, reason);

  if (send_bye && connection_->socket.is_open()) {
    close_after_write_ = true;
    try {
      send(Message(CommandType::BYE, COORDINATOR_ID));
    } catch (const std::exception &e) {
      GlobalLogger::warn("Session {}: could not send BYE: {}", name_, e.what());
      close_socket();
    }
  } else {
    close_socket();
  }

  if (on_closed_) {
    CloseHandler handler = std::move(on_closed_);
    on_closed_ = nullptr;
    handler(shared_from_this());
  }
}

void Session::close_socket() {
  if (!connection_->socket.is_open()) {
    return;
  }
  std::error_code ec;
  connection_->socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  if (ec && ec != asio::error::not_connected) {
    GlobalLogger::debug("Session {}: socket shutdown: {}", name_, ec.message());
  }
  connection_->socket.close(ec);
  if (ec) {
    GlobalLogger::debug("Session {}: socket close: {}", name_, ec.message());
  }
}

} // namespace dgen
