/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "distributed/coordinator.hpp"

#include "common/errors.hpp"

#include <fmt/format.h>
#include <stdexcept>

namespace dgen {

Coordinator::Coordinator(ServerSettings settings, const ChunkSet &requested_range,
                         const RecoverySnapshot &prior,
                         std::shared_ptr<const RunConfiguration> run_config,
                         std::optional<std::filesystem::path> log_dir,
                         std::shared_ptr<Logger> transition_logger,
                         std::shared_ptr<IngestAdmin> ingest_admin)
    : settings_(std::move(settings)),
      registry_(requested_range, prior.completed, std::move(transition_logger)),
      carried_completed_(set_difference(prior.completed, requested_range)),
      carried_assigned_(set_difference(prior.assigned, requested_range)),
      carried_limbo_(set_difference(prior.limbo, requested_range)),
      run_config_(std::move(run_config)), ingest_admin_(std::move(ingest_admin)),
      work_guard_(asio::make_work_guard(io_context_)),
      strand_(asio::make_strand(io_context_)), acceptor_(strand_), checkpoint_timer_(strand_) {
  if (!run_config_) {
    throw std::invalid_argument("Coordinator requires a run configuration");
  }
  if (log_dir) {
    store_.emplace(*log_dir);
  }

  ChunkSet problems = prior.problem_chunks();
  if (!problems.empty()) {
    GlobalLogger::warn("Earlier run left chunks that need review (not regenerated): {}",
                       summarize_chunks(problems));
  }
  GlobalLogger::info("Run range {} chunks, {} already completed, {} to generate",
                     requested_range.size(), registry_.count(ChunkState::COMPLETED),
                     registry_.count(ChunkState::TARGET));
}

Coordinator::~Coordinator() {
  begin_shutdown("coordinator destroyed");
  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

void Coordinator::start() {
  if (started_.exchange(true)) {
    throw std::logic_error("Coordinator already started");
  }

  if (ingest_admin_) {
    register_ingest_schema(*ingest_admin_, run_config_->ingest);
  }

  asio::ip::tcp::endpoint endpoint(asio::ip::make_address(settings_.host), settings_.port);
  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen();
  port_.store(acceptor_.local_endpoint().port(), std::memory_order_release);

  GlobalLogger::info("Coordinator listening on {}:{}", settings_.host, port());

  asio::post(strand_, [this]() {
    accept_connections();
    arm_checkpoint();
  });

  if (registry_.is_exhausted()) {
    begin_shutdown("no chunks to generate");
  }

  size_t num_threads = settings_.io_threads > 0 ? settings_.io_threads : 1;
  io_threads_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    io_threads_.emplace_back([this]() { io_context_.run(); });
  }
}

void Coordinator::stop() { begin_shutdown("stop requested"); }

void Coordinator::wait() {
  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  std::lock_guard<std::mutex> lock(error_mutex_);
  if (persistence_error_) {
    std::rethrow_exception(persistence_error_);
  }
}

size_t Coordinator::session_count() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}

std::vector<ChunkId> Coordinator::requeue(const std::vector<ChunkId> &ids) {
  std::vector<ChunkId> moved = registry_.requeue(ids);
  if (!moved.empty()) {
    GlobalLogger::info("Requeued {} chunks: {}", moved.size(),
                       summarize_chunks(to_chunk_set(moved)));
  }
  return moved;
}

RecoverySnapshot Coordinator::snapshot() const {
  RecoverySnapshot snap = registry_.snapshot();
  snap.completed.insert(carried_completed_.begin(), carried_completed_.end());
  snap.assigned.insert(carried_assigned_.begin(), carried_assigned_.end());
  snap.limbo.insert(carried_limbo_.begin(), carried_limbo_.end());
  return snap;
}

void Coordinator::persist() {
  if (!store_) {
    return;
  }
  std::lock_guard<std::mutex> lock(persist_mutex_);
  store_->save(snapshot());
  GlobalLogger::debug("Chunk logs written to {}", store_->directory().string());
}

std::string Coordinator::summary() const {
  RecoverySnapshot snap = snapshot();
  std::string out = "Run summary\n";
  out += fmt::format("  Target:    {}\n", snap.target.size());
  out += fmt::format("  Assigned:  {}\n", snap.assigned.size());
  out += fmt::format("  Completed: {}\n", snap.completed.size());
  out += fmt::format("  Limbo:     {}\n", snap.limbo.size());
  out += fmt::format("Completed chunks: {}\n", summarize_chunks(snap.completed));
  out += fmt::format("Limbo chunks: {}\n", summarize_chunks(snap.limbo));
  out += snap.report();
  out += "\n" + timings_.report();
  return out;
}

void Coordinator::accept_connections() {
  if (!acceptor_.is_open()) {
    return;
  }

  acceptor_.async_accept(io_context_, [this](std::error_code ec, asio::ip::tcp::socket socket) {
    if (ec) {
      if (ec != asio::error::operation_aborted) {
        GlobalLogger::warn("Accept failed: {}", ec.message());
        accept_connections();
      }
      return;
    }

    std::error_code option_ec;
    socket.set_option(asio::ip::tcp::no_delay(true), option_ec);
    if (option_ec) {
      GlobalLogger::debug("Failed to set TCP_NODELAY: {}", option_ec.message());
    }

    std::shared_ptr<Session> session;
    {
      std::lock_guard<std::mutex> lock(sessions_mutex_);
      if (shutting_down_.load(std::memory_order_acquire)) {
        std::error_code close_ec;
        socket.close(close_ec);
        return;
      }
      SessionOptions options;
      options.max_batch_size = settings_.max_batch_size;
      options.timeout = std::chrono::seconds(settings_.session_timeout_sec);
      session = std::make_shared<Session>(
          std::move(socket), "client" + std::to_string(next_client_id_++), registry_, timings_,
          run_config_, options, [this](const std::shared_ptr<Session> &closed) { on_session_closed(closed); });
      sessions_[session.get()] = session;
    }
    session->start();

    accept_connections();
  });
}

void Coordinator::on_session_closed(const std::shared_ptr<Session> &session) {
  bool none_left;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.erase(session.get());
    none_left = sessions_.empty();
  }
  if (!none_left) {
    return;
  }
  if (shutting_down_.load(std::memory_order_acquire)) {
    asio::post(strand_, [this]() { finalize(); });
  } else if (registry_.is_exhausted()) {
    begin_shutdown("all chunks resolved");
  }
}

void Coordinator::begin_shutdown(const std::string &reason) {
  if (shutting_down_.exchange(true)) {
    return;
  }
  GlobalLogger::info("Coordinator shutting down: {}", reason);

  asio::post(strand_, [this]() {
    std::error_code ec;
    acceptor_.close(ec);
    checkpoint_timer_.cancel();

    std::vector<std::shared_ptr<Session>> open;
    {
      std::lock_guard<std::mutex> lock(sessions_mutex_);
      for (auto &entry : sessions_) {
        open.push_back(entry.second);
      }
    }
    if (open.empty()) {
      finalize();
      return;
    }
    for (auto &session : open) {
      session->shutdown("coordinator shutting down");
    }
  });
}

void Coordinator::finalize() {
  if (finalized_.exchange(true)) {
    return;
  }
  checkpoint_timer_.cancel();

  try {
    persist();
  } catch (const PersistenceError &e) {
    GlobalLogger::critical("Could not write the final chunk logs: {}", e.what());
    record_persistence_error(std::current_exception());
  }
  GlobalLogger::info("{}", summary());
  publish();
  GlobalLogger::flush();

  work_guard_.reset();
}

void Coordinator::publish() {
  if (!ingest_admin_) {
    return;
  }
  try {
    if (publish_if_complete(*ingest_admin_, run_config_->ingest, snapshot())) {
      published_.store(true, std::memory_order_release);
    }
  } catch (const IngestError &e) {
    GlobalLogger::error("Failed to publish {}: {}", run_config_->ingest.db_name, e.what());
  }
}

void Coordinator::arm_checkpoint() {
  if (settings_.checkpoint_interval_sec == 0 || !store_ ||
      shutting_down_.load(std::memory_order_acquire)) {
    return;
  }
  checkpoint_timer_.expires_after(std::chrono::seconds(settings_.checkpoint_interval_sec));
  checkpoint_timer_.async_wait([this](std::error_code ec) {
    if (ec || shutting_down_.load(std::memory_order_acquire)) {
      return;
    }
    try {
      persist();
    } catch (const PersistenceError &e) {
      GlobalLogger::critical("Checkpoint failed: {}", e.what());
      record_persistence_error(std::current_exception());
      begin_shutdown("checkpoint failed");
      return;
    }
    arm_checkpoint();
  });
}

void Coordinator::record_persistence_error(std::exception_ptr error) {
  std::lock_guard<std::mutex> lock(error_mutex_);
  if (!persistence_error_) {
    persistence_error_ = error;
  }
}

} // namespace dgen
