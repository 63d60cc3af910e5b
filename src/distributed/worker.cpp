/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "distributed/worker.hpp"

#include "common/errors.hpp"
#include "logging/logger.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <future>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <thread>

namespace dgen {

namespace {

void write_file(const std::filesystem::path &path, const std::string &contents) {
  std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot write " + path.string());
  }
  file << contents;
  if (!file.good()) {
    throw std::runtime_error("Error writing " + path.string());
  }
}

// Microseconds since `mark`, which is moved to now.
uint64_t lap(std::chrono::steady_clock::time_point &mark) {
  auto now = std::chrono::steady_clock::now();
  auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(now - mark).count();
  mark = now;
  return static_cast<uint64_t>(elapsed);
}

// Only the last path component of a shipped file name is used.
std::filesystem::path safe_name(const std::string &name) {
  std::filesystem::path file_name = std::filesystem::path(name).filename();
  if (file_name.empty() || file_name == "." || file_name == "..") {
    throw std::runtime_error("Invalid file name in configuration: '" + name + "'");
  }
  return file_name;
}

} // namespace

Worker::Worker(WorkerConfig config, std::shared_ptr<Generator> generator,
               std::shared_ptr<Partitioner> partitioner, std::shared_ptr<IngestClient> ingest)
    : config_(std::move(config)), generator_(std::move(generator)),
      partitioner_(std::move(partitioner)), ingest_(std::move(ingest)) {
  if (!generator_ || !partitioner_ || !ingest_) {
    throw std::invalid_argument("Worker requires a generator, a partitioner and an ingest client");
  }
  if (config_.parallelism == 0) {
    config_.parallelism = 1;
  }
  if (config_.chunks_per_request == 0) {
    config_.chunks_per_request = 1;
  }
}

void Worker::run() {
  connect();
  try {
    handshake();
    if (stats_.closed_by_server) {
      channel_.close();
      return;
    }
    work_loop();
  } catch (const ProtocolError &e) {
    GlobalLogger::error("{}: protocol error: {}", name_, e.what());
    say_goodbye();
    throw;
  }
  GlobalLogger::info("{} finished: {} batches, {} succeeded, {} failed{}", name_, stats_.batches,
                     stats_.succeeded, stats_.failed, stats_.gave_up ? ", gave up" : "");
}

void Worker::connect() {
  while (true) {
    try {
      channel_.connect(config_.server_host, config_.server_port);
      GlobalLogger::info("Connected to {}:{}", config_.server_host, config_.server_port);
      return;
    } catch (const std::system_error &e) {
      if (!config_.retry) {
        throw;
      }
      GlobalLogger::warn("Cannot reach {}:{} ({}), retrying in {} s", config_.server_host,
                         config_.server_port, e.what(), config_.retry_interval_sec);
      std::this_thread::sleep_for(std::chrono::seconds(config_.retry_interval_sec));
    }
  }
}

void Worker::handshake() {
  channel_.send(Message(CommandType::HELLO, name_));
  Message reply = channel_.receive();
  if (reply.command() == CommandType::BYE) {
    GlobalLogger::info("Coordinator closed the session before sending a configuration");
    stats_.closed_by_server = true;
    return;
  }
  if (reply.command() != CommandType::CONFIG) {
    throw ProtocolError("Expected CONFIG, received " + to_string(reply.command()));
  }

  RunConfiguration run_config;
  try {
    run_config = RunConfiguration::from_json(nlohmann::json::parse(reply.get<std::string>()));
  } catch (const nlohmann::json::exception &e) {
    throw ProtocolError(std::string("Invalid configuration payload: ") + e.what());
  }
  configure(run_config);
}

void Worker::configure(const RunConfiguration &run_config) {
  run_config_ = run_config;
  if (!run_config_.client_name.empty()) {
    name_ = run_config_.client_name;
  }
  GlobalLogger::info("Configured as {}", name_);

  std::filesystem::create_directories(config_.work_dir);

  generator_spec_.arguments = run_config_.generator_arguments;
  generator_spec_.work_dir = config_.work_dir;
  generator_spec_.spec_file = config_.work_dir / safe_name(run_config_.generator_spec_name);
  write_file(generator_spec_.spec_file, run_config_.generator_spec);

  partitioner_config_.cfg_files.clear();
  if (!run_config_.partitioner_configs.empty()) {
    std::filesystem::path cfg_dir = config_.work_dir / "partitioner_cfg";
    std::filesystem::create_directories(cfg_dir);
    for (const auto &cfg : run_config_.partitioner_configs) {
      std::filesystem::path path = cfg_dir / safe_name(cfg.name);
      write_file(path, cfg.contents);
      partitioner_config_.cfg_files.push_back(path);
    }
  }

  for (const auto &file : run_config_.pregenerated_files) {
    write_file(config_.work_dir / safe_name(file.name), file.contents);
  }
}

void Worker::work_loop() {
  while (true) {
    channel_.send(Message(CommandType::REQUEST_BATCH, name_, config_.chunks_per_request));
    Message reply = channel_.receive();

    if (reply.command() == CommandType::BYE) {
      GlobalLogger::info("{}: coordinator ended the session", name_);
      stats_.closed_by_server = true;
      channel_.close();
      return;
    }
    if (reply.command() != CommandType::BATCH) {
      throw ProtocolError("Expected BATCH, received " + to_string(reply.command()));
    }

    const auto &ids = reply.get<std::vector<ChunkId>>();
    if (ids.empty()) {
      GlobalLogger::info("{}: no chunks left", name_);
      say_goodbye();
      return;
    }

    ++stats_.batches;
    GlobalLogger::info("{}: received {}", name_, summarize_chunks(to_chunk_set(ids)));
    if (!process_batch(ids)) {
      return;
    }
  }
}

bool Worker::process_batch(const std::vector<ChunkId> &ids) {
  std::mutex done_mutex;
  std::condition_variable done_cv;
  std::deque<ChunkReport> done;
  // declared after what the tasks touch so it is destroyed (and joined) first
  std::vector<std::future<void>> running;

  size_t next = 0;
  size_t in_flight = 0;
  auto launch = [&](ChunkId id) {
    running.push_back(std::async(std::launch::async, [&, id]() {
      ChunkReport report = process_chunk(id);
      {
        std::lock_guard<std::mutex> lock(done_mutex);
        done.push_back(std::move(report));
      }
      done_cv.notify_one();
    }));
    ++in_flight;
  };

  while (next < ids.size() && in_flight < config_.parallelism) {
    launch(ids[next++]);
  }

  while (in_flight > 0) {
    ChunkReport report;
    {
      std::unique_lock<std::mutex> lock(done_mutex);
      done_cv.wait(lock, [&]() { return !done.empty(); });
      report = std::move(done.front());
      done.pop_front();
    }
    --in_flight;

    if (report.outcome == ChunkOutcome::SUCCEEDED) {
      ++stats_.succeeded;
      consecutive_failures_ = 0;
    } else {
      ++stats_.failed;
      ++consecutive_failures_;
    }

    if (config_.max_consecutive_failures > 0 &&
        consecutive_failures_ >= config_.max_consecutive_failures) {
      std::vector<ChunkReport> final_reports{std::move(report)};
      for (auto &task : running) {
        task.wait();
      }
      {
        std::lock_guard<std::mutex> lock(done_mutex);
        for (auto &pending : done) {
          if (pending.outcome == ChunkOutcome::SUCCEEDED) {
            ++stats_.succeeded;
          } else {
            ++stats_.failed;
          }
          final_reports.push_back(std::move(pending));
        }
        done.clear();
      }
      give_up(std::move(final_reports));
      return false;
    }

    channel_.send(Message(CommandType::REPORT, name_, std::move(report)));

    if (next < ids.size()) {
      launch(ids[next++]);
    }
  }
  return true;
}

ChunkReport Worker::process_chunk(ChunkId id) {
  ChunkReport report;
  report.id = id;
  auto mark = std::chrono::steady_clock::now();
  try {
    GeneratedChunk generated = generator_->generate(id, generator_spec_);
    report.timing.generate_us = lap(mark);
    PartitionedChunk partitioned = partitioner_->partition(generated, partitioner_config_);
    report.timing.partition_us = lap(mark);
    if (run_config_.ingest.skip) {
      GlobalLogger::debug("{}: ingest skipped for chunk {}", name_, id);
    } else {
      ingest_->publish(partitioned.files, run_config_.ingest);
      report.timing.ingest_us = lap(mark);
    }

    if (!run_config_.keep_csv) {
      std::error_code ec;
      if (!generated.directory.empty()) {
        std::filesystem::remove_all(generated.directory, ec);
      }
      if (!ec && !partitioned.directory.empty()) {
        std::filesystem::remove_all(partitioned.directory, ec);
      }
      if (ec) {
        GlobalLogger::warn("{}: could not clean up chunk {}: {}", name_, id, ec.message());
      }
    }
    report.outcome = ChunkOutcome::SUCCEEDED;
    GlobalLogger::info("{}: chunk {} done", name_, id);
  } catch (const CollaboratorError &e) {
    report.outcome = ChunkOutcome::FAILED;
    report.message = e.what();
    GlobalLogger::warn("{}: chunk {} failed: {}", name_, id, e.what());
  } catch (const std::exception &e) {
    report.outcome = ChunkOutcome::FAILED;
    report.message = std::string("unexpected error: ") + e.what();
    GlobalLogger::error("{}: chunk {} failed unexpectedly: {}", name_, id, e.what());
  }
  return report;
}

void Worker::give_up(std::vector<ChunkReport> final_reports) {
  stats_.gave_up = true;
  GlobalLogger::error("{}: {} consecutive failures, giving up", name_, consecutive_failures_);
  channel_.send(Message(CommandType::GIVE_UP, name_, std::move(final_reports)));
  say_goodbye();
}

void Worker::say_goodbye() {
  if (!channel_.is_open()) {
    return;
  }
  try {
    channel_.send(Message(CommandType::BYE, name_));
  } catch (const std::system_error &e) {
    GlobalLogger::debug("{}: BYE not delivered: {}", name_, e.what());
  }
  channel_.close();
}

} // namespace dgen
