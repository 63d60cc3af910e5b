/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "chunk/chunk_set.hpp"
#include "command_type.hpp"

#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace dgen {

// Wall time a worker spent in each stage of one chunk, in microseconds.
struct ChunkTiming {
  uint64_t generate_us = 0;
  uint64_t partition_us = 0;
  uint64_t ingest_us = 0;

  bool operator==(const ChunkTiming &other) const = default;
};

// Outcome of one chunk as reported by a worker.
struct ChunkReport {
  ChunkId id = 0;
  ChunkOutcome outcome = ChunkOutcome::FAILED;
  std::string message;
  ChunkTiming timing;

  bool operator==(const ChunkReport &other) const = default;
};

using PayloadType = std::variant<std::monostate, std::string, uint32_t, std::vector<ChunkId>,
                                 ChunkReport, std::vector<ChunkReport>>;

template <typename VariantType, typename T, uint64_t index = 0> constexpr uint64_t variant_index() {
  static_assert(std::variant_size_v<VariantType> > index, "Type not found in variant");
  if constexpr (std::is_same_v<std::variant_alternative_t<index, VariantType>, T>) {
    return index;
  } else {
    return variant_index<VariantType, T, index + 1>();
  }
}

/**
 * @brief Payload alternative each command must carry.
 *
 * HELLO and BYE carry nothing, CONFIG the run configuration as JSON text, REQUEST_BATCH the
 * number of chunks wanted, BATCH the leased ids, REPORT one outcome and GIVE_UP the final ones.
 */
inline uint64_t expected_payload_type(CommandType type) {
  switch (type) {
  case CommandType::CONFIG:
    return variant_index<PayloadType, std::string>();
  case CommandType::REQUEST_BATCH:
    return variant_index<PayloadType, uint32_t>();
  case CommandType::BATCH:
    return variant_index<PayloadType, std::vector<ChunkId>>();
  case CommandType::REPORT:
    return variant_index<PayloadType, ChunkReport>();
  case CommandType::GIVE_UP:
    return variant_index<PayloadType, std::vector<ChunkReport>>();
  default:
    return variant_index<PayloadType, std::monostate>();
  }
}

// Sender id used by the coordinator side of every session.
constexpr const char *COORDINATOR_ID = "coordinator";

struct MessageHeader {
  CommandType command_type; // Type of command
  std::string sender_id;    // Client name or "coordinator"

  MessageHeader() : command_type(CommandType::_START) {}

  MessageHeader(CommandType cmd_type, std::string sender)
      : command_type(cmd_type), sender_id(std::move(sender)) {}
};

struct MessageData {
  uint64_t payload_type; // to indicate which type is held in the variant
  PayloadType payload;

  MessageData() : payload_type(0), payload(std::monostate{}) {}

  MessageData(PayloadType &&pay) : payload(std::move(pay)) {
    payload_type = static_cast<uint64_t>(payload.index());
  }
};

struct Message {
private:
  MessageHeader header_;
  MessageData data_;

public:
  Message() = default;

  Message(CommandType cmd_type, std::string sender_id, PayloadType &&payload = std::monostate{})
      : header_(cmd_type, std::move(sender_id)), data_(std::move(payload)) {}

  Message(MessageHeader &&header, MessageData &&data)
      : header_(std::move(header)), data_(std::move(data)) {}

  Message(const Message &other) = delete;
  Message &operator=(const Message &other) = delete;

  Message(Message &&other) noexcept = default;
  Message &operator=(Message &&other) noexcept = default;

  MessageHeader &header() { return header_; }
  const MessageHeader &header() const { return header_; }

  MessageData &data() { return data_; }
  const MessageData &data() const { return data_; }

  CommandType command() const { return header_.command_type; }
  const std::string &sender() const { return header_.sender_id; }

  template <typename T> bool has_type() const { return std::holds_alternative<T>(data_.payload); }

  template <typename T> T &get() { return std::get<T>(data_.payload); }

  template <typename T> const T &get() const { return std::get<T>(data_.payload); }
};

} // namespace dgen
