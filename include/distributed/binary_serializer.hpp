/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "common/errors.hpp"
#include "message.hpp"
#include "packet.hpp"
#include "tbuffer.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * Very Important note: size_t is platform dependent. For serialization we need a fixed size
 * type to ensure compatibility across different platforms, so sizes and counts always go on the
 * wire as uint64_t.
 */
namespace dgen {
class BinarySerializer {
public:
  static void serialize(const PacketHeader &header, TBuffer &buffer) {
    buffer.append(header.protocol_version);
    buffer.append(header.endianess);
    buffer.append(header.length);
  }

  static void serialize(const MessageHeader &header, TBuffer &buffer) {
    buffer.append(static_cast<uint16_t>(header.command_type));
    buffer.append(header.sender_id);
  }

  static void serialize(const ChunkReport &report, TBuffer &buffer) {
    buffer.append(static_cast<int64_t>(report.id));
    buffer.append(static_cast<uint8_t>(report.outcome));
    buffer.append(report.message);
    buffer.append(report.timing.generate_us);
    buffer.append(report.timing.partition_us);
    buffer.append(report.timing.ingest_us);
  }

  static void serialize(const MessageData &data, TBuffer &buffer) {
    buffer.append(data.payload_type);
    if (std::holds_alternative<std::monostate>(data.payload)) {
      // No additional data to write
    } else if (std::holds_alternative<std::string>(data.payload)) {
      buffer.append(std::get<std::string>(data.payload));
    } else if (std::holds_alternative<uint32_t>(data.payload)) {
      buffer.append(std::get<uint32_t>(data.payload));
    } else if (std::holds_alternative<std::vector<ChunkId>>(data.payload)) {
      const auto &ids = std::get<std::vector<ChunkId>>(data.payload);
      buffer.append(static_cast<uint64_t>(ids.size()));
      for (ChunkId id : ids) {
        buffer.append(static_cast<int64_t>(id));
      }
    } else if (std::holds_alternative<ChunkReport>(data.payload)) {
      serialize(std::get<ChunkReport>(data.payload), buffer);
    } else if (std::holds_alternative<std::vector<ChunkReport>>(data.payload)) {
      const auto &reports = std::get<std::vector<ChunkReport>>(data.payload);
      buffer.append(static_cast<uint64_t>(reports.size()));
      for (const auto &report : reports) {
        serialize(report, buffer);
      }
    } else {
      throw std::runtime_error("Unsupported payload type in MessageData");
    }
  }

  static void serialize(const Message &message, TBuffer &buffer) {
    serialize(message.header(), buffer);
    serialize(message.data(), buffer);
  }

  static void deserialize(const TBuffer &buffer, size_t &offset, PacketHeader &header) {
    buffer.read(offset, header.protocol_version);
    buffer.read(offset, header.endianess);
    buffer.read(offset, header.length);
    if (header.endianess != get_system_endianness()) {
      bswap(header.length);
    }
  }

  static void deserialize(const TBuffer &buffer, size_t &offset, MessageHeader &header) {
    uint16_t cmd_type;
    buffer.read<uint16_t>(offset, cmd_type);
    if (!is_valid_command(cmd_type)) {
      throw ProtocolError("Unknown command type " + std::to_string(cmd_type));
    }
    header.command_type = static_cast<CommandType>(cmd_type);
    buffer.read(offset, header.sender_id);
  }

  static void deserialize(const TBuffer &buffer, size_t &offset, ChunkReport &report) {
    int64_t id;
    uint8_t outcome;
    buffer.read(offset, id);
    buffer.read(offset, outcome);
    if (outcome > static_cast<uint8_t>(ChunkOutcome::FAILED)) {
      throw ProtocolError("Unknown chunk outcome " + std::to_string(outcome));
    }
    report.id = id;
    report.outcome = static_cast<ChunkOutcome>(outcome);
    buffer.read(offset, report.message);
    buffer.read(offset, report.timing.generate_us);
    buffer.read(offset, report.timing.partition_us);
    buffer.read(offset, report.timing.ingest_us);
  }

  static void deserialize(const TBuffer &buffer, size_t &offset, MessageData &data) {
    uint64_t payload_type;
    buffer.read(offset, payload_type);
    data.payload_type = payload_type;
    switch (data.payload_type) {
    case variant_index<PayloadType, std::monostate>():
      data.payload = std::monostate{};
      break;
    case variant_index<PayloadType, std::string>(): {
      std::string str;
      buffer.read(offset, str);
      data.payload = std::move(str);
    } break;
    case variant_index<PayloadType, uint32_t>(): {
      uint32_t value;
      buffer.read(offset, value);
      data.payload = value;
    } break;
    case variant_index<PayloadType, std::vector<ChunkId>>(): {
      uint64_t count;
      buffer.read(offset, count);
      check_count(buffer, offset, count, sizeof(int64_t));
      std::vector<ChunkId> ids(count);
      for (uint64_t i = 0; i < count; ++i) {
        int64_t id;
        buffer.read(offset, id);
        ids[i] = id;
      }
      data.payload = std::move(ids);
    } break;
    case variant_index<PayloadType, ChunkReport>(): {
      ChunkReport report;
      deserialize(buffer, offset, report);
      data.payload = std::move(report);
    } break;
    case variant_index<PayloadType, std::vector<ChunkReport>>(): {
      uint64_t count;
      buffer.read(offset, count);
      // id + outcome + message length + timing at the very least
      check_count(buffer, offset, count,
                  sizeof(int64_t) + sizeof(uint8_t) + sizeof(uint64_t) + sizeof(ChunkTiming));
      std::vector<ChunkReport> reports(count);
      for (uint64_t i = 0; i < count; ++i) {
        deserialize(buffer, offset, reports[i]);
      }
      data.payload = std::move(reports);
    } break;
    default:
      throw ProtocolError("Unsupported payload type " + std::to_string(payload_type));
    }
  }

  static void deserialize(const TBuffer &buffer, size_t &offset, Message &message) {
    deserialize(buffer, offset, message.header());
    deserialize(buffer, offset, message.data());
  }

  /**
   * @brief Builds the bytes of one framed message: packet header followed by the body.
   */
  static TBuffer encode(const Message &message) {
    TBuffer body;
    serialize(message, body);
    if (body.size() > MAX_MESSAGE_SIZE) {
      throw ProtocolError("Message of " + std::to_string(body.size()) +
                          " bytes exceeds the maximum message size");
    }
    TBuffer framed(PacketHeader::size() + body.size());
    serialize(PacketHeader(body.size()), framed);
    framed.append(body.get(), body.size());
    return framed;
  }

  /**
   * @brief Parses and validates a fixed packet header.
   * @throws ProtocolError on a version mismatch or an oversized body.
   */
  static PacketHeader decode_header(const TBuffer &buffer) {
    PacketHeader header;
    size_t offset = 0;
    try {
      deserialize(buffer, offset, header);
    } catch (const std::out_of_range &e) {
      throw ProtocolError(std::string("Truncated packet header: ") + e.what());
    }
    if (header.protocol_version != PROTOCOL_VERSION) {
      throw ProtocolError("Protocol version mismatch: expected " +
                          std::to_string(PROTOCOL_VERSION) + ", got " +
                          std::to_string(header.protocol_version));
    }
    if (header.endianess != Endianness::LITTLE && header.endianess != Endianness::BIG) {
      throw ProtocolError("Invalid endianness marker " + std::to_string(header.endianess));
    }
    if (header.length > MAX_MESSAGE_SIZE) {
      throw ProtocolError("Message body of " + std::to_string(header.length) +
                          " bytes exceeds the maximum message size");
    }
    return header;
  }

  /**
   * @brief Parses a complete message body.
   * @throws ProtocolError on truncated or trailing bytes, unknown commands, or a payload that
   * does not belong to the command.
   */
  static Message decode(const TBuffer &body) {
    Message message;
    size_t offset = 0;
    try {
      deserialize(body, offset, message);
    } catch (const std::out_of_range &e) {
      throw ProtocolError(std::string("Truncated message: ") + e.what());
    }
    if (offset != body.size()) {
      throw ProtocolError("Message has " + std::to_string(body.size() - offset) +
                          " trailing bytes");
    }
    if (message.data().payload_type != expected_payload_type(message.command())) {
      throw ProtocolError("Payload type " + std::to_string(message.data().payload_type) +
                          " does not match command " + to_string(message.command()));
    }
    return message;
  }

private:
  static void check_count(const TBuffer &buffer, size_t offset, uint64_t count,
                          size_t min_element_size) {
    if (count > (buffer.size() - offset) / min_element_size) {
      throw ProtocolError("Element count " + std::to_string(count) +
                          " exceeds the remaining message bytes");
    }
  }
};

} // namespace dgen
