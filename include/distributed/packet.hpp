/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "endian.hpp"

#include <cstdint>

namespace dgen {

constexpr uint8_t PROTOCOL_VERSION = 1;

// Upper bound on a message body. Anything larger is treated as a corrupt stream.
constexpr uint64_t MAX_MESSAGE_SIZE = 64ull * 1024 * 1024;

// Fixed header in front of every message body.
struct PacketHeader {
  uint8_t protocol_version = PROTOCOL_VERSION;
  Endianness endianess;
  uint64_t length = 0; // Length of the body that follows the header

  PacketHeader() : endianess(get_system_endianness()) {}

  explicit PacketHeader(uint64_t len) : endianess(get_system_endianness()), length(len) {}

  static constexpr uint64_t size() {
    return sizeof(uint8_t) +    // protocol_version
           sizeof(Endianness) + // endianess
           sizeof(uint64_t);    // length
  }
};

} // namespace dgen
