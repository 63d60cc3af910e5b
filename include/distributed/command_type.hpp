/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */

#pragma once

#include <cstdint>
#include <string>

namespace dgen {

/**
 * @brief Commands exchanged between the coordinator and its workers.
 * If you want to modify its contents, please also update the COUNT to have the
 * highest value, and START to be lowest.
 */
enum CommandType : uint16_t {
  _START,

  // handshake
  HELLO,  // worker -> coordinator, first message of a session
  CONFIG, // coordinator -> worker, run configuration, sent once

  // work loop
  REQUEST_BATCH, // worker -> coordinator, number of chunks wanted
  BATCH,         // coordinator -> worker, chunk ids (possibly none)
  REPORT,        // worker -> coordinator, outcome of one chunk

  // termination
  GIVE_UP, // worker -> coordinator, final outcomes before leaving
  BYE,     // either direction

  _COUNT
};

inline bool is_valid_command(uint16_t value) {
  return value > CommandType::_START && value < CommandType::_COUNT;
}

inline std::string to_string(CommandType type) {
  switch (type) {
  case CommandType::HELLO:
    return "HELLO";
  case CommandType::CONFIG:
    return "CONFIG";
  case CommandType::REQUEST_BATCH:
    return "REQUEST_BATCH";
  case CommandType::BATCH:
    return "BATCH";
  case CommandType::REPORT:
    return "REPORT";
  case CommandType::GIVE_UP:
    return "GIVE_UP";
  case CommandType::BYE:
    return "BYE";
  default:
    return "UNKNOWN(" + std::to_string(static_cast<uint16_t>(type)) + ")";
  }
}

} // namespace dgen
