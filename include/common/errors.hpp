/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <stdexcept>
#include <string>

namespace dgen {

// Malformed or out-of-sequence message. Terminates the offending session only.
class ProtocolError : public std::runtime_error {
public:
  explicit ProtocolError(const std::string &what) : std::runtime_error(what) {}
};

// Report for a chunk id that is not currently assigned (duplicate or stale).
class UnknownChunkError : public std::runtime_error {
public:
  explicit UnknownChunkError(const std::string &what) : std::runtime_error(what) {}
};

class CollaboratorError : public std::runtime_error {
public:
  explicit CollaboratorError(const std::string &what) : std::runtime_error(what) {}
};

class GenerationError : public CollaboratorError {
public:
  explicit GenerationError(const std::string &what) : CollaboratorError(what) {}
};

class PartitionError : public CollaboratorError {
public:
  explicit PartitionError(const std::string &what) : CollaboratorError(what) {}
};

class IngestError : public CollaboratorError {
public:
  explicit IngestError(const std::string &what) : CollaboratorError(what) {}
};

class SessionTimeoutError : public std::runtime_error {
public:
  explicit SessionTimeoutError(const std::string &what) : std::runtime_error(what) {}
};

// Recovery log read/write failure. Fatal to the coordinator.
class PersistenceError : public std::runtime_error {
public:
  explicit PersistenceError(const std::string &what) : std::runtime_error(what) {}
};

} // namespace dgen
