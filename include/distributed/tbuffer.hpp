/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "endian.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace dgen {

/**
 * @brief Growable byte buffer used to build and parse wire messages.
 *
 * Values are appended in host byte order. The endianness recorded on the buffer describes the
 * data it holds; read functions swap bytes when it differs from the host.
 */
class TBuffer {
private:
  std::vector<uint8_t> data_;
  Endianness endianess_ = get_system_endianness();

  std::string get_out_of_bound_msg(size_t index) const {
    return "Buffer bounds is (0, " + std::to_string(data_.size()) +
           "), accessed: " + std::to_string(index);
  }

public:
  TBuffer() = default;

  explicit TBuffer(size_t initial_capacity) { data_.reserve(initial_capacity); }

  uint8_t *get() { return data_.data(); }
  const uint8_t *get() const { return data_.data(); }

  bool empty() const { return data_.empty(); }
  size_t size() const { return data_.size(); }

  void resize(size_t new_size) { data_.resize(new_size); }

  void set_endianess(Endianness endianess) { endianess_ = endianess; }
  Endianness get_endianess() const { return endianess_; }

  template <typename T> void append(const T &value) {
    static_assert(std::is_trivially_copyable<T>::value,
                  "Type must be trivially copyable (primitive or POD type)");
    size_t offset = data_.size();
    data_.resize(offset + sizeof(T));
    std::memcpy(data_.data() + offset, &value, sizeof(T));
  }

  void append(const uint8_t *bytes, size_t length) {
    data_.insert(data_.end(), bytes, bytes + length);
  }

  void append(const std::string &str) {
    append<uint64_t>(static_cast<uint64_t>(str.size()));
    append(reinterpret_cast<const uint8_t *>(str.data()), str.size());
  }

  template <typename T> void read(size_t &offset, T &value) const {
    static_assert(std::is_trivially_copyable<T>::value,
                  "Type must be trivially copyable (primitive or POD type)");
    if (offset > data_.size() || data_.size() - offset < sizeof(T)) {
      throw std::out_of_range(get_out_of_bound_msg(offset + sizeof(T)));
    }
    std::memcpy(&value, data_.data() + offset, sizeof(T));
    offset += sizeof(T);
    if (endianess_ != get_system_endianness()) {
      bswap(value);
    }
  }

  void read(size_t &offset, std::string &str) const {
    uint64_t length = 0;
    read<uint64_t>(offset, length);
    if (length > data_.size() - offset) {
      throw std::out_of_range(get_out_of_bound_msg(offset + length));
    }
    str.assign(reinterpret_cast<const char *>(data_.data() + offset), length);
    offset += length;
  }
};

} // namespace dgen
