/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <cstdint>

namespace dgen {

enum Endianness : uint8_t { LITTLE = 0, BIG = 1 };

inline Endianness get_system_endianness() {
  union {
    uint32_t i;
    char c[4];
  } u = {0x01020304};
  return (u.c[0] == 1) ? Endianness::BIG : Endianness::LITTLE;
}

template <typename T> void bswap(T &value) {
  if constexpr (sizeof(T) == 1) {
    return;
  } else if constexpr (sizeof(T) == 2) {
    value = static_cast<T>(__builtin_bswap16(static_cast<uint16_t>(value)));
  } else if constexpr (sizeof(T) == 4) {
    value = static_cast<T>(__builtin_bswap32(static_cast<uint32_t>(value)));
  } else if constexpr (sizeof(T) == 8) {
    value = static_cast<T>(__builtin_bswap64(static_cast<uint64_t>(value)));
  } else {
    static_assert(sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8,
                  "bswap is only supported for 2, 4, or 8 byte types");
  }
}

} // namespace dgen
