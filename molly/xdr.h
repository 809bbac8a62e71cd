/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * All rights reserved.
 *
 * molly - XDR (big-endian) scalar unpacking
 */

#ifndef MOLLY_XDR_H
#define MOLLY_XDR_H

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace molly {
namespace xdr {

// XDR items are 4-byte aligned
static constexpr int alignmentBytes = 4;
static constexpr int alignmentBytesMinusOne = alignmentBytes - 1;

inline uint64_t align4(uint64_t l) {
  return (l + alignmentBytesMinusOne) & ~uint64_t(alignmentBytesMinusOne);
}

template <typename T> T byteswap(T value) {
  union {
    T val;
    uint8_t bytes[sizeof(T)];
  } src, dst;

  src.val = value;
  for (size_t i = 0; i < sizeof(T); i++) {
    dst.bytes[i] = src.bytes[sizeof(T) - 1 - i];
  }
  return dst.val;
}

inline bool host_is_little_endian() {
  const uint16_t one = 1;
  uint8_t first;
  std::memcpy(&first, &one, 1);
  return first == 1;
}

// Callers guarantee that 4 bytes are available at ptr.
inline uint32_t unpack_uint(const uint8_t *&ptr) {
  uint32_t value;
  std::memcpy(&value, ptr, sizeof(uint32_t));
  ptr += sizeof(uint32_t);
  return host_is_little_endian() ? byteswap(value) : value;
}

inline int32_t unpack_int(const uint8_t *&ptr) {
  uint32_t u = unpack_uint(ptr);
  int32_t value;
  std::memcpy(&value, &u, sizeof(int32_t));
  return value;
}

inline float unpack_float(const uint8_t *&ptr) {
  uint32_t tmp = unpack_uint(ptr);
  float value;
  std::memcpy(&value, &tmp, sizeof(float));
  return value;
}

} // namespace xdr
} // namespace molly

#endif // MOLLY_XDR_H
