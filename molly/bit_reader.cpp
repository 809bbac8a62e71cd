/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * All rights reserved.
 *
 * molly - bit cursor over a compressed coordinate block
 */

#include "bit_reader.h"
#include "xtc_error.h"
#include <algorithm>
#include <string>

namespace molly {

BitReader::BitReader(const uint8_t *data, size_t size, uint64_t bitpos)
    : data(data), nbits(uint64_t(size) * 8), bitpos(bitpos) {
  require(0);
}

void BitReader::require(uint64_t num_of_bits) const {
  if (bitpos > nbits || nbits - bitpos < num_of_bits) {
    throw XTCError(ErrorCode::TruncatedInput,
                   "need " + std::to_string(num_of_bits) + " bits at bit " +
                       std::to_string(bitpos) + " of " + std::to_string(nbits));
  }
}

uint32_t BitReader::read(int num_of_bits) {
  if (num_of_bits < 0 || num_of_bits > 32) {
    throw XTCError(ErrorCode::CorruptFrame,
                   "invalid bit width " + std::to_string(num_of_bits));
  }
  require(num_of_bits);

  uint64_t value = 0;
  int need = num_of_bits;
  while (need > 0) {
    const uint8_t byte = data[bitpos >> 3];
    const int avail = 8 - int(bitpos & 7);
    const int take = std::min(avail, need);
    const uint32_t bits = (byte >> (avail - take)) & ((1u << take) - 1);
    value = (value << take) | bits;
    bitpos += take;
    need -= take;
  }
  return uint32_t(value);
}

int BitReader::read_bytes(int num_of_bits, uint8_t bytes[]) {
  require(num_of_bits);
  int nbytes = 0;
  while (num_of_bits >= 8) {
    bytes[nbytes++] = uint8_t(read(8));
    num_of_bits -= 8;
  }
  if (num_of_bits > 0) {
    bytes[nbytes++] = uint8_t(read(num_of_bits));
  }
  return nbytes;
}

void BitReader::skip(uint64_t num_of_bits) {
  require(num_of_bits);
  bitpos += num_of_bits;
}

} // namespace molly
