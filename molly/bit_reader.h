/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * All rights reserved.
 *
 * molly - bit cursor over a compressed coordinate block
 */

#ifndef MOLLY_BIT_READER_H
#define MOLLY_BIT_READER_H

#include <cstddef>
#include <cstdint>

namespace molly {

/*
 * Reads unsigned values of 0..32 bits, most significant bit first, with no
 * alignment between consecutive values. The only state is the bit position.
 * Reading past the end of the byte range throws TruncatedInput.
 */
class BitReader {
public:
  BitReader(const uint8_t *data, size_t size, uint64_t bitpos = 0);

  uint32_t read(int num_of_bits);

  // Read a byte-wise little-endian composite of num_of_bits bits into
  // bytes[], as written by the triplet encoder. Returns the byte count.
  int read_bytes(int num_of_bits, uint8_t bytes[]);

  void skip(uint64_t num_of_bits);

  uint64_t position() const { return bitpos; }
  uint64_t bits_left() const { return nbits - bitpos; }

  // Bytes touched so far, counting a partially consumed byte
  uint64_t bytes_consumed() const { return (bitpos + 7) >> 3; }

private:
  void require(uint64_t num_of_bits) const;

  const uint8_t *data;
  uint64_t nbits;
  uint64_t bitpos;
};

} // namespace molly

#endif // MOLLY_BIT_READER_H
