/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * All rights reserved.
 *
 * molly - XTC frame header parsing
 */

#ifndef MOLLY_XTC_HEADER_H
#define MOLLY_XTC_HEADER_H

#include "xtc_unpack.h"
#include <array>
#include <cstddef>
#include <cstdint>

namespace molly {

static constexpr int32_t mxtc = 1995;

// magic, natoms, step, time, box[9], natoms again
static constexpr int hdr1 = 4 * 4 + 4 * 9 + 4;
// precision, minint[3], maxint[3], smallidx, byte count
static constexpr int hdr2 = 4 * 9;
static constexpr int hdrfull = hdr1 + hdr2;
static constexpr int flt3len = 3 * 4;

// Frames with at most this many atoms are stored as raw floats
static constexpr uint32_t max_uncompressed_atoms = 9;

struct FrameHeader {
  uint32_t natoms;
  int64_t step;
  double time;
  std::array<std::array<double, 3>, 3> box;
  float precision; // 0 for uncompressed frames
  uint32_t compressed_byte_count;

  // Coordinate block preamble, meaningful only when compressed
  int32_t minint[3];
  int32_t maxint[3];
  uint32_t smallidx;

  bool compressed() const { return natoms > max_uncompressed_atoms; }

  CoordinateBlock coordinate_block() const;
};

struct ParsedHeader {
  FrameHeader header;
  uint32_t header_length;  // bytes before the coordinate payload
  uint64_t record_length;  // header + payload, including XDR padding
};

/*
 * Parse the header of the frame record starting at data. size is the number
 * of bytes available; hdrfull bytes are enough for any frame.
 * Throws TruncatedInput when size is too small, WrongMagicNumber and
 * CorruptFrame on inconsistent fields.
 */
ParsedHeader parse_header(const uint8_t *data, size_t size);

} // namespace molly

#endif // MOLLY_XTC_HEADER_H
