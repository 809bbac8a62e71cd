/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * All rights reserved.
 *
 * molly - XTC coordinate block decompression
 */

#ifndef MOLLY_XTC_UNPACK_H
#define MOLLY_XTC_UNPACK_H

#include <cstddef>
#include <cstdint>

namespace molly {

// Parameters of one compressed coordinate block, taken from the frame header
struct CoordinateBlock {
  int32_t minint[3];
  int32_t maxint[3];
  uint32_t smallidx;
  uint32_t natoms;
  float precision;
};

/*
 * Decode the first `limit` atoms of a compressed block of `nbytes` bytes into
 * crds (3 floats per atom). When limit == natoms the whole block must be
 * consumed exactly. Throws XTCError (CorruptFrame, TruncatedInput).
 * No state is kept between calls.
 */
void unpack_frame(const CoordinateBlock &cb, const uint8_t *packed_data,
                  size_t nbytes, float *crds, uint32_t limit);

inline void unpack_frame(const CoordinateBlock &cb, const uint8_t *packed_data,
                         size_t nbytes, float *crds) {
  unpack_frame(cb, packed_data, nbytes, crds, cb.natoms);
}

} // namespace molly

#endif // MOLLY_XTC_UNPACK_H
