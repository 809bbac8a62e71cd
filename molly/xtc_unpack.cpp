/*
 * Copyright (c) 2009-2014, Erik Lindahl & David van der Spoel
 * Copyright (c) 2016-2020, Nikolay A. Krylov
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
 * FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
 * DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
 * SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
 * CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
 * OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
 * OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include "xtc_unpack.h"
#include "bit_reader.h"
#include "xtc_error.h"
#include <algorithm>
#include <cmath>
#include <string>

namespace molly {

namespace {

/*
 * sizeofint - calculate smallest number of bits necessary
 * to represent a certain integer.
 */
int sizeofint(uint32_t size) {
  uint64_t num = 1;
  int num_of_bits = 0;

  while (size >= num && num_of_bits < 32) {
    num_of_bits++;
    num <<= 1;
  }
  return num_of_bits;
}

/*
 * sizeofints - calculate 'bitsize' of compressed ints
 *
 * given a number of small unsigned integers and the maximum value
 * return the number of bits needed to read or write them with the
 * triplet routines.
 */
int sizeofints(int num_of_ints, const uint32_t sizes[]) {
  int i;
  uint32_t num, num_of_bytes, num_of_bits, bytes[32], bytecnt, tmp;
  num_of_bytes = 1;
  bytes[0] = 1;
  num_of_bits = 0;
  for (i = 0; i < num_of_ints; i++) {
    tmp = 0;
    for (bytecnt = 0; bytecnt < num_of_bytes; bytecnt++) {
      tmp = bytes[bytecnt] * sizes[i] + tmp;
      bytes[bytecnt] = tmp & 0xff;
      tmp >>= 8;
    }
    while (tmp != 0) {
      bytes[bytecnt++] = tmp & 0xff;
      tmp >>= 8;
    }
    num_of_bytes = bytecnt;
  }
  num = 1;
  num_of_bytes--;
  while (bytes[num_of_bytes] >= num) {
    num_of_bits++;
    num *= 2;
  }
  return num_of_bits + num_of_bytes * 8;
}

const int magicints[] = {
    0,        0,        0,        0,        0,        0,       0,       0,
    0,        8,        10,       12,       16,       20,      25,      32,
    40,       50,       64,       80,       101,      128,     161,     203,
    256,      322,      406,      512,      645,      812,     1024,    1290,
    1625,     2048,     2580,     3250,     4096,     5060,    6501,    8192,
    10321,    13003,    16384,    20642,    26007,    32768,   41285,   52015,
    65536,    82570,    104031,   131072,   165140,   208063,  262144,  330280,
    416127,   524287,   660561,   832255,   1048576,  1321122, 1664510, 2097152,
    2642245,  3329021,  4194304,  5284491,  6658042,  8388607, 10568983,
    13316085, 16777216};

const int FIRSTIDX = 9;
/* note that magicints[FIRSTIDX-1] == 0 */
const int LASTIDX = (sizeof(magicints) / sizeof(*magicints));

struct v3i {
  static const int ND = 3;
  int64_t V[ND];
  v3i(int64_t v = 0) : V{v, v, v} {}
  template <typename T>
  v3i(const T *v) : V{int64_t(v[0]), int64_t(v[1]), int64_t(v[2])} {}

  inline v3i &operator+=(const v3i &u) {
    for (int i = 0; i < ND; i++) {
      V[i] += u.V[i];
    }
    return *this;
  }

  inline v3i &operator-=(const v3i &u) {
    for (int i = 0; i < ND; i++) {
      V[i] -= u.V[i];
    }
    return *this;
  }

  inline void flt_convert(float *v, float inv_p) const {
    for (int i = 0; i < ND; i++) {
      v[i] = inv_p * float(V[i]);
    }
  }
};

void corrupt(const std::string &what) {
  throw XTCError(ErrorCode::CorruptFrame, what);
}

/*
 * Split a mixed-radix number held as little-endian bytes into three
 * coordinates; used when the combined width exceeds 64 bits.
 */
void decodeintsibuf(uint8_t bytes[], int num_of_bytes, const uint32_t sizes[],
                    uint64_t nums[]) {
  int i, j;
  uint32_t num, p;
  static const int num_of_ints = 3;

  for (i = num_of_ints - 1; i > 0; i--) {
    num = 0;
    for (j = num_of_bytes - 1; j >= 0; j--) {
      num = (num << 8) | bytes[j];
      p = num / sizes[i];
      bytes[j] = uint8_t(p);
      num = num - p * sizes[i];
    }
    nums[i] = num;
  }
  nums[0] = uint64_t(bytes[0]) | (uint64_t(bytes[1]) << 8) |
            (uint64_t(bytes[2]) << 16) | (uint64_t(bytes[3]) << 24);
}

// Read one triplet packed as a single mixed-radix integer of bitsize bits
void unpack_triplet(BitReader &br, int bitsize, const uint32_t sizes[],
                    v3i &out) {
  uint8_t bytes[32] = {0};
  if (bitsize > 8 * int(sizeof(bytes) - 4)) {
    corrupt("triplet width " + std::to_string(bitsize) + " bits");
  }
  const int nbytes = br.read_bytes(bitsize, bytes);

  uint64_t nums[3];
  if (bitsize <= 64) {
    uint64_t v = 0;
    for (int i = 0; i < nbytes; i++) {
      v |= uint64_t(bytes[i]) << (8 * i);
    }
    const uint64_t sz = sizes[2];
    const uint64_t sy = sizes[1];
    const uint64_t szy = sz * sy;
    nums[0] = v / szy;
    const uint64_t q1 = v - nums[0] * szy;
    nums[1] = q1 / sz;
    nums[2] = q1 - nums[1] * sz;
  } else {
    decodeintsibuf(bytes, std::max(nbytes, 4), sizes, nums);
  }

  if (nums[0] >= sizes[0]) {
    corrupt("packed triplet out of range");
  }
  for (int i = 0; i < 3; i++) {
    out.V[i] = int64_t(nums[i]);
  }
}

// Per-iteration shape of the stream: a literal triplet stands alone, or it
// anchors a run of small deltas.
enum class Segment { Literal, SmallRun };

} // namespace

void unpack_frame(const CoordinateBlock &cb, const uint8_t *packed_data,
                  size_t nbytes, float *crds, uint32_t limit) {
  if (!(cb.precision > 0.0f) || !std::isfinite(cb.precision)) {
    corrupt("invalid precision " + std::to_string(cb.precision));
  }
  if (cb.smallidx < uint32_t(FIRSTIDX) || cb.smallidx >= uint32_t(LASTIDX)) {
    corrupt("small index " + std::to_string(cb.smallidx) + " out of range");
  }
  limit = std::min(limit, cb.natoms);

  uint32_t sizeint[3];
  int bitsize = 0;
  int bitsizeint[3] = {0, 0, 0};
  for (int i = 0; i < 3; i++) {
    const int64_t span = int64_t(cb.maxint[i]) - int64_t(cb.minint[i]);
    if (span < 0 || span >= int64_t(UINT32_MAX)) {
      corrupt("invalid integer bounds on axis " + std::to_string(i));
    }
    sizeint[i] = uint32_t(span + 1);
  }
  if ((sizeint[0] | sizeint[1] | sizeint[2]) > 0xffffff) {
    bitsizeint[0] = sizeofint(sizeint[0]);
    bitsizeint[1] = sizeofint(sizeint[1]);
    bitsizeint[2] = sizeofint(sizeint[2]);
    bitsize = 0; /* flag the use of large sizes */
  } else {
    bitsize = sizeofints(3, sizeint);
  }
  const bool large = 0 == bitsize;

  const float inv_p = 1.0f / cb.precision;
  const v3i vminint(cb.minint);

  BitReader br(packed_data, nbytes);

  int smallidx = int(cb.smallidx);
  int smaller = magicints[std::max(FIRSTIDX, smallidx - 1)] / 2;
  int smallnum = magicints[smallidx] / 2;
  uint32_t run = 0;
  uint32_t i = 0;

  auto emit = [&](const v3i &v) {
    if (i < limit) {
      v.flt_convert(crds + 3 * size_t(i), inv_p);
    }
    i++;
  };

  while (i < limit) {
    v3i thiscrds;
    if (large) {
      for (int ibig = 0; ibig < 3; ibig++) {
        thiscrds.V[ibig] = br.read(bitsizeint[ibig]);
      }
    } else {
      unpack_triplet(br, bitsize, sizeint, thiscrds);
    }
    thiscrds += vminint;

    int is_smaller = 0;
    if (br.read(1)) {
      run = br.read(5);
      is_smaller = run % 3;
      run -= is_smaller;
      is_smaller--;
    }

    const Segment seg = run > 0 ? Segment::SmallRun : Segment::Literal;
    switch (seg) {
    case Segment::Literal:
      emit(thiscrds);
      break;
    case Segment::SmallRun: {
      const uint32_t nsmall = run / 3;
      if (cb.natoms - i < nsmall + 1) {
        corrupt("run of " + std::to_string(nsmall + 1) + " atoms at atom " +
                std::to_string(i) + " exceeds natoms " +
                std::to_string(cb.natoms));
      }
      const uint32_t sizesmall[3] = {uint32_t(magicints[smallidx]),
                                     uint32_t(magicints[smallidx]),
                                     uint32_t(magicints[smallidx])};
      const v3i vsmallnum(smallnum);
      v3i prevcoord = thiscrds;
      for (uint32_t k = 0; k < nsmall; k++) {
        v3i thissmallcrds;
        unpack_triplet(br, smallidx, sizesmall, thissmallcrds);
        thissmallcrds += prevcoord;
        thissmallcrds -= vsmallnum;
        if (0 == k) {
          // first small atom precedes the literal one (water OHH -> HOH)
          emit(thissmallcrds);
          emit(thiscrds);
        } else {
          emit(thissmallcrds);
        }
        prevcoord = thissmallcrds;
      }
      break;
    }
    }

    smallidx += is_smaller;
    if (smallidx < FIRSTIDX || smallidx >= LASTIDX) {
      corrupt("small index stepped out of range at atom " + std::to_string(i));
    }
    if (is_smaller < 0) {
      smallnum = smaller;
      if (smallidx > FIRSTIDX) {
        smaller = magicints[smallidx - 1] / 2;
      } else {
        smaller = 0;
      }
    } else if (is_smaller > 0) {
      smaller = smallnum;
      smallnum = magicints[smallidx] / 2;
    }
  }

  if (limit == cb.natoms && br.bytes_consumed() != nbytes) {
    corrupt("block declares " + std::to_string(nbytes) + " bytes, decoded " +
            std::to_string(br.bytes_consumed()));
  }
}

} // namespace molly
