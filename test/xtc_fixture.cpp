/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * All rights reserved.
 *
 * Test-only XTC encoder used to synthesize trajectories
 */

#include "xtc_fixture.h"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <limits>
#include <random>
#include <stdexcept>

#include <gtest/gtest.h>

namespace molly_test {

namespace {

const int32_t mxtc = 1995;

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
const int LASTIDX = sizeof(magicints) / sizeof(*magicints);

// Most atoms a single small-delta run may cover (literal + 9 deltas)
const int MAXRUNATOMS = 10;

int sizeofint(uint32_t size) {
  uint64_t num = 1;
  int num_of_bits = 0;

  while (size >= num && num_of_bits < 32) {
    num_of_bits++;
    num <<= 1;
  }
  return num_of_bits;
}

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

class bit_writer {
public:
  bit_writer() : buf(0), bitsused(0) {}

  std::vector<uint8_t> get_buffer() const {
    std::vector<uint8_t> result = written;
    if (bitsused > 0) {
      result.push_back((buf >> 56) & 0xFF);
    }
    return result;
  }

  void write_bits(uint64_t value, int nbits) {
    if (nbits == 0) {
      return;
    }
    value &= (nbits == 64) ? ~uint64_t(0) : ((uint64_t(1) << nbits) - 1);
    buf |= (value << (64 - bitsused - nbits));
    bitsused += nbits;

    while (bitsused >= 8) {
      written.push_back((buf >> 56) & 0xFF);
      buf <<= 8;
      bitsused -= 8;
    }
  }

private:
  uint64_t buf;
  int bitsused;
  std::vector<uint8_t> written;
};

// Pack three values as one mixed-radix integer of num_of_bits bits, least
// significant byte first
void encodeints(bit_writer &bw, int num_of_bits, const uint32_t sizes[],
                const int64_t nums[]) {
  uint32_t bytes[32];
  int i, j, num_of_bytes;

  for (i = 0; i < 3; i++) {
    if (nums[i] < 0 || nums[i] >= int64_t(sizes[i])) {
      throw std::runtime_error("Compression error: value out of bounds");
    }
  }

  uint32_t tmp = uint32_t(nums[0]);
  bytes[0] = tmp & 0xff;
  bytes[1] = (tmp >> 8) & 0xff;
  bytes[2] = (tmp >> 16) & 0xff;
  bytes[3] = (tmp >> 24) & 0xff;
  num_of_bytes = 4;

  for (i = 1; i < 3; i++) {
    uint64_t carry = uint64_t(nums[i]);
    for (j = 0; j < num_of_bytes; j++) {
      uint64_t t = uint64_t(bytes[j]) * sizes[i] + carry;
      bytes[j] = t & 0xff;
      carry = t >> 8;
    }
    while (carry != 0) {
      bytes[num_of_bytes++] = carry & 0xff;
      carry >>= 8;
    }
  }

  int bits_left = num_of_bits;
  for (i = 0; bits_left > 0; i++) {
    int bits_to_write = std::min(8, bits_left);
    uint32_t b = i < num_of_bytes ? bytes[i] : 0;
    bw.write_bits(b, bits_to_write);
    bits_left -= bits_to_write;
  }
}

bool fits_small(const int32_t *a, const int32_t *b, int idx) {
  const int64_t half = magicints[idx] / 2;
  for (int d = 0; d < 3; d++) {
    int64_t v = int64_t(a[d]) - int64_t(b[d]) + half;
    if (v < 0 || v >= magicints[idx]) {
      return false;
    }
  }
  return true;
}

void pack_uint(std::vector<uint8_t> &buf, uint32_t value) {
  buf.push_back((value >> 24) & 0xff);
  buf.push_back((value >> 16) & 0xff);
  buf.push_back((value >> 8) & 0xff);
  buf.push_back(value & 0xff);
}

void pack_int(std::vector<uint8_t> &buf, int32_t value) {
  uint32_t u;
  std::memcpy(&u, &value, sizeof(u));
  pack_uint(buf, u);
}

void pack_float(std::vector<uint8_t> &buf, float value) {
  uint32_t u;
  std::memcpy(&u, &value, sizeof(u));
  pack_uint(buf, u);
}

uint32_t read_be(const std::vector<uint8_t> &buf, size_t at) {
  return (uint32_t(buf[at]) << 24) | (uint32_t(buf[at + 1]) << 16) |
         (uint32_t(buf[at + 2]) << 8) | uint32_t(buf[at + 3]);
}

} // namespace

XTCFixtureWriter::XTCFixtureWriter(float precision, uint32_t initial_smallidx)
    : precision(precision), initial_smallidx(initial_smallidx) {
  if (precision <= 0) {
    throw std::invalid_argument("Precision must be positive");
  }
  if (initial_smallidx < uint32_t(FIRSTIDX) ||
      initial_smallidx >= uint32_t(LASTIDX)) {
    throw std::invalid_argument("Small index out of range");
  }
}

std::vector<int32_t>
XTCFixtureWriter::quantize(const std::vector<float> &coords) const {
  std::vector<int32_t> ints(coords.size());
  for (size_t i = 0; i < coords.size(); i++) {
    ints[i] = int32_t(std::lround(coords[i] * precision));
  }
  return ints;
}

std::vector<float>
XTCFixtureWriter::expected_positions(const FixtureFrame &frame) const {
  const size_t natoms = frame.coords.size() / 3;
  if (natoms <= 9) {
    return frame.coords;
  }
  const float inv_p = 1.0f / precision;
  std::vector<int32_t> ints = quantize(frame.coords);
  std::vector<float> out(ints.size());
  for (size_t i = 0; i < ints.size(); i++) {
    out[i] = inv_p * float(ints[i]);
  }
  return out;
}

std::vector<uint8_t>
XTCFixtureWriter::compress_coords(const std::vector<int32_t> &ints,
                                  uint32_t natoms, int32_t minint[3],
                                  int32_t maxint[3]) const {
  uint32_t sizeint[3];
  for (int d = 0; d < 3; d++) {
    sizeint[d] = uint32_t(int64_t(maxint[d]) - int64_t(minint[d]) + 1);
  }

  const bool large = (sizeint[0] | sizeint[1] | sizeint[2]) > 0xffffff;
  int bitsize = 0;
  int bitsizeint[3] = {0, 0, 0};
  if (large) {
    for (int d = 0; d < 3; d++) {
      bitsizeint[d] = sizeofint(sizeint[d]);
    }
  } else {
    bitsize = sizeofints(3, sizeint);
  }

  bit_writer bw;
  int smallidx = int(initial_smallidx);
  uint32_t prevrun = 0;
  uint32_t i = 0;
  const int32_t *a = ints.data();

  while (i < natoms) {
    // Grow a run: literal atom i+1, first delta atom i, then i+2, i+3, ...
    uint32_t m = 1;
    if (i + 1 < natoms && fits_small(a + 3 * i, a + 3 * (i + 1), smallidx)) {
      m = 2;
      const int32_t *prev = a + 3 * i;
      while (m < uint32_t(MAXRUNATOMS) && i + m < natoms &&
             fits_small(a + 3 * (i + m), prev, smallidx)) {
        prev = a + 3 * (i + m);
        m++;
      }
    }
    const uint32_t nsmall = m > 1 ? m - 1 : 0;

    // Step the small index towards what the neighbourhood needs
    int is_smaller = 0;
    if (nsmall == 0 && i + 1 < natoms && smallidx + 1 < LASTIDX &&
        fits_small(a + 3 * i, a + 3 * (i + 1), smallidx + 1)) {
      is_smaller = 1;
    } else if (nsmall > 0 && smallidx - 1 >= FIRSTIDX) {
      bool fits_lower = fits_small(a + 3 * i, a + 3 * (i + 1), smallidx - 1);
      for (uint32_t k = 2; k < m && fits_lower; k++) {
        const int32_t *prev = (k == 2) ? a + 3 * i : a + 3 * (i + k - 1);
        fits_lower = fits_small(a + 3 * (i + k), prev, smallidx - 1);
      }
      is_smaller = fits_lower ? -1 : 0;
    }

    const int32_t *lit = a + 3 * (nsmall > 0 ? i + 1 : i);
    int64_t lv[3];
    for (int d = 0; d < 3; d++) {
      lv[d] = int64_t(lit[d]) - int64_t(minint[d]);
    }
    if (large) {
      for (int d = 0; d < 3; d++) {
        bw.write_bits(uint64_t(lv[d]), bitsizeint[d]);
      }
    } else {
      encodeints(bw, bitsize, sizeint, lv);
    }

    const uint32_t run = nsmall * 3;
    if (run != prevrun || is_smaller != 0) {
      bw.write_bits(1, 1);
      bw.write_bits(run + uint32_t(is_smaller + 1), 5);
      prevrun = run;
    } else {
      bw.write_bits(0, 1);
    }

    if (nsmall > 0) {
      const uint32_t sizesmall[3] = {uint32_t(magicints[smallidx]),
                                     uint32_t(magicints[smallidx]),
                                     uint32_t(magicints[smallidx])};
      const int64_t half = magicints[smallidx] / 2;
      const int32_t *prev = lit;
      for (uint32_t k = 0; k < nsmall; k++) {
        const int32_t *cur = (k == 0) ? a + 3 * i : a + 3 * (i + 1 + k);
        int64_t sv[3];
        for (int d = 0; d < 3; d++) {
          sv[d] = int64_t(cur[d]) - int64_t(prev[d]) + half;
        }
        encodeints(bw, smallidx, sizesmall, sv);
        prev = cur;
      }
    }

    smallidx += is_smaller;
    i += m;
  }

  return bw.get_buffer();
}

std::vector<uint8_t>
XTCFixtureWriter::encode_frame(const FixtureFrame &frame) const {
  const uint32_t natoms = uint32_t(frame.coords.size() / 3);
  std::vector<uint8_t> rec;

  pack_int(rec, mxtc);
  pack_uint(rec, natoms);
  pack_int(rec, frame.step);
  pack_float(rec, frame.time);
  for (int i = 0; i < 3; i++) {
    for (int j = 0; j < 3; j++) {
      pack_float(rec, frame.box[i][j]);
    }
  }
  pack_uint(rec, natoms);

  if (natoms <= 9) {
    for (float c : frame.coords) {
      pack_float(rec, c);
    }
    return rec;
  }

  std::vector<int32_t> ints = quantize(frame.coords);
  int32_t minint[3], maxint[3];
  for (int d = 0; d < 3; d++) {
    minint[d] = std::numeric_limits<int32_t>::max();
    maxint[d] = std::numeric_limits<int32_t>::min();
  }
  for (uint32_t i = 0; i < natoms; i++) {
    for (int d = 0; d < 3; d++) {
      minint[d] = std::min(minint[d], ints[3 * i + d]);
      maxint[d] = std::max(maxint[d], ints[3 * i + d]);
    }
  }

  std::vector<uint8_t> payload = compress_coords(ints, natoms, minint, maxint);

  pack_float(rec, precision);
  for (int d = 0; d < 3; d++) {
    pack_int(rec, minint[d]);
  }
  for (int d = 0; d < 3; d++) {
    pack_int(rec, maxint[d]);
  }
  pack_uint(rec, initial_smallidx);
  pack_uint(rec, uint32_t(payload.size()));
  rec.insert(rec.end(), payload.begin(), payload.end());
  while (rec.size() % 4 != 0) {
    rec.push_back(0);
  }
  return rec;
}

std::vector<FixtureFrame> make_frames(size_t nframes, size_t natoms,
                                      unsigned seed) {
  std::mt19937 gen(seed);
  std::uniform_real_distribution<float> step(-0.04f, 0.04f);
  std::uniform_real_distribution<float> jump(-1.5f, 1.5f);
  std::uniform_real_distribution<float> drift(-0.01f, 0.01f);
  std::uniform_int_distribution<int> molecule(3, 12);

  std::vector<float> base(natoms * 3);
  float pos[3] = {2.5f, 2.5f, 2.5f};
  int left = 0;
  for (size_t i = 0; i < natoms; i++) {
    bool big = left-- <= 0;
    if (big) {
      left = molecule(gen);
    }
    for (int d = 0; d < 3; d++) {
      pos[d] += big ? jump(gen) : step(gen);
      base[3 * i + d] = pos[d];
    }
  }

  std::vector<FixtureFrame> frames(nframes);
  for (size_t f = 0; f < nframes; f++) {
    FixtureFrame &fr = frames[f];
    fr.step = int32_t(f * 100);
    fr.time = float(f) * 0.2f;
    fr.box = {{{{5.0f, 0.0f, 0.0f}},
               {{0.0f, 5.0f + 0.001f * f, 0.0f}},
               {{0.0f, 0.0f, 5.0f}}}};
    for (float &b : base) {
      b += drift(gen);
    }
    fr.coords = base;
  }
  return frames;
}

std::vector<std::vector<uint8_t>>
encode_all(const std::vector<FixtureFrame> &frames,
           const XTCFixtureWriter &writer) {
  std::vector<std::vector<uint8_t>> records;
  for (const auto &f : frames) {
    records.push_back(writer.encode_frame(f));
  }
  return records;
}

std::string write_trajectory(const std::string &name,
                             const std::vector<FixtureFrame> &frames,
                             const XTCFixtureWriter &writer) {
  std::string path = temp_path(name);
  write_file(path, concat(encode_all(frames, writer)));
  return path;
}

std::vector<uint8_t> concat(const std::vector<std::vector<uint8_t>> &records) {
  std::vector<uint8_t> out;
  for (const auto &r : records) {
    out.insert(out.end(), r.begin(), r.end());
  }
  return out;
}

void write_file(const std::string &path, const std::vector<uint8_t> &bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::out | std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error("Cannot open file for writing: " + path);
  }
  out.write(reinterpret_cast<const char *>(bytes.data()),
            std::streamsize(bytes.size()));
  if (!out.good()) {
    throw std::runtime_error("Write failed: " + path);
  }
}

std::string temp_path(const std::string &name) {
  return ::testing::TempDir() + name;
}

std::vector<uint8_t> truncate_payload(const std::vector<uint8_t> &record) {
  const size_t hdrfull = 92;
  const uint32_t nbytes = read_be(record, hdrfull - 4);
  if (nbytes == 0) {
    throw std::invalid_argument("record has no compressed payload");
  }
  std::vector<uint8_t> out(record.begin(), record.begin() + hdrfull - 4);
  pack_uint(out, nbytes - 1);
  out.insert(out.end(), record.begin() + hdrfull,
             record.begin() + hdrfull + nbytes - 1);
  while (out.size() % 4 != 0) {
    out.push_back(0);
  }
  return out;
}

} // namespace molly_test
