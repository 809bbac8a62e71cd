/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * All rights reserved.
 *
 * molly - XTC frame header parsing
 */

#include "xtc_header.h"
#include "xdr.h"
#include "xtc_error.h"
#include <string>

namespace molly {

CoordinateBlock FrameHeader::coordinate_block() const {
  CoordinateBlock cb;
  for (int i = 0; i < 3; i++) {
    cb.minint[i] = minint[i];
    cb.maxint[i] = maxint[i];
  }
  cb.smallidx = smallidx;
  cb.natoms = natoms;
  cb.precision = precision;
  return cb;
}

ParsedHeader parse_header(const uint8_t *data, size_t size) {
  if (size < size_t(hdr1)) {
    throw XTCError(ErrorCode::TruncatedInput,
                   "frame header needs " + std::to_string(hdr1) +
                       " bytes, have " + std::to_string(size));
  }

  const uint8_t *ptr = data;
  ParsedHeader ph;
  FrameHeader &h = ph.header;

  int32_t magic = xdr::unpack_int(ptr);
  if (magic != mxtc) {
    throw XTCError(ErrorCode::WrongMagicNumber,
                   "expected " + std::to_string(mxtc) + ", found " +
                       std::to_string(magic));
  }

  int32_t natoms = xdr::unpack_int(ptr);
  if (natoms < 0) {
    throw XTCError(ErrorCode::CorruptFrame,
                   "negative atom count " + std::to_string(natoms));
  }
  h.natoms = uint32_t(natoms);
  h.step = xdr::unpack_int(ptr);
  h.time = xdr::unpack_float(ptr);

  for (int i = 0; i < 9; i++) {
    h.box[i / 3][i % 3] = xdr::unpack_float(ptr);
  }

  int32_t lsize = xdr::unpack_int(ptr);
  if (lsize != natoms) {
    throw XTCError(ErrorCode::CorruptFrame,
                   "atom count " + std::to_string(natoms) +
                       " does not match coordinate count " +
                       std::to_string(lsize));
  }

  for (int i = 0; i < 3; i++) {
    h.minint[i] = h.maxint[i] = 0;
  }
  h.smallidx = 0;

  if (!h.compressed()) {
    h.precision = 0.0f;
    h.compressed_byte_count = h.natoms * flt3len;
    ph.header_length = hdr1;
    ph.record_length = uint64_t(hdr1) + h.compressed_byte_count;
    return ph;
  }

  if (size < size_t(hdrfull)) {
    throw XTCError(ErrorCode::TruncatedInput,
                   "compressed frame header needs " + std::to_string(hdrfull) +
                       " bytes, have " + std::to_string(size));
  }

  h.precision = xdr::unpack_float(ptr);
  for (int i = 0; i < 3; i++) {
    h.minint[i] = xdr::unpack_int(ptr);
  }
  for (int i = 0; i < 3; i++) {
    h.maxint[i] = xdr::unpack_int(ptr);
  }
  h.smallidx = xdr::unpack_uint(ptr);
  h.compressed_byte_count = xdr::unpack_uint(ptr);

  ph.header_length = hdrfull;
  ph.record_length = hdrfull + xdr::align4(h.compressed_byte_count);
  return ph;
}

} // namespace molly
