/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * All rights reserved.
 *
 * molly - frame ordinal to byte offset index
 */

#include "frame_index.h"
#include "trajectory_file.h"
#include "xtc_error.h"
#include "xtc_header.h"
#include <string>

namespace molly {

FrameIndex FrameIndex::build(TrajectoryFile &file) {
  FrameIndex index;
  const uint64_t fsize = file.size();
  uint8_t mem[hdrfull];
  uint64_t offset = 0;

  while (offset < fsize) {
    size_t got = file.read_at(offset, mem, hdrfull);
    ParsedHeader ph;
    try {
      ph = parse_header(mem, got);
    } catch (const XTCError &e) {
      // a header cut short by end of file marks an incomplete last frame
      if (e.code() == ErrorCode::TruncatedInput &&
          offset + got == fsize && !index.entries.empty()) {
        break;
      }
      if (e.code() == ErrorCode::TruncatedInput) {
        throw XTCError(ErrorCode::EmptyOrInvalidTrajectory,
                       file.path() + ": no complete frame (" + e.what() + ")");
      }
      throw;
    }

    if (offset + ph.record_length > fsize) {
      if (index.entries.empty()) {
        throw XTCError(ErrorCode::EmptyOrInvalidTrajectory,
                       file.path() + ": first frame extends past end of file");
      }
      break;
    }

    FrameIndexEntry entry;
    entry.frame_ordinal = index.entries.size();
    entry.byte_offset = offset;
    entry.record_length = ph.record_length;
    index.entries.push_back(entry);
    offset += ph.record_length;
  }

  if (index.entries.empty()) {
    throw XTCError(ErrorCode::EmptyOrInvalidTrajectory,
                   file.path() + ": empty trajectory");
  }
  return index;
}

const FrameIndexEntry &FrameIndex::entry(uint64_t ordinal) const {
  if (ordinal >= entries.size()) {
    throw XTCError(ErrorCode::OutOfRangeSelection,
                   "frame " + std::to_string(ordinal) + " of " +
                       std::to_string(entries.size()));
  }
  return entries[ordinal];
}

std::vector<uint64_t> FrameIndex::offsets() const {
  std::vector<uint64_t> v;
  v.reserve(entries.size());
  for (const auto &e : entries) {
    v.push_back(e.byte_offset);
  }
  return v;
}

std::vector<uint64_t> FrameIndex::frame_sizes() const {
  std::vector<uint64_t> v;
  v.reserve(entries.size());
  for (const auto &e : entries) {
    v.push_back(e.record_length);
  }
  return v;
}

} // namespace molly
