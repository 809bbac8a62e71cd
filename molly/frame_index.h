/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * All rights reserved.
 *
 * molly - frame ordinal to byte offset index
 */

#ifndef MOLLY_FRAME_INDEX_H
#define MOLLY_FRAME_INDEX_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace molly {

class TrajectoryFile;

struct FrameIndexEntry {
  uint64_t frame_ordinal;
  uint64_t byte_offset;
  uint64_t record_length;
};

/*
 * Dense, ordered list of frame records found by a forward header scan.
 * A truncated record at the end of the file is left out. The index is a
 * derived cache: it is never patched, only rebuilt.
 */
class FrameIndex {
public:
  FrameIndex() = default;

  // Throws EmptyOrInvalidTrajectory when no complete frame exists,
  // WrongMagicNumber / CorruptFrame on a malformed header before the tail.
  static FrameIndex build(TrajectoryFile &file);

  size_t frame_count() const { return entries.size(); }
  bool empty() const { return entries.empty(); }

  // Throws OutOfRangeSelection
  const FrameIndexEntry &entry(uint64_t ordinal) const;
  uint64_t offset_of(uint64_t ordinal) const {
    return entry(ordinal).byte_offset;
  }
  uint64_t size_of(uint64_t ordinal) const {
    return entry(ordinal).record_length;
  }

  std::vector<uint64_t> offsets() const;
  std::vector<uint64_t> frame_sizes() const;

private:
  std::vector<FrameIndexEntry> entries;
};

} // namespace molly

#endif // MOLLY_FRAME_INDEX_H
