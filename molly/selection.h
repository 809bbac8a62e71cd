/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * All rights reserved.
 *
 * molly - frame and atom selections
 */

#ifndef MOLLY_SELECTION_H
#define MOLLY_SELECTION_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace molly {

/*
 * Which frames to read. A range follows slice semantics: open bounds,
 * negative indices counting from the end, and a non-zero (possibly
 * negative) step.
 */
class FrameSelection {
public:
  enum class Kind { All, Range, FrameList };

  FrameSelection() : kind_(Kind::All), step_(1) {}

  static FrameSelection all() { return FrameSelection(); }
  static FrameSelection range(std::optional<int64_t> start,
                              std::optional<int64_t> stop, int64_t step = 1);
  static FrameSelection list(std::vector<int64_t> ordinals);

  Kind kind() const { return kind_; }
  const std::optional<int64_t> &start() const { return start_; }
  const std::optional<int64_t> &stop() const { return stop_; }
  int64_t step() const { return step_; }
  const std::vector<int64_t> &ordinals() const { return ordinals_; }

private:
  Kind kind_;
  std::optional<int64_t> start_, stop_;
  int64_t step_;
  std::vector<int64_t> ordinals_;
};

/*
 * Which atoms to keep from each selected frame.
 * IndexList keeps the given order and may repeat indices.
 * Mask keeps atoms whose flag is set; atoms beyond the mask are dropped.
 * Until(n) keeps the first n atoms.
 */
class AtomSelection {
public:
  enum class Kind { All, IndexList, Mask, Until };

  AtomSelection() : kind_(Kind::All), until_(0) {}

  static AtomSelection all() { return AtomSelection(); }
  static AtomSelection indices(std::vector<uint32_t> idx);
  static AtomSelection mask(std::vector<bool> m);
  static AtomSelection until(uint32_t n);

  Kind kind() const { return kind_; }
  bool is_all() const { return kind_ == Kind::All; }

private:
  friend class ResolvedAtoms;

  Kind kind_;
  std::vector<uint32_t> indices_;
  std::vector<bool> mask_;
  uint32_t until_;
};

// Atom selection made concrete for a frame of natoms atoms
class ResolvedAtoms {
public:
  // Throws OutOfRangeSelection
  ResolvedAtoms(const AtomSelection &sel, uint32_t natoms);

  uint32_t natoms() const { return natoms_; }
  // Number of atoms that a decode must produce: max selected index + 1
  uint32_t decode_limit() const { return limit; }
  // True when output rows equal the decoded rows 0..count()-1
  bool is_prefix() const { return prefix; }
  size_t count() const { return prefix ? limit : rows.size(); }
  const std::vector<uint32_t> &indices() const { return rows; }

private:
  uint32_t natoms_;
  uint32_t limit;
  bool prefix;
  std::vector<uint32_t> rows;
};

/*
 * Ordered frame ordinals selected out of frame_count frames.
 * Throws InvalidSelection for a zero step, OutOfRangeSelection for a
 * listed ordinal outside [-frame_count, frame_count).
 */
std::vector<uint64_t> resolve_frames(const FrameSelection &sel,
                                     uint64_t frame_count);

} // namespace molly

#endif // MOLLY_SELECTION_H
