/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * All rights reserved.
 *
 * molly - frame and atom selections
 */

#include "selection.h"
#include "xtc_error.h"
#include <algorithm>
#include <string>

namespace molly {

FrameSelection FrameSelection::range(std::optional<int64_t> start,
                                     std::optional<int64_t> stop,
                                     int64_t step) {
  if (step == 0) {
    throw XTCError(ErrorCode::InvalidSelection, "slice step cannot be zero");
  }
  FrameSelection sel;
  sel.kind_ = Kind::Range;
  sel.start_ = start;
  sel.stop_ = stop;
  sel.step_ = step;
  return sel;
}

FrameSelection FrameSelection::list(std::vector<int64_t> ordinals) {
  FrameSelection sel;
  sel.kind_ = Kind::FrameList;
  sel.ordinals_ = std::move(ordinals);
  return sel;
}

AtomSelection AtomSelection::indices(std::vector<uint32_t> idx) {
  AtomSelection sel;
  sel.kind_ = Kind::IndexList;
  sel.indices_ = std::move(idx);
  return sel;
}

AtomSelection AtomSelection::mask(std::vector<bool> m) {
  AtomSelection sel;
  sel.kind_ = Kind::Mask;
  sel.mask_ = std::move(m);
  return sel;
}

AtomSelection AtomSelection::until(uint32_t n) {
  AtomSelection sel;
  sel.kind_ = Kind::Until;
  sel.until_ = n;
  return sel;
}

namespace {

void out_of_range(const std::string &what, uint64_t value, uint64_t bound) {
  throw XTCError(ErrorCode::OutOfRangeSelection,
                 what + " " + std::to_string(value) + " out of range for " +
                     std::to_string(bound));
}

// Clamp a slice bound the way sequence slicing does
int64_t adjust_bound(const std::optional<int64_t> &bound, int64_t len,
                     int64_t step, bool is_start) {
  if (!bound) {
    if (step < 0) {
      return is_start ? len - 1 : -1;
    }
    return is_start ? 0 : len;
  }
  int64_t v = *bound;
  if (v < 0) {
    v += len;
    if (v < 0) {
      v = step < 0 ? -1 : 0;
    }
  } else if (v >= len) {
    v = step < 0 ? len - 1 : len;
  }
  return v;
}

} // namespace

ResolvedAtoms::ResolvedAtoms(const AtomSelection &sel, uint32_t natoms)
    : natoms_(natoms), limit(natoms), prefix(true) {
  switch (sel.kind_) {
  case AtomSelection::Kind::All:
    break;
  case AtomSelection::Kind::Until:
    if (sel.until_ > natoms) {
      out_of_range("atom count", sel.until_, natoms);
    }
    limit = sel.until_;
    break;
  case AtomSelection::Kind::IndexList:
    prefix = false;
    limit = 0;
    for (uint32_t idx : sel.indices_) {
      if (idx >= natoms) {
        out_of_range("atom index", idx, natoms);
      }
      limit = std::max(limit, idx + 1);
    }
    rows = sel.indices_;
    break;
  case AtomSelection::Kind::Mask:
    if (sel.mask_.size() > natoms) {
      out_of_range("atom mask length", sel.mask_.size(), natoms);
    }
    prefix = false;
    limit = 0;
    for (uint32_t idx = 0; idx < sel.mask_.size(); idx++) {
      if (sel.mask_[idx]) {
        rows.push_back(idx);
        limit = idx + 1;
      }
    }
    break;
  }
}

std::vector<uint64_t> resolve_frames(const FrameSelection &sel,
                                     uint64_t frame_count) {
  std::vector<uint64_t> out;
  const int64_t len = int64_t(frame_count);

  switch (sel.kind()) {
  case FrameSelection::Kind::All:
    out.resize(frame_count);
    for (uint64_t i = 0; i < frame_count; i++) {
      out[i] = i;
    }
    break;
  case FrameSelection::Kind::Range: {
    const int64_t step = sel.step();
    if (step == 0) {
      throw XTCError(ErrorCode::InvalidSelection, "slice step cannot be zero");
    }
    const int64_t start = adjust_bound(sel.start(), len, step, true);
    const int64_t stop = adjust_bound(sel.stop(), len, step, false);
    // distances are compared unsigned so that huge steps cannot overflow
    const uint64_t stride = step > 0 ? uint64_t(step) : uint64_t(0) - uint64_t(step);
    if (step > 0) {
      for (int64_t i = start; i < stop;) {
        out.push_back(uint64_t(i));
        if (uint64_t(stop - i) <= stride) {
          break;
        }
        i += step;
      }
    } else {
      for (int64_t i = start; i > stop;) {
        out.push_back(uint64_t(i));
        if (uint64_t(i - stop) <= stride) {
          break;
        }
        i += step;
      }
    }
    break;
  }
  case FrameSelection::Kind::FrameList:
    out.reserve(sel.ordinals().size());
    for (int64_t ord : sel.ordinals()) {
      int64_t v = ord < 0 ? ord + len : ord;
      if (v < 0 || v >= len) {
        throw XTCError(ErrorCode::OutOfRangeSelection,
                       "frame " + std::to_string(ord) + " out of range for " +
                           std::to_string(frame_count) + " frames");
      }
      out.push_back(uint64_t(v));
    }
    break;
  }
  return out;
}

} // namespace molly
