/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * All rights reserved.
 *
 * C++ XTCReader class - implementation file
 */

#include "xtc_reader.h"
#include "xdr.h"
#include "xtc_error.h"
#include "xtc_header.h"
#include "xtc_unpack.h"
#include <algorithm>
#include <exception>
#include <utility>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace molly {

namespace {

struct DecodeSlot {
  Frame frame;
  std::vector<float> scratch;
};

// Decode one complete frame record of len bytes
void decode_record(const uint8_t *rec, size_t len, const AtomSelection &atoms,
                   DecodeSlot &slot) {
  ParsedHeader ph = parse_header(rec, len);
  if (ph.record_length > len) {
    throw XTCError(ErrorCode::TruncatedInput,
                   "frame record needs " + std::to_string(ph.record_length) +
                       " bytes, have " + std::to_string(len));
  }
  const FrameHeader &h = ph.header;
  ResolvedAtoms ra(atoms, h.natoms);

  Frame &out = slot.frame;
  out.time = h.time;
  out.step = h.step;
  out.precision = h.precision;
  for (int i = 0; i < 3; i++) {
    for (int j = 0; j < 3; j++) {
      out.box[i][j] = float(h.box[i][j]);
    }
  }

  const uint32_t limit = ra.decode_limit();
  float *crds;
  if (ra.is_prefix()) {
    out.positions.resize(size_t(limit) * 3);
    crds = out.positions.data();
  } else {
    slot.scratch.resize(size_t(limit) * 3);
    crds = slot.scratch.data();
  }

  const uint8_t *payload = rec + ph.header_length;
  if (h.compressed()) {
    unpack_frame(h.coordinate_block(), payload, h.compressed_byte_count, crds,
                 limit);
  } else {
    for (size_t i = 0; i < size_t(limit) * 3; i++) {
      crds[i] = xdr::unpack_float(payload);
    }
  }

  if (!ra.is_prefix()) {
    const std::vector<uint32_t> &rows = ra.indices();
    out.positions.resize(rows.size() * 3);
    for (size_t r = 0; r < rows.size(); r++) {
      const float *src = crds + 3 * size_t(rows[r]);
      out.positions[3 * r] = src[0];
      out.positions[3 * r + 1] = src[1];
      out.positions[3 * r + 2] = src[2];
    }
  }
}

} // namespace

XTCReader::XTCReader(const std::string &fname, const ReaderOptions &opts)
    : filename(fname), opts(opts), file(fname), st(ReaderState::Opened),
      next_ordinal(0), next_offset(0) {
  if (opts.eager_index) {
    ensure_index();
  } else {
    // Validate the first frame header even when the scan is deferred
    uint8_t mem[hdrfull];
    size_t got = file.read_at(0, mem, hdrfull);
    try {
      ParsedHeader ph = parse_header(mem, got);
      if (ph.record_length > file.size()) {
        throw XTCError(ErrorCode::EmptyOrInvalidTrajectory,
                       fname + ": first frame extends past end of file");
      }
    } catch (const XTCError &e) {
      if (e.code() == ErrorCode::TruncatedInput) {
        throw XTCError(ErrorCode::EmptyOrInvalidTrajectory,
                       fname + ": no complete frame (" + e.what() + ")");
      }
      throw;
    }
  }
}

XTCReader::XTCReader(XTCReader &&other)
    : filename(std::move(other.filename)), opts(other.opts),
      file(std::move(other.file)), index(std::move(other.index)),
      st(other.st), next_ordinal(other.next_ordinal),
      next_offset(other.next_offset), buf(std::move(other.buf)),
      spare_positions(std::move(other.spare_positions)) {
  other.index.reset();
  other.st = ReaderState::Closed;
}

XTCReader &XTCReader::operator=(XTCReader &&other) {
  if (this != &other) {
    close();
    filename = std::move(other.filename);
    opts = other.opts;
    file = std::move(other.file);
    index = std::move(other.index);
    st = other.st;
    next_ordinal = other.next_ordinal;
    next_offset = other.next_offset;
    buf = std::move(other.buf);
    spare_positions = std::move(other.spare_positions);
    other.index.reset();
    other.st = ReaderState::Closed;
  }
  return *this;
}

XTCReader::~XTCReader() { close(); }

void XTCReader::ensure_open() const {
  if (st == ReaderState::Closed) {
    throw XTCError(ErrorCode::ReaderClosed, filename + " is closed");
  }
}

const FrameIndex &XTCReader::ensure_index() {
  ensure_open();
  if (!index) {
    index = FrameIndex::build(file);
    st = ReaderState::IndexReady;
  }
  return *index;
}

int XTCReader::num_threads() const {
#ifdef _OPENMP
  return std::max(1, std::min(opts.nt, omp_get_num_procs()));
#else
  return 1;
#endif
}

void XTCReader::read_exact(uint64_t offset, uint8_t *dst, size_t n) {
  size_t got = file.read_at(offset, dst, n);
  if (got != n) {
    throw XTCError(ErrorCode::TruncatedInput,
                   "expected " + std::to_string(n) + " bytes at offset " +
                       std::to_string(offset) + ", got " +
                       std::to_string(got));
  }
}

Frame XTCReader::read_frame() {
  Frame frame;
  read_frame(frame);
  return frame;
}

void XTCReader::read_frame(Frame &frame) {
  ensure_open();

  uint64_t offset;
  uint64_t reclen;
  if (index) {
    if (next_ordinal >= index->frame_count()) {
      throw XTCError(ErrorCode::EndOfTrajectory,
                     "no frame " + std::to_string(next_ordinal) + " in " +
                         filename);
    }
    offset = index->offset_of(next_ordinal);
    reclen = index->size_of(next_ordinal);
  } else {
    offset = next_offset;
    uint8_t mem[hdrfull];
    size_t got = file.read_at(offset, mem, hdrfull);
    ParsedHeader ph;
    try {
      ph = parse_header(mem, got);
    } catch (const XTCError &e) {
      // an incomplete last record is not part of the trajectory
      if (e.code() != ErrorCode::TruncatedInput) {
        throw;
      }
      got = 0;
    }
    if (got == 0 || offset + ph.record_length > file.size()) {
      throw XTCError(ErrorCode::EndOfTrajectory,
                     "no frame " + std::to_string(next_ordinal) + " in " +
                         filename);
    }
    reclen = ph.record_length;
  }

  buf.resize(reclen);
  read_exact(offset, buf.data(), reclen);

  // Decode into spare storage so frame is untouched when decoding fails;
  // the caller's old coordinate storage becomes the next spare
  DecodeSlot slot;
  slot.frame.positions.swap(spare_positions);
  decode_record(buf.data(), reclen, AtomSelection::all(), slot);
  spare_positions.swap(frame.positions);
  frame = std::move(slot.frame);

  next_ordinal++;
  next_offset = offset + reclen;
}

Frame XTCReader::read_frame_at(uint64_t ordinal, const AtomSelection &atoms) {
  const FrameIndex &idx = ensure_index();
  idx.entry(ordinal);

  Frame result;
  decode_frames(std::vector<uint64_t>(1, ordinal), atoms,
                [&](size_t, Frame &f) { result = std::move(f); });
  return result;
}

std::vector<Frame> XTCReader::read_frames(const FrameSelection &frames,
                                          const AtomSelection &atoms) {
  const FrameIndex &idx = ensure_index();
  std::vector<uint64_t> ordinals = resolve_frames(frames, idx.frame_count());

  std::vector<Frame> result(ordinals.size());
  decode_frames(ordinals, atoms,
                [&](size_t pos, Frame &f) { result[pos] = std::move(f); });
  return result;
}

bool XTCReader::read_into_array(const ArrayView<float, 3> &coordinate_array,
                                const ArrayView<float, 3> &boxvec_array,
                                const ArrayView<float, 1> *time_array,
                                const FrameSelection &frames,
                                const AtomSelection &atoms) {
  const FrameIndex &idx = ensure_index();
  std::vector<uint64_t> ordinals = resolve_frames(frames, idx.frame_count());
  const size_t nframes = ordinals.size();

  if (coordinate_array.shape[2] != 3) {
    throw XTCError(ErrorCode::ShapeMismatch,
                   "coordinate array must be of shape (nframes, natoms, 3)");
  }
  if (boxvec_array.shape[1] != 3 || boxvec_array.shape[2] != 3) {
    throw XTCError(ErrorCode::ShapeMismatch,
                   "boxvec array must be of shape (nframes, 3, 3)");
  }
  if (coordinate_array.shape[0] != nframes ||
      boxvec_array.shape[0] != nframes ||
      (time_array && time_array->shape[0] != nframes)) {
    throw XTCError(ErrorCode::ShapeMismatch,
                   "arrays must hold " + std::to_string(nframes) +
                       " frames, coordinate array holds " +
                       std::to_string(coordinate_array.shape[0]));
  }

  // Check every selected frame's atom count before touching the buffers
  uint8_t mem[hdrfull];
  for (uint64_t ord : ordinals) {
    size_t got = file.read_at(idx.offset_of(ord), mem, hdrfull);
    ParsedHeader ph = parse_header(mem, got);
    ResolvedAtoms ra(atoms, ph.header.natoms);
    if (ra.count() != coordinate_array.shape[1]) {
      throw XTCError(ErrorCode::ShapeMismatch,
                     "frame " + std::to_string(ord) + " selects " +
                         std::to_string(ra.count()) +
                         " atoms, coordinate array holds " +
                         std::to_string(coordinate_array.shape[1]));
    }
  }

  // Stage every frame first so that a decoding error leaves the buffers
  // untouched
  std::vector<Frame> staged(nframes);
  decode_frames(ordinals, atoms, [&](size_t pos, Frame &f) {
    staged[pos] = std::move(f);
  });

  for (size_t pos = 0; pos < nframes; pos++) {
    const Frame &f = staged[pos];
    const uint32_t na = f.natoms();
    for (uint32_t a = 0; a < na; a++) {
      for (int d = 0; d < 3; d++) {
        coordinate_array.at(pos, a, d) = f.positions[3 * size_t(a) + d];
      }
    }
    for (int i = 0; i < 3; i++) {
      for (int j = 0; j < 3; j++) {
        boxvec_array.at(pos, i, j) = f.box[i][j];
      }
    }
    if (time_array) {
      time_array->at(pos) = float(f.time);
    }
  }
  return true;
}

void XTCReader::decode_frames(const std::vector<uint64_t> &ordinals,
                              const AtomSelection &atoms,
                              const FrameSink &sink) {
  const FrameIndex &idx = ensure_index();
  const size_t n = ordinals.size();
  const int nth = num_threads();

  std::vector<DecodeSlot> slots;
  std::vector<size_t> starts;
  size_t pos = 0;

  while (pos < n) {
    // Gather a batch of whole records
    size_t end = pos;
    uint64_t bytes = 0;
    do {
      bytes += idx.size_of(ordinals[end]);
      end++;
    } while (opts.buffered && end < n &&
             bytes + idx.size_of(ordinals[end]) <= opts.batch_bytes);
    const size_t nb = end - pos;

    bool ascending = true;
    for (size_t k = pos + 1; k < end; k++) {
      ascending = ascending && ordinals[k] > ordinals[k - 1];
    }
    const uint64_t first = idx.offset_of(ordinals[pos]);
    const uint64_t last = idx.offset_of(ordinals[end - 1]) +
                          idx.size_of(ordinals[end - 1]);

    starts.resize(nb);
    if (ascending && last - first <= 2 * bytes) {
      // One read covering the batch, skipped frames included
      buf.resize(last - first);
      read_exact(first, buf.data(), last - first);
      for (size_t k = 0; k < nb; k++) {
        starts[k] = idx.offset_of(ordinals[pos + k]) - first;
      }
    } else {
      buf.resize(bytes);
      size_t off = 0;
      for (size_t k = 0; k < nb; k++) {
        const uint64_t len = idx.size_of(ordinals[pos + k]);
        read_exact(idx.offset_of(ordinals[pos + k]), buf.data() + off, len);
        starts[k] = off;
        off += len;
      }
    }

    if (slots.size() < nb) {
      slots.resize(nb);
    }
    std::vector<std::exception_ptr> errors(nb);
    const uint8_t *data = buf.data();

#ifdef _OPENMP
#pragma omp parallel for num_threads(nth) schedule(dynamic) if (nb > 1 && nth > 1)
#endif
    for (long k = 0; k < long(nb); k++) {
      try {
        decode_record(data + starts[k], idx.size_of(ordinals[pos + k]), atoms,
                      slots[k]);
      } catch (...) {
        errors[k] = std::current_exception();
      }
    }
    (void)nth;

    for (size_t k = 0; k < nb; k++) {
      if (errors[k]) {
        std::rethrow_exception(errors[k]);
      }
    }
    for (size_t k = 0; k < nb; k++) {
      sink(pos + k, slots[k].frame);
    }
    pos = end;
  }
}

void XTCReader::home() {
  ensure_open();
  next_ordinal = 0;
  next_offset = 0;
}

void XTCReader::refresh() {
  ensure_open();
  file.refresh_size();
  index = FrameIndex::build(file);
  st = ReaderState::IndexReady;
}

size_t XTCReader::frame_count() { return ensure_index().frame_count(); }

std::vector<uint64_t> XTCReader::offsets() { return ensure_index().offsets(); }

std::vector<uint64_t> XTCReader::frame_sizes() {
  return ensure_index().frame_sizes();
}

void XTCReader::close() {
  file.close();
  index.reset();
  st = ReaderState::Closed;
}

} // namespace molly
