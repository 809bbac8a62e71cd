/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * All rights reserved.
 *
 * C++ XTCReader class - header file
 */

#ifndef MOLLY_XTC_READER_H
#define MOLLY_XTC_READER_H

#include "array_view.h"
#include "frame.h"
#include "frame_index.h"
#include "selection.h"
#include "trajectory_file.h"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace molly {

struct ReaderOptions {
  // Read selected frames in batches of up to batch_bytes and decode each
  // batch on up to nt threads
  bool buffered = true;
  size_t batch_bytes = size_t(16) << 20;
  int nt = 4;
  // Scan the whole file for frame offsets when opening
  bool eager_index = true;
};

enum class ReaderState { Opened, IndexReady, Closed };

/*
 * Reader for one XTC trajectory. Not safe for concurrent use: the
 * sequential cursor and the lazily built index are plain members.
 */
class XTCReader {
public:
  // Throws FileNotFound, WrongMagicNumber, EmptyOrInvalidTrajectory
  explicit XTCReader(const std::string &fname,
                     const ReaderOptions &opts = ReaderOptions());

  static XTCReader open(const std::string &fname,
                        const ReaderOptions &opts = ReaderOptions()) {
    return XTCReader(fname, opts);
  }

  // A moved-from reader is closed
  XTCReader(XTCReader &&other);
  XTCReader &operator=(XTCReader &&other);

  ~XTCReader();

  // Decode the frame at the cursor and advance the cursor by one.
  // Throws EndOfTrajectory past the last frame; the cursor does not move
  // when decoding fails.
  Frame read_frame();
  void read_frame(Frame &frame);

  // Same as read_frame
  Frame pop_frame() { return read_frame(); }

  // Random access; none of these move the cursor.
  Frame read_frame_at(uint64_t ordinal,
                      const AtomSelection &atoms = AtomSelection());

  std::vector<Frame>
  read_frames(const FrameSelection &frames = FrameSelection(),
              const AtomSelection &atoms = AtomSelection());

  /*
   * Decode the selection straight into caller buffers of shape
   * (nframes, natoms, 3), (nframes, 3, 3) and optionally (nframes).
   * Shapes must match the resolved selection exactly (ShapeMismatch).
   * Returns true on success; errors are thrown. The buffers are written only
   * after every selected frame decoded, so a failed call leaves them as
   * they were.
   */
  bool read_into_array(const ArrayView<float, 3> &coordinate_array,
                       const ArrayView<float, 3> &boxvec_array,
                       const ArrayView<float, 1> *time_array = nullptr,
                       const FrameSelection &frames = FrameSelection(),
                       const AtomSelection &atoms = AtomSelection());

  // Move the cursor back to the first frame
  void home();

  // Rebuild the index, e.g. after the file was appended to
  void refresh();

  size_t frame_count();
  std::vector<uint64_t> offsets();
  std::vector<uint64_t> frame_sizes();

  void close();

  ReaderState state() const { return st; }
  bool is_closed() const { return st == ReaderState::Closed; }
  uint64_t cursor() const { return next_ordinal; }
  const std::string &path() const { return filename; }

  bool buffered() const { return opts.buffered; }
  void set_buffered(bool b) { opts.buffered = b; }

private:
  typedef std::function<void(size_t, Frame &)> FrameSink;

  void ensure_open() const;
  const FrameIndex &ensure_index();

  // Read exactly n bytes or throw TruncatedInput
  void read_exact(uint64_t offset, uint8_t *dst, size_t n);

  // Decode the frames at ordinals and hand each to sink(position, frame) in
  // selection order
  void decode_frames(const std::vector<uint64_t> &ordinals,
                     const AtomSelection &atoms, const FrameSink &sink);

  int num_threads() const;

  std::string filename;
  ReaderOptions opts;
  TrajectoryFile file;
  std::optional<FrameIndex> index;
  ReaderState st;

  // Sequential cursor: next frame ordinal and, while no index exists, the
  // byte offset of that frame
  uint64_t next_ordinal;
  uint64_t next_offset;

  std::vector<uint8_t> buf;
  std::vector<float> spare_positions;
};

} // namespace molly

#endif // MOLLY_XTC_READER_H
