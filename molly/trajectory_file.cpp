/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * All rights reserved.
 *
 * molly - seekable trajectory byte source
 */

#include "trajectory_file.h"
#include "xtc_error.h"

namespace molly {

TrajectoryFile::TrajectoryFile(const std::string &fname)
    : filename(fname), fsize(0) {
  fxtc.open(fname, std::ios::binary | std::ios::in);
  if (!fxtc.is_open()) {
    throw XTCError(ErrorCode::FileNotFound, "Cannot open file: " + fname);
  }
  refresh_size();
}

void TrajectoryFile::refresh_size() {
  fxtc.clear();
  fxtc.seekg(0, std::ios::end);
  std::streampos end = fxtc.tellg();
  if (end < 0) {
    throw XTCError(ErrorCode::IoError, "Cannot determine size of " + filename);
  }
  fsize = uint64_t(end);
  fxtc.seekg(0, std::ios::beg);
}

size_t TrajectoryFile::read_at(uint64_t offset, uint8_t *dst, size_t n) {
  if (offset >= fsize || n == 0) {
    return 0;
  }
  fxtc.clear();
  fxtc.seekg(std::streamoff(offset), std::ios::beg);
  if (!fxtc) {
    throw XTCError(ErrorCode::IoError, "Cannot seek to offset " +
                                           std::to_string(offset) + " in " +
                                           filename);
  }
  fxtc.read(reinterpret_cast<char *>(dst), std::streamsize(n));
  if (fxtc.bad()) {
    throw XTCError(ErrorCode::IoError, "Read failed at offset " +
                                           std::to_string(offset) + " in " +
                                           filename);
  }
  return size_t(fxtc.gcount());
}

void TrajectoryFile::close() {
  if (fxtc.is_open()) {
    fxtc.close();
  }
}

} // namespace molly
