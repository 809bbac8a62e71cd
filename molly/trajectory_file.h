/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * All rights reserved.
 *
 * molly - seekable trajectory byte source
 */

#ifndef MOLLY_TRAJECTORY_FILE_H
#define MOLLY_TRAJECTORY_FILE_H

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>

namespace molly {

class TrajectoryFile {
public:
  // Throws FileNotFound
  explicit TrajectoryFile(const std::string &fname);

  TrajectoryFile(TrajectoryFile &&) = default;
  TrajectoryFile &operator=(TrajectoryFile &&) = default;

  // Read up to n bytes at offset; returns the number of bytes read, which is
  // short only at end of file. Throws IoError.
  size_t read_at(uint64_t offset, uint8_t *dst, size_t n);

  // Re-query the length, for files that may have grown
  void refresh_size();

  uint64_t size() const { return fsize; }
  const std::string &path() const { return filename; }
  bool is_open() const { return fxtc.is_open(); }
  void close();

private:
  std::ifstream fxtc;
  std::string filename;
  uint64_t fsize;
};

} // namespace molly

#endif // MOLLY_TRAJECTORY_FILE_H
