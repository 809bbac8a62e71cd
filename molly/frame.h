/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * All rights reserved.
 *
 * molly - decoded trajectory frame
 */

#ifndef MOLLY_FRAME_H
#define MOLLY_FRAME_H

#include <array>
#include <cstdint>
#include <vector>

namespace molly {

// One decoded timestep. All distances in nanometers, time in picoseconds.
struct Frame {
  std::vector<float> positions;            // Atom coordinates [natoms * 3]
  std::array<std::array<float, 3>, 3> box; // Unit cell vectors [3x3]
  double time = 0.0;
  int64_t step = 0;
  float precision = 0.0f; // 0 when stored uncompressed

  Frame() : box{} {}

  uint32_t natoms() const { return uint32_t(positions.size() / 3); }

  const float *coords(uint32_t atom) const { return &positions[3 * atom]; }

  // Get coordinates reshaped as Nx3
  void get_coordinates_3d(std::vector<std::array<float, 3>> &coords) const {
    coords.resize(natoms());
    for (uint32_t i = 0; i < natoms(); i++) {
      coords[i][0] = positions[3 * i];
      coords[i][1] = positions[3 * i + 1];
      coords[i][2] = positions[3 * i + 2];
    }
  }
};

} // namespace molly

#endif // MOLLY_FRAME_H
