/*
 * Example usage of the molly XTCReader class
 */

#include "molly/xtc_error.h"
#include "molly/xtc_reader.h"
#include <algorithm>
#include <cmath>
#include <iostream>

using namespace molly;

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " trajectory.xtc" << std::endl;
    return 2;
  }
  const std::string xtc_file = argv[1];

  try {
    // Example 1: Basic usage - read all frames
    std::cout << "=== Example 1: Reading all frames ===" << std::endl;
    XTCReader reader(xtc_file);
    std::cout << "Frames in file: " << reader.frame_count() << std::endl;

    Frame frame;
    size_t frame_count = 0;
    while (reader.cursor() < reader.frame_count()) {
      reader.read_frame(frame);

      std::cout << "Frame " << frame_count << ", Step: " << frame.step
                << ", Time: " << frame.time << " ps"
                << ", Atoms: " << frame.natoms() << std::endl;
      std::cout << "  Box: [" << frame.box[0][0] << ", " << frame.box[1][1]
                << ", " << frame.box[2][2] << "]" << std::endl;
      if (frame.natoms() > 0) {
        const float *x = frame.coords(0);
        std::cout << "  First atom position: [" << x[0] << ", " << x[1]
                  << ", " << x[2] << "]" << std::endl;
      }
      frame_count++;
    }
    std::cout << "\nTotal frames read: " << frame_count << "\n" << std::endl;

    // Example 2: Every tenth frame, first three atoms only
    std::cout << "=== Example 2: Strided selection ===" << std::endl;
    std::vector<Frame> sampled = reader.read_frames(
        FrameSelection::range(std::nullopt, std::nullopt, 10),
        AtomSelection::until(std::min<uint32_t>(3, frame.natoms())));
    for (const Frame &f : sampled) {
      std::cout << "Time: " << f.time << " ps, " << f.natoms() << " atoms"
                << std::endl;
    }

    // Example 3: Computing with coordinates
    std::cout << "\n=== Example 3: Computing with coordinates ===" << std::endl;
    if (reader.frame_count() > 1) {
      std::vector<Frame> pair = reader.read_frames(FrameSelection::range(0, 2));
      const std::vector<float> &ref_coords = pair[0].positions;
      const std::vector<float> &curr_coords = pair[1].positions;
      const size_t n = std::min(ref_coords.size(), curr_coords.size());

      double sum_sq = 0.0;
      for (size_t i = 0; i < n; i++) {
        double diff = curr_coords[i] - ref_coords[i];
        sum_sq += diff * diff;
      }
      double rmsd = n ? std::sqrt(sum_sq / (n / 3.0)) : 0.0;
      std::cout << "RMSD between frame 0 and frame 1: " << rmsd << " nm"
                << std::endl;
    }

    // Example 4: Decode the last frames straight into caller buffers
    std::cout << "\n=== Example 4: Reading into arrays ===" << std::endl;
    const size_t nlast = std::min<size_t>(5, reader.frame_count());
    const size_t natoms = frame.natoms();
    std::vector<float> coords(nlast * natoms * 3);
    std::vector<float> boxes(nlast * 9);
    std::vector<float> times(nlast);
    auto coord_view =
        ArrayView<float, 3>::contiguous(coords.data(), {nlast, natoms, 3});
    auto box_view = ArrayView<float, 3>::contiguous(boxes.data(), {nlast, 3, 3});
    auto time_view = ArrayView<float, 1>::contiguous(times.data(), {nlast});
    reader.read_into_array(coord_view, box_view, &time_view,
                           FrameSelection::range(-int64_t(nlast), std::nullopt));
    for (size_t k = 0; k < nlast; k++) {
      std::cout << "Time: " << times[k] << " ps, box x: " << box_view.at(k, 0, 0)
                << std::endl;
    }

    // Example 5: Frame offsets from the index
    std::cout << "\n=== Example 5: Frame offsets ===" << std::endl;
    std::vector<uint64_t> offsets = reader.offsets();
    std::vector<uint64_t> sizes = reader.frame_sizes();
    for (size_t i = 0; i < std::min<size_t>(5, offsets.size()); i++) {
      std::cout << "Frame " << i << " at byte " << offsets[i] << ", "
                << sizes[i] << " bytes" << std::endl;
    }

    reader.close();
  } catch (const XTCError &e) {
    std::cerr << "Error (" << error_name(e.code()) << "): " << e.what()
              << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
