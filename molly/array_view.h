/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * All rights reserved.
 *
 * molly - strided view over a caller-owned numeric buffer
 */

#ifndef MOLLY_ARRAY_VIEW_H
#define MOLLY_ARRAY_VIEW_H

#include <array>
#include <cstddef>

namespace molly {

/*
 * Non-owning N-dimensional view. Strides are counted in elements, so views
 * over numpy-style buffers with byte strides must be converted by the caller.
 */
template <typename T, size_t ND> struct ArrayView {
  T *data = nullptr;
  std::array<size_t, ND> shape{};
  std::array<ptrdiff_t, ND> strides{};

  // Row-major view over a dense buffer
  static ArrayView contiguous(T *data, const std::array<size_t, ND> &shape) {
    ArrayView v;
    v.data = data;
    v.shape = shape;
    ptrdiff_t stride = 1;
    for (size_t d = ND; d-- > 0;) {
      v.strides[d] = stride;
      stride *= ptrdiff_t(shape[d]);
    }
    return v;
  }

  size_t size() const {
    size_t n = 1;
    for (size_t d = 0; d < ND; d++) {
      n *= shape[d];
    }
    return n;
  }

  template <typename... I> T &at(I... idx) const {
    static_assert(sizeof...(I) == ND, "index rank must match view rank");
    const size_t ix[ND] = {size_t(idx)...};
    ptrdiff_t off = 0;
    for (size_t d = 0; d < ND; d++) {
      off += ptrdiff_t(ix[d]) * strides[d];
    }
    return data[off];
  }
};

} // namespace molly

#endif // MOLLY_ARRAY_VIEW_H
