#pragma once

/** \file distance.hpp
 *  \brief Scalar squared Euclidean distance used by the flat index.
 *
 * Preconditions
 * - a.size() == b.size()
 * - All inputs are finite
 * Determinism: pure function, no allocations, no exceptions.
 */

#include <cstddef>
#include <span>

namespace docqa::kernels {

/** \brief Sum of squared differences: sum((a[i] - b[i])^2). O(d). */
inline float l2_sq(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  // 4-way unrolled loop for better instruction-level parallelism
  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;

  const std::size_t unroll_end = n & ~static_cast<std::size_t>(3);
  for (; i < unroll_end; i += 4) {
    float d0 = pa[i] - pb[i];
    float d1 = pa[i+1] - pb[i+1];
    float d2 = pa[i+2] - pb[i+2];
    float d3 = pa[i+3] - pb[i+3];

    s0 += d0 * d0;
    s1 += d1 * d1;
    s2 += d2 * d2;
    s3 += d3 * d3;
  }

  float s = s0 + s1 + s2 + s3;

  for (; i < n; ++i) {
    float d = pa[i] - pb[i];
    s += d * d;
  }
  return s;
}

} // namespace docqa::kernels
