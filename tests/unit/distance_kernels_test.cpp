#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <vector>

#include "docqa/kernels/distance.hpp"

using Catch::Matchers::WithinAbs;
using docqa::kernels::l2_sq;

TEST_CASE("l2_sq matches the naive sum including the tail", "[kernels]") {
  for (std::size_t d : {1u, 3u, 4u, 7u, 384u}) {
    std::vector<float> a(d), b(d);
    float expect = 0.0f;
    for (std::size_t i = 0; i < d; ++i) {
      a[i] = static_cast<float>(i) * 0.25f;
      b[i] = static_cast<float>(d - i) * 0.5f;
      const float diff = a[i] - b[i];
      expect += diff * diff;
    }
    REQUIRE_THAT(l2_sq(a, b), WithinAbs(expect, 1e-3 * (1.0 + expect)));
  }
}

TEST_CASE("l2_sq of identical vectors is zero", "[kernels]") {
  std::vector<float> a{1.5f, -2.0f, 3.25f, 0.0f, 9.0f};
  REQUIRE(l2_sq(a, a) == 0.0f);
}
