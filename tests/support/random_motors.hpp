#pragma once

#include <array>
#include <random>

#include <doctest/doctest.h>
#include <hyperpga/core/motor.hpp>

#include "tolerances.hpp"

namespace hyperpga::test_support {

using hyperpga::core::Motor;
using hyperpga::core::Plane;

// A rigid motion built from `rotations` random plane rotations and one
// random translation, so it satisfies every motor constraint.
inline Motor random_unit_motor(std::mt19937 &gen, int rotations = 3) {
  std::uniform_real_distribution<float> angle(-3.0f, 3.0f);
  std::uniform_real_distribution<float> offset(-5.0f, 5.0f);
  std::uniform_int_distribution<int> plane(0, 5);

  Motor m;
  for (int i = 0; i < rotations; ++i) {
    m = m * Motor::rotation(static_cast<Plane>(plane(gen)), angle(gen));
  }
  return m * Motor::translation({offset(gen), offset(gen), offset(gen),
                                 offset(gen)});
}

// Arbitrary 16 components, not a rigid motion.
inline Motor random_motor(std::mt19937 &gen) {
  std::uniform_real_distribution<float> dist(-2.0f, 2.0f);
  std::array<float, Motor::Size> c{};
  for (float &v : c)
    v = dist(gen);
  return Motor::from_components(c);
}

inline Motor::Vec4 random_vec4(std::mt19937 &gen, float range = 10.0f) {
  std::uniform_real_distribution<float> dist(-range, range);
  return {dist(gen), dist(gen), dist(gen), dist(gen)};
}

inline void check_motor_near(const Motor &a, const Motor &b,
                             float tol = kTolMedium) {
  const auto ca = a.components();
  const auto cb = b.components();
  for (size_t i = 0; i < Motor::Size; ++i) {
    INFO("component ", i);
    CHECK(ca[i] == doctest::Approx(cb[i]).epsilon(tol));
  }
}

inline void check_vec4_near(const Motor::Vec4 &a, const Motor::Vec4 &b,
                            float tol = kTolMedium) {
  for (size_t i = 0; i < 4; ++i) {
    INFO("coordinate ", i);
    CHECK(a[i] == doctest::Approx(b[i]).epsilon(tol));
  }
}

} // namespace hyperpga::test_support
