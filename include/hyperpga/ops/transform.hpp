#pragma once
#include <cmath>
#include <cstddef>
#include <iostream>

#include <hyperpga/core/config.hpp>
#include <hyperpga/core/motor.hpp>
#include <hyperpga/core/parallel.hpp>
#include <hyperpga/data/point_cloud.hpp>

namespace hyperpga::ops {

using hyperpga::core::Motor;
using hyperpga::core::Packet;
using hyperpga::core::WideMotor;
using hyperpga::data::PointCloud4;

namespace detail {

inline WideMotor::Vec4 load4(float *const *channels, size_t i) {
  return {Packet::load_unaligned(channels[0] + i),
          Packet::load_unaligned(channels[1] + i),
          Packet::load_unaligned(channels[2] + i),
          Packet::load_unaligned(channels[3] + i)};
}

inline void store4(float *const *channels, size_t i, const WideMotor::Vec4 &v) {
  v[0].store_unaligned(channels[0] + i);
  v[1].store_unaligned(channels[1] + i);
  v[2].store_unaligned(channels[2] + i);
  v[3].store_unaligned(channels[3] + i);
}

// Full SIMD blocks go through the worker pool, the remainder is scalar.
template <bool IsPoint>
void apply_motor(const Motor &motor, PointCloud4 &cloud) {
  const size_t n = cloud.num_points();
  if (n == 0)
    return;

  constexpr size_t lanes = Packet::size;
  const size_t blocks = n / lanes;
  const WideMotor wide = core::splat(motor);
  float *const channels[4] = {cloud.x.data(), cloud.y.data(), cloud.z.data(),
                              cloud.w.data()};

  core::parallel_for_ranges(blocks, [&](size_t begin, size_t end) {
    for (size_t b = begin; b < end; ++b) {
      const size_t i = b * lanes;
      const WideMotor::Vec4 p = load4(channels, i);
      if constexpr (IsPoint) {
        store4(channels, i, wide.transform_point(p));
      } else {
        store4(channels, i, wide.transform_direction(p));
      }
    }
  });

  for (size_t i = blocks * lanes; i < n; ++i) {
    const Motor::Vec4 p = cloud.get_point(i);
    if constexpr (IsPoint) {
      cloud.set_point(i, motor.transform_point(p));
    } else {
      cloud.set_point(i, motor.transform_direction(p));
    }
  }
}

} // namespace detail

/**
 * \brief Apply `motor` to every point of `cloud` in place.
 * \param motor Unit motor.
 * \param cloud Points with implicit unit weight.
 */
inline void transform_points(const Motor &motor, PointCloud4 &cloud) {
  detail::apply_motor<true>(motor, cloud);
  if (core::verbose_enabled()) {
    std::cout << "[Transform] Moved " << cloud.num_points() << " points\n";
  }
}

/**
 * \brief Rotate every direction of `cloud` in place; translation is ignored.
 * \param motor Unit motor.
 * \param cloud Direction vectors (normals).
 */
inline void transform_directions(const Motor &motor, PointCloud4 &cloud) {
  detail::apply_motor<false>(motor, cloud);
  if (core::verbose_enabled()) {
    std::cout << "[Transform] Rotated " << cloud.num_points()
              << " directions\n";
  }
}

/**
 * \brief Correct accumulated floating-point drift.
 *
 * Throws `std::domain_error` for a zero motor (see `Motor::normalized`).
 * \param motor Motor built from many compositions.
 * \param tolerance Allowed `|magnitude_squared - 1|`.
 * \return `motor.normalized()` when drifted beyond `tolerance`, else `motor`.
 */
inline Motor renormalize(const Motor &motor, float tolerance = 1e-4f) {
  const float drift = std::abs(motor.magnitude_squared() - 1.0f);
  if (drift <= tolerance)
    return motor;
  return motor.normalized();
}

} // namespace hyperpga::ops
