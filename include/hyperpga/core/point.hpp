#pragma once
#include <array>
#include <cmath>
#include <stdexcept>
#include <type_traits>

#include <hyperpga/core/algebra.hpp>
#include <hyperpga/core/motor.hpp>

namespace hyperpga::core {

/**
 * \brief Homogeneous point of 4D space, stored as a PGA4D quadvector.
 *
 * `e0123, e0124, e0134, e0234` hold the unnormalized x, y, z, w coordinates
 * and `e1234` the weight. Weight 0 marks an ideal point (a direction).
 */
template <typename Field> struct BasicPoint {
  using Vec4 = std::array<Field, 4>;

  Field e0123 = Field(0);
  Field e0124 = Field(0);
  Field e0134 = Field(0);
  Field e0234 = Field(0);
  Field e1234 = Field(1);

  // Origin: weight 1, no displacement.
  static constexpr BasicPoint identity() { return BasicPoint{}; }

  static constexpr BasicPoint from_cartesian(Field x, Field y, Field z,
                                             Field w) {
    return BasicPoint{x, y, z, w, Field(1)};
  }

  static constexpr BasicPoint from_cartesian(const Vec4 &p) {
    return from_cartesian(p[0], p[1], p[2], p[3]);
  }

  static constexpr BasicPoint from_direction(const Vec4 &n) {
    return BasicPoint{n[0], n[1], n[2], n[3], Field(0)};
  }

  constexpr Field weight() const { return e1234; }

  // Positional fields as stored (not divided by the weight).
  constexpr Vec4 coords() const { return {e0123, e0124, e0134, e0234}; }

  /**
   * \brief Cartesian coordinates of a finite point.
   *
   * Throws `std::domain_error` when the weight is zero (ideal point).
   * \return Positional fields divided by the weight.
   */
  Vec4 to_cartesian() const {
    if constexpr (std::is_arithmetic_v<Field>) {
      if (e1234 == Field(0)) {
        throw std::domain_error("Point at infinity has no Cartesian form");
      }
    }
    const Field inv = Field(1) / e1234;
    return {e0123 * inv, e0124 * inv, e0134 * inv, e0234 * inv};
  }

  /**
   * \brief Full sandwich `m * P * ~m`, keeping its quadvector part.
   *
   * No unit-magnitude assumption: the weight of the result is recomputed as
   * `e1234 * |m|^2`, so a unit motor leaves it unchanged and a scaled motor
   * scales the whole point uniformly (Cartesian position is the same).
   * Ideal points pick up rotation only.
   * \param m Motor to apply.
   * \return Transformed point.
   */
  constexpr BasicPoint transform(const BasicMotor<Field> &m) const {
    using K = MotorKernels<Field>;
    const Field norm = K::norm_squared(m);
    const Vec4 p = coords();
    const Vec4 r = K::rotation_offset(m, p);
    const Vec4 t = K::translation_offset(m);
    const Field two = Field(2);
    const Field v = e1234;
    return BasicPoint{norm * p[0] + two * (r[0] + v * t[0]),
                      norm * p[1] + two * (r[1] + v * t[1]),
                      norm * p[2] + two * (r[2] + v * t[2]),
                      norm * p[3] + two * (r[3] + v * t[3]), norm * v};
  }

  // Bitmaps of e0123, e0124, e0134, e0234, e1234 (e0 = bit 0).
  static constexpr std::array<unsigned int, 5> blades = {0b01111, 0b10111,
                                                         0b11011, 0b11101,
                                                         0b11110};

  constexpr Multivector<Field, PGA4D> to_multivector() const {
    Multivector<Field, PGA4D> mv;
    mv[blades[0]] = e0123;
    mv[blades[1]] = e0124;
    mv[blades[2]] = e0134;
    mv[blades[3]] = e0234;
    mv[blades[4]] = e1234;
    return mv;
  }

  bool operator==(const BasicPoint &) const = default;
};

using Point = BasicPoint<float>;

} // namespace hyperpga::core
