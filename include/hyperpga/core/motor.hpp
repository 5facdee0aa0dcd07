#pragma once
#include <array>
#include <cmath>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

#include <hyperpga/core/algebra.hpp>

namespace hyperpga::core {

// ========================================================================
// 1. PLANES OF ROTATION
// ========================================================================

// The six Euclidean bivectors of PGA4D.
enum class Plane { E12, E13, E14, E23, E24, E34 };

/**
 * \brief Resolve a plane name to its rotation bivector.
 *
 * Accepts bivector names (`"e12"` ... `"e34"`) and Cartesian coordinate pairs
 * (`"xy"`, `"xz"`, `"xw"`, `"yz"`, `"yw"`, `"zw"`). Points store x, y, z, w
 * on e0123, e0124, e0134, e0234, so the coordinate pair names the dual
 * bivector: x <-> e4, y <-> e3, z <-> e2, w <-> e1.
 * \param name Plane name.
 * \return Matching plane.
 */
inline Plane parse_plane(std::string_view name) {
  if (name == "e12" || name == "zw")
    return Plane::E12;
  if (name == "e13" || name == "yw")
    return Plane::E13;
  if (name == "e14" || name == "xw")
    return Plane::E14;
  if (name == "e23" || name == "yz")
    return Plane::E23;
  if (name == "e24" || name == "xz")
    return Plane::E24;
  if (name == "e34" || name == "xy")
    return Plane::E34;
  throw std::invalid_argument("Unknown rotation plane: " + std::string(name));
}

template <typename Field> struct BasicMotor;

// ========================================================================
// 2. KERNELS
// ========================================================================
// Hand-unrolled even subalgebra of Cl(4, 0, 1).
// Every coefficient below is the Cayley table of PGA4D restricted to grades
// 0, 2 and 4; tests compare it against Multivector<Field, PGA4D>.

template <typename Field> struct MotorKernels {
  using M = BasicMotor<Field>;
  using Vec4 = std::array<Field, 4>;

  static constexpr M geometric_product(const M &a, const M &b) {
    M r;
    // Grade 0
    r.s = a.s * b.s - a.e12 * b.e12 - a.e13 * b.e13 - a.e14 * b.e14 -
          a.e23 * b.e23 - a.e24 * b.e24 - a.e34 * b.e34 + a.e1234 * b.e1234;
    // Grade 2
    r.e01 = a.s * b.e01 + a.e01 * b.s - a.e02 * b.e12 - a.e03 * b.e13 -
            a.e04 * b.e14 + a.e12 * b.e02 + a.e13 * b.e03 + a.e14 * b.e04 -
            a.e23 * b.e0123 - a.e24 * b.e0124 - a.e34 * b.e0134 -
            a.e0123 * b.e23 - a.e0124 * b.e24 - a.e0134 * b.e34 +
            a.e0234 * b.e1234 - a.e1234 * b.e0234;
    r.e02 = a.s * b.e02 + a.e01 * b.e12 + a.e02 * b.s - a.e03 * b.e23 -
            a.e04 * b.e24 - a.e12 * b.e01 + a.e13 * b.e0123 + a.e14 * b.e0124 +
            a.e23 * b.e03 + a.e24 * b.e04 - a.e34 * b.e0234 + a.e0123 * b.e13 +
            a.e0124 * b.e14 - a.e0134 * b.e1234 - a.e0234 * b.e34 +
            a.e1234 * b.e0134;
    r.e03 = a.s * b.e03 + a.e01 * b.e13 + a.e02 * b.e23 + a.e03 * b.s -
            a.e04 * b.e34 - a.e12 * b.e0123 - a.e13 * b.e01 + a.e14 * b.e0134 -
            a.e23 * b.e02 + a.e24 * b.e0234 + a.e34 * b.e04 - a.e0123 * b.e12 +
            a.e0124 * b.e1234 + a.e0134 * b.e14 + a.e0234 * b.e24 -
            a.e1234 * b.e0124;
    r.e04 = a.s * b.e04 + a.e01 * b.e14 + a.e02 * b.e24 + a.e03 * b.e34 +
            a.e04 * b.s - a.e12 * b.e0124 - a.e13 * b.e0134 - a.e14 * b.e01 -
            a.e23 * b.e0234 - a.e24 * b.e02 - a.e34 * b.e03 -
            a.e0123 * b.e1234 - a.e0124 * b.e12 - a.e0134 * b.e13 -
            a.e0234 * b.e23 + a.e1234 * b.e0123;
    r.e12 = a.s * b.e12 + a.e12 * b.s - a.e13 * b.e23 - a.e14 * b.e24 +
            a.e23 * b.e13 + a.e24 * b.e14 - a.e34 * b.e1234 - a.e1234 * b.e34;
    r.e13 = a.s * b.e13 + a.e12 * b.e23 + a.e13 * b.s - a.e14 * b.e34 -
            a.e23 * b.e12 + a.e24 * b.e1234 + a.e34 * b.e14 + a.e1234 * b.e24;
    r.e14 = a.s * b.e14 + a.e12 * b.e24 + a.e13 * b.e34 + a.e14 * b.s -
            a.e23 * b.e1234 - a.e24 * b.e12 - a.e34 * b.e13 - a.e1234 * b.e23;
    r.e23 = a.s * b.e23 - a.e12 * b.e13 + a.e13 * b.e12 - a.e14 * b.e1234 +
            a.e23 * b.s - a.e24 * b.e34 + a.e34 * b.e24 - a.e1234 * b.e14;
    r.e24 = a.s * b.e24 - a.e12 * b.e14 + a.e13 * b.e1234 + a.e14 * b.e12 +
            a.e23 * b.e34 + a.e24 * b.s - a.e34 * b.e23 + a.e1234 * b.e13;
    r.e34 = a.s * b.e34 - a.e12 * b.e1234 - a.e13 * b.e14 + a.e14 * b.e13 -
            a.e23 * b.e24 + a.e24 * b.e23 + a.e34 * b.s - a.e1234 * b.e12;
    // Grade 4
    r.e0123 = a.s * b.e0123 + a.e01 * b.e23 - a.e02 * b.e13 + a.e03 * b.e12 -
              a.e04 * b.e1234 + a.e12 * b.e03 - a.e13 * b.e02 +
              a.e14 * b.e0234 + a.e23 * b.e01 - a.e24 * b.e0134 +
              a.e34 * b.e0124 + a.e0123 * b.s - a.e0124 * b.e34 +
              a.e0134 * b.e24 - a.e0234 * b.e14 + a.e1234 * b.e04;
    r.e0124 = a.s * b.e0124 + a.e01 * b.e24 - a.e02 * b.e14 + a.e03 * b.e1234 +
              a.e04 * b.e12 + a.e12 * b.e04 - a.e13 * b.e0234 - a.e14 * b.e02 +
              a.e23 * b.e0134 + a.e24 * b.e01 - a.e34 * b.e0123 +
              a.e0123 * b.e34 + a.e0124 * b.s - a.e0134 * b.e23 +
              a.e0234 * b.e13 - a.e1234 * b.e03;
    r.e0134 = a.s * b.e0134 + a.e01 * b.e34 - a.e02 * b.e1234 - a.e03 * b.e14 +
              a.e04 * b.e13 + a.e12 * b.e0234 + a.e13 * b.e04 - a.e14 * b.e03 -
              a.e23 * b.e0124 + a.e24 * b.e0123 + a.e34 * b.e01 -
              a.e0123 * b.e24 + a.e0124 * b.e23 + a.e0134 * b.s -
              a.e0234 * b.e12 + a.e1234 * b.e02;
    r.e0234 = a.s * b.e0234 + a.e01 * b.e1234 + a.e02 * b.e34 - a.e03 * b.e24 +
              a.e04 * b.e23 - a.e12 * b.e0134 + a.e13 * b.e0124 -
              a.e14 * b.e0123 + a.e23 * b.e04 - a.e24 * b.e03 + a.e34 * b.e02 +
              a.e0123 * b.e14 - a.e0124 * b.e13 + a.e0134 * b.e12 +
              a.e0234 * b.s - a.e1234 * b.e01;
    r.e1234 = a.s * b.e1234 + a.e12 * b.e34 - a.e13 * b.e24 + a.e14 * b.e23 +
              a.e23 * b.e14 - a.e24 * b.e13 + a.e34 * b.e12 + a.e1234 * b.s;
    return r;
  }

  static constexpr M reverse(const M &a) {
    M r = a;
    r.e01 = -a.e01;
    r.e02 = -a.e02;
    r.e03 = -a.e03;
    r.e04 = -a.e04;
    r.e12 = -a.e12;
    r.e13 = -a.e13;
    r.e14 = -a.e14;
    r.e23 = -a.e23;
    r.e24 = -a.e24;
    r.e34 = -a.e34;
    return r;
  }

  // Scalar part of ~m * m. The e0 terms drop out since e0^2 = 0.
  static constexpr Field norm_squared(const M &m) {
    return m.s * m.s + m.e12 * m.e12 + m.e13 * m.e13 + m.e14 * m.e14 +
           m.e23 * m.e23 + m.e24 * m.e24 + m.e34 * m.e34 +
           m.e1234 * m.e1234;
  }

  // m P ~m for P = x e0123 + y e0124 + z e0134 + w e0234 + v e1234 is
  //   |m|^2 (x, y, z, w, v) + 2 * (rotation_offset(p) + v * translation_offset)
  // on the four positional blades, and |m|^2 v on e1234.

  // Half of the rotational displacement. Only the Euclidean bivectors, the
  // scalar and e1234 contribute.
  static constexpr Vec4 rotation_offset(const M &m, const Vec4 &p) {
    const Field x = p[0];
    const Field y = p[1];
    const Field z = p[2];
    const Field w = p[3];
    return {
        -(m.e14 * m.e14 + m.e24 * m.e24 + m.e34 * m.e34 + m.e1234 * m.e1234) *
                x +
            (m.e12 * m.e1234 + m.e13 * m.e14 + m.e23 * m.e24 + m.s * m.e34) *
                y +
            (m.e13 * m.e1234 - m.e12 * m.e14 + m.e23 * m.e34 - m.s * m.e24) *
                z +
            (m.e23 * m.e1234 - m.e12 * m.e24 - m.e13 * m.e34 + m.s * m.e14) *
                w,
        (m.e13 * m.e14 + m.e23 * m.e24 - m.e12 * m.e1234 - m.s * m.e34) * x -
            (m.e13 * m.e13 + m.e23 * m.e23 + m.e34 * m.e34 + m.e1234 * m.e1234) *
                y +
            (m.e12 * m.e13 + m.e14 * m.e1234 + m.e24 * m.e34 + m.s * m.e23) *
                z +
            (m.e12 * m.e23 + m.e24 * m.e1234 - m.e14 * m.e34 - m.s * m.e13) *
                w,
        (m.e23 * m.e34 - m.e12 * m.e14 - m.e13 * m.e1234 + m.s * m.e24) * x +
            (m.e12 * m.e13 + m.e24 * m.e34 - m.e14 * m.e1234 - m.s * m.e23) *
                y -
            (m.e12 * m.e12 + m.e23 * m.e23 + m.e24 * m.e24 + m.e1234 * m.e1234) *
                z +
            (m.e13 * m.e23 + m.e14 * m.e24 + m.e34 * m.e1234 + m.s * m.e12) *
                w,
        -(m.e12 * m.e24 + m.e13 * m.e34 + m.e23 * m.e1234 + m.s * m.e14) * x +
            (m.e12 * m.e23 - m.e14 * m.e34 - m.e24 * m.e1234 + m.s * m.e13) *
                y +
            (m.e13 * m.e23 + m.e14 * m.e24 - m.e34 * m.e1234 - m.s * m.e12) *
                z -
            (m.e12 * m.e12 + m.e13 * m.e13 + m.e14 * m.e14 + m.e1234 * m.e1234) *
                w,
    };
  }

  // Half of the displacement of a unit-weight point. Every term carries one
  // e0 blade, so ideal points (v = 0) never see it.
  static constexpr Vec4 translation_offset(const M &m) {
    return {
        m.e01 * m.e14 + m.e02 * m.e24 + m.e03 * m.e34 - m.e04 * m.s +
            m.e0123 * m.e1234 - m.e0124 * m.e12 - m.e0134 * m.e13 -
            m.e0234 * m.e23,
        m.e03 * m.s + m.e04 * m.e34 - m.e01 * m.e13 - m.e02 * m.e23 +
            m.e0123 * m.e12 + m.e0124 * m.e1234 - m.e0134 * m.e14 -
            m.e0234 * m.e24,
        m.e01 * m.e12 - m.e02 * m.s - m.e03 * m.e23 - m.e04 * m.e24 +
            m.e0123 * m.e13 + m.e0124 * m.e14 + m.e0134 * m.e1234 -
            m.e0234 * m.e34,
        m.e01 * m.s + m.e02 * m.e12 + m.e03 * m.e13 + m.e04 * m.e14 +
            m.e0123 * m.e23 + m.e0124 * m.e24 + m.e0134 * m.e34 +
            m.e0234 * m.e1234,
    };
  }
};

// ========================================================================
// 3. MOTOR
// ========================================================================

/**
 * \brief Even-graded element of PGA4D: a rotation and translation in 4D.
 *
 * Grades 0, 2 and 4 of Cl(4, 0, 1), sixteen components. A default
 * constructed motor is the identity. Apply it with the sandwich
 * `m * X * ~m` through `transform_point` / `transform_direction`.
 */
template <typename Field> struct BasicMotor {
  using Vec4 = std::array<Field, 4>;
  static constexpr size_t Size = 16;

  // Grade 0
  Field s = Field(1);
  // Grade 2, translation part (e0 paired with a Euclidean axis)
  Field e01 = Field(0);
  Field e02 = Field(0);
  Field e03 = Field(0);
  Field e04 = Field(0);
  // Grade 2, rotation part
  Field e12 = Field(0);
  Field e13 = Field(0);
  Field e14 = Field(0);
  Field e23 = Field(0);
  Field e24 = Field(0);
  Field e34 = Field(0);
  // Grade 4
  Field e0123 = Field(0);
  Field e0124 = Field(0);
  Field e0134 = Field(0);
  Field e0234 = Field(0);
  Field e1234 = Field(0);

  // --- Constructors ---

  static constexpr BasicMotor identity() { return BasicMotor{}; }

  /**
   * \brief Pure translation by `offset = (x, y, z, w)`.
   * \param offset Displacement applied to points.
   * \return Motor with `s = 1` and half the offset on the e0i bivectors.
   */
  static constexpr BasicMotor translation(const Vec4 &offset) {
    const Field half = Field(0.5);
    BasicMotor m;
    m.e01 = offset[3] * half;
    m.e02 = -offset[2] * half;
    m.e03 = offset[1] * half;
    m.e04 = -offset[0] * half;
    return m;
  }

  /**
   * \brief Pure rotation by `angle` radians in one of the Euclidean planes.
   *
   * Half-angle rotor: `s = cos(angle / 2)`, the plane's bivector is
   * `sin(angle / 2)`; the sandwich then rotates by the full angle.
   * \param plane Rotation bivector.
   * \param angle Rotation angle in radians.
   * \return Unit rotation motor.
   */
  static BasicMotor rotation(Plane plane, Field angle) {
    using std::cos;
    using std::sin;
    const Field half = angle * Field(0.5);
    const Field c = cos(half);
    const Field sn = sin(half);

    BasicMotor m;
    m.s = c;
    switch (plane) {
    case Plane::E12:
      m.e12 = sn;
      break;
    case Plane::E13:
      m.e13 = sn;
      break;
    case Plane::E14:
      m.e14 = sn;
      break;
    case Plane::E23:
      m.e23 = sn;
      break;
    case Plane::E24:
      m.e24 = sn;
      break;
    case Plane::E34:
      m.e34 = sn;
      break;
    }
    return m;
  }

  // Cartesian plane aliases. A positive angle turns the second axis toward
  // the first one (rotation_xy(pi / 2) maps +y onto +x). The x-z plane is
  // e42 under the x, y, z, w -> e4, e3, e2, e1 duality, hence the sign.
  static BasicMotor rotation_xy(Field angle) {
    return rotation(Plane::E34, angle);
  }
  static BasicMotor rotation_xz(Field angle) {
    return rotation(Plane::E24, -angle);
  }
  static BasicMotor rotation_xw(Field angle) {
    return rotation(Plane::E14, angle);
  }
  static BasicMotor rotation_yz(Field angle) {
    return rotation(Plane::E23, angle);
  }
  static BasicMotor rotation_yw(Field angle) {
    return rotation(Plane::E13, angle);
  }
  static BasicMotor rotation_zw(Field angle) {
    return rotation(Plane::E12, angle);
  }

  // --- Algebra ---

  // Composition: (a * b) applies b first, then a.
  constexpr BasicMotor operator*(const BasicMotor &other) const {
    return MotorKernels<Field>::geometric_product(*this, other);
  }

  // Reverse. For a unit motor this is the inverse motion.
  constexpr BasicMotor operator~() const {
    return MotorKernels<Field>::reverse(*this);
  }

  constexpr Field magnitude_squared() const {
    return MotorKernels<Field>::norm_squared(*this);
  }

  Field magnitude() const {
    using std::sqrt;
    return sqrt(magnitude_squared());
  }

  constexpr BasicMotor scaled(Field k) const {
    BasicMotor r;
    r.s = s * k;
    r.e01 = e01 * k;
    r.e02 = e02 * k;
    r.e03 = e03 * k;
    r.e04 = e04 * k;
    r.e12 = e12 * k;
    r.e13 = e13 * k;
    r.e14 = e14 * k;
    r.e23 = e23 * k;
    r.e24 = e24 * k;
    r.e34 = e34 * k;
    r.e0123 = e0123 * k;
    r.e0124 = e0124 * k;
    r.e0134 = e0134 * k;
    r.e0234 = e0234 * k;
    r.e1234 = e1234 * k;
    return r;
  }

  /**
   * \brief Rescale to unit magnitude.
   *
   * Throws `std::domain_error` for a zero (or non-finite) magnitude on scalar
   * fields. SIMD lanes are not checked.
   * \return Motor with `magnitude_squared() == 1` up to rounding.
   */
  BasicMotor normalized() const {
    const Field mag = magnitude();
    if constexpr (std::is_arithmetic_v<Field>) {
      if (!(mag > Field(0)) || !std::isfinite(mag)) {
        throw std::domain_error("Cannot normalize a zero-magnitude motor");
      }
    }
    return scaled(Field(1) / mag);
  }

  // --- Sandwich Transforms (unit motors) ---

  /**
   * \brief Apply the motion to the point `(x, y, z, w)` with unit weight.
   * \param p Point coordinates.
   * \return `p + 2 * displacement`, the positional part of `m P ~m`.
   */
  constexpr Vec4 transform_point(const Vec4 &p) const {
    const Vec4 r = MotorKernels<Field>::rotation_offset(*this, p);
    const Vec4 t = MotorKernels<Field>::translation_offset(*this);
    const Field two = Field(2);
    return {p[0] + two * (r[0] + t[0]), p[1] + two * (r[1] + t[1]),
            p[2] + two * (r[2] + t[2]), p[3] + two * (r[3] + t[3])};
  }

  /**
   * \brief Apply only the rotational part of the motion to a direction.
   * \param n Direction (or normal) vector.
   * \return Rotated direction; translation never affects it.
   */
  constexpr Vec4 transform_direction(const Vec4 &n) const {
    const Vec4 r = MotorKernels<Field>::rotation_offset(*this, n);
    const Field two = Field(2);
    return {n[0] + two * r[0], n[1] + two * r[1], n[2] + two * r[2],
            n[3] + two * r[3]};
  }

  // --- Component Access ---

  constexpr std::array<Field, Size> components() const {
    return {s,   e01, e02, e03, e04,   e12,   e13,   e14,
            e23, e24, e34, e0123, e0124, e0134, e0234, e1234};
  }

  static constexpr BasicMotor
  from_components(const std::array<Field, Size> &c) {
    BasicMotor m;
    m.s = c[0];
    m.e01 = c[1];
    m.e02 = c[2];
    m.e03 = c[3];
    m.e04 = c[4];
    m.e12 = c[5];
    m.e13 = c[6];
    m.e14 = c[7];
    m.e23 = c[8];
    m.e24 = c[9];
    m.e34 = c[10];
    m.e0123 = c[11];
    m.e0124 = c[12];
    m.e0134 = c[13];
    m.e0234 = c[14];
    m.e1234 = c[15];
    return m;
  }

  // Blade bitmaps (PGA4D, e0 = bit 0) in component order.
  static constexpr std::array<unsigned int, Size> blades = {
      0b00000, 0b00011, 0b00101, 0b01001, 0b10001, 0b00110,
      0b01010, 0b10010, 0b01100, 0b10100, 0b11000, 0b01111,
      0b10111, 0b11011, 0b11101, 0b11110};

  constexpr Multivector<Field, PGA4D> to_multivector() const {
    Multivector<Field, PGA4D> mv;
    const auto c = components();
    for (size_t i = 0; i < Size; ++i)
      mv[blades[i]] = c[i];
    return mv;
  }

  // Odd grades of `mv` are dropped.
  static constexpr BasicMotor
  from_multivector(const Multivector<Field, PGA4D> &mv) {
    std::array<Field, Size> c{};
    for (size_t i = 0; i < Size; ++i)
      c[i] = mv[blades[i]];
    return from_components(c);
  }

  bool operator==(const BasicMotor &) const = default;
};

using Motor = BasicMotor<float>;
using WideMotor = BasicMotor<Packet>;

// Broadcast one motor to every SIMD lane.
inline WideMotor splat(const Motor &m) {
  const auto c = m.components();
  std::array<Packet, Motor::Size> wide{};
  for (size_t i = 0; i < Motor::Size; ++i)
    wide[i] = Packet(c[i]);
  return WideMotor::from_components(wide);
}

// ========================================================================
// 4. FREE FUNCTIONS
// ========================================================================

template <typename Field>
constexpr BasicMotor<Field> compose(const BasicMotor<Field> &a,
                                    const BasicMotor<Field> &b) {
  return a * b;
}

template <typename Field>
constexpr BasicMotor<Field> reverse(const BasicMotor<Field> &a) {
  return ~a;
}

template <typename Field>
constexpr Field magnitude_squared(const BasicMotor<Field> &a) {
  return a.magnitude_squared();
}

template <typename Field> Field magnitude(const BasicMotor<Field> &a) {
  return a.magnitude();
}

template <typename Field>
BasicMotor<Field> normalized(const BasicMotor<Field> &a) {
  return a.normalized();
}

inline Motor translation(const Motor::Vec4 &offset) {
  return Motor::translation(offset);
}

inline Motor rotation_in_plane(Plane plane, float angle) {
  return Motor::rotation(plane, angle);
}

// Cartesian names follow the `rotation_xy` ... `rotation_zw` orientation.
inline Motor rotation_in_plane(std::string_view plane, float angle) {
  if (plane == "xz")
    return Motor::rotation_xz(angle);
  return Motor::rotation(parse_plane(plane), angle);
}

template <typename Field>
constexpr typename BasicMotor<Field>::Vec4
transform_point(const BasicMotor<Field> &a,
                const typename BasicMotor<Field>::Vec4 &p) {
  return a.transform_point(p);
}

template <typename Field>
constexpr typename BasicMotor<Field>::Vec4
transform_direction(const BasicMotor<Field> &a,
                    const typename BasicMotor<Field>::Vec4 &n) {
  return a.transform_direction(n);
}

} // namespace hyperpga::core
