#pragma once
#include <Eigen/Core>
#include <type_traits>

#include <hyperpga/core/motor.hpp>

namespace hyperpga::core {

/// \brief Homogeneous 5x5 matrix type for 4D affine maps.
template <typename Field> using Matrix5 = Eigen::Matrix<Field, 5, 5>;

/**
 * \brief Matrix of the unit-motor action on `(x, y, z, w, 1)`.
 *
 * Columns 0..3 are the images of the axis directions, column 4 the image of
 * the origin. `to_matrix(a * b) == to_matrix(a) * to_matrix(b)`.
 * \param m Unit motor.
 * \return Homogeneous transform matrix.
 */
template <typename Field>
  requires std::is_arithmetic_v<Field>
Matrix5<Field> to_matrix(const BasicMotor<Field> &m) {
  using Vec4 = typename BasicMotor<Field>::Vec4;
  Matrix5<Field> mat = Matrix5<Field>::Zero();

  for (int j = 0; j < 4; ++j) {
    Vec4 axis{};
    axis[static_cast<size_t>(j)] = Field(1);
    const Vec4 col = m.transform_direction(axis);
    for (int i = 0; i < 4; ++i)
      mat(i, j) = col[static_cast<size_t>(i)];
  }

  const Vec4 origin = m.transform_point(Vec4{});
  for (int i = 0; i < 4; ++i)
    mat(i, 4) = origin[static_cast<size_t>(i)];
  mat(4, 4) = Field(1);
  return mat;
}

/**
 * \brief Apply a homogeneous matrix to a point with unit weight.
 * \param mat Matrix from `to_matrix`.
 * \param p Point coordinates.
 * \return Transformed coordinates.
 */
template <typename Field>
typename BasicMotor<Field>::Vec4
apply_matrix(const Matrix5<Field> &mat,
             const typename BasicMotor<Field>::Vec4 &p) {
  Eigen::Matrix<Field, 5, 1> h;
  h << p[0], p[1], p[2], p[3], Field(1);
  const Eigen::Matrix<Field, 5, 1> out = mat * h;
  return {out(0), out(1), out(2), out(3)};
}

} // namespace hyperpga::core
