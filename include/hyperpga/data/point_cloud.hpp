#pragma once

#include <array>
#include <span>
#include <string>
#include <vector>

namespace hyperpga::data {

/**
 * \brief Structure-of-arrays storage for 4D scene points or directions.
 *
 * `PointCloud4` owns one flat channel per axis (`x`, `y`, `z`, `w`) so batch
 * transforms can stream each axis straight into SIMD registers.
 */
struct PointCloud4 {
  using Vec4 = std::array<float, 4>;

  /// \brief X coordinates for all points.
  std::vector<float> x;
  /// \brief Y coordinates for all points.
  std::vector<float> y;
  /// \brief Z coordinates for all points.
  std::vector<float> z;
  /// \brief W coordinates for all points.
  std::vector<float> w;

  /// \brief Optional descriptive identifier.
  std::string name;

  [[nodiscard]] size_t num_points() const { return x.size(); }

  void reserve(size_t count) {
    x.reserve(count);
    y.reserve(count);
    z.reserve(count);
    w.reserve(count);
  }

  void resize(size_t count) {
    x.resize(count);
    y.resize(count);
    z.resize(count);
    w.resize(count);
  }

  /**
   * \brief Read point `i` as `(x, y, z, w)`.
   * \param i Point index.
   * \return Coordinates at index `i`.
   */
  [[nodiscard]] Vec4 get_point(size_t i) const {
    return {x[i], y[i], z[i], w[i]};
  }

  /**
   * \brief Overwrite point `i`.
   * \param i Point index.
   * \param p Replacement coordinates.
   */
  void set_point(size_t i, const Vec4 &p) {
    x[i] = p[0];
    y[i] = p[1];
    z[i] = p[2];
    w[i] = p[3];
  }

  void push_point(const Vec4 &p) {
    x.push_back(p[0]);
    y.push_back(p[1]);
    z.push_back(p[2]);
    w.push_back(p[3]);
  }

  /**
   * \brief Mutable views of the four channels in X/Y/Z/W order.
   * \return Array `{x, y, z, w}` as spans.
   */
  [[nodiscard]] std::array<std::span<float>, 4> xyzw_spans() {
    return {std::span<float>(x), std::span<float>(y), std::span<float>(z),
            std::span<float>(w)};
  }

  /// \brief Immutable views of the four channels in X/Y/Z/W order.
  [[nodiscard]] std::array<std::span<const float>, 4> xyzw_spans() const {
    return {std::span<const float>(x), std::span<const float>(y),
            std::span<const float>(z), std::span<const float>(w)};
  }

  /// \brief Clear geometry and name.
  void clear() {
    x.clear();
    y.clear();
    z.clear();
    w.clear();
    name.clear();
  }
};

} // namespace hyperpga::data
