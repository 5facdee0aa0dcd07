#pragma once
#include <cmath>
#include <iostream>
#include <numbers>
#include <stdexcept>

#include <hyperpga/core/config.hpp>
#include <hyperpga/core/motor.hpp>
#include <hyperpga/ops/transform.hpp>

namespace hyperpga::rig {

using hyperpga::core::Motor;

/// \brief Tuning knobs for `CameraRig`.
struct RigConfig {
  /// \brief Translation speed in units per second at full key press.
  float move_speed = 5.0f;
  /// \brief Radians per cursor unit.
  float look_sensitivity = 0.001f;
  /// \brief Radians per scroll unit (x-w plane).
  float roll_sensitivity = 0.01f;
  /// \brief Vertical field of view in radians.
  float v_fov = std::numbers::pi_v<float> / 2.0f;
  /// \brief Allowed `|magnitude_squared - 1|` before renormalizing.
  float drift_tolerance = 1e-4f;
};

/**
 * \brief Held movement keys, each in `[0, 1]`.
 *
 * Forward/backward drive x, up/down drive y, right/left drive z.
 */
struct MovementState {
  float forward = 0.0f;
  float backward = 0.0f;
  float left = 0.0f;
  float right = 0.0f;
  float up = 0.0f;
  float down = 0.0f;

  /**
   * \brief Translation covered during `dt` seconds.
   * \param dt Frame time in seconds.
   * \param speed Units per second.
   * \return Translation motor in the camera's local frame.
   */
  Motor transform(float dt, float speed) const {
    const float k = speed * dt;
    return Motor::translation({(forward - backward) * k, (up - down) * k,
                               (right - left) * k, 0.0f});
  }
};

/// \brief Camera data in the order the render backend uploads it.
struct CameraUniform {
  Motor transform;
  float v_fov = 0.0f;
};

/**
 * \brief Accumulates input into the camera motor, once per frame.
 *
 * `transform` carries position and heading; `vertical_look` is kept apart so
 * pitching never tilts the movement frame. Every input composes on the right,
 * i.e. in the camera's local frame.
 */
class CameraRig {
public:
  CameraRig() : CameraRig(RigConfig{}) {}

  explicit CameraRig(const RigConfig &config)
      : config_(config),
        transform_(Motor::translation({-4.5f, 0.5f, -1.5f, 0.5f})) {}

  CameraRig(const RigConfig &config, const Motor &start)
      : config_(config), transform_(start) {}

  MovementState &movement() { return movement_; }
  const MovementState &movement() const { return movement_; }

  const Motor &transform() const { return transform_; }
  const Motor &vertical_look() const { return vertical_look_; }
  const RigConfig &config() const { return config_; }

  /**
   * \brief Mouse motion: pitch on x-y, yaw on x-z.
   * \param dx Horizontal cursor delta.
   * \param dy Vertical cursor delta.
   */
  void cursor(float dx, float dy) {
    vertical_look_ =
        vertical_look_ * Motor::rotation_xy(dy * -config_.look_sensitivity);
    transform_ = transform_ * Motor::rotation_xz(dx * config_.look_sensitivity);
  }

  /// \brief Scroll wheel turns the view through the fourth axis (x-w).
  void scroll(float /*dx*/, float dy) {
    transform_ = transform_ * Motor::rotation_xw(dy * config_.roll_sensitivity);
  }

  /**
   * \brief Advance by one frame of `dt` seconds.
   *
   * Throws `std::invalid_argument` for a negative or non-finite `dt`.
   */
  void update(float dt) {
    if (!(dt >= 0.0f) || !std::isfinite(dt)) {
      throw std::invalid_argument("CameraRig::update requires dt >= 0");
    }
    transform_ = transform_ * movement_.transform(dt, config_.move_speed);
    transform_ = keep_unit(transform_, "transform");
    vertical_look_ = keep_unit(vertical_look_, "vertical_look");
  }

  /// \brief Motor handed to the renderer: heading, then pitch.
  Motor view() const { return transform_ * vertical_look_; }

  CameraUniform uniform() const { return {view(), config_.v_fov}; }

private:
  Motor keep_unit(const Motor &m, const char *label) const {
    const Motor fixed = ops::renormalize(m, config_.drift_tolerance);
    if (core::verbose_enabled() && !(fixed == m)) {
      std::cerr << "[Rig] Renormalized " << label << " (|m|^2 = "
                << m.magnitude_squared() << ")\n";
    }
    return fixed;
  }

  RigConfig config_;
  MovementState movement_;
  Motor transform_;
  Motor vertical_look_;
};

} // namespace hyperpga::rig
