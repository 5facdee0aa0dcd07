#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>
#include <limits>
#include <numbers>
#include <stdexcept>

#include <hyperpga/rig/camera_rig.hpp>

#include "support/random_motors.hpp"
#include "support/tolerances.hpp"

using hyperpga::core::Motor;
using hyperpga::rig::CameraRig;
using hyperpga::rig::RigConfig;
using namespace hyperpga::test_support;

namespace {

constexpr float kHalfPi = std::numbers::pi_v<float> / 2.0f;

RigConfig unit_config() {
  RigConfig config;
  config.look_sensitivity = 1.0f;
  config.roll_sensitivity = 1.0f;
  return config;
}

Motor::Vec4 eye(const CameraRig &rig) {
  return rig.view().transform_point({0.0f, 0.0f, 0.0f, 0.0f});
}

} // namespace

TEST_CASE("rig starts at its spawn pose") {
  const CameraRig rig;
  CHECK(rig.transform() == Motor::translation({-4.5f, 0.5f, -1.5f, 0.5f}));
  CHECK(rig.vertical_look() == Motor::identity());
  CHECK(eye(rig) == Motor::Vec4{-4.5f, 0.5f, -1.5f, 0.5f});

  const RigConfig defaults;
  CHECK(defaults.move_speed == 5.0f);
  CHECK(defaults.look_sensitivity == 0.001f);
  CHECK(defaults.roll_sensitivity == 0.01f);
  CHECK(defaults.v_fov == doctest::Approx(kHalfPi));
}

TEST_CASE("idle frame keeps the pose") {
  CameraRig rig;
  const Motor before = rig.transform();
  rig.update(0.016f);
  rig.update(0.0f);
  CHECK(rig.transform() == before);
}

TEST_CASE("forward key moves along local x") {
  CameraRig rig;
  rig.movement().forward = 1.0f;
  rig.update(0.5f);
  check_vec4_near(eye(rig), {-2.0f, 0.5f, -1.5f, 0.5f}, kTolTight);

  rig.movement().forward = 0.0f;
  rig.movement().backward = 1.0f;
  rig.update(0.5f);
  check_vec4_near(eye(rig), {-4.5f, 0.5f, -1.5f, 0.5f}, kTolTight);
}

TEST_CASE("up and right keys drive y and z") {
  CameraRig rig(RigConfig{}, Motor::identity());
  rig.movement().up = 1.0f;
  rig.movement().right = 0.5f;
  rig.update(1.0f);
  check_vec4_near(eye(rig), {0.0f, 5.0f, 2.5f, 0.0f}, kTolTight);
}

TEST_CASE("yaw turns the movement frame") {
  CameraRig rig(unit_config());
  rig.cursor(kHalfPi, 0.0f);
  rig.movement().forward = 1.0f;
  rig.update(0.5f);
  check_vec4_near(eye(rig), {-4.5f, 0.5f, -4.0f, 0.5f}, kTolMedium);
}

TEST_CASE("pitch tilts the view but not the movement frame") {
  CameraRig rig(unit_config(), Motor::identity());
  rig.cursor(0.0f, -kHalfPi);
  CHECK(rig.transform() == Motor::identity());

  // Looking forward now points down the -y axis.
  check_vec4_near(rig.view().transform_direction({1.0f, 0.0f, 0.0f, 0.0f}),
                  {0.0f, -1.0f, 0.0f, 0.0f}, kTolTight);

  rig.movement().forward = 1.0f;
  rig.update(0.2f);
  check_vec4_near(eye(rig), {1.0f, 0.0f, 0.0f, 0.0f}, kTolTight);
}

TEST_CASE("scroll turns forward into the fourth axis") {
  CameraRig rig(unit_config());
  rig.scroll(0.0f, kHalfPi);
  rig.movement().forward = 1.0f;
  rig.update(0.5f);
  check_vec4_near(eye(rig), {-4.5f, 0.5f, -1.5f, -2.0f}, kTolMedium);
}

TEST_CASE("invalid frame times are rejected") {
  CameraRig rig;
  CHECK_THROWS_AS(rig.update(-0.1f), std::invalid_argument);
  CHECK_THROWS_AS(rig.update(std::numeric_limits<float>::quiet_NaN()),
                  std::invalid_argument);
  CHECK_THROWS_AS(rig.update(std::numeric_limits<float>::infinity()),
                  std::invalid_argument);
}

TEST_CASE("motors stay unit over a long session") {
  CameraRig rig;
  rig.movement().forward = 1.0f;
  rig.movement().right = 0.3f;
  for (int frame = 0; frame < 5000; ++frame) {
    rig.cursor(13.0f, std::sin(static_cast<float>(frame) * 0.01f) * 20.0f);
    rig.scroll(0.0f, 0.7f);
    rig.update(1.0f / 60.0f);
  }

  const float tol = rig.config().drift_tolerance;
  CHECK(std::abs(rig.transform().magnitude_squared() - 1.0f) <= tol);
  CHECK(std::abs(rig.vertical_look().magnitude_squared() - 1.0f) <= tol);
  CHECK(std::abs(rig.view().magnitude_squared() - 1.0f) <= 3.0f * tol);
}

TEST_CASE("uniform carries the view and field of view") {
  RigConfig config;
  config.v_fov = 1.2f;
  CameraRig rig(config);
  rig.cursor(40.0f, 25.0f);

  const auto uniform = rig.uniform();
  CHECK(uniform.transform == rig.view());
  CHECK(uniform.v_fov == 1.2f);
}
