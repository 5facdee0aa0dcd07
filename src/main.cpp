#include <cmath>
#include <cstdlib>
#include <numbers>
#include <string>

#include <fmt/core.h>
#include <hyperpga/hyperpga.hpp>

using namespace hyperpga;
using core::Motor;

// Corners of the tesseract [-1, 1]^4, centred at `center`.
static data::PointCloud4 make_tesseract(const Motor::Vec4 &center) {
  data::PointCloud4 cloud;
  cloud.name = "tesseract";
  cloud.reserve(16);
  for (int i = 0; i < 16; ++i) {
    cloud.push_point({center[0] + ((i & 1) ? 1.0f : -1.0f),
                      center[1] + ((i & 2) ? 1.0f : -1.0f),
                      center[2] + ((i & 4) ? 1.0f : -1.0f),
                      center[3] + ((i & 8) ? 1.0f : -1.0f)});
  }
  return cloud;
}

static void print_vec4(const char *label, const Motor::Vec4 &v) {
  fmt::print("  {:<12} ({:+.4f}, {:+.4f}, {:+.4f}, {:+.4f})\n", label, v[0],
             v[1], v[2], v[3]);
}

int main(int argc, char **argv) {
  const int frames = argc > 1 ? std::atoi(argv[1]) : 120;
  constexpr float dt = 1.0f / 60.0f;

  // =========================================================
  // 1. Composition order
  // =========================================================
  fmt::print("--- Composition ---\n");
  const Motor turn = Motor::rotation_xy(std::numbers::pi_v<float> / 2.0f);
  const Motor step = Motor::translation({1.0f, 0.0f, 0.0f, 0.0f});
  print_vec4("turn*step", core::transform_point(turn * step, {}));
  print_vec4("step*turn", core::transform_point(step * turn, {}));

  // =========================================================
  // 2. Fly the camera with scripted input
  // =========================================================
  fmt::print("\n--- Camera Rig ({} frames) ---\n", frames);
  rig::CameraRig camera;
  camera.movement().forward = 1.0f;
  for (int frame = 0; frame < frames; ++frame) {
    const float t = static_cast<float>(frame) * dt;
    camera.cursor(12.0f * std::cos(t), 4.0f * std::sin(2.0f * t));
    if (frame % 30 == 0) {
      camera.scroll(0.0f, 1.0f);
    }
    camera.update(dt);
  }

  const rig::CameraUniform uniform = camera.uniform();
  print_vec4("eye", uniform.transform.transform_point({}));
  print_vec4("forward",
             uniform.transform.transform_direction({1.0f, 0.0f, 0.0f, 0.0f}));
  fmt::print("  |view|^2     {:.7f}\n", uniform.transform.magnitude_squared());
  fmt::print("  v_fov        {:.4f} rad\n", uniform.v_fov);

  // =========================================================
  // 3. Scene into camera space
  // =========================================================
  fmt::print("\n--- Camera Space ---\n");
  data::PointCloud4 scene = make_tesseract({2.0f, 0.5f, -1.5f, 0.5f});
  ops::transform_points(~uniform.transform, scene);

  for (size_t i = 0; i < scene.num_points(); ++i) {
    const std::string label = fmt::format("{}[{:2}]", scene.name, i);
    print_vec4(label.c_str(), scene.get_point(i));
  }

  // Same corner through the homogeneous point type.
  const core::Point corner = core::Point::from_cartesian(1.0f, -0.5f, -2.5f, -0.5f);
  print_vec4("point", corner.transform(~uniform.transform).to_cartesian());

  return 0;
}
