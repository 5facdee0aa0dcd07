#include <benchmark/benchmark.h>

#include <cstdlib>
#include <random>
#include <vector>

#include <hyperpga/core/motor.hpp>
#include <hyperpga/core/point.hpp>
#include <hyperpga/data/point_cloud.hpp>
#include <hyperpga/ops/transform.hpp>

using hyperpga::core::Motor;
using hyperpga::core::Plane;
using hyperpga::core::Point;
using hyperpga::data::PointCloud4;

namespace {
struct BenchEnvSetup {
  BenchEnvSetup() { unsetenv("HYPERPGA_VERBOSE"); }
} kBenchEnvSetup;
} // namespace

static Motor make_motor(std::mt19937 &rng) {
  std::uniform_real_distribution<float> angle(-3.0f, 3.0f);
  std::uniform_real_distribution<float> offset(-5.0f, 5.0f);
  return Motor::rotation(Plane::E12, angle(rng)) *
         Motor::rotation(Plane::E34, angle(rng)) *
         Motor::rotation(Plane::E24, angle(rng)) *
         Motor::translation({offset(rng), offset(rng), offset(rng),
                             offset(rng)});
}

static PointCloud4 make_cloud(size_t n_points) {
  PointCloud4 cloud;
  cloud.reserve(n_points);

  std::mt19937 rng(42);
  std::uniform_real_distribution<float> dist(-10.0f, 10.0f);
  for (size_t i = 0; i < n_points; ++i) {
    cloud.push_point({dist(rng), dist(rng), dist(rng), dist(rng)});
  }
  return cloud;
}

static void bench_compose(benchmark::State &state) {
  std::mt19937 rng(1);
  std::vector<Motor> motors(256);
  for (Motor &m : motors)
    m = make_motor(rng);

  size_t i = 0;
  Motor acc;
  for (auto _ : state) {
    acc = acc * motors[i++ & 255];
    benchmark::DoNotOptimize(acc);
  }
}

static void bench_transform_point(benchmark::State &state) {
  std::mt19937 rng(2);
  const Motor m = make_motor(rng);
  Motor::Vec4 p{1.0f, 2.0f, 3.0f, 4.0f};
  for (auto _ : state) {
    p = m.transform_point(p);
    benchmark::DoNotOptimize(p);
  }
}

static void bench_point_sandwich(benchmark::State &state) {
  std::mt19937 rng(3);
  const Motor m = make_motor(rng);
  Point p = Point::from_cartesian(1.0f, 2.0f, 3.0f, 4.0f);
  for (auto _ : state) {
    p = p.transform(m);
    benchmark::DoNotOptimize(p);
  }
}

static void bench_normalize(benchmark::State &state) {
  std::mt19937 rng(4);
  const Motor m = make_motor(rng).scaled(1.5f);
  for (auto _ : state) {
    Motor n = m.normalized();
    benchmark::DoNotOptimize(n);
  }
}

static void bench_transform_points_serial(benchmark::State &state) {
  setenv("HYPERPGA_BACKEND", "cpu", 1);
  PointCloud4 cloud = make_cloud(static_cast<size_t>(state.range(0)));
  std::mt19937 rng(5);
  const Motor m = make_motor(rng);
  for (auto _ : state) {
    hyperpga::ops::transform_points(m, cloud);
    benchmark::DoNotOptimize(cloud.x.data());
  }
  unsetenv("HYPERPGA_BACKEND");
}

static void bench_transform_points_parallel(benchmark::State &state) {
  setenv("HYPERPGA_BACKEND", "parallel", 1);
  PointCloud4 cloud = make_cloud(static_cast<size_t>(state.range(0)));
  std::mt19937 rng(6);
  const Motor m = make_motor(rng);
  for (auto _ : state) {
    hyperpga::ops::transform_points(m, cloud);
    benchmark::DoNotOptimize(cloud.x.data());
  }
  unsetenv("HYPERPGA_BACKEND");
}

BENCHMARK(bench_compose);
BENCHMARK(bench_transform_point);
BENCHMARK(bench_point_sandwich);
BENCHMARK(bench_normalize);
BENCHMARK(bench_transform_points_serial)->Arg(4096)->Arg(262144);
BENCHMARK(bench_transform_points_parallel)->Arg(4096)->Arg(262144);

BENCHMARK_MAIN();
