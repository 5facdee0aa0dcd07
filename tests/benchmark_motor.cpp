#include <algorithm>
#include <array>
#include <chrono>
#include <fmt/core.h>
#include <hyperpga/hyperpga.hpp>
#include <random>
#include <vector>

using namespace hyperpga::core;
using Clock = std::chrono::high_resolution_clock;

// Generic Cayley-table product over the full 32-blade algebra.
using Algebra = Multivector<float, PGA4D>;

int main() {
  constexpr int ITERATIONS = 2'000'000;

  std::vector<Motor> lhs(ITERATIONS);
  std::vector<Motor> rhs(ITERATIONS);

  std::mt19937 gen(42);
  std::uniform_real_distribution<float> dist(-2.0f, 2.0f);

  fmt::print("Generating {} random motors...\n", ITERATIONS);
  for (int i = 0; i < ITERATIONS; ++i) {
    std::array<float, Motor::Size> a{};
    std::array<float, Motor::Size> b{};
    for (size_t k = 0; k < Motor::Size; ++k) {
      a[k] = dist(gen);
      b[k] = dist(gen);
    }
    lhs[i] = Motor::from_components(a);
    rhs[i] = Motor::from_components(b);
  }

  std::vector<Algebra> lhs_mv(ITERATIONS);
  std::vector<Algebra> rhs_mv(ITERATIONS);
  for (int i = 0; i < ITERATIONS; ++i) {
    lhs_mv[i] = lhs[i].to_multivector();
    rhs_mv[i] = rhs[i].to_multivector();
  }

  float checksum = 0.0f;

  // --- Benchmark 1: Naive ---
  fmt::print("Benchmarking Naive Cayley Product... ");
  auto start = Clock::now();

  for (int i = 0; i < ITERATIONS; ++i) {
    auto result = lhs_mv[i].multiply_naive(rhs_mv[i]);
    checksum += result[0];
  }

  auto end = Clock::now();
  auto dur_naive =
      std::chrono::duration_cast<std::chrono::milliseconds>(end - start)
          .count();
  fmt::print("{} ms\n", dur_naive);

  // --- Benchmark 2: Unrolled Cayley ---
  fmt::print("Benchmarking TMP Unrolled Product... ");
  start = Clock::now();

  for (int i = 0; i < ITERATIONS; ++i) {
    auto result = lhs_mv[i] * rhs_mv[i];
    checksum += result[0];
  }

  end = Clock::now();
  auto dur_tmpl =
      std::chrono::duration_cast<std::chrono::milliseconds>(end - start)
          .count();
  fmt::print("{} ms\n", dur_tmpl);

  // --- Benchmark 3: Closed-form Motor ---
  fmt::print("Benchmarking Motor Compose... ");
  start = Clock::now();

  for (int i = 0; i < ITERATIONS; ++i) {
    auto result = lhs[i] * rhs[i];
    checksum += result.s;
  }

  end = Clock::now();
  auto dur_motor =
      std::chrono::duration_cast<std::chrono::milliseconds>(end - start)
          .count();
  fmt::print("{} ms\n", dur_motor);

  // --- Benchmark 4: Wide SIMD Motor ---
  constexpr int BATCH_SIZE = Packet::size;
  const int BATCH_COUNT = ITERATIONS / BATCH_SIZE;

  std::vector<WideMotor> lhs_wide(BATCH_COUNT);
  std::vector<WideMotor> rhs_wide(BATCH_COUNT);
  for (int i = 0; i < BATCH_COUNT; ++i) {
    lhs_wide[i] = splat(lhs[i]);
    rhs_wide[i] = splat(rhs[i]);
  }

  fmt::print("Benchmarking Wide Motor (Size {})... ", BATCH_SIZE);
  start = Clock::now();

  Packet wide_checksum(0.0f);
  for (int i = 0; i < BATCH_COUNT; ++i) {
    auto result = lhs_wide[i] * rhs_wide[i];
    wide_checksum += result.s;
  }
  checksum += wide_checksum.get(0);

  end = Clock::now();
  auto dur_wide =
      std::chrono::duration_cast<std::chrono::milliseconds>(end - start)
          .count();
  fmt::print("{} ms\n", dur_wide);

  // --- Final Report ---
  fmt::print("\n--- Speedup Report ---\n");
  fmt::print("Unrolled vs Naive: {:.2f}x\n",
             (double)dur_naive / (double)std::max<long long>(1, dur_tmpl));
  fmt::print("Motor vs Unrolled: {:.2f}x\n",
             (double)dur_tmpl / (double)std::max<long long>(1, dur_motor));
  fmt::print("Wide Motor vs Motor: {:.2f}x\n",
             (double)dur_motor / (double)std::max<long long>(1, dur_wide));

  fmt::print("\nChecksum: {} (ignore)\n", checksum);

  return 0;
}
