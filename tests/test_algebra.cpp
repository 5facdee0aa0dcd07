#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <random>

#include <hyperpga/core/algebra.hpp>

using hyperpga::core::Multivector;
using hyperpga::core::PGA4D;
using hyperpga::core::Signature;

// ============================================================================
// TEST SUITE 1: Projective 4D (Cl(4, 0, 1))
// Basis: e0 (bit 0, null), e1..e4 (bits 1..4, square to +1).
// ============================================================================
TEST_CASE("Projective Geometric Algebra (PGA 4D)") {
  using PGA = Multivector<double, PGA4D>;

  auto e0 = PGA::from_blade(1 << 0, 1);
  auto e1 = PGA::from_blade(1 << 1, 1);
  auto e2 = PGA::from_blade(1 << 2, 1);
  auto e3 = PGA::from_blade(1 << 3, 1);
  auto e4 = PGA::from_blade(1 << 4, 1);

  SUBCASE("Metric Properties") {
    CHECK((e0 * e0)[0] == doctest::Approx(0.0));
    CHECK((e1 * e1)[0] == doctest::Approx(1.0));
    CHECK((e2 * e2)[0] == doctest::Approx(1.0));
    CHECK((e3 * e3)[0] == doctest::Approx(1.0));
    CHECK((e4 * e4)[0] == doctest::Approx(1.0));
  }

  SUBCASE("Anti-Commutativity (e0 e1 = -e1 e0)") {
    auto e01 = e0 * e1;
    auto e10 = e1 * e0;
    CHECK(e01[0b00011] == doctest::Approx(1.0));
    CHECK(e10[0b00011] == doctest::Approx(-1.0));

    auto e34 = e3 * e4;
    auto e43 = e4 * e3;
    CHECK((e34 + e43)[0b11000] == doctest::Approx(0.0));
  }

  SUBCASE("Translation bivectors square to zero") {
    auto e01 = e0 * e1;
    auto sq = e01 * e01;
    for (size_t i = 0; i < PGA::Size; ++i) {
      CHECK(sq[i] == doctest::Approx(0.0));
    }
  }

  SUBCASE("Rotation bivectors square to -1") {
    auto e12 = e1 * e2;
    CHECK((e12 * e12)[0] == doctest::Approx(-1.0));
  }

  SUBCASE("Euclidean quadvector e1234 squares to +1") {
    auto I4 = e1 * e2 * e3 * e4;
    CHECK(I4[0b11110] == doctest::Approx(1.0));
    CHECK((I4 * I4)[0] == doctest::Approx(1.0));
  }

  SUBCASE("Pseudoscalar is degenerate") {
    auto I = e0 * e1 * e2 * e3 * e4;
    CHECK(I[0b11111] == doctest::Approx(1.0));
    CHECK((I * I)[0] == doctest::Approx(0.0));
  }

  SUBCASE("Wedge of shared factors vanishes") {
    auto w = (e1 * e2) ^ e2;
    for (size_t i = 0; i < PGA::Size; ++i) {
      CHECK(w[i] == doctest::Approx(0.0));
    }
    CHECK(((e1 * e2) ^ e3)[0b01110] == doctest::Approx(1.0));
  }
}

// ============================================================================
// TEST SUITE 2: Euclidean 4D (Cl(4, 0, 0))
// ============================================================================
TEST_CASE("Euclidean 4D Geometric Algebra") {
  using VGA = Multivector<double, Signature<4, 0, 0>>;

  auto e1 = VGA::from_blade(1 << 0, 1);
  auto e2 = VGA::from_blade(1 << 1, 1);
  auto e3 = VGA::from_blade(1 << 2, 1);
  auto e4 = VGA::from_blade(1 << 3, 1);

  SUBCASE("Generators Square to +1") {
    CHECK((e1 * e1)[0] == doctest::Approx(1.0));
    CHECK((e4 * e4)[0] == doctest::Approx(1.0));
  }

  SUBCASE("Pseudoscalar squares to +1 in four dimensions") {
    auto I = e1 * e2 * e3 * e4;
    CHECK(I[15] == doctest::Approx(1.0));
    CHECK((I * I)[0] == doctest::Approx(1.0));
  }
}

// ============================================================================
// TEST SUITE 3: Axiomatic Properties
// ============================================================================
TEST_CASE("Algebraic Axioms in PGA4D") {
  using Alg = Multivector<double, PGA4D>;

  std::mt19937 gen(7);
  std::uniform_real_distribution<double> dist(-2.0, 2.0);
  auto random_mv = [&]() {
    Alg mv;
    for (size_t i = 0; i < Alg::Size; ++i)
      mv[i] = dist(gen);
    return mv;
  };

  const Alg a = random_mv();
  const Alg b = random_mv();
  const Alg c = random_mv();

  SUBCASE("Distributivity: A(B + C) = AB + AC") {
    auto left = a * (b + c);
    auto right = (a * b) + (a * c);
    for (size_t i = 0; i < Alg::Size; ++i) {
      CHECK(left[i] == doctest::Approx(right[i]));
    }
  }

  SUBCASE("Associativity: (AB)C = A(BC)") {
    auto left = (a * b) * c;
    auto right = a * (b * c);
    for (size_t i = 0; i < Alg::Size; ++i) {
      CHECK(left[i] == doctest::Approx(right[i]));
    }
  }

  SUBCASE("Reverse is an anti-automorphism: ~(AB) = ~B ~A") {
    auto left = (a * b).reverse();
    auto right = b.reverse() * a.reverse();
    for (size_t i = 0; i < Alg::Size; ++i) {
      CHECK(left[i] == doctest::Approx(right[i]));
    }
  }

  SUBCASE("Naive vs Unrolled Implementation Match") {
    auto fast = a * b;
    auto slow = a.multiply_naive(b);
    for (size_t i = 0; i < Alg::Size; ++i) {
      CHECK(fast[i] == doctest::Approx(slow[i]));
    }
  }
}
