#pragma once
#include <array>
#include <bit>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <type_traits>
#include <utility>

// Portable SIMD Intrinsics (NEON/AVX/SSE)
#include <xsimd/xsimd.hpp>

namespace hyperpga::core {

// ========================================================================
// 1. SIGNATURE & METRIC
// ========================================================================

// Represents Cl(p, q, r).
// Basis bit layout: the r degenerate vectors come first, then the p positive
// ones, then the q negative ones. For projective algebras this puts e0 at
// bit 0 so that blade bitmaps read in the usual e0, e1, e2, ... order.
template <int P, int Q, int R = 0>
  requires(P >= 0) && (Q >= 0) && (R >= 0)
struct Signature {
  static constexpr int p = P;
  static constexpr int q = Q;
  static constexpr int r = R;
  static constexpr int dim = P + Q + R;
  static constexpr size_t size = 1ULL << dim;

  // Safety check: Prevent stack overflows
  static_assert(dim <= 16, "Algebra dimension too large for stack allocation.");
};

// Common Signatures
using Euclidean4D = Signature<4, 0>;
using PGA4D = Signature<4, 0, 1>; // e0^2 = 0, e1..e4 square to +1

// Metric Helper
template <typename Sig> constexpr int get_basis_metric(int index) {
  if (index < Sig::r)
    return 0;
  if (index < Sig::r + Sig::p)
    return 1;
  return -1;
}

// Computes the sign/metric for basis blade multiplication a * b
// Returns: 1, -1, or 0 (if metric is degenerate)
template <typename Sig>
constexpr int geometric_product_sign(unsigned int a, unsigned int b) {
  int sign = 1;

  // 1. Canonical Reordering (Count swaps)
  // If 'a' has bit i and 'b' has bit j with i > j, that's a swap.
  unsigned int a_temp = a >> 1;
  int swaps = 0;
  while (a_temp != 0) {
    swaps += std::popcount(a_temp & b);
    a_temp >>= 1;
  }
  if ((swaps % 2) != 0)
    sign = -sign;

  // 2. Metric Contraction (Square basis vectors)
  unsigned int intersection = a & b;
  while (intersection != 0) {
    int i = std::countr_zero(intersection);
    sign *= get_basis_metric<Sig>(i);
    intersection &= intersection - 1;
  }
  return sign;
}

// Grade of a basis blade = number of basis vectors in its bitmap.
constexpr int grade_of(unsigned int bitmap) { return std::popcount(bitmap); }

// Reversion flips the order of the k factors: sign (-1)^(k(k-1)/2).
constexpr int reverse_sign(unsigned int bitmap) {
  const int k = grade_of(bitmap);
  return ((k * (k - 1) / 2) % 2 == 0) ? 1 : -1;
}

// ========================================================================
// 2. CAYLEY LOOKUP TABLE
// ========================================================================
// Pre-calculates all signs at compile time so the runtime "naive" product
// does no bit-twiddling.
template <typename Sig> struct CayleyTable {
  static constexpr size_t N = Sig::size;
  std::array<int, N * N> signs{};

  consteval CayleyTable() {
    for (unsigned int i = 0; i < N; ++i) {
      for (unsigned int j = 0; j < N; ++j) {
        signs[i * N + j] = geometric_product_sign<Sig>(i, j);
      }
    }
  }

  constexpr int get(unsigned int i, unsigned int j) const {
    return signs[i * N + j];
  }
};

// ========================================================================
// 3. MULTIVECTOR
// ========================================================================

// Concept to ensure valid signature
template <typename T>
concept IsSignature = requires {
  { T::p } -> std::convertible_to<int>;
  { T::dim } -> std::convertible_to<int>;
};

// Dense reference multivector. The motor and point types carry their own
// hand-unrolled kernels; this one is the table-driven ground truth they are
// checked against.
template <typename Field, IsSignature Sig> struct Multivector {
  static constexpr size_t Size = Sig::size;

  static constexpr CayleyTable<Sig> table{};

  alignas(xsimd::default_arch::alignment()) std::array<Field, Sig::size> data;

  // --- Constructors ---
  constexpr Multivector() : data{} {}

  // Factory: Multivector::from_blade(0b00011, 2.5) -> 2.5 * e01
  static constexpr Multivector from_blade(unsigned int bitmap, Field scale) {
    Multivector mv;
    if (bitmap < Sig::size)
      mv.data[bitmap] = scale;
    return mv;
  }

  // --- Accessors ---
  constexpr Field operator[](size_t i) const { return data[i]; }
  constexpr Field &operator[](size_t i) { return data[i]; }

  // =========================================================
  // IMPLEMENTATION A: NAIVE (Runtime Loop with Table)
  // =========================================================
  constexpr Multivector multiply_naive(const Multivector &other) const {
    Multivector result;
    for (size_t i = 0; i < Size; ++i) {
      for (size_t j = 0; j < Size; ++j) {
        const unsigned int target_bit = static_cast<unsigned int>(i ^ j);
        const int sign = table.get(static_cast<unsigned int>(i),
                                   static_cast<unsigned int>(j));

        if (sign == 1)
          result.data[target_bit] += data[i] * other.data[j];
        else if (sign == -1)
          result.data[target_bit] -= data[i] * other.data[j];
      }
    }
    return result;
  }

  // =========================================================
  // IMPLEMENTATION B: OPTIMIZED (Compile-Time Gather)
  // =========================================================
private:
  // Unified Accumulator for Geometric (*) and Wedge (^) products
  template <bool IsWedge, size_t TargetK, size_t I>
  constexpr void accumulate_product(Field &accumulator,
                                    const Multivector &other) const {
    constexpr size_t J = I ^ TargetK;

    // Wedge: blades sharing a vector contribute nothing.
    if constexpr (IsWedge && (I & J) != 0) {
      return;
    }

    constexpr int sign = geometric_product_sign<Sig>(I, J);

    if constexpr (sign != 0) {
      if constexpr (sign == 1) {
        accumulator += data[I] * other.data[J];
      } else {
        accumulator -= data[I] * other.data[J];
      }
    }
  }

  // Unrolls the sum for a single target component
  template <bool IsWedge, size_t TargetK, size_t... Is>
  constexpr void compute_component(Multivector &result,
                                   const Multivector &other,
                                   std::index_sequence<Is...>) const {
    Field sum = Field(0);
    (accumulate_product<IsWedge, TargetK, Is>(sum, other), ...);
    result.data[TargetK] = sum;
  }

  // Unrolls the loop over all target components
  template <bool IsWedge, size_t... Ks>
  constexpr Multivector unroll_targets(const Multivector &other,
                                       std::index_sequence<Ks...>) const {
    Multivector result;
    (compute_component<IsWedge, Ks>(result, other,
                                    std::make_index_sequence<Size>{}),
     ...);
    return result;
  }

public:
  // Geometric Product (*)
  constexpr Multivector operator*(const Multivector &other) const {
    return unroll_targets<false>(other, std::make_index_sequence<Size>{});
  }

  // Outer Product (^)
  constexpr Multivector operator^(const Multivector &other) const {
    return unroll_targets<true>(other, std::make_index_sequence<Size>{});
  }

  // Reverse (~): grades 2 and 3 (mod 4) change sign.
  constexpr Multivector reverse() const {
    Multivector result;
    for (size_t i = 0; i < Size; ++i) {
      if (reverse_sign(static_cast<unsigned int>(i)) == 1)
        result.data[i] = data[i];
      else
        result.data[i] = -data[i];
    }
    return result;
  }

  // --- Basic Arithmetic ---
  constexpr Multivector operator+(const Multivector &other) const {
    Multivector result;
    for (size_t i = 0; i < Size; ++i)
      result.data[i] = data[i] + other.data[i];
    return result;
  }

  constexpr Multivector operator-(const Multivector &other) const {
    Multivector result;
    for (size_t i = 0; i < Size; ++i)
      result.data[i] = data[i] - other.data[i];
    return result;
  }
};

// ========================================================================
// 4. WIDE TYPES (Structure of Arrays)
// ========================================================================

// Auto-detect the best SIMD batch size (NEON on Mac, AVX on Intel)
using Packet = xsimd::batch<float>;

template <typename Sig> using WideMultivector = Multivector<Packet, Sig>;

} // namespace hyperpga::core
