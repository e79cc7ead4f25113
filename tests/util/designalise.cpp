#include <bit>
#include <cassert>
#include <cmath>
#include <cstdint>

#include "retype.hpp"

// tests/util/designalise.cpp
//
// designalise sets the quiet bit (most significant fraction bit) on NaN patterns and
// leaves every other pattern, infinities included, bit-identical.
//
// NaN cases run at runtime from volatile inputs: constant folding of signaling NaNs is
// not something this test wants to depend on.

using namespace retype;

// non-NaN patterns are usable in constant expressions
static_assert(std::bit_cast<std::uint32_t>(from_bits_f32_designalised(0x7F80'0000u)) == 0x7F80'0000u); // +inf
static_assert(std::bit_cast<std::uint32_t>(from_bits_f32_designalised(0x3F80'0000u)) == 0x3F80'0000u); // 1.0
static_assert(std::bit_cast<std::uint32_t>(from_bits_f32_designalised(0x0000'0001u)) == 0x0000'0001u); // subnormal
static_assert(std::bit_cast<std::uint64_t>(from_bits_f64_designalised(0xFFF0'0000'0000'0000ull)) == 0xFFF0'0000'0000'0000ull); // -inf
static_assert(std::bit_cast<std::uint64_t>(from_bits_f64_designalised(0x3FF0'0000'0000'0000ull)) == 0x3FF0'0000'0000'0000ull); // 1.0

namespace {
  std::uint32_t f32_bits_after(std::uint32_t in) {
    volatile std::uint32_t v = in;
    return std::bit_cast<std::uint32_t>(from_bits_f32_designalised(v));
  }

  std::uint64_t f64_bits_after(std::uint64_t in) {
    volatile std::uint64_t v = in;
    return std::bit_cast<std::uint64_t>(from_bits_f64_designalised(v));
  }
}

int main() {
  // f32: signaling -> quiet, payload and sign kept
  assert(f32_bits_after(0x7F80'0001u) == 0x7FC0'0001u);
  assert(f32_bits_after(0xFF80'0001u) == 0xFFC0'0001u);
  assert(f32_bits_after(0x7FBF'FFFFu) == 0x7FFF'FFFFu);
  // already quiet, infinities, ordinary values: unchanged
  assert(f32_bits_after(0x7FC0'0000u) == 0x7FC0'0000u);
  assert(f32_bits_after(0xFF80'0000u) == 0xFF80'0000u);
  assert(f32_bits_after(0x4020'0000u) == 0x4020'0000u);

  // f64: the quiet bit is bit 51
  assert(f64_bits_after(0x7FF0'0000'0000'0001ull) == 0x7FF8'0000'0000'0001ull);
  assert(f64_bits_after(0xFFF0'0000'0000'0001ull) == 0xFFF8'0000'0000'0001ull);
  assert(f64_bits_after(0x7FF4'0000'0000'0000ull) == 0x7FFC'0000'0000'0000ull);
  assert(f64_bits_after(0x7FF8'0000'0000'0000ull) == 0x7FF8'0000'0000'0000ull);
  assert(f64_bits_after(0x7FF0'0000'0000'0000ull) == 0x7FF0'0000'0000'0000ull);

  // float-typed entry points
  {
    volatile std::uint32_t raw = 0x7F80'0002u;
    const float q = designalise_f32(std::bit_cast<float>(static_cast<std::uint32_t>(raw)));
    assert(std::isnan(q));
    assert(designalise_f32(2.5f) == 2.5f);
  }
  {
    volatile std::uint64_t raw = 0x7FF0'0000'0000'0002ull;
    const double q = designalise_f64(std::bit_cast<double>(static_cast<std::uint64_t>(raw)));
    assert(std::isnan(q));
    assert(std::signbit(designalise_f64(-0.0)));
  }

  return 0;
}
