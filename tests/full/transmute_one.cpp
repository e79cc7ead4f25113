#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include "retype.hpp"
#include "support/byte_model.hpp"

// tests/full/transmute_one.cpp
//
// transmute_one<T>: guard at_least_one, then alignment, then a by-value read of the
// leading sizeof(T) bytes. Trailing bytes are ignored.

int main() {
  using namespace retype;
  namespace ref = retype_test::ref;

  ref::aligned_bytes<16> store;
  ref::fill_counting(store);

  // Exact size.
  {
    auto r = transmute_one<std::uint32_t>(std::span<std::byte const>(store.at(0), 4));
    assert(r.is_ok());
    assert(r.value() == ref::load_native(store.at(0), 4));
  }

  // Longer buffer: only the first four bytes matter.
  {
    auto r = transmute_one<std::uint32_t>(std::span<std::byte const>(store.at(4), 11));
    assert(r.is_ok());
    assert(r.value() == ref::load_native(store.at(4), 4));
  }

  // Too short.
  {
    auto r = transmute_one<std::uint32_t>(std::span<std::byte const>(store.at(0), 3));
    assert(r.is_error());
    assert(r.error().kind() == error_kind::guard);
    assert(r.error().get<guard_error>() == (guard_error{ 4, 3, error_reason::not_enough_bytes }));
  }

  // Empty.
  {
    auto r = transmute_one<std::uint64_t>(std::span<std::byte const>());
    assert(r.is_error());
    assert(r.error().get<guard_error>() == (guard_error{ 8, 0, error_reason::not_enough_bytes }));
  }

  // Misaligned.
  {
    auto r = transmute_one<std::uint32_t>(std::span<std::byte const>(store.at(2), 4));
    assert(r.is_error());
    assert(r.error().kind() == error_kind::unaligned);
    assert((r.error().get<unaligned_error<std::byte, std::uint32_t>>().offset == 2u));
  }

  // Byte-sized targets are never misaligned.
  {
    auto r = transmute_one<std::uint8_t>(std::span<std::byte const>(store.at(3), 1));
    assert(r.is_ok());
    assert(r.value() == 3u);
  }

  // Floats pass through bit-for-bit.
  {
    const float f = 1.5f;
    alignas(float) std::array<std::byte, sizeof(float)> raw{};
    std::memcpy(raw.data(), &f, sizeof f);
    auto r = transmute_one<float>(std::span<std::byte const>(raw));
    assert(r.is_ok());
    assert(r.value() == 1.5f);
  }

  // value_or on failure.
  {
    auto r = transmute_one<std::uint16_t>(std::span<std::byte const>(store.at(0), 1));
    assert(r.value_or(0xBEEFu) == 0xBEEFu);
  }

  return 0;
}
