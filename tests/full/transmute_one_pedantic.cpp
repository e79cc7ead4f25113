#include <cassert>
#include <cstddef>
#include <cstdint>

#include "retype.hpp"
#include "support/byte_model.hpp"

// tests/full/transmute_one_pedantic.cpp
//
// transmute_one_pedantic<T>: the buffer must be exactly sizeof(T) bytes. Shorter and
// longer buffers both report inexact_byte_count with required = sizeof(T).

int main() {
  using namespace retype;
  namespace ref = retype_test::ref;

  ref::aligned_bytes<16> store;
  ref::fill_counting(store);

  {
    auto r = transmute_one_pedantic<std::uint32_t>(std::span<std::byte const>(store.at(8), 4));
    assert(r.is_ok());
    assert(r.value() == ref::load_native(store.at(8), 4));
  }

  for (std::size_t len : { std::size_t{ 0 }, std::size_t{ 3 }, std::size_t{ 5 }, std::size_t{ 8 } }) {
    auto r = transmute_one_pedantic<std::uint32_t>(std::span<std::byte const>(store.at(0), len));
    assert(r.is_error());
    assert(r.error().get<guard_error>() == (guard_error{ 4, len, error_reason::inexact_byte_count }));
  }

  // Correct length, wrong address: alignment is still checked.
  {
    auto r = transmute_one_pedantic<std::uint16_t>(std::span<std::byte const>(store.at(1), 2));
    assert(r.is_error());
    assert((r.error().get<unaligned_error<std::byte, std::uint16_t>>().offset == 1u));
  }

  // Wrong length and wrong address: the guard is reported.
  {
    auto r = transmute_one_pedantic<std::uint16_t>(std::span<std::byte const>(store.at(1), 3));
    assert(r.is_error());
    assert(r.error().kind() == error_kind::guard);
  }

  return 0;
}
