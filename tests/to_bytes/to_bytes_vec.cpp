#include <cassert>
#include <cstddef>
#include <cstdint>
#include <utility>

#include "retype.hpp"
#include "support/byte_model.hpp"

// tests/to_bytes/to_bytes_vec.cpp
//
// transmute_to_bytes_vec relabels an owned buffer as bytes without copying: length and
// capacity scale by sizeof(T), the pointer is unchanged, and the storage is still freed
// with the alignment it was allocated with. Going back with transmute_byte_vec reuses
// it again.

int main() {
  using namespace retype;
  namespace ref = retype_test::ref;

  auto src = buffer<std::uint32_t>::with_capacity(5);
  src.push_back(0xAABBCCDDu);
  src.push_back(0x01020304u);
  auto const* p = static_cast<void const*>(src.data());

  buffer<std::byte> bytes = transmute_to_bytes_vec(std::move(src));
  assert(src.empty());
  assert(bytes.size() == 8u);
  assert(bytes.capacity() == 20u);
  assert(static_cast<void const*>(bytes.data()) == p);
  assert(bytes.allocation_alignment() == alignof(std::uint32_t));
  assert(ref::load_native(bytes.data(), 4) == 0xAABBCCDDu);

  auto r = transmute_byte_vec<std::uint32_t, guard_policy::pedantic>(std::move(bytes));
  assert(r.is_ok());
  assert(r.value().size() == 2u && r.value().capacity() == 5u);
  assert(static_cast<void const*>(r.value().data()) == p);
  assert(r.value()[1] == 0x01020304u);

  // Unchecked form accepts any trivially copyable element.
  {
    struct pair16 { std::uint16_t a; std::uint8_t b; };
    buffer<pair16> pairs(2);
    buffer<std::byte> raw = transmute_to_bytes_vec_unchecked(std::move(pairs));
    assert(raw.size() == 2 * sizeof(pair16));
  }

  return 0;
}
