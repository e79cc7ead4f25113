#include <array>
#include <cstddef>
#include <cstdint>

#include "retype.hpp"

// tests/capability/reject_non_trivially_copyable_opt_in_compile_fail.cpp  (compile-fail)
//
// Opting in is an unchecked assertion about bit patterns, but it cannot override the
// language: trivially_transmutable<T> also requires std::is_trivially_copyable_v<T>.
// A type with a user-provided copy constructor stays rejected even after opting in.
//
// This file must FAIL TO COMPILE.

struct counted {
  std::uint32_t v;
  counted() = default;
  counted(counted const& o) : v(o.v + 1) {}
};

RETYPE_TRIVIALLY_TRANSMUTABLE(counted);

static_assert(retype::is_trivially_transmutable<counted>::value);

int main() {
  alignas(4) std::array<std::byte, 4> buf{};
  auto r = retype::transmute_one<counted>(std::span<std::byte const>(buf)); // <-- should fail
  return r.is_ok() ? 0 : 1;
}
