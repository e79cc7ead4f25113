#pragma once
/*
  retype.hpp - single-header, checked zero-copy reinterpretation of byte buffers.

  Goal: view a contiguous byte buffer (or a buffer of one element type) as a buffer of
  another element type without an unconditional copy, and reject the accesses that would
  be undefined behavior (reading past the end, reading misaligned memory, manufacturing
  values with invalid bit patterns) with typed errors instead. Errors that can be
  recovered from by copying (misalignment, incompatible owned buffers) carry the rejected
  data so the caller can retry.

  Byte order is whatever the platform uses; this is not a serialization format.

  C++20 required (concepts, std::span, std::bit_cast).

  SPDX-License-Identifier: MIT
*/
#if __cplusplus < 202002L
#  error "retype requires C++20"
#endif
#ifndef RETYPE_HPP_INCLUDED
#define RETYPE_HPP_INCLUDED

#include <array>
#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <limits>
#include <memory>
#include <new>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#if defined(_MSC_VER)
  #define RETYPE_FORCEINLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
  #define RETYPE_FORCEINLINE __attribute__((always_inline)) inline
#else
  #define RETYPE_FORCEINLINE inline
#endif

// Contract checks for programming errors (wrong result alternative, index out of range).
// Expected failures never go through here; they are returned as errors.
#ifndef RETYPE_ASSERT
  #include <cassert>
  #define RETYPE_ASSERT(x) assert(x)
#endif

namespace retype {


  // lifetime helpers (the one place raw pointer reinterpretation happens)

  namespace detail {

#if defined(__cpp_lib_start_lifetime_as) && __cpp_lib_start_lifetime_as >= 202207L
    template <class T>
    RETYPE_FORCEINLINE T const* start_lifetime_as_array(void const* p, std::size_t n) noexcept {
      if (n == 0u) return static_cast<T const*>(p);
      return std::start_lifetime_as_array<T>(p, n);
    }

    template <class T>
    RETYPE_FORCEINLINE T* start_lifetime_as_array(void* p, std::size_t n) noexcept {
      if (n == 0u) return static_cast<T*>(p);
      return std::start_lifetime_as_array<T>(p, n);
    }
#else
    template <class T>
    RETYPE_FORCEINLINE T const* start_lifetime_as_array(void const* p, std::size_t) noexcept {
      return reinterpret_cast<T const*>(p);
    }

    template <class T>
    RETYPE_FORCEINLINE T* start_lifetime_as_array(void* p, std::size_t) noexcept {
      return reinterpret_cast<T*>(p);
    }
#endif

    // safe for any address: copies sizeof(T) bytes, never dereferences a T*
    template <class T>
    RETYPE_FORCEINLINE T load_unchecked(std::byte const* p) noexcept {
      std::array<std::byte, sizeof(T)> raw;
      std::memcpy(raw.data(), p, sizeof(T));
      return std::bit_cast<T>(raw);
    }

  } // namespace detail


  // element descriptors

  struct element_descriptor {
    std::size_t size{};
    std::size_t align{};

    friend constexpr bool operator==(element_descriptor const&, element_descriptor const&) noexcept = default;
  };

  template <class T>
  inline constexpr element_descriptor descriptor_of{ sizeof(T), alignof(T) };

  // Owned buffers may be relabelled only between types with identical size and alignment.
  template <class S, class T>
  inline constexpr bool same_layout = (descriptor_of<S> == descriptor_of<T>);


  // safety capability

  //
  // is_trivially_transmutable<T> asserts that *every* bit pattern of sizeof(T) bytes is a
  // valid T. It is what lets the checked operations skip value validation, leaving only
  // length and alignment as preconditions.
  //
  // Default-closed: unknown types are not capable. Built in for the integer types (not
  // bool), std::byte, float, double, and arrays of capable types. Authors of composite
  // types opt in with an explicit specialization, or RETYPE_TRIVIALLY_TRANSMUTABLE(Type)
  // at global namespace scope. Nothing verifies that claim: a struct with padding or with
  // a restricted-domain member must not opt in.
  //
  // C arrays T[N] are capable for borrowed views, to-bytes views and as members of
  // opted-in composites. They cannot be returned by value or held in a buffer, so
  // transmute_one, transmute_vec and the recovery copies take std::array<T, N> instead.
  //
  template <class T>
  struct is_trivially_transmutable : std::false_type {};

  namespace detail {
    template <class T>
    inline constexpr bool is_fully_populated_scalar =
      (std::is_integral_v<T> && !std::is_same_v<T, bool>) ||
      std::is_same_v<T, std::byte> ||
      std::is_same_v<T, float> ||
      std::is_same_v<T, double>;
  } // namespace detail

  template <class T>
    requires detail::is_fully_populated_scalar<T>
  struct is_trivially_transmutable<T> : std::true_type {};

  template <class T, std::size_t N>
  struct is_trivially_transmutable<T[N]> : is_trivially_transmutable<T> {};

  template <class T, std::size_t N>
  struct is_trivially_transmutable<std::array<T, N>>
    : std::bool_constant<is_trivially_transmutable<T>::value && (sizeof(std::array<T, N>) == N * sizeof(T))> {};

  template <class T>
  concept trivially_transmutable =
    is_trivially_transmutable<std::remove_cv_t<T>>::value && std::is_trivially_copyable_v<T>;

  // What the *_unchecked escape hatches accept: bytes can be copied in and out, but the
  // caller vouches for the values.
  template <class T>
  concept trivially_copyable = std::is_trivially_copyable_v<T>;

  #define RETYPE_TRIVIALLY_TRANSMUTABLE(...) \
    template <> struct retype::is_trivially_transmutable<__VA_ARGS__> : std::true_type {}


  // alignment

  // Bytes to discard from the front of a buffer at `address` so that it satisfies `align`.
  // Zero when already aligned, otherwise in [1, align). The modulus is the alignment, never
  // the size: they differ for composites such as struct { uint16_t a, b, c; }.
  RETYPE_FORCEINLINE constexpr std::size_t alignment_offset(std::uintptr_t address, std::size_t align) noexcept {
    if (align <= 1u) return 0u;
    const std::size_t rem = static_cast<std::size_t>(address % align);
    return (rem == 0u) ? 0u : (align - rem);
  }

  RETYPE_FORCEINLINE constexpr std::size_t alignment_offset(std::uintptr_t address, element_descriptor d) noexcept {
    return alignment_offset(address, d.align);
  }

  RETYPE_FORCEINLINE std::size_t alignment_offset(void const* p, std::size_t align) noexcept {
    return alignment_offset(reinterpret_cast<std::uintptr_t>(p), align);
  }

  template <class T>
  RETYPE_FORCEINLINE bool is_aligned_for(void const* p) noexcept {
    return alignment_offset(p, alignof(T)) == 0u;
  }


  // result<T, E>

  template <class E>
  struct failure {
    E error;
  };

  template <class E>
  RETYPE_FORCEINLINE constexpr failure<std::decay_t<E>> fail(E&& e) {
    return failure<std::decay_t<E>>{ std::forward<E>(e) };
  }

  //
  // Return type of every fallible operation. Holds either a T or an E; failures are built
  // with fail(e) so that T and E never compete for the same constructor.
  //
  template <class T, class E>
  class [[nodiscard]] result {
    std::variant<T, E> v_;

  public:
    using value_type = T;
    using error_type = E;

    constexpr result(T const& value) requires std::copy_constructible<T>
      : v_(std::in_place_index<0>, value) {}

    constexpr result(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>)
      : v_(std::in_place_index<0>, std::move(value)) {}

    template <class F>
      requires std::constructible_from<E, F&&>
    constexpr result(failure<F>&& f) noexcept(std::is_nothrow_constructible_v<E, F&&>)
      : v_(std::in_place_index<1>, std::move(f.error)) {}

    template <class F>
      requires std::constructible_from<E, F const&>
    constexpr result(failure<F> const& f)
      : v_(std::in_place_index<1>, f.error) {}

    [[nodiscard]] constexpr bool is_ok() const noexcept { return v_.index() == 0u; }

    [[nodiscard]] constexpr bool is_error() const noexcept { return v_.index() == 1u; }

    constexpr T& value() & noexcept {
      RETYPE_ASSERT(is_ok());
      return *std::get_if<0>(&v_);
    }

    constexpr T const& value() const& noexcept {
      RETYPE_ASSERT(is_ok());
      return *std::get_if<0>(&v_);
    }

    constexpr T&& value() && noexcept {
      RETYPE_ASSERT(is_ok());
      return std::move(*std::get_if<0>(&v_));
    }

    constexpr E& error() & noexcept {
      RETYPE_ASSERT(is_error());
      return *std::get_if<1>(&v_);
    }

    constexpr E const& error() const& noexcept {
      RETYPE_ASSERT(is_error());
      return *std::get_if<1>(&v_);
    }

    constexpr E&& error() && noexcept {
      RETYPE_ASSERT(is_error());
      return std::move(*std::get_if<1>(&v_));
    }

    template <class U>
    constexpr T value_or(U&& fallback) const& {
      return is_ok() ? value() : static_cast<T>(std::forward<U>(fallback));
    }
  };

  template <class E>
  class [[nodiscard]] result<void, E> {
    std::optional<E> error_;

  public:
    using value_type = void;
    using error_type = E;

    constexpr result() noexcept = default;

    template <class F>
      requires std::constructible_from<E, F&&>
    constexpr result(failure<F>&& f) noexcept(std::is_nothrow_constructible_v<E, F&&>)
      : error_(std::in_place, std::move(f.error)) {}

    template <class F>
      requires std::constructible_from<E, F const&>
    constexpr result(failure<F> const& f)
      : error_(std::in_place, f.error) {}

    [[nodiscard]] constexpr bool is_ok() const noexcept { return !error_.has_value(); }

    [[nodiscard]] constexpr bool is_error() const noexcept { return error_.has_value(); }

    constexpr E& error() & noexcept {
      RETYPE_ASSERT(is_error());
      return *error_;
    }

    constexpr E const& error() const& noexcept {
      RETYPE_ASSERT(is_error());
      return *error_;
    }

    constexpr E&& error() && noexcept {
      RETYPE_ASSERT(is_error());
      return std::move(*error_);
    }
  };


  // guard errors + boundary guards

  enum class error_reason : std::uint8_t {
    not_enough_bytes   = 0,
    too_many_bytes     = 1, // no shipped guard reports it; kept for caller-written guards
    inexact_byte_count = 2
  };

  constexpr char const* description(error_reason r) noexcept {
    switch (r) {
      case error_reason::not_enough_bytes:   return "not enough bytes to fill type";
      case error_reason::too_many_bytes:     return "too many bytes for type";
      case error_reason::inexact_byte_count: return "not exactly the amount of bytes for type";
    }
    return "unknown guard failure";
  }

  // Both fields are in bytes; `required` is always sizeof(T), never alignof(T).
  struct guard_error {
    std::size_t required{};
    std::size_t actual{};
    error_reason reason{};

    friend constexpr bool operator==(guard_error const&, guard_error const&) noexcept = default;

    constexpr char const* description() const noexcept { return retype::description(reason); }

    std::string to_string() const {
      return std::string(description()) + " (required: " + std::to_string(required) +
             ", actual: " + std::to_string(actual) + ")";
    }
  };

  //
  // Boundary policies. Each decides, from a buffer length and an element size (both in
  // bytes), whether the request is acceptable:
  //
  //   permissive   : anything; the element count rounds down, silently.
  //   exact        : exactly one element ("single value").
  //   at_least_one : one element or more; trailing bytes are ignored ("single many").
  //   pedantic     : one element or more and no trailing bytes.
  //   strict       : a whole number of elements, zero included ("all or nothing").
  //
  // A zero element size never reaches a division. permissive and at_least_one accept any
  // length for it; exact, pedantic and strict accept only length 0, the only multiple
  // of zero.
  //
  enum class guard_policy : std::uint8_t {
    permissive   = 0,
    exact        = 1,
    at_least_one = 2,
    pedantic     = 3,
    strict       = 4
  };

  namespace detail {
    RETYPE_FORCEINLINE constexpr bool whole_multiple(std::size_t length, std::size_t element_size) noexcept {
      return (element_size == 0u) ? (length == 0u) : ((length % element_size) == 0u);
    }

    RETYPE_FORCEINLINE constexpr failure<guard_error> guard_fail(std::size_t length, std::size_t element_size,
                                                                 error_reason r) noexcept {
      return { guard_error{ element_size, length, r } };
    }
  } // namespace detail

  template <guard_policy P>
  constexpr result<void, guard_error> check_guard(std::size_t length, std::size_t element_size) noexcept {
    if constexpr (P == guard_policy::permissive) {
      (void)length; (void)element_size;
      return {};
    } else if constexpr (P == guard_policy::exact) {
      if (length != element_size) return detail::guard_fail(length, element_size, error_reason::inexact_byte_count);
      return {};
    } else if constexpr (P == guard_policy::at_least_one) {
      if (length < element_size) return detail::guard_fail(length, element_size, error_reason::not_enough_bytes);
      return {};
    } else if constexpr (P == guard_policy::pedantic) {
      if (length < element_size) return detail::guard_fail(length, element_size, error_reason::not_enough_bytes);
      if (!detail::whole_multiple(length, element_size)) {
        return detail::guard_fail(length, element_size, error_reason::inexact_byte_count);
      }
      return {};
    } else {
      static_assert(P == guard_policy::strict, "unknown guard_policy");
      if (!detail::whole_multiple(length, element_size)) {
        return detail::guard_fail(length, element_size, error_reason::inexact_byte_count);
      }
      return {};
    }
  }

  // Runtime selection, for policies chosen from data. Out-of-range values get pedantic.
  constexpr result<void, guard_error> check_guard(guard_policy p, std::size_t length, std::size_t element_size) noexcept {
    switch (p) {
      case guard_policy::permissive:   return check_guard<guard_policy::permissive>(length, element_size);
      case guard_policy::exact:        return check_guard<guard_policy::exact>(length, element_size);
      case guard_policy::at_least_one: return check_guard<guard_policy::at_least_one>(length, element_size);
      case guard_policy::pedantic:     return check_guard<guard_policy::pedantic>(length, element_size);
      case guard_policy::strict:       return check_guard<guard_policy::strict>(length, element_size);
    }
    return check_guard<guard_policy::pedantic>(length, element_size);
  }

  // Whole elements in `length` bytes; what a view produced after a passing guard holds.
  RETYPE_FORCEINLINE constexpr std::size_t guarded_count(std::size_t length, std::size_t element_size) noexcept {
    return (element_size == 0u) ? 0u : (length / element_size);
  }


  // buffer<T>: owned, move-only, aligned heap storage

  //
  // Like a vector restricted to trivially copyable elements, with one extra piece of state:
  // the alignment the storage was allocated with. Storage is always released with that
  // alignment, whatever T currently is, so an allocation can be relabelled from one element
  // type to another (rebind_unchecked) and still be freed exactly as it was allocated.
  //
  template <class T>
  class buffer {
    static_assert(std::is_trivially_copyable_v<T>, "buffer<T> holds trivially copyable elements only");
    static_assert(!std::is_const_v<T> && !std::is_volatile_v<T>, "buffer<T> element type must be unqualified");
    static_assert(!std::is_array_v<T>, "buffer<T> of C arrays: use std::array");

    template <class U>
    friend class buffer;

    T* data_{};
    std::size_t size_{};
    std::size_t capacity_{};
    std::size_t alloc_align_{ alignof(T) };

    static T* allocate(std::size_t n) {
      if (n == 0u) return nullptr;
      if (n > std::numeric_limits<std::size_t>::max() / sizeof(T)) throw std::bad_array_new_length();
      return static_cast<T*>(::operator new(n * sizeof(T), std::align_val_t{ alignof(T) }));
    }

    static void deallocate(void* p, std::size_t align) noexcept {
      if (p != nullptr) ::operator delete(p, std::align_val_t{ align });
    }

    buffer(T* p, std::size_t n, std::size_t cap, std::size_t align) noexcept
      : data_(p), size_(n), capacity_(cap), alloc_align_(align) {}

  public:
    using value_type = T;
    using size_type = std::size_t;
    using iterator = T*;
    using const_iterator = T const*;

    buffer() noexcept = default;

    // n value-initialized (zeroed) elements
    explicit buffer(std::size_t n) : buffer(allocate(n), n, n, alignof(T)) {
      std::uninitialized_value_construct_n(data_, n);
    }

    buffer(std::initializer_list<T> values) : buffer(copy_of(std::span<T const>(values.begin(), values.size()))) {}

    buffer(buffer&& o) noexcept
      : data_(std::exchange(o.data_, nullptr)),
        size_(std::exchange(o.size_, 0u)),
        capacity_(std::exchange(o.capacity_, 0u)),
        alloc_align_(std::exchange(o.alloc_align_, alignof(T))) {}

    buffer& operator=(buffer&& o) noexcept {
      if (this != &o) {
        deallocate(data_, alloc_align_);
        data_ = std::exchange(o.data_, nullptr);
        size_ = std::exchange(o.size_, 0u);
        capacity_ = std::exchange(o.capacity_, 0u);
        alloc_align_ = std::exchange(o.alloc_align_, alignof(T));
      }
      return *this;
    }

    buffer(buffer const&) = delete;
    buffer& operator=(buffer const&) = delete;

    ~buffer() { deallocate(data_, alloc_align_); }

    static buffer with_capacity(std::size_t cap) { return buffer(allocate(cap), 0u, cap, alignof(T)); }

    static buffer copy_of(std::span<T const> src) {
      buffer out(allocate(src.size()), src.size(), src.size(), alignof(T));
      if (!src.empty()) std::memcpy(out.data_, src.data(), src.size_bytes());
      return out;
    }

    // floor(bytes.size() / sizeof(T)) elements copied byte-for-byte into fresh storage
    // aligned for T. Unchecked: the caller vouches that the bytes are valid T values.
    static buffer copy_bytes_unchecked(std::span<std::byte const> bytes) {
      const std::size_t n = guarded_count(bytes.size(), sizeof(T));
      buffer out(allocate(n), n, n, alignof(T));
      if (n != 0u) std::memcpy(out.data_, bytes.data(), n * sizeof(T));
      RETYPE_ASSERT(is_aligned_for<T>(out.data_));
      return out;
    }

    buffer clone() const { return copy_of(as_span()); }

    // Ownership transfer: the allocation moves to the returned buffer<U>, this buffer is
    // left empty. The caller guarantees that the first n elements are valid U values, that
    // the allocation is aligned for U, and that cap U elements fit in it.
    template <class U>
    buffer<U> rebind_unchecked(std::size_t n, std::size_t cap) && noexcept {
      U* p = detail::start_lifetime_as_array<U>(static_cast<void*>(data_), n);
      buffer<U> out(p, n, cap, alloc_align_);
      data_ = nullptr;
      size_ = 0u;
      capacity_ = 0u;
      alloc_align_ = alignof(T);
      return out;
    }

    T* data() noexcept { return data_; }
    T const* data() const noexcept { return data_; }

    std::size_t size() const noexcept { return size_; }
    std::size_t capacity() const noexcept { return capacity_; }
    std::size_t size_bytes() const noexcept { return size_ * sizeof(T); }
    std::size_t allocation_alignment() const noexcept { return alloc_align_; }
    bool empty() const noexcept { return size_ == 0u; }

    T& operator[](std::size_t i) noexcept {
      RETYPE_ASSERT(i < size_);
      return data_[i];
    }

    T const& operator[](std::size_t i) const noexcept {
      RETYPE_ASSERT(i < size_);
      return data_[i];
    }

    iterator begin() noexcept { return data_; }
    iterator end() noexcept { return data_ + size_; }
    const_iterator begin() const noexcept { return data_; }
    const_iterator end() const noexcept { return data_ + size_; }

    std::span<T> as_span() noexcept { return std::span<T>(data_, size_); }
    std::span<T const> as_span() const noexcept { return std::span<T const>(data_, size_); }

    void reserve(std::size_t cap) {
      if (cap <= capacity_) return;
      T* fresh = allocate(cap);
      if (size_ != 0u) std::memcpy(fresh, data_, size_bytes());
      deallocate(data_, alloc_align_);
      data_ = fresh;
      capacity_ = cap;
      alloc_align_ = alignof(T);
    }

    void push_back(T const& v) {
      const T copy = v; // v may live in the storage reserve() releases
      if (size_ == capacity_) reserve(capacity_ == 0u ? 4u : capacity_ * 2u);
      std::construct_at(data_ + size_, copy);
      ++size_;
    }

    void resize(std::size_t n) {
      if (n > size_) {
        reserve(n);
        std::uninitialized_value_construct_n(data_ + size_, n - size_);
      }
      size_ = n;
    }

    void clear() noexcept { size_ = 0u; }

    friend bool operator==(buffer const& a, buffer const& b) noexcept
      requires std::equality_comparable<T>
    {
      if (a.size_ != b.size_) return false;
      for (std::size_t i = 0; i < a.size_; ++i) {
        if (!(a.data_[i] == b.data_[i])) return false;
      }
      return true;
    }
  };


  // error model

  //
  // unaligned_error: the buffer start does not satisfy alignof(T). `offset` is how many
  // leading bytes to discard to reach an aligned address. `source` is the rejected data
  // when the check ran on a borrowed buffer (empty otherwise); copy() duplicates it into
  // fresh storage aligned for T, which always succeeds.
  //
  template <class S, class T>
  struct unaligned_error {
    std::size_t offset{};
    std::span<S const> source{};

    constexpr unaligned_error() noexcept = default;
    constexpr explicit unaligned_error(std::size_t off, std::span<S const> src = {}) noexcept
      : offset(off), source(src) {}

    buffer<T> copy() const requires trivially_transmutable<T> { return copy_unchecked(); }

    buffer<T> copy_unchecked() const { return buffer<T>::copy_bytes_unchecked(std::as_bytes(source)); }

    constexpr char const* description() const noexcept { return "data is unaligned"; }

    std::string to_string() const {
      return "data is unaligned (off by " + std::to_string(offset) + " bytes)";
    }
  };

  //
  // incompatible_vec_target_error: an owned buffer<S> cannot be relabelled as buffer<T>
  // because size or alignment differ. Owns the original buffer, which is the only way back
  // to the data; it is still freed as it was allocated. copy() yields
  // floor(len * sizeof(S) / sizeof(T)) elements; take() returns the original.
  //
  template <class S, class T>
  struct incompatible_vec_target_error {
    buffer<S> vec;

    explicit incompatible_vec_target_error(buffer<S>&& v) noexcept : vec(std::move(v)) {}

    buffer<T> copy() const requires trivially_transmutable<T> { return copy_unchecked(); }

    buffer<T> copy_unchecked() const { return buffer<T>::copy_bytes_unchecked(std::as_bytes(vec.as_span())); }

    buffer<S> take() && noexcept { return std::move(vec); }

    constexpr char const* description() const noexcept { return "incompatible target type"; }

    std::string to_string() const {
      return "incompatible target type (size: " + std::to_string(sizeof(T)) +
             ", align: " + std::to_string(alignof(T)) +
             ") for transmutation from source (size: " + std::to_string(sizeof(S)) +
             ", align: " + std::to_string(alignof(S)) + ")";
    }
  };

  // An owned buffer whose storage is not aligned for T. Same recovery as above.
  template <class S, class T>
  struct unaligned_vec_error {
    buffer<S> vec;
    std::size_t offset{};

    unaligned_vec_error(buffer<S>&& v, std::size_t off) noexcept : vec(std::move(v)), offset(off) {}

    buffer<T> copy() const requires trivially_transmutable<T> { return copy_unchecked(); }

    buffer<T> copy_unchecked() const { return buffer<T>::copy_bytes_unchecked(std::as_bytes(vec.as_span())); }

    buffer<S> take() && noexcept { return std::move(vec); }

    constexpr char const* description() const noexcept { return "data is unaligned"; }

    std::string to_string() const {
      return "owned data is unaligned (off by " + std::to_string(offset) + " bytes)";
    }
  };

  // A byte pattern that is not a valid value of the target (e.g. 0x02 as bool).
  struct invalid_value_error {
    friend constexpr bool operator==(invalid_value_error, invalid_value_error) noexcept = default;

    constexpr char const* description() const noexcept { return "invalid target value"; }

    std::string to_string() const { return description(); }
  };

  enum class error_kind : std::uint8_t {
    guard                   = 0,
    unaligned               = 1,
    incompatible_vec_target = 2,
    unaligned_vec           = 3,
    invalid_value           = 4
  };

  //
  // error<S, T>: every way a transmutation from S-typed data to T can fail. The
  // alternative order matches error_kind.
  //
  template <class S, class T>
  class error {
  public:
    using source_type = S;
    using target_type = T;
    using variant_type = std::variant<guard_error,
                                      unaligned_error<S, T>,
                                      incompatible_vec_target_error<S, T>,
                                      unaligned_vec_error<S, T>,
                                      invalid_value_error>;

  private:
    variant_type v_;

  public:
    error(guard_error e) noexcept : v_(std::in_place_type<guard_error>, e) {}
    error(unaligned_error<S, T> e) noexcept : v_(std::in_place_type<unaligned_error<S, T>>, e) {}
    error(incompatible_vec_target_error<S, T>&& e) noexcept
      : v_(std::in_place_type<incompatible_vec_target_error<S, T>>, std::move(e)) {}
    error(unaligned_vec_error<S, T>&& e) noexcept
      : v_(std::in_place_type<unaligned_vec_error<S, T>>, std::move(e)) {}
    error(invalid_value_error e) noexcept : v_(std::in_place_type<invalid_value_error>, e) {}

    error_kind kind() const noexcept { return static_cast<error_kind>(v_.index()); }

    template <class E>
    bool holds() const noexcept { return std::holds_alternative<E>(v_); }

    template <class E>
    E& get() & noexcept {
      RETYPE_ASSERT(holds<E>());
      return *std::get_if<E>(&v_);
    }

    template <class E>
    E const& get() const& noexcept {
      RETYPE_ASSERT(holds<E>());
      return *std::get_if<E>(&v_);
    }

    template <class E>
    E&& get() && noexcept {
      RETYPE_ASSERT(holds<E>());
      return std::move(*std::get_if<E>(&v_));
    }

    variant_type const& as_variant() const noexcept { return v_; }

    char const* description() const noexcept {
      return std::visit([](auto const& e) noexcept { return e.description(); }, v_);
    }

    std::string to_string() const {
      return std::visit([](auto const& e) { return e.to_string(); }, v_);
    }

    // Recovery: unaligned and vector errors turn into a fresh copy; guard and
    // invalid-value errors come back unchanged.
    result<buffer<T>, error> copy() && requires trivially_transmutable<T> {
      return std::move(*this).copy_unchecked();
    }

    result<buffer<T>, error> copy_unchecked() && {
      switch (kind()) {
        case error_kind::unaligned:
          return get<unaligned_error<S, T>>().copy_unchecked();
        case error_kind::incompatible_vec_target:
          return get<incompatible_vec_target_error<S, T>>().copy_unchecked();
        case error_kind::unaligned_vec:
          return get<unaligned_vec_error<S, T>>().copy_unchecked();
        case error_kind::guard:
        case error_kind::invalid_value:
          break;
      }
      return fail(std::move(*this));
    }
  };


  // alignment check on borrowed data

  template <class T, class S, std::size_t Extent>
  inline result<void, unaligned_error<std::remove_const_t<S>, T>> check_alignment(std::span<S, Extent> data) noexcept {
    using source = std::remove_const_t<S>;
    const std::size_t off = alignment_offset(static_cast<void const*>(data.data()), alignof(T));
    if (off != 0u) return fail(unaligned_error<source, T>(off, std::span<source const>(data.data(), data.size())));
    return {};
  }

  namespace detail {
    // guard, then alignment; the shared prefix of every checked borrowed operation
    template <class T, guard_policy P, class S, std::size_t Extent>
    inline result<void, error<std::remove_const_t<S>, T>> guard_and_align(std::span<S, Extent> data) noexcept {
      if (auto g = check_guard<P>(data.size_bytes(), sizeof(T)); g.is_error()) return fail(g.error());
      if (auto a = check_alignment<T>(data); a.is_error()) return fail(std::move(a).error());
      return {};
    }

    template <class T>
    RETYPE_FORCEINLINE std::span<T const> view_as(std::byte const* p, std::size_t length) noexcept {
      const std::size_t n = guarded_count(length, sizeof(T));
      return std::span<T const>(start_lifetime_as_array<T>(static_cast<void const*>(p), n), n);
    }

    template <class T>
    RETYPE_FORCEINLINE std::span<T> view_as_mut(std::byte* p, std::size_t length) noexcept {
      const std::size_t n = guarded_count(length, sizeof(T));
      return std::span<T>(start_lifetime_as_array<T>(static_cast<void*>(p), n), n);
    }
  } // namespace detail


  // unchecked layer (escape hatches)

  //
  // These still run the length guard, but the caller vouches for everything else:
  // the values (no capability required) and, for views, the alignment. Single-value reads
  // copy bytes out and are fine at any address.
  //
  template <trivially_copyable T>
  inline result<T, error<std::byte, T>> from_bytes_unchecked(std::span<std::byte const> bytes) noexcept {
    if (auto g = check_guard<guard_policy::at_least_one>(bytes.size(), sizeof(T)); g.is_error()) return fail(g.error());
    return detail::load_unchecked<T>(bytes.data());
  }

  template <trivially_copyable T>
  inline result<T, error<std::byte, T>> from_bytes_pedantic_unchecked(std::span<std::byte const> bytes) noexcept {
    if (auto g = check_guard<guard_policy::exact>(bytes.size(), sizeof(T)); g.is_error()) return fail(g.error());
    return detail::load_unchecked<T>(bytes.data());
  }

  template <trivially_copyable T, guard_policy P = guard_policy::at_least_one>
  inline result<std::span<T const>, error<std::byte, T>> transmute_many_unchecked(std::span<std::byte const> bytes) noexcept {
    if (auto g = check_guard<P>(bytes.size(), sizeof(T)); g.is_error()) return fail(g.error());
    return detail::view_as<T>(bytes.data(), bytes.size());
  }

  // Relabels the allocation; length and capacity (in elements) are preserved.
  template <trivially_copyable S, trivially_copyable T>
  inline buffer<T> transmute_vec_unchecked(buffer<S> vec) noexcept {
    static_assert(same_layout<S, T>, "transmute_vec_unchecked: source and target size/alignment must match");
    const std::size_t n = vec.size();
    const std::size_t cap = vec.capacity();
    return std::move(vec).template rebind_unchecked<T>(n, cap);
  }


  // checked borrowed reads

  // One T from the first sizeof(T) bytes; trailing bytes are ignored.
  template <trivially_transmutable T>
  inline result<T, error<std::byte, T>> transmute_one(std::span<std::byte const> bytes) noexcept {
    if (auto c = detail::guard_and_align<T, guard_policy::at_least_one>(bytes); c.is_error()) return fail(std::move(c).error());
    return detail::load_unchecked<T>(bytes.data());
  }

  // One T from exactly sizeof(T) bytes.
  template <trivially_transmutable T>
  inline result<T, error<std::byte, T>> transmute_one_pedantic(std::span<std::byte const> bytes) noexcept {
    if (auto c = detail::guard_and_align<T, guard_policy::exact>(bytes); c.is_error()) return fail(std::move(c).error());
    return detail::load_unchecked<T>(bytes.data());
  }

  //
  // A view of floor(bytes.size() / sizeof(T)) elements over the same memory. The view
  // borrows `bytes` and must not outlive it.
  //
  template <trivially_transmutable T, guard_policy P = guard_policy::at_least_one>
  inline result<std::span<T const>, error<std::byte, T>> transmute_many(std::span<std::byte const> bytes) noexcept {
    if (auto c = detail::guard_and_align<T, P>(bytes); c.is_error()) return fail(std::move(c).error());
    return detail::view_as<T>(bytes.data(), bytes.size());
  }

  template <trivially_transmutable T, guard_policy P = guard_policy::at_least_one>
  inline result<std::span<T>, error<std::byte, T>> transmute_many_mut(std::span<std::byte> bytes) noexcept {
    if (auto c = detail::guard_and_align<T, P>(bytes); c.is_error()) return fail(std::move(c).error());
    return detail::view_as_mut<T>(bytes.data(), bytes.size());
  }

  // Never fails on length: trailing bytes past the last whole element are dropped silently,
  // and an empty or short buffer gives an empty view.
  template <trivially_transmutable T>
  inline result<std::span<T const>, error<std::byte, T>> transmute_many_permissive(std::span<std::byte const> bytes) noexcept {
    return transmute_many<T, guard_policy::permissive>(bytes);
  }

  template <trivially_transmutable T>
  inline result<std::span<T const>, error<std::byte, T>> transmute_many_pedantic(std::span<std::byte const> bytes) noexcept {
    return transmute_many<T, guard_policy::pedantic>(bytes);
  }


  // checked owned reinterpretation

  //
  // Reuses the allocation iff sizeof and alignof of S and T agree: length, capacity and
  // bytes are unchanged and `vec` is left empty. Otherwise the buffer comes back inside
  // incompatible_vec_target_error, from which copy() builds a buffer<T>.
  //
  template <trivially_transmutable S, trivially_transmutable T>
  inline result<buffer<T>, error<S, T>> transmute_vec(buffer<S> vec) noexcept {
    if constexpr (same_layout<S, T>) {
      return transmute_vec_unchecked<S, T>(std::move(vec));
    } else {
      return fail(incompatible_vec_target_error<S, T>(std::move(vec)));
    }
  }

  //
  // Owned bytes to owned T, reusing the allocation: floor(size / sizeof(T)) elements,
  // floor(capacity / sizeof(T)) capacity. A guard failure drops the buffer; a misaligned
  // allocation comes back inside unaligned_vec_error.
  //
  template <trivially_transmutable T, guard_policy P = guard_policy::at_least_one>
  inline result<buffer<T>, error<std::byte, T>> transmute_byte_vec(buffer<std::byte> bytes) noexcept {
    if (auto g = check_guard<P>(bytes.size(), sizeof(T)); g.is_error()) return fail(g.error());
    if (const std::size_t off = alignment_offset(static_cast<void const*>(bytes.data()), alignof(T)); off != 0u) {
      return fail(unaligned_vec_error<std::byte, T>(std::move(bytes), off));
    }
    const std::size_t n = guarded_count(bytes.size(), sizeof(T));
    const std::size_t cap = guarded_count(bytes.capacity(), sizeof(T));
    return std::move(bytes).template rebind_unchecked<T>(n, cap);
  }


  // to bytes

  //
  // Always legal: byte alignment (1) divides every alignment and every size is a whole
  // number of bytes. No guard, no alignment check, no failure. The checked forms require
  // the capability so that no padding is exposed as data.
  //
  template <trivially_copyable T>
  inline std::span<std::byte const, sizeof(T)> transmute_one_to_bytes_unchecked(T const& value) noexcept {
    return std::span<std::byte const, sizeof(T)>(reinterpret_cast<std::byte const*>(std::addressof(value)), sizeof(T));
  }

  template <trivially_transmutable T>
  inline std::span<std::byte const, sizeof(T)> transmute_one_to_bytes(T const& value) noexcept {
    return transmute_one_to_bytes_unchecked(value);
  }

  // A byte view of a temporary would dangle at the end of the full-expression.
  template <class T>
  void transmute_one_to_bytes_unchecked(T const&&) = delete;

  template <class T>
  void transmute_one_to_bytes(T const&&) = delete;

  template <class T, std::size_t Extent>
    requires trivially_copyable<std::remove_const_t<T>>
  inline std::span<std::byte const> transmute_to_bytes_unchecked(std::span<T, Extent> values) noexcept {
    return std::span<std::byte const>(std::as_bytes(values));
  }

  template <class T, std::size_t Extent>
    requires trivially_transmutable<std::remove_const_t<T>>
  inline std::span<std::byte const> transmute_to_bytes(std::span<T, Extent> values) noexcept {
    return transmute_to_bytes_unchecked(values);
  }

  // Writable bytes over capable values: any bytes written back are valid values.
  template <class T, std::size_t Extent>
    requires (!std::is_const_v<T>) && trivially_transmutable<T>
  inline std::span<std::byte> transmute_to_bytes_mut(std::span<T, Extent> values) noexcept {
    return std::span<std::byte>(std::as_writable_bytes(values));
  }

  template <trivially_copyable T>
  inline buffer<std::byte> transmute_to_bytes_vec_unchecked(buffer<T> vec) noexcept {
    const std::size_t n = vec.size() * sizeof(T);
    const std::size_t cap = vec.capacity() * sizeof(T);
    return std::move(vec).template rebind_unchecked<std::byte>(n, cap);
  }

  template <trivially_transmutable T>
  inline buffer<std::byte> transmute_to_bytes_vec(buffer<T> vec) noexcept {
    return transmute_to_bytes_vec_unchecked(std::move(vec));
  }


  // bool

  //
  // bool is not trivially transmutable: only 0x00 and 0x01 are values. These layer the
  // per-byte predicate on top of the guard + alignment checks.
  //
  static_assert(sizeof(bool) == 1 && alignof(bool) == 1, "retype bool support requires a one-byte bool");

  namespace detail {
    inline constexpr unsigned char false_byte = std::bit_cast<unsigned char>(false);
    inline constexpr unsigned char true_byte  = std::bit_cast<unsigned char>(true);
  } // namespace detail

  constexpr bool byte_is_bool(std::byte b) noexcept {
    const unsigned char v = std::to_integer<unsigned char>(b);
    return v == detail::false_byte || v == detail::true_byte;
  }

  constexpr bool bytes_are_bool(std::span<std::byte const> bytes) noexcept {
    for (std::byte b : bytes) {
      if (!byte_is_bool(b)) return false;
    }
    return true;
  }

  namespace detail {
    template <guard_policy P>
    inline result<std::span<bool const>, error<std::byte, bool>> transmute_bool(std::span<std::byte const> bytes) noexcept {
      if (auto c = guard_and_align<bool, P>(bytes); c.is_error()) return fail(std::move(c).error());
      if (!bytes_are_bool(bytes)) return fail(invalid_value_error{});
      return view_as<bool>(bytes.data(), bytes.size());
    }

    template <guard_policy P>
    inline result<buffer<bool>, error<std::byte, bool>> transmute_bool_vec(buffer<std::byte> bytes) noexcept {
      if (auto g = check_guard<P>(bytes.size(), sizeof(bool)); g.is_error()) return fail(g.error());
      if (!bytes_are_bool(bytes.as_span())) return fail(invalid_value_error{});
      return transmute_vec_unchecked<std::byte, bool>(std::move(bytes));
    }
  } // namespace detail

  inline result<std::span<bool const>, error<std::byte, bool>> transmute_bool_permissive(std::span<std::byte const> bytes) noexcept {
    return detail::transmute_bool<guard_policy::permissive>(bytes);
  }

  inline result<std::span<bool const>, error<std::byte, bool>> transmute_bool_pedantic(std::span<std::byte const> bytes) noexcept {
    return detail::transmute_bool<guard_policy::pedantic>(bytes);
  }

  inline result<buffer<bool>, error<std::byte, bool>> transmute_bool_vec_permissive(buffer<std::byte> bytes) noexcept {
    return detail::transmute_bool_vec<guard_policy::permissive>(std::move(bytes));
  }

  inline result<buffer<bool>, error<std::byte, bool>> transmute_bool_vec_pedantic(buffer<std::byte> bytes) noexcept {
    return detail::transmute_bool_vec<guard_policy::pedantic>(std::move(bytes));
  }


  // recovery: try_copy

  // Either a view borrowed from the caller's buffer or a buffer owned after a recovery copy.
  template <class T>
  class maybe_owned {
    std::variant<std::span<T const>, buffer<T>> v_;

  public:
    explicit maybe_owned(std::span<T const> borrowed) noexcept : v_(std::in_place_index<0>, borrowed) {}
    explicit maybe_owned(buffer<T>&& owned) noexcept : v_(std::in_place_index<1>, std::move(owned)) {}

    bool is_owned() const noexcept { return v_.index() == 1u; }
    bool is_borrowed() const noexcept { return v_.index() == 0u; }

    std::span<T const> get() const noexcept {
      if (auto const* owned = std::get_if<1>(&v_)) return owned->as_span();
      return *std::get_if<0>(&v_);
    }

    T const* data() const noexcept { return get().data(); }
    std::size_t size() const noexcept { return get().size(); }
    T const& operator[](std::size_t i) const noexcept { return get()[i]; }
    T const* begin() const noexcept { return data(); }
    T const* end() const noexcept { return data() + size(); }

    buffer<T> into_owned() && {
      if (auto* owned = std::get_if<1>(&v_)) return std::move(*owned);
      return buffer<T>::copy_of(*std::get_if<0>(&v_));
    }
  };

  //
  // Attempt, then recover. On success the borrowed view is passed through; on an unaligned
  // or vector error the data is copied into fresh aligned storage; guard and invalid-value
  // errors propagate.
  //
  template <class S, trivially_transmutable T>
  inline result<maybe_owned<T>, error<S, T>> try_copy(result<std::span<T const>, error<S, T>>&& attempt) {
    if (attempt.is_ok()) return maybe_owned<T>(attempt.value());
    auto copied = std::move(attempt).error().copy();
    if (copied.is_error()) return fail(std::move(copied).error());
    return maybe_owned<T>(std::move(copied).value());
  }

  template <class S, trivially_transmutable T>
  inline result<buffer<T>, error<S, T>> try_copy(result<buffer<T>, error<S, T>>&& attempt) {
    if (attempt.is_ok()) return std::move(attempt).value();
    return std::move(attempt).error().copy();
  }

  template <class S, trivially_copyable T>
  inline result<maybe_owned<T>, error<S, T>> try_copy_unchecked(result<std::span<T const>, error<S, T>>&& attempt) {
    if (attempt.is_ok()) return maybe_owned<T>(attempt.value());
    auto copied = std::move(attempt).error().copy_unchecked();
    if (copied.is_error()) return fail(std::move(copied).error());
    return maybe_owned<T>(std::move(copied).value());
  }

  template <class S, trivially_copyable T>
  inline result<buffer<T>, error<S, T>> try_copy_unchecked(result<buffer<T>, error<S, T>>&& attempt) {
    if (attempt.is_ok()) return std::move(attempt).value();
    return std::move(attempt).error().copy_unchecked();
  }


  // float designalisation

  //
  // Reinterpreting bytes as float/double can produce a signaling NaN, which some
  // platforms trap on when the value is used. These set the quiet bit (the most
  // significant fraction bit) on any NaN pattern and leave every other value untouched.
  //
  static_assert(std::numeric_limits<float>::is_iec559 && sizeof(float) == 4, "designalise expects IEEE-754 binary32 float");
  static_assert(std::numeric_limits<double>::is_iec559 && sizeof(double) == 8, "designalise expects IEEE-754 binary64 double");

  constexpr float from_bits_f32_designalised(std::uint32_t bits) noexcept {
    constexpr std::uint32_t exp_mask   = 0x7F80'0000u;
    constexpr std::uint32_t qnan_mask  = 0x0040'0000u;
    constexpr std::uint32_t fract_mask = 0x007F'FFFFu;
    if ((bits & exp_mask) == exp_mask && (bits & fract_mask) != 0u) bits |= qnan_mask;
    return std::bit_cast<float>(bits);
  }

  constexpr double from_bits_f64_designalised(std::uint64_t bits) noexcept {
    constexpr std::uint64_t exp_mask   = 0x7FF0'0000'0000'0000ull;
    constexpr std::uint64_t qnan_mask  = 0x0008'0000'0000'0000ull;
    constexpr std::uint64_t fract_mask = 0x000F'FFFF'FFFF'FFFFull;
    if ((bits & exp_mask) == exp_mask && (bits & fract_mask) != 0u) bits |= qnan_mask;
    return std::bit_cast<double>(bits);
  }

  constexpr float designalise_f32(float f) noexcept {
    return from_bits_f32_designalised(std::bit_cast<std::uint32_t>(f));
  }

  constexpr double designalise_f64(double f) noexcept {
    return from_bits_f64_designalised(std::bit_cast<std::uint64_t>(f));
  }

} // namespace retype

#endif // RETYPE_HPP_INCLUDED
