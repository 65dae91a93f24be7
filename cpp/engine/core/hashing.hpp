#pragma once
/*
================================================================================
Fragment 1.8 — Core: Deterministic Hashing Utilities
FILE: cpp/engine/core/hashing.hpp

Purpose:
  - Stable 64-bit hashing for plan fingerprints (memoization / debounce keys
    owned by the caller).

Design constraints:
  - No dependence on std::hash (not stable across processes/platforms).
  - Use std::bit_cast for doubles after canonicalization.

Hardening:
  - Canonicalize -0.0 -> +0.0 and every NaN -> one quiet-NaN payload.
  - Integers encoded little-endian explicitly.
  - Strings length-delimited.

Notes:
  - NOT cryptographic.
================================================================================
*/

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

namespace fuel {

struct Hash64 {
  uint64_t value = 0;

  constexpr bool operator==(const Hash64& o) const noexcept { return value == o.value; }
  constexpr bool operator!=(const Hash64& o) const noexcept { return value != o.value; }
};

// ----------------------------- FNV-1a 64 -------------------------------------
class Fnv1a64 {
 public:
  static constexpr uint64_t kOffsetBasis = 14695981039346656037ull;
  static constexpr uint64_t kPrime       = 1099511628211ull;

  Fnv1a64() : h_(kOffsetBasis) {}

  uint64_t value() const { return h_; }

  void update_bytes(const void* data, size_t n);

  void update_u8(uint8_t v) { update_bytes(&v, 1); }
  void update_u32(uint32_t v) { update_le(v); }
  void update_u64(uint64_t v) { update_le(v); }
  void update_i32(int32_t v)  { update_le(static_cast<uint32_t>(v)); }

  void update_bool(bool b) { update_u8(static_cast<uint8_t>(b ? 1 : 0)); }

  void update_string(std::string_view s);

  template <class E, std::enable_if_t<std::is_enum_v<E>, int> = 0>
  void update_enum(E e) {
    using U = std::underlying_type_t<E>;
    update_u32(static_cast<uint32_t>(static_cast<U>(e)));
  }

  void update_f64(double x);

  // Presence byte, then the value when present.
  void update_opt_f64(const double* x) {
    update_bool(x != nullptr);
    if (x) update_f64(*x);
  }

 private:
  template <class T>
  void update_le(T v) {
    static_assert(std::is_integral_v<T> && (sizeof(T) == 4 || sizeof(T) == 8),
                  "update_le supports 32/64-bit integral types only");
    std::array<uint8_t, sizeof(T)> b{};
    for (size_t i = 0; i < sizeof(T); ++i) {
      b[i] = static_cast<uint8_t>((static_cast<uint64_t>(v) >> (8 * i)) & 0xFFu);
    }
    update_bytes(b.data(), b.size());
  }

  uint64_t h_;
};

Hash64 hash_combine(Hash64 a, Hash64 b);

// 16 lowercase hex chars, most significant nibble first.
std::string hash_to_hex(Hash64 h);

}  // namespace fuel
