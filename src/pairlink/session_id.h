#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace pairlink {

// 128-bit pairing key chosen by the clients out of band.
struct SessionId {
  uint64_t hi = 0;
  uint64_t lo = 0;

  static constexpr std::size_t kWireSize = 16;

  // Big-endian, kWireSize bytes.
  void write(uint8_t* out) const;
  static SessionId read(const uint8_t* in);

  // "0x" followed by lowercase hex without leading zeros ("0x0" for zero).
  std::string to_string() const;
  // Accepts up to 32 hex digits with an optional 0x/0X prefix.
  static std::optional<SessionId> parse(std::string_view text);

  friend bool operator==(const SessionId& a, const SessionId& b) { return a.hi == b.hi && a.lo == b.lo; }
  friend bool operator!=(const SessionId& a, const SessionId& b) { return !(a == b); }
};

struct SessionIdHash {
  std::size_t operator()(const SessionId& id) const {
    // splitmix64 finalizer over both halves.
    uint64_t x = id.hi ^ (id.lo + 0x9E3779B97F4A7C15ull + (id.hi << 6) + (id.hi >> 2));
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    x = x ^ (x >> 31);
    return static_cast<std::size_t>(x);
  }
};

} // namespace pairlink
