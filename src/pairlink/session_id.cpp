#include "src/pairlink/session_id.h"

#include <cctype>

namespace pairlink {

namespace {
inline void write_u64be(uint8_t* p, uint64_t v) {
  for (int i = 7; i >= 0; --i) {
    p[i] = static_cast<uint8_t>(v & 0xFF);
    v >>= 8;
  }
}
inline uint64_t read_u64be(const uint8_t* p) {
  uint64_t v = 0;
  for (int i = 0; i < 8; ++i) v = (v << 8) | p[i];
  return v;
}
inline int hex_value(unsigned char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}
} // namespace

void SessionId::write(uint8_t* out) const {
  write_u64be(out, hi);
  write_u64be(out + 8, lo);
}

SessionId SessionId::read(const uint8_t* in) {
  SessionId id;
  id.hi = read_u64be(in);
  id.lo = read_u64be(in + 8);
  return id;
}

std::string SessionId::to_string() const {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string digits;
  digits.reserve(32);
  for (int i = 60; i >= 0; i -= 4) digits.push_back(kHex[(hi >> i) & 0xF]);
  for (int i = 60; i >= 0; i -= 4) digits.push_back(kHex[(lo >> i) & 0xF]);
  const auto first = digits.find_first_not_of('0');
  if (first == std::string::npos) return "0x0";
  return "0x" + digits.substr(first);
}

std::optional<SessionId> SessionId::parse(std::string_view text) {
  if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) text.remove_prefix(2);
  if (text.empty() || text.size() > 32) return std::nullopt;

  SessionId id;
  for (unsigned char c : text) {
    const int v = hex_value(c);
    if (v < 0) return std::nullopt;
    id.hi = (id.hi << 4) | (id.lo >> 60);
    id.lo = (id.lo << 4) | static_cast<uint64_t>(v);
  }
  return id;
}

} // namespace pairlink
