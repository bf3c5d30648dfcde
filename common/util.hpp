#pragma once

#include <utility>
#include <boost/asio.hpp>

#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace common {

inline std::string iso_timestamp_utc() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const std::time_t t = system_clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif

  char buf[32];
  std::snprintf(buf,
                sizeof(buf),
                "%04d-%02d-%02dT%02d:%02d:%02dZ",
                tm.tm_year + 1900,
                tm.tm_mon + 1,
                tm.tm_mday,
                tm.tm_hour,
                tm.tm_min,
                tm.tm_sec);
  return buf;
}

inline std::mutex& log_mutex() {
  static std::mutex m;
  return m;
}

// Worker threads share stderr; one line per call.
inline void log(std::string_view msg) {
  const std::string ts = iso_timestamp_utc();
  std::lock_guard<std::mutex> lock(log_mutex());
  std::cerr << "[" << ts << "] " << msg << "\n";
}

template <class Endpoint>
inline std::string endpoint_to_string(const Endpoint& ep) {
  std::ostringstream oss;
  if (ep.address().is_v6()) {
    oss << "[" << ep.address().to_string() << "]:" << ep.port();
  } else {
    oss << ep.address().to_string() << ":" << ep.port();
  }
  return oss.str();
}

struct HostPort {
  std::string host;
  uint16_t port = 0;
};

inline std::optional<HostPort> parse_host_port(std::string_view s) {
  // Supports "host:port" and "[ipv6]:port".
  auto trim = [](std::string_view v) {
    while (!v.empty() && std::isspace(static_cast<unsigned char>(v.front()))) v.remove_prefix(1);
    while (!v.empty() && std::isspace(static_cast<unsigned char>(v.back()))) v.remove_suffix(1);
    return v;
  };
  s = trim(s);
  if (s.empty()) return std::nullopt;

  std::string_view host;
  std::string_view port_str;

  if (s.front() == '[') {
    const auto rb = s.find(']');
    if (rb == std::string_view::npos) return std::nullopt;
    host = s.substr(1, rb - 1);
    if (rb + 1 >= s.size() || s[rb + 1] != ':') return std::nullopt;
    port_str = s.substr(rb + 2);
  } else {
    const auto colon = s.rfind(':');
    if (colon == std::string_view::npos) return std::nullopt;
    host = s.substr(0, colon);
    port_str = s.substr(colon + 1);
  }

  host = trim(host);
  port_str = trim(port_str);
  if (host.empty() || port_str.empty()) return std::nullopt;

  unsigned long port_ul = 0;
  try {
    port_ul = std::stoul(std::string(port_str));
  } catch (const std::exception&) {
    return std::nullopt;
  }
  if (port_ul == 0 || port_ul > 65535) return std::nullopt;

  return HostPort{std::string(host), static_cast<uint16_t>(port_ul)};
}

inline std::optional<uint16_t> parse_port(std::string_view s) {
  if (s.empty() || s.size() > 5) return std::nullopt;
  unsigned long v = 0;
  for (unsigned char ch : s) {
    if (!std::isdigit(ch)) return std::nullopt;
    v = v * 10 + (ch - '0');
  }
  if (v > 65535) return std::nullopt;
  return static_cast<uint16_t>(v);
}

} // namespace common
