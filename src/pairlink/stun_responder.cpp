#include "src/pairlink/stun_responder.h"

#include "common/framing.hpp"
#include "common/util.hpp"

#include <boost/crc.hpp>

#include <cstring>
#include <memory>
#include <string>

using boost::asio::ip::udp;

namespace pairlink {

namespace stun {

namespace {

void put_u16(std::vector<uint8_t>& out, uint16_t v) {
  const std::size_t at = out.size();
  out.resize(at + 2);
  common::write_u16_be(v, out.data() + at);
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
  const std::size_t at = out.size();
  out.resize(at + 4);
  common::write_u32_be(v, out.data() + at);
}

void put_attr_header(std::vector<uint8_t>& out, uint16_t type, uint16_t len) {
  put_u16(out, type);
  put_u16(out, len);
}

// MAPPED-ADDRESS when `xor_key` is null, XOR-MAPPED-ADDRESS otherwise.
// xor_key is the 16 bytes magic cookie || transaction id.
void put_address(std::vector<uint8_t>& out, uint16_t type, const udp::endpoint& ep, const uint8_t* xor_key) {
  const bool v6 = ep.address().is_v6() && !ep.address().to_v6().is_v4_mapped();
  const uint16_t len = v6 ? 20 : 8;
  put_attr_header(out, type, len);
  out.push_back(0);
  out.push_back(v6 ? kFamilyIpv6 : kFamilyIpv4);

  uint16_t port = ep.port();
  if (xor_key) port ^= static_cast<uint16_t>(kMagicCookie >> 16);
  put_u16(out, port);

  if (v6) {
    auto bytes = ep.address().to_v6().to_bytes();
    for (std::size_t i = 0; i < bytes.size(); ++i) {
      out.push_back(xor_key ? static_cast<uint8_t>(bytes[i] ^ xor_key[i]) : bytes[i]);
    }
  } else {
    const auto v4 = ep.address().is_v4()
                        ? ep.address().to_v4()
                        : boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, ep.address().to_v6());
    auto bytes = v4.to_bytes();
    for (std::size_t i = 0; i < bytes.size(); ++i) {
      out.push_back(xor_key ? static_cast<uint8_t>(bytes[i] ^ xor_key[i]) : bytes[i]);
    }
  }
}

void put_software(std::vector<uint8_t>& out) {
  const std::size_t len = std::strlen(kSoftwareName);
  put_attr_header(out, kAttrSoftware, static_cast<uint16_t>(len));
  out.insert(out.end(), kSoftwareName, kSoftwareName + len);
  while (out.size() % 4 != 0) out.push_back(0);
}

void set_length(std::vector<uint8_t>& msg) {
  common::write_u16_be(static_cast<uint16_t>(msg.size() - kHeaderSize), msg.data() + 2);
}

std::optional<udp::endpoint> read_address(const uint8_t* value, uint16_t len, const uint8_t* xor_key) {
  if (len < 4) return std::nullopt;
  const uint8_t family = value[1];
  uint16_t port = common::read_u16_be(value + 2);
  if (xor_key) port ^= static_cast<uint16_t>(kMagicCookie >> 16);

  if (family == kFamilyIpv4) {
    if (len != 8) return std::nullopt;
    boost::asio::ip::address_v4::bytes_type bytes{};
    for (std::size_t i = 0; i < bytes.size(); ++i) {
      bytes[i] = xor_key ? static_cast<uint8_t>(value[4 + i] ^ xor_key[i]) : value[4 + i];
    }
    return udp::endpoint(boost::asio::ip::address_v4(bytes), port);
  }
  if (family == kFamilyIpv6) {
    if (len != 20) return std::nullopt;
    boost::asio::ip::address_v6::bytes_type bytes{};
    for (std::size_t i = 0; i < bytes.size(); ++i) {
      bytes[i] = xor_key ? static_cast<uint8_t>(value[4 + i] ^ xor_key[i]) : value[4 + i];
    }
    return udp::endpoint(boost::asio::ip::address_v6(bytes), port);
  }
  return std::nullopt;
}

} // namespace

uint32_t fingerprint(std::span<const uint8_t> message_prefix) {
  boost::crc_32_type crc;
  crc.process_bytes(message_prefix.data(), message_prefix.size());
  return crc.checksum() ^ kFingerprintXor;
}

std::optional<std::vector<uint8_t>> build_binding_response(std::span<const uint8_t> request,
                                                           const udp::endpoint& source) {
  if (request.size() < kHeaderSize || request.size() > kMaxDatagram) return std::nullopt;
  // Top two bits of every STUN message are zero.
  if ((request[0] & 0xC0) != 0) return std::nullopt;
  if (common::read_u16_be(request.data()) != kBindingRequest) return std::nullopt;
  const uint16_t body_len = common::read_u16_be(request.data() + 2);
  if (body_len % 4 != 0 || kHeaderSize + body_len != request.size()) return std::nullopt;

  const bool rfc5389 = common::read_u32_be(request.data() + 4) == kMagicCookie;

  std::vector<uint8_t> out;
  out.reserve(96);
  put_u16(out, kBindingResponse);
  put_u16(out, 0);
  // Cookie and transaction id echo the request verbatim.
  out.insert(out.end(), request.begin() + 4, request.begin() + kHeaderSize);

  put_address(out, kAttrMappedAddress, source, nullptr);
  if (rfc5389) {
    uint8_t xor_key[16];
    std::memcpy(xor_key, request.data() + 4, 16);
    put_address(out, kAttrXorMappedAddress, source, xor_key);
    put_software(out);

    // FINGERPRINT covers everything before it, with the length already counting it.
    const std::size_t fp_at = out.size();
    out.resize(fp_at + 8);
    common::write_u16_be(static_cast<uint16_t>(out.size() - kHeaderSize), out.data() + 2);
    out.resize(fp_at);
    const uint32_t fp = fingerprint(std::span<const uint8_t>(out.data(), out.size()));
    put_attr_header(out, kAttrFingerprint, 4);
    put_u32(out, fp);
  }
  set_length(out);
  return out;
}

std::vector<uint8_t> build_binding_request(const std::array<uint8_t, kTransactionIdSize>& transaction_id,
                                           bool rfc5389) {
  std::vector<uint8_t> out;
  put_u16(out, kBindingRequest);
  put_u16(out, 0);
  put_u32(out, rfc5389 ? kMagicCookie : 0);
  out.insert(out.end(), transaction_id.begin(), transaction_id.end());
  return out;
}

std::optional<udp::endpoint> parse_binding_response(std::span<const uint8_t> response,
                                                    const std::array<uint8_t, kTransactionIdSize>* expected) {
  if (response.size() < kHeaderSize) return std::nullopt;
  if (common::read_u16_be(response.data()) != kBindingResponse) return std::nullopt;
  const uint16_t body_len = common::read_u16_be(response.data() + 2);
  if (kHeaderSize + body_len != response.size()) return std::nullopt;
  if (expected && std::memcmp(response.data() + 8, expected->data(), kTransactionIdSize) != 0) {
    return std::nullopt;
  }

  const uint8_t* xor_key = response.data() + 4;
  std::optional<udp::endpoint> mapped;
  std::optional<udp::endpoint> xor_mapped;

  std::size_t pos = kHeaderSize;
  while (pos + 4 <= response.size()) {
    const uint16_t type = common::read_u16_be(response.data() + pos);
    const uint16_t len = common::read_u16_be(response.data() + pos + 2);
    const std::size_t value_at = pos + 4;
    if (value_at + len > response.size()) return std::nullopt;
    if (type == kAttrMappedAddress) {
      mapped = read_address(response.data() + value_at, len, nullptr);
    } else if (type == kAttrXorMappedAddress) {
      xor_mapped = read_address(response.data() + value_at, len, xor_key);
    }
    pos = value_at + ((len + 3u) & ~3u);
  }
  if (xor_mapped) return xor_mapped;
  return mapped;
}

} // namespace stun

StunResponder::StunResponder(boost::asio::io_context& io) : socket_(boost::asio::make_strand(io)) {}

void StunResponder::listen(const udp::endpoint& ep) {
  socket_.open(ep.protocol());
  socket_.set_option(boost::asio::socket_base::reuse_address(true));
  socket_.bind(ep);
  common::log("stun listening on " + common::endpoint_to_string(socket_.local_endpoint()));
  do_receive();
}

void StunResponder::stop() {
  boost::asio::post(socket_.get_executor(), [this] {
    boost::system::error_code ignored;
    socket_.close(ignored);
  });
}

udp::endpoint StunResponder::local_endpoint() const {
  boost::system::error_code ec;
  auto ep = socket_.local_endpoint(ec);
  return ec ? udp::endpoint() : ep;
}

void StunResponder::do_receive() {
  auto buf = std::make_shared<std::array<uint8_t, stun::kMaxDatagram>>();
  auto remote = std::make_shared<udp::endpoint>();
  socket_.async_receive_from(
      boost::asio::buffer(*buf),
      *remote,
      [this, buf, remote](const boost::system::error_code& ec, std::size_t n) {
        if (ec == boost::asio::error::operation_aborted || !socket_.is_open()) return;
        if (ec) {
          // ICMP port-unreachable from an earlier reply surfaces here on some stacks.
          common::log(std::string("stun receive error: ") + ec.message());
          return do_receive();
        }

        auto reply = stun::build_binding_response(std::span<const uint8_t>(buf->data(), n), *remote);
        if (!reply) {
          ++dropped_;
          return do_receive();
        }
        ++answered_;
        auto out = std::make_shared<std::vector<uint8_t>>(std::move(*reply));
        socket_.async_send_to(boost::asio::buffer(*out), *remote,
                              [out](const boost::system::error_code&, std::size_t) {});
        do_receive();
      });
}

} // namespace pairlink
