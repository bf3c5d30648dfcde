#include "common/framing.hpp"
#include "src/pairlink/stun_responder.h"

#include <utility>
#include <boost/asio.hpp>

#include <array>
#include <cassert>
#include <chrono>
#include <cstring>
#include <optional>
#include <vector>

using boost::asio::ip::udp;
using namespace pairlink;

namespace {

const std::array<uint8_t, stun::kTransactionIdSize> kTxid = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12};

struct Attr {
  uint16_t type;
  std::vector<uint8_t> value;
  std::size_t offset;
};

std::vector<Attr> attributes(const std::vector<uint8_t>& msg) {
  std::vector<Attr> out;
  std::size_t pos = stun::kHeaderSize;
  while (pos + 4 <= msg.size()) {
    const uint16_t type = common::read_u16_be(msg.data() + pos);
    const uint16_t len = common::read_u16_be(msg.data() + pos + 2);
    assert(pos + 4 + len <= msg.size());
    out.push_back({type, std::vector<uint8_t>(msg.begin() + pos + 4, msg.begin() + pos + 4 + len), pos});
    pos += 4 + ((len + 3u) & ~3u);
  }
  assert(pos == msg.size());
  return out;
}

const Attr* find_attr(const std::vector<Attr>& attrs, uint16_t type) {
  for (const auto& a : attrs) {
    if (a.type == type) return &a;
  }
  return nullptr;
}

void test_ipv4_mapping() {
  const auto request = stun::build_binding_request(kTxid);
  assert(request.size() == stun::kHeaderSize);
  const udp::endpoint source(boost::asio::ip::make_address("1.2.3.4"), 5000);

  const auto response = stun::build_binding_response(request, source);
  assert(response.has_value());
  const auto& msg = *response;
  assert(common::read_u16_be(msg.data()) == stun::kBindingResponse);
  assert(common::read_u16_be(msg.data() + 2) == msg.size() - stun::kHeaderSize);
  assert(common::read_u32_be(msg.data() + 4) == stun::kMagicCookie);
  assert(std::memcmp(msg.data() + 8, kTxid.data(), kTxid.size()) == 0);

  const auto attrs = attributes(msg);
  const Attr* xor_mapped = find_attr(attrs, stun::kAttrXorMappedAddress);
  assert(xor_mapped);
  const std::vector<uint8_t> expected_xor = {0x00, 0x01, 0x32, 0x9A, 0x20, 0x10, 0xA7, 0x46};
  assert(xor_mapped->value == expected_xor);

  const Attr* mapped = find_attr(attrs, stun::kAttrMappedAddress);
  assert(mapped);
  const std::vector<uint8_t> expected_plain = {0x00, 0x01, 0x13, 0x88, 1, 2, 3, 4};
  assert(mapped->value == expected_plain);

  assert(find_attr(attrs, stun::kAttrSoftware));

  // FINGERPRINT is last and covers everything before it.
  const Attr& fp = attrs.back();
  assert(fp.type == stun::kAttrFingerprint);
  const uint32_t expected_fp = stun::fingerprint(std::span<const uint8_t>(msg.data(), fp.offset));
  assert(common::read_u32_be(fp.value.data()) == expected_fp);

  const auto parsed = stun::parse_binding_response(msg, &kTxid);
  assert(parsed && *parsed == source);

  std::array<uint8_t, stun::kTransactionIdSize> other = kTxid;
  other[0] ^= 0xFF;
  assert(!stun::parse_binding_response(msg, &other));
}

void test_ipv6_mapping() {
  const auto request = stun::build_binding_request(kTxid);
  const udp::endpoint source(boost::asio::ip::make_address("2001:db8::1"), 40000);
  const auto response = stun::build_binding_response(request, source);
  assert(response.has_value());
  const auto attrs = attributes(*response);
  const Attr* xor_mapped = find_attr(attrs, stun::kAttrXorMappedAddress);
  assert(xor_mapped && xor_mapped->value.size() == 20);
  assert(xor_mapped->value[1] == stun::kFamilyIpv6);
  const auto parsed = stun::parse_binding_response(*response, &kTxid);
  assert(parsed && *parsed == source);

  // A v4-mapped source is reported as plain IPv4.
  const udp::endpoint mapped_v4(boost::asio::ip::make_address("::ffff:10.0.0.7"), 1234);
  const auto v4_response = stun::build_binding_response(request, mapped_v4);
  const auto v4 = stun::parse_binding_response(*v4_response);
  assert(v4 && v4->address() == boost::asio::ip::make_address("10.0.0.7") && v4->port() == 1234);
}

void test_classic_request() {
  const auto request = stun::build_binding_request(kTxid, false);
  const udp::endpoint source(boost::asio::ip::make_address("1.2.3.4"), 5000);
  const auto response = stun::build_binding_response(request, source);
  assert(response.has_value());
  const auto attrs = attributes(*response);
  assert(attrs.size() == 1);
  assert(attrs[0].type == stun::kAttrMappedAddress);
  const auto parsed = stun::parse_binding_response(*response);
  assert(parsed && *parsed == source);
}

void test_malformed_requests_dropped() {
  const udp::endpoint source(boost::asio::ip::make_address("1.2.3.4"), 5000);
  const auto good = stun::build_binding_request(kTxid);

  assert(!stun::build_binding_response(std::span<const uint8_t>(good.data(), 19), source));

  auto bad_type = good;
  bad_type[1] = 0x11;
  assert(!stun::build_binding_response(bad_type, source));

  auto top_bits = good;
  top_bits[0] |= 0x80;
  assert(!stun::build_binding_response(top_bits, source));

  auto bad_len = good;
  common::write_u16_be(4, bad_len.data() + 2);
  assert(!stun::build_binding_response(bad_len, source));

  auto unaligned = good;
  unaligned.push_back(0);
  unaligned.push_back(0);
  common::write_u16_be(2, unaligned.data() + 2);
  assert(!stun::build_binding_response(unaligned, source));

  // Attributes in the request are allowed and ignored.
  auto with_attr = good;
  const std::vector<uint8_t> attr = {0x80, 0x22, 0x00, 0x04, 't', 'e', 's', 't'};
  with_attr.insert(with_attr.end(), attr.begin(), attr.end());
  common::write_u16_be(8, with_attr.data() + 2);
  assert(stun::build_binding_response(with_attr, source).has_value());
}

void test_live_socket() {
  boost::asio::io_context io;
  StunResponder responder(io);
  responder.listen(udp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
  const auto server_ep = responder.local_endpoint();
  assert(server_ep.port() != 0);

  udp::socket client(io, udp::endpoint(udp::v4(), 0));
  const std::vector<uint8_t> junk = {0xDE, 0xAD};
  client.send_to(boost::asio::buffer(junk), server_ep);
  const auto request = stun::build_binding_request(kTxid);
  client.send_to(boost::asio::buffer(request), server_ep);

  std::array<uint8_t, stun::kMaxDatagram> buf{};
  udp::endpoint from;
  std::optional<udp::endpoint> mapped;
  client.async_receive_from(boost::asio::buffer(buf), from, [&](const boost::system::error_code& ec, std::size_t n) {
    if (ec) return;
    mapped = stun::parse_binding_response(std::span<const uint8_t>(buf.data(), n), &kTxid);
  });
  io.run_for(std::chrono::seconds(2));

  assert(mapped.has_value());
  assert(mapped->port() == client.local_endpoint().port());
  assert(mapped->address() == boost::asio::ip::make_address("127.0.0.1"));
  assert(responder.requests_answered() == 1);
  assert(responder.requests_dropped() == 1);
}

} // namespace

int main() {
  test_ipv4_mapping();
  test_ipv6_mapping();
  test_classic_request();
  test_malformed_requests_dropped();
  test_live_socket();
  return 0;
}
