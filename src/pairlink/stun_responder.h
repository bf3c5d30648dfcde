#pragma once

#include <utility>
#include <boost/asio.hpp>

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace pairlink {

namespace stun {

constexpr uint16_t kBindingRequest = 0x0001;
constexpr uint16_t kBindingResponse = 0x0101;

constexpr uint16_t kAttrMappedAddress = 0x0001;
constexpr uint16_t kAttrXorMappedAddress = 0x0020;
constexpr uint16_t kAttrSoftware = 0x8022;
constexpr uint16_t kAttrFingerprint = 0x8028;

constexpr uint32_t kMagicCookie = 0x2112A442;
constexpr uint32_t kFingerprintXor = 0x5354554E;
constexpr uint8_t kFamilyIpv4 = 0x01;
constexpr uint8_t kFamilyIpv6 = 0x02;

constexpr std::size_t kHeaderSize = 20;
constexpr std::size_t kTransactionIdSize = 12;
constexpr std::size_t kMaxDatagram = 1500;

constexpr const char* kSoftwareName = "pairlink";

// Builds the binding success response for `request` as seen from `source`.
// Returns nullopt for anything that is not a well-formed binding request.
std::optional<std::vector<uint8_t>> build_binding_response(std::span<const uint8_t> request,
                                                           const boost::asio::ip::udp::endpoint& source);

// Builds a binding request. An all-zero magic cookie yields a classic RFC 3489 request.
std::vector<uint8_t> build_binding_request(const std::array<uint8_t, kTransactionIdSize>& transaction_id,
                                           bool rfc5389 = true);

// Extracts the reflexive address from a binding response, preferring
// XOR-MAPPED-ADDRESS over MAPPED-ADDRESS. Checks the transaction id when given.
std::optional<boost::asio::ip::udp::endpoint> parse_binding_response(
    std::span<const uint8_t> response,
    const std::array<uint8_t, kTransactionIdSize>* expected_transaction_id = nullptr);

uint32_t fingerprint(std::span<const uint8_t> message_prefix);

} // namespace stun

// Answers STUN binding requests on one UDP socket. Holds no state across
// requests; every reply owns its buffer.
class StunResponder {
 public:
  explicit StunResponder(boost::asio::io_context& io);

  void listen(const boost::asio::ip::udp::endpoint& ep);
  void stop();

  boost::asio::ip::udp::endpoint local_endpoint() const;

  uint64_t requests_answered() const { return answered_.load(); }
  uint64_t requests_dropped() const { return dropped_.load(); }

 private:
  void do_receive();

  boost::asio::ip::udp::socket socket_;
  std::atomic<uint64_t> answered_{0};
  std::atomic<uint64_t> dropped_{0};
};

} // namespace pairlink
