#pragma once

#include "common/framing.hpp"
#include "src/pairlink/session_id.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pairlink {

using Bytes = std::vector<uint8_t>;

enum class ErrorCode : uint16_t {
  ProtocolViolation = 1,
  SessionFull = 2,
  UnknownSession = 3,
  NotAParticipant = 4,
  NoCounterpart = 5,
  DecodeError = 6,
  SessionClosing = 7,
  PeerDisconnected = 8,
  BufferFull = 9,
  SessionExpired = 10,
  // Reserved for clients reporting a failed negotiation to their peer.
  NegotiationFailed = 100,
};

const char* error_code_name(ErrorCode code);

enum class MessageTag : uint8_t {
  JoinSession = 0x01,
  SessionWaiting = 0x02,
  SessionPaired = 0x03,
  Offer = 0x10,
  Answer = 0x11,
  Candidate = 0x12,
  ConnectionEstablished = 0x20,
  CloseSession = 0x21,
  Error = 0x7F,
};

// Largest opaque payload that still fits a frame: tag + u32 length prefix.
constexpr std::size_t kMaxPayloadSize = common::kMaxFrameSize - 5;

// Longest Error reason accepted on the wire.
constexpr std::size_t kMaxErrorReason = 1024;

struct JoinSession {
  SessionId session_id;

  bool operator==(const JoinSession&) const = default;
};

struct SessionWaiting {
  SessionId session_id;

  bool operator==(const SessionWaiting&) const = default;
};

struct SessionPaired {
  SessionId session_id;
  bool initiator = false; // registered first; expected to send the Offer

  bool operator==(const SessionPaired&) const = default;
};

struct Offer {
  Bytes payload;

  bool operator==(const Offer&) const = default;
};

struct Answer {
  Bytes payload;

  bool operator==(const Answer&) const = default;
};

struct Candidate {
  Bytes payload;

  bool operator==(const Candidate&) const = default;
};

struct ConnectionEstablished {
  bool operator==(const ConnectionEstablished&) const = default;
};

// Server instruction: the session is over, the channel is about to close.
struct CloseSession {
  bool operator==(const CloseSession&) const = default;
};

struct Error {
  ErrorCode code = ErrorCode::ProtocolViolation;
  std::string reason;

  bool operator==(const Error&) const = default;
};

using SignalMessage = std::variant<JoinSession,
                                   SessionWaiting,
                                   SessionPaired,
                                   Offer,
                                   Answer,
                                   Candidate,
                                   ConnectionEstablished,
                                   CloseSession,
                                   Error>;

enum class DecodeError {
  Empty,
  UnknownTag,
  Truncated,
  TrailingBytes,
  PayloadTooLarge,
  InvalidField,
};

const char* decode_error_name(DecodeError err);

MessageTag message_tag(const SignalMessage& msg);
const char* message_name(const SignalMessage& msg);

// Messages a peer may send once registered; forwarded to the counterpart untouched.
bool is_relayable(const SignalMessage& msg);

Bytes encode_message(const SignalMessage& msg);
std::optional<SignalMessage> decode_message(std::span<const uint8_t> bytes, DecodeError* out_error = nullptr);

// Server-side errors; the reason is cut to kMaxErrorReason.
inline Error make_error(ErrorCode code, std::string_view reason) {
  return Error{code, std::string(reason.substr(0, kMaxErrorReason))};
}

} // namespace pairlink
