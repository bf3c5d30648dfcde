#include "src/pairlink/signal_message.h"

#include <algorithm>
#include <cstring>

namespace pairlink {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

void put_session_id(Bytes& out, const SessionId& id) {
  const std::size_t at = out.size();
  out.resize(at + SessionId::kWireSize);
  id.write(out.data() + at);
}

void put_payload(Bytes& out, const Bytes& payload) {
  const std::size_t at = out.size();
  out.resize(at + 4 + payload.size());
  common::write_u32_be(static_cast<uint32_t>(payload.size()), out.data() + at);
  if (!payload.empty()) std::memcpy(out.data() + at + 4, payload.data(), payload.size());
}

class Reader {
 public:
  explicit Reader(std::span<const uint8_t> bytes) : bytes_(bytes) {}

  bool remaining(std::size_t n) const { return bytes_.size() - pos_ >= n; }
  bool at_end() const { return pos_ == bytes_.size(); }

  uint8_t u8() { return bytes_[pos_++]; }
  uint16_t u16() {
    const uint16_t v = common::read_u16_be(bytes_.data() + pos_);
    pos_ += 2;
    return v;
  }
  uint32_t u32() {
    const uint32_t v = common::read_u32_be(bytes_.data() + pos_);
    pos_ += 4;
    return v;
  }
  SessionId session_id() {
    const SessionId id = SessionId::read(bytes_.data() + pos_);
    pos_ += SessionId::kWireSize;
    return id;
  }
  Bytes take(std::size_t n) {
    Bytes out(bytes_.begin() + static_cast<std::ptrdiff_t>(pos_),
              bytes_.begin() + static_cast<std::ptrdiff_t>(pos_ + n));
    pos_ += n;
    return out;
  }

 private:
  std::span<const uint8_t> bytes_;
  std::size_t pos_ = 0;
};

std::optional<SignalMessage> fail(DecodeError err, DecodeError* out_error) {
  if (out_error) *out_error = err;
  return std::nullopt;
}

std::optional<Bytes> read_payload(Reader& r, DecodeError* err) {
  if (!r.remaining(4)) {
    *err = DecodeError::Truncated;
    return std::nullopt;
  }
  const uint32_t len = r.u32();
  if (len > kMaxPayloadSize) {
    *err = DecodeError::PayloadTooLarge;
    return std::nullopt;
  }
  if (!r.remaining(len)) {
    *err = DecodeError::Truncated;
    return std::nullopt;
  }
  return r.take(len);
}

} // namespace

const char* error_code_name(ErrorCode code) {
  switch (code) {
    case ErrorCode::ProtocolViolation: return "protocol_violation";
    case ErrorCode::SessionFull: return "session_full";
    case ErrorCode::UnknownSession: return "unknown_session";
    case ErrorCode::NotAParticipant: return "not_a_participant";
    case ErrorCode::NoCounterpart: return "no_counterpart";
    case ErrorCode::DecodeError: return "decode_error";
    case ErrorCode::SessionClosing: return "session_closing";
    case ErrorCode::PeerDisconnected: return "peer_disconnected";
    case ErrorCode::BufferFull: return "buffer_full";
    case ErrorCode::SessionExpired: return "session_expired";
    case ErrorCode::NegotiationFailed: return "negotiation_failed";
  }
  return "unknown";
}

const char* decode_error_name(DecodeError err) {
  switch (err) {
    case DecodeError::Empty: return "empty";
    case DecodeError::UnknownTag: return "unknown_tag";
    case DecodeError::Truncated: return "truncated";
    case DecodeError::TrailingBytes: return "trailing_bytes";
    case DecodeError::PayloadTooLarge: return "payload_too_large";
    case DecodeError::InvalidField: return "invalid_field";
  }
  return "unknown";
}

MessageTag message_tag(const SignalMessage& msg) {
  return std::visit(Overloaded{
                        [](const JoinSession&) { return MessageTag::JoinSession; },
                        [](const SessionWaiting&) { return MessageTag::SessionWaiting; },
                        [](const SessionPaired&) { return MessageTag::SessionPaired; },
                        [](const Offer&) { return MessageTag::Offer; },
                        [](const Answer&) { return MessageTag::Answer; },
                        [](const Candidate&) { return MessageTag::Candidate; },
                        [](const ConnectionEstablished&) { return MessageTag::ConnectionEstablished; },
                        [](const CloseSession&) { return MessageTag::CloseSession; },
                        [](const Error&) { return MessageTag::Error; },
                    },
                    msg);
}

const char* message_name(const SignalMessage& msg) {
  switch (message_tag(msg)) {
    case MessageTag::JoinSession: return "join_session";
    case MessageTag::SessionWaiting: return "session_waiting";
    case MessageTag::SessionPaired: return "session_paired";
    case MessageTag::Offer: return "offer";
    case MessageTag::Answer: return "answer";
    case MessageTag::Candidate: return "candidate";
    case MessageTag::ConnectionEstablished: return "connection_established";
    case MessageTag::CloseSession: return "close_session";
    case MessageTag::Error: return "error";
  }
  return "unknown";
}

bool is_relayable(const SignalMessage& msg) {
  return std::holds_alternative<Offer>(msg) || std::holds_alternative<Answer>(msg) ||
         std::holds_alternative<Candidate>(msg) || std::holds_alternative<Error>(msg);
}

Bytes encode_message(const SignalMessage& msg) {
  Bytes out;
  out.push_back(static_cast<uint8_t>(message_tag(msg)));
  std::visit(Overloaded{
                 [&](const JoinSession& m) { put_session_id(out, m.session_id); },
                 [&](const SessionWaiting& m) { put_session_id(out, m.session_id); },
                 [&](const SessionPaired& m) {
                   put_session_id(out, m.session_id);
                   out.push_back(m.initiator ? 1 : 0);
                 },
                 [&](const Offer& m) { put_payload(out, m.payload); },
                 [&](const Answer& m) { put_payload(out, m.payload); },
                 [&](const Candidate& m) { put_payload(out, m.payload); },
                 [](const ConnectionEstablished&) {},
                 [](const CloseSession&) {},
                 [&](const Error& m) {
                   // Over-limit reasons are written as is; decode_message rejects them.
                   const std::size_t len = std::min<std::size_t>(m.reason.size(), 0xFFFF);
                   const std::size_t at = out.size();
                   out.resize(at + 4 + len);
                   common::write_u16_be(static_cast<uint16_t>(m.code), out.data() + at);
                   common::write_u16_be(static_cast<uint16_t>(len), out.data() + at + 2);
                   if (len > 0) std::memcpy(out.data() + at + 4, m.reason.data(), len);
                 },
             },
             msg);
  return out;
}

std::optional<SignalMessage> decode_message(std::span<const uint8_t> bytes, DecodeError* out_error) {
  if (bytes.empty()) return fail(DecodeError::Empty, out_error);

  Reader r(bytes);
  const uint8_t tag = r.u8();
  DecodeError err = DecodeError::Truncated;
  std::optional<SignalMessage> msg;

  switch (static_cast<MessageTag>(tag)) {
    case MessageTag::JoinSession:
    case MessageTag::SessionWaiting: {
      if (!r.remaining(SessionId::kWireSize)) return fail(DecodeError::Truncated, out_error);
      const SessionId id = r.session_id();
      if (static_cast<MessageTag>(tag) == MessageTag::JoinSession) {
        msg = JoinSession{id};
      } else {
        msg = SessionWaiting{id};
      }
      break;
    }
    case MessageTag::SessionPaired: {
      if (!r.remaining(SessionId::kWireSize + 1)) return fail(DecodeError::Truncated, out_error);
      const SessionId id = r.session_id();
      const uint8_t flag = r.u8();
      if (flag > 1) return fail(DecodeError::InvalidField, out_error);
      msg = SessionPaired{id, flag == 1};
      break;
    }
    case MessageTag::Offer: {
      auto payload = read_payload(r, &err);
      if (!payload) return fail(err, out_error);
      msg = Offer{std::move(*payload)};
      break;
    }
    case MessageTag::Answer: {
      auto payload = read_payload(r, &err);
      if (!payload) return fail(err, out_error);
      msg = Answer{std::move(*payload)};
      break;
    }
    case MessageTag::Candidate: {
      auto payload = read_payload(r, &err);
      if (!payload) return fail(err, out_error);
      msg = Candidate{std::move(*payload)};
      break;
    }
    case MessageTag::ConnectionEstablished:
      msg = ConnectionEstablished{};
      break;
    case MessageTag::CloseSession:
      msg = CloseSession{};
      break;
    case MessageTag::Error: {
      if (!r.remaining(4)) return fail(DecodeError::Truncated, out_error);
      const uint16_t code = r.u16();
      const uint16_t len = r.u16();
      if (len > kMaxErrorReason) return fail(DecodeError::PayloadTooLarge, out_error);
      if (!r.remaining(len)) return fail(DecodeError::Truncated, out_error);
      const Bytes reason = r.take(len);
      msg = Error{static_cast<ErrorCode>(code), std::string(reason.begin(), reason.end())};
      break;
    }
    default:
      return fail(DecodeError::UnknownTag, out_error);
  }

  if (!r.at_end()) return fail(DecodeError::TrailingBytes, out_error);
  return msg;
}

} // namespace pairlink
