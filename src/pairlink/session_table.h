#pragma once

#include "src/pairlink/session_id.h"
#include "src/pairlink/signal_message.h"

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace pairlink {

// One end of a session as the table sees it. Implementations must not block:
// both calls only schedule work on the participant's own executor.
class Participant {
 public:
  virtual ~Participant() = default;

  virtual uint64_t participant_id() const = 0;
  virtual void deliver(SignalMessage msg) = 0;
  // Sends `final_message` (if any), drains, then closes. Idempotent.
  virtual void close(std::optional<SignalMessage> final_message) = 0;
};

using ParticipantRef = std::weak_ptr<Participant>;

// Empty and Closed are never stored: a missing entry reports Empty.
enum class SessionPhase { Empty, Waiting, Paired, Closing, Closed };

const char* session_phase_name(SessionPhase phase);

struct SessionTableOptions {
  std::size_t stripes = 16;
  // Messages held for a Waiting session until the counterpart registers.
  std::size_t max_pending_messages = 0;
  std::chrono::steady_clock::duration waiting_timeout = std::chrono::seconds(60);
  std::chrono::steady_clock::duration idle_timeout = std::chrono::seconds(120);
  std::chrono::steady_clock::duration closing_grace = std::chrono::seconds(5);
};

struct RegisterOutcome {
  enum class Status { Waiting, Paired, SessionFull, AlreadyRegistered };
  Status status = Status::SessionFull;
  ParticipantRef counterpart;
  // Messages the counterpart sent while waiting, in order, for the newcomer.
  std::vector<SignalMessage> flushed;
  uint64_t generation = 0;
};

struct RelayOutcome {
  enum class Status { Forward, Buffered, NoCounterpart, BufferFull, UnknownSession, NotAParticipant, SessionClosing };
  Status status = Status::UnknownSession;
  ParticipantRef counterpart;
};

struct EstablishedOutcome {
  enum class Status { Recorded, Closing, AlreadyClosing, NoCounterpart, UnknownSession, NotAParticipant };
  Status status = Status::UnknownSession;
  std::array<ParticipantRef, 2> participants;
  uint64_t generation = 0;
};

struct LeaveOutcome {
  enum class Status {
    Removed,       // was Waiting; entry gone
    Abandoned,     // was Paired; entry gone, counterpart must be told
    ClosingHalf,   // was Closing; the other side has not closed yet
    Closed,        // was Closing; both sides closed, entry gone
    UnknownSession,
    NotAParticipant,
  };
  Status status = Status::UnknownSession;
  ParticipantRef counterpart;
  std::size_t dropped_messages = 0;
};

struct TeardownOutcome {
  bool removed = false;
  SessionPhase phase = SessionPhase::Empty;
  std::vector<ParticipantRef> remaining;
  std::size_t dropped_messages = 0;
};

struct SweepAction {
  enum class Reason { WaitingExpired, IdleExpired, ClosingExpired };
  SessionId session_id;
  Reason reason = Reason::WaitingExpired;
  std::vector<ParticipantRef> participants;
  std::size_t dropped_messages = 0;
};

const char* sweep_reason_name(SweepAction::Reason reason);

// Concurrent SessionId -> session map. Entries are spread over independently
// locked stripes; no call holds more than one stripe lock and none performs I/O.
class SessionTable {
 public:
  explicit SessionTable(SessionTableOptions options = {});

  SessionTable(const SessionTable&) = delete;
  SessionTable& operator=(const SessionTable&) = delete;

  RegisterOutcome register_participant(const SessionId& id, const std::shared_ptr<Participant>& participant);
  // Relays towards a newcomer stay queued until finish_pairing() reports the
  // queue empty, so they reach it after SessionPaired and the flushed messages.
  RelayOutcome relay(const SessionId& id, uint64_t from, const SignalMessage& msg);

  // Takes what was queued for the newcomer since the last call. An empty result
  // ends the hand-off; later relays are forwarded directly.
  std::vector<SignalMessage> finish_pairing(const SessionId& id, uint64_t generation);

  EstablishedOutcome report_established(const SessionId& id, uint64_t from);
  LeaveOutcome unregister(const SessionId& id, uint64_t participant);

  // Removes the entry regardless of phase. With a generation, only removes
  // that incarnation of the session.
  TeardownOutcome teardown(const SessionId& id, std::optional<uint64_t> generation = std::nullopt);

  std::vector<SweepAction> sweep(std::chrono::steady_clock::time_point now);

  SessionPhase phase(const SessionId& id) const;
  std::size_t participant_count(const SessionId& id) const;
  std::size_t size() const;

  const SessionTableOptions& options() const { return options_; }

 private:
  struct Slot {
    uint64_t id = 0;
    ParticipantRef handle;
    bool established = false;
    bool closed = false;
  };

  struct Session {
    SessionPhase phase = SessionPhase::Waiting;
    std::array<Slot, 2> slots;
    std::size_t count = 0;
    std::vector<SignalMessage> pending;
    bool handing_off = false;
    uint64_t generation = 0;
    std::chrono::steady_clock::time_point created_at{};
    std::chrono::steady_clock::time_point last_activity{};
    std::chrono::steady_clock::time_point closing_since{};

    int slot_of(uint64_t participant) const;
  };

  struct Stripe {
    mutable std::mutex mutex;
    std::unordered_map<SessionId, Session, SessionIdHash> sessions;
  };

  Stripe& stripe_for(const SessionId& id);
  const Stripe& stripe_for(const SessionId& id) const;

  SessionTableOptions options_;
  std::vector<std::unique_ptr<Stripe>> stripes_;
  std::atomic<uint64_t> next_generation_{1};
};

} // namespace pairlink
