#include "src/pairlink/session_table.h"

namespace pairlink {

const char* session_phase_name(SessionPhase phase) {
  switch (phase) {
    case SessionPhase::Empty: return "empty";
    case SessionPhase::Waiting: return "waiting";
    case SessionPhase::Paired: return "paired";
    case SessionPhase::Closing: return "closing";
    case SessionPhase::Closed: return "closed";
  }
  return "unknown";
}

const char* sweep_reason_name(SweepAction::Reason reason) {
  switch (reason) {
    case SweepAction::Reason::WaitingExpired: return "waiting_expired";
    case SweepAction::Reason::IdleExpired: return "idle_expired";
    case SweepAction::Reason::ClosingExpired: return "closing_expired";
  }
  return "unknown";
}

int SessionTable::Session::slot_of(uint64_t participant) const {
  for (std::size_t i = 0; i < count; ++i) {
    if (slots[i].id == participant) return static_cast<int>(i);
  }
  return -1;
}

SessionTable::SessionTable(SessionTableOptions options) : options_(options) {
  if (options_.stripes == 0) options_.stripes = 1;
  stripes_.reserve(options_.stripes);
  for (std::size_t i = 0; i < options_.stripes; ++i) stripes_.push_back(std::make_unique<Stripe>());
}

SessionTable::Stripe& SessionTable::stripe_for(const SessionId& id) {
  return *stripes_[SessionIdHash{}(id) % stripes_.size()];
}

const SessionTable::Stripe& SessionTable::stripe_for(const SessionId& id) const {
  return *stripes_[SessionIdHash{}(id) % stripes_.size()];
}

RegisterOutcome SessionTable::register_participant(const SessionId& id,
                                                   const std::shared_ptr<Participant>& participant) {
  RegisterOutcome out;
  const auto now = std::chrono::steady_clock::now();
  const uint64_t pid = participant->participant_id();

  Stripe& stripe = stripe_for(id);
  std::lock_guard<std::mutex> lock(stripe.mutex);

  auto it = stripe.sessions.find(id);
  if (it == stripe.sessions.end()) {
    Session s;
    s.phase = SessionPhase::Waiting;
    s.slots[0].id = pid;
    s.slots[0].handle = participant;
    s.count = 1;
    s.generation = next_generation_.fetch_add(1);
    s.created_at = now;
    s.last_activity = now;
    out.generation = s.generation;
    stripe.sessions.emplace(id, std::move(s));
    out.status = RegisterOutcome::Status::Waiting;
    return out;
  }

  Session& s = it->second;
  out.generation = s.generation;
  if (s.slot_of(pid) >= 0) {
    out.status = RegisterOutcome::Status::AlreadyRegistered;
    return out;
  }
  if (s.phase != SessionPhase::Waiting) {
    out.status = RegisterOutcome::Status::SessionFull;
    return out;
  }

  s.slots[1].id = pid;
  s.slots[1].handle = participant;
  s.count = 2;
  s.phase = SessionPhase::Paired;
  s.handing_off = true;
  s.last_activity = now;
  out.status = RegisterOutcome::Status::Paired;
  out.counterpart = s.slots[0].handle;
  out.flushed = std::move(s.pending);
  s.pending.clear();
  return out;
}

RelayOutcome SessionTable::relay(const SessionId& id, uint64_t from, const SignalMessage& msg) {
  RelayOutcome out;
  Stripe& stripe = stripe_for(id);
  std::lock_guard<std::mutex> lock(stripe.mutex);

  auto it = stripe.sessions.find(id);
  if (it == stripe.sessions.end()) {
    out.status = RelayOutcome::Status::UnknownSession;
    return out;
  }
  Session& s = it->second;
  const int slot = s.slot_of(from);
  if (slot < 0) {
    out.status = RelayOutcome::Status::NotAParticipant;
    return out;
  }

  switch (s.phase) {
    case SessionPhase::Waiting:
      if (s.pending.size() >= options_.max_pending_messages) {
        out.status = options_.max_pending_messages == 0 ? RelayOutcome::Status::NoCounterpart
                                                        : RelayOutcome::Status::BufferFull;
        return out;
      }
      s.pending.push_back(msg);
      s.last_activity = std::chrono::steady_clock::now();
      out.status = RelayOutcome::Status::Buffered;
      return out;
    case SessionPhase::Paired:
      s.last_activity = std::chrono::steady_clock::now();
      if (s.handing_off && slot == 0) {
        s.pending.push_back(msg);
        out.status = RelayOutcome::Status::Buffered;
        return out;
      }
      out.status = RelayOutcome::Status::Forward;
      out.counterpart = s.slots[1 - slot].handle;
      return out;
    case SessionPhase::Closing:
    case SessionPhase::Closed:
    case SessionPhase::Empty:
      break;
  }
  out.status = RelayOutcome::Status::SessionClosing;
  return out;
}

std::vector<SignalMessage> SessionTable::finish_pairing(const SessionId& id, uint64_t generation) {
  Stripe& stripe = stripe_for(id);
  std::lock_guard<std::mutex> lock(stripe.mutex);

  auto it = stripe.sessions.find(id);
  if (it == stripe.sessions.end() || it->second.generation != generation) return {};
  Session& s = it->second;
  if (s.pending.empty()) {
    s.handing_off = false;
    return {};
  }
  std::vector<SignalMessage> out = std::move(s.pending);
  s.pending.clear();
  return out;
}

EstablishedOutcome SessionTable::report_established(const SessionId& id, uint64_t from) {
  EstablishedOutcome out;
  Stripe& stripe = stripe_for(id);
  std::lock_guard<std::mutex> lock(stripe.mutex);

  auto it = stripe.sessions.find(id);
  if (it == stripe.sessions.end()) {
    out.status = EstablishedOutcome::Status::UnknownSession;
    return out;
  }
  Session& s = it->second;
  out.generation = s.generation;
  const int slot = s.slot_of(from);
  if (slot < 0) {
    out.status = EstablishedOutcome::Status::NotAParticipant;
    return out;
  }
  if (s.phase == SessionPhase::Waiting) {
    out.status = EstablishedOutcome::Status::NoCounterpart;
    return out;
  }
  if (s.phase != SessionPhase::Paired) {
    out.status = EstablishedOutcome::Status::AlreadyClosing;
    return out;
  }

  const auto now = std::chrono::steady_clock::now();
  s.slots[slot].established = true;
  s.last_activity = now;
  if (!s.slots[0].established || !s.slots[1].established) {
    out.status = EstablishedOutcome::Status::Recorded;
    return out;
  }

  s.phase = SessionPhase::Closing;
  s.closing_since = now;
  out.status = EstablishedOutcome::Status::Closing;
  out.participants = {s.slots[0].handle, s.slots[1].handle};
  return out;
}

LeaveOutcome SessionTable::unregister(const SessionId& id, uint64_t participant) {
  LeaveOutcome out;
  Stripe& stripe = stripe_for(id);
  std::lock_guard<std::mutex> lock(stripe.mutex);

  auto it = stripe.sessions.find(id);
  if (it == stripe.sessions.end()) {
    out.status = LeaveOutcome::Status::UnknownSession;
    return out;
  }
  Session& s = it->second;
  const int slot = s.slot_of(participant);
  if (slot < 0) {
    out.status = LeaveOutcome::Status::NotAParticipant;
    return out;
  }

  switch (s.phase) {
    case SessionPhase::Waiting:
      out.status = LeaveOutcome::Status::Removed;
      out.dropped_messages = s.pending.size();
      stripe.sessions.erase(it);
      return out;
    case SessionPhase::Paired:
      out.status = LeaveOutcome::Status::Abandoned;
      out.counterpart = s.slots[1 - slot].handle;
      out.dropped_messages = s.pending.size();
      stripe.sessions.erase(it);
      return out;
    case SessionPhase::Closing:
      s.slots[slot].closed = true;
      if (s.slots[1 - slot].closed) {
        out.status = LeaveOutcome::Status::Closed;
        stripe.sessions.erase(it);
      } else {
        out.status = LeaveOutcome::Status::ClosingHalf;
      }
      return out;
    case SessionPhase::Empty:
    case SessionPhase::Closed:
      break;
  }
  out.status = LeaveOutcome::Status::UnknownSession;
  return out;
}

TeardownOutcome SessionTable::teardown(const SessionId& id, std::optional<uint64_t> generation) {
  TeardownOutcome out;
  Stripe& stripe = stripe_for(id);
  std::lock_guard<std::mutex> lock(stripe.mutex);

  auto it = stripe.sessions.find(id);
  if (it == stripe.sessions.end()) return out;
  Session& s = it->second;
  if (generation && *generation != s.generation) return out;

  out.removed = true;
  out.phase = s.phase;
  out.dropped_messages = s.pending.size();
  for (std::size_t i = 0; i < s.count; ++i) {
    if (!s.slots[i].closed) out.remaining.push_back(s.slots[i].handle);
  }
  stripe.sessions.erase(it);
  return out;
}

std::vector<SweepAction> SessionTable::sweep(std::chrono::steady_clock::time_point now) {
  std::vector<SweepAction> actions;
  for (auto& stripe_ptr : stripes_) {
    Stripe& stripe = *stripe_ptr;
    std::lock_guard<std::mutex> lock(stripe.mutex);
    for (auto it = stripe.sessions.begin(); it != stripe.sessions.end();) {
      const Session& s = it->second;
      std::optional<SweepAction::Reason> reason;
      if (s.phase == SessionPhase::Waiting && now - s.created_at > options_.waiting_timeout) {
        reason = SweepAction::Reason::WaitingExpired;
      } else if (s.phase == SessionPhase::Paired && now - s.last_activity > options_.idle_timeout) {
        reason = SweepAction::Reason::IdleExpired;
      } else if (s.phase == SessionPhase::Closing && now - s.closing_since > options_.closing_grace) {
        reason = SweepAction::Reason::ClosingExpired;
      }
      if (!reason) {
        ++it;
        continue;
      }

      SweepAction action;
      action.session_id = it->first;
      action.reason = *reason;
      action.dropped_messages = s.pending.size();
      for (std::size_t i = 0; i < s.count; ++i) {
        if (!s.slots[i].closed) action.participants.push_back(s.slots[i].handle);
      }
      actions.push_back(std::move(action));
      it = stripe.sessions.erase(it);
    }
  }
  return actions;
}

SessionPhase SessionTable::phase(const SessionId& id) const {
  const Stripe& stripe = stripe_for(id);
  std::lock_guard<std::mutex> lock(stripe.mutex);
  auto it = stripe.sessions.find(id);
  if (it == stripe.sessions.end()) return SessionPhase::Empty;
  return it->second.phase;
}

std::size_t SessionTable::participant_count(const SessionId& id) const {
  const Stripe& stripe = stripe_for(id);
  std::lock_guard<std::mutex> lock(stripe.mutex);
  auto it = stripe.sessions.find(id);
  if (it == stripe.sessions.end()) return 0;
  return it->second.count;
}

std::size_t SessionTable::size() const {
  std::size_t n = 0;
  for (const auto& stripe : stripes_) {
    std::lock_guard<std::mutex> lock(stripe->mutex);
    n += stripe->sessions.size();
  }
  return n;
}

} // namespace pairlink
