#include "src/pairlink/session_supervisor.h"

#include "common/util.hpp"

#include <string>
#include <utility>
#include <vector>

namespace pairlink {

namespace {

std::string tag(const SessionId& id, uint64_t participant) {
  return "id=" + id.to_string() + " participant=" + std::to_string(participant);
}

void close_all(const std::vector<ParticipantRef>& refs, const std::optional<SignalMessage>& final_message) {
  for (const auto& ref : refs) {
    if (auto p = ref.lock()) p->close(final_message);
  }
}

} // namespace

SessionSupervisor::SessionSupervisor(boost::asio::io_context& io,
                                     SessionTableOptions options,
                                     std::chrono::steady_clock::duration sweep_interval)
    : io_(io),
      table_(options),
      sweep_interval_(sweep_interval),
      sweep_timer_(boost::asio::make_strand(io)) {}

SessionSupervisor::~SessionSupervisor() { cancel_grace_timers(); }

void SessionSupervisor::start() {
  {
    std::lock_guard<std::mutex> lock(timers_mutex_);
    stopped_ = false;
  }
  schedule_sweep();
}

// Timers are only touched on their own strands; stop() may run on any thread.
void SessionSupervisor::stop() {
  cancel_grace_timers();
  boost::asio::post(sweep_timer_.get_executor(), [this] { sweep_timer_.cancel(); });
}

void SessionSupervisor::cancel_grace_timers() {
  std::unordered_map<uint64_t, std::shared_ptr<boost::asio::steady_timer>> timers;
  {
    std::lock_guard<std::mutex> lock(timers_mutex_);
    stopped_ = true;
    timers.swap(grace_timers_);
  }
  for (auto& [gen, timer] : timers) {
    boost::asio::post(timer->get_executor(), [timer] { timer->cancel(); });
  }
}

bool SessionSupervisor::stopped() {
  std::lock_guard<std::mutex> lock(timers_mutex_);
  return stopped_;
}

bool SessionSupervisor::join(const SessionId& id, const std::shared_ptr<Participant>& participant) {
  auto outcome = table_.register_participant(id, participant);
  const uint64_t pid = participant->participant_id();

  switch (outcome.status) {
    case RegisterOutcome::Status::Waiting:
      common::log("session_waiting " + tag(id, pid));
      participant->deliver(SessionWaiting{id});
      return true;

    case RegisterOutcome::Status::Paired: {
      common::log("session_paired " + tag(id, pid) + " flushed=" + std::to_string(outcome.flushed.size()));
      if (auto first = outcome.counterpart.lock()) first->deliver(SessionPaired{id, true});
      participant->deliver(SessionPaired{id, false});
      std::vector<SignalMessage> batch = std::move(outcome.flushed);
      for (;;) {
        for (auto& msg : batch) participant->deliver(std::move(msg));
        batch = table_.finish_pairing(id, outcome.generation);
        if (batch.empty()) break;
      }
      return true;
    }

    case RegisterOutcome::Status::SessionFull:
      common::log("session_full " + tag(id, pid));
      participant->close(make_error(ErrorCode::SessionFull, "session already has two participants"));
      return false;

    case RegisterOutcome::Status::AlreadyRegistered:
      participant->deliver(make_error(ErrorCode::ProtocolViolation, "already registered"));
      return true;
  }
  return false;
}

void SessionSupervisor::relay(const SessionId& id, const std::shared_ptr<Participant>& from, SignalMessage msg) {
  const auto outcome = table_.relay(id, from->participant_id(), msg);
  switch (outcome.status) {
    case RelayOutcome::Status::Forward:
      if (auto to = outcome.counterpart.lock()) {
        to->deliver(std::move(msg));
      } else {
        // The counterpart is mid-teardown; its leave() notifies the sender.
        common::log("relay_dropped " + tag(id, from->participant_id()) + " reason=counterpart_gone");
      }
      return;
    case RelayOutcome::Status::Buffered:
      return;
    case RelayOutcome::Status::NoCounterpart:
      from->deliver(make_error(ErrorCode::NoCounterpart, "no counterpart registered yet"));
      return;
    case RelayOutcome::Status::BufferFull:
      from->deliver(make_error(ErrorCode::BufferFull, "pending message limit reached"));
      return;
    case RelayOutcome::Status::UnknownSession:
      from->deliver(make_error(ErrorCode::UnknownSession, "unknown session"));
      return;
    case RelayOutcome::Status::NotAParticipant:
      from->deliver(make_error(ErrorCode::NotAParticipant, "not a participant of this session"));
      return;
    case RelayOutcome::Status::SessionClosing:
      from->deliver(make_error(ErrorCode::SessionClosing, "session is closing"));
      return;
  }
}

void SessionSupervisor::report_established(const SessionId& id, const std::shared_ptr<Participant>& from) {
  const uint64_t pid = from->participant_id();
  const auto outcome = table_.report_established(id, pid);
  switch (outcome.status) {
    case EstablishedOutcome::Status::Recorded:
      common::log("established " + tag(id, pid) + " waiting_for=counterpart");
      return;
    case EstablishedOutcome::Status::Closing:
      common::log("session_closing " + tag(id, pid));
      arm_closing_grace(id, outcome.generation);
      for (const auto& ref : outcome.participants) {
        if (auto p = ref.lock()) p->close(CloseSession{});
      }
      return;
    case EstablishedOutcome::Status::AlreadyClosing:
      return;
    case EstablishedOutcome::Status::NoCounterpart:
      from->deliver(make_error(ErrorCode::NoCounterpart, "no counterpart registered yet"));
      return;
    case EstablishedOutcome::Status::UnknownSession:
      from->deliver(make_error(ErrorCode::UnknownSession, "unknown session"));
      return;
    case EstablishedOutcome::Status::NotAParticipant:
      from->deliver(make_error(ErrorCode::NotAParticipant, "not a participant of this session"));
      return;
  }
}

void SessionSupervisor::leave(const SessionId& id, uint64_t participant_id) {
  const auto outcome = table_.unregister(id, participant_id);
  switch (outcome.status) {
    case LeaveOutcome::Status::Removed:
      common::log("session_abandoned " + tag(id, participant_id) + " phase=waiting dropped=" +
                  std::to_string(outcome.dropped_messages));
      return;
    case LeaveOutcome::Status::Abandoned:
      common::log("session_abandoned " + tag(id, participant_id) + " phase=paired");
      if (auto other = outcome.counterpart.lock()) {
        other->close(make_error(ErrorCode::PeerDisconnected, "peer disconnected"));
      }
      return;
    case LeaveOutcome::Status::ClosingHalf:
      return;
    case LeaveOutcome::Status::Closed:
      common::log("session_closed " + tag(id, participant_id));
      return;
    case LeaveOutcome::Status::UnknownSession:
    case LeaveOutcome::Status::NotAParticipant:
      // Already reaped by a sweep or grace timer.
      return;
  }
}

std::size_t SessionSupervisor::sweep_now(std::chrono::steady_clock::time_point now) {
  auto actions = table_.sweep(now);
  for (const auto& action : actions) {
    common::log("session_reaped id=" + action.session_id.to_string() +
                " reason=" + sweep_reason_name(action.reason) +
                " dropped=" + std::to_string(action.dropped_messages));
    if (action.reason == SweepAction::Reason::ClosingExpired) {
      close_all(action.participants, std::nullopt);
    } else {
      std::string reason = action.reason == SweepAction::Reason::WaitingExpired ? "no counterpart arrived in time"
                                                                                 : "session idle for too long";
      if (action.dropped_messages > 0) {
        reason += "; " + std::to_string(action.dropped_messages) + " pending message(s) discarded";
      }
      close_all(action.participants, make_error(ErrorCode::SessionExpired, reason));
    }
  }
  return actions.size();
}

void SessionSupervisor::schedule_sweep() {
  sweep_timer_.expires_after(sweep_interval_);
  sweep_timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || stopped()) return;
    sweep_now();
    schedule_sweep();
  });
}

void SessionSupervisor::arm_closing_grace(const SessionId& id, uint64_t generation) {
  auto timer = std::make_shared<boost::asio::steady_timer>(boost::asio::make_strand(io_));
  // Armed before it is published, so a concurrent stop() only ever posts cancel().
  std::lock_guard<std::mutex> lock(timers_mutex_);
  if (stopped_) return;
  timer->expires_after(table_.options().closing_grace);
  timer->async_wait([this, id, generation, timer](const boost::system::error_code& ec) {
    if (ec || stopped()) return;
    on_closing_grace_expired(id, generation);
  });
  grace_timers_[generation] = timer;
}

void SessionSupervisor::on_closing_grace_expired(const SessionId& id, uint64_t generation) {
  {
    std::lock_guard<std::mutex> lock(timers_mutex_);
    grace_timers_.erase(generation);
  }
  auto outcome = table_.teardown(id, generation);
  if (!outcome.removed) return;
  common::log("session_teardown id=" + id.to_string() + " reason=closing_grace_elapsed remaining=" +
              std::to_string(outcome.remaining.size()));
  close_all(outcome.remaining, std::nullopt);
}

} // namespace pairlink
