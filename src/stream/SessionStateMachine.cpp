#include "sanchez/stream/SessionStateMachine.h"

namespace sanchez::stream {

SessionStateMachine::SessionStateMachine()
    : state_(State::kAwaitingMetadata), illegal_transition_total_(0), reannounce_total_(0) {}

bool SessionStateMachine::OnMetadata() {
  std::lock_guard<std::mutex> lock(mutex_);
  switch (state_) {
    case State::kAwaitingMetadata:
      TransitionLocked(State::kAwaitingConfig);
      return true;
    case State::kAwaitingConfig:
    case State::kStreaming:
      ++reannounce_total_;
      return true;
    case State::kEnded:
    case State::kDisconnected:
      RecordIllegalTransitionLocked(state_, State::kAwaitingConfig);
      return false;
  }
  return false;
}

bool SessionStateMachine::OnConfig() {
  std::lock_guard<std::mutex> lock(mutex_);
  switch (state_) {
    case State::kAwaitingConfig:
      TransitionLocked(State::kStreaming);
      return true;
    case State::kStreaming:
      ++reannounce_total_;
      return true;
    case State::kAwaitingMetadata:
    case State::kEnded:
    case State::kDisconnected:
      RecordIllegalTransitionLocked(state_, State::kStreaming);
      return false;
  }
  return false;
}

bool SessionStateMachine::OnEnd() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (IsTerminal(state_)) {
    RecordIllegalTransitionLocked(state_, State::kEnded);
    return false;
  }
  TransitionLocked(State::kEnded);
  return true;
}

bool SessionStateMachine::OnDisconnect() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (IsTerminal(state_)) {
    RecordIllegalTransitionLocked(state_, State::kDisconnected);
    return false;
  }
  TransitionLocked(State::kDisconnected);
  return true;
}

SessionStateMachine::State SessionStateMachine::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool SessionStateMachine::synchronized() const {
  return state() == State::kStreaming;
}

bool SessionStateMachine::terminal() const {
  return IsTerminal(state());
}

SessionStateMachine::MetricsSnapshot SessionStateMachine::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  MetricsSnapshot snapshot;
  snapshot.transitions = transitions_;
  snapshot.illegal_transitions = illegal_transitions_;
  snapshot.illegal_transition_total = illegal_transition_total_;
  snapshot.reannounce_total = reannounce_total_;
  snapshot.state = state_;
  return snapshot;
}

void SessionStateMachine::TransitionLocked(State to) {
  ++transitions_[{state_, to}];
  state_ = to;
}

void SessionStateMachine::RecordIllegalTransitionLocked(State from, State attempted_to) {
  ++illegal_transition_total_;
  ++illegal_transitions_[{from, attempted_to}];
}

bool SessionStateMachine::IsTerminal(State state) {
  return state == State::kEnded || state == State::kDisconnected;
}

const char* SessionStateToString(SessionStateMachine::State state) {
  switch (state) {
    case SessionStateMachine::State::kAwaitingMetadata:
      return "awaiting_metadata";
    case SessionStateMachine::State::kAwaitingConfig:
      return "awaiting_config";
    case SessionStateMachine::State::kStreaming:
      return "streaming";
    case SessionStateMachine::State::kEnded:
      return "ended";
    case SessionStateMachine::State::kDisconnected:
      return "disconnected";
  }
  return "unknown";
}

}  // namespace sanchez::stream
