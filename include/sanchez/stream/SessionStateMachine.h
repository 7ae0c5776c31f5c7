#ifndef SANCHEZ_STREAM_SESSION_STATE_MACHINE_H_
#define SANCHEZ_STREAM_SESSION_STATE_MACHINE_H_

#include <cstdint>
#include <map>
#include <mutex>
#include <utility>

namespace sanchez::stream {

// SessionStateMachine tracks the client side of one stream session:
// AWAITING_METADATA -> AWAITING_CONFIG -> STREAMING -> (ENDED | DISCONNECTED).
// Repeated METADATA/CONFIG while streaming (connectionless re-announcements)
// are accepted without a transition.
class SessionStateMachine {
 public:
  enum class State {
    kAwaitingMetadata = 0,
    kAwaitingConfig = 1,
    kStreaming = 2,
    kEnded = 3,
    kDisconnected = 4,
  };

  struct MetricsSnapshot {
    std::map<std::pair<State, State>, uint64_t> transitions;
    std::map<std::pair<State, State>, uint64_t> illegal_transitions;
    uint64_t illegal_transition_total = 0;
    uint64_t reannounce_total = 0;
    State state = State::kAwaitingMetadata;
  };

  SessionStateMachine();

  SessionStateMachine(const SessionStateMachine&) = delete;
  SessionStateMachine& operator=(const SessionStateMachine&) = delete;

  bool OnMetadata();
  bool OnConfig();
  bool OnEnd();
  bool OnDisconnect();

  [[nodiscard]] State state() const;
  [[nodiscard]] bool synchronized() const;
  [[nodiscard]] bool terminal() const;
  [[nodiscard]] MetricsSnapshot Snapshot() const;

 private:
  void TransitionLocked(State to);
  void RecordIllegalTransitionLocked(State from, State attempted_to);
  static bool IsTerminal(State state);

  mutable std::mutex mutex_;
  State state_;
  std::map<std::pair<State, State>, uint64_t> transitions_;
  std::map<std::pair<State, State>, uint64_t> illegal_transitions_;
  uint64_t illegal_transition_total_;
  uint64_t reannounce_total_;
};

const char* SessionStateToString(SessionStateMachine::State state);

}  // namespace sanchez::stream

#endif  // SANCHEZ_STREAM_SESSION_STATE_MACHINE_H_
