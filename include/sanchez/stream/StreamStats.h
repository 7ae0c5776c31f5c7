// Repository: Sanchez
// Component: Stream Statistics
// Purpose: Counters accumulated by server sessions and by the client.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_STREAM_STREAM_STATS_H_
#define SANCHEZ_STREAM_STREAM_STATS_H_

#include <cstdint>

namespace sanchez::stream {

// Client-side session statistics.
struct ClientStats {
  uint64_t frames_received = 0;
  uint64_t frames_dropped = 0;
  uint64_t bytes_received = 0;
  uint64_t packets_received = 0;
  uint64_t packets_lost_estimate = 0;
  uint64_t parity_recoveries = 0;
  uint64_t presync_discarded = 0;
  // Well-formed packets that do not fit the announced session.
  uint64_t ignored_packets = 0;
};

// Server-side statistics, per session or aggregated over sessions.
struct SessionStats {
  uint64_t sessions = 0;
  uint64_t packets_sent = 0;
  uint64_t frames_sent = 0;
  uint64_t bytes_sent = 0;
  uint64_t parity_packets_sent = 0;
  uint64_t audio_packets_sent = 0;
  uint64_t keepalives_sent = 0;
  uint64_t late_frames = 0;
  uint64_t send_errors = 0;

  SessionStats& operator+=(const SessionStats& other) {
    sessions += other.sessions;
    packets_sent += other.packets_sent;
    frames_sent += other.frames_sent;
    bytes_sent += other.bytes_sent;
    parity_packets_sent += other.parity_packets_sent;
    audio_packets_sent += other.audio_packets_sent;
    keepalives_sent += other.keepalives_sent;
    late_frames += other.late_frames;
    send_errors += other.send_errors;
    return *this;
  }
};

}  // namespace sanchez::stream

#endif  // SANCHEZ_STREAM_STREAM_STATS_H_
