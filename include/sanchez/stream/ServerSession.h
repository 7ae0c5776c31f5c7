// Repository: Sanchez
// Component: Server Session
// Purpose: Streams one shared container over one transport with pacing, parity and announcements.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_STREAM_SERVER_SESSION_H_
#define SANCHEZ_STREAM_SERVER_SESSION_H_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "sanchez/core/Status.h"
#include "sanchez/format/Container.h"
#include "sanchez/stream/FramePacketizer.h"
#include "sanchez/stream/ITransport.h"
#include "sanchez/stream/StreamConfig.h"
#include "sanchez/stream/StreamStats.h"
#include "sanchez/telemetry/MetricsExporter.h"
#include "sanchez/timing/FramePacer.h"
#include "sanchez/timing/MasterClock.h"

namespace sanchez::stream {

// ServerSession sends one pass (or, with loop, repeated passes) of the
// container to a single transport. It owns the sequence counter, the frame
// serial counter and the pacer of its session; the Container is only read.
//
// Connection-oriented sessions send METADATA and CONFIG once, then frames,
// then END, with KEEPALIVE while idle between frames. Connectionless sessions
// repeat METADATA and CONFIG every announce_interval_frames frames and once
// more before finishing; unicast finishes with end_repeat END packets,
// multicast and broadcast just stop.
class ServerSession {
 public:
  ServerSession(const ServerConfig& config,
                std::shared_ptr<const format::Container> container,
                std::shared_ptr<const std::vector<uint8_t>> audio,
                std::shared_ptr<timing::MasterClock> clock);
  ~ServerSession();

  ServerSession(const ServerSession&) = delete;
  ServerSession& operator=(const ServerSession&) = delete;

  // Streams until the last frame (no loop), stop, or a transport failure.
  // A raised stop still ends the session cleanly (END where applicable).
  Status Run(ITransport& transport, const std::atomic<bool>& stop);

  // Safe to call while Run() is in progress.
  SessionStats stats() const;

 private:
  // Stamps the sequence number and sends.
  Status SendPacket(ITransport& transport, Packet& packet);
  Status SendAnnouncement(ITransport& transport);
  Status SendFrame(ITransport& transport, uint32_t frame_index);
  Status SendAudioChunk(ITransport& transport);
  Status SendEnd(ITransport& transport);
  // Called between pacing slices.
  void MaybeSendKeepalive(ITransport& transport);
  void PublishMetrics(telemetry::SessionPhase phase);

  const ServerConfig config_;
  std::shared_ptr<const format::Container> container_;
  std::shared_ptr<timing::MasterClock> clock_;
  FramePacketizer packetizer_;
  std::vector<Packet> audio_packets_;
  size_t audio_cursor_;

  uint32_t next_sequence_;
  uint32_t next_serial_;
  uint64_t frames_since_announce_;
  int64_t last_send_utc_us_;

  // Set from the pacing callback when a keepalive fails.
  std::atomic<bool> halt_;
  Status keepalive_status_;

  uint32_t metrics_session_id_;

  mutable std::mutex stats_mutex_;
  SessionStats stats_;
};

}  // namespace sanchez::stream

#endif  // SANCHEZ_STREAM_SERVER_SESSION_H_
