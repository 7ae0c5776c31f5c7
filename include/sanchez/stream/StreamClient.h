// Repository: Sanchez
// Component: Stream Client
// Purpose: Receives a stream, synchronizes on METADATA/CONFIG and yields decoded frames.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_STREAM_STREAM_CLIENT_H_
#define SANCHEZ_STREAM_STREAM_CLIENT_H_

#include <atomic>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "sanchez/codec/FrameCodec.h"
#include "sanchez/core/Status.h"
#include "sanchez/format/ContainerTypes.h"
#include "sanchez/media/IFrameSource.h"
#include "sanchez/stream/FrameAssembler.h"
#include "sanchez/stream/ITransport.h"
#include "sanchez/stream/Packet.h"
#include "sanchez/stream/SessionStateMachine.h"
#include "sanchez/stream/StreamConfig.h"
#include "sanchez/stream/StreamStats.h"

namespace sanchez::stream {

// One decoded frame of a live stream.
struct ReceivedFrame {
  uint32_t frame_serial = 0;
  uint32_t frame_index = 0;
  uint32_t width = 0;
  uint32_t height = 0;
  std::vector<uint8_t> data;
};

// StreamClient pulls packets from one transport and turns them into frames.
//
// Frame-bearing packets that arrive before METADATA and CONFIG are held in a
// bounded pre-sync buffer and replayed once the session synchronizes. Frames
// are reassembled by FrameAssembler, checked against the carried CRC32 and
// decompressed; a frame that fails either step is counted as dropped and
// skipped. Session-level failures end the sequence and show up in status().
//
// Next() and the transport belong to one thread. Cancel() and GetStats() may
// be called from any thread.
class StreamClient : public media::IFrameSource {
 public:
  explicit StreamClient(const ClientConfig& config);
  ~StreamClient() override;

  StreamClient(const StreamClient&) = delete;
  StreamClient& operator=(const StreamClient&) = delete;

  // TCP: connects to host:port and sends HELLO. UDP: binds port; for
  // multicast, host is the group to join, for unicast the local address to
  // bind, or any address when host is not local.
  Status ReceiveStream(const std::string& host, uint16_t port);

  // Takes over an already open transport.
  void Attach(std::unique_ptr<ITransport> transport, bool connection_oriented);

  // Blocks for the next frame. Returns false once the session is over.
  bool Next(ReceivedFrame& frame);
  bool Next(media::RgbFrame& frame) override;

  // Ok after END; otherwise the reason the session stopped.
  Status status() const override { return status_; }

  SessionStateMachine::State state() const { return state_machine_.state(); }
  const SessionStateMachine& state_machine() const { return state_machine_; }

  // Cooperative stop, observed at the next receive boundary (<= 100 ms).
  void Cancel() { cancel_requested_.store(true, std::memory_order_release); }

  ClientStats GetStats() const;

  const format::Metadata& metadata() const { return metadata_; }
  const format::Config& config() const { return session_config_.config; }
  const SessionConfigPayload& session_config() const { return session_config_; }

  // Complete side-channel audio; empty until every AUDIO chunk arrived.
  const std::vector<uint8_t>& audio_data() const { return audio_data_; }
  bool audio_complete() const { return audio_complete_; }

 private:
  void ReceiveStep();
  void HandlePacket(Packet& packet);
  void HandleMetadata(const Packet& packet);
  void HandleConfig(const Packet& packet);
  void HandleAudio(const Packet& packet);
  void IgnoreAudio();
  void HandleEnd(const Packet& packet);
  void BufferPreSync(Packet& packet);

  // Commits a CONFIG and replays the pre-sync buffer.
  void ApplyConfig(const SessionConfigPayload& config);
  // Feeds a FRAME, FRAME_CHUNK or PARITY to the assembler.
  bool HandleStreamData(const Packet& packet);
  // Verifies and decodes completed frames into ready_.
  void DrainAssembler();

  // Malformed packets end connection-oriented sessions and are skipped otherwise.
  void RejectPacket(const Packet& packet, const Status& status);
  void TrackSequence(uint32_t sequence);
  void Terminate(const Status& status, bool ended);
  void PublishMetrics();

  ClientConfig config_;
  std::unique_ptr<ITransport> transport_;
  bool connection_oriented_;
  uint32_t max_consecutive_timeouts_;

  SessionStateMachine state_machine_;
  FrameAssembler assembler_;
  std::unique_ptr<codec::FrameCodec> codec_;
  format::Metadata metadata_;
  SessionConfigPayload session_config_;
  std::optional<SessionConfigPayload> held_config_;

  std::deque<Packet> presync_;
  std::deque<ReceivedFrame> ready_;

  // Keyed by chunk index; holds only chunks that actually arrived.
  std::map<uint32_t, std::vector<uint8_t>> audio_chunks_;
  uint32_t audio_chunk_count_;
  size_t audio_buffered_bytes_;
  uint64_t audio_ignored_;
  std::vector<uint8_t> audio_data_;
  bool audio_complete_;

  bool finished_;
  Status status_;
  std::atomic<bool> cancel_requested_;
  uint32_t consecutive_timeouts_;
  uint32_t waited_ms_;

  bool sequence_anchored_;
  int64_t sequence_max_;
  int64_t sequence_min_;
  uint64_t sequenced_packets_;

  uint32_t metrics_session_id_;

  mutable std::mutex stats_mutex_;
  ClientStats stats_;
  uint64_t verify_failures_;
};

}  // namespace sanchez::stream

#endif  // SANCHEZ_STREAM_STREAM_CLIENT_H_
