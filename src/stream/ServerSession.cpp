// Repository: Sanchez
// Component: Server Session
// Purpose: Streams one shared container over one transport with pacing, parity and announcements.
// Copyright (c) 2025 Sanchez

#include "sanchez/stream/ServerSession.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <utility>

namespace sanchez::stream {

namespace {

constexpr uint64_t kMetricsEveryFrames = 10;

uint16_t EffectiveFecGroupSize(const ServerConfig& config) {
  if (config.satellite_mode && config.fec_group_size == 0) {
    return kDefaultFecGroupSize;
  }
  return config.fec_group_size;
}

}  // namespace

ServerSession::ServerSession(const ServerConfig& config,
                             std::shared_ptr<const format::Container> container,
                             std::shared_ptr<const std::vector<uint8_t>> audio,
                             std::shared_ptr<timing::MasterClock> clock)
    : config_(config),
      container_(std::move(container)),
      clock_(std::move(clock)),
      packetizer_(FramePacketizer::ForMode(config.mode, config.satellite_mode,
                                           EffectiveFecGroupSize(config))),
      audio_cursor_(0),
      next_sequence_(0),
      next_serial_(0),
      frames_since_announce_(0),
      last_send_utc_us_(0),
      halt_(false),
      metrics_session_id_(0) {
  if (audio && !audio->empty()) {
    packetizer_.PacketizeAudio(*audio, audio_packets_);
  }
  if (config_.metrics) {
    metrics_session_id_ = config_.metrics->NextSessionId();
  }
}

ServerSession::~ServerSession() = default;

SessionStats ServerSession::stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

Status ServerSession::Run(ITransport& transport, const std::atomic<bool>& stop) {
  const bool connection_oriented = IsConnectionOriented(config_.mode);
  const format::Config& cfg = container_->config();
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.sessions = 1;
  }

  std::cout << "[ServerSession] Streaming '" << container_->metadata().title << "' ("
            << cfg.frame_count << " frames @ " << cfg.fps << " fps) over "
            << StreamModeToString(config_.mode)
            << (config_.satellite_mode ? " (satellite)" : "") << std::endl;

  const auto fail = [&](const Status& status) {
    std::cerr << "[ServerSession] Session failed: " << status.ToString() << std::endl;
    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      ++stats_.send_errors;
    }
    PublishMetrics(telemetry::SessionPhase::kError);
    return status;
  };

  halt_.store(false, std::memory_order_release);
  keepalive_status_ = Status::Ok();
  last_send_utc_us_ = clock_->now_utc_us();
  PublishMetrics(telemetry::SessionPhase::kSyncing);

  Status status = SendAnnouncement(transport);
  if (!status.ok()) {
    return fail(status);
  }
  PublishMetrics(telemetry::SessionPhase::kStreaming);

  timing::FramePacer pacer(clock_, cfg.fps);
  const auto on_slice = [&]() {
    if (stop.load(std::memory_order_acquire)) {
      halt_.store(true, std::memory_order_release);
      return;
    }
    if (connection_oriented) {
      MaybeSendKeepalive(transport);
    }
  };
  const auto halted = [&]() {
    return stop.load(std::memory_order_acquire) || halt_.load(std::memory_order_acquire);
  };

  uint64_t frame_number = 0;
  bool pass_complete = false;
  while (cfg.frame_count > 0 && !halted() && !(pass_complete && !config_.loop)) {
    audio_cursor_ = 0;
    pass_complete = false;
    for (uint32_t index = 0; index < cfg.frame_count; ++index) {
      if (halted()) {
        break;
      }
      if (config_.realtime_pacing && cfg.fps > 0.0 &&
          !pacer.WaitForFrame(frame_number, halt_, on_slice)) {
        break;
      }
      if (!connection_oriented && config_.announce_interval_frames > 0 &&
          frames_since_announce_ >= config_.announce_interval_frames) {
        status = SendAnnouncement(transport);
        if (!status.ok()) {
          return fail(status);
        }
      }

      status = SendFrame(transport, index);
      if (!status.ok()) {
        return fail(status);
      }
      ++frame_number;
      ++frames_since_announce_;

      status = SendAudioChunk(transport);
      if (!status.ok()) {
        return fail(status);
      }
      if (frame_number % kMetricsEveryFrames == 0) {
        PublishMetrics(telemetry::SessionPhase::kStreaming);
      }
      pass_complete = index + 1 == cfg.frame_count;
    }
  }

  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.late_frames = pacer.late_frames();
  }
  if (!keepalive_status_.ok()) {
    return fail(keepalive_status_);
  }

  if (!connection_oriented) {
    status = SendAnnouncement(transport);
    if (!status.ok()) {
      return fail(status);
    }
  }
  status = SendEnd(transport);
  if (!status.ok()) {
    return fail(status);
  }

  const SessionStats summary = stats();
  std::cout << "[ServerSession] Finished: frames=" << summary.frames_sent
            << " packets=" << summary.packets_sent << " parity=" << summary.parity_packets_sent
            << " late=" << summary.late_frames << std::endl;
  PublishMetrics(telemetry::SessionPhase::kEnded);
  return Status::Ok();
}

Status ServerSession::SendPacket(ITransport& transport, Packet& packet) {
  packet.sequence = next_sequence_++;
  Status status = transport.Send(packet);
  if (!status.ok()) {
    return status;
  }
  last_send_utc_us_ = clock_->now_utc_us();

  std::lock_guard<std::mutex> lock(stats_mutex_);
  ++stats_.packets_sent;
  stats_.bytes_sent += packet.wire_size();
  switch (packet.type) {
    case PacketType::kParity:
      ++stats_.parity_packets_sent;
      break;
    case PacketType::kAudio:
      ++stats_.audio_packets_sent;
      break;
    case PacketType::kKeepalive:
      ++stats_.keepalives_sent;
      break;
    case PacketType::kHello:
    case PacketType::kMetadata:
    case PacketType::kConfig:
    case PacketType::kFrame:
    case PacketType::kFrameChunk:
    case PacketType::kEnd:
      break;
  }
  return Status::Ok();
}

Status ServerSession::SendAnnouncement(ITransport& transport) {
  Packet metadata;
  metadata.type = PacketType::kMetadata;
  EncodeMetadataPayload(container_->metadata(), metadata.payload);
  Status status = SendPacket(transport, metadata);
  if (!status.ok()) {
    return status;
  }

  SessionConfigPayload session_config;
  session_config.config = container_->config();
  session_config.fec_group_size = packetizer_.fec_group_size();
  session_config.max_chunk_payload = static_cast<uint16_t>(packetizer_.chunk_data_size());
  session_config.satellite_mode = config_.satellite_mode;
  session_config.next_frame_serial = next_serial_;

  Packet config;
  config.type = PacketType::kConfig;
  EncodeSessionConfig(session_config, config.payload);
  status = SendPacket(transport, config);
  if (status.ok()) {
    frames_since_announce_ = 0;
  }
  return status;
}

Status ServerSession::SendFrame(ITransport& transport, uint32_t frame_index) {
  std::vector<uint8_t> stored;
  Status status = container_->GetStoredFrame(frame_index, stored);
  if (!status.ok()) {
    return status;
  }
  if (!packetizer_.CanCarry(stored.size())) {
    return Status(ErrorCode::kInvalidFormat,
                  "frame " + std::to_string(frame_index) + " is too large to packetize");
  }

  const format::FrameRecord& record = container_->record(frame_index);
  FrameDescriptor descriptor;
  descriptor.frame_serial = next_serial_;
  descriptor.frame_index = frame_index;
  descriptor.raw_length = record.raw_length;
  descriptor.checksum = record.checksum;

  std::vector<Packet> packets;
  packetizer_.Packetize(descriptor, stored, packets);

  const auto started = std::chrono::steady_clock::now();
  for (Packet& packet : packets) {
    status = SendPacket(transport, packet);
    if (!status.ok()) {
      break;
    }
  }
  const double elapsed_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started)
          .count();
  if (config_.metrics) {
    config_.metrics->RecordSendLatency(telemetry::SessionRole::kServer, status.ok(), elapsed_ms);
  }
  if (!status.ok()) {
    return status;
  }

  ++next_serial_;
  std::lock_guard<std::mutex> lock(stats_mutex_);
  ++stats_.frames_sent;
  return Status::Ok();
}

Status ServerSession::SendAudioChunk(ITransport& transport) {
  if (audio_cursor_ >= audio_packets_.size()) {
    return Status::Ok();
  }
  Packet packet = audio_packets_[audio_cursor_++];
  return SendPacket(transport, packet);
}

Status ServerSession::SendEnd(ITransport& transport) {
  uint32_t repeat = 1;
  switch (config_.mode) {
    case StreamMode::kTcpUnicast:
      break;
    case StreamMode::kUdpUnicast:
      repeat = std::max<uint32_t>(config_.end_repeat, 1);
      break;
    case StreamMode::kUdpMulticast:
    case StreamMode::kUdpBroadcast:
      // No reliable end-of-stream for a dynamic receiver set.
      return Status::Ok();
  }

  EndPayload end;
  end.frame_serial_end = next_serial_;
  for (uint32_t i = 0; i < repeat; ++i) {
    Packet packet;
    packet.type = PacketType::kEnd;
    EncodeEnd(end, packet.payload);
    Status status = SendPacket(transport, packet);
    if (!status.ok()) {
      return status;
    }
  }
  return Status::Ok();
}

void ServerSession::MaybeSendKeepalive(ITransport& transport) {
  if (config_.keepalive_interval_ms == 0 || !keepalive_status_.ok()) {
    return;
  }
  const int64_t idle_us = clock_->now_utc_us() - last_send_utc_us_;
  if (idle_us < static_cast<int64_t>(config_.keepalive_interval_ms) * 1000) {
    return;
  }

  Packet packet;
  packet.type = PacketType::kKeepalive;
  Status status = SendPacket(transport, packet);
  if (!status.ok()) {
    keepalive_status_ = status;
    halt_.store(true, std::memory_order_release);
  }
}

void ServerSession::PublishMetrics(telemetry::SessionPhase phase) {
  if (!config_.metrics) {
    return;
  }
  const SessionStats snapshot = stats();
  telemetry::SessionMetrics metrics;
  metrics.role = telemetry::SessionRole::kServer;
  metrics.phase = phase;
  metrics.mode = StreamModeToString(config_.mode);
  metrics.packets_total = snapshot.packets_sent;
  metrics.frames_total = snapshot.frames_sent;
  metrics.bytes_total = snapshot.bytes_sent;
  metrics.parity_packets_total = snapshot.parity_packets_sent;
  metrics.errors_total = snapshot.send_errors;
  config_.metrics->SubmitSessionMetrics(metrics_session_id_, metrics);
}

}  // namespace sanchez::stream
