// Repository: Sanchez
// Component: Stream Client
// Purpose: Receives a stream, synchronizes on METADATA/CONFIG and yields decoded frames.
// Copyright (c) 2025 Sanchez

#include "sanchez/stream/StreamClient.h"

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>

#include "sanchez/format/ByteOrder.h"
#include "sanchez/stream/TcpTransport.h"
#include "sanchez/stream/UdpTransport.h"
#include "sanchez/telemetry/MetricsExporter.h"

namespace sanchez::stream {

namespace {

constexpr uint32_t kReceiveSliceMs = 100;
constexpr uint32_t kConnectTimeoutMs = 5000;
constexpr uint32_t kTcpDefaultMaxTimeouts = 5;
constexpr uint64_t kMetricsEveryFrames = 10;

bool IsFrameBearing(PacketType type) {
  return type == PacketType::kFrame || type == PacketType::kFrameChunk ||
         type == PacketType::kParity;
}

// Serial carried by a frame-bearing payload (both layouts start with it).
bool PeekFrameSerial(const Packet& packet, uint32_t& serial) {
  if (!IsFrameBearing(packet.type) || packet.payload.size() < 4) {
    return false;
  }
  format::ByteReader reader(packet.payload.data(), packet.payload.size());
  return reader.GetU32(serial);
}

}  // namespace

StreamClient::StreamClient(const ClientConfig& config)
    : config_(config),
      connection_oriented_(IsConnectionOriented(config.mode)),
      max_consecutive_timeouts_(0),
      audio_chunk_count_(0),
      audio_buffered_bytes_(0),
      audio_ignored_(0),
      audio_complete_(false),
      finished_(false),
      cancel_requested_(false),
      consecutive_timeouts_(0),
      waited_ms_(0),
      sequence_anchored_(false),
      sequence_max_(0),
      sequence_min_(0),
      sequenced_packets_(0),
      metrics_session_id_(0),
      verify_failures_(0) {
  if (config_.metrics) {
    metrics_session_id_ = config_.metrics->NextSessionId();
  }
}

StreamClient::~StreamClient() {
  if (transport_) {
    transport_->Close();
  }
}

Status StreamClient::ReceiveStream(const std::string& host, uint16_t port) {
  if (IsConnectionOriented(config_.mode)) {
    std::unique_ptr<TcpTransport> tcp;
    Status status = TcpTransport::Connect(host, port, kConnectTimeoutMs, tcp);
    if (!status.ok()) {
      std::cerr << "[StreamClient] Connect to " << host << ":" << port << " failed: "
                << status.ToString() << std::endl;
      Terminate(status, false);
      return status;
    }

    HelloPayload hello;
    hello.client_name = config_.client_name;
    Packet packet;
    packet.type = PacketType::kHello;
    EncodeHello(hello, packet.payload);
    status = tcp->Send(packet);
    if (!status.ok()) {
      std::cerr << "[StreamClient] HELLO failed: " << status.ToString() << std::endl;
      Terminate(status, false);
      return status;
    }
    std::cout << "[StreamClient] Connected to " << tcp->peer() << std::endl;
    Attach(std::move(tcp), true);
    return Status::Ok();
  }

  std::unique_ptr<UdpTransport> udp;
  Status status =
      UdpTransport::OpenReceiver(config_.mode, host, port, config_.multicast_interface, udp);
  if (!status.ok()) {
    std::cerr << "[StreamClient] Cannot receive " << StreamModeToString(config_.mode) << " on "
              << host << ":" << port << ": " << status.ToString() << std::endl;
    Terminate(status, false);
    return status;
  }
  std::cout << "[StreamClient] Receiving " << StreamModeToString(config_.mode) << " on port "
            << udp->local_port() << std::endl;
  Attach(std::move(udp), false);
  return Status::Ok();
}

void StreamClient::Attach(std::unique_ptr<ITransport> transport, bool connection_oriented) {
  transport_ = std::move(transport);
  connection_oriented_ = connection_oriented;
  if (config_.max_consecutive_timeouts >= 0) {
    max_consecutive_timeouts_ = static_cast<uint32_t>(config_.max_consecutive_timeouts);
  } else {
    max_consecutive_timeouts_ = connection_oriented ? kTcpDefaultMaxTimeouts : 0;
  }
  PublishMetrics();
}

bool StreamClient::Next(ReceivedFrame& frame) {
  while (true) {
    if (!ready_.empty()) {
      frame = std::move(ready_.front());
      ready_.pop_front();
      return true;
    }
    if (finished_) {
      return false;
    }
    if (cancel_requested_.load(std::memory_order_acquire)) {
      Terminate(Status(ErrorCode::kCancelled, "receive cancelled by caller"), false);
      continue;
    }
    ReceiveStep();
  }
}

bool StreamClient::Next(media::RgbFrame& frame) {
  ReceivedFrame received;
  if (!Next(received)) {
    return false;
  }
  frame.index = received.frame_index;
  frame.width = received.width;
  frame.height = received.height;
  frame.data = std::move(received.data);
  return true;
}

ClientStats StreamClient::GetStats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

void StreamClient::ReceiveStep() {
  if (!transport_) {
    Terminate(Status(ErrorCode::kDisconnected, "no transport attached"), false);
    return;
  }

  const uint32_t slice = std::min(std::max<uint32_t>(config_.receive_timeout_ms, 1),
                                  kReceiveSliceMs);
  Packet packet;
  Status status = transport_->Receive(packet, slice);

  if (status.code() == ErrorCode::kTimeout) {
    waited_ms_ += slice;
    if (waited_ms_ < config_.receive_timeout_ms) {
      return;
    }
    waited_ms_ = 0;
    ++consecutive_timeouts_;
    if (max_consecutive_timeouts_ > 0 && consecutive_timeouts_ >= max_consecutive_timeouts_) {
      Terminate(Status(ErrorCode::kDisconnected,
                       std::to_string(consecutive_timeouts_) + " consecutive receive timeouts"),
                false);
    }
    return;
  }
  if (status.code() == ErrorCode::kInvalidFormat) {
    RejectPacket(packet, status);
    return;
  }
  if (!status.ok()) {
    const ErrorCode code =
        status.code() == ErrorCode::kIOError ? ErrorCode::kIOError : ErrorCode::kDisconnected;
    Terminate(Status(code, status.message()), false);
    return;
  }

  consecutive_timeouts_ = 0;
  waited_ms_ = 0;
  TrackSequence(packet.sequence);
  HandlePacket(packet);
}

void StreamClient::TrackSequence(uint32_t sequence) {
  int64_t key = sequence;
  if (sequence_anchored_) {
    key = sequence_max_ + static_cast<int32_t>(sequence - static_cast<uint32_t>(sequence_max_));
  } else {
    sequence_anchored_ = true;
    sequence_min_ = key;
    sequence_max_ = key;
  }
  sequence_min_ = std::min(sequence_min_, key);
  sequence_max_ = std::max(sequence_max_, key);
  ++sequenced_packets_;

  const uint64_t span = static_cast<uint64_t>(sequence_max_ - sequence_min_ + 1);
  std::lock_guard<std::mutex> lock(stats_mutex_);
  ++stats_.packets_received;
  stats_.packets_lost_estimate = span > sequenced_packets_ ? span - sequenced_packets_ : 0;
}

void StreamClient::HandlePacket(Packet& packet) {
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.bytes_received += packet.wire_size();
  }

  switch (packet.type) {
    case PacketType::kHello:
    case PacketType::kKeepalive:
      return;
    case PacketType::kMetadata:
      HandleMetadata(packet);
      return;
    case PacketType::kConfig:
      HandleConfig(packet);
      return;
    case PacketType::kFrame:
    case PacketType::kFrameChunk:
    case PacketType::kParity:
      if (!state_machine_.synchronized()) {
        BufferPreSync(packet);
        return;
      }
      HandleStreamData(packet);
      return;
    case PacketType::kAudio:
      HandleAudio(packet);
      return;
    case PacketType::kEnd:
      HandleEnd(packet);
      return;
  }
}

void StreamClient::HandleMetadata(const Packet& packet) {
  format::Metadata metadata;
  Status status = DecodeMetadataPayload(packet.payload, metadata);
  if (!status.ok()) {
    RejectPacket(packet, status);
    return;
  }

  const bool first = state_machine_.state() == SessionStateMachine::State::kAwaitingMetadata;
  state_machine_.OnMetadata();
  if (!first) {
    return;
  }
  metadata_ = std::move(metadata);
  std::cout << "[StreamClient] METADATA: '" << metadata_.title << "' by '" << metadata_.creator
            << "'" << std::endl;

  if (held_config_) {
    SessionConfigPayload held = *held_config_;
    held_config_.reset();
    ApplyConfig(held);
  }
}

void StreamClient::HandleConfig(const Packet& packet) {
  SessionConfigPayload config;
  Status status = DecodeSessionConfig(packet.payload, config);
  if (!status.ok()) {
    RejectPacket(packet, status);
    return;
  }

  switch (state_machine_.state()) {
    case SessionStateMachine::State::kAwaitingMetadata:
      held_config_ = config;
      return;
    case SessionStateMachine::State::kAwaitingConfig:
      ApplyConfig(config);
      return;
    case SessionStateMachine::State::kStreaming:
      state_machine_.OnConfig();
      return;
    case SessionStateMachine::State::kEnded:
    case SessionStateMachine::State::kDisconnected:
      return;
  }
}

void StreamClient::ApplyConfig(const SessionConfigPayload& config) {
  session_config_ = config;
  codec_ = std::make_unique<codec::FrameCodec>(config.config.compression_enabled);
  assembler_.SetFecGroupSize(config.fec_group_size);
  const size_t raw_frame_size = config.config.raw_frame_size();
  assembler_.SetFrameLimits(raw_frame_size, codec_->MaxStoredSize(raw_frame_size));
  state_machine_.OnConfig();

  std::cout << "[StreamClient] CONFIG: " << config.config.width << "x" << config.config.height
            << " @ " << config.config.fps << " fps, " << config.config.frame_count
            << " frames, fec=" << config.fec_group_size
            << (config.satellite_mode ? " (satellite)" : "") << std::endl;

  // Buffered frames anchor the sequence at the oldest serial they carry.
  bool have_serial = false;
  uint32_t oldest = 0;
  for (const Packet& buffered : presync_) {
    uint32_t serial = 0;
    if (PeekFrameSerial(buffered, serial) && (!have_serial || SequenceLess(serial, oldest))) {
      oldest = serial;
      have_serial = true;
    }
  }
  assembler_.SetExpectedSerial(have_serial ? oldest : config.next_frame_serial);

  std::deque<Packet> replay;
  replay.swap(presync_);
  uint64_t rejected = 0;
  for (const Packet& buffered : replay) {
    if (!HandleStreamData(buffered)) {
      ++rejected;
    }
  }
  if (rejected > 0) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.presync_discarded += rejected;
  }
  PublishMetrics();
}

void StreamClient::BufferPreSync(Packet& packet) {
  if (presync_.size() >= kPreSyncWindowPackets) {
    if (connection_oriented_) {
      Terminate(Status(ErrorCode::kSessionDesync,
                       "no METADATA/CONFIG within " + std::to_string(kPreSyncWindowPackets) +
                           " packets"),
                false);
      return;
    }
    presync_.pop_front();
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.presync_discarded;
  }
  presync_.push_back(std::move(packet));
}

bool StreamClient::HandleStreamData(const Packet& packet) {
  bool accepted = false;
  switch (packet.type) {
    case PacketType::kFrame: {
      FramePayload frame;
      Status status = DecodeFrame(packet.payload, frame);
      if (!status.ok()) {
        RejectPacket(packet, status);
        return false;
      }
      accepted = assembler_.AddFrame(frame);
      break;
    }
    case PacketType::kFrameChunk:
    case PacketType::kParity: {
      ChunkPayload chunk;
      Status status = DecodeChunk(packet.payload, chunk);
      if (!status.ok()) {
        RejectPacket(packet, status);
        return false;
      }
      accepted = packet.type == PacketType::kParity ? assembler_.AddParity(chunk)
                                                     : assembler_.AddChunk(chunk);
      break;
    }
    case PacketType::kHello:
    case PacketType::kMetadata:
    case PacketType::kConfig:
    case PacketType::kAudio:
    case PacketType::kEnd:
    case PacketType::kKeepalive:
      return false;
  }
  DrainAssembler();
  return accepted;
}

void StreamClient::DrainAssembler() {
  if (!codec_) {
    return;
  }
  const format::Config& cfg = session_config_.config;
  AssembledFrame assembled;
  uint64_t delivered = 0;
  while (assembler_.PopCompleted(assembled)) {
    if (codec::FrameCodec::Checksum(assembled.stored.data(), assembled.stored.size()) !=
        assembled.checksum) {
      std::cerr << "[StreamClient] Checksum mismatch on frame serial " << assembled.frame_serial
                << std::endl;
      ++verify_failures_;
      continue;
    }

    ReceivedFrame frame;
    Status status = codec_->Decompress(assembled.stored.data(), assembled.stored.size(),
                                       assembled.raw_length, frame.data);
    if (!status.ok() || frame.data.size() != cfg.raw_frame_size()) {
      std::cerr << "[StreamClient] Cannot decode frame serial " << assembled.frame_serial << ": "
                << (status.ok() ? "unexpected frame size" : status.ToString()) << std::endl;
      ++verify_failures_;
      continue;
    }
    frame.frame_serial = assembled.frame_serial;
    frame.frame_index = assembled.frame_index;
    frame.width = cfg.width;
    frame.height = cfg.height;
    ready_.push_back(std::move(frame));
    ++delivered;
  }

  uint64_t frames_received = 0;
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.frames_received += delivered;
    stats_.frames_dropped = assembler_.frames_dropped() + verify_failures_;
    stats_.parity_recoveries = assembler_.parity_recoveries();
    stats_.ignored_packets = assembler_.ignored_packets() + audio_ignored_;
    frames_received = stats_.frames_received;
  }
  if (delivered > 0 && frames_received % kMetricsEveryFrames < delivered) {
    PublishMetrics();
  }
}

void StreamClient::HandleAudio(const Packet& packet) {
  AudioPayload audio;
  Status status = DecodeAudio(packet.payload, audio);
  if (!status.ok()) {
    RejectPacket(packet, status);
    return;
  }
  if (audio_complete_) {
    return;
  }
  if (audio.data.empty() || audio.chunk_count > kMaxAudioBytes) {
    RejectPacket(packet, Status(ErrorCode::kInvalidFormat,
                                "audio chunk count " + std::to_string(audio.chunk_count) +
                                    " exceeds the audio size limit"));
    return;
  }
  if (audio_chunk_count_ == 0) {
    audio_chunk_count_ = audio.chunk_count;
  }
  if (audio.chunk_count != audio_chunk_count_) {
    IgnoreAudio();
    return;
  }
  if (audio_chunks_.count(audio.chunk_index) > 0) {
    return;
  }
  if (audio.data.size() > kMaxAudioBytes - audio_buffered_bytes_) {
    RejectPacket(packet, Status(ErrorCode::kInvalidFormat,
                                "audio exceeds " + std::to_string(kMaxAudioBytes) + " bytes"));
    return;
  }

  audio_buffered_bytes_ += audio.data.size();
  audio_chunks_[audio.chunk_index] = std::move(audio.data);
  if (audio_chunks_.size() < audio_chunk_count_) {
    return;
  }

  audio_data_.reserve(audio_buffered_bytes_);
  for (const auto& chunk : audio_chunks_) {
    audio_data_.insert(audio_data_.end(), chunk.second.begin(), chunk.second.end());
  }
  audio_chunks_.clear();
  audio_buffered_bytes_ = 0;
  audio_complete_ = true;
  std::cout << "[StreamClient] Audio complete: " << audio_data_.size() << " bytes" << std::endl;
}

void StreamClient::IgnoreAudio() {
  ++audio_ignored_;
  std::lock_guard<std::mutex> lock(stats_mutex_);
  stats_.ignored_packets = assembler_.ignored_packets() + audio_ignored_;
}

void StreamClient::HandleEnd(const Packet& packet) {
  EndPayload end;
  Status status = DecodeEnd(packet.payload, end);
  if (!status.ok()) {
    RejectPacket(packet, status);
    return;
  }
  if (state_machine_.synchronized()) {
    assembler_.Finish(end.frame_serial_end);
    DrainAssembler();
  }
  Terminate(Status::Ok(), true);
}

void StreamClient::RejectPacket(const Packet& packet, const Status& status) {
  std::cerr << "[StreamClient] Malformed " << PacketTypeToString(packet.type)
            << " packet: " << status.ToString() << std::endl;
  if (connection_oriented_) {
    Terminate(Status(ErrorCode::kInvalidFormat, status.message()), false);
  }
}

void StreamClient::Terminate(const Status& status, bool ended) {
  if (finished_) {
    return;
  }
  finished_ = true;
  status_ = status;

  if (ended) {
    state_machine_.OnEnd();
  } else {
    state_machine_.OnDisconnect();
  }

  DrainAssembler();
  assembler_.Abandon();
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.frames_dropped = assembler_.frames_dropped() + verify_failures_;
    stats_.presync_discarded += presync_.size();
  }
  presync_.clear();

  if (transport_) {
    transport_->Close();
  }

  const ClientStats stats = GetStats();
  if (status.ok()) {
    std::cout << "[StreamClient] Session ended: received=" << stats.frames_received
              << " dropped=" << stats.frames_dropped
              << " recovered=" << stats.parity_recoveries << std::endl;
  } else {
    std::cerr << "[StreamClient] Session stopped: " << status.ToString()
              << " (received=" << stats.frames_received << " dropped=" << stats.frames_dropped
              << ")" << std::endl;
  }
  PublishMetrics();
}

void StreamClient::PublishMetrics() {
  if (!config_.metrics) {
    return;
  }
  const ClientStats stats = GetStats();
  telemetry::SessionMetrics metrics;
  metrics.role = telemetry::SessionRole::kClient;
  switch (state_machine_.state()) {
    case SessionStateMachine::State::kAwaitingMetadata:
    case SessionStateMachine::State::kAwaitingConfig:
      metrics.phase = telemetry::SessionPhase::kSyncing;
      break;
    case SessionStateMachine::State::kStreaming:
      metrics.phase = telemetry::SessionPhase::kStreaming;
      break;
    case SessionStateMachine::State::kEnded:
      metrics.phase = telemetry::SessionPhase::kEnded;
      break;
    case SessionStateMachine::State::kDisconnected:
      metrics.phase = status_.code() == ErrorCode::kCancelled ? telemetry::SessionPhase::kEnded
                                                               : telemetry::SessionPhase::kError;
      break;
  }
  metrics.mode = StreamModeToString(config_.mode);
  metrics.packets_total = stats.packets_received;
  metrics.frames_total = stats.frames_received;
  metrics.bytes_total = stats.bytes_received;
  metrics.frames_dropped_total = stats.frames_dropped;
  metrics.packets_lost_estimate = stats.packets_lost_estimate;
  metrics.parity_recoveries_total = stats.parity_recoveries;
  metrics.errors_total = status_.ok() ? 0 : 1;
  config_.metrics->SubmitSessionMetrics(metrics_session_id_, metrics);
}

}  // namespace sanchez::stream
