// Repository: Sanchez
// Component: Stream Configuration
// Purpose: Transport modes, payload budgets and server/client settings.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_STREAM_STREAM_CONFIG_H_
#define SANCHEZ_STREAM_STREAM_CONFIG_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace sanchez::telemetry {
class MetricsExporter;
}

namespace sanchez::stream {

enum class StreamMode {
  kTcpUnicast,
  kUdpUnicast,
  kUdpMulticast,
  kUdpBroadcast,
};

const char* StreamModeToString(StreamMode mode);

// TCP is the only connection-oriented mode.
bool IsConnectionOriented(StreamMode mode);

// Largest packet (header included) each mode sends in one piece.
constexpr size_t kTcpSafePacketSize = 1024 * 1024;
constexpr size_t kUdpSafePacketSize = 1400;
constexpr size_t kSatelliteSafePacketSize = 512;
// chunk_size travels as u16.
constexpr size_t kMaxChunkData = 65000;

constexpr uint16_t kDefaultFecGroupSize = 4;
constexpr size_t kPreSyncWindowPackets = 512;
constexpr size_t kMaxPendingFrames = 64;

size_t SafePacketSize(StreamMode mode, bool satellite_mode);
// Largest stored frame that still goes out as a single FRAME packet.
size_t MaxSingleFramePayload(StreamMode mode, bool satellite_mode);
// Data bytes per FRAME_CHUNK / PARITY / AUDIO packet.
size_t ChunkDataSize(StreamMode mode, bool satellite_mode);

// ServerConfig
struct ServerConfig {
  StreamMode mode = StreamMode::kTcpUnicast;
  // TCP: bind address ("" or "0.0.0.0" = any). UDP: destination address
  // (unicast host, multicast group or broadcast address).
  std::string host = "0.0.0.0";
  uint16_t port = 9999;  // 0 = ephemeral (TCP).
  bool loop = false;
  bool satellite_mode = false;
  uint16_t fec_group_size = kDefaultFecGroupSize;
  std::string audio_path;  // Optional side-channel file.
  bool realtime_pacing = true;
  uint32_t announce_interval_frames = 30;
  uint32_t keepalive_interval_ms = 1000;
  int multicast_ttl = 4;
  uint32_t end_repeat = 3;
  uint32_t max_sessions = 8;
  std::shared_ptr<telemetry::MetricsExporter> metrics;
};

// ClientConfig
struct ClientConfig {
  StreamMode mode = StreamMode::kTcpUnicast;
  uint32_t receive_timeout_ms = 1000;
  // Consecutive receive timeouts before DISCONNECTED; 0 = unlimited.
  // Negative selects the mode default (TCP 5, UDP unlimited).
  int max_consecutive_timeouts = -1;
  std::string client_name = "sanchez-client";
  // Multicast interface address for the group join ("" = any).
  std::string multicast_interface;
  std::shared_ptr<telemetry::MetricsExporter> metrics;
};

}  // namespace sanchez::stream

#endif  // SANCHEZ_STREAM_STREAM_CONFIG_H_
