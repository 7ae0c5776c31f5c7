// Repository: Sanchez
// Component: Stream Configuration
// Purpose: Transport modes, payload budgets and server/client settings.
// Copyright (c) 2025 Sanchez

#include "sanchez/stream/StreamConfig.h"

#include <algorithm>

#include "sanchez/stream/Packet.h"

namespace sanchez::stream {

const char* StreamModeToString(StreamMode mode) {
  switch (mode) {
    case StreamMode::kTcpUnicast:
      return "tcp";
    case StreamMode::kUdpUnicast:
      return "udp";
    case StreamMode::kUdpMulticast:
      return "multicast";
    case StreamMode::kUdpBroadcast:
      return "broadcast";
  }
  return "unknown";
}

bool IsConnectionOriented(StreamMode mode) {
  switch (mode) {
    case StreamMode::kTcpUnicast:
      return true;
    case StreamMode::kUdpUnicast:
    case StreamMode::kUdpMulticast:
    case StreamMode::kUdpBroadcast:
      return false;
  }
  return false;
}

size_t SafePacketSize(StreamMode mode, bool satellite_mode) {
  if (satellite_mode) {
    return kSatelliteSafePacketSize;
  }
  return IsConnectionOriented(mode) ? kTcpSafePacketSize : kUdpSafePacketSize;
}

size_t MaxSingleFramePayload(StreamMode mode, bool satellite_mode) {
  return SafePacketSize(mode, satellite_mode) - kPacketHeaderSize - kFrameHeaderSize;
}

size_t ChunkDataSize(StreamMode mode, bool satellite_mode) {
  const size_t budget = SafePacketSize(mode, satellite_mode) - kPacketHeaderSize - kChunkHeaderSize;
  return std::min(budget, kMaxChunkData);
}

}  // namespace sanchez::stream
