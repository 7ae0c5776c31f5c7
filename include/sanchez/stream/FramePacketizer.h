// Repository: Sanchez
// Component: Frame Packetizer
// Purpose: Splits stored frames and audio into FRAME, FRAME_CHUNK, PARITY and AUDIO packets.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_STREAM_FRAME_PACKETIZER_H_
#define SANCHEZ_STREAM_FRAME_PACKETIZER_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "sanchez/stream/Packet.h"
#include "sanchez/stream/StreamConfig.h"

namespace sanchez::stream {

// Identity of one transmitted frame.
struct FrameDescriptor {
  uint32_t frame_serial = 0;
  uint32_t frame_index = 0;
  uint32_t raw_length = 0;
  uint32_t checksum = 0;
};

// FramePacketizer produces packets with sequence 0; the session stamps
// sequence numbers as it sends them.
//
// A frame goes out as one FRAME packet when it fits max_single_frame and
// chunking is not forced; otherwise as FRAME_CHUNKs of chunk_data_size bytes
// in chunk order. With fec_group_size > 0 every group of that many chunks
// (the last may be shorter) is followed by one PARITY packet.
class FramePacketizer {
 public:
  FramePacketizer(size_t max_single_frame, size_t chunk_data_size, bool always_chunk,
                  uint16_t fec_group_size);

  // Budgets for a transport mode. Satellite mode always chunks and adds parity.
  static FramePacketizer ForMode(StreamMode mode, bool satellite_mode, uint16_t fec_group_size);

  void Packetize(const FrameDescriptor& frame, const std::vector<uint8_t>& stored,
                 std::vector<Packet>& out) const;

  // Every AUDIO packet of the side-channel file, in chunk order.
  void PacketizeAudio(const std::vector<uint8_t>& audio, std::vector<Packet>& out) const;

  // chunk_count travels as u16.
  bool CanCarry(size_t stored_size) const {
    return stored_size > 0 && (stored_size + chunk_data_size_ - 1) / chunk_data_size_ <= 0xFFFF;
  }

  size_t chunk_data_size() const { return chunk_data_size_; }
  uint16_t fec_group_size() const { return fec_group_size_; }

  // acc[i] ^= data[i]; acc must be at least size long.
  static void XorInto(std::vector<uint8_t>& acc, const uint8_t* data, size_t size);

 private:
  size_t max_single_frame_;
  size_t chunk_data_size_;
  bool always_chunk_;
  uint16_t fec_group_size_;
};

}  // namespace sanchez::stream

#endif  // SANCHEZ_STREAM_FRAME_PACKETIZER_H_
