// Repository: Sanchez
// Component: Frame Packetizer
// Purpose: Splits stored frames and audio into FRAME, FRAME_CHUNK, PARITY and AUDIO packets.
// Copyright (c) 2025 Sanchez

#include "sanchez/stream/FramePacketizer.h"

#include <algorithm>
#include <utility>

namespace sanchez::stream {

FramePacketizer::FramePacketizer(size_t max_single_frame, size_t chunk_data_size,
                                 bool always_chunk, uint16_t fec_group_size)
    : max_single_frame_(max_single_frame),
      chunk_data_size_(std::min<size_t>(std::max<size_t>(chunk_data_size, 1), kMaxChunkData)),
      always_chunk_(always_chunk),
      fec_group_size_(fec_group_size) {}

FramePacketizer FramePacketizer::ForMode(StreamMode mode, bool satellite_mode,
                                         uint16_t fec_group_size) {
  return FramePacketizer(MaxSingleFramePayload(mode, satellite_mode),
                         ChunkDataSize(mode, satellite_mode),
                         satellite_mode,
                         satellite_mode ? fec_group_size : 0);
}

void FramePacketizer::XorInto(std::vector<uint8_t>& acc, const uint8_t* data, size_t size) {
  for (size_t i = 0; i < size; ++i) {
    acc[i] ^= data[i];
  }
}

void FramePacketizer::Packetize(const FrameDescriptor& frame,
                                const std::vector<uint8_t>& stored,
                                std::vector<Packet>& out) const {
  if (!always_chunk_ && stored.size() <= max_single_frame_) {
    FramePayload payload;
    payload.frame_serial = frame.frame_serial;
    payload.frame_index = frame.frame_index;
    payload.raw_length = frame.raw_length;
    payload.checksum = frame.checksum;
    payload.data = stored;

    Packet packet;
    packet.type = PacketType::kFrame;
    EncodeFrame(payload, packet.payload);
    out.push_back(std::move(packet));
    return;
  }

  const size_t chunk_count = (stored.size() + chunk_data_size_ - 1) / chunk_data_size_;
  ChunkPayload chunk;
  chunk.frame_serial = frame.frame_serial;
  chunk.frame_index = frame.frame_index;
  chunk.chunk_count = static_cast<uint16_t>(chunk_count);
  chunk.chunk_size = static_cast<uint16_t>(chunk_data_size_);
  chunk.stored_length = static_cast<uint32_t>(stored.size());
  chunk.raw_length = frame.raw_length;
  chunk.checksum = frame.checksum;

  std::vector<uint8_t> parity;
  size_t group_members = 0;
  uint16_t group_index = 0;

  for (size_t i = 0; i < chunk_count; ++i) {
    const size_t begin = i * chunk_data_size_;
    const size_t size = std::min(chunk_data_size_, stored.size() - begin);

    chunk.chunk_index = static_cast<uint16_t>(i);
    chunk.data.assign(stored.begin() + static_cast<std::ptrdiff_t>(begin),
                      stored.begin() + static_cast<std::ptrdiff_t>(begin + size));
    Packet packet;
    packet.type = PacketType::kFrameChunk;
    EncodeChunk(chunk, packet.payload);
    out.push_back(std::move(packet));

    if (fec_group_size_ == 0) {
      continue;
    }
    if (group_members == 0) {
      parity.assign(chunk_data_size_, 0);
    }
    XorInto(parity, stored.data() + begin, size);
    ++group_members;

    if (group_members == fec_group_size_ || i + 1 == chunk_count) {
      ChunkPayload parity_payload = chunk;
      parity_payload.chunk_index = group_index++;
      parity_payload.data = parity;
      Packet parity_packet;
      parity_packet.type = PacketType::kParity;
      EncodeChunk(parity_payload, parity_packet.payload);
      out.push_back(std::move(parity_packet));
      group_members = 0;
    }
  }
}

void FramePacketizer::PacketizeAudio(const std::vector<uint8_t>& audio,
                                     std::vector<Packet>& out) const {
  if (audio.empty()) {
    return;
  }
  const size_t chunk_count = (audio.size() + chunk_data_size_ - 1) / chunk_data_size_;
  for (size_t i = 0; i < chunk_count; ++i) {
    const size_t begin = i * chunk_data_size_;
    const size_t size = std::min(chunk_data_size_, audio.size() - begin);

    AudioPayload payload;
    payload.chunk_index = static_cast<uint32_t>(i);
    payload.chunk_count = static_cast<uint32_t>(chunk_count);
    payload.data.assign(audio.begin() + static_cast<std::ptrdiff_t>(begin),
                        audio.begin() + static_cast<std::ptrdiff_t>(begin + size));

    Packet packet;
    packet.type = PacketType::kAudio;
    EncodeAudio(payload, packet.payload);
    out.push_back(std::move(packet));
  }
}

}  // namespace sanchez::stream
