// Repository: Sanchez
// Component: Packet Model
// Purpose: Wire packet types, header framing and payload codecs shared by server and client.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_STREAM_PACKET_H_
#define SANCHEZ_STREAM_PACKET_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "sanchez/core/Status.h"
#include "sanchez/format/ContainerTypes.h"

namespace sanchez::stream {

enum class PacketType : uint8_t {
  kHello = 1,
  kMetadata = 2,
  kConfig = 3,
  kFrame = 4,
  kFrameChunk = 5,
  kParity = 6,
  kAudio = 7,
  kEnd = 8,
  kKeepalive = 9,
};

const char* PacketTypeToString(PacketType type);

constexpr uint16_t kProtocolVersion = 1;

// type:u8 + sequence:u32
constexpr size_t kPacketHeaderSize = 1 + 4;
// TCP length prefix.
constexpr size_t kLengthPrefixSize = 4;
constexpr size_t kMaxPacketSize = 16 * 1024 * 1024;
// Largest side-channel audio file a session carries.
constexpr size_t kMaxAudioBytes = 256 * 1024 * 1024;

// Fixed parts of the frame-bearing payloads.
constexpr size_t kFrameHeaderSize = 4 * 4;
constexpr size_t kChunkHeaderSize = 4 + 4 + 2 + 2 + 2 + 4 + 4 + 4;
constexpr size_t kAudioHeaderSize = 4 + 4;

// Packet is one protocol data unit: {type, sequence, payload}.
struct Packet {
  PacketType type = PacketType::kKeepalive;
  uint32_t sequence = 0;
  std::vector<uint8_t> payload;

  [[nodiscard]] size_t wire_size() const { return kPacketHeaderSize + payload.size(); }
};

// Serial-number comparison: true when a precedes b modulo 2^32.
inline bool SequenceLess(uint32_t a, uint32_t b) {
  return static_cast<int32_t>(a - b) < 0;
}

// Header + payload, no length prefix.
void SerializePacket(const Packet& packet, std::vector<uint8_t>& out);

// Parses one packet from an exact buffer. Unknown type, short header or
// oversize input fail with kInvalidFormat.
Status ParsePacket(const uint8_t* data, size_t size, Packet& packet);

// HELLO: sent by a connection-oriented client right after connecting.
struct HelloPayload {
  uint16_t protocol_version = kProtocolVersion;
  std::string client_name;
};

// CONFIG: the container config plus the session's transmission parameters.
struct SessionConfigPayload {
  format::Config config;
  uint16_t fec_group_size = 0;
  uint16_t max_chunk_payload = 0;
  bool satellite_mode = false;
  // Serial of the next frame the server will send; frames before it are not
  // counted as lost by a late joiner.
  uint32_t next_frame_serial = 0;
};

// FRAME: a whole stored frame in one packet.
struct FramePayload {
  uint32_t frame_serial = 0;
  uint32_t frame_index = 0;
  uint32_t raw_length = 0;
  uint32_t checksum = 0;
  std::vector<uint8_t> data;
};

// FRAME_CHUNK and PARITY share this shape. For PARITY, chunk_index is the
// group index and data is the XOR of that group's chunks padded to chunk_size.
struct ChunkPayload {
  uint32_t frame_serial = 0;
  uint32_t frame_index = 0;
  uint16_t chunk_index = 0;
  uint16_t chunk_count = 0;
  uint16_t chunk_size = 0;  // Nominal size of every chunk but the last.
  uint32_t stored_length = 0;
  uint32_t raw_length = 0;
  uint32_t checksum = 0;
  std::vector<uint8_t> data;
};

// AUDIO: one piece of the side-channel audio file.
struct AudioPayload {
  uint32_t chunk_index = 0;
  uint32_t chunk_count = 0;
  std::vector<uint8_t> data;
};

// END: one past the last frame serial of the session.
struct EndPayload {
  uint32_t frame_serial_end = 0;
};

void EncodeHello(const HelloPayload& hello, std::vector<uint8_t>& out);
Status DecodeHello(const std::vector<uint8_t>& payload, HelloPayload& hello);

void EncodeMetadataPayload(const format::Metadata& metadata, std::vector<uint8_t>& out);
Status DecodeMetadataPayload(const std::vector<uint8_t>& payload, format::Metadata& metadata);

void EncodeSessionConfig(const SessionConfigPayload& config, std::vector<uint8_t>& out);
Status DecodeSessionConfig(const std::vector<uint8_t>& payload, SessionConfigPayload& config);

void EncodeFrame(const FramePayload& frame, std::vector<uint8_t>& out);
Status DecodeFrame(const std::vector<uint8_t>& payload, FramePayload& frame);

void EncodeChunk(const ChunkPayload& chunk, std::vector<uint8_t>& out);
Status DecodeChunk(const std::vector<uint8_t>& payload, ChunkPayload& chunk);

void EncodeAudio(const AudioPayload& audio, std::vector<uint8_t>& out);
Status DecodeAudio(const std::vector<uint8_t>& payload, AudioPayload& audio);

void EncodeEnd(const EndPayload& end, std::vector<uint8_t>& out);
Status DecodeEnd(const std::vector<uint8_t>& payload, EndPayload& end);

}  // namespace sanchez::stream

#endif  // SANCHEZ_STREAM_PACKET_H_
