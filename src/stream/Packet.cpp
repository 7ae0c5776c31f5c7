// Repository: Sanchez
// Component: Packet Model
// Purpose: Wire packet types, header framing and payload codecs shared by server and client.
// Copyright (c) 2025 Sanchez

#include "sanchez/stream/Packet.h"

#include "sanchez/format/ByteOrder.h"

namespace sanchez::stream {

namespace {

using format::ByteReader;
using format::ByteWriter;

constexpr uint8_t kSatelliteFlag = 0x01;

Status Malformed(PacketType type, const std::string& detail) {
  return Status(ErrorCode::kInvalidFormat,
                std::string("malformed ") + PacketTypeToString(type) + " payload: " + detail);
}

bool IsKnownType(uint8_t value) {
  return value >= static_cast<uint8_t>(PacketType::kHello) &&
         value <= static_cast<uint8_t>(PacketType::kKeepalive);
}

}  // namespace

const char* PacketTypeToString(PacketType type) {
  switch (type) {
    case PacketType::kHello:
      return "HELLO";
    case PacketType::kMetadata:
      return "METADATA";
    case PacketType::kConfig:
      return "CONFIG";
    case PacketType::kFrame:
      return "FRAME";
    case PacketType::kFrameChunk:
      return "FRAME_CHUNK";
    case PacketType::kParity:
      return "PARITY";
    case PacketType::kAudio:
      return "AUDIO";
    case PacketType::kEnd:
      return "END";
    case PacketType::kKeepalive:
      return "KEEPALIVE";
  }
  return "UNKNOWN";
}

void SerializePacket(const Packet& packet, std::vector<uint8_t>& out) {
  out.clear();
  out.reserve(packet.wire_size());
  ByteWriter writer(out);
  writer.PutU8(static_cast<uint8_t>(packet.type));
  writer.PutU32(packet.sequence);
  writer.PutBytes(packet.payload.data(), packet.payload.size());
}

Status ParsePacket(const uint8_t* data, size_t size, Packet& packet) {
  if (size < kPacketHeaderSize) {
    return Status(ErrorCode::kInvalidFormat,
                  "packet of " + std::to_string(size) + " bytes is shorter than its header");
  }
  if (size > kMaxPacketSize) {
    return Status(ErrorCode::kInvalidFormat,
                  "packet of " + std::to_string(size) + " bytes exceeds the maximum");
  }

  ByteReader reader(data, size);
  uint8_t type = 0;
  reader.GetU8(type);
  if (!IsKnownType(type)) {
    return Status(ErrorCode::kInvalidFormat,
                  "unknown packet type " + std::to_string(static_cast<int>(type)));
  }
  packet.type = static_cast<PacketType>(type);
  reader.GetU32(packet.sequence);
  reader.GetRemaining(packet.payload);
  return Status::Ok();
}

void EncodeHello(const HelloPayload& hello, std::vector<uint8_t>& out) {
  ByteWriter writer(out);
  writer.PutU16(hello.protocol_version);
  writer.PutString16(hello.client_name);
}

Status DecodeHello(const std::vector<uint8_t>& payload, HelloPayload& hello) {
  ByteReader reader(payload.data(), payload.size());
  if (!reader.GetU16(hello.protocol_version) || !reader.GetString16(hello.client_name) ||
      reader.remaining() != 0) {
    return Malformed(PacketType::kHello, "bad length");
  }
  return Status::Ok();
}

void EncodeMetadataPayload(const format::Metadata& metadata, std::vector<uint8_t>& out) {
  format::EncodeMetadata(metadata, out);
}

Status DecodeMetadataPayload(const std::vector<uint8_t>& payload, format::Metadata& metadata) {
  ByteReader reader(payload.data(), payload.size());
  if (!format::DecodeMetadata(reader, metadata) || reader.remaining() != 0) {
    return Malformed(PacketType::kMetadata, "bad length");
  }
  return Status::Ok();
}

void EncodeSessionConfig(const SessionConfigPayload& config, std::vector<uint8_t>& out) {
  format::EncodeConfig(config.config, out);
  ByteWriter writer(out);
  writer.PutU16(config.fec_group_size);
  writer.PutU16(config.max_chunk_payload);
  writer.PutU8(config.satellite_mode ? kSatelliteFlag : 0);
  writer.PutU32(config.next_frame_serial);
}

Status DecodeSessionConfig(const std::vector<uint8_t>& payload, SessionConfigPayload& config) {
  ByteReader reader(payload.data(), payload.size());
  uint8_t flags = 0;
  if (!format::DecodeConfig(reader, config.config) || !reader.GetU16(config.fec_group_size) ||
      !reader.GetU16(config.max_chunk_payload) || !reader.GetU8(flags) ||
      !reader.GetU32(config.next_frame_serial) || reader.remaining() != 0) {
    return Malformed(PacketType::kConfig, "bad length or flag byte");
  }
  config.satellite_mode = (flags & kSatelliteFlag) != 0;
  if (config.config.width == 0 || config.config.height == 0) {
    return Malformed(PacketType::kConfig, "zero dimensions");
  }
  if (config.satellite_mode && config.fec_group_size == 0) {
    return Malformed(PacketType::kConfig, "satellite mode without FEC group size");
  }
  return Status::Ok();
}

void EncodeFrame(const FramePayload& frame, std::vector<uint8_t>& out) {
  out.reserve(out.size() + kFrameHeaderSize + frame.data.size());
  ByteWriter writer(out);
  writer.PutU32(frame.frame_serial);
  writer.PutU32(frame.frame_index);
  writer.PutU32(frame.raw_length);
  writer.PutU32(frame.checksum);
  writer.PutBytes(frame.data.data(), frame.data.size());
}

Status DecodeFrame(const std::vector<uint8_t>& payload, FramePayload& frame) {
  ByteReader reader(payload.data(), payload.size());
  if (!reader.GetU32(frame.frame_serial) || !reader.GetU32(frame.frame_index) ||
      !reader.GetU32(frame.raw_length) || !reader.GetU32(frame.checksum)) {
    return Malformed(PacketType::kFrame, "short header");
  }
  if (reader.remaining() == 0) {
    return Malformed(PacketType::kFrame, "empty frame");
  }
  reader.GetRemaining(frame.data);
  return Status::Ok();
}

void EncodeChunk(const ChunkPayload& chunk, std::vector<uint8_t>& out) {
  out.reserve(out.size() + kChunkHeaderSize + chunk.data.size());
  ByteWriter writer(out);
  writer.PutU32(chunk.frame_serial);
  writer.PutU32(chunk.frame_index);
  writer.PutU16(chunk.chunk_index);
  writer.PutU16(chunk.chunk_count);
  writer.PutU16(chunk.chunk_size);
  writer.PutU32(chunk.stored_length);
  writer.PutU32(chunk.raw_length);
  writer.PutU32(chunk.checksum);
  writer.PutBytes(chunk.data.data(), chunk.data.size());
}

Status DecodeChunk(const std::vector<uint8_t>& payload, ChunkPayload& chunk) {
  ByteReader reader(payload.data(), payload.size());
  if (!reader.GetU32(chunk.frame_serial) || !reader.GetU32(chunk.frame_index) ||
      !reader.GetU16(chunk.chunk_index) || !reader.GetU16(chunk.chunk_count) ||
      !reader.GetU16(chunk.chunk_size) || !reader.GetU32(chunk.stored_length) ||
      !reader.GetU32(chunk.raw_length) || !reader.GetU32(chunk.checksum)) {
    return Malformed(PacketType::kFrameChunk, "short header");
  }
  if (chunk.chunk_count == 0 || chunk.chunk_size == 0 || chunk.stored_length == 0) {
    return Malformed(PacketType::kFrameChunk, "zero count, size or length");
  }
  if (reader.remaining() == 0 || reader.remaining() > chunk.chunk_size) {
    return Malformed(PacketType::kFrameChunk, "data does not fit chunk size");
  }
  if (static_cast<uint64_t>(chunk.chunk_size) * chunk.chunk_count < chunk.stored_length) {
    return Malformed(PacketType::kFrameChunk, "chunks cannot hold stored length");
  }
  reader.GetRemaining(chunk.data);
  return Status::Ok();
}

void EncodeAudio(const AudioPayload& audio, std::vector<uint8_t>& out) {
  ByteWriter writer(out);
  writer.PutU32(audio.chunk_index);
  writer.PutU32(audio.chunk_count);
  writer.PutBytes(audio.data.data(), audio.data.size());
}

Status DecodeAudio(const std::vector<uint8_t>& payload, AudioPayload& audio) {
  ByteReader reader(payload.data(), payload.size());
  if (!reader.GetU32(audio.chunk_index) || !reader.GetU32(audio.chunk_count)) {
    return Malformed(PacketType::kAudio, "short header");
  }
  if (audio.chunk_count == 0 || audio.chunk_index >= audio.chunk_count) {
    return Malformed(PacketType::kAudio, "chunk index out of range");
  }
  reader.GetRemaining(audio.data);
  return Status::Ok();
}

void EncodeEnd(const EndPayload& end, std::vector<uint8_t>& out) {
  ByteWriter writer(out);
  writer.PutU32(end.frame_serial_end);
}

Status DecodeEnd(const std::vector<uint8_t>& payload, EndPayload& end) {
  ByteReader reader(payload.data(), payload.size());
  if (!reader.GetU32(end.frame_serial_end) || reader.remaining() != 0) {
    return Malformed(PacketType::kEnd, "bad length");
  }
  return Status::Ok();
}

}  // namespace sanchez::stream
