// Repository: Sanchez
// Component: Container Builder
// Purpose: Authoring state of a .sanchez file: append frames, then publish once.
// Copyright (c) 2025 Sanchez

#include "sanchez/format/ContainerBuilder.h"

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <utility>

#include "sanchez/format/ByteOrder.h"

namespace sanchez::format {

namespace {

constexpr size_t kCopyChunkBytes = 1 << 20;

int64_t NowUnixSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

Status IOErrorFromErrno(const std::string& what) {
  return Status(ErrorCode::kIOError, what + ": " + std::strerror(errno));
}

}  // namespace

ContainerBuilder::ContainerBuilder(std::string title,
                                   std::string creator,
                                   uint32_t width,
                                   uint32_t height,
                                   const BuilderOptions& options)
    : codec_(options.compression_enabled),
      spool_size_(0),
      sealed_(false) {
  metadata_.title = std::move(title);
  metadata_.creator = std::move(creator);
  metadata_.created_at = options.created_at != 0 ? options.created_at : NowUnixSeconds();

  config_.width = width;
  config_.height = height;
  config_.fps = options.fps;
  config_.frame_count = 0;
  config_.is_image = options.is_image;
  config_.compression_enabled = options.compression_enabled;
}

ContainerBuilder::~ContainerBuilder() = default;

Status ContainerBuilder::AppendFrame(const uint8_t* raw, size_t size) {
  if (sealed_) {
    return Status(ErrorCode::kIOError, "container already saved");
  }

  const size_t expected = config_.raw_frame_size();
  if (expected == 0 || size != expected) {
    return Status(ErrorCode::kDimensionMismatch,
                  "frame is " + std::to_string(size) + " bytes, expected " +
                      std::to_string(expected) + " (" + std::to_string(config_.width) +
                      "x" + std::to_string(config_.height) + "x3)");
  }
  if (expected > UINT32_MAX) {
    return Status(ErrorCode::kDimensionMismatch, "frame exceeds 4 GiB");
  }
  if (config_.frame_count == UINT32_MAX) {
    return Status(ErrorCode::kIOError, "frame index is full");
  }

  std::vector<uint8_t> stored;
  Status status = codec_.Compress(raw, size, stored);
  if (!status.ok()) {
    return status;
  }
  if (stored.size() > UINT32_MAX) {
    return Status(ErrorCode::kIOError, "stored frame exceeds 4 GiB");
  }

  if (!spool_) {
    spool_.reset(std::tmpfile());
    if (!spool_) {
      return IOErrorFromErrno("cannot create payload spool");
    }
  }
  if (std::fwrite(stored.data(), 1, stored.size(), spool_.get()) != stored.size()) {
    return IOErrorFromErrno("payload spool write failed");
  }

  FrameRecord record;
  record.index = config_.frame_count;
  record.byte_offset = spool_size_;
  record.stored_length = static_cast<uint32_t>(stored.size());
  record.raw_length = static_cast<uint32_t>(size);
  record.checksum = codec::FrameCodec::Checksum(stored.data(), stored.size());
  records_.push_back(record);

  spool_size_ += stored.size();
  config_.frame_count++;
  return Status::Ok();
}

std::vector<uint8_t> ContainerBuilder::BuildHeader(uint64_t payload_base) const {
  std::vector<uint8_t> metadata_block;
  EncodeMetadata(metadata_, metadata_block);

  std::vector<uint8_t> header;
  header.reserve(payload_base);
  ByteWriter writer(header);

  // Magic stays zeroed until the payload is on disk.
  writer.PutU32(0);
  writer.PutU16(kFormatVersion);
  writer.PutU32(static_cast<uint32_t>(metadata_block.size()));
  writer.PutBytes(metadata_block.data(), metadata_block.size());
  EncodeConfig(config_, header);
  writer.PutU32(static_cast<uint32_t>(records_.size()));
  for (const auto& record : records_) {
    writer.PutU64(payload_base + record.byte_offset);
    writer.PutU32(record.stored_length);
    writer.PutU32(record.raw_length);
    writer.PutU32(record.checksum);
  }
  return header;
}

Status ContainerBuilder::WriteTo(std::FILE* out, const std::string& partial_path) {
  std::vector<uint8_t> metadata_block;
  EncodeMetadata(metadata_, metadata_block);
  const uint64_t payload_base = kPreambleSize + 4 + metadata_block.size() +
                                kConfigBlockSize + 4 +
                                records_.size() * kIndexEntrySize;

  const std::vector<uint8_t> header = BuildHeader(payload_base);
  if (header.size() != payload_base) {
    return Status(ErrorCode::kIOError, "header size mismatch");
  }
  if (std::fwrite(header.data(), 1, header.size(), out) != header.size()) {
    return IOErrorFromErrno("write failed for " + partial_path);
  }

  if (spool_) {
    if (std::fflush(spool_.get()) != 0 || std::fseek(spool_.get(), 0, SEEK_SET) != 0) {
      return IOErrorFromErrno("payload spool rewind failed");
    }
    std::vector<uint8_t> chunk(kCopyChunkBytes);
    uint64_t copied = 0;
    while (copied < spool_size_) {
      const size_t want = static_cast<size_t>(
          std::min<uint64_t>(chunk.size(), spool_size_ - copied));
      const size_t got = std::fread(chunk.data(), 1, want, spool_.get());
      if (got != want) {
        return IOErrorFromErrno("payload spool read failed");
      }
      if (std::fwrite(chunk.data(), 1, got, out) != got) {
        return IOErrorFromErrno("write failed for " + partial_path);
      }
      copied += got;
    }
    // Appends after a failed save continue at the end of the spool.
    if (std::fseek(spool_.get(), 0, SEEK_END) != 0) {
      return IOErrorFromErrno("payload spool seek failed");
    }
  }

  if (std::fflush(out) != 0 || ::fsync(::fileno(out)) != 0) {
    return IOErrorFromErrno("flush failed for " + partial_path);
  }

  // Publish the header last.
  if (std::fseek(out, 0, SEEK_SET) != 0 ||
      std::fwrite(kMagic, 1, sizeof(kMagic), out) != sizeof(kMagic)) {
    return IOErrorFromErrno("magic write failed for " + partial_path);
  }
  if (std::fflush(out) != 0 || ::fsync(::fileno(out)) != 0) {
    return IOErrorFromErrno("flush failed for " + partial_path);
  }
  return Status::Ok();
}

Status ContainerBuilder::Save(const std::string& path) {
  if (sealed_) {
    return Status(ErrorCode::kIOError, "container already saved");
  }

  const std::string partial_path = path + ".partial";
  FilePtr out(std::fopen(partial_path.c_str(), "wb"));
  if (!out) {
    const Status status = IOErrorFromErrno("cannot create " + partial_path);
    std::cerr << "[ContainerBuilder] " << status.ToString() << std::endl;
    return status;
  }

  Status status = WriteTo(out.get(), partial_path);
  if (status.ok() && std::fclose(out.release()) != 0) {
    status = IOErrorFromErrno("close failed for " + partial_path);
  }
  if (status.ok() && std::rename(partial_path.c_str(), path.c_str()) != 0) {
    status = IOErrorFromErrno("cannot publish " + path);
  }
  if (!status.ok()) {
    out.reset();
    std::remove(partial_path.c_str());
    std::cerr << "[ContainerBuilder] Save failed: " << status.ToString() << std::endl;
    return status;
  }

  sealed_ = true;
  spool_.reset();
  std::cout << "[ContainerBuilder] Saved " << config_.frame_count << " frames ("
            << config_.width << "x" << config_.height << " @ " << config_.fps
            << " fps) to " << path << std::endl;
  return Status::Ok();
}

}  // namespace sanchez::format
