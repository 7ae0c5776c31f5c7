// Repository: Sanchez
// Component: Container
// Purpose: Read-only view of a published .sanchez file with random frame access.
// Copyright (c) 2025 Sanchez

#include "sanchez/format/Container.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

#include "sanchez/format/ByteOrder.h"

namespace sanchez::format {

namespace {

// Largest metadata block: two u16-prefixed strings plus created_at.
constexpr uint32_t kMaxMetadataLength = 2 + 0xFFFF + 2 + 0xFFFF + 8;
constexpr uint32_t kMinMetadataLength = 2 + 2 + 8;

Status FormatError(const std::string& path, const std::string& what) {
  return Status(ErrorCode::kInvalidFormat, path + ": " + what);
}

}  // namespace

Status Container::Open(const std::string& path, std::unique_ptr<Container>& out) {
  const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return Status(ErrorCode::kIOError,
                  "cannot open " + path + ": " + std::strerror(errno));
  }

  struct stat st {};
  if (::fstat(fd, &st) != 0) {
    const int err = errno;
    ::close(fd);
    return Status(ErrorCode::kIOError, "cannot stat " + path + ": " + std::strerror(err));
  }

  std::unique_ptr<Container> container(
      new Container(path, fd, static_cast<uint64_t>(st.st_size)));
  Status status = container->Parse();
  if (!status.ok()) {
    std::cerr << "[Container] Open failed: " << status.ToString() << std::endl;
    return status;
  }

  out = std::move(container);
  return Status::Ok();
}

Container::Container(std::string path, int fd, uint64_t file_size)
    : path_(std::move(path)), fd_(fd), file_size_(file_size) {}

Container::~Container() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

Status Container::ReadAt(uint64_t offset, uint8_t* dst, size_t size,
                         bool truncated_is_format_error) const {
  size_t done = 0;
  while (done < size) {
    const ssize_t n = ::pread(fd_, dst + done, size - done,
                              static_cast<off_t>(offset + done));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return Status(ErrorCode::kIOError,
                    "read failed for " + path_ + ": " + std::strerror(errno));
    }
    if (n == 0) {
      if (truncated_is_format_error) {
        return FormatError(path_, "truncated at byte " + std::to_string(offset + done));
      }
      return Status(ErrorCode::kIOError,
                    "unexpected end of file in " + path_ + " at byte " +
                        std::to_string(offset + done));
    }
    done += static_cast<size_t>(n);
  }
  return Status::Ok();
}

Status Container::Parse() {
  uint8_t preamble[kPreambleSize + 4];
  Status status = ReadAt(0, preamble, sizeof(preamble), true);
  if (!status.ok()) {
    return status;
  }
  if (std::memcmp(preamble, kMagic, sizeof(kMagic)) != 0) {
    return FormatError(path_, "not a .sanchez file (bad magic)");
  }

  ByteReader preamble_reader(preamble + sizeof(kMagic), sizeof(preamble) - sizeof(kMagic));
  uint16_t version = 0;
  uint32_t metadata_len = 0;
  preamble_reader.GetU16(version);
  preamble_reader.GetU32(metadata_len);
  if (version != kFormatVersion) {
    return FormatError(path_, "unsupported format version " + std::to_string(version));
  }
  if (metadata_len < kMinMetadataLength || metadata_len > kMaxMetadataLength) {
    return FormatError(path_, "metadata length " + std::to_string(metadata_len) +
                                  " out of range");
  }

  uint64_t pos = sizeof(preamble);
  std::vector<uint8_t> block(metadata_len + kConfigBlockSize + 4);
  status = ReadAt(pos, block.data(), block.size(), true);
  if (!status.ok()) {
    return status;
  }

  ByteReader metadata_reader(block.data(), metadata_len);
  if (!DecodeMetadata(metadata_reader, metadata_) || metadata_reader.remaining() != 0) {
    return FormatError(path_, "malformed metadata block");
  }

  ByteReader config_reader(block.data() + metadata_len, kConfigBlockSize + 4);
  uint32_t entry_count = 0;
  if (!DecodeConfig(config_reader, config_) || !config_reader.GetU32(entry_count)) {
    return FormatError(path_, "malformed config block");
  }
  if (entry_count != config_.frame_count) {
    return FormatError(path_, "index has " + std::to_string(entry_count) +
                                  " entries but config declares " +
                                  std::to_string(config_.frame_count) + " frames");
  }

  const uint64_t raw_size = config_.raw_frame_size();
  if (config_.frame_count > 0 && (raw_size == 0 || raw_size > UINT32_MAX)) {
    return FormatError(path_, "invalid frame dimensions " + std::to_string(config_.width) +
                                  "x" + std::to_string(config_.height));
  }

  pos += block.size();
  const uint64_t index_bytes = static_cast<uint64_t>(entry_count) * kIndexEntrySize;
  if (pos + index_bytes > file_size_) {
    return FormatError(path_, "frame index extends past end of file");
  }

  std::vector<uint8_t> index_block(static_cast<size_t>(index_bytes));
  status = ReadAt(pos, index_block.data(), index_block.size(), true);
  if (!status.ok()) {
    return status;
  }

  const uint64_t payload_base = pos + index_bytes;
  uint64_t previous_end = payload_base;
  ByteReader index_reader(index_block.data(), index_block.size());
  index_.reserve(entry_count);
  for (uint32_t i = 0; i < entry_count; ++i) {
    FrameRecord record;
    record.index = i;
    index_reader.GetU64(record.byte_offset);
    index_reader.GetU32(record.stored_length);
    index_reader.GetU32(record.raw_length);
    index_reader.GetU32(record.checksum);

    if (record.byte_offset < previous_end) {
      return FormatError(path_, "frame " + std::to_string(i) + " offset overlaps previous data");
    }
    if (record.stored_length == 0 ||
        record.byte_offset + record.stored_length > file_size_) {
      return FormatError(path_, "frame " + std::to_string(i) + " extends past end of file");
    }
    if (record.raw_length != raw_size) {
      return FormatError(path_, "frame " + std::to_string(i) + " raw length " +
                                    std::to_string(record.raw_length) +
                                    " does not match dimensions");
    }
    previous_end = record.byte_offset + record.stored_length;
    index_.push_back(record);
  }

  codec_ = std::make_unique<codec::FrameCodec>(config_.compression_enabled);
  return Status::Ok();
}

Status Container::GetStoredFrame(uint32_t index, std::vector<uint8_t>& stored) const {
  if (index >= config_.frame_count) {
    return Status(ErrorCode::kIndexOutOfRange,
                  "frame " + std::to_string(index) + " >= frame_count " +
                      std::to_string(config_.frame_count));
  }

  const FrameRecord& rec = index_[index];
  stored.resize(rec.stored_length);
  Status status = ReadAt(rec.byte_offset, stored.data(), stored.size(), false);
  if (!status.ok()) {
    return status;
  }

  const uint32_t actual = codec::FrameCodec::Checksum(stored.data(), stored.size());
  if (actual != rec.checksum) {
    return Status(ErrorCode::kCorruptFrame,
                  "frame " + std::to_string(index) + " checksum mismatch");
  }
  return Status::Ok();
}

Status Container::GetFrame(uint32_t index, std::vector<uint8_t>& raw) const {
  std::vector<uint8_t> stored;
  Status status = GetStoredFrame(index, stored);
  if (!status.ok()) {
    return status;
  }

  status = codec_->Decompress(stored.data(), stored.size(), index_[index].raw_length, raw);
  if (!status.ok()) {
    return Status(status.code(), "frame " + std::to_string(index) + ": " + status.message());
  }
  return Status::Ok();
}

std::unique_ptr<ContainerFrameSource> Container::Frames(bool skip_corrupt) const {
  return std::make_unique<ContainerFrameSource>(*this, skip_corrupt);
}

ContainerFrameSource::ContainerFrameSource(const Container& container, bool skip_corrupt)
    : container_(container), skip_corrupt_(skip_corrupt), cursor_(0) {}

bool ContainerFrameSource::Next(media::RgbFrame& frame) {
  if (!status_.ok()) {
    return false;
  }

  while (cursor_ < container_.frame_count()) {
    const uint32_t index = cursor_++;
    Status status = container_.GetFrame(index, frame.data);
    if (status.ok()) {
      frame.index = index;
      frame.width = container_.config().width;
      frame.height = container_.config().height;
      return true;
    }
    if (status.code() == ErrorCode::kCorruptFrame && skip_corrupt_) {
      std::cerr << "[Container] Skipping corrupt frame " << index << std::endl;
      skipped_.push_back(index);
      continue;
    }
    status_ = status;
    return false;
  }
  return false;
}

}  // namespace sanchez::format
