// Repository: Sanchez
// Component: Container
// Purpose: Read-only view of a published .sanchez file with random frame access.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_FORMAT_CONTAINER_H_
#define SANCHEZ_FORMAT_CONTAINER_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "sanchez/codec/FrameCodec.h"
#include "sanchez/core/Status.h"
#include "sanchez/format/ContainerTypes.h"
#include "sanchez/media/IFrameSource.h"

namespace sanchez::format {

class ContainerFrameSource;

// Container is the published, immutable form of a .sanchez file.
//
// Open() parses header, metadata, config and the frame index without touching
// any payload. Frames are read with positional reads, so one Container may be
// shared by any number of threads (decoder, stream server sessions).
class Container {
 public:
  // Fails with kInvalidFormat (magic, version, inconsistent header) or kIOError.
  static Status Open(const std::string& path, std::unique_ptr<Container>& out);

  ~Container();

  Container(const Container&) = delete;
  Container& operator=(const Container&) = delete;

  const Metadata& metadata() const { return metadata_; }
  const Config& config() const { return config_; }
  uint32_t frame_count() const { return config_.frame_count; }
  const std::vector<FrameRecord>& index() const { return index_; }
  const FrameRecord& record(uint32_t i) const { return index_[i]; }
  uint64_t file_size() const { return file_size_; }
  const std::string& path() const { return path_; }

  // Random access: seek via the index, verify CRC32, decompress.
  Status GetFrame(uint32_t index, std::vector<uint8_t>& raw) const;

  // Same as GetFrame() without decompression.
  Status GetStoredFrame(uint32_t index, std::vector<uint8_t>& stored) const;

  // Sequential frames in index order. The Container must outlive the source.
  std::unique_ptr<ContainerFrameSource> Frames(bool skip_corrupt = false) const;

 private:
  Container(std::string path, int fd, uint64_t file_size);

  Status Parse();
  // Reads exactly size bytes at offset. Short reads are kInvalidFormat when
  // truncated_is_format_error, kIOError otherwise.
  Status ReadAt(uint64_t offset, uint8_t* dst, size_t size,
                bool truncated_is_format_error) const;

  std::string path_;
  int fd_;
  uint64_t file_size_;
  Metadata metadata_;
  Config config_;
  std::vector<FrameRecord> index_;
  std::unique_ptr<codec::FrameCodec> codec_;
};

// ContainerFrameSource yields exactly frame_count frames in order.
// On kCorruptFrame it stops with that status, or skips the frame when
// constructed with skip_corrupt.
class ContainerFrameSource : public media::IFrameSource {
 public:
  ContainerFrameSource(const Container& container, bool skip_corrupt);

  bool Next(media::RgbFrame& frame) override;
  Status status() const override { return status_; }

  // Indices skipped because of corruption.
  const std::vector<uint32_t>& skipped() const { return skipped_; }

 private:
  const Container& container_;
  const bool skip_corrupt_;
  uint32_t cursor_;
  Status status_;
  std::vector<uint32_t> skipped_;
};

}  // namespace sanchez::format

#endif  // SANCHEZ_FORMAT_CONTAINER_H_
