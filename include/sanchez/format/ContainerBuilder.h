// Repository: Sanchez
// Component: Container Builder
// Purpose: Authoring state of a .sanchez file: append frames, then publish once.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_FORMAT_CONTAINER_BUILDER_H_
#define SANCHEZ_FORMAT_CONTAINER_BUILDER_H_

#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include "sanchez/codec/FrameCodec.h"
#include "sanchez/core/Status.h"
#include "sanchez/format/ContainerTypes.h"

namespace sanchez::format {

// BuilderOptions holds the settings fixed at creation besides title/creator/size.
struct BuilderOptions {
  double fps = 24.0;
  bool compression_enabled = true;
  bool is_image = false;
  int64_t created_at = 0;  // 0 = now.
};

// ContainerBuilder is the write side of a container.
//
// Frames are compressed on append and spooled to an anonymous temporary file,
// so authoring does not keep every payload in memory. Save() publishes the
// finished file; after a successful Save() the builder is sealed. A builder is
// exclusively owned by its writer and is not thread-safe.
class ContainerBuilder {
 public:
  ContainerBuilder(std::string title,
                   std::string creator,
                   uint32_t width,
                   uint32_t height,
                   const BuilderOptions& options = BuilderOptions());
  ~ContainerBuilder();

  ContainerBuilder(const ContainerBuilder&) = delete;
  ContainerBuilder& operator=(const ContainerBuilder&) = delete;

  // Validates size before mutating anything (kDimensionMismatch).
  Status AppendFrame(const uint8_t* raw, size_t size);
  Status AppendFrame(const std::vector<uint8_t>& raw) {
    return AppendFrame(raw.data(), raw.size());
  }

  // Writes the container to path. The file becomes readable only once every
  // section has been flushed; on failure nothing is left at path.
  Status Save(const std::string& path);

  uint32_t frame_count() const { return config_.frame_count; }
  const Metadata& metadata() const { return metadata_; }
  const Config& config() const { return config_; }
  bool sealed() const { return sealed_; }

 private:
  struct FileCloser {
    void operator()(std::FILE* file) const {
      if (file) std::fclose(file);
    }
  };
  using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

  // Serializes everything that precedes the payload region.
  std::vector<uint8_t> BuildHeader(uint64_t payload_base) const;
  Status WriteTo(std::FILE* out, const std::string& partial_path);

  Metadata metadata_;
  Config config_;
  codec::FrameCodec codec_;
  FilePtr spool_;
  uint64_t spool_size_;
  // byte_offset is relative to the payload region until Save().
  std::vector<FrameRecord> records_;
  bool sealed_;
};

}  // namespace sanchez::format

#endif  // SANCHEZ_FORMAT_CONTAINER_BUILDER_H_
