// Repository: Sanchez
// Component: Stub Image Codec for Testing
// Purpose: Keeps "written" images in memory keyed by path.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_TESTS_FIXTURES_STUB_IMAGE_CODEC_H_
#define SANCHEZ_TESTS_FIXTURES_STUB_IMAGE_CODEC_H_

#include <map>
#include <memory>
#include <string>

#include "sanchez/media/IImageCodec.h"

namespace sanchez::tests::fixtures {

using ImageStore = std::map<std::string, media::RgbFrame>;

class StubImageCodec : public media::IImageCodec {
 public:
  explicit StubImageCodec(std::shared_ptr<ImageStore> store) : store_(std::move(store)) {}

  Status Encode(const std::string& path, const media::RgbFrame& frame) override {
    (*store_)[path] = frame;
    return Status::Ok();
  }

  Status Decode(const std::string& path, media::RgbFrame& frame) override {
    auto it = store_->find(path);
    if (it == store_->end()) {
      return Status(ErrorCode::kSourceUnreadable, "no image at " + path);
    }
    frame = it->second;
    return Status::Ok();
  }

 private:
  std::shared_ptr<ImageStore> store_;
};

}  // namespace sanchez::tests::fixtures

#endif  // SANCHEZ_TESTS_FIXTURES_STUB_IMAGE_CODEC_H_
