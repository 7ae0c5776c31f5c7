#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "fixtures/FrameFactory.h"
#include "fixtures/StubImageCodec.h"
#include "fixtures/StubVideoSink.h"
#include "fixtures/StubVideoSource.h"
#include "fixtures/TempDir.h"
#include "sanchez/decode/Decoder.h"
#include "sanchez/encode/Encoder.h"
#include "sanchez/format/Container.h"

namespace sanchez::tests::integration
{
namespace
{

using fixtures::FrameFactory;
using fixtures::ImageStore;
using fixtures::SinkRecord;
using fixtures::StubImageCodec;
using fixtures::StubVideoSink;
using fixtures::StubVideoSource;
using fixtures::TempDir;

constexpr uint32_t kWidth = 8;
constexpr uint32_t kHeight = 6;

std::vector<media::RgbFrame> SourceFrames(uint32_t count)
{
  std::vector<media::RgbFrame> frames;
  for (uint32_t i = 0; i < count; ++i)
  {
    frames.push_back(FrameFactory::CreateFrame(i, kWidth, kHeight));
  }
  return frames;
}

encode::Encoder MakeEncoder(uint32_t count, double fps)
{
  return encode::Encoder([count, fps]() -> std::unique_ptr<media::IVideoSource> {
    return std::make_unique<StubVideoSource>(SourceFrames(count), fps);
  });
}

class EncodeDecodeIntegrationTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    sink_record_ = std::make_shared<SinkRecord>();
    images_ = std::make_shared<ImageStore>();
  }

  decode::Decoder MakeDecoder()
  {
    auto record = sink_record_;
    auto images = images_;
    return decode::Decoder(
        [record]() -> std::unique_ptr<media::IVideoSink> {
          return std::make_unique<StubVideoSink>(record);
        },
        [images]() -> std::unique_ptr<media::IImageCodec> {
          return std::make_unique<StubImageCodec>(images);
        });
  }

  TempDir dir_;
  std::shared_ptr<SinkRecord> sink_record_;
  std::shared_ptr<ImageStore> images_;
};

TEST_F(EncodeDecodeIntegrationTest, EncodedVideoKeepsEveryFrameAndTheSourceRate)
{
  const std::string out = dir_.File("intro.sanchez");
  encode::Encoder encoder = MakeEncoder(12, 30.0);

  encode::EncodeOptions options;
  options.creator = "integration";
  encode::EncodeReport report;
  const Status status = encoder.Encode("clips/intro.mp4", out, options, &report);
  ASSERT_TRUE(status.ok()) << status.ToString();
  EXPECT_EQ(report.frames_written, 12u);
  EXPECT_EQ(report.width, kWidth);
  EXPECT_EQ(report.height, kHeight);
  EXPECT_DOUBLE_EQ(report.fps, 30.0);

  std::unique_ptr<format::Container> container;
  ASSERT_TRUE(format::Container::Open(out, container).ok());
  EXPECT_EQ(container->metadata().title, "intro");
  EXPECT_EQ(container->metadata().creator, "integration");
  EXPECT_EQ(container->frame_count(), 12u);
  EXPECT_FALSE(container->config().is_image);

  const auto expected = SourceFrames(12);
  for (uint32_t i = 0; i < 12; ++i)
  {
    std::vector<uint8_t> raw;
    ASSERT_TRUE(container->GetFrame(i, raw).ok());
    EXPECT_EQ(raw, expected[i].data) << "frame " << i;
  }
}

TEST_F(EncodeDecodeIntegrationTest, MaxFramesAndMissingRateAreHonored)
{
  const std::string out = dir_.File("short.sanchez");
  encode::Encoder encoder = MakeEncoder(20, 0.0);

  encode::EncodeOptions options;
  options.title = "short";
  options.max_frames = 5;
  options.use_compression = false;
  ASSERT_TRUE(encoder.Encode("short.mov", out, options).ok());

  decode::InfoSummary info;
  ASSERT_TRUE(MakeDecoder().GetInfo(out, info).ok());
  EXPECT_EQ(info.config.frame_count, 5u);
  EXPECT_DOUBLE_EQ(info.config.fps, 24.0);
  EXPECT_FALSE(info.config.compression_enabled);
  EXPECT_NEAR(info.duration_seconds, 5.0 / 24.0, 1e-9);
  EXPECT_EQ(info.file_size_bytes, std::filesystem::file_size(out));
}

TEST_F(EncodeDecodeIntegrationTest, StillImageIsOneFrameAtOneFps)
{
  const std::string out = dir_.File("still.sanchez");
  encode::Encoder encoder = MakeEncoder(3, 25.0);

  ASSERT_TRUE(encoder.EncodeImage("poster.png", out, encode::EncodeOptions()).ok());

  decode::InfoSummary info;
  ASSERT_TRUE(MakeDecoder().GetInfo(out, info).ok());
  EXPECT_TRUE(info.config.is_image);
  EXPECT_EQ(info.config.frame_count, 1u);
  EXPECT_DOUBLE_EQ(info.config.fps, 1.0);
  EXPECT_EQ(info.metadata.title, "poster");
}

TEST_F(EncodeDecodeIntegrationTest, UnreadableSourcesFailWithoutOutput)
{
  const std::string out = dir_.File("never.sanchez");

  encode::Encoder refusing([]() -> std::unique_ptr<media::IVideoSource> {
    auto source = std::make_unique<StubVideoSource>(SourceFrames(3), 24.0);
    source->FailOpen();
    return source;
  });
  EXPECT_EQ(refusing.Encode("missing.mp4", out, encode::EncodeOptions()).code(),
            ErrorCode::kSourceUnreadable);

  encode::Encoder empty = MakeEncoder(0, 24.0);
  EXPECT_EQ(empty.Encode("empty.mp4", out, encode::EncodeOptions()).code(),
            ErrorCode::kSourceUnreadable);

  encode::Encoder failing([]() -> std::unique_ptr<media::IVideoSource> {
    auto source = std::make_unique<StubVideoSource>(SourceFrames(6), 24.0);
    source->FailAfter(2);
    return source;
  });
  EXPECT_EQ(failing.Encode("broken.mp4", out, encode::EncodeOptions()).code(),
            ErrorCode::kSourceUnreadable);

  EXPECT_FALSE(std::filesystem::exists(out));
}

TEST_F(EncodeDecodeIntegrationTest, DecodeFeedsTheSinkInOrder)
{
  const std::string clip = dir_.File("clip.sanchez");
  ASSERT_TRUE(MakeEncoder(4, 30.0).Encode("clip.mp4", clip, encode::EncodeOptions()).ok());

  decode::DecodeOptions options;
  options.audio_path = "soundtrack.mp3";
  const Status status = MakeDecoder().Decode(clip, dir_.File("clip.mp4"), options);
  ASSERT_TRUE(status.ok()) << status.ToString();

  EXPECT_TRUE(sink_record_->closed);
  EXPECT_EQ(sink_record_->width, kWidth);
  EXPECT_EQ(sink_record_->height, kHeight);
  EXPECT_DOUBLE_EQ(sink_record_->fps, 30.0);
  EXPECT_EQ(sink_record_->audio_path, "soundtrack.mp3");
  const auto expected = SourceFrames(4);
  ASSERT_EQ(sink_record_->frames.size(), 4u);
  for (uint32_t i = 0; i < 4; ++i)
  {
    EXPECT_EQ(sink_record_->frames[i].index, i);
    EXPECT_EQ(sink_record_->frames[i].data, expected[i].data);
  }
}

TEST_F(EncodeDecodeIntegrationTest, ExtractWritesNumberedImages)
{
  const std::string clip = dir_.File("clip.sanchez");
  ASSERT_TRUE(MakeEncoder(3, 24.0).Encode("clip.mp4", clip, encode::EncodeOptions()).ok());

  const std::string frames_dir = dir_.File("frames");
  decode::ExtractReport report;
  ASSERT_TRUE(MakeDecoder()
                  .ExtractAllFrames(clip, frames_dir, "png", decode::DecodeOptions(), &report)
                  .ok());
  EXPECT_EQ(report.frames_written, 3u);
  EXPECT_TRUE(report.skipped_indices.empty());
  EXPECT_TRUE(std::filesystem::is_directory(frames_dir));

  const auto expected = SourceFrames(3);
  for (uint32_t i = 0; i < 3; ++i)
  {
    const std::string path =
        (std::filesystem::path(frames_dir) / decode::Decoder::FrameFileName(i, "png")).string();
    auto it = images_->find(path);
    ASSERT_NE(it, images_->end()) << path;
    EXPECT_EQ(it->second.data, expected[i].data);
  }
  EXPECT_EQ(decode::Decoder::FrameFileName(42, "png"), "frame_000042.png");

  EXPECT_EQ(MakeDecoder().ExtractAllFrames(clip, frames_dir, "tiff").code(),
            ErrorCode::kIOError);
}

TEST_F(EncodeDecodeIntegrationTest, SingleFrameExportAndRangeCheck)
{
  const std::string clip = dir_.File("clip.sanchez");
  ASSERT_TRUE(MakeEncoder(3, 24.0).Encode("clip.mp4", clip, encode::EncodeOptions()).ok());

  const std::string image = dir_.File("frame2.png");
  ASSERT_TRUE(MakeDecoder().DecodeToImage(clip, image, 2).ok());
  ASSERT_EQ(images_->count(image), 1u);
  EXPECT_EQ(images_->at(image).data, SourceFrames(3)[2].data);

  EXPECT_EQ(MakeDecoder().DecodeToImage(clip, dir_.File("frame9.png"), 9).code(),
            ErrorCode::kIndexOutOfRange);
}

}  // namespace
}  // namespace sanchez::tests::integration
