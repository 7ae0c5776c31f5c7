#include <gtest/gtest.h>

#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"
#include "fixtures/FrameFactory.h"
#include "fixtures/TempDir.h"
#include "sanchez/format/Container.h"
#include "sanchez/format/ContainerBuilder.h"

namespace sanchez::tests::contracts {

using sanchez::tests::RegisterExpectedDomainCoverage;
using sanchez::tests::fixtures::FrameFactory;
using sanchez::tests::fixtures::TempDir;

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage("Container",
                                 {"CF-001", "CF-002", "CF-003", "CF-004", "CF-005", "CF-006",
                                  "CF-007", "CF-008", "CF-009", "CF-010"});
  return true;
}();

namespace {

std::vector<uint8_t> ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in),
                              std::istreambuf_iterator<char>());
}

void WriteFile(const std::string& path, const std::vector<uint8_t>& bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char*>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
}

uint32_t ReadU32BE(const std::vector<uint8_t>& bytes, size_t offset) {
  return (static_cast<uint32_t>(bytes[offset]) << 24) |
         (static_cast<uint32_t>(bytes[offset + 1]) << 16) |
         (static_cast<uint32_t>(bytes[offset + 2]) << 8) | bytes[offset + 3];
}

}  // namespace

class ContainerContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "Container"; }

  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"CF-001", "CF-002", "CF-003", "CF-004", "CF-005",
            "CF-006", "CF-007", "CF-008", "CF-009", "CF-010"};
  }

  std::unique_ptr<format::Container> OpenOrFail(const std::string& path) {
    std::unique_ptr<format::Container> container;
    Status status = format::Container::Open(path, container);
    EXPECT_TRUE(status.ok()) << status.ToString();
    return container;
  }

  TempDir dir_;
};

TEST_F(ContainerContractTest, CF_001_SolidColorClipReopensWithTenFrames) {
  const auto solid = FrameFactory::SolidColor(4, 4, 255, 0, 0);
  format::ContainerBuilder builder("red", "tests", 4, 4);
  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(builder.AppendFrame(solid).ok());
  }
  const std::string path = dir_.File("red.sanchez");
  ASSERT_TRUE(builder.Save(path).ok());
  EXPECT_TRUE(builder.sealed());

  auto container = OpenOrFail(path);
  ASSERT_NE(container, nullptr);
  EXPECT_EQ(container->frame_count(), 10u);
  std::vector<uint8_t> first;
  ASSERT_TRUE(container->GetFrame(0, first).ok());
  EXPECT_EQ(first, solid);
}

TEST_F(ContainerContractTest, CF_002_SavedFramesReadBackInOrder) {
  for (const bool compression : {true, false}) {
    std::vector<std::vector<uint8_t>> frames;
    for (uint32_t i = 0; i < 7; ++i) {
      frames.push_back(FrameFactory::Pattern(6, 5, i));
    }
    const std::string path =
        dir_.File(compression ? "packed.sanchez" : "plain.sanchez");
    ASSERT_TRUE(FrameFactory::WriteContainer(path, 6, 5, frames, compression, 29.97).ok());

    auto container = OpenOrFail(path);
    ASSERT_NE(container, nullptr);
    EXPECT_EQ(container->metadata().title, "test clip");
    EXPECT_EQ(container->metadata().creator, "sanchez tests");
    EXPECT_EQ(container->metadata().created_at, 1'700'000'000);
    EXPECT_EQ(container->config().width, 6u);
    EXPECT_EQ(container->config().height, 5u);
    EXPECT_NEAR(container->config().fps, 29.97, 1e-3);
    EXPECT_EQ(container->config().compression_enabled, compression);
    EXPECT_FALSE(container->config().is_image);
    ASSERT_EQ(container->frame_count(), frames.size());

    uint64_t previous_offset = 0;
    for (uint32_t i = 0; i < frames.size(); ++i) {
      const format::FrameRecord& record = container->record(i);
      EXPECT_EQ(record.index, i);
      EXPECT_GT(record.byte_offset, previous_offset);
      EXPECT_EQ(record.raw_length, frames[i].size());
      previous_offset = record.byte_offset;

      std::vector<uint8_t> raw;
      ASSERT_TRUE(container->GetFrame(i, raw).ok());
      EXPECT_EQ(raw, frames[i]) << "frame " << i;
    }
  }
}

TEST_F(ContainerContractTest, CF_003_RandomAccessIsIndependentOfCallOrder) {
  std::vector<std::vector<uint8_t>> frames;
  for (uint32_t i = 0; i < 5; ++i) {
    frames.push_back(FrameFactory::Pattern(8, 8, 100 + i));
  }
  const std::string path = dir_.File("random.sanchez");
  ASSERT_TRUE(FrameFactory::WriteContainer(path, 8, 8, frames).ok());
  auto container = OpenOrFail(path);
  ASSERT_NE(container, nullptr);

  const uint32_t order[] = {4, 0, 2, 2, 1, 4, 3, 0};
  for (const uint32_t index : order) {
    std::vector<uint8_t> raw;
    ASSERT_TRUE(container->GetFrame(index, raw).ok());
    EXPECT_EQ(raw, frames[index]) << "frame " << index;
  }
}

TEST_F(ContainerContractTest, CF_004_AnyFlippedStoredByteIsCorruptFrame) {
  const std::vector<std::vector<uint8_t>> frames = {FrameFactory::Pattern(4, 4, 1),
                                                    FrameFactory::Pattern(4, 4, 2),
                                                    FrameFactory::Pattern(4, 4, 3)};
  const std::string path = dir_.File("flip.sanchez");
  ASSERT_TRUE(FrameFactory::WriteContainer(path, 4, 4, frames).ok());

  format::FrameRecord target;
  {
    auto container = OpenOrFail(path);
    ASSERT_NE(container, nullptr);
    target = container->record(1);
  }

  const std::vector<uint8_t> original = ReadFile(path);
  const std::string damaged_path = dir_.File("damaged.sanchez");
  for (uint32_t i = 0; i < target.stored_length; ++i) {
    std::vector<uint8_t> damaged = original;
    damaged[target.byte_offset + i] ^= 0x01;
    WriteFile(damaged_path, damaged);

    auto container = OpenOrFail(damaged_path);
    ASSERT_NE(container, nullptr);
    std::vector<uint8_t> raw;
    EXPECT_EQ(container->GetFrame(1, raw).code(), ErrorCode::kCorruptFrame) << "byte " << i;
    EXPECT_TRUE(container->GetFrame(0, raw).ok());
    EXPECT_TRUE(container->GetFrame(2, raw).ok());
  }
}

TEST_F(ContainerContractTest, CF_005_BadMagicOrVersionIsInvalidFormat) {
  const std::string path = dir_.File("good.sanchez");
  ASSERT_TRUE(FrameFactory::WriteContainer(path, 4, 4, FrameFactory::SolidSequence(4, 4, 2)).ok());
  const std::vector<uint8_t> original = ReadFile(path);

  std::vector<uint8_t> bad_magic = original;
  bad_magic[0] = 'X';
  WriteFile(dir_.File("magic.sanchez"), bad_magic);
  std::unique_ptr<format::Container> container;
  EXPECT_EQ(format::Container::Open(dir_.File("magic.sanchez"), container).code(),
            ErrorCode::kInvalidFormat);

  std::vector<uint8_t> bad_version = original;
  bad_version[5] = static_cast<uint8_t>(format::kFormatVersion + 1);
  WriteFile(dir_.File("version.sanchez"), bad_version);
  EXPECT_EQ(format::Container::Open(dir_.File("version.sanchez"), container).code(),
            ErrorCode::kInvalidFormat);

  std::vector<uint8_t> truncated(original.begin(), original.begin() + 20);
  WriteFile(dir_.File("short.sanchez"), truncated);
  EXPECT_EQ(format::Container::Open(dir_.File("short.sanchez"), container).code(),
            ErrorCode::kInvalidFormat);

  EXPECT_EQ(format::Container::Open(dir_.File("missing.sanchez"), container).code(),
            ErrorCode::kIOError);
  EXPECT_EQ(container, nullptr);
}

TEST_F(ContainerContractTest, CF_006_WrongBufferSizeIsRejectedBeforeMutation) {
  format::ContainerBuilder builder("sizes", "tests", 4, 4);
  ASSERT_TRUE(builder.AppendFrame(FrameFactory::SolidColor(4, 4, 1, 1, 1)).ok());

  EXPECT_EQ(builder.AppendFrame(FrameFactory::SolidColor(4, 3, 1, 1, 1)).code(),
            ErrorCode::kDimensionMismatch);
  EXPECT_EQ(builder.AppendFrame(std::vector<uint8_t>()).code(), ErrorCode::kDimensionMismatch);
  EXPECT_EQ(builder.frame_count(), 1u);

  const std::string path = dir_.File("sizes.sanchez");
  ASSERT_TRUE(builder.Save(path).ok());
  auto container = OpenOrFail(path);
  ASSERT_NE(container, nullptr);
  EXPECT_EQ(container->frame_count(), 1u);
}

TEST_F(ContainerContractTest, CF_007_IndexPastFrameCountIsOutOfRange) {
  const std::string path = dir_.File("range.sanchez");
  ASSERT_TRUE(FrameFactory::WriteContainer(path, 4, 4, FrameFactory::SolidSequence(4, 4, 3)).ok());
  auto container = OpenOrFail(path);
  ASSERT_NE(container, nullptr);

  std::vector<uint8_t> raw;
  EXPECT_EQ(container->GetFrame(3, raw).code(), ErrorCode::kIndexOutOfRange);
  EXPECT_EQ(container->GetFrame(UINT32_MAX, raw).code(), ErrorCode::kIndexOutOfRange);
  EXPECT_TRUE(container->GetFrame(2, raw).ok());
}

TEST_F(ContainerContractTest, CF_008_IterationYieldsEveryFrameAndCanSkipCorruption) {
  const auto frames = FrameFactory::SolidSequence(4, 4, 4);
  const std::string path = dir_.File("iter.sanchez");
  ASSERT_TRUE(FrameFactory::WriteContainer(path, 4, 4, frames).ok());

  {
    auto container = OpenOrFail(path);
    ASSERT_NE(container, nullptr);
    for (int pass = 0; pass < 2; ++pass) {
      auto source = container->Frames();
      media::RgbFrame frame;
      uint32_t count = 0;
      while (source->Next(frame)) {
        EXPECT_EQ(frame.index, count);
        EXPECT_EQ(frame.width, 4u);
        EXPECT_EQ(frame.data, frames[count]);
        ++count;
      }
      EXPECT_TRUE(source->status().ok());
      EXPECT_EQ(count, 4u);
    }
  }

  format::FrameRecord target;
  {
    auto container = OpenOrFail(path);
    ASSERT_NE(container, nullptr);
    target = container->record(2);
  }
  std::vector<uint8_t> bytes = ReadFile(path);
  bytes[target.byte_offset] ^= 0xFF;
  WriteFile(path, bytes);

  auto container = OpenOrFail(path);
  ASSERT_NE(container, nullptr);

  auto strict = container->Frames(false);
  media::RgbFrame frame;
  uint32_t strict_count = 0;
  while (strict->Next(frame)) {
    ++strict_count;
  }
  EXPECT_EQ(strict_count, 2u);
  EXPECT_EQ(strict->status().code(), ErrorCode::kCorruptFrame);

  auto lenient = container->Frames(true);
  std::vector<uint32_t> seen;
  while (lenient->Next(frame)) {
    seen.push_back(frame.index);
  }
  EXPECT_TRUE(lenient->status().ok());
  EXPECT_EQ(seen, (std::vector<uint32_t>{0, 1, 3}));
  EXPECT_EQ(lenient->skipped(), (std::vector<uint32_t>{2}));
}

TEST_F(ContainerContractTest, CF_009_FailedSaveLeavesNothingReadable) {
  format::ContainerBuilder builder("nowhere", "tests", 4, 4);
  ASSERT_TRUE(builder.AppendFrame(FrameFactory::SolidColor(4, 4, 9, 9, 9)).ok());

  const std::string path = dir_.File("no/such/dir/out.sanchez");
  EXPECT_EQ(builder.Save(path).code(), ErrorCode::kIOError);
  EXPECT_FALSE(builder.sealed());

  std::unique_ptr<format::Container> container;
  EXPECT_FALSE(format::Container::Open(path, container).ok());

  const std::string good = dir_.File("retry.sanchez");
  ASSERT_TRUE(builder.Save(good).ok());
  EXPECT_EQ(builder.AppendFrame(FrameFactory::SolidColor(4, 4, 9, 9, 9)).code(),
            ErrorCode::kIOError);
}

TEST_F(ContainerContractTest, CF_010_HeaderLayoutIsBigEndian) {
  format::BuilderOptions options;
  options.fps = 23.976;
  options.created_at = 42;
  format::ContainerBuilder builder("ab", "c", 4, 2, options);
  ASSERT_TRUE(builder.AppendFrame(FrameFactory::SolidColor(4, 2, 0, 0, 0)).ok());
  const std::string path = dir_.File("layout.sanchez");
  ASSERT_TRUE(builder.Save(path).ok());

  const std::vector<uint8_t> bytes = ReadFile(path);
  ASSERT_GT(bytes.size(), 60u);
  EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + 4), "SNCZ");
  EXPECT_EQ(bytes[4], 0x00);
  EXPECT_EQ(bytes[5], format::kFormatVersion);

  // title_len + "ab" + creator_len + "c" + created_at
  const uint32_t metadata_len = ReadU32BE(bytes, 6);
  EXPECT_EQ(metadata_len, 2u + 2u + 2u + 1u + 8u);
  EXPECT_EQ(bytes[10], 0x00);
  EXPECT_EQ(bytes[11], 0x02);
  EXPECT_EQ(bytes[12], 'a');

  const size_t config = 10 + metadata_len;
  EXPECT_EQ(ReadU32BE(bytes, config), 4u);
  EXPECT_EQ(ReadU32BE(bytes, config + 4), 2u);
  EXPECT_EQ(ReadU32BE(bytes, config + 8), 23976u);
  EXPECT_EQ(ReadU32BE(bytes, config + 12), 1u);
  EXPECT_EQ(bytes[config + 16], 0u);
  EXPECT_EQ(bytes[config + 17], 1u);
  EXPECT_EQ(ReadU32BE(bytes, config + 18), 1u);

  auto container = OpenOrFail(path);
  ASSERT_NE(container, nullptr);
  EXPECT_EQ(container->record(0).byte_offset, config + 22 + format::kIndexEntrySize);
  EXPECT_EQ(container->file_size(), bytes.size());
}

}  // namespace sanchez::tests::contracts
