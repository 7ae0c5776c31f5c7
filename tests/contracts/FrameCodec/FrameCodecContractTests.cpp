#include <gtest/gtest.h>

#include <vector>

#include "BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"
#include "fixtures/FrameFactory.h"
#include "sanchez/codec/FrameCodec.h"

namespace sanchez::tests::contracts {

using sanchez::tests::RegisterExpectedDomainCoverage;
using sanchez::tests::fixtures::FrameFactory;

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage("FrameCodec",
                                 {"FC-001", "FC-002", "FC-003", "FC-004", "FC-005"});
  return true;
}();

class FrameCodecContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "FrameCodec"; }

  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"FC-001", "FC-002", "FC-003", "FC-004", "FC-005"};
  }
};

TEST_F(FrameCodecContractTest, FC_001_CompressedRoundTripIsByteExact) {
  codec::FrameCodec codec(true);
  const std::vector<std::vector<uint8_t>> inputs = {
      FrameFactory::SolidColor(4, 4, 200, 10, 30),
      FrameFactory::Pattern(64, 48, 7),
      FrameFactory::Pattern(1, 1, 3),
  };

  for (const auto& raw : inputs) {
    std::vector<uint8_t> stored;
    ASSERT_TRUE(codec.Compress(raw.data(), raw.size(), stored).ok());
    std::vector<uint8_t> restored;
    ASSERT_TRUE(codec.Decompress(stored.data(), stored.size(), raw.size(), restored).ok());
    EXPECT_EQ(restored, raw);
  }
}

TEST_F(FrameCodecContractTest, FC_002_DisabledCompressionIsIdentity) {
  codec::FrameCodec codec(false);
  const auto raw = FrameFactory::Pattern(8, 8, 1);

  std::vector<uint8_t> stored;
  ASSERT_TRUE(codec.Compress(raw.data(), raw.size(), stored).ok());
  EXPECT_EQ(stored, raw);

  std::vector<uint8_t> restored;
  ASSERT_TRUE(codec.Decompress(stored.data(), stored.size(), raw.size(), restored).ok());
  EXPECT_EQ(restored, raw);
}

TEST_F(FrameCodecContractTest, FC_003_MalformedInputIsCorruptFrame) {
  codec::FrameCodec codec(true);
  const std::vector<uint8_t> garbage = {0x00, 0x11, 0x22, 0x33, 0x44, 0x55};
  std::vector<uint8_t> restored;
  Status status = codec.Decompress(garbage.data(), garbage.size(), 48, restored);
  EXPECT_EQ(status.code(), ErrorCode::kCorruptFrame);

  const auto raw = FrameFactory::Pattern(4, 4, 9);
  std::vector<uint8_t> stored;
  ASSERT_TRUE(codec.Compress(raw.data(), raw.size(), stored).ok());
  stored.resize(stored.size() / 2);
  status = codec.Decompress(stored.data(), stored.size(), raw.size(), restored);
  EXPECT_EQ(status.code(), ErrorCode::kCorruptFrame);
}

TEST_F(FrameCodecContractTest, FC_004_LengthMismatchIsCorruptFrame) {
  const auto raw = FrameFactory::SolidColor(4, 4, 1, 2, 3);
  std::vector<uint8_t> restored;

  codec::FrameCodec compressed(true);
  std::vector<uint8_t> stored;
  ASSERT_TRUE(compressed.Compress(raw.data(), raw.size(), stored).ok());
  EXPECT_EQ(compressed.Decompress(stored.data(), stored.size(), raw.size() + 3, restored).code(),
            ErrorCode::kCorruptFrame);
  EXPECT_EQ(compressed.Decompress(stored.data(), stored.size(), raw.size() - 3, restored).code(),
            ErrorCode::kCorruptFrame);

  codec::FrameCodec identity(false);
  EXPECT_EQ(identity.Decompress(raw.data(), raw.size(), raw.size() + 1, restored).code(),
            ErrorCode::kCorruptFrame);
}

TEST_F(FrameCodecContractTest, FC_005_CompressionAndChecksumAreDeterministic) {
  codec::FrameCodec codec(true);
  const auto raw = FrameFactory::Pattern(32, 32, 5);

  std::vector<uint8_t> first;
  std::vector<uint8_t> second;
  ASSERT_TRUE(codec.Compress(raw.data(), raw.size(), first).ok());
  ASSERT_TRUE(codec.Compress(raw.data(), raw.size(), second).ok());
  EXPECT_EQ(first, second);

  // CRC-32 check value.
  const std::string check = "123456789";
  EXPECT_EQ(codec::FrameCodec::Checksum(reinterpret_cast<const uint8_t*>(check.data()),
                                        check.size()),
            0xCBF43926u);
}

}  // namespace sanchez::tests::contracts
