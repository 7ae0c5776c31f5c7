#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "BaseContractTest.h"
#include "../ContractRegistryEnvironment.h"
#include "fixtures/FrameFactory.h"
#include "fixtures/TempDir.h"
#include "sanchez/format/Container.h"
#include "sanchez/stream/MemoryTransport.h"
#include "sanchez/stream/ServerSession.h"
#include "sanchez/stream/StreamClient.h"
#include "sanchez/stream/StreamServer.h"
#include "sanchez/telemetry/MetricsExporter.h"
#include "sanchez/timing/MasterClock.h"
#include "timing/TestMasterClock.h"

namespace sanchez::tests::contracts {

using namespace sanchez::stream;
using sanchez::tests::RegisterExpectedDomainCoverage;
using sanchez::tests::fixtures::FrameFactory;
using sanchez::tests::fixtures::TempDir;

const bool kRegisterCoverage = []() {
  RegisterExpectedDomainCoverage("StreamSession",
                                 {"SS-001", "SS-002", "SS-003", "SS-004", "SS-005", "SS-006",
                                  "SS-007", "SS-008", "SS-009", "SS-010", "SS-011",
                                  "SS-012"});
  return true;
}();

namespace {

constexpr uint32_t kWidth = 4;
constexpr uint32_t kHeight = 4;

std::vector<std::vector<uint8_t>> PatternFrames(uint32_t count) {
  std::vector<std::vector<uint8_t>> frames;
  for (uint32_t i = 0; i < count; ++i) {
    frames.push_back(FrameFactory::Pattern(kWidth, kHeight, i));
  }
  return frames;
}

std::vector<PacketType> DrainTypes(ITransport& transport) {
  std::vector<PacketType> types;
  Packet packet;
  while (transport.Receive(packet, 10).ok()) {
    types.push_back(packet.type);
  }
  return types;
}

std::vector<Packet> DrainPackets(ITransport& transport) {
  std::vector<Packet> packets;
  Packet packet;
  while (transport.Receive(packet, 10).ok()) {
    packets.push_back(packet);
  }
  return packets;
}

Packet FramePacket(uint32_t serial, const std::vector<uint8_t>& data) {
  FramePayload frame;
  frame.frame_serial = serial;
  frame.frame_index = serial;
  frame.raw_length = static_cast<uint32_t>(data.size());
  frame.data = data;
  Packet packet;
  packet.type = PacketType::kFrame;
  EncodeFrame(frame, packet.payload);
  return packet;
}

Packet ChunkPacket(const ChunkPayload& chunk) {
  Packet packet;
  packet.type = PacketType::kFrameChunk;
  EncodeChunk(chunk, packet.payload);
  return packet;
}

std::vector<uint8_t> WriteAudio(const std::string& path, size_t size) {
  std::vector<uint8_t> audio(size);
  for (size_t i = 0; i < audio.size(); ++i) {
    audio[i] = static_cast<uint8_t>(i * 31);
  }
  std::ofstream out(path, std::ios::binary);
  out.write(reinterpret_cast<const char*>(audio.data()),
            static_cast<std::streamsize>(audio.size()));
  return audio;
}

// Forwards to another transport and raises stop once enough FRAME packets
// went out.
class StopAfterFramesTransport : public ITransport {
 public:
  StopAfterFramesTransport(ITransport& inner, uint32_t frames, std::atomic<bool>& stop)
      : inner_(inner), limit_(frames), sent_(0), stop_(stop) {}

  Status Send(const Packet& packet) override {
    Status status = inner_.Send(packet);
    if (status.ok() && packet.type == PacketType::kFrame && ++sent_ >= limit_) {
      stop_.store(true, std::memory_order_release);
    }
    return status;
  }

  Status Receive(Packet& packet, uint32_t timeout_ms) override {
    return inner_.Receive(packet, timeout_ms);
  }

  void Close() override { inner_.Close(); }
  size_t max_packet_size() const override { return inner_.max_packet_size(); }

 private:
  ITransport& inner_;
  uint32_t limit_;
  uint32_t sent_;
  std::atomic<bool>& stop_;
};

}  // namespace

class StreamSessionContractTest : public BaseContractTest {
 protected:
  [[nodiscard]] std::string DomainName() const override { return "StreamSession"; }

  [[nodiscard]] std::vector<std::string> CoveredRuleIds() const override {
    return {"SS-001", "SS-002", "SS-003", "SS-004", "SS-005", "SS-006",
            "SS-007", "SS-008", "SS-009", "SS-010", "SS-011", "SS-012"};
  }

  void SetUp() override {
    BaseContractTest::SetUp();
    clip_path_ = dir_.File("clip.sanchez");
    frames_ = PatternFrames(7);
    ASSERT_TRUE(FrameFactory::WriteContainer(clip_path_, kWidth, kHeight, frames_).ok());
  }

  static ServerConfig MemoryServerConfig(StreamMode mode) {
    ServerConfig config;
    config.mode = mode;
    config.realtime_pacing = false;
    config.keepalive_interval_ms = 0;
    return config;
  }

  // Runs a whole server session into a memory link and returns the
  // receiving end with every packet queued.
  std::unique_ptr<MemoryTransport> RunIntoMemory(const ServerConfig& config) {
    StreamServer server(config, nullptr);
    EXPECT_TRUE(server.Open(clip_path_).ok());

    std::unique_ptr<MemoryTransport> server_end;
    std::unique_ptr<MemoryTransport> client_end;
    CreateMemoryTransportPair(server_end, client_end);
    EXPECT_TRUE(server.RunSession(*server_end).ok());
    server_end->Close();
    return client_end;
  }

  TempDir dir_;
  std::string clip_path_;
  std::vector<std::vector<uint8_t>> frames_;
};

TEST_F(StreamSessionContractTest, SS_001_ConnectionlessSessionAnnouncesAroundTheFrames) {
  ServerConfig config = MemoryServerConfig(StreamMode::kUdpUnicast);
  auto client_end = RunIntoMemory(config);

  std::vector<PacketType> expected = {PacketType::kMetadata, PacketType::kConfig};
  for (size_t i = 0; i < frames_.size(); ++i) {
    expected.push_back(PacketType::kFrame);
  }
  expected.insert(expected.end(), {PacketType::kMetadata, PacketType::kConfig, PacketType::kEnd,
                                   PacketType::kEnd, PacketType::kEnd});
  EXPECT_EQ(DrainTypes(*client_end), expected);
}

TEST_F(StreamSessionContractTest, SS_002_ConnectionOrientedSessionAnnouncesOnce) {
  ServerConfig config = MemoryServerConfig(StreamMode::kTcpUnicast);
  config.announce_interval_frames = 2;

  std::unique_ptr<MemoryTransport> server_end;
  std::unique_ptr<MemoryTransport> client_end;
  CreateMemoryTransportPair(server_end, client_end);
  StreamServer server(config, nullptr);
  ASSERT_TRUE(server.Open(clip_path_).ok());
  ASSERT_TRUE(server.RunSession(*server_end).ok());
  server_end->Close();

  uint32_t expected_sequence = 0;
  std::vector<PacketType> types;
  Packet packet;
  while (client_end->Receive(packet, 10).ok()) {
    EXPECT_EQ(packet.sequence, expected_sequence++);
    types.push_back(packet.type);
  }

  std::vector<PacketType> expected = {PacketType::kMetadata, PacketType::kConfig};
  for (size_t i = 0; i < frames_.size(); ++i) {
    expected.push_back(PacketType::kFrame);
  }
  expected.push_back(PacketType::kEnd);
  EXPECT_EQ(types, expected);

  const SessionStats stats = server.GetSessionStats();
  EXPECT_EQ(stats.sessions, 1u);
  EXPECT_EQ(stats.frames_sent, frames_.size());
  EXPECT_EQ(stats.packets_sent, expected.size());
}

TEST_F(StreamSessionContractTest, SS_003_LateJoinerReplaysBufferedFrames) {
  ServerConfig config = MemoryServerConfig(StreamMode::kUdpUnicast);
  config.announce_interval_frames = 3;
  auto client_end = RunIntoMemory(config);

  // Miss the opening announcement.
  Packet skipped;
  ASSERT_TRUE(client_end->Receive(skipped, 10).ok());
  EXPECT_EQ(skipped.type, PacketType::kMetadata);
  ASSERT_TRUE(client_end->Receive(skipped, 10).ok());
  EXPECT_EQ(skipped.type, PacketType::kConfig);

  ClientConfig client_config;
  client_config.mode = StreamMode::kUdpUnicast;
  client_config.receive_timeout_ms = 50;
  StreamClient client(client_config);
  client.Attach(std::move(client_end), false);

  std::vector<uint32_t> indices;
  ReceivedFrame frame;
  while (client.Next(frame)) {
    ASSERT_LT(frame.frame_index, frames_.size());
    EXPECT_EQ(frame.data, frames_[frame.frame_index]);
    indices.push_back(frame.frame_index);
  }

  EXPECT_TRUE(client.status().ok()) << client.status().ToString();
  EXPECT_EQ(indices, (std::vector<uint32_t>{0, 1, 2, 3, 4, 5, 6}));
  const ClientStats stats = client.GetStats();
  EXPECT_EQ(stats.frames_dropped, 0u);
  EXPECT_EQ(stats.presync_discarded, 0u);
  EXPECT_EQ(client.metadata().title, "test clip");
}

TEST_F(StreamSessionContractTest, SS_004_AudioSideChannelCompletes) {
  const std::string audio_path = dir_.File("track.raw");
  const std::vector<uint8_t> audio = WriteAudio(audio_path, 3000);

  ServerConfig config = MemoryServerConfig(StreamMode::kUdpUnicast);
  config.audio_path = audio_path;
  auto client_end = RunIntoMemory(config);

  ClientConfig client_config;
  client_config.mode = StreamMode::kUdpUnicast;
  client_config.receive_timeout_ms = 50;
  StreamClient client(client_config);
  client.Attach(std::move(client_end), false);

  ReceivedFrame frame;
  uint32_t received = 0;
  while (client.Next(frame)) {
    ++received;
  }
  EXPECT_EQ(received, frames_.size());
  ASSERT_TRUE(client.audio_complete());
  EXPECT_EQ(client.audio_data(), audio);
}

TEST_F(StreamSessionContractTest, SS_005_EndClosesTheSessionCleanly) {
  ServerConfig config = MemoryServerConfig(StreamMode::kTcpUnicast);
  auto client_end = RunIntoMemory(config);

  ClientConfig client_config;
  client_config.receive_timeout_ms = 50;
  StreamClient client(client_config);
  client.Attach(std::move(client_end), true);

  media::RgbFrame frame;
  uint32_t received = 0;
  while (client.Next(frame)) {
    EXPECT_EQ(frame.width, kWidth);
    EXPECT_EQ(frame.height, kHeight);
    EXPECT_EQ(frame.data, frames_[frame.index]);
    ++received;
  }
  EXPECT_EQ(received, frames_.size());
  EXPECT_TRUE(client.status().ok());
  EXPECT_EQ(client.state(), SessionStateMachine::State::kEnded);
  EXPECT_EQ(client.config().frame_count, frames_.size());
  EXPECT_FALSE(client.Next(frame));
}

TEST_F(StreamSessionContractTest, SS_006_SilenceAndPeerCloseDisconnect) {
  // Peer stays open but silent.
  {
    std::unique_ptr<MemoryTransport> server_end;
    std::unique_ptr<MemoryTransport> client_end;
    CreateMemoryTransportPair(server_end, client_end);

    ClientConfig client_config;
    client_config.receive_timeout_ms = 20;
    client_config.max_consecutive_timeouts = 2;
    StreamClient client(client_config);
    client.Attach(std::move(client_end), true);

    ReceivedFrame frame;
    EXPECT_FALSE(client.Next(frame));
    EXPECT_EQ(client.status().code(), ErrorCode::kDisconnected);
    EXPECT_EQ(client.state(), SessionStateMachine::State::kDisconnected);
  }

  // Peer goes away before END.
  {
    std::unique_ptr<MemoryTransport> server_end;
    std::unique_ptr<MemoryTransport> client_end;
    CreateMemoryTransportPair(server_end, client_end);
    server_end->Close();

    StreamClient client(ClientConfig{});
    client.Attach(std::move(client_end), true);

    ReceivedFrame frame;
    EXPECT_FALSE(client.Next(frame));
    EXPECT_EQ(client.status().code(), ErrorCode::kDisconnected);
  }
}

TEST_F(StreamSessionContractTest, SS_007_CancelStopsTheSession) {
  std::unique_ptr<MemoryTransport> server_end;
  std::unique_ptr<MemoryTransport> client_end;
  CreateMemoryTransportPair(server_end, client_end);

  StreamClient client(ClientConfig{});
  client.Attach(std::move(client_end), true);
  client.Cancel();

  ReceivedFrame frame;
  EXPECT_FALSE(client.Next(frame));
  EXPECT_EQ(client.status().code(), ErrorCode::kCancelled);
  EXPECT_EQ(client.state(), SessionStateMachine::State::kDisconnected);
}

TEST_F(StreamSessionContractTest, SS_008_MalformedPacketsAndMetrics) {
  // Connection-oriented: a malformed CONFIG ends the session.
  {
    std::unique_ptr<MemoryTransport> server_end;
    std::unique_ptr<MemoryTransport> client_end;
    CreateMemoryTransportPair(server_end, client_end);

    Packet bad;
    bad.type = PacketType::kConfig;
    bad.payload = {0x01, 0x02};
    ASSERT_TRUE(server_end->Send(bad).ok());

    StreamClient client(ClientConfig{});
    client.Attach(std::move(client_end), true);
    ReceivedFrame frame;
    EXPECT_FALSE(client.Next(frame));
    EXPECT_EQ(client.status().code(), ErrorCode::kInvalidFormat);
  }

  // Connectionless: it is skipped and the session still completes.
  auto exporter = std::make_shared<telemetry::MetricsExporter>(0, false);
  ServerConfig config = MemoryServerConfig(StreamMode::kUdpUnicast);
  StreamServer server(config, nullptr);
  ASSERT_TRUE(server.Open(clip_path_).ok());

  std::unique_ptr<MemoryTransport> server_end;
  std::unique_ptr<MemoryTransport> client_end;
  CreateMemoryTransportPair(server_end, client_end);
  Packet bad;
  bad.type = PacketType::kConfig;
  bad.payload = {0x01, 0x02};
  ASSERT_TRUE(server_end->Send(bad).ok());
  ASSERT_TRUE(server.RunSession(*server_end).ok());
  server_end->Close();

  ClientConfig client_config;
  client_config.mode = StreamMode::kUdpUnicast;
  client_config.receive_timeout_ms = 50;
  client_config.metrics = exporter;
  StreamClient client(client_config);
  client.Attach(std::move(client_end), false);

  ReceivedFrame frame;
  uint32_t received = 0;
  while (client.Next(frame)) {
    ++received;
  }
  EXPECT_TRUE(client.status().ok());
  EXPECT_EQ(received, frames_.size());

  telemetry::SessionMetrics metrics;
  ASSERT_TRUE(exporter->GetSessionMetrics(1, metrics));
  EXPECT_EQ(metrics.role, telemetry::SessionRole::kClient);
  EXPECT_EQ(metrics.phase, telemetry::SessionPhase::kEnded);
  EXPECT_EQ(metrics.frames_total, frames_.size());
  EXPECT_EQ(metrics.mode, "udp");
}

TEST_F(StreamSessionContractTest, SS_008_OversizedHeadersAreIgnoredWithoutAllocating) {
  const std::string audio_path = dir_.File("track.raw");
  const std::vector<uint8_t> audio = WriteAudio(audio_path, 3000);
  ServerConfig config = MemoryServerConfig(StreamMode::kUdpUnicast);
  config.audio_path = audio_path;
  auto recorded = RunIntoMemory(config);
  const std::vector<Packet> session = DrainPackets(*recorded);

  std::unique_ptr<MemoryTransport> server_end;
  std::unique_ptr<MemoryTransport> client_end;
  CreateMemoryTransportPair(server_end, client_end);

  AudioPayload audio_bomb;
  audio_bomb.chunk_index = 0;
  audio_bomb.chunk_count = 0xFFFFFFF0u;
  audio_bomb.data = {1, 2, 3};
  Packet bomb;
  bomb.type = PacketType::kAudio;
  EncodeAudio(audio_bomb, bomb.payload);
  ASSERT_TRUE(server_end->Send(bomb).ok());

  // Structurally valid chunk whose stored_length is ~4 GB.
  ChunkPayload huge;
  huge.frame_serial = 3;
  huge.frame_index = 3;
  huge.chunk_count = 65535;
  huge.chunk_size = 65535;
  huge.stored_length = 4294836000u;
  huge.raw_length = kWidth * kHeight * 3;
  huge.data.assign(100, 0xAB);

  // Raw length that does not match the announced 4x4 frames.
  ChunkPayload wrong_raw;
  wrong_raw.frame_serial = 4;
  wrong_raw.frame_index = 4;
  wrong_raw.chunk_count = 1;
  wrong_raw.chunk_size = 40;
  wrong_raw.stored_length = 40;
  wrong_raw.raw_length = 4096;
  wrong_raw.data.assign(40, 0xCD);

  bool injected = false;
  for (const Packet& packet : session) {
    ASSERT_TRUE(server_end->Send(packet).ok());
    if (!injected && packet.type == PacketType::kConfig) {
      ASSERT_TRUE(server_end->Send(ChunkPacket(huge)).ok());
      ASSERT_TRUE(server_end->Send(ChunkPacket(wrong_raw)).ok());
      injected = true;
    }
  }
  ASSERT_TRUE(injected);
  server_end->Close();

  ClientConfig client_config;
  client_config.mode = StreamMode::kUdpMulticast;
  client_config.receive_timeout_ms = 50;
  StreamClient client(client_config);
  client.Attach(std::move(client_end), false);

  std::vector<uint32_t> indices;
  ReceivedFrame frame;
  while (client.Next(frame)) {
    EXPECT_EQ(frame.data, frames_[frame.frame_index]);
    indices.push_back(frame.frame_index);
  }
  EXPECT_TRUE(client.status().ok()) << client.status().ToString();
  EXPECT_EQ(indices, (std::vector<uint32_t>{0, 1, 2, 3, 4, 5, 6}));
  EXPECT_EQ(client.GetStats().ignored_packets, 2u);
  EXPECT_EQ(client.GetStats().frames_dropped, 0u);
  ASSERT_TRUE(client.audio_complete());
  EXPECT_EQ(client.audio_data(), audio);
}

TEST_F(StreamSessionContractTest, SS_009_LoopReplaysFramesWithMonotonicSerials) {
  ServerConfig config = MemoryServerConfig(StreamMode::kUdpUnicast);
  config.loop = true;
  config.announce_interval_frames = 0;

  std::unique_ptr<format::Container> opened;
  ASSERT_TRUE(format::Container::Open(clip_path_, opened).ok());
  std::shared_ptr<const format::Container> container(std::move(opened));
  ServerSession session(config, container, nullptr, timing::MakeSystemMasterClock());

  std::unique_ptr<MemoryTransport> server_end;
  std::unique_ptr<MemoryTransport> client_end;
  CreateMemoryTransportPair(server_end, client_end);

  // Two full passes and three frames into the third.
  constexpr uint32_t kFramesSent = 17;
  std::atomic<bool> stop(false);
  StopAfterFramesTransport link(*server_end, kFramesSent, stop);
  ASSERT_TRUE(session.Run(link, stop).ok());
  server_end->Close();
  EXPECT_EQ(session.stats().frames_sent, kFramesSent);

  ClientConfig client_config;
  client_config.mode = StreamMode::kUdpUnicast;
  client_config.receive_timeout_ms = 50;
  StreamClient client(client_config);
  client.Attach(std::move(client_end), false);

  uint32_t expected_serial = 0;
  ReceivedFrame frame;
  while (client.Next(frame)) {
    EXPECT_EQ(frame.frame_serial, expected_serial);
    EXPECT_EQ(frame.frame_index, expected_serial % frames_.size());
    EXPECT_EQ(frame.data, frames_[frame.frame_index]);
    ++expected_serial;
  }
  EXPECT_EQ(expected_serial, kFramesSent);
  EXPECT_TRUE(client.status().ok()) << client.status().ToString();
  EXPECT_EQ(client.state(), SessionStateMachine::State::kEnded);
  EXPECT_EQ(client.GetStats().frames_dropped, 0u);
}

TEST_F(StreamSessionContractTest, SS_010_IdleConnectionOrientedSessionSendsKeepalives) {
  // Two frames per second leave long idle gaps between frames.
  const std::string slow_clip = dir_.File("slow.sanchez");
  const std::vector<std::vector<uint8_t>> frames = PatternFrames(3);
  ASSERT_TRUE(FrameFactory::WriteContainer(slow_clip, kWidth, kHeight, frames, true, 2.0).ok());

  auto clock = std::make_shared<timing::TestMasterClock>(1'000'000);
  clock->SetMaxWaitUs(20'000);

  ServerConfig config;
  config.mode = StreamMode::kTcpUnicast;
  config.realtime_pacing = true;
  config.keepalive_interval_ms = 100;
  StreamServer server(config, clock);
  ASSERT_TRUE(server.Open(slow_clip).ok());

  std::unique_ptr<MemoryTransport> server_end;
  std::unique_ptr<MemoryTransport> client_end;
  CreateMemoryTransportPair(server_end, client_end);

  std::atomic<bool> done(false);
  Status session_status;
  std::thread session_thread([&]() {
    session_status = server.RunSession(*server_end);
    done.store(true, std::memory_order_release);
  });
  while (!done.load(std::memory_order_acquire)) {
    clock->AdvanceMicroseconds(50'000);
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  session_thread.join();
  server_end->Close();
  ASSERT_TRUE(session_status.ok()) << session_status.ToString();

  const SessionStats stats = server.GetSessionStats();
  EXPECT_EQ(stats.frames_sent, frames.size());
  EXPECT_GE(stats.keepalives_sent, 1u);

  ClientConfig client_config;
  client_config.receive_timeout_ms = 50;
  StreamClient client(client_config);
  client.Attach(std::move(client_end), true);

  uint32_t received = 0;
  ReceivedFrame frame;
  while (client.Next(frame)) {
    EXPECT_EQ(frame.data, frames[frame.frame_index]);
    ++received;
  }
  EXPECT_EQ(received, frames.size());
  EXPECT_TRUE(client.status().ok()) << client.status().ToString();
  EXPECT_EQ(client.GetStats().packets_received, stats.packets_sent);
}

TEST_F(StreamSessionContractTest, SS_011_PreSyncOverflow) {
  const std::vector<uint8_t> data = FrameFactory::Pattern(kWidth, kHeight, 1);

  // Connection-oriented: desync ends the session.
  {
    std::unique_ptr<MemoryTransport> server_end;
    std::unique_ptr<MemoryTransport> client_end;
    CreateMemoryTransportPair(server_end, client_end);
    for (uint32_t serial = 0; serial <= kPreSyncWindowPackets; ++serial) {
      ASSERT_TRUE(server_end->Send(FramePacket(serial, data)).ok());
    }

    ClientConfig client_config;
    client_config.receive_timeout_ms = 50;
    StreamClient client(client_config);
    client.Attach(std::move(client_end), true);

    ReceivedFrame frame;
    EXPECT_FALSE(client.Next(frame));
    EXPECT_EQ(client.status().code(), ErrorCode::kSessionDesync);
    EXPECT_EQ(client.state(), SessionStateMachine::State::kDisconnected);
  }

  // Connectionless: the oldest packets are discarded and counted.
  {
    std::unique_ptr<MemoryTransport> server_end;
    std::unique_ptr<MemoryTransport> client_end;
    CreateMemoryTransportPair(server_end, client_end);
    const uint32_t overflow = 8;
    for (uint32_t serial = 0; serial < kPreSyncWindowPackets + overflow; ++serial) {
      ASSERT_TRUE(server_end->Send(FramePacket(serial, data)).ok());
    }
    server_end->Close();

    ClientConfig client_config;
    client_config.mode = StreamMode::kUdpUnicast;
    client_config.receive_timeout_ms = 50;
    StreamClient client(client_config);
    client.Attach(std::move(client_end), false);

    ReceivedFrame frame;
    EXPECT_FALSE(client.Next(frame));
    EXPECT_EQ(client.status().code(), ErrorCode::kDisconnected);
    // Overflowed packets plus the buffer released at teardown.
    EXPECT_EQ(client.GetStats().presync_discarded, kPreSyncWindowPackets + overflow);
  }
}

TEST_F(StreamSessionContractTest, SS_012_GroupSessionsStopWithoutEnd) {
  const std::vector<PacketType> announcement = {PacketType::kMetadata, PacketType::kConfig};
  for (StreamMode mode : {StreamMode::kUdpMulticast, StreamMode::kUdpBroadcast}) {
    auto client_end = RunIntoMemory(MemoryServerConfig(mode));
    std::vector<PacketType> expected = announcement;
    for (size_t i = 0; i < frames_.size(); ++i) {
      expected.push_back(PacketType::kFrame);
    }
    expected.insert(expected.end(), announcement.begin(), announcement.end());
    EXPECT_EQ(DrainTypes(*client_end), expected) << StreamModeToString(mode);
  }

  // A multicast receiver keeps every frame and leaves on silence.
  StreamServer server(MemoryServerConfig(StreamMode::kUdpMulticast), nullptr);
  ASSERT_TRUE(server.Open(clip_path_).ok());
  std::unique_ptr<MemoryTransport> server_end;
  std::unique_ptr<MemoryTransport> client_end;
  CreateMemoryTransportPair(server_end, client_end);
  ASSERT_TRUE(server.RunSession(*server_end).ok());

  ClientConfig client_config;
  client_config.mode = StreamMode::kUdpMulticast;
  client_config.receive_timeout_ms = 20;
  client_config.max_consecutive_timeouts = 2;
  StreamClient client(client_config);
  client.Attach(std::move(client_end), false);

  uint32_t received = 0;
  ReceivedFrame frame;
  while (client.Next(frame)) {
    ++received;
  }
  EXPECT_EQ(received, frames_.size());
  EXPECT_EQ(client.status().code(), ErrorCode::kDisconnected);
  EXPECT_EQ(client.state(), SessionStateMachine::State::kDisconnected);
}

}  // namespace sanchez::tests::contracts
