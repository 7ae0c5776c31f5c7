#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "fixtures/FrameFactory.h"
#include "fixtures/TempDir.h"
#include "sanchez/format/Container.h"
#include "sanchez/renderer/FramePlayer.h"
#include "sanchez/renderer/PlaybackSurface.h"
#include "sanchez/stream/LossyTransport.h"
#include "sanchez/stream/MemoryTransport.h"
#include "sanchez/stream/StreamClient.h"
#include "sanchez/stream/StreamRecorder.h"
#include "sanchez/stream/StreamServer.h"
#include "sanchez/stream/UdpTransport.h"
#include "sanchez/timing/MasterClock.h"

namespace sanchez::tests::integration
{
namespace
{

using fixtures::FrameFactory;
using fixtures::TempDir;
using namespace sanchez::stream;

constexpr uint32_t kFrames = 10;
constexpr uint32_t kLossPercent = 20;
constexpr uint32_t kLossSeed = 8;

class StreamLoopbackIntegrationTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    clip_path_ = dir_.File("solid.sanchez");
    frames_ = FrameFactory::SolidSequence(4, 4, kFrames);
    ASSERT_TRUE(FrameFactory::WriteContainer(clip_path_, 4, 4, frames_).ok());
  }

  // Streams the clip once through a memory link that loses kLossPercent of
  // the server's packets, then drains it with a client.
  ClientStats StreamThroughLossyLink(bool satellite_mode, std::vector<uint32_t>& indices)
  {
    ServerConfig config;
    config.mode = StreamMode::kUdpUnicast;
    config.satellite_mode = satellite_mode;
    config.fec_group_size = 4;
    config.realtime_pacing = false;
    StreamServer server(config, nullptr);
    EXPECT_TRUE(server.Open(clip_path_).ok());

    std::unique_ptr<MemoryTransport> server_end;
    std::unique_ptr<MemoryTransport> client_end;
    CreateMemoryTransportPair(server_end, client_end);
    LossyTransport lossy(std::move(server_end), kLossPercent, kLossSeed);
    EXPECT_TRUE(server.RunSession(lossy).ok());
    lossy.Close();

    ClientConfig client_config;
    client_config.mode = StreamMode::kUdpUnicast;
    client_config.receive_timeout_ms = 50;
    StreamClient client(client_config);
    client.Attach(std::move(client_end), false);

    ReceivedFrame frame;
    while (client.Next(frame))
    {
      EXPECT_EQ(frame.data, frames_[frame.frame_index]);
      indices.push_back(frame.frame_index);
    }
    EXPECT_TRUE(client.status().ok()) << client.status().ToString();
    return client.GetStats();
  }

  TempDir dir_;
  std::string clip_path_;
  std::vector<std::vector<uint8_t>> frames_;
};

TEST_F(StreamLoopbackIntegrationTest, TcpLoopbackDeliversEveryFrame)
{
  ServerConfig config;
  config.mode = StreamMode::kTcpUnicast;
  config.host = "127.0.0.1";
  config.port = 0;
  config.realtime_pacing = false;
  StreamServer server(config, timing::MakeSystemMasterClock());
  ASSERT_TRUE(server.Start(clip_path_).ok());
  ASSERT_NE(server.BoundPort(), 0);

  ClientConfig client_config;
  client_config.client_name = "loopback-test";
  StreamClient client(client_config);
  ASSERT_TRUE(client.ReceiveStream("127.0.0.1", server.BoundPort()).ok());

  std::vector<uint32_t> indices;
  ReceivedFrame frame;
  while (client.Next(frame))
  {
    EXPECT_EQ(frame.data, frames_[frame.frame_index]);
    indices.push_back(frame.frame_index);
  }

  EXPECT_TRUE(client.status().ok()) << client.status().ToString();
  EXPECT_EQ(client.state(), SessionStateMachine::State::kEnded);
  EXPECT_EQ(client.metadata().title, "test clip");
  EXPECT_EQ(client.metadata().creator, "sanchez tests");
  EXPECT_DOUBLE_EQ(client.config().fps, 24.0);
  EXPECT_EQ(indices, (std::vector<uint32_t>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));

  const ClientStats stats = client.GetStats();
  EXPECT_EQ(stats.frames_received, kFrames);
  EXPECT_EQ(stats.frames_dropped, 0u);
  EXPECT_EQ(stats.packets_lost_estimate, 0u);

  server.Stop();
  EXPECT_FALSE(server.isRunning());
  const SessionStats served = server.GetSessionStats();
  EXPECT_EQ(served.sessions, 1u);
  EXPECT_EQ(served.frames_sent, kFrames);
}

TEST_F(StreamLoopbackIntegrationTest, ParityKeepsLossyLinkDropsBelowBaseline)
{
  std::vector<uint32_t> satellite_indices;
  const ClientStats satellite = StreamThroughLossyLink(true, satellite_indices);

  std::vector<uint32_t> baseline_indices;
  const ClientStats baseline = StreamThroughLossyLink(false, baseline_indices);

  EXPECT_LT(static_cast<double>(satellite.frames_dropped) / kFrames, 0.2);
  EXPECT_GT(satellite.parity_recoveries, 0u);
  EXPECT_EQ(satellite.frames_received + satellite.frames_dropped, kFrames);
  EXPECT_LT(satellite.frames_dropped, baseline.frames_dropped);
  EXPECT_EQ(baseline.frames_received + baseline.frames_dropped, kFrames);

  for (size_t i = 1; i < satellite_indices.size(); ++i)
  {
    EXPECT_LT(satellite_indices[i - 1], satellite_indices[i]);
  }
}

TEST_F(StreamLoopbackIntegrationTest, RecorderRebuildsTheClipAndItsAudio)
{
  std::vector<uint8_t> audio(2000, 0x5a);
  const std::string audio_path = dir_.File("track.mp3");
  {
    std::ofstream out(audio_path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(audio.data()),
              static_cast<std::streamsize>(audio.size()));
  }

  ServerConfig config;
  config.mode = StreamMode::kTcpUnicast;
  config.realtime_pacing = false;
  config.audio_path = audio_path;
  StreamServer server(config, nullptr);
  ASSERT_TRUE(server.Open(clip_path_).ok());

  std::unique_ptr<MemoryTransport> server_end;
  std::unique_ptr<MemoryTransport> client_end;
  CreateMemoryTransportPair(server_end, client_end);
  ASSERT_TRUE(server.RunSession(*server_end).ok());
  server_end->Close();

  StreamClient client(ClientConfig{});
  client.Attach(std::move(client_end), true);

  const std::string recording = dir_.File("recorded.sanchez");
  RecordReport report;
  const Status status = StreamRecorder::Record(client, recording, RecordOptions(), &report);
  ASSERT_TRUE(status.ok()) << status.ToString();
  EXPECT_EQ(report.frames_recorded, kFrames);
  EXPECT_TRUE(report.stream_status.ok());
  EXPECT_EQ(report.audio_path, dir_.File("recorded.mp3"));

  std::unique_ptr<format::Container> container;
  ASSERT_TRUE(format::Container::Open(recording, container).ok());
  EXPECT_EQ(container->metadata().title, "test clip (stream)");
  EXPECT_EQ(container->frame_count(), kFrames);
  for (uint32_t i = 0; i < kFrames; ++i)
  {
    std::vector<uint8_t> raw;
    ASSERT_TRUE(container->GetFrame(i, raw).ok());
    EXPECT_EQ(raw, frames_[i]);
  }

  std::ifstream saved(report.audio_path, std::ios::binary);
  const std::vector<uint8_t> saved_audio((std::istreambuf_iterator<char>(saved)),
                                         std::istreambuf_iterator<char>());
  EXPECT_EQ(saved_audio, audio);
}

TEST_F(StreamLoopbackIntegrationTest, RecorderStopsAtMaxFrames)
{
  ServerConfig config;
  config.mode = StreamMode::kTcpUnicast;
  config.realtime_pacing = false;
  StreamServer server(config, nullptr);
  ASSERT_TRUE(server.Open(clip_path_).ok());

  std::unique_ptr<MemoryTransport> server_end;
  std::unique_ptr<MemoryTransport> client_end;
  CreateMemoryTransportPair(server_end, client_end);
  ASSERT_TRUE(server.RunSession(*server_end).ok());
  server_end->Close();

  StreamClient client(ClientConfig{});
  client.Attach(std::move(client_end), true);

  RecordOptions options;
  options.max_frames = 3;
  options.save_audio = false;
  RecordReport report;
  const std::string recording = dir_.File("partial.sanchez");
  ASSERT_TRUE(StreamRecorder::Record(client, recording, options, &report).ok());
  EXPECT_EQ(report.frames_recorded, 3u);
  EXPECT_TRUE(report.audio_path.empty());

  std::unique_ptr<format::Container> container;
  ASSERT_TRUE(format::Container::Open(recording, container).ok());
  EXPECT_EQ(container->frame_count(), 3u);
}

TEST_F(StreamLoopbackIntegrationTest, PlayerPresentsContainerFramesHeadless)
{
  std::unique_ptr<format::Container> container;
  ASSERT_TRUE(format::Container::Open(clip_path_, container).ok());
  auto frames = container->Frames();

  renderer::PlayerConfig config;
  config.fps = container->config().fps;
  config.realtime_pacing = false;
  renderer::FramePlayer player(config, timing::MakeSystemMasterClock());
  renderer::HeadlessSurface surface;

  const Status status = player.Play(*frames, surface);
  EXPECT_TRUE(status.ok()) << status.ToString();
  EXPECT_EQ(player.stats().frames_presented, kFrames);
  EXPECT_EQ(surface.frames_presented(), kFrames);
  EXPECT_EQ(surface.frames_rejected(), 0u);
  EXPECT_FALSE(surface.is_open());
}

TEST_F(StreamLoopbackIntegrationTest, UnicastReceiverAcceptsARemoteServerAddress)
{
  // 192.0.2.1 (TEST-NET-1) is never a local address.
  std::unique_ptr<UdpTransport> receiver;
  Status status =
      UdpTransport::OpenReceiver(StreamMode::kUdpUnicast, "192.0.2.1", 0, "", receiver);
  ASSERT_TRUE(status.ok()) << status.ToString();
  ASSERT_GT(receiver->local_port(), 0u);

  std::unique_ptr<UdpTransport> sender;
  status = UdpTransport::OpenSender(StreamMode::kUdpUnicast, "127.0.0.1",
                                    receiver->local_port(), 4, sender);
  ASSERT_TRUE(status.ok()) << status.ToString();

  Packet sent;
  sent.type = PacketType::kKeepalive;
  sent.sequence = 42;
  ASSERT_TRUE(sender->Send(sent).ok());

  Packet received;
  status = receiver->Receive(received, 1000);
  ASSERT_TRUE(status.ok()) << status.ToString();
  EXPECT_EQ(received.type, PacketType::kKeepalive);
  EXPECT_EQ(received.sequence, 42u);
}

TEST_F(StreamLoopbackIntegrationTest, PlayerStartsAtRequestedFrame)
{
  std::unique_ptr<format::Container> container;
  ASSERT_TRUE(format::Container::Open(clip_path_, container).ok());

  renderer::PlayerConfig config;
  config.realtime_pacing = false;
  config.start_frame = 6;
  renderer::FramePlayer player(config, timing::MakeSystemMasterClock());
  renderer::HeadlessSurface surface;

  auto frames = container->Frames();
  Status status = player.Play(*frames, surface);
  EXPECT_TRUE(status.ok()) << status.ToString();
  EXPECT_EQ(player.stats().frames_skipped, 6u);
  EXPECT_EQ(player.stats().frames_presented, kFrames - 6);
  EXPECT_EQ(surface.frames_presented(), kFrames - 6);

  config.start_frame = kFrames + 5;
  renderer::FramePlayer past_end(config, timing::MakeSystemMasterClock());
  renderer::HeadlessSurface unused;
  auto again = container->Frames();
  status = past_end.Play(*again, unused);
  EXPECT_EQ(status.code(), ErrorCode::kIndexOutOfRange);
  EXPECT_EQ(past_end.stats().frames_skipped, kFrames);
  EXPECT_EQ(past_end.stats().frames_presented, 0u);
}

}  // namespace
}  // namespace sanchez::tests::integration
