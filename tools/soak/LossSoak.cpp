#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <numeric>
#include <string>
#include <string_view>
#include <vector>

#include <unistd.h>

#include "sanchez/format/ContainerBuilder.h"
#include "sanchez/stream/LossyTransport.h"
#include "sanchez/stream/MemoryTransport.h"
#include "sanchez/stream/StreamClient.h"
#include "sanchez/stream/StreamServer.h"
#include "sanchez/telemetry/MetricsExporter.h"
#include "sanchez/timing/MasterClock.h"

namespace
{
  constexpr uint32_t kDefaultFrames = 60;
  constexpr uint32_t kDefaultTrials = 20;

  struct ParsedArgs
  {
    uint32_t frames = kDefaultFrames;
    uint32_t width = 32;
    uint32_t height = 24;
    uint32_t trials = kDefaultTrials;
    uint32_t seed = 1;
    uint16_t fec_group_size = 4;
    bool compress = true;
    int metrics_port = 0;
  };

  ParsedArgs ParseArgs(int argc, char **argv)
  {
    ParsedArgs args;
    for (int i = 1; i < argc; ++i)
    {
      const std::string_view arg(argv[i]);
      if (arg == "--frames" && i + 1 < argc)
      {
        args.frames = static_cast<uint32_t>(std::stoul(argv[++i]));
      }
      else if (arg == "--width" && i + 1 < argc)
      {
        args.width = static_cast<uint32_t>(std::stoul(argv[++i]));
      }
      else if (arg == "--height" && i + 1 < argc)
      {
        args.height = static_cast<uint32_t>(std::stoul(argv[++i]));
      }
      else if (arg == "--trials" && i + 1 < argc)
      {
        args.trials = std::max<uint32_t>(1, static_cast<uint32_t>(std::stoul(argv[++i])));
      }
      else if (arg == "--seed" && i + 1 < argc)
      {
        args.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
      }
      else if (arg == "--fec-group-size" && i + 1 < argc)
      {
        args.fec_group_size = static_cast<uint16_t>(std::clamp(std::stoi(argv[++i]), 1, 64));
      }
      else if (arg == "--no-compression")
      {
        args.compress = false;
      }
      else if (arg == "--metrics-port" && i + 1 < argc)
      {
        args.metrics_port = std::stoi(argv[++i]);
      }
    }
    return args;
  }

  double Mean(const std::vector<double> &values)
  {
    if (values.empty())
      return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
  }

  double P95(std::vector<double> values)
  {
    if (values.empty())
      return 0.0;
    std::sort(values.begin(), values.end());
    const double rank = 0.95 * static_cast<double>(values.size() - 1);
    const auto lo = static_cast<size_t>(std::floor(rank));
    const auto hi = static_cast<size_t>(std::ceil(rank));
    const double fraction = rank - static_cast<double>(lo);
    return values[lo] + (values[hi] - values[lo]) * fraction;
  }

  // Diagonal gradient that changes every frame.
  sanchez::Status WriteSyntheticContainer(const ParsedArgs &args, const std::string &path)
  {
    sanchez::format::BuilderOptions options;
    options.fps = 30.0;
    options.compression_enabled = args.compress;
    sanchez::format::ContainerBuilder builder("loss soak", "sanchez_loss_soak", args.width,
                                              args.height, options);
    std::vector<uint8_t> frame(static_cast<size_t>(args.width) * args.height * 3);
    for (uint32_t n = 0; n < args.frames; ++n)
    {
      for (uint32_t y = 0; y < args.height; ++y)
      {
        for (uint32_t x = 0; x < args.width; ++x)
        {
          uint8_t *px = &frame[(static_cast<size_t>(y) * args.width + x) * 3];
          px[0] = static_cast<uint8_t>(x * 7 + n);
          px[1] = static_cast<uint8_t>(y * 5 + n * 3);
          px[2] = static_cast<uint8_t>((x ^ y) + n * 11);
        }
      }
      sanchez::Status status = builder.AppendFrame(frame);
      if (!status.ok())
        return status;
    }
    return builder.Save(path);
  }

  struct TrialResult
  {
    double drop_ratio = 0.0;
    uint64_t recoveries = 0;
  };

  sanchez::Status RunTrial(sanchez::stream::StreamServer &server,
                           const std::shared_ptr<sanchez::telemetry::MetricsExporter> &metrics,
                           uint32_t loss_percent, uint32_t seed, uint32_t frames,
                           TrialResult &result)
  {
    using namespace sanchez::stream;
    std::unique_ptr<MemoryTransport> server_end;
    std::unique_ptr<MemoryTransport> client_end;
    CreateMemoryTransportPair(server_end, client_end);

    LossyTransport lossy(std::move(server_end), loss_percent, seed);
    sanchez::Status status = server.RunSession(lossy);
    lossy.Close();
    if (!status.ok())
      return status;

    ClientConfig client_config;
    client_config.mode = StreamMode::kUdpUnicast;
    client_config.receive_timeout_ms = 50;
    client_config.max_consecutive_timeouts = 1;
    client_config.metrics = metrics;
    StreamClient client(client_config);
    client.Attach(std::move(client_end), false);

    ReceivedFrame frame;
    while (client.Next(frame))
    {
    }
    const ClientStats stats = client.GetStats();
    const uint64_t delivered = std::min<uint64_t>(stats.frames_received, frames);
    result.drop_ratio = static_cast<double>(frames - delivered) / static_cast<double>(frames);
    result.recoveries = stats.parity_recoveries;
    return sanchez::Status::Ok();
  }

} // namespace

int main(int argc, char **argv)
{
  using namespace sanchez;
  const ParsedArgs args = ParseArgs(argc, argv);

  std::shared_ptr<telemetry::MetricsExporter> metrics;
  if (args.metrics_port > 0)
  {
    metrics = std::make_shared<telemetry::MetricsExporter>(args.metrics_port);
    if (!metrics->Start())
    {
      std::cerr << "[loss_soak] cannot start metrics exporter" << std::endl;
      return EXIT_FAILURE;
    }
  }

  const std::string path =
      (std::filesystem::temp_directory_path() /
       ("sanchez_loss_soak_" + std::to_string(::getpid()) + ".sanchez"))
          .string();
  Status status = WriteSyntheticContainer(args, path);
  if (!status.ok())
  {
    std::cerr << "[loss_soak] cannot write container: " << status.ToString() << std::endl;
    return EXIT_FAILURE;
  }

  const std::vector<uint32_t> loss_rates = {0, 5, 10, 20, 30};
  double fec_at_20 = 0.0;
  double plain_at_20 = 0.0;
  int exit_code = EXIT_SUCCESS;

  for (const bool satellite : {false, true})
  {
    stream::ServerConfig server_config;
    server_config.mode = stream::StreamMode::kUdpUnicast;
    server_config.satellite_mode = satellite;
    server_config.fec_group_size = args.fec_group_size;
    server_config.realtime_pacing = false;
    server_config.metrics = metrics;
    stream::StreamServer server(server_config, timing::MakeSystemMasterClock());
    status = server.Open(path);
    if (!status.ok())
    {
      std::cerr << "[loss_soak] cannot open container: " << status.ToString() << std::endl;
      exit_code = EXIT_FAILURE;
      break;
    }

    for (const uint32_t loss : loss_rates)
    {
      std::vector<double> drops;
      uint64_t recoveries = 0;
      for (uint32_t trial = 0; trial < args.trials; ++trial)
      {
        TrialResult result;
        status = RunTrial(server, metrics, loss, args.seed + trial, args.frames, result);
        if (!status.ok())
        {
          std::cerr << "[loss_soak] trial failed: " << status.ToString() << std::endl;
          exit_code = EXIT_FAILURE;
          break;
        }
        drops.push_back(result.drop_ratio);
        recoveries += result.recoveries;
      }
      if (exit_code != EXIT_SUCCESS)
        break;

      const double mean_drop = Mean(drops);
      std::cout << "[loss_soak] mode=" << (satellite ? "satellite" : "udp")
                << " loss_pct=" << loss << " mean_drop_ratio=" << mean_drop
                << " p95_drop_ratio=" << P95(drops) << " parity_recoveries=" << recoveries
                << std::endl;
      if (loss == 20)
      {
        (satellite ? fec_at_20 : plain_at_20) = mean_drop;
      }
    }
    if (exit_code != EXIT_SUCCESS)
      break;
  }

  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (metrics)
    metrics->Stop();

  if (exit_code == EXIT_SUCCESS && fec_at_20 > plain_at_20)
  {
    std::cerr << "[loss_soak] FEC did not reduce frame loss at 20% packet loss" << std::endl;
    exit_code = EXIT_FAILURE;
  }
  if (exit_code == EXIT_SUCCESS)
    std::cout << "[loss_soak] completed successfully" << std::endl;
  return exit_code;
}
