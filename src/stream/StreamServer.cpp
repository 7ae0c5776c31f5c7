// Repository: Sanchez
// Component: Stream Server
// Purpose: Serves a .sanchez container to TCP clients or a UDP destination.
// Copyright (c) 2025 Sanchez

#include "sanchez/stream/StreamServer.h"

#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <utility>

#include "sanchez/stream/Packet.h"
#include "sanchez/stream/UdpTransport.h"

namespace sanchez::stream {

namespace {

constexpr uint32_t kAcceptPollMs = 100;
constexpr uint32_t kHelloTimeoutMs = 2000;
// Sessions get this long to send END after a stop before their sockets are shut.
constexpr auto kStopGrace = std::chrono::milliseconds(1000);

Status ReadAudioFile(const std::string& path, std::vector<uint8_t>& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Status(ErrorCode::kIOError, "cannot open audio file " + path);
  }
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) {
    return Status(ErrorCode::kIOError, "failed reading audio file " + path);
  }
  if (out.size() > kMaxAudioBytes) {
    return Status(ErrorCode::kInvalidFormat,
                  "audio file " + path + " exceeds " + std::to_string(kMaxAudioBytes) + " bytes");
  }
  return Status::Ok();
}

}  // namespace

StreamServer::StreamServer(const ServerConfig& config,
                           std::shared_ptr<timing::MasterClock> master_clock)
    : config_(config), master_clock_(std::move(master_clock)) {
  if (!master_clock_) {
    master_clock_ = timing::MakeSystemMasterClock();
  }
}

StreamServer::~StreamServer() {
  Stop();
}

Status StreamServer::Open(const std::string& container_path) {
  std::unique_ptr<format::Container> container;
  Status status = format::Container::Open(container_path, container);
  if (!status.ok()) {
    std::cerr << "[StreamServer] Cannot open " << container_path << ": " << status.ToString()
              << std::endl;
    return status;
  }

  if (!config_.audio_path.empty()) {
    auto audio = std::make_shared<std::vector<uint8_t>>();
    status = ReadAudioFile(config_.audio_path, *audio);
    if (!status.ok()) {
      std::cerr << "[StreamServer] " << status.ToString() << std::endl;
      return status;
    }
    audio_ = std::move(audio);
  }

  container_ = std::shared_ptr<const format::Container>(std::move(container));
  return Status::Ok();
}

Status StreamServer::Start(const std::string& container_path) {
  if (is_running_.load(std::memory_order_acquire)) {
    return Status(ErrorCode::kIOError, "server already running");
  }
  if (!container_) {
    Status status = Open(container_path);
    if (!status.ok()) {
      return status;
    }
  }

  stop_requested_.store(false, std::memory_order_release);

  if (IsConnectionOriented(config_.mode)) {
    Status status = listener_.Listen(config_.host, config_.port);
    if (!status.ok()) {
      std::cerr << "[StreamServer] Listen failed: " << status.ToString() << std::endl;
      return status;
    }
    bound_port_ = listener_.port();
    is_running_.store(true, std::memory_order_release);
    accept_thread_ = std::thread(&StreamServer::AcceptLoop, this);
    std::cout << "[StreamServer] Listening on " << config_.host << ":" << bound_port_
              << " (max " << config_.max_sessions << " sessions)" << std::endl;
    return Status::Ok();
  }

  std::unique_ptr<UdpTransport> sender;
  Status status = UdpTransport::OpenSender(config_.mode, config_.host, config_.port,
                                           config_.multicast_ttl, sender);
  if (!status.ok()) {
    std::cerr << "[StreamServer] Cannot open UDP sender: " << status.ToString() << std::endl;
    return status;
  }
  bound_port_ = config_.port;
  udp_transport_ = std::move(sender);
  udp_session_ = MakeSession();
  is_running_.store(true, std::memory_order_release);

  std::cout << "[StreamServer] Sending " << StreamModeToString(config_.mode) << " to "
            << config_.host << ":" << bound_port_ << std::endl;
  udp_thread_ = std::thread([this]() {
    Status result = udp_session_->Run(*udp_transport_, stop_requested_);
    if (!result.ok()) {
      std::cerr << "[StreamServer] UDP session ended with " << result.ToString() << std::endl;
    }
    MarkStopped();
  });
  return Status::Ok();
}

void StreamServer::Stop() {
  stop_requested_.store(true, std::memory_order_release);

  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  listener_.Close();

  if (udp_thread_.joinable()) {
    udp_thread_.join();
  }
  if (udp_transport_) {
    udp_transport_->Close();
  }

  ReapFinishedSessions(true);

  if (is_running_.load(std::memory_order_acquire)) {
    std::cout << "[StreamServer] Stopped" << std::endl;
  }
  MarkStopped();
}

void StreamServer::MarkStopped() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    is_running_.store(false, std::memory_order_release);
  }
  state_cv_.notify_all();
}

void StreamServer::Wait() {
  std::unique_lock<std::mutex> lock(state_mutex_);
  state_cv_.wait(lock, [this]() { return !is_running_.load(std::memory_order_acquire); });
}

bool StreamServer::isRunning() const {
  return is_running_.load(std::memory_order_acquire);
}

std::unique_ptr<ServerSession> StreamServer::MakeSession() const {
  return std::make_unique<ServerSession>(config_, container_, audio_, master_clock_);
}

Status StreamServer::RunSession(ITransport& transport) {
  if (!container_) {
    return Status(ErrorCode::kIOError, "no container open");
  }
  std::unique_ptr<ServerSession> session = MakeSession();
  Status status = session->Run(transport, stop_requested_);

  std::lock_guard<std::mutex> lock(sessions_mutex_);
  AccumulateLocked(*session);
  return status;
}

void StreamServer::AcceptLoop() {
  while (!stop_requested_.load(std::memory_order_acquire)) {
    ReapFinishedSessions(false);

    std::unique_ptr<TcpTransport> client;
    Status status = listener_.Accept(client, kAcceptPollMs);
    if (status.code() == ErrorCode::kTimeout) {
      continue;
    }
    if (!status.ok()) {
      if (stop_requested_.load(std::memory_order_acquire)) {
        break;
      }
      std::cerr << "[StreamServer] Accept failed: " << status.ToString() << std::endl;
      std::this_thread::sleep_for(std::chrono::milliseconds(kAcceptPollMs));
      continue;
    }

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    if (sessions_.size() >= config_.max_sessions) {
      std::cerr << "[StreamServer] Session limit reached, rejecting " << client->peer()
                << std::endl;
      client->Close();
      continue;
    }

    std::cout << "[StreamServer] Client connected: " << client->peer() << std::endl;
    auto slot = std::make_unique<SessionSlot>();
    slot->transport = std::move(client);
    slot->session = MakeSession();
    SessionSlot* raw = slot.get();
    sessions_.push_back(std::move(slot));
    raw->thread = std::thread(&StreamServer::ServeClient, this, raw);
  }
}

void StreamServer::ServeClient(SessionSlot* slot) {
  Status status = ReadHello(*slot->transport);
  if (status.ok()) {
    status = slot->session->Run(*slot->transport, stop_requested_);
  }
  if (!status.ok()) {
    std::cerr << "[StreamServer] Session with " << slot->transport->peer() << " ended: "
              << status.ToString() << std::endl;
  } else {
    std::cout << "[StreamServer] Session with " << slot->transport->peer() << " complete"
              << std::endl;
  }
  slot->transport->Close();
  slot->done.store(true, std::memory_order_release);
}

Status StreamServer::ReadHello(TcpTransport& transport) {
  Packet packet;
  Status status = transport.Receive(packet, kHelloTimeoutMs);
  if (status.code() == ErrorCode::kTimeout) {
    std::cout << "[StreamServer] No HELLO from " << transport.peer() << ", streaming anyway"
              << std::endl;
    return Status::Ok();
  }
  if (!status.ok()) {
    return status;
  }
  if (packet.type != PacketType::kHello) {
    std::cerr << "[StreamServer] Expected HELLO from " << transport.peer() << ", got "
              << PacketTypeToString(packet.type) << std::endl;
    return Status::Ok();
  }

  HelloPayload hello;
  status = DecodeHello(packet.payload, hello);
  if (!status.ok()) {
    return status;
  }
  std::cout << "[StreamServer] HELLO from '" << hello.client_name << "' protocol v"
            << hello.protocol_version << std::endl;
  if (hello.protocol_version != kProtocolVersion) {
    return Status(ErrorCode::kInvalidFormat,
                  "unsupported protocol version " + std::to_string(hello.protocol_version));
  }
  return Status::Ok();
}

void StreamServer::ReapFinishedSessions(bool join_all) {
  std::list<std::unique_ptr<SessionSlot>> finished;
  if (join_all) {
    // Give running sessions a chance to send END, then unblock them.
    const auto deadline = std::chrono::steady_clock::now() + kStopGrace;
    while (std::chrono::steady_clock::now() < deadline) {
      bool all_done = true;
      {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& slot : sessions_) {
          all_done = all_done && slot->done.load(std::memory_order_acquire);
        }
      }
      if (all_done) {
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto& slot : sessions_) {
      if (!slot->done.load(std::memory_order_acquire)) {
        slot->transport->Close();
      }
    }
    finished.splice(finished.end(), sessions_);
  } else {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if ((*it)->done.load(std::memory_order_acquire)) {
        finished.splice(finished.end(), sessions_, it++);
      } else {
        ++it;
      }
    }
  }

  for (auto& slot : finished) {
    if (slot->thread.joinable()) {
      slot->thread.join();
    }
  }

  std::lock_guard<std::mutex> lock(sessions_mutex_);
  for (const auto& slot : finished) {
    AccumulateLocked(*slot->session);
  }
}

void StreamServer::AccumulateLocked(const ServerSession& session) {
  finished_stats_ += session.stats();
}

SessionStats StreamServer::GetSessionStats() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  SessionStats total = finished_stats_;
  for (const auto& slot : sessions_) {
    total += slot->session->stats();
  }
  if (udp_session_) {
    total += udp_session_->stats();
  }
  return total;
}

}  // namespace sanchez::stream
