// Repository: Sanchez
// Component: Stream Server
// Purpose: Serves a .sanchez container to TCP clients or a UDP destination.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_STREAM_STREAM_SERVER_H_
#define SANCHEZ_STREAM_STREAM_SERVER_H_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "sanchez/core/Status.h"
#include "sanchez/format/Container.h"
#include "sanchez/stream/ITransport.h"
#include "sanchez/stream/ServerSession.h"
#include "sanchez/stream/StreamConfig.h"
#include "sanchez/stream/StreamStats.h"
#include "sanchez/stream/TcpTransport.h"
#include "sanchez/timing/MasterClock.h"

namespace sanchez::stream {

// StreamServer opens the container once and shares it, read-only, with
// every session.
//
// TCP: listens on host:port and runs one session thread per accepted client,
// up to max_sessions at a time. UDP: runs a single session that sends to
// host:port (unicast address, multicast group or broadcast address).
//
// The server queries its MasterClock for pacing; sessions never share a
// pacer or a sequence counter.
class StreamServer {
 public:
  StreamServer(const ServerConfig& config, std::shared_ptr<timing::MasterClock> master_clock);
  ~StreamServer();

  StreamServer(const StreamServer&) = delete;
  StreamServer& operator=(const StreamServer&) = delete;

  // Opens the container (and the audio file, if configured) without starting
  // any network activity.
  Status Open(const std::string& container_path);

  // Open() if needed, then starts listening (TCP) or sending (UDP).
  Status Start(const std::string& container_path);

  // Raises the stop flag, closes the listener and joins every thread.
  void Stop();

  // Blocks until the UDP session finishes or Stop() is called.
  void Wait();

  bool isRunning() const;

  // Listening port (TCP, useful with port 0) or destination port (UDP).
  uint16_t BoundPort() const { return bound_port_; }

  // Runs one session on the calling thread over any transport. The
  // container must be open.
  Status RunSession(ITransport& transport);

  // Aggregate over finished and running sessions.
  SessionStats GetSessionStats() const;

 private:
  struct SessionSlot {
    std::unique_ptr<TcpTransport> transport;
    std::unique_ptr<ServerSession> session;
    std::thread thread;
    std::atomic<bool> done{false};
  };

  void AcceptLoop();
  void ServeClient(SessionSlot* slot);
  void ReapFinishedSessions(bool join_all);
  void MarkStopped();

  // Reads the client's HELLO. Fails on a protocol version mismatch.
  Status ReadHello(TcpTransport& transport);

  std::unique_ptr<ServerSession> MakeSession() const;
  void AccumulateLocked(const ServerSession& session);

  ServerConfig config_;
  std::shared_ptr<timing::MasterClock> master_clock_;
  std::shared_ptr<const format::Container> container_;
  std::shared_ptr<const std::vector<uint8_t>> audio_;

  std::atomic<bool> is_running_{false};
  std::atomic<bool> stop_requested_{false};
  uint16_t bound_port_{0};
  std::mutex state_mutex_;
  std::condition_variable state_cv_;

  TcpListener listener_;
  std::thread accept_thread_;

  std::unique_ptr<ITransport> udp_transport_;
  std::unique_ptr<ServerSession> udp_session_;
  std::thread udp_thread_;

  mutable std::mutex sessions_mutex_;
  std::list<std::unique_ptr<SessionSlot>> sessions_;
  SessionStats finished_stats_;
};

}  // namespace sanchez::stream

#endif  // SANCHEZ_STREAM_STREAM_SERVER_H_
