// Repository: Sanchez
// Component: Metrics HTTP Server
// Purpose: Minimal HTTP endpoint serving Prometheus text.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_TELEMETRY_METRICS_HTTP_SERVER_H_
#define SANCHEZ_TELEMETRY_METRICS_HTTP_SERVER_H_

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace sanchez::telemetry {

// Produces the body of a /metrics response.
using MetricsCallback = std::function<std::string()>;

// MetricsHTTPServer answers GET /metrics with the callback output, GET / with
// a short banner and everything else with 404. One connection is handled at
// a time on the server thread.
//
// The listening socket is bound in Start() so bind failures are reported to
// the caller. Port 0 picks an ephemeral port, readable through GetPort().
class MetricsHTTPServer {
 public:
  explicit MetricsHTTPServer(int port = 9309);
  ~MetricsHTTPServer();

  MetricsHTTPServer(const MetricsHTTPServer&) = delete;
  MetricsHTTPServer& operator=(const MetricsHTTPServer&) = delete;

  // Must be called before Start().
  void SetMetricsCallback(MetricsCallback callback);

  bool Start();
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }
  int GetPort() const { return port_; }

 private:
  void ServerLoop();
  void HandleConnection(int client_socket);

  static std::string ParseRequestPath(const std::string& request);
  std::string BuildResponse(const std::string& path);

  int port_;
  std::atomic<bool> running_;
  std::atomic<bool> stop_requested_;

  std::unique_ptr<std::thread> server_thread_;
  MetricsCallback metrics_callback_;
  int server_socket_;
};

}  // namespace sanchez::telemetry

#endif  // SANCHEZ_TELEMETRY_METRICS_HTTP_SERVER_H_
