// Repository: Sanchez
// Component: Metrics Exporter
// Purpose: Per-session streaming metrics in Prometheus text format.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_TELEMETRY_METRICS_EXPORTER_H_
#define SANCHEZ_TELEMETRY_METRICS_EXPORTER_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sanchez::telemetry {

class MetricsHTTPServer;

// SessionPhase is the coarse lifecycle of one stream session.
enum class SessionPhase {
  kSyncing = 0,
  kStreaming = 1,
  kEnded = 2,
  kError = 3
};

const char* SessionPhaseToString(SessionPhase phase);

enum class SessionRole {
  kServer = 0,
  kClient = 1,
};

const char* SessionRoleToString(SessionRole role);

// SessionMetrics holds the telemetry of one server or client session.
struct SessionMetrics {
  SessionRole role = SessionRole::kServer;
  SessionPhase phase = SessionPhase::kSyncing;
  std::string mode;
  std::string peer;
  uint64_t packets_total = 0;
  uint64_t frames_total = 0;
  uint64_t bytes_total = 0;
  uint64_t parity_packets_total = 0;
  uint64_t frames_dropped_total = 0;
  uint64_t packets_lost_estimate = 0;
  uint64_t parity_recoveries_total = 0;
  uint64_t errors_total = 0;
};

// MetricsExporter collects session metrics and renders them for scraping.
//
// Updates are pushed through a bounded queue drained by a worker thread so
// streaming loops never block on the metrics lock. When the exporter is not
// running, updates are applied synchronously.
//
// Metrics exported:
// - sanchez_stream_session_phase{session,role,mode,phase} - gauge
// - sanchez_stream_packets_total{session,role} - counter
// - sanchez_stream_frames_total{session,role} - counter
// - sanchez_stream_bytes_total{session,role} - counter
// - sanchez_stream_parity_packets_total{session,role} - counter
// - sanchez_stream_frames_dropped_total{session,role} - counter
// - sanchez_stream_packets_lost_estimate{session,role} - gauge
// - sanchez_stream_parity_recoveries_total{session,role} - counter
// - sanchez_stream_errors_total{session,role} - counter
// - sanchez_stream_send_latency_ms{role} - p95 gauge
class MetricsExporter {
 public:
  struct LatencySnapshot {
    uint64_t samples = 0;
    uint64_t failures = 0;
    double latency_p95_ms = 0.0;
  };

  struct Snapshot {
    std::map<uint32_t, SessionMetrics> session_metrics;
    std::map<SessionRole, LatencySnapshot> send_latency;
    uint64_t queue_overflow_total = 0;
  };

  // port is used only when enable_http.
  explicit MetricsExporter(int port = 9309, bool enable_http = true,
                           size_t queue_capacity = 1024);
  ~MetricsExporter();

  MetricsExporter(const MetricsExporter&) = delete;
  MetricsExporter& operator=(const MetricsExporter&) = delete;

  bool Start(bool start_http_server = true);
  void Stop();
  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // Unique id for a new session.
  uint32_t NextSessionId() { return next_session_id_.fetch_add(1, std::memory_order_acq_rel); }

  bool SubmitSessionMetrics(uint32_t session_id, const SessionMetrics& metrics);
  void SubmitSessionRemoval(uint32_t session_id);
  void RecordSendLatency(SessionRole role, bool success, double latency_ms);

  bool GetSessionMetrics(uint32_t session_id, SessionMetrics& metrics) const;

  // Prometheus text exposition.
  std::string GenerateMetricsText() const;

  Snapshot SnapshotForTest() const;
  bool WaitUntilDrainedForTest(std::chrono::milliseconds timeout);

  uint64_t queue_overflow_total() const {
    return queue_overflow_total_.load(std::memory_order_acquire);
  }

 private:
  struct Event {
    enum class Type {
      kUpdateSession,
      kRemoveSession,
      kRecordLatency,
    };

    Type type = Type::kUpdateSession;
    uint32_t session_id = 0;
    SessionMetrics session_metrics;
    SessionRole role = SessionRole::kServer;
    bool success = true;
    double latency_ms = 0.0;
  };

  // Single-producer/single-consumer ring; producers serialize on push_mutex_.
  class EventQueue {
   public:
    explicit EventQueue(size_t capacity);

    bool Push(const Event& event);
    bool Pop(Event& event);
    bool Empty() const;

   private:
    const size_t capacity_;
    std::vector<Event> buffer_;
    std::atomic<size_t> head_;
    std::atomic<size_t> tail_;
  };

  bool Enqueue(const Event& event);
  void WorkerLoop();
  void ProcessEventLocked(const Event& event);
  static double ComputePercentile(const std::vector<double>& values, double percentile);

  int port_;
  const bool enable_http_;
  std::atomic<bool> running_;
  std::atomic<bool> stop_requested_;
  std::atomic<uint32_t> next_session_id_;

  std::unique_ptr<MetricsHTTPServer> http_server_;

  std::atomic<uint64_t> queue_overflow_total_;
  EventQueue event_queue_;
  std::mutex push_mutex_;
  std::atomic<uint64_t> submitted_events_;
  std::atomic<uint64_t> processed_events_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::thread worker_thread_;

  mutable std::mutex metrics_mutex_;
  std::map<uint32_t, SessionMetrics> session_metrics_;

  struct LatencyData {
    uint64_t samples = 0;
    uint64_t failures = 0;
    std::vector<double> latencies_ms;
  };
  std::map<SessionRole, LatencyData> latency_data_;
};

}  // namespace sanchez::telemetry

#endif  // SANCHEZ_TELEMETRY_METRICS_EXPORTER_H_
