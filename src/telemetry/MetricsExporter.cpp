// Repository: Sanchez
// Component: Metrics Exporter
// Purpose: Per-session streaming metrics in Prometheus text format.
// Copyright (c) 2025 Sanchez

#include "sanchez/telemetry/MetricsExporter.h"
#include "sanchez/telemetry/MetricsHTTPServer.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace sanchez::telemetry {

namespace {

constexpr size_t kLatencyWindow = 1024;

int SessionPhaseToValue(SessionPhase phase) {
  return static_cast<int>(phase);
}

}  // namespace

const char* SessionPhaseToString(SessionPhase phase) {
  switch (phase) {
    case SessionPhase::kSyncing:
      return "syncing";
    case SessionPhase::kStreaming:
      return "streaming";
    case SessionPhase::kEnded:
      return "ended";
    case SessionPhase::kError:
      return "error";
  }
  return "unknown";
}

const char* SessionRoleToString(SessionRole role) {
  switch (role) {
    case SessionRole::kServer:
      return "server";
    case SessionRole::kClient:
      return "client";
  }
  return "unknown";
}

MetricsExporter::EventQueue::EventQueue(size_t capacity)
    : capacity_(capacity < 2 ? 2 : capacity),
      buffer_(capacity_),
      head_(0),
      tail_(0) {}

bool MetricsExporter::EventQueue::Push(const Event& event) {
  const size_t tail = tail_.load(std::memory_order_relaxed);
  const size_t head = head_.load(std::memory_order_acquire);
  const size_t next = (tail + 1) % capacity_;
  if (next == head) {
    return false;
  }
  buffer_[tail] = event;
  tail_.store(next, std::memory_order_release);
  return true;
}

bool MetricsExporter::EventQueue::Pop(Event& event) {
  const size_t head = head_.load(std::memory_order_relaxed);
  const size_t tail = tail_.load(std::memory_order_acquire);
  if (head == tail) {
    return false;
  }
  event = buffer_[head];
  head_.store((head + 1) % capacity_, std::memory_order_release);
  return true;
}

bool MetricsExporter::EventQueue::Empty() const {
  return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
}

MetricsExporter::MetricsExporter(int port, bool enable_http, size_t queue_capacity)
    : port_(port),
      enable_http_(enable_http),
      running_(false),
      stop_requested_(false),
      next_session_id_(1),
      http_server_(enable_http ? std::make_unique<MetricsHTTPServer>(port) : nullptr),
      queue_overflow_total_(0),
      event_queue_(queue_capacity),
      submitted_events_(0),
      processed_events_(0) {
  if (http_server_) {
    http_server_->SetMetricsCallback([this]() { return this->GenerateMetricsText(); });
  }
}

MetricsExporter::~MetricsExporter() {
  Stop();
}

bool MetricsExporter::Start(bool start_http_server) {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    return false;
  }

  stop_requested_.store(false, std::memory_order_release);

  if (enable_http_ && start_http_server && http_server_) {
    if (!http_server_->Start()) {
      std::cerr << "[MetricsExporter] Failed to start HTTP server" << std::endl;
      running_.store(false, std::memory_order_release);
      return false;
    }
    std::cout << "[MetricsExporter] Metrics at http://localhost:" << http_server_->GetPort()
              << "/metrics" << std::endl;
  }

  worker_thread_ = std::thread(&MetricsExporter::WorkerLoop, this);
  return true;
}

void MetricsExporter::Stop() {
  bool expected = true;
  if (!running_.compare_exchange_strong(expected, false)) {
    return;
  }

  stop_requested_.store(true, std::memory_order_release);
  queue_cv_.notify_all();
  if (worker_thread_.joinable()) {
    worker_thread_.join();
  }

  if (enable_http_ && http_server_) {
    http_server_->Stop();
  }
}

bool MetricsExporter::Enqueue(const Event& event) {
  if (!running_.load(std::memory_order_acquire)) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    ProcessEventLocked(event);
    return true;
  }

  bool pushed = false;
  {
    std::lock_guard<std::mutex> lock(push_mutex_);
    pushed = event_queue_.Push(event);
  }
  if (!pushed) {
    queue_overflow_total_.fetch_add(1, std::memory_order_acq_rel);
    std::cerr << "[MetricsExporter] Queue overflow, dropping event for session "
              << event.session_id << std::endl;
    return false;
  }

  submitted_events_.fetch_add(1, std::memory_order_acq_rel);
  queue_cv_.notify_one();
  return true;
}

bool MetricsExporter::SubmitSessionMetrics(uint32_t session_id, const SessionMetrics& metrics) {
  Event event;
  event.type = Event::Type::kUpdateSession;
  event.session_id = session_id;
  event.session_metrics = metrics;
  return Enqueue(event);
}

void MetricsExporter::SubmitSessionRemoval(uint32_t session_id) {
  Event event;
  event.type = Event::Type::kRemoveSession;
  event.session_id = session_id;
  Enqueue(event);
}

void MetricsExporter::RecordSendLatency(SessionRole role, bool success, double latency_ms) {
  Event event;
  event.type = Event::Type::kRecordLatency;
  event.role = role;
  event.success = success;
  event.latency_ms = latency_ms;
  Enqueue(event);
}

bool MetricsExporter::GetSessionMetrics(uint32_t session_id, SessionMetrics& metrics) const {
  std::lock_guard<std::mutex> lock(metrics_mutex_);
  auto it = session_metrics_.find(session_id);
  if (it == session_metrics_.end()) {
    return false;
  }
  metrics = it->second;
  return true;
}

MetricsExporter::Snapshot MetricsExporter::SnapshotForTest() const {
  std::lock_guard<std::mutex> lock(metrics_mutex_);
  Snapshot snapshot;
  snapshot.session_metrics = session_metrics_;
  for (const auto& [role, data] : latency_data_) {
    LatencySnapshot ls;
    ls.samples = data.samples;
    ls.failures = data.failures;
    ls.latency_p95_ms = ComputePercentile(data.latencies_ms, 0.95);
    snapshot.send_latency.emplace(role, ls);
  }
  snapshot.queue_overflow_total = queue_overflow_total_.load(std::memory_order_acquire);
  return snapshot;
}

bool MetricsExporter::WaitUntilDrainedForTest(std::chrono::milliseconds timeout) {
  if (!running_.load(std::memory_order_acquire)) {
    return true;
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (processed_events_.load(std::memory_order_acquire) >=
            submitted_events_.load(std::memory_order_acquire) &&
        event_queue_.Empty()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return false;
}

void MetricsExporter::WorkerLoop() {
  while (!stop_requested_.load(std::memory_order_acquire) || !event_queue_.Empty()) {
    Event event;
    if (event_queue_.Pop(event)) {
      {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        ProcessEventLocked(event);
      }
      processed_events_.fetch_add(1, std::memory_order_acq_rel);
      continue;
    }

    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_cv_.wait_for(lock, std::chrono::milliseconds(50));
  }
}

void MetricsExporter::ProcessEventLocked(const Event& event) {
  switch (event.type) {
    case Event::Type::kUpdateSession:
      session_metrics_[event.session_id] = event.session_metrics;
      break;
    case Event::Type::kRemoveSession:
      session_metrics_.erase(event.session_id);
      std::cout << "[MetricsExporter] Session " << event.session_id << " removed from metrics"
                << std::endl;
      break;
    case Event::Type::kRecordLatency: {
      auto& data = latency_data_[event.role];
      ++data.samples;
      if (!event.success) {
        ++data.failures;
      }
      data.latencies_ms.push_back(event.latency_ms);
      if (data.latencies_ms.size() > kLatencyWindow) {
        data.latencies_ms.erase(data.latencies_ms.begin());
      }
      break;
    }
  }
}

double MetricsExporter::ComputePercentile(const std::vector<double>& values, double percentile) {
  if (values.empty()) {
    return 0.0;
  }

  std::vector<double> sorted = values;
  std::sort(sorted.begin(), sorted.end());
  const double rank = percentile * static_cast<double>(sorted.size() - 1);
  const auto lower_index = static_cast<std::size_t>(std::floor(rank));
  const auto upper_index = static_cast<std::size_t>(std::ceil(rank));
  const double lower = sorted[lower_index];
  if (upper_index == lower_index) {
    return lower;
  }
  const double fraction = rank - static_cast<double>(lower_index);
  return lower + (sorted[upper_index] - lower) * fraction;
}

std::string MetricsExporter::GenerateMetricsText() const {
  std::lock_guard<std::mutex> lock(metrics_mutex_);
  std::ostringstream oss;

  oss << "# HELP sanchez_metrics_overflow_total Metric events dropped on queue overflow\n";
  oss << "# TYPE sanchez_metrics_overflow_total counter\n";
  oss << "sanchez_metrics_overflow_total "
      << queue_overflow_total_.load(std::memory_order_acquire) << "\n\n";

  oss << "# HELP sanchez_stream_session_phase Current phase of a stream session\n";
  oss << "# TYPE sanchez_stream_session_phase gauge\n";
  for (const auto& [id, metrics] : session_metrics_) {
    oss << "sanchez_stream_session_phase{session=\"" << id << "\",role=\""
        << SessionRoleToString(metrics.role) << "\",mode=\"" << metrics.mode
        << "\",phase=\"" << SessionPhaseToString(metrics.phase) << "\"} "
        << SessionPhaseToValue(metrics.phase) << "\n";
  }

  struct Series {
    const char* name;
    const char* type;
    const char* help;
    uint64_t SessionMetrics::*field;
  };
  static const Series kSeries[] = {
      {"sanchez_stream_packets_total", "counter", "Packets sent or received",
       &SessionMetrics::packets_total},
      {"sanchez_stream_frames_total", "counter", "Frames sent or delivered",
       &SessionMetrics::frames_total},
      {"sanchez_stream_bytes_total", "counter", "Packet bytes sent or received",
       &SessionMetrics::bytes_total},
      {"sanchez_stream_parity_packets_total", "counter", "PARITY packets sent",
       &SessionMetrics::parity_packets_total},
      {"sanchez_stream_frames_dropped_total", "counter", "Frames lost or failed verification",
       &SessionMetrics::frames_dropped_total},
      {"sanchez_stream_packets_lost_estimate", "gauge", "Packets missing from the sequence",
       &SessionMetrics::packets_lost_estimate},
      {"sanchez_stream_parity_recoveries_total", "counter", "Chunks rebuilt from parity",
       &SessionMetrics::parity_recoveries_total},
      {"sanchez_stream_errors_total", "counter", "Transport errors",
       &SessionMetrics::errors_total},
  };

  for (const Series& series : kSeries) {
    oss << "\n# HELP " << series.name << " " << series.help << "\n";
    oss << "# TYPE " << series.name << " " << series.type << "\n";
    for (const auto& [id, metrics] : session_metrics_) {
      oss << series.name << "{session=\"" << id << "\",role=\""
          << SessionRoleToString(metrics.role) << "\"} " << metrics.*(series.field) << "\n";
    }
  }

  oss << "\n# HELP sanchez_stream_send_latency_ms Packet send latency p95\n";
  oss << "# TYPE sanchez_stream_send_latency_ms gauge\n";
  for (const auto& [role, data] : latency_data_) {
    oss << "sanchez_stream_send_latency_ms{role=\"" << SessionRoleToString(role) << "\"} "
        << ComputePercentile(data.latencies_ms, 0.95) << "\n";
  }

  return oss.str();
}

}  // namespace sanchez::telemetry
