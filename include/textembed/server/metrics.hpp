#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace textembed::server {

/**
 * Prometheus-compatible metrics registry.
 *
 * Collects counters, histograms, and gauges and exports them
 * in Prometheus text exposition format.
 */
class PrometheusMetrics {
 public:
  PrometheusMetrics() = default;

  void Counter(std::string_view name, uint64_t delta);
  void Histogram(std::string_view name, double value);
  void Gauge(std::string_view name, double value);

  /**
   * Generate Prometheus text format output.
   */
  std::string Export() const;

  /**
   * Record an HTTP request metric.
   */
  void RecordHttpRequest(const std::string& method,
                         const std::string& path,
                         int status_code,
                         double latency_ms);

  /**
   * Record one successful embedding call: texts embedded, batches run and
   * time spent in the pipeline.
   */
  void RecordEmbedding(uint64_t texts, uint64_t batches, double latency_ms);

  /** Record a failed embedding call. */
  void RecordEmbeddingFailure();

 private:
  struct HistogramData {
    std::vector<uint64_t> buckets;
    uint64_t count = 0;
    double sum = 0.0;
  };

  static void Observe(HistogramData* h, double value);

  mutable std::mutex mu_;

  std::unordered_map<std::string, uint64_t> counters_;
  std::unordered_map<std::string, HistogramData> histograms_;
  std::unordered_map<std::string, double> gauges_;

  // HTTP request metrics with labels
  struct HttpMetricKey {
    std::string method;
    std::string path;
    int status_code;

    bool operator==(const HttpMetricKey& other) const {
      return method == other.method && path == other.path &&
             status_code == other.status_code;
    }
  };

  struct HttpMetricKeyHash {
    size_t operator()(const HttpMetricKey& k) const {
      return std::hash<std::string>{}(k.method) ^
             (std::hash<std::string>{}(k.path) << 1) ^
             (std::hash<int>{}(k.status_code) << 2);
    }
  };

  std::unordered_map<HttpMetricKey, uint64_t, HttpMetricKeyHash> http_requests_;
  HistogramData http_latency_;
};

/**
 * Register the metrics endpoint with the Drogon app.
 */
void RegisterMetricsHandler(std::shared_ptr<PrometheusMetrics> metrics,
                            const std::string& path);

/**
 * RAII helper for timing HTTP requests.
 */
class RequestTimer {
 public:
  RequestTimer(std::shared_ptr<PrometheusMetrics> metrics,
               std::string method,
               std::string path);

  ~RequestTimer();

  void SetStatusCode(int code) { status_code_ = code; }

 private:
  std::shared_ptr<PrometheusMetrics> metrics_;
  std::string method_;
  std::string path_;
  int status_code_ = 200;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace textembed::server
