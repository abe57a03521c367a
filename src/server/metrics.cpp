#include <textembed/server/metrics.hpp>

#include <drogon/drogon.h>

#include <iomanip>
#include <map>
#include <sstream>

namespace textembed::server {

namespace {

// Histogram buckets for latency (in milliseconds)
const std::vector<double> kLatencyBuckets = {
    0.5, 1, 2.5, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000};

size_t FindBucket(double value, const std::vector<double>& buckets) {
  for (size_t i = 0; i < buckets.size(); ++i) {
    if (value <= buckets[i]) {
      return i;
    }
  }
  return buckets.size();  // +Inf bucket
}

// Sorted copy so the exposition is stable between scrapes.
template <typename Map>
std::map<std::string, typename Map::mapped_type> Sorted(const Map& m) {
  return std::map<std::string, typename Map::mapped_type>(m.begin(), m.end());
}

}  // namespace

// --- PrometheusMetrics ---

void PrometheusMetrics::Observe(HistogramData* h, double value) {
  if (h->buckets.empty()) {
    h->buckets.resize(kLatencyBuckets.size() + 1, 0);
  }
  size_t bucket = FindBucket(value, kLatencyBuckets);
  for (size_t i = bucket; i < h->buckets.size(); ++i) {
    h->buckets[i]++;
  }
  h->count++;
  h->sum += value;
}

void PrometheusMetrics::Counter(std::string_view name, uint64_t delta) {
  std::lock_guard<std::mutex> lock(mu_);
  counters_[std::string(name)] += delta;
}

void PrometheusMetrics::Histogram(std::string_view name, double value) {
  std::lock_guard<std::mutex> lock(mu_);
  Observe(&histograms_[std::string(name)], value);
}

void PrometheusMetrics::Gauge(std::string_view name, double value) {
  std::lock_guard<std::mutex> lock(mu_);
  gauges_[std::string(name)] = value;
}

void PrometheusMetrics::RecordHttpRequest(const std::string& method,
                                          const std::string& path,
                                          int status_code,
                                          double latency_ms) {
  std::lock_guard<std::mutex> lock(mu_);
  http_requests_[HttpMetricKey{method, path, status_code}]++;
  Observe(&http_latency_, latency_ms);
}

void PrometheusMetrics::RecordEmbedding(uint64_t texts, uint64_t batches,
                                        double latency_ms) {
  std::lock_guard<std::mutex> lock(mu_);
  counters_["textembed_texts_embedded_total"] += texts;
  counters_["textembed_batches_total"] += batches;
  Observe(&histograms_["textembed_embed_duration_ms"], latency_ms);
}

void PrometheusMetrics::RecordEmbeddingFailure() {
  std::lock_guard<std::mutex> lock(mu_);
  counters_["textembed_embed_failures_total"]++;
}

std::string PrometheusMetrics::Export() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::ostringstream out;
  out << std::fixed << std::setprecision(6);

  for (const auto& [name, value] : Sorted(counters_)) {
    out << "# TYPE " << name << " counter\n";
    out << name << " " << value << "\n";
  }

  for (const auto& [name, value] : Sorted(gauges_)) {
    out << "# TYPE " << name << " gauge\n";
    out << name << " " << value << "\n";
  }

  for (const auto& [name, data] : Sorted(histograms_)) {
    out << "# TYPE " << name << " histogram\n";
    for (size_t i = 0; i < kLatencyBuckets.size(); ++i) {
      out << name << "_bucket{le=\"" << kLatencyBuckets[i] << "\"} "
          << data.buckets[i] << "\n";
    }
    out << name << "_bucket{le=\"+Inf\"} " << data.buckets.back() << "\n";
    out << name << "_sum " << data.sum << "\n";
    out << name << "_count " << data.count << "\n";
  }

  if (!http_requests_.empty()) {
    out << "# TYPE textembed_http_requests_total counter\n";
    for (const auto& [key, count] : http_requests_) {
      out << "textembed_http_requests_total{method=\"" << key.method
          << "\",path=\"" << key.path << "\",status=\"" << key.status_code
          << "\"} " << count << "\n";
    }
  }

  if (http_latency_.count > 0) {
    out << "# TYPE textembed_http_request_duration_ms histogram\n";
    for (size_t i = 0; i < kLatencyBuckets.size(); ++i) {
      out << "textembed_http_request_duration_ms_bucket{le=\""
          << kLatencyBuckets[i] << "\"} " << http_latency_.buckets[i] << "\n";
    }
    out << "textembed_http_request_duration_ms_bucket{le=\"+Inf\"} "
        << http_latency_.buckets.back() << "\n";
    out << "textembed_http_request_duration_ms_sum " << http_latency_.sum << "\n";
    out << "textembed_http_request_duration_ms_count " << http_latency_.count << "\n";
  }

  return out.str();
}

// --- Metrics Handler Registration ---

void RegisterMetricsHandler(std::shared_ptr<PrometheusMetrics> metrics,
                            const std::string& path) {
  drogon::app().registerHandler(
      path,
      [metrics](const drogon::HttpRequestPtr& req,
                std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setBody(metrics->Export());
        resp->setContentTypeString("text/plain; version=0.0.4; charset=utf-8");
        resp->setStatusCode(drogon::k200OK);
        callback(resp);
      },
      {drogon::Get});
}

// --- RequestTimer ---

RequestTimer::RequestTimer(std::shared_ptr<PrometheusMetrics> metrics,
                           std::string method,
                           std::string path)
    : metrics_(std::move(metrics)),
      method_(std::move(method)),
      path_(std::move(path)),
      start_(std::chrono::steady_clock::now()) {}

RequestTimer::~RequestTimer() {
  if (metrics_) {
    auto end = std::chrono::steady_clock::now();
    auto duration =
        std::chrono::duration_cast<std::chrono::microseconds>(end - start_);
    double latency_ms = static_cast<double>(duration.count()) / 1000.0;
    metrics_->RecordHttpRequest(method_, path_, status_code_, latency_ms);
  }
}

}  // namespace textembed::server
