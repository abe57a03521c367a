#include <textembed/server/server.hpp>
#include <textembed/server/handlers.hpp>
#include <textembed/server/metrics.hpp>
#include <textembed/server/shutdown.hpp>

#include <drogon/drogon.h>
#include <trantor/utils/Logger.h>

#include <chrono>
#include <stdexcept>
#include <thread>

namespace textembed::server {

Server::Server(const Config& config) : config_(config) {
  config_.Validate();

  InitOptions options = config_.ToInitOptions();
  info_ = GetModelInfo(options.model);

  auto status = TextEmbedding::Open(options, &model_);
  if (!status.ok()) {
    throw std::runtime_error("Failed to load model " + info_.model_code +
                             ": " + status.ToString());
  }
}

Server::~Server() {
  if (running_) {
    Shutdown();
  }
}

void Server::SetupRoutes() {
  std::shared_ptr<PrometheusMetrics> metrics;
  if (config_.metrics.enabled) {
    metrics = std::make_shared<PrometheusMetrics>();
    metrics->Gauge("textembed_model_dim", static_cast<double>(info_.dim));
    metrics->Gauge("textembed_max_length",
                   static_cast<double>(config_.model.max_length));
  }

  RegisterHandlers(model_.get(), info_, config_, metrics,
                   &GlobalShutdownCoordinator());

  if (metrics) {
    RegisterMetricsHandler(metrics, config_.metrics.path);
  }
}

void Server::SetupShutdown() {
  auto& coordinator = GlobalShutdownCoordinator();
  coordinator.SetDrainTimeout(
      std::chrono::seconds(config_.server.drain_timeout_seconds));
  if (!coordinator.WatchSignals()) {
    LOG_WARN << "Could not install shutdown signal handlers";
  }

  coordinator.OnShutdown([]() {
    LOG_INFO << "Shutting down HTTP server...";
    drogon::app().quit();
  });
}

void Server::Run() {
  running_ = true;

  auto& app = drogon::app();
  app.addListener(config_.server.host, config_.server.port);

  uint32_t threads = config_.server.threads;
  if (threads == 0) {
    threads = std::thread::hardware_concurrency();
    if (threads == 0) threads = 4;  // Fallback
  }
  app.setThreadNum(threads);

  // Embedding bodies can be large; texts arrive in one request.
  app.setClientMaxBodySize(64 * 1024 * 1024);
  app.setMaxConnectionNum(10000);
  app.setMaxConnectionNumPerIP(100);
  app.setIdleConnectionTimeout(60);
  app.setKeepaliveRequestsNumber(100);
  app.disableSession();

  SetupRoutes();
  SetupShutdown();

  LOG_INFO << "Textembed server starting on " << config_.server.host << ":"
           << config_.server.port << " with " << threads << " threads, model "
           << info_.model_code;

  // Blocks until quit()
  app.run();

  running_ = false;
  GlobalShutdownCoordinator().StopWatchingSignals();
  LOG_INFO << "Server stopped.";
}

void Server::Shutdown() {
  if (running_) {
    GlobalShutdownCoordinator().Shutdown();
  }
}

}  // namespace textembed::server
