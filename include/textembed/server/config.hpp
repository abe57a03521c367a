#pragma once

#include <textembed/text_embedding.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace textembed::server {

/**
 * HTTP listener configuration.
 */
struct ServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = 8080;
  uint32_t threads = 0;  // 0 = auto-detect CPU cores
  std::string log_level = "info";
  uint32_t drain_timeout_seconds = 30;  // wait for in-flight requests on shutdown
};

/**
 * Which model to serve and how to run it.
 */
struct ModelConfig {
  std::string name = "BGESmallENV15";  // enum-style name or repository name
  std::string cache_dir = kDefaultCacheDir;
  size_t max_length = kDefaultMaxLength;
  size_t batch_size = kDefaultBatchSize;  // default when a request omits it
  std::vector<std::string> providers;     // "cpu", "cuda", "tensorrt"
  bool show_download_progress = true;
};

/**
 * Metrics configuration.
 */
struct MetricsConfig {
  bool enabled = true;
  std::string path = "/metrics";
};

/**
 * Complete server configuration.
 */
struct Config {
  ServerConfig server;
  ModelConfig model;
  MetricsConfig metrics;

  /**
   * Load configuration from a YAML file.
   * @throws std::runtime_error if file cannot be read or parsed.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Parse configuration from command-line arguments.
   * A --config file is read first; the other flags override its values.
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;

  /**
   * Library options for TextEmbedding::Open().
   * @throws std::runtime_error on an unknown model or provider.
   */
  InitOptions ToInitOptions() const;
};

}  // namespace textembed::server
