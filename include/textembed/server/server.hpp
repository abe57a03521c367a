#pragma once

#include <textembed/models.hpp>
#include <textembed/server/config.hpp>
#include <textembed/text_embedding.hpp>

#include <memory>
#include <string>

namespace textembed::server {

/**
 * Textembed HTTP Server.
 *
 * Loads one embedding model at construction and serves it over a REST API
 * using Drogon.
 */
class Server {
 public:
  /**
   * Validate the configuration and load the model.
   * @throws std::runtime_error on invalid configuration or load failure.
   */
  explicit Server(const Config& config);

  ~Server();

  // Non-copyable, non-movable
  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  /**
   * Start the server (blocking).
   * Returns when the server shuts down.
   */
  void Run();

  /**
   * Drain in-flight requests, then stop the server.
   */
  void Shutdown();

  const TextEmbedding* GetModel() const { return model_.get(); }

 private:
  void SetupRoutes();
  void SetupShutdown();

  Config config_;
  ModelInfo info_;
  std::unique_ptr<TextEmbedding> model_;
  bool running_ = false;
};

}  // namespace textembed::server
