#pragma once

#include <textembed/models.hpp>
#include <textembed/server/config.hpp>
#include <textembed/server/metrics.hpp>
#include <textembed/server/shutdown.hpp>
#include <textembed/status.hpp>
#include <textembed/text_embedding.hpp>

#include <drogon/HttpAppFramework.h>
#include <json/json.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace textembed::server {

/** A decoded POST /v1/embeddings body. */
struct EmbeddingRequest {
  std::vector<std::string> input;
  std::optional<size_t> batch_size;
  std::optional<std::string> model;
};

/**
 * HTTP status for a failed Status: 400 for invalid arguments and encoding
 * errors, 500 otherwise.
 */
int HttpStatusFor(const Status& status);

/**
 * Create an error response `{"error", "code", "message"}` from a Status.
 */
drogon::HttpResponsePtr MakeErrorResponse(const Status& status,
                                          const std::string& context);

/** Parse a request body as JSON; InvalidArgument on malformed input. */
Status ParseJsonBody(std::string_view body, Json::Value* out);

/**
 * Validate an embeddings request.
 * `input` is a string or an array of strings; `batch_size`, when present,
 * is a positive integer.
 */
Status ParseEmbeddingRequest(const Json::Value& body, EmbeddingRequest* out);

/** `{"object":"list","model":...,"data":[{"object","index","embedding"}]}` */
Json::Value MakeEmbeddingResponse(const std::string& model_code,
                                  const std::vector<Embedding>& embeddings);

/** The supported model registry as JSON. */
Json::Value MakeModelsResponse();

/**
 * Register the embedding, model listing and health handlers with the
 * Drogon app. `model` must outlive the app loop; `metrics` may be null.
 *
 * With a `shutdown` coordinator, embedding requests hold a lease while they
 * run and get 503 once it drains; readiness also reports 503 while draining.
 */
void RegisterHandlers(const TextEmbedding* model,
                      const ModelInfo& info,
                      const Config& config,
                      std::shared_ptr<PrometheusMetrics> metrics,
                      ShutdownCoordinator* shutdown = nullptr);

}  // namespace textembed::server
