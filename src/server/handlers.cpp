#include <textembed/server/handlers.hpp>

#include <drogon/drogon.h>
#include <trantor/utils/Logger.h>

#include <chrono>
#include <memory>
#include <optional>

namespace textembed::server {

namespace {

drogon::HttpResponsePtr JsonResponse(const Json::Value& json,
                                     drogon::HttpStatusCode code) {
  auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
  resp->setStatusCode(code);
  return resp;
}

const char* ErrorName(const Status& status) {
  switch (status.code()) {
    case Status::Code::kInvalidArgument:
      return "invalid_argument";
    case Status::Code::kEncodingError:
      return "encoding_error";
    case Status::Code::kTensorShapeError:
      return "tensor_shape_error";
    case Status::Code::kInferenceRuntimeError:
      return "inference_error";
    default:
      return "internal_error";
  }
}

Json::Value ModelInfoJson(const ModelInfo& info) {
  Json::Value json;
  json["id"] = info.model_code;
  json["object"] = "model";
  json["name"] = info.name;
  json["dim"] = static_cast<Json::UInt64>(info.dim);
  json["description"] = info.description;
  json["model_file"] = info.model_file;
  json["max_length"] = static_cast<Json::UInt64>(info.max_length);
  return json;
}

}  // namespace

// --- Error Response Helper ---

int HttpStatusFor(const Status& status) {
  if (status.IsInvalidArgument() || status.IsEncodingError()) {
    return 400;
  }
  return 500;
}

drogon::HttpResponsePtr MakeErrorResponse(const Status& status,
                                          const std::string& context) {
  const int http_code = HttpStatusFor(status);

  Json::Value json;
  json["error"] = ErrorName(status);
  json["code"] = http_code;
  json["message"] = context + ": " + status.ToString();

  return JsonResponse(json, static_cast<drogon::HttpStatusCode>(http_code));
}

// --- Request / Response Bodies ---

Status ParseJsonBody(std::string_view body, Json::Value* out) {
  if (body.empty()) {
    return Status::InvalidArgument("Request body is empty");
  }
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  std::string errors;
  if (!reader->parse(body.data(), body.data() + body.size(), out, &errors)) {
    return Status::InvalidArgument("Request body is not valid JSON: " + errors);
  }
  return Status::OK();
}

Status ParseEmbeddingRequest(const Json::Value& body, EmbeddingRequest* out) {
  if (!body.isObject()) {
    return Status::InvalidArgument("Request body must be a JSON object");
  }
  if (!body.isMember("input")) {
    return Status::InvalidArgument("Request body must contain 'input'");
  }

  EmbeddingRequest request;
  const Json::Value& input = body["input"];
  if (input.isString()) {
    request.input.push_back(input.asString());
  } else if (input.isArray()) {
    request.input.reserve(input.size());
    for (Json::ArrayIndex i = 0; i < input.size(); ++i) {
      if (!input[i].isString()) {
        return Status::InvalidArgument("input[" + std::to_string(i) +
                                       "] must be a string");
      }
      request.input.push_back(input[i].asString());
    }
  } else {
    return Status::InvalidArgument("'input' must be a string or an array of strings");
  }

  if (body.isMember("batch_size")) {
    const Json::Value& batch = body["batch_size"];
    if (!batch.isIntegral() || !batch.isUInt64() || batch.asUInt64() == 0) {
      return Status::InvalidArgument("'batch_size' must be a positive integer");
    }
    request.batch_size = static_cast<size_t>(batch.asUInt64());
  }

  if (body.isMember("model")) {
    if (!body["model"].isString()) {
      return Status::InvalidArgument("'model' must be a string");
    }
    request.model = body["model"].asString();
  }

  *out = std::move(request);
  return Status::OK();
}

Json::Value MakeEmbeddingResponse(const std::string& model_code,
                                  const std::vector<Embedding>& embeddings) {
  Json::Value json;
  json["object"] = "list";
  json["model"] = model_code;

  Json::Value data(Json::arrayValue);
  for (size_t i = 0; i < embeddings.size(); ++i) {
    Json::Value item;
    item["object"] = "embedding";
    item["index"] = static_cast<Json::UInt64>(i);
    Json::Value vector(Json::arrayValue);
    for (float v : embeddings[i]) {
      vector.append(static_cast<double>(v));
    }
    item["embedding"] = std::move(vector);
    data.append(std::move(item));
  }
  json["data"] = std::move(data);
  return json;
}

Json::Value MakeModelsResponse() {
  Json::Value json;
  json["object"] = "list";
  Json::Value data(Json::arrayValue);
  for (const auto& info : SupportedModels()) {
    data.append(ModelInfoJson(info));
  }
  json["data"] = std::move(data);
  return json;
}

// --- Handler Registration ---

void RegisterHandlers(const TextEmbedding* model,
                      const ModelInfo& info,
                      const Config& config,
                      std::shared_ptr<PrometheusMetrics> metrics,
                      ShutdownCoordinator* shutdown) {
  auto& app = drogon::app();
  const size_t default_batch_size = config.model.batch_size;

  // ==========================================================================
  // Embedding Endpoints
  // ==========================================================================

  // POST /v1/embeddings - Embed one text or a list of texts
  app.registerHandler(
      "/v1/embeddings",
      [model, info, default_batch_size, metrics, shutdown](
          const drogon::HttpRequestPtr& req,
          std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
        RequestTimer timer(metrics, "POST", "/v1/embeddings");

        // Held until the response is handed back so shutdown can drain it.
        std::optional<ShutdownCoordinator::Lease> lease =
            shutdown != nullptr ? shutdown->Admit() : std::nullopt;
        if (shutdown != nullptr && !lease) {
          timer.SetStatusCode(503);
          Json::Value json;
          json["error"] = "shutting_down";
          json["code"] = 503;
          json["message"] = "Server is shutting down";
          callback(JsonResponse(json, drogon::k503ServiceUnavailable));
          return;
        }

        Json::Value body;
        EmbeddingRequest request;
        Status status = ParseJsonBody(req->body(), &body);
        if (status.ok()) {
          status = ParseEmbeddingRequest(body, &request);
        }
        if (status.ok() && request.model) {
          EmbeddingModel requested;
          Status parsed = ParseModel(*request.model, &requested);
          if (!parsed.ok() || requested != info.model) {
            status = Status::InvalidArgument("This server only serves " +
                                             info.model_code);
          }
        }
        if (!status.ok()) {
          timer.SetStatusCode(HttpStatusFor(status));
          callback(MakeErrorResponse(status, "Invalid embeddings request"));
          return;
        }

        const size_t batch_size = request.batch_size.value_or(default_batch_size);
        auto start = std::chrono::steady_clock::now();

        std::vector<Embedding> embeddings;
        status = model->Embed(request.input, &embeddings, batch_size);
        if (!status.ok()) {
          LOG_WARN << "Embedding " << request.input.size()
                   << " texts failed: " << status.ToString();
          if (metrics) metrics->RecordEmbeddingFailure();
          timer.SetStatusCode(HttpStatusFor(status));
          callback(MakeErrorResponse(status, "Embedding failed"));
          return;
        }

        if (metrics) {
          auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
              std::chrono::steady_clock::now() - start);
          const uint64_t batches =
              (request.input.size() + batch_size - 1) / batch_size;
          metrics->RecordEmbedding(request.input.size(), batches,
                                   static_cast<double>(elapsed.count()) / 1000.0);
        }

        callback(JsonResponse(MakeEmbeddingResponse(info.model_code, embeddings),
                              drogon::k200OK));
      },
      {drogon::Post});

  // GET /v1/models - Supported model registry
  app.registerHandler(
      "/v1/models",
      [metrics](const drogon::HttpRequestPtr& req,
                std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
        RequestTimer timer(metrics, "GET", "/v1/models");
        callback(JsonResponse(MakeModelsResponse(), drogon::k200OK));
      },
      {drogon::Get});

  // ==========================================================================
  // Health Endpoints
  // ==========================================================================

  // GET /health - Liveness check
  app.registerHandler(
      "/health",
      [](const drogon::HttpRequestPtr& req,
         std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
        Json::Value json;
        json["status"] = "healthy";
        callback(JsonResponse(json, drogon::k200OK));
      },
      {drogon::Get});

  // GET /health/ready - Readiness check with model details
  app.registerHandler(
      "/health/ready",
      [model, info, shutdown](
          const drogon::HttpRequestPtr& req,
          std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
        Json::Value json;
        if (shutdown != nullptr && shutdown->IsDraining()) {
          json["status"] = "draining";
          json["in_flight"] = static_cast<Json::UInt64>(shutdown->InFlight());
          callback(JsonResponse(json, drogon::k503ServiceUnavailable));
        } else if (model != nullptr) {
          json["status"] = "healthy";
          json["model"] = info.model_code;
          json["dim"] = static_cast<Json::UInt64>(info.dim);
          json["token_type_ids"] = model->need_token_type_ids();
          callback(JsonResponse(json, drogon::k200OK));
        } else {
          json["status"] = "unhealthy";
          json["error"] = "model not loaded";
          callback(JsonResponse(json, drogon::k503ServiceUnavailable));
        }
      },
      {drogon::Get});
}

}  // namespace textembed::server
