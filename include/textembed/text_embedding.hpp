#pragma once

#include <textembed/model_repository.hpp>
#include <textembed/models.hpp>
#include <textembed/session.hpp>
#include <textembed/status.hpp>
#include <textembed/tokenizer.hpp>
#include <textembed/tokenizer_config.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace textembed {

/** L2-normalized sentence vector. */
using Embedding = std::vector<float>;

inline constexpr size_t kDefaultBatchSize = 256;
inline constexpr size_t kDefaultMaxLength = 512;
inline constexpr char kDefaultCacheDir[] = ".textembed_cache";

/**
 * Options for TextEmbedding::Open().
 *
 * When cache_dir is left at the default, the TEXTEMBED_CACHE_PATH
 * environment variable overrides it.
 */
struct InitOptions {
  EmbeddingModel model = kDefaultEmbeddingModel;
  std::vector<ExecutionProvider> execution_providers;
  size_t max_length = kDefaultMaxLength;
  std::filesystem::path cache_dir = kDefaultCacheDir;
  bool show_download_progress = true;
};

/** Options for TextEmbedding::OpenUserDefined(). */
struct InitOptionsUserDefined {
  std::vector<ExecutionProvider> execution_providers;
  size_t max_length = kDefaultMaxLength;

  InitOptionsUserDefined() = default;
  explicit InitOptionsUserDefined(const InitOptions& options)
      : execution_providers(options.execution_providers),
        max_length(options.max_length) {}
};

/** A "bring your own" model: serialized network plus tokenizer files. */
struct UserDefinedEmbeddingModel {
  std::string onnx_file;
  TokenizerFiles tokenizer_files;
};

/**
 * Batched sentence-embedding pipeline.
 *
 * Texts are split into batches, each batch is tokenized (padded to its
 * longest sequence), run through the encoder, and the hidden state of the
 * first token of every sequence is L2-normalized into the embedding.
 * Batches run in parallel on a shared worker pool.
 *
 * Thread-safe: Embed() may be called concurrently.
 *
 * Example:
 *   std::unique_ptr<textembed::TextEmbedding> model;
 *   auto s = textembed::TextEmbedding::Open(textembed::InitOptions(), &model);
 *   std::vector<textembed::Embedding> vectors;
 *   s = model->Embed(std::vector<std::string>{"passage: hello"}, &vectors);
 */
class TextEmbedding {
 public:
  ~TextEmbedding();

  TextEmbedding(const TextEmbedding&) = delete;
  TextEmbedding& operator=(const TextEmbedding&) = delete;

  /**
   * Load a supported model, downloading it into the cache if necessary.
   *
   * Errors: RepositoryError (missing files), EngineBuildError (session),
   * DataFormatError (tokenizer files).
   */
  static Status Open(const InitOptions& options,
                     std::unique_ptr<TextEmbedding>* out);

  /** Load a model from in-memory files. */
  static Status OpenUserDefined(const UserDefinedEmbeddingModel& model,
                                const InitOptionsUserDefined& options,
                                std::unique_ptr<TextEmbedding>* out);

  /** Assemble from an existing tokenizer and session. */
  static Status Create(std::unique_ptr<Tokenizer> tokenizer,
                       std::unique_ptr<InferenceSession> session,
                       std::unique_ptr<TextEmbedding>* out);

  /**
   * Embed `texts`, one vector per text in input order.
   *
   * @param batch_size Texts per batch; kDefaultBatchSize when unset, and
   *                   InvalidArgument when zero
   *
   * Any failing batch fails the whole call and `out` is left untouched.
   */
  Status Embed(const std::vector<std::string_view>& texts,
               std::vector<Embedding>* out,
               std::optional<size_t> batch_size = std::nullopt) const;

  Status Embed(const std::vector<std::string>& texts,
               std::vector<Embedding>* out,
               std::optional<size_t> batch_size = std::nullopt) const;

  /** Whether the network declares a "token_type_ids" input. */
  bool need_token_type_ids() const { return need_token_type_ids_; }

  static const std::vector<ModelInfo>& ListSupportedModels() {
    return SupportedModels();
  }

  static const ModelInfo& GetModelInfo(EmbeddingModel model) {
    return textembed::GetModelInfo(model);
  }

 private:
  TextEmbedding(std::unique_ptr<Tokenizer> tokenizer,
                std::unique_ptr<InferenceSession> session);

  Status EmbedBatch(const std::string_view* texts, size_t count,
                    std::vector<Embedding>* out) const;

  std::unique_ptr<Tokenizer> tokenizer_;
  std::unique_ptr<InferenceSession> session_;
  bool need_token_type_ids_ = false;
};

/**
 * Read a whole file into memory. Handy for assembling a
 * UserDefinedEmbeddingModel from cached files.
 */
Status ReadFileToBytes(const std::filesystem::path& path, std::string* out);

/**
 * Fetch tokenizer.json, config.json, special_tokens_map.json and
 * tokenizer_config.json from `repo`.
 */
Status LoadTokenizerFiles(ModelRepository* repo, TokenizerFiles* out);

}  // namespace textembed
