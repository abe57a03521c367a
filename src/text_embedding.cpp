#include <textembed/text_embedding.hpp>

#include <textembed/normalize.hpp>
#include <textembed/tensor.hpp>
#include <textembed/worker_pool.hpp>

#include <trantor/utils/Logger.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>

namespace textembed {

namespace {

constexpr char kInputIds[] = "input_ids";
constexpr char kAttentionMask[] = "attention_mask";
constexpr char kTokenTypeIds[] = "token_type_ids";
constexpr char kLastHiddenState[] = "last_hidden_state";

std::filesystem::path CacheDirFor(const InitOptions& options) {
  if (options.cache_dir == std::filesystem::path(kDefaultCacheDir)) {
    if (const char* env = std::getenv("TEXTEMBED_CACHE_PATH")) {
      if (*env != '\0') return env;
    }
  }
  return options.cache_dir;
}

}  // namespace

TextEmbedding::TextEmbedding(std::unique_ptr<Tokenizer> tokenizer,
                             std::unique_ptr<InferenceSession> session)
    : tokenizer_(std::move(tokenizer)),
      session_(std::move(session)),
      need_token_type_ids_(session_->HasInput(kTokenTypeIds)) {}

TextEmbedding::~TextEmbedding() = default;

Status TextEmbedding::Create(std::unique_ptr<Tokenizer> tokenizer,
                             std::unique_ptr<InferenceSession> session,
                             std::unique_ptr<TextEmbedding>* out) {
  if (!tokenizer || !session) {
    return Status::InvalidArgument("TextEmbedding needs a tokenizer and a session");
  }
  out->reset(new TextEmbedding(std::move(tokenizer), std::move(session)));
  return Status::OK();
}

Status TextEmbedding::Open(const InitOptions& options,
                           std::unique_ptr<TextEmbedding>* out) {
  const ModelInfo& info = GetModelInfo(options.model);
  const std::filesystem::path cache_dir = CacheDirFor(options);

  std::unique_ptr<ModelRepository> repo;
  Status s = ResolveModel(info, cache_dir, options.show_download_progress, &repo);
  if (!s.ok()) return s;

  std::filesystem::path weights;
  s = FetchModelWeights(repo.get(), info, &weights);
  if (!s.ok()) return s;

  SessionOptions session_options;
  session_options.execution_providers = options.execution_providers;
  session_options.intra_threads = HardwareThreads();

  std::unique_ptr<InferenceSession> session;
  s = InferenceSession::FromFile(weights, session_options, &session);
  if (!s.ok()) return s;

  TokenizerFiles files;
  s = LoadTokenizerFiles(repo.get(), &files);
  if (!s.ok()) return s;

  std::unique_ptr<Tokenizer> tokenizer;
  s = LoadTokenizer(files, options.max_length, &tokenizer);
  if (!s.ok()) return s;

  LOG_INFO << "Loaded embedding model " << info.model_code << " (dim "
           << info.dim << ")";
  return Create(std::move(tokenizer), std::move(session), out);
}

Status TextEmbedding::OpenUserDefined(const UserDefinedEmbeddingModel& model,
                                      const InitOptionsUserDefined& options,
                                      std::unique_ptr<TextEmbedding>* out) {
  SessionOptions session_options;
  session_options.execution_providers = options.execution_providers;
  session_options.intra_threads = HardwareThreads();

  std::unique_ptr<InferenceSession> session;
  Status s = InferenceSession::FromMemory(model.onnx_file, session_options, &session);
  if (!s.ok()) return s;

  std::unique_ptr<Tokenizer> tokenizer;
  s = LoadTokenizer(model.tokenizer_files, options.max_length, &tokenizer);
  if (!s.ok()) return s;

  return Create(std::move(tokenizer), std::move(session), out);
}

Status TextEmbedding::Embed(const std::vector<std::string>& texts,
                            std::vector<Embedding>* out,
                            std::optional<size_t> batch_size) const {
  std::vector<std::string_view> views(texts.begin(), texts.end());
  return Embed(views, out, batch_size);
}

Status TextEmbedding::Embed(const std::vector<std::string_view>& texts,
                            std::vector<Embedding>* out,
                            std::optional<size_t> batch_size) const {
  const size_t size = batch_size.value_or(kDefaultBatchSize);
  if (size == 0) {
    return Status::InvalidArgument("batch_size must be greater than zero");
  }
  if (texts.empty()) {
    out->clear();
    return Status::OK();
  }

  auto start = std::chrono::steady_clock::now();
  const size_t num_batches = (texts.size() + size - 1) / size;

  // Each batch writes only its own slot, so results come back in input
  // order whichever worker finishes first.
  std::vector<std::vector<Embedding>> per_batch(num_batches);
  Status s = internal::SharedWorkerPool().ParallelFor(
      num_batches, [&](size_t b) {
        const size_t begin = b * size;
        const size_t count = std::min(size, texts.size() - begin);
        return EmbedBatch(texts.data() + begin, count, &per_batch[b])
            .WithContext("Batch " + std::to_string(b));
      });
  if (!s.ok()) return s;

  std::vector<Embedding> result;
  result.reserve(texts.size());
  for (auto& batch : per_batch) {
    for (auto& embedding : batch) result.push_back(std::move(embedding));
  }
  *out = std::move(result);

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  LOG_DEBUG << "Embedded " << texts.size() << " texts in " << num_batches
            << " batches (" << elapsed.count() << " ms)";
  return Status::OK();
}

Status TextEmbedding::EmbedBatch(const std::string_view* texts, size_t count,
                                 std::vector<Embedding>* out) const {
  std::vector<std::string_view> batch(texts, texts + count);
  std::vector<Encoding> encodings;
  Status s = tokenizer_->EncodeBatch(batch, true, &encodings);
  if (!s.ok()) {
    return s.IsEncodingError() ? s : Status::EncodingError(s.ToString());
  }
  if (encodings.size() != count) {
    return Status::EncodingError("Tokenizer returned " +
                                 std::to_string(encodings.size()) +
                                 " encodings for " + std::to_string(count) +
                                 " texts");
  }

  // Padding to the batch longest makes every encoding this long.
  const size_t seq_len = encodings[0].size();
  const size_t total = count * seq_len;

  std::vector<int64_t> ids;
  std::vector<int64_t> mask;
  std::vector<int64_t> type_ids;
  ids.reserve(total);
  mask.reserve(total);
  if (need_token_type_ids_) type_ids.reserve(total);

  for (const auto& encoding : encodings) {
    ids.insert(ids.end(), encoding.ids.begin(), encoding.ids.end());
    mask.insert(mask.end(), encoding.attention_mask.begin(),
                encoding.attention_mask.end());
    if (need_token_type_ids_) {
      type_ids.insert(type_ids.end(), encoding.type_ids.begin(),
                      encoding.type_ids.end());
    }
  }

  const std::vector<int64_t> shape = {static_cast<int64_t>(count),
                                      static_cast<int64_t>(seq_len)};
  NamedTensors inputs;
  s = Tensor::FromInt64(std::move(ids), shape, &inputs[kInputIds]);
  if (!s.ok()) return s.WithContext(kInputIds);
  s = Tensor::FromInt64(std::move(mask), shape, &inputs[kAttentionMask]);
  if (!s.ok()) return s.WithContext(kAttentionMask);
  if (need_token_type_ids_) {
    s = Tensor::FromInt64(std::move(type_ids), shape, &inputs[kTokenTypeIds]);
    if (!s.ok()) return s.WithContext(kTokenTypeIds);
  }

  NamedTensors outputs;
  s = session_->Run(inputs, &outputs);
  if (!s.ok()) {
    return s.IsInferenceRuntimeError() ? s
                                       : Status::InferenceRuntimeError(s.ToString());
  }

  auto it = outputs.find(kLastHiddenState);
  if (it == outputs.end()) {
    return Status::TensorShapeError("Output 'last_hidden_state' not produced");
  }
  const Tensor& hidden = it->second;
  const auto& dims = hidden.shape();
  if (hidden.type() != TensorType::kFloat32 || dims.size() != 3 ||
      dims[0] != static_cast<int64_t>(count) || dims[1] < 1 || dims[2] < 1) {
    return Status::TensorShapeError(
        "Expected float last_hidden_state of shape (" + std::to_string(count) +
        ", seq, hidden), got " + ShapeToString(dims));
  }

  // Pool by taking the hidden state at position 0 of every sequence.
  const size_t row_stride = static_cast<size_t>(dims[1] * dims[2]);
  const size_t hidden_dim = static_cast<size_t>(dims[2]);
  const float* data = hidden.float_data().data();

  out->clear();
  out->reserve(count);
  for (size_t i = 0; i < count; ++i) {
    out->push_back(internal::Normalize(data + i * row_stride, hidden_dim));
  }
  return Status::OK();
}

Status ReadFileToBytes(const std::filesystem::path& path, std::string* out) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return Status::IOError("Cannot open " + path.string());
  }

  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  std::string buffer;
  if (!ec) buffer.reserve(static_cast<size_t>(size));
  buffer.assign(std::istreambuf_iterator<char>(file),
                std::istreambuf_iterator<char>());
  if (file.bad()) {
    return Status::IOError("Failed to read " + path.string());
  }
  *out = std::move(buffer);
  return Status::OK();
}

Status LoadTokenizerFiles(ModelRepository* repo, TokenizerFiles* out) {
  struct Entry {
    const char* name;
    std::string* bytes;
  };
  const Entry entries[] = {
      {"tokenizer.json", &out->tokenizer_file},
      {"config.json", &out->config_file},
      {"special_tokens_map.json", &out->special_tokens_map_file},
      {"tokenizer_config.json", &out->tokenizer_config_file},
  };

  for (const auto& entry : entries) {
    std::filesystem::path path;
    Status s = repo->Get(entry.name, &path);
    if (!s.ok()) return s;
    s = ReadFileToBytes(path, entry.bytes);
    if (!s.ok()) return s;
  }
  return Status::OK();
}

}  // namespace textembed
