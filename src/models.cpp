#include <textembed/models.hpp>

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace textembed {

namespace {

std::vector<ModelInfo> BuildRegistry() {
  using M = EmbeddingModel;
  return {
      {M::kAllMiniLML6V2, "AllMiniLML6V2", 384,
       "Sentence Transformer model, MiniLM-L6-v2",
       "Qdrant/all-MiniLM-L6-v2-onnx", "model.onnx", {}, 512},
      {M::kBGEBaseENV15, "BGEBaseENV15", 768,
       "v1.5 release of the base English model",
       "Xenova/bge-base-en-v1.5", "onnx/model.onnx", {}, 512},
      {M::kBGEBaseENV15Q, "BGEBaseENV15Q", 768,
       "Quantized v1.5 release of the base English model",
       "Qdrant/bge-base-en-v1.5-onnx-Q", "model_optimized.onnx", {}, 512},
      {M::kBGELargeENV15, "BGELargeENV15", 1024,
       "v1.5 release of the large English model",
       "Xenova/bge-large-en-v1.5", "onnx/model.onnx", {}, 512},
      {M::kBGELargeENV15Q, "BGELargeENV15Q", 1024,
       "Quantized v1.5 release of the large English model",
       "Qdrant/bge-large-en-v1.5-onnx-Q", "model_optimized.onnx", {}, 512},
      {M::kBGESmallENV15, "BGESmallENV15", 384,
       "v1.5 release of the fast and default English model",
       "Xenova/bge-small-en-v1.5", "onnx/model.onnx", {}, 512},
      {M::kBGESmallENV15Q, "BGESmallENV15Q", 384,
       "Quantized v1.5 release of the fast and default English model",
       "Qdrant/bge-small-en-v1.5-onnx-Q", "model_optimized.onnx", {}, 512},
      {M::kNomicEmbedTextV1, "NomicEmbedTextV1", 768,
       "8192 context length English model",
       "nomic-ai/nomic-embed-text-v1", "onnx/model.onnx", {}, 8192},
      {M::kNomicEmbedTextV15, "NomicEmbedTextV15", 768,
       "v1.5 release of the 8192 context length English model",
       "nomic-ai/nomic-embed-text-v1.5", "onnx/model.onnx", {}, 8192},
      {M::kParaphraseMLMiniLML12V2, "ParaphraseMLMiniLML12V2", 384,
       "Multi-lingual model",
       "Xenova/paraphrase-multilingual-MiniLM-L12-v2", "onnx/model.onnx", {},
       512},
      {M::kParaphraseMLMiniLML12V2Q, "ParaphraseMLMiniLML12V2Q", 384,
       "Quantized Multi-lingual model",
       "Qdrant/paraphrase-multilingual-MiniLM-L12-v2-onnx-Q",
       "model_optimized.onnx", {}, 512},
      {M::kParaphraseMLMpnetBaseV2, "ParaphraseMLMpnetBaseV2", 768,
       "Sentence-transformers model for tasks like clustering or semantic search",
       "Xenova/paraphrase-multilingual-mpnet-base-v2", "onnx/model.onnx", {},
       512},
      {M::kBGESmallZHV15, "BGESmallZHV15", 512,
       "v1.5 release of the small Chinese model",
       "Xenova/bge-small-zh-v1.5", "onnx/model.onnx", {}, 512},
      {M::kMultilingualE5Small, "MultilingualE5Small", 384,
       "Small model of multilingual E5 Text Embeddings",
       "intfloat/multilingual-e5-small", "onnx/model.onnx", {}, 512},
      {M::kMultilingualE5Base, "MultilingualE5Base", 768,
       "Base model of multilingual E5 Text Embeddings",
       "intfloat/multilingual-e5-base", "onnx/model.onnx", {}, 512},
      {M::kMultilingualE5Large, "MultilingualE5Large", 1024,
       "Large model of multilingual E5 Text Embeddings",
       "Qdrant/multilingual-e5-large-onnx", "model.onnx",
       {"model.onnx_data"}, 512},
      {M::kMxbaiEmbedLargeV1, "MxbaiEmbedLargeV1", 1024,
       "Large English embedding model from MixedBreed.ai",
       "mixedbread-ai/mxbai-embed-large-v1", "onnx/model.onnx", {}, 512},
      {M::kMxbaiEmbedLargeV1Q, "MxbaiEmbedLargeV1Q", 1024,
       "Quantized Large English embedding model from MixedBreed.ai",
       "mixedbread-ai/mxbai-embed-large-v1", "onnx/model_quantized.onnx", {},
       512},
  };
}

std::string ToLower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

}  // namespace

const std::vector<ModelInfo>& SupportedModels() {
  static const std::vector<ModelInfo> kRegistry = BuildRegistry();
  return kRegistry;
}

const ModelInfo& GetModelInfo(EmbeddingModel model) {
  static const std::unordered_map<int, const ModelInfo*> kIndex = [] {
    std::unordered_map<int, const ModelInfo*> index;
    for (const auto& info : SupportedModels()) {
      index.emplace(static_cast<int>(info.model), &info);
    }
    return index;
  }();
  // Every enumerator is listed in BuildRegistry().
  return *kIndex.at(static_cast<int>(model));
}

const std::string& ModelCode(EmbeddingModel model) {
  return GetModelInfo(model).model_code;
}

Status ParseModel(std::string_view text, EmbeddingModel* out) {
  const std::string needle = ToLower(text);
  for (const auto& info : SupportedModels()) {
    if (ToLower(info.name) == needle) {
      *out = info.model;
      return Status::OK();
    }
  }
  // Codes are not unique (mxbai ships two weight files); the first entry wins.
  for (const auto& info : SupportedModels()) {
    if (ToLower(info.model_code) == needle) {
      *out = info.model;
      return Status::OK();
    }
  }
  return Status::InvalidArgument("Unknown embedding model: " + std::string(text));
}

}  // namespace textembed
