#pragma once

#include <textembed/status.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace textembed {

/** Embedding models with a known repository layout. */
enum class EmbeddingModel {
  kAllMiniLML6V2,
  kBGEBaseENV15,
  kBGEBaseENV15Q,
  kBGELargeENV15,
  kBGELargeENV15Q,
  kBGESmallENV15,
  kBGESmallENV15Q,
  kNomicEmbedTextV1,
  kNomicEmbedTextV15,
  kParaphraseMLMiniLML12V2,
  kParaphraseMLMiniLML12V2Q,
  kParaphraseMLMpnetBaseV2,
  kBGESmallZHV15,
  kMultilingualE5Small,
  kMultilingualE5Base,
  kMultilingualE5Large,
  kMxbaiEmbedLargeV1,
  kMxbaiEmbedLargeV1Q,
};

inline constexpr EmbeddingModel kDefaultEmbeddingModel =
    EmbeddingModel::kBGESmallENV15;

/**
 * Static description of a supported model.
 */
struct ModelInfo {
  EmbeddingModel model;
  std::string name;         // Enum-style name, e.g. "BGESmallENV15"
  size_t dim = 0;           // Hidden size of the encoder output
  std::string description;
  std::string model_code;   // Repository name, e.g. "Xenova/bge-small-en-v1.5"
  std::string model_file;   // Weights file inside the repository
  // Files that must be present next to model_file (external weight blobs).
  std::vector<std::string> additional_files;
  size_t max_length = 512;  // Max sequence length declared by the model
};

/**
 * The registry of supported models, built once on first use.
 */
const std::vector<ModelInfo>& SupportedModels();

/** Descriptor for `model`. Every enumerator has an entry. */
const ModelInfo& GetModelInfo(EmbeddingModel model);

/** Repository name for `model`; this is also its display form. */
const std::string& ModelCode(EmbeddingModel model);

/**
 * Look up a model by repository name or enum-style name (case-insensitive).
 * Returns InvalidArgument if nothing matches.
 */
Status ParseModel(std::string_view text, EmbeddingModel* out);

}  // namespace textembed
