#pragma once

#include <textembed/status.hpp>
#include <textembed/tokenizer.hpp>

#include <cstddef>
#include <memory>
#include <string>

namespace textembed {

/**
 * Raw contents of the four files that define a pretrained tokenizer.
 */
struct TokenizerFiles {
  std::string tokenizer_file;           // tokenizer.json
  std::string config_file;              // config.json
  std::string special_tokens_map_file;  // special_tokens_map.json
  std::string tokenizer_config_file;    // tokenizer_config.json
};

/**
 * min(requested, model_max_length) with the model value truncated toward
 * zero and saturated to the size_t range. Models use huge sentinels such as
 * 1e30 to mean "unbounded".
 */
size_t EffectiveMaxLength(size_t requested, double model_max_length);

/**
 * Build a tokenizer ready for embedding.
 *
 * Padding pads each batch to its longest sequence with the pad token from
 * tokenizer_config.json and `pad_token_id` from config.json (0 if absent).
 * Truncation caps sequences at EffectiveMaxLength(). Every entry of
 * special_tokens_map.json is registered as a special token.
 *
 * Fails with DataFormatError naming the offending file and field.
 */
Status LoadPretrainedTokenizer(const TokenizerFiles& files, size_t max_length,
                               std::unique_ptr<PretrainedTokenizer>* out);

inline Status LoadTokenizer(const TokenizerFiles& files, size_t max_length,
                            std::unique_ptr<Tokenizer>* out) {
  std::unique_ptr<PretrainedTokenizer> tokenizer;
  Status s = LoadPretrainedTokenizer(files, max_length, &tokenizer);
  if (s.ok()) *out = std::move(tokenizer);
  return s;
}

}  // namespace textembed
