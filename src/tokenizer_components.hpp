#pragma once

#include <textembed/status.hpp>
#include <textembed/tokenizer.hpp>

#include <json/json.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace textembed::internal {

/**
 * Text-to-text transform applied before pre-tokenization.
 * Operates on UTF-8.
 */
class Normalizer {
 public:
  virtual ~Normalizer() = default;
  virtual void Normalize(std::string* text) const = 0;
};

/**
 * Splits normalized text into the pieces the model tokenizes independently.
 * Each call refines every existing split.
 */
class PreTokenizer {
 public:
  virtual ~PreTokenizer() = default;
  virtual void PreTokenize(std::vector<std::string>* splits) const = 0;
};

struct Token {
  uint32_t id = 0;
  std::string value;
};

/**
 * Maps one pre-tokenized piece to vocabulary tokens.
 */
class TokenModel {
 public:
  virtual ~TokenModel() = default;

  virtual Status Tokenize(const std::string& piece,
                          std::vector<Token>* out) const = 0;

  virtual std::optional<uint32_t> TokenToId(const std::string& token) const = 0;
  virtual size_t VocabSize() const = 0;
};

/**
 * Adds the special tokens around an encoded sequence.
 */
class PostProcessor {
 public:
  virtual ~PostProcessor() = default;

  /** Number of tokens Process() adds to a single sequence. */
  virtual size_t AddedTokens() const = 0;

  virtual void Process(Encoding* encoding) const = 0;
};

// Factories. A null JSON value yields a null component and OK.
// Unsupported or malformed definitions yield DataFormatError.
Status BuildNormalizer(const Json::Value& def,
                       std::unique_ptr<Normalizer>* out);
Status BuildPreTokenizer(const Json::Value& def,
                         std::unique_ptr<PreTokenizer>* out);
Status BuildModel(const Json::Value& def, std::unique_ptr<TokenModel>* out);
Status BuildPostProcessor(const Json::Value& def,
                          std::unique_ptr<PostProcessor>* out);

/** Standard base64 with padding; false on invalid input. */
bool DecodeBase64(const std::string& in, std::string* out);

}  // namespace textembed::internal
