#pragma once

#include <textembed/status.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace textembed {

namespace internal {
class Normalizer;
class PreTokenizer;
class TokenModel;
class PostProcessor;
}  // namespace internal

/**
 * Output of encoding one text: parallel per-token arrays.
 * After batch padding every array has the same length as the others in
 * the batch.
 */
struct Encoding {
  std::vector<uint32_t> ids;
  std::vector<uint32_t> type_ids;
  std::vector<uint32_t> attention_mask;
  std::vector<uint32_t> special_tokens_mask;
  std::vector<std::string> tokens;

  size_t size() const { return ids.size(); }
};

/**
 * A token matched verbatim in input text before the model runs.
 */
struct AddedToken {
  std::string content;
  bool single_word = false;
  bool lstrip = false;
  bool rstrip = false;
  bool normalized = true;
  bool special = false;

  AddedToken() = default;
  AddedToken(std::string c, bool is_special)
      : content(std::move(c)), special(is_special) {}
};

enum class PaddingStrategy {
  kBatchLongest,
  kFixed
};

enum class Direction {
  kLeft,
  kRight
};

struct PaddingParams {
  PaddingStrategy strategy = PaddingStrategy::kBatchLongest;
  size_t fixed_length = 0;  // kFixed only
  Direction direction = Direction::kRight;
  std::optional<size_t> pad_to_multiple_of;
  uint32_t pad_id = 0;
  uint32_t pad_type_id = 0;
  std::string pad_token = "[PAD]";
};

struct TruncationParams {
  size_t max_length = 512;
  Direction direction = Direction::kRight;
};

/**
 * Batch-encoding capability consumed by the embedding pipeline.
 *
 * Implementations must be safe to call concurrently once configured.
 */
class Tokenizer {
 public:
  virtual ~Tokenizer() = default;

  /**
   * Encode `texts`, applying the configured truncation and padding.
   * Fails with EncodingError if any text cannot be encoded.
   */
  virtual Status EncodeBatch(const std::vector<std::string_view>& texts,
                             bool add_special_tokens,
                             std::vector<Encoding>* out) const = 0;
};

/**
 * Tokenizer built from a serialized `tokenizer.json` definition.
 *
 * The definition is a pipeline: normalizer, pre-tokenizer, model
 * (WordPiece or Unigram) and post-processor, plus a table of added tokens
 * that are split out of the raw text first.
 */
class PretrainedTokenizer : public Tokenizer {
 public:
  ~PretrainedTokenizer() override;

  /**
   * Parse a tokenizer definition.
   * Fails with DataFormatError on malformed JSON or unsupported components.
   */
  static Status FromBytes(std::string_view json,
                          std::unique_ptr<PretrainedTokenizer>* out);

  void SetPadding(std::optional<PaddingParams> padding);
  void SetTruncation(std::optional<TruncationParams> truncation);

  const std::optional<PaddingParams>& padding() const { return padding_; }
  const std::optional<TruncationParams>& truncation() const {
    return truncation_;
  }

  /**
   * Register special tokens. Tokens already registered are skipped; a
   * token present in the model vocabulary keeps its vocabulary id.
   *
   * @return Number of tokens newly registered
   */
  size_t AddSpecialTokens(const std::vector<AddedToken>& tokens);

  /** Encode one text with truncation applied; no padding. */
  Status Encode(std::string_view text, bool add_special_tokens,
                Encoding* out) const;

  Status EncodeBatch(const std::vector<std::string_view>& texts,
                     bool add_special_tokens,
                     std::vector<Encoding>* out) const override;

  std::optional<uint32_t> TokenToId(std::string_view token) const;

  /** Model vocabulary plus added tokens. */
  size_t VocabSize() const;

  const std::vector<AddedToken>& added_tokens() const { return added_; }

 private:
  PretrainedTokenizer();

  struct Segment {
    std::string text;
    std::optional<size_t> added;  // index into added_ for matched tokens
  };

  // Returns false if a token with the same content is already registered.
  bool AddToken(const AddedToken& token, std::optional<uint32_t> id);

  // Split `text` on the added tokens whose `normalized` flag matches.
  void SplitOnAddedTokens(std::string_view text, bool normalized,
                          std::vector<Segment>* out) const;

  Status TokenizeSegment(const std::string& text, Encoding* out) const;
  void PushAdded(size_t index, Encoding* out) const;

  void Truncate(size_t max_tokens, Encoding* enc) const;
  void Pad(size_t target, Encoding* enc) const;

  std::unique_ptr<internal::Normalizer> normalizer_;
  std::unique_ptr<internal::PreTokenizer> pre_tokenizer_;
  std::unique_ptr<internal::TokenModel> model_;
  std::unique_ptr<internal::PostProcessor> post_processor_;

  std::vector<AddedToken> added_;
  std::vector<uint32_t> added_ids_;          // parallel to added_
  std::vector<std::string> added_patterns_;  // content as matched in text
  std::unordered_map<std::string, size_t> added_index_;  // content -> index

  std::optional<PaddingParams> padding_;
  std::optional<TruncationParams> truncation_;
};

}  // namespace textembed
