#include <textembed/tokenizer.hpp>

#include "tokenizer_components.hpp"

#include <textembed/unicode.hpp>

#include <json/json.h>

#include <algorithm>

namespace textembed {

namespace {

bool IsAsciiSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// Code point ending at byte `pos` (exclusive), or 0 at the start.
char32_t CharBefore(std::string_view text, size_t pos) {
  if (pos == 0) return 0;
  size_t start = pos - 1;
  while (start > 0 && (static_cast<uint8_t>(text[start]) & 0xC0) == 0x80) {
    --start;
  }
  std::u32string cps = internal::DecodeUtf8(text.substr(start, pos - start));
  return cps.empty() ? 0 : cps.front();
}

// Code point starting at byte `pos`, or 0 at the end.
char32_t CharAt(std::string_view text, size_t pos) {
  if (pos >= text.size()) return 0;
  size_t end = pos + 1;
  while (end < text.size() && (static_cast<uint8_t>(text[end]) & 0xC0) == 0x80) {
    ++end;
  }
  std::u32string cps = internal::DecodeUtf8(text.substr(pos, end - pos));
  return cps.empty() ? 0 : cps.front();
}

size_t NextCharStart(std::string_view text, size_t pos) {
  ++pos;
  while (pos < text.size() && (static_cast<uint8_t>(text[pos]) & 0xC0) == 0x80) {
    ++pos;
  }
  return pos;
}

Status ParseDirection(const Json::Value& v, Direction* out) {
  if (v.isNull()) {
    *out = Direction::kRight;
    return Status::OK();
  }
  std::string name = v.isString() ? v.asString() : std::string();
  if (name == "Right") {
    *out = Direction::kRight;
  } else if (name == "Left") {
    *out = Direction::kLeft;
  } else {
    return Status::DataFormatError(
        "Invalid tokenizer definition: unknown direction '" + name + "'");
  }
  return Status::OK();
}

// Reads an optional boolean flag, rejecting values of any other type.
Status ReadFlag(const Json::Value& entry, const char* key, bool fallback,
                bool* out) {
  const Json::Value& v = entry[key];
  if (v.isNull()) {
    *out = fallback;
  } else if (v.isBool()) {
    *out = v.asBool();
  } else {
    return Status::DataFormatError(std::string("Invalid tokenizer definition: "
                                               "added token '") +
                                   key + "' must be a boolean");
  }
  return Status::OK();
}

Status ParseAddedToken(const Json::Value& entry, AddedToken* token,
                       uint32_t* id) {
  if (!entry.isObject() || !entry["content"].isString() ||
      !entry["id"].isUInt()) {
    return Status::DataFormatError(
        "Invalid tokenizer definition: added token needs 'id' and 'content'");
  }
  token->content = entry["content"].asString();
  *id = entry["id"].asUInt();
  Status s = ReadFlag(entry, "single_word", false, &token->single_word);
  if (s.ok()) s = ReadFlag(entry, "lstrip", false, &token->lstrip);
  if (s.ok()) s = ReadFlag(entry, "rstrip", false, &token->rstrip);
  if (s.ok()) s = ReadFlag(entry, "normalized", true, &token->normalized);
  if (s.ok()) s = ReadFlag(entry, "special", false, &token->special);
  return s;
}

Status ParseTruncation(const Json::Value& def, TruncationParams* out) {
  if (!def["max_length"].isUInt()) {
    return Status::DataFormatError(
        "Invalid tokenizer definition: truncation.max_length must be an integer");
  }
  out->max_length = def["max_length"].asUInt();
  return ParseDirection(def["direction"], &out->direction);
}

Status ParsePadding(const Json::Value& def, PaddingParams* out) {
  const Json::Value& strategy = def["strategy"];
  if (strategy.isObject() && strategy["Fixed"].isUInt()) {
    out->strategy = PaddingStrategy::kFixed;
    out->fixed_length = strategy["Fixed"].asUInt();
  } else if (strategy.isNull() ||
             (strategy.isString() && strategy.asString() == "BatchLongest")) {
    out->strategy = PaddingStrategy::kBatchLongest;
  } else {
    return Status::DataFormatError(
        "Invalid tokenizer definition: unknown padding strategy");
  }
  if (def["pad_to_multiple_of"].isUInt()) {
    out->pad_to_multiple_of = def["pad_to_multiple_of"].asUInt();
  }
  if (def["pad_id"].isUInt()) out->pad_id = def["pad_id"].asUInt();
  if (def["pad_type_id"].isUInt()) out->pad_type_id = def["pad_type_id"].asUInt();
  if (def["pad_token"].isString()) out->pad_token = def["pad_token"].asString();
  return ParseDirection(def["direction"], &out->direction);
}

}  // namespace

PretrainedTokenizer::PretrainedTokenizer() = default;
PretrainedTokenizer::~PretrainedTokenizer() = default;

Status PretrainedTokenizer::FromBytes(std::string_view json,
                                      std::unique_ptr<PretrainedTokenizer>* out) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors)) {
    return Status::DataFormatError("Invalid tokenizer definition: " + errors);
  }
  if (!root.isObject()) {
    return Status::DataFormatError(
        "Invalid tokenizer definition: top level must be an object");
  }

  auto tokenizer = std::unique_ptr<PretrainedTokenizer>(new PretrainedTokenizer());

  Status s = internal::BuildNormalizer(root["normalizer"], &tokenizer->normalizer_);
  if (!s.ok()) return s;
  s = internal::BuildPreTokenizer(root["pre_tokenizer"], &tokenizer->pre_tokenizer_);
  if (!s.ok()) return s;
  s = internal::BuildModel(root["model"], &tokenizer->model_);
  if (!s.ok()) return s;
  s = internal::BuildPostProcessor(root["post_processor"],
                                   &tokenizer->post_processor_);
  if (!s.ok()) return s;

  const Json::Value& added = root["added_tokens"];
  if (!added.isNull() && !added.isArray()) {
    return Status::DataFormatError(
        "Invalid tokenizer definition: added_tokens must be an array");
  }
  for (const auto& entry : added) {
    AddedToken token;
    uint32_t id = 0;
    s = ParseAddedToken(entry, &token, &id);
    if (!s.ok()) return s;
    tokenizer->AddToken(token, id);
  }

  if (root["truncation"].isObject()) {
    TruncationParams truncation;
    s = ParseTruncation(root["truncation"], &truncation);
    if (!s.ok()) return s;
    tokenizer->truncation_ = truncation;
  }
  if (root["padding"].isObject()) {
    PaddingParams padding;
    s = ParsePadding(root["padding"], &padding);
    if (!s.ok()) return s;
    tokenizer->padding_ = padding;
  }

  *out = std::move(tokenizer);
  return Status::OK();
}

void PretrainedTokenizer::SetPadding(std::optional<PaddingParams> padding) {
  padding_ = std::move(padding);
}

void PretrainedTokenizer::SetTruncation(std::optional<TruncationParams> truncation) {
  truncation_ = std::move(truncation);
}

bool PretrainedTokenizer::AddToken(const AddedToken& token,
                                   std::optional<uint32_t> id) {
  if (token.content.empty() || added_index_.count(token.content) > 0) {
    return false;
  }

  if (!id) id = model_->TokenToId(token.content);
  if (!id) {
    uint32_t next = static_cast<uint32_t>(model_->VocabSize());
    for (uint32_t existing : added_ids_) next = std::max(next, existing + 1);
    id = next;
  }

  std::string pattern = token.content;
  if (token.normalized && normalizer_) normalizer_->Normalize(&pattern);

  added_index_.emplace(token.content, added_.size());
  added_.push_back(token);
  added_ids_.push_back(*id);
  added_patterns_.push_back(std::move(pattern));
  return true;
}

size_t PretrainedTokenizer::AddSpecialTokens(const std::vector<AddedToken>& tokens) {
  size_t added = 0;
  for (const auto& token : tokens) {
    AddedToken special = token;
    special.special = true;
    if (AddToken(special, std::nullopt)) ++added;
  }
  return added;
}

std::optional<uint32_t> PretrainedTokenizer::TokenToId(std::string_view token) const {
  auto it = added_index_.find(std::string(token));
  if (it != added_index_.end()) return added_ids_[it->second];
  return model_->TokenToId(std::string(token));
}

size_t PretrainedTokenizer::VocabSize() const {
  size_t extra = 0;
  for (const auto& token : added_) {
    if (!model_->TokenToId(token.content)) ++extra;
  }
  return model_->VocabSize() + extra;
}

void PretrainedTokenizer::SplitOnAddedTokens(std::string_view text,
                                             bool normalized,
                                             std::vector<Segment>* out) const {
  size_t segment_start = 0;
  size_t pos = 0;

  while (pos < text.size()) {
    // Longest registered token matching at `pos`.
    std::optional<size_t> best;
    size_t best_len = 0;
    for (size_t i = 0; i < added_.size(); ++i) {
      if (added_[i].normalized != normalized) continue;
      const std::string& pattern = added_patterns_[i];
      if (pattern.empty() || pattern.size() <= best_len) continue;
      if (text.compare(pos, pattern.size(), pattern) != 0) continue;
      if (added_[i].single_word) {
        char32_t before = CharBefore(text, pos);
        char32_t after = CharAt(text, pos + pattern.size());
        if ((before != 0 && internal::IsWordChar(before)) ||
            (after != 0 && internal::IsWordChar(after))) {
          continue;
        }
      }
      best = i;
      best_len = pattern.size();
    }

    if (!best) {
      pos = NextCharStart(text, pos);
      continue;
    }

    size_t match_begin = pos;
    size_t match_end = pos + best_len;
    if (added_[*best].lstrip) {
      while (match_begin > segment_start && IsAsciiSpace(text[match_begin - 1])) {
        --match_begin;
      }
    }
    if (added_[*best].rstrip) {
      while (match_end < text.size() && IsAsciiSpace(text[match_end])) {
        ++match_end;
      }
    }

    if (match_begin > segment_start) {
      out->push_back(
          {std::string(text.substr(segment_start, match_begin - segment_start)),
           std::nullopt});
    }
    out->push_back({std::string(text.substr(pos, best_len)), best});
    pos = match_end;
    segment_start = match_end;
  }

  if (segment_start < text.size()) {
    out->push_back({std::string(text.substr(segment_start)), std::nullopt});
  }
}

void PretrainedTokenizer::PushAdded(size_t index, Encoding* out) const {
  out->ids.push_back(added_ids_[index]);
  out->type_ids.push_back(0);
  out->attention_mask.push_back(1);
  out->special_tokens_mask.push_back(added_[index].special ? 1 : 0);
  out->tokens.push_back(added_[index].content);
}

Status PretrainedTokenizer::TokenizeSegment(const std::string& text,
                                            Encoding* out) const {
  std::vector<std::string> splits{text};
  if (pre_tokenizer_) pre_tokenizer_->PreTokenize(&splits);

  std::vector<internal::Token> tokens;
  for (const auto& split : splits) {
    Status s = model_->Tokenize(split, &tokens);
    if (!s.ok()) return s;
  }

  for (auto& token : tokens) {
    out->ids.push_back(token.id);
    out->type_ids.push_back(0);
    out->attention_mask.push_back(1);
    out->special_tokens_mask.push_back(0);
    out->tokens.push_back(std::move(token.value));
  }
  return Status::OK();
}

void PretrainedTokenizer::Truncate(size_t max_tokens, Encoding* enc) const {
  if (enc->size() <= max_tokens) return;
  const bool left = truncation_ && truncation_->direction == Direction::kLeft;

  auto cut = [&](auto& v) {
    if (left) {
      v.erase(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(v.size() - max_tokens));
    } else {
      v.resize(max_tokens);
    }
  };
  cut(enc->ids);
  cut(enc->type_ids);
  cut(enc->attention_mask);
  cut(enc->special_tokens_mask);
  cut(enc->tokens);
}

void PretrainedTokenizer::Pad(size_t target, Encoding* enc) const {
  if (!padding_ || enc->size() >= target) return;
  const size_t n = target - enc->size();
  const bool left = padding_->direction == Direction::kLeft;

  auto fill = [&](auto& v, const auto& value) {
    if (left) {
      v.insert(v.begin(), n, value);
    } else {
      v.insert(v.end(), n, value);
    }
  };
  fill(enc->ids, padding_->pad_id);
  fill(enc->type_ids, padding_->pad_type_id);
  fill(enc->attention_mask, 0u);
  fill(enc->special_tokens_mask, 1u);
  fill(enc->tokens, padding_->pad_token);
}

Status PretrainedTokenizer::Encode(std::string_view text, bool add_special_tokens,
                                   Encoding* out) const {
  Encoding enc;

  // Tokens that match the raw text are split out before normalization; the
  // rest are matched against normalized text.
  std::vector<Segment> raw;
  SplitOnAddedTokens(text, false, &raw);
  for (const auto& segment : raw) {
    if (segment.added) {
      PushAdded(*segment.added, &enc);
      continue;
    }
    std::string normalized = segment.text;
    if (normalizer_) normalizer_->Normalize(&normalized);

    std::vector<Segment> inner;
    SplitOnAddedTokens(normalized, true, &inner);
    for (const auto& piece : inner) {
      if (piece.added) {
        PushAdded(*piece.added, &enc);
        continue;
      }
      Status s = TokenizeSegment(piece.text, &enc);
      if (!s.ok()) return s;
    }
  }

  const size_t specials =
      (add_special_tokens && post_processor_) ? post_processor_->AddedTokens() : 0;
  if (truncation_) {
    if (truncation_->max_length < specials) {
      return Status::EncodingError(
          "Truncation length " + std::to_string(truncation_->max_length) +
          " is shorter than the " + std::to_string(specials) +
          " special tokens added to each sequence");
    }
    Truncate(truncation_->max_length - specials, &enc);
  }
  if (specials > 0) post_processor_->Process(&enc);

  *out = std::move(enc);
  return Status::OK();
}

Status PretrainedTokenizer::EncodeBatch(const std::vector<std::string_view>& texts,
                                        bool add_special_tokens,
                                        std::vector<Encoding>* out) const {
  std::vector<Encoding> encodings(texts.size());
  for (size_t i = 0; i < texts.size(); ++i) {
    Status s = Encode(texts[i], add_special_tokens, &encodings[i]);
    if (!s.ok()) {
      return Status::EncodingError(s.message())
          .WithContext("Failed to encode text " + std::to_string(i));
    }
  }

  if (padding_ && !encodings.empty()) {
    size_t target = padding_->fixed_length;
    if (padding_->strategy == PaddingStrategy::kBatchLongest) {
      target = 0;
      for (const auto& e : encodings) target = std::max(target, e.size());
    }
    if (padding_->pad_to_multiple_of && *padding_->pad_to_multiple_of > 0) {
      size_t m = *padding_->pad_to_multiple_of;
      target = (target + m - 1) / m * m;
    }
    for (auto& e : encodings) Pad(target, &e);
  }

  *out = std::move(encodings);
  return Status::OK();
}

}  // namespace textembed
