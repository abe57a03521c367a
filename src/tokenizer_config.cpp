#include <textembed/tokenizer_config.hpp>

#include <json/json.h>
#include <trantor/utils/Logger.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace textembed {

namespace {

Status ParseJson(const std::string& bytes, const char* file_name,
                 Json::Value* out) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  std::string errors;
  if (!reader->parse(bytes.data(), bytes.data() + bytes.size(), out, &errors)) {
    return Status::DataFormatError(std::string("Could not read ") + file_name +
                                   ": " + errors);
  }
  return Status::OK();
}

Status FieldError(const char* file_name, const std::string& field,
                  const char* expected) {
  return Status::DataFormatError(std::string(file_name) + ": '" + field +
                                 "' " + expected);
}

Status ReadFlag(const Json::Value& entry, const std::string& key,
                const char* field, bool* out) {
  const Json::Value& v = entry[field];
  if (!v.isBool()) {
    return FieldError("special_tokens_map.json", key + "." + field,
                      "must be a boolean");
  }
  *out = v.asBool();
  return Status::OK();
}

// A string registers a special token with default attributes; an object
// must spell out every attribute. Other value kinds (lists of additional
// tokens) are ignored.
Status CollectSpecialTokens(const Json::Value& map,
                            std::vector<AddedToken>* out) {
  if (!map.isObject()) return Status::OK();

  for (const auto& key : map.getMemberNames()) {
    const Json::Value& value = map[key];
    if (value.isString()) {
      out->emplace_back(value.asString(), true);
    } else if (value.isObject()) {
      if (!value["content"].isString()) {
        return FieldError("special_tokens_map.json", key + ".content",
                          "must be a string");
      }
      AddedToken token(value["content"].asString(), true);
      Status s = ReadFlag(value, key, "single_word", &token.single_word);
      if (s.ok()) s = ReadFlag(value, key, "lstrip", &token.lstrip);
      if (s.ok()) s = ReadFlag(value, key, "rstrip", &token.rstrip);
      if (s.ok()) s = ReadFlag(value, key, "normalized", &token.normalized);
      if (!s.ok()) return s;
      out->push_back(std::move(token));
    }
  }
  return Status::OK();
}

}  // namespace

size_t EffectiveMaxLength(size_t requested, double model_max_length) {
  constexpr double kSizeLimit =
      static_cast<double>(std::numeric_limits<size_t>::max());
  size_t model_max = 0;
  if (std::isnan(model_max_length) || model_max_length <= 0.0) {
    model_max = 0;
  } else if (model_max_length >= kSizeLimit) {
    model_max = std::numeric_limits<size_t>::max();
  } else {
    model_max = static_cast<size_t>(model_max_length);
  }
  return std::min(requested, model_max);
}

Status LoadPretrainedTokenizer(const TokenizerFiles& files, size_t max_length,
                               std::unique_ptr<PretrainedTokenizer>* out) {
  Json::Value config;
  Json::Value special_tokens_map;
  Json::Value tokenizer_config;

  Status s = ParseJson(files.config_file, "config.json", &config);
  if (!s.ok()) return s;
  s = ParseJson(files.special_tokens_map_file, "special_tokens_map.json",
                &special_tokens_map);
  if (!s.ok()) return s;
  s = ParseJson(files.tokenizer_config_file, "tokenizer_config.json",
                &tokenizer_config);
  if (!s.ok()) return s;

  std::unique_ptr<PretrainedTokenizer> tokenizer;
  s = PretrainedTokenizer::FromBytes(files.tokenizer_file, &tokenizer);
  if (!s.ok()) return s.WithContext("Could not read tokenizer.json");

  if (!config.isObject() || !tokenizer_config.isObject()) {
    return Status::DataFormatError(
        "config.json and tokenizer_config.json must hold JSON objects");
  }

  const Json::Value& model_max = tokenizer_config["model_max_length"];
  if (!model_max.isNumeric() || model_max.isBool()) {
    return FieldError("tokenizer_config.json", "model_max_length",
                      "must be a number");
  }
  const size_t effective = EffectiveMaxLength(max_length, model_max.asDouble());

  const Json::Value& pad_token = tokenizer_config["pad_token"];
  if (!pad_token.isString()) {
    return FieldError("tokenizer_config.json", "pad_token", "must be a string");
  }

  uint32_t pad_id = 0;
  const Json::Value& pad_token_id = config["pad_token_id"];
  if (pad_token_id.isUInt64()) {
    pad_id = static_cast<uint32_t>(pad_token_id.asUInt64());
  }

  PaddingParams padding;
  padding.strategy = PaddingStrategy::kBatchLongest;
  padding.pad_token = pad_token.asString();
  padding.pad_id = pad_id;
  tokenizer->SetPadding(padding);

  TruncationParams truncation;
  truncation.max_length = effective;
  tokenizer->SetTruncation(truncation);

  std::vector<AddedToken> specials;
  s = CollectSpecialTokens(special_tokens_map, &specials);
  if (!s.ok()) return s;
  size_t added = tokenizer->AddSpecialTokens(specials);

  LOG_DEBUG << "Tokenizer configured: max_length=" << effective
            << " pad_token=" << padding.pad_token << " pad_id=" << pad_id
            << " new special tokens=" << added;

  *out = std::move(tokenizer);
  return Status::OK();
}

}  // namespace textembed
