#include "tokenizer_components.hpp"

#include <textembed/unicode.hpp>

#include <openssl/evp.h>
#include <re2/re2.h>

#include <algorithm>
#include <functional>
#include <limits>

namespace textembed::internal {

namespace {

Status Malformed(const std::string& what) {
  return Status::DataFormatError("Invalid tokenizer definition: " + what);
}

bool GetBool(const Json::Value& def, const char* key, bool fallback) {
  const Json::Value& v = def[key];
  return v.isBool() ? v.asBool() : fallback;
}

std::string TypeOf(const Json::Value& def) {
  const Json::Value& t = def["type"];
  return t.isString() ? t.asString() : std::string();
}

std::u32string RemoveMarks(const std::u32string& in) {
  std::u32string out;
  out.reserve(in.size());
  for (char32_t cp : in) {
    if (!IsCombiningMark(cp)) out.push_back(cp);
  }
  return out;
}

// ---------------------------------------------------------------------------
// Normalizers
// ---------------------------------------------------------------------------

class BertNormalizer : public Normalizer {
 public:
  BertNormalizer(bool clean_text, bool handle_chinese_chars,
                 std::optional<bool> strip_accents, bool lowercase)
      : clean_text_(clean_text),
        handle_chinese_chars_(handle_chinese_chars),
        strip_accents_(strip_accents.value_or(lowercase)),
        lowercase_(lowercase) {}

  void Normalize(std::string* text) const override {
    std::u32string in = DecodeUtf8(*text);
    std::u32string out;
    out.reserve(in.size());

    for (char32_t cp : in) {
      if (clean_text_) {
        if (cp == 0 || cp == 0xFFFD || IsControl(cp)) continue;
        if (IsWhitespace(cp)) {
          out.push_back(U' ');
          continue;
        }
      }
      if (handle_chinese_chars_ && IsChineseChar(cp)) {
        out.push_back(U' ');
        out.push_back(cp);
        out.push_back(U' ');
        continue;
      }
      out.push_back(cp);
    }

    if (strip_accents_) {
      out = RemoveMarks(internal::Normalize(out, NormalizationForm::kNFD));
    }
    if (lowercase_) out = ToLower(out);
    *text = EncodeUtf8(out);
  }

 private:
  bool clean_text_;
  bool handle_chinese_chars_;
  bool strip_accents_;
  bool lowercase_;
};

class LowercaseNormalizer : public Normalizer {
 public:
  void Normalize(std::string* text) const override {
    *text = EncodeUtf8(ToLower(DecodeUtf8(*text)));
  }
};

class StripAccentsNormalizer : public Normalizer {
 public:
  void Normalize(std::string* text) const override {
    *text = EncodeUtf8(RemoveMarks(DecodeUtf8(*text)));
  }
};

class UnicodeNormalizer : public Normalizer {
 public:
  explicit UnicodeNormalizer(NormalizationForm form) : form_(form) {}

  void Normalize(std::string* text) const override {
    *text = EncodeUtf8(internal::Normalize(DecodeUtf8(*text), form_));
  }

 private:
  NormalizationForm form_;
};

class StripNormalizer : public Normalizer {
 public:
  StripNormalizer(bool left, bool right) : left_(left), right_(right) {}

  void Normalize(std::string* text) const override {
    std::u32string cps = DecodeUtf8(*text);
    size_t begin = 0;
    size_t end = cps.size();
    if (left_) {
      while (begin < end && IsWhitespace(cps[begin])) ++begin;
    }
    if (right_) {
      while (end > begin && IsWhitespace(cps[end - 1])) --end;
    }
    *text = EncodeUtf8(std::u32string_view(cps).substr(begin, end - begin));
  }

 private:
  bool left_;
  bool right_;
};

class ReplaceNormalizer : public Normalizer {
 public:
  static Status Create(const Json::Value& def,
                       std::unique_ptr<Normalizer>* out) {
    const Json::Value& pattern = def["pattern"];
    const Json::Value& content = def["content"];
    if (!pattern.isObject() || !content.isString()) {
      return Malformed("Replace normalizer needs 'pattern' and 'content'");
    }

    auto n = std::unique_ptr<ReplaceNormalizer>(new ReplaceNormalizer());
    n->content_ = content.asString();
    if (pattern["String"].isString()) {
      n->literal_ = pattern["String"].asString();
      if (n->literal_.empty()) {
        return Malformed("Replace normalizer has an empty pattern");
      }
    } else if (pattern["Regex"].isString()) {
      RE2::Options options;
      options.set_log_errors(false);
      n->regex_ = std::make_unique<RE2>(pattern["Regex"].asString(), options);
      if (!n->regex_->ok()) {
        return Malformed("Replace normalizer regex: " + n->regex_->error());
      }
      // Rewrite strings treat '\' as an escape; the content is literal.
      n->rewrite_.reserve(n->content_.size());
      for (char c : n->content_) {
        if (c == '\\') n->rewrite_ += '\\';
        n->rewrite_ += c;
      }
    } else {
      return Malformed("Replace normalizer pattern must be String or Regex");
    }
    *out = std::move(n);
    return Status::OK();
  }

  void Normalize(std::string* text) const override {
    if (regex_) {
      RE2::GlobalReplace(text, *regex_, rewrite_);
      return;
    }
    std::string result;
    result.reserve(text->size());
    size_t pos = 0;
    while (true) {
      size_t hit = text->find(literal_, pos);
      if (hit == std::string::npos) break;
      result.append(*text, pos, hit - pos);
      result += content_;
      pos = hit + literal_.size();
    }
    result.append(*text, pos, std::string::npos);
    *text = std::move(result);
  }

 private:
  ReplaceNormalizer() = default;

  std::string literal_;
  std::unique_ptr<RE2> regex_;
  std::string rewrite_;
  std::string content_;
};

/**
 * SentencePiece precompiled character map.
 *
 * Layout: little-endian u32 trie size in bytes, a darts-clone double array
 * of that size, then NUL-separated replacement strings indexed by the
 * trie's leaf values.
 */
class PrecompiledNormalizer : public Normalizer {
 public:
  static Status Create(const std::string& blob,
                       std::unique_ptr<Normalizer>* out) {
    if (blob.size() < 4) {
      return Malformed("precompiled_charsmap is truncated");
    }
    auto byte = [&blob](size_t i) {
      return static_cast<uint32_t>(static_cast<uint8_t>(blob[i]));
    };
    uint32_t trie_size = byte(0) | (byte(1) << 8) | (byte(2) << 16) |
                         (byte(3) << 24);
    if (trie_size % 4 != 0 || 4 + static_cast<size_t>(trie_size) > blob.size()) {
      return Malformed("precompiled_charsmap has an invalid trie size");
    }

    auto n = std::unique_ptr<PrecompiledNormalizer>(new PrecompiledNormalizer());
    n->trie_.resize(trie_size / 4);
    for (size_t i = 0; i < n->trie_.size(); ++i) {
      size_t p = 4 + i * 4;
      n->trie_[i] = byte(p) | (byte(p + 1) << 8) | (byte(p + 2) << 16) |
                    (byte(p + 3) << 24);
    }
    n->normalized_ = blob.substr(4 + trie_size);
    *out = std::move(n);
    return Status::OK();
  }

  void Normalize(std::string* text) const override {
    std::u32string cps = DecodeUtf8(*text);
    std::string result;
    result.reserve(text->size());

    size_t i = 0;
    while (i < cps.size()) {
      // A grapheme here is a base character and its combining marks.
      size_t j = i + 1;
      while (j < cps.size() && IsCombiningMark(cps[j])) ++j;
      std::string grapheme = EncodeUtf8(std::u32string_view(cps).substr(i, j - i));

      std::string_view replacement;
      if (grapheme.size() < 6 && Transform(grapheme, &replacement)) {
        result.append(replacement);
      } else {
        for (size_t k = i; k < j; ++k) {
          std::string part;
          AppendUtf8(cps[k], &part);
          if (Transform(part, &replacement)) {
            result.append(replacement);
          } else {
            result += part;
          }
        }
      }
      i = j;
    }
    *text = std::move(result);
  }

 private:
  PrecompiledNormalizer() = default;

  static bool HasLeaf(uint32_t unit) { return ((unit >> 8) & 1) == 1; }
  static uint32_t Value(uint32_t unit) { return unit & 0x7FFFFFFFu; }
  static uint32_t Label(uint32_t unit) { return unit & (0x80000000u | 0xFFu); }
  static uint32_t Offset(uint32_t unit) {
    return (unit >> 10) << ((unit & (1u << 9)) >> 6);
  }

  // First value found by a common-prefix search of `key`.
  std::optional<uint32_t> FirstPrefixMatch(std::string_view key) const {
    if (trie_.empty()) return std::nullopt;
    size_t node = 0;
    uint32_t unit = trie_[node];
    node ^= Offset(unit);
    for (char ch : key) {
      uint32_t c = static_cast<uint8_t>(ch);
      if (c == 0) break;
      node ^= c;
      if (node >= trie_.size()) return std::nullopt;
      unit = trie_[node];
      if (Label(unit) != c) return std::nullopt;
      node ^= Offset(unit);
      if (node >= trie_.size()) return std::nullopt;
      if (HasLeaf(unit)) return Value(trie_[node]);
    }
    return std::nullopt;
  }

  bool Transform(std::string_view chunk, std::string_view* out) const {
    std::optional<uint32_t> index = FirstPrefixMatch(chunk);
    if (!index || *index >= normalized_.size()) return false;
    size_t end = normalized_.find('\0', *index);
    if (end == std::string::npos) end = normalized_.size();
    *out = std::string_view(normalized_).substr(*index, end - *index);
    return true;
  }

  std::vector<uint32_t> trie_;
  std::string normalized_;
};

class SequenceNormalizer : public Normalizer {
 public:
  explicit SequenceNormalizer(std::vector<std::unique_ptr<Normalizer>> steps)
      : steps_(std::move(steps)) {}

  void Normalize(std::string* text) const override {
    for (const auto& step : steps_) step->Normalize(text);
  }

 private:
  std::vector<std::unique_ptr<Normalizer>> steps_;
};

// ---------------------------------------------------------------------------
// Pre-tokenizers
// ---------------------------------------------------------------------------

enum class SplitBehavior {
  kRemoved,
  kIsolated,
  kMergedWithPrevious,
  kMergedWithNext,
  kContiguous
};

Status ParseBehavior(const Json::Value& v, SplitBehavior* out) {
  if (v.isNull()) {
    *out = SplitBehavior::kIsolated;
    return Status::OK();
  }
  std::string name = v.isString() ? v.asString() : std::string();
  if (name == "Removed") {
    *out = SplitBehavior::kRemoved;
  } else if (name == "Isolated") {
    *out = SplitBehavior::kIsolated;
  } else if (name == "MergedWithPrevious") {
    *out = SplitBehavior::kMergedWithPrevious;
  } else if (name == "MergedWithNext") {
    *out = SplitBehavior::kMergedWithNext;
  } else if (name == "Contiguous") {
    *out = SplitBehavior::kContiguous;
  } else {
    return Malformed("unknown split behavior '" + name + "'");
  }
  return Status::OK();
}

void SplitBy(const std::string& text,
             const std::function<bool(char32_t)>& is_delim,
             SplitBehavior behavior,
             std::vector<std::string>* out) {
  std::u32string cur;
  auto flush = [&]() {
    if (!cur.empty()) {
      out->push_back(EncodeUtf8(cur));
      cur.clear();
    }
  };

  bool prev_delim = false;
  for (char32_t cp : DecodeUtf8(text)) {
    if (!is_delim(cp)) {
      if (behavior == SplitBehavior::kContiguous && prev_delim) flush();
      cur.push_back(cp);
      prev_delim = false;
      continue;
    }
    switch (behavior) {
      case SplitBehavior::kRemoved:
        flush();
        break;
      case SplitBehavior::kIsolated:
        flush();
        cur.push_back(cp);
        flush();
        break;
      case SplitBehavior::kContiguous:
        if (!prev_delim) flush();
        cur.push_back(cp);
        break;
      case SplitBehavior::kMergedWithPrevious:
        cur.push_back(cp);
        flush();
        break;
      case SplitBehavior::kMergedWithNext:
        flush();
        cur.push_back(cp);
        break;
    }
    prev_delim = true;
  }
  flush();
}

void RefineEach(std::vector<std::string>* splits,
                const std::function<bool(char32_t)>& is_delim,
                SplitBehavior behavior) {
  std::vector<std::string> out;
  out.reserve(splits->size());
  for (const auto& s : *splits) SplitBy(s, is_delim, behavior, &out);
  *splits = std::move(out);
}

class BertPreTokenizer : public PreTokenizer {
 public:
  void PreTokenize(std::vector<std::string>* splits) const override {
    RefineEach(splits, IsWhitespace, SplitBehavior::kRemoved);
    RefineEach(splits, IsPunctuation, SplitBehavior::kIsolated);
  }
};

class WhitespaceSplitPreTokenizer : public PreTokenizer {
 public:
  void PreTokenize(std::vector<std::string>* splits) const override {
    RefineEach(splits, IsWhitespace, SplitBehavior::kRemoved);
  }
};

// Equivalent to the pattern \w+|[^\w\s]+
class WhitespacePreTokenizer : public PreTokenizer {
 public:
  void PreTokenize(std::vector<std::string>* splits) const override {
    std::vector<std::string> out;
    for (const auto& s : *splits) {
      std::u32string cur;
      int cur_class = 0;  // 1 word, 2 other
      for (char32_t cp : DecodeUtf8(s)) {
        int cls = IsWhitespace(cp) ? 0 : (IsWordChar(cp) ? 1 : 2);
        if (cls != cur_class && !cur.empty()) {
          out.push_back(EncodeUtf8(cur));
          cur.clear();
        }
        if (cls != 0) cur.push_back(cp);
        cur_class = cls;
      }
      if (!cur.empty()) out.push_back(EncodeUtf8(cur));
    }
    *splits = std::move(out);
  }
};

class MetaspacePreTokenizer : public PreTokenizer {
 public:
  enum class Prepend { kAlways, kNever, kFirst };

  MetaspacePreTokenizer(char32_t replacement, Prepend prepend, bool split)
      : replacement_(replacement), prepend_(prepend), split_(split) {}

  void PreTokenize(std::vector<std::string>* splits) const override {
    std::vector<std::string> replaced;
    replaced.reserve(splits->size());
    for (size_t i = 0; i < splits->size(); ++i) {
      std::u32string cps = DecodeUtf8((*splits)[i]);
      for (char32_t& cp : cps) {
        if (cp == U' ') cp = replacement_;
      }
      bool prepend = prepend_ == Prepend::kAlways ||
                     (prepend_ == Prepend::kFirst && i == 0);
      if (prepend && (cps.empty() || cps.front() != replacement_)) {
        cps.insert(cps.begin(), replacement_);
      }
      replaced.push_back(EncodeUtf8(cps));
    }

    if (split_) {
      const char32_t r = replacement_;
      RefineEach(&replaced, [r](char32_t cp) { return cp == r; },
                 SplitBehavior::kMergedWithNext);
    }
    *splits = std::move(replaced);
  }

 private:
  char32_t replacement_;
  Prepend prepend_;
  bool split_;
};

class PunctuationPreTokenizer : public PreTokenizer {
 public:
  explicit PunctuationPreTokenizer(SplitBehavior behavior)
      : behavior_(behavior) {}

  void PreTokenize(std::vector<std::string>* splits) const override {
    RefineEach(splits, IsPunctuation, behavior_);
  }

 private:
  SplitBehavior behavior_;
};

class DigitsPreTokenizer : public PreTokenizer {
 public:
  explicit DigitsPreTokenizer(bool individual) : individual_(individual) {}

  void PreTokenize(std::vector<std::string>* splits) const override {
    RefineEach(splits, IsDigit,
               individual_ ? SplitBehavior::kIsolated
                           : SplitBehavior::kContiguous);
  }

 private:
  bool individual_;
};

class SequencePreTokenizer : public PreTokenizer {
 public:
  explicit SequencePreTokenizer(std::vector<std::unique_ptr<PreTokenizer>> steps)
      : steps_(std::move(steps)) {}

  void PreTokenize(std::vector<std::string>* splits) const override {
    for (const auto& step : steps_) step->PreTokenize(splits);
  }

 private:
  std::vector<std::unique_ptr<PreTokenizer>> steps_;
};

// ---------------------------------------------------------------------------
// Models
// ---------------------------------------------------------------------------

// Byte offsets of each code point start, plus the total length.
std::vector<size_t> CharBoundaries(const std::string& s) {
  std::vector<size_t> bounds;
  bounds.reserve(s.size() + 1);
  for (size_t i = 0; i < s.size(); ++i) {
    if ((static_cast<uint8_t>(s[i]) & 0xC0) != 0x80) bounds.push_back(i);
  }
  bounds.push_back(s.size());
  return bounds;
}

class WordPieceModel : public TokenModel {
 public:
  WordPieceModel(std::unordered_map<std::string, uint32_t> vocab,
                 std::string unk_token, std::string prefix,
                 size_t max_input_chars_per_word)
      : vocab_(std::move(vocab)),
        unk_token_(std::move(unk_token)),
        prefix_(std::move(prefix)),
        max_chars_(max_input_chars_per_word) {}

  Status Tokenize(const std::string& piece,
                  std::vector<Token>* out) const override {
    if (piece.empty()) return Status::OK();

    std::vector<size_t> bounds = CharBoundaries(piece);
    const size_t n_chars = bounds.size() - 1;
    if (n_chars > max_chars_) return PushUnk(out);

    std::vector<Token> sub_tokens;
    size_t start = 0;
    while (start < n_chars) {
      size_t end = n_chars;
      bool found = false;
      while (start < end) {
        std::string sub = piece.substr(bounds[start], bounds[end] - bounds[start]);
        if (start > 0) sub = prefix_ + sub;
        auto it = vocab_.find(sub);
        if (it != vocab_.end()) {
          sub_tokens.push_back({it->second, std::move(sub)});
          found = true;
          break;
        }
        --end;
      }
      if (!found) return PushUnk(out);
      start = end;
    }

    for (auto& t : sub_tokens) out->push_back(std::move(t));
    return Status::OK();
  }

  std::optional<uint32_t> TokenToId(const std::string& token) const override {
    auto it = vocab_.find(token);
    if (it == vocab_.end()) return std::nullopt;
    return it->second;
  }

  size_t VocabSize() const override { return vocab_.size(); }

 private:
  Status PushUnk(std::vector<Token>* out) const {
    auto it = vocab_.find(unk_token_);
    if (it == vocab_.end()) {
      return Status::EncodingError("WordPiece unknown token '" + unk_token_ +
                                   "' is missing from the vocabulary");
    }
    out->push_back({it->second, unk_token_});
    return Status::OK();
  }

  std::unordered_map<std::string, uint32_t> vocab_;
  std::string unk_token_;
  std::string prefix_;
  size_t max_chars_;
};

class UnigramModel : public TokenModel {
 public:
  static constexpr double kUnkPenalty = 10.0;

  UnigramModel(std::vector<std::pair<std::string, double>> pieces,
               std::optional<uint32_t> unk_id)
      : pieces_(std::move(pieces)), unk_id_(unk_id) {
    min_score_ = std::numeric_limits<double>::max();
    for (size_t i = 0; i < pieces_.size(); ++i) {
      index_.emplace(pieces_[i].first, static_cast<uint32_t>(i));
      min_score_ = std::min(min_score_, pieces_[i].second);
      max_piece_chars_ = std::max(max_piece_chars_,
                                  CharBoundaries(pieces_[i].first).size() - 1);
    }
    if (pieces_.empty()) min_score_ = 0.0;
  }

  Status Tokenize(const std::string& piece,
                  std::vector<Token>* out) const override {
    if (piece.empty()) return Status::OK();

    std::vector<size_t> bounds = CharBoundaries(piece);
    const size_t n = bounds.size() - 1;
    const double kNegInf = -std::numeric_limits<double>::infinity();
    const double unk_score = min_score_ - kUnkPenalty;

    struct Node {
      double score;
      size_t prev;
      uint32_t id;
      bool unk;
    };
    std::vector<Node> best(n + 1, Node{kNegInf, 0, 0, false});
    best[0].score = 0.0;

    // Viterbi over the lattice of vocabulary pieces.
    for (size_t i = 0; i < n; ++i) {
      if (best[i].score == kNegInf) continue;
      bool has_single = false;
      size_t limit = std::min(max_piece_chars_, n - i);
      for (size_t len = 1; len <= limit; ++len) {
        auto it = index_.find(
            piece.substr(bounds[i], bounds[i + len] - bounds[i]));
        if (it == index_.end()) continue;
        if (len == 1) has_single = true;
        double score = best[i].score + pieces_[it->second].second;
        if (score > best[i + len].score) {
          best[i + len] = Node{score, i, it->second, false};
        }
      }
      if (!has_single) {
        double score = best[i].score + unk_score;
        if (score > best[i + 1].score) {
          best[i + 1] = Node{score, i, 0, true};
        }
      }
    }

    struct Span {
      size_t begin;
      size_t end;
      uint32_t id;
      bool unk;
    };
    std::vector<Span> spans;
    for (size_t pos = n; pos > 0; pos = best[pos].prev) {
      spans.push_back({best[pos].prev, pos, best[pos].id, best[pos].unk});
    }

    // Emit in order, fusing runs of unknown characters.
    std::vector<Token> tokens;
    for (auto it = spans.rbegin(); it != spans.rend(); ++it) {
      std::string text = piece.substr(bounds[it->begin],
                                      bounds[it->end] - bounds[it->begin]);
      if (it->unk) {
        if (!unk_id_) {
          return Status::EncodingError(
              "Unigram model has no unknown token for '" + text + "'");
        }
        if (!tokens.empty() && tokens.back().id == *unk_id_) {
          tokens.back().value += text;
          continue;
        }
        tokens.push_back({*unk_id_, std::move(text)});
      } else {
        tokens.push_back({it->id, std::move(text)});
      }
    }

    for (auto& t : tokens) out->push_back(std::move(t));
    return Status::OK();
  }

  std::optional<uint32_t> TokenToId(const std::string& token) const override {
    auto it = index_.find(token);
    if (it == index_.end()) return std::nullopt;
    return it->second;
  }

  size_t VocabSize() const override { return pieces_.size(); }

 private:
  std::vector<std::pair<std::string, double>> pieces_;
  std::unordered_map<std::string, uint32_t> index_;
  std::optional<uint32_t> unk_id_;
  double min_score_ = 0.0;
  size_t max_piece_chars_ = 0;
};

Status BuildWordPiece(const Json::Value& def, std::unique_ptr<TokenModel>* out) {
  const Json::Value& vocab = def["vocab"];
  if (!vocab.isObject()) {
    return Malformed("WordPiece 'vocab' must be an object");
  }
  std::unordered_map<std::string, uint32_t> map;
  map.reserve(vocab.size());
  for (const auto& name : vocab.getMemberNames()) {
    const Json::Value& id = vocab[name];
    if (!id.isUInt()) {
      return Malformed("WordPiece id for '" + name + "' is not an integer");
    }
    map.emplace(name, id.asUInt());
  }

  std::string unk = def["unk_token"].isString() ? def["unk_token"].asString()
                                                 : std::string("[UNK]");
  std::string prefix = def["continuing_subword_prefix"].isString()
                           ? def["continuing_subword_prefix"].asString()
                           : std::string("##");
  size_t max_chars = def["max_input_chars_per_word"].isUInt()
                         ? def["max_input_chars_per_word"].asUInt()
                         : 100;
  *out = std::make_unique<WordPieceModel>(std::move(map), std::move(unk),
                                          std::move(prefix), max_chars);
  return Status::OK();
}

Status BuildUnigram(const Json::Value& def, std::unique_ptr<TokenModel>* out) {
  const Json::Value& vocab = def["vocab"];
  if (!vocab.isArray()) {
    return Malformed("Unigram 'vocab' must be an array");
  }
  std::vector<std::pair<std::string, double>> pieces;
  pieces.reserve(vocab.size());
  for (Json::ArrayIndex i = 0; i < vocab.size(); ++i) {
    const Json::Value& entry = vocab[i];
    if (!entry.isArray() || entry.size() != 2 || !entry[0].isString() ||
        !entry[1].isNumeric()) {
      return Malformed("Unigram vocab entry " + std::to_string(i) +
                       " must be [piece, score]");
    }
    pieces.emplace_back(entry[0].asString(), entry[1].asDouble());
  }

  std::optional<uint32_t> unk_id;
  const Json::Value& unk = def["unk_id"];
  if (unk.isUInt()) {
    if (unk.asUInt() >= pieces.size()) {
      return Malformed("Unigram unk_id is out of range");
    }
    unk_id = unk.asUInt();
  } else if (!unk.isNull()) {
    return Malformed("Unigram unk_id must be an integer");
  }

  *out = std::make_unique<UnigramModel>(std::move(pieces), unk_id);
  return Status::OK();
}

// ---------------------------------------------------------------------------
// Post-processors
// ---------------------------------------------------------------------------

class TemplateProcessor : public PostProcessor {
 public:
  struct Piece {
    bool is_sequence = false;
    uint32_t type_id = 0;
    std::vector<uint32_t> ids;        // special tokens only
    std::vector<std::string> tokens;  // special tokens only
  };

  explicit TemplateProcessor(std::vector<Piece> pieces)
      : pieces_(std::move(pieces)) {
    for (const auto& p : pieces_) added_ += p.ids.size();
  }

  size_t AddedTokens() const override { return added_; }

  void Process(Encoding* encoding) const override {
    Encoding result;
    const size_t total = encoding->size() + added_;
    result.ids.reserve(total);
    result.type_ids.reserve(total);
    result.attention_mask.reserve(total);
    result.special_tokens_mask.reserve(total);
    result.tokens.reserve(total);

    for (const auto& p : pieces_) {
      if (p.is_sequence) {
        for (size_t i = 0; i < encoding->size(); ++i) {
          result.ids.push_back(encoding->ids[i]);
          result.type_ids.push_back(p.type_id);
          result.attention_mask.push_back(encoding->attention_mask[i]);
          result.special_tokens_mask.push_back(encoding->special_tokens_mask[i]);
          result.tokens.push_back(std::move(encoding->tokens[i]));
        }
      } else {
        for (size_t i = 0; i < p.ids.size(); ++i) {
          result.ids.push_back(p.ids[i]);
          result.type_ids.push_back(p.type_id);
          result.attention_mask.push_back(1);
          result.special_tokens_mask.push_back(1);
          result.tokens.push_back(p.tokens[i]);
        }
      }
    }
    *encoding = std::move(result);
  }

 private:
  std::vector<Piece> pieces_;
  size_t added_ = 0;
};

class SequenceProcessor : public PostProcessor {
 public:
  explicit SequenceProcessor(std::vector<std::unique_ptr<PostProcessor>> steps)
      : steps_(std::move(steps)) {}

  size_t AddedTokens() const override {
    size_t n = 0;
    for (const auto& step : steps_) n += step->AddedTokens();
    return n;
  }

  void Process(Encoding* encoding) const override {
    for (const auto& step : steps_) step->Process(encoding);
  }

 private:
  std::vector<std::unique_ptr<PostProcessor>> steps_;
};

// ["[CLS]", 101]
Status ParseTokenPair(const Json::Value& v, const char* field,
                      TemplateProcessor::Piece* out) {
  if (!v.isArray() || v.size() != 2 || !v[0].isString() || !v[1].isUInt()) {
    return Malformed(std::string("'") + field + "' must be [token, id]");
  }
  out->is_sequence = false;
  out->tokens = {v[0].asString()};
  out->ids = {v[1].asUInt()};
  return Status::OK();
}

Status GetTypeId(const Json::Value& item, uint32_t* out) {
  const Json::Value& v = item["type_id"];
  if (v.isNull()) {
    *out = 0;
  } else if (v.isUInt()) {
    *out = v.asUInt();
  } else {
    return Malformed("TemplateProcessing 'type_id' must be an integer");
  }
  return Status::OK();
}

Status BuildTemplate(const Json::Value& def, std::unique_ptr<PostProcessor>* out) {
  const Json::Value& single = def["single"];
  const Json::Value& specials = def["special_tokens"];
  if (!single.isArray()) {
    return Malformed("TemplateProcessing 'single' must be an array");
  }

  std::vector<TemplateProcessor::Piece> pieces;
  for (const auto& item : single) {
    TemplateProcessor::Piece piece;
    if (!item.isObject()) {
      return Malformed("TemplateProcessing item must be an object");
    }
    if (item["Sequence"].isObject()) {
      piece.is_sequence = true;
      Status s = GetTypeId(item["Sequence"], &piece.type_id);
      if (!s.ok()) return s;
    } else if (item["SpecialToken"].isObject()) {
      const Json::Value& st = item["SpecialToken"];
      if (!st["id"].isString()) {
        return Malformed("TemplateProcessing SpecialToken 'id' must be a string");
      }
      std::string id = st["id"].asString();
      Status s = GetTypeId(st, &piece.type_id);
      if (!s.ok()) return s;
      const Json::Value& entry =
          specials.isObject() ? specials[id] : Json::Value::nullSingleton();
      if (!entry.isObject() || !entry["ids"].isArray() ||
          !entry["tokens"].isArray() ||
          entry["ids"].size() != entry["tokens"].size()) {
        return Malformed("TemplateProcessing special token '" + id +
                         "' is not defined");
      }
      for (Json::ArrayIndex i = 0; i < entry["ids"].size(); ++i) {
        const Json::Value& tid = entry["ids"][i];
        const Json::Value& text = entry["tokens"][i];
        if (!tid.isUInt() || !text.isString()) {
          return Malformed("TemplateProcessing special token '" + id +
                           "' has a malformed id or token");
        }
        piece.ids.push_back(tid.asUInt());
        piece.tokens.push_back(text.asString());
      }
    } else {
      return Malformed("TemplateProcessing item must be Sequence or SpecialToken");
    }
    pieces.push_back(std::move(piece));
  }

  *out = std::make_unique<TemplateProcessor>(std::move(pieces));
  return Status::OK();
}

// BertProcessing and RobertaProcessing both produce `cls $A sep` for a
// single sequence.
Status BuildClsSep(const Json::Value& def, std::unique_ptr<PostProcessor>* out) {
  TemplateProcessor::Piece cls;
  TemplateProcessor::Piece sep;
  Status s = ParseTokenPair(def["cls"], "cls", &cls);
  if (!s.ok()) return s;
  s = ParseTokenPair(def["sep"], "sep", &sep);
  if (!s.ok()) return s;

  TemplateProcessor::Piece seq;
  seq.is_sequence = true;

  std::vector<TemplateProcessor::Piece> pieces;
  pieces.push_back(std::move(cls));
  pieces.push_back(std::move(seq));
  pieces.push_back(std::move(sep));
  *out = std::make_unique<TemplateProcessor>(std::move(pieces));
  return Status::OK();
}

}  // namespace

Status BuildNormalizer(const Json::Value& def, std::unique_ptr<Normalizer>* out) {
  out->reset();
  if (def.isNull()) return Status::OK();
  if (!def.isObject()) return Malformed("normalizer must be an object");

  const std::string type = TypeOf(def);
  if (type == "BertNormalizer") {
    std::optional<bool> strip;
    if (def["strip_accents"].isBool()) strip = def["strip_accents"].asBool();
    *out = std::make_unique<BertNormalizer>(
        GetBool(def, "clean_text", true),
        GetBool(def, "handle_chinese_chars", true), strip,
        GetBool(def, "lowercase", true));
  } else if (type == "Lowercase") {
    *out = std::make_unique<LowercaseNormalizer>();
  } else if (type == "StripAccents") {
    *out = std::make_unique<StripAccentsNormalizer>();
  } else if (type == "NFD") {
    *out = std::make_unique<UnicodeNormalizer>(NormalizationForm::kNFD);
  } else if (type == "NFKD") {
    *out = std::make_unique<UnicodeNormalizer>(NormalizationForm::kNFKD);
  } else if (type == "NFC") {
    *out = std::make_unique<UnicodeNormalizer>(NormalizationForm::kNFC);
  } else if (type == "NFKC") {
    *out = std::make_unique<UnicodeNormalizer>(NormalizationForm::kNFKC);
  } else if (type == "Strip") {
    *out = std::make_unique<StripNormalizer>(GetBool(def, "strip_left", true),
                                             GetBool(def, "strip_right", true));
  } else if (type == "Replace") {
    return ReplaceNormalizer::Create(def, out);
  } else if (type == "Precompiled") {
    const Json::Value& charsmap = def["precompiled_charsmap"];
    if (charsmap.isNull()) return Status::OK();
    std::string blob;
    if (!charsmap.isString() || !DecodeBase64(charsmap.asString(), &blob)) {
      return Malformed("precompiled_charsmap is not valid base64");
    }
    return PrecompiledNormalizer::Create(blob, out);
  } else if (type == "Sequence") {
    const Json::Value& list = def["normalizers"];
    if (!list.isArray()) return Malformed("Sequence 'normalizers' must be an array");
    std::vector<std::unique_ptr<Normalizer>> steps;
    for (const auto& item : list) {
      std::unique_ptr<Normalizer> step;
      Status s = BuildNormalizer(item, &step);
      if (!s.ok()) return s;
      if (step) steps.push_back(std::move(step));
    }
    *out = std::make_unique<SequenceNormalizer>(std::move(steps));
  } else {
    return Malformed("unsupported normalizer '" + type + "'");
  }
  return Status::OK();
}

Status BuildPreTokenizer(const Json::Value& def,
                         std::unique_ptr<PreTokenizer>* out) {
  out->reset();
  if (def.isNull()) return Status::OK();
  if (!def.isObject()) return Malformed("pre_tokenizer must be an object");

  const std::string type = TypeOf(def);
  if (type == "BertPreTokenizer") {
    *out = std::make_unique<BertPreTokenizer>();
  } else if (type == "Whitespace") {
    *out = std::make_unique<WhitespacePreTokenizer>();
  } else if (type == "WhitespaceSplit") {
    *out = std::make_unique<WhitespaceSplitPreTokenizer>();
  } else if (type == "Metaspace") {
    std::u32string replacement = def["replacement"].isString()
                                     ? DecodeUtf8(def["replacement"].asString())
                                     : std::u32string(U"▁");
    if (replacement.size() != 1) {
      return Malformed("Metaspace replacement must be a single character");
    }
    using Prepend = MetaspacePreTokenizer::Prepend;
    Prepend prepend = Prepend::kAlways;
    const Json::Value& scheme = def["prepend_scheme"];
    if (scheme.isString()) {
      const std::string name = scheme.asString();
      if (name == "always") {
        prepend = Prepend::kAlways;
      } else if (name == "never") {
        prepend = Prepend::kNever;
      } else if (name == "first") {
        prepend = Prepend::kFirst;
      } else {
        return Malformed("unknown Metaspace prepend_scheme '" + name + "'");
      }
    } else if (def["add_prefix_space"].isBool()) {
      prepend = def["add_prefix_space"].asBool() ? Prepend::kAlways
                                                 : Prepend::kNever;
    }
    *out = std::make_unique<MetaspacePreTokenizer>(
        replacement[0], prepend, GetBool(def, "split", true));
  } else if (type == "Punctuation") {
    SplitBehavior behavior;
    Status s = ParseBehavior(def["behavior"], &behavior);
    if (!s.ok()) return s;
    *out = std::make_unique<PunctuationPreTokenizer>(behavior);
  } else if (type == "Digits") {
    *out = std::make_unique<DigitsPreTokenizer>(
        GetBool(def, "individual_digits", false));
  } else if (type == "Sequence") {
    const Json::Value& list = def["pretokenizers"];
    if (!list.isArray()) {
      return Malformed("Sequence 'pretokenizers' must be an array");
    }
    std::vector<std::unique_ptr<PreTokenizer>> steps;
    for (const auto& item : list) {
      std::unique_ptr<PreTokenizer> step;
      Status s = BuildPreTokenizer(item, &step);
      if (!s.ok()) return s;
      if (step) steps.push_back(std::move(step));
    }
    *out = std::make_unique<SequencePreTokenizer>(std::move(steps));
  } else {
    return Malformed("unsupported pre_tokenizer '" + type + "'");
  }
  return Status::OK();
}

Status BuildModel(const Json::Value& def, std::unique_ptr<TokenModel>* out) {
  out->reset();
  if (!def.isObject()) return Malformed("'model' must be an object");

  std::string type = TypeOf(def);
  if (type.empty()) {
    // Older definitions omit the tag; infer it from the vocabulary shape.
    if (def["vocab"].isArray()) {
      type = "Unigram";
    } else if (def["vocab"].isObject() && def.isMember("merges")) {
      type = "BPE";
    } else if (def["vocab"].isObject()) {
      type = "WordPiece";
    }
  }

  if (type == "WordPiece") return BuildWordPiece(def, out);
  if (type == "Unigram") return BuildUnigram(def, out);
  return Malformed("unsupported model '" + type + "'");
}

Status BuildPostProcessor(const Json::Value& def,
                          std::unique_ptr<PostProcessor>* out) {
  out->reset();
  if (def.isNull()) return Status::OK();
  if (!def.isObject()) return Malformed("post_processor must be an object");

  const std::string type = TypeOf(def);
  if (type == "TemplateProcessing") return BuildTemplate(def, out);
  if (type == "BertProcessing" || type == "RobertaProcessing") {
    return BuildClsSep(def, out);
  }
  if (type == "Sequence") {
    const Json::Value& list = def["processors"];
    if (!list.isArray()) return Malformed("Sequence 'processors' must be an array");
    std::vector<std::unique_ptr<PostProcessor>> steps;
    for (const auto& item : list) {
      std::unique_ptr<PostProcessor> step;
      Status s = BuildPostProcessor(item, &step);
      if (!s.ok()) return s;
      if (step) steps.push_back(std::move(step));
    }
    *out = std::make_unique<SequenceProcessor>(std::move(steps));
    return Status::OK();
  }
  return Malformed("unsupported post_processor '" + type + "'");
}

bool DecodeBase64(const std::string& in, std::string* out) {
  if (in.size() % 4 != 0) return false;
  if (in.empty()) {
    out->clear();
    return true;
  }

  std::string buf(in.size() / 4 * 3, '\0');
  int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&buf[0]),
                          reinterpret_cast<const unsigned char*>(in.data()),
                          static_cast<int>(in.size()));
  if (n < 0) return false;

  // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
  size_t padding = 0;
  if (in[in.size() - 1] == '=') ++padding;
  if (in[in.size() - 2] == '=') ++padding;
  buf.resize(static_cast<size_t>(n) - padding);
  *out = std::move(buf);
  return true;
}

}  // namespace textembed::internal
