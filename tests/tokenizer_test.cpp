// Unit tests for textembed/tokenizer.hpp
// Tests: tokenizer.json parsing, WordPiece/Unigram encoding, added tokens,
// truncation and batch padding

#include <gtest/gtest.h>

#include <textembed/test_utils.hpp>
#include <textembed/tokenizer.hpp>

#include <json/json.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace textembed {
namespace {

using testing::BertTokenizerJson;
using testing::ToJsonString;

Json::Value ParseJson(const std::string& text) {
  Json::Value root;
  Json::CharReaderBuilder builder;
  std::string errors;
  std::istringstream stream(text);
  EXPECT_TRUE(Json::parseFromStream(builder, stream, &root, &errors)) << errors;
  return root;
}

std::vector<uint32_t> Ids(std::initializer_list<uint32_t> ids) { return ids; }

class TokenizerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(PretrainedTokenizer::FromBytes(BertTokenizerJson(), &tokenizer_).ok());
  }

  Encoding Encode(const std::string& text, bool special = true) {
    Encoding enc;
    Status s = tokenizer_->Encode(text, special, &enc);
    EXPECT_TRUE(s.ok()) << s.ToString();
    return enc;
  }

  std::unique_ptr<PretrainedTokenizer> tokenizer_;
};

// =============================================================================
// Parsing
// =============================================================================

TEST(TokenizerParseTest, MalformedJson) {
  std::unique_ptr<PretrainedTokenizer> tok;
  Status s = PretrainedTokenizer::FromBytes("{not json", &tok);
  EXPECT_TRUE(s.IsDataFormatError());
  EXPECT_EQ(tok, nullptr);
}

TEST(TokenizerParseTest, BpeModelIsUnsupported) {
  Json::Value root = ParseJson(BertTokenizerJson());
  root["model"]["type"] = "BPE";
  std::unique_ptr<PretrainedTokenizer> tok;
  Status s = PretrainedTokenizer::FromBytes(ToJsonString(root), &tok);
  EXPECT_TRUE(s.IsDataFormatError());
  EXPECT_NE(s.message().find("BPE"), std::string::npos);
}

TEST(TokenizerParseTest, UnknownNormalizer) {
  Json::Value root = ParseJson(BertTokenizerJson());
  root["normalizer"]["type"] = "Wobble";
  std::unique_ptr<PretrainedTokenizer> tok;
  EXPECT_TRUE(PretrainedTokenizer::FromBytes(ToJsonString(root), &tok).IsDataFormatError());
}

TEST(TokenizerParseTest, AddedTokenWithoutId) {
  Json::Value root = ParseJson(BertTokenizerJson());
  root["added_tokens"][0].removeMember("id");
  std::unique_ptr<PretrainedTokenizer> tok;
  EXPECT_TRUE(PretrainedTokenizer::FromBytes(ToJsonString(root), &tok).IsDataFormatError());
}

TEST(TokenizerParseTest, AddedTokenFlagOfWrongType) {
  Json::Value root = ParseJson(BertTokenizerJson());
  root["added_tokens"][0]["single_word"] = "no";
  std::unique_ptr<PretrainedTokenizer> tok;
  Status s = PretrainedTokenizer::FromBytes(ToJsonString(root), &tok);
  EXPECT_TRUE(s.IsDataFormatError());
  EXPECT_NE(s.message().find("single_word"), std::string::npos);

  root = ParseJson(BertTokenizerJson());
  root["added_tokens"][0]["special"] = Json::Value(Json::objectValue);
  EXPECT_TRUE(PretrainedTokenizer::FromBytes(ToJsonString(root), &tok).IsDataFormatError());
}

TEST(TokenizerParseTest, AddedTokenFlagsDefaultWhenAbsent) {
  Json::Value root = ParseJson(BertTokenizerJson());
  root["added_tokens"][0].removeMember("single_word");
  root["added_tokens"][0].removeMember("normalized");
  std::unique_ptr<PretrainedTokenizer> tok;
  EXPECT_TRUE(PretrainedTokenizer::FromBytes(ToJsonString(root), &tok).ok());
}

TEST(TokenizerParseTest, TemplateFieldsOfWrongType) {
  std::unique_ptr<PretrainedTokenizer> tok;

  Json::Value root = ParseJson(BertTokenizerJson());
  root["post_processor"]["single"][1]["Sequence"]["type_id"] = "0";
  Status s = PretrainedTokenizer::FromBytes(ToJsonString(root), &tok);
  EXPECT_TRUE(s.IsDataFormatError());
  EXPECT_NE(s.message().find("type_id"), std::string::npos);

  root = ParseJson(BertTokenizerJson());
  root["post_processor"]["single"][0]["SpecialToken"]["id"] = 7;
  EXPECT_TRUE(PretrainedTokenizer::FromBytes(ToJsonString(root), &tok).IsDataFormatError());

  root = ParseJson(BertTokenizerJson());
  root["post_processor"]["special_tokens"]["[CLS]"]["ids"][0] = "two";
  EXPECT_TRUE(PretrainedTokenizer::FromBytes(ToJsonString(root), &tok).IsDataFormatError());

  root = ParseJson(BertTokenizerJson());
  root["post_processor"]["special_tokens"]["[SEP]"]["tokens"][0] = 3;
  EXPECT_TRUE(PretrainedTokenizer::FromBytes(ToJsonString(root), &tok).IsDataFormatError());
}

TEST(TokenizerParseTest, TruncationAndPaddingBlocks) {
  Json::Value root = ParseJson(BertTokenizerJson());
  root["truncation"]["max_length"] = 16;
  root["truncation"]["direction"] = "Right";
  root["padding"]["strategy"]["Fixed"] = 10;
  root["padding"]["direction"] = "Right";
  root["padding"]["pad_id"] = 0;
  root["padding"]["pad_type_id"] = 0;
  root["padding"]["pad_token"] = "[PAD]";

  std::unique_ptr<PretrainedTokenizer> tok;
  ASSERT_TRUE(PretrainedTokenizer::FromBytes(ToJsonString(root), &tok).ok());
  ASSERT_TRUE(tok->truncation().has_value());
  EXPECT_EQ(tok->truncation()->max_length, 16u);
  ASSERT_TRUE(tok->padding().has_value());
  EXPECT_EQ(tok->padding()->strategy, PaddingStrategy::kFixed);
  EXPECT_EQ(tok->padding()->fixed_length, 10u);
}

// =============================================================================
// WordPiece Encoding
// =============================================================================

TEST_F(TokenizerTest, VocabularyLookup) {
  EXPECT_EQ(tokenizer_->VocabSize(), testing::TestVocab().size());
  EXPECT_EQ(tokenizer_->TokenToId("[CLS]"), testing::kTestClsId);
  EXPECT_EQ(tokenizer_->TokenToId("fox"), 10u);
  EXPECT_FALSE(tokenizer_->TokenToId("missing").has_value());
}

TEST_F(TokenizerTest, SimpleSentence) {
  Encoding enc = Encode("Hello, world!");
  EXPECT_EQ(enc.ids, Ids({2, 5, 17, 6, 19, 3}));
  EXPECT_EQ(enc.tokens,
            (std::vector<std::string>{"[CLS]", "hello", ",", "world", "!", "[SEP]"}));
  EXPECT_EQ(enc.attention_mask, Ids({1, 1, 1, 1, 1, 1}));
  EXPECT_EQ(enc.type_ids, Ids({0, 0, 0, 0, 0, 0}));
  EXPECT_EQ(enc.special_tokens_mask, Ids({1, 0, 0, 0, 0, 1}));
}

TEST_F(TokenizerTest, WithoutSpecialTokens) {
  Encoding enc = Encode("hello world", false);
  EXPECT_EQ(enc.ids, Ids({5, 6}));
}

TEST_F(TokenizerTest, Subwords) {
  EXPECT_EQ(Encode("jumps jumped", false).ids, Ids({11, 12, 11, 13}));
  Encoding enc = Encode("embedding", false);
  EXPECT_EQ(enc.ids, Ids({24, 25}));
  EXPECT_EQ(enc.tokens, (std::vector<std::string>{"embed", "##ding"}));
}

TEST_F(TokenizerTest, UnknownWordBecomesUnk) {
  EXPECT_EQ(Encode("hello xyzzy", false).ids, Ids({5, testing::kTestUnkId}));
  // A partial match still maps the whole word to [UNK].
  EXPECT_EQ(Encode("jumpq", false).ids, Ids({testing::kTestUnkId}));
}

TEST_F(TokenizerTest, CaseAndAccentsAreNormalized) {
  EXPECT_EQ(Encode("HÉLLO Wörld", false).ids, Ids({5, 6}));
}

std::vector<std::string> VocabWithNonLatin() {
  std::vector<std::string> vocab = testing::TestVocab();
  vocab.push_back("\xCE\xB1\xCE\xBB\xCF\x86\xCE\xB1");  // 27: Greek "alpha"
  vocab.push_back("\xD0\xB8");                          // 28: Cyrillic i
  vocab.push_back("fi");                                // 29
  return vocab;
}

TEST(TokenizerUnicodeTest, GreekAndCyrillicLowercaseAndStripAccents) {
  std::unique_ptr<PretrainedTokenizer> tok;
  ASSERT_TRUE(PretrainedTokenizer::FromBytes(BertTokenizerJson(VocabWithNonLatin()),
                                             &tok).ok());
  Encoding enc;
  // Capital alpha with tonos, capital lambda, phi, alpha; capital short i.
  ASSERT_TRUE(tok->Encode("\xCE\x86\xCE\x9B\xCE\xA6\xCE\x91 \xD0\x99", false,
                          &enc).ok());
  EXPECT_EQ(enc.ids, Ids({27, 28}));
}

TEST(TokenizerUnicodeTest, NfkcFoldsCompatibilityLigature) {
  Json::Value root = ParseJson(BertTokenizerJson(VocabWithNonLatin()));
  root["normalizer"] = Json::Value(Json::objectValue);
  root["normalizer"]["type"] = "NFKC";
  root["pre_tokenizer"]["type"] = "WhitespaceSplit";

  std::unique_ptr<PretrainedTokenizer> tok;
  ASSERT_TRUE(PretrainedTokenizer::FromBytes(ToJsonString(root), &tok).ok());
  Encoding enc;
  ASSERT_TRUE(tok->Encode("\xEF\xAC\x81 \xEF\xBD\x86\xEF\xBD\x8F\xEF\xBD\x98",
                          false, &enc).ok());
  EXPECT_EQ(enc.ids, Ids({29, 10}));
}

TEST_F(TokenizerTest, ChineseCharactersSplitIndividually) {
  EXPECT_EQ(Encode("你好", false).ids, Ids({1, 1}));
}

TEST_F(TokenizerTest, ControlCharactersDropped) {
  EXPECT_EQ(Encode("hel\x01lo\tworld", false).ids, Ids({5, 6}));
}

TEST_F(TokenizerTest, EmptyText) {
  Encoding enc = Encode("");
  EXPECT_EQ(enc.ids, Ids({2, 3}));
}

TEST_F(TokenizerTest, AddedTokenInText) {
  Encoding enc = Encode("hello [MASK] world", false);
  EXPECT_EQ(enc.ids, Ids({5, 4, 6}));
  EXPECT_EQ(enc.special_tokens_mask, Ids({0, 1, 0}));
}

TEST_F(TokenizerTest, AddSpecialTokens) {
  std::vector<AddedToken> tokens = {AddedToken("[CLS]", true),
                                    AddedToken("<extra>", true)};
  EXPECT_EQ(tokenizer_->AddSpecialTokens(tokens), 1u);
  EXPECT_EQ(tokenizer_->AddSpecialTokens(tokens), 0u);

  const uint32_t extra_id = static_cast<uint32_t>(testing::TestVocab().size());
  EXPECT_EQ(tokenizer_->TokenToId("<extra>"), extra_id);
  EXPECT_EQ(tokenizer_->VocabSize(), testing::TestVocab().size() + 1);
  EXPECT_EQ(Encode("hello<extra>", false).ids, Ids({5, extra_id}));
}

TEST_F(TokenizerTest, SpecialTokenInVocabKeepsVocabId) {
  AddedToken dog("dog", true);
  EXPECT_EQ(tokenizer_->AddSpecialTokens({dog}), 1u);
  EXPECT_EQ(tokenizer_->TokenToId("dog"), 16u);
  EXPECT_EQ(Encode("lazy dog", false).special_tokens_mask, Ids({0, 1}));
}

TEST_F(TokenizerTest, SingleWordToken) {
  AddedToken token("fox", true);
  token.single_word = true;
  tokenizer_->AddSpecialTokens({token});
  // A single-word token does not match inside a longer word.
  Encoding enc = Encode("a fox", false);
  EXPECT_EQ(enc.special_tokens_mask, Ids({0, 1}));
  Encoding inside = Encode("afox", false);
  EXPECT_EQ(inside.ids, Ids({testing::kTestUnkId}));
}

// =============================================================================
// Truncation
// =============================================================================

TEST_F(TokenizerTest, TruncationKeepsSpecialTokens) {
  TruncationParams truncation;
  truncation.max_length = 4;
  tokenizer_->SetTruncation(truncation);

  Encoding enc = Encode("the quick brown fox");
  EXPECT_EQ(enc.ids, Ids({2, 7, 8, 3}));
}

TEST_F(TokenizerTest, LeftTruncation) {
  TruncationParams truncation;
  truncation.max_length = 4;
  truncation.direction = Direction::kLeft;
  tokenizer_->SetTruncation(truncation);

  EXPECT_EQ(Encode("the quick brown fox").ids, Ids({2, 9, 10, 3}));
}

TEST_F(TokenizerTest, TruncationShorterThanSpecialTokensFails) {
  TruncationParams truncation;
  truncation.max_length = 1;
  tokenizer_->SetTruncation(truncation);

  Encoding enc;
  EXPECT_TRUE(tokenizer_->Encode("hello", true, &enc).IsEncodingError());
  // Without special tokens one model token fits.
  ASSERT_TRUE(tokenizer_->Encode("hello world", false, &enc).ok());
  EXPECT_EQ(enc.ids, Ids({5}));
}

// =============================================================================
// Batch Padding
// =============================================================================

TEST_F(TokenizerTest, BatchLongestPadding) {
  tokenizer_->SetPadding(PaddingParams{});

  std::vector<std::string_view> texts = {"hello", "the quick brown fox"};
  std::vector<Encoding> out;
  ASSERT_TRUE(tokenizer_->EncodeBatch(texts, true, &out).ok());
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].size(), 6u);
  EXPECT_EQ(out[1].size(), 6u);
  EXPECT_EQ(out[0].ids, Ids({2, 5, 3, 0, 0, 0}));
  EXPECT_EQ(out[0].attention_mask, Ids({1, 1, 1, 0, 0, 0}));
  EXPECT_EQ(out[0].special_tokens_mask, Ids({1, 0, 1, 1, 1, 1}));
  EXPECT_EQ(out[0].tokens.back(), "[PAD]");
  EXPECT_EQ(out[1].attention_mask, Ids({1, 1, 1, 1, 1, 1}));
}

TEST_F(TokenizerTest, NoPaddingLeavesLengthsRagged) {
  std::vector<std::string_view> texts = {"hello", "the quick brown fox"};
  std::vector<Encoding> out;
  ASSERT_TRUE(tokenizer_->EncodeBatch(texts, true, &out).ok());
  EXPECT_EQ(out[0].size(), 3u);
  EXPECT_EQ(out[1].size(), 6u);
}

TEST_F(TokenizerTest, FixedAndMultiplePadding) {
  PaddingParams padding;
  padding.strategy = PaddingStrategy::kFixed;
  padding.fixed_length = 8;
  tokenizer_->SetPadding(padding);

  std::vector<std::string_view> texts = {"hello"};
  std::vector<Encoding> out;
  ASSERT_TRUE(tokenizer_->EncodeBatch(texts, true, &out).ok());
  EXPECT_EQ(out[0].size(), 8u);

  padding.strategy = PaddingStrategy::kBatchLongest;
  padding.pad_to_multiple_of = 4;
  tokenizer_->SetPadding(padding);
  texts = {"the quick brown fox"};  // 6 tokens
  ASSERT_TRUE(tokenizer_->EncodeBatch(texts, true, &out).ok());
  EXPECT_EQ(out[0].size(), 8u);
}

TEST_F(TokenizerTest, LeftPaddingUsesPadTypeId) {
  PaddingParams padding;
  padding.direction = Direction::kLeft;
  padding.pad_id = 4;
  padding.pad_type_id = 1;
  tokenizer_->SetPadding(padding);

  std::vector<std::string_view> texts = {"a", "a b c"};
  std::vector<Encoding> out;
  ASSERT_TRUE(tokenizer_->EncodeBatch(texts, true, &out).ok());
  EXPECT_EQ(out[0].ids, Ids({4, 4, 2, 21, 3}));
  EXPECT_EQ(out[0].type_ids, Ids({1, 1, 0, 0, 0}));
  EXPECT_EQ(out[0].attention_mask, Ids({0, 0, 1, 1, 1}));
}

TEST_F(TokenizerTest, BatchErrorNamesText) {
  TruncationParams truncation;
  truncation.max_length = 1;
  tokenizer_->SetTruncation(truncation);

  std::vector<std::string_view> texts = {"a", "b"};
  std::vector<Encoding> out;
  Status s = tokenizer_->EncodeBatch(texts, true, &out);
  EXPECT_TRUE(s.IsEncodingError());
  EXPECT_NE(s.message().find("Failed to encode text 0"), std::string::npos);
}

TEST_F(TokenizerTest, ConcurrentBatches) {
  tokenizer_->SetPadding(PaddingParams{});
  std::vector<std::thread> threads;
  std::atomic<int> failures{0};
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 50; ++i) {
        std::vector<std::string_view> texts = {"hello world", "lazy dog", "fox"};
        std::vector<Encoding> out;
        if (!tokenizer_->EncodeBatch(texts, true, &out).ok() ||
            out[0].ids != Ids({2, 5, 6, 3})) {
          failures.fetch_add(1);
        }
      }
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(failures.load(), 0);
}

// =============================================================================
// Other Components
// =============================================================================

TEST(TokenizerComponentsTest, WhitespacePreTokenizerAndReplace) {
  Json::Value root = ParseJson(BertTokenizerJson());
  root["pre_tokenizer"]["type"] = "Whitespace";

  Json::Value replace;
  replace["type"] = "Replace";
  replace["pattern"]["String"] = "!";
  replace["content"] = "?";
  Json::Value lower;
  lower["type"] = "Lowercase";
  Json::Value sequence;
  sequence["type"] = "Sequence";
  sequence["normalizers"].append(replace);
  sequence["normalizers"].append(lower);
  root["normalizer"] = sequence;

  std::unique_ptr<PretrainedTokenizer> tok;
  ASSERT_TRUE(PretrainedTokenizer::FromBytes(ToJsonString(root), &tok).ok());
  Encoding enc;
  ASSERT_TRUE(tok->Encode("Hello,World!", false, &enc).ok());
  EXPECT_EQ(enc.ids, Ids({5, 17, 6, 20}));
}

TEST(TokenizerComponentsTest, RegexReplaceOnLongWhitespaceRun) {
  Json::Value root = ParseJson(BertTokenizerJson());
  Json::Value replace;
  replace["type"] = "Replace";
  replace["pattern"]["Regex"] = "\\s+";
  replace["content"] = "?";
  root["normalizer"] = replace;

  std::unique_ptr<PretrainedTokenizer> tok;
  ASSERT_TRUE(PretrainedTokenizer::FromBytes(ToJsonString(root), &tok).ok());
  std::string text = "a" + std::string(200000, ' ') + "a";
  Encoding enc;
  ASSERT_TRUE(tok->Encode(text, false, &enc).ok());
  EXPECT_EQ(enc.ids, Ids({21, 20, 21}));
}

TEST(TokenizerComponentsTest, RegexReplaceContentIsLiteral) {
  Json::Value root = ParseJson(BertTokenizerJson());
  Json::Value replace;
  replace["type"] = "Replace";
  replace["pattern"]["Regex"] = "(a)";
  replace["content"] = "\\1";
  root["normalizer"] = replace;
  root["pre_tokenizer"]["type"] = "WhitespaceSplit";

  std::unique_ptr<PretrainedTokenizer> tok;
  ASSERT_TRUE(PretrainedTokenizer::FromBytes(ToJsonString(root), &tok).ok());
  Encoding enc;
  ASSERT_TRUE(tok->Encode("a", false, &enc).ok());
  ASSERT_EQ(enc.tokens.size(), 1u);
  EXPECT_EQ(enc.ids, Ids({testing::kTestUnkId}));
  EXPECT_EQ(enc.tokens[0], "[UNK]");
}

TEST(TokenizerComponentsTest, InvalidReplaceRegex) {
  Json::Value root = ParseJson(BertTokenizerJson());
  Json::Value replace;
  replace["type"] = "Replace";
  replace["pattern"]["Regex"] = "(unclosed";
  replace["content"] = " ";
  root["normalizer"] = replace;

  std::unique_ptr<PretrainedTokenizer> tok;
  Status s = PretrainedTokenizer::FromBytes(ToJsonString(root), &tok);
  EXPECT_TRUE(s.IsDataFormatError());
  EXPECT_NE(s.message().find("regex"), std::string::npos);
}

TEST(TokenizerComponentsTest, BertProcessing) {
  Json::Value root = ParseJson(BertTokenizerJson());
  Json::Value post;
  post["type"] = "BertProcessing";
  post["cls"].append("[CLS]");
  post["cls"].append(2);
  post["sep"].append("[SEP]");
  post["sep"].append(3);
  root["post_processor"] = post;

  std::unique_ptr<PretrainedTokenizer> tok;
  ASSERT_TRUE(PretrainedTokenizer::FromBytes(ToJsonString(root), &tok).ok());
  Encoding enc;
  ASSERT_TRUE(tok->Encode("dog", true, &enc).ok());
  EXPECT_EQ(enc.ids, Ids({2, 16, 3}));
}

class UnigramTokenizerTest : public ::testing::Test {
 protected:
  static std::string Definition(bool with_unk) {
    Json::Value root;
    root["added_tokens"] = Json::Value(Json::arrayValue);
    root["normalizer"] = Json::nullValue;
    root["post_processor"] = Json::nullValue;

    Json::Value pre;
    pre["type"] = "Metaspace";
    pre["replacement"] = "\xE2\x96\x81";
    pre["prepend_scheme"] = "always";
    pre["split"] = true;
    root["pre_tokenizer"] = pre;

    Json::Value model;
    model["type"] = "Unigram";
    if (with_unk) model["unk_id"] = 0;
    auto piece = [&model](const std::string& text, double score) {
      Json::Value entry(Json::arrayValue);
      entry.append(text);
      entry.append(score);
      model["vocab"].append(entry);
    };
    piece("<unk>", 0.0);
    piece("\xE2\x96\x81hello", -1.0);
    piece("\xE2\x96\x81world", -2.0);
    piece("\xE2\x96\x81", -3.0);
    piece("\xE2\x96\x81he", -4.0);
    piece("llo", -4.0);
    root["model"] = model;
    return ToJsonString(root);
  }
};

TEST_F(UnigramTokenizerTest, PrefersHighestScoringSegmentation) {
  std::unique_ptr<PretrainedTokenizer> tok;
  ASSERT_TRUE(PretrainedTokenizer::FromBytes(Definition(true), &tok).ok());
  Encoding enc;
  ASSERT_TRUE(tok->Encode("hello world", true, &enc).ok());
  EXPECT_EQ(enc.ids, Ids({1, 2}));
  EXPECT_EQ(enc.tokens[0], "\xE2\x96\x81hello");
}

TEST_F(UnigramTokenizerTest, UnknownPieceUsesUnkId) {
  std::unique_ptr<PretrainedTokenizer> tok;
  ASSERT_TRUE(PretrainedTokenizer::FromBytes(Definition(true), &tok).ok());
  Encoding enc;
  ASSERT_TRUE(tok->Encode("zz", false, &enc).ok());
  ASSERT_FALSE(enc.ids.empty());
  EXPECT_NE(std::find(enc.ids.begin(), enc.ids.end(), 0u), enc.ids.end());
}

TEST_F(UnigramTokenizerTest, UnknownPieceWithoutUnkFails) {
  std::unique_ptr<PretrainedTokenizer> tok;
  ASSERT_TRUE(PretrainedTokenizer::FromBytes(Definition(false), &tok).ok());
  Encoding enc;
  EXPECT_TRUE(tok->Encode("zz", false, &enc).IsEncodingError());
  EXPECT_TRUE(tok->Encode("hello", false, &enc).ok());
}

}  // namespace
}  // namespace textembed
