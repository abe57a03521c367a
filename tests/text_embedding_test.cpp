// Unit tests for textembed/text_embedding.hpp
// Tests: batching, ordering, pooling/normalization, error propagation,
// using a real tokenizer over a fake inference session

#include <gtest/gtest.h>

#include <textembed/normalize.hpp>
#include <textembed/test_utils.hpp>
#include <textembed/text_embedding.hpp>

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

namespace textembed {
namespace {

using testing::FakeSession;
using testing::MakeBertTokenizerFiles;
using testing::TempDir;

constexpr size_t kDim = 8;

Embedding Expected(const std::vector<int64_t>& ids) {
  return internal::Normalize(FakeSession::RawVector(ids, kDim));
}

class TextEmbeddingTest : public ::testing::Test {
 protected:
  void SetUp() override { ASSERT_TRUE(Build().ok()); }

  Status Build(size_t max_length = 512,
               std::vector<std::string> inputs = {"input_ids", "attention_mask"}) {
    std::unique_ptr<Tokenizer> tokenizer;
    Status s = LoadTokenizer(MakeBertTokenizerFiles(), max_length, &tokenizer);
    if (!s.ok()) return s;
    auto session = std::make_unique<FakeSession>(kDim, std::move(inputs));
    session_ = session.get();
    return TextEmbedding::Create(std::move(tokenizer), std::move(session), &model_);
  }

  std::vector<Embedding> EmbedOk(const std::vector<std::string>& texts,
                                 std::optional<size_t> batch_size = std::nullopt) {
    std::vector<Embedding> out;
    Status s = model_->Embed(texts, &out, batch_size);
    EXPECT_TRUE(s.ok()) << s.ToString();
    return out;
  }

  std::unique_ptr<TextEmbedding> model_;
  FakeSession* session_ = nullptr;
};

std::vector<std::string> SampleTexts() {
  return {"hello world", "the quick brown fox", "jumps over the lazy dog",
          "a", "b c", "embedding text", "hello", "dog", "fox jumped",
          "the lazy brown dog jumps over the quick fox"};
}

// =============================================================================
// Basic Embedding
// =============================================================================

TEST_F(TextEmbeddingTest, PoolsFirstTokenAndNormalizes) {
  auto out = EmbedOk({"hello world", "lazy dog"});
  ASSERT_EQ(out.size(), 2u);

  EXPECT_EQ(out[0], Expected({2, 5, 6, 3}));
  EXPECT_EQ(out[1], Expected({2, 15, 16, 3}));
  for (const auto& e : out) {
    ASSERT_EQ(e.size(), kDim);
    EXPECT_NEAR(internal::L2Norm(e.data(), e.size()), 1.0f, 1e-5f);
  }
}

TEST_F(TextEmbeddingTest, EmptyInput) {
  std::vector<Embedding> out = {Embedding(3, 1.0f)};
  ASSERT_TRUE(model_->Embed(std::vector<std::string>{}, &out).ok());
  EXPECT_TRUE(out.empty());
  EXPECT_EQ(session_->run_count(), 0u);
}

TEST_F(TextEmbeddingTest, EmptyStringStillEmbeds) {
  auto out = EmbedOk({""});
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0], Expected({2, 3}));
}

TEST_F(TextEmbeddingTest, StringViewOverload) {
  std::vector<std::string_view> texts = {"hello", "dog"};
  std::vector<Embedding> out;
  ASSERT_TRUE(model_->Embed(texts, &out).ok());
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[1], Expected({2, 16, 3}));
}

TEST_F(TextEmbeddingTest, ZeroBatchSizeRejected) {
  std::vector<Embedding> out = {Embedding(3, 1.0f)};
  Status s = model_->Embed(SampleTexts(), &out, 0);
  EXPECT_TRUE(s.IsInvalidArgument());
  EXPECT_EQ(out.size(), 1u);
  EXPECT_EQ(session_->run_count(), 0u);
}

// =============================================================================
// Batching
// =============================================================================

TEST_F(TextEmbeddingTest, BatchCountAndSizes) {
  auto out = EmbedOk(SampleTexts(), 3);
  EXPECT_EQ(out.size(), 10u);

  auto calls = session_->calls();
  ASSERT_EQ(calls.size(), 4u);
  std::vector<size_t> sizes;
  for (const auto& c : calls) sizes.push_back(c.batch_size);
  std::sort(sizes.begin(), sizes.end());
  EXPECT_EQ(sizes, (std::vector<size_t>{1, 3, 3, 3}));
}

TEST_F(TextEmbeddingTest, DefaultBatchSizeIsOneBatch) {
  EmbedOk(SampleTexts());
  EXPECT_EQ(session_->run_count(), 1u);
}

TEST_F(TextEmbeddingTest, BatchSizeDoesNotChangeResults) {
  auto texts = SampleTexts();
  auto whole = EmbedOk(texts);
  for (size_t batch : {1u, 2u, 3u, 7u, 10u, 64u}) {
    auto split = EmbedOk(texts, batch);
    ASSERT_EQ(split.size(), whole.size()) << "batch " << batch;
    for (size_t i = 0; i < whole.size(); ++i) {
      EXPECT_EQ(split[i], whole[i]) << "batch " << batch << " text " << i;
    }
  }
}

TEST_F(TextEmbeddingTest, OutputOrderMatchesInput) {
  auto texts = SampleTexts();
  auto batched = EmbedOk(texts, 2);
  for (size_t i = 0; i < texts.size(); ++i) {
    auto single = EmbedOk({texts[i]});
    EXPECT_EQ(batched[i], single[0]) << texts[i];
  }
}

TEST_F(TextEmbeddingTest, BatchPaddedToLongest) {
  EmbedOk({"a", "the quick brown fox"});
  auto calls = session_->calls();
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].batch_size, 2u);
  EXPECT_EQ(calls[0].seq_len, 6u);
}

TEST_F(TextEmbeddingTest, TruncatesToMaxLength) {
  ASSERT_TRUE(Build(4).ok());
  auto out = EmbedOk({"the quick brown fox jumps"});
  EXPECT_EQ(session_->calls()[0].seq_len, 4u);
  EXPECT_EQ(out[0], Expected({2, 7, 8, 3}));
}

// =============================================================================
// token_type_ids
// =============================================================================

TEST_F(TextEmbeddingTest, NoTokenTypeIdsByDefault) {
  EXPECT_FALSE(model_->need_token_type_ids());
  EmbedOk({"hello"});
  EXPECT_EQ(session_->calls()[0].input_names,
            (std::vector<std::string>{"attention_mask", "input_ids"}));
}

TEST_F(TextEmbeddingTest, TokenTypeIdsWhenDeclared) {
  ASSERT_TRUE(Build(512, {"input_ids", "attention_mask", "token_type_ids"}).ok());
  EXPECT_TRUE(model_->need_token_type_ids());
  auto out = EmbedOk({"hello", "lazy dog"});
  EXPECT_EQ(session_->calls()[0].input_names,
            (std::vector<std::string>{"attention_mask", "input_ids", "token_type_ids"}));
  EXPECT_EQ(out[0], Expected({2, 5, 3}));
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(TextEmbeddingTest, InferenceFailureFailsWholeCall) {
  session_->FailOnToken(16);  // "dog"
  std::vector<Embedding> out = {Embedding(1, 0.0f)};
  std::vector<std::string> texts = {"hello", "world", "lazy dog", "fox"};
  Status s = model_->Embed(texts, &out, 2);
  EXPECT_TRUE(s.IsInferenceRuntimeError());
  EXPECT_NE(s.message().find("Batch 1"), std::string::npos);
  EXPECT_EQ(out.size(), 1u);
}

TEST_F(TextEmbeddingTest, LowestFailingBatchReported) {
  session_->FailOnToken(5);  // "hello" in batches 0 and 2
  std::vector<std::string> texts = {"hello", "dog", "hello"};
  std::vector<Embedding> out;
  Status s = model_->Embed(texts, &out, 1);
  EXPECT_TRUE(s.IsInferenceRuntimeError());
  EXPECT_NE(s.message().find("Batch 0"), std::string::npos);
}

TEST_F(TextEmbeddingTest, EncodingErrorPropagates) {
  ASSERT_TRUE(Build(1).ok());
  std::vector<Embedding> out;
  Status s = model_->Embed(std::vector<std::string>{"hello"}, &out);
  EXPECT_TRUE(s.IsEncodingError());
  EXPECT_EQ(session_->run_count(), 0u);
}

TEST_F(TextEmbeddingTest, OutputFaultsAreShapeErrors) {
  using Fault = FakeSession::OutputFault;
  for (Fault fault : {Fault::kMissingOutput, Fault::kWrongRank, Fault::kWrongBatch,
                      Fault::kInt64Output}) {
    ASSERT_TRUE(Build().ok());
    session_->SetOutputFault(fault);
    std::vector<Embedding> out;
    Status s = model_->Embed(std::vector<std::string>{"hello", "dog"}, &out);
    EXPECT_TRUE(s.IsTensorShapeError()) << s.ToString();
    EXPECT_TRUE(out.empty());
  }
}

TEST(TextEmbeddingCreateTest, RequiresBothParts) {
  std::unique_ptr<TextEmbedding> model;
  EXPECT_TRUE(TextEmbedding::Create(nullptr, std::make_unique<FakeSession>(), &model)
                  .IsInvalidArgument());
  EXPECT_EQ(model, nullptr);
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_F(TextEmbeddingTest, ConcurrentCallers) {
  auto texts = SampleTexts();
  auto reference = EmbedOk(texts, 3);

  std::atomic<int> mismatches{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 10; ++i) {
        std::vector<Embedding> out;
        if (!model_->Embed(texts, &out, 3).ok() || out != reference) {
          mismatches.fetch_add(1);
        }
      }
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(mismatches.load(), 0);
}

// =============================================================================
// Construction Helpers
// =============================================================================

TEST(InitOptionsTest, Defaults) {
  InitOptions options;
  EXPECT_EQ(options.model, EmbeddingModel::kBGESmallENV15);
  EXPECT_EQ(options.max_length, 512u);
  EXPECT_EQ(options.cache_dir, std::filesystem::path(".textembed_cache"));
  EXPECT_TRUE(options.show_download_progress);
  EXPECT_TRUE(options.execution_providers.empty());
  EXPECT_EQ(kDefaultBatchSize, 256u);
}

TEST(InitOptionsTest, UserDefinedFromInitOptions) {
  InitOptions options;
  options.max_length = 128;
  options.execution_providers = {ExecutionProvider::kCUDA, ExecutionProvider::kCPU};

  InitOptionsUserDefined user(options);
  EXPECT_EQ(user.max_length, 128u);
  EXPECT_EQ(user.execution_providers, options.execution_providers);

  InitOptionsUserDefined defaults;
  EXPECT_EQ(defaults.max_length, 512u);
}

TEST(TextEmbeddingRegistryTest, ListSupportedModels) {
  EXPECT_EQ(TextEmbedding::ListSupportedModels().size(), SupportedModels().size());
  EXPECT_EQ(TextEmbedding::GetModelInfo(EmbeddingModel::kBGEBaseENV15).dim, 768u);
}

TEST(ReadFileToBytesTest, ReadsBinaryContent) {
  TempDir dir;
  const std::string content("a\0b\xff\n", 5);
  testing::WriteTextFile(dir.path() / "blob.bin", content);

  std::string bytes;
  ASSERT_TRUE(ReadFileToBytes(dir.path() / "blob.bin", &bytes).ok());
  EXPECT_EQ(bytes, content);
}

TEST(ReadFileToBytesTest, MissingFile) {
  TempDir dir;
  std::string bytes = "unchanged";
  EXPECT_TRUE(ReadFileToBytes(dir.path() / "nope", &bytes).IsIOError());
  EXPECT_EQ(bytes, "unchanged");
}

TEST(LoadTokenizerFilesTest, FromLocalDirectory) {
  TempDir dir;
  TokenizerFiles expected = MakeBertTokenizerFiles();
  testing::WriteTokenizerFiles(dir.path(), expected);

  LocalDirectoryRepository repo(dir.path());
  TokenizerFiles files;
  ASSERT_TRUE(LoadTokenizerFiles(&repo, &files).ok());
  EXPECT_EQ(files.tokenizer_file, expected.tokenizer_file);
  EXPECT_EQ(files.config_file, expected.config_file);
  EXPECT_EQ(files.special_tokens_map_file, expected.special_tokens_map_file);
  EXPECT_EQ(files.tokenizer_config_file, expected.tokenizer_config_file);
}

TEST(LoadTokenizerFilesTest, MissingFile) {
  TempDir dir;
  testing::WriteTokenizerFiles(dir.path(), MakeBertTokenizerFiles());
  std::filesystem::remove(dir.path() / "special_tokens_map.json");

  LocalDirectoryRepository repo(dir.path());
  TokenizerFiles files;
  Status s = LoadTokenizerFiles(&repo, &files);
  EXPECT_TRUE(s.IsRepositoryError());
  EXPECT_NE(s.message().find("special_tokens_map.json"), std::string::npos);
}

TEST(OpenUserDefinedTest, InvalidNetworkIsEngineBuildError) {
  UserDefinedEmbeddingModel model;
  model.onnx_file = "definitely not a serialized network";
  model.tokenizer_files = MakeBertTokenizerFiles();

  std::unique_ptr<TextEmbedding> out;
  Status s = TextEmbedding::OpenUserDefined(model, InitOptionsUserDefined(), &out);
  EXPECT_TRUE(s.IsEngineBuildError()) << s.ToString();
  EXPECT_EQ(out, nullptr);
}

TEST(OpenTest, UnreachableHubIsRepositoryError) {
  TempDir dir;
  ::setenv("HF_ENDPOINT", "http://127.0.0.1:9", 1);

  InitOptions options;
  options.cache_dir = dir.path();
  options.show_download_progress = false;
  std::unique_ptr<TextEmbedding> out;
  Status s = TextEmbedding::Open(options, &out);
  ::unsetenv("HF_ENDPOINT");

  EXPECT_TRUE(s.IsRepositoryError()) << s.ToString();
  EXPECT_NE(s.message().find("onnx/model.onnx"), std::string::npos);
  EXPECT_EQ(out, nullptr);
}

}  // namespace
}  // namespace textembed
