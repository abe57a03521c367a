// Performance benchmarks for the textembed pipeline
// Uses Google Benchmark for accurate measurement and CI regression tracking
//
// Organization:
// 1. MICROBENCHMARKS: tokenization and normalization, no inference
// 2. MACROBENCHMARKS: batched Embed() over a fake encoder, so the numbers
//    measure tokenization, tensor assembly, scheduling and pooling only
//
// Benchmark hygiene:
// - Pre-generate all test data outside timing loops
// - Use fixed dataset sizes for reproducible results

#include <benchmark/benchmark.h>

#include <textembed/normalize.hpp>
#include <textembed/test_utils.hpp>
#include <textembed/text_embedding.hpp>
#include <textembed/tokenizer_config.hpp>

#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace {

// =============================================================================
// Benchmark Data
// =============================================================================

// Sentences over the test vocabulary, with some out-of-vocabulary words.
std::vector<std::string> MakeTexts(size_t count, size_t words_per_text) {
  static const char* kWords[] = {"hello", "world", "the",   "quick", "brown",
                                 "fox",   "jumps", "over",  "lazy",  "dog",
                                 "embedding", "text", "unknownword", "a", "b"};
  std::mt19937 gen(42);
  std::uniform_int_distribution<size_t> dis(0, sizeof(kWords) / sizeof(kWords[0]) - 1);

  std::vector<std::string> texts;
  texts.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    std::string text;
    for (size_t w = 0; w < words_per_text; ++w) {
      if (w > 0) text += (w % 7 == 0) ? ", " : " ";
      text += kWords[dis(gen)];
    }
    text += ".";
    texts.push_back(std::move(text));
  }
  return texts;
}

std::unique_ptr<textembed::PretrainedTokenizer> MakeTokenizer() {
  std::unique_ptr<textembed::PretrainedTokenizer> tokenizer;
  auto s = textembed::LoadPretrainedTokenizer(
      textembed::testing::MakeBertTokenizerFiles(), 512, &tokenizer);
  if (!s.ok()) return nullptr;
  return tokenizer;
}

// =============================================================================
// PART 1: MICROBENCHMARKS
// =============================================================================

static void BM_Tokenizer_Encode(benchmark::State& state) {
  auto tokenizer = MakeTokenizer();
  if (!tokenizer) {
    state.SkipWithError("tokenizer construction failed");
    return;
  }
  auto texts = MakeTexts(1, static_cast<size_t>(state.range(0)));

  textembed::Encoding encoding;
  for (auto _ : state) {
    auto s = tokenizer->Encode(texts[0], true, &encoding);
    benchmark::DoNotOptimize(s);
    benchmark::DoNotOptimize(encoding);
  }
  state.SetBytesProcessed(state.iterations() * texts[0].size());
}
BENCHMARK(BM_Tokenizer_Encode)->Range(8, 256);

static void BM_Tokenizer_EncodeBatch(benchmark::State& state) {
  auto tokenizer = MakeTokenizer();
  if (!tokenizer) {
    state.SkipWithError("tokenizer construction failed");
    return;
  }
  auto texts = MakeTexts(static_cast<size_t>(state.range(0)), 32);
  std::vector<std::string_view> views(texts.begin(), texts.end());

  std::vector<textembed::Encoding> encodings;
  for (auto _ : state) {
    auto s = tokenizer->EncodeBatch(views, true, &encodings);
    benchmark::DoNotOptimize(s);
    benchmark::DoNotOptimize(encodings);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Tokenizer_EncodeBatch)->RangeMultiplier(4)->Range(1, 256);

static void BM_Normalize(benchmark::State& state) {
  std::vector<float> v(static_cast<size_t>(state.range(0)));
  std::mt19937 gen(7);
  std::uniform_real_distribution<float> dis(-1.0f, 1.0f);
  for (auto& x : v) x = dis(gen);

  for (auto _ : state) {
    auto out = textembed::internal::Normalize(v);
    benchmark::DoNotOptimize(out);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Normalize)->Arg(384)->Arg(768)->Arg(1024);

// =============================================================================
// PART 2: MACROBENCHMARKS - Embed() with a fake encoder
// =============================================================================

class PipelineBenchmark : public benchmark::Fixture {
 protected:
  void SetUp(const benchmark::State& state) override {
    std::unique_ptr<textembed::Tokenizer> tokenizer = MakeTokenizer();
    auto session = std::make_unique<textembed::testing::FakeSession>(384);
    status_ = textembed::TextEmbedding::Create(std::move(tokenizer),
                                               std::move(session), &model_);
    texts_ = MakeTexts(512, 24);
  }

  void TearDown(const benchmark::State& state) override { model_.reset(); }

  textembed::Status status_;
  std::unique_ptr<textembed::TextEmbedding> model_;
  std::vector<std::string> texts_;
};

BENCHMARK_DEFINE_F(PipelineBenchmark, Embed)(benchmark::State& state) {
  if (!status_.ok()) {
    state.SkipWithError(status_.ToString().c_str());
    return;
  }
  const size_t batch_size = static_cast<size_t>(state.range(0));

  std::vector<textembed::Embedding> out;
  for (auto _ : state) {
    auto s = model_->Embed(texts_, &out, batch_size);
    if (!s.ok()) {
      state.SkipWithError(s.ToString().c_str());
      break;
    }
    benchmark::DoNotOptimize(out);
  }
  state.SetItemsProcessed(state.iterations() * texts_.size());
}
BENCHMARK_REGISTER_F(PipelineBenchmark, Embed)
    ->Arg(8)->Arg(32)->Arg(128)->Arg(512)
    ->UseRealTime();

}  // namespace

BENCHMARK_MAIN();
