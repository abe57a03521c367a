// Unit tests for textembed/model_repository.hpp
// Tests: local directory lookups, hub cache layout, weight fetching,
// SHA-256 digests of downloaded blobs

#include <gtest/gtest.h>

#include <textembed/digest.hpp>
#include <textembed/model_repository.hpp>
#include <textembed/test_utils.hpp>

#include <cstdlib>
#include <string>

namespace textembed {
namespace {

using testing::TempDir;
using testing::WriteTextFile;

constexpr char kCommit[] = "0123456789abcdef0123456789abcdef01234567";

// =============================================================================
// LocalDirectoryRepository
// =============================================================================

TEST(LocalDirectoryRepositoryTest, FindsExistingFiles) {
  TempDir dir;
  WriteTextFile(dir.path() / "onnx" / "model.onnx", "weights");

  LocalDirectoryRepository repo(dir.path());
  std::filesystem::path path;
  ASSERT_TRUE(repo.Get("onnx/model.onnx", &path).ok());
  EXPECT_EQ(path, dir.path() / "onnx" / "model.onnx");
  EXPECT_EQ(repo.Describe(), dir.string());
}

TEST(LocalDirectoryRepositoryTest, MissingFile) {
  TempDir dir;
  LocalDirectoryRepository repo(dir.path());
  std::filesystem::path path;
  Status s = repo.Get("tokenizer.json", &path);
  EXPECT_TRUE(s.IsRepositoryError());
  EXPECT_NE(s.message().find("tokenizer.json"), std::string::npos);
}

TEST(LocalDirectoryRepositoryTest, DirectoryIsNotAFile) {
  TempDir dir;
  std::filesystem::create_directories(dir.path() / "onnx");
  LocalDirectoryRepository repo(dir.path());
  std::filesystem::path path;
  EXPECT_TRUE(repo.Get("onnx", &path).IsRepositoryError());
}

// =============================================================================
// FetchModelWeights
// =============================================================================

TEST(FetchModelWeightsTest, PrimaryFile) {
  TempDir dir;
  const ModelInfo& info = GetModelInfo(EmbeddingModel::kBGESmallENV15);
  WriteTextFile(dir.path() / info.model_file, "weights");

  LocalDirectoryRepository repo(dir.path());
  std::filesystem::path weights;
  ASSERT_TRUE(FetchModelWeights(&repo, info, &weights).ok());
  EXPECT_EQ(weights, dir.path() / info.model_file);
}

TEST(FetchModelWeightsTest, MissingPrimaryFile) {
  TempDir dir;
  LocalDirectoryRepository repo(dir.path());
  std::filesystem::path weights;
  Status s = FetchModelWeights(
      &repo, GetModelInfo(EmbeddingModel::kAllMiniLML6V2), &weights);
  EXPECT_TRUE(s.IsRepositoryError());
  EXPECT_NE(s.message().find("model.onnx"), std::string::npos);
}

TEST(FetchModelWeightsTest, SideFilesRequired) {
  TempDir dir;
  const ModelInfo& info = GetModelInfo(EmbeddingModel::kMultilingualE5Large);
  WriteTextFile(dir.path() / "model.onnx", "graph");

  LocalDirectoryRepository repo(dir.path());
  std::filesystem::path weights;
  Status s = FetchModelWeights(&repo, info, &weights);
  EXPECT_TRUE(s.IsRepositoryError());
  EXPECT_NE(s.message().find("model.onnx_data"), std::string::npos);
  EXPECT_NE(s.message().find("MultilingualE5Large"), std::string::npos);

  WriteTextFile(dir.path() / "model.onnx_data", "blob");
  ASSERT_TRUE(FetchModelWeights(&repo, info, &weights).ok());
  EXPECT_EQ(weights, dir.path() / "model.onnx");
}

// =============================================================================
// HubRepository
// =============================================================================

TEST(HubRepositoryTest, CacheFolderName) {
  EXPECT_EQ(HubRepository::CacheFolderName("Xenova/bge-small-en-v1.5"),
            "models--Xenova--bge-small-en-v1.5");
}

TEST(HubRepositoryTest, RejectsBadRepoId) {
  TempDir dir;
  std::unique_ptr<HubRepository> repo;
  EXPECT_TRUE(HubRepository::Open(dir.path(), "no-slash", HubOptions(), &repo)
                  .IsInvalidArgument());
  HubOptions options;
  options.endpoint.clear();
  EXPECT_TRUE(HubRepository::Open(dir.path(), "org/name", options, &repo)
                  .IsInvalidArgument());
}

class HubCacheTest : public ::testing::Test {
 protected:
  void SetUp() override {
    HubOptions options;
    // Nothing listens here; any network access fails fast.
    options.endpoint = "http://127.0.0.1:9";
    options.show_progress = false;
    options.stall_timeout_seconds = 5;
    ASSERT_TRUE(HubRepository::Open(dir_.path(), "org/model", options, &repo_).ok());
    EXPECT_EQ(repo_->repo_dir(), dir_.path() / "models--org--model");
  }

  void Populate(const std::string& filename, const std::string& content) {
    WriteTextFile(repo_->repo_dir() / "refs" / "main", std::string(kCommit) + "\n");
    WriteTextFile(repo_->repo_dir() / "snapshots" / kCommit / filename, content);
  }

  TempDir dir_;
  std::unique_ptr<HubRepository> repo_;
};

TEST_F(HubCacheTest, CachedFileNeedsNoNetwork) {
  Populate("tokenizer.json", "{}");
  std::filesystem::path path;
  ASSERT_TRUE(repo_->Get("tokenizer.json", &path).ok());
  EXPECT_EQ(path, repo_->repo_dir() / "snapshots" / kCommit / "tokenizer.json");
}

TEST_F(HubCacheTest, NestedFile) {
  Populate("onnx/model.onnx", "weights");
  std::filesystem::path path;
  ASSERT_TRUE(repo_->Get("onnx/model.onnx", &path).ok());
  EXPECT_TRUE(std::filesystem::is_regular_file(path));
}

TEST_F(HubCacheTest, CommitRevisionSkipsRefs) {
  HubOptions options;
  options.endpoint = "http://127.0.0.1:9";
  options.revision = kCommit;
  options.show_progress = false;
  std::unique_ptr<HubRepository> pinned;
  ASSERT_TRUE(HubRepository::Open(dir_.path(), "org/model", options, &pinned).ok());

  WriteTextFile(pinned->repo_dir() / "snapshots" / kCommit / "config.json", "{}");
  std::filesystem::path path;
  ASSERT_TRUE(pinned->Get("config.json", &path).ok());
}

TEST_F(HubCacheTest, MissingFileFailsWithoutServer) {
  Populate("tokenizer.json", "{}");
  std::filesystem::path path;
  Status s = repo_->Get("config.json", &path);
  EXPECT_TRUE(s.IsRepositoryError());
  EXPECT_NE(s.message().find("config.json"), std::string::npos);
  EXPECT_NE(s.message().find("org/model"), std::string::npos);
}

TEST_F(HubCacheTest, Describe) {
  EXPECT_EQ(repo_->Describe(), "org/model");
}

// =============================================================================
// Sha256
// =============================================================================

TEST(Sha256Test, KnownDigests) {
  EXPECT_EQ(internal::Sha256::Hex("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(internal::Sha256::Hex(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, IncrementalMatchesOneShot) {
  internal::Sha256 sha;
  sha.Update("a");
  sha.Update("");
  sha.Update("bc");
  EXPECT_EQ(sha.HexDigest(), internal::Sha256::Hex("abc"));
}

TEST(Sha256Test, HashFile) {
  TempDir dir;
  const std::string content(3u << 20, 'x');  // spans several reads
  WriteTextFile(dir.path() / "blob", content);

  internal::Sha256 sha;
  uint64_t size = 0;
  ASSERT_TRUE(internal::HashFile(dir.path() / "blob", &sha, &size).ok());
  EXPECT_EQ(size, content.size());
  EXPECT_EQ(sha.HexDigest(), internal::Sha256::Hex(content));

  EXPECT_TRUE(internal::HashFile(dir.path() / "missing", &sha, &size).IsIOError());
}

// =============================================================================
// ResolveModel / HubOptions
// =============================================================================

TEST(ResolveModelTest, OpensCacheFolderForModel) {
  TempDir dir;
  const ModelInfo& info = GetModelInfo(EmbeddingModel::kBGESmallENV15);
  std::unique_ptr<ModelRepository> repo;
  ASSERT_TRUE(ResolveModel(info, dir.path(), false, &repo).ok());
  EXPECT_EQ(repo->Describe(), info.model_code);

  // Nothing is created until a file is fetched.
  EXPECT_FALSE(std::filesystem::exists(
      dir.path() / HubRepository::CacheFolderName(info.model_code)));
}

TEST(HubOptionsTest, Environment) {
  ::setenv("HF_ENDPOINT", "https://mirror.example.com", 1);
  ::setenv("HF_TOKEN", "secret", 1);
  HubOptions options = HubOptions::FromEnvironment();
  EXPECT_EQ(options.endpoint, "https://mirror.example.com");
  ASSERT_TRUE(options.token.has_value());
  EXPECT_EQ(*options.token, "secret");

  ::unsetenv("HF_ENDPOINT");
  ::unsetenv("HF_TOKEN");
  options = HubOptions::FromEnvironment();
  EXPECT_EQ(options.endpoint, "https://huggingface.co");
  EXPECT_FALSE(options.token.has_value());
}

}  // namespace
}  // namespace textembed
