#pragma once

#include <textembed/models.hpp>
#include <textembed/status.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace textembed {

/**
 * Supplies model files by name as local paths.
 */
class ModelRepository {
 public:
  virtual ~ModelRepository() = default;

  /**
   * Local path of `filename` (relative to the repository root), fetching
   * it first if necessary. Fails with RepositoryError if it is unavailable.
   */
  virtual Status Get(const std::string& filename,
                     std::filesystem::path* out) = 0;

  /** Human-readable location, used in log and error messages. */
  virtual std::string Describe() const = 0;
};

/**
 * Files already on disk under one directory. Never touches the network.
 */
class LocalDirectoryRepository : public ModelRepository {
 public:
  explicit LocalDirectoryRepository(std::filesystem::path root);

  Status Get(const std::string& filename, std::filesystem::path* out) override;
  std::string Describe() const override { return root_.string(); }

 private:
  std::filesystem::path root_;
};

struct HubOptions {
  std::string endpoint = "https://huggingface.co";
  std::string revision = "main";
  std::optional<std::string> token;  // sent as a bearer token
  bool show_progress = true;
  // Files are fetched with ranged GETs of `chunk_bytes` each; every request
  // must complete within `stall_timeout_seconds`.
  uint64_t chunk_bytes = 8ull << 20;
  double stall_timeout_seconds = 60.0;

  /** Defaults overridden by HF_ENDPOINT and HF_TOKEN when set. */
  static HubOptions FromEnvironment();
};

/**
 * A model hub repository mirrored into a local cache.
 *
 * Cache layout (shared with other hub clients):
 *   {cache}/models--{org}--{name}/refs/{revision}          commit hash
 *   {cache}/models--{org}--{name}/blobs/{etag}             file contents
 *   {cache}/models--{org}--{name}/snapshots/{commit}/{file} link to blob
 *
 * Cached files are returned without network access. Missing files are
 * streamed over HTTPS into blobs/{etag}.incomplete, which a later call
 * resumes after an interrupted transfer. Large files are verified against
 * the SHA-256 the hub reports in X-Linked-Etag.
 */
class HubRepository : public ModelRepository {
 public:
  ~HubRepository() override;

  static Status Open(const std::filesystem::path& cache_dir,
                     const std::string& repo_id,
                     const HubOptions& options,
                     std::unique_ptr<HubRepository>* out);

  Status Get(const std::string& filename, std::filesystem::path* out) override;
  std::string Describe() const override { return repo_id_; }

  /** Directory holding refs/, blobs/ and snapshots/ for this repository. */
  const std::filesystem::path& repo_dir() const { return repo_dir_; }

  /** "Xenova/bge-small-en-v1.5" -> "models--Xenova--bge-small-en-v1.5" */
  static std::string CacheFolderName(const std::string& repo_id);

 private:
  struct Http;

  HubRepository() = default;

  std::optional<std::filesystem::path> CachedPath(const std::string& filename) const;
  Status Download(const std::string& filename, std::filesystem::path* out);

  std::string repo_id_;
  std::filesystem::path repo_dir_;
  HubOptions options_;

  std::mutex mu_;
  std::unique_ptr<Http> http_;  // created on first download
};

/**
 * Open the hub repository for `info` inside `cache_dir`.
 */
Status ResolveModel(const ModelInfo& info,
                    const std::filesystem::path& cache_dir,
                    bool show_progress,
                    std::unique_ptr<ModelRepository>* out);

/**
 * Fetch the weights file of `info`, then every additional file it lists.
 * The first file that cannot be fetched aborts with RepositoryError.
 *
 * @param weights Receives the local path of the primary weights file
 */
Status FetchModelWeights(ModelRepository* repo, const ModelInfo& info,
                         std::filesystem::path* weights);

}  // namespace textembed
