#include <textembed/model_repository.hpp>

#include <trantor/utils/Logger.h>

#include <cstdlib>
#include <system_error>

namespace textembed {

LocalDirectoryRepository::LocalDirectoryRepository(std::filesystem::path root)
    : root_(std::move(root)) {}

Status LocalDirectoryRepository::Get(const std::string& filename,
                                     std::filesystem::path* out) {
  std::filesystem::path path = root_ / filename;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return Status::RepositoryError("File '" + filename + "' not found in " +
                                   root_.string());
  }
  *out = std::move(path);
  return Status::OK();
}

HubOptions HubOptions::FromEnvironment() {
  HubOptions options;
  if (const char* endpoint = std::getenv("HF_ENDPOINT")) {
    if (*endpoint != '\0') options.endpoint = endpoint;
  }
  if (const char* token = std::getenv("HF_TOKEN")) {
    if (*token != '\0') options.token = token;
  }
  return options;
}

Status ResolveModel(const ModelInfo& info,
                    const std::filesystem::path& cache_dir,
                    bool show_progress,
                    std::unique_ptr<ModelRepository>* out) {
  HubOptions options = HubOptions::FromEnvironment();
  options.show_progress = show_progress;

  std::unique_ptr<HubRepository> repo;
  Status s = HubRepository::Open(cache_dir, info.model_code, options, &repo);
  if (!s.ok()) return s;

  LOG_DEBUG << "Resolved " << info.model_code << " in " << repo->repo_dir().string();
  *out = std::move(repo);
  return Status::OK();
}

Status FetchModelWeights(ModelRepository* repo, const ModelInfo& info,
                         std::filesystem::path* weights) {
  Status s = repo->Get(info.model_file, weights);
  if (!s.ok()) return s;

  // External weight blobs are loaded by the engine from next to the model
  // file, so they only need to be present.
  for (const auto& extra : info.additional_files) {
    std::filesystem::path ignored;
    s = repo->Get(extra, &ignored);
    if (!s.ok()) {
      return s.WithContext("Required file for " + info.name + " is missing");
    }
  }
  return Status::OK();
}

}  // namespace textembed
