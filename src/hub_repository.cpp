#include <textembed/model_repository.hpp>

#include <textembed/digest.hpp>

#include <drogon/HttpClient.h>
#include <trantor/net/EventLoopThread.h>
#include <trantor/utils/Logger.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <system_error>

namespace textembed {

namespace {

constexpr int kMaxRedirects = 5;
constexpr int kChunkAttempts = 3;

// "W/\"abc\"" -> "abc"
std::string CleanEtag(std::string etag) {
  if (etag.rfind("W/", 0) == 0) etag.erase(0, 2);
  etag.erase(std::remove(etag.begin(), etag.end(), '"'), etag.end());
  return etag;
}

bool IsHex(const std::string& s, size_t length) {
  return s.size() == length &&
         std::all_of(s.begin(), s.end(), [](unsigned char c) {
           return std::isxdigit(c) != 0;
         });
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// "https://host:443/a/b?c" -> ("https://host:443", "/a/b?c")
bool SplitUrl(const std::string& url, std::string* origin, std::string* path) {
  size_t scheme_end = url.find("://");
  if (scheme_end == std::string::npos) return false;
  size_t host_end = url.find('/', scheme_end + 3);
  if (host_end == std::string::npos) {
    *origin = url;
    *path = "/";
  } else {
    *origin = url.substr(0, host_end);
    *path = url.substr(host_end);
  }
  return !origin->empty();
}

bool IsRedirect(int code) {
  return code == 301 || code == 302 || code == 303 || code == 307 ||
         code == 308;
}

Status WriteFile(const std::filesystem::path& path, std::string_view data) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    return Status::IOError("Cannot open " + path.string() + " for writing");
  }
  file.write(data.data(), static_cast<std::streamsize>(data.size()));
  file.close();
  if (!file) {
    return Status::IOError("Failed to write " + path.string());
  }
  return Status::OK();
}

struct HubMetadata {
  std::string commit;
  std::string etag;
};

struct RangeReply {
  bool partial = false;  // 206 with a Content-Range
  uint64_t total = 0;    // size of the whole file
  std::string body;
};

bool ParseU64(std::string_view s, uint64_t* out) {
  if (s.empty()) return false;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), *out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

// "bytes 0-99/1234" -> start 0, total 1234
bool ParseContentRange(const std::string& header, uint64_t* start,
                       uint64_t* total) {
  constexpr std::string_view kPrefix = "bytes ";
  if (header.compare(0, kPrefix.size(), kPrefix) != 0) return false;
  std::string_view range = std::string_view(header).substr(kPrefix.size());
  size_t dash = range.find('-');
  size_t slash = range.find('/');
  if (dash == std::string_view::npos || slash == std::string_view::npos ||
      dash > slash) {
    return false;
  }
  return ParseU64(range.substr(0, dash), start) &&
         ParseU64(range.substr(slash + 1), total);
}

// GETs bytes [offset, offset + length) of `*url`, following redirects and
// leaving `*url` at the final location. The hub's metadata headers are taken
// from the first hop when `meta` is set.
Status GetRange(trantor::EventLoop* loop, const HubOptions& options,
                std::string* url, uint64_t offset, uint64_t length,
                HubMetadata* meta, RangeReply* out) {
  std::string hub_origin;
  std::string hub_path;
  const bool hub_known = SplitUrl(options.endpoint + "/", &hub_origin, &hub_path);

  for (int hop = 0; hop <= kMaxRedirects; ++hop) {
    std::string origin;
    std::string path;
    if (!SplitUrl(*url, &origin, &path)) {
      return Status::RepositoryError("Malformed URL: " + *url);
    }

    auto client = drogon::HttpClient::newHttpClient(origin, loop);
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Get);
    req->setPathEncode(false);
    req->setPath(path);
    req->addHeader("Range", "bytes=" + std::to_string(offset) + "-" +
                                std::to_string(offset + length - 1));
    // Credentials never leave the hub for a redirect target.
    if (options.token && hub_known && origin == hub_origin) {
      req->addHeader("Authorization", "Bearer " + *options.token);
    }

    auto [result, resp] = client->sendRequest(req, options.stall_timeout_seconds);
    if (result != drogon::ReqResult::Ok || !resp) {
      return Status::RepositoryError("Request to " + origin +
                                     " failed (network error " +
                                     std::to_string(static_cast<int>(result)) + ")");
    }

    // The first hop is answered by the hub itself and carries the metadata.
    if (hop == 0 && meta) {
      meta->commit = resp->getHeader("x-repo-commit");
      meta->etag = CleanEtag(resp->getHeader("x-linked-etag"));
      if (meta->etag.empty()) meta->etag = CleanEtag(resp->getHeader("etag"));
    }

    const int code = static_cast<int>(resp->statusCode());
    if (IsRedirect(code)) {
      const std::string& location = resp->getHeader("location");
      if (location.empty()) {
        return Status::RepositoryError("Redirect without a location for " + *url);
      }
      *url = location.front() == '/' ? origin + location : location;
      continue;
    }

    if (code == 206) {
      uint64_t start = 0;
      if (!ParseContentRange(resp->getHeader("content-range"), &start,
                             &out->total) ||
          start != offset) {
        return Status::RepositoryError("Unexpected Content-Range '" +
                                       resp->getHeader("content-range") +
                                       "' for " + *url);
      }
      out->partial = true;
      out->body.assign(resp->body().data(), resp->body().size());
      return Status::OK();
    }
    if (code == 200) {
      out->partial = false;
      out->body.assign(resp->body().data(), resp->body().size());
      out->total = out->body.size();
      return Status::OK();
    }
    if (code == 416 && offset == 0) {
      // Nothing to range over: the file is empty.
      out->partial = false;
      out->body.clear();
      out->total = 0;
      return Status::OK();
    }
    return Status::RepositoryError("HTTP " + std::to_string(code) + " for " + *url);
  }
  return Status::RepositoryError("Too many redirects for " + *url);
}

// Appends to a partial blob while hashing everything it holds.
class BlobWriter {
 public:
  // With `resume`, the existing content is kept and hashed first.
  Status Open(const std::filesystem::path& path, bool resume) {
    path_ = path;
    if (resume) {
      Status s = internal::HashFile(path, &sha_, &size_);
      if (!s.ok()) return s;
    }
    file_.open(path, resume ? std::ios::binary | std::ios::app
                            : std::ios::binary | std::ios::trunc);
    if (!file_.is_open()) {
      return Status::IOError("Cannot open " + path.string() + " for writing");
    }
    return Status::OK();
  }

  Status Append(std::string_view data) {
    file_.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!file_) return Status::IOError("Failed to write " + path_.string());
    sha_.Update(data);
    size_ += data.size();
    return Status::OK();
  }

  Status Finish(std::string* digest) {
    file_.close();
    if (!file_) return Status::IOError("Failed to write " + path_.string());
    *digest = sha_.HexDigest();
    if (digest->empty()) {
      return Status::IOError("SHA-256 digest of " + path_.string() + " failed");
    }
    return Status::OK();
  }

  uint64_t size() const { return size_; }

 private:
  std::filesystem::path path_;
  std::ofstream file_;
  internal::Sha256 sha_;
  uint64_t size_ = 0;
};

}  // namespace

struct HubRepository::Http {
  trantor::EventLoopThread loop_thread{"textembed-hub"};

  Http() { loop_thread.run(); }
};

HubRepository::~HubRepository() = default;

std::string HubRepository::CacheFolderName(const std::string& repo_id) {
  std::string name = "models--";
  for (char c : repo_id) {
    if (c == '/') {
      name += "--";
    } else {
      name += c;
    }
  }
  return name;
}

Status HubRepository::Open(const std::filesystem::path& cache_dir,
                           const std::string& repo_id,
                           const HubOptions& options,
                           std::unique_ptr<HubRepository>* out) {
  if (repo_id.empty() || repo_id.find('/') == std::string::npos) {
    return Status::InvalidArgument("Repository id must look like 'org/name': " +
                                   repo_id);
  }
  if (options.endpoint.empty()) {
    return Status::InvalidArgument("Hub endpoint must not be empty");
  }

  auto repo = std::unique_ptr<HubRepository>(new HubRepository());
  repo->repo_id_ = repo_id;
  repo->repo_dir_ = cache_dir / CacheFolderName(repo_id);
  repo->options_ = options;
  while (!repo->options_.endpoint.empty() && repo->options_.endpoint.back() == '/') {
    repo->options_.endpoint.pop_back();
  }
  *out = std::move(repo);
  return Status::OK();
}

std::optional<std::filesystem::path> HubRepository::CachedPath(
    const std::string& filename) const {
  std::string commit = options_.revision;
  if (!IsHex(commit, 40)) {
    std::ifstream ref(repo_dir_ / "refs" / options_.revision);
    if (!ref.is_open() || !std::getline(ref, commit)) return std::nullopt;
    while (!commit.empty() && std::isspace(static_cast<unsigned char>(commit.back()))) {
      commit.pop_back();
    }
    if (commit.empty()) return std::nullopt;
  }

  std::filesystem::path path = repo_dir_ / "snapshots" / commit / filename;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) return std::nullopt;
  return path;
}

Status HubRepository::Get(const std::string& filename,
                          std::filesystem::path* out) {
  std::lock_guard<std::mutex> lock(mu_);

  if (auto cached = CachedPath(filename)) {
    LOG_DEBUG << "Cache hit for " << repo_id_ << "/" << filename;
    *out = std::move(*cached);
    return Status::OK();
  }

  Status s = Download(filename, out);
  if (!s.ok()) {
    return s.WithContext("Failed to retrieve " + filename + " from " + repo_id_);
  }
  return s;
}

Status HubRepository::Download(const std::string& filename,
                               std::filesystem::path* out) {
  if (!http_) http_ = std::make_unique<Http>();
  trantor::EventLoop* loop = http_->loop_thread.getLoop();

  if (options_.show_progress) {
    LOG_INFO << "Downloading " << repo_id_ << "/" << filename;
  } else {
    LOG_DEBUG << "Downloading " << repo_id_ << "/" << filename;
  }

  std::string url = options_.endpoint + "/" + repo_id_ + "/resolve/" +
                    options_.revision + "/" + filename;
  const uint64_t chunk = std::max<uint64_t>(options_.chunk_bytes, 1);

  HubMetadata meta;
  RangeReply reply;
  Status s = GetRange(loop, options_, &url, 0, chunk, &meta, &reply);
  if (!s.ok()) return s;

  std::string etag = meta.etag;
  const std::string commit = meta.commit.empty() ? options_.revision : meta.commit;

  const std::filesystem::path blobs = repo_dir_ / "blobs";
  const std::filesystem::path snapshot = repo_dir_ / "snapshots" / commit / filename;
  std::error_code ec;
  std::filesystem::create_directories(blobs, ec);
  if (!ec) std::filesystem::create_directories(snapshot.parent_path(), ec);
  if (ec) {
    return Status::IOError("Cannot create cache directories under " +
                           repo_dir_.string() + ": " + ec.message());
  }

  // Named after the ETag so that an interrupted transfer resumes into the
  // same partial file.
  std::string stem = etag;
  if (stem.empty()) {
    stem = commit + "--" + filename;
    std::replace(stem.begin(), stem.end(), '/', '-');
  }
  std::filesystem::path incomplete = blobs / (stem + ".incomplete");

  BlobWriter writer;
  uint64_t existing = 0;
  if (std::filesystem::is_regular_file(incomplete, ec)) {
    existing = std::filesystem::file_size(incomplete, ec);
    if (ec) existing = 0;
  }
  if (reply.partial && existing > reply.body.size() && existing < reply.total) {
    s = writer.Open(incomplete, true);
    if (!s.ok()) return s;
    LOG_DEBUG << "Resuming " << repo_id_ << "/" << filename << " at byte "
              << writer.size();
  } else {
    s = writer.Open(incomplete, false);
    if (s.ok()) s = writer.Append(reply.body);
    if (!s.ok()) return s;
  }

  const uint64_t total = reply.partial ? reply.total : writer.size();
  while (writer.size() < total) {
    const uint64_t offset = writer.size();
    const uint64_t length = std::min(chunk, total - offset);
    for (int attempt = 1;; ++attempt) {
      s = GetRange(loop, options_, &url, offset, length, nullptr, &reply);
      if (s.ok() || attempt >= kChunkAttempts) break;
      LOG_WARN << "Retrying " << repo_id_ << "/" << filename << " at byte "
               << offset << ": " << s.ToString();
    }
    // The partial file stays behind for the next attempt.
    if (!s.ok()) return s;
    if (!reply.partial || reply.body.empty()) {
      return Status::RepositoryError("Server ignored the byte range for " + url);
    }
    s = writer.Append(reply.body);
    if (!s.ok()) return s;

    if (options_.show_progress) {
      LOG_INFO << repo_id_ << "/" << filename << ": "
               << writer.size() * 100 / total << "% of "
               << total / (1024 * 1024) << " MiB";
    }
  }

  std::string digest;
  s = writer.Finish(&digest);
  if (!s.ok()) return s;

  // LFS files are addressed by the SHA-256 of their contents.
  if (IsHex(etag, 64) && ToLower(etag) != digest) {
    std::filesystem::remove(incomplete, ec);
    return Status::RepositoryError("Checksum mismatch for " + filename +
                                   ": expected " + etag + ", got " + digest);
  }
  if (etag.empty()) etag = digest;

  const std::filesystem::path blob = blobs / etag;
  std::filesystem::rename(incomplete, blob, ec);
  if (ec) {
    return Status::IOError("Cannot move download into " + blob.string() + ": " +
                           ec.message());
  }

  std::filesystem::remove(snapshot, ec);
  std::filesystem::path target =
      std::filesystem::relative(blob, snapshot.parent_path(), ec);
  if (!ec) std::filesystem::create_symlink(target, snapshot, ec);
  if (ec) {
    // Filesystems without symlinks get a copy.
    ec.clear();
    std::filesystem::copy_file(blob, snapshot,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
      return Status::IOError("Cannot create " + snapshot.string() + ": " +
                             ec.message());
    }
  }

  if (commit != options_.revision) {
    std::filesystem::create_directories(repo_dir_ / "refs", ec);
    s = ec ? Status::IOError(ec.message())
           : WriteFile(repo_dir_ / "refs" / options_.revision, commit);
    if (!s.ok()) return s.WithContext("Cannot record revision " + options_.revision);
  }

  if (options_.show_progress) {
    LOG_INFO << "Downloaded " << repo_id_ << "/" << filename << " ("
             << total / (1024 * 1024) << " MiB)";
  }

  *out = snapshot;
  return Status::OK();
}

}  // namespace textembed
