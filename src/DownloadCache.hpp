#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

struct CachedDownload {
  std::string url;
  std::filesystem::path path;
  std::uintmax_t size{0};
};

// Downloaded PDFs keyed by the URL they were fetched from. The in-memory
// index is only an accelerator: the file name is a pure function of the URL,
// so a fresh process finds earlier downloads on disk.
class DownloadCache {
 public:
  struct Stats {
    std::size_t file_count{0};
    std::uintmax_t total_bytes{0};
    std::filesystem::path cache_dir;
  };

  /// Creates `dir` if needed and restricts it to its owner (0700).
  explicit DownloadCache(const std::filesystem::path& dir);
  DownloadCache(const DownloadCache&) = delete;
  DownloadCache& operator=(const DownloadCache&) = delete;

  /// Path of a previous download of `url`, if its file still exists. Stale
  /// index entries are dropped; a disk hit is added to the index.
  std::optional<std::filesystem::path> Lookup(const std::string& url);

  /// "<16 hex of sha256(url)>_<basename>" for URLs whose path ends in
  /// ".pdf", "<16 hex>.pdf" otherwise. Only [A-Za-z0-9._-] survive in the
  /// basename.
  static std::string FilenameFor(const std::string& url);

  std::filesystem::path PathFor(const std::string& url) const {
    return dir_ / FilenameFor(url);
  }

  /// Writes `body` as the download of `url` (mode 0600, atomically
  /// replacing any previous one) and indexes it. Throws std::system_error
  /// on I/O failure; nothing is indexed in that case.
  CachedDownload Store(const std::string& url, const std::string& body);

  /// Points `url` at an existing file.
  void Register(const std::string& url, const std::filesystem::path& path);

  /// Deletes every cached PDF and empties the index. Files that cannot be
  /// deleted are skipped and not counted.
  std::size_t Clear();

  /// Scans the directory; reflects files added or removed behind our back.
  Stats GetStats() const;

  const std::filesystem::path& GetDir() const {
    return dir_;
  }

 private:
  std::filesystem::path dir_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::filesystem::path> index_;
};
