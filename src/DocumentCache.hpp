#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "DocumentParser.hpp"

// Which bytes a cache entry describes: the file plus a change fingerprint, so
// an edited document gets a new key instead of stale text.
struct DocumentIdentity {
  std::filesystem::path path;  // canonical
  std::int64_t mtime_ns{0};
  std::uintmax_t size{0};

  /// Fingerprints the file as it is now. Throws
  /// std::filesystem::filesystem_error if it does not exist.
  static DocumentIdentity ForFile(const std::filesystem::path& file);

  /// SHA-256 over path, mtime and size
  std::string Key() const;

  bool operator==(const DocumentIdentity& o) const {
    return path == o.path && mtime_ns == o.mtime_ns && size == o.size;
  }
  bool operator!=(const DocumentIdentity& o) const {
    return !(*this == o);
  }
};

struct DocumentRecord {
  DocumentIdentity identity;
  int page_count{0};
  nlohmann::json metadata = nlohmann::json::object();
  std::vector<TocEntry> toc;
  std::chrono::system_clock::time_point created_at;
};

// Extracted document content on disk, one directory per identity:
//
//   <dir>/<key>/identity.json
//   <dir>/<key>/meta.json       page count, metadata, outline
//   <dir>/<key>/page-<n>.txt    text of 0-based page n
//
// Metadata and each page expire separately, `ttl` after they were written.
// Reads never return expired data; Purge() reclaims it.
class DocumentCache {
 public:
  struct Stats {
    std::size_t total_files{0};  // documents with live metadata
    std::size_t total_pages{0};
    std::uintmax_t cache_size_bytes{0};
    std::filesystem::path cache_dir;
  };

  DocumentCache(const std::filesystem::path& dir, std::chrono::seconds ttl);
  DocumentCache(const DocumentCache&) = delete;
  DocumentCache& operator=(const DocumentCache&) = delete;

  void SaveMetadata(const DocumentIdentity& id, int page_count,
                    const nlohmann::json& metadata,
                    const std::vector<TocEntry>& toc);
  std::optional<DocumentRecord> GetMetadata(const DocumentIdentity& id) const;

  void SavePageText(const DocumentIdentity& id, int page_index,
                    const std::string& text);
  std::optional<std::string> GetPageText(const DocumentIdentity& id,
                                         int page_index) const;

  /// Only the pages that are cached and unexpired appear in the result.
  std::map<int, std::string> GetPagesText(const DocumentIdentity& id,
                                          const std::vector<int>& pages) const;

  /// Purges, then counts what is left.
  Stats GetStats();

  /// Removes expired files, and whole entries whose source file has changed
  /// or vanished. Returns the number of files removed.
  std::size_t Purge();

  void ClearAll();

 private:
  std::size_t PurgeLocked();
  bool IsExpired(const std::filesystem::path& file) const;
  std::filesystem::path EntryDir(const DocumentIdentity& id) const;
  std::filesystem::path EnsureEntry(const DocumentIdentity& id) const;
  static std::filesystem::path PageFile(const std::filesystem::path& entry,
                                        int page_index);
  static void WriteAtomically(const std::filesystem::path& file,
                              const std::string& content);

  std::filesystem::path dir_;
  std::chrono::seconds ttl_;
  std::mutex write_mutex_;
};
