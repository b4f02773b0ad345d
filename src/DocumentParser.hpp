#pragma once

#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

/// One outline entry; `page` is 1-based as PDF viewers show it.
struct TocEntry {
  int level{1};
  std::string title;
  int page{0};

  bool operator==(const TocEntry& o) const {
    return level == o.level && title == o.title && page == o.page;
  }
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(TocEntry, level, title, page)

/// Thrown by a parser for input it cannot open.
class DocumentError : public std::runtime_error {
 public:
  explicit DocumentError(const std::string& what) : std::runtime_error(what) {
  }
};

class DocumentHandle {
 public:
  virtual ~DocumentHandle() = default;
  virtual int PageCount() const = 0;
};

// The PDF engine, seen only through this seam.
class DocumentParser {
 public:
  virtual ~DocumentParser() = default;

  /// Throws DocumentError on corrupt or unreadable input.
  virtual std::unique_ptr<DocumentHandle> Open(
    const std::filesystem::path& path) = 0;

  /// Text of the 0-based page `page_index`.
  virtual std::string ExtractText(DocumentHandle& doc, int page_index) = 0;

  /// Document info dictionary as a JSON object of scalars.
  virtual nlohmann::json ExtractMetadata(DocumentHandle& doc) = 0;

  virtual std::vector<TocEntry> ExtractToc(DocumentHandle& doc) = 0;
};
