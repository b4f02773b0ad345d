#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "DocumentCache.hpp"
#include "DocumentParser.hpp"
#include "RemoteFetcher.hpp"

// Turns a source string (local path or URL) into document info and page text,
// fetching remote files and serving repeat reads from the content cache.
class DocumentService {
 public:
  DocumentService(RemoteFetcher& fetcher, DocumentCache& cache,
                  DocumentParser& parser)
      : fetcher_(fetcher), cache_(cache), parser_(parser) {
  }

  static bool IsUrl(const std::string& source) {
    return RemoteFetcher::IsUrl(source);
  }

  /// Local file backing `source`. URLs go through the fetcher; a local path
  /// must exist, else std::runtime_error.
  std::filesystem::path ResolveSource(const std::string& source,
                                      bool force_refresh = false);

  DocumentRecord GetInfo(const std::string& source);

  /// Text of the pages named by `pages_spec`, keyed by 0-based index.
  std::map<int, std::string> ReadPages(const std::string& source,
                                       const std::string& pages_spec = "");

  /// "1-3,5,8-10" (1-based) to sorted unique 0-based indices below
  /// `page_count`. An empty spec selects every page. Throws
  /// std::invalid_argument on malformed input.
  static std::vector<int> ParsePageRange(const std::string& spec,
                                         int page_count);

 private:
  DocumentRecord LoadRecord(const DocumentIdentity& id);

  RemoteFetcher& fetcher_;
  DocumentCache& cache_;
  DocumentParser& parser_;
};
