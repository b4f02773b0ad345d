#include "DocumentService.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace {

std::string trim(const std::string& s) {
  auto b = s.find_first_not_of(" \t");
  if (b == std::string::npos)
    return "";
  auto e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

long parse_page_number(const std::string& token, const std::string& spec) {
  if (token.empty() ||
      !std::all_of(token.begin(), token.end(),
                   [](unsigned char c) { return std::isdigit(c); }))
    throw std::invalid_argument("Invalid page range '" + spec + "'");
  try {
    return std::stol(token);
  } catch (const std::out_of_range&) {
    return std::numeric_limits<long>::max();
  }
}

}  // namespace

std::filesystem::path DocumentService::ResolveSource(const std::string& source,
                                                     bool force_refresh) {
  if (IsUrl(source))
    return fetcher_.Fetch(source, force_refresh);

  std::filesystem::path p(source);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(p, ec))
    throw std::runtime_error("PDF file not found: " + source);
  return p;
}

DocumentRecord DocumentService::LoadRecord(const DocumentIdentity& id) {
  if (auto cached = cache_.GetMetadata(id)) {
    logr::debug << "[DocumentService] metadata cache hit: " << id.path;
    return *cached;
  }

  auto doc = parser_.Open(id.path);
  DocumentRecord rec;
  rec.identity = id;
  rec.page_count = doc->PageCount();
  rec.metadata = parser_.ExtractMetadata(*doc);
  rec.toc = parser_.ExtractToc(*doc);
  rec.created_at = std::chrono::system_clock::now();
  cache_.SaveMetadata(id, rec.page_count, rec.metadata, rec.toc);
  return rec;
}

DocumentRecord DocumentService::GetInfo(const std::string& source) {
  auto id = DocumentIdentity::ForFile(ResolveSource(source));
  return LoadRecord(id);
}

std::map<int, std::string> DocumentService::ReadPages(
  const std::string& source, const std::string& pages_spec) {
  auto id = DocumentIdentity::ForFile(ResolveSource(source));
  const auto rec = LoadRecord(id);
  const auto pages = ParsePageRange(pages_spec, rec.page_count);

  auto out = cache_.GetPagesText(id, pages);
  if (out.size() == pages.size())
    return out;

  const size_t misses = pages.size() - out.size();
  auto doc = parser_.Open(id.path);
  for (int page : pages) {
    if (out.count(page))
      continue;
    std::string text = parser_.ExtractText(*doc, page);
    cache_.SavePageText(id, page, text);
    out.emplace(page, std::move(text));
  }
  logr::debug << "[DocumentService] " << id.path << ": " << pages.size()
              << " pages, " << misses << " extracted";
  return out;
}

std::vector<int> DocumentService::ParsePageRange(const std::string& spec,
                                                 int page_count) {
  std::vector<int> pages;
  if (page_count <= 0)
    return pages;

  if (trim(spec).empty()) {
    pages.reserve(static_cast<size_t>(page_count));
    for (int i = 0; i < page_count; ++i)
      pages.push_back(i);
    return pages;
  }

  std::istringstream in(spec);
  std::string part;
  while (std::getline(in, part, ',')) {
    part = trim(part);
    if (part.empty())
      continue;

    long first, last;
    if (auto dash = part.find('-'); dash != std::string::npos) {
      first = parse_page_number(trim(part.substr(0, dash)), spec);
      last = parse_page_number(trim(part.substr(dash + 1)), spec);
      if (first > last)
        std::swap(first, last);
    } else {
      first = last = parse_page_number(part, spec);
    }

    first = std::max(first, 1L);
    last = std::min(last, static_cast<long>(page_count));
    for (long p = first; p <= last; ++p)
      pages.push_back(static_cast<int>(p - 1));
  }

  std::sort(pages.begin(), pages.end());
  pages.erase(std::unique(pages.begin(), pages.end()), pages.end());
  return pages;
}
