#include "DocumentCache.hpp"
#include "Digest.hpp"
#include "Logger.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace {

constexpr const char* kIdentityFile = "identity.json";
constexpr const char* kMetaFile = "meta.json";

nlohmann::json identity_to_json(const DocumentIdentity& id) {
  return {{"path", id.path.string()},
          {"mtime_ns", id.mtime_ns},
          {"size", id.size}};
}

std::optional<nlohmann::json> read_json(const std::filesystem::path& file) {
  std::ifstream in(file, std::ios::binary);
  if (!in)
    return std::nullopt;
  auto j = nlohmann::json::parse(in, nullptr, false);
  if (j.is_discarded()) {
    logr::warning << "[DocumentCache] unreadable " << file;
    return std::nullopt;
  }
  return j;
}

std::chrono::system_clock::time_point to_system_time(
  std::filesystem::file_time_type ftime) {
  auto since = std::filesystem::file_time_type::clock::now() - ftime;
  return std::chrono::system_clock::now() -
         std::chrono::duration_cast<std::chrono::system_clock::duration>(since);
}

bool is_page_file(const std::filesystem::path& p) {
  const std::string name = p.filename().string();
  return name.rfind("page-", 0) == 0 && p.extension() == ".txt";
}

}  // namespace

DocumentIdentity DocumentIdentity::ForFile(const std::filesystem::path& file) {
  DocumentIdentity id;
  id.path = std::filesystem::canonical(file);
  id.mtime_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                  std::filesystem::last_write_time(id.path).time_since_epoch())
                  .count();
  id.size = std::filesystem::file_size(id.path);
  return id;
}

std::string DocumentIdentity::Key() const {
  return Sha256Hex(path.string() + "\n" + std::to_string(mtime_ns) + "\n" +
                   std::to_string(size));
}

DocumentCache::DocumentCache(const std::filesystem::path& dir,
                             std::chrono::seconds ttl)
    : dir_{dir}, ttl_{ttl} {
  std::filesystem::create_directories(dir_);
  std::filesystem::permissions(dir_, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::replace);
}

bool DocumentCache::IsExpired(const std::filesystem::path& file) const {
  std::error_code ec;
  auto ftime = std::filesystem::last_write_time(file, ec);
  if (ec)
    return true;
  auto age = std::filesystem::file_time_type::clock::now() - ftime;
  // clock skew
  if (age < decltype(age)::zero())
    age = decltype(age)::zero();
  return age > std::chrono::duration_cast<decltype(age)>(ttl_);
}

std::filesystem::path DocumentCache::EntryDir(
  const DocumentIdentity& id) const {
  return dir_ / id.Key();
}

std::filesystem::path DocumentCache::EnsureEntry(
  const DocumentIdentity& id) const {
  auto entry = EntryDir(id);
  std::filesystem::create_directories(entry);
  auto identity_file = entry / kIdentityFile;
  if (!std::filesystem::exists(identity_file))
    WriteAtomically(identity_file, identity_to_json(id).dump(2));
  return entry;
}

std::filesystem::path DocumentCache::PageFile(
  const std::filesystem::path& entry, int page_index) {
  return entry / ("page-" + std::to_string(page_index) + ".txt");
}

void DocumentCache::WriteAtomically(const std::filesystem::path& file,
                                    const std::string& content) {
  std::filesystem::path tmp = file;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
      std::error_code ec;
      std::filesystem::remove(tmp, ec);
      throw std::runtime_error("Could not write " + file.string());
    }
  }
  std::filesystem::rename(tmp, file);
}

void DocumentCache::SaveMetadata(const DocumentIdentity& id, int page_count,
                                 const nlohmann::json& metadata,
                                 const std::vector<TocEntry>& toc) {
  if (page_count < 0)
    throw std::invalid_argument("negative page count");

  nlohmann::json j = {{"page_count", page_count},
                      {"metadata", metadata.is_null()
                                     ? nlohmann::json::object()
                                     : metadata},
                      {"toc", toc}};

  std::lock_guard<std::mutex> lk(write_mutex_);
  PurgeLocked();
  auto entry = EnsureEntry(id);
  WriteAtomically(entry / kMetaFile, j.dump(2));
  logr::debug << "[DocumentCache] metadata stored for " << id.path;
}

std::optional<DocumentRecord> DocumentCache::GetMetadata(
  const DocumentIdentity& id) const {
  auto file = EntryDir(id) / kMetaFile;
  std::error_code ec;
  if (!std::filesystem::exists(file, ec) || IsExpired(file))
    return std::nullopt;

  auto j = read_json(file);
  if (!j)
    return std::nullopt;

  DocumentRecord rec;
  rec.identity = id;
  try {
    rec.page_count = j->at("page_count").get<int>();
    rec.metadata = j->value("metadata", nlohmann::json::object());
    rec.toc = j->value("toc", std::vector<TocEntry>{});
  } catch (const nlohmann::json::exception& e) {
    logr::warning << "[DocumentCache] malformed " << file << ": " << e.what();
    return std::nullopt;
  }
  auto ftime = std::filesystem::last_write_time(file, ec);
  rec.created_at = ec ? std::chrono::system_clock::now() : to_system_time(ftime);
  return rec;
}

void DocumentCache::SavePageText(const DocumentIdentity& id, int page_index,
                                 const std::string& text) {
  if (page_index < 0)
    throw std::out_of_range("negative page index " +
                            std::to_string(page_index));

  std::lock_guard<std::mutex> lk(write_mutex_);
  auto entry = EnsureEntry(id);
  WriteAtomically(PageFile(entry, page_index), text);
}

std::optional<std::string> DocumentCache::GetPageText(
  const DocumentIdentity& id, int page_index) const {
  if (page_index < 0)
    return std::nullopt;

  auto p = PageFile(EntryDir(id), page_index);
  std::error_code ec;
  if (!std::filesystem::exists(p, ec) || IsExpired(p))
    return std::nullopt;

  std::ifstream in(p, std::ios::binary);
  if (!in)
    return std::nullopt;
  std::string data((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  return data;
}

std::map<int, std::string> DocumentCache::GetPagesText(
  const DocumentIdentity& id, const std::vector<int>& pages) const {
  std::map<int, std::string> out;
  for (int page : pages) {
    if (auto text = GetPageText(id, page))
      out.emplace(page, std::move(*text));
  }
  return out;
}

std::size_t DocumentCache::Purge() {
  std::lock_guard<std::mutex> lk(write_mutex_);
  return PurgeLocked();
}

// Caller holds write_mutex_.
std::size_t DocumentCache::PurgeLocked() {
  std::size_t removed = 0;
  std::error_code ec;

  for (auto it = std::filesystem::directory_iterator(dir_, ec);
       !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    const std::filesystem::path entry = it->path();
    std::error_code entry_ec;
    if (!it->is_directory(entry_ec))
      continue;

    // Entries for a file that has since changed can never be read again.
    bool orphaned = true;
    if (auto j = read_json(entry / kIdentityFile)) {
      try {
        auto current = DocumentIdentity::ForFile(j->at("path").get<std::string>());
        orphaned = identity_to_json(current) != *j;
      } catch (const std::filesystem::filesystem_error&) {
        orphaned = true;
      } catch (const nlohmann::json::exception&) {
        orphaned = true;
      }
    }

    std::size_t live = 0;
    for (auto f = std::filesystem::directory_iterator(entry, entry_ec);
         !entry_ec && f != std::filesystem::directory_iterator();
         f.increment(entry_ec)) {
      const std::filesystem::path p = f->path();
      if (p.filename() == kIdentityFile)
        continue;
      if (orphaned || IsExpired(p)) {
        std::error_code rm_ec;
        if (std::filesystem::remove(p, rm_ec))
          ++removed;
        else if (rm_ec)
          logr::warning << "[DocumentCache] could not remove " << p << ": "
                        << rm_ec.message();
      } else {
        ++live;
      }
    }
    if (entry_ec) {
      logr::warning << "[DocumentCache] could not scan " << entry << ": "
                    << entry_ec.message();
      continue;
    }

    if (live == 0) {
      std::error_code rm_ec;
      std::filesystem::remove_all(entry, rm_ec);
      if (rm_ec)
        logr::warning << "[DocumentCache] could not remove " << entry << ": "
                      << rm_ec.message();
    }
  }
  if (ec)
    logr::warning << "[DocumentCache] could not scan " << dir_ << ": "
                  << ec.message();

  if (removed > 0)
    logr::info << "[DocumentCache] purged " << removed << " expired files";
  return removed;
}

DocumentCache::Stats DocumentCache::GetStats() {
  std::lock_guard<std::mutex> lk(write_mutex_);
  PurgeLocked();

  Stats s;
  s.cache_dir = dir_;
  std::error_code ec;
  for (auto it = std::filesystem::recursive_directory_iterator(dir_, ec);
       !ec && it != std::filesystem::recursive_directory_iterator();
       it.increment(ec)) {
    std::error_code file_ec;
    if (!it->is_regular_file(file_ec))
      continue;
    const auto size = it->file_size(file_ec);
    if (file_ec)
      continue;
    const std::filesystem::path& p = it->path();
    s.cache_size_bytes += size;
    if (p.filename() == kMetaFile)
      ++s.total_files;
    else if (is_page_file(p))
      ++s.total_pages;
  }
  if (ec)
    logr::warning << "[DocumentCache] could not scan " << dir_ << ": "
                  << ec.message();
  return s;
}

void DocumentCache::ClearAll() {
  std::lock_guard<std::mutex> lk(write_mutex_);
  std::error_code ec;
  for (auto it = std::filesystem::directory_iterator(dir_, ec);
       !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    std::error_code rm_ec;
    std::filesystem::remove_all(it->path(), rm_ec);
    if (rm_ec)
      logr::warning << "[DocumentCache] could not remove " << it->path()
                    << ": " << rm_ec.message();
  }
  if (ec)
    logr::warning << "[DocumentCache] could not scan " << dir_ << ": "
                  << ec.message();
  logr::info << "[DocumentCache] cleared " << dir_;
}
