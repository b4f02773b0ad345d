#include "DownloadCache.hpp"
#include "Digest.hpp"
#include "Logger.hpp"
#include "URL.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace {

constexpr std::size_t kHashChars = 16;

std::string sanitize_filename(const std::string& name) {
  std::string out;
  out.reserve(name.size());
  for (unsigned char c : name) {
    if (std::isalnum(c) || c == '.' || c == '_' || c == '-')
      out.push_back(static_cast<char>(c));
  }
  return out;
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// write(2) until everything is out or an error other than EINTR occurs
void write_all(int fd, const std::string& data) {
  const char* p = data.data();
  std::size_t left = data.size();
  while (left > 0) {
    ssize_t n = ::write(fd, p, left);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw std::system_error(errno, std::generic_category(), "write");
    }
    p += n;
    left -= static_cast<std::size_t>(n);
  }
}

}  // namespace

DownloadCache::DownloadCache(const std::filesystem::path& dir) : dir_{dir} {
  std::filesystem::create_directories(dir_);
  std::filesystem::permissions(dir_, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::replace);
}

std::string DownloadCache::FilenameFor(const std::string& url) {
  const std::string hash = Sha256Hex(url).substr(0, kHashChars);
  const URL parsed(url);
  const std::string path = parsed.GetPath();

  if (ends_with(path, ".pdf")) {
    return hash + "_" + sanitize_filename(parsed.GetBasename());
  }
  return hash + ".pdf";
}

std::optional<std::filesystem::path> DownloadCache::Lookup(
  const std::string& url) {
  std::error_code ec;
  {
    std::lock_guard<std::mutex> lk(mutex_);
    if (auto it = index_.find(url); it != index_.end()) {
      if (std::filesystem::is_regular_file(it->second, ec))
        return it->second;
      logr::debug << "[DownloadCache] stale entry for " << url << ": "
                  << it->second;
      index_.erase(it);
    }
  }

  auto candidate = PathFor(url);
  if (std::filesystem::is_regular_file(candidate, ec)) {
    std::lock_guard<std::mutex> lk(mutex_);
    index_[url] = candidate;
    return candidate;
  }
  return std::nullopt;
}

CachedDownload DownloadCache::Store(const std::string& url,
                                    const std::string& body) {
  const auto filename = PathFor(url);

  // mkstemp creates the file 0600; the name doesn't end in .pdf so a
  // half-written file is never mistaken for a download
  std::string tmpl = (dir_ / ("." + FilenameFor(url) + ".XXXXXX")).string();
  int fd = ::mkstemp(tmpl.data());
  if (fd < 0) {
    throw std::system_error(errno, std::generic_category(),
                            "mkstemp in " + dir_.string());
  }
  const std::filesystem::path tmp{tmpl};

  try {
    write_all(fd, body);
    if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0)
      throw std::system_error(errno, std::generic_category(), "fchmod");
    if (::close(fd) != 0) {
      fd = -1;
      throw std::system_error(errno, std::generic_category(), "close");
    }
    fd = -1;
    std::filesystem::rename(tmp, filename);
  } catch (...) {
    if (fd >= 0)
      ::close(fd);
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    throw;
  }

  Register(url, filename);
  logr::debug << "[DownloadCache] stored " << body.size() << " bytes for "
              << url << " at " << filename;
  return CachedDownload{url, filename, body.size()};
}

void DownloadCache::Register(const std::string& url,
                             const std::filesystem::path& path) {
  std::lock_guard<std::mutex> lk(mutex_);
  index_[url] = path;
}

std::size_t DownloadCache::Clear() {
  std::size_t count = 0;
  std::error_code ec;
  for (auto it = std::filesystem::directory_iterator(dir_, ec);
       !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    const auto& p = it->path();
    if (p.extension() != ".pdf")
      continue;
    std::error_code rm_ec;
    if (std::filesystem::remove(p, rm_ec)) {
      ++count;
    } else if (rm_ec) {
      logr::warning << "[DownloadCache] could not delete " << p << ": "
                    << rm_ec.message();
    }
  }
  if (ec) {
    logr::warning << "[DownloadCache] scan of " << dir_
                  << " stopped: " << ec.message();
  }

  std::lock_guard<std::mutex> lk(mutex_);
  index_.clear();
  return count;
}

DownloadCache::Stats DownloadCache::GetStats() const {
  Stats stats;
  stats.cache_dir = dir_;
  std::error_code ec;
  for (auto it = std::filesystem::directory_iterator(dir_, ec);
       !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    std::error_code entry_ec;
    if (it->path().extension() != ".pdf" || !it->is_regular_file(entry_ec))
      continue;
    auto size = it->file_size(entry_ec);
    if (entry_ec)
      continue;  // removed while scanning
    ++stats.file_count;
    stats.total_bytes += size;
  }
  return stats;
}
