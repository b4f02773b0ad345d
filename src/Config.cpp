#include "Config.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cstdlib>  // for std::getenv
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <thread>
#include <vector>

using json = nlohmann::json;

namespace {

template <typename T>
T positive(const json& j, const char* key, T fallback) {
  auto it = j.find(key);
  if (it == j.end())
    return fallback;
  if (!it->is_number_integer())
    throw std::runtime_error(std::string(key) + " must be an integer");
  auto v = it->get<long long>();
  if (v <= 0)
    throw std::runtime_error(std::string(key) + " must be positive");
  return static_cast<T>(v);
}

}  // namespace

std::optional<std::filesystem::path> Config::FindConfigFile() {
  std::vector<std::filesystem::path> candidates;
  if (const char* explicit_file = std::getenv("PDFCACHE_CONFIG")) {
    candidates.emplace_back(explicit_file);
  }
  if (const char* h = std::getenv("HOME")) {
    candidates.push_back(std::filesystem::path{h} / ".config" / "pdfcache" /
                         "conf.json");
  }
  candidates.push_back(std::filesystem::current_path() / "pdfcache" /
                       "conf.json");
  candidates.push_back(std::filesystem::path{"/etc"} / "pdfcache" /
                       "conf.json");

  std::error_code ec;
  for (auto const& file : candidates) {
    if (std::filesystem::is_regular_file(file, ec)) {
      return file;
    }
  }
  return std::nullopt;
}

Config::Config() {
  SetDefaults();
  if (auto found = FindConfigFile()) {
    config_file_ = *found;
    Load();
  } else {
    logr::debug << "[Config] no conf.json found; using defaults";
  }
}

Config::Config(const std::filesystem::path& config_file)
    : config_file_{config_file} {
  SetDefaults();
  if (config_file_.empty() || !std::filesystem::exists(config_file_)) {
    throw std::runtime_error("pdfcache config not found: " +
                             config_file_.string());
  }
  Load();
}

void Config::SetDefaults() {
  auto base = std::filesystem::temp_directory_path() / "pdfcache";
  download_dir_ = base / "downloads";
  content_dir_ = base / "content";
  http_timeout_s_ = kDefaultHttpTimeout;
  max_download_bytes_ = kDefaultMaxDownloadBytes;
  max_redirects_ = kDefaultMaxRedirects;
  content_ttl_h_ = kDefaultContentTtl;
  max_concurrent_fetches_ = std::max(1u, std::thread::hardware_concurrency());
  user_agent_ = "pdfcache/1.0";
}

void Config::Load() {
  std::ifstream in{config_file_};
  if (!in.is_open()) {
    throw std::runtime_error("Failed to open " + config_file_.string());
  }

  try {
    json j;
    in >> j;

    // {
    //   "download_dir": "/var/cache/pdfcache/downloads",
    //   "content_dir": "/var/cache/pdfcache/content",
    //   "http_timeout_s": 60,
    //   "max_download_bytes": 104857600,
    //   "max_redirects": 10,
    //   "content_ttl_hours": 24,
    //   "max_concurrent_fetches": 4,
    //   "user_agent": "pdfcache/1.0"
    // }
    if (!j.is_object())
      throw std::runtime_error("top level must be an object");

    if (j.contains("download_dir"))
      download_dir_ = j.at("download_dir").get<std::string>();
    if (j.contains("content_dir"))
      content_dir_ = j.at("content_dir").get<std::string>();
    user_agent_ = j.value("user_agent", user_agent_);

    http_timeout_s_ = std::chrono::seconds{
      positive<long long>(j, "http_timeout_s", http_timeout_s_.count())};
    max_download_bytes_ = positive<std::uint64_t>(j, "max_download_bytes",
                                                  max_download_bytes_);
    max_redirects_ = positive<long>(j, "max_redirects", max_redirects_);
    content_ttl_h_ = std::chrono::hours{
      positive<long long>(j, "content_ttl_hours", content_ttl_h_.count())};
    max_concurrent_fetches_ = positive<unsigned>(j, "max_concurrent_fetches",
                                                 max_concurrent_fetches_);
  } catch (const std::exception& ex) {
    throw std::runtime_error("Error parsing " + config_file_.string() + ": " +
                             ex.what());
  }

  logr::debug << "[Config] loaded " << config_file_;
}

std::filesystem::path Config::GetDownloadDir() const {
  return download_dir_;
}

std::filesystem::path Config::GetContentDir() const {
  return content_dir_;
}

std::chrono::seconds Config::GetHttpTimeout() const {
  return http_timeout_s_;
}

std::uint64_t Config::GetMaxDownloadBytes() const {
  return max_download_bytes_;
}

long Config::GetMaxRedirects() const {
  return max_redirects_;
}

std::chrono::hours Config::GetContentTtl() const {
  return content_ttl_h_;
}

unsigned Config::GetMaxConcurrentFetches() const {
  return max_concurrent_fetches_;
}

std::string Config::GetUserAgent() const {
  return user_agent_;
}
