#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

class Config {
 public:
  static constexpr std::chrono::seconds kDefaultHttpTimeout{60};
  static constexpr std::uint64_t kDefaultMaxDownloadBytes = 100ULL * 1024 * 1024;
  static constexpr long kDefaultMaxRedirects = 10;
  static constexpr std::chrono::hours kDefaultContentTtl{24};

  /// Searches $PDFCACHE_CONFIG, ~/.config/pdfcache, ./pdfcache and
  /// /etc/pdfcache for conf.json; defaults apply when none is found.
  Config();

  /// Loads the given file. Throws std::runtime_error if it is missing or
  /// invalid.
  explicit Config(const std::filesystem::path& conf_file);

  Config(const Config& conf) = default;

  /// The file the settings came from, empty when running on defaults
  const std::filesystem::path& GetConfigFile() const {
    return config_file_;
  }

  std::filesystem::path GetDownloadDir() const;

  std::filesystem::path GetContentDir() const;

  std::chrono::seconds GetHttpTimeout() const;

  std::uint64_t GetMaxDownloadBytes() const;

  long GetMaxRedirects() const;

  std::chrono::hours GetContentTtl() const;

  unsigned GetMaxConcurrentFetches() const;

  std::string GetUserAgent() const;

  static std::optional<std::filesystem::path> FindConfigFile();

 private:
  void SetDefaults();
  void Load();

  std::filesystem::path config_file_;
  std::filesystem::path download_dir_;
  std::filesystem::path content_dir_;
  std::chrono::seconds http_timeout_s_{kDefaultHttpTimeout};
  std::uint64_t max_download_bytes_{kDefaultMaxDownloadBytes};
  long max_redirects_{kDefaultMaxRedirects};
  std::chrono::hours content_ttl_h_{kDefaultContentTtl};
  unsigned max_concurrent_fetches_{1};
  std::string user_agent_;
};
