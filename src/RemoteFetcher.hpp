#pragma once

#include <curl/curl.h>

#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "Config.hpp"
#include "DownloadCache.hpp"
#include "Gate.hpp"
#include "HttpResponse.hpp"
#include "SsrfGuard.hpp"

namespace detail {

// libcurl timeouts for one transfer. `timeout` bounds connecting and each
// stretch without received bytes; the total duration is not capped.
struct CurlTimeouts {
  long connect_timeout_ms{0};
  long low_speed_limit{0};  // bytes per second
  long low_speed_time{0};   // seconds below the limit before giving up
  long total_timeout_ms{0};  // 0: none
};

CurlTimeouts TimeoutsFor(std::chrono::seconds timeout);

/// "host:port:addr1,[v6addr2]", a CURLOPT_RESOLVE entry pinning the host to
/// the validated addresses
std::string ResolveEntry(const ValidatedTarget& target);

/// CURLOPT_OPENSOCKETFUNCTION. `clientp` is a std::optional<std::string>*
/// that receives the address of a refused connection.
curl_socket_t OpenSocketCallback(void* clientp, curlsocktype purpose,
                                 struct curl_sockaddr* address);

}  // namespace detail

// Downloads PDFs over HTTP(S) into a DownloadCache.
//
// Redirects are followed by hand, one hop at a time, so every target is run
// through SsrfGuard before anything connects to it. Each connection is pinned
// to the addresses that were validated, and a socket-open hook refuses any
// blocked address as a last line of defence.
class RemoteFetcher {
 public:
  struct Options {
    std::chrono::seconds timeout{Config::kDefaultHttpTimeout};
    std::uint64_t max_bytes{Config::kDefaultMaxDownloadBytes};
    long max_redirects{Config::kDefaultMaxRedirects};
    unsigned max_concurrent{4};
    std::string user_agent{"pdfcache/1.0"};
  };

  struct TestHooks {
    struct ScriptedResponse {
      long status{200};
      std::vector<std::string> headers;  // "Name: value"
      std::string body;
      // overrides the transfer result, e.g. CURLE_OPERATION_TIMEDOUT
      std::optional<CURLcode> curl_code = std::nullopt;
    };

    // When enabled, transfers are served from `responses` (front first) and
    // fed through the same header/body callbacks a real transfer uses.
    static inline bool enabled = false;
    static inline std::deque<ScriptedResponse> responses;
    static inline std::vector<std::string> requested_urls;

    static void Reset() {
      enabled = false;
      responses.clear();
      requested_urls.clear();
    }
  };

  // Read-buffer size handed to libcurl; the body arrives in pieces no larger
  // than this.
  static constexpr std::size_t kChunkSize = 8 * 1024;

  RemoteFetcher(DownloadCache& cache, Options opts);
  RemoteFetcher(DownloadCache& cache, const Config& conf);
  RemoteFetcher(const RemoteFetcher&) = delete;
  RemoteFetcher& operator=(const RemoteFetcher&) = delete;

  /// Local path of the PDF at `url`, downloading it unless a cached copy
  /// exists (or `force_refresh`). Throws BlockedURL, TooLarge, NotAPDF,
  /// TooManyRedirects or TransportError.
  std::filesystem::path Fetch(const std::string& url,
                              bool force_refresh = false);

  /// Fetch on a worker thread; at most Options::max_concurrent run at once.
  std::future<std::filesystem::path> FetchAsync(const std::string& url,
                                                bool force_refresh = false);

  /// http:// or https:// prefix
  static bool IsUrl(const std::string& source);

 private:
  struct Transfer;

  HttpResponse Download(ValidatedTarget target);
  HttpResponse PerformHop(const ValidatedTarget& target);
  CURLcode PerformCurl(const ValidatedTarget& target, Transfer& transfer,
                       std::string& detail);
  static CURLcode PerformScripted(const std::string& url, Transfer& transfer);

  std::shared_ptr<std::mutex> InflightLock(const std::string& url);

  static size_t WriteBodyCallback(char* ptr, size_t size, size_t nmemb,
                                  void* userdata);
  static size_t WriteHeaderCallback(char* ptr, size_t size, size_t nmemb,
                                    void* userdata);

  DownloadCache& cache_;
  Options opts_;
  Gate gate_;

  std::mutex inflight_mutex_;
  std::unordered_map<std::string, std::weak_ptr<std::mutex>> inflight_;
};
