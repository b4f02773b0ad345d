#include "RemoteFetcher.hpp"
#include "FetchError.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>

namespace {

void GlobalInitOnce() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
      throw std::runtime_error("curl_global_init failed");
  });
}

// RAII for the easy handle and the CURLOPT_RESOLVE list.
struct CurlEasy {
  CURL* h{curl_easy_init()};
  ~CurlEasy() {
    if (h)
      curl_easy_cleanup(h);
  }
  CurlEasy() = default;
  CurlEasy(const CurlEasy&) = delete;
  CurlEasy& operator=(const CurlEasy&) = delete;
};

struct CurlList {
  curl_slist* l{nullptr};
  ~CurlList() {
    if (l)
      curl_slist_free_all(l);
  }
  CurlList() = default;
  CurlList(const CurlList&) = delete;
  CurlList& operator=(const CurlList&) = delete;
};

}  // namespace

detail::CurlTimeouts detail::TimeoutsFor(std::chrono::seconds timeout) {
  CurlTimeouts t;
  t.connect_timeout_ms = static_cast<long>(timeout.count() * 1000);
  t.low_speed_limit = 1L;
  t.low_speed_time = static_cast<long>(timeout.count());
  return t;
}

// Creates the socket for every connection libcurl makes, refusing blocked
// addresses no matter how they were arrived at.
curl_socket_t detail::OpenSocketCallback(void* clientp,
                                         curlsocktype /*purpose*/,
                                         struct curl_sockaddr* address) {
  auto* refused = static_cast<std::optional<std::string>*>(clientp);

  char buf[INET6_ADDRSTRLEN] = {0};
  const void* src = nullptr;
  if (address->family == AF_INET) {
    src = &reinterpret_cast<sockaddr_in*>(&address->addr)->sin_addr;
  } else if (address->family == AF_INET6) {
    src = &reinterpret_cast<sockaddr_in6*>(&address->addr)->sin6_addr;
  }
  if (!src || !::inet_ntop(address->family, src, buf, sizeof(buf))) {
    *refused = "(non-IP address)";
    return CURL_SOCKET_BAD;
  }
  if (SsrfGuard::IsBlockedAddress(buf)) {
    *refused = buf;
    return CURL_SOCKET_BAD;
  }
  return ::socket(address->family, address->socktype, address->protocol);
}

std::string detail::ResolveEntry(const ValidatedTarget& target) {
  std::string entry =
    target.url.GetHost() + ":" + std::to_string(*target.port) + ":";
  for (size_t i = 0; i < target.addresses.size(); ++i) {
    const auto& addr = target.addresses[i];
    if (i > 0)
      entry += ',';
    if (addr.find(':') != std::string::npos)
      entry += "[" + addr + "]";
    else
      entry += addr;
  }
  return entry;
}

struct RemoteFetcher::Transfer {
  HttpResponse response;
  std::uint64_t max_bytes{0};
  std::uint64_t received{0};
  bool too_large{false};
  // redirect or error status: the body is not wanted
  bool stopped_after_headers{false};
  std::optional<std::string> refused_address;
};

RemoteFetcher::RemoteFetcher(DownloadCache& cache, Options opts)
    : cache_{cache}, opts_{std::move(opts)}, gate_{opts_.max_concurrent} {
  GlobalInitOnce();
}

RemoteFetcher::RemoteFetcher(DownloadCache& cache, const Config& conf)
    : RemoteFetcher(cache, Options{conf.GetHttpTimeout(),
                                   conf.GetMaxDownloadBytes(),
                                   conf.GetMaxRedirects(),
                                   conf.GetMaxConcurrentFetches(),
                                   conf.GetUserAgent()}) {
}

bool RemoteFetcher::IsUrl(const std::string& source) {
  return source.rfind("http://", 0) == 0 || source.rfind("https://", 0) == 0;
}

std::filesystem::path RemoteFetcher::Fetch(const std::string& url,
                                           bool force_refresh) {
  try {
    ValidatedTarget target = SsrfGuard::Validate(url);

    if (!force_refresh) {
      if (auto hit = cache_.Lookup(url)) {
        logr::debug << "[RemoteFetcher] cache hit: " << url;
        return *hit;
      }
    }

    // one download per URL at a time; whoever waited finds the result cached
    auto lock = InflightLock(url);
    std::lock_guard<std::mutex> in_flight(*lock);
    if (!force_refresh) {
      if (auto hit = cache_.Lookup(url)) {
        logr::debug << "[RemoteFetcher] fetched concurrently: " << url;
        return *hit;
      }
    }

    logr::info << "[RemoteFetcher] downloading " << url;
    HttpResponse response = Download(std::move(target));
    auto stored = cache_.Store(url, response.GetBody());
    logr::info << "[RemoteFetcher] " << url << " -> " << stored.path << " ("
               << stored.size << " bytes)";
    return stored.path;
  } catch (const FetchError& e) {
    logr::warning << "[RemoteFetcher] " << url << ": " << e.what();
    throw;
  }
}

std::future<std::filesystem::path> RemoteFetcher::FetchAsync(
  const std::string& url, bool force_refresh) {
  return std::async(std::launch::async, [this, url, force_refresh] {
    Gate::Permit permit(gate_);
    return Fetch(url, force_refresh);
  });
}

HttpResponse RemoteFetcher::Download(ValidatedTarget target) {
  for (long hop = 0; hop < opts_.max_redirects; ++hop) {
    logr::debug << "[RemoteFetcher] hop " << hop << ": " << target.url;
    HttpResponse response = PerformHop(target);
    const long status = response.GetStatusCode();

    if (response.IsRedirect()) {
      auto location = response.GetHeader("Location");
      if (!location || location->empty()) {
        throw TransportError(
          "Redirect with no target URL from " + target.url.ToString(), status);
      }
      const std::string next = target.url.Resolve(*location).ToString();
      logr::debug << "[RemoteFetcher] " << status << " redirect -> " << next;
      target = SsrfGuard::Validate(next);
      continue;
    }

    if (!response.IsOkay()) {
      throw TransportError("HTTP " + std::to_string(status) + " fetching " +
                             target.url.ToString(),
                           status);
    }

    if (!response.LooksLikePdf()) {
      throw NotAPDF("URL does not appear to be a PDF: " +
                    target.url.ToString());
    }
    return response;
  }
  throw TooManyRedirects("Too many redirects (max " +
                         std::to_string(opts_.max_redirects) + ")");
}

HttpResponse RemoteFetcher::PerformHop(const ValidatedTarget& target) {
  Transfer transfer;
  transfer.max_bytes = opts_.max_bytes;
  const std::string url = target.url.ToString();

  std::string detail;
  CURLcode code = TestHooks::enabled ? PerformScripted(url, transfer)
                                     : PerformCurl(target, transfer, detail);

  if (transfer.refused_address) {
    throw BlockedURL(BlockedURL::Reason::PrivateAddress,
                     "Connection to blocked address " +
                       *transfer.refused_address + " refused: " + url);
  }

  if (transfer.too_large) {
    auto declared = transfer.response.GetContentLength();
    if (transfer.received == 0 && declared && *declared > opts_.max_bytes) {
      throw TooLarge("PDF file too large: " + std::to_string(*declared) +
                     " bytes (max " + std::to_string(opts_.max_bytes) +
                     " bytes)");
    }
    throw TooLarge("PDF download exceeded maximum size of " +
                   std::to_string(opts_.max_bytes) + " bytes");
  }

  if (code != CURLE_OK &&
      !(code == CURLE_WRITE_ERROR && transfer.stopped_after_headers)) {
    if (detail.empty())
      detail = curl_easy_strerror(code);
    if (code == CURLE_OPERATION_TIMEDOUT) {
      throw TransportError("Timed out after " +
                           std::to_string(opts_.timeout.count()) +
                           "s fetching " + url + ": " + detail);
    }
    throw TransportError("Transfer of " + url + " failed: " + detail);
  }

  if (transfer.response.GetStatusCode() == 0) {
    throw TransportError("No HTTP response from " + url);
  }
  return std::move(transfer.response);
}

CURLcode RemoteFetcher::PerformCurl(const ValidatedTarget& target,
                                    Transfer& transfer, std::string& detail) {
  if (!target.port) {
    detail = "invalid port";
    return CURLE_URL_MALFORMAT;
  }

  CurlEasy easy;
  CURL* curl = easy.h;
  if (!curl) {
    detail = "failed to init CURL";
    return CURLE_FAILED_INIT;
  }

  const std::string url = target.url.ToString();
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);  // thread-safe timeouts on *nix
  const auto timeouts = detail::TimeoutsFor(opts_.timeout);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                   timeouts.connect_timeout_ms);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeouts.total_timeout_ms);
  curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, timeouts.low_speed_time);
  curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, timeouts.low_speed_limit);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, opts_.user_agent.c_str());
  curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(kChunkSize));

  // redirects are ours to follow, one validated hop at a time
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);

#if LIBCURL_VERSION_NUM >= 0x075500
  curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
#else
  curl_easy_setopt(curl, CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
#endif

  // a proxy would make the connection target somebody else's decision
  curl_easy_setopt(curl, CURLOPT_PROXY, "");

  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

  CurlList resolve;
  if (!target.url.HostIsIPv4() && !target.url.HostIsIPv6()) {
    const std::string entry = detail::ResolveEntry(target);
    resolve.l = curl_slist_append(nullptr, entry.c_str());
    curl_easy_setopt(curl, CURLOPT_RESOLVE, resolve.l);
  }
  curl_easy_setopt(curl, CURLOPT_OPENSOCKETFUNCTION,
                   detail::OpenSocketCallback);
  curl_easy_setopt(curl, CURLOPT_OPENSOCKETDATA, &transfer.refused_address);

  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteBodyCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, WriteHeaderCallback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &transfer);

  char errbuf[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);

  CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK && errbuf[0])
    detail = errbuf;
  return code;
}

CURLcode RemoteFetcher::PerformScripted(const std::string& url,
                                        Transfer& transfer) {
  TestHooks::requested_urls.push_back(url);
  if (TestHooks::responses.empty()) {
    return CURLE_COULDNT_CONNECT;
  }
  auto scripted = std::move(TestHooks::responses.front());
  TestHooks::responses.pop_front();

  auto feed_header = [&transfer](std::string line) {
    line += "\r\n";
    return WriteHeaderCallback(line.data(), 1, line.size(), &transfer) ==
           line.size();
  };

  if (!feed_header("HTTP/1.1 " + std::to_string(scripted.status) + " Scripted"))
    return CURLE_WRITE_ERROR;
  for (const auto& h : scripted.headers) {
    if (!feed_header(h))
      return CURLE_WRITE_ERROR;
  }
  if (!feed_header(""))
    return CURLE_WRITE_ERROR;

  std::string& body = scripted.body;
  for (size_t off = 0; off < body.size(); off += kChunkSize) {
    const size_t len = std::min(kChunkSize, body.size() - off);
    if (WriteBodyCallback(body.data() + off, 1, len, &transfer) != len)
      return CURLE_WRITE_ERROR;
  }
  return scripted.curl_code.value_or(CURLE_OK);
}

std::shared_ptr<std::mutex> RemoteFetcher::InflightLock(
  const std::string& url) {
  std::lock_guard<std::mutex> lk(inflight_mutex_);
  for (auto it = inflight_.begin(); it != inflight_.end();) {
    if (it->second.expired())
      it = inflight_.erase(it);
    else
      ++it;
  }
  auto& slot = inflight_[url];
  if (auto existing = slot.lock())
    return existing;
  auto fresh = std::make_shared<std::mutex>();
  slot = fresh;
  return fresh;
}

size_t RemoteFetcher::WriteHeaderCallback(char* ptr, size_t size,
                                          size_t nmemb, void* userdata) {
  auto* transfer = static_cast<Transfer*>(userdata);
  const size_t n = size * nmemb;
  transfer->response.AddHeaderLine(std::string(ptr, n));

  if (!transfer->response.HeadersComplete())
    return n;

  if (!transfer->response.IsOkay()) {
    transfer->stopped_after_headers = true;
    return 0;
  }
  if (auto declared = transfer->response.GetContentLength();
      declared && *declared > transfer->max_bytes) {
    transfer->too_large = true;
    return 0;
  }
  return n;
}

size_t RemoteFetcher::WriteBodyCallback(char* ptr, size_t size, size_t nmemb,
                                        void* userdata) {
  auto* transfer = static_cast<Transfer*>(userdata);
  const size_t n = size * nmemb;

  if (!transfer->response.IsOkay()) {
    transfer->stopped_after_headers = true;
    return 0;
  }
  // the declared length may be absent or wrong; count what actually arrives
  if (transfer->received + n > transfer->max_bytes) {
    transfer->too_large = true;
    return 0;
  }
  transfer->received += n;
  transfer->response.AppendBody(ptr, n);
  return n;
}
