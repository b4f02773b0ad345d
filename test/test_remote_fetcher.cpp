#include <gtest/gtest.h>
#include "DownloadCache.hpp"
#include "FetchError.hpp"
#include "RemoteFetcher.hpp"
#include "SsrfGuard.hpp"

#include <arpa/inet.h>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace fs = std::filesystem;

using Scripted = RemoteFetcher::TestHooks::ScriptedResponse;

static std::string ReadFile(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
}

static Scripted Pdf(const std::string& body = "%PDF-1.4\nhello\n%%EOF") {
  return Scripted{200, {"Content-Type: application/pdf"}, body};
}

static Scripted Redirect(const std::string& location, long status = 302) {
  return Scripted{status, {"Location: " + location}, ""};
}

class RemoteFetcherTest : public ::testing::Test {
 protected:
  fs::path tmpdir;
  std::unique_ptr<DownloadCache> cache;

  void SetUp() override {
    tmpdir = fs::temp_directory_path() / "remote_fetcher_test";
    fs::remove_all(tmpdir);
    cache = std::make_unique<DownloadCache>(tmpdir);

    SsrfGuard::TestHooks::fake_dns =
      std::unordered_map<std::string, std::vector<std::string>>{
        {"example.com", {"93.184.216.34"}},
        {"cdn.example.org", {"151.101.1.1"}},
        {"internal.example.com", {"10.1.2.3"}},
      };
    RemoteFetcher::TestHooks::Reset();
    RemoteFetcher::TestHooks::enabled = true;
  }

  void TearDown() override {
    RemoteFetcher::TestHooks::Reset();
    SsrfGuard::TestHooks::fake_dns.reset();
    cache.reset();
    fs::remove_all(tmpdir);
  }

  static RemoteFetcher::Options SmallLimits() {
    RemoteFetcher::Options opts;
    opts.max_bytes = 1024;
    return opts;
  }

  static void Script(std::vector<Scripted> responses) {
    for (auto& r : responses)
      RemoteFetcher::TestHooks::responses.push_back(std::move(r));
  }

  static const std::vector<std::string>& Requested() {
    return RemoteFetcher::TestHooks::requested_urls;
  }
};

TEST_F(RemoteFetcherTest, DownloadsAndCachesPdf) {
  SCOPED_TRACE("A PDF served with 200 lands in the download cache.");
  RecordProperty("description",
                 "Fetch returns the cache path for the URL and the file holds "
                 "exactly the response body.");

  const std::string url = "https://example.com/papers/report.pdf";
  Script({Pdf("%PDF-1.4 report")});

  RemoteFetcher fetcher(*cache, RemoteFetcher::Options{});
  auto path = fetcher.Fetch(url);

  EXPECT_EQ(path, cache->PathFor(url));
  EXPECT_EQ(path.filename().string(),
            DownloadCache::FilenameFor(url));
  EXPECT_EQ(ReadFile(path), "%PDF-1.4 report");
  ASSERT_EQ(Requested().size(), 1u);
  EXPECT_EQ(Requested()[0], url);
}

TEST_F(RemoteFetcherTest, RepeatFetchIsServedFromCache) {
  SCOPED_TRACE("A second fetch of the same URL makes no transfer.");
  RecordProperty("description",
                 "Only one scripted transfer happens for two Fetch calls.");

  const std::string url = "https://example.com/a.pdf";
  Script({Pdf()});

  RemoteFetcher fetcher(*cache, RemoteFetcher::Options{});
  auto first = fetcher.Fetch(url);
  auto second = fetcher.Fetch(url);

  EXPECT_EQ(first, second);
  EXPECT_EQ(Requested().size(), 1u);
}

TEST_F(RemoteFetcherTest, CacheOnDiskSurvivesNewFetcher) {
  SCOPED_TRACE("Downloads are found again by a fresh cache and fetcher.");
  RecordProperty("description",
                 "A new DownloadCache over the same directory serves the "
                 "earlier download without a transfer.");

  const std::string url = "https://example.com/a.pdf";
  Script({Pdf()});
  {
    RemoteFetcher fetcher(*cache, RemoteFetcher::Options{});
    fetcher.Fetch(url);
  }

  DownloadCache reopened(tmpdir);
  RemoteFetcher fetcher(reopened, RemoteFetcher::Options{});
  EXPECT_EQ(fetcher.Fetch(url), reopened.PathFor(url));
  EXPECT_EQ(Requested().size(), 1u);
}

TEST_F(RemoteFetcherTest, ForceRefreshDownloadsAgain) {
  SCOPED_TRACE("force_refresh bypasses and replaces the cached copy.");
  RecordProperty("description",
                 "Two transfers happen and the file holds the second body.");

  const std::string url = "https://example.com/a.pdf";
  Script({Pdf("%PDF old"), Pdf("%PDF new")});

  RemoteFetcher fetcher(*cache, RemoteFetcher::Options{});
  fetcher.Fetch(url);
  auto path = fetcher.Fetch(url, true);

  EXPECT_EQ(Requested().size(), 2u);
  EXPECT_EQ(ReadFile(path), "%PDF new");
}

TEST_F(RemoteFetcherTest, FollowsRedirectToPublicHost) {
  SCOPED_TRACE("Relative and cross-host redirects are followed.");
  RecordProperty("description",
                 "A relative Location resolves against the current URL, then "
                 "a 301 to another public host is followed; the result is "
                 "cached under the original URL.");

  const std::string url = "https://example.com/start";
  Script({Redirect("/files/doc.pdf"),
          Redirect("https://cdn.example.org/doc.pdf", 301), Pdf("%PDF cdn")});

  RemoteFetcher fetcher(*cache, RemoteFetcher::Options{});
  auto path = fetcher.Fetch(url);

  ASSERT_EQ(Requested().size(), 3u);
  EXPECT_EQ(Requested()[0], url);
  EXPECT_EQ(Requested()[1], "https://example.com/files/doc.pdf");
  EXPECT_EQ(Requested()[2], "https://cdn.example.org/doc.pdf");
  EXPECT_EQ(path, cache->PathFor(url));
  EXPECT_EQ(ReadFile(path), "%PDF cdn");
}

TEST_F(RemoteFetcherTest, RedirectToMetadataAddressIsBlocked) {
  SCOPED_TRACE("Every redirect hop is validated before it is requested.");
  RecordProperty("description",
                 "A redirect to 169.254.169.254 raises BlockedURL and the "
                 "metadata endpoint is never requested; nothing is cached.");

  const std::string url = "https://example.com/a.pdf";
  Script({Redirect("http://169.254.169.254/latest/meta-data/")});

  RemoteFetcher fetcher(*cache, RemoteFetcher::Options{});
  try {
    fetcher.Fetch(url);
    FAIL() << "expected BlockedURL";
  } catch (const BlockedURL& e) {
    EXPECT_EQ(e.GetReason(), BlockedURL::Reason::PrivateAddress);
  }

  EXPECT_EQ(Requested().size(), 1u);
  EXPECT_FALSE(cache->Lookup(url).has_value());
}

TEST_F(RemoteFetcherTest, RedirectToPrivateNameOrLocalhostIsBlocked) {
  SCOPED_TRACE("Redirects to private names and localhost are refused.");
  RecordProperty("description",
                 "A hostname resolving to 10/8 and a localhost literal are "
                 "both blocked mid-chain.");

  RemoteFetcher fetcher(*cache, RemoteFetcher::Options{});

  Script({Redirect("http://internal.example.com/x.pdf")});
  EXPECT_THROW(fetcher.Fetch("https://example.com/one.pdf"), BlockedURL);

  Script({Redirect("http://localhost:8080/admin")});
  try {
    fetcher.Fetch("https://example.com/two.pdf");
    FAIL() << "expected BlockedURL";
  } catch (const BlockedURL& e) {
    EXPECT_EQ(e.GetReason(), BlockedURL::Reason::Localhost);
  }
  EXPECT_EQ(Requested().size(), 2u);
}

TEST_F(RemoteFetcherTest, BlockedUrlMakesNoRequest) {
  SCOPED_TRACE("Validation happens before any transfer.");
  RecordProperty("description",
                 "Private, localhost and non-http URLs throw BlockedURL "
                 "without a single request.");

  RemoteFetcher fetcher(*cache, RemoteFetcher::Options{});
  EXPECT_THROW(fetcher.Fetch("http://10.0.0.1/a.pdf"), BlockedURL);
  EXPECT_THROW(fetcher.Fetch("http://localhost/a.pdf"), BlockedURL);
  EXPECT_THROW(fetcher.Fetch("file:///etc/passwd"), BlockedURL);
  EXPECT_THROW(fetcher.Fetch("https://unknown.example.net/a.pdf"), BlockedURL);
  EXPECT_TRUE(Requested().empty());
}

TEST_F(RemoteFetcherTest, TooManyRedirects) {
  SCOPED_TRACE("Redirect chains are capped.");
  RecordProperty("description",
                 "With max_redirects 10 an endless chain stops after 10 "
                 "requests with TooManyRedirects.");

  std::vector<Scripted> loop;
  for (int i = 0; i < 20; ++i)
    loop.push_back(Redirect("/loop/" + std::to_string(i)));
  Script(std::move(loop));

  RemoteFetcher fetcher(*cache, RemoteFetcher::Options{});
  try {
    fetcher.Fetch("https://example.com/loop");
    FAIL() << "expected TooManyRedirects";
  } catch (const TooManyRedirects& e) {
    EXPECT_EQ(std::string(e.what()), "Too many redirects (max 10)");
  }
  EXPECT_EQ(Requested().size(), 10u);
}

TEST_F(RemoteFetcherTest, RedirectWithoutLocation) {
  SCOPED_TRACE("A redirect with no target is a transport failure.");
  RecordProperty("description",
                 "A 302 lacking Location raises TransportError carrying 302.");

  Script({Scripted{302, {}, ""}});
  RemoteFetcher fetcher(*cache, RemoteFetcher::Options{});
  try {
    fetcher.Fetch("https://example.com/a.pdf");
    FAIL() << "expected TransportError";
  } catch (const TransportError& e) {
    EXPECT_EQ(e.GetHttpStatus(), std::optional<long>(302));
  }
}

TEST_F(RemoteFetcherTest, DeclaredLengthTooLarge) {
  SCOPED_TRACE("An oversized Content-Length is refused before the body.");
  RecordProperty("description",
                 "Content-Length 5000 against a 1024 byte cap raises "
                 "TooLarge naming both sizes; nothing is written.");

  Script({Scripted{200,
                   {"Content-Type: application/pdf", "Content-Length: 5000"},
                   std::string(5000, 'x')}});

  RemoteFetcher fetcher(*cache, SmallLimits());
  try {
    fetcher.Fetch("https://example.com/big.pdf");
    FAIL() << "expected TooLarge";
  } catch (const TooLarge& e) {
    EXPECT_EQ(std::string(e.what()),
              "PDF file too large: 5000 bytes (max 1024 bytes)");
  }
  EXPECT_EQ(cache->GetStats().file_count, 0u);
}

TEST_F(RemoteFetcherTest, StreamedBodyTooLarge) {
  SCOPED_TRACE("The cap holds when no length is declared.");
  RecordProperty("description",
                 "A 3000 byte body without Content-Length is aborted with "
                 "TooLarge and leaves no file behind.");

  Script({Scripted{200, {"Content-Type: application/pdf"},
                   "%PDF" + std::string(2996, 'x')}});

  RemoteFetcher fetcher(*cache, SmallLimits());
  try {
    fetcher.Fetch("https://example.com/big.pdf");
    FAIL() << "expected TooLarge";
  } catch (const TooLarge& e) {
    EXPECT_EQ(std::string(e.what()),
              "PDF download exceeded maximum size of 1024 bytes");
  }
  EXPECT_EQ(cache->GetStats().file_count, 0u);
  EXPECT_TRUE(fs::is_empty(tmpdir));
}

TEST_F(RemoteFetcherTest, UnderstatedLengthStillCapped) {
  SCOPED_TRACE("A lying Content-Length does not lift the cap.");
  RecordProperty("description",
                 "Content-Length 10 with a 4000 byte body raises TooLarge.");

  Script({Scripted{200,
                   {"Content-Type: application/pdf", "Content-Length: 10"},
                   "%PDF" + std::string(3996, 'x')}});

  RemoteFetcher fetcher(*cache, SmallLimits());
  EXPECT_THROW(fetcher.Fetch("https://example.com/liar.pdf"), TooLarge);
}

TEST_F(RemoteFetcherTest, BodyAtTheCapIsAccepted) {
  SCOPED_TRACE("The cap is inclusive.");
  RecordProperty("description",
                 "A body of exactly max_bytes is stored.");

  const std::string body = "%PDF" + std::string(1020, 'x');
  Script({Scripted{200, {"Content-Type: application/pdf"}, body}});

  RemoteFetcher fetcher(*cache, SmallLimits());
  auto path = fetcher.Fetch("https://example.com/exact.pdf");
  EXPECT_EQ(fs::file_size(path), 1024u);
}

TEST_F(RemoteFetcherTest, NonPdfIsRejected) {
  SCOPED_TRACE("HTML served at a PDF URL is not cached.");
  RecordProperty("description",
                 "text/html without the %PDF magic raises NotAPDF.");

  Script({Scripted{200, {"Content-Type: text/html"}, "<html>login</html>"}});

  RemoteFetcher fetcher(*cache, RemoteFetcher::Options{});
  EXPECT_THROW(fetcher.Fetch("https://example.com/a.pdf"), NotAPDF);
  EXPECT_EQ(cache->GetStats().file_count, 0u);
}

TEST_F(RemoteFetcherTest, MagicBytesAreEnough) {
  SCOPED_TRACE("A generic content type is fine when the body is a PDF.");
  RecordProperty("description",
                 "application/octet-stream with a %PDF body is accepted, as "
                 "is a PDF content type in any case.");

  Script({Scripted{200, {"Content-Type: application/octet-stream"},
                   "%PDF-1.7 data"},
          Scripted{200, {"content-type: Application/PDF"}, "no magic"}});

  RemoteFetcher fetcher(*cache, RemoteFetcher::Options{});
  EXPECT_NO_THROW(fetcher.Fetch("https://example.com/download?id=1"));
  EXPECT_NO_THROW(fetcher.Fetch("https://example.com/download?id=2"));
}

TEST_F(RemoteFetcherTest, HttpErrorStatus) {
  SCOPED_TRACE("Non-2xx final responses fail with their status.");
  RecordProperty("description",
                 "A 404 raises TransportError with GetHttpStatus() == 404.");

  Script({Scripted{404, {"Content-Type: text/html"}, "not found"}});

  RemoteFetcher fetcher(*cache, RemoteFetcher::Options{});
  try {
    fetcher.Fetch("https://example.com/missing.pdf");
    FAIL() << "expected TransportError";
  } catch (const TransportError& e) {
    EXPECT_EQ(e.GetHttpStatus(), std::optional<long>(404));
  }
}

TEST_F(RemoteFetcherTest, TimeoutIsTransportError) {
  SCOPED_TRACE("Timeouts surface as transport failures.");
  RecordProperty("description",
                 "A transfer ending in CURLE_OPERATION_TIMEDOUT raises "
                 "TransportError mentioning the timeout; nothing is cached.");

  Scripted slow = Pdf();
  slow.curl_code = CURLE_OPERATION_TIMEDOUT;
  Script({slow});

  RemoteFetcher fetcher(*cache, RemoteFetcher::Options{});
  try {
    fetcher.Fetch("https://example.com/slow.pdf");
    FAIL() << "expected TransportError";
  } catch (const TransportError& e) {
    EXPECT_NE(std::string(e.what()).find("Timed out after 60s"),
              std::string::npos);
    EXPECT_FALSE(e.GetHttpStatus().has_value());
  }
  EXPECT_EQ(cache->GetStats().file_count, 0u);
}

TEST_F(RemoteFetcherTest, ConnectionFailure) {
  SCOPED_TRACE("A failed connection is a transport failure.");
  RecordProperty("description",
                 "With no scripted response the transfer cannot connect and "
                 "TransportError is raised.");

  RemoteFetcher fetcher(*cache, RemoteFetcher::Options{});
  EXPECT_THROW(fetcher.Fetch("https://example.com/a.pdf"), TransportError);
}

TEST_F(RemoteFetcherTest, ConcurrentFetchesOfOneUrlDownloadOnce) {
  SCOPED_TRACE("Same-URL fetches in flight collapse into one download.");
  RecordProperty("description",
                 "Four FetchAsync calls for one URL all get the same path "
                 "from a single transfer.");

  const std::string url = "https://example.com/shared.pdf";
  Script({Pdf()});

  RemoteFetcher::Options opts;
  opts.max_concurrent = 4;
  RemoteFetcher fetcher(*cache, opts);

  std::vector<std::future<fs::path>> futures;
  for (int i = 0; i < 4; ++i)
    futures.push_back(fetcher.FetchAsync(url));
  for (auto& f : futures)
    EXPECT_EQ(f.get(), cache->PathFor(url));

  EXPECT_EQ(Requested().size(), 1u);
}

TEST_F(RemoteFetcherTest, VeryLongUrlIsFetched) {
  SCOPED_TRACE("A long URL is handled like any other.");
  RecordProperty("description",
                 "A URL with a 100000 character query validates, downloads "
                 "and is cached under a name of the usual length.");

  const std::string url =
    "https://example.com/doc.pdf?q=" + std::string(100000, 'a');
  Script({Pdf()});

  RemoteFetcher fetcher(*cache, RemoteFetcher::Options{});
  auto path = fetcher.Fetch(url);

  ASSERT_EQ(Requested().size(), 1u);
  EXPECT_EQ(Requested()[0], url);
  EXPECT_EQ(path, cache->PathFor(url));
  EXPECT_LT(path.filename().string().size(), 64u);
}

TEST_F(RemoteFetcherTest, VeryLongLocationIsFollowed) {
  SCOPED_TRACE("A redirect target of any length is resolved and validated.");
  RecordProperty("description",
                 "A 302 whose Location is 100000 characters long is "
                 "resolved, checked and followed; a long absolute Location "
                 "to a private host is still blocked.");

  const std::string tail(100000, 'b');
  Script({Redirect("/files/" + tail + "?x=" + tail), Pdf("%PDF long")});

  RemoteFetcher fetcher(*cache, RemoteFetcher::Options{});
  auto path = fetcher.Fetch("https://example.com/start");

  ASSERT_EQ(Requested().size(), 2u);
  EXPECT_EQ(Requested()[1], "https://example.com/files/" + tail + "?x=" + tail);
  EXPECT_EQ(ReadFile(path), "%PDF long");

  RemoteFetcher::TestHooks::requested_urls.clear();
  Script({Redirect("http://internal.example.com/" + tail)});
  try {
    fetcher.Fetch("https://example.com/again");
    FAIL() << "expected BlockedURL";
  } catch (const BlockedURL& e) {
    EXPECT_EQ(e.GetReason(), BlockedURL::Reason::PrivateAddress);
  }
  EXPECT_EQ(Requested().size(), 1u);
}

TEST(RemoteFetcherStatic, IsUrl) {
  SCOPED_TRACE("Classifies sources by prefix only.");
  RecordProperty("description",
                 "http:// and https:// prefixes are URLs; paths and other "
                 "schemes are not.");

  EXPECT_TRUE(RemoteFetcher::IsUrl("http://example.com/a.pdf"));
  EXPECT_TRUE(RemoteFetcher::IsUrl("https://example.com/a.pdf"));
  EXPECT_FALSE(RemoteFetcher::IsUrl("/tmp/a.pdf"));
  EXPECT_FALSE(RemoteFetcher::IsUrl("ftp://example.com/a.pdf"));
  EXPECT_FALSE(RemoteFetcher::IsUrl("HTTP://example.com/a.pdf"));
}

namespace {

// libcurl hands the open-socket hook a curl_sockaddr with room for a
// sockaddr_in6 behind the header; this mirrors that layout.
struct SocketAddress {
  curl_sockaddr head;
  sockaddr_storage room;
};

curl_sockaddr* MakeAddress(SocketAddress& buf, const std::string& ip) {
  std::memset(&buf, 0, sizeof(buf));
  buf.head.socktype = SOCK_STREAM;
  buf.head.protocol = IPPROTO_TCP;
  char* addr = reinterpret_cast<char*>(&buf) + offsetof(curl_sockaddr, addr);

  if (ip.find(':') == std::string::npos) {
    sockaddr_in sin{};
    sin.sin_family = AF_INET;
    sin.sin_port = htons(443);
    EXPECT_EQ(::inet_pton(AF_INET, ip.c_str(), &sin.sin_addr), 1) << ip;
    buf.head.family = AF_INET;
    buf.head.addrlen = sizeof(sin);
    std::memcpy(addr, &sin, sizeof(sin));
  } else {
    sockaddr_in6 sin6{};
    sin6.sin6_family = AF_INET6;
    sin6.sin6_port = htons(443);
    EXPECT_EQ(::inet_pton(AF_INET6, ip.c_str(), &sin6.sin6_addr), 1) << ip;
    buf.head.family = AF_INET6;
    buf.head.addrlen = sizeof(sin6);
    std::memcpy(addr, &sin6, sizeof(sin6));
  }
  return &buf.head;
}

}  // namespace

TEST(RemoteFetcherCurl, ResolveEntryPinsEveryAddress) {
  SCOPED_TRACE("The CURLOPT_RESOLVE entry lists exactly the checked answers.");
  RecordProperty("description",
                 "A mixed IPv4/IPv6 answer becomes host:port:v4,[v6], and an "
                 "explicit port is carried through.");

  ValidatedTarget target{URL("https://example.com/doc.pdf"), "example.com",
                         443, {"1.2.3.4", "2606:4700::1"}};
  EXPECT_EQ(detail::ResolveEntry(target),
            "example.com:443:1.2.3.4,[2606:4700::1]");

  ValidatedTarget ported{URL("http://example.com:8080/doc.pdf"),
                         "example.com", 8080, {"93.184.216.34"}};
  EXPECT_EQ(detail::ResolveEntry(ported), "example.com:8080:93.184.216.34");
}

TEST(RemoteFetcherCurl, OpenSocketRefusesBlockedAddresses) {
  SCOPED_TRACE("Connections to blocked addresses never get a socket.");
  RecordProperty("description",
                 "169.254.169.254, 10.0.0.1 and ::ffff:127.0.0.1 yield "
                 "CURL_SOCKET_BAD and the refused address is recorded.");

  for (const std::string ip :
       {"169.254.169.254", "10.0.0.1", "::ffff:127.0.0.1"}) {
    SCOPED_TRACE(ip);
    SocketAddress buf;
    std::optional<std::string> refused;
    EXPECT_EQ(detail::OpenSocketCallback(&refused, CURLSOCKTYPE_IPCXN,
                                         MakeAddress(buf, ip)),
              CURL_SOCKET_BAD);
    ASSERT_TRUE(refused.has_value());
    EXPECT_EQ(*refused, ip);
  }
}

TEST(RemoteFetcherCurl, OpenSocketRefusesNonIpFamilies) {
  SCOPED_TRACE("Only IPv4 and IPv6 connections are allowed.");
  RecordProperty("description",
                 "An AF_UNIX address is refused as a non-IP address.");

  SocketAddress buf;
  std::memset(&buf, 0, sizeof(buf));
  buf.head.family = AF_UNIX;
  buf.head.socktype = SOCK_STREAM;
  buf.head.addrlen = sizeof(sockaddr_un);

  std::optional<std::string> refused;
  EXPECT_EQ(detail::OpenSocketCallback(&refused, CURLSOCKTYPE_IPCXN, &buf.head),
            CURL_SOCKET_BAD);
  EXPECT_EQ(refused, std::optional<std::string>("(non-IP address)"));
}

TEST(RemoteFetcherCurl, OpenSocketAllowsPublicAddress) {
  SCOPED_TRACE("Public addresses get a real socket.");
  RecordProperty("description",
                 "93.184.216.34 yields a usable descriptor and nothing is "
                 "recorded as refused.");

  SocketAddress buf;
  std::optional<std::string> refused;
  curl_socket_t sock = detail::OpenSocketCallback(
    &refused, CURLSOCKTYPE_IPCXN, MakeAddress(buf, "93.184.216.34"));
  EXPECT_NE(sock, CURL_SOCKET_BAD);
  EXPECT_FALSE(refused.has_value());
  if (sock != CURL_SOCKET_BAD)
    ::close(sock);
}

TEST(RemoteFetcherCurl, TimeoutBoundsIdleTimeNotTotalTime) {
  SCOPED_TRACE("A slow but live transfer is not cut off.");
  RecordProperty("description",
                 "The configured timeout becomes the connect timeout and the "
                 "low-speed window; the total transfer time is uncapped.");

  auto t = detail::TimeoutsFor(std::chrono::seconds(60));
  EXPECT_EQ(t.connect_timeout_ms, 60000L);
  EXPECT_EQ(t.low_speed_limit, 1L);
  EXPECT_EQ(t.low_speed_time, 60L);
  EXPECT_EQ(t.total_timeout_ms, 0L);

  EXPECT_EQ(detail::TimeoutsFor(std::chrono::seconds(5)).low_speed_time, 5L);
}
