#include "SsrfGuard.hpp"
#include "FetchError.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cstring>
#include <initializer_list>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>

namespace {

struct V4Range {
  std::uint32_t net;
  int prefix;
};

constexpr std::uint32_t ip4(unsigned a, unsigned b, unsigned c, unsigned d) {
  return (a << 24) | (b << 16) | (c << 8) | d;
}

// Everything an outbound fetch must never reach.
const V4Range kBlockedV4[] = {
  {ip4(0, 0, 0, 0), 8},          // "this" network
  {ip4(10, 0, 0, 0), 8},         // RFC 1918
  {ip4(100, 64, 0, 0), 10},      // shared address space (CGNAT)
  {ip4(127, 0, 0, 0), 8},        // loopback
  {ip4(169, 254, 0, 0), 16},     // link-local, cloud metadata
  {ip4(172, 16, 0, 0), 12},      // RFC 1918
  {ip4(192, 0, 0, 0), 24},       // IETF protocol assignments
  {ip4(192, 0, 2, 0), 24},       // TEST-NET-1
  {ip4(192, 88, 99, 0), 24},     // 6to4 relay anycast
  {ip4(192, 168, 0, 0), 16},     // RFC 1918
  {ip4(198, 18, 0, 0), 15},      // benchmarking
  {ip4(198, 51, 100, 0), 24},    // TEST-NET-2
  {ip4(203, 0, 113, 0), 24},     // TEST-NET-3
  {ip4(224, 0, 0, 0), 4},        // multicast
  {ip4(240, 0, 0, 0), 4},        // reserved, broadcast
};

bool blocked_v4(std::uint32_t addr) {
  for (const auto& r : kBlockedV4) {
    std::uint32_t mask = r.prefix == 0 ? 0 : ~std::uint32_t{0} << (32 - r.prefix);
    if ((addr & mask) == (r.net & mask))
      return true;
  }
  return false;
}

std::uint32_t embedded_v4(const unsigned char* b) {
  return ip4(b[12], b[13], b[14], b[15]);
}

bool prefix_is(const unsigned char* b, std::initializer_list<unsigned char> p) {
  return std::equal(p.begin(), p.end(), b);
}

bool blocked_v6(const unsigned char* b) {
  static const unsigned char zero[16] = {0};

  // ::/128 unspecified, ::1/128 loopback
  if (std::memcmp(b, zero, 15) == 0 && (b[15] == 0 || b[15] == 1))
    return true;

  // ::ffff:a.b.c.d mapped, ::a.b.c.d compatible, 64:ff9b::a.b.c.d NAT64:
  // judge the embedded IPv4 address
  if (prefix_is(b, {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xff, 0xff}) ||
      prefix_is(b, {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0}) ||
      prefix_is(b, {0, 0x64, 0xff, 0x9b, 0, 0, 0, 0, 0, 0, 0, 0}))
    return blocked_v4(embedded_v4(b));

  // only global unicast 2000::/3 is reachable; ULA fc00::/7, link-local
  // fe80::/10, site-local fec0::/10, multicast ff00::/8 and the reserved
  // blocks all fall outside it
  if ((b[0] & 0xe0) != 0x20)
    return true;

  // 2001::/23 IETF protocol assignments (Teredo, ORCHID, benchmarking)
  if (b[0] == 0x20 && b[1] == 0x01 && (b[2] & 0xfe) == 0x00)
    return true;

  // 2001:db8::/32 documentation
  if (prefix_is(b, {0x20, 0x01, 0x0d, 0xb8}))
    return true;

  // 2002::/16 6to4: judge the IPv4 address in bits 16..47
  if (b[0] == 0x20 && b[1] == 0x02)
    return blocked_v4(ip4(b[2], b[3], b[4], b[5]));

  return false;
}

std::string normalize_host(std::string host) {
  std::transform(host.begin(), host.end(), host.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
    host = host.substr(1, host.size() - 2);
  while (!host.empty() && host.back() == '.')
    host.pop_back();
  return host;
}

}  // namespace

bool SsrfGuard::IsBlockedAddress(const std::string& address) {
  std::string text = address;
  // drop an IPv6 zone id ("fe80::1%eth0")
  if (auto pct = text.find('%'); pct != std::string::npos)
    text.erase(pct);

  in_addr v4{};
  if (::inet_pton(AF_INET, text.c_str(), &v4) == 1) {
    return blocked_v4(ntohl(v4.s_addr));
  }
  in6_addr v6{};
  if (::inet_pton(AF_INET6, text.c_str(), &v6) == 1) {
    return blocked_v6(v6.s6_addr);
  }
  // not an address we can reason about
  return true;
}

bool SsrfGuard::IsLocalhostLiteral(const std::string& hostname) {
  const std::string h = normalize_host(hostname);
  return h == "localhost" || h == "127.0.0.1" || h == "::1" || h == "0.0.0.0";
}

std::optional<std::vector<std::string>> SsrfGuard::ResolveAll(
  const std::string& hostname) {
  const std::string host = normalize_host(hostname);

  if (TestHooks::fake_dns) {
    auto it = TestHooks::fake_dns->find(host);
    if (it == TestHooks::fake_dns->end())
      return std::nullopt;
    return it->second;
  }

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  addrinfo* result = nullptr;
  int ret = ::getaddrinfo(host.c_str(), nullptr, &hints, &result);
  if (ret != 0) {
    logr::debug << "[SsrfGuard] getaddrinfo(" << host
                << ") failed: " << ::gai_strerror(ret);
    return std::nullopt;
  }

  std::vector<std::string> addresses;
  for (addrinfo* rp = result; rp != nullptr; rp = rp->ai_next) {
    char buf[INET6_ADDRSTRLEN] = {0};
    const void* src = nullptr;
    if (rp->ai_family == AF_INET) {
      src = &reinterpret_cast<sockaddr_in*>(rp->ai_addr)->sin_addr;
    } else if (rp->ai_family == AF_INET6) {
      src = &reinterpret_cast<sockaddr_in6*>(rp->ai_addr)->sin6_addr;
    } else {
      continue;
    }
    if (!::inet_ntop(rp->ai_family, src, buf, sizeof(buf)))
      continue;
    std::string addr{buf};
    if (std::find(addresses.begin(), addresses.end(), addr) == addresses.end())
      addresses.push_back(std::move(addr));
  }
  ::freeaddrinfo(result);
  return addresses;
}

ValidatedTarget SsrfGuard::Validate(const std::string& url_string) {
  URL url(url_string);

  const std::string scheme = url.GetScheme();
  if (scheme != "http" && scheme != "https") {
    throw BlockedURL(
      BlockedURL::Reason::Scheme,
      "Only HTTP and HTTPS URLs are allowed, got: '" + scheme + "'");
  }

  const std::string hostname = url.GetHostname();
  if (hostname.empty()) {
    throw BlockedURL(BlockedURL::Reason::NoHost,
                     "Could not extract hostname from URL: " + url_string);
  }

  if (IsLocalhostLiteral(hostname)) {
    throw BlockedURL(BlockedURL::Reason::Localhost,
                     "URLs targeting localhost are not allowed: " + url_string);
  }

  auto addresses = ResolveAll(hostname);
  if (!addresses || addresses->empty()) {
    throw BlockedURL(
      BlockedURL::Reason::Unresolvable,
      "URL host could not be resolved and is blocked: " + url_string);
  }

  IF_DEBUG {
    std::string joined;
    for (const auto& addr : *addresses)
      joined += (joined.empty() ? "" : ", ") + addr;
    logr::debug << "[SsrfGuard] " << hostname << " -> " << joined;
  }

  for (const auto& addr : *addresses) {
    if (IsBlockedAddress(addr)) {
      logr::warning << "[SsrfGuard] " << hostname << " resolves to blocked "
                    << addr;
      throw BlockedURL(
        BlockedURL::Reason::PrivateAddress,
        "URL resolves to a private/reserved IP address and is blocked: " +
          url_string);
    }
  }

  return ValidatedTarget{url, hostname, url.GetPort(), std::move(*addresses)};
}
