#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "URL.hpp"

// A URL that passed validation, with the addresses it resolved to. The
// fetcher connects to exactly these addresses so a second DNS answer cannot
// differ from the one that was checked.
struct ValidatedTarget {
  URL url;
  std::string hostname;
  std::optional<std::uint16_t> port;
  std::vector<std::string> addresses;
};

class SsrfGuard {
 public:
  struct TestHooks {
    // When set, replaces getaddrinfo: hostname -> addresses. A hostname
    // absent from the map fails to resolve.
    static inline std::optional<
      std::unordered_map<std::string, std::vector<std::string>>>
      fake_dns = std::nullopt;
  };

  /// Applies the block policy to `url`. Throws BlockedURL.
  static ValidatedTarget Validate(const std::string& url);

  /// True for private, loopback, link-local, reserved, multicast and
  /// unparseable addresses (IPv4 or IPv6 text form).
  static bool IsBlockedAddress(const std::string& address);

  /// True for the literal names rejected without resolution.
  static bool IsLocalhostLiteral(const std::string& hostname);

  /// Every address the system resolver returns for `hostname`, in order,
  /// de-duplicated; nullopt when resolution fails.
  static std::optional<std::vector<std::string>> ResolveAll(
    const std::string& hostname);
};
