#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

class URL {
 public:
  explicit URL(const std::string& url_string);

  URL Resolve(const URL& ref) const;
  URL Resolve(const std::string& ref) const;

  /// Scheme and host are both present
  bool IsValid() const;

  /// Lowercased scheme, e.g. "https"
  std::string GetScheme() const;

  /// Lowercased host as written; IPv6 literals keep their brackets
  std::string GetHost() const;

  /// Host suitable for name resolution: brackets stripped, trailing dot
  /// removed
  std::string GetHostname() const;

  /// Explicit port, or the scheme default (80/443), or nullopt
  std::optional<std::uint16_t> GetPort() const;

  std::string GetPath() const;
  std::string GetQuery() const;

  /// Last path segment ("document.pdf" for "/a/document.pdf"), empty for a
  /// directory path
  std::string GetBasename() const;

  /// The string this URL was constructed from
  const std::string& GetRaw() const {
    return raw_url_;
  }

  std::string ToString() const;
  bool HostIsIPv4() const;
  bool HostIsIPv6() const;

  bool operator==(const URL& other) const {
    return ToString() == other.ToString();
  }
  bool operator!=(const URL& other) const {
    return !(*this == other);
  }

 private:
  std::string raw_url_;
  std::string scheme_, host_, port_, path_, query_, fragment_;
  bool has_authority_{false};

  void Parse();
};

inline std::ostream& operator<<(std::ostream& os, const URL& u) {
  os << u.ToString();
  return os;
}
