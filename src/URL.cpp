#include "URL.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string_view>
#include <vector>

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

inline bool is_ipv6_literal(const std::string& host) {
  return !host.empty() && host.front() == '[' && host.back() == ']';
}

inline bool is_ipv4(const std::string& host) {
  // light check, enough to tell dotted quads from names
  unsigned a, b, c, d;
  char dot1, dot2, dot3;
  std::stringstream ss(host);
  if (!(ss >> a >> dot1 >> b >> dot2 >> c >> dot3 >> d))
    return false;
  if (dot1 != '.' || dot2 != '.' || dot3 != '.')
    return false;
  return ss.peek() == std::char_traits<char>::eof();
}

// Length of a leading "scheme:" (without the colon), or npos.
std::size_t scheme_length(std::string_view s) {
  if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0])))
    return std::string_view::npos;
  std::size_t i = 1;
  while (i < s.size()) {
    const unsigned char c = static_cast<unsigned char>(s[i]);
    if (!std::isalnum(c) && c != '+' && c != '.' && c != '-')
      break;
    ++i;
  }
  return i < s.size() && s[i] == ':' ? i : std::string_view::npos;
}

inline bool has_scheme(const std::string& ref) {
  return scheme_length(ref) != std::string_view::npos;
}

// join and normalize “/a/b/../c” → “/a/c”
std::string normalize_path(const std::string& raw) {
  std::vector<std::string> parts;
  const bool trailing_slash = !raw.empty() && raw.back() == '/';
  for (size_t i = 0, n = raw.size(); i < n;) {
    size_t j = raw.find('/', i);
    if (j == std::string::npos)
      j = n;
    std::string seg = raw.substr(i, j - i);
    if (seg == "..") {
      if (!parts.empty())
        parts.pop_back();
    } else if (seg != "" && seg != ".") {
      parts.push_back(seg);
    }
    i = j + 1;
  }
  std::string out = "/";
  for (size_t k = 0; k < parts.size(); ++k) {
    out += parts[k];
    if (k + 1 < parts.size())
      out += "/";
  }
  if (trailing_slash && !parts.empty())
    out += "/";
  return out;
}

}  // namespace

URL::URL(const std::string& url_string) : raw_url_(url_string) {
  Parse();
}

void URL::Parse() {
  // scheme ":" ["//" authority] path ["?" query] ["#" fragment]
  const std::size_t scheme_end = scheme_length(raw_url_);
  if (scheme_end == std::string_view::npos) {
    logr::debug << "[URL] unparseable: " << raw_url_;
    return;
  }

  std::string_view rest(raw_url_);
  rest.remove_prefix(scheme_end + 1);

  if (auto h = rest.find('#'); h != std::string_view::npos) {
    fragment_.assign(rest.substr(h + 1));
    rest = rest.substr(0, h);
  }
  if (auto q = rest.find('?'); q != std::string_view::npos) {
    query_.assign(rest.substr(q));  // keep leading '?'
    rest = rest.substr(0, q);
  }

  std::string authority;
  has_authority_ = rest.size() >= 2 && rest[0] == '/' && rest[1] == '/';
  if (has_authority_) {
    rest.remove_prefix(2);
    const auto slash = rest.find('/');
    authority.assign(rest.substr(0, slash));
    rest = slash == std::string_view::npos ? std::string_view()
                                           : rest.substr(slash);
  }
  path_.assign(rest);
  scheme_ = to_lower(raw_url_.substr(0, scheme_end));

  // drop any userinfo; the host is what follows the last '@'
  if (auto at = authority.rfind('@'); at != std::string::npos)
    authority.erase(0, at + 1);

  if (!authority.empty() && authority.front() == '[') {
    auto close = authority.find(']');
    if (close == std::string::npos) {
      logr::debug << "[URL] unterminated IPv6 literal: " << raw_url_;
      return;
    }
    host_ = authority.substr(0, close + 1);
    auto after = authority.substr(close + 1);
    if (!after.empty() && after.front() == ':')
      port_ = after.substr(1);
  } else if (auto colon = authority.rfind(':'); colon != std::string::npos) {
    host_ = authority.substr(0, colon);
    port_ = authority.substr(colon + 1);
  } else {
    host_ = authority;
  }
  host_ = to_lower(host_);
}

bool URL::IsValid() const {
  return !scheme_.empty() && !GetHostname().empty();
}

URL URL::Resolve(const URL& ref) const {
  return Resolve(ref.GetRaw());
}

URL URL::Resolve(const std::string& ref) const {
  // Absolute: scheme present
  if (has_scheme(ref)) {
    return URL(ref);
  }

  // Protocol-relative: inherit base scheme
  if (ref.size() >= 2 && ref[0] == '/' && ref[1] == '/') {
    return URL(scheme_ + ":" + ref);
  }

  std::string_view sv = ref;
  std::string frag, ref_query, ref_path;

  if (auto h = sv.find('#'); h != std::string::npos) {
    frag.assign(sv.substr(h + 1));
    sv = sv.substr(0, h);
  }
  if (auto q = sv.find('?'); q != std::string::npos) {
    ref_query.assign(sv.substr(q));  // keep leading '?'
    ref_path.assign(sv.substr(0, q));
  } else {
    ref_path.assign(sv);
  }

  std::string origin = scheme_ + "://" + host_;
  if (!port_.empty())
    origin += ":" + port_;

  std::string path;
  if (ref_path.empty()) {
    path = path_.empty() ? "/" : path_;
  } else if (ref_path[0] == '/') {
    path = normalize_path(ref_path);
  } else {
    const std::string base_dir =
      path_.empty() ? "/" : path_.substr(0, path_.find_last_of('/') + 1);
    path = normalize_path(base_dir + ref_path);
  }

  // Query: ref wins; else inherit only when path is empty
  const std::string query = !ref_query.empty() ? ref_query
                            : ref_path.empty() ? query_
                                               : "";

  return URL(origin + path + query + (frag.empty() ? "" : "#" + frag));
}

std::string URL::GetScheme() const {
  return scheme_;
}

std::string URL::GetHost() const {
  return host_;
}

std::string URL::GetHostname() const {
  std::string h = host_;
  if (is_ipv6_literal(h))
    return h.substr(1, h.size() - 2);
  while (!h.empty() && h.back() == '.')
    h.pop_back();
  return h;
}

std::optional<std::uint16_t> URL::GetPort() const {
  if (port_.empty()) {
    if (scheme_ == "https")
      return 443;
    if (scheme_ == "http")
      return 80;
    return std::nullopt;
  }
  if (port_.size() > 5 ||
      !std::all_of(port_.begin(), port_.end(),
                   [](unsigned char c) { return std::isdigit(c); }))
    return std::nullopt;
  unsigned long p = std::stoul(port_);
  if (p == 0 || p > 65535)
    return std::nullopt;
  return static_cast<std::uint16_t>(p);
}

std::string URL::GetPath() const {
  return path_;
}

std::string URL::GetQuery() const {
  return query_;
}

std::string URL::GetBasename() const {
  auto slash = path_.find_last_of('/');
  return slash == std::string::npos ? path_ : path_.substr(slash + 1);
}

std::string URL::ToString() const {
  std::string url;

  if (!scheme_.empty()) {
    url += scheme_;
    url += ':';
  }
  if (has_authority_) {
    url += "//";
    url += host_;
    if (!port_.empty()) {
      url += ':';
      url += port_;
    }
  }

  url += path_;
  url += query_;

  if (!fragment_.empty()) {
    url += '#';
    url += fragment_;
  }

  return url;
}

bool URL::HostIsIPv4() const {
  return is_ipv4(host_);
}

bool URL::HostIsIPv6() const {
  return is_ipv6_literal(host_);
}
