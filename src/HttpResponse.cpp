#include "HttpResponse.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

void trim(std::string& s) {
  auto l = s.find_first_not_of(" \t\r\n");
  auto r = s.find_last_not_of(" \t\r\n");
  if (l == std::string::npos) {
    s.clear();
    return;
  }
  s = s.substr(l, r - l + 1);
}

}  // namespace

void HttpResponse::AddHeaderLine(const std::string& raw) {
  std::string line = raw;
  trim(line);

  if (line.empty()) {
    // blank line terminates a header block; interim 1xx blocks don't count
    if (status_code_ >= 200)
      headers_complete_ = true;
    return;
  }

  if (line.compare(0, 5, "HTTP/") == 0) {
    headers_.clear();
    headers_complete_ = false;
    status_code_ = 0;
    auto sp = line.find(' ');
    if (sp != std::string::npos) {
      auto end = line.find(' ', sp + 1);
      auto code = line.substr(sp + 1, end == std::string::npos
                                        ? std::string::npos
                                        : end - sp - 1);
      if (!code.empty() && code.size() <= 3 &&
          std::all_of(code.begin(), code.end(),
                      [](unsigned char c) { return std::isdigit(c); }))
        status_code_ = std::stol(code);
    }
    return;
  }

  auto colon = line.find(':');
  if (colon == std::string::npos)
    return;  // skip non-header lines

  std::string name = line.substr(0, colon);
  std::string value = line.substr(colon + 1);
  trim(name);
  trim(value);

  headers_.emplace_back(std::move(name), std::move(value));
}

void HttpResponse::AppendBody(const char* data, size_t len) {
  body_.append(data, len);
}

std::optional<std::string> HttpResponse::GetHeader(
  const std::string& key) const {
  std::string want = lowercase(key);
  for (auto const& [name, val] : headers_) {
    if (lowercase(name) == want) {
      return val;
    }
  }
  return std::nullopt;
}

const std::string& HttpResponse::GetBody() const {
  return body_;
}

std::optional<std::uint64_t> HttpResponse::GetContentLength() const {
  auto value = GetHeader("Content-Length");
  if (!value || value->empty() || value->size() > 20 ||
      !std::all_of(value->begin(), value->end(),
                   [](unsigned char c) { return std::isdigit(c); }))
    return std::nullopt;
  try {
    return std::stoull(*value);
  } catch (const std::out_of_range&) {
    return UINT64_MAX;
  }
}

bool HttpResponse::LooksLikePdf() const {
  auto type = GetHeader("Content-Type");
  if (type && lowercase(*type).find("pdf") != std::string::npos)
    return true;
  return body_.compare(0, 4, "%PDF") == 0;
}

long HttpResponse::GetStatusCode() const {
  return status_code_;
}

bool HttpResponse::IsOkay() const {
  return status_code_ >= 200 && status_code_ < 300;
}

bool HttpResponse::IsRedirect() const {
  return status_code_ >= 300 && status_code_ < 400;
}
