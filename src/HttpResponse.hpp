#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/// One HTTP response as seen by the header/body callbacks of a transfer.
class HttpResponse {
 public:
  HttpResponse() = default;

  /// Feed one raw header line, status lines included. A status line
  /// ("HTTP/1.1 302 Found") starts a new response and discards any headers
  /// from an interim one (e.g. "100 Continue").
  void AddHeaderLine(const std::string& line);

  /// Append to the response body
  void AppendBody(const char* data, size_t len);

  /// Return the first header value matching `key` (case-insensitive)
  std::optional<std::string> GetHeader(const std::string& key) const;

  /// The accumulated body
  const std::string& GetBody() const;

  /// Declared Content-Length, nullopt if absent or unparseable
  std::optional<std::uint64_t> GetContentLength() const;

  /// Content-Type mentions pdf, or the body starts with "%PDF"
  bool LooksLikePdf() const;

  long GetStatusCode() const;

  /// The header block of the final response has been received
  bool HeadersComplete() const {
    return headers_complete_;
  }

  /// HTTP status code is 200 to 299
  bool IsOkay() const;

  /// HTTP status code is 300 to 399
  bool IsRedirect() const;

 private:
  std::vector<std::pair<std::string, std::string>> headers_;
  std::string body_;
  long status_code_{0};
  bool headers_complete_{false};
};
