#pragma once

#include <optional>
#include <stdexcept>
#include <string>

// Base for every terminal failure of a remote fetch. None are retried
// internally.
class FetchError : public std::runtime_error {
 public:
  explicit FetchError(const std::string& what) : std::runtime_error(what) {
  }
};

class BlockedURL : public FetchError {
 public:
  enum class Reason { Scheme, NoHost, Localhost, Unresolvable, PrivateAddress };

  BlockedURL(Reason reason, const std::string& what)
      : FetchError(what), reason_{reason} {
  }

  Reason GetReason() const noexcept {
    return reason_;
  }

  static const char* ReasonName(Reason reason) noexcept {
    switch (reason) {
      case Reason::Scheme:
        return "scheme";
      case Reason::NoHost:
        return "no-host";
      case Reason::Localhost:
        return "localhost";
      case Reason::Unresolvable:
        return "unresolvable";
      case Reason::PrivateAddress:
        return "private-address";
    }
    return "unknown";
  }

 private:
  Reason reason_;
};

class TooLarge : public FetchError {
 public:
  using FetchError::FetchError;
};

class NotAPDF : public FetchError {
 public:
  using FetchError::FetchError;
};

class TooManyRedirects : public FetchError {
 public:
  using FetchError::FetchError;
};

class TransportError : public FetchError {
 public:
  explicit TransportError(const std::string& what,
                          std::optional<long> http_status = std::nullopt)
      : FetchError(what), http_status_{http_status} {
  }

  /// HTTP status when the failure was an unsuccessful response
  std::optional<long> GetHttpStatus() const {
    return http_status_;
  }

 private:
  std::optional<long> http_status_;
};
