/**
 * @file errors.hpp
 * @brief Exception types raised by the discovery engine and HTTP transport.
 *
 * Discovery failures derive from DiscoveryError so callers can handle every
 * failed scan in one place. Cancellation is reported through ScanCancelled,
 * which deliberately sits outside that hierarchy.
 */
#ifndef GERRITNAV_ERRORS_HPP
#define GERRITNAV_ERRORS_HPP

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>

namespace gnav {

/// Transport level failure reported by libcurl (DNS, connect, TLS, timeout).
class TransientNetworkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// HTTP response with a status outside the 2xx range.
class HttpStatusError : public std::runtime_error {
public:
  HttpStatusError(int status_code, const std::string &message)
      : std::runtime_error(message), status(status_code) {}

  int status; ///< HTTP status code returned by the server
};

/// Root of all failures surfaced by a discovery scan.
class DiscoveryError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// The server URL is not a usable http(s) URI.
class MalformedEndpoint : public DiscoveryError {
public:
  using DiscoveryError::DiscoveryError;
};

/// The navigator could not derive its endpoint from the configured URL.
class ResolutionFailure : public DiscoveryError {
public:
  using DiscoveryError::DiscoveryError;
};

/// The API client could not be constructed or the first page fetch failed.
class ConnectionFailure : public DiscoveryError {
public:
  using DiscoveryError::DiscoveryError;
};

/**
 * A page of the project listing could not be fetched or decoded.
 *
 * Projects yielded before the failing page remain valid.
 */
class PageFetchFailure : public DiscoveryError {
public:
  PageFetchFailure(std::size_t page, const std::string &message)
      : DiscoveryError(message), page_(page) {}

  /// Zero-based index of the page that failed.
  std::size_t page() const noexcept { return page_; }

private:
  std::size_t page_;
};

/// The server kept reporting more results past the configured page cap.
class PaginationLimitExceeded : public DiscoveryError {
public:
  explicit PaginationLimitExceeded(std::size_t max_pages)
      : DiscoveryError("Project listing exceeded " + std::to_string(max_pages) +
                       " pages"),
        max_pages_(max_pages) {}

  std::size_t max_pages() const noexcept { return max_pages_; }

private:
  std::size_t max_pages_;
};

/**
 * Signals a cooperative abort of a scan.
 *
 * Not a failure: callers treat it as a normal early termination.
 */
class ScanCancelled : public std::exception {
public:
  explicit ScanCancelled(std::size_t submitted) noexcept
      : submitted_(submitted) {}

  /// Number of candidates submitted before the cancellation was observed.
  std::size_t submitted() const noexcept { return submitted_; }

  const char *what() const noexcept override { return "Discovery cancelled"; }

private:
  std::size_t submitted_;
};

} // namespace gnav

#endif // GERRITNAV_ERRORS_HPP
