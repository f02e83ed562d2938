/**
 * @file http_client.hpp
 * @brief HTTP transport used by the Gerrit REST client.
 *
 * Declares the HttpClient interface, the libcurl implementation and a retry
 * decorator for transient failures.
 */
#ifndef GERRITNAV_HTTP_CLIENT_HPP
#define GERRITNAV_HTTP_CLIENT_HPP

#include <chrono>
#include <curl/curl.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gnav {

/** Interface for performing HTTP requests. */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  /**
   * Perform a HTTP GET request.
   *
   * @param url Absolute request URL.
   * @param headers Additional request headers expressed as `Header: value`
   *        strings.
   * @return Response body content as a UTF-8 string.
   * @throws TransientNetworkError On transport failures.
   * @throws HttpStatusError When the server answers with a non-2xx status.
   */
  virtual std::string get(const std::string &url,
                          const std::vector<std::string> &headers) = 0;
};

/**
 * RAII wrapper for a CURL easy handle ensuring global CURL initialization.
 */
class CurlHandle {
public:
  CurlHandle();
  ~CurlHandle();
  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;

  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

/// Login used for HTTP basic authentication.
struct BasicAuth {
  std::string username;
  std::string password;
};

/// Transport settings for CurlHttpClient.
struct HttpClientOptions {
  std::chrono::milliseconds timeout{30000}; ///< Connect and total timeout
  bool insecure_https{false};  ///< Skip TLS peer and host verification
  std::optional<BasicAuth> auth; ///< Basic auth login, if any
  std::string http_proxy;      ///< Proxy for http:// URLs
  std::string https_proxy;     ///< Proxy for https:// URLs
  std::string user_agent{"gerritnav"};
};

/**
 * CURL-based HTTP client implementation.
 *
 * @note Not thread-safe; every scan owns its own instance.
 */
class CurlHttpClient : public HttpClient {
public:
  explicit CurlHttpClient(HttpClientOptions options = {});

  /// @copydoc HttpClient::get()
  std::string get(const std::string &url,
                  const std::vector<std::string> &headers) override;

  const HttpClientOptions &options() const { return options_; }

private:
  void apply_proxy(CURL *curl, const std::string &url);

  CurlHandle curl_;
  HttpClientOptions options_;
};

/**
 * Decorator retrying requests that failed with a transient error.
 *
 * Transport errors and 5xx responses are retried with exponential backoff
 * (`backoff * 2^attempt`, the exponent capped at kMaxBackoffShift); every
 * other failure is rethrown immediately.
 */
class RetryHttpClient : public HttpClient {
public:
  RetryHttpClient(std::unique_ptr<HttpClient> inner, int max_retries,
                  std::chrono::milliseconds backoff);

  /// Largest exponent applied to the backoff.
  static constexpr int kMaxBackoffShift = 10;

  std::string get(const std::string &url,
                  const std::vector<std::string> &headers) override;

  /// Delay before retry number @p attempt (zero-based).
  std::chrono::milliseconds delay_for(int attempt) const;

private:
  std::unique_ptr<HttpClient> inner_;
  int max_retries_;
  std::chrono::milliseconds backoff_;
};

} // namespace gnav

#endif // GERRITNAV_HTTP_CLIENT_HPP
