/**
 * @file http_client.cpp
 * @brief libcurl transport and retry decorator.
 */

#include "http_client.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <memory>
#include <mutex>
#include <sstream>
#include <spdlog/spdlog.h>
#include <thread>
#include <utility>

namespace gnav {

namespace {

std::shared_ptr<spdlog::logger> http_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("http");
  }();
  return logger;
}

/**
 * Create a human readable error message for a CURL request.
 *
 * @param url Request URL.
 * @param code CURL error code.
 * @param errbuf Optional buffer with extended error text.
 * @return Combined error description.
 */
std::string format_curl_error(const std::string &url, CURLcode code,
                              const char *errbuf) {
  std::ostringstream oss;
  oss << "curl GET";
  if (!url.empty()) {
    oss << ' ' << url;
  }
  oss << " failed: " << curl_easy_strerror(code);
  if (errbuf != nullptr && errbuf[0] != '\0') {
    oss << " - " << errbuf;
  }
  return oss.str();
}

/**
 * RAII wrapper managing a CURL linked list of headers.
 */
struct CurlSlist {
  curl_slist *list{nullptr};
  CurlSlist() = default;
  ~CurlSlist() { curl_slist_free_all(list); }
  void append(const std::string &s) {
    list = curl_slist_append(list, s.c_str());
  }
  curl_slist *get() const { return list; }
  CurlSlist(const CurlSlist &) = delete;
  CurlSlist &operator=(const CurlSlist &) = delete;
};

size_t write_callback(void *contents, size_t size, size_t nmemb, void *userp) {
  size_t total = size * nmemb;
  auto *s = static_cast<std::string *>(userp);
  s->append(static_cast<char *>(contents), total);
  return total;
}

bool is_transient(const std::exception &e) {
  if (dynamic_cast<const TransientNetworkError *>(&e) != nullptr) {
    return true;
  }
  if (const auto *http_err = dynamic_cast<const HttpStatusError *>(&e)) {
    return http_err->status >= 500 && http_err->status < 600;
  }
  return false;
}

} // namespace

CurlHandle::CurlHandle() {
  static std::once_flag flag;
  std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  handle_ = curl_easy_init();
  if (!handle_) {
    throw TransientNetworkError("Failed to init curl");
  }
}

CurlHandle::~CurlHandle() { curl_easy_cleanup(handle_); }

CurlHttpClient::CurlHttpClient(HttpClientOptions options)
    : options_(std::move(options)) {}

void CurlHttpClient::apply_proxy(CURL *curl, const std::string &url) {
  const std::string *proxy = nullptr;
  if (url.rfind("https://", 0) == 0) {
    if (!options_.https_proxy.empty()) {
      proxy = &options_.https_proxy;
    } else if (!options_.http_proxy.empty()) {
      proxy = &options_.http_proxy;
    }
    if (proxy) {
      curl_easy_setopt(curl, CURLOPT_HTTPPROXYTUNNEL, 1L);
    }
  } else if (url.rfind("http://", 0) == 0) {
    if (!options_.http_proxy.empty()) {
      proxy = &options_.http_proxy;
    }
  }
  if (proxy) {
    curl_easy_setopt(curl, CURLOPT_PROXY, proxy->c_str());
  }
}

std::string CurlHttpClient::get(const std::string &url,
                                const std::vector<std::string> &headers) {
  CURL *curl = curl_.get();
  curl_easy_reset(curl);
  std::string response;
  const long timeout_ms = static_cast<long>(options_.timeout.count());
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  apply_proxy(curl, url);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  if (options_.insecure_https) {
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
  } else {
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
  }
  if (options_.auth) {
    curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
    curl_easy_setopt(curl, CURLOPT_USERNAME, options_.auth->username.c_str());
    curl_easy_setopt(curl, CURLOPT_PASSWORD, options_.auth->password.c_str());
  }
  CurlSlist header_list;
  for (const auto &h : headers) {
    header_list.append(h);
  }
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());

  CURLcode res = curl_easy_perform(curl);
  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  if (res != CURLE_OK) {
    std::string msg = format_curl_error(url, res, errbuf);
    http_log()->error(msg);
    throw TransientNetworkError(msg);
  }
  if (http_code < 200 || http_code >= 300) {
    http_log()->error("curl GET {} failed with HTTP code {}", url, http_code);
    throw HttpStatusError(static_cast<int>(http_code),
                          "GET " + url + " failed with HTTP code " +
                              std::to_string(http_code));
  }
  http_log()->trace("GET {} -> {} ({} bytes)", url, http_code,
                    response.size());
  return response;
}

RetryHttpClient::RetryHttpClient(std::unique_ptr<HttpClient> inner,
                                 int max_retries,
                                 std::chrono::milliseconds backoff)
    : inner_(std::move(inner)), max_retries_(max_retries < 0 ? 0 : max_retries),
      backoff_(backoff) {}

std::chrono::milliseconds RetryHttpClient::delay_for(int attempt) const {
  return backoff_ * (1 << std::min(attempt, kMaxBackoffShift));
}

std::string RetryHttpClient::get(const std::string &url,
                                 const std::vector<std::string> &headers) {
  int attempt = 0;
  while (true) {
    try {
      return inner_->get(url, headers);
    } catch (const std::exception &e) {
      if (attempt >= max_retries_ || !is_transient(e))
        throw;
      auto delay = delay_for(attempt);
      http_log()->warn("Retrying after {} ms (attempt {}/{}): {}",
                       delay.count(), attempt + 1, max_retries_, e.what());
      std::this_thread::sleep_for(delay);
      ++attempt;
    }
  }
}

} // namespace gnav
