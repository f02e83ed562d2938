/**
 * @file server_endpoint.cpp
 * @brief Parses Gerrit server URLs into web and REST base URIs.
 */
#include "server_endpoint.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace gnav {

namespace {

std::shared_ptr<spdlog::logger> endpoint_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("endpoint");
  }();
  return logger;
}

constexpr const char *kAuthenticatedSegment = "a";

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });
  return value;
}

std::string trim(const std::string &s) {
  auto first = std::find_if_not(
      s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
  if (first == s.end())
    return {};
  auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
                return std::isspace(c);
              }).base();
  return std::string(first, last);
}

[[noreturn]] void reject(const std::string &url, const std::string &why) {
  endpoint_log()->debug("Rejecting server URL '{}': {}", url, why);
  throw MalformedEndpoint("Invalid server URL '" + url + "': " + why);
}

bool valid_scheme(const std::string &scheme) {
  if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0])))
    return false;
  return std::all_of(scheme.begin(), scheme.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '-' || c == '.';
  });
}

bool valid_reg_name(const std::string &host) {
  return std::all_of(host.begin(), host.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~' ||
           c == '%';
  });
}

bool valid_ipv6_literal(const std::string &inner) {
  if (inner.empty())
    return false;
  return std::all_of(inner.begin(), inner.end(), [](unsigned char c) {
    return std::isxdigit(c) || c == ':' || c == '.';
  });
}

int default_port(const std::string &scheme) {
  return scheme == "https" ? 443 : 80;
}

/// Split on '/', dropping empty segments produced by leading, trailing or
/// repeated separators.
std::vector<std::string> path_segments(const std::string &path) {
  std::vector<std::string> segments;
  std::size_t start = 0;
  while (start <= path.size()) {
    std::size_t end = path.find('/', start);
    if (end == std::string::npos)
      end = path.size();
    if (end > start)
      segments.push_back(path.substr(start, end - start));
    start = end + 1;
  }
  return segments;
}

} // namespace

ServerEndpoint resolve_endpoint(const std::string &server_url) {
  const std::string url = trim(server_url);
  if (url.empty()) {
    reject(server_url, "URL is blank");
  }
  if (std::any_of(url.begin(), url.end(), [](unsigned char c) {
        return std::isspace(c) || std::iscntrl(c);
      })) {
    reject(url, "URL contains whitespace or control characters");
  }

  const auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    reject(url, "missing scheme");
  }
  const std::string scheme = to_lower_copy(url.substr(0, scheme_end));
  if (!valid_scheme(scheme)) {
    reject(url, "invalid scheme '" + scheme + "'");
  }
  if (scheme != "http" && scheme != "https") {
    reject(url, "unsupported scheme '" + scheme + "'");
  }

  const std::size_t authority_start = scheme_end + 3;
  std::size_t authority_end = url.find_first_of("/?#", authority_start);
  if (authority_end == std::string::npos)
    authority_end = url.size();
  std::string authority =
      url.substr(authority_start, authority_end - authority_start);
  auto at = authority.rfind('@');
  if (at != std::string::npos) {
    authority.erase(0, at + 1);
  }

  std::string host;
  std::string port_text;
  if (!authority.empty() && authority.front() == '[') {
    auto close = authority.find(']');
    if (close == std::string::npos ||
        !valid_ipv6_literal(authority.substr(1, close - 1))) {
      reject(url, "invalid IPv6 host");
    }
    host = authority.substr(0, close + 1);
    std::string rest = authority.substr(close + 1);
    if (!rest.empty()) {
      if (rest.front() != ':')
        reject(url, "unexpected characters after host");
      port_text = rest.substr(1);
    }
  } else {
    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
      host = authority.substr(0, colon);
      port_text = authority.substr(colon + 1);
    } else {
      host = authority;
    }
    if (!valid_reg_name(host)) {
      reject(url, "invalid host '" + host + "'");
    }
  }
  if (host.empty()) {
    reject(url, "missing host");
  }
  host = to_lower_copy(host);

  int port = 0;
  if (!port_text.empty()) {
    if (port_text.size() > 5 ||
        !std::all_of(port_text.begin(), port_text.end(), [](unsigned char c) {
          return std::isdigit(c);
        })) {
      reject(url, "invalid port '" + port_text + "'");
    }
    port = std::stoi(port_text);
    if (port < 1 || port > 65535) {
      reject(url, "port out of range");
    }
    if (port == default_port(scheme)) {
      port = 0;
    }
  }

  std::string raw_path;
  if (authority_end < url.size() && url[authority_end] == '/') {
    auto path_end = url.find_first_of("?#", authority_end);
    if (path_end == std::string::npos)
      path_end = url.size();
    raw_path = url.substr(authority_end, path_end - authority_end);
  }
  auto segments = path_segments(raw_path);
  if (!segments.empty() && segments.back() == kAuthenticatedSegment) {
    segments.pop_back();
  }
  std::string path;
  for (const auto &segment : segments) {
    path += '/';
    path += segment;
  }

  ServerEndpoint endpoint;
  endpoint.server_url_ = url;
  endpoint.scheme_ = scheme;
  endpoint.host_ = host;
  endpoint.port_ = port;
  endpoint.path_ = path;
  endpoint.web_base_ = scheme + "://" + host +
                       (port != 0 ? ":" + std::to_string(port) : "") + path;
  endpoint.api_base_ = endpoint.web_base_;
  endpoint.authenticated_api_base_ =
      endpoint.web_base_ + "/" + kAuthenticatedSegment;
  endpoint_log()->debug("Resolved '{}' to web={} api={} auth_api={}", url,
                        endpoint.web_base_, endpoint.api_base_,
                        endpoint.authenticated_api_base_);
  return endpoint;
}

} // namespace gnav
