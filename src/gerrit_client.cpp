/**
 * @file gerrit_client.cpp
 * @brief Project listing against the Gerrit REST API.
 */

#include "gerrit_client.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace gnav {

namespace {

std::shared_ptr<spdlog::logger> gerrit_client_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("gerrit.client");
  }();
  return logger;
}

/// Gerrit prefixes every JSON response with this guard against XSSI.
constexpr const char *kXssiGuard = ")]}'";

std::string strip_xssi_guard(const std::string &body) {
  const std::string guard(kXssiGuard);
  std::size_t start = 0;
  while (start < body.size() &&
         std::isspace(static_cast<unsigned char>(body[start]))) {
    ++start;
  }
  if (body.compare(start, guard.size(), guard) != 0) {
    return body;
  }
  return body.substr(start + guard.size());
}

std::string string_or_empty(const nlohmann::ordered_json &info,
                            const char *key) {
  auto it = info.find(key);
  if (it != info.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return {};
}

} // namespace

std::string to_string(ProjectType type) {
  switch (type) {
  case ProjectType::Code:
    return "code";
  case ProjectType::Permissions:
    return "permissions";
  case ProjectType::All:
    return "all";
  }
  return "code";
}

ProjectType project_type_from_string(const std::string &value) {
  std::string lower = value;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });
  if (lower == "code")
    return ProjectType::Code;
  if (lower == "permissions")
    return ProjectType::Permissions;
  if (lower == "all")
    return ProjectType::All;
  throw std::invalid_argument("Unknown project type '" + value + "'");
}

ProjectPage parse_project_page(const std::string &body) {
  nlohmann::ordered_json j;
  try {
    j = nlohmann::ordered_json::parse(strip_xssi_guard(body));
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error(std::string("Malformed project list: ") +
                             e.what());
  }
  if (!j.is_object()) {
    throw std::runtime_error("Malformed project list: expected a JSON object");
  }
  ProjectPage page;
  page.projects.reserve(j.size());
  for (const auto &[name, info] : j.items()) {
    if (!info.is_object()) {
      throw std::runtime_error("Malformed project list: entry '" + name +
                               "' is not an object");
    }
    RemoteProject project;
    project.name = string_or_empty(info, "name");
    if (project.name.empty()) {
      project.name = name;
    }
    project.id = string_or_empty(info, "id");
    project.parent = string_or_empty(info, "parent");
    project.description = string_or_empty(info, "description");
    project.state = string_or_empty(info, "state");
    auto more = info.find("_more_projects");
    if (more != info.end() && more->is_boolean() && more->get<bool>()) {
      page.more = true;
    }
    page.projects.push_back(std::move(project));
  }
  return page;
}

GerritClient::GerritClient(ConnectionSettings settings,
                           std::unique_ptr<HttpClient> http)
    : settings_(std::move(settings)),
      http_(http ? std::move(http) : make_http_client(settings_)) {
  if (!settings_.logger) {
    settings_.logger = gerrit_client_log();
  }
  settings_.logger->debug("Gerrit client for {} ({}, TLS verification {})",
                          api_base(),
                          authenticated() ? "authenticated" : "anonymous",
                          settings_.insecure_https ? "disabled" : "enabled");
}

std::unique_ptr<HttpClient>
GerritClient::make_http_client(const ConnectionSettings &settings) {
  HttpClientOptions options;
  options.timeout = settings.timeout;
  options.insecure_https = settings.insecure_https;
  options.http_proxy = settings.http_proxy;
  options.https_proxy = settings.https_proxy;
  if (settings.credentials) {
    options.auth =
        BasicAuth{settings.credentials->username, settings.credentials->password};
  }
  std::unique_ptr<HttpClient> http =
      std::make_unique<CurlHttpClient>(std::move(options));
  if (settings.retries > 0) {
    http = std::make_unique<RetryHttpClient>(
        std::move(http), settings.retries, std::chrono::milliseconds(200));
  }
  return http;
}

const std::string &GerritClient::api_base() const {
  return settings_.endpoint.api_base_for(authenticated());
}

std::string GerritClient::projects_url(std::size_t limit, std::size_t skip,
                                       ProjectType type) const {
  std::string url = api_base() + "/projects/?n=" + std::to_string(limit) +
                    "&S=" + std::to_string(skip);
  if (type == ProjectType::Code) {
    url += "&type=CODE";
  } else if (type == ProjectType::Permissions) {
    url += "&type=PERMISSIONS";
  }
  return url;
}

ProjectPage GerritClient::list_projects(std::size_t limit, std::size_t skip,
                                        ProjectType type) {
  const std::string url = projects_url(limit, skip, type);
  settings_.logger->debug("Listing projects: {}", url);
  std::string body = http_->get(url, {"Accept: application/json"});
  ProjectPage page = parse_project_page(body);
  settings_.logger->debug("Received {} project(s), more={}",
                          page.projects.size(), page.more);
  return page;
}

} // namespace gnav
