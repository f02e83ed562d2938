/**
 * @file gerrit_client.hpp
 * @brief Minimal Gerrit REST client for listing projects page by page.
 */
#ifndef GERRITNAV_GERRIT_CLIENT_HPP
#define GERRITNAV_GERRIT_CLIENT_HPP

#include "credentials.hpp"
#include "http_client.hpp"
#include "server_endpoint.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>

namespace gnav {

/// One repository hosted on the Gerrit server.
struct RemoteProject {
  std::string name;        ///< Server-unique project name
  std::string id;          ///< URL-encoded project id
  std::string parent;      ///< Parent project, if reported
  std::string description; ///< Free form description
  std::string state;       ///< ACTIVE, READ_ONLY or HIDDEN
};

/// Project listing filter understood by `GET /projects/?type=`.
enum class ProjectType {
  Code,        ///< Projects holding code (the Gerrit default for navigators)
  Permissions, ///< Permission-only projects
  All          ///< No filter
};

/// Lowercase name of the project type.
std::string to_string(ProjectType type);

/**
 * Parse a project type name (case-insensitive).
 *
 * @throws std::invalid_argument for unknown names.
 */
ProjectType project_type_from_string(const std::string &value);

/// Projects of one listing response plus the continuation flag.
struct ProjectPage {
  std::vector<RemoteProject> projects; ///< In server order
  bool more{false}; ///< Server reported `_more_projects`
};

/**
 * Connection context of one scan.
 *
 * Built once per scan from user configuration and the resolved credential,
 * never shared between scans.
 */
struct ConnectionSettings {
  explicit ConnectionSettings(ServerEndpoint server)
      : endpoint(std::move(server)) {}

  ServerEndpoint endpoint;
  bool insecure_https{false};
  std::optional<UsernamePassword> credentials;
  std::shared_ptr<spdlog::logger> logger; ///< Diagnostics sink for the scan
  std::chrono::milliseconds timeout{30000};
  int retries{0}; ///< Transport retries; 0 disables the retry decorator
  std::string http_proxy;
  std::string https_proxy;
};

/**
 * Decode a `GET /projects/` response body.
 *
 * Strips Gerrit's `)]}'` XSSI guard, then reads the object mapping project
 * name to ProjectInfo in document order. The page continues when any entry
 * carries `"_more_projects": true`.
 *
 * @throws std::runtime_error when the body is not a JSON object of objects.
 */
ProjectPage parse_project_page(const std::string &body);

/**
 * Gerrit REST client bound to one endpoint and credential.
 *
 * Authenticated clients call the `/a` REST root with HTTP basic auth;
 * anonymous clients call the plain root.
 */
class GerritClient {
public:
  /**
   * Construct a client.
   *
   * @param settings Connection context of the scan.
   * @param http Transport override; a libcurl client configured from
   *        @p settings is created when `nullptr`.
   * @throws TransientNetworkError if libcurl cannot be initialised.
   */
  explicit GerritClient(ConnectionSettings settings,
                        std::unique_ptr<HttpClient> http = nullptr);

  /**
   * Build the transport described by the settings.
   *
   * Wraps the libcurl client in a RetryHttpClient when retries are enabled.
   */
  static std::unique_ptr<HttpClient>
  make_http_client(const ConnectionSettings &settings);

  /**
   * Fetch one page of the project listing.
   *
   * @param limit Page size (`n`).
   * @param skip Number of projects to skip (`S`).
   * @param type Project type filter.
   * @throws TransientNetworkError, HttpStatusError on transport failures and
   *         std::runtime_error when the body cannot be decoded.
   */
  ProjectPage list_projects(std::size_t limit, std::size_t skip,
                            ProjectType type = ProjectType::Code);

  /// URL requested by list_projects() for the given arguments.
  std::string projects_url(std::size_t limit, std::size_t skip,
                           ProjectType type) const;

  /// REST root in use (authenticated or anonymous).
  const std::string &api_base() const;

  bool authenticated() const { return settings_.credentials.has_value(); }

  const ConnectionSettings &settings() const { return settings_; }

private:
  ConnectionSettings settings_;
  std::unique_ptr<HttpClient> http_;
};

} // namespace gnav

#endif // GERRITNAV_GERRIT_CLIENT_HPP
