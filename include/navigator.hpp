/**
 * @file navigator.hpp
 * @brief Discovery of the projects of one Gerrit server.
 */
#ifndef GERRITNAV_NAVIGATOR_HPP
#define GERRITNAV_NAVIGATOR_HPP

#include "cancellation.hpp"
#include "credentials.hpp"
#include "gerrit_client.hpp"
#include "project_pager.hpp"
#include "source_observer.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace gnav {

/// User configuration of one navigator.
struct NavigatorSettings {
  std::string server_url;
  bool insecure_https{false};
  std::optional<std::string> credentials_id;
  std::vector<nlohmann::json> traits; ///< Copied onto every candidate
};

/// Transport and paging tunables shared by the scans of a run.
struct ScanOptions {
  PagerOptions pager;
  std::chrono::milliseconds timeout{30000};
  int retries{0};
  std::string http_proxy;
  std::string https_proxy;
  std::shared_ptr<spdlog::logger> logger; ///< Defaults to the navigator logger
};

/// Creates the API client of a scan; replaced in tests.
using ClientFactory =
    std::function<std::shared_ptr<GerritClient>(ConnectionSettings)>;

/**
 * Navigator enumerating the projects of a Gerrit server as candidate
 * sources.
 *
 * Each visit_sources() call is an independent scan: the endpoint is resolved,
 * the credential looked up once, and the project listing traversed page by
 * page while every project is handed to the observer.
 */
class GerritNavigator {
public:
  /**
   * @param settings Navigator configuration. The server URL is trimmed and a
   *        blank credentials id is treated as absent.
   * @param credentials Store consulted when a credentials id is set; may be
   *        null, in which case scans run anonymously.
   * @param options Transport and paging tunables.
   * @throws std::invalid_argument if the page size or page cap is zero.
   */
  GerritNavigator(NavigatorSettings settings,
                  std::shared_ptr<const CredentialStore> credentials = nullptr,
                  ScanOptions options = {});

  /// Stable identifier `server-url=<url>::credentials-id=<id or null>`.
  std::string id() const;

  /**
   * Validate a server URL without touching the network.
   *
   * @return Error message, or `std::nullopt` when the URL is usable.
   */
  static std::optional<std::string> check_server_url(const std::string &url);

  /**
   * Scan the server and submit every project to @p observer.
   *
   * The observer's session hooks bracket the scan on every exit path.
   *
   * @throws ResolutionFailure if the server URL is malformed.
   * @throws ConnectionFailure if the client cannot be built or the first page
   *         cannot be fetched.
   * @throws PageFetchFailure if a later page fails.
   * @throws PaginationLimitExceeded if the page cap is reached.
   * @throws ScanCancelled if @p cancel is set during the scan.
   */
  void visit_sources(SourceObserver &observer,
                     const CancellationToken &cancel = CancellationToken());

  /// Override how API clients are created.
  void set_client_factory(ClientFactory factory) {
    client_factory_ = std::move(factory);
  }

  const NavigatorSettings &settings() const { return settings_; }
  const ScanOptions &options() const { return options_; }

private:
  std::shared_ptr<GerritClient> make_client(ConnectionSettings settings);

  NavigatorSettings settings_;
  std::shared_ptr<const CredentialStore> credentials_;
  ScanOptions options_;
  ClientFactory client_factory_;
};

} // namespace gnav

#endif // GERRITNAV_NAVIGATOR_HPP
