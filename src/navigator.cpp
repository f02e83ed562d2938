#include "navigator.hpp"
#include "discovery_session.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <stdexcept>
#include <utility>

namespace gnav {

namespace {

std::shared_ptr<spdlog::logger> navigator_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("navigator");
  }();
  return logger;
}

std::string trim(const std::string &s) {
  auto first = std::find_if_not(
      s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
  auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
                return std::isspace(c);
              }).base();
  if (first >= last) {
    return {};
  }
  return std::string(first, last);
}

} // namespace

GerritNavigator::GerritNavigator(
    NavigatorSettings settings,
    std::shared_ptr<const CredentialStore> credentials, ScanOptions options)
    : settings_(std::move(settings)), credentials_(std::move(credentials)),
      options_(std::move(options)) {
  if (options_.pager.page_size == 0) {
    throw std::invalid_argument("Page size must be positive");
  }
  if (options_.pager.max_pages == 0) {
    throw std::invalid_argument("Page cap must be positive");
  }
  settings_.server_url = trim(settings_.server_url);
  if (settings_.credentials_id) {
    std::string id = trim(*settings_.credentials_id);
    if (id.empty()) {
      settings_.credentials_id.reset();
    } else {
      settings_.credentials_id = id;
    }
  }
  if (!options_.logger) {
    options_.logger = navigator_log();
  }
}

std::string GerritNavigator::id() const {
  return "server-url=" + settings_.server_url + "::credentials-id=" +
         settings_.credentials_id.value_or("null");
}

std::optional<std::string>
GerritNavigator::check_server_url(const std::string &url) {
  try {
    resolve_endpoint(url);
  } catch (const MalformedEndpoint &e) {
    return std::string(e.what());
  }
  return std::nullopt;
}

std::shared_ptr<GerritClient>
GerritNavigator::make_client(ConnectionSettings settings) {
  if (client_factory_) {
    return client_factory_(std::move(settings));
  }
  return std::make_shared<GerritClient>(std::move(settings));
}

void GerritNavigator::visit_sources(SourceObserver &observer,
                                    const CancellationToken &cancel) {
  const auto &log = options_.logger;

  std::optional<ServerEndpoint> resolved;
  try {
    resolved = resolve_endpoint(settings_.server_url);
  } catch (const MalformedEndpoint &e) {
    log->error("Cannot resolve {}: {}", settings_.server_url, e.what());
    throw ResolutionFailure(e.what());
  }
  const ServerEndpoint endpoint = *resolved;

  ConnectionSettings conn(endpoint);
  conn.insecure_https = settings_.insecure_https;
  conn.logger = log;
  conn.timeout = options_.timeout;
  conn.retries = options_.retries;
  conn.http_proxy = options_.http_proxy;
  conn.https_proxy = options_.https_proxy;
  if (settings_.credentials_id) {
    if (credentials_) {
      conn.credentials =
          credentials_->lookup(settings_.server_url, *settings_.credentials_id);
    }
    if (!conn.credentials) {
      log->warn("Credentials '{}' not found for {}, scanning anonymously",
                *settings_.credentials_id, endpoint.web_base());
    }
  }

  std::shared_ptr<GerritClient> client;
  try {
    client = make_client(std::move(conn));
  } catch (const std::exception &e) {
    log->error("Cannot connect to {}: {}", endpoint.web_base(), e.what());
    throw ConnectionFailure("Cannot connect to " + endpoint.web_base() + ": " +
                            e.what());
  }
  if (!client) {
    throw ConnectionFailure("No API client for " + endpoint.web_base());
  }

  const std::string navigator_id = id();
  log->info("Discovering projects of {} via {}", endpoint.web_base(),
            client->api_base());

  DiscoverySession session(
      observer, DiscoveryContext{navigator_id, endpoint, settings_.traits, 0},
      log);
  try {
    ProjectPager pager(client, options_.pager);
    for (auto it = pager.begin(); it != pager.end(); ++it) {
      const RemoteProject &project = *it;
      CandidateFactory factory = [navigator_id, name = project.name, endpoint,
                                  insecure = settings_.insecure_https,
                                  credentials_id = settings_.credentials_id,
                                  traits = settings_.traits]() {
        return CandidateSource{navigator_id + "::" + name,
                               name,
                               endpoint,
                               insecure,
                               credentials_id,
                               traits};
      };
      if (session.submit(project, factory)) {
        log->info("Observer stopped the scan of {} after {} project(s)",
                  endpoint.web_base(), session.submitted());
        session.close(ScanOutcome::Stopped);
        return;
      }
      if (cancel.cancelled()) {
        log->warn("Scan of {} cancelled after {} project(s)",
                  endpoint.web_base(), session.submitted());
        session.close(ScanOutcome::Cancelled);
        throw ScanCancelled(session.submitted());
      }
    }
    log->info("Scan of {} completed: {} project(s) in {} page(s)",
              endpoint.web_base(), session.submitted(), pager.pages_fetched());
    session.close(ScanOutcome::Completed);
  } catch (const PageFetchFailure &e) {
    session.close(ScanOutcome::Failed);
    if (e.page() == 0) {
      throw ConnectionFailure(e.what());
    }
    throw;
  }
}

} // namespace gnav
