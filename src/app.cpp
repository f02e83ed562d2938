#include "app.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "server_endpoint.hpp"

#include <exception>
#include <future>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace gnav {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

/// Combine per-server exit codes: cancellation wins over failure.
int combine_exit_codes(int current, int next) {
  if (current == kExitCancelled || next == kExitCancelled) {
    return kExitCancelled;
  }
  return current != 0 ? current : next;
}
} // namespace

App::App(std::ostream &out) : out_(out) {}

App::App() : App(std::cout) {}

/**
 * Execute the main application flow.
 *
 * Parses the command line, loads the configuration, initialises logging and
 * then either validates the server URLs (`--check-url`) or scans every
 * configured server.
 *
 * @param argc Argument count passed from @c main().
 * @param argv Argument vector passed from @c main().
 * @return Process exit code.
 */
int App::run(int argc, char **argv) {
  should_exit_ = false;
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    should_exit_ = true;
    return exit.exit_code();
  }
  try {
    if (!options_.config_file.empty()) {
      config_ = Config::from_file(options_.config_file);
    }
    merge_options();
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    should_exit_ = true;
    return 1;
  }
  setup_logging();
  if (options_.verbose) {
    app_log()->debug("Verbose mode enabled");
  }
  if (options_.check_url) {
    should_exit_ = true;
    return check_urls();
  }
  try {
    return scan_all();
  } catch (const std::exception &e) {
    app_log()->error("Discovery aborted: {}", e.what());
    return 1;
  }
}

void App::merge_options() {
  if (!options_.server_urls.empty()) {
    std::vector<NavigatorSettings> servers;
    for (const auto &url : options_.server_urls) {
      NavigatorSettings server;
      server.server_url = url;
      server.insecure_https = options_.insecure_https;
      if (!options_.credentials_id.empty()) {
        server.credentials_id = options_.credentials_id;
      }
      servers.push_back(std::move(server));
    }
    config_.set_servers(std::move(servers));
  }
  if (!options_.credentials_file.empty()) {
    config_.set_credentials_file(options_.credentials_file);
  }
  if (options_.page_size > 0) {
    config_.set_page_size(options_.page_size);
  }
  if (options_.max_pages > 0) {
    config_.set_max_pages(options_.max_pages);
  }
  if (!options_.project_type.empty()) {
    config_.set_project_type(project_type_from_string(options_.project_type));
  }
  if (!options_.include_projects.empty()) {
    config_.set_include_projects(options_.include_projects);
  }
  if (!options_.exclude_projects.empty()) {
    config_.set_exclude_projects(options_.exclude_projects);
  }
  if (options_.limit_explicit) {
    config_.set_limit(options_.limit);
  }
  if (options_.http_timeout_explicit) {
    config_.set_http_timeout(options_.http_timeout);
  }
  if (options_.http_retries_explicit) {
    config_.set_http_retries(options_.http_retries);
  }
  if (!options_.log_level.empty()) {
    config_.set_log_level(options_.log_level);
  } else if (options_.verbose && config_.log_level() == "info") {
    config_.set_log_level("debug");
  }
  if (!options_.log_file.empty()) {
    config_.set_log_file(options_.log_file);
  }
  if (options_.log_rotate_explicit) {
    config_.set_log_rotate(options_.log_rotate);
  }
  if (options_.log_compress_explicit) {
    config_.set_log_compress(options_.log_compress);
  }
  if (!options_.log_categories.empty()) {
    auto categories = config_.log_categories();
    for (const auto &[name, level] : options_.log_categories) {
      categories[name] = level;
    }
    config_.set_log_categories(std::move(categories));
  }
}

void App::setup_logging() {
  LogOptions log_options;
  try {
    log_options.level = spdlog::level::from_str(config_.log_level());
  } catch (const spdlog::spdlog_ex &) {
    app_log()->warn("Unknown log level '{}', using info", config_.log_level());
  }
  log_options.pattern = config_.log_pattern();
  log_options.file = config_.log_file();
  log_options.rotate_files = static_cast<std::size_t>(config_.log_rotate());
  log_options.compress_rotations = config_.log_compress();
  init_logger(log_options);

  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, level_str] : config_.log_categories()) {
    try {
      category_levels[category] = spdlog::level::from_str(level_str);
    } catch (const spdlog::spdlog_ex &) {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      level_str, category);
    }
  }
  configure_log_categories(category_levels);
}

int App::check_urls() {
  int rc = 0;
  for (const auto &server : config_.servers()) {
    try {
      ServerEndpoint endpoint = resolve_endpoint(server.server_url);
      std::lock_guard<std::mutex> lock(out_mutex_);
      out_ << server.server_url << '\t' << endpoint.web_base() << '\t'
           << endpoint.api_base() << '\t' << endpoint.authenticated_api_base()
           << '\n';
    } catch (const MalformedEndpoint &e) {
      app_log()->error("{}", e.what());
      rc = 1;
    }
  }
  out_.flush();
  return rc;
}

int App::scan_all() {
  if (config_.servers().empty()) {
    app_log()->error("No Gerrit server configured; use --server-url or a "
                     "config file");
    return 1;
  }
  std::shared_ptr<const CredentialStore> credentials;
  if (!config_.credentials_file().empty()) {
    try {
      credentials = std::make_shared<FileCredentialStore>(
          FileCredentialStore::from_file(config_.credentials_file()));
    } catch (const std::exception &e) {
      app_log()->error("Cannot load credentials: {}", e.what());
      return 1;
    }
  }

  int rc = 0;
  if (options_.parallel && config_.servers().size() > 1) {
    std::vector<std::future<int>> scans;
    for (const auto &server : config_.servers()) {
      scans.push_back(std::async(std::launch::async, [this, &server,
                                                      &credentials] {
        return scan_server(server, credentials);
      }));
    }
    for (auto &scan : scans) {
      rc = combine_exit_codes(rc, scan.get());
    }
  } else {
    for (const auto &server : config_.servers()) {
      rc = combine_exit_codes(rc, scan_server(server, credentials));
      if (cancel_.cancelled()) {
        rc = kExitCancelled;
        break;
      }
    }
  }
  out_.flush();
  return rc;
}

int App::scan_server(const NavigatorSettings &server,
                     const std::shared_ptr<const CredentialStore> &credentials) {
  GerritNavigator navigator(server, credentials, config_.scan_options());
  if (client_factory_) {
    navigator.set_client_factory(client_factory_);
  }
  PatternSourceObserver observer(
      config_.include_projects(), config_.exclude_projects(), config_.limit(),
      [this](CandidateSource &&candidate) { emit(candidate); });
  try {
    navigator.visit_sources(observer, cancel_);
  } catch (const ScanCancelled &e) {
    app_log()->warn("{}: {} after {} project(s)", navigator.id(), e.what(),
                    e.submitted());
    return kExitCancelled;
  } catch (const DiscoveryError &e) {
    app_log()->error("{}: {}", navigator.id(), e.what());
    return 1;
  }
  return 0;
}

void App::emit(const CandidateSource &candidate) {
  std::lock_guard<std::mutex> lock(out_mutex_);
  if (options_.format == OutputFormat::Json) {
    nlohmann::ordered_json line;
    line["id"] = candidate.id;
    line["project"] = candidate.project_name;
    line["server_url"] = candidate.endpoint.server_url();
    line["web_base"] = candidate.endpoint.web_base();
    line["api_base"] = candidate.endpoint.api_base();
    line["insecure_https"] = candidate.insecure_https;
    if (candidate.credentials_id) {
      line["credentials_id"] = *candidate.credentials_id;
    } else {
      line["credentials_id"] = nullptr;
    }
    line["traits"] = nlohmann::ordered_json::array();
    for (const auto &trait : candidate.traits) {
      line["traits"].push_back(nlohmann::ordered_json::parse(trait.dump()));
    }
    out_ << line.dump() << '\n';
  } else {
    out_ << candidate.id << '\t' << candidate.project_name << '\t'
         << candidate.endpoint.web_base() << '\n';
  }
}

} // namespace gnav
