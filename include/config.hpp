#ifndef GERRITNAV_CONFIG_HPP
#define GERRITNAV_CONFIG_HPP

#include "gerrit_client.hpp"
#include "navigator.hpp"

#include <chrono>
#include <cstddef>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace gnav {

/// Application configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /** Check whether verbose output is enabled. */
  bool verbose() const { return verbose_; }

  /// Set verbose output mode.
  void set_verbose(bool verbose) { verbose_ = verbose; }

  /// Servers to scan, one navigator each.
  const std::vector<NavigatorSettings> &servers() const { return servers_; }

  /// Replace the server list.
  void set_servers(std::vector<NavigatorSettings> servers) {
    servers_ = std::move(servers);
  }

  /// Append a server.
  void add_server(NavigatorSettings server) {
    servers_.push_back(std::move(server));
  }

  /// Path of the credentials file (empty = no credentials).
  const std::string &credentials_file() const { return credentials_file_; }

  void set_credentials_file(const std::string &path) {
    credentials_file_ = path;
  }

  /// Projects requested per listing page.
  std::size_t page_size() const { return page_size_; }

  /// Set the page size.
  /// @throws std::invalid_argument if @p size is zero.
  void set_page_size(std::size_t size);

  /// Upper bound on pages fetched per scan.
  std::size_t max_pages() const { return max_pages_; }

  /// Set the page cap.
  /// @throws std::invalid_argument if @p pages is zero.
  void set_max_pages(std::size_t pages);

  /// Project type filter of the listing.
  ProjectType project_type() const { return project_type_; }

  void set_project_type(ProjectType type) { project_type_ = type; }

  /// Project name patterns to accept (empty = all).
  const std::vector<std::string> &include_projects() const {
    return include_projects_;
  }

  void set_include_projects(std::vector<std::string> patterns) {
    include_projects_ = std::move(patterns);
  }

  /// Project name patterns to reject.
  const std::vector<std::string> &exclude_projects() const {
    return exclude_projects_;
  }

  void set_exclude_projects(std::vector<std::string> patterns) {
    exclude_projects_ = std::move(patterns);
  }

  /// Accepted candidates per server before the scan stops (0 = unlimited).
  std::size_t limit() const { return limit_; }

  void set_limit(std::size_t limit) { limit_ = limit; }

  /// HTTP request timeout.
  std::chrono::milliseconds http_timeout() const { return http_timeout_; }

  /// Set HTTP request timeout.
  void set_http_timeout(std::chrono::milliseconds timeout) {
    http_timeout_ = timeout;
  }

  /// Number of HTTP retry attempts.
  int http_retries() const { return http_retries_; }

  /// Set number of HTTP retry attempts.
  void set_http_retries(int retries) {
    http_retries_ = retries < 0 ? 0 : retries;
  }

  /// Proxy URL for HTTP requests.
  const std::string &http_proxy() const { return http_proxy_; }

  /// Set proxy URL for HTTP requests.
  void set_http_proxy(const std::string &proxy) { http_proxy_ = proxy; }

  /// Proxy URL for HTTPS requests.
  const std::string &https_proxy() const { return https_proxy_; }

  /// Set proxy URL for HTTPS requests.
  void set_https_proxy(const std::string &proxy) { https_proxy_ = proxy; }

  /// Get logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Get logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Path to the log file.
  const std::string &log_file() const { return log_file_; }

  /// Set path of the log file.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to retain (0 disables rotation).
  int log_rotate() const { return log_rotate_; }

  /// Set number of rotated log files to retain.
  void set_log_rotate(int count) { log_rotate_ = count < 0 ? 0 : count; }

  /// Whether rotated log files are compressed.
  bool log_compress() const { return log_compress_; }

  /// Enable or disable compression of rotated log files.
  void set_log_compress(bool enable) { log_compress_ = enable; }

  /// Per-category log level overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace the category level overrides.
  void set_log_categories(
      std::unordered_map<std::string, std::string> categories) {
    log_categories_ = std::move(categories);
  }

  /// Paging, transport and logging tunables for the navigators.
  ScanOptions scan_options() const;

  /// Load configuration from a JSON object.
  void load_json(const nlohmann::json &j);

  /// Create a Config from a JSON object.
  static Config from_json(const nlohmann::json &j);

  /// Load configuration from the file at `path`.
  static Config from_file(const std::string &path);

private:
  bool verbose_ = false;
  std::vector<NavigatorSettings> servers_;
  std::string credentials_file_;
  std::size_t page_size_ = 50;
  std::size_t max_pages_ = 10000;
  ProjectType project_type_ = ProjectType::Code;
  std::vector<std::string> include_projects_;
  std::vector<std::string> exclude_projects_;
  std::size_t limit_ = 0;
  std::chrono::milliseconds http_timeout_{30000};
  int http_retries_ = 0;
  std::string http_proxy_;
  std::string https_proxy_;
  std::string log_level_ = "info";
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_ = 3;
  bool log_compress_ = false;
  std::unordered_map<std::string, std::string> log_categories_;
};

} // namespace gnav

#endif // GERRITNAV_CONFIG_HPP
