#include "config.hpp"
#include "document_loader.hpp"
#include "log.hpp"
#include "util/duration.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace gnav {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

/// Hoist the keys of grouped sections into the document root.
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  auto merge_section = [&normalized](std::string_view name) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      return;
    }
    const nlohmann::json section = *it;
    for (const auto &[key, value] : section.items()) {
      normalized[key] = value;
    }
  };

  for (std::string_view section : {"discovery", "http", "network", "logging"}) {
    merge_section(section);
  }

  // Section-local spellings of the flat keys.
  auto alias = [&normalized](const char *from, const char *to) {
    auto it = normalized.find(from);
    if (it != normalized.end() && !normalized.contains(to)) {
      normalized[to] = *it;
    }
  };
  alias("timeout", "http_timeout");
  alias("retries", "http_retries");
  alias("include", "include_projects");
  alias("exclude", "exclude_projects");
  return normalized;
}

std::size_t positive_size(const nlohmann::json &value, const char *key) {
  long long n = value.get<long long>();
  if (n <= 0) {
    throw std::runtime_error(std::string(key) + " must be positive");
  }
  return static_cast<std::size_t>(n);
}

std::chrono::milliseconds timeout_value(const nlohmann::json &value) {
  if (value.is_number_integer()) {
    return std::chrono::seconds(value.get<long long>());
  }
  if (value.is_number()) {
    return std::chrono::milliseconds(
        static_cast<long long>(value.get<double>() * 1000));
  }
  return parse_timeout(value.get<std::string>());
}

std::vector<std::string> pattern_list(const nlohmann::json &value) {
  if (value.is_string()) {
    return {value.get<std::string>()};
  }
  return value.get<std::vector<std::string>>();
}

NavigatorSettings parse_server(const nlohmann::json &entry) {
  NavigatorSettings server;
  if (entry.is_string()) {
    server.server_url = entry.get<std::string>();
  } else if (entry.is_object()) {
    server.server_url = string_member(entry, "server_url");
    if (server.server_url.empty()) {
      server.server_url = string_member(entry, "url");
    }
    if (entry.contains("insecure_https")) {
      server.insecure_https = entry["insecure_https"].get<bool>();
    }
    std::string credentials_id = string_member(entry, "credentials_id");
    if (!credentials_id.empty()) {
      server.credentials_id = credentials_id;
    }
    auto traits = entry.find("traits");
    if (traits != entry.end() && !traits->is_null()) {
      if (!traits->is_array()) {
        throw std::runtime_error("Server traits must be an array");
      }
      for (const auto &trait : *traits) {
        server.traits.push_back(trait);
      }
    }
  } else {
    throw std::runtime_error("Server entries must be strings or objects");
  }
  if (auto error = GerritNavigator::check_server_url(server.server_url)) {
    throw std::runtime_error(*error);
  }
  return server;
}

} // namespace

void Config::set_page_size(std::size_t size) {
  if (size == 0) {
    throw std::invalid_argument("Page size must be positive");
  }
  page_size_ = size;
}

void Config::set_max_pages(std::size_t pages) {
  if (pages == 0) {
    throw std::invalid_argument("Page cap must be positive");
  }
  max_pages_ = pages;
}

ScanOptions Config::scan_options() const {
  ScanOptions options;
  options.pager.page_size = page_size_;
  options.pager.max_pages = max_pages_;
  options.pager.type = project_type_;
  options.timeout = http_timeout_;
  options.retries = http_retries_;
  options.http_proxy = http_proxy_;
  options.https_proxy = https_proxy_;
  return options;
}

/**
 * Populate configuration settings from a JSON object.
 *
 * @param j JSON document holding configuration keys.
 * @throws nlohmann::json::exception When values cannot be converted to the
 *         expected types.
 * @throws std::runtime_error When a server URL or paging value is invalid.
 */
void Config::load_json(const nlohmann::json &j) {
  nlohmann::json cfg = normalize_config_sections(j);

  if (cfg.contains("verbose")) {
    set_verbose(cfg["verbose"].get<bool>());
  }
  if (cfg.contains("servers")) {
    const auto &servers = cfg["servers"];
    if (!servers.is_array()) {
      throw std::runtime_error("servers must be an array");
    }
    std::vector<NavigatorSettings> parsed;
    for (const auto &entry : servers) {
      parsed.push_back(parse_server(entry));
    }
    set_servers(std::move(parsed));
  }
  if (cfg.contains("server_url")) {
    add_server(parse_server(cfg));
  }
  if (cfg.contains("credentials_file")) {
    set_credentials_file(cfg["credentials_file"].get<std::string>());
  }
  if (cfg.contains("page_size")) {
    set_page_size(positive_size(cfg["page_size"], "page_size"));
  }
  if (cfg.contains("max_pages")) {
    set_max_pages(positive_size(cfg["max_pages"], "max_pages"));
  }
  if (cfg.contains("project_type")) {
    try {
      set_project_type(
          project_type_from_string(cfg["project_type"].get<std::string>()));
    } catch (const std::invalid_argument &e) {
      throw std::runtime_error(e.what());
    }
  }
  if (cfg.contains("include_projects")) {
    set_include_projects(pattern_list(cfg["include_projects"]));
  }
  if (cfg.contains("exclude_projects")) {
    set_exclude_projects(pattern_list(cfg["exclude_projects"]));
  }
  if (cfg.contains("limit")) {
    long long limit = cfg["limit"].get<long long>();
    set_limit(limit < 0 ? 0 : static_cast<std::size_t>(limit));
  }
  if (cfg.contains("http_timeout")) {
    try {
      set_http_timeout(timeout_value(cfg["http_timeout"]));
    } catch (const std::invalid_argument &e) {
      throw std::runtime_error(std::string("Invalid http_timeout: ") +
                               e.what());
    }
  }
  if (cfg.contains("http_retries")) {
    set_http_retries(cfg["http_retries"].get<int>());
  }
  if (cfg.contains("http_proxy")) {
    set_http_proxy(cfg["http_proxy"].get<std::string>());
  }
  if (cfg.contains("https_proxy")) {
    set_https_proxy(cfg["https_proxy"].get<std::string>());
  }
  if (cfg.contains("log_level")) {
    set_log_level(cfg["log_level"].get<std::string>());
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(cfg["log_pattern"].get<std::string>());
  }
  if (cfg.contains("log_file")) {
    set_log_file(cfg["log_file"].get<std::string>());
  }
  if (cfg.contains("log_rotate")) {
    set_log_rotate(cfg["log_rotate"].get<int>());
  }
  if (cfg.contains("log_compress")) {
    set_log_compress(cfg["log_compress"].get<bool>());
  }
  if (cfg.contains("log_categories")) {
    std::unordered_map<std::string, std::string> categories;
    const auto &value = cfg["log_categories"];
    auto assign_category = [&categories](std::string name, std::string level) {
      if (name.empty()) {
        return;
      }
      if (level.empty()) {
        level = "debug";
      }
      categories[std::move(name)] = std::move(level);
    };
    auto assign_raw = [&assign_category](const std::string &raw) {
      auto pos = raw.find('=');
      assign_category(pos == std::string::npos ? raw : raw.substr(0, pos),
                      pos == std::string::npos ? std::string{"debug"}
                                               : raw.substr(pos + 1));
    };
    if (value.is_object()) {
      for (const auto &[key, v] : value.items()) {
        if (v.is_string()) {
          assign_category(key, v.get<std::string>());
        } else if (v.is_null()) {
          assign_category(key, "debug");
        } else {
          config_log()->warn("Unsupported value for log category '{}'; "
                             "expected string or null",
                             key);
        }
      }
    } else if (value.is_array()) {
      for (const auto &item : value) {
        if (item.is_string()) {
          assign_raw(item.get<std::string>());
        }
      }
    } else if (value.is_string()) {
      assign_raw(value.get<std::string>());
    }
    set_log_categories(std::move(categories));
  }

  for (const auto &pattern : include_projects_) {
    for (const auto &excluded : exclude_projects_) {
      if (pattern == excluded) {
        config_log()->warn("Pattern '{}' is both included and excluded;"
                           " exclusion takes precedence",
                           pattern);
      }
    }
  }
}

/**
 * Construct a configuration object from a JSON representation.
 *
 * @param j JSON document with configuration values.
 * @return Populated configuration instance.
 */
Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

/**
 * Load configuration from a file on disk.
 *
 * The file type is inferred from the extension and may be YAML, JSON, or
 * TOML. Errors during parsing are logged and rethrown.
 *
 * @param path Filesystem location of the configuration file.
 * @return Fully populated configuration object.
 * @throws std::runtime_error When the file cannot be read or holds invalid
 *         values.
 */
Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  Config cfg;
  try {
    cfg.load_json(load_document(path));
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw;
  }
  config_log()->info("Config loaded successfully from {}", path);
  return cfg;
}

} // namespace gnav
