#include "cli.hpp"
#include "gerrit_client.hpp"
#include "log.hpp"
#include "util/duration.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <cstdint>
#include <memory>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string_view>

#include <spdlog/spdlog.h>

namespace gnav {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 11> categories = {
      "app",      "cli",      "config",  "credentials",   "endpoint",
      "gerrit.client", "http", "navigator", "observer", "pager", "session"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i > 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  return oss.str();
}

} // namespace

/**
 * Parse command line arguments into a CliOptions structure.
 *
 * @param argc Argument count provided to @c main().
 * @param argv Argument vector provided to @c main().
 * @return Fully populated CLI options.
 */
CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"gerritnav: discover the projects of Gerrit servers"};
  app.footer(log_category_help_text());
  CliOptions options;

  app.add_flag("-v,--verbose", options.verbose, "Enable verbose output")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file")
      ->type_name("FILE")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::int64_t) {
           std::cout << "gerritnav " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");

  app.add_option("-s,--server-url", options.server_urls,
                 "Gerrit server to scan (repeatable)")
      ->type_name("URL")
      ->group("Servers");
  app.add_flag("-k,--insecure-https", options.insecure_https,
               "Skip TLS certificate verification for --server-url servers")
      ->group("Servers");
  app.add_option("-c,--credentials-id", options.credentials_id,
                 "Credential used for --server-url servers")
      ->type_name("ID")
      ->group("Servers");
  app.add_option("--credentials-file", options.credentials_file,
                 "File holding credentials (YAML, TOML or JSON)")
      ->type_name("FILE")
      ->group("Servers");

  app.add_option("--page-size", options.page_size,
                 "Projects requested per listing page")
      ->type_name("N")
      ->check(CLI::PositiveNumber)
      ->group("Discovery");
  app.add_option("--max-pages", options.max_pages,
                 "Maximum listing pages fetched per server")
      ->type_name("N")
      ->check(CLI::PositiveNumber)
      ->group("Discovery");
  app.add_option_function<std::string>(
         "--project-type",
         [&options](const std::string &value) {
           try {
             project_type_from_string(value);
           } catch (const std::invalid_argument &e) {
             throw CLI::ValidationError("--project-type", e.what());
           }
           options.project_type = value;
         },
         "Project type to list (code, permissions, all)")
      ->type_name("TYPE")
      ->group("Discovery");
  app.add_option("--include", options.include_projects,
                 "Accept projects matching PATTERN (repeatable)")
      ->type_name("PATTERN")
      ->group("Discovery");
  app.add_option("--exclude", options.exclude_projects,
                 "Reject projects matching PATTERN (repeatable)")
      ->type_name("PATTERN")
      ->group("Discovery");
  CLI::Option *limit_option =
      app.add_option("--limit", options.limit,
                     "Stop a server's scan after N accepted projects "
                     "(0 = no limit)")
          ->type_name("N")
          ->group("Discovery");

  std::string format{"text"};
  app.add_option("--format", format, "Output format")
      ->type_name("FORMAT")
      ->check(CLI::IsMember({"text", "json"}))
      ->default_val("text")
      ->group("Output");
  app.add_flag("--parallel", options.parallel,
               "Scan configured servers concurrently")
      ->group("Output");
  app.add_flag("--check-url", options.check_url,
               "Validate server URLs and print the derived URIs")
      ->group("Output");

  app.add_option(
         "-G,--log-level", options.log_level,
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to rotating log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<std::string>(
         "--log-category",
         [&options](const std::string &value) {
           auto pos = value.find('=');
           std::string name =
               pos == std::string::npos ? value : value.substr(0, pos);
           std::string level = pos == std::string::npos ? std::string{"debug"}
                                                        : value.substr(pos + 1);
           if (name.empty()) {
             throw CLI::ValidationError("--log-category",
                                        "category name must not be empty");
           }
           if (level.empty()) {
             level = "debug";
           }
           options.log_categories[name] = level;
         },
         "Enable a logging category (NAME or NAME=LEVEL). See help footer for "
         "available categories.")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");
  app.add_option_function<int>(
         "--log-rotate",
         [&options](int value) {
           if (value < 0) {
             throw CLI::ValidationError("--log-rotate",
                                        "rotation count must be non-negative");
           }
           options.log_rotate = value;
           options.log_rotate_explicit = true;
         },
         "Number of rotated log files to retain (0 disables rotation)")
      ->type_name("N")
      ->group("Logging");
  app.add_flag_function(
         "--log-compress",
         [&options](std::int64_t) {
           options.log_compress = true;
           options.log_compress_explicit = true;
         },
         "Compress rotated log files with gzip")
      ->group("Logging");

  app.add_option_function<std::string>(
         "--http-timeout",
         [&options](const std::string &value) {
           try {
             options.http_timeout = parse_timeout(value);
           } catch (const std::invalid_argument &e) {
             throw CLI::ValidationError("--http-timeout", e.what());
           }
           options.http_timeout_explicit = true;
         },
         "HTTP request timeout (e.g. 30s, 1500ms, 1m)")
      ->type_name("DURATION")
      ->group("HTTP");
  app.add_option_function<int>(
         "--http-retries",
         [&options](int value) {
           if (value < 0) {
             throw CLI::ValidationError("--http-retries",
                                        "retry count must be non-negative");
           }
           options.http_retries = value;
           options.http_retries_explicit = true;
         },
         "Retries of failed HTTP requests")
      ->type_name("N")
      ->group("HTTP");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }
  options.limit_explicit = limit_option->count() > 0U;
  options.format = format == "json" ? OutputFormat::Json : OutputFormat::Text;
  if (options.check_url && options.parallel) {
    cli_log()->debug("--parallel has no effect with --check-url");
  }
  return options;
}

} // namespace gnav
