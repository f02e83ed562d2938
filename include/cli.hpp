/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for gerritnav.
 *
 * Declares CLI parsing helpers, option structures, and related exceptions for
 * the tool.
 */

#ifndef GERRITNAV_CLI_HPP
#define GERRITNAV_CLI_HPP

#include <chrono>
#include <cstddef>
#include <exception>
#include <string>
#include <unordered_map>
#include <vector>

namespace gnav {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Exit code that triggered the exception.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/// Output format of accepted candidates.
enum class OutputFormat { Text, Json };

/**
 * Parsed command line options supplied via the CLI.
 *
 * Values flagged `*_explicit` override the configuration file; everything
 * else only applies when set.
 */
struct CliOptions {
  bool verbose{false};      ///< Enable debug logging
  std::string config_file;  ///< Optional configuration file

  // Servers
  std::vector<std::string> server_urls; ///< Servers given with --server-url
  bool insecure_https{false};           ///< Skip TLS verification
  std::string credentials_id;           ///< Credential for CLI servers
  std::string credentials_file;         ///< Credentials file override

  // Discovery
  std::size_t page_size{0};  ///< 0 keeps the configured page size
  std::size_t max_pages{0};  ///< 0 keeps the configured page cap
  std::string project_type;  ///< Empty keeps the configured type
  std::vector<std::string> include_projects; ///< Name patterns to accept
  std::vector<std::string> exclude_projects; ///< Name patterns to reject
  std::size_t limit{0};                      ///< Accepted candidates per server
  bool limit_explicit{false};                ///< True if CLI set --limit

  // Output
  OutputFormat format{OutputFormat::Text};
  bool parallel{false};  ///< Scan servers concurrently
  bool check_url{false}; ///< Only validate and print derived URIs

  // Logging
  std::string log_level; ///< Empty keeps the configured level
  std::string log_file;  ///< Path of the log file
  int log_rotate{3};     ///< Rotated log files to keep
  bool log_rotate_explicit{false};
  bool log_compress{false}; ///< gzip rotated log files
  bool log_compress_explicit{false};
  std::unordered_map<std::string, std::string> log_categories;

  // HTTP
  std::chrono::milliseconds http_timeout{30000};
  bool http_timeout_explicit{false};
  int http_retries{0};
  bool http_retries_explicit{false};
};

/**
 * Parse command line arguments and return the normalized options structure.
 *
 * @param argc Number of elements supplied in @p argv.
 * @param argv Null-terminated array of raw CLI argument strings.
 * @return Populated options structure describing the requested behaviour.
 * @throws CliParseExit When parsing fails or `--help`/`--version` ask the
 *         application to exit early.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace gnav

#endif // GERRITNAV_CLI_HPP
