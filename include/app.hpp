/**
 * @file app.hpp
 * @brief Main application entry point and orchestrator for gerritnav.
 *
 * Declares the App class, which manages high-level application flow,
 * configuration loading, CLI parsing and the per-server discovery scans.
 */

#ifndef GERRITNAV_APP_HPP
#define GERRITNAV_APP_HPP

#include "cancellation.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "credentials.hpp"
#include "navigator.hpp"
#include "source_observer.hpp"

#include <iosfwd>
#include <memory>
#include <mutex>
#include <vector>

namespace gnav {

/// Exit code reported when a scan was cancelled by a signal.
constexpr int kExitCancelled = 130;

/**
 * Main application entry point responsible for orchestrating high level
 * application flow, configuration loading, and CLI parsing.
 */
class App {
public:
  /// @param out Stream receiving accepted candidates.
  explicit App(std::ostream &out);
  App();

  /**
   * Run the application with the given command line arguments.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return 0 on success, 1 when any scan or the setup failed and
   *         kExitCancelled when the run was cancelled.
   */
  int run(int argc, char **argv);

  /// Parsed command line options.
  const CliOptions &options() const { return options_; }

  /// Configuration after CLI overrides were applied.
  const Config &config() const { return config_; }

  /// Whether `run()` stopped before scanning (help, version, errors).
  bool should_exit() const { return should_exit_; }

  /// Token cancelling every running scan; safe to copy into a signal handler.
  const CancellationToken &cancellation() const { return cancel_; }

  /// Create API clients through @p factory instead of libcurl.
  void set_client_factory(ClientFactory factory) {
    client_factory_ = std::move(factory);
  }

private:
  void merge_options();
  void setup_logging();
  int check_urls();
  int scan_all();
  int scan_server(const NavigatorSettings &server,
                  const std::shared_ptr<const CredentialStore> &credentials);
  void emit(const CandidateSource &candidate);

  std::ostream &out_;
  std::mutex out_mutex_;
  CliOptions options_;
  Config config_;
  CancellationToken cancel_;
  ClientFactory client_factory_;
  bool should_exit_{false};
};

} // namespace gnav

#endif // GERRITNAV_APP_HPP
