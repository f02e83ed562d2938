/**
 * @file source_observer.hpp
 * @brief Candidate sources and the observers that receive them.
 *
 * The navigator hands every discovered project to a SourceObserver together
 * with a factory building the project's CandidateSource. Observers own the
 * acceptance policy and decide whether the scan continues.
 */
#ifndef GERRITNAV_SOURCE_OBSERVER_HPP
#define GERRITNAV_SOURCE_OBSERVER_HPP

#include "gerrit_client.hpp"
#include "server_endpoint.hpp"

#include <cstddef>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace gnav {

/// Per-project descriptor produced during discovery.
struct CandidateSource {
  std::string id;           ///< `<navigator id>::<project name>`
  std::string project_name; ///< Gerrit project name
  ServerEndpoint endpoint;  ///< Server the project lives on
  bool insecure_https{false};
  std::optional<std::string> credentials_id;
  std::vector<nlohmann::json> traits; ///< Opaque, passed through unmodified
};

/// Builds the candidate of one project on demand.
using CandidateFactory = std::function<CandidateSource()>;

/// How a scan ended.
enum class ScanOutcome {
  Completed, ///< Listing exhausted
  Stopped,   ///< Observer requested early termination
  Cancelled, ///< Cancellation token was set
  Failed     ///< An error aborted the scan
};

/// Lowercase name of the outcome.
std::string to_string(ScanOutcome outcome);

/// Read-only view of the scan an observer is taking part in.
struct DiscoveryContext {
  std::string navigator_id;
  ServerEndpoint endpoint;
  std::vector<nlohmann::json> traits;
  std::size_t submitted{0}; ///< Projects submitted so far
};

/** Receiver of discovered projects. */
class SourceObserver {
public:
  virtual ~SourceObserver() = default;

  /**
   * Handle one discovered project.
   *
   * @param project Project as listed by the server.
   * @param factory Builds the project's candidate; call it only for
   *        projects that are accepted.
   * @param context Scan the project belongs to.
   * @return `true` to stop the scan after this project.
   */
  virtual bool process(const RemoteProject &project,
                       const CandidateFactory &factory,
                       const DiscoveryContext &context) = 0;

  /// Called once before the first project of a scan.
  virtual void on_session_open(const DiscoveryContext &context) {
    (void)context;
  }

  /// Called once when a scan ends, whatever the outcome.
  virtual void on_session_close(const DiscoveryContext &context,
                                ScanOutcome outcome) {
    (void)context;
    (void)outcome;
  }
};

/**
 * Check whether a project name matches any of the patterns.
 *
 * Patterns may carry a `prefix:`, `suffix:`, `contains:`, `literal:`,
 * `glob:` or `regex:` tag. Untagged patterns containing `*` or `?` are globs,
 * anything else must match literally. Invalid regular expressions never
 * match.
 */
bool matches_pattern(const std::string &name,
                     const std::vector<std::string> &patterns);

/**
 * Observer accepting projects by name patterns.
 *
 * A project is accepted when it matches an include pattern (or no include
 * patterns are configured) and no exclude pattern. Accepted candidates are
 * forwarded to the sink; the scan is stopped once `limit` candidates were
 * accepted (0 = unlimited).
 */
class PatternSourceObserver : public SourceObserver {
public:
  using Sink = std::function<void(CandidateSource &&)>;

  PatternSourceObserver(std::vector<std::string> include,
                        std::vector<std::string> exclude, std::size_t limit,
                        Sink sink);

  bool process(const RemoteProject &project, const CandidateFactory &factory,
               const DiscoveryContext &context) override;

  void on_session_close(const DiscoveryContext &context,
                        ScanOutcome outcome) override;

  std::size_t accepted() const { return accepted_; }
  std::size_t rejected() const { return rejected_; }

private:
  std::vector<std::string> include_;
  std::vector<std::string> exclude_;
  std::size_t limit_;
  Sink sink_;
  std::size_t accepted_{0};
  std::size_t rejected_{0};
};

/// Observer keeping every candidate in memory.
class CollectingSourceObserver : public SourceObserver {
public:
  /// @param stop_after Request stop after this many candidates (0 = never).
  explicit CollectingSourceObserver(std::size_t stop_after = 0)
      : stop_after_(stop_after) {}

  bool process(const RemoteProject &project, const CandidateFactory &factory,
               const DiscoveryContext &context) override;

  void on_session_open(const DiscoveryContext &context) override;
  void on_session_close(const DiscoveryContext &context,
                        ScanOutcome outcome) override;

  const std::vector<CandidateSource> &candidates() const {
    return candidates_;
  }
  int sessions_opened() const { return opened_; }
  int sessions_closed() const { return closed_; }
  std::optional<ScanOutcome> outcome() const { return outcome_; }

private:
  std::size_t stop_after_;
  std::vector<CandidateSource> candidates_;
  int opened_{0};
  int closed_{0};
  std::optional<ScanOutcome> outcome_;
};

} // namespace gnav

#endif // GERRITNAV_SOURCE_OBSERVER_HPP
