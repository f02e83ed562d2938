/**
 * @file discovery_session.hpp
 * @brief Scoped lifetime of one observer scan.
 */
#ifndef GERRITNAV_DISCOVERY_SESSION_HPP
#define GERRITNAV_DISCOVERY_SESSION_HPP

#include "source_observer.hpp"

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>

namespace gnav {

/**
 * Binds an observer to one scan.
 *
 * Opening the session notifies the observer; close() notifies it once with
 * the scan's outcome. A session destroyed without being closed reports
 * ScanOutcome::Failed, so every exit path of a scan closes exactly once.
 */
class DiscoverySession {
public:
  DiscoverySession(SourceObserver &observer, DiscoveryContext context,
                   std::shared_ptr<spdlog::logger> logger);
  ~DiscoverySession();

  DiscoverySession(const DiscoverySession &) = delete;
  DiscoverySession &operator=(const DiscoverySession &) = delete;

  /**
   * Hand one project to the observer.
   *
   * @return `true` when the observer asked to stop.
   */
  bool submit(const RemoteProject &project, const CandidateFactory &factory);

  /// Close the session; later calls are ignored.
  void close(ScanOutcome outcome);

  bool closed() const { return closed_; }
  std::size_t submitted() const { return context_.submitted; }
  const DiscoveryContext &context() const { return context_; }

private:
  SourceObserver &observer_;
  DiscoveryContext context_;
  std::shared_ptr<spdlog::logger> log_;
  bool closed_{false};
};

} // namespace gnav

#endif // GERRITNAV_DISCOVERY_SESSION_HPP
