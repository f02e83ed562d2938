#include "discovery_session.hpp"
#include "log.hpp"

#include <exception>
#include <utility>

namespace gnav {

DiscoverySession::DiscoverySession(SourceObserver &observer,
                                   DiscoveryContext context,
                                   std::shared_ptr<spdlog::logger> logger)
    : observer_(observer), context_(std::move(context)),
      log_(std::move(logger)) {
  if (!log_) {
    ensure_default_logger();
    log_ = category_logger("session");
  }
  log_->debug("Opening discovery session for {}", context_.navigator_id);
  observer_.on_session_open(context_);
}

DiscoverySession::~DiscoverySession() {
  if (closed_) {
    return;
  }
  try {
    close(ScanOutcome::Failed);
  } catch (const std::exception &e) {
    log_->error("Closing discovery session failed: {}", e.what());
  }
}

bool DiscoverySession::submit(const RemoteProject &project,
                              const CandidateFactory &factory) {
  ++context_.submitted;
  log_->trace("Submitting project {}", project.name);
  return observer_.process(project, factory, context_);
}

void DiscoverySession::close(ScanOutcome outcome) {
  if (closed_) {
    return;
  }
  closed_ = true;
  log_->debug("Closing discovery session for {} after {} project(s): {}",
              context_.navigator_id, context_.submitted, to_string(outcome));
  observer_.on_session_close(context_, outcome);
}

} // namespace gnav
