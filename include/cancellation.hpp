/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation flag shared between a scan and its owner.
 */
#ifndef GERRITNAV_CANCELLATION_HPP
#define GERRITNAV_CANCELLATION_HPP

#include <atomic>
#include <memory>

namespace gnav {

/**
 * Copyable handle to a shared cancellation flag.
 *
 * Copies observe the same flag, so a signal handler or another thread can
 * cancel a scan running elsewhere. Scans poll the flag between projects.
 */
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const noexcept { flag_->store(true); }

  bool cancelled() const noexcept { return flag_->load(); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace gnav

#endif // GERRITNAV_CANCELLATION_HPP
