#include "app.hpp"
#include "cancellation.hpp"

#include <csignal>
#include <spdlog/spdlog.h>

namespace {

gnav::CancellationToken *g_cancel = nullptr;

void handle_signal(int) {
  if (g_cancel != nullptr) {
    g_cancel->cancel();
  }
}

} // namespace

/**
 * Program entry point.
 *
 * SIGINT and SIGTERM cancel the running scans cooperatively; the scans stop
 * after the project being processed and the process exits with 130.
 *
 * @return Process exit code forwarded from the application logic.
 */
int main(int argc, char **argv) {
  gnav::App app;
  gnav::CancellationToken cancel = app.cancellation();
  g_cancel = &cancel;
  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);

  int ret = app.run(argc, argv);

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  g_cancel = nullptr;
  spdlog::shutdown();
  return ret;
}
