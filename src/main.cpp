#include "app.hpp"
#include "dispatcher.hpp"

#include <chrono>
#include <csignal>

namespace {

adoi::CancellationToken *g_stop = nullptr;

extern "C" void handle_interrupt(int) {
  if (g_stop != nullptr) {
    g_stop->cancel();
  }
}

} // namespace

/**
 * Program entry point: parse options, then run the selected inventory.
 *
 * Ctrl+C stops handing out new tasks; requests already in flight finish and
 * their results are still aggregated.
 *
 * @param argc Number of CLI arguments received from the OS.
 * @param argv Null-terminated array containing the raw CLI arguments.
 * @return Process exit code forwarded from the application logic.
 */
int main(int argc, char **argv) {
  adoi::App app;
  int ret = app.run(argc, argv);
  if (ret != 0 || app.should_exit()) {
    return ret;
  }
  g_stop = app.stop_token().get();
  std::signal(SIGINT, handle_interrupt);
  ret = app.execute();
  adoi::wait_for_abandoned_workers(std::chrono::seconds(3));
  return ret;
}
