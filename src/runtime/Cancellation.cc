#include "runtime/Cancellation.hh"

#include <csignal>

#include <signal.h>

namespace cancellation {
  namespace {
    volatile sig_atomic_t pending_signal = 0;

    const int handled_signals[] = {SIGINT, SIGTERM, SIGHUP, SIGQUIT};

    void handler(int sig) { pending_signal = sig; }
  }

  void install() noexcept {
    struct sigaction sa = {};
    sa.sa_handler = handler;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: blocking waits must return so the request is noticed
    sa.sa_flags = 0;
    for (int sig : handled_signals) {
      sigaction(sig, &sa, nullptr);
    }
  }

  void uninstall() noexcept {
    for (int sig : handled_signals) {
      std::signal(sig, SIG_DFL);
    }
  }

  bool requested() noexcept { return pending_signal != 0; }

  int signal() noexcept { return pending_signal; }

  void request(int sig) noexcept { pending_signal = sig; }

  void reset() noexcept { pending_signal = 0; }
}
