#pragma once

#include <csignal>

/**
 * Cooperative cancellation for a run. Interrupt-class signals (INT, TERM, HUP, QUIT) do not kill
 * the run directly. The handler records the signal, blocking calls return early, and the code
 * waiting on a subprocess forwards the request to that subprocess's process group. The run then
 * leaves through the same cleanup path as any other failure.
 */
namespace cancellation {
  /// Install handlers for the interrupt-class signals. Handlers do not restart system calls.
  void install() noexcept;

  /// Restore default handling for the interrupt-class signals
  void uninstall() noexcept;

  /// Has a cancellation been requested?
  bool requested() noexcept;

  /// Which signal requested cancellation (0 if none)
  int signal() noexcept;

  /// Request cancellation as if the given signal had arrived
  void request(int sig) noexcept;

  /// Clear any pending request
  void reset() noexcept;
}
