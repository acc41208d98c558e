#pragma once

#include <chrono>

namespace corvid {

class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Installs handlers for SIGINT and SIGTERM (graceful stop request) and SIGHUP (reload request).
  // maxDrainPeriod specifies the maximum time to allow for graceful draining
  // after a termination signal is received (default: 5000 ms, 0: no limit).
  static void Enable(std::chrono::milliseconds maxDrainPeriod = std::chrono::milliseconds{5000});

  // Disables the signal handlers and restores default behavior.
  static void Disable();

  // Returns true if a termination signal was received.
  static bool IsStopRequested();

  // Number of the last termination signal received, 0 if none.
  static int StopSignal();

  // Returns true (once) if SIGHUP was received since the last call.
  static bool ConsumeReloadRequest();

  // Returns the maximum drain period configured for signal handling.
  static std::chrono::milliseconds GetMaxDrainPeriod();

  // Resets the stop and reload flags. Used by freshly forked workers and by tests.
  static void ResetStopRequest();
};

}  // namespace corvid
