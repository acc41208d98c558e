#include "corvid/signal-handler.hpp"

#include <chrono>
#include <csignal>

namespace {

volatile std::sig_atomic_t g_stopSignal{};
volatile std::sig_atomic_t g_reloadRequested{};
std::chrono::milliseconds g_maxDrainPeriod{5000};

}  // namespace

extern "C" void CorvidSignalHandler(int sigNum) {
  if (sigNum == SIGHUP) {
    g_reloadRequested = 1;
  } else {
    g_stopSignal = sigNum;
  }
}

namespace corvid {

namespace {

// No SA_RESTART: a pending epoll_wait / sleep must be interrupted so that the flags are observed promptly.
void Install(int sigNum, void (*handler)(int)) {
  struct sigaction action{};
  action.sa_handler = handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  ::sigaction(sigNum, &action, nullptr);
}

}  // namespace

void SignalHandler::Enable(std::chrono::milliseconds maxDrainPeriod) {
  Install(SIGINT, ::CorvidSignalHandler);
  Install(SIGTERM, ::CorvidSignalHandler);
  Install(SIGHUP, ::CorvidSignalHandler);
  g_maxDrainPeriod = maxDrainPeriod;
}

void SignalHandler::Disable() {
  Install(SIGINT, SIG_DFL);
  Install(SIGTERM, SIG_DFL);
  Install(SIGHUP, SIG_DFL);
}

bool SignalHandler::IsStopRequested() { return g_stopSignal != 0; }

int SignalHandler::StopSignal() { return g_stopSignal; }

bool SignalHandler::ConsumeReloadRequest() {
  if (g_reloadRequested == 0) {
    return false;
  }
  g_reloadRequested = 0;
  return true;
}

std::chrono::milliseconds SignalHandler::GetMaxDrainPeriod() { return g_maxDrainPeriod; }

void SignalHandler::ResetStopRequest() {
  g_stopSignal = 0;
  g_reloadRequested = 0;
}

}  // namespace corvid
