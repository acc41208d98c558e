#pragma once

#include <sys/types.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

#include "corvid/supervisor-config.hpp"
#include "corvid/timedef.hpp"

namespace corvid {

// Pre-forks and monitors worker processes.
//
// Each worker runs WorkerMain in a child process, its return value becomes the exit status of the child.
// A worker that exits while the supervisor is running is restarted; a worker that dies sooner than
// SupervisorConfig::minWorkerUptime after its start counts as a failed spawn, as does a fork() failure, and
// delays its restart by SupervisorConfig::restartBackoff. Too many consecutive failed spawns terminate the
// workers and make run() throw.
//
// Signals (see SignalHandler, which must be enabled by the caller): a stop request is forwarded to the workers
// as SIGTERM, and those still alive after SupervisorConfig::shutdownGracePeriod are killed. A reload request is
// forwarded as SIGHUP.
class WorkerSupervisor {
 public:
  using WorkerMain = std::function<int(uint32_t workerIdx)>;

  struct WorkerInfo {
    uint32_t idx{};
    pid_t pid{};
    SteadyTimePoint startTp;
  };

  // Throws std::invalid_argument if config is invalid, nbWorkers is 0 or workerMain is empty.
  WorkerSupervisor(SupervisorConfig config, WorkerMain workerMain);

  WorkerSupervisor(const WorkerSupervisor&) = delete;
  WorkerSupervisor(WorkerSupervisor&&) = delete;
  WorkerSupervisor& operator=(const WorkerSupervisor&) = delete;
  WorkerSupervisor& operator=(WorkerSupervisor&&) = delete;

  ~WorkerSupervisor();

  // Spawns the workers and supervises them until a stop request, then waits for their exit.
  // Throws std::runtime_error after maxConsecutiveSpawnFailures consecutive failed spawns.
  void run();

  // Thread safe, same effect as a termination signal.
  void stop() noexcept { _stopRequested.store(true, std::memory_order_relaxed); }

  // Currently running workers (supervisor process only).
  [[nodiscard]] const std::vector<WorkerInfo>& workers() const noexcept { return _workers; }

  [[nodiscard]] uint32_t nbRestarts() const noexcept { return _nbRestarts; }

 private:
  struct PendingSpawn {
    uint32_t idx{};
    SteadyTimePoint notBefore;
  };

  void spawn(uint32_t idx);
  [[noreturn]] void runWorker(uint32_t idx);
  void reapExitedWorkers();
  void spawnPendingWorkers();
  void recordSpawnFailure();
  void signalWorkers(int sigNum) const;
  void terminateWorkers();

  SupervisorConfig _config;
  WorkerMain _workerMain;
  std::vector<WorkerInfo> _workers;
  std::vector<PendingSpawn> _pendingSpawns;
  uint32_t _consecutiveFailures{0};
  uint32_t _nbRestarts{0};
  std::atomic<bool> _stopRequested{false};
};

}  // namespace corvid
