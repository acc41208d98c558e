#include "corvid/worker-supervisor.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>

#include "corvid/log.hpp"
#include "corvid/signal-handler.hpp"
#include "corvid/supervisor-config.hpp"
#include "corvid/timedef.hpp"

namespace corvid {

namespace {

// Returns true if the process exited (or does not exist anymore).
bool ReapWorker(pid_t pid) {
  int status = 0;
  pid_t ret;
  do {
    ret = ::waitpid(pid, &status, WNOHANG);
  } while (ret == -1 && errno == EINTR);
  return ret != 0;
}

void WaitWorker(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
  }
}

void LogWorkerExit(uint32_t idx, pid_t pid, int status) {
  if (WIFEXITED(status)) {
    log::warn("Worker {} (pid {}) exited with status {}", idx, pid, WEXITSTATUS(status));
  } else if (WIFSIGNALED(status)) {
    log::warn("Worker {} (pid {}) killed by signal {}", idx, pid, WTERMSIG(status));
  } else {
    log::warn("Worker {} (pid {}) terminated", idx, pid);
  }
}

}  // namespace

WorkerSupervisor::WorkerSupervisor(SupervisorConfig config, WorkerMain workerMain)
    : _config(std::move(config)), _workerMain(std::move(workerMain)) {
  _config.validate();
  if (_config.nbWorkers == 0) {
    throw std::invalid_argument("WorkerSupervisor needs at least one worker");
  }
  if (!_workerMain) {
    throw std::invalid_argument("WorkerSupervisor needs a worker main function");
  }
}

WorkerSupervisor::~WorkerSupervisor() {
  if (!_workers.empty()) {
    terminateWorkers();
  }
}

void WorkerSupervisor::run() {
  log::info("Starting {} worker(s)", _config.nbWorkers);
  _consecutiveFailures = 0;
  for (uint32_t idx = 0; idx < _config.nbWorkers; ++idx) {
    spawn(idx);
  }

  while (!_stopRequested.load(std::memory_order_relaxed) && !SignalHandler::IsStopRequested()) {
    reapExitedWorkers();
    spawnPendingWorkers();
    if (SignalHandler::ConsumeReloadRequest()) {
      log::info("Forwarding reload request to {} worker(s)", _workers.size());
      signalWorkers(SIGHUP);
    }
    std::this_thread::sleep_for(_config.pollInterval);
  }

  log::info("Stopping {} worker(s)", _workers.size());
  _pendingSpawns.clear();
  terminateWorkers();
  _stopRequested.store(false, std::memory_order_relaxed);
  log::info("All workers stopped");
}

void WorkerSupervisor::spawn(uint32_t idx) {
  const auto now = SteadyClock::now();
  const pid_t pid = ::fork();
  if (pid == -1) {
    log::error("fork failed for worker {}: {}", idx, std::strerror(errno));
    _pendingSpawns.push_back(PendingSpawn{idx, now + _config.restartBackoff});
    recordSpawnFailure();
    return;
  }
  if (pid == 0) {
    runWorker(idx);
  }
  _workers.push_back(WorkerInfo{idx, pid, now});
  log::info("Spawned worker {} (pid {})", idx, pid);
}

void WorkerSupervisor::runWorker(uint32_t idx) {
  // The stop / reload flags of the supervisor are not meant for the child.
  SignalHandler::ResetStopRequest();
  int status = EXIT_FAILURE;
  try {
    status = _workerMain(idx);
  } catch (const std::exception& ex) {
    log::critical("Worker {} failed: {}", idx, ex.what());
  } catch (...) {
    log::critical("Worker {} failed with an unknown exception", idx);
  }
  log::default_logger()->flush();
  // Leave without running the destructors of the supervisor state copied by fork.
  ::_exit(status);
}

void WorkerSupervisor::reapExitedWorkers() {
  int status = 0;
  pid_t pid;
  while ((pid = ::waitpid(-1, &status, WNOHANG)) > 0) {
    const auto it = std::ranges::find_if(_workers, [pid](const WorkerInfo& worker) { return worker.pid == pid; });
    if (it == _workers.end()) {
      log::debug("Reaped unknown child pid {}", pid);
      continue;
    }
    const WorkerInfo worker = *it;
    _workers.erase(it);
    LogWorkerExit(worker.idx, worker.pid, status);

    const auto now = SteadyClock::now();
    if (now - worker.startTp < _config.minWorkerUptime) {
      _pendingSpawns.push_back(PendingSpawn{worker.idx, now + _config.restartBackoff});
      recordSpawnFailure();
    } else {
      _consecutiveFailures = 0;
      _pendingSpawns.push_back(PendingSpawn{worker.idx, now});
    }
  }
}

void WorkerSupervisor::spawnPendingWorkers() {
  const auto now = SteadyClock::now();
  auto pendingSpawns = std::exchange(_pendingSpawns, {});
  for (const PendingSpawn& pending : pendingSpawns) {
    if (pending.notBefore <= now) {
      ++_nbRestarts;
      log::info("Restarting worker {}", pending.idx);
      spawn(pending.idx);
    } else {
      _pendingSpawns.push_back(pending);
    }
  }
}

void WorkerSupervisor::recordSpawnFailure() {
  if (++_consecutiveFailures < _config.maxConsecutiveSpawnFailures) {
    return;
  }
  log::critical("{} consecutive worker spawn failures, giving up", _consecutiveFailures);
  _pendingSpawns.clear();
  terminateWorkers();
  throw std::runtime_error(fmt::format("{} consecutive worker spawn failures", _consecutiveFailures));
}

void WorkerSupervisor::signalWorkers(int sigNum) const {
  for (const WorkerInfo& worker : _workers) {
    if (::kill(worker.pid, sigNum) == -1) {
      log::warn("Unable to send signal {} to worker {} (pid {}): {}", sigNum, worker.idx, worker.pid,
                std::strerror(errno));
    }
  }
}

void WorkerSupervisor::terminateWorkers() {
  signalWorkers(SIGTERM);
  const auto deadline = SteadyClock::now() + _config.shutdownGracePeriod;
  while (true) {
    std::erase_if(_workers, [](const WorkerInfo& worker) { return ReapWorker(worker.pid); });
    if (_workers.empty()) {
      break;
    }
    if (SteadyClock::now() >= deadline) {
      for (const WorkerInfo& worker : _workers) {
        log::warn("Worker {} (pid {}) still alive after the grace period, killing it", worker.idx, worker.pid);
        if (::kill(worker.pid, SIGKILL) == -1) {
          log::error("Unable to kill worker pid {}: {}", worker.pid, std::strerror(errno));
          continue;
        }
        WaitWorker(worker.pid);
      }
      _workers.clear();
      break;
    }
    std::this_thread::sleep_for(_config.pollInterval);
  }
}

}  // namespace corvid
