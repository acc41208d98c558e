#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

namespace corvid {

struct SupervisorConfig {
  enum class ShareMode : uint8_t {
    // Listening sockets are bound once by the supervisor before forking, workers inherit them.
    Inherit,
    // Each worker binds its own sockets with SO_REUSEPORT (ports must then be fixed, non zero).
    ReusePort
  };

  // Number of worker processes. 0 runs the server in the calling process, without forking.
  uint32_t nbWorkers{0};

  ShareMode shareMode{ShareMode::Inherit};

  // Delay before restarting a worker that exited less than minWorkerUptime after its start.
  std::chrono::milliseconds restartBackoff{std::chrono::milliseconds{100}};

  std::chrono::milliseconds minWorkerUptime{std::chrono::seconds{1}};

  // Number of consecutive failed spawns (fork failures, or workers failing right after their start)
  // after which the supervisor gives up.
  uint32_t maxConsecutiveSpawnFailures{5};

  // Time left to workers to exit after a stop request before they are killed.
  std::chrono::milliseconds shutdownGracePeriod{std::chrono::seconds{5}};

  // Period at which the supervisor checks for exited workers and signals.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{50}};

  SupervisorConfig& withNbWorkers(uint32_t nbWorkers);

  SupervisorConfig& withShareMode(ShareMode shareMode);

  SupervisorConfig& withRestartBackoff(std::chrono::milliseconds backoff);

  SupervisorConfig& withMinWorkerUptime(std::chrono::milliseconds uptime);

  SupervisorConfig& withMaxConsecutiveSpawnFailures(uint32_t maxFailures);

  SupervisorConfig& withShutdownGracePeriod(std::chrono::milliseconds gracePeriod);

  SupervisorConfig& withPollInterval(std::chrono::milliseconds interval);

  // Throws std::invalid_argument if the config is not valid.
  void validate() const;

  bool operator==(const SupervisorConfig&) const = default;
};

std::string_view ShareModeToStr(SupervisorConfig::ShareMode shareMode);

}  // namespace corvid
