#include "corvid/supervisor-config.hpp"

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string_view>

namespace corvid {

SupervisorConfig& SupervisorConfig::withNbWorkers(uint32_t nbWorkers) {
  this->nbWorkers = nbWorkers;
  return *this;
}

SupervisorConfig& SupervisorConfig::withShareMode(ShareMode shareMode) {
  this->shareMode = shareMode;
  return *this;
}

SupervisorConfig& SupervisorConfig::withRestartBackoff(std::chrono::milliseconds backoff) {
  this->restartBackoff = backoff;
  return *this;
}

SupervisorConfig& SupervisorConfig::withMinWorkerUptime(std::chrono::milliseconds uptime) {
  this->minWorkerUptime = uptime;
  return *this;
}

SupervisorConfig& SupervisorConfig::withMaxConsecutiveSpawnFailures(uint32_t maxFailures) {
  this->maxConsecutiveSpawnFailures = maxFailures;
  return *this;
}

SupervisorConfig& SupervisorConfig::withShutdownGracePeriod(std::chrono::milliseconds gracePeriod) {
  this->shutdownGracePeriod = gracePeriod;
  return *this;
}

SupervisorConfig& SupervisorConfig::withPollInterval(std::chrono::milliseconds interval) {
  this->pollInterval = interval;
  return *this;
}

void SupervisorConfig::validate() const {
  if (maxConsecutiveSpawnFailures == 0) {
    throw std::invalid_argument("maxConsecutiveSpawnFailures must be > 0");
  }
  if (restartBackoff.count() < 0) {
    throw std::invalid_argument("restartBackoff must be non-negative");
  }
  if (minWorkerUptime.count() < 0) {
    throw std::invalid_argument("minWorkerUptime must be non-negative");
  }
  if (shutdownGracePeriod.count() < 0) {
    throw std::invalid_argument("shutdownGracePeriod must be non-negative");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("pollInterval must be > 0");
  }
}

std::string_view ShareModeToStr(SupervisorConfig::ShareMode shareMode) {
  switch (shareMode) {
    case SupervisorConfig::ShareMode::Inherit:
      return "inherit";
    case SupervisorConfig::ShareMode::ReusePort:
      return "reuseport";
    default:
      return "unknown";
  }
}

}  // namespace corvid
