#pragma once

#include <cstdint>
#include <string_view>
#include <utility>

#include "corvid/base-fd.hpp"

namespace corvid {

// RAII listening socket.
class Socket {
 public:
  Socket() noexcept = default;

  // Takes ownership of an already created socket fd.
  explicit Socket(BaseFd&& baseFd) noexcept : _baseFd(std::move(baseFd)) {}

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Resolve host (empty or "*" means any IPv4 address), create a non-blocking close-on-exec socket of the
  // matching family, bind it and start listening. SO_REUSEADDR is always set, SO_REUSEPORT on demand.
  // If port is 0, an ephemeral port is chosen and written back into the argument.
  // Throws std::system_error on failure, std::invalid_argument if host cannot be resolved.
  void bindAndListen(std::string_view host, uint16_t& port, bool reusePort, int backlog);

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace corvid
