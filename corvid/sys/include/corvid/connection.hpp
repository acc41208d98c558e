#pragma once

#include "corvid/base-fd.hpp"
#include "corvid/socket.hpp"

namespace corvid {

// RAII class wrapping a connected socket, either accepted from a listening Socket or
// created by ConnectTCP.
class Connection {
 public:
  Connection() noexcept = default;

  // Accept one pending connection (non-blocking, close-on-exec).
  // The result is empty (operator bool false) if nothing is pending or accept failed (logged).
  explicit Connection(const Socket& socket);

  // Takes ownership of an existing fd.
  explicit Connection(BaseFd&& bd) noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  void close() noexcept { _baseFd.close(); }

  bool operator==(const Connection&) const noexcept = default;

 private:
  BaseFd _baseFd;
};

}  // namespace corvid
