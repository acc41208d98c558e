#pragma once

#include <cstdint>
#include <string>

#include "corvid/connection.hpp"

namespace corvid {

struct ConnectResult {
  Connection cnx;
  bool connectPending{false};
  bool failure{false};
};

// Resolve host:port and start a non-blocking connect to the first address that accepts it.
// connectPending is set when the connect completes asynchronously (EINPROGRESS): completion is
// signalled by writability, and the outcome must then be read with GetSocketError.
// failure is set (and logged) when no address could be connected.
ConnectResult ConnectTCP(const std::string& host, uint16_t port, int family = 0);

}  // namespace corvid
