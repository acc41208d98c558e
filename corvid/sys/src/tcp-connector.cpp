#include "corvid/tcp-connector.hpp"

#include <netdb.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>

#include "corvid/base-fd.hpp"
#include "corvid/connection.hpp"
#include "corvid/log.hpp"

namespace corvid {

ConnectResult ConnectTCP(const std::string& host, uint16_t port, int family) {
  addrinfo hints{};
  hints.ai_family = family;
  hints.ai_socktype = SOCK_STREAM;

  const std::string portStr = std::to_string(port);
  addrinfo* res = nullptr;
  const int gai = ::getaddrinfo(host.c_str(), portStr.c_str(), &hints, &res);
  std::unique_ptr<addrinfo, void (*)(addrinfo*)> resRAII(res, &::freeaddrinfo);
  ConnectResult connectResult;

  if (gai != 0) [[unlikely]] {
    log::error("ConnectTCP: getaddrinfo('{}', '{}') failed: {}", host, portStr, ::gai_strerror(gai));
    connectResult.failure = true;
    return connectResult;
  }

  for (addrinfo* rp = res; rp != nullptr; rp = rp->ai_next) {
    const int socktype = rp->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC;

    connectResult.cnx = Connection(BaseFd(::socket(rp->ai_family, socktype, rp->ai_protocol)));
    if (!connectResult.cnx) [[unlikely]] {
      const int saved = errno;
      log::error("ConnectTCP: socket() failed (family={}): errno={}, msg={}", rp->ai_family, saved,
                 std::strerror(saved));
      if (saved == EMFILE || saved == ENFILE) {
        break;
      }
      continue;
    }

    if (::connect(connectResult.cnx.fd(), rp->ai_addr, rp->ai_addrlen) == 0) {
      return connectResult;
    }

    const int connectErr = errno;
    if (connectErr == EINPROGRESS || connectErr == EALREADY) {
      connectResult.connectPending = true;
      return connectResult;
    }
    log::warn("ConnectTCP: connect() to {}:{} failed (family={}): errno={}, msg={}", host, port, rp->ai_family,
              connectErr, std::strerror(connectErr));
  }
  connectResult.cnx.close();
  connectResult.failure = true;
  return connectResult;
}

}  // namespace corvid
