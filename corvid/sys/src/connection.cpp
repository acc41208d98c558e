#include "corvid/connection.hpp"

#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "corvid/base-fd.hpp"
#include "corvid/log.hpp"
#include "corvid/socket.hpp"

namespace corvid {

namespace {

// Returns the accepted fd, or BaseFd::kClosedFd when the backlog is empty or accept failed.
int AcceptPending(int listenFd) {
  while (true) {
    const int fd = ::accept4(listenFd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd != -1) {
      log::debug("Accepted fd # {} on listener fd # {}", fd, listenFd);
      return fd;
    }
    switch (errno) {
      case EINTR:
        [[fallthrough]];
      case ECONNABORTED:
        // Client gave up while queued: try the next one.
        continue;
      case EAGAIN:
#if EAGAIN != EWOULDBLOCK
      case EWOULDBLOCK:
#endif
        log::trace("No pending connection on listener fd # {}", listenFd);
        return BaseFd::kClosedFd;
      case EMFILE:
        [[fallthrough]];
      case ENFILE:
        log::warn("Out of file descriptors, connection left pending on listener fd # {}", listenFd);
        return BaseFd::kClosedFd;
      default:
        log::error("accept4 failed on listener fd # {}: {}", listenFd, std::strerror(errno));
        return BaseFd::kClosedFd;
    }
  }
}

}  // namespace

Connection::Connection(const Socket& socket) : _baseFd(AcceptPending(socket.fd())) {}

Connection::Connection(BaseFd&& bd) noexcept : _baseFd(std::move(bd)) {}

}  // namespace corvid
