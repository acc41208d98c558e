#include "corvid/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "corvid/log.hpp"

namespace corvid {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

void BaseFd::close() noexcept {
  const int fd = release();
  if (fd == kClosedFd) {
    return;
  }
  // On Linux the descriptor is released even when close() reports EINTR: retrying could close
  // a descriptor reused in the meantime by another thread.
  if (::close(fd) == -1 && errno != EINTR) {
    log::error("Unable to close fd # {}: {}", fd, std::strerror(errno));
    return;
  }
  log::debug("fd # {} closed", fd);
}

int BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

}  // namespace corvid
