#include "corvid/socket.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "corvid/base-fd.hpp"
#include "corvid/errno-throw.hpp"
#include "corvid/log.hpp"
#include "corvid/socket-ops.hpp"

namespace corvid {

void Socket::bindAndListen(std::string_view host, uint16_t& port, bool reusePort, int backlog) {
  const std::string hostStr(host.empty() || host == "*" ? std::string_view("0.0.0.0") : host);
  const std::string portStr = std::to_string(port);

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;

  addrinfo* res = nullptr;
  const int gai = ::getaddrinfo(hostStr.c_str(), portStr.c_str(), &hints, &res);
  if (gai != 0) {
    throw std::invalid_argument("Unable to resolve listen address '" + hostStr + "': " + ::gai_strerror(gai));
  }
  std::unique_ptr<addrinfo, void (*)(addrinfo*)> resRAII(res, &::freeaddrinfo);

  _baseFd = BaseFd(::socket(res->ai_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());

  static constexpr int kEnable = 1;
  if (::setsockopt(_baseFd.fd(), SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) < 0) {
    throw_errno("setsockopt(SO_REUSEADDR) failed");
  }
  if (reusePort && ::setsockopt(_baseFd.fd(), SOL_SOCKET, SO_REUSEPORT, &kEnable, sizeof(kEnable)) < 0) {
    throw_errno("setsockopt(SO_REUSEPORT) failed");
  }
  if (::bind(_baseFd.fd(), res->ai_addr, res->ai_addrlen) < 0) {
    throw_errno("bind failed on {}:{}", hostStr, port);
  }
  if (::listen(_baseFd.fd(), backlog) < 0) {
    throw_errno("listen failed on {}:{}", hostStr, port);
  }
  if (port == 0) {
    port = GetLocalPort(_baseFd.fd());
    if (port == 0) {
      throw_errno("getsockname failed");
    }
  }
}

}  // namespace corvid
