#pragma once

#include <sys/epoll.h>

#include <cstdint>

namespace corvid {

// Readiness bitmap as reported by the reactor, expressed in epoll flags.
using EventBmp = uint32_t;

inline constexpr EventBmp EventIn = EPOLLIN;
inline constexpr EventBmp EventOut = EPOLLOUT;
inline constexpr EventBmp EventErr = EPOLLERR;
inline constexpr EventBmp EventHup = EPOLLHUP;
inline constexpr EventBmp EventRdHup = EPOLLRDHUP;
inline constexpr EventBmp EventEt = EPOLLET;

// Peer went away or the socket is in error: no more bytes will come in.
constexpr bool IsTerminalEvent(EventBmp events) noexcept { return (events & (EventErr | EventHup)) != 0; }

}  // namespace corvid
