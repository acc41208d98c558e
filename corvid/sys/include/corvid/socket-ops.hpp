#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace corvid {

// Thin wrappers centralising socket system calls so that higher level modules
// never include networking headers directly.

// Set a file descriptor to non-blocking mode. Returns true on success.
bool SetNonBlocking(int fd) noexcept;

// Enable TCP_NODELAY (disable Nagle's algorithm). Returns true on success.
bool SetTcpNoDelay(int fd) noexcept;

// Retrieve the pending socket error (SO_ERROR).
// Returns 0 if no error, an errno value otherwise (including the errno of getsockopt itself).
int GetSocketError(int fd) noexcept;

// Port the socket is locally bound to, 0 on failure.
uint16_t GetLocalPort(int fd) noexcept;

// "ip:port" of the remote peer, empty on failure.
std::string GetPeerAddress(int fd);

// Send with MSG_NOSIGNAL, retrying on EINTR.
// Returns the number of bytes sent, or -1 on error (errno is set).
int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept;

inline int64_t SafeSend(int fd, std::string_view data) noexcept { return SafeSend(fd, data.data(), data.size()); }

// recv retrying on EINTR. Returns bytes read, 0 on orderly shutdown, -1 on error (errno is set).
int64_t SafeRecv(int fd, void* buf, std::size_t len) noexcept;

// Shutdown the write half of a socket connection. Returns false on error (errno is set).
bool ShutdownWrite(int fd) noexcept;

}  // namespace corvid
