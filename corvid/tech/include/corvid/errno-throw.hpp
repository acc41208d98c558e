#pragma once

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <system_error>
#include <utility>

namespace corvid {

// Capture errno immediately and throw std::system_error with a formatted message.
// Usage: throw_errno("bind failed for {}", path);
template <typename... Args>
[[noreturn]] void throw_errno(fmt::format_string<Args...> fmtStr, Args&&... args) {
  const int savedErr = errno;
  std::error_code ec(savedErr, std::generic_category());
  throw std::system_error(ec, fmt::format(fmtStr, std::forward<Args>(args)...));
}

}  // namespace corvid
