#include "corvid/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "corvid/base-fd.hpp"
#include "corvid/log.hpp"

namespace corvid {

File::File(const std::string& path) {
  BaseFd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (!fd) {
    log::debug("Unable to open '{}': {}", path, std::strerror(errno));
    return;
  }
  struct stat st{};
  if (::fstat(fd.fd(), &st) != 0) {
    log::error("fstat failed for '{}': {}", path, std::strerror(errno));
    return;
  }
  if (!S_ISREG(st.st_mode)) {
    log::debug("'{}' is not a regular file", path);
    return;
  }
  _fd = std::move(fd);
  _size = static_cast<std::size_t>(st.st_size);
}

File File::CreateUnique(std::string_view directory, std::string_view namePrefix, std::string& createdPath) {
  std::string pathTemplate(directory);
  if (!pathTemplate.empty() && pathTemplate.back() != '/') {
    pathTemplate.push_back('/');
  }
  pathTemplate.append(namePrefix).append("XXXXXX");
  const int fd = ::mkostemp(pathTemplate.data(), O_CLOEXEC);
  if (fd == -1) {
    log::error("Unable to create a file in '{}': {}", directory, std::strerror(errno));
    createdPath.clear();
    return File();
  }
  createdPath = std::move(pathTemplate);
  log::debug("Created '{}' (fd # {})", createdPath, fd);
  return File(BaseFd(fd));
}

std::size_t File::readAt(std::span<char> dst, std::size_t offset) const {
  while (true) {
    const auto ret = ::pread(_fd.fd(), dst.data(), dst.size(), static_cast<off_t>(offset));
    if (ret >= 0) {
      return static_cast<std::size_t>(ret);
    }
    if (errno != EINTR) {
      log::error("pread failed on fd # {}: {}", _fd.fd(), std::strerror(errno));
      return kError;
    }
  }
}

bool File::writeAll(std::string_view data) {
  while (!data.empty()) {
    const auto ret = ::write(_fd.fd(), data.data(), data.size());
    if (ret == -1) {
      if (errno == EINTR) {
        continue;
      }
      log::error("write failed on fd # {}: {}", _fd.fd(), std::strerror(errno));
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(ret));
    _size += static_cast<std::size_t>(ret);
  }
  return true;
}

}  // namespace corvid
