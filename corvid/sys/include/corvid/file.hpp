#pragma once

#include <cstddef>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "corvid/base-fd.hpp"

namespace corvid {

// Regular file opened for reading (static files) or created for writing (spooled uploads).
class File {
 public:
  static constexpr std::size_t kError = std::numeric_limits<std::size_t>::max();

  File() noexcept = default;

  // Opens path read-only. Fails (operator bool false) if it cannot be opened or is not a regular file.
  explicit File(const std::string& path);

  // Creates a new file with a unique name in directory, readable and writable by the owner only.
  // Its path is stored in createdPath. Returns an empty File on failure (logged).
  static File CreateUnique(std::string_view directory, std::string_view namePrefix, std::string& createdPath);

  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // Size in bytes when the file was opened.
  [[nodiscard]] std::size_t size() const noexcept { return _size; }

  // Reads up to dst.size() bytes at offset. Returns the number of bytes read (0 at end of file), kError on error.
  [[nodiscard]] std::size_t readAt(std::span<char> dst, std::size_t offset) const;

  // Appends all of data. Returns false on error (logged).
  [[nodiscard]] bool writeAll(std::string_view data);

 private:
  explicit File(BaseFd fd) noexcept : _fd(std::move(fd)), _size(0) {}

  BaseFd _fd;
  std::size_t _size{0};
};

}  // namespace corvid
