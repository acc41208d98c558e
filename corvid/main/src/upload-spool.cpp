#include "corvid/upload-spool.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>

#include "corvid/file.hpp"
#include "corvid/http-request.hpp"
#include "corvid/log.hpp"

namespace corvid {

UploadSpool::UploadSpool(HttpRequest& request, std::string_view directory) {
  if (directory.empty()) {
    return;
  }
  for (auto& upload : request._uploads) {
    if (upload.error != http::UploadError::None) {
      continue;
    }
    std::string path;
    File file = File::CreateUnique(directory, "corvid-upload-", path);
    if (!file) {
      _ok = false;
      return;
    }
    _paths.push_back(path);
    if (!file.writeAll(request.uploadContent(upload))) {
      _ok = false;
      return;
    }
    log::debug("Spooled upload '{}' of field '{}' to '{}'", upload.filename, upload.fieldName, path);
    upload.tempPath = std::move(path);
  }
}

UploadSpool::~UploadSpool() {
  for (const auto& path : _paths) {
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
      log::warn("Unable to remove '{}': {}", path, std::strerror(errno));
    }
  }
}

}  // namespace corvid
