#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "corvid/http-request.hpp"

namespace corvid {

// Copies the uploads of a request into files of an upload directory for the time of its dispatch.
// Each spooled upload gets its tempPath set. The files are removed on destruction.
class UploadSpool {
 public:
  // Nothing is written if directory is empty. Uploads that exceeded the upload limit are not spooled.
  UploadSpool(HttpRequest& request, std::string_view directory);

  UploadSpool(const UploadSpool&) = delete;
  UploadSpool(UploadSpool&&) = delete;
  UploadSpool& operator=(const UploadSpool&) = delete;
  UploadSpool& operator=(UploadSpool&&) = delete;

  ~UploadSpool();

  // False if an upload could not be written (the request should then not be dispatched).
  [[nodiscard]] bool ok() const noexcept { return _ok; }

 private:
  std::vector<std::string> _paths;
  bool _ok{true};
};

}  // namespace corvid
