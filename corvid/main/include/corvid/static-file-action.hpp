#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "corvid/action-context.hpp"
#include "corvid/action.hpp"
#include "corvid/param-value.hpp"

namespace corvid {

// Writes a complete 200 response with the content of the regular file at path, its Content-Type guessed from the
// extension (application/octet-stream if unknown).
// With attachment, a Content-Disposition header proposes downloadName, or the file name of path if empty.
// Returns false without writing anything if the file cannot be opened.
// Throws std::logic_error if the headers were already composed, std::runtime_error if the file cannot be read
// entirely.
bool ServeStaticFile(ActionContext& ctx, const std::string& path, bool attachment = false,
                     std::string_view downloadName = {});

// Serves the files below a directory.
//
// Route arguments:
//  - "root" (string, required): directory to serve.
//  - "param" (string, default "file"): name of the path parameter holding the file path relative to root.
//    If the route has no such parameter, the query or form parameter of that name is used.
//  - "attachment" (bool, default false): add a Content-Disposition header.
// Surrounding spaces and slashes of the relative path are ignored. Paths resolving outside of root, root itself,
// directories and missing files are answered with 404.
class StaticFileAction : public Action {
 public:
  // Throws std::out_of_range if "root" is missing.
  explicit StaticFileAction(const RouteArgs& args);

  void get(ActionContext& ctx) override;

  // Absolute path of the file designated by relativePath, std::nullopt if it would escape root.
  [[nodiscard]] std::optional<std::string> resolve(std::string_view relativePath) const;

 private:
  std::filesystem::path _root;
  std::string _param;
  bool _attachment;
};

}  // namespace corvid
