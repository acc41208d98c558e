#include "corvid/static-file-action.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "corvid/action-context.hpp"
#include "corvid/file.hpp"
#include "corvid/http-constants.hpp"
#include "corvid/http-method.hpp"
#include "corvid/http-status-code.hpp"
#include "corvid/log.hpp"
#include "corvid/mime-types.hpp"
#include "corvid/param-value.hpp"

namespace corvid {

namespace {

constexpr std::size_t kFileReadChunkBytes = 64UL * 1024;

std::string_view StripPathSeparators(std::string_view path) {
  static constexpr std::string_view kStripped = " /\\";
  const auto first = path.find_first_not_of(kStripped);
  if (first == std::string_view::npos) {
    return {};
  }
  return path.substr(first, path.find_last_not_of(kStripped) - first + 1);
}

}  // namespace

bool ServeStaticFile(ActionContext& ctx, const std::string& path, bool attachment, std::string_view downloadName) {
  if (ctx.headersComposed()) {
    throw std::logic_error("cannot serve a file once headers are composed");
  }
  const File file(path);
  if (!file) {
    return false;
  }
  const std::size_t fileSize = file.size();

  const std::string_view mimeType = MimeTypeForPath(path);
  ctx.setStatus(http::StatusCodeOK);
  ctx.setContentType(mimeType.empty() ? http::ContentTypeOctetStream : mimeType);
  ctx.setHeader(http::ContentLength, std::to_string(fileSize));
  if (attachment) {
    std::string disposition("attachment; filename=\"");
    if (downloadName.empty()) {
      disposition.append(std::filesystem::path(path).filename().string());
    } else {
      disposition.append(downloadName);
    }
    disposition.push_back('"');
    ctx.setHeader(http::ContentDisposition, disposition);
  }
  ctx.composeHeaders();
  if (ctx.request().method() == http::Method::HEAD) {
    return true;
  }

  std::array<char, kFileReadChunkBytes> chunk;
  for (std::size_t offset = 0; offset < fileSize;) {
    const auto nbRead = file.readAt(std::span<char>(chunk), offset);
    if (nbRead == File::kError || nbRead == 0) {
      throw std::runtime_error("unable to read '" + path + "' entirely");
    }
    ctx.write(std::string_view(chunk.data(), std::min(nbRead, fileSize - offset)));
    offset += nbRead;
  }
  log::debug("Served '{}' ({} bytes)", path, fileSize);
  return true;
}

StaticFileAction::StaticFileAction(const RouteArgs& args)
    : _root(std::filesystem::path(args.get<std::string>("root")).lexically_normal()),
      _param(args.contains("param") ? args.get<std::string>("param") : "file"),
      _attachment(args.contains("attachment") && args.get<bool>("attachment")) {
  std::error_code ec;
  auto canonicalRoot = std::filesystem::weakly_canonical(_root, ec);
  if (!ec) {
    _root = std::move(canonicalRoot);
  }
}

std::optional<std::string> StaticFileAction::resolve(std::string_view relativePath) const {
  const std::string_view stripped = StripPathSeparators(relativePath);
  if (stripped.empty()) {
    return std::nullopt;
  }
  std::error_code ec;
  // Symbolic links are followed before checking the location.
  const auto resolved = std::filesystem::weakly_canonical(_root / stripped, ec);
  if (ec) {
    return std::nullopt;
  }
  const auto relative = resolved.lexically_relative(_root);
  if (relative.empty() || *relative.begin() == ".." || relative == ".") {
    return std::nullopt;
  }
  return resolved.string();
}

void StaticFileAction::get(ActionContext& ctx) {
  std::optional<std::string_view> relativePath;
  if (const auto* pCaptured = ctx.params().getIf<std::string>(_param)) {
    relativePath = *pCaptured;
  } else {
    relativePath = ctx.argument(_param);
  }
  const auto path = relativePath ? resolve(*relativePath) : std::nullopt;
  if (!path || !ServeStaticFile(ctx, *path, _attachment)) {
    log::debug("No file to serve for '{}'", ctx.request().path());
    ctx.raiseError(http::StatusCodeNotFound);
  }
}

}  // namespace corvid
