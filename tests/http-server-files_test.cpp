#include <gtest/gtest.h>
#include <unistd.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "corvid/action-context.hpp"
#include "corvid/action.hpp"
#include "corvid/http-constants.hpp"
#include "corvid/http-request.hpp"
#include "corvid/http-status-code.hpp"
#include "corvid/param-value.hpp"
#include "corvid/route-table.hpp"
#include "corvid/server-config.hpp"
#include "corvid/static-file-action.hpp"
#include "corvid/test-server-fixture.hpp"
#include "corvid/test-util.hpp"

using namespace corvid;

namespace {

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

void WriteFile(const std::filesystem::path& path, std::string_view content) {
  std::ofstream out(path, std::ios::binary);
  out << content;
}

std::mutex gSpooledPathsMutex;
std::vector<std::string> gSpooledPaths;

// Describes the fields and uploads it received, one per line.
class UploadAction : public Action {
 public:
  void post(ActionContext& ctx) override {
    const HttpRequest& request = ctx.request();
    std::ostringstream oss;
    for (const auto& [name, value] : request.queryParams()) {
      oss << "field " << name << '=' << value << '\n';
    }
    for (const auto& upload : request.uploads()) {
      oss << "file " << upload.fieldName << ' ' << upload.filename << ' ' << upload.contentType << ' ' << upload.size;
      if (upload.error == http::UploadError::MaxSizeExceeded) {
        oss << " too-large";
      } else {
        oss << ' ' << request.uploadContent(upload);
      }
      if (!upload.tempPath.empty()) {
        oss << " spooled=" << ReadFile(upload.tempPath);
        std::scoped_lock lock(gSpooledPathsMutex);
        gSpooledPaths.push_back(upload.tempPath);
      }
      oss << '\n';
    }
    ctx.respond(http::StatusCodeOK, oss.str(), http::ContentTypeTextPlain);
  }
};

class RedirectAction : public Action {
 public:
  explicit RedirectAction(const RouteArgs& args) : _status(args.get<int64_t>("status")) {}

  void get(ActionContext& ctx) override {
    ctx.redirect("/new/location?from=old", static_cast<http::StatusCode>(_status));
  }

 private:
  int64_t _status;
};

// Starts a response, then gives up with 403.
class ForbiddenAction : public Action {
 public:
  void get(ActionContext& ctx) override {
    ctx.composeHeaders();
    ctx.write("secret part");
    ctx.raiseError(http::StatusCodeForbidden);
  }
};

class NotFoundPage : public Action {
 public:
  void get(ActionContext& ctx) override { ctx.respond(http::StatusCodeNotFound, "custom 404", http::ContentTypeTextHtml); }
};

std::string MultipartRequest(std::string_view body) {
  test::RequestOptions opt;
  opt.method = "POST";
  opt.target = "/upload";
  opt.body = body;
  opt.headers.emplace_back("Content-Type", "multipart/form-data; boundary=corvid-boundary");
  return test::buildRequest(opt);
}

constexpr std::string_view kUploadBody =
    "--corvid-boundary\r\n"
    "Content-Disposition: form-data; name=\"comment\"\r\n\r\n"
    "nice picture\r\n"
    "--corvid-boundary\r\n"
    "Content-Disposition: form-data; name=\"picture\"; filename=\"cat.png\"\r\n\r\n"
    "PNGDATA\r\n"
    "--corvid-boundary\r\n"
    "Content-Disposition: form-data; name=\"notes\"; filename=\"notes.txt\"\r\n"
    "Content-Type: text/markdown\r\n\r\n"
    "# a longer note\r\n"
    "--corvid-boundary--\r\n";

}  // namespace

class HttpServerFilesTest : public ::testing::Test {
 protected:
  HttpServerFilesTest() {
    baseDir = std::filesystem::temp_directory_path() / ("corvid-files-test-" + std::to_string(::getpid()));
    std::filesystem::remove_all(baseDir);
    std::filesystem::create_directories(baseDir / "public" / "sub");
    std::filesystem::create_directories(baseDir / "uploads");
    WriteFile(baseDir / "public" / "hello.txt", "hello static\n");
    WriteFile(baseDir / "public" / "sub" / "page.html", "<p>page</p>");
    WriteFile(baseDir / "public" / "data.corvidbin", std::string(200000, 'z'));
    WriteFile(baseDir / "secret.txt", "top secret");
    std::filesystem::create_symlink(baseDir / "secret.txt", baseDir / "public" / "link.txt");
  }

  ~HttpServerFilesTest() override { std::filesystem::remove_all(baseDir); }

  RouteTable makeTable() const {
    RouteTable table;
    const std::string root = (baseDir / "public").string();
    table.addLiteral("/static", R"(/(file:[\w./-]+))", HandlerRef::Of<StaticFileAction>(), {{"root", root}});
    table.addLiteral("/download", HandlerRef::Of<StaticFileAction>(),
                     {{"root", root}, {"param", std::string("path")}, {"attachment", true}});
    table.addLiteral("/upload", HandlerRef::Of<UploadAction>());
    table.addLiteral("/old", HandlerRef::Of<RedirectAction>(), {{"status", int64_t{307}}});
    table.addLiteral("/moved", HandlerRef::Of<RedirectAction>(), {{"status", int64_t{301}}});
    table.addLiteral("/not-a-redirect", HandlerRef::Of<RedirectAction>(), {{"status", int64_t{200}}});
    table.addLiteral("/forbidden", HandlerRef::Of<ForbiddenAction>());
    return table;
  }

  std::filesystem::path baseDir;
};

TEST_F(HttpServerFilesTest, ServesStaticFileWithContentType) {
  test::TestServer ts(test::LoopbackConfig(), makeTable());
  auto resp = test::parseResponseOrThrow(test::simpleGet(ts.port(), "/static/hello.txt"));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.headers.at("Content-Type"), "text/plain");
  EXPECT_EQ(resp.headers.at("Content-Length"), "13");
  EXPECT_FALSE(resp.headers.contains("Content-Disposition"));
  EXPECT_EQ(resp.body, "hello static\n");

  resp = test::parseResponseOrThrow(test::simpleGet(ts.port(), "/static/sub/page.html"));
  EXPECT_EQ(resp.headers.at("Content-Type"), "text/html");
  EXPECT_EQ(resp.body, "<p>page</p>");
}

TEST_F(HttpServerFilesTest, LargeFileOfUnknownTypeIsOctetStream) {
  test::TestServer ts(test::LoopbackConfig(), makeTable());
  const auto resp = test::parseResponseOrThrow(test::simpleGet(ts.port(), "/static/data.corvidbin"));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.headers.at("Content-Type"), http::ContentTypeOctetStream);
  EXPECT_EQ(resp.body, std::string(200000, 'z'));
}

TEST_F(HttpServerFilesTest, HeadSendsHeadersOnly) {
  test::TestServer ts(test::LoopbackConfig(), makeTable());
  test::RequestOptions opt;
  opt.method = "HEAD";
  opt.target = "/static/hello.txt";
  const auto resp = test::parseResponseOrThrow(test::requestOrThrow(ts.port(), opt));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.headers.at("Content-Length"), "13");
  EXPECT_TRUE(resp.body.empty());
}

TEST_F(HttpServerFilesTest, AttachmentFromQueryParameter) {
  test::TestServer ts(test::LoopbackConfig(), makeTable());
  const auto resp = test::parseResponseOrThrow(test::simpleGet(ts.port(), "/download?path=/sub/page.html"));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.headers.at("Content-Disposition"), "attachment; filename=\"page.html\"");
  EXPECT_EQ(resp.body, "<p>page</p>");
}

TEST_F(HttpServerFilesTest, MissingFilesAndEscapesAreNotFound) {
  test::TestServer ts(test::LoopbackConfig(), makeTable());
  for (const std::string_view target :
       {"/static/missing.txt", "/static/sub", "/static/../secret.txt", "/static/sub/../../secret.txt",
        "/static/%2E%2E/secret.txt", "/static/link.txt", "/download", "/download?path=/"}) {
    const auto resp = test::parseResponseOrThrow(test::simpleGet(ts.port(), target));
    EXPECT_EQ(resp.statusCode, http::StatusCodeNotFound) << target;
    EXPECT_EQ(resp.body.find("top secret"), std::string::npos) << target;
  }

  ts.router().setErrorAction(http::StatusCodeNotFound, HandlerRef::Of<NotFoundPage>());
  EXPECT_EQ(test::parseResponseOrThrow(test::simpleGet(ts.port(), "/static/missing.txt")).body, "custom 404");
}

TEST_F(HttpServerFilesTest, StaticFileActionResolve) {
  const StaticFileAction action(RouteArgs{{"root", (baseDir / "public").string()}});
  const auto resolved = action.resolve(" /sub/page.html/ ");
  ASSERT_TRUE(resolved.has_value());
  EXPECT_EQ(*resolved, std::filesystem::weakly_canonical(baseDir / "public" / "sub" / "page.html").string());
  EXPECT_FALSE(action.resolve("..").has_value());
  EXPECT_FALSE(action.resolve("sub/../..").has_value());
  EXPECT_FALSE(action.resolve("///").has_value());
  EXPECT_FALSE(action.resolve("sub/..").has_value());
}

TEST_F(HttpServerFilesTest, RedirectSetsLocation) {
  test::TestServer ts(test::LoopbackConfig(), makeTable());
  auto resp = test::parseResponseOrThrow(test::simpleGet(ts.port(), "/old"));
  EXPECT_EQ(resp.statusCode, http::StatusCodeTemporaryRedirect);
  EXPECT_EQ(resp.headers.at("Location"), "/new/location?from=old");
  EXPECT_EQ(resp.headers.at("Content-Length"), "0");
  EXPECT_TRUE(resp.body.empty());

  resp = test::parseResponseOrThrow(test::simpleGet(ts.port(), "/moved"));
  EXPECT_EQ(resp.statusCode, http::StatusCodeMovedPermanently);
  EXPECT_EQ(resp.headers.at("Location"), "/new/location?from=old");

  EXPECT_EQ(test::parseResponseOrThrow(test::simpleGet(ts.port(), "/not-a-redirect")).statusCode,
            http::StatusCodeInternalServerError);
}

TEST_F(HttpServerFilesTest, RaisedErrorDiscardsPartialResponseAndKeepsConnection) {
  test::TestServer ts(test::LoopbackConfig(), makeTable());
  test::RequestOptions opt;
  opt.target = "/forbidden";
  opt.connection = "keep-alive";
  const auto first = test::buildRequest(opt);
  opt.target = "/static/hello.txt";
  opt.connection = "close";
  const auto raw = test::sendAndCollect(ts.port(), first + test::buildRequest(opt));
  EXPECT_EQ(raw.find("secret part"), std::string::npos);
  EXPECT_EQ(test::countOccurrences(raw, "HTTP/1.1 "), 2);
  EXPECT_EQ(test::parseResponseOrThrow(raw).statusCode, http::StatusCodeForbidden);
  EXPECT_NE(raw.find("hello static"), std::string::npos);
}

TEST_F(HttpServerFilesTest, MultipartFieldsAndUploadsInMemory) {
  test::TestServer ts(test::LoopbackConfig(), makeTable());
  const auto resp = test::parseResponseOrThrow(test::sendAndCollect(ts.port(), MultipartRequest(kUploadBody)));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.body,
            "field comment=nice picture\n"
            "file picture cat.png image/png 7 PNGDATA\n"
            "file notes notes.txt text/markdown 15 # a longer note\n");
}

TEST_F(HttpServerFilesTest, UploadsAreSpooledThenRemoved) {
  test::TestServer ts(test::LoopbackConfig().withUploadDir((baseDir / "uploads").string()).withMaxUploadBytes(10),
                      makeTable());
  {
    std::scoped_lock lock(gSpooledPathsMutex);
    gSpooledPaths.clear();
  }
  const auto resp = test::parseResponseOrThrow(test::sendAndCollect(ts.port(), MultipartRequest(kUploadBody)));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.body,
            "field comment=nice picture\n"
            "file picture cat.png image/png 7 PNGDATA spooled=PNGDATA\n"
            "file notes notes.txt text/markdown 15 too-large\n");

  std::scoped_lock lock(gSpooledPathsMutex);
  ASSERT_EQ(gSpooledPaths.size(), 1U);
  EXPECT_TRUE(gSpooledPaths[0].starts_with((baseDir / "uploads").string()));
  EXPECT_FALSE(std::filesystem::exists(gSpooledPaths[0]));
  EXPECT_TRUE(std::filesystem::is_empty(baseDir / "uploads"));
}

TEST_F(HttpServerFilesTest, MalformedMultipartIsBadRequest) {
  test::TestServer ts(test::LoopbackConfig(), makeTable());
  const auto resp = test::parseResponseOrThrow(
      test::sendAndCollect(ts.port(), MultipartRequest("--corvid-boundary\r\nContent-Type: text/plain\r\n\r\nx")));
  EXPECT_EQ(resp.statusCode, http::StatusCodeBadRequest);
}
