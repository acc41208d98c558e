#include "corvid/request-parser.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <string_view>

#include "corvid/http-method.hpp"
#include "corvid/http-request.hpp"
#include "corvid/http-status-code.hpp"
#include "corvid/http-version.hpp"

using namespace corvid;

namespace {

struct ParseOutcome {
  http::StatusCode status{kStatusNeedMoreData};
  HttpRequest request;
  std::string leftover;
};

ParseOutcome ParseWhole(std::string_view raw, ParserLimits limits = {}) {
  RequestParser parser(limits);
  ParseOutcome outcome;
  outcome.leftover.assign(raw);
  outcome.status = parser.parse(outcome.leftover);
  outcome.request = parser.request();
  return outcome;
}

ParseOutcome ParseByteByByte(std::string_view raw, ParserLimits limits = {}) {
  RequestParser parser(limits);
  ParseOutcome outcome;
  for (char ch : raw) {
    outcome.leftover.push_back(ch);
    if (outcome.status == kStatusNeedMoreData) {
      outcome.status = parser.parse(outcome.leftover);
    }
  }
  outcome.request = parser.request();
  return outcome;
}

ParseOutcome ParseInSlices(std::string_view raw, std::size_t sliceLen) {
  RequestParser parser;
  ParseOutcome outcome;
  for (std::size_t pos = 0; pos < raw.size(); pos += sliceLen) {
    outcome.leftover.append(raw.substr(pos, sliceLen));
    if (outcome.status == kStatusNeedMoreData) {
      outcome.status = parser.parse(outcome.leftover);
    }
  }
  outcome.request = parser.request();
  return outcome;
}

constexpr std::string_view kFormPost =
    "POST /submit/form?lang=en&x=%41%42 HTTP/1.1\r\n"
    "Host: example.org\r\n"
    "Content-Type: application/x-www-form-urlencoded\r\n"
    "Cookie: session=abc; theme=dark\r\n"
    "Content-Length: 21\r\n"
    "\r\n"
    "name=Jane+Doe&lang=fr";

constexpr std::string_view kChunkedPut =
    "PUT /upload HTTP/1.1\r\n"
    "Transfer-Encoding: chunked\r\n"
    "\r\n"
    "5;ext=1\r\nhello\r\n"
    "7\r\n, world\r\n"
    "0\r\n"
    "X-Trailer: ignored\r\n"
    "\r\n";

}  // namespace

TEST(RequestParser, SimpleGet) {
  auto outcome = ParseWhole("GET /hello?name=world HTTP/1.1\r\nHost: localhost\r\n\r\n");
  ASSERT_EQ(outcome.status, http::StatusCodeOK);
  const HttpRequest& req = outcome.request;
  EXPECT_EQ(req.method(), http::Method::GET);
  EXPECT_EQ(req.path(), "/hello");
  EXPECT_EQ(req.queryString(), "name=world");
  EXPECT_EQ(req.queryParams().get("name"), "world");
  EXPECT_EQ(req.version(), http::HTTP_1_1);
  EXPECT_EQ(req.headerValue("host"), "localhost");
  EXPECT_TRUE(req.body().empty());
  EXPECT_TRUE(req.wantsKeepAlive());
  EXPECT_TRUE(outcome.leftover.empty());
}

TEST(RequestParser, FormPostMergesBodyParamsAndCookies) {
  auto outcome = ParseWhole(kFormPost);
  ASSERT_EQ(outcome.status, http::StatusCodeOK);
  const HttpRequest& req = outcome.request;
  EXPECT_EQ(req.method(), http::Method::POST);
  EXPECT_EQ(req.declaredContentLength(), 21U);
  EXPECT_EQ(req.body(), "name=Jane+Doe&lang=fr");
  EXPECT_EQ(req.queryParams().get("name"), "Jane Doe");
  EXPECT_EQ(req.queryParams().get("x"), "AB");
  // body fields come after query fields: last value wins
  EXPECT_EQ(req.queryParams().get("lang"), "fr");
  EXPECT_EQ(req.queryParams().getAll("lang").size(), 2U);
  EXPECT_EQ(req.cookie("session"), "abc");
  EXPECT_EQ(req.cookie("theme"), "dark");
  EXPECT_FALSE(req.cookie("missing").has_value());
}

TEST(RequestParser, ChunkedBody) {
  auto outcome = ParseWhole(kChunkedPut);
  ASSERT_EQ(outcome.status, http::StatusCodeOK);
  EXPECT_TRUE(outcome.request.isChunked());
  EXPECT_EQ(outcome.request.body(), "hello, world");
}

TEST(RequestParser, ChunkBoundaryIndependence) {
  for (std::string_view raw : {kFormPost, kChunkedPut}) {
    const auto whole = ParseWhole(raw);
    const auto byByte = ParseByteByByte(raw);
    ASSERT_EQ(whole.status, http::StatusCodeOK);
    EXPECT_EQ(byByte.status, whole.status);
    EXPECT_EQ(byByte.request, whole.request);
    for (std::size_t slice : {2U, 3U, 7U, 16U}) {
      const auto sliced = ParseInSlices(raw, slice);
      EXPECT_EQ(sliced.status, whole.status) << "slice " << slice;
      EXPECT_EQ(sliced.request, whole.request) << "slice " << slice;
    }
  }
}

TEST(RequestParser, ErrorsAreChunkBoundaryIndependent) {
  ParserLimits limits;
  limits.maxRequestLineBytes = 16;
  limits.maxHeaderBytes = 32;
  for (std::string_view raw : {std::string_view("GET /a-very-long-target-path HTTP/1.1\r\n\r\n"),
                               std::string_view("GET / HTTP/1.1\r\nX-Long: 0123456789012345678901234\r\n\r\n"),
                               std::string_view("GET / HTTP/1.1\r\nBad header\r\n\r\n")}) {
    const auto whole = ParseWhole(raw, limits);
    const auto byByte = ParseByteByByte(raw, limits);
    EXPECT_GE(whole.status, 400);
    EXPECT_EQ(byByte.status, whole.status) << raw;
  }
}

TEST(RequestParser, PipelinedRequestsStayInBuffer) {
  RequestParser parser;
  std::string input("GET /first HTTP/1.1\r\n\r\nGET /second?a=1 HTTP/1.1\r\n\r\n");
  ASSERT_EQ(parser.parse(input), http::StatusCodeOK);
  EXPECT_EQ(parser.request().path(), "/first");
  EXPECT_EQ(input, "GET /second?a=1 HTTP/1.1\r\n\r\n");

  parser.reset();
  ASSERT_EQ(parser.parse(input), http::StatusCodeOK);
  EXPECT_EQ(parser.request().path(), "/second");
  EXPECT_EQ(parser.request().queryParams().get("a"), "1");
  EXPECT_TRUE(input.empty());
}

TEST(RequestParser, ResetClearsPreviousRequestState) {
  RequestParser parser;
  std::string input("POST /p HTTP/1.1\r\nContent-Length: 3\r\nCookie: a=1\r\n\r\nabc");
  ASSERT_EQ(parser.parse(input), http::StatusCodeOK);
  parser.reset();
  input = "GET /g HTTP/1.1\r\n\r\n";
  ASSERT_EQ(parser.parse(input), http::StatusCodeOK);
  EXPECT_TRUE(parser.request().body().empty());
  EXPECT_TRUE(parser.request().cookies().empty());
  EXPECT_FALSE(parser.request().headerValue("Content-Length").has_value());
}

TEST(RequestParser, IncompleteBodyNeedsMoreData) {
  RequestParser parser;
  std::string input("POST /p HTTP/1.1\r\nContent-Length: 10\r\n\r\nabc");
  EXPECT_EQ(parser.parse(input), kStatusNeedMoreData);
  EXPECT_EQ(parser.state(), ParserState::AwaitingBody);
  input.append("defghij");
  EXPECT_EQ(parser.parse(input), http::StatusCodeOK);
  EXPECT_EQ(parser.request().body(), "abcdefghij");
}

TEST(RequestParser, StatesProgress) {
  RequestParser parser;
  std::string input("GET /x HTTP/1.1");
  EXPECT_EQ(parser.parse(input), kStatusNeedMoreData);
  EXPECT_EQ(parser.state(), ParserState::AwaitingRequestLine);
  input.append("\r\nHost: a\r\n");
  EXPECT_EQ(parser.parse(input), kStatusNeedMoreData);
  EXPECT_EQ(parser.state(), ParserState::ParsingHeaders);
  input.append("\r\n");
  EXPECT_EQ(parser.parse(input), http::StatusCodeOK);
  EXPECT_EQ(parser.state(), ParserState::ReadyToDispatch);
}

TEST(RequestParser, MissingVersionMeansHttp10AndMissingSlashIsPrepended) {
  auto outcome = ParseWhole("GET index.html\r\n\r\n");
  ASSERT_EQ(outcome.status, http::StatusCodeOK);
  EXPECT_EQ(outcome.request.version(), http::HTTP_1_0);
  EXPECT_EQ(outcome.request.path(), "/index.html");
  EXPECT_FALSE(outcome.request.wantsKeepAlive());
}

TEST(RequestParser, KeepAliveRules) {
  EXPECT_TRUE(ParseWhole("GET / HTTP/1.0\r\nConnection: keep-alive\r\n\r\n").request.wantsKeepAlive());
  EXPECT_FALSE(ParseWhole("GET / HTTP/1.1\r\nConnection: close\r\n\r\n").request.wantsKeepAlive());
  EXPECT_TRUE(ParseWhole("GET / HTTP/1.1\r\nConnection: Keep-Alive\r\n\r\n").request.wantsKeepAlive());
}

TEST(RequestParser, PercentDecodedPath) {
  auto outcome = ParseWhole("GET /a%20b/c+d HTTP/1.1\r\n\r\n");
  ASSERT_EQ(outcome.status, http::StatusCodeOK);
  EXPECT_EQ(outcome.request.path(), "/a b/c+d");
  EXPECT_EQ(outcome.request.target(), "/a%20b/c+d");
}

TEST(RequestParser, DuplicateHeadersLastWinsExceptCookie) {
  auto outcome = ParseWhole("GET / HTTP/1.1\r\nX-A: 1\r\nx-a: 2\r\nCookie: a=1\r\nCookie: b=2\r\n\r\n");
  ASSERT_EQ(outcome.status, http::StatusCodeOK);
  EXPECT_EQ(outcome.request.headerValue("X-A"), "2");
  EXPECT_EQ(outcome.request.cookie("a"), "1");
  EXPECT_EQ(outcome.request.cookie("b"), "2");
}

TEST(RequestParser, ProtocolErrors) {
  EXPECT_EQ(ParseWhole("BREW /pot HTTP/1.1\r\n\r\n").status, http::StatusCodeNotImplemented);
  EXPECT_EQ(ParseWhole("GET / HTTP/2.0\r\n\r\n").status, http::StatusCodeHTTPVersionNotSupported);
  EXPECT_EQ(ParseWhole("GET / HTTQ/1.1\r\n\r\n").status, http::StatusCodeBadRequest);
  EXPECT_EQ(ParseWhole("GET / HTTP/1.1 extra\r\n\r\n").status, http::StatusCodeBadRequest);
  EXPECT_EQ(ParseWhole("GARBAGE\r\n\r\n").status, http::StatusCodeBadRequest);
  EXPECT_EQ(ParseWhole("GET / HTTP/1.1\r\nNoColon\r\n\r\n").status, http::StatusCodeBadRequest);
  EXPECT_EQ(ParseWhole("GET / HTTP/1.1\r\nA: b\r\n folded\r\n\r\n").status, http::StatusCodeBadRequest);
  EXPECT_EQ(ParseWhole("GET /%zz HTTP/1.1\r\n\r\n").status, http::StatusCodeBadRequest);
  EXPECT_EQ(ParseWhole("POST / HTTP/1.1\r\nContent-Length: abc\r\n\r\n").status, http::StatusCodeBadRequest);
  EXPECT_EQ(ParseWhole("POST / HTTP/1.1\r\nContent-Length: 3\r\nTransfer-Encoding: chunked\r\n\r\n").status,
            http::StatusCodeBadRequest);
  EXPECT_EQ(ParseWhole("POST / HTTP/1.1\r\nTransfer-Encoding: gzip\r\n\r\n").status, http::StatusCodeNotImplemented);
  EXPECT_EQ(ParseWhole("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n").status,
            http::StatusCodeBadRequest);
  EXPECT_EQ(ParseWhole("POST /f HTTP/1.1\r\nContent-Type: application/x-www-form-urlencoded\r\n\r\n").status,
            http::StatusCodeLengthRequired);
}

TEST(RequestParser, Limits) {
  ParserLimits limits;
  limits.maxRequestLineBytes = 20;
  limits.maxHeaderBytes = 30;
  limits.maxBodyBytes = 4;
  EXPECT_EQ(ParseWhole("GET /0123456789012345 HTTP/1.1\r\n\r\n", limits).status, http::StatusCodeURITooLong);
  EXPECT_EQ(ParseWhole("GET / HTTP/1.1\r\nX: 01234567890123456789012345\r\n\r\n", limits).status,
            http::StatusCodeRequestHeaderFieldsTooLarge);
  EXPECT_EQ(ParseWhole("POST / HTTP/1.1\r\nContent-Length: 5\r\n\r\n12345", limits).status,
            http::StatusCodePayloadTooLarge);
  EXPECT_EQ(ParseWhole("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n5\r\n12345\r\n0\r\n\r\n", limits).status,
            http::StatusCodePayloadTooLarge);

  // a partial line already exceeding the limit fails without waiting for its end
  RequestParser parser(limits);
  std::string input(64, 'A');
  EXPECT_EQ(parser.parse(input), http::StatusCodeURITooLong);
  EXPECT_EQ(parser.state(), ParserState::Failed);
}

TEST(RequestParser, RequestLineLimitExcludesTerminator) {
  ParserLimits limits;
  limits.maxRequestLineBytes = 20;
  EXPECT_EQ(ParseWhole("GET /012345 HTTP/1.1\r\n\r\n", limits).status, http::StatusCodeOK);
  EXPECT_EQ(ParseWhole("GET /0123456 HTTP/1.1\r\n\r\n", limits).status, http::StatusCodeURITooLong);

  RequestParser parser(limits);
  std::string input("GET /012345 HTTP/1.1\r");
  EXPECT_EQ(parser.parse(input), kStatusNeedMoreData);
  input.append("\n\r\n");
  EXPECT_EQ(parser.parse(input), http::StatusCodeOK);
}

TEST(RequestParser, LeadingEmptyLinesAreIgnored) {
  auto outcome = ParseWhole("\r\n\r\nGET /ok HTTP/1.1\r\n\r\n");
  ASSERT_EQ(outcome.status, http::StatusCodeOK);
  EXPECT_EQ(outcome.request.path(), "/ok");
}

namespace {

std::string MultipartPost(std::string_view body) {
  std::string raw("POST /upload HTTP/1.1\r\nContent-Type: multipart/form-data; boundary=BND\r\nContent-Length: ");
  raw.append(std::to_string(body.size())).append("\r\n\r\n").append(body);
  return raw;
}

constexpr std::string_view kMultipartBody =
    "--BND\r\n"
    "Content-Disposition: form-data; name=\"title\"\r\n\r\n"
    "Report\r\n"
    "--BND\r\n"
    "Content-Disposition: form-data; name=\"doc\"; filename=\"report.pdf\"\r\n\r\n"
    "%PDF-1.7 data\r\n"
    "--BND\r\n"
    "Content-Disposition: form-data; name=\"blob\"; filename=\"raw.bin-unknown\"\r\n\r\n"
    "0123456789\r\n"
    "--BND\r\n"
    "Content-Disposition: form-data; name=\"typed\"; filename=\"x.pdf\"\r\n"
    "Content-Type: image/png\r\n\r\n"
    "png\r\n"
    "--BND--\r\n";

}  // namespace

TEST(RequestParser, MultipartFieldsAndUploads) {
  const std::string raw = MultipartPost(kMultipartBody);
  for (const auto& outcome : {ParseWhole(raw), ParseByteByByte(raw)}) {
    ASSERT_EQ(outcome.status, http::StatusCodeOK);
    const HttpRequest& req = outcome.request;
    EXPECT_EQ(req.queryParams().get("title"), "Report");
    EXPECT_FALSE(req.queryParams().contains("doc"));
    ASSERT_EQ(req.uploads().size(), 3U);

    const http::UploadedFile* doc = req.upload("doc");
    ASSERT_NE(doc, nullptr);
    EXPECT_EQ(doc->filename, "report.pdf");
    EXPECT_EQ(doc->contentType, "application/pdf");
    EXPECT_EQ(doc->size, 13U);
    EXPECT_EQ(doc->error, http::UploadError::None);
    EXPECT_TRUE(doc->tempPath.empty());
    EXPECT_EQ(req.uploadContent(*doc), "%PDF-1.7 data");

    EXPECT_EQ(req.upload("blob")->contentType, "application/octet-stream");
    // part header wins over the extension
    EXPECT_EQ(req.upload("typed")->contentType, "image/png");
    EXPECT_EQ(req.upload("title"), nullptr);
  }
}

TEST(RequestParser, MultipartUploadOverLimitKeepsRequest) {
  ParserLimits limits;
  limits.maxUploadBytes = 12;
  auto outcome = ParseWhole(MultipartPost(kMultipartBody), limits);
  ASSERT_EQ(outcome.status, http::StatusCodeOK);
  const HttpRequest& req = outcome.request;

  const http::UploadedFile* doc = req.upload("doc");
  ASSERT_NE(doc, nullptr);
  EXPECT_EQ(doc->error, http::UploadError::MaxSizeExceeded);
  EXPECT_EQ(doc->size, 13U);
  EXPECT_TRUE(req.uploadContent(*doc).empty());

  const http::UploadedFile* blob = req.upload("blob");
  EXPECT_EQ(blob->error, http::UploadError::None);
  EXPECT_EQ(req.uploadContent(*blob), "0123456789");
  EXPECT_EQ(req.queryParams().get("title"), "Report");
}

TEST(RequestParser, MalformedMultipartIsBadRequest) {
  EXPECT_EQ(ParseWhole(MultipartPost("--BND\r\nContent-Disposition: form-data; name=\"a\"\r\n\r\nno end")).status,
            http::StatusCodeBadRequest);
  EXPECT_EQ(ParseWhole("POST /upload HTTP/1.1\r\nContent-Type: multipart/form-data; boundary=BND\r\n\r\n").status,
            http::StatusCodeLengthRequired);

  ParserLimits limits;
  limits.maxMultipartParts = 2;
  EXPECT_EQ(ParseWhole(MultipartPost(kMultipartBody), limits).status, http::StatusCodeBadRequest);
}
