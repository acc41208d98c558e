#include "corvid/response-parser.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "corvid/chunked-decoder.hpp"
#include "corvid/cookies.hpp"
#include "corvid/header-map.hpp"
#include "corvid/http-constants.hpp"
#include "corvid/http-status-code.hpp"
#include "corvid/http-version.hpp"
#include "corvid/string-equal-ignore-case.hpp"
#include "corvid/string-trim.hpp"
#include "corvid/stringconv.hpp"

namespace corvid {

namespace {

// Bound on the response head (status line and headers).
constexpr std::size_t kMaxResponseHeadBytes = 64UL * 1024;

void SplitContentType(std::string_view value, ClientResponse& response) {
  auto semiPos = value.find(';');
  response.contentType.assign(TrimOws(value.substr(0, semiPos)));
  while (semiPos != std::string_view::npos) {
    value.remove_prefix(semiPos + 1);
    semiPos = value.find(';');
    const std::string_view param = TrimOws(value.substr(0, semiPos));
    const auto eqPos = param.find('=');
    if (eqPos != std::string_view::npos && CaseInsensitiveEqual(TrimOws(param.substr(0, eqPos)), "charset")) {
      std::string_view charset = TrimOws(param.substr(eqPos + 1));
      if (charset.size() >= 2 && charset.front() == '"' && charset.back() == '"') {
        charset = charset.substr(1, charset.size() - 2);
      }
      response.charset.assign(charset);
    }
  }
}

}  // namespace

ResponseParser::Status ResponseParser::fail(std::string_view message) {
  _state = State::Failed;
  _errorMessage.assign(message);
  return Status::Error;
}

ResponseParser::Status ResponseParser::complete() {
  _state = State::Complete;
  return Status::Complete;
}

ResponseParser::Status ResponseParser::parse(std::string& input) {
  std::size_t pos = 0;
  Status status = Status::NeedMoreData;

  while (status == Status::NeedMoreData) {
    const std::string_view rest = std::string_view(input).substr(pos);
    if (_state == State::StatusLine || _state == State::Headers) {
      const auto lfPos = rest.find('\n');
      if (_headBytes + (lfPos == std::string_view::npos ? rest.size() : lfPos + 1) > kMaxResponseHeadBytes) {
        status = fail("response head too large");
        break;
      }
      if (lfPos == std::string_view::npos) {
        break;
      }
      std::string_view line = rest.substr(0, lfPos);
      if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
      }
      pos += lfPos + 1;
      _headBytes += lfPos + 1;
      if (_state == State::StatusLine) {
        status = parseStatusLine(line);
      } else {
        status = line.empty() ? onHeadersComplete() : parseHeaderLine(line);
      }
    } else if (_state == State::ContentLengthBody) {
      const std::size_t nb = std::min(_remainingBody, rest.size());
      _response.body.append(rest.data(), nb);
      pos += nb;
      _remainingBody -= nb;
      if (_remainingBody != 0) {
        break;
      }
      status = complete();
    } else if (_state == State::ChunkedBody) {
      std::size_t consumed = 0;
      const auto decodeStatus = _chunkedDecoder.decode(rest, _response.body, consumed);
      pos += consumed;
      if (decodeStatus == http::ChunkedDecoder::Status::Error) {
        status = fail("invalid chunked encoding");
      } else if (_response.body.size() > _maxResponseBytes) {
        status = fail("response body too large");
      } else if (decodeStatus == http::ChunkedDecoder::Status::Done) {
        status = complete();
      } else {
        break;
      }
    } else if (_state == State::UntilCloseBody) {
      _response.body.append(rest);
      pos += rest.size();
      if (_response.body.size() > _maxResponseBytes) {
        status = fail("response body too large");
      }
      break;
    } else {
      status = _state == State::Complete ? Status::Complete : Status::Error;
    }
  }

  input.erase(0, pos);
  return status;
}

ResponseParser::Status ResponseParser::onEof() {
  switch (_state) {
    case State::UntilCloseBody:
      [[fallthrough]];
    case State::Complete:
      return complete();
    case State::Failed:
      return Status::Error;
    default:
      return fail("connection closed before the response was complete");
  }
}

ResponseParser::Status ResponseParser::parseStatusLine(std::string_view line) {
  // HTTP/x.y SP code [SP reason]
  const auto firstSp = line.find(' ');
  const auto version = http::ParseVersion(line.substr(0, firstSp));
  if (firstSp == std::string_view::npos || !version || version->major != 1) {
    return fail("malformed status line");
  }
  std::string_view rest = line.substr(firstSp + 1);
  const auto secondSp = rest.find(' ');
  const auto code = StringToIntegral<http::StatusCode>(rest.substr(0, secondSp));
  if (!code || *code < 100 || *code > 999) {
    return fail("malformed status code");
  }
  _response.version = *version;
  _response.status = *code;
  if (secondSp != std::string_view::npos) {
    _response.reason.assign(rest.substr(secondSp + 1));
  }
  _state = State::Headers;
  return Status::NeedMoreData;
}

ResponseParser::Status ResponseParser::parseHeaderLine(std::string_view line) {
  const auto colonPos = line.find(':');
  if (colonPos == std::string_view::npos || colonPos == 0) {
    return fail("malformed header line");
  }
  const std::string_view name = TrimOws(line.substr(0, colonPos));
  const std::string_view value = TrimOws(line.substr(colonPos + 1));
  if (CaseInsensitiveEqual(name, http::SetCookie)) {
    if (auto cookie = http::ParseSetCookie(value)) {
      _response.cookies.insert_or_assign(std::move(cookie->first), std::move(cookie->second));
    }
  }
  _response.headers.insert_or_assign(std::string(name), std::string(value));
  return Status::NeedMoreData;
}

ResponseParser::Status ResponseParser::onHeadersComplete() {
  const auto connection = _response.headerValue(http::Connection);
  if (_response.version == http::HTTP_1_1) {
    _response.keepAlive = !connection || !http::HeaderValueHasToken(*connection, http::close);
  } else {
    _response.keepAlive = connection && http::HeaderValueHasToken(*connection, http::keepalive);
  }
  if (const auto contentType = _response.headerValue(http::ContentType)) {
    SplitContentType(*contentType, _response);
  }
  if (const auto contentEncoding = _response.headerValue(http::ContentEncoding)) {
    _response.contentEncoding.assign(*contentEncoding);
  }

  const auto status = _response.status;
  if (_headRequest || (status >= 100 && status < 200) || status == http::StatusCodeNoContent ||
      status == http::StatusCodeNotModified) {
    return complete();
  }
  if (const auto te = _response.headerValue(http::TransferEncoding)) {
    if (!http::HeaderValueHasToken(*te, http::chunked)) {
      return fail("unsupported transfer encoding");
    }
    _state = State::ChunkedBody;
    return Status::NeedMoreData;
  }
  if (const auto contentLength = _response.headerValue(http::ContentLength)) {
    const auto length = StringToIntegral<std::size_t>(*contentLength);
    if (!length) {
      return fail("invalid Content-Length");
    }
    if (*length > _maxResponseBytes) {
      return fail("response body too large");
    }
    if (*length == 0) {
      return complete();
    }
    _remainingBody = *length;
    _state = State::ContentLengthBody;
    return Status::NeedMoreData;
  }
  _response.keepAlive = false;
  _state = State::UntilCloseBody;
  return Status::NeedMoreData;
}

}  // namespace corvid
