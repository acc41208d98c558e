#include "corvid/response-writer.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <iterator>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "corvid/cookies.hpp"
#include "corvid/header-map.hpp"
#include "corvid/http-constants.hpp"
#include "corvid/http-status-code.hpp"
#include "corvid/http-version.hpp"
#include "corvid/string-equal-ignore-case.hpp"
#include "corvid/stringconv.hpp"

namespace corvid::http {

namespace {

void AppendHeader(std::string& out, std::string_view name, std::string_view value) {
  out.append(name);
  out.append(": ");
  out.append(value);
  out.append(CRLF);
}

constexpr bool StatusHasNoBody(StatusCode status) {
  return (status >= 100 && status < 200) || status == StatusCodeNoContent || status == StatusCodeNotModified;
}

}  // namespace

ResponseWriter::ResponseWriter(std::string& out, Version version, bool headRequest, bool keepAlive)
    : _out(out), _version(version), _headRequest(headRequest), _keepAlive(keepAlive), _contentType(ContentTypeTextHtml) {}

void ResponseWriter::setStatus(StatusCode status, std::string_view reason) {
  _status = status;
  _reason.assign(reason);
}

bool ResponseWriter::hasHeader(std::string_view name) const {
  return std::ranges::any_of(_headers, [name](const HeaderPair& header) { return CaseInsensitiveEqual(header.first, name); });
}

void ResponseWriter::setHeader(std::string_view name, std::string_view value) {
  if (_headersComposed) {
    throw std::logic_error("cannot set header after headers were composed");
  }
  if (CaseInsensitiveEqual(name, Connection)) {
    if (HeaderValueHasToken(value, close)) {
      _keepAlive = false;
    }
    return;
  }
  if (CaseInsensitiveEqual(name, ContentType)) {
    _contentType.assign(value);
    return;
  }
  auto it = std::ranges::find_if(_headers, [name](const HeaderPair& header) { return CaseInsensitiveEqual(header.first, name); });
  if (it == _headers.end()) {
    _headers.emplace_back(std::string(name), std::string(value));
  } else {
    it->second.assign(value);
  }
}

void ResponseWriter::setCookie(ResponseCookie cookie) {
  if (_headersComposed) {
    throw std::logic_error("cannot set cookie after headers were composed");
  }
  _cookies.push_back(std::move(cookie));
}

void ResponseWriter::composeHeaders(std::span<const HeaderPair> globalHeaders) {
  if (_headersComposed) {
    throw std::logic_error("headers already composed");
  }
  _headersComposed = true;

  if (StatusHasNoBody(_status)) {
    _framing = Framing::None;
  } else if (hasHeader(ContentLength)) {
    const auto it = std::ranges::find_if(
        _headers, [](const HeaderPair& header) { return CaseInsensitiveEqual(header.first, ContentLength); });
    const auto declaredLength = StringToIntegral<std::size_t>(it->second);
    if (!declaredLength) {
      throw std::logic_error(fmt::format("invalid Content-Length '{}'", it->second));
    }
    _declaredLength = *declaredLength;
    _framing = Framing::ContentLength;
  } else if (_version == HTTP_1_1) {
    _framing = Framing::Chunked;
  } else {
    _framing = Framing::CloseDelimited;
    _keepAlive = false;
  }

  const std::string_view reason = _reason.empty() ? ReasonPhraseFor(_status) : std::string_view(_reason);
  fmt::format_to(std::back_inserter(_out), "{} {} {}\r\n", VersionToStr(_version), _status, reason);

  if (_framing != Framing::None) {
    AppendHeader(_out, ContentType, _contentType);
  }
  for (const auto& [name, value] : globalHeaders) {
    if (!hasHeader(name)) {
      AppendHeader(_out, name, value);
    }
  }
  for (const auto& [name, value] : _headers) {
    AppendHeader(_out, name, value);
  }
  for (const auto& cookie : _cookies) {
    AppendHeader(_out, SetCookie, cookie.serialize());
  }
  if (_framing == Framing::Chunked) {
    AppendHeader(_out, TransferEncoding, chunked);
  }
  AppendHeader(_out, Connection, _keepAlive ? keepalive : close);
  _out.append(CRLF);
}

void ResponseWriter::write(std::string_view data) {
  if (!_headersComposed) {
    throw std::logic_error("composeHeaders() must be called before writing the body");
  }
  if (_finished) {
    throw std::logic_error("response already finished");
  }
  if (_framing == Framing::ContentLength && data.size() > _declaredLength - _bodyBytes) {
    throw std::logic_error(
        fmt::format("body exceeds Content-Length of {} bytes ({} more after {})", _declaredLength, data.size(), _bodyBytes));
  }
  _bodyBytes += data.size();
  if (_headRequest || _framing == Framing::None || data.empty()) {
    return;
  }
  if (_framing == Framing::Chunked) {
    fmt::format_to(std::back_inserter(_out), "{:X}\r\n", data.size());
    _out.append(data);
    _out.append(CRLF);
  } else {
    _out.append(data);
  }
}

void ResponseWriter::finish() {
  if (_finished || !_headersComposed) {
    return;
  }
  _finished = true;
  if (_framing == Framing::ContentLength && !_headRequest && _bodyBytes != _declaredLength) {
    throw std::logic_error(
        fmt::format("body of {} bytes is shorter than its Content-Length of {}", _bodyBytes, _declaredLength));
  }
  if (_framing == Framing::Chunked && !_headRequest) {
    _out.append("0\r\n\r\n");
  }
}

void ResponseWriter::writeSimple(StatusCode status, std::string_view body, std::string_view contentType,
                                 std::span<const HeaderPair> globalHeaders) {
  setStatus(status);
  setContentType(contentType);
  if (!StatusHasNoBody(status)) {
    setHeader(ContentLength, std::to_string(body.size()));
  }
  composeHeaders(globalHeaders);
  write(body);
  finish();
}

}  // namespace corvid::http
