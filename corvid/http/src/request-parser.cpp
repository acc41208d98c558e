#include "corvid/request-parser.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "corvid/chunked-decoder.hpp"
#include "corvid/cookies.hpp"
#include "corvid/header-map.hpp"
#include "corvid/http-constants.hpp"
#include "corvid/http-method.hpp"
#include "corvid/http-status-code.hpp"
#include "corvid/http-version.hpp"
#include "corvid/log.hpp"
#include "corvid/mime-types.hpp"
#include "corvid/multipart-form-data.hpp"
#include "corvid/query-params.hpp"
#include "corvid/string-equal-ignore-case.hpp"
#include "corvid/string-trim.hpp"
#include "corvid/stringconv.hpp"
#include "corvid/url-decode.hpp"

namespace corvid {

namespace {

bool StartsWithIgnoreCase(std::string_view str, std::string_view prefix) {
  return str.size() >= prefix.size() && CaseInsensitiveEqual(str.substr(0, prefix.size()), prefix);
}

bool IsFormUrlEncoded(const HttpRequest& request) {
  const auto contentType = request.headerValue(http::ContentType);
  return contentType && StartsWithIgnoreCase(TrimOws(*contentType), http::ContentTypeFormUrlEncoded);
}

bool IsMultipart(const HttpRequest& request) {
  const auto contentType = request.headerValue(http::ContentType);
  return contentType && http::IsMultipartFormData(*contentType);
}

bool IsValidHeaderName(std::string_view name) {
  return !name.empty() && std::ranges::none_of(name, [](char ch) {
    return ch == ' ' || ch == '\t' || static_cast<unsigned char>(ch) < 0x21 || ch == 0x7F;
  });
}

}  // namespace

void RequestParser::reset() {
  _state = ParserState::AwaitingRequestLine;
  _errorStatus = http::StatusCodeOK;
  _headerBytes = 0;
  _remainingBody = 0;
  _chunkedDecoder.reset();
  _request = HttpRequest{};
}

http::StatusCode RequestParser::fail(http::StatusCode status) {
  _state = ParserState::Failed;
  _errorStatus = status;
  return status;
}

http::StatusCode RequestParser::parse(std::string& input) {
  std::size_t pos = 0;
  http::StatusCode status = kStatusNeedMoreData;

  while (status == kStatusNeedMoreData) {
    const std::string_view rest = std::string_view(input).substr(pos);

    if (_state == ParserState::AwaitingRequestLine || _state == ParserState::ParsingHeaders) {
      const auto lfPos = rest.find('\n');
      const std::size_t lineLen = lfPos == std::string_view::npos ? rest.size() : lfPos;
      if (_state == ParserState::AwaitingRequestLine) {
        // The limit applies to the line content, its terminating CR excluded.
        const std::size_t contentLen = lineLen != 0 && rest[lineLen - 1] == '\r' ? lineLen - 1 : lineLen;
        if (contentLen > _limits.maxRequestLineBytes) {
          status = fail(http::StatusCodeURITooLong);
          break;
        }
      } else if (_headerBytes + lineLen + (lfPos == std::string_view::npos ? 0 : 1) > _limits.maxHeaderBytes) {
        status = fail(http::StatusCodeRequestHeaderFieldsTooLarge);
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

      if (_state == ParserState::AwaitingRequestLine) {
        if (line.empty()) {
          // tolerate empty lines preceding a request line
          continue;
        }
        status = parseRequestLine(line);
      } else {
        _headerBytes += lfPos + 1;
        status = line.empty() ? onHeadersComplete() : parseHeaderLine(line);
      }
    } else if (_state == ParserState::AwaitingBody) {
      if (_request._chunked) {
        std::size_t consumed = 0;
        const auto decodeStatus = _chunkedDecoder.decode(rest, _request._body, consumed);
        pos += consumed;
        if (decodeStatus == http::ChunkedDecoder::Status::Error) {
          status = fail(http::StatusCodeBadRequest);
        } else if (_request._body.size() > _limits.maxBodyBytes) {
          status = fail(http::StatusCodePayloadTooLarge);
        } else if (decodeStatus == http::ChunkedDecoder::Status::Done) {
          status = finalize();
        } else {
          break;
        }
      } else {
        const std::size_t nb = std::min(_remainingBody, rest.size());
        _request._body.append(rest.data(), nb);
        pos += nb;
        _remainingBody -= nb;
        if (_remainingBody != 0) {
          break;
        }
        status = finalize();
      }
    } else {
      // ReadyToDispatch or Failed: nothing more to consume until reset()
      status = _state == ParserState::Failed ? _errorStatus : http::StatusCodeOK;
    }
  }

  input.erase(0, pos);
  return status;
}

http::StatusCode RequestParser::parseRequestLine(std::string_view line) {
  // METHOD SP target [SP HTTP/x.y]
  const auto firstSp = line.find(' ');
  if (line.size() < http::kHttpReqLineMinLen || firstSp == std::string_view::npos) {
    return fail(http::StatusCodeBadRequest);
  }
  const std::string_view methodStr = line.substr(0, firstSp);
  std::string_view rest = line.substr(firstSp + 1);
  const auto secondSp = rest.find(' ');
  const std::string_view target = rest.substr(0, secondSp);
  std::string_view versionStr;
  if (secondSp != std::string_view::npos) {
    versionStr = rest.substr(secondSp + 1);
    if (versionStr.find(' ') != std::string_view::npos) {
      return fail(http::StatusCodeBadRequest);
    }
  }
  if (target.empty() || methodStr.empty()) {
    return fail(http::StatusCodeBadRequest);
  }

  const auto method = http::MethodFromStr(methodStr);
  if (!method) {
    log::debug("Unsupported method token '{}'", methodStr);
    return fail(http::StatusCodeNotImplemented);
  }
  _request._method = *method;

  if (versionStr.empty()) {
    _request._version = http::HTTP_1_0;
  } else {
    const auto version = http::ParseVersion(versionStr);
    if (!version) {
      return fail(http::StatusCodeBadRequest);
    }
    if (*version != http::HTTP_1_0 && *version != http::HTTP_1_1) {
      return fail(http::StatusCodeHTTPVersionNotSupported);
    }
    _request._version = *version;
  }

  if (target.front() != '/') {
    _request._target.reserve(target.size() + 1);
    _request._target.push_back('/');
  }
  _request._target.append(target);

  const std::string_view fullTarget = _request._target;
  const auto qPos = fullTarget.find('?');
  auto decodedPath = url::Decode(fullTarget.substr(0, qPos));
  if (!decodedPath) {
    return fail(http::StatusCodeBadRequest);
  }
  _request._path = std::move(*decodedPath);
  if (qPos != std::string_view::npos) {
    _request._queryString = fullTarget.substr(qPos + 1);
    if (!http::ParseUrlEncoded(_request._queryString, _request._queryParams)) {
      return fail(http::StatusCodeBadRequest);
    }
  }

  _state = ParserState::ParsingHeaders;
  return kStatusNeedMoreData;
}

http::StatusCode RequestParser::parseHeaderLine(std::string_view line) {
  if (line.front() == ' ' || line.front() == '\t') {
    // obsolete line folding
    return fail(http::StatusCodeBadRequest);
  }
  const auto colonPos = line.find(':');
  if (colonPos == std::string_view::npos) {
    return fail(http::StatusCodeBadRequest);
  }
  const std::string_view name = line.substr(0, colonPos);
  if (!IsValidHeaderName(name)) {
    return fail(http::StatusCodeBadRequest);
  }
  const std::string_view value = TrimOws(line.substr(colonPos + 1));

  auto it = _request._headers.find(name);
  if (it == _request._headers.end()) {
    _request._headers.emplace(std::string(name), std::string(value));
  } else if (CaseInsensitiveEqual(name, http::Cookie)) {
    it->second.append("; ").append(value);
  } else {
    it->second.assign(value);
  }
  return kStatusNeedMoreData;
}

http::StatusCode RequestParser::onHeadersComplete() {
  const auto transferEncoding = _request.headerValue(http::TransferEncoding);
  const auto contentLength = _request.headerValue(http::ContentLength);

  if (transferEncoding) {
    if (contentLength) {
      return fail(http::StatusCodeBadRequest);
    }
    // chunked must be the final coding
    std::string_view te = TrimOws(*transferEncoding);
    const auto lastComma = te.rfind(',');
    if (lastComma != std::string_view::npos) {
      te = TrimOws(te.substr(lastComma + 1));
    }
    if (!CaseInsensitiveEqual(te, http::chunked)) {
      return fail(http::StatusCodeNotImplemented);
    }
    _request._chunked = true;
    _state = ParserState::AwaitingBody;
    return kStatusNeedMoreData;
  }

  if (contentLength) {
    const auto length = StringToIntegral<std::size_t>(TrimOws(*contentLength));
    if (!length) {
      return fail(http::StatusCodeBadRequest);
    }
    if (*length > _limits.maxBodyBytes) {
      return fail(http::StatusCodePayloadTooLarge);
    }
    _request._contentLength = *length;
    if (*length != 0) {
      _remainingBody = *length;
      _request._body.reserve(*length);
      _state = ParserState::AwaitingBody;
      return kStatusNeedMoreData;
    }
  } else if (_request._method == http::Method::POST && (IsFormUrlEncoded(_request) || IsMultipart(_request))) {
    return fail(http::StatusCodeLengthRequired);
  }
  return finalize();
}

http::StatusCode RequestParser::finalize() {
  if (const auto cookieHeader = _request.headerValue(http::Cookie)) {
    http::ParseCookieHeader(*cookieHeader, _request._cookies);
  }
  if (!_request._body.empty() && IsFormUrlEncoded(_request) &&
      !http::ParseUrlEncoded(_request._body, _request._queryParams)) {
    return fail(http::StatusCodeBadRequest);
  }
  if (!_request._body.empty() && IsMultipart(_request)) {
    const auto status = parseMultipartBody(*_request.headerValue(http::ContentType));
    if (status != kStatusNeedMoreData) {
      return status;
    }
  }
  _state = ParserState::ReadyToDispatch;
  return http::StatusCodeOK;
}

http::StatusCode RequestParser::parseMultipartBody(std::string_view contentType) {
  const http::MultipartFormData form(contentType, _request._body,
                                     http::MultipartFormDataOptions{_limits.maxMultipartParts, 32});
  if (!form.valid()) {
    log::debug("Rejecting multipart body: {}", form.invalidReason());
    return fail(http::StatusCodeBadRequest);
  }
  for (const auto& part : form.parts()) {
    if (!part.filename) {
      _request._queryParams.add(std::string(part.name), std::string(part.value));
      continue;
    }
    auto& upload = _request._uploads.emplace_back();
    upload.fieldName = part.name;
    upload.filename = *part.filename;
    if (!part.contentType.empty()) {
      upload.contentType = part.contentType;
    } else if (const auto guessed = MimeTypeForPath(upload.filename); !guessed.empty()) {
      upload.contentType = guessed;
    } else {
      upload.contentType = http::ContentTypeOctetStream;
    }
    upload.size = part.value.size();
    upload.bodyOffset = static_cast<std::size_t>(part.value.data() - _request._body.data());
    if (_limits.maxUploadBytes != 0 && upload.size > _limits.maxUploadBytes) {
      log::warn("Upload '{}' of field '{}' exceeds the upload limit ({} > {} bytes)", upload.filename,
                upload.fieldName, upload.size, _limits.maxUploadBytes);
      upload.error = http::UploadError::MaxSizeExceeded;
    }
  }
  return kStatusNeedMoreData;
}

}  // namespace corvid
