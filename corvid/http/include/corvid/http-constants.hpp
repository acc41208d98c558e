#pragma once

#include <cstddef>
#include <string_view>

namespace corvid::http {

inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

// Header names
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view ContentDisposition = "Content-Disposition";
inline constexpr std::string_view ContentEncoding = "Content-Encoding";
inline constexpr std::string_view Cookie = "Cookie";
inline constexpr std::string_view Host = "Host";
inline constexpr std::string_view Location = "Location";
inline constexpr std::string_view SetCookie = "Set-Cookie";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view UserAgent = "User-Agent";

// Header values
inline constexpr std::string_view keepalive = "keep-alive";
inline constexpr std::string_view close = "close";
inline constexpr std::string_view chunked = "chunked";

inline constexpr std::string_view ContentTypeTextHtml = "text/html; charset=utf-8";
inline constexpr std::string_view ContentTypeTextPlain = "text/plain; charset=utf-8";
inline constexpr std::string_view ContentTypeFormUrlEncoded = "application/x-www-form-urlencoded";
inline constexpr std::string_view ContentTypeMultipartFormData = "multipart/form-data";
inline constexpr std::string_view ContentTypeOctetStream = "application/octet-stream";

// Minimal request line "GET /"
inline constexpr std::size_t kHttpReqLineMinLen = 5;

// Longest accepted chunk size line (hex digits plus optional extensions).
inline constexpr std::size_t kMaxChunkSizeLineLen = 1024;

}  // namespace corvid::http
