#include "corvid/url-encode.hpp"

#include <string>
#include <string_view>

#include "corvid/char-hexadecimal-converter.hpp"

namespace corvid::url {

namespace {

constexpr bool IsUnreserved(char ch) noexcept {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '-' || ch == '.' ||
         ch == '_' || ch == '~';
}

void AppendEncoded(std::string& out, std::string_view raw) {
  for (char ch : raw) {
    if (IsUnreserved(ch)) {
      out.push_back(ch);
    } else if (ch == ' ') {
      out.push_back('+');
    } else {
      const auto byte = static_cast<unsigned char>(ch);
      out.push_back('%');
      out.push_back(kHexDigitsUpper[byte >> 4]);
      out.push_back(kHexDigitsUpper[byte & 0x0F]);
    }
  }
}

}  // namespace

std::string EncodeFormComponent(std::string_view raw) {
  std::string ret;
  ret.reserve(raw.size());
  AppendEncoded(ret, raw);
  return ret;
}

void AppendFormPair(std::string& out, std::string_view name, std::string_view value) {
  if (!out.empty()) {
    out.push_back('&');
  }
  AppendEncoded(out, name);
  out.push_back('=');
  AppendEncoded(out, value);
}

}  // namespace corvid::url
