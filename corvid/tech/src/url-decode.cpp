#include "corvid/url-decode.hpp"

#include <optional>
#include <string>
#include <string_view>

#include "corvid/char-hexadecimal-converter.hpp"

namespace corvid::url {

char* DecodeInPlace(char* first, const char* last, char plusAs, bool strictInvalid) {
  char* out = first;
  for (; first < last; ++first) {
    char ch = *first;
    switch (ch) {
      case '+':
        *out++ = plusAs;
        break;
      case '%': {
        if (first + 2 >= last) {
          if (strictInvalid) {
            return nullptr;
          }
          // best effort: keep the remaining characters literally
          while (first < last) {
            *out++ = *first++;
          }
          return out;
        }
        char c1 = *++first;
        char c2 = *++first;
        int v1 = from_hex_digit(c1);
        int v2 = from_hex_digit(c2);
        if (v1 < 0 || v2 < 0) {
          if (strictInvalid) {
            return nullptr;
          }
          *out++ = '%';
          *out++ = c1;
          *out++ = c2;
          break;
        }
        *out++ = static_cast<char>((v1 << 4) | v2);
        break;
      }
      default:
        *out++ = ch;
        break;
    }
  }
  return out;
}

std::optional<std::string> Decode(std::string_view encoded, char plusAs) {
  std::string ret(encoded);
  char* newEnd = DecodeInPlace(ret.data(), ret.data() + ret.size(), plusAs);
  if (newEnd == nullptr) {
    return std::nullopt;
  }
  ret.resize(static_cast<std::size_t>(newEnd - ret.data()));
  return ret;
}

}  // namespace corvid::url
