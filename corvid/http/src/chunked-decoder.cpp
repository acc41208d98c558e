#include "corvid/chunked-decoder.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>

#include "corvid/http-constants.hpp"
#include "corvid/string-trim.hpp"
#include "corvid/stringconv.hpp"

namespace corvid::http {

ChunkedDecoder::Status ChunkedDecoder::decode(std::string_view in, std::string& out, std::size_t& consumed) {
  consumed = 0;
  while (true) {
    const std::string_view rest = in.substr(consumed);
    switch (_state) {
      case State::Size:
        [[fallthrough]];
      case State::Trailer: {
        const auto lfPos = rest.find('\n');
        if (lfPos == std::string_view::npos) {
          return rest.size() > kMaxChunkSizeLineLen ? Status::Error : Status::NeedMoreData;
        }
        if (lfPos > kMaxChunkSizeLineLen) {
          return Status::Error;
        }
        std::string_view line = rest.substr(0, lfPos);
        if (!line.empty() && line.back() == '\r') {
          line.remove_suffix(1);
        }
        consumed += lfPos + 1;
        if (_state == State::Trailer) {
          if (line.empty()) {
            _state = State::Done;
            return Status::Done;
          }
          break;  // trailer field, discarded
        }
        const auto extPos = line.find(';');
        auto size = StringToIntegral<std::size_t>(TrimOws(line.substr(0, extPos)), 16);
        if (!size) {
          return Status::Error;
        }
        _remaining = *size;
        _state = _remaining == 0 ? State::Trailer : State::Data;
        break;
      }
      case State::Data: {
        if (rest.empty()) {
          return Status::NeedMoreData;
        }
        const std::size_t nb = std::min(_remaining, rest.size());
        out.append(rest.data(), nb);
        consumed += nb;
        _remaining -= nb;
        if (_remaining == 0) {
          _state = State::DataCrlf;
        }
        break;
      }
      case State::DataCrlf: {
        if (rest.empty()) {
          return Status::NeedMoreData;
        }
        if (rest[0] == '\n') {
          consumed += 1;
        } else if (rest[0] == '\r') {
          if (rest.size() < 2) {
            return Status::NeedMoreData;
          }
          if (rest[1] != '\n') {
            return Status::Error;
          }
          consumed += 2;
        } else {
          return Status::Error;
        }
        _state = State::Size;
        break;
      }
      case State::Done:
        return Status::Done;
    }
  }
}

}  // namespace corvid::http
