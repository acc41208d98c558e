#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace corvid::http {

// Incremental decoder for the chunked transfer coding. Chunk extensions are ignored,
// trailer fields are read and discarded. Input may be split at any byte boundary.
class ChunkedDecoder {
 public:
  enum class Status : uint8_t { NeedMoreData, Done, Error };

  // Decodes from 'in', appending payload bytes to 'out'. 'consumed' receives the number of bytes of 'in'
  // that were used; unused bytes must be presented again (with more data appended) on the next call.
  Status decode(std::string_view in, std::string& out, std::size_t& consumed);

  void reset() noexcept {
    _state = State::Size;
    _remaining = 0;
  }

 private:
  enum class State : uint8_t { Size, Data, DataCrlf, Trailer, Done };

  State _state{State::Size};
  std::size_t _remaining{0};
};

}  // namespace corvid::http
