#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace corvid::url {

// Decodes within the provided buffer, compacting percent-encoded sequences and translating '+'
// into plusAs. Returns nullptr on invalid encoding (truncated % or non-hex digits) when strictInvalid is true,
// leaving the buffer in an unspecified partially modified state.
// Returns a pointer to the new logical end of the decoded sequence.
// plusAs should be ' ' only for query strings and form bodies, not for paths.
char* DecodeInPlace(char* first, const char* last, char plusAs = '+', bool strictInvalid = true);

// Copying variant. Returns std::nullopt on invalid encoding.
std::optional<std::string> Decode(std::string_view encoded, char plusAs = '+');

}  // namespace corvid::url
