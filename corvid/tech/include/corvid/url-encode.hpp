#pragma once

#include <string>
#include <string_view>

namespace corvid::url {

// application/x-www-form-urlencoded encoding: unreserved characters are kept, space becomes '+',
// everything else is percent-encoded with upper case hex digits.
std::string EncodeFormComponent(std::string_view raw);

// Appends "name=value" pairs joined by '&' into out.
void AppendFormPair(std::string& out, std::string_view name, std::string_view value);

}  // namespace corvid::url
