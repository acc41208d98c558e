#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "corvid/param-value.hpp"

namespace corvid {

enum class ParamType : uint8_t { String, Integer, Float, Boolean };

// Maps a type tag of a typed capture group to its type:
//  - int, number, integer     -> Integer (int64_t)
//  - float, decimal, double   -> Float (double)
//  - bool                     -> Boolean
//  - str, string, word, slug, path -> String
// Tags are case-insensitive. Returns std::nullopt for an unknown tag.
std::optional<ParamType> ParamTypeFromTag(std::string_view tag);

std::string_view ParamTypeToStr(ParamType type);

// Converts the captured text to a value of the given type.
// Returns std::nullopt if the text is not a valid representation (non numeric, overflow, unknown boolean word).
// Booleans accept true/false/1/0/yes/no, case-insensitive.
std::optional<ParamValue> Coerce(ParamType type, std::string_view text);

}  // namespace corvid
