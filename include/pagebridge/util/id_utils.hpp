#pragma once

#include "pagebridge/util/result.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace pagebridge {

constexpr std::size_t kMaxIdLength = 100;

// Opaque service IDs look like "0-4D24C77F19546939!40109".
inline bool IsIdChar(char c) {
    return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           c == '-' || c == '!';
}

// Trims surrounding whitespace, then rejects empty, over-long, or
// non-whitelisted IDs. `label` names the ID in the error message.
Result SanitizeId(std::string_view raw, std::string_view label, std::string& out);

// ".../resources/{id}/$value" -> id, or "" when the URL has no such segment.
std::string ExtractPageItemId(std::string_view url);

// ".../onenote/pages/{id}..." -> id, or "".
std::string ExtractPageIdFromLocation(std::string_view url);

} // namespace pagebridge
