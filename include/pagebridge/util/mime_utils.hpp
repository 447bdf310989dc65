#pragma once

#include <string>
#include <string_view>

namespace pagebridge {

constexpr const char* kDefaultContentType = "application/octet-stream";

// ".jpg", ".pdf", ... or "" when the type is not recognized.
std::string ExtensionForContentType(std::string_view content_type);

// `<item_id><ext>`, falling back to ".bin".
std::string FilenameForItem(std::string_view item_id, std::string_view content_type);

std::string HtmlEscape(std::string_view s);

} // namespace pagebridge
