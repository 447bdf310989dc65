#pragma once

#include <string>
#include <string_view>

namespace pagebridge {

struct ImageLimits {
    int max_width = 1024;
    int max_height = 768;
};

// Shrinks a PNG larger than `limits` to fit, keeping the aspect ratio, and
// replaces `data` with the re-encoded image. Returns false and leaves `data`
// untouched for other content types, images already within limits, or
// bytes that do not decode.
bool ScaleImageIfNeeded(std::string& data, std::string_view content_type, const ImageLimits& limits);

} // namespace pagebridge
