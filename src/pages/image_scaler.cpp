#include "pagebridge/pages/image_scaler.hpp"

#include "pagebridge/util/logger.hpp"

#include <png.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

namespace pagebridge {

namespace {

constexpr int kChannels = 4; // PNG_FORMAT_RGBA

class PngImage final {
public:
    PngImage() {
        img_.version = PNG_IMAGE_VERSION;
        img_.opaque = nullptr;
    }
    PngImage(const PngImage&) = delete;
    PngImage& operator=(const PngImage&) = delete;
    ~PngImage() { png_image_free(&img_); }

    png_image* get() { return &img_; }
    const char* message() const { return img_.message; }

private:
    png_image img_{};
};

struct Pixels {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::vector<std::uint8_t> rgba;
};

bool DecodePng(const std::string& data, Pixels& out) {
    PngImage img;
    if (!png_image_begin_read_from_memory(img.get(), data.data(), data.size())) {
        LogDebug("Not a decodable PNG: %s", img.message());
        return false;
    }
    img.get()->format = PNG_FORMAT_RGBA;
    std::vector<std::uint8_t> buf(PNG_IMAGE_SIZE(*img.get()));
    if (!png_image_finish_read(img.get(), nullptr, buf.data(), 0, nullptr)) {
        LogDebug("PNG decode failed: %s", img.message());
        return false;
    }
    out.width = img.get()->width;
    out.height = img.get()->height;
    out.rgba = std::move(buf);
    return true;
}

bool EncodePng(const Pixels& px, std::string& out) {
    PngImage img;
    img.get()->width = px.width;
    img.get()->height = px.height;
    img.get()->format = PNG_FORMAT_RGBA;

    png_alloc_size_t size = 0;
    if (!png_image_write_to_memory(img.get(), nullptr, &size, 0, px.rgba.data(), 0, nullptr)) {
        LogDebug("PNG size query failed: %s", img.message());
        return false;
    }
    std::string buf(size, '\0');
    if (!png_image_write_to_memory(img.get(), buf.data(), &size, 0, px.rgba.data(), 0, nullptr)) {
        LogDebug("PNG encode failed: %s", img.message());
        return false;
    }
    buf.resize(size);
    out = std::move(buf);
    return true;
}

// Bilinear resample of an RGBA buffer.
Pixels Resample(const Pixels& src, std::uint32_t width, std::uint32_t height) {
    Pixels dst;
    dst.width = width;
    dst.height = height;
    dst.rgba.resize(static_cast<std::size_t>(width) * height * kChannels);

    const double sx = static_cast<double>(src.width) / width;
    const double sy = static_cast<double>(src.height) / height;
    auto at = [&](std::uint32_t x, std::uint32_t y, int c) -> double {
        return src.rgba[(static_cast<std::size_t>(y) * src.width + x) * kChannels + c];
    };

    for (std::uint32_t y = 0; y < height; ++y) {
        const double fy = std::clamp((y + 0.5) * sy - 0.5, 0.0, static_cast<double>(src.height - 1));
        const auto y0 = static_cast<std::uint32_t>(fy);
        const std::uint32_t y1 = std::min(y0 + 1, src.height - 1);
        const double wy = fy - y0;
        for (std::uint32_t x = 0; x < width; ++x) {
            const double fx = std::clamp((x + 0.5) * sx - 0.5, 0.0, static_cast<double>(src.width - 1));
            const auto x0 = static_cast<std::uint32_t>(fx);
            const std::uint32_t x1 = std::min(x0 + 1, src.width - 1);
            const double wx = fx - x0;
            for (int c = 0; c < kChannels; ++c) {
                const double top = at(x0, y0, c) * (1 - wx) + at(x1, y0, c) * wx;
                const double bottom = at(x0, y1, c) * (1 - wx) + at(x1, y1, c) * wx;
                const double v = top * (1 - wy) + bottom * wy;
                dst.rgba[(static_cast<std::size_t>(y) * width + x) * kChannels + c] =
                    static_cast<std::uint8_t>(std::clamp(std::lround(v), 0L, 255L));
            }
        }
    }
    return dst;
}

} // namespace

bool ScaleImageIfNeeded(std::string& data, std::string_view content_type, const ImageLimits& limits) {
    if (content_type != "image/png") return false;
    if (limits.max_width <= 0 || limits.max_height <= 0) return false;

    Pixels src;
    if (!DecodePng(data, src)) return false;

    const auto max_w = static_cast<std::uint32_t>(limits.max_width);
    const auto max_h = static_cast<std::uint32_t>(limits.max_height);
    if (src.width <= max_w && src.height <= max_h) return false;

    // Fit to whichever side hits its limit first.
    std::uint64_t w = max_w;
    std::uint64_t h = max_h;
    if (static_cast<std::uint64_t>(src.width) * max_h >= static_cast<std::uint64_t>(src.height) * max_w) {
        h = std::max<std::uint64_t>(1, static_cast<std::uint64_t>(src.height) * max_w / src.width);
    } else {
        w = std::max<std::uint64_t>(1, static_cast<std::uint64_t>(src.width) * max_h / src.height);
    }

    std::string encoded;
    if (!EncodePng(Resample(src, static_cast<std::uint32_t>(w), static_cast<std::uint32_t>(h)), encoded)) {
        return false;
    }

    LogDebug("Scaled image %ux%u -> %llux%llu (%zu -> %zu bytes)", src.width, src.height,
             static_cast<unsigned long long>(w), static_cast<unsigned long long>(h), data.size(),
             encoded.size());
    data = std::move(encoded);
    return true;
}

} // namespace pagebridge
