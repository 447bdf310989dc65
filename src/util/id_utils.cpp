#include "pagebridge/util/id_utils.hpp"

#include "pagebridge/util/logger.hpp"

namespace pagebridge {

namespace {

std::string_view Trim(std::string_view s) {
    constexpr std::string_view kWs = " \t\r\n\f\v";
    const auto b = s.find_first_not_of(kWs);
    if (b == std::string_view::npos) return {};
    const auto e = s.find_last_not_of(kWs);
    return s.substr(b, e - b + 1);
}

std::size_t IdRunLength(std::string_view s) {
    std::size_t n = 0;
    while (n < s.size() && IsIdChar(s[n])) ++n;
    return n;
}

} // namespace

Result SanitizeId(std::string_view raw, std::string_view label, std::string& out) {
    const std::string name(label);
    const std::string_view id = Trim(raw);
    if (id.empty()) {
        return Result::Invalid(name + " cannot be empty");
    }
    for (char c : id) {
        if (!IsIdChar(c)) {
            LogDebug("Invalid character in %s: 0x%02x", name.c_str(), static_cast<unsigned char>(c));
            return Result::Invalid(name + " contains invalid characters");
        }
    }
    if (id.size() > kMaxIdLength) {
        return Result::Invalid(name + " is too long");
    }
    out.assign(id);
    return Result::Ok();
}

std::string ExtractPageItemId(std::string_view url) {
    constexpr std::string_view kMarker = "/resources/";
    constexpr std::string_view kSuffix = "/$value";

    std::size_t pos = url.find(kMarker);
    while (pos != std::string_view::npos) {
        const std::string_view rest = url.substr(pos + kMarker.size());
        const std::size_t n = IdRunLength(rest);
        if (n > 0 && rest.substr(n, kSuffix.size()) == kSuffix) {
            return std::string(rest.substr(0, n));
        }
        pos = url.find(kMarker, pos + 1);
    }
    return {};
}

std::string ExtractPageIdFromLocation(std::string_view url) {
    constexpr std::string_view kMarker = "/onenote/pages/";

    std::size_t pos = url.find(kMarker);
    while (pos != std::string_view::npos) {
        const std::string_view rest = url.substr(pos + kMarker.size());
        const std::size_t n = IdRunLength(rest);
        if (n > 0) {
            return std::string(rest.substr(0, n));
        }
        pos = url.find(kMarker, pos + 1);
    }
    return {};
}

} // namespace pagebridge
