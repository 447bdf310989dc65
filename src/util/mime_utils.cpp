#include "pagebridge/util/mime_utils.hpp"

#include <array>
#include <utility>

namespace pagebridge {

namespace {

struct ExtensionRule {
    std::string_view prefix;
    std::string_view ext;
};

constexpr std::array<ExtensionRule, 12> kRules{{
    {"image/jpeg", ".jpg"},
    {"image/png", ".png"},
    {"image/gif", ".gif"},
    {"image/bmp", ".bmp"},
    {"image/webp", ".webp"},
    {"image/svg", ".svg"},
    {"application/pdf", ".pdf"},
    {"text/plain", ".txt"},
    {"text/html", ".html"},
    {"application/json", ".json"},
    {"application/xml", ".xml"},
    {"application/zip", ".zip"},
}};

constexpr std::string_view kOfficePrefix = "application/vnd.openxmlformats-officedocument";

} // namespace

std::string ExtensionForContentType(std::string_view content_type) {
    for (const auto& rule : kRules) {
        if (content_type.starts_with(rule.prefix)) return std::string(rule.ext);
    }
    if (content_type.starts_with(kOfficePrefix)) {
        if (content_type.find("wordprocessingml") != std::string_view::npos) return ".docx";
        if (content_type.find("spreadsheetml") != std::string_view::npos) return ".xlsx";
        if (content_type.find("presentationml") != std::string_view::npos) return ".pptx";
        return ".office";
    }
    return {};
}

std::string FilenameForItem(std::string_view item_id, std::string_view content_type) {
    std::string ext = ExtensionForContentType(content_type);
    if (ext.empty()) ext = ".bin";
    std::string out(item_id);
    out += ext;
    return out;
}

std::string HtmlEscape(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        case '\'': out += "&#39;"; break;
        default: out.push_back(c); break;
        }
    }
    return out;
}

} // namespace pagebridge
