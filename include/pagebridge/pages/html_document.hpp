#pragma once

#include <cstddef>
#include <expected>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pagebridge {

using HtmlAttributes = std::vector<std::pair<std::string, std::string>>;

// Read-only snapshot of one element. `index` is the element's position in
// document order and stays valid for the lifetime of the owning document.
struct HtmlElement {
    std::size_t index = 0;
    std::string tag;
    HtmlAttributes attributes;

    // "" when absent.
    std::string Attribute(std::string_view name) const;
    bool HasAttribute(std::string_view name) const;
};

// A parsed HTML tree owned by one caller. Not shared between threads.
class HtmlDocument {
public:
    HtmlDocument(const HtmlDocument&) = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;
    HtmlDocument(HtmlDocument&&) noexcept;
    HtmlDocument& operator=(HtmlDocument&&) noexcept;
    ~HtmlDocument();

    // Parses a body fragment such as "<p>text</p><img src=...>".
    static std::expected<HtmlDocument, std::string> ParseFragment(std::string_view html);
    // Parses a complete page as returned by the content endpoint.
    static std::expected<HtmlDocument, std::string> ParseDocument(std::string_view html);

    // Elements whose lowercase tag name is one of `tags`, in document order.
    std::vector<HtmlElement> FindElements(std::initializer_list<std::string_view> tags) const;

    // Drops every attribute of the element and sets `attributes` instead.
    bool ReplaceAttributes(std::size_t index, const HtmlAttributes& attributes);

    // Serializes the children of <body> without reformatting.
    std::expected<std::string, std::string> RenderBody() const;

private:
    struct Impl;
    explicit HtmlDocument(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

} // namespace pagebridge
