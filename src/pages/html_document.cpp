#include "pagebridge/pages/html_document.hpp"

#include <libxml/HTMLparser.h>
#include <libxml/HTMLtree.h>
#include <libxml/parser.h>
#include <libxml/tree.h>

#include <climits>
#include <mutex>

namespace pagebridge {

namespace {

constexpr int kParseOptions = HTML_PARSE_NODEFDTD | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING |
                              HTML_PARSE_NONET;

void EnsureLibxmlInitialized() {
    static std::once_flag once;
    std::call_once(once, [] { xmlInitParser(); });
}

struct DocDeleter {
    void operator()(xmlDoc* d) const {
        if (d) xmlFreeDoc(d);
    }
};

class XmlString final {
public:
    explicit XmlString(xmlChar* s) : s_(s) {}
    XmlString(const XmlString&) = delete;
    XmlString& operator=(const XmlString&) = delete;
    ~XmlString() {
        if (s_) xmlFree(s_);
    }

    std::string str() const { return s_ ? reinterpret_cast<const char*>(s_) : ""; }

private:
    xmlChar* s_ = nullptr;
};

class OutputBuffer final {
public:
    OutputBuffer() : buf_(xmlAllocOutputBuffer(nullptr)) {}
    OutputBuffer(const OutputBuffer&) = delete;
    OutputBuffer& operator=(const OutputBuffer&) = delete;
    ~OutputBuffer() {
        if (buf_) (void)xmlOutputBufferClose(buf_);
    }

    xmlOutputBuffer* get() const { return buf_; }
    bool ok() const { return buf_ != nullptr; }

private:
    xmlOutputBuffer* buf_ = nullptr;
};

std::string NodeName(const xmlNode* n) {
    return n->name ? reinterpret_cast<const char*>(n->name) : "";
}

void CollectElements(xmlNode* n, std::vector<xmlNode*>& out) {
    for (xmlNode* cur = n; cur; cur = cur->next) {
        if (cur->type == XML_ELEMENT_NODE) out.push_back(cur);
        if (cur->children) CollectElements(cur->children, out);
    }
}

xmlNode* FindBody(xmlNode* n) {
    for (xmlNode* cur = n; cur; cur = cur->next) {
        if (cur->type == XML_ELEMENT_NODE && NodeName(cur) == "body") return cur;
        if (cur->children) {
            if (xmlNode* found = FindBody(cur->children)) return found;
        }
    }
    return nullptr;
}

} // namespace

std::string HtmlElement::Attribute(std::string_view name) const {
    for (const auto& [k, v] : attributes) {
        if (k == name) return v;
    }
    return {};
}

bool HtmlElement::HasAttribute(std::string_view name) const {
    for (const auto& kv : attributes) {
        if (kv.first == name) return true;
    }
    return false;
}

struct HtmlDocument::Impl {
    std::unique_ptr<xmlDoc, DocDeleter> doc;
    std::vector<xmlNode*> elements; // document order
};

HtmlDocument::HtmlDocument(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}
HtmlDocument::HtmlDocument(HtmlDocument&&) noexcept = default;
HtmlDocument& HtmlDocument::operator=(HtmlDocument&&) noexcept = default;
HtmlDocument::~HtmlDocument() = default;

std::expected<HtmlDocument, std::string> HtmlDocument::ParseDocument(std::string_view html) {
    EnsureLibxmlInitialized();
    if (html.size() > static_cast<std::size_t>(INT_MAX)) {
        return std::unexpected("HTML input too large");
    }

    htmlDocPtr raw = htmlReadMemory(html.data(), static_cast<int>(html.size()), nullptr, "UTF-8",
                                    kParseOptions);
    if (!raw) {
        return std::unexpected("failed to parse HTML");
    }

    auto impl = std::make_unique<Impl>();
    impl->doc.reset(raw);
    CollectElements(xmlDocGetRootElement(raw), impl->elements);
    return HtmlDocument(std::move(impl));
}

std::expected<HtmlDocument, std::string> HtmlDocument::ParseFragment(std::string_view html) {
    // An explicit body keeps top-level text where it is instead of letting
    // the parser wrap it in an implied paragraph.
    std::string wrapped = "<html><body>";
    wrapped.append(html);
    wrapped += "</body></html>";
    return ParseDocument(wrapped);
}

std::vector<HtmlElement> HtmlDocument::FindElements(std::initializer_list<std::string_view> tags) const {
    std::vector<HtmlElement> out;
    for (std::size_t i = 0; i < impl_->elements.size(); ++i) {
        const xmlNode* n = impl_->elements[i];
        const std::string name = NodeName(n);
        bool wanted = false;
        for (auto t : tags) {
            if (name == t) {
                wanted = true;
                break;
            }
        }
        if (!wanted) continue;

        HtmlElement el;
        el.index = i;
        el.tag = name;
        for (xmlAttr* a = n->properties; a; a = a->next) {
            XmlString value(xmlNodeGetContent(reinterpret_cast<xmlNode*>(a)));
            el.attributes.emplace_back(NodeName(reinterpret_cast<const xmlNode*>(a)), value.str());
        }
        out.push_back(std::move(el));
    }
    return out;
}

bool HtmlDocument::ReplaceAttributes(std::size_t index, const HtmlAttributes& attributes) {
    if (index >= impl_->elements.size()) return false;
    xmlNode* n = impl_->elements[index];

    while (n->properties) {
        if (xmlRemoveProp(n->properties) != 0) return false;
    }
    for (const auto& [k, v] : attributes) {
        if (!xmlSetProp(n, reinterpret_cast<const xmlChar*>(k.c_str()),
                        reinterpret_cast<const xmlChar*>(v.c_str()))) {
            return false;
        }
    }
    return true;
}

std::expected<std::string, std::string> HtmlDocument::RenderBody() const {
    xmlNode* body = FindBody(xmlDocGetRootElement(impl_->doc.get()));
    if (!body) {
        return std::unexpected("document has no body");
    }

    OutputBuffer out;
    if (!out.ok()) {
        return std::unexpected("xmlAllocOutputBuffer failed");
    }
    for (xmlNode* cur = body->children; cur; cur = cur->next) {
        htmlNodeDumpFormatOutput(out.get(), impl_->doc.get(), cur, nullptr, 0);
    }
    if (xmlOutputBufferFlush(out.get()) < 0) {
        return std::unexpected("failed to serialize HTML");
    }

    const xmlChar* content = xmlOutputBufferGetContent(out.get());
    const std::size_t size = xmlOutputBufferGetSize(out.get());
    if (!content) return std::string{};
    return std::string(reinterpret_cast<const char*>(content), size);
}

} // namespace pagebridge
