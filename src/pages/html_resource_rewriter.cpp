#include "pagebridge/pages/html_resource_rewriter.hpp"

#include "pagebridge/pages/html_document.hpp"
#include "pagebridge/util/id_utils.hpp"
#include "pagebridge/util/logger.hpp"

namespace pagebridge {

namespace {

struct EmbeddedReference {
    std::size_t element = 0;
    std::string url_attribute;
    std::string url;
    std::string resource_id;
};

struct ElementRewrite {
    std::size_t element = 0;
    HtmlAttributes attributes;
};

const char* UrlAttributeFor(const std::string& tag) {
    return tag == "img" ? "src" : "data";
}

std::vector<EmbeddedReference> ScanReferences(const HtmlDocument& doc, const std::string& prefix) {
    std::vector<EmbeddedReference> refs;
    for (const auto& el : doc.FindElements({"img", "object"})) {
        const char* attr = UrlAttributeFor(el.tag);
        std::string url = el.Attribute(attr);
        if (!url.starts_with(prefix)) continue;

        std::string id = ExtractPageItemId(url);
        if (id.empty()) {
            LogDebug("No resource ID in <%s %s=\"%s\">, leaving as is", el.tag.c_str(), attr, url.c_str());
            continue;
        }
        refs.push_back({
            .element = el.index,
            .url_attribute = attr,
            .url = std::move(url),
            .resource_id = std::move(id),
        });
    }
    return refs;
}

} // namespace

HtmlResourceRewriter::HtmlResourceRewriter(IResourceFetcher& fetcher, std::string resource_host_prefix)
    : fetcher_(fetcher), prefix_(std::move(resource_host_prefix)) {}

RewriteOutput HtmlResourceRewriter::Rewrite(std::string_view html,
                                            const std::string& page_id,
                                            ContentIdSequence& ids) const {
    RewriteOutput out;
    out.html.assign(html);

    auto doc = HtmlDocument::ParseFragment(html);
    if (!doc) {
        LogDebug("HTML parse failed, sending content unchanged: %s", doc.error().c_str());
        return out;
    }

    const auto refs = ScanReferences(*doc, prefix_);
    if (refs.empty()) return out;

    const std::size_t issued_before = ids.Issued();
    std::vector<ElementRewrite> plan;
    std::vector<ResourcePart> parts;
    for (const auto& ref : refs) {
        PageItemData item;
        auto r = fetcher_.FetchResource(page_id, ref.resource_id, item);
        if (!r.is_ok()) {
            LogWarn("Failed to download resource %s, leaving reference as is: %s",
                    ref.resource_id.c_str(), r.msg.c_str());
            continue;
        }

        std::string content_id = ids.Next();
        LogDebug("Resource %s -> %s (%s, %zu bytes)", ref.resource_id.c_str(), content_id.c_str(),
                 item.content_type.c_str(), item.content.size());
        plan.push_back({
            .element = ref.element,
            .attributes = {{ref.url_attribute, "name:" + content_id}},
        });
        parts.push_back({
            .content_id = std::move(content_id),
            .content = std::move(item.content),
            .content_type = std::move(item.content_type),
            .filename = std::move(item.filename),
        });
    }
    if (plan.empty()) return out;

    for (const auto& step : plan) {
        if (!doc->ReplaceAttributes(step.element, step.attributes)) {
            LogWarn("Failed to rewrite element attributes, sending content unchanged");
            ids.Rewind(issued_before);
            return out;
        }
    }

    auto rendered = doc->RenderBody();
    if (!rendered) {
        LogWarn("Failed to render rewritten HTML, sending content unchanged: %s", rendered.error().c_str());
        ids.Rewind(issued_before);
        return out;
    }

    out.html = std::move(*rendered);
    out.parts = std::move(parts);
    out.rewritten = true;
    return out;
}

} // namespace pagebridge
