#include "pagebridge/pages/page_client.hpp"

#include "pagebridge/pages/html_document.hpp"
#include "pagebridge/pages/multipart_assembler.hpp"
#include "pagebridge/pages/table_guardrail.hpp"
#include "pagebridge/util/id_utils.hpp"
#include "pagebridge/util/logger.hpp"
#include "pagebridge/util/mime_utils.hpp"

#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

namespace pagebridge {

namespace {

std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string ItemType(const std::string& tag, const std::map<std::string, std::string>& attrs) {
    if (tag == "img") return "image";
    if (tag == "object") {
        auto it = attrs.find("data-attachment");
        return (it != attrs.end() && it->second == "true") ? "attachment" : "object";
    }
    return tag;
}

std::string ItemMimeType(const std::string& tag, const std::map<std::string, std::string>& attrs) {
    auto it = attrs.find("data-src-type");
    if (it != attrs.end() && !it->second.empty()) return it->second;
    if (tag == "object") {
        it = attrs.find("type");
        if (it != attrs.end() && !it->second.empty()) return it->second;
    }
    return {};
}

// Objects declare their type in `type`; images in `data-src-type`.
std::string ContentTypeFromHtml(const PageItemInfo& info) {
    if (info.tag_name == "object") {
        auto it = info.attributes.find("type");
        if (it != info.attributes.end() && !it->second.empty()) return it->second;
    }
    auto it = info.attributes.find("data-src-type");
    if (it != info.attributes.end() && !it->second.empty()) return it->second;
    return {};
}

} // namespace

std::expected<std::vector<PageItemInfo>, std::string> ScanPageItems(std::string_view html) {
    auto doc = HtmlDocument::ParseDocument(html);
    if (!doc) {
        return std::unexpected("failed to parse page items: " + doc.error());
    }

    std::vector<PageItemInfo> items;
    for (const auto& el : doc->FindElements({"img", "object"})) {
        const std::string url = el.Attribute(el.tag == "img" ? "src" : "data");
        if (url.empty()) continue;
        std::string id = ExtractPageItemId(url);
        if (id.empty()) continue;

        PageItemInfo info;
        info.page_item_id = std::move(id);
        info.tag_name = el.tag;
        info.attributes.insert(el.attributes.begin(), el.attributes.end());
        info.type = ItemType(info.tag_name, info.attributes);
        info.mime_type = ItemMimeType(info.tag_name, info.attributes);
        info.original_url = url;
        items.push_back(std::move(info));
    }
    return items;
}

PageClient::PageClient(IHttpTransport& http, GraphEndpoints endpoints)
    : http_(http), endpoints_(std::move(endpoints)) {}

Result PageClient::UpdatePage(const std::string& page_id, std::span<const UpdateCommand> commands) {
    std::string id;
    auto r = SanitizeId(page_id, "pageID", id);
    if (!r.is_ok()) return r;

    if (commands.empty()) {
        LogError("No update commands provided for page %s", id.c_str());
        return Result::Invalid("no update commands provided");
    }
    for (size_t i = 0; i < commands.size(); ++i) {
        if (commands[i].target.empty()) {
            return Result::Invalid("update command " + std::to_string(i) + " has an empty target");
        }
        LogDebug("Update command %zu: target=%s action=%s content_length=%zu", i,
                 commands[i].target.c_str(), ActionName(commands[i].action), commands[i].content.size());
        LogContentDebug("Update command content", commands[i].content);
    }

    r = CheckTableUpdates(commands);
    if (!r.is_ok()) {
        LogError("Table update validation failed for page %s", id.c_str());
        return r;
    }

    IResourceFetcher& fetcher = fetcher_ ? *fetcher_ : static_cast<IResourceFetcher&>(*this);
    const HtmlResourceRewriter rewriter(fetcher, endpoints_.ResourceHostPrefix());
    ContentIdSequence ids;

    std::vector<UpdateCommand> rewritten(commands.begin(), commands.end());
    std::vector<ResourcePart> parts;
    for (auto& c : rewritten) {
        if (c.content.empty()) continue;
        auto out = rewriter.Rewrite(c.content, id, ids);
        if (!out.rewritten) continue;
        c.content = std::move(out.html);
        for (auto& p : out.parts) parts.push_back(std::move(p));
    }
    LogDebug("HTML rewriting completed for page %s: %zu resource parts", id.c_str(), parts.size());

    const MultipartAssembler assembler(boundary_);
    auto payload = assembler.Assemble(rewritten, parts);
    if (!payload) {
        LogError("Failed to build update payload for page %s: %s", id.c_str(), payload.error().c_str());
        return Result::Invalid(payload.error());
    }

    HttpRequest req;
    req.method = "PATCH";
    req.url = endpoints_.PageContent(id);
    req.body = std::move(payload->body);
    req.headers = {{"Content-Type", payload->content_type}};

    HttpResponse resp;
    r = http_.Send(req, resp);
    if (!r.is_ok()) return r;
    if (!resp.IsSuccess()) {
        LogError("UpdatePageContent failed for page %s: HTTP %d", id.c_str(), resp.status);
        return HttpFailure("UpdatePageContent", resp);
    }

    LogInfo("Updated page %s (%zu commands, %zu resource parts)", id.c_str(), rewritten.size(),
            parts.size() - payload->skipped_parts);
    return Result::Ok();
}

Result PageClient::UpdatePageSimple(const std::string& page_id, const std::string& content) {
    const UpdateCommand body_replace{
        .target = "body",
        .action = UpdateAction::Replace,
        .position = std::nullopt,
        .content = content,
    };
    return UpdatePage(page_id, std::span<const UpdateCommand>(&body_replace, 1));
}

Result PageClient::GetPageContent(const std::string& page_id, bool for_update, std::string& out) {
    std::string id;
    auto r = SanitizeId(page_id, "pageID", id);
    if (!r.is_ok()) return r;

    HttpRequest req;
    req.url = endpoints_.PageContent(id, for_update);

    HttpResponse resp;
    r = http_.Send(req, resp);
    if (!r.is_ok()) return r;
    if (!resp.IsSuccess()) return HttpFailure("GetPageContent", resp);

    out = std::move(resp.body);
    LogInfo("Fetched content of page %s (%zu bytes, include_ids=%d)", id.c_str(), out.size(),
            for_update ? 1 : 0);
    return Result::Ok();
}

Result PageClient::CreatePage(const std::string& section_id,
                              const std::string& title,
                              const std::string& html,
                              std::string& new_page_id) {
    std::string sid;
    auto r = SanitizeId(section_id, "sectionID", sid);
    if (!r.is_ok()) return r;

    std::string body = html;
    if (ToLower(html).find("<title>") == std::string::npos) {
        body = "<html><head><title>" + HtmlEscape(title) + "</title></head><body>" + html +
               "</body></html>";
    }
    LogContentDebug("CreatePage content", body);

    HttpRequest req;
    req.method = "POST";
    req.url = endpoints_.SectionPages(sid);
    req.body = std::move(body);
    req.headers = {{"Content-Type", "application/xhtml+xml"}};

    HttpResponse resp;
    r = http_.Send(req, resp);
    if (!r.is_ok()) return r;
    if (!resp.IsSuccess()) return HttpFailure("CreatePage", resp);

    try {
        const auto j = nlohmann::json::parse(resp.body);
        new_page_id = j.value("id", "");
    } catch (const nlohmann::json::exception& e) {
        return Result::Remote(resp.status, std::string("failed to decode CreatePage response: ") + e.what());
    }
    if (new_page_id.empty()) {
        LogWarn("CreatePage succeeded but the response has no page id");
    } else {
        LogInfo("Created page %s in section %s", new_page_id.c_str(), sid.c_str());
    }
    return Result::Ok();
}

Result PageClient::DeletePage(const std::string& page_id) {
    std::string id;
    auto r = SanitizeId(page_id, "pageID", id);
    if (!r.is_ok()) return r;

    HttpRequest req;
    req.method = "DELETE";
    req.url = endpoints_.Page(id);

    HttpResponse resp;
    r = http_.Send(req, resp);
    if (!r.is_ok()) return r;
    if (!resp.IsSuccess()) return HttpFailure("DeletePage", resp);

    LogInfo("Deleted page %s", id.c_str());
    return Result::Ok();
}

Result PageClient::ListPageItems(const std::string& page_id, std::vector<PageItemInfo>& out) {
    std::string html;
    auto r = GetPageContent(page_id, false, html);
    if (!r.is_ok()) return r;

    auto items = ScanPageItems(html);
    if (!items) {
        return Result::Remote(0, items.error());
    }
    out = std::move(*items);
    LogInfo("Found %zu items on page %s", out.size(), page_id.c_str());
    return Result::Ok();
}

Result PageClient::GetPageItem(const std::string& page_id, const std::string& item_id, PageItemData& out) {
    std::string pid;
    auto r = SanitizeId(page_id, "pageID", pid);
    if (!r.is_ok()) return r;
    std::string iid;
    r = SanitizeId(item_id, "pageItemID", iid);
    if (!r.is_ok()) return r;

    std::vector<PageItemInfo> items;
    r = ListPageItems(pid, items);
    if (!r.is_ok()) {
        return Result::Fail(r.kind, r.err, "failed to get page items list: " + r.msg);
    }
    const PageItemInfo* meta = nullptr;
    for (const auto& item : items) {
        if (item.page_item_id == iid) {
            meta = &item;
            break;
        }
    }

    HttpRequest req;
    req.url = endpoints_.ResourceValue(iid);

    HttpResponse resp;
    r = http_.Send(req, resp);
    if (!r.is_ok()) return r;
    if (!resp.IsSuccess()) return HttpFailure("GetPageItem", resp);

    PageItemData data;
    data.size = static_cast<std::int64_t>(resp.body.size());
    data.content = std::move(resp.body);

    if (meta) {
        data.tag_name = meta->tag_name;
        data.attributes = meta->attributes;
        data.original_url = meta->original_url;
        data.content_type = ContentTypeFromHtml(*meta);
    } else {
        LogDebug("No HTML metadata for item %s on page %s", iid.c_str(), pid.c_str());
    }
    if (data.content_type.empty()) data.content_type = resp.Header("Content-Type");
    if (data.content_type.empty()) data.content_type = kDefaultContentType;
    data.filename = FilenameForItem(iid, data.content_type);

    if (image_limits_ && ScaleImageIfNeeded(data.content, data.content_type, *image_limits_)) {
        LogDebug("Item %s scaled from %lld to %zu bytes", iid.c_str(), static_cast<long long>(data.size),
                 data.content.size());
        data.size = static_cast<std::int64_t>(data.content.size());
    }

    LogInfo("Downloaded item %s (%s, %s, %lld bytes)", iid.c_str(), data.filename.c_str(),
            data.content_type.c_str(), static_cast<long long>(data.size));
    out = std::move(data);
    return Result::Ok();
}

Result PageClient::FetchResource(const std::string& page_id,
                                 const std::string& resource_id,
                                 PageItemData& out) {
    return GetPageItem(page_id, resource_id, out);
}

} // namespace pagebridge
