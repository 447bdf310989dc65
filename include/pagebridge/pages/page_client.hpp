#pragma once

#include "pagebridge/net/graph_endpoints.hpp"
#include "pagebridge/net/http.hpp"
#include "pagebridge/pages/html_resource_rewriter.hpp"
#include "pagebridge/pages/image_scaler.hpp"
#include "pagebridge/pages/resource_fetcher.hpp"
#include "pagebridge/pages/update_command.hpp"
#include "pagebridge/util/result.hpp"

#include <expected>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pagebridge {

// An embedded item found in page HTML.
struct PageItemInfo {
    std::string page_item_id;
    std::string tag_name;  // "img" or "object"
    std::string type;      // "image", "attachment" or "object"
    std::string mime_type; // data-src-type, or type for objects; may be empty
    std::map<std::string, std::string> attributes;
    std::string original_url;
};

// Finds <img>/<object> elements whose URL carries a resource ID.
std::expected<std::vector<PageItemInfo>, std::string> ScanPageItems(std::string_view html);

class PageClient final : public IResourceFetcher {
public:
    PageClient(IHttpTransport& http, GraphEndpoints endpoints);

    // Resource downloads during UpdatePage go through `fetcher` instead of
    // GetPageItem. Null restores the default.
    void SetResourceFetcher(IResourceFetcher* fetcher) { fetcher_ = fetcher; }
    // Fixed multipart boundary; empty means a random one per request.
    void SetMultipartBoundary(std::string boundary) { boundary_ = std::move(boundary); }
    // Downloaded PNG items larger than `limits` are shrunk before they are
    // returned or re-sent. Off by default.
    void SetImageLimits(std::optional<ImageLimits> limits) { image_limits_ = limits; }

    // Validates, rewrites embedded resources, and sends one multipart PATCH.
    Result UpdatePage(const std::string& page_id, std::span<const UpdateCommand> commands);
    // Replaces the whole body.
    Result UpdatePageSimple(const std::string& page_id, const std::string& content);

    // `for_update` asks the service for generated element IDs usable as targets.
    Result GetPageContent(const std::string& page_id, bool for_update, std::string& out);
    Result CreatePage(const std::string& section_id,
                      const std::string& title,
                      const std::string& html,
                      std::string& new_page_id);
    Result DeletePage(const std::string& page_id);

    Result ListPageItems(const std::string& page_id, std::vector<PageItemInfo>& out);
    Result GetPageItem(const std::string& page_id, const std::string& item_id, PageItemData& out);

    Result FetchResource(const std::string& page_id,
                         const std::string& resource_id,
                         PageItemData& out) override;

    const GraphEndpoints& Endpoints() const { return endpoints_; }

private:
    IHttpTransport& http_;
    GraphEndpoints endpoints_;
    IResourceFetcher* fetcher_ = nullptr;
    std::string boundary_;
    std::optional<ImageLimits> image_limits_;
};

} // namespace pagebridge
