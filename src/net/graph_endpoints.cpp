#include "pagebridge/net/graph_endpoints.hpp"

namespace pagebridge {

namespace {

constexpr std::string_view kStable = "/v1.0/me/onenote";
// copyToSection is only exposed on the beta surface.
constexpr std::string_view kBeta = "/beta/me/onenote";

} // namespace

GraphEndpoints::GraphEndpoints(std::string base_url) : base_(std::move(base_url)) {
    while (!base_.empty() && base_.back() == '/') base_.pop_back();
}

std::string GraphEndpoints::PageContent(std::string_view page_id, bool include_ids) const {
    std::string url = base_;
    url.append(kStable).append("/pages/").append(page_id).append("/content");
    if (include_ids) url += "?includeIDs=true";
    return url;
}

std::string GraphEndpoints::Page(std::string_view page_id) const {
    std::string url = base_;
    url.append(kStable).append("/pages/").append(page_id);
    return url;
}

std::string GraphEndpoints::SectionPages(std::string_view section_id) const {
    std::string url = base_;
    url.append(kStable).append("/sections/").append(section_id).append("/pages");
    return url;
}

std::string GraphEndpoints::CopyToSection(std::string_view page_id) const {
    std::string url = base_;
    url.append(kBeta).append("/pages/").append(page_id).append("/copyToSection");
    return url;
}

std::string GraphEndpoints::Operation(std::string_view operation_id) const {
    std::string url = base_;
    url.append(kStable).append("/operations/").append(operation_id);
    return url;
}

std::string GraphEndpoints::ResourceValue(std::string_view resource_id) const {
    std::string url = base_;
    url.append(kStable).append("/resources/").append(resource_id).append("/$value");
    return url;
}

} // namespace pagebridge
