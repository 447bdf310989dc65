#pragma once

#include <string>
#include <string_view>

namespace pagebridge {

// Builds OneNote URLs against a Graph base such as "https://graph.microsoft.com".
// IDs passed in must already be sanitized.
class GraphEndpoints {
  public:
    explicit GraphEndpoints(std::string base_url);

    const std::string& BaseUrl() const { return base_; }

    // Embedded resources are only rewritten when their URL starts with this.
    std::string ResourceHostPrefix() const { return base_ + "/"; }

    std::string PageContent(std::string_view page_id, bool include_ids = false) const;
    std::string Page(std::string_view page_id) const;
    std::string SectionPages(std::string_view section_id) const;
    std::string CopyToSection(std::string_view page_id) const;
    std::string Operation(std::string_view operation_id) const;
    std::string ResourceValue(std::string_view resource_id) const;

  private:
    std::string base_;
};

} // namespace pagebridge
