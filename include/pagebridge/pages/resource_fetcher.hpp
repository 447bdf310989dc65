#pragma once

#include "pagebridge/util/result.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace pagebridge {

// A downloaded embedded resource plus the HTML metadata needed to reference it.
struct PageItemData {
    std::string content_type;
    std::string filename;
    std::int64_t size = 0;
    std::string content;
    std::string tag_name; // "img" or "object"
    std::map<std::string, std::string> attributes;
    std::string original_url;
};

class IResourceFetcher {
public:
    virtual ~IResourceFetcher() = default;
    virtual Result FetchResource(const std::string& page_id,
                                 const std::string& resource_id,
                                 PageItemData& out) = 0;
};

} // namespace pagebridge
