#pragma once

#include "pagebridge/pages/resource_fetcher.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace pagebridge {

// A binary part of the multipart update, referenced from HTML as
// "name:<content_id>".
struct ResourcePart {
    std::string content_id;
    std::string content;
    std::string content_type;
    std::string filename;
};

// Hands out part1, part2, ... for one update call.
class ContentIdSequence {
public:
    std::string Next() { return "part" + std::to_string(next_++); }
    std::size_t Issued() const { return next_ - 1; }
    // Takes back every ID handed out after the first `issued`.
    void Rewind(std::size_t issued) {
        if (issued < Issued()) next_ = issued + 1;
    }

private:
    std::size_t next_ = 1;
};

struct RewriteOutput {
    std::string html;
    std::vector<ResourcePart> parts;
    bool rewritten = false;
};

// Replaces <img src> and <object data> references to service-hosted
// resources with "name:partN" placeholders and downloads the bytes so they
// can be sent alongside the update. Elements whose ID cannot be extracted or
// whose download fails are left untouched.
class HtmlResourceRewriter {
public:
    HtmlResourceRewriter(IResourceFetcher& fetcher, std::string resource_host_prefix);

    // Returns `html` byte-identical when nothing was rewritten.
    RewriteOutput Rewrite(std::string_view html, const std::string& page_id, ContentIdSequence& ids) const;

private:
    IResourceFetcher& fetcher_;
    std::string prefix_;
};

} // namespace pagebridge
