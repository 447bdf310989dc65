#pragma once

#include "pagebridge/pages/html_resource_rewriter.hpp"
#include "pagebridge/pages/update_command.hpp"

#include <cstddef>
#include <expected>
#include <span>
#include <string>

namespace pagebridge {

struct MultipartPayload {
    std::string body;
    std::string content_type; // "multipart/form-data; boundary=..."
    std::size_t skipped_parts = 0;
};

// 32 hex characters from the OpenSSL CSPRNG.
std::expected<std::string, std::string> GenerateBoundary();

// Builds the multipart/form-data body for a page PATCH. The "commands" part
// always comes first; resource parts that cannot be framed safely are skipped.
class MultipartAssembler {
public:
    MultipartAssembler() = default;
    // Fixed boundary, mainly for tests.
    explicit MultipartAssembler(std::string boundary) : boundary_(std::move(boundary)) {}

    std::expected<MultipartPayload, std::string> Assemble(std::span<const UpdateCommand> commands,
                                                          std::span<const ResourcePart> parts) const;

private:
    std::string boundary_;
};

} // namespace pagebridge
