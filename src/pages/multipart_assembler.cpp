#include "pagebridge/pages/multipart_assembler.hpp"

#include "pagebridge/util/logger.hpp"

#include <openssl/rand.h>

#include <array>
#include <cstdint>
#include <string_view>

namespace pagebridge {

namespace {

constexpr std::string_view kCrlf = "\r\n";

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

// Header values are written between quotes on a single line.
bool IsSafeHeaderValue(std::string_view v) {
    return v.find_first_of("\r\n\"") == std::string_view::npos;
}

void AppendPartHeader(std::string& body,
                      const std::string& boundary,
                      std::string_view name,
                      std::string_view filename,
                      std::string_view content_type) {
    body.append("--").append(boundary).append(kCrlf);
    body.append("Content-Disposition: form-data; name=\"").append(name).append("\"; filename=\"");
    body.append(filename).append("\"").append(kCrlf);
    body.append("Content-Type: ").append(content_type).append(kCrlf);
    body.append(kCrlf);
}

} // namespace

std::expected<std::string, std::string> GenerateBoundary() {
    std::array<std::uint8_t, 16> raw{};
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        return std::unexpected("RAND_bytes failed");
    }
    return HexEncode(raw);
}

std::expected<MultipartPayload, std::string> MultipartAssembler::Assemble(
    std::span<const UpdateCommand> commands,
    std::span<const ResourcePart> parts) const {
    auto commands_json = SerializeCommands(commands);
    if (!commands_json) {
        return std::unexpected(commands_json.error());
    }
    LogContentDebug("Commands JSON", *commands_json);

    std::string boundary = boundary_;
    if (boundary.empty()) {
        auto generated = GenerateBoundary();
        if (!generated) {
            return std::unexpected("failed to generate multipart boundary: " + generated.error());
        }
        boundary = std::move(*generated);
    }
    const std::string delimiter = "--" + boundary;

    MultipartPayload out;
    out.content_type = "multipart/form-data; boundary=" + boundary;

    size_t reserve = commands_json->size() + 256;
    for (const auto& p : parts) reserve += p.content.size() + 256;
    out.body.reserve(reserve);

    AppendPartHeader(out.body, boundary, "commands", "commands.json", "application/json");
    out.body.append(*commands_json).append(kCrlf);

    for (const auto& p : parts) {
        if (p.content_id.empty() || !IsSafeHeaderValue(p.content_id) || !IsSafeHeaderValue(p.filename) ||
            !IsSafeHeaderValue(p.content_type)) {
            LogWarn("Skipping resource part %s: unsafe header value", p.content_id.c_str());
            ++out.skipped_parts;
            continue;
        }
        if (p.content.find(delimiter) != std::string::npos) {
            LogWarn("Skipping resource part %s: content contains the multipart boundary",
                    p.content_id.c_str());
            ++out.skipped_parts;
            continue;
        }

        const std::string_view type = p.content_type.empty() ? "application/octet-stream"
                                                             : std::string_view(p.content_type);
        AppendPartHeader(out.body, boundary, p.content_id, p.filename, type);
        out.body.append(p.content).append(kCrlf);
        LogDebug("Added resource part %s (%s, %zu bytes)", p.content_id.c_str(), p.filename.c_str(),
                 p.content.size());
    }

    out.body.append(delimiter).append("--").append(kCrlf);
    return out;
}

} // namespace pagebridge
