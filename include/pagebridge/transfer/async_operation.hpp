#pragma once

#include "pagebridge/net/graph_endpoints.hpp"
#include "pagebridge/net/http.hpp"
#include "pagebridge/util/result.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace pagebridge {

enum class OperationStatus {
    NotStarted,
    Running,
    Completed,
    Failed,
    Unknown,
};

const char* OperationStatusName(OperationStatus s);
// Case-insensitive: the service answers "notStarted" on submit and
// "Running"/"Completed" while polling.
OperationStatus ParseOperationStatus(std::string_view s);

struct AsyncOperation {
    std::string operation_id;
    OperationStatus status = OperationStatus::Unknown;
    std::string raw_status;
    std::optional<std::string> resource_location;
    std::string note;
    // Synthesized from a 503 rather than reported by the service.
    bool transient = false;
};

// Requires a string "status"; "id" and "resourceLocation" are optional here.
std::expected<AsyncOperation, std::string> ParseOperationPayload(std::string_view body);

class OperationClient {
public:
    OperationClient(IHttpTransport& http, const GraphEndpoints& endpoints);

    // 503 is reported as a transient Running operation, not an error.
    Result GetOperation(const std::string& operation_id, AsyncOperation& out);

private:
    IHttpTransport& http_;
    const GraphEndpoints& endpoints_;
};

} // namespace pagebridge
