#include "pagebridge/transfer/async_operation.hpp"

#include "pagebridge/util/id_utils.hpp"
#include "pagebridge/util/logger.hpp"

#include <cctype>
#include <nlohmann/json.hpp>

namespace pagebridge {

namespace {

constexpr int kServiceUnavailable = 503;

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

const char* OperationStatusName(OperationStatus s) {
    switch (s) {
    case OperationStatus::NotStarted: return "NotStarted";
    case OperationStatus::Running: return "Running";
    case OperationStatus::Completed: return "Completed";
    case OperationStatus::Failed: return "Failed";
    case OperationStatus::Unknown: return "Unknown";
    }
    return "Unknown";
}

OperationStatus ParseOperationStatus(std::string_view s) {
    if (EqualsIgnoreCase(s, "notStarted")) return OperationStatus::NotStarted;
    if (EqualsIgnoreCase(s, "running")) return OperationStatus::Running;
    if (EqualsIgnoreCase(s, "completed")) return OperationStatus::Completed;
    if (EqualsIgnoreCase(s, "failed")) return OperationStatus::Failed;
    return OperationStatus::Unknown;
}

std::expected<AsyncOperation, std::string> ParseOperationPayload(std::string_view body) {
    try {
        const auto j = nlohmann::json::parse(body);
        if (!j.is_object()) {
            return std::unexpected("operation payload must be a JSON object");
        }
        if (!j.contains("status") || !j["status"].is_string()) {
            return std::unexpected("no status field found in operation payload");
        }

        AsyncOperation op;
        op.raw_status = j["status"].get<std::string>();
        op.status = ParseOperationStatus(op.raw_status);
        if (j.contains("id") && j["id"].is_string()) {
            op.operation_id = j["id"].get<std::string>();
        }
        if (j.contains("resourceLocation") && j["resourceLocation"].is_string()) {
            op.resource_location = j["resourceLocation"].get<std::string>();
        }
        return op;
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::string("failed to parse operation payload: ") + e.what());
    }
}

OperationClient::OperationClient(IHttpTransport& http, const GraphEndpoints& endpoints)
    : http_(http), endpoints_(endpoints) {}

Result OperationClient::GetOperation(const std::string& operation_id, AsyncOperation& out) {
    std::string id;
    auto r = SanitizeId(operation_id, "operationID", id);
    if (!r.is_ok()) return r;

    HttpRequest req;
    req.url = endpoints_.Operation(id);

    HttpResponse resp;
    r = http_.Send(req, resp);
    if (!r.is_ok()) return r;

    if (resp.status == kServiceUnavailable) {
        LogWarn("Operation %s status returned 503, treating as still in progress", id.c_str());
        out = AsyncOperation{
            .operation_id = id,
            .status = OperationStatus::Running,
            .raw_status = "Running",
            .resource_location = std::nullopt,
            .note = "Operation is still in progress (503 response received)",
            .transient = true,
        };
        return Result::Ok();
    }
    if (!resp.IsSuccess()) return HttpFailure("GetOnenoteOperation", resp);

    auto op = ParseOperationPayload(resp.body);
    if (!op) return Result::Remote(resp.status, op.error());
    if (op->operation_id.empty()) op->operation_id = id;

    LogDebug("Operation %s status %s", id.c_str(), op->raw_status.c_str());
    out = std::move(*op);
    return Result::Ok();
}

} // namespace pagebridge
