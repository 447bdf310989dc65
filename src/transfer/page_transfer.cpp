#include "pagebridge/transfer/page_transfer.hpp"

#include "pagebridge/util/id_utils.hpp"
#include "pagebridge/util/logger.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace pagebridge {

namespace {

constexpr int kAccepted = 202;

void LogTransition(const std::string& op_id, TransferState from, TransferState to, int attempt) {
    if (from == to) return;
    LogDebug("Copy operation %s: %s -> %s (attempt %d)", op_id.c_str(), TransferStateName(from),
             TransferStateName(to), attempt);
}

} // namespace

const char* TransferStateName(TransferState s) {
    switch (s) {
    case TransferState::Submitted: return "Submitted";
    case TransferState::Running: return "Running";
    case TransferState::Completed: return "Completed";
    case TransferState::Failed: return "Failed";
    case TransferState::TimedOut: return "TimedOut";
    }
    return "Unknown";
}

PageTransfer::PageTransfer(IHttpTransport& http, PageClient& pages, IClock& clock, PollPolicy policy)
    : http_(http), pages_(pages), clock_(clock), policy_(policy) {}

std::chrono::seconds PageTransfer::BackoffDelay(int attempt, std::mt19937& rng) const {
    const int lo = std::max(0, policy_.min_delay_seconds);
    const int hi = std::max(lo, policy_.jitter_base_seconds + attempt);
    std::uniform_int_distribution<int> dist(lo, hi);
    return std::chrono::seconds(dist(rng));
}

Result PageTransfer::Submit(const std::string& page_id, const std::string& section_id, AsyncOperation& op) {
    HttpRequest req;
    req.method = "POST";
    req.url = pages_.Endpoints().CopyToSection(page_id);
    req.body = nlohmann::json{{"id", section_id}}.dump();
    req.headers = {{"Content-Type", "application/json"}};

    HttpResponse resp;
    auto r = http_.Send(req, resp);
    if (!r.is_ok()) return r;

    // The service never completes a copy synchronously.
    if (resp.status != kAccepted) {
        LogError("Copy of page %s failed: expected HTTP 202, got %d", page_id.c_str(), resp.status);
        return Result::Remote(resp.status, "copy operation failed: expected status 202, got " +
                                               std::to_string(resp.status) + " - " + resp.body);
    }

    auto parsed = ParseOperationPayload(resp.body);
    if (!parsed) {
        return Result::Remote(resp.status, "failed to parse copy response: " + parsed.error());
    }
    if (parsed->operation_id.empty()) {
        return Result::Remote(resp.status, "no id field found in copy response");
    }
    op = std::move(*parsed);
    return Result::Ok();
}

Result PageTransfer::ResolveCompleted(const AsyncOperation& op, std::string& new_page_id) const {
    if (!op.resource_location) {
        return Result::Remote(0, "resourceLocation field not found in completed operation " + op.operation_id);
    }
    const std::string extracted = ExtractPageIdFromLocation(*op.resource_location);
    if (extracted.empty()) {
        return Result::Remote(0, "could not extract page ID from URL: " + *op.resource_location);
    }
    auto r = SanitizeId(extracted, "extracted page ID", new_page_id);
    if (!r.is_ok()) {
        return Result::Remote(0, "extracted page ID failed validation: " + r.msg);
    }
    return Result::Ok();
}

Result PageTransfer::Copy(const std::string& page_id, const std::string& target_section_id, CopyResult& out) {
    std::string pid;
    auto r = SanitizeId(page_id, "pageID", pid);
    if (!r.is_ok()) return r;
    std::string sid;
    r = SanitizeId(target_section_id, "targetSectionID", sid);
    if (!r.is_ok()) return r;

    LogInfo("Copying page %s to section %s", pid.c_str(), sid.c_str());

    AsyncOperation op;
    r = Submit(pid, sid, op);
    if (!r.is_ok()) return r;

    const std::string op_id = op.operation_id;
    LogDebug("Copy operation %s submitted (initial status %s)", op_id.c_str(), op.raw_status.c_str());

    std::mt19937 rng(seed_ ? *seed_ : std::random_device{}());
    OperationClient operations(http_, pages_.Endpoints());
    TransferState state = TransferState::Submitted;

    for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        r = operations.GetOperation(op_id, op);
        if (!r.is_ok()) {
            LogError("Failed to get status of copy operation %s on attempt %d: %s", op_id.c_str(), attempt,
                     r.msg.c_str());
            return Result::Fail(r.kind, r.err, "failed to get operation status: " + r.msg);
        }

        switch (op.status) {
        case OperationStatus::Completed: {
            LogTransition(op_id, state, TransferState::Completed, attempt);
            std::string new_id;
            r = ResolveCompleted(op, new_id);
            if (!r.is_ok()) {
                LogError("Copy operation %s completed without a usable page id: %s", op_id.c_str(),
                         r.msg.c_str());
                return Result::Fail(r.kind, r.err,
                                    "failed to extract page ID from operation result: " + r.msg);
            }
            out = CopyResult{.new_page_id = std::move(new_id), .operation_id = op_id, .status_polls = attempt};
            LogInfo("Copied page %s to %s (operation %s, %d polls)", pid.c_str(), out.new_page_id.c_str(),
                    op_id.c_str(), attempt);
            return Result::Ok();
        }
        case OperationStatus::Failed:
            LogTransition(op_id, state, TransferState::Failed, attempt);
            LogError("Copy operation %s failed", op_id.c_str());
            return Result::Remote(0, "copy operation " + op_id + " failed");
        default:
            LogTransition(op_id, state, TransferState::Running, attempt);
            state = TransferState::Running;
            if (op.transient) {
                LogInfo("Copy operation %s still in progress: %s", op_id.c_str(), op.note.c_str());
            }
            break;
        }

        if (attempt < policy_.max_attempts) {
            const auto delay = BackoffDelay(attempt, rng);
            LogDebug("Waiting %llds before polling operation %s again (status %s)",
                     static_cast<long long>(delay.count()), op_id.c_str(), op.raw_status.c_str());
            clock_.SleepFor(delay);
        }
    }

    LogTransition(op_id, state, TransferState::TimedOut, policy_.max_attempts);
    LogError("Copy operation %s timed out after %d attempts", op_id.c_str(), policy_.max_attempts);
    return Result::Fail(ErrorKind::Timeout, 0,
                        "copy operation did not complete within " + std::to_string(policy_.max_attempts) +
                            " attempts");
}

Result PageTransfer::Move(const std::string& page_id, const std::string& target_section_id, MoveResult& out) {
    CopyResult copied;
    auto r = Copy(page_id, target_section_id, copied);
    if (!r.is_ok()) {
        return Result::Fail(r.kind, r.err, "failed to copy page for move operation: " + r.msg);
    }

    MoveResult result{
        .new_page_id = copied.new_page_id,
        .operation_id = copied.operation_id,
        .source_deleted = false,
        .warning = {},
    };

    r = pages_.DeletePage(page_id);
    if (r.is_ok()) {
        result.source_deleted = true;
    } else {
        result.warning = "page copied to " + copied.new_page_id +
                         " but the original could not be deleted: " + r.msg;
        LogWarn("%s", result.warning.c_str());
    }

    LogInfo("Moved page %s to %s%s", page_id.c_str(), result.new_page_id.c_str(),
            result.source_deleted ? "" : " (source kept)");
    out = std::move(result);
    return Result::Ok();
}

} // namespace pagebridge
