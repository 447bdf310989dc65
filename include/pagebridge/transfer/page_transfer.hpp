#pragma once

#include "pagebridge/net/http.hpp"
#include "pagebridge/pages/page_client.hpp"
#include "pagebridge/transfer/async_operation.hpp"
#include "pagebridge/util/clock.hpp"
#include "pagebridge/util/result.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <random>
#include <string>

namespace pagebridge {

// Status polls for one copy. A 503 counts as an attempt like any Running
// answer. Before attempt N+1 the caller sleeps a uniform random
// min_delay_seconds..(jitter_base_seconds + N) seconds.
struct PollPolicy {
    int max_attempts = 30;
    int min_delay_seconds = 1;
    int jitter_base_seconds = 2;
};

enum class TransferState {
    Submitted,
    Running,
    Completed,
    Failed,
    TimedOut,
};

const char* TransferStateName(TransferState s);

struct CopyResult {
    std::string new_page_id;
    std::string operation_id;
    int status_polls = 0;
};

// A move whose source delete failed is still a success; `source_deleted`
// tells the caller the original page is still there.
struct MoveResult {
    std::string new_page_id;
    std::string operation_id;
    bool source_deleted = false;
    std::string warning;
};

class PageTransfer {
public:
    PageTransfer(IHttpTransport& http, PageClient& pages, IClock& clock, PollPolicy policy = {});

    // Makes the backoff delays reproducible.
    void SetSeed(std::uint32_t seed) { seed_ = seed; }

    const PollPolicy& Policy() const { return policy_; }

    // Submits copyToSection and polls the operation until it finishes.
    Result Copy(const std::string& page_id, const std::string& target_section_id, CopyResult& out);

    // Copy, then delete the source. No rollback when the delete fails.
    Result Move(const std::string& page_id, const std::string& target_section_id, MoveResult& out);

    // Delay before the poll that follows `attempt` (1-based).
    std::chrono::seconds BackoffDelay(int attempt, std::mt19937& rng) const;

private:
    Result Submit(const std::string& page_id, const std::string& section_id, AsyncOperation& op);
    Result ResolveCompleted(const AsyncOperation& op, std::string& new_page_id) const;

    IHttpTransport& http_;
    PageClient& pages_;
    IClock& clock_;
    PollPolicy policy_;
    std::optional<std::uint32_t> seed_;
};

} // namespace pagebridge
