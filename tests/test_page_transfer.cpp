#include "pagebridge/transfer/page_transfer.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace pagebridge;

namespace {

constexpr const char* kBase = "https://graph.microsoft.com";
constexpr const char* kOpsPath = "/v1.0/me/onenote/operations/";

struct Fixture {
    testutil::ScriptedTransport http;
    testutil::FakeClock clock;
    PageClient pages{http, GraphEndpoints(kBase)};
    PageTransfer transfer{http, pages, clock};

    Fixture() { transfer.SetSeed(42); }

    void Submitted() { http.Push(testutil::Response(202, R"({"status":"notStarted","id":"op-1"})")); }
    void Status(const std::string& status) {
        http.Push(testutil::Response(200, nlohmann::json{{"id", "op-1"}, {"status", status}}.dump()));
    }
    void Completed(const std::string& location) {
        http.Push(testutil::Response(
            200, nlohmann::json{{"id", "op-1"}, {"status", "Completed"}, {"resourceLocation", location}}.dump()));
    }
};

const std::string kLocation =
    "https://graph.microsoft.com/beta/users/me/onenote/pages/0-NEW!77?select=id";

} // namespace

TEST(PageTransferTest, ServiceUnavailableCountsAsRunning) {
    Fixture f;
    f.Submitted();
    f.http.Push(testutil::Response(503, "busy"));
    f.Status("Running");
    f.Completed(kLocation);

    CopyResult out;
    const auto r = f.transfer.Copy("0-SRC!1", "0-SEC!2", out);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(out.new_page_id, "0-NEW!77");
    EXPECT_EQ(out.operation_id, "op-1");
    EXPECT_EQ(out.status_polls, 3);
    EXPECT_EQ(f.http.CountContaining(kOpsPath), 3u);
    EXPECT_EQ(f.clock.Sleeps().size(), 2u);

    const auto submit = f.http.Requests().at(0);
    EXPECT_EQ(submit.method, "POST");
    EXPECT_EQ(submit.url, "https://graph.microsoft.com/beta/me/onenote/pages/0-SRC!1/copyToSection");
    EXPECT_EQ(nlohmann::json::parse(submit.body), nlohmann::json({{"id", "0-SEC!2"}}));
    EXPECT_EQ(f.http.Requests().at(1).url, "https://graph.microsoft.com/v1.0/me/onenote/operations/op-1");
}

TEST(PageTransferTest, FailedStatusStopsImmediately) {
    Fixture f;
    f.Submitted();
    f.Status("Failed");
    f.Status("Completed");

    CopyResult out;
    const auto r = f.transfer.Copy("0-SRC!1", "0-SEC!2", out);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Remote);
    EXPECT_EQ(f.http.CountContaining(kOpsPath), 1u);
    EXPECT_TRUE(f.clock.Sleeps().empty());
    EXPECT_EQ(f.http.Pending(), 1u);
}

TEST(PageTransferTest, TimesOutAfterThirtyRunningPolls) {
    Fixture f;
    f.Submitted();
    for (int i = 0; i < 30; ++i) f.Status("Running");
    f.Completed(kLocation);

    CopyResult out;
    const auto r = f.transfer.Copy("0-SRC!1", "0-SEC!2", out);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Timeout);
    EXPECT_NE(r.msg.find("30 attempts"), std::string::npos);
    EXPECT_EQ(f.http.CountContaining(kOpsPath), 30u);
    // No sleep after the last attempt.
    ASSERT_EQ(f.clock.Sleeps().size(), 29u);
    for (size_t i = 0; i < f.clock.Sleeps().size(); ++i) {
        const auto attempt = static_cast<long long>(i + 1);
        EXPECT_GE(f.clock.Sleeps()[i].count(), 1);
        EXPECT_LE(f.clock.Sleeps()[i].count(), 2 + attempt);
    }
}

TEST(PageTransferTest, NotStartedAndUnknownStatusesKeepPolling) {
    Fixture f;
    f.Submitted();
    f.Status("NotStarted");
    f.Status("Queued");
    f.Completed(kLocation);

    CopyResult out;
    ASSERT_TRUE(f.transfer.Copy("0-SRC!1", "0-SEC!2", out).is_ok());
    EXPECT_EQ(out.status_polls, 3);
}

TEST(PageTransferTest, SubmitMustBeAccepted) {
    const int statuses[] = {200, 201, 400, 503};
    for (int status : statuses) {
        Fixture f;
        f.http.Push(testutil::Response(status, R"({"status":"Completed","id":"op-1"})"));

        CopyResult out;
        const auto r = f.transfer.Copy("0-SRC!1", "0-SEC!2", out);
        ASSERT_FALSE(r.is_ok()) << status;
        EXPECT_EQ(r.kind, ErrorKind::Remote);
        EXPECT_EQ(r.err, status);
        EXPECT_EQ(f.http.CallCount(), 1u);
    }
}

TEST(PageTransferTest, MalformedSubmitResponses) {
    const char* bodies[] = {
        R"({"id":"op-1"})",
        R"({"status":"notStarted"})",
        "not json",
    };
    for (const char* body : bodies) {
        Fixture f;
        f.http.Push(testutil::Response(202, body));
        CopyResult out;
        const auto r = f.transfer.Copy("0-SRC!1", "0-SEC!2", out);
        ASSERT_FALSE(r.is_ok()) << body;
        EXPECT_EQ(r.kind, ErrorKind::Remote);
        EXPECT_EQ(f.http.CallCount(), 1u);
    }
}

TEST(PageTransferTest, CompletedWithoutUsableLocationFails) {
    {
        Fixture f;
        f.Submitted();
        f.Status("Completed");
        CopyResult out;
        const auto r = f.transfer.Copy("0-SRC!1", "0-SEC!2", out);
        ASSERT_FALSE(r.is_ok());
        EXPECT_NE(r.msg.find("resourceLocation"), std::string::npos);
    }
    {
        Fixture f;
        f.Submitted();
        f.Completed("https://graph.microsoft.com/v1.0/me/onenote/sections/0-S!1");
        CopyResult out;
        const auto r = f.transfer.Copy("0-SRC!1", "0-SEC!2", out);
        ASSERT_FALSE(r.is_ok());
        EXPECT_NE(r.msg.find("could not extract page ID"), std::string::npos);
    }
    {
        Fixture f;
        f.Submitted();
        f.Completed("https://graph.microsoft.com/v1.0/me/onenote/pages/" + std::string(120, 'a'));
        CopyResult out;
        const auto r = f.transfer.Copy("0-SRC!1", "0-SEC!2", out);
        ASSERT_FALSE(r.is_ok());
        EXPECT_NE(r.msg.find("too long"), std::string::npos);
    }
}

TEST(PageTransferTest, InvalidIdsFailWithoutNetwork) {
    Fixture f;
    CopyResult out;
    EXPECT_EQ(f.transfer.Copy("bad/id", "0-SEC!2", out).kind, ErrorKind::Validation);
    EXPECT_EQ(f.transfer.Copy("0-SRC!1", "", out).kind, ErrorKind::Validation);
    EXPECT_EQ(f.http.CallCount(), 0u);
}

TEST(PageTransferTest, StatusErrorOtherThan503IsFatal) {
    Fixture f;
    f.Submitted();
    f.http.Push(testutil::Response(500, "boom"));

    CopyResult out;
    const auto r = f.transfer.Copy("0-SRC!1", "0-SEC!2", out);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, 500);
    EXPECT_NE(r.msg.find("failed to get operation status"), std::string::npos);
}

TEST(PageTransferTest, MoveDeletesSource) {
    Fixture f;
    f.Submitted();
    f.Completed(kLocation);
    f.http.Push(testutil::Response(204));

    MoveResult out;
    ASSERT_TRUE(f.transfer.Move("0-SRC!1", "0-SEC!2", out).is_ok());
    EXPECT_EQ(out.new_page_id, "0-NEW!77");
    EXPECT_TRUE(out.source_deleted);
    EXPECT_TRUE(out.warning.empty());

    const auto del = f.http.Requests().back();
    EXPECT_EQ(del.method, "DELETE");
    EXPECT_EQ(del.url, "https://graph.microsoft.com/v1.0/me/onenote/pages/0-SRC!1");
}

TEST(PageTransferTest, MoveWithFailedDeleteStillSucceeds) {
    Fixture f;
    f.Submitted();
    f.Completed(kLocation);
    f.http.Push(testutil::Response(403, "forbidden"));

    MoveResult out;
    const auto r = f.transfer.Move("0-SRC!1", "0-SEC!2", out);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(out.new_page_id, "0-NEW!77");
    EXPECT_FALSE(out.source_deleted);
    EXPECT_NE(out.warning.find("0-NEW!77"), std::string::npos);
    EXPECT_NE(out.warning.find("HTTP 403"), std::string::npos);
}

TEST(PageTransferTest, MoveDoesNotDeleteWhenCopyFails) {
    Fixture f;
    f.Submitted();
    f.Status("Failed");

    MoveResult out;
    ASSERT_FALSE(f.transfer.Move("0-SRC!1", "0-SEC!2", out).is_ok());
    EXPECT_EQ(f.http.CallCount(), 2u);
}

TEST(PageTransferTest, CustomPolicy) {
    testutil::ScriptedTransport http;
    testutil::FakeClock clock;
    PageClient pages(http, GraphEndpoints(kBase));
    PageTransfer transfer(http, pages, clock, PollPolicy{.max_attempts = 3, .min_delay_seconds = 0, .jitter_base_seconds = 0});

    http.Push(testutil::Response(202, R"({"status":"notStarted","id":"op-1"})"));
    for (int i = 0; i < 3; ++i) http.Push(testutil::Response(503));

    CopyResult out;
    const auto r = transfer.Copy("0-SRC!1", "0-SEC!2", out);
    EXPECT_EQ(r.kind, ErrorKind::Timeout);
    EXPECT_EQ(http.CountContaining(kOpsPath), 3u);
    ASSERT_EQ(clock.Sleeps().size(), 2u);
    EXPECT_LE(clock.Sleeps()[0].count(), 1);
    EXPECT_LE(clock.Sleeps()[1].count(), 2);
}

TEST(PageTransferTest, BackoffStaysWithinJitterWindow) {
    Fixture f;
    std::mt19937 rng(7);
    bool saw_low = false;
    bool saw_high = false;
    for (int i = 0; i < 500; ++i) {
        const auto d = f.transfer.BackoffDelay(4, rng).count();
        EXPECT_GE(d, 1);
        EXPECT_LE(d, 6);
        saw_low |= (d == 1);
        saw_high |= (d == 6);
    }
    EXPECT_TRUE(saw_low);
    EXPECT_TRUE(saw_high);
}
