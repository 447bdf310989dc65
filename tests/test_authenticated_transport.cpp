#include "pagebridge/net/authenticated_transport.hpp"
#include "testing.hpp"

#include <atomic>
#include <gtest/gtest.h>
#include <thread>

using namespace pagebridge;

namespace {

constexpr std::int64_t kNow = 1'700'000'000;

class CountingRefresher final : public ITokenRefresher {
  public:
    explicit CountingRefresher(bool succeed = true) : succeed_(succeed) {}

    Result Refresh(const std::string& refresh_token, TokenSet& out) override {
        const int n = ++calls_;
        if (!succeed_) return Result::Fail(ErrorKind::Auth, 400, "invalid_grant");
        // Give concurrent callers a chance to queue up on the lock.
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        out.access_token = "fresh-" + std::to_string(n);
        out.refresh_token = refresh_token + "-rotated";
        out.expiry = kNow + 3600;
        return Result::Ok();
    }

    int Calls() const { return calls_.load(); }

  private:
    bool succeed_;
    std::atomic<int> calls_{0};
};

TokenSet ValidTokens() {
    return TokenSet{.access_token = "access-1", .refresh_token = "refresh-1", .expiry = kNow + 3600};
}

HttpRequest Get(const std::string& url) {
    HttpRequest req;
    req.url = url;
    return req;
}

} // namespace

TEST(AuthenticatedTransportTest, AddsBearerToken) {
    testutil::ScriptedTransport inner;
    inner.Push(testutil::Response(200, "ok"));
    testutil::FakeClock clock(kNow);
    CountingRefresher refresher;
    AuthenticatedTransport http(inner, &refresher, ValidTokens(), "", clock);

    HttpResponse resp;
    ASSERT_TRUE(http.Send(Get("https://graph/x"), resp).is_ok());
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(FindHeader(inner.Requests().at(0).headers, "Authorization"), "Bearer access-1");
    EXPECT_EQ(refresher.Calls(), 0);
}

TEST(AuthenticatedTransportTest, RefreshesAndRetriesOnceOnAuthFailure) {
    for (int status : {401, 403}) {
        testutil::ScriptedTransport inner;
        inner.Push(testutil::Response(status, "expired"));
        inner.Push(testutil::Response(200, "ok"));
        testutil::FakeClock clock(kNow);
        CountingRefresher refresher;
        AuthenticatedTransport http(inner, &refresher, ValidTokens(), "", clock);

        HttpResponse resp;
        ASSERT_TRUE(http.Send(Get("https://graph/x"), resp).is_ok());
        EXPECT_EQ(resp.status, 200);
        EXPECT_EQ(resp.body, "ok");
        EXPECT_EQ(refresher.Calls(), 1);
        ASSERT_EQ(inner.CallCount(), 2u);
        EXPECT_EQ(FindHeader(inner.Requests().at(1).headers, "Authorization"), "Bearer fresh-1");
        EXPECT_EQ(http.Tokens().refresh_token, "refresh-1-rotated");
    }
}

TEST(AuthenticatedTransportTest, SecondAuthFailureIsReported) {
    testutil::ScriptedTransport inner;
    inner.Push(testutil::Response(401, "no"));
    inner.Push(testutil::Response(401, "still no"));
    inner.Push(testutil::Response(200, "never"));
    testutil::FakeClock clock(kNow);
    CountingRefresher refresher;
    AuthenticatedTransport http(inner, &refresher, ValidTokens(), "", clock);

    HttpResponse resp;
    const auto r = http.Send(Get("https://graph/x"), resp);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Auth);
    EXPECT_EQ(r.err, 401);
    EXPECT_EQ(inner.CallCount(), 2u);
    EXPECT_EQ(refresher.Calls(), 1);
}

TEST(AuthenticatedTransportTest, FailedRefreshIsAuthError) {
    testutil::ScriptedTransport inner;
    inner.Push(testutil::Response(401, "no"));
    testutil::FakeClock clock(kNow);
    CountingRefresher refresher(false);
    AuthenticatedTransport http(inner, &refresher, ValidTokens(), "", clock);

    HttpResponse resp;
    const auto r = http.Send(Get("https://graph/x"), resp);
    EXPECT_EQ(r.kind, ErrorKind::Auth);
    EXPECT_NE(r.msg.find("invalid_grant"), std::string::npos);
    EXPECT_EQ(inner.CallCount(), 1u);
}

TEST(AuthenticatedTransportTest, OtherStatusesPassThrough) {
    testutil::ScriptedTransport inner;
    inner.Push(testutil::Response(404, "missing"));
    testutil::FakeClock clock(kNow);
    CountingRefresher refresher;
    AuthenticatedTransport http(inner, &refresher, ValidTokens(), "", clock);

    HttpResponse resp;
    ASSERT_TRUE(http.Send(Get("https://graph/x"), resp).is_ok());
    EXPECT_EQ(resp.status, 404);
    EXPECT_EQ(refresher.Calls(), 0);
}

TEST(AuthenticatedTransportTest, ClearedTokensRequireReauthentication) {
    testutil::ScriptedTransport inner;
    testutil::FakeClock clock(kNow);
    CountingRefresher refresher;
    AuthenticatedTransport http(inner, &refresher, TokenSet{}, "", clock);

    HttpResponse resp;
    const auto r = http.Send(Get("https://graph/x"), resp);
    EXPECT_EQ(r.kind, ErrorKind::Auth);
    EXPECT_NE(r.msg.find("re-authenticate"), std::string::npos);
    EXPECT_EQ(inner.CallCount(), 0u);
}

TEST(AuthenticatedTransportTest, ExpiredTokenIsRefreshedBeforeSending) {
    testutil::TemporaryDirectory dir;
    const std::string token_path = dir.Path() + "/tokens.json";

    testutil::ScriptedTransport inner;
    inner.Push(testutil::Response(200, "ok"));
    testutil::FakeClock clock(kNow);
    CountingRefresher refresher;
    TokenSet tokens = ValidTokens();
    tokens.expiry = kNow + 30; // inside the 60s buffer
    AuthenticatedTransport http(inner, &refresher, tokens, token_path, clock);

    HttpResponse resp;
    ASSERT_TRUE(http.Send(Get("https://graph/x"), resp).is_ok());
    EXPECT_EQ(refresher.Calls(), 1);
    EXPECT_EQ(FindHeader(inner.Requests().at(0).headers, "Authorization"), "Bearer fresh-1");

    TokenSet saved;
    ASSERT_TRUE(TokenSet::LoadFromFile(token_path, saved).is_ok());
    EXPECT_EQ(saved.access_token, "fresh-1");
    EXPECT_EQ(saved.expiry, kNow + 3600);
}

TEST(AuthenticatedTransportTest, ConcurrentCallersShareOneRefresh) {
    testutil::ScriptedTransport inner;
    constexpr int kThreads = 8;
    for (int i = 0; i < kThreads; ++i) inner.Push(testutil::Response(200, "ok"));
    testutil::FakeClock clock(kNow);
    CountingRefresher refresher;
    TokenSet tokens = ValidTokens();
    tokens.expiry = kNow - 10;
    AuthenticatedTransport http(inner, &refresher, tokens, "", clock);

    std::atomic<int> ok{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            HttpResponse resp;
            if (http.Send(Get("https://graph/x"), resp).is_ok() && resp.status == 200) ++ok;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(ok.load(), kThreads);
    EXPECT_EQ(refresher.Calls(), 1);
    for (const auto& req : inner.Requests()) {
        EXPECT_EQ(FindHeader(req.headers, "Authorization"), "Bearer fresh-1");
    }
}
