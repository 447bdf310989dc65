#include "pagebridge/transfer/async_operation.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

using namespace pagebridge;

TEST(AsyncOperationTest, StatusNamesAreCaseInsensitive) {
    EXPECT_EQ(ParseOperationStatus("notStarted"), OperationStatus::NotStarted);
    EXPECT_EQ(ParseOperationStatus("NotStarted"), OperationStatus::NotStarted);
    EXPECT_EQ(ParseOperationStatus("running"), OperationStatus::Running);
    EXPECT_EQ(ParseOperationStatus("Completed"), OperationStatus::Completed);
    EXPECT_EQ(ParseOperationStatus("FAILED"), OperationStatus::Failed);
    EXPECT_EQ(ParseOperationStatus("Paused"), OperationStatus::Unknown);
}

TEST(AsyncOperationTest, ParsePayload) {
    auto op = ParseOperationPayload(
        R"({"id":"op-9","status":"Completed","resourceLocation":"https://x/onenote/pages/0-A!1"})");
    ASSERT_TRUE(op.has_value()) << op.error();
    EXPECT_EQ(op->operation_id, "op-9");
    EXPECT_EQ(op->status, OperationStatus::Completed);
    ASSERT_TRUE(op->resource_location.has_value());
    EXPECT_FALSE(op->transient);

    EXPECT_FALSE(ParseOperationPayload(R"({"id":"op-9"})").has_value());
    EXPECT_FALSE(ParseOperationPayload(R"({"status":7})").has_value());
    EXPECT_FALSE(ParseOperationPayload("[]").has_value());
    EXPECT_FALSE(ParseOperationPayload("{").has_value());
}

TEST(AsyncOperationTest, ServiceUnavailableIsSynthesizedRunning) {
    testutil::ScriptedTransport http;
    http.Push(testutil::Response(503, "<html>unavailable</html>"));
    GraphEndpoints endpoints("https://graph.microsoft.com");
    OperationClient client(http, endpoints);

    AsyncOperation op;
    const auto r = client.GetOperation("op-1", op);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(op.status, OperationStatus::Running);
    EXPECT_EQ(op.operation_id, "op-1");
    EXPECT_TRUE(op.transient);
    EXPECT_EQ(op.note, "Operation is still in progress (503 response received)");
}

TEST(AsyncOperationTest, RejectsBadOperationIdWithoutNetwork) {
    testutil::ScriptedTransport http;
    GraphEndpoints endpoints("https://graph.microsoft.com");
    OperationClient client(http, endpoints);

    AsyncOperation op;
    EXPECT_EQ(client.GetOperation("op/../1", op).kind, ErrorKind::Validation);
    EXPECT_EQ(http.CallCount(), 0u);
}
