#include "pagebridge/pages/page_client.hpp"
#include "pagebridge/pages/table_guardrail.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

using namespace pagebridge;

namespace {

UpdateCommand Replace(std::string target) {
    return {.target = std::move(target), .action = UpdateAction::Replace, .position = std::nullopt,
            .content = "<p>x</p>"};
}

} // namespace

TEST(TableGuardrailTest, AcceptsWholeTableAndOtherTargets) {
    const std::vector<UpdateCommand> cmds = {Replace("table:{t1}"), Replace("body"), Replace("p:{td-lookalike}")};
    EXPECT_TRUE(CheckTableUpdates(cmds).is_ok());
    EXPECT_TRUE(FindTableElementTargets(cmds).empty());
}

TEST(TableGuardrailTest, RejectsEveryCellRowAndHeaderTarget) {
    const std::vector<UpdateCommand> cmds = {Replace("td:{c1}"), Replace("body"), Replace("th:{h1}"),
                                             Replace("tr:{r1}")};
    const auto offending = FindTableElementTargets(cmds);
    ASSERT_EQ(offending.size(), 3u);

    const auto r = CheckTableUpdates(cmds);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Validation);
    EXPECT_EQ(r.msg.rfind("TABLE UPDATE RESTRICTION", 0), 0u);
    EXPECT_NE(r.msg.find("td:{c1}"), std::string::npos);
    EXPECT_NE(r.msg.find("th:{h1}"), std::string::npos);
    EXPECT_NE(r.msg.find("tr:{r1}"), std::string::npos);
    EXPECT_EQ(r.msg.find("\"body\""), std::string::npos);
    EXPECT_NE(r.msg.find("table:{table-data-id}"), std::string::npos);
    EXPECT_NE(r.msg.find("replace"), std::string::npos);
}

TEST(TableGuardrailTest, UpdatePageRejectsBeforeAnyNetworkCall) {
    testutil::ScriptedTransport http;
    testutil::FakeResourceFetcher fetcher;
    fetcher.Add("0-R1!1", "bytes", "image/png");

    PageClient pages(http, GraphEndpoints("https://graph.microsoft.com"));
    pages.SetResourceFetcher(&fetcher);

    UpdateCommand cell = Replace("td:{c1}");
    cell.content = "<td><img src=\"https://graph.microsoft.com/v1.0/me/onenote/resources/0-R1!1/$value\"></td>";
    const std::vector<UpdateCommand> cmds = {cell};

    const auto r = pages.UpdatePage("0-PAGE!1", cmds);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Validation);
    EXPECT_EQ(http.CallCount(), 0u);
    EXPECT_TRUE(fetcher.Calls().empty());
}
