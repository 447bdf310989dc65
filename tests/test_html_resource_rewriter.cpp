#include "pagebridge/pages/html_resource_rewriter.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

using namespace pagebridge;

namespace {

constexpr const char* kPrefix = "https://graph.microsoft.com/";

std::string ResourceUrl(const std::string& id) {
    return std::string(kPrefix) + "v1.0/me/onenote/resources/" + id + "/$value";
}

size_t CountOccurrences(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        ++n;
    }
    return n;
}

} // namespace

TEST(HtmlResourceRewriterTest, NoReferencesReturnsInputByteIdentical) {
    testutil::FakeResourceFetcher fetcher;
    HtmlResourceRewriter rewriter(fetcher, kPrefix);
    ContentIdSequence ids;

    const std::string inputs[] = {
        "<p>Plain   text &amp; <b>bold</b></p>\n",
        "<img src=\"https://example.com/cat.png\" alt='x'>",
        "<object data=\"https://graph.microsoft.com/v1.0/me/onenote/pages\"></object>",
        "",
    };
    for (const auto& in : inputs) {
        const auto out = rewriter.Rewrite(in, "0-PAGE!1", ids);
        EXPECT_EQ(out.html, in);
        EXPECT_TRUE(out.parts.empty());
        EXPECT_FALSE(out.rewritten);
    }
    EXPECT_TRUE(fetcher.Calls().empty());
    EXPECT_EQ(ids.Issued(), 0u);
}

TEST(HtmlResourceRewriterTest, RewritesEveryExtractableReferenceInOrder) {
    testutil::FakeResourceFetcher fetcher;
    fetcher.Add("0-AA11!2-BB22!3", "png-bytes", "image/png");
    fetcher.Add("0-CC!4", "pdf-bytes", "application/pdf");
    fetcher.Add("0-DD!5", "jpg-bytes", "image/jpeg");

    HtmlResourceRewriter rewriter(fetcher, kPrefix);
    ContentIdSequence ids;

    const std::string html =
        "<div><p>Before</p>"
        "<img src=\"" + ResourceUrl("0-AA11!2-BB22!3") + "\" width=\"320\" data-src-type=\"image/png\">"
        "<object data=\"" + ResourceUrl("0-CC!4") + "\" type=\"application/pdf\" data-attachment=\"true\"></object>"
        "<p><img src=\"" + ResourceUrl("0-DD!5") + "\" alt=\"photo\"></p></div>";

    const auto out = rewriter.Rewrite(html, "0-PAGE!1", ids);
    ASSERT_TRUE(out.rewritten);
    ASSERT_EQ(out.parts.size(), 3u);
    EXPECT_EQ(out.parts[0].content_id, "part1");
    EXPECT_EQ(out.parts[0].content, "png-bytes");
    EXPECT_EQ(out.parts[0].content_type, "image/png");
    EXPECT_EQ(out.parts[1].content_id, "part2");
    EXPECT_EQ(out.parts[1].content_type, "application/pdf");
    EXPECT_EQ(out.parts[2].content_id, "part3");

    EXPECT_EQ(CountOccurrences(out.html, "name:part"), 3u);
    EXPECT_NE(out.html.find("src=\"name:part1\""), std::string::npos) << out.html;
    EXPECT_NE(out.html.find("data=\"name:part2\""), std::string::npos) << out.html;
    EXPECT_NE(out.html.find("src=\"name:part3\""), std::string::npos) << out.html;

    // Every other attribute of a rewritten element is dropped.
    EXPECT_EQ(out.html.find("width="), std::string::npos);
    EXPECT_EQ(out.html.find("data-src-type"), std::string::npos);
    EXPECT_EQ(out.html.find("data-attachment"), std::string::npos);
    EXPECT_EQ(out.html.find("alt="), std::string::npos);
    EXPECT_EQ(out.html.find("graph.microsoft.com"), std::string::npos);

    EXPECT_NE(out.html.find("<p>Before</p>"), std::string::npos);
    ASSERT_EQ(fetcher.Calls().size(), 3u);
    EXPECT_EQ(fetcher.Calls()[0], "0-PAGE!1/0-AA11!2-BB22!3");
}

TEST(HtmlResourceRewriterTest, FailedDownloadLeavesElementAndDoesNotConsumeId) {
    testutil::FakeResourceFetcher fetcher;
    fetcher.Add("0-OK!1", "ok", "image/png");

    HtmlResourceRewriter rewriter(fetcher, kPrefix);
    ContentIdSequence ids;

    const std::string html = "<img src=\"" + ResourceUrl("0-MISSING!9") + "\" alt=\"gone\">"
                             "<img src=\"" + ResourceUrl("0-OK!1") + "\">";
    const auto out = rewriter.Rewrite(html, "0-PAGE!1", ids);

    ASSERT_EQ(out.parts.size(), 1u);
    EXPECT_EQ(out.parts[0].content_id, "part1");
    EXPECT_NE(out.html.find("src=\"name:part1\""), std::string::npos);
    EXPECT_NE(out.html.find("0-MISSING!9"), std::string::npos);
    EXPECT_NE(out.html.find("alt=\"gone\""), std::string::npos);
    EXPECT_EQ(fetcher.Calls().size(), 2u);
}

TEST(HtmlResourceRewriterTest, AllDownloadsFailingReturnsInputUnchanged) {
    testutil::FakeResourceFetcher fetcher;
    HtmlResourceRewriter rewriter(fetcher, kPrefix);
    ContentIdSequence ids;

    const std::string html = "<p>x</p><img src=\"" + ResourceUrl("0-MISSING!9") + "\">";
    const auto out = rewriter.Rewrite(html, "0-PAGE!1", ids);
    EXPECT_EQ(out.html, html);
    EXPECT_TRUE(out.parts.empty());
    EXPECT_EQ(fetcher.Calls().size(), 1u);
}

TEST(HtmlResourceRewriterTest, MalformedResourceUrlIsNotDownloaded) {
    testutil::FakeResourceFetcher fetcher;
    HtmlResourceRewriter rewriter(fetcher, kPrefix);
    ContentIdSequence ids;

    const std::string html =
        "<img src=\"https://graph.microsoft.com/v1.0/me/onenote/resources/bad id/$value\">"
        "<object data=\"https://graph.microsoft.com/v1.0/me/onenote/resources/0-X!1/content\"></object>";
    const auto out = rewriter.Rewrite(html, "0-PAGE!1", ids);
    EXPECT_EQ(out.html, html);
    EXPECT_TRUE(fetcher.Calls().empty());
}

TEST(HtmlResourceRewriterTest, SequenceContinuesAcrossCommandsOfOneUpdate) {
    testutil::FakeResourceFetcher fetcher;
    fetcher.Add("0-A!1", "a", "image/png");
    fetcher.Add("0-B!2", "b", "image/png");

    HtmlResourceRewriter rewriter(fetcher, kPrefix);
    ContentIdSequence ids;

    const auto first = rewriter.Rewrite("<img src=\"" + ResourceUrl("0-A!1") + "\">", "0-P!1", ids);
    const auto second = rewriter.Rewrite("<img src=\"" + ResourceUrl("0-B!2") + "\">", "0-P!1", ids);
    ASSERT_EQ(first.parts.size(), 1u);
    ASSERT_EQ(second.parts.size(), 1u);
    EXPECT_EQ(first.parts[0].content_id, "part1");
    EXPECT_EQ(second.parts[0].content_id, "part2");
    EXPECT_NE(second.html.find("name:part2"), std::string::npos);
}

TEST(HtmlResourceRewriterTest, KeepsTopLevelTextAroundRewrittenElement) {
    testutil::FakeResourceFetcher fetcher;
    fetcher.Add("0-A!1", "a", "image/png");
    HtmlResourceRewriter rewriter(fetcher, kPrefix);
    ContentIdSequence ids;

    const auto out = rewriter.Rewrite("Caption <img src=\"" + ResourceUrl("0-A!1") + "\"> trailing", "0-P!1", ids);
    ASSERT_TRUE(out.rewritten);
    EXPECT_EQ(out.html.rfind("Caption ", 0), 0u) << out.html;
    EXPECT_NE(out.html.find(" trailing"), std::string::npos);
    EXPECT_EQ(out.html.find("<p>"), std::string::npos);
}

TEST(HtmlResourceRewriterTest, RewoundSequenceReissuesReturnedIds) {
    ContentIdSequence ids;
    EXPECT_EQ(ids.Next(), "part1");
    const std::size_t kept = ids.Issued();
    EXPECT_EQ(ids.Next(), "part2");
    EXPECT_EQ(ids.Next(), "part3");

    ids.Rewind(kept);
    EXPECT_EQ(ids.Issued(), 1u);
    EXPECT_EQ(ids.Next(), "part2");

    // Rewinding forward never skips numbers.
    ids.Rewind(10);
    EXPECT_EQ(ids.Next(), "part3");
}
