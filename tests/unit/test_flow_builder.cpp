#include <gtest/gtest.h>
#include "pdf/flow_builder.hpp"

using namespace rd;

namespace {

TextRun make_run(const std::string& text, double y, int page = 1,
                 double size = 10.0, bool bold = false) {
    TextRun run;
    run.text = text;
    run.box = {50.0, y, 400.0, size * 1.2};
    run.page_number = page;
    run.font_size = size;
    run.style.bold = bold;
    return run;
}

PageLayout make_page(int number, std::vector<TextRun> runs) {
    PageLayout page;
    page.page_number = number;
    page.width = 600.0;
    page.height = 800.0;
    page.runs = std::move(runs);
    return page;
}

} // namespace

class FlowBuilderTest : public ::testing::Test {
protected:
    FlowBuilder builder;
};

// ==========================================
// Paragraph Merging
// ==========================================

TEST_F(FlowBuilderTest, CloseLinesMerge) {
    auto paragraphs = builder.build({make_page(1, {
        make_run("The first line", 100.0),
        make_run("continues here.", 112.0),
    })});

    ASSERT_EQ(paragraphs.size(), 1u);
    EXPECT_EQ(paragraphs[0].text(), "The first line continues here.");
    EXPECT_EQ(paragraphs[0].runs.size(), 2u);
}

TEST_F(FlowBuilderTest, LargeGapSplits) {
    auto paragraphs = builder.build({make_page(1, {
        make_run("One paragraph.", 100.0),
        make_run("Another paragraph.", 160.0),
    })});

    ASSERT_EQ(paragraphs.size(), 2u);
    EXPECT_EQ(paragraphs[1].text(), "Another paragraph.");
}

TEST_F(FlowBuilderTest, FontChangeSplits) {
    auto paragraphs = builder.build({make_page(1, {
        make_run("Heading", 100.0, 1, 18.0),
        make_run("Body text follows.", 115.0, 1, 10.0),
    })});
    EXPECT_EQ(paragraphs.size(), 2u);
}

TEST_F(FlowBuilderTest, PageBreakAlwaysEndsParagraph) {
    // Bottom of page 1 and top of page 2, same font: still two paragraphs
    auto paragraphs = builder.build({
        make_page(1, {make_run("Sentence that runs on", 700.0, 1, 14.0)}),
        make_page(2, {make_run("to the next page.", 50.0, 2, 14.0)}),
    });

    ASSERT_EQ(paragraphs.size(), 2u);
    EXPECT_EQ(paragraphs[0].page_number, 1);
    EXPECT_EQ(paragraphs[1].page_number, 2);
    for (const auto& para : paragraphs) {
        for (const auto& run : para.runs) {
            EXPECT_EQ(run.page_number, para.page_number);
        }
    }
}

TEST_F(FlowBuilderTest, HyphenAtLineBreakIsJoined) {
    auto paragraphs = builder.build({make_page(1, {
        make_run("an extra-", 100.0),
        make_run("ordinary result", 112.0),
    })});
    ASSERT_EQ(paragraphs.size(), 1u);
    EXPECT_EQ(paragraphs[0].text(), "an extraordinary result");
}

TEST_F(FlowBuilderTest, EmptyPagesAreSkipped) {
    auto paragraphs = builder.build({make_page(1, {}), make_page(2, {})});
    EXPECT_TRUE(paragraphs.empty());
}

// ==========================================
// Roles
// ==========================================

TEST_F(FlowBuilderTest, RolesAssigned) {
    std::vector<Paragraph> paragraphs(4);
    paragraphs[0].runs = {make_run("Figure 3 A diagram", 100.0)};
    paragraphs[1].runs = {make_run("1. First step", 200.0)};
    paragraphs[2].runs = {make_run("Big Heading", 300.0, 1, 16.0)};
    paragraphs[3].runs = {make_run("Plain body sentence.", 400.0)};

    builder.assign_roles(paragraphs, 10.0);
    EXPECT_EQ(paragraphs[0].role, ParagraphRole::CAPTION);
    EXPECT_EQ(paragraphs[1].role, ParagraphRole::LIST_ITEM);
    EXPECT_EQ(paragraphs[2].role, ParagraphRole::HEADING_CANDIDATE);
    EXPECT_EQ(paragraphs[3].role, ParagraphRole::BODY);
    EXPECT_EQ(paragraph_role_to_string(paragraphs[0].role), "caption");
    EXPECT_EQ(paragraph_role_to_string(paragraphs[2].role), "heading_candidate");
}

TEST_F(FlowBuilderTest, BoldShortLineIsHeadingCandidate) {
    std::vector<Paragraph> paragraphs(2);
    paragraphs[0].runs = {make_run("Background", 100.0, 1, 10.0, true)};
    paragraphs[1].runs = {make_run("A bold sentence ends with a period.", 200.0, 1, 10.0, true)};

    builder.assign_roles(paragraphs, 10.0);
    EXPECT_EQ(paragraphs[0].role, ParagraphRole::HEADING_CANDIDATE);
    EXPECT_EQ(paragraphs[1].role, ParagraphRole::BODY);
}

TEST_F(FlowBuilderTest, BodyFontSizeWeightsByText) {
    std::vector<Paragraph> paragraphs(2);
    paragraphs[0].runs = {make_run("Title", 100.0, 1, 20.0)};
    paragraphs[1].runs = {make_run("A much longer run of ordinary body text", 200.0, 1, 10.2)};

    EXPECT_DOUBLE_EQ(FlowBuilder::body_font_size(paragraphs), 10.0);
}

TEST(FlowHelpersTest, CaptionAndListDetection) {
    EXPECT_TRUE(looks_like_caption("Table 4 Results"));
    EXPECT_TRUE(looks_like_caption("Fig. 2.1 Overview"));
    EXPECT_FALSE(looks_like_caption("Figures can mislead"));

    EXPECT_TRUE(looks_like_list_item("\xE2\x80\xA2 bullet"));
    EXPECT_TRUE(looks_like_list_item("b) second"));
    EXPECT_TRUE(looks_like_list_item("- dash"));
    EXPECT_FALSE(looks_like_list_item("1999 was a year"));
}

// ==========================================
// Running Matter
// ==========================================

TEST_F(FlowBuilderTest, RepeatedHeadersAreRemoved) {
    std::vector<PageLayout> pages;
    for (int p = 1; p <= 4; ++p) {
        pages.push_back(make_page(p, {
            make_run("A Book Title", 10.0, p),
            make_run("Body text on page", 300.0, p),
            make_run("Page " + std::to_string(p), 780.0, p),
        }));
    }

    size_t removed = builder.remove_running_matter(pages);
    EXPECT_EQ(removed, 8u);
    for (const auto& page : pages) {
        ASSERT_EQ(page.runs.size(), 1u);
        EXPECT_EQ(page.runs[0].text, "Body text on page");
    }
}

TEST_F(FlowBuilderTest, ShortDocumentsKeepRunningMatter) {
    std::vector<PageLayout> pages = {
        make_page(1, {make_run("Header", 10.0, 1)}),
        make_page(2, {make_run("Header", 10.0, 2)}),
    };
    EXPECT_EQ(builder.remove_running_matter(pages), 0u);
}
