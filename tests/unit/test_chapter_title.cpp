#include <gtest/gtest.h>
#include "pdf/chapter_title.hpp"

using namespace rd;

namespace {

Paragraph make_paragraph(const std::string& text, double y, double size, int page = 1) {
    TextRun run;
    run.text = text;
    run.box = {50.0, y, 400.0, size * 1.2};
    run.page_number = page;
    run.font_size = size;

    Paragraph para;
    para.runs = {run};
    para.page_number = page;
    para.box = run.box;
    return para;
}

} // namespace

TEST(ChapterTitleTest, MultiLineTitleIsMerged) {
    std::vector<Paragraph> paragraphs = {
        make_paragraph("The Long Road", 100.0, 24.0),
        make_paragraph("to Recovery", 130.0, 24.0),
        make_paragraph("Body text starts the chapter.", 200.0, 10.0),
    };

    ChapterTitleExtractor extractor;
    ChapterTitle title = extractor.extract(paragraphs);

    EXPECT_FALSE(title.is_placeholder);
    EXPECT_EQ(title.text, "The Long Road to Recovery");
    EXPECT_DOUBLE_EQ(title.font_size, 24.0);
    EXPECT_EQ(title.block_indices, (std::vector<size_t>{0, 1}));
}

TEST(ChapterTitleTest, BackwardMergeKeepsDocumentOrder) {
    // Label line slightly smaller than the anchor, within tolerance
    std::vector<Paragraph> paragraphs = {
        make_paragraph("Chapter 3", 100.0, 23.5),
        make_paragraph("Instruments", 130.0, 24.0),
        make_paragraph("Body.", 220.0, 10.0),
    };

    ChapterTitle title = ChapterTitleExtractor().extract(paragraphs);
    EXPECT_EQ(title.text, "Chapter 3 Instruments");
    EXPECT_EQ(title.block_indices.front(), 0u);
}

TEST(ChapterTitleTest, DistantBlockIsNotMerged) {
    std::vector<Paragraph> paragraphs = {
        make_paragraph("Anatomy", 100.0, 20.0),
        make_paragraph("Pull quote in the same size", 400.0, 20.0),
        make_paragraph("Body text.", 450.0, 10.0),
    };

    ChapterTitle title = ChapterTitleExtractor().extract(paragraphs);
    EXPECT_EQ(title.text, "Anatomy");
    EXPECT_EQ(title.block_indices.size(), 1u);
}

TEST(ChapterTitleTest, OtherPageIsNotMerged) {
    std::vector<Paragraph> paragraphs = {
        make_paragraph("Ending", 760.0, 20.0, 1),
        make_paragraph("Continued", 20.0, 20.0, 2),
        make_paragraph("Body.", 80.0, 10.0, 2),
    };
    EXPECT_EQ(ChapterTitleExtractor().extract(paragraphs).text, "Ending");
}

TEST(ChapterTitleTest, UniformTextGivesPlaceholder) {
    std::vector<Paragraph> paragraphs = {
        make_paragraph("Just body.", 100.0, 10.0),
        make_paragraph("More body.", 130.0, 10.0),
    };

    ChapterTitle title = ChapterTitleExtractor().extract(paragraphs);
    EXPECT_TRUE(title.is_placeholder);
    EXPECT_EQ(title.text, "Untitled Chapter");
    EXPECT_TRUE(title.block_indices.empty());
}

TEST(ChapterTitleTest, EmptyInputGivesPlaceholder) {
    ChapterTitleConfig config;
    config.placeholder = "Front Matter";
    ChapterTitle title = ChapterTitleExtractor(config).extract({});
    EXPECT_TRUE(title.is_placeholder);
    EXPECT_EQ(title.text, "Front Matter");
}

TEST(ChapterTitleTest, AnchorOutsideOpeningRegionIsIgnored) {
    ChapterTitleConfig config;
    config.opening_blocks = 2;
    std::vector<Paragraph> paragraphs = {
        make_paragraph("Body one.", 100.0, 10.0),
        make_paragraph("Body two.", 130.0, 10.0),
        make_paragraph("Late Heading", 300.0, 24.0),
    };
    EXPECT_TRUE(ChapterTitleExtractor(config).extract(paragraphs).is_placeholder);
}
