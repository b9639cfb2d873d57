#include <gtest/gtest.h>
#include "model/structured_document.hpp"
#include "common/errors.hpp"

using namespace rd;

// ==========================================
// Source Format
// ==========================================

TEST(SourceFormatTest, DetectsByExtension) {
    EXPECT_EQ(detect_source_format("/books/manual.pdf"), SourceFormat::PDF);
    EXPECT_EQ(detect_source_format("novel.EPUB"), SourceFormat::EPUB);
    EXPECT_EQ(detect_source_format("novel.epub3"), SourceFormat::EPUB);
}

TEST(SourceFormatTest, RejectsOtherExtensions) {
    EXPECT_THROW(detect_source_format("notes.docx"), UnsupportedFormatError);
    EXPECT_THROW(detect_source_format("no_extension"), UnsupportedFormatError);
}

// ==========================================
// Identifiers
// ==========================================

TEST(IdentifierTest, ChapterIdsArePadded) {
    EXPECT_EQ(make_chapter_id(1), "ch0001");
    EXPECT_EQ(make_chapter_id(42), "ch0042");
}

TEST(IdentifierTest, NamespacingIsIdempotent) {
    EXPECT_EQ(namespaced_id("ch0002", "intro"), "ch0002-intro");
    EXPECT_EQ(namespaced_id("ch0002", "ch0002-intro"), "ch0002-intro");
}

TEST(IdentifierTest, NamespacedIdsAreXmlNames) {
    EXPECT_EQ(namespaced_id("ch0003", "fig 1"), "ch0003-fig_1");
    EXPECT_EQ(namespaced_id("ch0003", "1:a"), "ch0003-1_a");
    EXPECT_EQ(namespaced_id("ch0003", "caf\xC3\xA9"), "ch0003-caf__");

    EXPECT_EQ(xml_name("9780134685991"), "_9780134685991");
    EXPECT_EQ(xml_name("-x"), "_-x");
    EXPECT_EQ(xml_name(""), "_");
    EXPECT_EQ(xml_name("sample"), "sample");
}

TEST(IdentifierTest, BookIdPrefersIsbn) {
    EXPECT_EQ(make_book_id("/in/My Book.pdf", "9780134685991"), "9780134685991");
    EXPECT_EQ(make_book_id("/in/My Book (2nd).pdf", ""), "My_Book__2nd_");
}

TEST(IdentifierTest, IsbnNormalization) {
    EXPECT_EQ(normalize_isbn("ISBN 978-0-13-468599-1"), "9780134685991");
    EXPECT_EQ(normalize_isbn("0-8044-2957-x"), "080442957X");
    EXPECT_EQ(normalize_isbn("12345"), "");
    EXPECT_EQ(normalize_isbn("X123456789"), "");
}

TEST(IdentifierTest, YearExtraction) {
    EXPECT_EQ(extract_year("D:20190314120000"), "");
    EXPECT_EQ(extract_year("Copyright (c) 2019 Someone"), "2019");
    EXPECT_EQ(extract_year("no year here"), "");
}

// ==========================================
// Chapters
// ==========================================

TEST(ChapterTest, RootCarriesId) {
    Chapter chapter("ch0003", 3, "text/ch3.xhtml");
    EXPECT_STREQ(chapter.root().name(), "chapter");
    EXPECT_STREQ(chapter.root().attribute("id").value(), "ch0003");
    EXPECT_EQ(chapter.file_name(), "ch0003.xml");
}

TEST(ChapterTest, SetTitlePrependsOnce) {
    Chapter chapter("ch0001", 1, "a.xhtml");
    chapter.root().append_child("sect1");
    chapter.set_title("First");
    chapter.set_title("Second");

    EXPECT_EQ(chapter.title(), "Second");
    EXPECT_STREQ(chapter.root().first_child().name(), "title");
    size_t titles = 0;
    for (pugi::xml_node child : chapter.root().children("title")) {
        (void)child;
        ++titles;
    }
    EXPECT_EQ(titles, 1u);
}

TEST(StructuredDocumentTest, ChaptersNumberedInOrder) {
    StructuredDocument doc;
    doc.add_chapter("a.xhtml");
    doc.add_chapter("b.xhtml");
    Chapter& third = doc.add_chapter("c.xhtml");

    EXPECT_EQ(third.id(), "ch0003");
    ASSERT_NE(doc.find_chapter("ch0002"), nullptr);
    EXPECT_EQ(doc.find_chapter("ch0002")->source_file(), "b.xhtml");
    EXPECT_EQ(doc.find_chapter("ch0009"), nullptr);
}

TEST(StructuredDocumentTest, RemoveChapterKeepsOthers) {
    StructuredDocument doc;
    doc.add_chapter("a.xhtml");
    doc.add_chapter("b.xhtml");

    EXPECT_TRUE(doc.remove_chapter("ch0001"));
    EXPECT_FALSE(doc.remove_chapter("ch0001"));
    ASSERT_EQ(doc.chapters.size(), 1u);
    EXPECT_EQ(doc.chapters[0].id(), "ch0002");

    // Numbering continues after the last remaining chapter
    EXPECT_EQ(doc.add_chapter("c.xhtml").id(), "ch0003");
}
