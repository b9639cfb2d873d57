#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "epub/epub_archive.hpp"
#include "epub/epub_structurer.hpp"
#include "test_fixtures.hpp"
#include <filesystem>
#include <fstream>
#include <limits>

namespace fs = std::filesystem;

using namespace rd;
using namespace rd::testing_support;

class EpubStructurerTest : public ::testing::Test {
protected:
    std::unique_ptr<ScratchDir> scratch;
    std::string epub_path;
    std::string media_dir;

    void SetUp() override {
        scratch = std::make_unique<ScratchDir>("epub");
        epub_path = (scratch->path() / "field_guide.epub").string();
        media_dir = (scratch->path() / "media").string();
        write_zip(epub_path, sample_epub_entries());
    }
};

// ==========================================
// Archive
// ==========================================

TEST_F(EpubStructurerTest, ArchiveReadsPackageDocument) {
    EpubArchive archive(epub_path);

    EXPECT_EQ(archive.opf_path(), "OEBPS/content.opf");
    EXPECT_TRUE(archive.has_entry("OEBPS/images/diagram.png"));
    EXPECT_FALSE(archive.has_entry("OEBPS/images/absent.png"));
    ASSERT_EQ(archive.spine().size(), 5u);
    EXPECT_EQ(archive.spine()[1].full_path, "OEBPS/text/chapter01.xhtml");
    EXPECT_EQ(archive.manifest().size(), 8u);

    const EpubMetadata& meta = archive.metadata();
    EXPECT_EQ(meta.title, "Field Guide to Testing");
    EXPECT_EQ(meta.creators.size(), 2u);
    EXPECT_EQ(meta.isbn, "9780134685991");

    const ManifestItem* image = archive.find_by_path("OEBPS/images/diagram.png");
    ASSERT_NE(image, nullptr);
    EXPECT_TRUE(image->is_image());
}

TEST_F(EpubStructurerTest, MissingContainerIsExtractionError) {
    std::string broken = (scratch->path() / "broken.epub").string();
    write_zip(broken, {{"mimetype", "application/epub+zip"}});
    EXPECT_THROW(EpubArchive{broken}, ExtractionError);
}

TEST_F(EpubStructurerTest, NotAZipIsExtractionError) {
    std::string bogus = (scratch->path() / "bogus.epub").string();
    std::ofstream(bogus) << "plain text";
    EXPECT_THROW(EpubArchive{bogus}, ExtractionError);
}

TEST(EpubPathTest, ContainerPathHelpers) {
    EXPECT_EQ(container_dirname("OEBPS/text/a.xhtml"), "OEBPS/text");
    EXPECT_EQ(container_dirname("a.xhtml"), "");
    EXPECT_EQ(container_join("OEBPS/text", "../images/a.png"), "OEBPS/images/a.png");
    EXPECT_EQ(container_join("OEBPS/text", "./b.xhtml"), "OEBPS/text/b.xhtml");
    EXPECT_EQ(container_join("OEBPS", "/root.png"), "root.png");
    EXPECT_EQ(percent_decode("my%20file.png"), "my file.png");
}

// ==========================================
// Structuring
// ==========================================

TEST_F(EpubStructurerTest, OneChapterPerSpineDocument) {
    EpubArchive archive(epub_path);
    ReferenceMapper mapper;
    EpubStructuralProcessor processor(mapper);

    StructuredDocument doc = processor.process(archive, media_dir);

    ASSERT_EQ(doc.chapters.size(), 5u);
    EXPECT_EQ(doc.chapters[0].id(), "ch0001");
    EXPECT_EQ(doc.chapters[4].id(), "ch0005");
    EXPECT_EQ(doc.format, SourceFormat::EPUB);
    EXPECT_EQ(doc.book_id, "9780134685991");

    // Heading-less documents are titled from their file names
    EXPECT_EQ(doc.chapters[0].title(), "Cover");
    EXPECT_EQ(doc.chapters[1].title(), "Getting Started");
    EXPECT_EQ(doc.chapters[3].title(), "Glossary Terms");
    EXPECT_EQ(doc.chapters[4].title(), "Afterword");

    EXPECT_EQ(mapper.chapter_for("OEBPS/text/chapter02.xhtml").value_or(""), "ch0003");
}

TEST_F(EpubStructurerTest, MetadataCarriedIntoDocument) {
    EpubArchive archive(epub_path);
    ReferenceMapper mapper;
    StructuredDocument doc = EpubStructuralProcessor(mapper).process(archive, media_dir);

    EXPECT_EQ(doc.metadata.title, "Field Guide to Testing");
    EXPECT_EQ(doc.metadata.publisher, "Example Press");
    EXPECT_EQ(doc.metadata.copyright_year, "2018");
    EXPECT_EQ(doc.metadata.pubdate, "2019-03-14");
    EXPECT_EQ(doc.metadata.authors,
              (std::vector<std::string>{"Ada Lovelace", "Charles Babbage"}));
}

TEST_F(EpubStructurerTest, HeadingsOpenNestedSections) {
    EpubArchive archive(epub_path);
    ReferenceMapper mapper;
    StructuredDocument doc = EpubStructuralProcessor(mapper).process(archive, media_dir);

    pugi::xml_node root = doc.chapters[1].root();
    pugi::xml_node setup = root.child("section");
    ASSERT_TRUE(setup);
    EXPECT_STREQ(setup.attribute("id").value(), "setup");
    EXPECT_STREQ(setup.child("title").text().get(), "Setup");

    pugi::xml_node details = setup.child("section");
    ASSERT_TRUE(details);
    EXPECT_STREQ(details.child("title").text().get(), "Details");

    pugi::xml_node deeper = details.child("section");
    ASSERT_TRUE(deeper);
    EXPECT_TRUE(deeper.child("figure"));
    EXPECT_TRUE(deeper.child("variablelist"));

    // The h1 became the chapter title, not a section
    EXPECT_EQ(root.select_nodes("section").size(), 1u);
}

TEST_F(EpubStructurerTest, ImagesRegisteredAndReferenced) {
    EpubArchive archive(epub_path);
    ReferenceMapper mapper;
    StructuredDocument doc = EpubStructuralProcessor(mapper).process(archive, media_dir);

    ASSERT_EQ(mapper.size(), 3u);
    auto cover = mapper.get("OEBPS/images/cover.png");
    ASSERT_TRUE(cover.has_value());
    EXPECT_EQ(cover->intermediate_name, "img_0001.png");
    EXPECT_EQ(cover->geometry.width, 600);
    EXPECT_EQ(cover->geometry.height, 800);
    EXPECT_EQ(cover->referenced_in, (std::set<std::string>{"ch0001"}));
    EXPECT_TRUE(fs::exists(fs::path(media_dir) / "img_0001.png"));

    auto dot = mapper.get("OEBPS/images/dot.png");
    ASSERT_TRUE(dot.has_value());
    EXPECT_EQ(dot->referenced_in, (std::set<std::string>{"ch0002"}));

    // Image references in the tree use intermediate names
    pugi::xpath_node data = doc.chapters[1].root().select_node(".//figure//imagedata");
    ASSERT_TRUE(data);
    EXPECT_STREQ(data.node().attribute("fileref").value(), "img_0002.png");
    EXPECT_TRUE(doc.chapters[1].root().select_node(".//inlinemediaobject"));
}

TEST_F(EpubStructurerTest, InternalLinksResolveToChapters) {
    EpubArchive archive(epub_path);
    ReferenceMapper mapper;
    StructuredDocument doc = EpubStructuralProcessor(mapper).process(archive, media_dir);

    pugi::xpath_node_set links = doc.chapters[2].root().select_nodes(".//link");
    ASSERT_EQ(links.size(), 2u);
    EXPECT_STREQ(links[0].node().attribute("linkend").value(), "ch0002-setup");
    // Anchor that does not exist falls back to the chapter itself
    EXPECT_STREQ(links[1].node().attribute("linkend").value(), "ch0002");

    pugi::xpath_node ulink = doc.chapters[2].root().select_node(".//ulink");
    ASSERT_TRUE(ulink);
    EXPECT_STREQ(ulink.node().attribute("url").value(), "https://example.com/");

    auto recorded = mapper.links();
    ASSERT_EQ(recorded.size(), 2u);
    for (const auto& link : recorded) {
        EXPECT_TRUE(link.resolved);
        EXPECT_EQ(link.source_chapter, "ch0003");
        EXPECT_EQ(link.target_chapter, "ch0002");
    }
}

TEST_F(EpubStructurerTest, TablesAndListsMapped) {
    EpubArchive archive(epub_path);
    ReferenceMapper mapper;
    StructuredDocument doc = EpubStructuralProcessor(mapper).process(archive, media_dir);

    pugi::xml_node chapter = doc.chapters[2].root();
    pugi::xml_node list = chapter.child("itemizedlist");
    ASSERT_TRUE(list);
    size_t items = 0;
    for (pugi::xml_node item : list.children("listitem")) {
        EXPECT_TRUE(item.child("para"));
        ++items;
    }
    EXPECT_EQ(items, 2u);

    pugi::xml_node table = chapter.child("table");
    ASSERT_TRUE(table);
    EXPECT_STREQ(table.child("title").text().get(), "Table 1 Values");
    EXPECT_STREQ(table.child("tgroup").attribute("cols").value(), "2");
    EXPECT_TRUE(table.child("tgroup").child("thead"));
    EXPECT_TRUE(table.child("tgroup").child("tbody"));
}

TEST_F(EpubStructurerTest, MalformedDocumentIsExtractionError) {
    auto entries = sample_epub_entries();
    for (auto& [name, data] : entries) {
        if (name == "OEBPS/text/afterword.xhtml") {
            data = "<html><body><p>unclosed</body></html>";
        }
    }
    std::string broken = (scratch->path() / "malformed.epub").string();
    write_zip(broken, entries);

    EpubArchive archive(broken);
    ReferenceMapper mapper;
    EXPECT_THROW(EpubStructuralProcessor(mapper).process(archive, media_dir), ExtractionError);
}

// ==========================================
// Helpers
// ==========================================

TEST(EpubHelpersTest, TitleFromFilename) {
    EXPECT_EQ(title_from_filename("OEBPS/text/glossary_terms.xhtml"), "Glossary Terms");
    EXPECT_EQ(title_from_filename("a-b.xhtml"), "A B");
    EXPECT_EQ(title_from_filename("___.xhtml"), "Untitled");
}

TEST(EpubHelpersTest, InspectPngAndSvg) {
    ResourceGeometry png = inspect_image_bytes(png_bytes(120, 45), ".png");
    EXPECT_EQ(png.width, 120);
    EXPECT_EQ(png.height, 45);
    EXPECT_TRUE(png.is_raster);

    ResourceGeometry svg = inspect_image_bytes("<svg width=\"10\" height=\"20\"></svg>", ".svg");
    EXPECT_TRUE(svg.is_vector);
    EXPECT_FALSE(svg.is_raster);
    EXPECT_EQ(svg.width, 10);
    EXPECT_EQ(svg.height, 20);

    ResourceGeometry huge = inspect_image_bytes("<svg width=\"99999999999\" height=\"10\"/>", ".svg");
    EXPECT_EQ(huge.width, std::numeric_limits<int>::max());
    EXPECT_EQ(huge.height, 10);
}

TEST(EpubHelpersTest, DecodesNamedEntities) {
    EXPECT_EQ(decode_html_entities("a&nbsp;b&mdash;c"), "a\xC2\xA0" "b\xE2\x80\x94" "c");
    EXPECT_EQ(decode_html_entities("&amp; stays"), "&amp; stays");
}
