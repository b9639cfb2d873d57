#include <gtest/gtest.h>
#include "compliance/dtd_compliance.hpp"
#include "common/errors.hpp"
#include <set>

using namespace rd;

namespace {

Chapter make_chapter(const std::string& id, int number, const std::string& body) {
    Chapter chapter(id, number, id + ".xhtml");
    pugi::xml_document fragment;
    pugi::xml_parse_result parsed = fragment.load_string(("<r>" + body + "</r>").c_str());
    EXPECT_TRUE(parsed) << parsed.description();
    for (pugi::xml_node n = fragment.document_element().first_child(); n; n = n.next_sibling()) {
        chapter.root().append_copy(n);
    }
    return chapter;
}

std::vector<pugi::xml_node> all_elements(pugi::xml_node root) {
    std::vector<pugi::xml_node> out;
    for (pugi::xpath_node found : root.select_nodes("descendant-or-self::*")) {
        out.push_back(found.node());
    }
    return out;
}

std::set<std::string> ids_of(const Chapter& chapter) {
    std::set<std::string> ids;
    for (pugi::xml_node node : all_elements(chapter.root())) {
        if (node.attribute("id")) {
            ids.insert(node.attribute("id").value());
        }
    }
    return ids;
}

std::string nested_sections(int depth) {
    std::string open;
    std::string close;
    for (int i = 0; i < depth; ++i) {
        open += "<section><title>Level " + std::to_string(i + 1) + "</title><para>x</para>";
        close += "</section>";
    }
    return "<title>Deep</title>" + open + close;
}

} // namespace

// ==========================================
// Sections and banned elements
// ==========================================

TEST(ComplianceTransformerTest, NestedSectionsWithVariableList) {
    Chapter chapter = make_chapter("ch0001", 1,
        "<title>Nesting</title>"
        "<section id=\"a\"><title>A</title><para>x</para>"
        "<section id=\"b\"><title>B</title>"
        "<section id=\"c\"><title>C</title>"
        "<variablelist><varlistentry><term>T</term>"
        "<listitem><para>D</para></listitem></varlistentry></variablelist>"
        "</section></section></section>");

    ComplianceTransformer transformer;
    ComplianceReport report = transformer.transform_chapter(chapter);
    EXPECT_TRUE(report.changed());

    pugi::xml_node sect3 = chapter.root().child("sect1").child("sect2").child("sect3");
    ASSERT_TRUE(sect3);
    pugi::xml_node entry = sect3.child("glosslist").child("glossentry");
    ASSERT_TRUE(entry);
    EXPECT_STREQ(entry.child("glossterm").text().get(), "T");
    EXPECT_STREQ(entry.child("glossdef").child("para").text().get(), "D");

    for (pugi::xml_node node : all_elements(chapter.root())) {
        EXPECT_EQ(ComplianceTransformer::banned_elements().count(node.name()), 0u)
            << "banned element left: " << node.name();
    }
}

TEST(ComplianceTransformerTest, SectionDepthBeyondFiveIsAnError) {
    Chapter chapter = make_chapter("ch0004", 4, nested_sections(6));
    std::string before = chapter.to_xml();

    ComplianceTransformer transformer;
    try {
        transformer.transform_chapter(chapter);
        FAIL() << "expected ComplianceError";
    } catch (const ComplianceError& e) {
        EXPECT_EQ(e.chapter_id(), "ch0004");
    }
    // Nothing was rewritten before the failure
    EXPECT_EQ(chapter.to_xml(), before);
}

TEST(ComplianceTransformerTest, FiveLevelsAreAccepted) {
    Chapter chapter = make_chapter("ch0001", 1, nested_sections(5));
    ComplianceTransformer transformer;
    ASSERT_NO_THROW(transformer.transform_chapter(chapter));

    EXPECT_TRUE(chapter.root().child("sect1").child("sect2").child("sect3")
                .child("sect4").child("sect5"));
}

TEST(ComplianceTransformerTest, InformalFormsBecomeFormal) {
    Chapter chapter = make_chapter("ch0002", 2,
        "<title>Plates</title>"
        "<section><title>S</title>"
        "<informalfigure><mediaobject><imageobject><imagedata fileref=\"img_0001.png\"/>"
        "</imageobject></mediaobject></informalfigure>"
        "<informaltable><tgroup><tbody>"
        "<row><entry>a</entry></row><row><entry>b</entry><entry>c</entry><entry>d</entry></row>"
        "</tbody></tgroup></informaltable>"
        "</section>");

    ComplianceTransformer().transform_chapter(chapter);

    pugi::xml_node sect1 = chapter.root().child("sect1");
    pugi::xml_node figure = sect1.child("figure");
    ASSERT_TRUE(figure);
    EXPECT_STREQ(figure.first_child().name(), "title");
    EXPECT_STREQ(figure.child("title").text().get(), "Figure 1");

    pugi::xml_node table = sect1.child("table");
    ASSERT_TRUE(table);
    EXPECT_STREQ(table.child("title").text().get(), "Table 1");
    EXPECT_STREQ(table.child("tgroup").attribute("cols").value(), "3");
}

TEST(ComplianceTransformerTest, HtmlLeftoversAreUnwrapped) {
    Chapter chapter = make_chapter("ch0001", 1,
        "<title>Leftovers</title>"
        "<section><title>S</title>"
        "<div class=\"box\"><p>One<br/>Two</p><p>Three</p></div>"
        "</section>");

    ComplianceTransformer().transform_chapter(chapter);

    for (pugi::xml_node node : all_elements(chapter.root())) {
        std::string name = node.name();
        EXPECT_NE(name, "div");
        EXPECT_NE(name, "p");
        EXPECT_NE(name, "br");
    }
    EXPECT_EQ(chapter.root().child("sect1").select_nodes("para").size(), 2u);
}

TEST(ComplianceTransformerTest, NestedInlineParagraphDissolves) {
    Chapter chapter = make_chapter("ch0001", 1,
        "<title>T</title>"
        "<section><title>S</title><para>Outer <para>inner</para> text</para></section>");

    ComplianceTransformer().transform_chapter(chapter);

    pugi::xml_node sect1 = chapter.root().child("sect1");
    EXPECT_EQ(sect1.select_nodes("para").size(), 1u);
    EXPECT_EQ(sect1.select_nodes(".//para/para").size(), 0u);
}

TEST(ComplianceTransformerTest, NestedParagraphWithIdBecomesPhrase) {
    Chapter chapter = make_chapter("ch0001", 1,
        "<title>T</title>"
        "<section><title>S</title>"
        "<para>See <para id=\"x\">this</para> now, "
        "<emphasis><para id=\"y\">and this</para></emphasis>.</para>"
        "<para>Back to <link linkend=\"x\">x</link>.</para></section>");

    ComplianceTransformer().transform_chapter(chapter);

    pugi::xml_node sect1 = chapter.root().child("sect1");
    EXPECT_EQ(sect1.select_nodes(".//para//para").size(), 0u);
    ASSERT_EQ(sect1.select_nodes("para").size(), 2u);

    pugi::xml_node first = sect1.child("para");
    pugi::xml_node phrase = first.child("phrase");
    ASSERT_TRUE(phrase);
    EXPECT_STREQ(phrase.attribute("id").value(), "ch0001-x");
    EXPECT_STREQ(phrase.text().get(), "this");
    EXPECT_STREQ(first.child("emphasis").child("phrase").attribute("id").value(), "ch0001-y");

    pugi::xml_node link = first.next_sibling("para").child("link");
    EXPECT_STREQ(link.attribute("linkend").value(), "ch0001-x");
}

TEST(ComplianceTransformerTest, BlocksAfterSubsectionMoveIntoTrailingSubsection) {
    Chapter chapter = make_chapter("ch0002", 2,
        "<title>T</title>"
        "<section id=\"top\"><title>Top</title><para>lead</para>"
        "<section><title>Inner</title><para>inner</para></section>"
        "<para>after one</para><itemizedlist><listitem><para>i</para></listitem></itemizedlist>"
        "</section>");

    ComplianceTransformer transformer;
    transformer.transform_chapter(chapter);

    pugi::xml_node sect1 = chapter.root().child("sect1");
    std::vector<std::string> names;
    for (pugi::xml_node child = sect1.first_child(); child; child = child.next_sibling()) {
        names.push_back(child.name());
    }
    std::vector<std::string> expected = {"title", "para", "sect2", "sect2"};
    EXPECT_EQ(names, expected);

    pugi::xml_node trailing = sect1.last_child();
    EXPECT_STREQ(trailing.attribute("id").value(), "ch0002-continued");
    EXPECT_STREQ(trailing.child("title").text().get(), "Continued");
    EXPECT_STREQ(trailing.child("para").text().get(), "after one");
    EXPECT_TRUE(trailing.child("itemizedlist"));

    std::string once = chapter.to_xml();
    EXPECT_FALSE(transformer.transform_chapter(chapter).changed());
    EXPECT_EQ(chapter.to_xml(), once);
}

TEST(ComplianceTransformerTest, IdsBecomeXmlNames) {
    Chapter chapter = make_chapter("ch0001", 1,
        "<title>T</title>"
        "<section id=\"fig 1\"><title>S</title>"
        "<para>See <link linkend=\"fig 1\">it</link>.</para></section>");

    ComplianceTransformer().transform_chapter(chapter);

    pugi::xml_node sect1 = chapter.root().child("sect1");
    EXPECT_STREQ(sect1.attribute("id").value(), "ch0001-fig_1");
    EXPECT_STREQ(sect1.child("para").child("link").attribute("linkend").value(), "ch0001-fig_1");
}

// ==========================================
// Chapter content model
// ==========================================

TEST(ComplianceTransformerTest, LooseContentWrappedInGeneratedSection) {
    Chapter chapter = make_chapter("ch0003", 3,
        "<title>Loose</title><para>Hello</para>"
        "<section><title>Body</title><para>x</para></section>"
        "<para>Trailing</para>");

    ComplianceTransformer().transform_chapter(chapter);

    std::vector<pugi::xml_node> children;
    for (pugi::xml_node child = chapter.root().first_child(); child; child = child.next_sibling()) {
        children.push_back(child);
    }
    ASSERT_EQ(children.size(), 4u);
    EXPECT_STREQ(children[0].name(), "title");

    EXPECT_STREQ(children[1].name(), "sect1");
    EXPECT_STREQ(children[1].attribute("id").value(), "ch0003-intro");
    EXPECT_STREQ(children[1].child("title").text().get(), "Introduction");
    EXPECT_STREQ(children[1].child("para").text().get(), "Hello");

    EXPECT_STREQ(children[2].child("title").text().get(), "Body");

    EXPECT_STREQ(children[3].attribute("id").value(), "ch0003-continued");
    EXPECT_STREQ(children[3].child("para").text().get(), "Trailing");

    for (const pugi::xml_node& child : children) {
        EXPECT_TRUE(ComplianceTransformer::chapter_whitelist().count(child.name()))
            << child.name();
    }
}

TEST(ComplianceTransformerTest, TitleOnlyChapterGetsContentSection) {
    Chapter chapter = make_chapter("ch0001", 1, "<title>Empty</title>");
    ComplianceTransformer().transform_chapter(chapter);

    pugi::xml_node sect1 = chapter.root().child("sect1");
    ASSERT_TRUE(sect1);
    EXPECT_STREQ(sect1.attribute("id").value(), "ch0001-content");
    EXPECT_TRUE(sect1.child("para"));
}

TEST(ComplianceTransformerTest, EmptyRequiredContentFilled) {
    Chapter chapter = make_chapter("ch0001", 1,
        "<section><title></title><para>x</para>"
        "<glosslist><glossentry><glossterm/><glossdef><para>d</para></glossdef></glossentry></glosslist>"
        "</section>");

    ComplianceTransformer().transform_chapter(chapter);

    EXPECT_EQ(chapter.title(), "Untitled");
    pugi::xml_node sect1 = chapter.root().child("sect1");
    EXPECT_STREQ(sect1.child("title").text().get(), "Untitled");
    EXPECT_STREQ(sect1.child("glosslist").child("glossentry").child("glossterm").text().get(), "Term");
}

// ==========================================
// Ids
// ==========================================

TEST(ComplianceTransformerTest, IdsNamespacedAndLinksFollow) {
    Chapter chapter = make_chapter("ch0001", 1,
        "<title>T</title>"
        "<section id=\"setup\"><title>Setup</title>"
        "<para>See <link linkend=\"setup\">setup</link>.</para></section>");

    ComplianceTransformer().transform_chapter(chapter);

    pugi::xml_node sect1 = chapter.root().child("sect1");
    EXPECT_STREQ(sect1.attribute("id").value(), "ch0001-setup");
    EXPECT_STREQ(sect1.child("para").child("link").attribute("linkend").value(), "ch0001-setup");
    EXPECT_STREQ(chapter.root().attribute("id").value(), "ch0001");
}

TEST(ComplianceTransformerTest, IdsDisjointAcrossChapters) {
    const std::string body =
        "<title>Chapter</title>"
        "<section id=\"introduction\"><title>Introduction</title><para id=\"p1\">x</para></section>"
        "<section id=\"introduction\"><title>Again</title><para>y</para></section>";
    Chapter first = make_chapter("ch0001", 1, body);
    Chapter second = make_chapter("ch0002", 2, body);

    ComplianceTransformer transformer;
    transformer.transform_chapter(first);
    transformer.transform_chapter(second);

    std::set<std::string> a = ids_of(first);
    std::set<std::string> b = ids_of(second);
    EXPECT_TRUE(a.count("ch0001-introduction"));
    EXPECT_TRUE(a.count("ch0001-introduction-2"));
    for (const auto& id : a) {
        EXPECT_EQ(b.count(id), 0u) << "shared id " << id;
    }
}

// ==========================================
// Idempotence
// ==========================================

TEST(ComplianceTransformerTest, SecondPassChangesNothing) {
    Chapter chapter = make_chapter("ch0001", 1,
        "<title>Mixed</title>"
        "<div id=\"introduction\"><p>Loose text <emphasis>here</emphasis>.</p></div>"
        "<informaltable><tgroup><tbody><row><entry>a</entry><entry>b</entry></row></tbody>"
        "</tgroup></informaltable>"
        "<section id=\"introduction\"><title>Intro again</title><p>Body</p>"
        "<variablelist><varlistentry><term>T</term><listitem>def</listitem></varlistentry>"
        "</variablelist></section>"
        "<para>Trailing</para>");

    ComplianceTransformer transformer;
    transformer.transform_chapter(chapter);
    std::string once = chapter.to_xml();

    ComplianceReport second = transformer.transform_chapter(chapter);
    EXPECT_EQ(chapter.to_xml(), once);
    EXPECT_FALSE(second.changed());
}

TEST(ComplianceTransformerTest, DocumentTransformStopsAtFailingChapter) {
    StructuredDocument doc;
    doc.add_chapter("a.xhtml").set_title("Fine");
    Chapter& deep = doc.add_chapter("b.xhtml");
    Chapter built = make_chapter(deep.id(), deep.number(), nested_sections(6));
    deep = std::move(built);

    ComplianceTransformer transformer;
    EXPECT_THROW(transformer.transform(doc), ComplianceError);
    // Metadata placeholders were applied before the chapters
    EXPECT_EQ(doc.metadata.title, "Untitled Book");
}

// ==========================================
// Metadata
// ==========================================

TEST(ComplianceTransformerTest, MetadataPlaceholders) {
    BookMetadata metadata;
    std::vector<std::string> filled = ComplianceTransformer().apply_metadata_defaults(metadata);

    EXPECT_EQ(filled.size(), 5u);
    EXPECT_EQ(metadata.isbn, "0000000000000");
    EXPECT_EQ(metadata.title, "Untitled Book");
    EXPECT_EQ(metadata.authors, std::vector<std::string>{"Unknown Author"});
    EXPECT_EQ(metadata.publisher, "Unknown Publisher");
    EXPECT_EQ(metadata.copyright_year, "2024");
    EXPECT_EQ(metadata.copyright_holder, "Unknown Publisher");
}

TEST(ComplianceTransformerTest, PresentMetadataKept) {
    BookMetadata metadata;
    metadata.title = "Real Title";
    metadata.isbn = "978-0-13-468599-1";
    metadata.authors = {"A. Writer"};
    metadata.publisher = "House";
    metadata.copyright_year = "2001";

    std::vector<std::string> filled = ComplianceTransformer().apply_metadata_defaults(metadata);

    EXPECT_TRUE(filled.empty());
    EXPECT_EQ(metadata.isbn, "9780134685991");
    EXPECT_EQ(metadata.title, "Real Title");
}
