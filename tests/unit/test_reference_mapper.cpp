#include <gtest/gtest.h>
#include "mapping/reference_mapper.hpp"
#include "common/errors.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace rd;

class ReferenceMapperTest : public ::testing::Test {
protected:
    ReferenceMapper mapper;
    fs::path root;

    void SetUp() override {
        root = fs::temp_directory_path() /
               ("rittdoc_mapper_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(root / "MultiMedia");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void touch(const std::string& final_name) {
        std::ofstream(root / "MultiMedia" / final_name) << "x";
    }
};

// ==========================================
// Registration
// ==========================================

TEST_F(ReferenceMapperTest, RegisterAndGet) {
    ResourceGeometry geometry;
    geometry.width = 640;
    geometry.height = 480;
    mapper.register_resource("OEBPS/images/fig1.png", "img_0001.png", ResourceKind::IMAGE, geometry);

    auto resource = mapper.get("OEBPS/images/fig1.png");
    ASSERT_TRUE(resource.has_value());
    EXPECT_EQ(resource->intermediate_name, "img_0001.png");
    EXPECT_FALSE(resource->final_name.has_value());
    EXPECT_EQ(resource->geometry.width, 640);
    EXPECT_EQ(mapper.size(), 1u);

    auto by_name = mapper.find_by_intermediate("img_0001.png");
    ASSERT_TRUE(by_name.has_value());
    EXPECT_EQ(by_name->original_path, "OEBPS/images/fig1.png");
}

TEST_F(ReferenceMapperTest, DuplicateRegistrationThrows) {
    mapper.register_resource("a.png", "img_0001.png", ResourceKind::IMAGE);
    EXPECT_THROW(mapper.register_resource("a.png", "img_0002.png", ResourceKind::IMAGE),
                 DuplicateResourceError);
    EXPECT_EQ(mapper.size(), 1u);
}

TEST_F(ReferenceMapperTest, FinalizeUnknownThrows) {
    EXPECT_THROW(mapper.finalize("missing.png", "Ch0001f01.png"), UnknownResourceError);
}

TEST_F(ReferenceMapperTest, RecordReferenceIsIdempotent) {
    mapper.register_resource("a.png", "img_0001.png", ResourceKind::IMAGE);
    mapper.record_reference("a.png", "ch0002");
    mapper.record_reference("a.png", "ch0002");
    mapper.record_reference("a.png", "ch0001");

    auto resource = mapper.get("a.png");
    ASSERT_TRUE(resource.has_value());
    EXPECT_EQ(resource->referenced_in.size(), 2u);
    EXPECT_EQ(resource->first_seen_in, "ch0002");
}

TEST_F(ReferenceMapperTest, EarlyReferenceAttachesOnRegistration) {
    mapper.record_reference("late.png", "ch0001");
    EXPECT_EQ(mapper.statistics().dangling_references, 1u);

    mapper.register_resource("late.png", "img_0001.png", ResourceKind::IMAGE);
    EXPECT_EQ(mapper.statistics().dangling_references, 0u);
    EXPECT_EQ(mapper.get("late.png")->first_seen_in, "ch0001");
}

TEST_F(ReferenceMapperTest, EarlyReferenceKeepsFirstChapterNotSmallest) {
    mapper.record_reference("late.png", "ch0003");
    mapper.record_reference("late.png", "ch0001");

    mapper.register_resource("late.png", "img_0001.png", ResourceKind::IMAGE);
    auto resource = mapper.get("late.png");
    ASSERT_TRUE(resource.has_value());
    EXPECT_EQ(resource->first_seen_in, "ch0003");
    EXPECT_EQ(resource->referenced_in.size(), 2u);
}

// ==========================================
// Validation
// ==========================================

TEST_F(ReferenceMapperTest, ValidatePassesWhenEveryFileExists) {
    mapper.register_resource("a.png", "img_0001.png", ResourceKind::IMAGE);
    mapper.record_reference("a.png", "ch0001");
    mapper.finalize("a.png", "Ch0001f01.png");
    touch("Ch0001f01.png");

    auto [ok, problems] = mapper.validate(root.string());
    EXPECT_TRUE(ok);
    EXPECT_TRUE(problems.empty());
    EXPECT_TRUE(mapper.get("a.png")->exists_in_output);
}

TEST_F(ReferenceMapperTest, ValidateReportsEveryProblemKind) {
    mapper.register_resource("unnamed.png", "img_0001.png", ResourceKind::IMAGE);
    mapper.register_resource("absent.png", "img_0002.png", ResourceKind::IMAGE);
    mapper.finalize("absent.png", "Ch0001f02.png");
    mapper.record_reference("ghost.png", "ch0001");

    LinkReference link;
    link.original_href = "nowhere.xhtml#x";
    link.source_chapter = "ch0001";
    mapper.add_link(link);

    auto [ok, problems] = mapper.validate(root.string());
    EXPECT_FALSE(ok);
    EXPECT_EQ(problems.size(), 4u);
}

TEST_F(ReferenceMapperTest, RetractChapterForgetsItsReferences) {
    mapper.register_resource("shared.png", "img_0001.png", ResourceKind::IMAGE);
    mapper.record_reference("shared.png", "ch0001");
    mapper.record_reference("shared.png", "ch0002");
    mapper.record_reference("ghost.png", "ch0002");

    LinkReference outgoing;
    outgoing.original_href = "a.xhtml";
    outgoing.source_chapter = "ch0002";
    outgoing.target_chapter = "ch0001";
    outgoing.resolved = true;
    mapper.add_link(outgoing);

    LinkReference incoming;
    incoming.original_href = "b.xhtml";
    incoming.source_chapter = "ch0001";
    incoming.target_chapter = "ch0002";
    incoming.resolved = true;
    mapper.add_link(incoming);

    mapper.retract_chapter("ch0002");

    auto resource = mapper.get("shared.png");
    EXPECT_EQ(resource->referenced_in, (std::set<std::string>{"ch0001"}));
    EXPECT_EQ(mapper.statistics().dangling_references, 0u);

    auto links = mapper.links();
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0].source_chapter, "ch0001");
    EXPECT_FALSE(links[0].resolved);
}

// ==========================================
// Export
// ==========================================

TEST_F(ReferenceMapperTest, ExportWritesRegistry) {
    mapper.register_resource("a.png", "img_0001.png", ResourceKind::IMAGE);
    mapper.register_chapter("text/one.xhtml", "ch0001");
    mapper.finalize("a.png", "Ch0001f01.png");

    fs::path out = root / "mapping.json";
    mapper.export_to_json(out.string());

    std::ifstream file(out);
    nlohmann::json j = nlohmann::json::parse(file);
    EXPECT_EQ(j["resources"]["a.png"]["final_name"], "Ch0001f01.png");
    EXPECT_EQ(j["chapter_map"]["text/one.xhtml"], "ch0001");
    EXPECT_EQ(j["statistics"]["finalized_resources"], 1);
}

TEST_F(ReferenceMapperTest, ReportMentionsMissingFinalName) {
    mapper.register_resource("a.png", "img_0001.png", ResourceKind::IMAGE);
    std::string report = mapper.generate_report();
    EXPECT_NE(report.find("NOT SET"), std::string::npos);
    EXPECT_NE(report.find("REFERENCE MAPPING REPORT"), std::string::npos);
}
