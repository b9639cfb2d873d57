#include <gtest/gtest.h>
#include "pipeline/conversion_pipeline.hpp"
#include "test_fixtures.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

using namespace rd;
using namespace rd::testing_support;

class ConversionPipelineTest : public ::testing::Test {
protected:
    std::unique_ptr<ScratchDir> scratch;
    std::string output_dir;

    void SetUp() override {
        scratch = std::make_unique<ScratchDir>("pipeline");
        output_dir = (scratch->path() / "out").string();
    }

    ConversionConfig config() const {
        ConversionConfig c;
        c.dtd_path = test_dtd_path();
        c.output_directory = output_dir;
        c.verbose = false;
        return c;
    }

    std::string write_epub(const std::string& name, const ZipEntries& entries) const {
        std::string path = (scratch->path() / name).string();
        write_zip(path, entries);
        return path;
    }

    /**
     * Two chapters, one image, one cross-chapter link.
     */
    static ZipEntries two_chapter_entries() {
        std::string opf =
            "<?xml version=\"1.0\"?>\n"
            "<package xmlns=\"http://www.idpf.org/2007/opf\" version=\"3.0\">"
            "<metadata xmlns:dc=\"http://purl.org/dc/elements/1.1/\">"
            "<dc:title>Short Book</dc:title><dc:creator>Alan Turing</dc:creator>"
            "</metadata>"
            "<manifest>"
            "<item id=\"a\" href=\"a.xhtml\" media-type=\"application/xhtml+xml\"/>"
            "<item id=\"b\" href=\"b.xhtml\" media-type=\"application/xhtml+xml\"/>"
            "<item id=\"pic\" href=\"images/pic.png\" media-type=\"image/png\"/>"
            "</manifest>"
            "<spine><itemref idref=\"a\"/><itemref idref=\"b\"/></spine>"
            "</package>";

        return {
            {"mimetype", "application/epub+zip"},
            {"META-INF/container.xml", container_xml()},
            {"OEBPS/content.opf", opf},
            {"OEBPS/a.xhtml", xhtml("<h1>Alpha</h1><p>First <a href=\"b.xhtml#end\">jump</a>.</p>"
                                    "<p><img src=\"images/pic.png\" alt=\"Pic\"/></p>")},
            {"OEBPS/b.xhtml", xhtml("<h1>Beta</h1><p id=\"end\">Last words.</p>")},
            {"OEBPS/images/pic.png", png_bytes(320, 240)},
        };
    }
};

// ==========================================
// Job failures
// ==========================================

TEST_F(ConversionPipelineTest, UnsupportedExtensionFailsWithArtifacts) {
    std::string input = (scratch->path() / "notes.txt").string();
    std::ofstream(input) << "plain text";

    ConversionPipeline pipeline(config());
    ConversionResult result = pipeline.run(input);

    EXPECT_EQ(result.status, JobStatus::FAILED);
    EXPECT_FALSE(result.ok());
    EXPECT_NE(result.failure_reason.find("Unsupported"), std::string::npos);
    EXPECT_TRUE(result.package_dir.empty());

    // The audit trail is written whatever the outcome
    EXPECT_TRUE(fs::exists(result.reference_mapping_path));
    EXPECT_TRUE(fs::exists(result.validation_report_path));
    ASSERT_TRUE(fs::exists(result.result_path));

    std::ifstream in(result.result_path);
    json j = json::parse(in);
    EXPECT_EQ(j["status"].get<std::string>(), "failed");
}

TEST_F(ConversionPipelineTest, MissingSourceIsExtractionFailure) {
    ConversionPipeline pipeline(config());
    ConversionResult result = pipeline.run((scratch->path() / "absent.epub").string());

    EXPECT_EQ(result.status, JobStatus::FAILED);
    EXPECT_NE(result.failure_reason.find("Extraction failed"), std::string::npos);
    EXPECT_EQ(result.statistics.source_format, "epub");
}

TEST_F(ConversionPipelineTest, CorruptEpubIsExtractionFailure) {
    std::string input = (scratch->path() / "broken.epub").string();
    std::ofstream(input) << "not a zip archive";

    ConversionPipeline pipeline(config());
    ConversionResult result = pipeline.run(input);

    EXPECT_EQ(result.status, JobStatus::FAILED);
    EXPECT_NE(result.failure_reason.find("Extraction failed"), std::string::npos);
    // No scratch directory survives the job
    for (const auto& entry : fs::directory_iterator(output_dir)) {
        EXPECT_EQ(entry.path().filename().string().rfind(".work-", 0), std::string::npos);
    }
}

TEST_F(ConversionPipelineTest, MissingDtdFailsPackaging) {
    ConversionConfig c = config();
    c.dtd_path = (scratch->path() / "nowhere.dtd").string();
    std::string input = write_epub("short.epub", two_chapter_entries());

    ConversionPipeline pipeline(c);
    ConversionResult result = pipeline.run(input);

    EXPECT_EQ(result.status, JobStatus::FAILED);
    EXPECT_NE(result.failure_reason.find("Packaging failed"), std::string::npos);
}

// ==========================================
// End to end
// ==========================================

TEST_F(ConversionPipelineTest, TwoChapterEpubConvertsCleanly) {
    std::string input = write_epub("short.epub", two_chapter_entries());

    ConversionPipeline pipeline(config());
    ConversionResult result = pipeline.run(input);

    ASSERT_EQ(result.status, JobStatus::SUCCESS) << result.failure_reason;
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_TRUE(result.validation.passed());
    EXPECT_EQ(result.book_id, "short");

    fs::path root(result.package_dir);
    EXPECT_TRUE(fs::exists(root / "Book.XML"));
    EXPECT_TRUE(fs::exists(root / "ch0001.xml"));
    EXPECT_TRUE(fs::exists(root / "ch0002.xml"));
    EXPECT_TRUE(fs::exists(root / "MultiMedia" / "Ch0001f01.png"));
    EXPECT_TRUE(fs::exists(result.archive_path));
    EXPECT_EQ(fs::path(result.archive_path).filename().string(), "short.zip");

    EXPECT_EQ(result.statistics.source_format, "epub");
    EXPECT_EQ(result.statistics.chapters, 2);
    EXPECT_EQ(result.statistics.images, 1);
    EXPECT_EQ(result.statistics.links, 1);
    EXPECT_EQ(result.statistics.broken_links, 0);

    std::ifstream in(result.reference_mapping_path);
    json mapping = json::parse(in);
    ASSERT_TRUE(mapping.contains("resources"));
    ASSERT_EQ(mapping["resources"].size(), 1u);
    EXPECT_EQ(mapping["resources"][0]["final_name"].get<std::string>(), "Ch0001f01.png");
}

TEST_F(ConversionPipelineTest, SampleEpubConvertsEverySpineDocument) {
    std::string input = write_epub("guide.epub", sample_epub_entries());

    ConversionPipeline pipeline(config());
    ConversionResult result = pipeline.run(input);

    ASSERT_EQ(result.status, JobStatus::SUCCESS) << result.failure_reason;
    EXPECT_EQ(result.book_id, "9780134685991");
    EXPECT_EQ(result.validation.files_checked.size(), 5u);
    EXPECT_EQ(result.statistics.images, 3);
    EXPECT_EQ(result.statistics.links, 2);
    EXPECT_EQ(result.statistics.broken_links, 0);
    EXPECT_EQ(fs::path(result.package_dir).filename().string(), "9780134685991");
}

TEST_F(ConversionPipelineTest, LinkOutsideSpineIsWarning) {
    ZipEntries entries = two_chapter_entries();
    for (auto& [name, data] : entries) {
        if (name == "OEBPS/b.xhtml") {
            data = xhtml("<h1>Beta</h1><p id=\"end\">See <a href=\"notes.xhtml#n1\">note</a>.</p>");
        }
    }
    std::string input = write_epub("short.epub", entries);

    ConversionPipeline pipeline(config());
    ConversionResult result = pipeline.run(input);

    ASSERT_EQ(result.status, JobStatus::SUCCESS_WITH_WARNINGS) << result.failure_reason;
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.statistics.broken_links, 1);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("Unresolved link: notes.xhtml#n1"), std::string::npos);
}

TEST_F(ConversionPipelineTest, ManifestListingOneImageTwiceRegistersItOnce) {
    ZipEntries entries = two_chapter_entries();
    for (auto& [name, data] : entries) {
        if (name == "OEBPS/content.opf") {
            std::string item = "<item id=\"pic\" href=\"images/pic.png\" media-type=\"image/png\"/>";
            data.replace(data.find(item), item.size(),
                         item + "<item id=\"pic-again\" href=\"images/pic.png\" media-type=\"image/png\"/>");
        }
    }
    std::string input = write_epub("twice.epub", entries);

    ConversionPipeline pipeline(config());
    ConversionResult result = pipeline.run(input);

    ASSERT_EQ(result.status, JobStatus::SUCCESS) << result.failure_reason;
    EXPECT_EQ(result.statistics.images, 1);
    EXPECT_TRUE(fs::exists(fs::path(result.package_dir) / "MultiMedia" / "Ch0001f01.png"));
}

TEST_F(ConversionPipelineTest, OversizedSvgDimensionsDoNotStopTheJob) {
    ZipEntries entries = two_chapter_entries();
    for (auto& [name, data] : entries) {
        if (name == "OEBPS/content.opf") {
            std::string manifest_end = "</manifest>";
            data.insert(data.find(manifest_end),
                        "<item id=\"chart\" href=\"images/chart.svg\" media-type=\"image/svg+xml\"/>");
        } else if (name == "OEBPS/b.xhtml") {
            data = xhtml("<h1>Beta</h1><p id=\"end\">Last words.</p>"
                         "<p><img src=\"images/chart.svg\" alt=\"Chart\"/></p>");
        }
    }
    entries.push_back({"OEBPS/images/chart.svg",
                       "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"99999999999\" height=\"10\"/>"});
    std::string input = write_epub("wide.epub", entries);

    ConversionPipeline pipeline(config());
    ConversionResult result = pipeline.run(input);

    ASSERT_EQ(result.status, JobStatus::SUCCESS) << result.failure_reason;
    EXPECT_EQ(result.statistics.images, 2);
    EXPECT_TRUE(fs::exists(result.reference_mapping_path));
}

TEST_F(ConversionPipelineTest, UnwritableOutputStillLeavesAuditTrail) {
    std::string blocker = (scratch->path() / "occupied").string();
    std::ofstream(blocker) << "a file where a directory should go";
    std::string input = write_epub("short.epub", two_chapter_entries());

    ConversionPipeline pipeline(config());
    std::vector<std::string> stages;
    pipeline.set_progress_callback([&stages](const std::string& stage, int, int,
                                             const std::string&) {
        stages.push_back(stage);
    });
    ConversionResult result = pipeline.run(input, blocker + "/out");

    EXPECT_EQ(result.status, JobStatus::FAILED);
    EXPECT_NE(result.failure_reason.find("Cannot create output directory"), std::string::npos);
    EXPECT_EQ(stages, std::vector<std::string>{"Failed"});
    ASSERT_TRUE(fs::exists(result.result_path));
    EXPECT_TRUE(fs::exists(result.reference_mapping_path));
    EXPECT_EQ(fs::path(result.result_path).parent_path().filename().string(), "rittdoc-short");

    std::error_code ec;
    fs::remove_all(fs::path(result.result_path).parent_path(), ec);
}

TEST_F(ConversionPipelineTest, ParallelRunMatchesSequential) {
    std::string input = write_epub("guide.epub", sample_epub_entries());

    ConversionConfig sequential = config();
    ConversionResult first = ConversionPipeline(sequential).run(input, output_dir + "/seq");

    ConversionConfig parallel = config();
    parallel.parallel_processing = true;
    ConversionResult second = ConversionPipeline(parallel).run(input, output_dir + "/par");

    EXPECT_EQ(first.status, second.status);
    EXPECT_EQ(first.validation.files_checked, second.validation.files_checked);

    for (const auto& file : first.validation.files_checked) {
        std::ifstream a(fs::path(first.package_dir) / file);
        std::ifstream b(fs::path(second.package_dir) / file);
        std::string text_a((std::istreambuf_iterator<char>(a)), std::istreambuf_iterator<char>());
        std::string text_b((std::istreambuf_iterator<char>(b)), std::istreambuf_iterator<char>());
        EXPECT_EQ(text_a, text_b) << file;
    }
}

TEST_F(ConversionPipelineTest, ProgressCallbackSeesEveryStage) {
    std::string input = write_epub("short.epub", two_chapter_entries());

    std::vector<std::string> stages;
    ConversionPipeline pipeline(config());
    pipeline.set_progress_callback([&stages](const std::string& stage, int current, int total,
                                             const std::string&) {
        EXPECT_LE(current, total);
        stages.push_back(stage);
    });
    pipeline.run(input);

    EXPECT_EQ(stages, (std::vector<std::string>{
        "Extracting", "Compliance", "Packaging", "References", "Validating"}));
}

// ==========================================
// Configuration
// ==========================================

TEST(ConversionConfigTest, DefaultsValidate) {
    ConversionConfig config;
    std::string error;
    EXPECT_TRUE(config.validate(error)) << error;
    EXPECT_EQ(config.chapter_failure_policy, "abort");
    EXPECT_EQ(config.grid_rows, 12);
    EXPECT_EQ(config.grid_columns, 2);
}

TEST(ConversionConfigTest, InvalidValuesRejected) {
    std::string error;

    ConversionConfig policy;
    policy.chapter_failure_policy = "skip";
    EXPECT_FALSE(policy.validate(error));
    EXPECT_NE(error.find("chapter_failure_policy"), std::string::npos);

    ConversionConfig grid;
    grid.grid_columns = 0;
    EXPECT_FALSE(grid.validate(error));

    ConversionConfig gap;
    gap.line_gap_multiplier = -1.0;
    EXPECT_FALSE(gap.validate(error));

    EXPECT_THROW(ConversionPipeline{policy}, std::invalid_argument);
}

TEST(ConversionConfigTest, JsonFileRoundTripKeepsOverrides) {
    ScratchDir scratch("config");
    std::string path = (scratch.path() / "rittdoc.json").string();

    ConversionConfig config;
    config.chapter_failure_policy = "exclude";
    config.grid_rows = 8;
    config.dtd_path = "/opt/dtd/RittDocBook.dtd";
    config.create_archive = false;
    config.detect_figures = false;
    config.to_json_file(path);

    ConversionConfig loaded = ConversionConfig::from_json_file(path);
    EXPECT_EQ(loaded.chapter_failure_policy, "exclude");
    EXPECT_EQ(loaded.grid_rows, 8);
    EXPECT_EQ(loaded.dtd_path, "/opt/dtd/RittDocBook.dtd");
    EXPECT_FALSE(loaded.create_archive);
    EXPECT_FALSE(loaded.detect_figures);
    EXPECT_DOUBLE_EQ(loaded.line_gap_multiplier, 2.0);
}

TEST(ConversionConfigTest, PartialFileKeepsDefaults) {
    ScratchDir scratch("config");
    std::string path = (scratch.path() / "partial.json").string();
    std::ofstream(path) << "{\"render_dpi\": 300}";

    ConversionConfig loaded = ConversionConfig::from_json_file(path);
    EXPECT_EQ(loaded.render_dpi, 300);
    EXPECT_EQ(loaded.output_directory, "Output");
}

TEST(ConversionConfigTest, UnreadableFileThrows) {
    ScratchDir scratch("config");
    EXPECT_THROW(ConversionConfig::from_json_file((scratch.path() / "none.json").string()),
                 std::runtime_error);

    std::string path = (scratch.path() / "bad.json").string();
    std::ofstream(path) << "{ not json";
    EXPECT_THROW(ConversionConfig::from_json_file(path), std::runtime_error);
}

TEST(ConversionConfigTest, EnvironmentOverrides) {
    setenv("RITTDOC_DTD_PATH", "/env/RittDocBook.dtd", 1);
    setenv("RITTDOC_OUTPUT_DIR", "/env/out", 1);
    setenv("RITTDOC_VERBOSE", "0", 1);

    ConversionConfig config = ConversionConfig::from_environment();
    EXPECT_EQ(config.dtd_path, "/env/RittDocBook.dtd");
    EXPECT_EQ(config.output_directory, "/env/out");
    EXPECT_FALSE(config.verbose);

    unsetenv("RITTDOC_DTD_PATH");
    unsetenv("RITTDOC_OUTPUT_DIR");
    unsetenv("RITTDOC_VERBOSE");

    ConversionConfig plain = ConversionConfig::from_environment();
    EXPECT_TRUE(plain.dtd_path.empty());
    EXPECT_TRUE(plain.verbose);
}
