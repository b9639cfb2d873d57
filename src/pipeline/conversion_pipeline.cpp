#include "pipeline/conversion_pipeline.hpp"
#include "common/errors.hpp"
#include "epub/epub_archive.hpp"
#include "epub/epub_structurer.hpp"
#include "package/packager.hpp"
#include "pdf/flow_builder.hpp"
#include "pdf/pdf_layout.hpp"
#include "pdf/pdf_structurer.hpp"
#include "pdf/reading_order.hpp"
#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace rd {

namespace {

double seconds_since(std::chrono::high_resolution_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::high_resolution_clock::now() - start).count();
}

/**
 * Scratch directory of one job, removed when the job ends.
 */
class WorkDirectory {
public:
    explicit WorkDirectory(const fs::path& path) : path_(path) {
        std::error_code ec;
        fs::remove_all(path_, ec);
        fs::create_directories(path_);
    }
    ~WorkDirectory() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    WorkDirectory(const WorkDirectory&) = delete;
    WorkDirectory& operator=(const WorkDirectory&) = delete;

    std::string str() const { return path_.string(); }
    std::string sub(const std::string& name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

} // namespace

// ============================================================================
// ConversionConfig
// ============================================================================

ConversionConfig ConversionConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }

    ConversionConfig config;

    // Heuristics
    if (j.contains("line_gap_multiplier")) config.line_gap_multiplier = j["line_gap_multiplier"];
    if (j.contains("font_size_tolerance")) config.font_size_tolerance = j["font_size_tolerance"];
    if (j.contains("title_gap_multiplier")) config.title_gap_multiplier = j["title_gap_multiplier"];
    if (j.contains("grid_rows")) config.grid_rows = j["grid_rows"];
    if (j.contains("grid_columns")) config.grid_columns = j["grid_columns"];
    if (j.contains("chapter_opening_blocks")) config.chapter_opening_blocks = j["chapter_opening_blocks"];
    if (j.contains("chapter_font_ratio")) config.chapter_font_ratio = j["chapter_font_ratio"];
    if (j.contains("render_dpi")) config.render_dpi = j["render_dpi"];
    if (j.contains("detect_figures")) config.detect_figures = j["detect_figures"];

    // Policy and schema
    if (j.contains("chapter_failure_policy")) config.chapter_failure_policy = j["chapter_failure_policy"];
    if (j.contains("dtd_path")) config.dtd_path = j["dtd_path"];

    // Processing and output
    if (j.contains("parallel_processing")) config.parallel_processing = j["parallel_processing"];
    if (j.contains("output_directory")) config.output_directory = j["output_directory"];
    if (j.contains("create_archive")) config.create_archive = j["create_archive"];
    if (j.contains("verbose")) config.verbose = j["verbose"];

    return config;
}

json ConversionConfig::to_json() const {
    json j;
    j["line_gap_multiplier"] = line_gap_multiplier;
    j["font_size_tolerance"] = font_size_tolerance;
    j["title_gap_multiplier"] = title_gap_multiplier;
    j["grid_rows"] = grid_rows;
    j["grid_columns"] = grid_columns;
    j["chapter_opening_blocks"] = chapter_opening_blocks;
    j["chapter_font_ratio"] = chapter_font_ratio;
    j["render_dpi"] = render_dpi;
    j["detect_figures"] = detect_figures;
    j["chapter_failure_policy"] = chapter_failure_policy;
    j["dtd_path"] = dtd_path;
    j["parallel_processing"] = parallel_processing;
    j["output_directory"] = output_directory;
    j["create_archive"] = create_archive;
    j["verbose"] = verbose;
    return j;
}

void ConversionConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write config file: " + path);
    }
    file << to_json().dump(2) << "\n";
}

void ConversionConfig::apply_environment() {
    const char* dtd = std::getenv("RITTDOC_DTD_PATH");
    if (dtd) dtd_path = dtd;

    const char* output_dir = std::getenv("RITTDOC_OUTPUT_DIR");
    if (output_dir) output_directory = output_dir;

    const char* verbose_env = std::getenv("RITTDOC_VERBOSE");
    if (verbose_env) {
        std::string value = verbose_env;
        verbose = !(value == "0" || value == "false" || value == "no" || value == "off");
    }
}

ConversionConfig ConversionConfig::from_environment() {
    ConversionConfig config;
    config.apply_environment();
    return config;
}

bool ConversionConfig::validate(std::string& error_message) const {
    if (line_gap_multiplier <= 0.0) {
        error_message = "line_gap_multiplier must be positive";
        return false;
    }
    if (title_gap_multiplier <= 0.0) {
        error_message = "title_gap_multiplier must be positive";
        return false;
    }
    if (chapter_font_ratio <= 0.0) {
        error_message = "chapter_font_ratio must be positive";
        return false;
    }
    if (font_size_tolerance < 0.0) {
        error_message = "font_size_tolerance must not be negative";
        return false;
    }
    if (grid_rows <= 0 || grid_columns <= 0) {
        error_message = "grid_rows and grid_columns must be positive";
        return false;
    }
    if (chapter_opening_blocks <= 0) {
        error_message = "chapter_opening_blocks must be positive";
        return false;
    }
    if (render_dpi <= 0) {
        error_message = "render_dpi must be positive";
        return false;
    }
    if (chapter_failure_policy != "abort" && chapter_failure_policy != "exclude") {
        error_message = "chapter_failure_policy must be 'abort' or 'exclude'";
        return false;
    }
    if (output_directory.empty()) {
        error_message = "output_directory must not be empty";
        return false;
    }
    return true;
}

// ============================================================================
// ConversionStatistics
// ============================================================================

void ConversionStatistics::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Conversion Summary\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "Source:\n";
    std::cout << "  Format: " << source_format << "\n";
    if (pages > 0) {
        std::cout << "  Pages: " << pages << "\n";
        std::cout << "  Paragraphs: " << paragraphs << "\n";
        std::cout << "  Running matter removed: " << running_matter_removed << "\n";
    }
    std::cout << "\n";

    std::cout << "Structure:\n";
    std::cout << "  Chapters: " << chapters << "\n";
    std::cout << "  Chapters excluded: " << chapters_excluded << "\n";
    std::cout << "  Compliance fixes: " << compliance_fixes << "\n\n";

    std::cout << "References:\n";
    std::cout << "  Images: " << images << " (low-confidence retained: "
              << low_confidence_images_retained << ")\n";
    std::cout << "  Links: " << links << " (broken: " << broken_links << ")\n";
    std::cout << "  Reference problems: " << reference_problems << "\n\n";

    std::cout << "Validation:\n";
    std::cout << "  Findings: " << validation_findings << "\n\n";

    std::cout << "Timing:\n";
    std::cout << "  Total time: " << total_time_seconds << " seconds\n";
    std::cout << "  Extraction: " << extraction_time_seconds << " seconds\n";
    std::cout << "  Compliance: " << compliance_time_seconds << " seconds\n";
    std::cout << "  Packaging: " << packaging_time_seconds << " seconds\n";
    std::cout << "  Validation: " << validation_time_seconds << " seconds\n";

    std::cout << "\n" << std::string(70, '=') << "\n\n";
}

json ConversionStatistics::to_json() const {
    json j;
    j["source_format"] = source_format;
    j["pages"] = pages;
    j["running_matter_removed"] = running_matter_removed;
    j["paragraphs"] = paragraphs;
    j["chapters"] = chapters;
    j["chapters_excluded"] = chapters_excluded;
    j["compliance_fixes"] = compliance_fixes;
    j["images"] = images;
    j["low_confidence_images_retained"] = low_confidence_images_retained;
    j["links"] = links;
    j["broken_links"] = broken_links;
    j["reference_problems"] = reference_problems;
    j["validation_findings"] = validation_findings;

    j["extraction_time_seconds"] = extraction_time_seconds;
    j["compliance_time_seconds"] = compliance_time_seconds;
    j["packaging_time_seconds"] = packaging_time_seconds;
    j["validation_time_seconds"] = validation_time_seconds;
    j["total_time_seconds"] = total_time_seconds;
    return j;
}

json ConversionResult::to_json() const {
    json j;
    j["status"] = job_status_to_string(status);
    j["failure_reason"] = failure_reason;
    j["source_path"] = source_path;
    j["book_id"] = book_id;
    j["package_dir"] = package_dir;
    j["archive_path"] = archive_path;
    j["reference_mapping_path"] = reference_mapping_path;
    j["validation_report_path"] = validation_report_path;
    j["excluded_chapters"] = excluded_chapters;
    j["warnings"] = warnings;
    j["validation_passed"] = validation.passed();
    j["validation_findings"] = validation.findings.size();
    j["statistics"] = statistics.to_json();
    return j;
}

// ============================================================================
// ConversionPipeline
// ============================================================================

ConversionPipeline::ConversionPipeline(const ConversionConfig& config)
    : config_(config) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("Invalid configuration: " + error);
    }
}

void ConversionPipeline::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = std::move(callback);
}

void ConversionPipeline::report_progress(const std::string& stage, int current, int total,
                                         const std::string& message) {
    if (progress_callback_) {
        progress_callback_(stage, current, total, message);
    } else if (config_.verbose) {
        std::cout << "[" << stage << "] " << current << "/" << total;
        if (!message.empty()) {
            std::cout << " - " << message;
        }
        std::cout << std::endl;
    }
}

ConversionResult ConversionPipeline::run(const std::string& input_path,
                                         const std::string& output_dir_arg) {
    auto start_time = std::chrono::high_resolution_clock::now();
    std::string output_dir = output_dir_arg.empty() ? config_.output_directory : output_dir_arg;

    ConversionResult result;
    result.source_path = input_path;
    result.book_id = make_book_id(input_path, "");

    ReferenceMapper mapper;
    mapper.set_verbose(config_.verbose);

    const int total_stages = 5;
    std::error_code dir_ec;
    fs::create_directories(output_dir, dir_ec);
    if (dir_ec) {
        result.failure_reason = "Cannot create output directory " + output_dir + ": " +
                                dir_ec.message();
        report_progress("Failed", 0, total_stages, result.failure_reason);
        // The audit trail moves to the temp directory; without one it is lost
        fs::path fallback = fs::temp_directory_path(dir_ec) / ("rittdoc-" + result.book_id);
        if (!dir_ec) {
            fs::create_directories(fallback, dir_ec);
        }
        if (dir_ec) {
            result.warnings.push_back("No writable directory for audit artifacts");
        } else {
            result.warnings.push_back("Audit artifacts written to " + fallback.string());
            write_artifacts(result, mapper, fallback.string());
        }
        if (config_.verbose) {
            std::cerr << "Job " << result.book_id << ": " << result.failure_reason << std::endl;
        }
        return result;
    }

    try {
        // Stage 1: extraction and structuring
        report_progress("Extracting", 1, total_stages, input_path);
        SourceFormat format = detect_source_format(input_path);
        result.statistics.source_format = source_format_to_string(format);
        if (!fs::is_regular_file(input_path)) {
            throw ExtractionError("Source file not found: " + input_path);
        }

        WorkDirectory work(fs::path(output_dir) / (".work-" + result.book_id));
        auto stage_start = std::chrono::high_resolution_clock::now();
        StructuredDocument doc = format == SourceFormat::PDF
            ? extract_pdf(input_path, work.str(), mapper, result.statistics)
            : extract_epub(input_path, work.str(), mapper);
        result.book_id = doc.book_id;
        result.statistics.extraction_time_seconds = seconds_since(stage_start);

        // Stage 2: compliance
        report_progress("Compliance", 2, total_stages,
                        std::to_string(doc.chapters.size()) + " chapters");
        stage_start = std::chrono::high_resolution_clock::now();
        std::vector<ValidationFinding> exclusion_findings = apply_compliance(doc, mapper, result);
        result.statistics.chapters = static_cast<int>(doc.chapters.size());
        result.statistics.compliance_time_seconds = seconds_since(stage_start);

        // Stage 3: packaging
        report_progress("Packaging", 3, total_stages, doc.book_id);
        stage_start = std::chrono::high_resolution_clock::now();
        PackagerOptions options;
        options.dtd_path = config_.dtd_path;
        options.create_archive = config_.create_archive;
        Packager packager(mapper, options);
        packager.set_verbose(config_.verbose);
        PackageResult package = packager.package(doc, work.sub("media"), output_dir);
        result.package_dir = package.package_dir;
        result.archive_path = package.archive_path;
        result.statistics.low_confidence_images_retained =
            static_cast<int>(package.low_confidence_retained);
        result.statistics.packaging_time_seconds = seconds_since(stage_start);

        // Stage 4: reference resolution, advisory
        report_progress("References", 4, total_stages);
        auto [references_ok, problems] = mapper.validate(package.package_dir);
        result.warnings = problems;
        if (!references_ok && config_.verbose) {
            std::cerr << "Reference problems: " << problems.size() << std::endl;
            for (const auto& problem : problems) {
                std::cerr << "  " << problem << std::endl;
            }
        }

        // Stage 5: DTD validation of the package
        report_progress("Validating", 5, total_stages, package.package_dir);
        stage_start = std::chrono::high_resolution_clock::now();
        EntityTrackingValidator validator(config_.dtd_path);
        validator.set_parallel(config_.parallel_processing);
        validator.set_verbose(config_.verbose);
        result.validation = validator.validate_package(package.package_dir);
        result.validation.findings.insert(result.validation.findings.begin(),
                                          exclusion_findings.begin(), exclusion_findings.end());
        result.statistics.validation_time_seconds = seconds_since(stage_start);

        if (!result.validation.passed()) {
            result.status = JobStatus::FAILED;
            result.failure_reason = "DTD validation failed with " +
                std::to_string(result.validation.findings.size()) + " finding(s)";
        } else if (!problems.empty()) {
            result.status = JobStatus::SUCCESS_WITH_WARNINGS;
        } else {
            result.status = JobStatus::SUCCESS;
        }
    } catch (const UnsupportedFormatError& e) {
        result.failure_reason = std::string("Unsupported format: ") + e.what();
    } catch (const ExtractionError& e) {
        result.failure_reason = std::string("Extraction failed: ") + e.what();
    } catch (const ComplianceError& e) {
        result.failure_reason = std::string("Compliance failed in ") + e.chapter_id() + ": " + e.what();
    } catch (const ValidatorUnavailableError& e) {
        result.failure_reason = std::string("Validator unavailable: ") + e.what();
    } catch (const PackagingError& e) {
        result.failure_reason = std::string("Packaging failed: ") + e.what();
    } catch (const fs::filesystem_error& e) {
        result.failure_reason = std::string("File system error: ") + e.what();
    } catch (const std::exception& e) {
        result.failure_reason = std::string("Unexpected error: ") + e.what();
    }

    auto stats = mapper.statistics();
    result.statistics.images = static_cast<int>(stats.total_images);
    result.statistics.links = static_cast<int>(stats.total_links);
    result.statistics.broken_links = static_cast<int>(stats.broken_links);
    result.statistics.reference_problems = static_cast<int>(result.warnings.size());
    result.statistics.validation_findings = static_cast<int>(result.validation.findings.size());
    result.statistics.total_time_seconds = seconds_since(start_time);

    write_artifacts(result, mapper, output_dir);

    if (config_.verbose) {
        std::cout << "Job " << result.book_id << ": " << job_status_to_string(result.status);
        if (!result.failure_reason.empty()) {
            std::cout << " (" << result.failure_reason << ")";
        }
        std::cout << std::endl;
    }
    return result;
}

StructuredDocument ConversionPipeline::extract_pdf(const std::string& input_path,
                                                   const std::string& work_dir,
                                                   ReferenceMapper& mapper,
                                                   ConversionStatistics& stats) {
    if (!PDFLayoutExtractor::is_available()) {
        throw ExtractionError("PDF input needs poppler support, not built in: " + input_path);
    }
    PDFLayoutExtractor extractor;
    extractor.set_verbose(config_.verbose);
    extractor.set_render_dpi(config_.render_dpi);
    extractor.set_detect_figures(config_.detect_figures);
    PDFLayout layout = extractor.load_layout(input_path, (fs::path(work_dir) / "pages").string());
    stats.pages = static_cast<int>(layout.pages.size());

    // Reading order, one independent unit per page
    ReadingOrderConfig order_config;
    order_config.grid_rows = config_.grid_rows;
    order_config.grid_columns = config_.grid_columns;
    ReadingOrderReconstructor reconstructor(order_config);

    if (config_.parallel_processing) {
        std::vector<std::future<std::vector<TextRun>>> futures;
        for (const auto& page : layout.pages) {
            futures.push_back(std::async(std::launch::async, [&reconstructor, &page]() {
                return reconstructor.order_page(page);
            }));
        }
        for (size_t i = 0; i < futures.size(); ++i) {
            layout.pages[i].runs = futures[i].get();
        }
    } else {
        for (auto& page : layout.pages) {
            page.runs = reconstructor.order_page(page);
        }
    }

    FlowConfig flow_config;
    flow_config.line_gap_multiplier = config_.line_gap_multiplier;
    flow_config.font_size_tolerance = config_.font_size_tolerance;
    FlowBuilder flow(flow_config);
    flow.set_verbose(config_.verbose);
    stats.running_matter_removed = static_cast<int>(flow.remove_running_matter(layout.pages));

    std::vector<Paragraph> paragraphs = flow.build(layout.pages);
    double body_size = FlowBuilder::body_font_size(paragraphs);
    flow.assign_roles(paragraphs, body_size);
    stats.paragraphs = static_cast<int>(paragraphs.size());

    PdfStructureConfig structure;
    structure.chapter_font_ratio = config_.chapter_font_ratio;
    structure.font_size_tolerance = config_.font_size_tolerance;
    structure.title.font_size_tolerance = config_.font_size_tolerance;
    structure.title.gap_multiplier = config_.title_gap_multiplier;
    structure.title.opening_blocks = static_cast<size_t>(config_.chapter_opening_blocks);

    PdfStructuralProcessor processor(mapper, structure);
    processor.set_verbose(config_.verbose);
    return processor.process(layout, paragraphs, body_size, (fs::path(work_dir) / "media").string());
}

StructuredDocument ConversionPipeline::extract_epub(const std::string& input_path,
                                                    const std::string& work_dir,
                                                    ReferenceMapper& mapper) {
    EpubArchive archive(input_path);
    EpubStructuralProcessor processor(mapper);
    processor.set_verbose(config_.verbose);
    return processor.process(archive, (fs::path(work_dir) / "media").string());
}

std::vector<ValidationFinding> ConversionPipeline::apply_compliance(StructuredDocument& doc,
                                                                    ReferenceMapper& mapper,
                                                                    ConversionResult& result) {
    ComplianceTransformer transformer;
    transformer.set_verbose(config_.verbose);
    transformer.apply_metadata_defaults(doc.metadata);
    if (doc.book_id.empty()) {
        doc.book_id = make_book_id(doc.source_path, doc.metadata.isbn);
    }

    // Chapters are independent trees; failures are collected per chapter
    std::vector<std::exception_ptr> failures(doc.chapters.size());
    std::vector<ComplianceReport> reports(doc.chapters.size());
    auto transform_one = [&](size_t i) {
        try {
            reports[i] = transformer.transform_chapter(doc.chapters[i]);
        } catch (const ComplianceError&) {
            failures[i] = std::current_exception();
        }
    };

    if (config_.parallel_processing) {
        std::vector<std::future<void>> futures;
        for (size_t i = 0; i < doc.chapters.size(); ++i) {
            futures.push_back(std::async(std::launch::async, transform_one, i));
        }
        for (auto& f : futures) f.get();
    } else {
        for (size_t i = 0; i < doc.chapters.size(); ++i) {
            transform_one(i);
            if (failures[i] && config_.chapter_failure_policy == "abort") break;
        }
    }

    std::vector<ValidationFinding> findings;
    std::vector<std::string> to_remove;
    for (size_t i = 0; i < doc.chapters.size(); ++i) {
        result.statistics.compliance_fixes += static_cast<int>(reports[i].fixes.size());
        if (!failures[i]) continue;

        if (config_.chapter_failure_policy == "abort") {
            std::rethrow_exception(failures[i]);
        }
        try {
            std::rethrow_exception(failures[i]);
        } catch (const ComplianceError& e) {
            ValidationFinding finding;
            finding.file = doc.chapters[i].file_name();
            finding.category = FindingCategory::COMPLIANCE_FAILURE;
            finding.description = "Chapter excluded: " + std::string(e.what());
            findings.push_back(finding);
            to_remove.push_back(e.chapter_id());
            if (config_.verbose) {
                std::cerr << "Excluding chapter " << e.chapter_id() << ": " << e.what() << std::endl;
            }
        }
    }

    for (const auto& chapter_id : to_remove) {
        mapper.retract_chapter(chapter_id);
        doc.remove_chapter(chapter_id);
        result.excluded_chapters.push_back(chapter_id);
    }
    result.statistics.chapters_excluded = static_cast<int>(to_remove.size());
    return findings;
}

void ConversionPipeline::write_artifacts(ConversionResult& result, const ReferenceMapper& mapper,
                                         const std::string& output_dir) const {
    fs::path dir(output_dir);
    result.reference_mapping_path = (dir / (result.book_id + "_reference_mapping.json")).string();
    result.validation_report_path = (dir / (result.book_id + "_validation_report.json")).string();
    result.result_path = (dir / (result.book_id + "_conversion_result.json")).string();

    try {
        mapper.export_to_json(result.reference_mapping_path);
        result.validation.save(result.validation_report_path);

        std::ofstream out(result.result_path);
        if (!out.is_open()) {
            throw std::runtime_error("Cannot write " + result.result_path);
        }
        out << result.to_json().dump(2) << "\n";
    } catch (const std::exception& e) {
        // The job outcome stands; the caller learns the audit trail is incomplete
        result.warnings.push_back(std::string("Audit artifact not written: ") + e.what());
        if (config_.verbose) {
            std::cerr << "Warning: " << e.what() << std::endl;
        }
    }
}

// ============================================================================
// Utility Functions
// ============================================================================

ConversionConfig load_config_with_fallback(const std::string& config_path) {
    std::vector<std::string> paths_to_try;
    if (!config_path.empty()) {
        paths_to_try.push_back(config_path);
    }
    paths_to_try.push_back("rittdoc.json");
    paths_to_try.push_back(".rittdoc.json");

    for (const auto& path : paths_to_try) {
        if (fs::is_regular_file(path)) {
            ConversionConfig config = ConversionConfig::from_json_file(path);
            config.apply_environment();
            return config;
        }
    }
    if (!config_path.empty()) {
        throw std::runtime_error("Config file not found: " + config_path);
    }
    return ConversionConfig::from_environment();
}

} // namespace rd
