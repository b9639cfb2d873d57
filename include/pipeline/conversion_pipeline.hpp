#pragma once

#include "compliance/dtd_compliance.hpp"
#include "mapping/reference_mapper.hpp"
#include "model/structured_document.hpp"
#include "validation/dtd_validator.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <vector>

namespace rd {

// ============================================================================
// Pipeline Configuration
// ============================================================================

/**
 * @brief Configuration for one conversion job
 */
struct ConversionConfig {
    // Flow and title heuristics
    double line_gap_multiplier = 2.0;       ///< Paragraph merge threshold x typical line height
    double font_size_tolerance = 1.0;       ///< +/- points for title merge and font clustering
    double title_gap_multiplier = 2.0;      ///< Title merge gap threshold x anchor font size
    int grid_rows = 12;                     ///< Reading-order grid row bands
    int grid_columns = 2;                   ///< Most columns a PDF page is split into
    int chapter_opening_blocks = 6;         ///< Paragraphs searched for a chapter title
    double chapter_font_ratio = 1.4;        ///< PDF chapter heading if font >= ratio x body size
    int render_dpi = 150;                   ///< DPI for rendered PDF pages and figures
    bool detect_figures = true;             ///< Cut drawn figures out of PDF text pages

    // Policy
    std::string chapter_failure_policy = "abort";  ///< "abort" or "exclude"

    // Schema
    std::string dtd_path;                   ///< Empty = bundled RITTDOCdtd/v1.1/RittDocBook.dtd

    // Processing
    bool parallel_processing = false;       ///< Per-page / per-chapter work via std::async

    // Output
    std::string output_directory = "Output";
    bool create_archive = true;             ///< Write <book_id>.zip beside the package
    bool verbose = true;

    /**
     * @brief Load configuration from JSON file
     *
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static ConversionConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Defaults overridden by RITTDOC_DTD_PATH, RITTDOC_OUTPUT_DIR, RITTDOC_VERBOSE
     */
    static ConversionConfig from_environment();

    /**
     * @brief Apply the environment overrides on top of this configuration
     */
    void apply_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;

    nlohmann::json to_json() const;
};

// ============================================================================
// Statistics and Result
// ============================================================================

struct ConversionStatistics {
    std::string source_format;
    int pages = 0;
    int running_matter_removed = 0;
    int paragraphs = 0;
    int chapters = 0;
    int chapters_excluded = 0;
    int compliance_fixes = 0;
    int images = 0;
    int low_confidence_images_retained = 0;
    int links = 0;
    int broken_links = 0;
    int reference_problems = 0;
    int validation_findings = 0;

    double extraction_time_seconds = 0.0;
    double compliance_time_seconds = 0.0;
    double packaging_time_seconds = 0.0;
    double validation_time_seconds = 0.0;
    double total_time_seconds = 0.0;

    void print_summary() const;
    nlohmann::json to_json() const;
};

enum class JobStatus {
    SUCCESS,
    SUCCESS_WITH_WARNINGS,
    FAILED
};

inline std::string job_status_to_string(JobStatus status) {
    switch (status) {
        case JobStatus::SUCCESS: return "success";
        case JobStatus::SUCCESS_WITH_WARNINGS: return "success_with_warnings";
        case JobStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Outcome of one job as reported to the caller
 */
struct ConversionResult {
    JobStatus status = JobStatus::FAILED;
    std::string failure_reason;
    std::string source_path;
    std::string book_id;
    std::string package_dir;
    std::string archive_path;
    std::string reference_mapping_path;
    std::string validation_report_path;
    std::string result_path;
    std::vector<std::string> excluded_chapters;
    std::vector<std::string> warnings;       ///< Reference problems, non-fatal
    ValidationReport validation;
    ConversionStatistics statistics;

    bool ok() const { return status != JobStatus::FAILED; }

    nlohmann::json to_json() const;
};

/**
 * @brief Progress callback function type
 */
using ProgressCallback = std::function<void(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
)>;

// ============================================================================
// Conversion Pipeline
// ============================================================================

/**
 * @brief End-to-end conversion of one PDF or EPUB into a RittDoc package
 *
 * Stages run in order, each on the complete output of the previous one:
 * extraction and structuring, DTD-compliance transformation, packaging,
 * reference validation and per-chapter DTD validation. A fresh reference
 * mapper is owned by each run() call.
 */
class ConversionPipeline {
public:
    /**
     * @throws std::invalid_argument if the configuration does not validate
     */
    explicit ConversionPipeline(const ConversionConfig& config);

    /**
     * @brief Convert one source file
     *
     * Job-level failures are reported in the result, not thrown. The audit
     * artifacts are written to the output directory whatever the outcome.
     *
     * @param input_path PDF or EPUB file
     * @param output_dir Output directory; empty = config output_directory
     */
    ConversionResult run(const std::string& input_path, const std::string& output_dir = "");

    void set_progress_callback(ProgressCallback callback);

private:
    StructuredDocument extract_pdf(const std::string& input_path, const std::string& work_dir,
                                   ReferenceMapper& mapper, ConversionStatistics& stats);
    StructuredDocument extract_epub(const std::string& input_path, const std::string& work_dir,
                                    ReferenceMapper& mapper);

    /**
     * @brief Transform every chapter; excluded chapters come back as findings
     *
     * @throws ComplianceError under the "abort" policy
     */
    std::vector<ValidationFinding> apply_compliance(StructuredDocument& doc,
                                                    ReferenceMapper& mapper,
                                                    ConversionResult& result);

    void write_artifacts(ConversionResult& result, const ReferenceMapper& mapper,
                         const std::string& output_dir) const;

    void report_progress(const std::string& stage, int current, int total,
                         const std::string& message = "");

    ConversionConfig config_;
    ProgressCallback progress_callback_;
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Load configuration from file with fallback to environment
 */
ConversionConfig load_config_with_fallback(const std::string& config_path = "");

} // namespace rd
