#include "pipeline/conversion_pipeline.hpp"
#include <filesystem>
#include <iostream>
#include <iomanip>

using namespace rd;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

// Progress callback function
void progress_handler(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
) {
    std::cout << "[" << stage << "] ";
    if (total > 0) {
        std::cout << current << "/" << total << " ";
        int percent = (current * 100) / total;
        std::cout << "(" << percent << "%) ";
    }
    if (!message.empty()) {
        std::cout << "- " << message;
    }
    std::cout << std::endl;
}

int main(int argc, char* argv[]) {
    print_separator("PDF / EPUB to RittDoc Conversion");

    std::cout << "This example demonstrates the complete pipeline:\n";
    std::cout << "  Source → Structured Chapters → DTD Compliance → Package → Validation\n\n";

    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <book.pdf|book.epub> [--config <config.json>]\n";
        return 1;
    }
    std::string input_path = argv[1];

    // =========================================================================
    // Configuration
    // =========================================================================

    print_separator("Step 1: Configuration");

    ConversionConfig config;
    try {
        if (argc > 3 && std::string(argv[2]) == "--config") {
            std::cout << "Loading configuration from: " << argv[3] << "\n";
            config = ConversionConfig::from_json_file(argv[3]);
            config.apply_environment();
        } else {
            std::cout << "Loading configuration from rittdoc.json or environment...\n";
            config = load_config_with_fallback("");
        }
    } catch (const std::runtime_error& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    std::string error;
    if (!config.validate(error)) {
        std::cerr << "Configuration error: " << error << "\n\n";
        ConversionConfig().to_json_file("example_rittdoc_config.json");
        std::cout << "✓ Saved default config to: example_rittdoc_config.json\n";
        std::cout << "  Edit this file and run: " << argv[0] << " " << input_path
                  << " --config example_rittdoc_config.json\n\n";
        return 1;
    }

    config.verbose = false;  // the progress handler does the talking

    std::cout << "✓ Configuration validated\n";
    std::cout << "  Failure policy: " << config.chapter_failure_policy << "\n";
    std::cout << "  Reading grid: " << config.grid_rows << "x" << config.grid_columns << "\n";
    std::cout << "  DTD: " << (config.dtd_path.empty() ? "(bundled)" : config.dtd_path) << "\n";
    std::cout << "  Output: " << config.output_directory << "\n\n";

    // =========================================================================
    // Run
    // =========================================================================

    print_separator("Step 2: Convert");

    ConversionPipeline pipeline(config);
    pipeline.set_progress_callback(progress_handler);
    ConversionResult result = pipeline.run(input_path);

    // =========================================================================
    // Results
    // =========================================================================

    print_separator("Step 3: Results");

    result.statistics.print_summary();

    std::cout << "Status: " << job_status_to_string(result.status) << "\n";
    if (!result.failure_reason.empty()) {
        std::cout << "Reason: " << result.failure_reason << "\n";
    }
    if (!result.excluded_chapters.empty()) {
        std::cout << "Excluded chapters:";
        for (const auto& id : result.excluded_chapters) {
            std::cout << " " << id;
        }
        std::cout << "\n";
    }
    std::cout << "\n";

    if (!result.validation.findings.empty()) {
        std::cout << "First findings:\n";
        size_t shown = 0;
        for (const auto& finding : result.validation.findings) {
            if (shown++ == 10) break;
            std::cout << "  " << std::left << std::setw(14) << finding.file
                      << std::setw(6) << finding.line
                      << finding_category_to_string(finding.category) << ": "
                      << finding.description << "\n";
        }
        std::cout << "\n";
    }

    std::cout << "Output files:\n";
    if (!result.package_dir.empty()) {
        std::cout << "  - " << result.package_dir << "/ (Book.XML, chapters, MultiMedia/)\n";
    }
    if (!result.archive_path.empty()) {
        std::cout << "  - " << result.archive_path << "\n";
    }
    std::cout << "  - " << result.reference_mapping_path << "\n";
    std::cout << "  - " << result.validation_report_path << "\n";
    std::cout << "  - " << result.result_path << "\n";

    print_separator("End of Conversion Example");

    return result.ok() ? 0 : 1;
}
