#include "cli/cli.hpp"
#include "common/errors.hpp"
#include "pipeline/conversion_pipeline.hpp"
#include "validation/dtd_validator.hpp"
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

using namespace rd;

namespace {

std::string format_duration(std::chrono::steady_clock::duration d) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    std::stringstream ss;
    if (ms >= 1000) {
        ss << std::fixed << std::setprecision(2) << (ms / 1000.0) << "s";
    } else {
        ss << ms << "ms";
    }
    return ss.str();
}

} // namespace

// ============== rittdoc convert ==============
ExitCode cmd_convert(const Args& args) {
    std::string input_path = args.require("input");

    ConversionConfig config = load_config_with_fallback(args.get("config").value);
    if (args.has("output")) config.output_directory = args.get("output").value;
    if (args.has("dtd")) config.dtd_path = args.get("dtd").value;
    if (args.has("exclude-failed")) config.chapter_failure_policy = "exclude";
    if (args.has("parallel")) config.parallel_processing = true;
    if (args.has("quiet")) config.verbose = false;

    auto start = std::chrono::steady_clock::now();
    ConversionPipeline pipeline(config);
    ConversionResult result = pipeline.run(input_path, config.output_directory);

    if (config.verbose) {
        result.statistics.print_summary();
        if (!result.validation.findings.empty()) {
            result.validation.print_summary();
        }
    }

    std::cout << "Status:       " << job_status_to_string(result.status) << "\n";
    if (!result.failure_reason.empty()) {
        std::cout << "Reason:       " << result.failure_reason << "\n";
    }
    if (!result.archive_path.empty()) {
        std::cout << "Archive:      " << result.archive_path << "\n";
    }
    if (!result.package_dir.empty()) {
        std::cout << "Package:      " << result.package_dir << "\n";
    }
    std::cout << "Mapping:      " << result.reference_mapping_path << "\n";
    std::cout << "Validation:   " << result.validation_report_path << "\n";
    for (const auto& chapter : result.excluded_chapters) {
        std::cout << "Excluded:     " << chapter << "\n";
    }
    std::cout << "Time:         " << format_duration(std::chrono::steady_clock::now() - start) << "\n";

    switch (result.status) {
        case JobStatus::SUCCESS: return ExitCode::OK;
        case JobStatus::SUCCESS_WITH_WARNINGS: return ExitCode::WARNINGS;
        default: return ExitCode::FAILED;
    }
}

// ============== rittdoc validate ==============
ExitCode cmd_validate(const Args& args) {
    std::string package_path = args.require("package");
    std::string dtd_path = args.get("dtd").value;

    EntityTrackingValidator validator(dtd_path);
    validator.set_parallel(args.has("parallel"));
    validator.set_verbose(!args.has("quiet"));

    std::cout << "Validating package: " << package_path << "\n";
    ValidationReport report = validator.validate_package(package_path);
    report.print_summary();

    if (args.has("report")) {
        std::string report_path = args.get("report").value;
        report.save(report_path);
        std::cout << "Report saved: " << report_path << "\n";
    }
    return report.passed() ? ExitCode::OK : ExitCode::FAILED;
}

// ============== rittdoc init-config ==============
ExitCode cmd_init_config(const Args& args) {
    std::string output_path = args.require("output");
    if (fs::exists(output_path) && !args.has("force")) {
        std::cerr << "Refusing to overwrite " << output_path << " (use --force)\n";
        return ExitCode::FAILED;
    }
    ConversionConfig config;
    config.to_json_file(output_path);
    std::cout << "Default configuration written to " << output_path << "\n";
    return ExitCode::OK;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CommandLine cli("rittdoc", "1.0.0");

    cli.add({
        "convert",
        "Convert a PDF or EPUB into a validated RittDoc package",
        "input",
        {
            {"input", "i", "Source file (.pdf, .epub)", "", "", true, false},
            {"output", "o", "Output directory", "", "RITTDOC_OUTPUT_DIR", false, false},
            {"dtd", "d", "RittDoc DTD to bundle and validate against", "", "RITTDOC_DTD_PATH", false, false},
            {"config", "c", "JSON configuration file", "", "", false, false},
            {"exclude-failed", "x", "Exclude chapters that cannot be made compliant instead of aborting", "", "", false, true},
            {"parallel", "p", "Process pages and chapters in parallel", "", "", false, true},
            {"quiet", "q", "Only print the final summary", "", "", false, true}
        },
        cmd_convert
    });

    cli.add({
        "validate",
        "Validate an existing package directory or zip against the DTD",
        "package",
        {
            {"package", "k", "Package directory or .zip", "", "", true, false},
            {"dtd", "d", "DTD path (default: the one bundled in the package)", "", "RITTDOC_DTD_PATH", false, false},
            {"report", "r", "Write the validation report as JSON", "", "", false, false},
            {"parallel", "p", "Validate chapters in parallel", "", "", false, true},
            {"quiet", "q", "Less output", "", "", false, true}
        },
        cmd_validate
    });

    cli.add({
        "init-config",
        "Write a default configuration file",
        "",
        {
            {"output", "o", "Configuration file to write", "rittdoc.json", "", false, false},
            {"force", "f", "Overwrite an existing file", "", "", false, true}
        },
        cmd_init_config
    });

    return cli.run(argc, argv);
}
