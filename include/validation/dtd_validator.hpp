#pragma once

#include <nlohmann/json.hpp>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace rd {

// ============================================================================
// Findings
// ============================================================================

enum class FindingCategory {
    INVALID_CONTENT_MODEL,
    UNDECLARED_ELEMENT,
    MISSING_REQUIRED_ATTRIBUTE,
    MISSING_REQUIRED_CHILD,
    INVALID_ATTRIBUTE_VALUE,
    MISSING_FILE,
    COMPLIANCE_FAILURE,
    XML_SYNTAX
};

inline std::string finding_category_to_string(FindingCategory category) {
    switch (category) {
        case FindingCategory::INVALID_CONTENT_MODEL: return "invalid_content_model";
        case FindingCategory::UNDECLARED_ELEMENT: return "undeclared_element";
        case FindingCategory::MISSING_REQUIRED_ATTRIBUTE: return "missing_required_attribute";
        case FindingCategory::MISSING_REQUIRED_CHILD: return "missing_required_child";
        case FindingCategory::INVALID_ATTRIBUTE_VALUE: return "invalid_attribute_value";
        case FindingCategory::MISSING_FILE: return "missing_file";
        case FindingCategory::COMPLIANCE_FAILURE: return "compliance_failure";
        case FindingCategory::XML_SYNTAX: return "xml_syntax";
        default: return "unknown";
    }
}

enum class FindingSeverity {
    ERROR,
    WARNING
};

inline std::string finding_severity_to_string(FindingSeverity severity) {
    return severity == FindingSeverity::ERROR ? "error" : "warning";
}

/**
 * @brief One violation, located in the chapter file that contains it
 */
struct ValidationFinding {
    std::string file;                 ///< Chapter file name, e.g. "ch0007.xml"
    int line = 0;                     ///< 1-based line in that file, 0 if not applicable
    FindingCategory category = FindingCategory::INVALID_CONTENT_MODEL;
    std::string description;
    FindingSeverity severity = FindingSeverity::ERROR;

    nlohmann::json to_json() const;
};

/**
 * @brief Aggregate result: passes only when there are no findings
 */
struct ValidationReport {
    std::string dtd_path;
    std::vector<std::string> files_checked;
    std::vector<ValidationFinding> findings;

    bool passed() const { return findings.empty(); }

    nlohmann::json to_json() const;

    /**
     * @brief Write to_json() to a file
     *
     * @throws std::runtime_error if the file cannot be written
     */
    void save(const std::string& path) const;

    void print_summary() const;
};

// ============================================================================
// Validator
// ============================================================================

/**
 * @brief Validates chapter files of a package one by one against the DTD
 *
 * Each chapter file is parsed and validated on its own so that line numbers
 * point into that file. Chapter files are found through the external
 * entities declared in Book.XML. References to ids defined in another
 * chapter of the same package are not reported as dangling.
 */
class EntityTrackingValidator {
public:
    /**
     * @param dtd_path Explicit DTD; empty to use the one bundled in the package
     * @throws ValidatorUnavailableError if DTD validation is not compiled in
     */
    explicit EntityTrackingValidator(const std::string& dtd_path = "");
    ~EntityTrackingValidator();

    EntityTrackingValidator(const EntityTrackingValidator&) = delete;
    EntityTrackingValidator& operator=(const EntityTrackingValidator&) = delete;

    /**
     * @brief True if the XML library was built with DTD validation
     */
    static bool is_available();

    /**
     * @brief DTD used for a package: the explicit one, else the bundled one
     *
     * @throws ValidatorUnavailableError if neither exists
     */
    std::string resolve_dtd(const std::string& package_root) const;

    /**
     * @brief Validate one chapter file
     *
     * @param path Chapter XML file
     * @param known_ids Ids defined elsewhere in the package; IDREFs to them are fine
     * @throws ValidatorUnavailableError if the DTD cannot be loaded
     */
    std::vector<ValidationFinding> validate_chapter_file(
        const std::string& path,
        const std::set<std::string>& known_ids = {}
    ) const;

    /**
     * @brief Validate a package directory or .zip archive
     *
     * @throws ValidatorUnavailableError if no DTD can be loaded
     */
    ValidationReport validate_package(const std::string& package_path) const;

    /**
     * @brief Chapter files declared as external entities in a Book.XML, in order
     */
    static std::vector<std::pair<std::string, std::string>> extract_entity_declarations(
        const std::string& book_xml_path);

    void set_parallel(bool parallel) { parallel_ = parallel; }
    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    class Dtd;

    ValidationReport validate_directory(const std::string& root) const;
    std::shared_ptr<Dtd> load_dtd(const std::string& path) const;

    std::string dtd_path_;
    bool parallel_ = false;
    bool verbose_ = false;
};

/**
 * @brief Category of a libxml2 validity message when no error code is at hand
 */
FindingCategory categorize_message(const std::string& message);

} // namespace rd
