#include "validation/dtd_validator.hpp"
#include "common/errors.hpp"
#include <libxml/parser.h>
#include <libxml/valid.h>
#include <libxml/xmlerror.h>
#include <libxml/xmlversion.h>
#include <pugixml.hpp>
#include <zip.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <map>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace rd {

// ============================================================================
// JSON conversion
// ============================================================================

nlohmann::json ValidationFinding::to_json() const {
    nlohmann::json j;
    j["file"] = file;
    j["line"] = line;
    j["category"] = finding_category_to_string(category);
    j["description"] = description;
    j["severity"] = finding_severity_to_string(severity);
    return j;
}

nlohmann::json ValidationReport::to_json() const {
    std::map<std::string, int> by_file;
    std::map<std::string, int> by_category;
    nlohmann::json findings_json = nlohmann::json::array();
    for (const auto& f : findings) {
        by_file[f.file]++;
        by_category[finding_category_to_string(f.category)]++;
        findings_json.push_back(f.to_json());
    }

    nlohmann::json j;
    j["status"] = passed() ? "pass" : "fail";
    j["passed"] = passed();
    j["dtd_path"] = dtd_path;
    j["files_checked"] = files_checked;
    j["total_findings"] = findings.size();
    j["findings_by_file"] = by_file;
    j["findings_by_category"] = by_category;
    j["findings"] = findings_json;
    return j;
}

void ValidationReport::save(const std::string& path) const {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot write validation report: " + path);
    }
    out << to_json().dump(2) << "\n";
    if (!out) {
        throw std::runtime_error("Failed writing validation report: " + path);
    }
}

void ValidationReport::print_summary() const {
    std::cout << "\n=== DTD Validation ===\n";
    std::cout << "DTD: " << dtd_path << "\n";
    std::cout << "Files checked: " << files_checked.size() << "\n";
    std::cout << "Findings: " << findings.size() << "\n";

    std::map<std::string, int> by_category;
    for (const auto& f : findings) by_category[finding_category_to_string(f.category)]++;
    for (const auto& [category, count] : by_category) {
        std::cout << "  " << category << ": " << count << "\n";
    }

    size_t shown = 0;
    for (const auto& f : findings) {
        if (shown++ >= 20) {
            std::cout << "  ... and " << (findings.size() - 20) << " more\n";
            break;
        }
        std::cout << "  " << f.file << ":" << f.line << " ["
                  << finding_category_to_string(f.category) << "] " << f.description << "\n";
    }
    std::cout << "Result: " << (passed() ? "PASS" : "FAIL") << "\n";
}

// ============================================================================
// Message handling
// ============================================================================

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::set<std::string> element_names(const std::string& model) {
    static const std::regex name_re(R"([A-Za-z_][A-Za-z0-9_.\-]*)");
    std::set<std::string> names;
    for (auto it = std::sregex_iterator(model.begin(), model.end(), name_re);
         it != std::sregex_iterator(); ++it) {
        std::string n = it->str();
        if (n != "PCDATA" && n != "CDATA") names.insert(n);
    }
    return names;
}

/**
 * Content-model violations where every child present is allowed by the
 * model mean something required is absent.
 */
FindingCategory categorize_content_model(const std::string& message) {
    size_t expecting = message.find("expecting ");
    size_t got = message.find(", got ");
    if (expecting == std::string::npos || got == std::string::npos || got < expecting) {
        return FindingCategory::INVALID_CONTENT_MODEL;
    }
    std::string expected_part = message.substr(expecting + 10, got - expecting - 10);
    std::string got_part = trim(message.substr(got + 6));

    auto expected = element_names(expected_part);
    auto present = element_names(got_part);
    if (present.empty()) return FindingCategory::MISSING_REQUIRED_CHILD;
    for (const auto& n : present) {
        if (!expected.count(n)) return FindingCategory::INVALID_CONTENT_MODEL;
    }
    return FindingCategory::MISSING_REQUIRED_CHILD;
}

std::string readable(std::string message) {
    message = trim(message);
    static const std::regex no_decl(R"(No declaration for element (\S+))");
    message = std::regex_replace(message, no_decl, "Element <$1> is not declared in the DTD");
    static const std::regex not_follow(R"(does not follow the DTD)");
    message = std::regex_replace(message, not_follow, "does not match what the DTD expects");
    static const std::regex not_carry(R"(Element (\S+) does not carry attribute (\S+))");
    message = std::regex_replace(message, not_carry,
                                 "Element <$1> is missing required attribute '$2'");
    return message;
}

struct RawFinding {
    ValidationFinding finding;
    std::string unknown_id;       ///< Target of an IDREF that did not resolve in this file
};

struct ErrorCollector {
    std::string file;
    std::vector<RawFinding> findings;
    std::vector<std::string> dtd_errors;
    bool collecting_dtd = false;
};

FindingCategory categorize_code(int domain, int code, const std::string& message) {
    if (domain == XML_FROM_PARSER || domain == XML_FROM_NAMESPACE ||
        domain == XML_FROM_IO || domain == XML_FROM_I18N) {
        return FindingCategory::XML_SYNTAX;
    }
    switch (code) {
        case XML_DTD_UNKNOWN_ELEM:
        case XML_DTD_NO_ELEM_NAME:
            return FindingCategory::UNDECLARED_ELEMENT;
        case XML_DTD_MISSING_ATTRIBUTE:
            return FindingCategory::MISSING_REQUIRED_ATTRIBUTE;
        case XML_DTD_CONTENT_MODEL:
            return categorize_content_model(message);
        case XML_DTD_NOT_EMPTY:
        case XML_DTD_NOT_PCDATA:
        case XML_DTD_CONTENT_ERROR:
        case XML_DTD_CONTENT_NOT_DETERMINIST:
        case XML_DTD_INVALID_CHILD:
            return FindingCategory::INVALID_CONTENT_MODEL;
        case XML_DTD_UNKNOWN_ATTRIBUTE:
        case XML_DTD_ATTRIBUTE_VALUE:
        case XML_DTD_ATTRIBUTE_DEFAULT:
        case XML_DTD_ID_REDEFINED:
        case XML_DTD_UNKNOWN_ID:
        case XML_DTD_NOTATION_VALUE:
        case XML_DTD_UNKNOWN_NOTATION:
        case XML_DTD_UNKNOWN_ENTITY:
        case XML_DTD_ENTITY_TYPE:
            return FindingCategory::INVALID_ATTRIBUTE_VALUE;
        default:
            return categorize_message(message);
    }
}

#if LIBXML_VERSION >= 21200
void collect_error(void* user_data, const xmlError* err)
#else
void collect_error(void* user_data, xmlErrorPtr err)
#endif
{
    if (!user_data || !err) return;
    auto* collector = static_cast<ErrorCollector*>(user_data);
    std::string message = err->message ? err->message : "";

    if (collector->collecting_dtd) {
        if (err->level >= XML_ERR_ERROR) collector->dtd_errors.push_back(trim(message));
        return;
    }
    if (err->level < XML_ERR_ERROR) return;

    RawFinding raw;
    raw.finding.file = collector->file;
    raw.finding.line = err->line > 0 ? err->line : 0;
    raw.finding.category = categorize_code(err->domain, err->code, message);
    raw.finding.description = readable(message);
    raw.finding.severity = FindingSeverity::ERROR;
    if (err->code == XML_DTD_UNKNOWN_ID) {
        if (err->str2) {
            raw.unknown_id = err->str2;
        } else {
            static const std::regex quoted("\"([^\"]+)\"");
            std::smatch m;
            if (std::regex_search(message, m, quoted)) raw.unknown_id = m[1].str();
        }
    }
    collector->findings.push_back(std::move(raw));
}

/**
 * Routes libxml2 errors of the calling thread into a collector for its lifetime.
 */
class ErrorCapture {
public:
    explicit ErrorCapture(ErrorCollector& collector) {
        xmlSetStructuredErrorFunc(&collector, collect_error);
    }
    ~ErrorCapture() {
        xmlSetStructuredErrorFunc(nullptr, nullptr);
    }
    ErrorCapture(const ErrorCapture&) = delete;
    ErrorCapture& operator=(const ErrorCapture&) = delete;
};

struct DocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

struct ValidCtxtDeleter {
    void operator()(xmlValidCtxt* ctxt) const { xmlFreeValidCtxt(ctxt); }
};

std::set<std::string> collect_ids(const std::string& path) {
    std::set<std::string> ids;
    pugi::xml_document doc;
    if (!doc.load_file(path.c_str())) return ids;
    for (const auto& node : doc.select_nodes("//*[@id]")) {
        ids.insert(node.node().attribute("id").value());
    }
    return ids;
}

bool has_zip_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext == ".zip";
}

/**
 * Temporary extraction of a package archive, removed on destruction.
 */
class ExtractedArchive {
public:
    explicit ExtractedArchive(const std::string& zip_path) {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root_ = fs::temp_directory_path() /
                ("rittdoc-validate-" + std::to_string(stamp));
        fs::create_directories(root_);

        int error = 0;
        zip_t* archive = zip_open(zip_path.c_str(), ZIP_RDONLY, &error);
        if (!archive) {
            zip_error_t ze;
            zip_error_init_with_code(&ze, error);
            std::string reason = zip_error_strerror(&ze);
            zip_error_fini(&ze);
            throw ExtractionError("Cannot open package " + zip_path + ": " + reason);
        }

        zip_int64_t count = zip_get_num_entries(archive, 0);
        for (zip_int64_t i = 0; i < count; ++i) {
            const char* name = zip_get_name(archive, static_cast<zip_uint64_t>(i), 0);
            if (!name) continue;
            std::string entry = name;
            if (entry.empty() || entry.back() == '/') continue;
            if (entry.find("..") != std::string::npos || entry.front() == '/') continue;

            zip_file_t* file = zip_fopen_index(archive, static_cast<zip_uint64_t>(i), 0);
            if (!file) {
                zip_discard(archive);
                throw ExtractionError("Cannot read " + entry + " in " + zip_path);
            }
            fs::path target = root_ / entry;
            fs::create_directories(target.parent_path());
            std::ofstream out(target, std::ios::binary);
            char buffer[8192];
            zip_int64_t n;
            while ((n = zip_fread(file, buffer, sizeof(buffer))) > 0) {
                out.write(buffer, n);
            }
            zip_fclose(file);
            if (n < 0 || !out) {
                zip_discard(archive);
                throw ExtractionError("Cannot extract " + entry + " from " + zip_path);
            }
        }
        zip_discard(archive);
    }

    ~ExtractedArchive() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    ExtractedArchive(const ExtractedArchive&) = delete;
    ExtractedArchive& operator=(const ExtractedArchive&) = delete;

    std::string root() const {
        // Archives written with a single top-level folder are validated from inside it
        if (!fs::exists(root_ / "Book.XML")) {
            for (const auto& entry : fs::directory_iterator(root_)) {
                if (entry.is_directory() && fs::exists(entry.path() / "Book.XML")) {
                    return entry.path().string();
                }
            }
        }
        return root_.string();
    }

private:
    fs::path root_;
};

} // namespace

FindingCategory categorize_message(const std::string& message) {
    std::string lower = message;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower.find("no declaration for element") != std::string::npos ||
        lower.find("not declared") != std::string::npos) {
        return FindingCategory::UNDECLARED_ELEMENT;
    }
    if (lower.find("does not carry attribute") != std::string::npos ||
        lower.find("required attribute") != std::string::npos) {
        return FindingCategory::MISSING_REQUIRED_ATTRIBUTE;
    }
    if (lower.find("does not follow") != std::string::npos ||
        lower.find("content model") != std::string::npos) {
        return categorize_content_model(message);
    }
    if (lower.find("attribute") != std::string::npos ||
        lower.find("idref") != std::string::npos) {
        return FindingCategory::INVALID_ATTRIBUTE_VALUE;
    }
    return FindingCategory::INVALID_CONTENT_MODEL;
}

// ============================================================================
// DTD handle
// ============================================================================

class EntityTrackingValidator::Dtd {
public:
    explicit Dtd(xmlDtd* dtd) : dtd_(dtd) {}
    ~Dtd() { if (dtd_) xmlFreeDtd(dtd_); }

    Dtd(const Dtd&) = delete;
    Dtd& operator=(const Dtd&) = delete;

    xmlDtd* get() const { return dtd_; }

private:
    xmlDtd* dtd_;
};

// ============================================================================
// Validator
// ============================================================================

EntityTrackingValidator::EntityTrackingValidator(const std::string& dtd_path)
    : dtd_path_(dtd_path) {
    if (!is_available()) {
        throw ValidatorUnavailableError(
            "libxml2 was built without DTD validation support");
    }
    xmlInitParser();
}

EntityTrackingValidator::~EntityTrackingValidator() = default;

bool EntityTrackingValidator::is_available() {
#ifdef LIBXML_VALID_ENABLED
    return true;
#else
    return false;
#endif
}

std::string EntityTrackingValidator::resolve_dtd(const std::string& package_root) const {
    if (!dtd_path_.empty()) {
        if (!fs::exists(dtd_path_)) {
            throw ValidatorUnavailableError("DTD not found: " + dtd_path_);
        }
        return dtd_path_;
    }
    fs::path bundled = fs::path(package_root) / "RITTDOCdtd" / "v1.1" / "RittDocBook.dtd";
    if (fs::exists(bundled)) return bundled.string();
    throw ValidatorUnavailableError("No DTD given and none bundled at " + bundled.string());
}

std::shared_ptr<EntityTrackingValidator::Dtd> EntityTrackingValidator::load_dtd(
    const std::string& path) const {
    ErrorCollector collector;
    collector.collecting_dtd = true;
    xmlDtd* dtd = nullptr;
    {
        ErrorCapture capture(collector);
        dtd = xmlParseDTD(nullptr, reinterpret_cast<const xmlChar*>(path.c_str()));
    }
    if (!dtd) {
        std::string reason = collector.dtd_errors.empty()
            ? "parse failed" : collector.dtd_errors.front();
        throw ValidatorUnavailableError("Cannot load DTD " + path + ": " + reason);
    }
    return std::make_shared<Dtd>(dtd);
}

namespace {

std::vector<ValidationFinding> validate_with_dtd(
    xmlDtd* dtd, const std::string& path, const std::set<std::string>& known_ids) {
    ErrorCollector collector;
    collector.file = fs::path(path).filename().string();

    {
        ErrorCapture capture(collector);
        std::unique_ptr<xmlDoc, DocDeleter> doc(
            xmlReadFile(path.c_str(), nullptr, XML_PARSE_NONET));
        if (doc) {
            std::unique_ptr<xmlValidCtxt, ValidCtxtDeleter> vctxt(xmlNewValidCtxt());
            if (vctxt) {
                xmlValidateDtd(vctxt.get(), doc.get(), dtd);
            }
        } else if (collector.findings.empty()) {
            RawFinding raw;
            raw.finding.file = collector.file;
            raw.finding.category = FindingCategory::XML_SYNTAX;
            raw.finding.description = "File could not be parsed as XML";
            collector.findings.push_back(std::move(raw));
        }
    }

    std::vector<ValidationFinding> findings;
    for (auto& raw : collector.findings) {
        if (!raw.unknown_id.empty() && known_ids.count(raw.unknown_id)) continue;
        findings.push_back(std::move(raw.finding));
    }
    return findings;
}

} // namespace

std::vector<ValidationFinding> EntityTrackingValidator::validate_chapter_file(
    const std::string& path, const std::set<std::string>& known_ids) const {
    std::string dtd_path = resolve_dtd(fs::path(path).parent_path().string());
    auto dtd = load_dtd(dtd_path);
    return validate_with_dtd(dtd->get(), path, known_ids);
}

std::vector<std::pair<std::string, std::string>>
EntityTrackingValidator::extract_entity_declarations(const std::string& book_xml_path) {
    std::ifstream in(book_xml_path);
    if (!in) {
        throw std::runtime_error("Cannot read " + book_xml_path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    std::string content = buffer.str();

    // Only the internal subset of the DOCTYPE declares chapter entities
    size_t doctype = content.find("<!DOCTYPE");
    if (doctype != std::string::npos) {
        size_t open = content.find('[', doctype);
        size_t close = open == std::string::npos ? open : content.find("]>", open);
        if (open != std::string::npos && close != std::string::npos) {
            content = content.substr(open, close - open);
        }
    }

    static const std::regex entity_re(R"(<!ENTITY\s+(\w+)\s+SYSTEM\s+"([^"]+)">)");
    std::vector<std::pair<std::string, std::string>> entities;
    for (auto it = std::sregex_iterator(content.begin(), content.end(), entity_re);
         it != std::sregex_iterator(); ++it) {
        entities.emplace_back((*it)[1].str(), (*it)[2].str());
    }
    return entities;
}

ValidationReport EntityTrackingValidator::validate_package(const std::string& package_path) const {
    if (fs::is_regular_file(package_path) && has_zip_extension(package_path)) {
        ExtractedArchive extracted(package_path);
        return validate_directory(extracted.root());
    }
    if (!fs::is_directory(package_path)) {
        throw std::runtime_error("Package not found: " + package_path);
    }
    return validate_directory(package_path);
}

ValidationReport EntityTrackingValidator::validate_directory(const std::string& root) const {
    ValidationReport report;
    report.dtd_path = resolve_dtd(root);

    std::vector<std::string> chapter_files;
    fs::path book_xml = fs::path(root) / "Book.XML";
    if (fs::exists(book_xml)) {
        for (const auto& [name, system_id] : extract_entity_declarations(book_xml.string())) {
            fs::path file = fs::path(root) / system_id;
            if (!fs::exists(file)) {
                ValidationFinding missing;
                missing.file = system_id;
                missing.category = FindingCategory::MISSING_FILE;
                missing.description = "Entity '" + name + "' refers to missing file " + system_id;
                report.findings.push_back(std::move(missing));
                continue;
            }
            chapter_files.push_back(file.string());
        }
    } else {
        ValidationFinding missing;
        missing.file = "Book.XML";
        missing.category = FindingCategory::MISSING_FILE;
        missing.description = "Package has no Book.XML";
        report.findings.push_back(std::move(missing));
    }

    std::set<std::string> known_ids;
    for (const auto& file : chapter_files) {
        auto ids = collect_ids(file);
        known_ids.insert(ids.begin(), ids.end());
    }

    std::vector<std::vector<ValidationFinding>> per_file(chapter_files.size());
    if (parallel_ && chapter_files.size() > 1) {
        // xmlDtd is not shared between threads; each task loads its own copy
        std::vector<std::future<std::vector<ValidationFinding>>> futures;
        for (const auto& file : chapter_files) {
            futures.push_back(std::async(std::launch::async,
                [this, &report, &known_ids, file]() {
                    auto dtd = load_dtd(report.dtd_path);
                    return validate_with_dtd(dtd->get(), file, known_ids);
                }));
        }
        for (size_t i = 0; i < futures.size(); ++i) {
            per_file[i] = futures[i].get();
        }
    } else {
        auto dtd = load_dtd(report.dtd_path);
        for (size_t i = 0; i < chapter_files.size(); ++i) {
            per_file[i] = validate_with_dtd(dtd->get(), chapter_files[i], known_ids);
            if (verbose_) {
                std::cout << "  Validated " << fs::path(chapter_files[i]).filename().string()
                          << ": " << per_file[i].size() << " finding(s)\n";
            }
        }
    }

    for (size_t i = 0; i < chapter_files.size(); ++i) {
        report.files_checked.push_back(fs::path(chapter_files[i]).filename().string());
        for (auto& f : per_file[i]) report.findings.push_back(std::move(f));
    }

    if (verbose_) {
        std::cout << "Validated " << chapter_files.size() << " chapter file(s) against "
                  << report.dtd_path << ": " << report.findings.size() << " finding(s)\n";
    }
    return report;
}

} // namespace rd
