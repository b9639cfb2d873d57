#pragma once

#include "model/structured_document.hpp"
#include <pugixml.hpp>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace rd {

/**
 * @brief Fixes applied to one chapter, for the audit trail
 */
struct ComplianceReport {
    std::string chapter_id;
    std::vector<std::string> fixes;

    bool changed() const { return !fixes.empty(); }
};

/**
 * @brief Placeholder values for required book metadata
 */
struct MetadataDefaults {
    std::string isbn = "0000000000000";
    std::string title = "Untitled Book";
    std::string author = "Unknown Author";
    std::string publisher = "Unknown Publisher";
    std::string copyright_year = "2024";
};

/**
 * @brief Rewrites chapter trees into the element subset the RittDoc DTD accepts
 *
 * The rules are deterministic and each is a no-op on input that already
 * satisfies it, so transforming twice gives the same bytes as once:
 *  - HTML leftovers (div, span, br, html, body) unwrapped, p renamed para
 *  - generic sections renumbered sect1..sect5 by depth (deeper is an error)
 *  - banned elements rewritten (variablelist -> glosslist, informal
 *    figure/table -> figure/table with a title)
 *  - loose chapter content wrapped in a generated sect1
 *  - ids namespaced with the chapter id and made unique
 *  - required but empty content filled with defaults
 */
class ComplianceTransformer {
public:
    static constexpr int MAX_SECTION_DEPTH = 5;

    explicit ComplianceTransformer(const MetadataDefaults& defaults = MetadataDefaults());

    /**
     * @brief Transform one chapter in place
     *
     * @throws ComplianceError if sections nest deeper than MAX_SECTION_DEPTH
     */
    ComplianceReport transform_chapter(Chapter& chapter) const;

    /**
     * @brief Fill missing required book metadata with placeholders
     *
     * @return Names of the fields that were filled
     */
    std::vector<std::string> apply_metadata_defaults(BookMetadata& metadata) const;

    /**
     * @brief Transform metadata and every chapter, stopping at the first failure
     */
    std::vector<ComplianceReport> transform(StructuredDocument& doc) const;

    /**
     * @brief Direct children a <chapter> may have besides section content
     */
    static const std::set<std::string>& chapter_whitelist();

    /**
     * @brief Generic element names that must not remain after transformation
     */
    static const std::set<std::string>& banned_elements();

    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    void unwrap_html(pugi::xml_node chapter, ComplianceReport& report) const;
    void renumber_sections(pugi::xml_node chapter, const std::string& chapter_id,
                           ComplianceReport& report) const;
    void rewrite_banned(pugi::xml_node chapter, ComplianceReport& report) const;
    void normalize_figures_and_tables(pugi::xml_node chapter, ComplianceReport& report) const;
    void fix_lists(pugi::xml_node chapter, ComplianceReport& report) const;
    void unwrap_nested_paras(pugi::xml_node chapter, ComplianceReport& report) const;
    void wrap_loose_content(pugi::xml_node chapter, const std::string& chapter_id,
                            ComplianceReport& report) const;
    void fill_empty_content(pugi::xml_node chapter, ComplianceReport& report) const;
    void namespace_ids(pugi::xml_node chapter, const std::string& chapter_id,
                       ComplianceReport& report) const;

    MetadataDefaults defaults_;
    bool verbose_ = false;
};

/**
 * @brief True if the element name is section-like (section, sect1..sect5)
 */
bool is_section_element(const std::string& name);

} // namespace rd
