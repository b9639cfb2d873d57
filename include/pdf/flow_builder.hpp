#pragma once

#include "pdf/pdf_layout.hpp"
#include <string>
#include <vector>

namespace rd {

// ============================================================================
// Paragraph
// ============================================================================

/**
 * @brief Coarse typographic role of a paragraph
 */
enum class ParagraphRole {
    BODY,
    HEADING_CANDIDATE,
    CAPTION,
    LIST_ITEM
};

inline std::string paragraph_role_to_string(ParagraphRole role) {
    switch (role) {
        case ParagraphRole::BODY: return "body";
        case ParagraphRole::HEADING_CANDIDATE: return "heading_candidate";
        case ParagraphRole::CAPTION: return "caption";
        case ParagraphRole::LIST_ITEM: return "list_item";
        default: return "unknown";
    }
}

/**
 * @brief A run sequence merged by spacing and typography
 *
 * All runs of a paragraph come from the same page.
 */
struct Paragraph {
    std::vector<TextRun> runs;
    int page_number = 1;                      ///< Page of the first run
    BoundingBox box;                          ///< Union of the run boxes
    ParagraphRole role = ParagraphRole::BODY;

    /**
     * @brief Run texts joined with spaces; a trailing hyphen at a line
     *        break before a lowercase letter is removed
     */
    std::string text() const;

    /**
     * @brief Largest font size among the runs
     */
    double font_size() const;

    /**
     * @brief True if every run is bold
     */
    bool is_bold() const;
};

// ============================================================================
// Flow Builder
// ============================================================================

struct FlowConfig {
    double line_gap_multiplier = 2.0;       ///< Merge while gap < multiplier x typical line height
    double font_size_tolerance = 1.0;       ///< Size change beyond this ends a paragraph
    double heading_size_delta = 2.0;        ///< Heading if font >= body size + delta
    size_t heading_max_chars = 120;         ///< Bold lines longer than this stay body text
    bool filter_running_matter = true;      ///< Drop repeated headers/footers
    double running_matter_band = 0.08;      ///< Top/bottom fraction of the page searched
    double running_matter_page_ratio = 0.5; ///< Repeated on more than this share of pages
    size_t running_matter_min_pages = 3;    ///< Below this, nothing is considered repeated
};

/**
 * @brief Builds ordered paragraphs from per-page ordered runs
 *
 * Two consecutive runs share a paragraph only if they are on the same
 * page and the vertical distance between their tops is below
 * line_gap_multiplier times the page's typical line height. A page break
 * always ends the paragraph.
 */
class FlowBuilder {
public:
    explicit FlowBuilder(const FlowConfig& config = FlowConfig());

    /**
     * @brief Build paragraphs
     *
     * @param pages Pages whose runs are already in reading order
     */
    std::vector<Paragraph> build(const std::vector<PageLayout>& pages) const;

    /**
     * @brief Remove runs repeated in the top or bottom band of most pages
     *
     * @return Number of runs removed
     */
    size_t remove_running_matter(std::vector<PageLayout>& pages) const;

    /**
     * @brief Median line height of the runs of one page
     */
    static double typical_line_height(const std::vector<TextRun>& runs);

    /**
     * @brief Font size that carries the most text, rounded to half points
     */
    static double body_font_size(const std::vector<Paragraph>& paragraphs);

    /**
     * @brief Assign roles given the document body size
     */
    void assign_roles(std::vector<Paragraph>& paragraphs, double body_size) const;

    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    bool should_merge(const TextRun& prev, const TextRun& next, double line_height) const;

    FlowConfig config_;
    bool verbose_ = false;
};

/**
 * @brief True for "Figure 3", "Fig. 2.1", "Table 4" style openings
 */
bool looks_like_caption(const std::string& text);

/**
 * @brief True for bullet or enumerator openings ("•", "-", "3.", "b)")
 */
bool looks_like_list_item(const std::string& text);

} // namespace rd
