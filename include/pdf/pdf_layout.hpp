#pragma once

#include <string>
#include <vector>

namespace rd {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief Axis-aligned box in page space, origin top-left, y grows downward
 */
struct BoundingBox {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    double right() const { return x + width; }
    double bottom() const { return y + height; }

    /**
     * @brief Smallest box containing both boxes
     */
    BoundingBox united(const BoundingBox& other) const;
};

/**
 * @brief Style flags derived from the font family name
 */
struct RunStyle {
    bool bold = false;
    bool italic = false;
};

/**
 * @brief Atomic unit of text produced by the extractor
 */
struct TextRun {
    std::string text;              ///< UTF-8 content
    BoundingBox box;               ///< Geometry on the page
    int page_number = 1;           ///< Page number (1-indexed)
    double font_size = 0.0;        ///< Font size in points
    std::string font_family;       ///< Font family as reported by the PDF
    RunStyle style;
};

/**
 * @brief An image produced for a page
 *
 * Either a rendered image-only page, with an empty box, or a figure cut
 * out of a text page, with its box in page space.
 */
struct PageImage {
    std::string source_id;         ///< Stable identifier, e.g. "page-0007" or "page-0007-fig01"
    std::string file_path;         ///< Where the extractor wrote the image
    int page_number = 1;
    int width = 0;                 ///< Pixels
    int height = 0;                ///< Pixels
    bool is_raster = true;
    BoundingBox box;               ///< Position on the page; empty for a whole page

    bool is_positioned() const { return box.width > 0.0 && box.height > 0.0; }
};

/**
 * @brief All text runs and images of one page
 */
struct PageLayout {
    int page_number = 1;           ///< Page number (1-indexed)
    double width = 0.0;
    double height = 0.0;
    std::vector<TextRun> runs;
    std::vector<PageImage> images;
};

/**
 * @brief Information dictionary of a PDF
 */
struct PDFMetadata {
    std::string title;
    std::string author;
    std::string subject;
    std::string keywords;
    std::string creator;
    std::string producer;
    std::string creation_date;
    int num_pages = 0;
};

/**
 * @brief Extracted layout of an entire PDF
 */
struct PDFLayout {
    std::string file_path;
    std::string document_id;
    PDFMetadata metadata;
    std::vector<PageLayout> pages;

    size_t get_total_runs() const;
};

// ============================================================================
// PDF Layout Extractor
// ============================================================================

/**
 * @brief Extracts positioned text runs from PDF files
 *
 * This class uses Poppler to read every text box of a page along with
 * its bounding box, font size and font name. Pages without any text are
 * rendered to PNG so that scanned plates and full-page figures survive
 * as image resources. On text pages, drawings and embedded pictures are
 * found as clusters of ink outside the text boxes and cut out as PNG
 * figures; text runs lying inside a figure are dropped with it.
 */
class PDFLayoutExtractor {
public:
    PDFLayoutExtractor();
    ~PDFLayoutExtractor();

    /**
     * @brief Load a PDF file and extract its page layouts
     *
     * @param file_path Path to PDF file
     * @param image_dir Directory for rendered page images (empty = no rendering)
     * @return Extracted layout
     * @throws ExtractionError if the file cannot be loaded or is locked
     */
    PDFLayout load_layout(const std::string& file_path,
                          const std::string& image_dir = "");

    /**
     * @brief Set verbose output
     */
    void set_verbose(bool verbose) { verbose_ = verbose; }

    /**
     * @brief DPI used for rendering image-only pages
     */
    void set_render_dpi(int dpi) { render_dpi_ = dpi; }

    /**
     * @brief Enable figure detection on pages that carry text
     */
    void set_detect_figures(bool detect) { detect_figures_ = detect; }

    /**
     * @brief Check if Poppler support is available
     */
    static bool is_available();

private:
    bool verbose_ = false;
    int render_dpi_ = 150;
    bool detect_figures_ = true;

    /**
     * @brief Generate document ID from file path
     */
    std::string generate_document_id(const std::string& file_path) const;
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Derive bold/italic flags from a font name ("ABCDEF+Times-BoldItalic")
 */
RunStyle style_from_font_name(const std::string& font_name);

/**
 * @brief Strip the subset prefix from a font name ("ABCDEF+Times" -> "Times")
 */
std::string font_family_from_name(const std::string& font_name);

/**
 * @brief Figure regions of a page from a coarse ink mask
 *
 * Ink cells a single empty cell apart belong to the same region. Regions
 * narrower or shorter than min_extent are dropped and overlapping regions
 * are merged.
 *
 * @param ink Row-major mask, true where a cell holds ink outside any text box
 * @param columns Cells per row
 * @param rows Rows of cells
 * @param cell_size Edge of a cell in points
 * @param min_extent Smallest width and height of a figure in points
 * @return Regions in page space, top to bottom
 * @throws std::invalid_argument if the mask size does not match columns x rows
 */
std::vector<BoundingBox> find_figure_regions(const std::vector<bool>& ink, int columns, int rows,
                                             double cell_size, double min_extent);

/**
 * @brief Share of a region covered by text run boxes, 0 to 1
 */
double text_coverage(const BoundingBox& region, const std::vector<TextRun>& runs);

/**
 * @brief Sanitize text (remove control characters, normalize whitespace)
 */
std::string sanitize_text(const std::string& text);

} // namespace rd
