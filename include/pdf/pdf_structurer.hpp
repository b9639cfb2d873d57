#pragma once

#include "mapping/reference_mapper.hpp"
#include "model/structured_document.hpp"
#include "pdf/chapter_title.hpp"
#include "pdf/flow_builder.hpp"
#include "pdf/pdf_layout.hpp"
#include <pugixml.hpp>
#include <string>
#include <utility>
#include <vector>

namespace rd {

struct PdfStructureConfig {
    double chapter_font_ratio = 1.4;     ///< Chapter heading if font >= ratio x body size
    double font_size_tolerance = 1.0;    ///< Heading sizes closer than this share a tier
    int max_section_tiers = 4;           ///< Smaller heading tiers become bold paragraphs
    ChapterTitleConfig title;
};

/**
 * @brief Turns the paragraph flow of a PDF into chapters and sections
 *
 * A chapter starts where a page opens with a heading candidate set at
 * chapter scale. Text before the first such page becomes a front-matter
 * chapter only when it is not empty. Inside a chapter, the remaining
 * heading candidates open nested sections by font-size tier. Rendered
 * image-only pages and figures cut from text pages become figures
 * registered with the reference mapper; a cut figure keeps its place
 * among the paragraphs of its page.
 */
class PdfStructuralProcessor {
public:
    PdfStructuralProcessor(ReferenceMapper& mapper,
                           const PdfStructureConfig& config = PdfStructureConfig());

    /**
     * @brief Build the structured document
     *
     * @param layout Extracted layout (metadata and rendered page images)
     * @param paragraphs Paragraphs with roles assigned, in reading order
     * @param body_size Body font size of the document
     * @param media_dir Directory receiving images under their intermediate names
     */
    StructuredDocument process(const PDFLayout& layout,
                               const std::vector<Paragraph>& paragraphs,
                               double body_size,
                               const std::string& media_dir);

    /**
     * @brief Indices of paragraphs that open a chapter
     */
    std::vector<size_t> find_chapter_starts(const std::vector<Paragraph>& paragraphs,
                                            double body_size) const;

    /**
     * @brief Distinct heading sizes, largest first, clustered by tolerance
     */
    std::vector<double> heading_tiers(const std::vector<Paragraph>& paragraphs) const;

    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    struct Block {
        const Paragraph* paragraph = nullptr;
        const PageImage* image = nullptr;
        int page_number = 0;
    };

    struct ChapterContext {
        Chapter* chapter = nullptr;
        std::vector<std::pair<int, pugi::xml_node>> sections;   ///< (level, node)
        pugi::xml_node open_list;
        bool open_list_ordered = false;
    };

    void fill_chapter(Chapter& chapter, const std::vector<Block>& blocks,
                      const std::vector<double>& tiers, bool is_front_matter);
    void append_paragraph(const Paragraph& paragraph, const std::vector<double>& tiers,
                          ChapterContext& ctx);
    void append_image(const PageImage& image, ChapterContext& ctx);
    pugi::xml_node current_container(ChapterContext& ctx) const;
    int tier_of(double font_size, const std::vector<double>& tiers) const;

    void fill_metadata(const PDFLayout& layout, const std::vector<Paragraph>& paragraphs,
                       StructuredDocument& doc) const;

    ReferenceMapper& mapper_;
    PdfStructureConfig config_;
    std::string media_dir_;
    int image_counter_ = 0;
    bool verbose_ = false;
};

/**
 * @brief Split a PDF Author field into names ("A, B and C" -> 3 names)
 */
std::vector<std::string> split_authors(const std::string& author_field);

/**
 * @brief Text of a list item without its bullet or enumerator
 */
std::string strip_list_marker(const std::string& text);

} // namespace rd
