#pragma once

#include "pdf/flow_builder.hpp"
#include <string>
#include <vector>

namespace rd {

/**
 * @brief Title of one chapter, possibly spanning several source blocks
 */
struct ChapterTitle {
    std::string text;
    double font_size = 0.0;
    int page_number = 0;
    std::vector<size_t> block_indices;   ///< Paragraphs consumed, in document order
    bool is_placeholder = false;
};

struct ChapterTitleConfig {
    double font_size_tolerance = 1.0;    ///< +/- points around the anchor size
    double gap_multiplier = 2.0;         ///< Max gap as a multiple of the anchor size
    size_t opening_blocks = 6;           ///< Paragraphs searched for the anchor
    std::string placeholder = "Untitled Chapter";
};

/**
 * @brief Finds the title block of a chapter from its opening paragraphs
 *
 * The largest-font paragraph of the opening region is the anchor. Blocks
 * next to it with a font size within tolerance and a vertical gap under
 * gap_multiplier x the anchor size are collected, first forward then
 * backward, and joined in document order.
 */
class ChapterTitleExtractor {
public:
    explicit ChapterTitleExtractor(const ChapterTitleConfig& config = ChapterTitleConfig());

    ChapterTitle extract(const std::vector<Paragraph>& paragraphs) const;

private:
    bool adjacent(const Paragraph& upper, const Paragraph& lower, double anchor_size) const;

    ChapterTitleConfig config_;
};

} // namespace rd
