#include "pdf/chapter_title.hpp"
#include <algorithm>
#include <cmath>

namespace rd {

ChapterTitleExtractor::ChapterTitleExtractor(const ChapterTitleConfig& config)
    : config_(config) {}

bool ChapterTitleExtractor::adjacent(const Paragraph& upper,
                                     const Paragraph& lower,
                                     double anchor_size) const {
    if (upper.page_number != lower.page_number) {
        return false;
    }
    double gap = lower.box.y - upper.box.bottom();
    return gap < config_.gap_multiplier * anchor_size;
}

ChapterTitle ChapterTitleExtractor::extract(const std::vector<Paragraph>& paragraphs) const {
    ChapterTitle title;
    title.text = config_.placeholder;
    title.is_placeholder = true;

    size_t region = std::min(config_.opening_blocks, paragraphs.size());
    if (region == 0) {
        return title;
    }

    // Single largest font in the opening region; earliest wins ties
    size_t anchor = 0;
    double smallest = paragraphs[0].font_size();
    for (size_t i = 1; i < region; ++i) {
        double size = paragraphs[i].font_size();
        if (size > paragraphs[anchor].font_size()) {
            anchor = i;
        }
        smallest = std::min(smallest, size);
    }

    const Paragraph& anchor_para = paragraphs[anchor];
    double anchor_size = anchor_para.font_size();
    bool stands_out = anchor_size - smallest > config_.font_size_tolerance ||
                      anchor_para.role == ParagraphRole::HEADING_CANDIDATE;
    if (!stands_out || anchor_para.text().empty()) {
        return title;
    }

    auto same_size = [&](const Paragraph& p) {
        return std::abs(p.font_size() - anchor_size) <= config_.font_size_tolerance;
    };

    size_t first = anchor;
    size_t last = anchor;

    while (last + 1 < paragraphs.size() &&
           same_size(paragraphs[last + 1]) &&
           adjacent(paragraphs[last], paragraphs[last + 1], anchor_size)) {
        ++last;
    }
    while (first > 0 &&
           same_size(paragraphs[first - 1]) &&
           adjacent(paragraphs[first - 1], paragraphs[first], anchor_size)) {
        --first;
    }

    title.text.clear();
    for (size_t i = first; i <= last; ++i) {
        std::string piece = paragraphs[i].text();
        if (piece.empty()) {
            continue;
        }
        if (!title.text.empty()) {
            title.text += ' ';
        }
        title.text += piece;
        title.block_indices.push_back(i);
    }
    title.font_size = anchor_size;
    title.page_number = paragraphs[first].page_number;
    title.is_placeholder = false;
    return title;
}

} // namespace rd
