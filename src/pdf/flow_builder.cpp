#include "pdf/flow_builder.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <map>
#include <regex>
#include <set>

namespace rd {

// ============================================================================
// Paragraph
// ============================================================================

std::string Paragraph::text() const {
    std::string out;
    for (size_t i = 0; i < runs.size(); ++i) {
        const std::string& piece = runs[i].text;
        if (piece.empty()) {
            continue;
        }
        if (!out.empty()) {
            bool new_line = std::abs(runs[i].box.y - runs[i - 1].box.y) >
                            0.5 * std::max(runs[i - 1].box.height, 1.0);
            bool hyphenated = out.back() == '-' && out.size() > 1 &&
                              std::isalpha(static_cast<unsigned char>(out[out.size() - 2])) &&
                              std::islower(static_cast<unsigned char>(piece[0]));
            if (new_line && hyphenated) {
                out.pop_back();
            } else {
                out += ' ';
            }
        }
        out += piece;
    }
    return out;
}

double Paragraph::font_size() const {
    double size = 0.0;
    for (const auto& run : runs) {
        size = std::max(size, run.font_size);
    }
    return size;
}

bool Paragraph::is_bold() const {
    if (runs.empty()) {
        return false;
    }
    return std::all_of(runs.begin(), runs.end(),
                       [](const TextRun& r) { return r.style.bold; });
}

// ============================================================================
// Classification helpers
// ============================================================================

bool looks_like_caption(const std::string& text) {
    static const std::regex caption_re(R"(^(Figure|Fig\.|Table|Plate|Exhibit)\s*[0-9IVXivx]+)");
    return std::regex_search(text, caption_re);
}

bool looks_like_list_item(const std::string& text) {
    // UTF-8 bullet, middle dot, en dash
    if (text.rfind("\xE2\x80\xA2", 0) == 0 || text.rfind("\xC2\xB7", 0) == 0 ||
        text.rfind("\xE2\x80\x93 ", 0) == 0) {
        return true;
    }
    static const std::regex list_re(R"(^([-*]\s|[0-9]{1,3}[.)]\s|[a-z][.)]\s|\([0-9a-z]{1,3}\)\s))");
    return std::regex_search(text, list_re);
}

// ============================================================================
// FlowBuilder
// ============================================================================

FlowBuilder::FlowBuilder(const FlowConfig& config)
    : config_(config) {}

double FlowBuilder::typical_line_height(const std::vector<TextRun>& runs) {
    std::vector<double> heights;
    heights.reserve(runs.size());
    for (const auto& run : runs) {
        double h = run.box.height > 0.0 ? run.box.height : run.font_size * 1.2;
        if (h > 0.0) {
            heights.push_back(h);
        }
    }
    if (heights.empty()) {
        return 12.0;
    }
    std::sort(heights.begin(), heights.end());
    return heights[heights.size() / 2];
}

double FlowBuilder::body_font_size(const std::vector<Paragraph>& paragraphs) {
    std::map<double, size_t> weight;
    for (const auto& para : paragraphs) {
        for (const auto& run : para.runs) {
            double rounded = std::round(run.font_size * 2.0) / 2.0;
            weight[rounded] += run.text.size();
        }
    }
    double best = 0.0;
    size_t best_weight = 0;
    for (const auto& [size, w] : weight) {
        if (w > best_weight) {
            best = size;
            best_weight = w;
        }
    }
    return best;
}

bool FlowBuilder::should_merge(const TextRun& prev, const TextRun& next, double line_height) const {
    if (prev.page_number != next.page_number) {
        return false;
    }
    if (std::abs(prev.font_size - next.font_size) > config_.font_size_tolerance) {
        return false;
    }

    double dy = next.box.y - prev.box.y;
    // Same line: pieces of one line reported separately
    if (std::abs(dy) < 0.5 * line_height) {
        return true;
    }
    return dy > 0.0 && dy < config_.line_gap_multiplier * line_height;
}

std::vector<Paragraph> FlowBuilder::build(const std::vector<PageLayout>& pages) const {
    std::vector<Paragraph> paragraphs;

    for (const auto& page : pages) {
        if (page.runs.empty()) {
            continue;
        }
        double line_height = typical_line_height(page.runs);

        Paragraph current;
        for (const auto& run : page.runs) {
            if (!current.runs.empty() && !should_merge(current.runs.back(), run, line_height)) {
                paragraphs.push_back(std::move(current));
                current = Paragraph();
            }
            if (current.runs.empty()) {
                current.page_number = run.page_number;
                current.box = run.box;
            } else {
                current.box = current.box.united(run.box);
            }
            current.runs.push_back(run);
        }
        // Page break: always close the open paragraph
        if (!current.runs.empty()) {
            paragraphs.push_back(std::move(current));
        }
    }

    assign_roles(paragraphs, body_font_size(paragraphs));

    if (verbose_) {
        std::cout << "  Built " << paragraphs.size() << " paragraphs from "
                  << pages.size() << " pages" << std::endl;
    }
    return paragraphs;
}

void FlowBuilder::assign_roles(std::vector<Paragraph>& paragraphs, double body_size) const {
    for (auto& para : paragraphs) {
        std::string text = para.text();
        double size = para.font_size();

        if (looks_like_caption(text)) {
            para.role = ParagraphRole::CAPTION;
        } else if (looks_like_list_item(text)) {
            para.role = ParagraphRole::LIST_ITEM;
        } else if (size >= body_size + config_.heading_size_delta ||
                   (para.is_bold() && text.size() <= config_.heading_max_chars &&
                    !text.empty() && text.back() != '.')) {
            para.role = ParagraphRole::HEADING_CANDIDATE;
        } else {
            para.role = ParagraphRole::BODY;
        }
    }
}

size_t FlowBuilder::remove_running_matter(std::vector<PageLayout>& pages) const {
    if (!config_.filter_running_matter) {
        return 0;
    }

    size_t text_pages = 0;
    for (const auto& page : pages) {
        if (!page.runs.empty()) {
            ++text_pages;
        }
    }
    if (text_pages < config_.running_matter_min_pages) {
        return 0;
    }

    // Digits collapse so "Page 3" and "Page 4" count as the same line
    auto key_for = [&](const TextRun& run, const PageLayout& page) -> std::string {
        if (page.height <= 0.0) {
            return "";
        }
        double top = run.box.y / page.height;
        double bottom = run.box.bottom() / page.height;
        char band;
        if (top <= config_.running_matter_band) {
            band = 'T';
        } else if (bottom >= 1.0 - config_.running_matter_band) {
            band = 'B';
        } else {
            return "";
        }
        std::string key(1, band);
        key += ':';
        for (char c : run.text) {
            key += std::isdigit(static_cast<unsigned char>(c)) ? '#' : c;
        }
        return key;
    };

    std::map<std::string, size_t> page_counts;
    for (const auto& page : pages) {
        std::set<std::string> seen;
        for (const auto& run : page.runs) {
            std::string key = key_for(run, page);
            if (!key.empty()) {
                seen.insert(key);
            }
        }
        for (const auto& key : seen) {
            page_counts[key]++;
        }
    }

    std::set<std::string> repeated;
    for (const auto& [key, count] : page_counts) {
        if (static_cast<double>(count) > config_.running_matter_page_ratio * text_pages) {
            repeated.insert(key);
        }
    }
    if (repeated.empty()) {
        return 0;
    }

    size_t removed = 0;
    for (auto& page : pages) {
        auto it = std::remove_if(page.runs.begin(), page.runs.end(), [&](const TextRun& run) {
            return repeated.count(key_for(run, page)) > 0;
        });
        removed += static_cast<size_t>(std::distance(it, page.runs.end()));
        page.runs.erase(it, page.runs.end());
    }

    if (verbose_) {
        std::cout << "  Removed " << removed << " running header/footer runs" << std::endl;
    }
    return removed;
}

} // namespace rd
