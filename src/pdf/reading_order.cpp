#include "pdf/reading_order.hpp"
#include <algorithm>
#include <stdexcept>
#include <cmath>

namespace rd {

ReadingOrderReconstructor::ReadingOrderReconstructor(const ReadingOrderConfig& config)
    : config_(config) {
    if (config_.grid_rows < 1 || config_.grid_columns < 1) {
        throw std::invalid_argument("Reading order grid needs at least one row and one column");
    }
    if (config_.min_column_lines < 1) {
        throw std::invalid_argument("A column needs at least one line");
    }
}

// ============================================================================
// Lines
// ============================================================================

std::vector<std::vector<TextRun>> ReadingOrderReconstructor::group_lines(
    const std::vector<TextRun>& runs
) const {
    std::vector<TextRun> sorted = runs;
    std::stable_sort(sorted.begin(), sorted.end(), [](const TextRun& a, const TextRun& b) {
        return a.box.y + a.box.height / 2.0 < b.box.y + b.box.height / 2.0;
    });

    std::vector<std::vector<TextRun>> lines;
    double top = 0.0;
    double bottom = 0.0;
    for (auto& run : sorted) {
        if (!lines.empty()) {
            double overlap = std::min(bottom, run.box.bottom()) - std::max(top, run.box.y);
            double shorter = std::min(bottom - top, run.box.height);
            bool same_line = shorter <= 0.0
                ? std::abs(run.box.y - top) < 1.0
                : overlap >= config_.line_overlap * shorter;
            if (same_line) {
                top = std::min(top, run.box.y);
                bottom = std::max(bottom, run.box.bottom());
                lines.back().push_back(std::move(run));
                continue;
            }
        }
        top = run.box.y;
        bottom = run.box.bottom();
        lines.emplace_back();
        lines.back().push_back(std::move(run));
    }

    for (auto& line : lines) {
        std::stable_sort(line.begin(), line.end(), [](const TextRun& a, const TextRun& b) {
            return a.box.x < b.box.x;
        });
    }
    return lines;
}

TextRun merge_line_runs(const std::vector<TextRun>& runs) {
    if (runs.empty()) {
        return TextRun();
    }

    TextRun merged = runs.front();
    const TextRun* longest = &runs.front();
    for (size_t i = 1; i < runs.size(); ++i) {
        const TextRun& piece = runs[i];
        // Style changes inside a word arrive as touching pieces
        double gap = piece.box.x - runs[i - 1].box.right();
        bool touching = gap < 0.15 * std::max(piece.font_size, 1.0);
        if (!touching && !merged.text.empty() && merged.text.back() != ' ') {
            merged.text += ' ';
        }
        merged.text += piece.text;
        merged.box = merged.box.united(piece.box);
        merged.style.bold = merged.style.bold && piece.style.bold;
        merged.style.italic = merged.style.italic && piece.style.italic;
        if (piece.text.size() > longest->text.size()) {
            longest = &piece;
        }
    }
    merged.font_size = longest->font_size;
    merged.font_family = longest->font_family;
    return merged;
}

// ============================================================================
// Columns
// ============================================================================

std::vector<double> ReadingOrderReconstructor::detect_gutters(
    const std::vector<std::vector<TextRun>>& lines
) const {
    if (config_.grid_columns < 2 ||
        lines.size() < static_cast<size_t>(config_.min_column_lines)) {
        return {};
    }

    double left = 0.0;
    double right = 0.0;
    bool first = true;
    for (const auto& line : lines) {
        for (const auto& run : line) {
            left = first ? run.box.x : std::min(left, run.box.x);
            right = first ? run.box.right() : std::max(right, run.box.right());
            first = false;
        }
    }
    double extent = right - left;
    if (extent <= 0.0) {
        return {};
    }

    // A column is never narrower than this
    double min_column = extent / (2.0 * config_.grid_columns);
    double allowed_crossing = config_.max_gutter_crossing * static_cast<double>(lines.size());

    struct Interval {
        double begin = 0.0;
        double end = 0.0;
        size_t crossing = 0;
    };
    std::vector<Interval> intervals;
    bool open = false;

    for (double x = left + min_column; x <= right - min_column; x += 1.0) {
        size_t crossing = 0;
        size_t left_lines = 0;
        size_t right_lines = 0;
        for (const auto& line : lines) {
            bool crosses = false;
            bool has_left = false;
            bool has_right = false;
            for (const auto& run : line) {
                if (run.box.x < x && run.box.right() > x) crosses = true;
                if (run.box.right() <= x) has_left = true;
                if (run.box.x >= x) has_right = true;
            }
            if (crosses) {
                ++crossing;
            } else {
                if (has_left) ++left_lines;
                if (has_right) ++right_lines;
            }
        }

        bool valid = static_cast<double>(crossing) <= allowed_crossing &&
                     left_lines >= static_cast<size_t>(config_.min_column_lines) &&
                     right_lines >= static_cast<size_t>(config_.min_column_lines);
        if (!valid) {
            open = false;
            continue;
        }
        if (!open) {
            intervals.push_back({x, x, crossing});
            open = true;
        } else {
            intervals.back().end = x;
            intervals.back().crossing = std::min(intervals.back().crossing, crossing);
        }
    }

    // Cleanest and widest gutters first
    std::sort(intervals.begin(), intervals.end(), [](const Interval& a, const Interval& b) {
        if (a.crossing != b.crossing) return a.crossing < b.crossing;
        return a.end - a.begin > b.end - b.begin;
    });

    std::vector<double> gutters;
    for (const auto& interval : intervals) {
        if (gutters.size() + 1 >= static_cast<size_t>(config_.grid_columns)) {
            break;
        }
        double middle = (interval.begin + interval.end) / 2.0;
        bool apart = std::all_of(gutters.begin(), gutters.end(), [&](double g) {
            return std::abs(g - middle) >= min_column;
        });
        if (apart) {
            gutters.push_back(middle);
        }
    }
    std::sort(gutters.begin(), gutters.end());
    return gutters;
}

// ============================================================================
// Grid
// ============================================================================

std::pair<int, int> ReadingOrderReconstructor::cell_for(
    const TextRun& run,
    double page_height,
    const std::vector<double>& gutters
) const {
    int row = 0;
    if (page_height > 0.0) {
        row = static_cast<int>(std::floor(run.box.y / page_height * config_.grid_rows));
        row = std::clamp(row, 0, config_.grid_rows - 1);
    }

    // Runs spanning several cells belong to the cell of their top-left corner
    int col = static_cast<int>(std::count_if(gutters.begin(), gutters.end(),
                                             [&](double g) { return g <= run.box.x; }));
    return {row, col};
}

std::vector<TextRun> ReadingOrderReconstructor::order_page(const PageLayout& page) const {
    if (page.runs.empty()) {
        return {};
    }

    // Some producers report a zero media box; fall back to the content extent
    double height = page.height;
    if (height <= 0.0) {
        for (const auto& run : page.runs) {
            height = std::max(height, run.box.bottom());
        }
    }

    std::vector<std::vector<TextRun>> lines = group_lines(page.runs);
    std::vector<double> gutters = detect_gutters(lines);

    struct Placed {
        std::pair<int, int> cell;
        size_t line_index;
        TextRun run;
    };

    std::vector<Placed> placed;
    for (size_t li = 0; li < lines.size(); ++li) {
        const auto& line = lines[li];

        // A line running across a gutter is not cut there
        std::vector<double> cuts;
        for (double g : gutters) {
            bool crossed = std::any_of(line.begin(), line.end(), [&](const TextRun& r) {
                return r.box.x < g && r.box.right() > g;
            });
            if (!crossed) cuts.push_back(g);
        }

        std::vector<TextRun> segment;
        auto flush = [&]() {
            if (segment.empty()) return;
            TextRun merged = merge_line_runs(segment);
            placed.push_back({cell_for(merged, height, gutters), li, std::move(merged)});
            segment.clear();
        };
        for (const auto& run : line) {
            if (!segment.empty()) {
                double prev_right = segment.back().box.right();
                bool cut = std::any_of(cuts.begin(), cuts.end(), [&](double g) {
                    return prev_right <= g && run.box.x >= g;
                });
                if (cut) flush();
            }
            segment.push_back(run);
        }
        flush();
    }

    std::stable_sort(placed.begin(), placed.end(), [](const Placed& a, const Placed& b) {
        if (a.cell != b.cell) {
            return a.cell < b.cell;
        }
        if (a.line_index != b.line_index) {
            return a.line_index < b.line_index;
        }
        return a.run.box.x < b.run.box.x;
    });

    std::vector<TextRun> ordered;
    ordered.reserve(placed.size());
    for (auto& p : placed) {
        ordered.push_back(std::move(p.run));
    }
    return ordered;
}

} // namespace rd
