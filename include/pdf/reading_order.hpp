#pragma once

#include "pdf/pdf_layout.hpp"
#include <vector>
#include <utility>

namespace rd {

/**
 * @brief Grid resolution and line/column detection used to order runs on a page
 */
struct ReadingOrderConfig {
    int grid_rows = 12;                 ///< Horizontal row bands
    int grid_columns = 2;               ///< Most columns a page is split into
    double line_overlap = 0.5;          ///< Shared height (x shorter run) putting two runs on one line
    int min_column_lines = 3;           ///< Lines needed on each side of a column gutter
    double max_gutter_crossing = 0.2;   ///< Share of lines allowed to run across a gutter
};

/**
 * @brief Orders the text runs of one page into reading order
 *
 * Word-level runs are first grouped into lines. Column gutters are taken
 * from the content: an x position that few lines cross while enough lines
 * sit on either side of it. Each line is cut at the gutters into segments
 * and each segment is merged into a single run. Segments are then placed
 * on a grid whose row bands are fixed and whose column edges are the
 * gutters; a segment lands in the cell holding its top-left corner. Cells
 * are read top-to-bottom by row band and left-to-right inside a band;
 * segments inside a cell follow their line, then their horizontal position.
 *
 * A page without gutters is a single column, whatever its width.
 */
class ReadingOrderReconstructor {
public:
    explicit ReadingOrderReconstructor(const ReadingOrderConfig& config = ReadingOrderConfig());

    /**
     * @brief Produce the linear reading order of a page, one run per line segment
     *
     * An empty page yields an empty ordering.
     */
    std::vector<TextRun> order_page(const PageLayout& page) const;

    /**
     * @brief Cluster runs into lines, top to bottom, each line left to right
     *
     * Runs share a line when their vertical extents overlap by at least
     * line_overlap of the shorter one, so words of mixed font size stay
     * on their line.
     */
    std::vector<std::vector<TextRun>> group_lines(const std::vector<TextRun>& runs) const;

    /**
     * @brief Column gutters of a page, ascending x
     */
    std::vector<double> detect_gutters(const std::vector<std::vector<TextRun>>& lines) const;

    /**
     * @brief Grid cell (row band, column) of a run
     */
    std::pair<int, int> cell_for(const TextRun& run, double page_height,
                                 const std::vector<double>& gutters) const;

private:
    ReadingOrderConfig config_;
};

/**
 * @brief Merge the runs of one line segment into a single run
 *
 * Texts are joined with a space unless the pieces touch. The merged run
 * takes the font of its longest piece and is bold or italic only when
 * every piece is.
 */
TextRun merge_line_runs(const std::vector<TextRun>& runs);

} // namespace rd
