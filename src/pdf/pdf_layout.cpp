#include "pdf/pdf_layout.hpp"
#include "common/errors.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <memory>
#include <filesystem>
#include <cstdint>
#include <cstring>
#include <stdexcept>

#ifdef HAVE_POPPLER
#include <poppler/cpp/poppler-document.h>
#include <poppler/cpp/poppler-page.h>
#include <poppler/cpp/poppler-page-renderer.h>
#include <poppler/cpp/poppler-image.h>
#endif

namespace fs = std::filesystem;

namespace rd {

#ifdef HAVE_POPPLER
namespace {

constexpr double FIGURE_CELL_POINTS = 4.0;
constexpr double FIGURE_MIN_POINTS = 36.0;
constexpr double FIGURE_MAX_TEXT_COVERAGE = 0.3;
constexpr int FIGURE_MIN_CELL_PIXELS = 2;

void configure_renderer(poppler::page_renderer& renderer) {
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_rgb24);
}

// format_rgb24 stores 0xffRRGGBB as one native 32-bit word per pixel
bool is_ink(const char* pixel) {
    uint32_t value = 0;
    std::memcpy(&value, pixel, sizeof(value));
    int r = static_cast<int>((value >> 16) & 0xff);
    int g = static_cast<int>((value >> 8) & 0xff);
    int b = static_cast<int>(value & 0xff);
    return std::min({r, g, b}) < 224;
}

/**
 * Render a text page, find drawn figures outside its text boxes and save
 * each one as a PNG. Runs inside a saved figure are removed from the page.
 */
std::vector<PageImage> cut_figures(const poppler::page& page, PageLayout& page_layout,
                                   int dpi, const std::string& image_dir) {
    std::vector<PageImage> figures;
    if (page_layout.width <= 0.0 || page_layout.height <= 0.0) {
        return figures;
    }

    poppler::page_renderer renderer;
    configure_renderer(renderer);
    poppler::image rendered = renderer.render_page(&page, dpi, dpi);
    if (!rendered.is_valid()) {
        return figures;
    }

    const double scale = dpi / 72.0;
    const int columns = static_cast<int>(std::ceil(page_layout.width / FIGURE_CELL_POINTS));
    const int rows = static_cast<int>(std::ceil(page_layout.height / FIGURE_CELL_POINTS));
    auto cell_index = [&](double x, double y) {
        int c = std::clamp(static_cast<int>(x / FIGURE_CELL_POINTS), 0, columns - 1);
        int r = std::clamp(static_cast<int>(y / FIGURE_CELL_POINTS), 0, rows - 1);
        return static_cast<size_t>(r) * columns + c;
    };

    // Glyphs are ink too; cells under a text box never count
    std::vector<bool> masked(static_cast<size_t>(columns) * rows, false);
    for (const auto& run : page_layout.runs) {
        for (double y = run.box.y - 1.0; y < run.box.bottom() + 1.0; y += FIGURE_CELL_POINTS / 2.0) {
            for (double x = run.box.x - 1.0; x < run.box.right() + 1.0; x += FIGURE_CELL_POINTS / 2.0) {
                masked[cell_index(x, y)] = true;
            }
            masked[cell_index(run.box.right() + 1.0, y)] = true;
        }
    }

    std::vector<int> ink_pixels(masked.size(), 0);
    const char* data = rendered.const_data();
    for (int py = 0; py < rendered.height(); ++py) {
        const char* row = data + static_cast<size_t>(py) * rendered.bytes_per_row();
        for (int px = 0; px < rendered.width(); ++px) {
            if (is_ink(row + static_cast<size_t>(px) * 4)) {
                ++ink_pixels[cell_index(px / scale, py / scale)];
            }
        }
    }
    std::vector<bool> ink(masked.size(), false);
    for (size_t i = 0; i < ink.size(); ++i) {
        ink[i] = !masked[i] && ink_pixels[i] >= FIGURE_MIN_CELL_PIXELS;
    }

    std::vector<BoundingBox> regions =
        find_figure_regions(ink, columns, rows, FIGURE_CELL_POINTS, FIGURE_MIN_POINTS);

    for (const auto& region : regions) {
        // Mostly text: a table or a boxed sidebar, not a figure
        if (text_coverage(region, page_layout.runs) > FIGURE_MAX_TEXT_COVERAGE) {
            continue;
        }

        int left = std::clamp(static_cast<int>(std::floor(region.x * scale)), 0, rendered.width());
        int top = std::clamp(static_cast<int>(std::floor(region.y * scale)), 0, rendered.height());
        int right = std::clamp(static_cast<int>(std::ceil(region.right() * scale)), 0, rendered.width());
        int bottom = std::clamp(static_cast<int>(std::ceil(region.bottom() * scale)), 0, rendered.height());
        if (right <= left || bottom <= top) {
            continue;
        }

        poppler::image crop(right - left, bottom - top, poppler::image::format_rgb24);
        if (!crop.is_valid()) {
            continue;
        }
        for (int py = top; py < bottom; ++py) {
            std::memcpy(crop.data() + static_cast<size_t>(py - top) * crop.bytes_per_row(),
                        data + static_cast<size_t>(py) * rendered.bytes_per_row() +
                            static_cast<size_t>(left) * 4,
                        static_cast<size_t>(right - left) * 4);
        }

        std::ostringstream id;
        id << "page-" << std::setfill('0') << std::setw(4) << page_layout.page_number
           << "-fig" << std::setw(2) << figures.size() + 1;

        PageImage image;
        image.source_id = id.str();
        image.file_path = (fs::path(image_dir) / (image.source_id + ".png")).string();
        image.page_number = page_layout.page_number;
        image.width = crop.width();
        image.height = crop.height();
        image.is_raster = true;
        image.box = region;

        if (!crop.save(image.file_path, "png", dpi)) {
            throw ExtractionError("Failed to write figure image: " + image.file_path);
        }
        figures.push_back(image);

        // Labels drawn inside the figure go with it
        auto& runs = page_layout.runs;
        runs.erase(std::remove_if(runs.begin(), runs.end(), [&](const TextRun& run) {
            return run.box.x >= region.x && run.box.y >= region.y &&
                   run.box.right() <= region.right() && run.box.bottom() <= region.bottom();
        }), runs.end());
    }
    return figures;
}

} // namespace
#endif

// ============================================================================
// BoundingBox
// ============================================================================

BoundingBox BoundingBox::united(const BoundingBox& other) const {
    BoundingBox out;
    out.x = std::min(x, other.x);
    out.y = std::min(y, other.y);
    out.width = std::max(right(), other.right()) - out.x;
    out.height = std::max(bottom(), other.bottom()) - out.y;
    return out;
}

// ============================================================================
// PDFLayout
// ============================================================================

size_t PDFLayout::get_total_runs() const {
    size_t total = 0;
    for (const auto& page : pages) {
        total += page.runs.size();
    }
    return total;
}

// ============================================================================
// PDFLayoutExtractor
// ============================================================================

PDFLayoutExtractor::PDFLayoutExtractor() {}

PDFLayoutExtractor::~PDFLayoutExtractor() {}

bool PDFLayoutExtractor::is_available() {
#ifdef HAVE_POPPLER
    return true;
#else
    return false;
#endif
}

std::string PDFLayoutExtractor::generate_document_id(const std::string& file_path) const {
    std::string filename = fs::path(file_path).stem().string();

    // Sanitize: replace non-alphanumeric with underscore
    std::string doc_id;
    for (char c : filename) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-') {
            doc_id += c;
        } else {
            doc_id += '_';
        }
    }

    return doc_id.empty() ? "book" : doc_id;
}

PDFLayout PDFLayoutExtractor::load_layout(const std::string& file_path,
                                          const std::string& image_dir) {
#ifndef HAVE_POPPLER
    (void)file_path;
    (void)image_dir;
    throw ExtractionError("Poppler support not available. Rebuild with Poppler.");
#else
    if (verbose_) {
        std::cout << "Loading PDF: " << file_path << std::endl;
    }

    std::unique_ptr<poppler::document> doc(
        poppler::document::load_from_file(file_path)
    );

    if (!doc) {
        throw ExtractionError("Failed to load PDF: " + file_path);
    }

    if (doc->is_locked()) {
        throw ExtractionError("PDF is password protected: " + file_path);
    }

    PDFLayout layout;
    layout.file_path = file_path;
    layout.document_id = generate_document_id(file_path);
    layout.metadata.num_pages = doc->pages();

    auto get_info = [&](const std::string& key) -> std::string {
        poppler::ustring info = doc->info_key(key);
        std::vector<char> utf8_data = info.to_utf8();
        return sanitize_text(std::string(utf8_data.begin(), utf8_data.end()));
    };

    layout.metadata.title = get_info("Title");
    layout.metadata.author = get_info("Author");
    layout.metadata.subject = get_info("Subject");
    layout.metadata.keywords = get_info("Keywords");
    layout.metadata.creator = get_info("Creator");
    layout.metadata.producer = get_info("Producer");
    layout.metadata.creation_date = get_info("CreationDate");

    if (verbose_) {
        std::cout << "  Pages: " << layout.metadata.num_pages << std::endl;
        if (!layout.metadata.title.empty()) {
            std::cout << "  Title: " << layout.metadata.title << std::endl;
        }
    }

    for (int i = 0; i < doc->pages(); ++i) {
        std::unique_ptr<poppler::page> page(doc->create_page(i));
        if (!page) {
            throw ExtractionError("Failed to read page " + std::to_string(i + 1) +
                                  " of " + file_path);
        }

        PageLayout page_layout;
        page_layout.page_number = i + 1;
        poppler::rectf page_rect = page->page_rect();
        page_layout.width = page_rect.width();
        page_layout.height = page_rect.height();

        // text_list boxes already use a top-left origin
        std::vector<poppler::text_box> boxes =
            page->text_list(poppler::page::text_list_include_font);

        for (auto& box : boxes) {
            poppler::byte_array bytes = box.text().to_utf8();
            std::string text = sanitize_text(std::string(bytes.begin(), bytes.end()));
            if (text.empty()) {
                continue;
            }

            poppler::rectf bbox = box.bbox();

            TextRun run;
            run.text = text;
            run.box.x = bbox.x();
            run.box.y = bbox.y();
            run.box.width = bbox.width();
            run.box.height = bbox.height();
            run.page_number = page_layout.page_number;

            std::string font_name = box.get_font_name();
            if (font_name == "*ignored*") {
                font_name.clear();
            }
            run.font_family = font_family_from_name(font_name);
            run.style = style_from_font_name(font_name);

            double size = box.get_font_size();
            run.font_size = size > 0.0 ? size : bbox.height();

            page_layout.runs.push_back(std::move(run));
        }

        if (!page_layout.runs.empty() && detect_figures_ && !image_dir.empty() &&
            poppler::page_renderer::can_render()) {
            fs::create_directories(image_dir);
            page_layout.images = cut_figures(*page, page_layout, render_dpi_, image_dir);
        } else if (page_layout.runs.empty() && !image_dir.empty() &&
                   poppler::page_renderer::can_render()) {
            fs::create_directories(image_dir);

            poppler::page_renderer renderer;
            configure_renderer(renderer);
            poppler::image rendered = renderer.render_page(page.get(), render_dpi_, render_dpi_);
            if (rendered.is_valid()) {
                std::ostringstream id;
                id << "page-" << std::setfill('0') << std::setw(4) << page_layout.page_number;

                PageImage image;
                image.source_id = id.str();
                image.file_path = (fs::path(image_dir) / (image.source_id + ".png")).string();
                image.page_number = page_layout.page_number;
                image.width = rendered.width();
                image.height = rendered.height();
                image.is_raster = true;

                if (!rendered.save(image.file_path, "png", render_dpi_)) {
                    throw ExtractionError("Failed to write rendered page image: " + image.file_path);
                }
                page_layout.images.push_back(image);
            }
        }

        if (verbose_) {
            std::cout << "  Page " << page_layout.page_number << ": "
                      << page_layout.runs.size() << " runs";
            if (page_layout.runs.empty() && !page_layout.images.empty()) {
                std::cout << ", rendered as image";
            } else if (!page_layout.images.empty()) {
                std::cout << ", " << page_layout.images.size() << " figure(s)";
            }
            std::cout << std::endl;
        }

        layout.pages.push_back(std::move(page_layout));
    }

    if (verbose_) {
        std::cout << "  Total: " << layout.get_total_runs() << " text runs" << std::endl;
    }

    return layout;
#endif
}

// ============================================================================
// Utility Functions
// ============================================================================

std::vector<BoundingBox> find_figure_regions(const std::vector<bool>& ink, int columns, int rows,
                                             double cell_size, double min_extent) {
    if (columns < 0 || rows < 0 ||
        ink.size() != static_cast<size_t>(columns) * static_cast<size_t>(rows)) {
        throw std::invalid_argument("Ink mask does not match its " + std::to_string(columns) +
                                    "x" + std::to_string(rows) + " grid");
    }

    // Grow ink by one cell so strokes a cell apart connect
    std::vector<bool> grown(ink.size(), false);
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < columns; ++c) {
            if (!ink[static_cast<size_t>(r) * columns + c]) continue;
            for (int dr = -1; dr <= 1; ++dr) {
                for (int dc = -1; dc <= 1; ++dc) {
                    int nr = r + dr;
                    int nc = c + dc;
                    if (nr >= 0 && nr < rows && nc >= 0 && nc < columns) {
                        grown[static_cast<size_t>(nr) * columns + nc] = true;
                    }
                }
            }
        }
    }

    std::vector<BoundingBox> regions;
    std::vector<bool> visited(ink.size(), false);
    std::vector<size_t> stack;
    for (size_t start = 0; start < ink.size(); ++start) {
        if (!ink[start] || visited[start]) continue;

        // Extent over real ink cells only; growth just links them
        int left = columns;
        int top = rows;
        int right = -1;
        int bottom = -1;
        visited[start] = true;
        stack.push_back(start);
        while (!stack.empty()) {
            size_t cell = stack.back();
            stack.pop_back();
            int r = static_cast<int>(cell / columns);
            int c = static_cast<int>(cell % columns);
            if (ink[cell]) {
                left = std::min(left, c);
                right = std::max(right, c);
                top = std::min(top, r);
                bottom = std::max(bottom, r);
            }
            for (int dr = -1; dr <= 1; ++dr) {
                for (int dc = -1; dc <= 1; ++dc) {
                    int nr = r + dr;
                    int nc = c + dc;
                    if (nr < 0 || nr >= rows || nc < 0 || nc >= columns) continue;
                    size_t next = static_cast<size_t>(nr) * columns + nc;
                    if (grown[next] && !visited[next]) {
                        visited[next] = true;
                        stack.push_back(next);
                    }
                }
            }
        }

        BoundingBox box;
        box.x = left * cell_size;
        box.y = top * cell_size;
        box.width = (right - left + 1) * cell_size;
        box.height = (bottom - top + 1) * cell_size;
        if (box.width >= min_extent && box.height >= min_extent) {
            regions.push_back(box);
        }
    }

    auto overlaps = [](const BoundingBox& a, const BoundingBox& b) {
        return a.x < b.right() && b.x < a.right() && a.y < b.bottom() && b.y < a.bottom();
    };
    for (bool merged = true; merged;) {
        merged = false;
        for (size_t i = 0; i < regions.size() && !merged; ++i) {
            for (size_t j = i + 1; j < regions.size(); ++j) {
                if (overlaps(regions[i], regions[j])) {
                    regions[i] = regions[i].united(regions[j]);
                    regions.erase(regions.begin() + static_cast<std::ptrdiff_t>(j));
                    merged = true;
                    break;
                }
            }
        }
    }

    std::sort(regions.begin(), regions.end(), [](const BoundingBox& a, const BoundingBox& b) {
        if (a.y != b.y) return a.y < b.y;
        return a.x < b.x;
    });
    return regions;
}

double text_coverage(const BoundingBox& region, const std::vector<TextRun>& runs) {
    double area = region.width * region.height;
    if (area <= 0.0) {
        return 0.0;
    }
    double covered = 0.0;
    for (const auto& run : runs) {
        double w = std::min(region.right(), run.box.right()) - std::max(region.x, run.box.x);
        double h = std::min(region.bottom(), run.box.bottom()) - std::max(region.y, run.box.y);
        if (w > 0.0 && h > 0.0) {
            covered += w * h;
        }
    }
    return std::min(1.0, covered / area);
}

RunStyle style_from_font_name(const std::string& font_name) {
    std::string lower = font_name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    RunStyle style;
    style.bold = lower.find("bold") != std::string::npos ||
                 lower.find("black") != std::string::npos ||
                 lower.find("heavy") != std::string::npos;
    style.italic = lower.find("italic") != std::string::npos ||
                   lower.find("oblique") != std::string::npos;
    return style;
}

std::string font_family_from_name(const std::string& font_name) {
    size_t plus = font_name.find('+');
    if (plus == 6) {
        return font_name.substr(plus + 1);
    }
    return font_name;
}

std::string sanitize_text(const std::string& text) {
    std::string result;
    result.reserve(text.length());

    bool last_was_space = false;

    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);

        // Remove control characters except newlines and tabs
        if (uc < 0x80 && std::iscntrl(uc) && c != '\n' && c != '\t') {
            continue;
        }

        // Normalize whitespace
        if (uc < 0x80 && std::isspace(uc)) {
            if (!last_was_space && !result.empty()) {
                result += ' ';
            }
            last_was_space = true;
        } else {
            result += c;
            last_was_space = false;
        }
    }

    while (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }

    return result;
}

} // namespace rd
