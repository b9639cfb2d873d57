#include "pdf/pdf_structurer.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <regex>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace rd {

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool starts_with_bullet(const std::string& text) {
    return text.rfind("\xE2\x80\xA2", 0) == 0 || text.rfind("\xC2\xB7", 0) == 0 ||
           text.rfind("\xE2\x80\x93 ", 0) == 0 || text.rfind("- ", 0) == 0 ||
           text.rfind("* ", 0) == 0;
}

} // namespace

std::vector<std::string> split_authors(const std::string& author_field) {
    static const std::regex separators(R"(\s*(?:;|,|&|\band\b)\s*)");
    std::vector<std::string> authors;
    std::sregex_token_iterator it(author_field.begin(), author_field.end(), separators, -1);
    for (; it != std::sregex_token_iterator(); ++it) {
        std::string name = trim(it->str());
        if (!name.empty()) authors.push_back(name);
    }
    return authors;
}

std::string strip_list_marker(const std::string& text) {
    static const std::regex marker(
        R"(^(\xE2\x80\xA2|\xC2\xB7|\xE2\x80\x93|[-*]|[0-9]{1,3}[.)]|[a-z][.)]|\([0-9a-z]{1,3}\))\s*)");
    return trim(std::regex_replace(text, marker, "", std::regex_constants::format_first_only));
}

// ============================================================================
// PdfStructuralProcessor
// ============================================================================

PdfStructuralProcessor::PdfStructuralProcessor(ReferenceMapper& mapper,
                                               const PdfStructureConfig& config)
    : mapper_(mapper), config_(config) {}

std::vector<size_t> PdfStructuralProcessor::find_chapter_starts(
    const std::vector<Paragraph>& paragraphs, double body_size) const {
    std::vector<size_t> starts;
    double threshold = config_.chapter_font_ratio * body_size;

    for (size_t i = 0; i < paragraphs.size(); ++i) {
        const Paragraph& para = paragraphs[i];
        bool opens_page = i == 0 || paragraphs[i - 1].page_number != para.page_number;
        if (opens_page && para.role == ParagraphRole::HEADING_CANDIDATE &&
            para.font_size() >= threshold) {
            starts.push_back(i);
        }
    }
    return starts;
}

std::vector<double> PdfStructuralProcessor::heading_tiers(
    const std::vector<Paragraph>& paragraphs) const {
    std::vector<double> sizes;
    for (const auto& para : paragraphs) {
        if (para.role == ParagraphRole::HEADING_CANDIDATE) {
            sizes.push_back(para.font_size());
        }
    }
    std::sort(sizes.begin(), sizes.end(), std::greater<double>());

    std::vector<double> tiers;
    for (double size : sizes) {
        if (tiers.empty() || tiers.back() - size > config_.font_size_tolerance) {
            tiers.push_back(size);
        }
    }
    return tiers;
}

int PdfStructuralProcessor::tier_of(double font_size, const std::vector<double>& tiers) const {
    for (size_t i = 0; i < tiers.size(); ++i) {
        if (std::abs(tiers[i] - font_size) <= config_.font_size_tolerance) {
            return static_cast<int>(i) + 1;
        }
    }
    return static_cast<int>(tiers.size()) + 1;
}

StructuredDocument PdfStructuralProcessor::process(const PDFLayout& layout,
                                                   const std::vector<Paragraph>& paragraphs,
                                                   double body_size,
                                                   const std::string& media_dir) {
    media_dir_ = media_dir;
    image_counter_ = 0;

    StructuredDocument doc;
    doc.source_path = layout.file_path;
    doc.format = SourceFormat::PDF;
    fill_metadata(layout, paragraphs, doc);
    doc.book_id = make_book_id(layout.file_path, doc.metadata.isbn);

    // Paragraphs and page images interleaved in page order; a figure cut
    // from a text page goes before the first paragraph below its top edge
    std::vector<Block> blocks;
    std::vector<size_t> block_of_paragraph(paragraphs.size(), 0);
    size_t next_para = 0;
    for (const auto& page : layout.pages) {
        size_t next_image = 0;
        while (next_para < paragraphs.size() &&
               paragraphs[next_para].page_number <= page.page_number) {
            const Paragraph& para = paragraphs[next_para];
            while (next_image < page.images.size() && para.page_number == page.page_number &&
                   page.images[next_image].is_positioned() &&
                   para.box.y > page.images[next_image].box.y) {
                blocks.push_back({nullptr, &page.images[next_image], page.page_number});
                ++next_image;
            }
            block_of_paragraph[next_para] = blocks.size();
            blocks.push_back({&para, nullptr, para.page_number});
            ++next_para;
        }
        for (; next_image < page.images.size(); ++next_image) {
            blocks.push_back({nullptr, &page.images[next_image], page.page_number});
        }
    }
    while (next_para < paragraphs.size()) {
        block_of_paragraph[next_para] = blocks.size();
        blocks.push_back({&paragraphs[next_para], nullptr, paragraphs[next_para].page_number});
        ++next_para;
    }

    std::vector<size_t> starts;
    for (size_t index : find_chapter_starts(paragraphs, body_size)) {
        starts.push_back(block_of_paragraph[index]);
    }

    // Chapter headings are titles, not section tiers
    std::vector<Paragraph> section_candidates;
    std::set<const Paragraph*> chapter_openers;
    for (size_t index : find_chapter_starts(paragraphs, body_size)) {
        chapter_openers.insert(&paragraphs[index]);
    }
    for (const auto& para : paragraphs) {
        if (!chapter_openers.count(&para)) section_candidates.push_back(para);
    }
    std::vector<double> tiers = heading_tiers(section_candidates);
    if (tiers.size() > static_cast<size_t>(config_.max_section_tiers)) {
        tiers.resize(static_cast<size_t>(config_.max_section_tiers));
    }

    std::string source_name = fs::path(layout.file_path).filename().string();
    auto add_chapter = [&](size_t begin, size_t end, bool front_matter) {
        if (begin >= end) return;
        std::ostringstream source;
        source << source_name << "#page=" << blocks[begin].page_number;
        Chapter& chapter = doc.add_chapter(source.str());
        mapper_.register_chapter(source.str(), chapter.id());
        std::vector<Block> range(blocks.begin() + static_cast<std::ptrdiff_t>(begin),
                                 blocks.begin() + static_cast<std::ptrdiff_t>(end));
        fill_chapter(chapter, range, tiers, front_matter);
    };

    size_t first = starts.empty() ? blocks.size() : starts.front();
    add_chapter(0, first, true);
    for (size_t i = 0; i < starts.size(); ++i) {
        size_t end = i + 1 < starts.size() ? starts[i + 1] : blocks.size();
        add_chapter(starts[i], end, false);
    }

    if (verbose_) {
        std::cout << "  Chapters: " << doc.chapters.size()
                  << ", section tiers: " << tiers.size()
                  << ", page images: " << image_counter_ << std::endl;
    }
    return doc;
}

void PdfStructuralProcessor::fill_chapter(Chapter& chapter, const std::vector<Block>& blocks,
                                          const std::vector<double>& tiers,
                                          bool is_front_matter) {
    // Title search runs over the opening paragraphs only
    std::vector<Paragraph> opening;
    std::vector<size_t> opening_blocks;
    for (size_t i = 0; i < blocks.size() && opening.size() < config_.title.opening_blocks; ++i) {
        if (blocks[i].paragraph) {
            opening.push_back(*blocks[i].paragraph);
            opening_blocks.push_back(i);
        }
    }

    std::set<size_t> consumed;
    ChapterTitleExtractor extractor(config_.title);
    ChapterTitle title = extractor.extract(opening);
    if (title.is_placeholder && is_front_matter) {
        chapter.set_title("Front Matter");
    } else {
        chapter.set_title(title.text);
        for (size_t index : title.block_indices) {
            consumed.insert(opening_blocks[index]);
        }
    }

    ChapterContext ctx;
    ctx.chapter = &chapter;
    for (size_t i = 0; i < blocks.size(); ++i) {
        if (consumed.count(i)) continue;
        if (blocks[i].image) {
            ctx.open_list = pugi::xml_node();
            append_image(*blocks[i].image, ctx);
        } else {
            append_paragraph(*blocks[i].paragraph, tiers, ctx);
        }
    }
}

pugi::xml_node PdfStructuralProcessor::current_container(ChapterContext& ctx) const {
    return ctx.sections.empty() ? ctx.chapter->root() : ctx.sections.back().second;
}

void PdfStructuralProcessor::append_paragraph(const Paragraph& paragraph,
                                              const std::vector<double>& tiers,
                                              ChapterContext& ctx) {
    std::string text = trim(paragraph.text());
    if (text.empty()) return;

    if (paragraph.role == ParagraphRole::LIST_ITEM) {
        bool ordered = !starts_with_bullet(text);
        if (!ctx.open_list || ctx.open_list_ordered != ordered) {
            ctx.open_list = current_container(ctx).append_child(
                ordered ? "orderedlist" : "itemizedlist");
            ctx.open_list_ordered = ordered;
        }
        pugi::xml_node item = ctx.open_list.append_child("listitem");
        item.append_child("para").text().set(strip_list_marker(text).c_str());
        return;
    }
    ctx.open_list = pugi::xml_node();

    if (paragraph.role == ParagraphRole::HEADING_CANDIDATE) {
        int level = tier_of(paragraph.font_size(), tiers);
        if (level <= static_cast<int>(tiers.size())) {
            while (!ctx.sections.empty() && ctx.sections.back().first >= level) {
                ctx.sections.pop_back();
            }
            pugi::xml_node section = current_container(ctx).append_child("section");
            section.append_child("title").text().set(text.c_str());
            ctx.sections.emplace_back(level, section);
            return;
        }
        pugi::xml_node para = current_container(ctx).append_child("para");
        pugi::xml_node emphasis = para.append_child("emphasis");
        emphasis.append_attribute("role") = "bold";
        emphasis.text().set(text.c_str());
        return;
    }

    pugi::xml_node container = current_container(ctx);
    if (paragraph.role == ParagraphRole::CAPTION) {
        // A caption right after a page figure becomes its title
        pugi::xml_node last = container.last_child();
        if (last && std::string(last.name()) == "informalfigure") {
            last.set_name("figure");
            pugi::xml_node title = last.prepend_child("title");
            title.text().set(text.c_str());
            return;
        }
    }
    container.append_child("para").text().set(text.c_str());
}

void PdfStructuralProcessor::append_image(const PageImage& image, ChapterContext& ctx) {
    std::error_code ec;
    fs::create_directories(media_dir_, ec);

    std::string ext = fs::path(image.file_path).extension().string();
    if (ext.empty()) ext = ".png";
    std::ostringstream name;
    name << "img_" << std::setfill('0') << std::setw(4) << ++image_counter_ << ext;
    fs::path target = fs::path(media_dir_) / name.str();

    if (fs::absolute(image.file_path) != fs::absolute(target)) {
        fs::copy_file(image.file_path, target, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw ExtractionError("Cannot copy page image " + image.file_path + ": " + ec.message());
        }
    }

    ResourceGeometry geometry;
    geometry.width = image.width;
    geometry.height = image.height;
    geometry.is_raster = image.is_raster;
    geometry.is_vector = !image.is_raster;
    std::error_code size_ec;
    auto size = fs::file_size(target, size_ec);
    geometry.file_size = size_ec ? 0 : static_cast<size_t>(size);

    mapper_.register_resource(image.source_id, name.str(), ResourceKind::IMAGE, geometry);
    mapper_.record_reference(image.source_id, ctx.chapter->id());

    pugi::xml_node figure = current_container(ctx).append_child("informalfigure");
    pugi::xml_node imageobject = figure.append_child("mediaobject").append_child("imageobject");
    imageobject.append_child("imagedata").append_attribute("fileref") = name.str().c_str();
}

void PdfStructuralProcessor::fill_metadata(const PDFLayout& layout,
                                           const std::vector<Paragraph>& paragraphs,
                                           StructuredDocument& doc) const {
    const PDFMetadata& info = layout.metadata;
    doc.metadata.title = trim(info.title);
    doc.metadata.subtitle = trim(info.subject);
    doc.metadata.authors = split_authors(info.author);
    // PDF dates read "D:YYYYMMDDHHmmSS..."
    const std::string& date = info.creation_date;
    if (date.rfind("D:", 0) == 0 && date.size() >= 6) {
        doc.metadata.pubdate = extract_year(date.substr(2, 4));
    } else {
        doc.metadata.pubdate = extract_year(date);
    }
    doc.metadata.copyright_year = doc.metadata.pubdate;

    // ISBN and copyright are usually printed on the first pages
    static const std::regex isbn_re(R"(ISBN(?:-1[03])?:?\s*([0-9Xx][0-9Xx\- ]{8,20}[0-9Xx]))");
    static const std::regex copyright_re(
        R"((?:©|\(c\)|Copyright)\s*(?:©\s*)?([12][0-9]{3})\s*(?:by\s+)?([^.]*))",
        std::regex::icase);
    for (const auto& para : paragraphs) {
        if (para.page_number > 10) break;
        std::string text = para.text();
        std::smatch m;
        if (doc.metadata.isbn.empty() && std::regex_search(text, m, isbn_re)) {
            doc.metadata.isbn = normalize_isbn(m[1].str());
        }
        if (doc.metadata.copyright_holder.empty() && std::regex_search(text, m, copyright_re)) {
            doc.metadata.copyright_year = m[1].str();
            doc.metadata.copyright_holder = trim(m[2].str());
        }
    }
}

} // namespace rd
