#include "epub/epub_structurer.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <limits>
#include <regex>
#include <set>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace rd {

namespace {

// Lowercase local name ("html:p" -> "p")
std::string lname(const pugi::xml_node& node) {
    const char* name = node.name();
    const char* colon = std::strchr(name, ':');
    std::string out = colon ? colon + 1 : name;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}

bool is_text(const pugi::xml_node& node) {
    return node.type() == pugi::node_pcdata || node.type() == pugi::node_cdata;
}

std::string collapse_whitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool space = false;
    for (char c : text) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            if (!space) out += ' ';
            space = true;
        } else {
            out += c;
            space = false;
        }
    }
    return out;
}

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string collect_text(const pugi::xml_node& node) {
    std::string out;
    for (pugi::xml_node n = node.first_child(); n; n = n.next_sibling()) {
        if (is_text(n)) {
            out += n.value();
        } else if (n.type() == pugi::node_element) {
            out += collect_text(n);
        }
    }
    return out;
}

int heading_level(const std::string& name) {
    if (name.size() == 2 && name[0] == 'h' && name[1] >= '1' && name[1] <= '6') {
        return name[1] - '0';
    }
    return 0;
}

const std::set<std::string>& inline_names() {
    static const std::set<std::string> names = {
        "a", "abbr", "acronym", "b", "bdi", "bdo", "big", "br", "cite", "code", "del",
        "dfn", "em", "font", "i", "ins", "kbd", "mark", "q", "s", "samp", "small",
        "span", "strike", "strong", "sub", "sup", "time", "tt", "u", "var", "wbr"
    };
    return names;
}

const std::set<std::string>& skipped_names() {
    static const std::set<std::string> names = {
        "script", "style", "head", "meta", "link", "hr", "noscript", "template"
    };
    return names;
}

bool has_image(const pugi::xml_node& node) {
    return node.find_node([](pugi::xml_node n) {
        std::string name = lname(n);
        return name == "img" || name == "image";
    });
}

// <p><img/></p> or <p><a><img/></a></p>: image with no text around it
bool only_images(const pugi::xml_node& node) {
    return has_image(node) && is_blank(collect_text(node));
}

void trim_edges(pugi::xml_node node) {
    pugi::xml_node first = node.first_child();
    if (first && first.type() == pugi::node_pcdata) {
        std::string v = first.value();
        size_t start = v.find_first_not_of(' ');
        if (start == std::string::npos) {
            node.remove_child(first);
        } else if (start > 0) {
            first.set_value(v.substr(start).c_str());
        }
    }
    pugi::xml_node last = node.last_child();
    if (last && last.type() == pugi::node_pcdata) {
        std::string v = last.value();
        size_t end = v.find_last_not_of(' ');
        if (end == std::string::npos) {
            node.remove_child(last);
        } else if (end + 1 < v.size()) {
            last.set_value(v.substr(0, end + 1).c_str());
        }
    }
}

void append_text(pugi::xml_node dst, const std::string& text) {
    pugi::xml_node last = dst.last_child();
    if (last && last.type() == pugi::node_pcdata) {
        std::string merged = last.value();
        if (!merged.empty() && merged.back() == ' ' && !text.empty() && text.front() == ' ') {
            merged += text.substr(1);
        } else {
            merged += text;
        }
        last.set_value(merged.c_str());
        return;
    }
    dst.append_child(pugi::node_pcdata).set_value(text.c_str());
}

std::string image_src(const pugi::xml_node& img) {
    for (const char* attr : {"src", "xlink:href", "href"}) {
        std::string value = img.attribute(attr).as_string();
        if (!value.empty()) return value;
    }
    return "";
}

bool is_external(const std::string& href) {
    return href.find("://") != std::string::npos ||
           href.rfind("mailto:", 0) == 0 || href.rfind("tel:", 0) == 0;
}

uint32_t be16(const std::string& b, size_t i) {
    return (static_cast<uint8_t>(b[i]) << 8) | static_cast<uint8_t>(b[i + 1]);
}

uint32_t be32(const std::string& b, size_t i) {
    return (be16(b, i) << 16) | be16(b, i + 2);
}

uint32_t le16(const std::string& b, size_t i) {
    return static_cast<uint8_t>(b[i]) | (static_cast<uint8_t>(b[i + 1]) << 8);
}

// Digits only; absurd sizes clamp instead of overflowing
int parse_dimension(const std::string& digits) {
    int value = 0;
    auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    (void)end;
    if (ec == std::errc::result_out_of_range) {
        return std::numeric_limits<int>::max();
    }
    return ec == std::errc() ? value : 0;
}

} // namespace

// ============================================================================
// Utility Functions
// ============================================================================

ResourceGeometry inspect_image_bytes(const std::string& bytes, const std::string& extension) {
    ResourceGeometry geometry;
    geometry.file_size = bytes.size();

    std::string ext = extension;
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (ext == ".svg" || bytes.find("<svg") != std::string::npos) {
        geometry.is_vector = true;
        geometry.is_raster = false;
        static const std::regex width_re(R"(<svg[^>]*\bwidth\s*=\s*["']([0-9]+))");
        static const std::regex height_re(R"(<svg[^>]*\bheight\s*=\s*["']([0-9]+))");
        std::smatch m;
        if (std::regex_search(bytes, m, width_re)) geometry.width = parse_dimension(m[1].str());
        if (std::regex_search(bytes, m, height_re)) geometry.height = parse_dimension(m[1].str());
        return geometry;
    }

    if (bytes.size() >= 24 && bytes.compare(0, 8, "\x89PNG\r\n\x1a\n") == 0) {
        geometry.width = static_cast<int>(be32(bytes, 16));
        geometry.height = static_cast<int>(be32(bytes, 20));
    } else if (bytes.size() >= 10 && bytes.compare(0, 4, "GIF8") == 0) {
        geometry.width = static_cast<int>(le16(bytes, 6));
        geometry.height = static_cast<int>(le16(bytes, 8));
    } else if (bytes.size() >= 4 && static_cast<uint8_t>(bytes[0]) == 0xFF &&
               static_cast<uint8_t>(bytes[1]) == 0xD8) {
        size_t i = 2;
        while (i + 9 < bytes.size()) {
            if (static_cast<uint8_t>(bytes[i]) != 0xFF) {
                ++i;
                continue;
            }
            uint8_t marker = static_cast<uint8_t>(bytes[i + 1]);
            if (marker >= 0xC0 && marker <= 0xCF &&
                marker != 0xC4 && marker != 0xC8 && marker != 0xCC) {
                geometry.height = static_cast<int>(be16(bytes, i + 5));
                geometry.width = static_cast<int>(be16(bytes, i + 7));
                break;
            }
            if (marker == 0xFF || marker == 0x01 || (marker >= 0xD0 && marker <= 0xD8)) {
                i += (marker == 0xFF) ? 1 : 2;
                continue;
            }
            i += 2 + be16(bytes, i + 2);
        }
    }
    return geometry;
}

std::string title_from_filename(const std::string& path) {
    std::string stem = fs::path(path).stem().string();
    std::string out;
    bool word_start = true;
    for (char c : stem) {
        if (c == '_' || c == '-' || c == ' ') {
            if (!out.empty() && out.back() != ' ') out += ' ';
            word_start = true;
            continue;
        }
        out += word_start ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c;
        word_start = false;
    }
    while (!out.empty() && out.back() == ' ') out.pop_back();
    return out.empty() ? "Untitled" : out;
}

std::string decode_html_entities(const std::string& xhtml) {
    static const std::vector<std::pair<std::string, std::string>> entities = {
        {"&nbsp;", "\xC2\xA0"}, {"&copy;", "\xC2\xA9"}, {"&reg;", "\xC2\xAE"},
        {"&trade;", "\xE2\x84\xA2"}, {"&mdash;", "\xE2\x80\x94"}, {"&ndash;", "\xE2\x80\x93"},
        {"&hellip;", "\xE2\x80\xA6"}, {"&lsquo;", "\xE2\x80\x98"}, {"&rsquo;", "\xE2\x80\x99"},
        {"&ldquo;", "\xE2\x80\x9C"}, {"&rdquo;", "\xE2\x80\x9D"}, {"&bull;", "\xE2\x80\xA2"},
        {"&middot;", "\xC2\xB7"}, {"&deg;", "\xC2\xB0"}, {"&times;", "\xC3\x97"},
        {"&eacute;", "\xC3\xA9"}, {"&egrave;", "\xC3\xA8"}, {"&uuml;", "\xC3\xBC"},
        {"&ouml;", "\xC3\xB6"}, {"&auml;", "\xC3\xA4"}, {"&sect;", "\xC2\xA7"},
        {"&para;", "\xC2\xB6"}, {"&laquo;", "\xC2\xAB"}, {"&raquo;", "\xC2\xBB"}
    };

    std::string out = xhtml;
    for (const auto& [name, utf8] : entities) {
        size_t pos = 0;
        while ((pos = out.find(name, pos)) != std::string::npos) {
            out.replace(pos, name.size(), utf8);
            pos += utf8.size();
        }
    }
    return out;
}

// ============================================================================
// EpubStructuralProcessor
// ============================================================================

EpubStructuralProcessor::EpubStructuralProcessor(ReferenceMapper& mapper)
    : mapper_(mapper) {}

StructuredDocument EpubStructuralProcessor::process(const EpubArchive& archive,
                                                    const std::string& media_dir) {
    intermediate_by_path_.clear();
    links_.clear();
    pending_links_.clear();

    StructuredDocument doc;
    doc.source_path = archive.path();
    doc.format = SourceFormat::EPUB;

    const EpubMetadata& meta = archive.metadata();
    doc.metadata.title = meta.title;
    doc.metadata.authors = meta.creators;
    doc.metadata.publisher = meta.publisher;
    doc.metadata.pubdate = meta.date;
    doc.metadata.isbn = meta.isbn;
    doc.metadata.language = meta.language;
    doc.metadata.copyright_year = extract_year(meta.rights);
    if (doc.metadata.copyright_year.empty()) {
        doc.metadata.copyright_year = extract_year(meta.date);
    }
    doc.metadata.copyright_holder = meta.publisher;
    doc.book_id = make_book_id(archive.path(), meta.isbn);

    if (verbose_) {
        std::cout << "Processing EPUB: " << archive.path() << std::endl;
        std::cout << "  Spine documents: " << archive.spine().size() << std::endl;
    }

    // Chapter ids first so links can resolve forward
    for (const auto& item : archive.spine()) {
        Chapter& chapter = doc.add_chapter(item.full_path);
        mapper_.register_chapter(item.full_path, chapter.id());
    }

    extract_images(archive, media_dir);

    for (size_t i = 0; i < archive.spine().size(); ++i) {
        convert_document(archive, archive.spine()[i], doc.chapters[i]);
    }

    resolve_links(doc);

    if (verbose_) {
        std::cout << "  Chapters: " << doc.chapters.size()
                  << ", links: " << links_.size() << std::endl;
    }
    return doc;
}

void EpubStructuralProcessor::extract_images(const EpubArchive& archive,
                                             const std::string& media_dir) {
    fs::create_directories(media_dir);

    int counter = 0;
    for (const auto& item : archive.manifest()) {
        if (!item.is_image()) {
            continue;
        }
        std::string bytes = archive.read_entry(item.full_path);
        std::string ext = fs::path(item.full_path).extension().string();

        std::ostringstream name;
        name << "img_" << std::setfill('0') << std::setw(4) << ++counter << ext;

        fs::path target = fs::path(media_dir) / name.str();
        std::ofstream out(target, std::ios::binary);
        if (!out.is_open()) {
            throw ExtractionError("Cannot write extracted image: " + target.string());
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));

        mapper_.register_resource(item.full_path, name.str(), ResourceKind::IMAGE,
                                  inspect_image_bytes(bytes, ext));
        intermediate_by_path_[item.full_path] = name.str();
    }

    if (verbose_) {
        std::cout << "  Extracted " << counter << " images" << std::endl;
    }
}

void EpubStructuralProcessor::convert_document(const EpubArchive& archive,
                                               const ManifestItem& item,
                                               Chapter& chapter) {
    DocumentContext ctx;
    ctx.chapter = &chapter;
    ctx.doc_path = item.full_path;
    ctx.doc_dir = container_dirname(item.full_path);

    // An image directly in the spine is a one-figure chapter
    if (item.is_image()) {
        chapter.set_title(title_from_filename(item.full_path));
        pugi::xml_node figure = chapter.root().append_child("informalfigure");
        append_image(fs::path(item.full_path).filename().string(), "",
                     figure.append_child("mediaobject"), ctx);
        return;
    }

    std::string xhtml = decode_html_entities(archive.read_entry(item.full_path));
    pugi::xml_document source;
    pugi::xml_parse_result parsed = source.load_buffer(
        xhtml.data(), xhtml.size(), pugi::parse_default | pugi::parse_ws_pcdata);
    if (!parsed) {
        throw ExtractionError("Malformed XHTML in " + item.full_path + " at offset " +
                              std::to_string(parsed.offset) + ": " + parsed.description());
    }

    pugi::xml_node body = source.find_node([](pugi::xml_node n) { return lname(n) == "body"; });
    if (!body) {
        body = source.document_element();
    }

    // Title: first h1, else first h2-h4, else the file name
    pugi::xml_node title_source = body.find_node([](pugi::xml_node n) { return lname(n) == "h1"; });
    if (!title_source) {
        title_source = body.find_node([](pugi::xml_node n) {
            int level = heading_level(lname(n));
            return level >= 2 && level <= 4;
        });
    }

    pugi::xml_node title = chapter.root().append_child("title");
    if (title_source) {
        ctx.title_source = title_source;
        convert_inline(title_source, title, ctx);
        trim_edges(title);
    }
    if (is_blank(collect_text(title))) {
        chapter.root().remove_child(title);
        chapter.set_title(title_from_filename(item.full_path));
    }

    convert_flow(body, chapter.root(), ctx, true);

    if (verbose_) {
        std::cout << "  " << chapter.id() << " <- " << item.full_path
                  << " \"" << chapter.title() << "\"" << std::endl;
    }
}

// ============================================================================
// Block conversion
// ============================================================================

pugi::xml_node EpubStructuralProcessor::current_container(DocumentContext& ctx) const {
    return ctx.sections.empty() ? ctx.chapter->root() : ctx.sections.back().second;
}

pugi::xml_node EpubStructuralProcessor::append_block(pugi::xml_node dst, const char* name,
                                                     const pugi::xml_node& src,
                                                     DocumentContext& ctx) {
    pugi::xml_node node = dst.append_child(name);
    std::string id = src ? src.attribute("id").as_string() : "";
    if (id.empty() && !ctx.pending_anchor.empty()) {
        id = ctx.pending_anchor;
        ctx.pending_anchor.clear();
    }
    if (!id.empty()) {
        node.append_attribute("id") = id.c_str();
    }
    return node;
}

void EpubStructuralProcessor::convert_flow(const pugi::xml_node& src, pugi::xml_node dst,
                                           DocumentContext& ctx, bool allow_sections) {
    ctx.open_para = pugi::xml_node();

    for (pugi::xml_node child = src.first_child(); child; child = child.next_sibling()) {
        pugi::xml_node target = allow_sections ? current_container(ctx) : dst;

        if (is_text(child)) {
            std::string text = collapse_whitespace(child.value());
            if (is_blank(text)) {
                if (ctx.open_para) append_text(ctx.open_para, " ");
                continue;
            }
            if (!ctx.open_para || ctx.open_para.parent() != target) {
                ctx.open_para = append_block(target, "para", pugi::xml_node(), ctx);
            }
            append_text(ctx.open_para, text);
            continue;
        }
        if (child.type() != pugi::node_element || child == ctx.title_source) {
            continue;
        }

        std::string name = lname(child);
        if (inline_names().count(name) && !only_images(child)) {
            if (!ctx.open_para || ctx.open_para.parent() != target) {
                ctx.open_para = append_block(target, "para", pugi::xml_node(), ctx);
            }
            convert_inline_node(child, ctx.open_para, ctx);
            continue;
        }

        if (ctx.open_para) {
            trim_edges(ctx.open_para);
            ctx.open_para = pugi::xml_node();
        }
        convert_block(child, target, ctx, allow_sections);
        ctx.open_para = pugi::xml_node();
    }

    if (ctx.open_para) {
        trim_edges(ctx.open_para);
        ctx.open_para = pugi::xml_node();
    }
}

void EpubStructuralProcessor::convert_block(const pugi::xml_node& src, pugi::xml_node dst,
                                            DocumentContext& ctx, bool allow_sections) {
    std::string name = lname(src);
    if (skipped_names().count(name)) {
        return;
    }

    int level = heading_level(name);
    if (level > 0) {
        if (allow_sections) {
            open_section(src, level <= 2 ? 1 : level - 1, ctx);
        } else {
            pugi::xml_node para = append_block(dst, "para", src, ctx);
            pugi::xml_node emphasis = para.append_child("emphasis");
            emphasis.append_attribute("role") = "bold";
            convert_inline(src, emphasis, ctx);
            trim_edges(emphasis);
        }
        return;
    }

    if (name == "img" || name == "svg" || name == "figure" || name == "picture" ||
        (name == "p" && only_images(src))) {
        convert_figure(src, dst, ctx);
        return;
    }

    if (name == "p") {
        bool has_blocks = static_cast<bool>(src.find_child([](pugi::xml_node n) {
            std::string child = lname(n);
            return n.type() == pugi::node_element && !inline_names().count(child) &&
                   child != "img";
        }));
        if (has_blocks) {
            if (src.attribute("id") && ctx.pending_anchor.empty()) {
                ctx.pending_anchor = src.attribute("id").as_string();
            }
            convert_flow(src, dst, ctx, false);
            return;
        }
        pugi::xml_node para = append_block(dst, "para", src, ctx);
        convert_inline(src, para, ctx);
        trim_edges(para);
        if (!para.first_child() && !para.attribute("id")) {
            dst.remove_child(para);
        }
        return;
    }

    if (name == "ul" || name == "ol") {
        convert_list(src, dst, ctx);
        return;
    }
    if (name == "dl") {
        convert_definition_list(src, dst, ctx);
        return;
    }
    if (name == "table") {
        convert_table(src, dst, ctx);
        return;
    }
    if (name == "blockquote") {
        pugi::xml_node quote = append_block(dst, "blockquote", src, ctx);
        convert_flow(src, quote, ctx, false);
        if (!quote.first_child()) {
            dst.remove_child(quote);
        }
        return;
    }
    if (name == "pre") {
        pugi::xml_node listing = append_block(dst, "programlisting", src, ctx);
        listing.text().set(collect_text(src).c_str());
        return;
    }

    // div, section, article, nav, aside and anything unknown: keep the content
    std::string id = src.attribute("id").as_string();
    if (!id.empty() && ctx.pending_anchor.empty()) {
        ctx.pending_anchor = id;
    }
    convert_flow(src, dst, ctx, allow_sections);
}

void EpubStructuralProcessor::open_section(const pugi::xml_node& heading, int level,
                                           DocumentContext& ctx) {
    while (!ctx.sections.empty() && ctx.sections.back().first >= level) {
        ctx.sections.pop_back();
    }
    pugi::xml_node parent = current_container(ctx);
    pugi::xml_node section = append_block(parent, "section", heading, ctx);
    pugi::xml_node title = section.append_child("title");
    convert_inline(heading, title, ctx);
    trim_edges(title);
    if (!title.first_child()) {
        title.text().set("Section");
    }
    ctx.sections.emplace_back(level, section);
}

void EpubStructuralProcessor::convert_list(const pugi::xml_node& src, pugi::xml_node dst,
                                           DocumentContext& ctx) {
    pugi::xml_node list = append_block(dst, lname(src) == "ol" ? "orderedlist" : "itemizedlist",
                                       src, ctx);

    for (pugi::xml_node child = src.first_child(); child; child = child.next_sibling()) {
        if (is_text(child) && is_blank(child.value())) {
            continue;
        }
        pugi::xml_node item = append_block(list, "listitem",
                                           lname(child) == "li" ? child : pugi::xml_node(), ctx);
        if (lname(child) == "li") {
            convert_flow(child, item, ctx, false);
        } else if (is_text(child)) {
            pugi::xml_node para = item.append_child("para");
            append_text(para, collapse_whitespace(child.value()));
            trim_edges(para);
        } else {
            convert_block(child, item, ctx, false);
        }
        if (!item.find_child([](pugi::xml_node n) { return n.type() == pugi::node_element; })) {
            item.append_child("para");
        }
    }

    if (!list.first_child()) {
        dst.remove_child(list);
    }
}

void EpubStructuralProcessor::convert_definition_list(const pugi::xml_node& src,
                                                      pugi::xml_node dst,
                                                      DocumentContext& ctx) {
    pugi::xml_node list = append_block(dst, "variablelist", src, ctx);
    pugi::xml_node entry;
    pugi::xml_node definition;

    std::function<void(const pugi::xml_node&)> walk = [&](const pugi::xml_node& parent) {
        for (pugi::xml_node child = parent.first_child(); child; child = child.next_sibling()) {
            if (child.type() != pugi::node_element) {
                continue;
            }
            std::string name = lname(child);
            if (name == "dt") {
                if (entry && definition) {
                    entry = pugi::xml_node();
                }
                if (!entry) {
                    entry = append_block(list, "varlistentry", child, ctx);
                    definition = pugi::xml_node();
                }
                // Several dt for one dd share one term
                pugi::xml_node term = entry.child("term");
                if (!term) {
                    term = entry.append_child("term");
                } else {
                    append_text(term, "; ");
                }
                convert_inline(child, term, ctx);
                trim_edges(term);
            } else if (name == "dd") {
                if (!entry) {
                    entry = append_block(list, "varlistentry", pugi::xml_node(), ctx);
                    entry.append_child("term");
                }
                if (!definition) {
                    definition = append_block(entry, "listitem", child, ctx);
                } else if (child.attribute("id") && ctx.pending_anchor.empty()) {
                    ctx.pending_anchor = child.attribute("id").as_string();
                }
                convert_flow(child, definition, ctx, false);
            } else {
                walk(child);
            }
        }
    };
    walk(src);

    for (pugi::xml_node e = list.child("varlistentry"); e; e = e.next_sibling("varlistentry")) {
        pugi::xml_node item = e.child("listitem");
        if (!item) {
            item = e.append_child("listitem");
        }
        if (!item.find_child([](pugi::xml_node n) { return n.type() == pugi::node_element; })) {
            item.append_child("para");
        }
    }

    if (!list.first_child()) {
        dst.remove_child(list);
    }
}

void EpubStructuralProcessor::convert_table(const pugi::xml_node& src, pugi::xml_node dst,
                                            DocumentContext& ctx) {
    pugi::xml_node caption = src.find_child([](pugi::xml_node n) { return lname(n) == "caption"; });

    pugi::xml_node table = append_block(dst, caption ? "table" : "informaltable", src, ctx);
    if (caption) {
        pugi::xml_node title = table.append_child("title");
        convert_inline(caption, title, ctx);
        trim_edges(title);
    }
    pugi::xml_node tgroup = table.append_child("tgroup");
    pugi::xml_node thead;
    pugi::xml_node tbody;
    size_t max_cols = 0;

    auto add_row = [&](const pugi::xml_node& tr, bool header) {
        pugi::xml_node section;
        if (header) {
            if (!thead) thead = tgroup.prepend_child("thead");
            section = thead;
        } else {
            if (!tbody) tbody = tgroup.append_child("tbody");
            section = tbody;
        }
        pugi::xml_node row = section.append_child("row");
        size_t cols = 0;
        for (pugi::xml_node cell = tr.first_child(); cell; cell = cell.next_sibling()) {
            std::string cell_name = lname(cell);
            if (cell_name != "td" && cell_name != "th") {
                continue;
            }
            pugi::xml_node entry = row.append_child("entry");
            bool has_blocks = static_cast<bool>(cell.find_child([](pugi::xml_node n) {
                return n.type() == pugi::node_element && !inline_names().count(lname(n)) &&
                       lname(n) != "img";
            }));
            if (has_blocks) {
                convert_flow(cell, entry, ctx, false);
            } else {
                convert_inline(cell, entry, ctx);
                trim_edges(entry);
            }
            ++cols;
        }
        if (cols == 0) {
            row.append_child("entry");
            cols = 1;
        }
        max_cols = std::max(max_cols, cols);
    };

    for (pugi::xml_node child = src.first_child(); child; child = child.next_sibling()) {
        std::string name = lname(child);
        if (name == "tr") {
            add_row(child, false);
        } else if (name == "thead" || name == "tbody" || name == "tfoot") {
            for (pugi::xml_node tr = child.child("tr"); tr; tr = tr.next_sibling("tr")) {
                add_row(tr, name == "thead");
            }
        }
    }

    if (!tbody) {
        tbody = tgroup.append_child("tbody");
        tbody.append_child("row").append_child("entry");
        max_cols = std::max<size_t>(max_cols, 1);
    }
    tgroup.prepend_attribute("cols") = std::to_string(max_cols).c_str();
}

void EpubStructuralProcessor::convert_figure(const pugi::xml_node& src, pugi::xml_node dst,
                                             DocumentContext& ctx) {
    pugi::xml_node caption = src.find_child([](pugi::xml_node n) { return lname(n) == "figcaption"; });

    std::vector<pugi::xml_node> images;
    std::string name = lname(src);
    if (name == "img" || name == "image") {
        images.push_back(src);
    } else {
        for (pugi::xpath_node found : src.select_nodes(".//*")) {
            std::string n = lname(found.node());
            if (n == "img" || n == "image") {
                images.push_back(found.node());
            }
        }
    }

    if (images.empty()) {
        // A figure wrapping a table or listing: keep caption and content as blocks
        if (caption) {
            pugi::xml_node para = append_block(dst, "para", caption, ctx);
            pugi::xml_node emphasis = para.append_child("emphasis");
            emphasis.append_attribute("role") = "bold";
            convert_inline(caption, emphasis, ctx);
            trim_edges(emphasis);
        }
        for (pugi::xml_node child = src.first_child(); child; child = child.next_sibling()) {
            if (child != caption && child.type() == pugi::node_element) {
                convert_block(child, dst, ctx, false);
            }
        }
        return;
    }

    pugi::xml_node figure = append_block(dst, caption ? "figure" : "informalfigure", src, ctx);
    if (caption) {
        pugi::xml_node title = figure.append_child("title");
        convert_inline(caption, title, ctx);
        trim_edges(title);
    }
    for (const auto& img : images) {
        append_image(image_src(img), img.attribute("alt").as_string(),
                     figure.append_child("mediaobject"), ctx);
    }

    // Text next to the images (credits, notes) stays as paragraphs
    if (name != "img" && name != "image") {
        for (pugi::xml_node child = src.first_child(); child; child = child.next_sibling()) {
            if (child == caption || child.type() != pugi::node_element) {
                continue;
            }
            std::string child_name = lname(child);
            if (child_name == "img" || child_name == "image" || has_image(child)) {
                std::string text = collapse_whitespace(collect_text(child));
                if (!is_blank(text)) {
                    pugi::xml_node para = dst.append_child("para");
                    append_text(para, text);
                    trim_edges(para);
                }
                continue;
            }
            convert_block(child, dst, ctx, false);
        }
    }
}

void EpubStructuralProcessor::append_image(const std::string& src, const std::string& alt,
                                           pugi::xml_node mediaobject, DocumentContext& ctx) {
    if (src.empty() || src.rfind("data:", 0) == 0) {
        mediaobject.append_child("textobject").append_child("phrase")
            .text().set(alt.empty() ? "[embedded image]" : alt.c_str());
        return;
    }

    std::string path = src.substr(0, src.find_first_of("?#"));
    std::string resolved = container_join(ctx.doc_dir, percent_decode(path));
    mapper_.record_reference(resolved, ctx.chapter->id());

    auto it = intermediate_by_path_.find(resolved);
    std::string fileref = it != intermediate_by_path_.end() ? it->second : resolved;
    if (it == intermediate_by_path_.end() && verbose_) {
        std::cerr << "  Warning: image not in manifest: " << resolved
                  << " (" << ctx.chapter->id() << ")" << std::endl;
    }

    mediaobject.append_child("imageobject").append_child("imagedata")
        .append_attribute("fileref") = fileref.c_str();
    if (!alt.empty()) {
        mediaobject.append_child("textobject").append_child("phrase").text().set(alt.c_str());
    }
}

// ============================================================================
// Inline conversion
// ============================================================================

void EpubStructuralProcessor::convert_inline(const pugi::xml_node& src, pugi::xml_node dst,
                                             DocumentContext& ctx) {
    for (pugi::xml_node child = src.first_child(); child; child = child.next_sibling()) {
        convert_inline_node(child, dst, ctx);
    }
}

void EpubStructuralProcessor::convert_inline_node(const pugi::xml_node& node, pugi::xml_node dst,
                                                  DocumentContext& ctx) {
    if (is_text(node)) {
        append_text(dst, collapse_whitespace(node.value()));
        return;
    }
    if (node.type() != pugi::node_element) {
        return;
    }

    std::string name = lname(node);
    if (skipped_names().count(name)) {
        return;
    }

    // Inline anchors land on the enclosing paragraph or section
    std::string id = node.attribute("id").as_string();
    if (!id.empty()) {
        for (pugi::xml_node holder = dst; holder; holder = holder.parent()) {
            std::string holder_name = holder.name();
            if (holder_name == "para" || holder_name == "section") {
                if (!holder.attribute("id")) {
                    holder.append_attribute("id") = id.c_str();
                }
                break;
            }
        }
    }

    if (name == "em" || name == "i" || name == "cite" || name == "var" || name == "dfn") {
        convert_inline(node, dst.append_child("emphasis"), ctx);
    } else if (name == "strong" || name == "b") {
        pugi::xml_node emphasis = dst.append_child("emphasis");
        emphasis.append_attribute("role") = "bold";
        convert_inline(node, emphasis, ctx);
    } else if (name == "u") {
        pugi::xml_node emphasis = dst.append_child("emphasis");
        emphasis.append_attribute("role") = "underline";
        convert_inline(node, emphasis, ctx);
    } else if (name == "sub") {
        convert_inline(node, dst.append_child("subscript"), ctx);
    } else if (name == "sup") {
        convert_inline(node, dst.append_child("superscript"), ctx);
    } else if (name == "code" || name == "kbd" || name == "samp" || name == "tt") {
        convert_inline(node, dst.append_child("literal"), ctx);
    } else if (name == "a") {
        convert_link(node, dst, ctx);
    } else if (name == "br") {
        append_text(dst, " ");
    } else if (name == "img" || name == "image") {
        append_image(image_src(node), node.attribute("alt").as_string(),
                     dst.append_child("inlinemediaobject"), ctx);
    } else {
        convert_inline(node, dst, ctx);
    }
}

void EpubStructuralProcessor::convert_link(const pugi::xml_node& src, pugi::xml_node dst,
                                           DocumentContext& ctx) {
    std::string href = src.attribute("href").as_string();
    if (href.empty()) {
        href = src.attribute("xlink:href").as_string();
    }
    if (href.empty()) {
        convert_inline(src, dst, ctx);
        return;
    }

    if (is_external(href)) {
        pugi::xml_node ulink = dst.append_child("ulink");
        ulink.append_attribute("url") = href.c_str();
        convert_inline(src, ulink, ctx);
        if (!ulink.first_child()) {
            ulink.text().set(href.c_str());
        }
        return;
    }

    size_t hash = href.find('#');
    std::string file_part = href.substr(0, hash);
    std::string anchor = hash == std::string::npos ? "" : href.substr(hash + 1);
    std::string target_path = file_part.empty()
        ? ctx.doc_path
        : container_join(ctx.doc_dir, percent_decode(file_part));

    LinkReference link;
    link.original_href = href;
    link.source_chapter = ctx.chapter->id();
    link.target_anchor = anchor;

    std::optional<std::string> target = mapper_.chapter_for(target_path);
    if (!target) {
        // Not a spine document: keep the text, report the link
        links_.push_back(link);
        convert_inline(src, dst, ctx);
        return;
    }

    link.target_chapter = *target;
    pugi::xml_node node = dst.append_child("link");
    std::string linkend = anchor.empty() ? *target : namespaced_id(*target, anchor);
    node.append_attribute("linkend") = linkend.c_str();
    convert_inline(src, node, ctx);

    pending_links_.push_back({node, links_.size()});
    links_.push_back(link);
}

void EpubStructuralProcessor::resolve_links(StructuredDocument& doc) {
    std::set<std::string> known;
    for (const auto& chapter : doc.chapters) {
        known.insert(chapter.id());
        for (pugi::xpath_node found : chapter.root().select_nodes(".//*[@id]")) {
            known.insert(namespaced_id(chapter.id(), found.node().attribute("id").as_string()));
        }
    }

    for (const auto& pending : pending_links_) {
        LinkReference& link = links_[pending.link_index];
        std::string linkend = pending.node.attribute("linkend").as_string();
        if (!known.count(linkend)) {
            // Anchor vanished in conversion: point at the chapter itself
            pending.node.attribute("linkend").set_value(link.target_chapter.c_str());
            if (verbose_) {
                std::cerr << "  Warning: anchor '" << link.target_anchor << "' not found, "
                          << link.original_href << " now targets " << link.target_chapter
                          << std::endl;
            }
        }
        link.resolved = true;
    }

    for (const auto& link : links_) {
        mapper_.add_link(link);
    }
}

} // namespace rd
