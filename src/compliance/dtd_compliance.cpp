#include "compliance/dtd_compliance.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <iostream>

namespace rd {

namespace {

void collect_elements(pugi::xml_node node, std::vector<pugi::xml_node>& out) {
    for (pugi::xml_node child = node.first_child(); child; child = child.next_sibling()) {
        if (child.type() == pugi::node_element) {
            out.push_back(child);
            collect_elements(child, out);
        }
    }
}

std::vector<pugi::xml_node> elements_of(pugi::xml_node root) {
    std::vector<pugi::xml_node> out;
    collect_elements(root, out);
    return out;
}

bool is_blank_text(const pugi::xml_node& node) {
    if (node.type() != pugi::node_pcdata && node.type() != pugi::node_cdata) {
        return false;
    }
    std::string value = node.value();
    return value.find_first_not_of(" \t\r\n") == std::string::npos;
}

bool has_text_content(const pugi::xml_node& node) {
    for (pugi::xml_node child = node.first_child(); child; child = child.next_sibling()) {
        if ((child.type() == pugi::node_pcdata || child.type() == pugi::node_cdata) &&
            !is_blank_text(child)) {
            return true;
        }
        if (child.type() == pugi::node_element) {
            return true;
        }
    }
    return false;
}

bool is_block(const std::string& name) {
    static const std::set<std::string> blocks = {
        "para", "figure", "informalfigure", "table", "informaltable", "itemizedlist",
        "orderedlist", "glosslist", "variablelist", "blockquote", "programlisting",
        "literallayout", "note", "sidebar", "mediaobject"
    };
    return blocks.count(name) > 0;
}

int section_depth(pugi::xml_node node) {
    int depth = 0;
    for (pugi::xml_node p = node; p; p = p.parent()) {
        if (p.type() == pugi::node_element && is_section_element(p.name())) {
            ++depth;
        }
    }
    return depth;
}

void add_fix(ComplianceReport& report, size_t count, const std::string& what) {
    if (count > 0) {
        report.fixes.push_back(std::to_string(count) + " " + what);
    }
}

void ensure_title_first(pugi::xml_node node, const char* default_title, size_t& fixed) {
    pugi::xml_node title = node.child("title");
    if (!title) {
        node.prepend_child("title").text().set(default_title);
        ++fixed;
        return;
    }
    pugi::xml_node first = node.first_child();
    while (first && first.type() != pugi::node_element) {
        first = first.next_sibling();
    }
    if (first != title) {
        node.prepend_move(title);
        ++fixed;
    }
}

// True when a node sits in a paragraph, directly or through inline markup
bool inside_para(pugi::xml_node node) {
    static const std::set<std::string> inline_wrappers = {
        "emphasis", "phrase", "link", "ulink", "literal", "citetitle", "quote",
        "subscript", "superscript"
    };
    for (pugi::xml_node p = node.parent(); p && p.type() == pugi::node_element; p = p.parent()) {
        std::string name = p.name();
        if (name == "para") {
            return true;
        }
        if (!inline_wrappers.count(name)) {
            return false;
        }
    }
    return false;
}

// Runs of text and inline elements inside a block container become paragraphs
size_t wrap_inline_runs(pugi::xml_node container) {
    size_t wrapped = 0;
    std::vector<pugi::xml_node> children;
    for (pugi::xml_node child = container.first_child(); child; child = child.next_sibling()) {
        children.push_back(child);
    }

    pugi::xml_node para;
    for (pugi::xml_node child : children) {
        if (is_blank_text(child)) {
            if (!para) {
                container.remove_child(child);
            } else {
                para.append_move(child);
            }
            continue;
        }
        bool loose = child.type() == pugi::node_pcdata || child.type() == pugi::node_cdata;
        if (child.type() == pugi::node_element) {
            std::string name = child.name();
            loose = !is_block(name) && !is_section_element(name) && name != "title" &&
                    name != "subtitle" && name != "titleabbrev";
        }
        if (!loose) {
            para = pugi::xml_node();
            continue;
        }
        if (!para) {
            para = container.insert_child_before("para", child);
            ++wrapped;
        }
        para.append_move(child);
    }
    return wrapped;
}

} // namespace

bool is_section_element(const std::string& name) {
    return name == "section" || name == "sect1" || name == "sect2" ||
           name == "sect3" || name == "sect4" || name == "sect5";
}

// ============================================================================
// ComplianceTransformer
// ============================================================================

ComplianceTransformer::ComplianceTransformer(const MetadataDefaults& defaults)
    : defaults_(defaults) {}

const std::set<std::string>& ComplianceTransformer::chapter_whitelist() {
    static const std::set<std::string> whitelist = {
        "beginpage", "chapterinfo", "title", "subtitle", "titleabbrev", "tocchap",
        "toc", "lot", "index", "glossary", "bibliography", "sect1", "section"
    };
    return whitelist;
}

const std::set<std::string>& ComplianceTransformer::banned_elements() {
    static const std::set<std::string> banned = {
        "section", "variablelist", "varlistentry", "informalfigure", "informaltable",
        "html", "body", "div", "span", "p", "br"
    };
    return banned;
}

std::vector<std::string> ComplianceTransformer::apply_metadata_defaults(BookMetadata& metadata) const {
    std::vector<std::string> filled;

    if (metadata.title.empty()) {
        metadata.title = defaults_.title;
        filled.push_back("title");
    }
    std::string isbn = normalize_isbn(metadata.isbn);
    if (isbn.empty()) {
        metadata.isbn = defaults_.isbn;
        filled.push_back("isbn");
    } else {
        metadata.isbn = isbn;
    }
    if (metadata.authors.empty()) {
        metadata.authors.push_back(defaults_.author);
        filled.push_back("author");
    }
    if (metadata.publisher.empty()) {
        metadata.publisher = defaults_.publisher;
        filled.push_back("publisher");
    }
    if (metadata.copyright_year.empty()) {
        metadata.copyright_year = defaults_.copyright_year;
        filled.push_back("copyright_year");
    }
    if (metadata.copyright_holder.empty()) {
        metadata.copyright_holder = metadata.publisher;
    }
    return filled;
}

std::vector<ComplianceReport> ComplianceTransformer::transform(StructuredDocument& doc) const {
    std::vector<ComplianceReport> reports;
    apply_metadata_defaults(doc.metadata);
    for (auto& chapter : doc.chapters) {
        reports.push_back(transform_chapter(chapter));
    }
    return reports;
}

ComplianceReport ComplianceTransformer::transform_chapter(Chapter& chapter) const {
    ComplianceReport report;
    report.chapter_id = chapter.id();
    pugi::xml_node root = chapter.root();

    // Fail before touching anything
    for (pugi::xml_node node : elements_of(root)) {
        if (is_section_element(node.name())) {
            int depth = section_depth(node);
            if (depth > MAX_SECTION_DEPTH) {
                throw ComplianceError(chapter.id(),
                    "Section nesting depth " + std::to_string(depth) + " exceeds " +
                    std::to_string(MAX_SECTION_DEPTH) + " in chapter " + chapter.id());
            }
        }
    }

    if (std::string(root.attribute("id").as_string()) != chapter.id()) {
        if (!root.attribute("id")) root.append_attribute("id");
        root.attribute("id").set_value(chapter.id().c_str());
        report.fixes.push_back("chapter id set");
    }

    unwrap_html(root, report);
    rewrite_banned(root, report);
    renumber_sections(root, chapter.id(), report);
    unwrap_nested_paras(root, report);
    fix_lists(root, report);
    normalize_figures_and_tables(root, report);
    wrap_loose_content(root, chapter.id(), report);
    fill_empty_content(root, report);
    namespace_ids(root, chapter.id(), report);

    if (verbose_ && report.changed()) {
        std::cout << "  " << chapter.id() << ": " << report.fixes.size() << " fix group(s)" << std::endl;
    }
    return report;
}

// ============================================================================
// Rules
// ============================================================================

void ComplianceTransformer::unwrap_html(pugi::xml_node chapter, ComplianceReport& report) const {
    size_t unwrapped = 0;
    size_t renamed = 0;

    for (pugi::xml_node node : elements_of(chapter)) {
        std::string name = node.name();
        if (name == "p") {
            node.set_name("para");
            ++renamed;
        } else if (name == "br") {
            node.parent().insert_child_before(pugi::node_pcdata, node).set_value(" ");
            node.parent().remove_child(node);
            ++unwrapped;
        } else if (name == "div" || name == "span" || name == "html" || name == "body") {
            pugi::xml_node parent = node.parent();
            while (node.first_child()) {
                parent.insert_move_before(node.first_child(), node);
            }
            parent.remove_child(node);
            ++unwrapped;
        }
    }

    add_fix(report, renamed, "p renamed to para");
    add_fix(report, unwrapped, "HTML wrapper(s) unwrapped");
}

void ComplianceTransformer::rewrite_banned(pugi::xml_node chapter, ComplianceReport& report) const {
    size_t rewritten = 0;

    auto in_entry = [](pugi::xml_node node) {
        std::string parent = node.parent().name();
        return parent == "varlistentry" || parent == "glossentry";
    };

    for (pugi::xml_node node : elements_of(chapter)) {
        std::string name = node.name();
        if (name == "variablelist") {
            node.set_name("glosslist");
        } else if (name == "varlistentry") {
            node.set_name("glossentry");
        } else if (name == "term" && in_entry(node)) {
            node.set_name("glossterm");
        } else if (name == "listitem" && in_entry(node)) {
            node.set_name("glossdef");
        } else if (name == "informalfigure") {
            node.set_name("figure");
        } else if (name == "informaltable") {
            node.set_name("table");
        } else {
            continue;
        }
        ++rewritten;
    }

    // Several terms for one entry fold into the first glossterm
    for (pugi::xml_node node : elements_of(chapter)) {
        if (std::string(node.name()) != "glossentry") continue;
        pugi::xml_node first = node.child("glossterm");
        pugi::xml_node extra = first ? first.next_sibling("glossterm") : pugi::xml_node();
        while (extra) {
            pugi::xml_node next = extra.next_sibling("glossterm");
            first.append_child(pugi::node_pcdata).set_value("; ");
            while (extra.first_child()) {
                first.append_move(extra.first_child());
            }
            node.remove_child(extra);
            extra = next;
            ++rewritten;
        }
    }

    add_fix(report, rewritten, "banned element(s) rewritten");
}

void ComplianceTransformer::renumber_sections(pugi::xml_node chapter, const std::string& chapter_id,
                                              ComplianceReport& report) const {
    size_t renamed = 0;
    for (pugi::xml_node node : elements_of(chapter)) {
        std::string name = node.name();
        if (!is_section_element(name)) {
            continue;
        }
        int depth = section_depth(node);
        if (depth > MAX_SECTION_DEPTH) {
            throw ComplianceError(chapter_id, "Section nesting depth " + std::to_string(depth) +
                                  " exceeds " + std::to_string(MAX_SECTION_DEPTH));
        }
        std::string target = "sect" + std::to_string(depth);
        if (name != target) {
            node.set_name(target.c_str());
            ++renamed;
        }
    }
    add_fix(report, renamed, "section(s) renumbered by depth");
}

void ComplianceTransformer::unwrap_nested_paras(pugi::xml_node chapter, ComplianceReport& report) const {
    size_t fixed = 0;

    // Deepest first so inner paragraphs are flat before their parent is split
    std::vector<pugi::xml_node> paras;
    for (pugi::xml_node node : elements_of(chapter)) {
        if (std::string(node.name()) == "para") {
            paras.push_back(node);
        }
    }
    std::reverse(paras.begin(), paras.end());

    for (pugi::xml_node para : paras) {
        pugi::xml_node parent = para.parent();

        // Inline-only paragraph inside a paragraph dissolves into its parent;
        // one carrying an id becomes a phrase so the link target survives
        if (inside_para(para)) {
            bool inline_only = true;
            for (pugi::xml_node child = para.first_child(); child; child = child.next_sibling()) {
                if (child.type() == pugi::node_element && is_block(child.name())) {
                    inline_only = false;
                    break;
                }
            }
            if (inline_only && para.attribute("id")) {
                para.set_name("phrase");
                ++fixed;
                continue;
            }
            if (inline_only) {
                while (para.first_child()) {
                    parent.insert_move_before(para.first_child(), para);
                }
                parent.remove_child(para);
                ++fixed;
                continue;
            }
        }

        bool has_blocks = false;
        for (pugi::xml_node child = para.first_child(); child; child = child.next_sibling()) {
            if (child.type() == pugi::node_element && is_block(child.name())) {
                has_blocks = true;
                break;
            }
        }
        if (!has_blocks) {
            continue;
        }

        // Hoist block children after the paragraph, splitting the text around them
        std::vector<pugi::xml_node> children;
        for (pugi::xml_node child = para.first_child(); child; child = child.next_sibling()) {
            children.push_back(child);
        }
        pugi::xml_node anchor = para;
        pugi::xml_node current = para;
        for (pugi::xml_node child : children) {
            if (child.type() == pugi::node_element && is_block(child.name())) {
                parent.insert_move_after(child, anchor);
                anchor = child;
                current = pugi::xml_node();
            } else if (current != para) {
                if (!current) {
                    if (is_blank_text(child)) {
                        para.remove_child(child);
                        continue;
                    }
                    current = parent.insert_child_after("para", anchor);
                    anchor = current;
                }
                current.append_move(child);
            }
        }
        if (!has_text_content(para) && !para.attribute("id")) {
            parent.remove_child(para);
        }
        ++fixed;
    }

    add_fix(report, fixed, "nested paragraph(s) flattened");
}

void ComplianceTransformer::fix_lists(pugi::xml_node chapter, ComplianceReport& report) const {
    size_t fixed = 0;

    for (pugi::xml_node node : elements_of(chapter)) {
        std::string name = node.name();

        if (name == "itemizedlist" || name == "orderedlist") {
            std::vector<pugi::xml_node> children;
            for (pugi::xml_node child = node.first_child(); child; child = child.next_sibling()) {
                children.push_back(child);
            }
            for (pugi::xml_node child : children) {
                if (child.type() == pugi::node_element && std::string(child.name()) == "listitem") {
                    continue;
                }
                if (is_blank_text(child)) {
                    node.remove_child(child);
                    continue;
                }
                pugi::xml_node item = node.insert_child_before("listitem", child);
                item.append_move(child);
                ++fixed;
            }
            if (!node.child("listitem")) {
                node.append_child("listitem");
                ++fixed;
            }
        } else if (name == "glossentry") {
            if (!node.child("glossterm")) {
                node.prepend_child("glossterm");
                ++fixed;
            }
            if (!node.child("glossdef")) {
                node.append_child("glossdef");
                ++fixed;
            }
        } else if (name == "glosslist" && !node.child("glossentry")) {
            pugi::xml_node entry = node.append_child("glossentry");
            entry.append_child("glossterm");
            entry.append_child("glossdef");
            ++fixed;
        }
    }

    // Block containers hold paragraphs, not bare text
    for (pugi::xml_node node : elements_of(chapter)) {
        std::string name = node.name();
        if (name == "listitem" || name == "glossdef" || name == "blockquote") {
            fixed += wrap_inline_runs(node);
            bool has_block = false;
            for (pugi::xml_node child = node.first_child(); child; child = child.next_sibling()) {
                if (child.type() == pugi::node_element) {
                    has_block = true;
                    break;
                }
            }
            if (!has_block) {
                node.append_child("para");
                ++fixed;
            }
        }
    }

    add_fix(report, fixed, "list structure fix(es)");
}

void ComplianceTransformer::normalize_figures_and_tables(pugi::xml_node chapter,
                                                         ComplianceReport& report) const {
    size_t fixed = 0;
    int figure_number = 0;
    int table_number = 0;

    for (pugi::xml_node node : elements_of(chapter)) {
        std::string name = node.name();

        if (name == "figure") {
            ++figure_number;
            std::string title = "Figure " + std::to_string(figure_number);
            ensure_title_first(node, title.c_str(), fixed);

            if (!node.child("mediaobject")) {
                node.append_child("mediaobject").append_child("textobject")
                    .append_child("phrase").text().set("Image not available");
                ++fixed;
            }
        } else if (name == "mediaobject" || name == "inlinemediaobject") {
            if (!node.child("imageobject") && !node.child("textobject")) {
                node.append_child("textobject").append_child("phrase")
                    .text().set("Image not available");
                ++fixed;
            }
        } else if (name == "table") {
            ++table_number;
            std::string title = "Table " + std::to_string(table_number);
            ensure_title_first(node, title.c_str(), fixed);

            pugi::xml_node tgroup = node.child("tgroup");
            if (!tgroup) {
                tgroup = node.append_child("tgroup");
                ++fixed;
            }
            pugi::xml_node tbody = tgroup.child("tbody");
            if (!tbody) {
                tbody = tgroup.append_child("tbody");
                ++fixed;
            }
            if (!tbody.child("row")) {
                tbody.append_child("row");
                ++fixed;
            }

            size_t cols = 1;
            for (pugi::xml_node section : {tgroup.child("thead"), tbody, tgroup.child("tfoot")}) {
                if (!section) continue;
                for (pugi::xml_node row = section.child("row"); row; row = row.next_sibling("row")) {
                    if (!row.child("entry")) {
                        row.append_child("entry");
                        ++fixed;
                    }
                    size_t count = 0;
                    for (pugi::xml_node entry = row.child("entry"); entry;
                         entry = entry.next_sibling("entry")) {
                        ++count;
                    }
                    cols = std::max(cols, count);
                }
            }
            std::string cols_text = std::to_string(cols);
            if (std::string(tgroup.attribute("cols").as_string()) != cols_text) {
                if (!tgroup.attribute("cols")) tgroup.prepend_attribute("cols");
                tgroup.attribute("cols").set_value(cols_text.c_str());
                ++fixed;
            }
        }
    }

    add_fix(report, fixed, "figure/table fix(es)");
}

void ComplianceTransformer::wrap_loose_content(pugi::xml_node chapter, const std::string& chapter_id,
                                               ComplianceReport& report) const {
    static const std::set<std::string> header = {
        "beginpage", "chapterinfo", "title", "subtitle", "titleabbrev", "tocchap"
    };

    std::set<std::string> used_ids;
    for (pugi::xml_node node : elements_of(chapter)) {
        if (node.attribute("id")) {
            used_ids.insert(namespaced_id(chapter_id, node.attribute("id").as_string()));
        }
    }
    auto fresh_id = [&](const std::string& base) {
        std::string id = base;
        for (int n = 2; used_ids.count(id); ++n) {
            id = base + "-" + std::to_string(n);
        }
        used_ids.insert(id);
        return id;
    };

    std::vector<pugi::xml_node> children;
    for (pugi::xml_node child = chapter.first_child(); child; child = child.next_sibling()) {
        children.push_back(child);
    }

    size_t wrapped = 0;
    bool seen_section = false;
    pugi::xml_node section;
    for (pugi::xml_node child : children) {
        if (is_blank_text(child) || child.type() == pugi::node_comment ||
            child.type() == pugi::node_pi) {
            chapter.remove_child(child);
            continue;
        }
        if (child.type() == pugi::node_element && chapter_whitelist().count(child.name())) {
            if (!header.count(child.name())) {
                seen_section = true;
            }
            section = pugi::xml_node();
            continue;
        }

        if (!section) {
            section = chapter.insert_child_before("sect1", child);
            std::string id = fresh_id(chapter_id + (seen_section ? "-continued" : "-intro"));
            section.append_attribute("id") = id.c_str();
            section.append_child("title").text().set(seen_section ? "Continued" : "Introduction");
            ++wrapped;
        }
        section.append_move(child);
    }

    // Inside a section, blocks may not follow its subsections
    for (pugi::xml_node node : elements_of(chapter)) {
        if (!is_section_element(node.name())) {
            continue;
        }
        std::vector<pugi::xml_node> parts;
        for (pugi::xml_node child = node.first_child(); child; child = child.next_sibling()) {
            parts.push_back(child);
        }
        bool seen_subsection = false;
        pugi::xml_node trailing;
        for (pugi::xml_node child : parts) {
            if (child.type() == pugi::node_element && is_section_element(child.name())) {
                seen_subsection = true;
                trailing = pugi::xml_node();
                continue;
            }
            if (!seen_subsection) {
                continue;
            }
            if (is_blank_text(child) || child.type() == pugi::node_comment ||
                child.type() == pugi::node_pi) {
                node.remove_child(child);
                continue;
            }
            if (!trailing) {
                std::string name = "sect" + std::to_string(section_depth(node) + 1);
                trailing = node.insert_child_before(name.c_str(), child);
                std::string id = fresh_id(chapter_id + "-continued");
                trailing.append_attribute("id") = id.c_str();
                trailing.append_child("title").text().set("Continued");
                ++wrapped;
            }
            trailing.append_move(child);
        }
    }

    // A chapter needs at least one section
    bool has_body = false;
    for (pugi::xml_node child = chapter.first_child(); child; child = child.next_sibling()) {
        if (child.type() == pugi::node_element && !header.count(child.name())) {
            has_body = true;
            break;
        }
    }
    if (!has_body) {
        pugi::xml_node content = chapter.append_child("sect1");
        std::string id = fresh_id(chapter_id + "-content");
        content.append_attribute("id") = id.c_str();
        content.append_child("title").text().set("Content");
        content.append_child("para");
        ++wrapped;
    }

    add_fix(report, wrapped, "section(s) generated for loose chapter content");
}

void ComplianceTransformer::fill_empty_content(pugi::xml_node chapter, ComplianceReport& report) const {
    size_t filled = 0;

    ensure_title_first(chapter, "Untitled", filled);

    for (pugi::xml_node node : elements_of(chapter)) {
        std::string name = node.name();

        if (is_section_element(name)) {
            ensure_title_first(node, "Section", filled);
            filled += wrap_inline_runs(node);
            bool has_content = false;
            for (pugi::xml_node child = node.first_child(); child; child = child.next_sibling()) {
                if (child.type() == pugi::node_element && std::string(child.name()) != "title") {
                    has_content = true;
                    break;
                }
            }
            if (!has_content) {
                node.append_child("para");
                ++filled;
            }
        }
    }

    for (pugi::xml_node node : elements_of(chapter)) {
        std::string name = node.name();
        if ((name == "title" || name == "glossterm") && !has_text_content(node)) {
            while (node.first_child()) node.remove_child(node.first_child());
            node.text().set(name == "title" ? "Untitled" : "Term");
            ++filled;
        }
    }

    add_fix(report, filled, "empty required element(s) filled");
}

void ComplianceTransformer::namespace_ids(pugi::xml_node chapter, const std::string& chapter_id,
                                          ComplianceReport& report) const {
    size_t renamed = 0;
    std::set<std::string> used = {chapter_id};
    std::map<std::string, std::string> renames;

    for (pugi::xml_node node : elements_of(chapter)) {
        pugi::xml_attribute id = node.attribute("id");
        if (!id) {
            continue;
        }
        std::string original = id.as_string();
        std::string target = original.empty() ? chapter_id + "-anon" : namespaced_id(chapter_id, original);
        std::string unique = target;
        for (int n = 2; used.count(unique); ++n) {
            unique = target + "-" + std::to_string(n);
        }
        used.insert(unique);
        if (unique != original) {
            id.set_value(unique.c_str());
            renames.emplace(original, unique);
            ++renamed;
        }
    }

    // Local references follow their target
    for (pugi::xml_node node : elements_of(chapter)) {
        pugi::xml_attribute linkend = node.attribute("linkend");
        if (!linkend) {
            continue;
        }
        auto it = renames.find(linkend.as_string());
        if (it != renames.end() && !used.count(linkend.as_string())) {
            linkend.set_value(it->second.c_str());
            ++renamed;
        }
    }

    add_fix(report, renamed, "id(s) namespaced");
}

} // namespace rd
