#include "model/structured_document.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace rd {

// ============================================================================
// Source Format
// ============================================================================

SourceFormat detect_source_format(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (ext == ".pdf") {
        return SourceFormat::PDF;
    }
    if (ext == ".epub" || ext == ".epub3") {
        return SourceFormat::EPUB;
    }
    throw UnsupportedFormatError("Cannot convert '" + path +
                                 "': unrecognized extension '" + ext + "'");
}

// ============================================================================
// BookMetadata
// ============================================================================

nlohmann::json BookMetadata::to_json() const {
    nlohmann::json j;
    j["title"] = title;
    j["subtitle"] = subtitle;
    j["isbn"] = isbn;
    j["authors"] = authors;
    j["publisher"] = publisher;
    j["pubdate"] = pubdate;
    j["copyright_year"] = copyright_year;
    j["copyright_holder"] = copyright_holder;
    j["language"] = language;
    return j;
}

std::string normalize_isbn(const std::string& raw) {
    std::string cleaned;
    for (char c : raw) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            cleaned += c;
        } else if (c == 'X' || c == 'x') {
            cleaned += 'X';
        }
    }
    if (cleaned.size() != 10 && cleaned.size() != 13) {
        return "";
    }
    // 'X' is only legal as the ISBN-10 check digit
    size_t x = cleaned.find('X');
    if (x != std::string::npos && (cleaned.size() != 10 || x != 9)) {
        return "";
    }
    return cleaned;
}

std::string extract_year(const std::string& text) {
    static const std::regex year_re(R"((^|[^0-9])([12][0-9]{3})([^0-9]|$))");
    std::smatch match;
    if (std::regex_search(text, match, year_re)) {
        return match[2].str();
    }
    return "";
}

// ============================================================================
// Chapter
// ============================================================================

std::string make_chapter_id(int number) {
    std::ostringstream ss;
    ss << "ch" << std::setfill('0') << std::setw(4) << number;
    return ss.str();
}

std::string xml_name(const std::string& value) {
    std::string name;
    name.reserve(value.size() + 1);
    for (char c : value) {
        unsigned char uc = static_cast<unsigned char>(c);
        bool name_char = uc < 0x80 && (std::isalnum(uc) || c == '_' || c == '-' || c == '.');
        name += name_char ? c : '_';
    }
    if (name.empty() || !(std::isalpha(static_cast<unsigned char>(name[0])) || name[0] == '_')) {
        name.insert(0, 1, '_');
    }
    return name;
}

std::string namespaced_id(const std::string& chapter_id, const std::string& id) {
    std::string prefix = chapter_id + "-";
    if (id.rfind(prefix, 0) == 0) {
        return xml_name(id);
    }
    return xml_name(prefix + id);
}

std::string make_book_id(const std::string& source_path, const std::string& isbn) {
    if (!isbn.empty()) {
        return isbn;
    }
    std::string stem = fs::path(source_path).stem().string();
    std::string book_id;
    for (char c : stem) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-') {
            book_id += c;
        } else {
            book_id += '_';
        }
    }
    return book_id.empty() ? "book" : book_id;
}

Chapter::Chapter(const std::string& id, int number, const std::string& source_file)
    : id_(id),
      number_(number),
      source_file_(source_file),
      doc_(std::make_unique<pugi::xml_document>()) {
    pugi::xml_node chapter = doc_->append_child("chapter");
    chapter.append_attribute("id") = id_.c_str();
}

std::string Chapter::title() const {
    return root().child("title").text().as_string();
}

void Chapter::set_title(const std::string& title) {
    pugi::xml_node chapter = root();
    pugi::xml_node title_node = chapter.child("title");
    if (!title_node) {
        title_node = chapter.prepend_child("title");
    }
    title_node.text().set(title.c_str());
}

std::string Chapter::to_xml() const {
    std::ostringstream out;
    root().print(out, "  ", pugi::format_indent, pugi::encoding_utf8);
    return out.str();
}

// ============================================================================
// StructuredDocument
// ============================================================================

Chapter& StructuredDocument::add_chapter(const std::string& source_file) {
    int number = chapters.empty() ? 1 : chapters.back().number() + 1;
    chapters.emplace_back(make_chapter_id(number), number, source_file);
    return chapters.back();
}

Chapter* StructuredDocument::find_chapter(const std::string& chapter_id) {
    for (auto& chapter : chapters) {
        if (chapter.id() == chapter_id) {
            return &chapter;
        }
    }
    return nullptr;
}

bool StructuredDocument::remove_chapter(const std::string& chapter_id) {
    auto it = std::find_if(chapters.begin(), chapters.end(),
                           [&](const Chapter& c) { return c.id() == chapter_id; });
    if (it == chapters.end()) {
        return false;
    }
    chapters.erase(it);
    return true;
}

std::string StructuredDocument::to_xml() const {
    std::string out;
    for (const auto& chapter : chapters) {
        out += chapter.to_xml();
    }
    return out;
}

} // namespace rd
