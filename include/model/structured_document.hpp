#pragma once

#include <pugixml.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <memory>

namespace rd {

// ============================================================================
// Source Format
// ============================================================================

enum class SourceFormat {
    PDF,
    EPUB
};

inline std::string source_format_to_string(SourceFormat format) {
    switch (format) {
        case SourceFormat::PDF: return "pdf";
        case SourceFormat::EPUB: return "epub";
        default: return "unknown";
    }
}

/**
 * @brief Infer the source format from the file extension
 *
 * @throws UnsupportedFormatError for anything but .pdf, .epub, .epub3
 */
SourceFormat detect_source_format(const std::string& path);

// ============================================================================
// Book Metadata
// ============================================================================

/**
 * @brief Book-level metadata carried into <bookinfo>
 */
struct BookMetadata {
    std::string title;
    std::string subtitle;
    std::string isbn;
    std::vector<std::string> authors;
    std::string publisher;
    std::string pubdate;
    std::string copyright_year;
    std::string copyright_holder;
    std::string language;

    nlohmann::json to_json() const;
};

/**
 * @brief Keep only digits and 'X' of an ISBN candidate; empty if not 10 or 13 long
 */
std::string normalize_isbn(const std::string& raw);

/**
 * @brief First four-digit year (1000-2999) found in text, empty if none
 */
std::string extract_year(const std::string& text);

// ============================================================================
// Chapter
// ============================================================================

/**
 * @brief One top-level structural unit, backed by its own XML tree
 *
 * The tree root is a <chapter> element. Chapters are authored
 * independently, one per EPUB spine entry or detected PDF chapter.
 */
class Chapter {
public:
    Chapter(const std::string& id, int number, const std::string& source_file);

    Chapter(Chapter&&) = default;
    Chapter& operator=(Chapter&&) = default;

    const std::string& id() const { return id_; }
    int number() const { return number_; }
    const std::string& source_file() const { return source_file_; }

    /**
     * @brief The <chapter> element
     */
    pugi::xml_node root() const { return doc_->document_element(); }

    pugi::xml_document& document() { return *doc_; }

    /**
     * @brief Text of the chapter <title>, empty if none
     */
    std::string title() const;

    /**
     * @brief Replace or create the chapter <title>
     */
    void set_title(const std::string& title);

    /**
     * @brief Serialize the chapter element (no XML declaration)
     */
    std::string to_xml() const;

    /**
     * @brief File name used in the package, e.g. "ch0001.xml"
     */
    std::string file_name() const { return id_ + ".xml"; }

private:
    std::string id_;
    int number_ = 0;
    std::string source_file_;
    std::unique_ptr<pugi::xml_document> doc_;
};

/**
 * @brief Chapter identifier for a 1-based chapter number, e.g. "ch0001"
 */
std::string make_chapter_id(int number);

/**
 * @brief Value turned into an XML Name usable as an ID
 *
 * Characters outside [A-Za-z0-9._-] become '_'; a value not starting
 * with a letter or '_' gets a leading '_'.
 */
std::string xml_name(const std::string& value);

/**
 * @brief Id as it reads after namespacing under a chapter
 *
 * Ids already carrying the "<chapter_id>-" prefix keep it. The result
 * is always a valid XML Name.
 */
std::string namespaced_id(const std::string& chapter_id, const std::string& id);

/**
 * @brief Package identifier: the ISBN when known, else the sanitized file stem
 */
std::string make_book_id(const std::string& source_path, const std::string& isbn);

// ============================================================================
// Structured Document
// ============================================================================

/**
 * @brief Canonical intermediate tree of one conversion job
 */
struct StructuredDocument {
    std::string source_path;
    std::string book_id;
    SourceFormat format = SourceFormat::PDF;
    BookMetadata metadata;
    std::vector<Chapter> chapters;

    /**
     * @brief Append a chapter numbered after the existing ones
     */
    Chapter& add_chapter(const std::string& source_file);

    Chapter* find_chapter(const std::string& chapter_id);

    /**
     * @brief Remove a chapter by id; returns false if absent
     */
    bool remove_chapter(const std::string& chapter_id);

    /**
     * @brief Concatenated serialization of all chapters, for comparisons
     */
    std::string to_xml() const;
};

} // namespace rd
