#pragma once

#include "epub/epub_archive.hpp"
#include "mapping/reference_mapper.hpp"
#include "model/structured_document.hpp"
#include <pugixml.hpp>
#include <map>
#include <string>
#include <vector>

namespace rd {

/**
 * @brief Converts the spine of an EPUB into chapters, one per spine document
 *
 * EPUB structure is authoritative: no heading heuristics decide chapter
 * boundaries, so a spine document without any heading still yields its own
 * chapter. Headings h2-h6 open nested generic <section> elements, other
 * XHTML is mapped to generic DocBook-like elements which the compliance
 * transformer later rewrites. Every image and internal link is registered
 * with the reference mapper before the chapter is returned.
 */
class EpubStructuralProcessor {
public:
    explicit EpubStructuralProcessor(ReferenceMapper& mapper);

    /**
     * @brief Convert the whole book
     *
     * @param archive Opened EPUB
     * @param media_dir Directory receiving extracted images under their intermediate names
     * @throws ExtractionError for unreadable or malformed spine documents
     */
    StructuredDocument process(const EpubArchive& archive, const std::string& media_dir);

    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    struct PendingLink {
        pugi::xml_node node;
        size_t link_index;          ///< Position in links_
    };

    struct DocumentContext {
        Chapter* chapter = nullptr;
        std::string doc_path;       ///< Container path of the XHTML document
        std::string doc_dir;
        pugi::xml_node title_source;
        std::vector<std::pair<int, pugi::xml_node>> sections;   ///< (level, node)
        pugi::xml_node open_para;   ///< Paragraph collecting loose inline content
        std::string pending_anchor; ///< id of an unwrapped container, given to the next block
    };

    void extract_images(const EpubArchive& archive, const std::string& media_dir);
    void convert_document(const EpubArchive& archive, const ManifestItem& item, Chapter& chapter);

    pugi::xml_node current_container(DocumentContext& ctx) const;
    void convert_flow(const pugi::xml_node& src, pugi::xml_node dst, DocumentContext& ctx,
                      bool allow_sections);
    void convert_block(const pugi::xml_node& src, pugi::xml_node dst, DocumentContext& ctx,
                       bool allow_sections);
    void convert_inline(const pugi::xml_node& src, pugi::xml_node dst, DocumentContext& ctx);
    void convert_inline_node(const pugi::xml_node& node, pugi::xml_node dst, DocumentContext& ctx);

    void open_section(const pugi::xml_node& heading, int level, DocumentContext& ctx);
    void convert_list(const pugi::xml_node& src, pugi::xml_node dst, DocumentContext& ctx);
    void convert_definition_list(const pugi::xml_node& src, pugi::xml_node dst, DocumentContext& ctx);
    void convert_table(const pugi::xml_node& src, pugi::xml_node dst, DocumentContext& ctx);
    void convert_figure(const pugi::xml_node& src, pugi::xml_node dst, DocumentContext& ctx);
    void append_image(const std::string& src, const std::string& alt,
                      pugi::xml_node mediaobject, DocumentContext& ctx);
    void convert_link(const pugi::xml_node& src, pugi::xml_node dst, DocumentContext& ctx);

    pugi::xml_node append_block(pugi::xml_node dst, const char* name,
                                const pugi::xml_node& src, DocumentContext& ctx);

    void resolve_links(StructuredDocument& doc);

    ReferenceMapper& mapper_;
    std::map<std::string, std::string> intermediate_by_path_;   ///< container path -> intermediate name
    std::vector<LinkReference> links_;
    std::vector<PendingLink> pending_links_;
    bool verbose_ = false;
};

/**
 * @brief Pixel size and kind read from PNG, JPEG, GIF or SVG bytes
 */
ResourceGeometry inspect_image_bytes(const std::string& bytes, const std::string& extension);

/**
 * @brief Chapter title made from a file name: "glossary_terms.xhtml" -> "Glossary Terms"
 */
std::string title_from_filename(const std::string& path);

/**
 * @brief Replace common HTML named entities that XHTML files use without a DTD
 */
std::string decode_html_entities(const std::string& xhtml);

} // namespace rd
