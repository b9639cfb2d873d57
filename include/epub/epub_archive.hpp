#pragma once

#include <map>
#include <string>
#include <vector>

struct zip;

namespace rd {

/**
 * @brief One <item> of the OPF manifest
 */
struct ManifestItem {
    std::string id;
    std::string href;          ///< As written in the OPF
    std::string full_path;     ///< Path inside the container
    std::string media_type;
    std::string properties;

    bool is_image() const { return media_type.rfind("image/", 0) == 0; }
};

/**
 * @brief Dublin Core fields of the OPF <metadata>
 */
struct EpubMetadata {
    std::string title;
    std::vector<std::string> creators;
    std::string publisher;
    std::string date;
    std::string language;
    std::string rights;
    std::vector<std::string> identifiers;
    std::string isbn;          ///< First identifier that normalizes to an ISBN
};

/**
 * @brief Read-only view of an EPUB container
 *
 * Opens the zip, follows META-INF/container.xml to the package document
 * and parses its manifest, spine and metadata.
 */
class EpubArchive {
public:
    /**
     * @throws ExtractionError if the container or package document is unreadable
     */
    explicit EpubArchive(const std::string& path);
    ~EpubArchive();

    EpubArchive(const EpubArchive&) = delete;
    EpubArchive& operator=(const EpubArchive&) = delete;

    /**
     * @brief Bytes of a container entry
     *
     * @throws ExtractionError if the entry is missing or truncated
     */
    std::string read_entry(const std::string& name) const;

    bool has_entry(const std::string& name) const;

    const std::string& path() const { return path_; }
    const std::string& opf_path() const { return opf_path_; }
    const std::vector<ManifestItem>& manifest() const { return manifest_; }

    /**
     * @brief Spine documents in reading order
     */
    const std::vector<ManifestItem>& spine() const { return spine_; }

    const EpubMetadata& metadata() const { return metadata_; }

    /**
     * @brief Manifest item by container path, nullptr if none
     */
    const ManifestItem* find_by_path(const std::string& full_path) const;

private:
    void load_package();

    std::string path_;
    zip* zip_ = nullptr;
    std::string opf_path_;
    std::vector<ManifestItem> manifest_;
    std::vector<ManifestItem> spine_;
    std::map<std::string, size_t> by_path_;
    EpubMetadata metadata_;
};

/**
 * @brief Directory part of a container path ("OEBPS/text/a.xhtml" -> "OEBPS/text")
 */
std::string container_dirname(const std::string& path);

/**
 * @brief Resolve a relative href against a container directory, folding "." and ".."
 */
std::string container_join(const std::string& base_dir, const std::string& href);

/**
 * @brief Decode %XX escapes in an href
 */
std::string percent_decode(const std::string& href);

} // namespace rd
