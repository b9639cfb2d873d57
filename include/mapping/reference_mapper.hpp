#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace rd {

// ============================================================================
// Data Structures
// ============================================================================

enum class ResourceKind {
    IMAGE,
    OTHER
};

inline std::string resource_kind_to_string(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::IMAGE: return "image";
        case ResourceKind::OTHER: return "other";
        default: return "unknown";
    }
}

/**
 * @brief Pixel geometry and kind of an extracted image
 */
struct ResourceGeometry {
    int width = 0;
    int height = 0;
    bool is_vector = false;
    bool is_raster = true;
    size_t file_size = 0;
};

/**
 * @brief One extracted resource tracked through its three names
 *
 * The referencing-chapter set is a back-reference only; the mapper owns
 * the resource for the lifetime of the job.
 */
struct Resource {
    std::string original_path;               ///< Identity in the source, e.g. "OEBPS/images/fig1.png"
    std::string intermediate_name;           ///< Name during extraction, e.g. "img_0001.png"
    std::optional<std::string> final_name;   ///< Name in the package, e.g. "Ch0001f01.png"
    ResourceKind kind = ResourceKind::IMAGE;
    ResourceGeometry geometry;
    std::set<std::string> referenced_in;     ///< Chapter ids
    std::string first_seen_in;               ///< First chapter that referenced it
    bool exists_in_output = false;

    nlohmann::json to_json() const;
};

/**
 * @brief An internal cross-document link seen during conversion
 */
struct LinkReference {
    std::string original_href;   ///< e.g. "chapter02.xhtml#section1"
    std::string source_chapter;
    std::string target_chapter;
    std::string target_anchor;
    bool resolved = false;

    nlohmann::json to_json() const;
};

struct MapperStatistics {
    size_t total_resources = 0;
    size_t total_images = 0;
    size_t vector_images = 0;
    size_t raster_images = 0;
    size_t finalized_resources = 0;
    size_t total_links = 0;
    size_t broken_links = 0;
    size_t unreferenced_resources = 0;
    size_t dangling_references = 0;

    nlohmann::json to_json() const;
};

// ============================================================================
// Reference Mapper
// ============================================================================

/**
 * @brief Job-scoped registry of resource identities and links
 *
 * One mapper is constructed per conversion job and passed explicitly to
 * the stages that need it. All operations are serialized by an internal
 * mutex so per-page and per-chapter workers can share it.
 */
class ReferenceMapper {
public:
    ReferenceMapper() = default;

    ReferenceMapper(const ReferenceMapper&) = delete;
    ReferenceMapper& operator=(const ReferenceMapper&) = delete;

    // ========================================================================
    // Resources
    // ========================================================================

    /**
     * @brief Create the entry for a newly extracted resource
     *
     * @throws DuplicateResourceError if original_path is already registered
     */
    void register_resource(const std::string& original_path,
                           const std::string& intermediate_name,
                           ResourceKind kind,
                           const ResourceGeometry& geometry = ResourceGeometry());

    /**
     * @brief Note that a chapter references a resource (idempotent)
     *
     * A reference to an unregistered path is kept as a dangling reference
     * and reported by validate().
     */
    void record_reference(const std::string& original_path, const std::string& chapter_id);

    /**
     * @brief Set the package name of a resource
     *
     * @throws UnknownResourceError if the resource is not registered
     */
    void finalize(const std::string& original_path, const std::string& final_name);

    std::optional<Resource> get(const std::string& original_path) const;
    std::optional<Resource> find_by_intermediate(const std::string& intermediate_name) const;

    /**
     * @brief All resources in registration order
     */
    std::vector<Resource> resources() const;

    size_t size() const;

    // ========================================================================
    // Chapters and links
    // ========================================================================

    void register_chapter(const std::string& original_file, const std::string& chapter_id);
    std::optional<std::string> chapter_for(const std::string& original_file) const;

    void add_link(const LinkReference& link);
    std::vector<LinkReference> links() const;

    /**
     * @brief Forget every reference made by a chapter that was excluded
     *
     * Removes the chapter from all referencing sets, drops its links and
     * dangling references, and marks links into it as unresolved.
     */
    void retract_chapter(const std::string& chapter_id);

    // ========================================================================
    // Validation and export
    // ========================================================================

    /**
     * @brief Check that every resource resolved to a file in the package
     *
     * Reports resources without a final name, final names missing under
     * output_root/MultiMedia, dangling references and unresolved links.
     * Never throws for these; the caller decides what they mean.
     */
    std::pair<bool, std::vector<std::string>> validate(const std::string& output_root);

    MapperStatistics statistics() const;

    nlohmann::json to_json() const;

    /**
     * @brief Write the full registry as JSON
     *
     * @throws std::runtime_error if the file cannot be written
     */
    void export_to_json(const std::string& path) const;

    /**
     * @brief Human-readable summary of the registry
     */
    std::string generate_report() const;

    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    MapperStatistics statistics_locked() const;

    mutable std::mutex mutex_;
    std::vector<Resource> resources_;
    std::map<std::string, size_t> index_;                       ///< original_path -> position
    std::map<std::string, std::set<std::string>> dangling_;     ///< unknown path -> chapters
    std::map<std::string, std::string> dangling_first_;         ///< unknown path -> first chapter
    std::vector<LinkReference> links_;
    std::map<std::string, std::string> chapter_map_;            ///< original file -> chapter id
    bool verbose_ = false;
};

} // namespace rd
