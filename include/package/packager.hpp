#pragma once

#include "mapping/reference_mapper.hpp"
#include "model/structured_document.hpp"
#include <map>
#include <string>
#include <vector>

namespace rd {

/**
 * @brief Decides which extracted images go into the package
 *
 * Images smaller than the size floor are low-confidence content (rules,
 * bullets, spacer pixels). With bypass on, which is the default for both
 * PDF and EPUB sources, they are still retained and only counted.
 */
struct ImageRetentionPolicy {
    bool bypass_filtering = true;
    int min_width = 32;
    int min_height = 32;

    bool is_low_confidence(const Resource& resource) const;
    bool retain(const Resource& resource) const;
};

struct PackagerOptions {
    std::string dtd_path;                  ///< DTD to bundle; empty = ./RITTDOCdtd/v1.1/RittDocBook.dtd
    bool create_archive = true;            ///< Also write <output>/<book_id>.zip
    ImageRetentionPolicy retention;
};

/**
 * @brief What the packager wrote
 */
struct PackageResult {
    std::string package_dir;               ///< <output>/<book_id>
    std::string archive_path;              ///< <output>/<book_id>.zip, empty if not created
    std::vector<std::string> chapter_files;
    std::map<std::string, std::string> final_names;   ///< original path -> final name
    size_t images_packaged = 0;
    size_t low_confidence_retained = 0;
    size_t images_dropped = 0;
};

/**
 * @brief Assembles the distributable package
 *
 * Package layout:
 *   Book.XML                       descriptor with one entity per chapter
 *   ch0001.xml ...                 chapter files
 *   MultiMedia/Ch0001f01.png ...   images under their final names
 *   RITTDOCdtd/v1.1/               DTD files for offline validation
 */
class Packager {
public:
    static constexpr const char* PUBLIC_ID =
        "-//RIS Dev//DTD DocBook V4.3 -Based Variant V1.1//EN";
    static constexpr const char* SYSTEM_ID = "RITTDOCdtd/v1.1/RittDocBook.dtd";
    static constexpr const char* MEDIA_DIR = "MultiMedia";

    Packager(ReferenceMapper& mapper, const PackagerOptions& options = PackagerOptions());

    /**
     * @brief Write the package for a compliant document
     *
     * @param doc Document after compliance transformation; image filerefs
     *            are rewritten to their final names
     * @param media_dir Directory holding images under their intermediate names
     * @param output_root Job output directory
     * @throws PackagingError on I/O or archive failures
     */
    PackageResult package(StructuredDocument& doc,
                          const std::string& media_dir,
                          const std::string& output_root);

    /**
     * @brief Name images by chapter and first appearance and rewrite filerefs
     *
     * @return original path -> final name for every resource that got one
     */
    std::map<std::string, std::string> assign_final_names(StructuredDocument& doc);

    /**
     * @brief Text of Book.XML for a document
     */
    static std::string book_descriptor(const StructuredDocument& doc);

    /**
     * @brief Final name for the n-th image (1-based) of a chapter number
     */
    static std::string final_image_name(int chapter_number, int index, const std::string& extension);

    /**
     * @brief DTD file that will be bundled
     *
     * @throws PackagingError if none is given and none is found in the working directory
     */
    std::string resolve_dtd() const;

    /**
     * @brief Zip a package directory, entries relative to it
     *
     * @throws PackagingError if the archive cannot be written
     */
    static void create_archive(const std::string& package_dir, const std::string& archive_path);

    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    void copy_dtd(const std::string& package_dir) const;
    void write_text_file(const std::string& path, const std::string& content) const;

    ReferenceMapper& mapper_;
    PackagerOptions options_;
    bool verbose_ = false;
};

} // namespace rd
