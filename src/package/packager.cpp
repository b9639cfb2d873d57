#include "package/packager.hpp"
#include "common/errors.hpp"
#include <pugixml.hpp>
#include <zip.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace rd {

// ============================================================================
// ImageRetentionPolicy
// ============================================================================

bool ImageRetentionPolicy::is_low_confidence(const Resource& resource) const {
    if (resource.kind != ResourceKind::IMAGE || resource.geometry.is_vector) {
        return false;
    }
    // Unknown geometry is not evidence of anything
    if (resource.geometry.width == 0 && resource.geometry.height == 0) {
        return false;
    }
    return resource.geometry.width < min_width || resource.geometry.height < min_height;
}

bool ImageRetentionPolicy::retain(const Resource& resource) const {
    return bypass_filtering || !is_low_confidence(resource);
}

// ============================================================================
// Packager
// ============================================================================

namespace {

std::pair<std::string, std::string> split_name(const std::string& full_name) {
    size_t space = full_name.find_last_of(' ');
    if (space == std::string::npos) {
        return {"", full_name};
    }
    return {full_name.substr(0, space), full_name.substr(space + 1)};
}

} // namespace

Packager::Packager(ReferenceMapper& mapper, const PackagerOptions& options)
    : mapper_(mapper), options_(options) {}

std::string Packager::final_image_name(int chapter_number, int index, const std::string& extension) {
    std::ostringstream name;
    name << "Ch" << std::setfill('0') << std::setw(4) << chapter_number
         << "f" << std::setw(2) << index << extension;
    return name.str();
}

std::map<std::string, std::string> Packager::assign_final_names(StructuredDocument& doc) {
    std::map<std::string, std::string> final_names;

    for (auto& chapter : doc.chapters) {
        int index = 0;
        for (const auto& selected : chapter.root().select_nodes("//imagedata[@fileref]")) {
            pugi::xml_node imagedata = selected.node();
            std::string fileref = imagedata.attribute("fileref").value();

            auto resource = mapper_.find_by_intermediate(fileref);
            if (!resource) {
                continue;
            }
            auto it = final_names.find(resource->original_path);
            if (it == final_names.end()) {
                std::string ext = fs::path(resource->intermediate_name).extension().string();
                std::string name = final_image_name(chapter.number(), ++index, ext);
                it = final_names.emplace(resource->original_path, name).first;
            }
            std::string rewritten = std::string(MEDIA_DIR) + "/" + it->second;
            imagedata.attribute("fileref").set_value(rewritten.c_str());
        }
    }

    // Images no chapter shows are packaged too
    int index = 0;
    for (const auto& resource : mapper_.resources()) {
        if (resource.kind != ResourceKind::IMAGE || final_names.count(resource.original_path)) {
            continue;
        }
        if (!options_.retention.retain(resource)) {
            continue;
        }
        std::string ext = fs::path(resource.intermediate_name).extension().string();
        final_names[resource.original_path] = final_image_name(0, ++index, ext);
    }
    return final_names;
}

std::string Packager::book_descriptor(const StructuredDocument& doc) {
    pugi::xml_document info_doc;
    pugi::xml_node info = info_doc.append_child("bookinfo");
    const BookMetadata& meta = doc.metadata;

    info.append_child("isbn").text().set(meta.isbn.c_str());
    info.append_child("title").text().set(meta.title.c_str());
    if (!meta.subtitle.empty()) {
        info.append_child("subtitle").text().set(meta.subtitle.c_str());
    }
    pugi::xml_node group = info.append_child("authorgroup");
    for (const auto& author : meta.authors) {
        auto [first, last] = split_name(author);
        pugi::xml_node person = group.append_child("author").append_child("personname");
        if (!first.empty()) {
            person.append_child("firstname").text().set(first.c_str());
        }
        person.append_child("surname").text().set(last.c_str());
    }
    info.append_child("publisher").append_child("publishername").text().set(meta.publisher.c_str());
    if (!meta.pubdate.empty()) {
        info.append_child("pubdate").text().set(meta.pubdate.c_str());
    }
    pugi::xml_node copyright = info.append_child("copyright");
    copyright.append_child("year").text().set(meta.copyright_year.c_str());
    std::string holder = meta.copyright_holder.empty() ? meta.publisher : meta.copyright_holder;
    copyright.append_child("holder").text().set(holder.c_str());

    std::ostringstream out;
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out << "<!DOCTYPE book PUBLIC \"" << PUBLIC_ID << "\" \"" << SYSTEM_ID << "\" [\n";
    for (const auto& chapter : doc.chapters) {
        out << "<!ENTITY " << chapter.id() << " SYSTEM \"" << chapter.file_name() << "\">\n";
    }
    out << "]>\n";
    // ISBN-based ids start with a digit, which an XML ID may not
    out << "<book id=\"" << xml_name(doc.book_id) << "\">\n";
    info.print(out, "  ", pugi::format_indent, pugi::encoding_utf8, 1);
    for (const auto& chapter : doc.chapters) {
        out << "  &" << chapter.id() << ";\n";
    }
    out << "</book>\n";
    return out.str();
}

std::string Packager::resolve_dtd() const {
    if (!options_.dtd_path.empty()) {
        if (!fs::is_regular_file(options_.dtd_path)) {
            throw PackagingError("DTD not found: " + options_.dtd_path);
        }
        return options_.dtd_path;
    }
    fs::path fallback = fs::current_path() / SYSTEM_ID;
    if (fs::is_regular_file(fallback)) {
        return fallback.string();
    }
    throw PackagingError("No DTD configured and none found at " + fallback.string());
}

void Packager::copy_dtd(const std::string& package_dir) const {
    fs::path dtd = resolve_dtd();
    fs::path target_dir = fs::path(package_dir) / fs::path(SYSTEM_ID).parent_path();

    std::error_code ec;
    fs::create_directories(target_dir, ec);
    if (ec) {
        throw PackagingError("Cannot create " + target_dir.string() + ": " + ec.message());
    }

    // Modules and entity files next to the DTD come along
    fs::path source_dir = dtd.parent_path();
    for (const auto& entry : fs::recursive_directory_iterator(source_dir)) {
        if (!entry.is_regular_file()) continue;
        fs::path relative = fs::relative(entry.path(), source_dir);
        fs::path target = target_dir / relative;
        fs::create_directories(target.parent_path(), ec);
        fs::copy_file(entry.path(), target, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw PackagingError("Cannot copy " + entry.path().string() + ": " + ec.message());
        }
    }

    fs::path main_dtd = fs::path(package_dir) / SYSTEM_ID;
    if (!fs::exists(main_dtd)) {
        fs::copy_file(dtd, main_dtd, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw PackagingError("Cannot copy " + dtd.string() + ": " + ec.message());
        }
    }
}

void Packager::write_text_file(const std::string& path, const std::string& content) const {
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        throw PackagingError("Cannot write " + path);
    }
    out << content;
    if (!out) {
        throw PackagingError("Failed writing " + path);
    }
}

PackageResult Packager::package(StructuredDocument& doc,
                                const std::string& media_dir,
                                const std::string& output_root) {
    PackageResult result;
    fs::path package_dir = fs::path(output_root) / doc.book_id;
    fs::path multimedia = package_dir / MEDIA_DIR;
    result.package_dir = package_dir.string();

    std::error_code ec;
    fs::create_directories(multimedia, ec);
    if (ec) {
        throw PackagingError("Cannot create " + multimedia.string() + ": " + ec.message());
    }

    if (verbose_) {
        std::cout << "Packaging " << doc.chapters.size() << " chapters into "
                  << package_dir.string() << std::endl;
    }

    // Images
    result.final_names = assign_final_names(doc);
    for (const auto& resource : mapper_.resources()) {
        if (resource.kind != ResourceKind::IMAGE) continue;
        if (options_.retention.is_low_confidence(resource)) {
            if (options_.retention.retain(resource)) {
                result.low_confidence_retained++;
            }
        }
        auto it = result.final_names.find(resource.original_path);
        if (it == result.final_names.end()) {
            result.images_dropped++;
            continue;
        }

        fs::path source = fs::path(media_dir) / resource.intermediate_name;
        fs::path target = multimedia / it->second;
        if (fs::exists(source)) {
            fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
            if (ec) {
                throw PackagingError("Cannot copy " + source.string() + ": " + ec.message());
            }
            result.images_packaged++;
        } else if (verbose_) {
            std::cerr << "  Warning: extracted image missing: " << source.string() << std::endl;
        }
        mapper_.finalize(resource.original_path, it->second);
    }

    // Chapters
    for (const auto& chapter : doc.chapters) {
        fs::path file = package_dir / chapter.file_name();
        write_text_file(file.string(),
                        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n" + chapter.to_xml());
        result.chapter_files.push_back(chapter.file_name());
    }

    write_text_file((package_dir / "Book.XML").string(), book_descriptor(doc));
    copy_dtd(package_dir.string());

    if (options_.create_archive) {
        result.archive_path = (fs::path(output_root) / (doc.book_id + ".zip")).string();
        create_archive(package_dir.string(), result.archive_path);
    }

    if (verbose_) {
        std::cout << "  Images packaged: " << result.images_packaged
                  << " (low-confidence retained: " << result.low_confidence_retained << ")"
                  << std::endl;
        if (!result.archive_path.empty()) {
            std::cout << "  Archive: " << result.archive_path << std::endl;
        }
    }
    return result;
}

void Packager::create_archive(const std::string& package_dir, const std::string& archive_path) {
    std::vector<fs::path> files;
    for (const auto& entry : fs::recursive_directory_iterator(package_dir)) {
        if (entry.is_regular_file()) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    int error = 0;
    zip_t* archive = zip_open(archive_path.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &error);
    if (!archive) {
        zip_error_t ze;
        zip_error_init_with_code(&ze, error);
        std::string reason = zip_error_strerror(&ze);
        zip_error_fini(&ze);
        throw PackagingError("Cannot create archive " + archive_path + ": " + reason);
    }

    for (const auto& file : files) {
        std::string name = fs::relative(file, package_dir).generic_string();
        zip_source_t* source = zip_source_file(archive, file.string().c_str(), 0, 0);
        if (!source) {
            std::string reason = zip_strerror(archive);
            zip_discard(archive);
            throw PackagingError("Cannot read " + file.string() + ": " + reason);
        }
        if (zip_file_add(archive, name.c_str(), source, ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8) < 0) {
            zip_source_free(source);
            std::string reason = zip_strerror(archive);
            zip_discard(archive);
            throw PackagingError("Cannot add " + name + " to archive: " + reason);
        }
    }

    if (zip_close(archive) != 0) {
        std::string reason = zip_strerror(archive);
        zip_discard(archive);
        throw PackagingError("Cannot write archive " + archive_path + ": " + reason);
    }
}

} // namespace rd
