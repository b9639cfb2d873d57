#include "mapping/reference_mapper.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace rd {

// ============================================================================
// JSON conversion
// ============================================================================

nlohmann::json Resource::to_json() const {
    nlohmann::json j;
    j["original_path"] = original_path;
    j["original_filename"] = fs::path(original_path).filename().string();
    j["intermediate_name"] = intermediate_name;
    j["final_name"] = final_name ? nlohmann::json(*final_name) : nlohmann::json(nullptr);
    j["resource_type"] = resource_kind_to_string(kind);
    j["first_seen_in"] = first_seen_in;
    j["referenced_in"] = std::vector<std::string>(referenced_in.begin(), referenced_in.end());
    j["is_vector"] = geometry.is_vector;
    j["is_raster"] = geometry.is_raster;
    j["width"] = geometry.width;
    j["height"] = geometry.height;
    j["file_size"] = geometry.file_size;
    j["exists_in_output"] = exists_in_output;
    return j;
}

nlohmann::json LinkReference::to_json() const {
    nlohmann::json j;
    j["original_href"] = original_href;
    j["source_chapter"] = source_chapter;
    j["target_chapter"] = target_chapter;
    j["target_anchor"] = target_anchor;
    j["resolved"] = resolved;
    return j;
}

nlohmann::json MapperStatistics::to_json() const {
    nlohmann::json j;
    j["total_resources"] = total_resources;
    j["total_images"] = total_images;
    j["vector_images"] = vector_images;
    j["raster_images"] = raster_images;
    j["finalized_resources"] = finalized_resources;
    j["total_links"] = total_links;
    j["broken_links"] = broken_links;
    j["unreferenced_resources"] = unreferenced_resources;
    j["dangling_references"] = dangling_references;
    return j;
}

// ============================================================================
// Resources
// ============================================================================

void ReferenceMapper::register_resource(const std::string& original_path,
                                        const std::string& intermediate_name,
                                        ResourceKind kind,
                                        const ResourceGeometry& geometry) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (index_.count(original_path)) {
        throw DuplicateResourceError("Resource registered twice: " + original_path);
    }

    Resource resource;
    resource.original_path = original_path;
    resource.intermediate_name = intermediate_name;
    resource.kind = kind;
    resource.geometry = geometry;

    // A reference seen before extraction finished is no longer dangling
    auto pending = dangling_.find(original_path);
    if (pending != dangling_.end()) {
        resource.referenced_in = pending->second;
        resource.first_seen_in = dangling_first_[original_path];
        dangling_.erase(pending);
        dangling_first_.erase(original_path);
    }

    index_[original_path] = resources_.size();
    resources_.push_back(std::move(resource));

    if (verbose_) {
        std::cout << "  Registered " << resource_kind_to_string(kind) << ": "
                  << original_path << " -> " << intermediate_name << std::endl;
    }
}

void ReferenceMapper::record_reference(const std::string& original_path,
                                       const std::string& chapter_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(original_path);
    if (it == index_.end()) {
        dangling_[original_path].insert(chapter_id);
        dangling_first_.emplace(original_path, chapter_id);
        return;
    }

    Resource& resource = resources_[it->second];
    if (resource.first_seen_in.empty()) {
        resource.first_seen_in = chapter_id;
    }
    resource.referenced_in.insert(chapter_id);
}

void ReferenceMapper::finalize(const std::string& original_path, const std::string& final_name) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(original_path);
    if (it == index_.end()) {
        throw UnknownResourceError("Cannot finalize unknown resource: " + original_path);
    }
    resources_[it->second].final_name = final_name;
}

std::optional<Resource> ReferenceMapper::get(const std::string& original_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(original_path);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return resources_[it->second];
}

std::optional<Resource> ReferenceMapper::find_by_intermediate(const std::string& intermediate_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& resource : resources_) {
        if (resource.intermediate_name == intermediate_name) {
            return resource;
        }
    }
    return std::nullopt;
}

std::vector<Resource> ReferenceMapper::resources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resources_;
}

size_t ReferenceMapper::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resources_.size();
}

// ============================================================================
// Chapters and links
// ============================================================================

void ReferenceMapper::register_chapter(const std::string& original_file, const std::string& chapter_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    chapter_map_[original_file] = chapter_id;
}

std::optional<std::string> ReferenceMapper::chapter_for(const std::string& original_file) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chapter_map_.find(original_file);
    if (it == chapter_map_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ReferenceMapper::add_link(const LinkReference& link) {
    std::lock_guard<std::mutex> lock(mutex_);
    links_.push_back(link);
}

std::vector<LinkReference> ReferenceMapper::links() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return links_;
}

void ReferenceMapper::retract_chapter(const std::string& chapter_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto& resource : resources_) {
        resource.referenced_in.erase(chapter_id);
        if (resource.first_seen_in == chapter_id) {
            resource.first_seen_in = resource.referenced_in.empty()
                ? std::string() : *resource.referenced_in.begin();
        }
    }

    for (auto it = dangling_.begin(); it != dangling_.end();) {
        it->second.erase(chapter_id);
        if (it->second.empty()) {
            dangling_first_.erase(it->first);
            it = dangling_.erase(it);
        } else {
            if (dangling_first_[it->first] == chapter_id) {
                dangling_first_[it->first] = *it->second.begin();
            }
            ++it;
        }
    }

    links_.erase(std::remove_if(links_.begin(), links_.end(),
                                [&](const LinkReference& l) { return l.source_chapter == chapter_id; }),
                 links_.end());
    for (auto& link : links_) {
        if (link.target_chapter == chapter_id) {
            link.resolved = false;
        }
    }

    if (verbose_) {
        std::cout << "  Retracted references of excluded chapter " << chapter_id << std::endl;
    }
}

// ============================================================================
// Validation and export
// ============================================================================

std::pair<bool, std::vector<std::string>> ReferenceMapper::validate(const std::string& output_root) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> problems;

    for (auto& resource : resources_) {
        if (!resource.final_name) {
            problems.push_back("Resource has no final name: " + resource.original_path);
            resource.exists_in_output = false;
            continue;
        }
        fs::path final_path = fs::path(output_root) / "MultiMedia" / *resource.final_name;
        resource.exists_in_output = fs::exists(final_path);
        if (!resource.exists_in_output) {
            problems.push_back("Final resource not found: " + final_path.string());
        }
    }

    for (const auto& [path, chapters] : dangling_) {
        for (const auto& chapter : chapters) {
            problems.push_back("Unresolved reference: " + path + " in " + chapter);
        }
    }

    for (const auto& link : links_) {
        if (!link.resolved) {
            problems.push_back("Unresolved link: " + link.original_href + " in " + link.source_chapter);
        }
    }

    if (verbose_ && !problems.empty()) {
        std::cerr << "  Reference mapping: " << problems.size() << " problem(s)" << std::endl;
    }

    return {problems.empty(), problems};
}

MapperStatistics ReferenceMapper::statistics_locked() const {
    MapperStatistics stats;
    stats.total_resources = resources_.size();
    for (const auto& resource : resources_) {
        if (resource.kind == ResourceKind::IMAGE) {
            stats.total_images++;
            if (resource.geometry.is_vector) {
                stats.vector_images++;
            }
            if (resource.geometry.is_raster) {
                stats.raster_images++;
            }
        }
        if (resource.final_name) {
            stats.finalized_resources++;
        }
        if (resource.referenced_in.empty()) {
            stats.unreferenced_resources++;
        }
    }
    stats.total_links = links_.size();
    stats.broken_links = static_cast<size_t>(std::count_if(
        links_.begin(), links_.end(), [](const LinkReference& l) { return !l.resolved; }));
    for (const auto& entry : dangling_) {
        stats.dangling_references += entry.second.size();
    }
    return stats;
}

MapperStatistics ReferenceMapper::statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return statistics_locked();
}

nlohmann::json ReferenceMapper::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::ostringstream created;
    created << std::put_time(std::gmtime(&now), "%Y-%m-%dT%H:%M:%SZ");

    nlohmann::json j;
    j["metadata"] = {
        {"created", created.str()},
        {"total_resources", resources_.size()},
        {"total_links", links_.size()}
    };

    nlohmann::json resources = nlohmann::json::object();
    for (const auto& resource : resources_) {
        resources[resource.original_path] = resource.to_json();
    }
    j["resources"] = resources;

    nlohmann::json links = nlohmann::json::array();
    for (const auto& link : links_) {
        links.push_back(link.to_json());
    }
    j["links"] = links;

    nlohmann::json dangling = nlohmann::json::object();
    for (const auto& [path, chapters] : dangling_) {
        dangling[path] = std::vector<std::string>(chapters.begin(), chapters.end());
    }
    j["unresolved_references"] = dangling;

    j["chapter_map"] = chapter_map_;
    j["statistics"] = statistics_locked().to_json();
    return j;
}

void ReferenceMapper::export_to_json(const std::string& path) const {
    nlohmann::json j = to_json();

    fs::path target(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path());
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write reference mapping: " + path);
    }
    file << j.dump(2);

    if (verbose_) {
        std::cout << "  Exported reference mapping to " << path << std::endl;
    }
}

std::string ReferenceMapper::generate_report() const {
    std::lock_guard<std::mutex> lock(mutex_);
    MapperStatistics stats = statistics_locked();

    const std::string rule(80, '=');
    std::ostringstream out;
    out << rule << "\n"
        << "REFERENCE MAPPING REPORT\n"
        << rule << "\n"
        << "Total Resources: " << stats.total_resources << "\n"
        << "  - Images: " << stats.total_images << "\n"
        << "    - Vector: " << stats.vector_images << "\n"
        << "    - Raster: " << stats.raster_images << "\n"
        << "  - Finalized: " << stats.finalized_resources << "\n"
        << "Total Links: " << stats.total_links << "\n"
        << "  - Broken: " << stats.broken_links << "\n"
        << "Unreferenced Resources: " << stats.unreferenced_resources << "\n"
        << "Unresolved References: " << stats.dangling_references << "\n"
        << "\n"
        << "Chapter Mappings:\n";

    for (const auto& [original, chapter_id] : chapter_map_) {
        out << "  " << original << " -> " << chapter_id << "\n";
    }

    out << "\nResource Mappings (first 10):\n";
    size_t shown = 0;
    for (const auto& resource : resources_) {
        if (shown++ == 10) {
            break;
        }
        std::string referenced;
        for (const auto& chapter : resource.referenced_in) {
            if (!referenced.empty()) referenced += ", ";
            referenced += chapter;
        }
        out << "  " << resource.original_path << "\n"
            << "    -> intermediate: " << resource.intermediate_name << "\n"
            << "    -> final: " << resource.final_name.value_or("NOT SET") << "\n"
            << "    -> referenced in: " << (referenced.empty() ? "NONE" : referenced) << "\n";
    }
    if (resources_.size() > 10) {
        out << "  ... and " << (resources_.size() - 10) << " more\n";
    }
    out << rule << "\n";
    return out.str();
}

} // namespace rd
