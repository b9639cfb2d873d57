#include "mapping/reference_mapper.hpp"
#include "common/errors.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace rd;
namespace fs = std::filesystem;

/**
 * Walk-through of the reference mapper on its own: the three names of
 * an image, chapter links, and the completeness check against a package
 * directory.
 */
int main() {
    std::cout << "=== Reference Mapper Example ===\n\n";

    ReferenceMapper mapper;

    // Example 1: registering extracted images
    std::cout << "Example 1: Registering images\n";
    std::cout << "------------------------------\n";

    ResourceGeometry photo;
    photo.width = 1200;
    photo.height = 800;
    mapper.register_resource("OEBPS/images/harbour.jpg", "img_0001.jpg", ResourceKind::IMAGE, photo);

    ResourceGeometry rule;
    rule.width = 600;
    rule.height = 2;
    mapper.register_resource("OEBPS/images/rule.png", "img_0002.png", ResourceKind::IMAGE, rule);

    ResourceGeometry chart;
    chart.is_vector = true;
    chart.is_raster = false;
    mapper.register_resource("OEBPS/images/chart.svg", "img_0003.svg", ResourceKind::IMAGE, chart);

    std::cout << "Registered " << mapper.size() << " resources\n";

    try {
        mapper.register_resource("OEBPS/images/harbour.jpg", "img_0009.jpg", ResourceKind::IMAGE);
    } catch (const DuplicateResourceError& e) {
        std::cout << "Second registration rejected: " << e.what() << "\n";
    }
    std::cout << "\n";

    // Example 2: chapters and references
    std::cout << "Example 2: Chapters and references\n";
    std::cout << "-----------------------------------\n";

    mapper.register_chapter("OEBPS/text/ch01.xhtml", "ch0001");
    mapper.register_chapter("OEBPS/text/ch02.xhtml", "ch0002");

    mapper.record_reference("OEBPS/images/harbour.jpg", "ch0001");
    mapper.record_reference("OEBPS/images/chart.svg", "ch0002");
    mapper.record_reference("OEBPS/images/harbour.jpg", "ch0002");

    LinkReference link;
    link.original_href = "ch01.xhtml#harbour";
    link.source_chapter = "ch0002";
    link.target_chapter = "ch0001";
    link.target_anchor = "harbour";
    link.resolved = true;
    mapper.add_link(link);

    LinkReference lost;
    lost.original_href = "appendix.xhtml";
    lost.source_chapter = "ch0002";
    mapper.add_link(lost);

    if (auto harbour = mapper.get("OEBPS/images/harbour.jpg")) {
        std::cout << "harbour.jpg first seen in " << harbour->first_seen_in
                  << ", referenced by " << harbour->referenced_in.size() << " chapter(s)\n";
    }
    std::cout << "\n";

    // Example 3: final names and the completeness check
    std::cout << "Example 3: Finalizing and validating\n";
    std::cout << "-------------------------------------\n";

    mapper.finalize("OEBPS/images/harbour.jpg", "Ch0001f01.jpg");
    mapper.finalize("OEBPS/images/chart.svg", "Ch0002f01.svg");

    fs::path package = fs::temp_directory_path() / "rittdoc_reference_mapping_example";
    fs::create_directories(package / "MultiMedia");
    std::ofstream(package / "MultiMedia" / "Ch0001f01.jpg") << "jpeg";
    std::ofstream(package / "MultiMedia" / "Ch0002f01.svg") << "<svg/>";

    auto [ok, problems] = mapper.validate(package.string());
    std::cout << "Package complete: " << (ok ? "yes" : "no") << "\n";
    for (const auto& problem : problems) {
        std::cout << "  - " << problem << "\n";
    }
    std::cout << "\n";

    // Example 4: reports
    std::cout << "Example 4: Reports\n";
    std::cout << "------------------\n";

    std::cout << mapper.generate_report() << "\n";

    std::string json_path = (package / "reference_mapping.json").string();
    mapper.export_to_json(json_path);
    std::cout << "✓ Saved registry to: " << json_path << "\n";

    auto stats = mapper.statistics();
    std::cout << "  Vector: " << stats.vector_images << ", raster: " << stats.raster_images
              << ", unreferenced: " << stats.unreferenced_resources << "\n\n";

    std::cout << "=== Example Complete ===\n";
    return 0;
}
