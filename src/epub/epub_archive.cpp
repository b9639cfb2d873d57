#include "epub/epub_archive.hpp"
#include "common/errors.hpp"
#include "model/structured_document.hpp"
#include <zip.h>
#include <pugixml.hpp>
#include <cctype>
#include <cstring>

namespace rd {

// ============================================================================
// Path helpers
// ============================================================================

std::string container_dirname(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) return std::string();
    return path.substr(0, pos);
}

std::string container_join(const std::string& base_dir, const std::string& href) {
    std::string joined;
    if (!href.empty() && href[0] == '/') {
        joined = href.substr(1);
    } else if (base_dir.empty()) {
        joined = href;
    } else {
        joined = base_dir + "/" + href;
    }

    std::vector<std::string> parts;
    size_t i = 0;
    while (i <= joined.size()) {
        size_t j = joined.find('/', i);
        if (j == std::string::npos) j = joined.size();
        std::string part = joined.substr(i, j - i);
        if (part == "..") {
            if (!parts.empty()) parts.pop_back();
        } else if (!part.empty() && part != ".") {
            parts.push_back(part);
        }
        i = j + 1;
    }

    std::string result;
    for (size_t k = 0; k < parts.size(); ++k) {
        if (k) result.push_back('/');
        result += parts[k];
    }
    return result;
}

std::string percent_decode(const std::string& href) {
    std::string out;
    out.reserve(href.size());
    for (size_t i = 0; i < href.size(); ++i) {
        if (href[i] == '%' && i + 2 < href.size() &&
            std::isxdigit(static_cast<unsigned char>(href[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(href[i + 2]))) {
            out += static_cast<char>(std::stoi(href.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += href[i];
        }
    }
    return out;
}

namespace {

// pugixml keeps prefixes; OPF files use "opf:", "dc:" or none
const char* local_name(const pugi::xml_node& node) {
    const char* name = node.name();
    const char* colon = std::strchr(name, ':');
    return colon ? colon + 1 : name;
}

pugi::xml_node child_local(const pugi::xml_node& parent, const char* name) {
    for (pugi::xml_node child = parent.first_child(); child; child = child.next_sibling()) {
        if (child.type() == pugi::node_element && std::strcmp(local_name(child), name) == 0) {
            return child;
        }
    }
    return pugi::xml_node();
}

std::string trimmed_text(const pugi::xml_node& node) {
    std::string text = node.text().as_string();
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

} // namespace

// ============================================================================
// EpubArchive
// ============================================================================

EpubArchive::EpubArchive(const std::string& path)
    : path_(path) {
    int errcode = 0;
    zip_ = zip_open(path.c_str(), ZIP_RDONLY, &errcode);
    if (!zip_) {
        zip_error_t ze;
        zip_error_init_with_code(&ze, errcode);
        std::string msg = "Cannot open EPUB '" + path + "': " + zip_error_strerror(&ze);
        zip_error_fini(&ze);
        throw ExtractionError(msg);
    }

    try {
        load_package();
    } catch (...) {
        zip_close(zip_);
        zip_ = nullptr;
        throw;
    }
}

EpubArchive::~EpubArchive() {
    if (zip_) {
        zip_close(zip_);
    }
}

bool EpubArchive::has_entry(const std::string& name) const {
    return zip_name_locate(zip_, name.c_str(), 0) >= 0;
}

std::string EpubArchive::read_entry(const std::string& name) const {
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat(zip_, name.c_str(), 0, &st) != 0) {
        throw ExtractionError("Missing EPUB entry: " + name);
    }

    zip_file_t* f = zip_fopen(zip_, name.c_str(), 0);
    if (!f) {
        throw ExtractionError("Cannot open EPUB entry: " + name);
    }

    std::string buf;
    buf.resize(static_cast<size_t>(st.size));
    zip_int64_t n = zip_fread(f, buf.data(), st.size);
    zip_fclose(f);

    if (n < 0 || n != static_cast<zip_int64_t>(st.size)) {
        throw ExtractionError("Truncated EPUB entry: " + name);
    }
    return buf;
}

const ManifestItem* EpubArchive::find_by_path(const std::string& full_path) const {
    auto it = by_path_.find(full_path);
    return it == by_path_.end() ? nullptr : &manifest_[it->second];
}

void EpubArchive::load_package() {
    std::string container_xml = read_entry("META-INF/container.xml");
    pugi::xml_document container;
    if (!container.load_string(container_xml.c_str())) {
        throw ExtractionError("Malformed META-INF/container.xml in " + path_);
    }

    pugi::xml_node rootfile = child_local(child_local(container.document_element(), "rootfiles"),
                                          "rootfile");
    opf_path_ = rootfile.attribute("full-path").as_string();
    if (opf_path_.empty()) {
        throw ExtractionError("No package document declared in " + path_);
    }

    std::string opf_content = read_entry(opf_path_);
    pugi::xml_document opf;
    pugi::xml_parse_result parsed = opf.load_string(opf_content.c_str());
    if (!parsed) {
        throw ExtractionError("Malformed package document " + opf_path_ + ": " +
                              parsed.description());
    }

    pugi::xml_node package = opf.document_element();
    std::string opf_dir = container_dirname(opf_path_);

    // Manifest
    std::map<std::string, size_t> by_id;
    for (pugi::xml_node item = child_local(package, "manifest").first_child(); item;
         item = item.next_sibling()) {
        if (item.type() != pugi::node_element || std::strcmp(local_name(item), "item") != 0) {
            continue;
        }
        ManifestItem entry;
        entry.id = item.attribute("id").as_string();
        entry.href = item.attribute("href").as_string();
        entry.media_type = item.attribute("media-type").as_string();
        entry.properties = item.attribute("properties").as_string();
        if (entry.id.empty() || entry.href.empty()) {
            continue;
        }
        entry.full_path = container_join(opf_dir, percent_decode(entry.href));

        // A second id for an already listed file aliases the first item
        auto listed = by_path_.find(entry.full_path);
        if (listed != by_path_.end()) {
            by_id[entry.id] = listed->second;
            continue;
        }

        by_id[entry.id] = manifest_.size();
        by_path_[entry.full_path] = manifest_.size();
        manifest_.push_back(entry);
    }

    // Spine: every itemref becomes a chapter, linear="no" included
    for (pugi::xml_node ref = child_local(package, "spine").first_child(); ref;
         ref = ref.next_sibling()) {
        if (ref.type() != pugi::node_element || std::strcmp(local_name(ref), "itemref") != 0) {
            continue;
        }
        std::string idref = ref.attribute("idref").as_string();
        auto it = by_id.find(idref);
        if (it == by_id.end()) {
            throw ExtractionError("Spine references unknown manifest item '" + idref +
                                  "' in " + opf_path_);
        }
        spine_.push_back(manifest_[it->second]);
    }

    if (spine_.empty()) {
        throw ExtractionError("EPUB spine is empty: " + path_);
    }

    // Dublin Core metadata
    for (pugi::xml_node field = child_local(package, "metadata").first_child(); field;
         field = field.next_sibling()) {
        if (field.type() != pugi::node_element) {
            continue;
        }
        std::string name = local_name(field);
        std::string value = trimmed_text(field);
        if (value.empty()) {
            continue;
        }

        if (name == "title" && metadata_.title.empty()) {
            metadata_.title = value;
        } else if (name == "creator") {
            metadata_.creators.push_back(value);
        } else if (name == "publisher" && metadata_.publisher.empty()) {
            metadata_.publisher = value;
        } else if (name == "date" && metadata_.date.empty()) {
            metadata_.date = value;
        } else if (name == "language" && metadata_.language.empty()) {
            metadata_.language = value;
        } else if (name == "rights" && metadata_.rights.empty()) {
            metadata_.rights = value;
        } else if (name == "identifier") {
            metadata_.identifiers.push_back(value);
            std::string scheme;
            for (pugi::xml_attribute attr = field.first_attribute(); attr; attr = attr.next_attribute()) {
                std::string attr_name = attr.name();
                if (attr_name == "scheme" || attr_name == "opf:scheme") {
                    scheme = attr.value();
                }
            }
            bool isbn_hint = scheme == "ISBN" || value.find("isbn") != std::string::npos ||
                             value.find("ISBN") != std::string::npos;
            std::string isbn = normalize_isbn(value);
            // Plain 10/13-digit identifiers count as ISBNs too; UUIDs never normalize
            if (metadata_.isbn.empty() && !isbn.empty() &&
                (isbn_hint || value.find_first_of("-:") == std::string::npos ||
                 value.size() <= 17)) {
                metadata_.isbn = isbn;
            }
        }
    }
}

} // namespace rd
