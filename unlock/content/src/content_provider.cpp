#include <unlock/content/content_provider.hpp>
#include <unlock/core/log.hpp>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace unlock::content {

using json = nlohmann::json;

// ============================================================================
// IContentProvider
// ============================================================================

std::optional<Site> IContentProvider::find_site(const SiteId& id) const {
    for (auto& site : sites()) {
        if (site.id == id) {
            return site;
        }
    }
    return std::nullopt;
}

// ============================================================================
// StaticContentProvider
// ============================================================================

StaticContentProvider::StaticContentProvider(std::vector<Site> sites)
    : m_sites(std::move(sites)), m_revision(1) {}

std::vector<Site> StaticContentProvider::sites() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sites;
}

uint64_t StaticContentProvider::revision() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_revision;
}

void StaticContentProvider::set_sites(std::vector<Site> sites) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sites = std::move(sites);
    ++m_revision;
}

void StaticContentProvider::add_site(Site site) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sites.push_back(std::move(site));
    ++m_revision;
}

bool StaticContentProvider::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        core::log_warning("content", "Could not open site catalog: {}", path);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!load_from_string(buffer.str())) {
        return false;
    }

    core::log_info("content", "Loaded site catalog from: {}", path);
    return true;
}

bool StaticContentProvider::load_from_string(const std::string& text) {
    try {
        json j = json::parse(text);

        std::vector<Site> loaded;
        for (const auto& s : j.at("sites")) {
            Site site;
            site.id = s.at("id").get<std::string>();
            site.name = s.value("name", site.id);
            site.city = s.value("city", "");
            site.era = s.value("era", "");
            site.coordinate.latitude = s.at("latitude").get<double>();
            site.coordinate.longitude = s.at("longitude").get<double>();

            if (s.contains("subLocations")) {
                for (const auto& sub : s["subLocations"]) {
                    SubLocation sl;
                    sl.id = sub.at("id").get<std::string>();
                    sl.name = sub.value("name", sl.id);
                    site.sub_locations.push_back(std::move(sl));
                }
            }

            if (!site.coordinate.is_valid()) {
                core::log_warning("content", "Skipping site '{}' with invalid coordinate", site.id);
                continue;
            }
            loaded.push_back(std::move(site));
        }

        core::log_info("content", "Parsed {} sites", loaded.size());
        set_sites(std::move(loaded));
        return true;

    } catch (const std::exception& e) {
        core::log_error("content", "Failed to parse site catalog: {}", e.what());
        return false;
    }
}

} // namespace unlock::content
