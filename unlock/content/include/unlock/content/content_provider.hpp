#pragma once

#include <unlock/content/site.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace unlock::content {

// ============================================================================
// Content Provider
// ============================================================================
//
// Read-only view of the site catalog. The catalog is refreshed independently
// of the progress engine; revision() changes whenever sites() would return a
// different list.

class IContentProvider {
public:
    virtual ~IContentProvider() = default;

    virtual std::vector<Site> sites() const = 0;
    virtual uint64_t revision() const = 0;

    std::optional<Site> find_site(const SiteId& id) const;
};

// In-memory catalog, also the target of the JSON loader
class StaticContentProvider final : public IContentProvider {
public:
    StaticContentProvider() = default;
    explicit StaticContentProvider(std::vector<Site> sites);

    std::vector<Site> sites() const override;
    uint64_t revision() const override;

    void set_sites(std::vector<Site> sites);
    void add_site(Site site);

    // Replaces the catalog with the contents of a JSON file:
    // { "sites": [ { "id", "name", "city", "era", "latitude", "longitude",
    //                "subLocations": [ { "id", "name" } ] } ] }
    bool load_from_file(const std::string& path);
    bool load_from_string(const std::string& text);

private:
    mutable std::mutex m_mutex;
    std::vector<Site> m_sites;
    uint64_t m_revision = 0;
};

} // namespace unlock::content
