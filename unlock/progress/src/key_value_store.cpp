#include <unlock/progress/key_value_store.hpp>
#include <unlock/core/log.hpp>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <nlohmann/json.hpp>

namespace unlock::progress {

using json = nlohmann::json;
namespace fs = std::filesystem;

// ============================================================================
// MemoryKeyValueStore
// ============================================================================

std::optional<std::string> MemoryKeyValueStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_values.find(key);
    if (it == m_values.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryKeyValueStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_values[key] = value;
    ++m_writes;
    return true;
}

bool MemoryKeyValueStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_values.erase(key);
    ++m_writes;
    return true;
}

size_t MemoryKeyValueStore::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_values.size();
}

size_t MemoryKeyValueStore::write_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_writes;
}

// ============================================================================
// JsonFileKeyValueStore
// ============================================================================

JsonFileKeyValueStore::JsonFileKeyValueStore(std::string path)
    : m_path(std::move(path)) {
    reload();
}

bool JsonFileKeyValueStore::reload() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_values.clear();

    std::ifstream file(m_path);
    if (!file.is_open()) {
        // First run: nothing persisted yet
        return false;
    }

    try {
        json j = json::parse(file);
        for (auto& [key, value] : j.items()) {
            if (value.is_string()) {
                m_values[key] = value.get<std::string>();
            } else {
                core::log_warning("storage", "Ignoring non-string value for key '{}'", key);
            }
        }
        return true;
    } catch (const std::exception& e) {
        core::log_error("storage", "Failed to read store {}: {}", m_path, e.what());
        return false;
    }
}

std::optional<std::string> JsonFileKeyValueStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_values.find(key);
    if (it == m_values.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool JsonFileKeyValueStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_values[key] = value;
    return flush();
}

bool JsonFileKeyValueStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_values.erase(key) == 0) {
        return true;
    }
    return flush();
}

bool JsonFileKeyValueStore::flush() const {
    json j = json::object();
    for (const auto& [key, value] : m_values) {
        j[key] = value;
    }

    // Write to temp file first, then swap it in
    std::string temp_path = m_path + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file.is_open()) {
            core::log_error("storage", "Could not open store for writing: {}", temp_path);
            return false;
        }
        file << j.dump(2);
        if (!file.good()) {
            core::log_error("storage", "Short write to {}", temp_path);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(temp_path, m_path, ec);
    if (ec) {
        core::log_error("storage", "Could not replace {}: {}", m_path, ec.message());
        fs::remove(temp_path, ec);
        return false;
    }
    return true;
}

} // namespace unlock::progress
