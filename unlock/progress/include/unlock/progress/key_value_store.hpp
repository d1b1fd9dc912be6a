#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace unlock::progress {

// ============================================================================
// Key-Value Store
// ============================================================================
//
// Opaque blob storage the progress store persists into, one key per field
// group. set/remove return false only when the backing storage failed;
// removing an absent key succeeds. Callers treat failure as non-fatal.

class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;

    virtual std::optional<std::string> get(const std::string& key) const = 0;
    virtual bool set(const std::string& key, const std::string& value) = 0;
    virtual bool remove(const std::string& key) = 0;
};

class MemoryKeyValueStore final : public IKeyValueStore {
public:
    std::optional<std::string> get(const std::string& key) const override;
    bool set(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;

    size_t size() const;
    size_t write_count() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::string> m_values;
    size_t m_writes = 0;
};

// All keys live in one JSON object on disk; every set/remove rewrites the file
class JsonFileKeyValueStore final : public IKeyValueStore {
public:
    explicit JsonFileKeyValueStore(std::string path);

    std::optional<std::string> get(const std::string& key) const override;
    bool set(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;

    const std::string& path() const { return m_path; }

    // Re-read the file, dropping anything cached in memory
    bool reload();

private:
    bool flush() const;

    std::string m_path;
    mutable std::mutex m_mutex;
    std::map<std::string, std::string> m_values;
};

} // namespace unlock::progress
