#include <unlock/core/event_dispatcher.hpp>
#include <algorithm>
#include <utility>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace unlock::core {

struct ScopedConnection::Registry {
    struct Entry {
        uint64_t id;
        std::shared_ptr<const std::function<void(const void*)>> handler;
    };

    mutable std::mutex mutex;
    std::unordered_map<std::type_index, std::vector<Entry>> handlers;
    uint64_t next_id = 1;

    bool remove(std::type_index type, uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = handlers.find(type);
        if (it == handlers.end()) {
            return false;
        }
        auto& entries = it->second;
        auto removed = std::erase_if(entries, [id](const Entry& e) { return e.id == id; });
        if (entries.empty()) {
            handlers.erase(it);
        }
        return removed > 0;
    }
};

// ============================================================================
// ScopedConnection
// ============================================================================

ScopedConnection::ScopedConnection(ScopedConnection&& other) noexcept
    : m_registry(std::move(other.m_registry))
    , m_type(other.m_type)
    , m_id(std::exchange(other.m_id, 0)) {}

ScopedConnection& ScopedConnection::operator=(ScopedConnection&& other) noexcept {
    if (this != &other) {
        disconnect();
        m_registry = std::move(other.m_registry);
        m_type = other.m_type;
        m_id = std::exchange(other.m_id, 0);
    }
    return *this;
}

void ScopedConnection::disconnect() {
    if (m_id == 0) {
        return;
    }
    if (auto registry = m_registry.lock()) {
        registry->remove(m_type, m_id);
    }
    m_registry.reset();
    m_id = 0;
}

bool ScopedConnection::connected() const {
    return m_id != 0 && !m_registry.expired();
}

// ============================================================================
// EventDispatcher
// ============================================================================

EventDispatcher::EventDispatcher()
    : m_registry(std::make_shared<ScopedConnection::Registry>()) {}

EventDispatcher::~EventDispatcher() = default;

ScopedConnection EventDispatcher::subscribe_erased(std::type_index type, ErasedHandler handler) {
    std::lock_guard<std::mutex> lock(m_registry->mutex);
    uint64_t id = m_registry->next_id++;
    m_registry->handlers[type].push_back(
        {id, std::make_shared<const ErasedHandler>(std::move(handler))});
    return ScopedConnection(m_registry, type, id);
}

void EventDispatcher::dispatch_erased(std::type_index type, const void* event) const {
    // Snapshot so handlers may subscribe or disconnect while running
    std::vector<ScopedConnection::Registry::Entry> entries;
    {
        std::lock_guard<std::mutex> lock(m_registry->mutex);
        auto it = m_registry->handlers.find(type);
        if (it == m_registry->handlers.end()) {
            return;
        }
        entries = it->second;
    }

    for (const auto& entry : entries) {
        (*entry.handler)(event);
    }
}

size_t EventDispatcher::handler_count(std::type_index type) const {
    std::lock_guard<std::mutex> lock(m_registry->mutex);
    auto it = m_registry->handlers.find(type);
    return it != m_registry->handlers.end() ? it->second.size() : 0;
}

size_t EventDispatcher::total_handler_count() const {
    std::lock_guard<std::mutex> lock(m_registry->mutex);
    size_t count = 0;
    for (const auto& [type, entries] : m_registry->handlers) {
        count += entries.size();
    }
    return count;
}

} // namespace unlock::core
