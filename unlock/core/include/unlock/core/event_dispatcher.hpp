#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <type_traits>
#include <typeindex>

namespace unlock::core {

class EventDispatcher;

// ============================================================================
// ScopedConnection - RAII handle for event subscriptions
// ============================================================================
//
// Holds a weak reference to the dispatcher's handler table, so a connection
// may outlive the dispatcher that issued it.

class ScopedConnection {
public:
    ScopedConnection() = default;
    ~ScopedConnection() { disconnect(); }

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    ScopedConnection(ScopedConnection&& other) noexcept;
    ScopedConnection& operator=(ScopedConnection&& other) noexcept;

    void disconnect();
    bool connected() const;

private:
    friend class EventDispatcher;
    struct Registry;

    ScopedConnection(std::weak_ptr<Registry> registry, std::type_index type, uint64_t id)
        : m_registry(std::move(registry)), m_type(type), m_id(id) {}

    std::weak_ptr<Registry> m_registry;
    std::type_index m_type = std::type_index(typeid(void));
    uint64_t m_id = 0;
};

// ============================================================================
// EventDispatcher - Type-safe event pub/sub
// ============================================================================
//
// Owned by the composition root and handed to the components that publish
// progress events. Publishers may run on any thread (location fixes arrive
// on watchdog threads); handlers run synchronously on the publishing thread,
// in subscription order, outside the dispatcher's lock.

class EventDispatcher {
public:
    EventDispatcher();
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    template<typename T>
    [[nodiscard]] ScopedConnection subscribe(std::function<void(const T&)> callback) {
        static_assert(std::is_class_v<T>, "Event type must be a class/struct");
        return subscribe_erased(std::type_index(typeid(T)),
            [callback = std::move(callback)](const void* event) {
                callback(*static_cast<const T*>(event));
            });
    }

    template<typename T>
    void dispatch(const T& event) const {
        static_assert(std::is_class_v<T>, "Event type must be a class/struct");
        dispatch_erased(std::type_index(typeid(T)), &event);
    }

    template<typename T>
    size_t handler_count() const {
        return handler_count(std::type_index(typeid(T)));
    }

    size_t total_handler_count() const;

private:
    using ErasedHandler = std::function<void(const void*)>;

    ScopedConnection subscribe_erased(std::type_index type, ErasedHandler handler);
    void dispatch_erased(std::type_index type, const void* event) const;
    size_t handler_count(std::type_index type) const;

    std::shared_ptr<ScopedConnection::Registry> m_registry;
};

} // namespace unlock::core
