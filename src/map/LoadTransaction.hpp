#pragma once

#include "ecs/Registry.hpp"

#include <atomic>
#include <vector>

namespace overworld {

/// Cooperative cancellation flag for a map load. The loader checks it
/// between steps; requestCancel() may be called from any thread.
class CancellationToken {
public:
    void requestCancel() { m_cancelled.store(true, std::memory_order_release); }
    bool isCancelled() const { return m_cancelled.load(std::memory_order_acquire); }
    void reset() { m_cancelled.store(false, std::memory_order_release); }

private:
    std::atomic<bool> m_cancelled{false};
};

inline bool cancelled(const CancellationToken* token) {
    return token != nullptr && token->isCancelled();
}

/// Records every entity a load creates. Unless commit() is called, the
/// destructor destroys them all, which also drops their Spatial Index
/// entries through the Position destruction signal.
class LoadTransaction {
public:
    explicit LoadTransaction(Registry& registry) : m_registry(registry) {}

    ~LoadTransaction() {
        if (!m_committed) {
            rollback();
        }
    }

    LoadTransaction(const LoadTransaction&) = delete;
    LoadTransaction& operator=(const LoadTransaction&) = delete;

    void track(Entity entity) { m_entities.push_back(entity); }

    void track(const std::vector<Entity>& entities) {
        m_entities.insert(m_entities.end(), entities.begin(), entities.end());
    }

    /// Keep everything created so far. Returns the tracked entities.
    const std::vector<Entity>& commit() {
        m_committed = true;
        return m_entities;
    }

    /// Destroy every tracked entity now
    void rollback() {
        m_registry.destroyMany(m_entities);
        m_entities.clear();
    }

    bool committed() const { return m_committed; }
    size_t size() const { return m_entities.size(); }
    const std::vector<Entity>& entities() const { return m_entities; }

private:
    Registry& m_registry;
    std::vector<Entity> m_entities;
    bool m_committed = false;
};

} // namespace overworld
