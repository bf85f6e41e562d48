#pragma once

#include "ecs/Query.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <shared_mutex>

namespace overworld {

/// Memoizes QueryDescriptions by their component type-set so per-frame code
/// does not rebuild filter state. Returned references stay valid until
/// clear() or destruction; entries are never evicted during normal operation.
///
/// Lookups take a shared lock, so any number of threads may read
/// concurrently. Creating a missing entry takes the exclusive lock.
class QueryCache {
public:
    QueryCache() = default;

    // Non-copyable
    QueryCache(const QueryCache&) = delete;
    QueryCache& operator=(const QueryCache&) = delete;

    template<typename... Include, typename... Ex>
    const QueryDescription& getOrCreate(Exclude<Ex...> exclude = {}) {
        static_assert(sizeof...(Include) > 0, "a query needs at least one included component");
        // Built once per type-set instantiation; a hit is just the shared-locked find
        static const QueryKey key = QueryDescription::keyFor<Include...>(exclude);
        if (const QueryDescription* found = find(key)) {
            return *found;
        }
        return insert(QueryDescription::make<Include...>(exclude));
    }

    /// Number of distinct descriptions held
    size_t size() const;

    size_t hits() const { return m_hits.load(std::memory_order_relaxed); }
    size_t misses() const { return m_misses.load(std::memory_order_relaxed); }

    /// Drop every description. Invalidates all handles; teardown only.
    void clear();

private:
    const QueryDescription* find(const QueryKey& key) const;
    const QueryDescription& insert(QueryDescription description);

    mutable std::shared_mutex m_mutex;
    std::map<QueryKey, std::unique_ptr<QueryDescription>> m_entries;
    mutable std::atomic<size_t> m_hits{0};
    std::atomic<size_t> m_misses{0};
};

} // namespace overworld
