#include "ecs/QueryCache.hpp"

#include <algorithm>
#include <mutex>

namespace overworld {

// ---------------------------------------------------------------------------
// QueryDescription
// ---------------------------------------------------------------------------

void QueryDescription::addInclude(entt::id_type id, std::string_view name) {
    if (std::find(m_key.first.begin(), m_key.first.end(), id) != m_key.first.end()) {
        return;
    }
    m_key.first.push_back(id);
    m_includeNames.emplace_back(name);
}

void QueryDescription::addExclude(entt::id_type id, std::string_view name) {
    if (std::find(m_key.second.begin(), m_key.second.end(), id) != m_key.second.end()) {
        return;
    }
    m_key.second.push_back(id);
    m_excludeNames.emplace_back(name);
}

void QueryDescription::normalizeIds(std::vector<entt::id_type>& ids) {
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
}

void QueryDescription::normalize() {
    normalizeIds(m_key.first);
    normalizeIds(m_key.second);
    std::sort(m_includeNames.begin(), m_includeNames.end());
    std::sort(m_excludeNames.begin(), m_excludeNames.end());

    auto join = [](const std::vector<std::string>& names) {
        std::string out;
        for (size_t i = 0; i < names.size(); ++i) {
            if (i > 0) out += ", ";
            out += names[i];
        }
        return out;
    };

    m_description = "all(" + join(m_includeNames) + ")";
    if (!m_excludeNames.empty()) {
        m_description += " none(" + join(m_excludeNames) + ")";
    }
}

// ---------------------------------------------------------------------------
// QueryCache
// ---------------------------------------------------------------------------

const QueryDescription* QueryCache::find(const QueryKey& key) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return nullptr;
    }
    m_hits.fetch_add(1, std::memory_order_relaxed);
    return it->second.get();
}

const QueryDescription& QueryCache::insert(QueryDescription description) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    // Another thread may have created it between our shared and unique lock
    auto it = m_entries.find(description.key());
    if (it != m_entries.end()) {
        m_hits.fetch_add(1, std::memory_order_relaxed);
        return *it->second;
    }
    m_misses.fetch_add(1, std::memory_order_relaxed);
    QueryKey key = description.key();
    auto entry = std::make_unique<QueryDescription>(std::move(description));
    const QueryDescription& ref = *entry;
    m_entries.emplace(std::move(key), std::move(entry));
    return ref;
}

size_t QueryCache::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_entries.size();
}

void QueryCache::clear() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_entries.clear();
}

} // namespace overworld
