#pragma once

#include <entt/entt.hpp>

#include <atomic>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace overworld {

/// Marker for the component types a query must NOT have.
///   registry.query<Position, TileSprite>(Exclude<AnimatedTile>{}, fn);
template<typename... Components>
struct Exclude {};

/// Sorted include/exclude component type ids that identify a query.
using QueryKey = std::pair<std::vector<entt::id_type>, std::vector<entt::id_type>>;

/// Immutable, runtime description of a query: "has all of Include,
/// none of Exclude". Type ids are EnTT storage ids, so a description can be
/// evaluated against a registry with entt::runtime_view.
class QueryDescription {
public:
    QueryDescription() = default;

    template<typename... Include, typename... Ex>
    static QueryDescription make(Exclude<Ex...> = {}) {
        QueryDescription desc;
        (desc.addInclude(entt::type_hash<Include>::value(), entt::type_id<Include>().name()), ...);
        (desc.addExclude(entt::type_hash<Ex>::value(), entt::type_id<Ex>().name()), ...);
        desc.normalize();
        return desc;
    }

    template<typename... Include, typename... Ex>
    static QueryKey keyFor(Exclude<Ex...> = {}) {
        s_keyBuilds.fetch_add(1, std::memory_order_relaxed);
        QueryKey key;
        key.first = {entt::type_hash<Include>::value()...};
        key.second = {entt::type_hash<Ex>::value()...};
        normalizeIds(key.first);
        normalizeIds(key.second);
        return key;
    }

    const std::vector<entt::id_type>& includes() const { return m_key.first; }
    const std::vector<entt::id_type>& excludes() const { return m_key.second; }
    const QueryKey& key() const { return m_key; }

    /// Number of keyFor() calls made so far, process-wide
    static size_t keyBuilds() { return s_keyBuilds.load(std::memory_order_relaxed); }

    /// Human-readable form, e.g. "all(Position, TileSprite) none(AnimatedTile)"
    const std::string& describe() const { return m_description; }

private:
    void addInclude(entt::id_type id, std::string_view name);
    void addExclude(entt::id_type id, std::string_view name);
    void normalize();
    static void normalizeIds(std::vector<entt::id_type>& ids);

    static inline std::atomic<size_t> s_keyBuilds{0};

    QueryKey m_key;
    std::vector<std::string> m_includeNames;
    std::vector<std::string> m_excludeNames;
    std::string m_description;
};

} // namespace overworld
