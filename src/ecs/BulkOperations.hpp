#pragma once

#include "ecs/Registry.hpp"
#include "engine/Log.hpp"

#include <new>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace overworld {

enum class BulkCreateStatus {
    Success,
    BulkCreateFailed
};

inline const char* bulkStatusToString(BulkCreateStatus status) {
    switch (status) {
        case BulkCreateStatus::Success:          return "Success";
        case BulkCreateStatus::BulkCreateFailed: return "BulkCreateFailed";
    }
    return "Unknown";
}

struct BulkCreateResult {
    BulkCreateStatus status = BulkCreateStatus::Success;
    std::vector<Entity> entities;       // Empty unless status == Success
    size_t requested = 0;
    size_t wouldHaveSucceeded = 0;      // Rows produced before the failure
    std::string message;

    bool ok() const { return status == BulkCreateStatus::Success; }
};

/// One row of initial component values, or nullopt to abort the batch.
template<typename... Components>
using BulkRow = std::optional<std::tuple<Components...>>;

namespace detail {

template<typename Columns, typename Row, size_t... I>
void appendRow(Columns& columns, Row&& row, std::index_sequence<I...>) {
    (std::get<I>(columns).push_back(std::move(std::get<I>(row))), ...);
}

template<typename... Components, size_t... I>
void insertColumns(entt::registry& raw, const std::vector<Entity>& entities,
                   std::tuple<std::vector<Components>...>& columns, std::index_sequence<I...>) {
    (raw.insert<Components>(entities.begin(), entities.end(), std::get<I>(columns).begin()), ...);
}

} // namespace detail

/// Create `count` entities that all carry Components..., all or nothing.
///
/// Every row is produced by factory(index) before any entity exists. The
/// entity pool and each component pool are then reserved once and filled with
/// EnTT range create/insert, so the new entities sit contiguously in every
/// pool. On failure (factory returned nullopt, entity limit, allocation
/// failure) no entity from this call survives. Exceptions other than
/// std::bad_alloc thrown by the factory propagate; no entity exists yet then.
///
/// Components must be non-empty types; attach tag components afterwards.
template<typename... Components, typename Factory>
BulkCreateResult createMany(Registry& registry, size_t count, Factory&& factory) {
    static_assert(sizeof...(Components) > 0, "createMany needs at least one component type");

    BulkCreateResult result;
    result.requested = count;

    auto fail = [&result](size_t produced, std::string message) {
        result.status = BulkCreateStatus::BulkCreateFailed;
        result.wouldHaveSucceeded = produced;
        result.message = std::move(message);
        result.entities.clear();
        LOG_DEBUG("createMany: {} ({} of {} rows)", result.message, produced, result.requested);
        return result;
    };

    if (count == 0) {
        return result;
    }

    // Phase 1: produce every row without touching the registry
    std::tuple<std::vector<Components>...> columns;
    size_t produced = 0;
    try {
        std::apply([count](auto&... column) { (column.reserve(count), ...); }, columns);
        for (; produced < count; ++produced) {
            BulkRow<Components...> row = factory(produced);
            if (!row) {
                return fail(produced, "factory failed at index " + std::to_string(produced));
            }
            detail::appendRow(columns, std::move(*row), std::index_sequence_for<Components...>{});
        }
    } catch (const std::bad_alloc&) {
        return fail(produced, "out of memory while producing component values");
    }

    size_t remaining = registry.remainingCapacity();
    if (count > remaining) {
        return fail(remaining, "entity limit " + std::to_string(registry.entityLimit()) + " exceeded");
    }

    // Phase 2: one reservation per pool, then range create and insert
    entt::registry& raw = registry.raw();
    result.entities.assign(count, NullEntity);
    try {
        auto& entityPool = raw.storage<entt::entity>();
        entityPool.reserve(entityPool.size() + count);
        (raw.storage<Components>().reserve(raw.storage<Components>().size() + count), ...);

        raw.create(result.entities.begin(), result.entities.end());
        detail::insertColumns(raw, result.entities, columns,
                              std::index_sequence_for<Components...>{});
    } catch (const std::bad_alloc&) {
        registry.destroyMany(result.entities);
        return fail(0, "out of memory while creating entities");
    }

    result.wouldHaveSucceeded = count;
    return result;
}

} // namespace overworld
