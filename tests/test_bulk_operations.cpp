#include <gtest/gtest.h>

#include "ecs/BulkOperations.hpp"
#include "ecs/Components.hpp"

#include <set>
#include <stdexcept>

using namespace overworld;

namespace {

BulkRow<Position, TileSprite> tileRow(size_t i) {
    TileSprite sprite;
    sprite.gid = static_cast<uint32_t>(i % 7) + 1;
    return std::make_tuple(Position(static_cast<int>(i % 10), static_cast<int>(i / 10), 1), sprite);
}

} // namespace

TEST(BulkOperationsTest, CreatesExactlyN) {
    Registry registry;
    auto result = createMany<Position, TileSprite>(registry, 100, tileRow);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.entities.size(), 100u);
    EXPECT_EQ(result.requested, 100u);
    EXPECT_EQ(result.wouldHaveSucceeded, 100u);
    EXPECT_EQ((registry.count<Position, TileSprite>()), 100u);
    EXPECT_EQ(registry.alive(), 100u);
}

TEST(BulkOperationsTest, ComponentValuesComeFromFactory) {
    Registry registry;
    auto result = createMany<Position, TileSprite>(registry, 25, tileRow);
    ASSERT_TRUE(result.ok());

    for (size_t i = 0; i < result.entities.size(); ++i) {
        Position pos = registry.get<Position>(result.entities[i]);
        EXPECT_EQ(pos.x, static_cast<int>(i % 10));
        EXPECT_EQ(pos.y, static_cast<int>(i / 10));
        EXPECT_EQ(registry.get<TileSprite>(result.entities[i]).gid, static_cast<uint32_t>(i % 7) + 1);
    }
}

TEST(BulkOperationsTest, EntitiesAreDistinctAndValid) {
    Registry registry;
    auto result = createMany<Position>(registry, 50, [](size_t i) -> BulkRow<Position> {
        return std::make_tuple(Position(static_cast<int>(i), 0));
    });
    ASSERT_TRUE(result.ok());

    std::set<Entity> unique(result.entities.begin(), result.entities.end());
    EXPECT_EQ(unique.size(), 50u);
    for (Entity e : result.entities) {
        EXPECT_TRUE(registry.valid(e));
    }
}

TEST(BulkOperationsTest, ZeroCountIsEmptySuccess) {
    Registry registry;
    auto result = createMany<Position>(registry, 0, [](size_t) -> BulkRow<Position> {
        return std::nullopt;
    });
    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(result.entities.empty());
    EXPECT_TRUE(registry.empty());
}

TEST(BulkOperationsTest, InjectedFailureCreatesNothing) {
    Registry registry;
    Entity existing = registry.create(Position(0, 0));

    auto result = createMany<Position, TileSprite>(registry, 100, [](size_t i) -> BulkRow<Position, TileSprite> {
        if (i == 60) return std::nullopt;
        return tileRow(i);
    });

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.status, BulkCreateStatus::BulkCreateFailed);
    EXPECT_EQ(result.wouldHaveSucceeded, 60u);
    EXPECT_TRUE(result.entities.empty());
    EXPECT_FALSE(result.message.empty());

    // Only the pre-existing entity is reachable
    EXPECT_EQ(registry.alive(), 1u);
    EXPECT_EQ(registry.count<Position>(), 1u);
    EXPECT_EQ((registry.count<Position, TileSprite>()), 0u);
    EXPECT_TRUE(registry.valid(existing));
}

TEST(BulkOperationsTest, FailureOnFirstRow) {
    Registry registry;
    auto result = createMany<Position>(registry, 10, [](size_t) -> BulkRow<Position> {
        return std::nullopt;
    });
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.wouldHaveSucceeded, 0u);
    EXPECT_TRUE(registry.empty());
}

TEST(BulkOperationsTest, ThrowingFactoryPropagatesBeforeAnyEntityExists) {
    Registry registry;
    Entity existing = registry.create(Position(0, 0, 1));

    auto throwing = [](size_t i) -> BulkRow<Position, TileSprite> {
        if (i == 40) {
            throw std::runtime_error("bad tile row");
        }
        return tileRow(i);
    };
    EXPECT_THROW((createMany<Position, TileSprite>(registry, 64, throwing)), std::runtime_error);

    EXPECT_EQ(registry.alive(), 1u);
    EXPECT_TRUE(registry.valid(existing));
    EXPECT_EQ(registry.count<TileSprite>(), 0u);
}

TEST(BulkOperationsTest, EntityLimitFailsAllOrNothing) {
    Registry registry;
    registry.setEntityLimit(50);
    registry.create();
    registry.create();

    auto result = createMany<Position, TileSprite>(registry, 100, tileRow);

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.wouldHaveSucceeded, 48u);
    EXPECT_EQ(registry.alive(), 2u);
    EXPECT_EQ((registry.count<Position, TileSprite>()), 0u);
}

TEST(BulkOperationsTest, ExactlyAtLimitSucceeds) {
    Registry registry;
    registry.setEntityLimit(30);

    auto result = createMany<Position, TileSprite>(registry, 30, tileRow);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(registry.remainingCapacity(), 0u);
}

TEST(BulkOperationsTest, SecondBatchAfterFailureStillWorks) {
    Registry registry;
    auto failed = createMany<Position>(registry, 10, [](size_t i) -> BulkRow<Position> {
        if (i == 5) return std::nullopt;
        return std::make_tuple(Position(0, 0));
    });
    ASSERT_FALSE(failed.ok());

    auto ok = createMany<Position>(registry, 10, [](size_t i) -> BulkRow<Position> {
        return std::make_tuple(Position(static_cast<int>(i), 0));
    });
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(registry.count<Position>(), 10u);
}

TEST(BulkOperationsTest, StatusToString) {
    EXPECT_STREQ(bulkStatusToString(BulkCreateStatus::Success), "Success");
    EXPECT_STREQ(bulkStatusToString(BulkCreateStatus::BulkCreateFailed), "BulkCreateFailed");
}
