#include <gtest/gtest.h>

#include "world/SpatialIndex.hpp"

#include <algorithm>
#include <climits>

using namespace overworld;

namespace {

bool containsEntity(const std::vector<Entity>& entities, Entity entity) {
    return std::find(entities.begin(), entities.end(), entity) != entities.end();
}

} // namespace

// ===== Manual maintenance =====

TEST(SpatialIndexTest, AddAndQuery) {
    Registry registry;
    SpatialIndex index;
    Entity a = registry.create();
    Entity b = registry.create();

    index.add(a, 1, 3, 4);
    index.add(b, 1, 3, 4);

    const auto& here = index.getEntitiesAt(1, 3, 4);
    EXPECT_EQ(here.size(), 2u);
    EXPECT_TRUE(containsEntity(here, a));
    EXPECT_TRUE(containsEntity(here, b));
    EXPECT_TRUE(index.getEntitiesAt(1, 4, 4).empty());
    EXPECT_TRUE(index.getEntitiesAt(2, 3, 4).empty());
    EXPECT_EQ(index.entityCount(), 2u);
    EXPECT_EQ(index.occupiedCellCount(), 1u);
}

TEST(SpatialIndexTest, RemoveDropsEmptyCell) {
    Registry registry;
    SpatialIndex index;
    Entity a = registry.create();
    index.add(a, 1, 0, 0);

    EXPECT_TRUE(index.remove(a));
    EXPECT_FALSE(index.remove(a));
    EXPECT_TRUE(index.getEntitiesAt(1, 0, 0).empty());
    EXPECT_EQ(index.occupiedCellCount(), 0u);
    EXPECT_EQ(index.mapEntityCount(1), 0u);
}

TEST(SpatialIndexTest, MoveBetweenCellsAndMaps) {
    Registry registry;
    SpatialIndex index;
    Entity a = registry.create();
    index.add(a, 1, 0, 0);

    EXPECT_TRUE(index.move(a, 1, 1, 0));
    EXPECT_TRUE(index.getEntitiesAt(1, 0, 0).empty());
    EXPECT_EQ(index.getEntitiesAt(1, 1, 0).size(), 1u);

    EXPECT_TRUE(index.move(a, 2, 1, 0));
    EXPECT_EQ(index.mapEntityCount(1), 0u);
    EXPECT_EQ(index.mapEntityCount(2), 1u);
    ASSERT_NE(index.cellOf(a), nullptr);
    EXPECT_EQ(index.cellOf(a)->mapId, 2u);

    Entity stranger = registry.create();
    EXPECT_FALSE(index.move(stranger, 1, 0, 0));
}

TEST(SpatialIndexTest, ReAddMovesInsteadOfDuplicating) {
    Registry registry;
    SpatialIndex index;
    Entity a = registry.create();
    index.add(a, 1, 0, 0);
    index.add(a, 1, 5, 5);

    EXPECT_EQ(index.entityCount(), 1u);
    EXPECT_TRUE(index.getEntitiesAt(1, 0, 0).empty());
    EXPECT_EQ(index.getEntitiesAt(1, 5, 5).size(), 1u);
}

TEST(SpatialIndexTest, BoundsQueryDenseAndSparse) {
    Registry registry;
    SpatialIndex index;
    std::vector<Entity> row;
    for (int x = 0; x < 10; ++x) {
        Entity e = registry.create();
        index.add(e, 1, x, 0);
        row.push_back(e);
    }
    Entity other = registry.create();
    index.add(other, 2, 1, 0);

    // Small rectangle: walks the cells
    auto small = index.getEntitiesInBounds(1, TileBounds(2, 0, 4, 0));
    EXPECT_EQ(small.size(), 3u);
    EXPECT_TRUE(containsEntity(small, row[3]));

    // Rectangle larger than the index: walks occupied cells
    auto large = index.getEntitiesInBounds(1, TileBounds(-100, -100, 100, 100));
    EXPECT_EQ(large.size(), 10u);
    EXPECT_FALSE(containsEntity(large, other));

    EXPECT_TRUE(index.getEntitiesInBounds(1, TileBounds()).empty());
}

TEST(SpatialIndexTest, BoundsQueryAtIntegerLimits) {
    Registry registry;
    SpatialIndex index;
    Entity edge = registry.create();
    Entity corner = registry.create();
    Entity origin = registry.create();
    index.add(edge, 1, INT_MAX, 0);
    index.add(corner, 1, INT_MIN, INT_MIN);
    index.add(origin, 1, 0, 0);

    // Single cell on the last column: the dense walk must stop after it
    auto single = index.getEntitiesInBounds(1, TileBounds(INT_MAX, 0, INT_MAX, 0));
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(single.front(), edge);

    // Whole int range in both axes
    auto everything = index.getEntitiesInBounds(1, TileBounds(INT_MIN, INT_MIN, INT_MAX, INT_MAX));
    EXPECT_EQ(everything.size(), 3u);

    auto wide = index.getEntitiesInBounds(1, TileBounds(0, 0, INT_MAX, INT_MAX));
    EXPECT_EQ(wide.size(), 2u);
    EXPECT_FALSE(containsEntity(wide, corner));

    auto lowCorner = index.getEntitiesInBounds(1, TileBounds(INT_MIN, INT_MIN, INT_MIN + 1, INT_MIN + 1));
    ASSERT_EQ(lowCorner.size(), 1u);
    EXPECT_EQ(lowCorner.front(), corner);
}

TEST(SpatialIndexTest, RemoveMapOnlyTouchesThatMap) {
    Registry registry;
    SpatialIndex index;
    for (int i = 0; i < 5; ++i) {
        index.add(registry.create(), 1, i, 0);
    }
    Entity keep = registry.create();
    index.add(keep, 2, 0, 0);

    EXPECT_EQ(index.removeMap(1), 5u);
    EXPECT_EQ(index.entityCount(), 1u);
    EXPECT_EQ(index.mapEntityCount(1), 0u);
    EXPECT_TRUE(index.contains(keep));
    EXPECT_EQ(index.removeMap(1), 0u);
}

TEST(SpatialIndexTest, NegativeCoordinates) {
    Registry registry;
    SpatialIndex index;
    Entity a = registry.create();
    Entity b = registry.create();
    index.add(a, 1, -1, 0);
    index.add(b, 1, 0, -1);

    EXPECT_EQ(index.getEntitiesAt(1, -1, 0).front(), a);
    EXPECT_EQ(index.getEntitiesAt(1, 0, -1).front(), b);
}

// ===== Registry signals =====

class AttachedSpatialIndexTest : public ::testing::Test {
protected:
    void SetUp() override { index.attach(registry); }
    void TearDown() override { index.detach(); }

    Entity spawn(int x, int y, MapId map = 1) {
        Entity e = registry.create(Position(x, y, map));
        index.add(e, registry.get<Position>(e));
        return e;
    }

    Registry registry;
    SpatialIndex index;
};

TEST_F(AttachedSpatialIndexTest, DestroyRemovesEntry) {
    Entity a = spawn(2, 2);
    registry.destroy(a);
    EXPECT_FALSE(index.contains(a));
    EXPECT_TRUE(index.getEntitiesAt(1, 2, 2).empty());
}

TEST_F(AttachedSpatialIndexTest, RemovingPositionRemovesEntry) {
    Entity a = spawn(2, 2);
    registry.remove<Position>(a);
    EXPECT_FALSE(index.contains(a));
}

TEST_F(AttachedSpatialIndexTest, SetPositionMovesEntry) {
    Entity a = spawn(2, 2);
    registry.set<Position>(a, Position(3, 2, 1));

    EXPECT_TRUE(index.getEntitiesAt(1, 2, 2).empty());
    ASSERT_EQ(index.getEntitiesAt(1, 3, 2).size(), 1u);
    EXPECT_EQ(index.getEntitiesAt(1, 3, 2).front(), a);
}

TEST_F(AttachedSpatialIndexTest, ModifyPositionMovesEntry) {
    Entity a = spawn(2, 2);
    registry.modify<Position>(a, [](Position& pos) { pos.y = 7; });
    ASSERT_NE(index.cellOf(a), nullptr);
    EXPECT_EQ(index.cellOf(a)->y, 7);
}

TEST_F(AttachedSpatialIndexTest, UnindexedEntitiesAreIgnored) {
    Entity loose = registry.create(Position(1, 1, 1));
    registry.set<Position>(loose, Position(2, 2, 1));
    EXPECT_FALSE(index.contains(loose));
    registry.destroy(loose);
    EXPECT_EQ(index.entityCount(), 0u);
}

TEST_F(AttachedSpatialIndexTest, DetachStopsTracking) {
    Entity a = spawn(0, 0);
    index.detach();
    EXPECT_FALSE(index.isAttached());

    registry.destroy(a);
    EXPECT_TRUE(index.contains(a));
    EXPECT_TRUE(index.remove(a));
}

TEST_F(AttachedSpatialIndexTest, ClearRegistryEmptiesIndex) {
    for (int i = 0; i < 20; ++i) {
        spawn(i % 4, i / 4);
    }
    registry.clear();
    EXPECT_EQ(index.entityCount(), 0u);
    EXPECT_EQ(index.occupiedCellCount(), 0u);
}
