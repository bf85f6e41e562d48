#include <gtest/gtest.h>

#include "world/CollisionService.hpp"

using namespace overworld;

// ===== MapRegistry =====

TEST(MapRegistryTest, IdsAreStablePerName) {
    MapRegistry maps;
    MapId route = maps.getOrAssignId("route1");
    MapId town = maps.getOrAssignId("pallet_town");

    EXPECT_EQ(route, 1u);
    EXPECT_EQ(town, 2u);
    EXPECT_EQ(maps.getOrAssignId("route1"), route);
    ASSERT_TRUE(maps.findId("pallet_town").has_value());
    EXPECT_EQ(*maps.findId("pallet_town"), town);
    EXPECT_FALSE(maps.findId("cerulean").has_value());
    ASSERT_NE(maps.findName(route), nullptr);
    EXPECT_EQ(*maps.findName(route), "route1");
    EXPECT_EQ(maps.findName(99), nullptr);
}

TEST(MapRegistryTest, LoadedBookkeeping) {
    MapRegistry maps;
    MapId b = maps.getOrAssignId("b");
    MapId a = maps.getOrAssignId("a");

    for (MapId id : {a, b}) {
        LoadedMap loaded;
        loaded.handle = MapHandle{id, NullEntity};
        loaded.info = MapInfo(id, "m", 4, 2);
        maps.recordLoaded(loaded);
    }
    EXPECT_EQ(maps.loadedCount(), 2u);
    EXPECT_EQ(maps.loadedMaps(), (std::vector<MapId>{b, a}));

    auto bounds = maps.bounds(a);
    ASSERT_TRUE(bounds.has_value());
    EXPECT_EQ(bounds->maxX, 3);
    EXPECT_EQ(bounds->maxY, 1);

    auto released = maps.release(a);
    ASSERT_TRUE(released.has_value());
    EXPECT_EQ(released->info.mapId, a);
    EXPECT_FALSE(maps.isLoaded(a));
    EXPECT_FALSE(maps.release(a).has_value());
    EXPECT_FALSE(maps.bounds(a).has_value());
}

// ===== CollisionService =====

class CollisionTest : public ::testing::Test {
protected:
    void SetUp() override {
        mapId = maps.getOrAssignId("cave");
        LoadedMap loaded;
        loaded.handle = MapHandle{mapId, registry.create()};
        loaded.info = MapInfo(mapId, "cave", 5, 5);
        maps.recordLoaded(loaded);
    }

    Entity place(int x, int y) {
        Entity e = registry.create(Position(x, y, mapId));
        index.add(e, registry.get<Position>(e));
        return e;
    }

    Registry registry;
    SpatialIndex index;
    MapRegistry maps;
    CollisionService collision{registry, index, maps};
    MapId mapId = InvalidMapId;
};

TEST_F(CollisionTest, EmptyCellIsWalkable) {
    EXPECT_TRUE(collision.isWalkable(mapId, 2, 2));
    EXPECT_EQ(collision.outOfBoundsQueries(), 0u);
}

TEST_F(CollisionTest, OutOfBoundsIsNotWalkable) {
    EXPECT_FALSE(collision.isWalkable(mapId, -1, 0));
    EXPECT_FALSE(collision.isWalkable(mapId, 5, 0));
    EXPECT_FALSE(collision.isWalkable(mapId, 0, 5));
    EXPECT_FALSE(collision.isWalkable(mapId + 1, 0, 0));
    EXPECT_EQ(collision.outOfBoundsQueries(), 4u);
}

TEST_F(CollisionTest, SolidBlocks) {
    Entity rock = place(1, 1);
    registry.add<Collision>(rock, Collision{true});
    EXPECT_FALSE(collision.isWalkable(mapId, 1, 1, Direction::South));
}

TEST_F(CollisionTest, NonSolidCollisionDoesNotBlock) {
    Entity bush = place(1, 1);
    registry.add<Collision>(bush, Collision{false});
    registry.add<TerrainType>(bush, TerrainType{"grass", ""});
    EXPECT_TRUE(collision.isWalkable(mapId, 1, 1));
}

TEST_F(CollisionTest, AnySolidEntityOnCellBlocks) {
    place(3, 3);
    Entity npc = place(3, 3);
    registry.add<Collision>(npc, Collision{true});
    EXPECT_FALSE(collision.isWalkable(mapId, 3, 3));
}

TEST_F(CollisionTest, LedgeOnlyEnterableInJumpDirection) {
    Entity ledge = place(2, 2);
    registry.add<Collision>(ledge, Collision{true});
    registry.add<TileLedge>(ledge, TileLedge{Direction::South});

    EXPECT_TRUE(collision.isWalkable(mapId, 2, 2, Direction::South));
    EXPECT_FALSE(collision.isWalkable(mapId, 2, 2, Direction::North));
    EXPECT_FALSE(collision.isWalkable(mapId, 2, 2, Direction::East));
    EXPECT_FALSE(collision.isWalkable(mapId, 2, 2, Direction::West));
    EXPECT_FALSE(collision.isWalkable(mapId, 2, 2));
}

TEST_F(CollisionTest, LedgeDoesNotExcuseOtherSolids) {
    Entity ledge = place(2, 2);
    registry.add<Collision>(ledge, Collision{true});
    registry.add<TileLedge>(ledge, TileLedge{Direction::East});
    Entity boulder = place(2, 2);
    registry.add<Collision>(boulder, Collision{true});

    EXPECT_FALSE(collision.isWalkable(mapId, 2, 2, Direction::East));
}

TEST_F(CollisionTest, LedgeQueries) {
    Entity ledge = place(4, 0);
    registry.add<TileLedge>(ledge, TileLedge{Direction::West});

    EXPECT_TRUE(collision.isLedge(mapId, 4, 0));
    EXPECT_EQ(collision.getLedgeJumpDirection(mapId, 4, 0), Direction::West);
    EXPECT_FALSE(collision.isLedge(mapId, 0, 0));
    EXPECT_EQ(collision.getLedgeJumpDirection(mapId, 0, 0), Direction::None);
}

TEST_F(CollisionTest, DestroyedEntityNoLongerBlocks) {
    index.attach(registry);
    Entity rock = place(0, 4);
    registry.add<Collision>(rock, Collision{true});
    ASSERT_FALSE(collision.isWalkable(mapId, 0, 4));

    registry.destroy(rock);
    EXPECT_TRUE(collision.isWalkable(mapId, 0, 4));
    index.detach();
}
