#include "engine/Config.hpp"
#include "engine/GameLoop.hpp"
#include "engine/Log.hpp"
#include "ecs/QueryCache.hpp"
#include "map/MapLoader.hpp"
#include "map/TemplateRegistry.hpp"
#include "world/CollisionService.hpp"
#include "world/SpatialIndex.hpp"
#include "gameplay/GridMovement.hpp"
#include "gameplay/SpriteAnimation.hpp"
#include "gameplay/TileAnimationSystem.hpp"

#include <string>

using namespace overworld;

namespace {

/// Spawn a player from the "player" template if the map did not place one
Entity ensurePlayer(Registry& registry, SpatialIndex& index, const TemplateRegistry& templates,
                    const MapInfo& info, float movementSpeed) {
    auto players = registry.collect<Player>();
    if (!players.empty()) {
        return players.front();
    }

    Entity player = registry.create(Position(info.width / 2, info.height / 2, info.mapId),
                                    Name{"player"});
    if (const EntityTemplate* tmpl = templates.resolve("player")) {
        TemplateRegistry::apply(registry, player, *tmpl, info.tileSize);
    }
    if (!registry.has<GridMovement>(player)) {
        registry.set<GridMovement>(player, GridMovement(movementSpeed, info.tileSize));
    }
    index.add(player, registry.get<Position>(player));
    LOG_INFO("No player on map '{}', spawned one at ({}, {})", info.name, info.width / 2, info.height / 2);
    return player;
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath = argc > 1 ? argv[1] : "config.json";

    Config config;
    bool configLoaded = config.loadFromFile(configPath);
    GameSettings settings = config.toSettings();

    Log::init(settings.logFile, settings.logLevel);
    if (!configLoaded) {
        LOG_WARN("Could not load '{}', running with defaults", configPath);
    }

    std::string mapPath = argc > 2 ? argv[2] : config.getString("world.start_map", "");
    if (mapPath.empty()) {
        LOG_CRITICAL("No map given (argument 2 or world.start_map)");
        Log::shutdown();
        return 1;
    }

    Registry registry;
    registry.setEntityLimit(settings.entityLimit);

    SpatialIndex index;
    index.attach(registry);

    MapRegistry maps;
    QueryCache queries;

    TemplateRegistry templates;
    templates.registerBuiltins();
    if (!settings.templatesFile.empty() && !templates.loadFromFile(settings.templatesFile)) {
        LOG_WARN("Continuing with built-in templates only");
    }

    MapLoader loader(maps, index, queries);
    loader.setTemplateResolver(&templates);

    // I/O and validation off the world thread, mutation on it
    CancellationToken cancel;
    PreparedMap prepared = loader.prepareMapAsync(mapPath, &cancel).get();
    MapLoadResult loaded = loader.instantiate(registry, prepared);
    if (!loaded.ok()) {
        LOG_CRITICAL("Failed to load '{}': {} ({})", mapPath,
                     mapLoadStatusToString(loaded.status), loaded.message);
        index.detach();
        Log::shutdown();
        return 1;
    }

    const LoadedMap* map = maps.find(loaded.handle.mapId);
    Entity player = ensurePlayer(registry, index, templates, map->info, settings.movementSpeed);

    CollisionService collision(registry, index, maps);
    AnimationManifestCache manifests(
        AnimationManifestCache::jsonFileProvider(settings.assetRoot + "/sprites"));

    SystemScheduler scheduler;
    scheduler.init(registry);

    auto* movement = scheduler.addSystem<MovementSystem>(SystemPhase::Update);
    movement->setWalkabilityCallback([&collision](MapId mapId, int x, int y, Direction dir) {
        return collision.isWalkable(mapId, x, y, dir);
    });
    scheduler.addSystem<AnimationSystem>(SystemPhase::Update, manifests);
    scheduler.addSystem<TileAnimationSystem>(SystemPhase::Update);

    GameLoop loop(scheduler, settings.fixedTimestep, settings.maxStepsPerFrame);

    // Headless demo: walk the player around a square at a fixed frame rate
    const Direction pattern[] = {Direction::South, Direction::East, Direction::North, Direction::West};
    int frames = config.getInt("demo.frames", 600);
    size_t leg = 0;
    for (int frame = 0; frame < frames; ++frame) {
        const GridMovement* move = registry.tryGetRef<GridMovement>(player);
        if (move && !move->isMoving && !registry.has<MovementRequest>(player)) {
            requestMove(registry, player, pattern[(leg++ / 3) % 4]);
        }
        loop.tick(settings.fixedTimestep);
    }

    Position where = registry.get<Position>(player);
    LOG_INFO("Demo finished after {} frames: player at ({}, {}), {} moves, {} blocked",
             loop.frameCount(), where.x, where.y, movement->movesStarted(), movement->movesBlocked());

    scheduler.shutdown();
    loader.unloadMap(registry, loaded.handle);
    index.detach();
    Log::shutdown();
    return 0;
}
