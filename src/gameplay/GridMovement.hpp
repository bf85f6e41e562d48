#pragma once

#include "ecs/Systems.hpp"
#include "ecs/Components.hpp"

#include <functional>
#include <string>

namespace overworld {

/// Tile-by-tile movement with smooth pixel interpolation (Pokemon-style).
///
/// Position stays on the source tile while moving; the visual displacement
/// lives in Position::pixelOffset. When progress reaches 1 the entity's
/// Position is replaced with the target tile and progress resets to 0.
struct GridMovement {
    Vec2 startPosition{0.0f, 0.0f};     // Pixels, source tile origin
    Vec2 targetPosition{0.0f, 0.0f};    // Pixels, target tile origin
    int targetX = 0;
    int targetY = 0;
    float movementProgress = 0.0f;      // Always within [0, 1]
    float speed = 64.0f;                // Pixels per second
    int tileSize = 16;                  // Pixels per tile
    Direction facing = Direction::South;
    bool isMoving = false;

    GridMovement() = default;
    explicit GridMovement(float pixelsPerSecond, int tile = 16)
        : speed(pixelsPerSecond), tileSize(tile) {}

    /// Seconds to cross one tile
    float stepDuration() const {
        return speed > 0.0f ? static_cast<float>(tileSize) / speed : 0.0f;
    }
};

/// Movement intent. Consumed when the entity is idle; kept while a step is
/// in flight so it starts the next step as soon as the current one lands.
struct MovementRequest {
    Direction direction = Direction::None;
};

/// Return true if an entity on `mapId` moving in `direction` may enter (x, y)
using WalkabilityCallback = std::function<bool(MapId mapId, int x, int y, Direction direction)>;

/// "walk_south", "walk_north", ... (static strings, never rebuilt)
const std::string& walkAnimationName(Direction dir);

/// "idle_south", "idle_north", ...
const std::string& idleAnimationName(Direction dir);

/// Queue a movement request on an entity
void requestMove(Registry& registry, Entity entity, Direction direction);

/// Advances GridMovement for entities with Position + GridMovement:
///   Idle   -> Moving  when a request targets a walkable tile
///   Moving -> Idle    when progress reaches 1 (Position snaps to target)
/// Walkability is checked before the transition; a blocked request only
/// turns the entity. If the entity has an Animation, the matching walk/idle
/// clip is selected in place on the stored component.
class MovementSystem : public System {
public:
    MovementSystem() : System("MovementSystem", SystemPriority::Movement) {}

    /// Shared walkability check. If unset, every tile is walkable.
    void setWalkabilityCallback(WalkabilityCallback callback) {
        m_isWalkable = std::move(callback);
    }

    void update(float dt) override;

    size_t movesStarted() const { return m_movesStarted; }
    size_t movesBlocked() const { return m_movesBlocked; }

private:
    /// Returns true if the move started
    bool tryStart(const Position& pos, GridMovement& move, Direction direction);
    void selectAnimation(Entity entity, const GridMovement& move);

    WalkabilityCallback m_isWalkable;
    std::vector<Entity> m_consumed;
    size_t m_movesStarted = 0;
    size_t m_movesBlocked = 0;
};

} // namespace overworld
