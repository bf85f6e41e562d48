#include "gameplay/GridMovement.hpp"
#include "gameplay/SpriteAnimation.hpp"

#include <algorithm>

namespace overworld {

namespace {

size_t directionSlot(Direction dir) {
    // None faces south
    return dir == Direction::None ? 0 : static_cast<size_t>(dir) - 1;
}

} // namespace

const std::string& walkAnimationName(Direction dir) {
    static const std::string names[] = {"walk_south", "walk_west", "walk_north", "walk_east"};
    return names[directionSlot(dir)];
}

const std::string& idleAnimationName(Direction dir) {
    static const std::string names[] = {"idle_south", "idle_west", "idle_north", "idle_east"};
    return names[directionSlot(dir)];
}

void requestMove(Registry& registry, Entity entity, Direction direction) {
    if (!registry.valid(entity)) return;
    registry.set<MovementRequest>(entity, MovementRequest{direction});
}

void MovementSystem::update(float dt) {
    Registry& registry = getRegistry();
    m_consumed.clear();

    registry.query<Position, GridMovement>(
        [this, dt, &registry](Entity entity, Position& pos, GridMovement& move) {
            if (move.isMoving) {
                float step = move.tileSize > 0
                    ? move.speed * dt / static_cast<float>(move.tileSize)
                    : 1.0f;
                move.movementProgress = std::clamp(move.movementProgress + std::max(step, 0.0f),
                                                   0.0f, 1.0f);

                if (move.movementProgress >= 1.0f) {
                    // Arrived: snap onto the target tile through set() so
                    // Position observers (spatial index) see the move
                    Position arrived = pos;
                    arrived.x = move.targetX;
                    arrived.y = move.targetY;
                    arrived.pixelOffset = Vec2(0.0f, 0.0f);
                    move.isMoving = false;
                    move.movementProgress = 0.0f;
                    registry.set<Position>(entity, arrived);
                } else {
                    Vec2 travel = move.targetPosition - move.startPosition;
                    pos.pixelOffset = travel * move.movementProgress;
                }
            }

            if (!move.isMoving) {
                if (const MovementRequest* request = registry.tryGetRef<MovementRequest>(entity)) {
                    if (request->direction != Direction::None) {
                        tryStart(registry.getRef<Position>(entity), move, request->direction);
                    }
                    m_consumed.push_back(entity);
                }
            }

            selectAnimation(entity, move);
        }
    );

    for (Entity entity : m_consumed) {
        registry.remove<MovementRequest>(entity);
    }
}

bool MovementSystem::tryStart(const Position& pos, GridMovement& move, Direction direction) {
    move.facing = direction;

    int dx = 0, dy = 0;
    directionDelta(direction, dx, dy);
    int targetX = pos.x + dx;
    int targetY = pos.y + dy;

    if (m_isWalkable && !m_isWalkable(pos.mapId, targetX, targetY, direction)) {
        ++m_movesBlocked;
        return false;
    }

    float tile = static_cast<float>(move.tileSize);
    move.startPosition = Vec2(static_cast<float>(pos.x) * tile, static_cast<float>(pos.y) * tile);
    move.targetPosition = Vec2(static_cast<float>(targetX) * tile, static_cast<float>(targetY) * tile);
    move.targetX = targetX;
    move.targetY = targetY;
    move.movementProgress = 0.0f;
    move.isMoving = true;
    ++m_movesStarted;
    return true;
}

void MovementSystem::selectAnimation(Entity entity, const GridMovement& move) {
    // In-place reference: the stored component changes, not a copy
    Animation* anim = getRegistry().tryGetRef<Animation>(entity);
    if (!anim) return;

    const std::string& wanted = move.isMoving ? walkAnimationName(move.facing)
                                              : idleAnimationName(move.facing);
    if (anim->currentAnimation != wanted) {
        anim->play(wanted);
    }
}

} // namespace overworld
