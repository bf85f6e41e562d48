#pragma once

#include <cmath>

namespace overworld {

/// 2D vector for pixel positions and offsets.
struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vec2() = default;
    constexpr Vec2(float x, float y) : x(x), y(y) {}

    Vec2 operator+(const Vec2& other) const { return {x + other.x, y + other.y}; }
    Vec2 operator-(const Vec2& other) const { return {x - other.x, y - other.y}; }
    Vec2 operator*(float scalar) const { return {x * scalar, y * scalar}; }
    Vec2& operator+=(const Vec2& other) { x += other.x; y += other.y; return *this; }

    bool operator==(const Vec2& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Vec2& other) const { return !(*this == other); }

    float length() const { return std::sqrt(x * x + y * y); }

    /// Linear interpolation, t in [0, 1]
    static Vec2 lerp(const Vec2& a, const Vec2& b, float t) {
        return {a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t};
    }
};

/// Axis-aligned rectangle. Used for texture source regions (pixels) and
/// for tile-space query bounds.
struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    constexpr Rect() = default;
    constexpr Rect(float x, float y, float w, float h)
        : x(x), y(y), width(w), height(h) {}

    bool operator==(const Rect& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!=(const Rect& other) const { return !(*this == other); }
};

/// Inclusive tile-coordinate bounds.
struct TileBounds {
    int minX = 0;
    int minY = 0;
    int maxX = -1;
    int maxY = -1;

    constexpr TileBounds() = default;
    constexpr TileBounds(int x0, int y0, int x1, int y1)
        : minX(x0), minY(y0), maxX(x1), maxY(y1) {}

    bool empty() const { return maxX < minX || maxY < minY; }
    bool contains(int x, int y) const {
        return x >= minX && x <= maxX && y >= minY && y <= maxY;
    }
};

} // namespace overworld
