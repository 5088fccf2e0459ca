#pragma once
#include <ecs/ecs.hpp>
#include <cmath>
#include <algorithm>

namespace puck::math {

inline ecs::Vec2 add(const ecs::Vec2& a, const ecs::Vec2& b) {
    return {a.x + b.x, a.y + b.y};
}

inline ecs::Vec2 scale(const ecs::Vec2& v, float s) {
    return {v.x * s, v.y * s};
}

inline float length(const ecs::Vec2& v) {
    return std::sqrt(v.x * v.x + v.y * v.y);
}

inline bool is_zero(const ecs::Vec2& v) {
    return v.x == 0.0f && v.y == 0.0f;
}

/**
 * @brief Returns v scaled to unit length, or (0,0) when v has no length.
 */
inline ecs::Vec2 normalize_or_zero(const ecs::Vec2& v) {
    float len = length(v);
    if (len <= 0.0f || !std::isfinite(len)) return {0.0f, 0.0f};
    return {v.x / len, v.y / len};
}

/**
 * @brief Zeroes an analog stick axis pair when both components sit inside
 * the deadzone.
 */
inline ecs::Vec2 apply_deadzone(const ecs::Vec2& v, float deadzone) {
    if (std::abs(v.x) <= deadzone && std::abs(v.y) <= deadzone) return {0.0f, 0.0f};
    return v;
}

inline float lerp(float a, float b, float t) {
    t = std::clamp(t, 0.0f, 1.0f);
    return a + (b - a) * t;
}

} // namespace puck::math
