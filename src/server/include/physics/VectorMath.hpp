#pragma once

#include <glm/glm.hpp>
#include <cmath>

// [PHYSICS_AGENT] 2D vector helpers on top of glm::vec2
// glm already covers add/subtract/scale/dot; these add the zero-safe
// operations the collision code relies on

namespace BassBall {
namespace VectorMath {

inline const glm::vec2 UP{0.0f, 1.0f};

[[nodiscard]] inline float lengthSq(const glm::vec2& v) {
    return v.x * v.x + v.y * v.y;
}

[[nodiscard]] inline float length(const glm::vec2& v) {
    return std::sqrt(lengthSq(v));
}

// Unit vector, or the zero vector when v has no length
[[nodiscard]] inline glm::vec2 normalize(const glm::vec2& v) {
    const float len = length(v);
    return len > 0.0f ? v / len : glm::vec2(0.0f);
}

// Unit vector, or fallback when v has no length
[[nodiscard]] inline glm::vec2 normalizeOr(const glm::vec2& v, const glm::vec2& fallback) {
    const float len = length(v);
    return len > 0.0f ? v / len : fallback;
}

// Scales v down so its length does not exceed maxLength
[[nodiscard]] inline glm::vec2 clampLength(const glm::vec2& v, float maxLength) {
    const float len = length(v);
    if (len > maxLength && len > 0.0f) {
        return v * (maxLength / len);
    }
    return v;
}

[[nodiscard]] inline glm::vec2 clampToRect(const glm::vec2& v,
                                           const glm::vec2& minCorner,
                                           const glm::vec2& maxCorner) {
    return glm::vec2(
        std::fmax(minCorner.x, std::fmin(maxCorner.x, v.x)),
        std::fmax(minCorner.y, std::fmin(maxCorner.y, v.y))
    );
}

[[nodiscard]] inline bool isFinite(const glm::vec2& v) {
    return std::isfinite(v.x) && std::isfinite(v.y);
}

} // namespace VectorMath
} // namespace BassBall
