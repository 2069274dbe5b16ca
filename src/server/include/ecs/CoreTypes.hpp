#pragma once

#include "Constants.hpp"
#include <cstdint>
#include <string>
#include <entt/entt.hpp>
#include <glm/glm.hpp>

// [PHYSICS_AGENT] Core ECS types and components
// Player and ball state live in the match registry; only the collision
// system, the movement system and discipline handling mutate them

namespace BassBall {

using EntityID = entt::entity;
using Registry = entt::registry;
using PlayerId = std::string;

enum class TeamSide : uint8_t {
    HOME = 0,
    AWAY = 1
};

inline const char* teamSideToString(TeamSide side) {
    return side == TeamSide::HOME ? "home" : "away";
}

// ============================================================================
// PLAYER COMPONENTS
// ============================================================================

// [GAMEPLAY_AGENT] Attribute ratings, 1-99
struct SkillAttributes {
    uint8_t pace{70};
    uint8_t shooting{70};
    uint8_t passing{70};
    uint8_t dribbling{70};
    uint8_t defense{70};
    uint8_t physical{70};
};

// [PHYSICS_AGENT] Full per-player simulation state
struct PlayerState {
    PlayerId id;
    TeamSide team{TeamSide::HOME};
    glm::vec2 position{0.0f};
    glm::vec2 velocity{0.0f};
    float stamina{Constants::MAX_STAMINA};
    SkillAttributes skills;
    uint8_t yellowCards{0};
    uint8_t redCards{0};

    [[nodiscard]] bool isSentOff() const { return redCards > 0; }
};

// [PHYSICS_AGENT] Steering state left by the player's latest MOVE/SPRINT
struct MovementIntent {
    glm::vec2 direction{0.0f};  // Length <= 1
    bool sprinting{false};
};

// ============================================================================
// BALL COMPONENTS
// ============================================================================

// [PHYSICS_AGENT] Singleton per match
struct BallState {
    glm::vec2 position{0.0f};
    glm::vec2 velocity{0.0f};
};

} // namespace BassBall
