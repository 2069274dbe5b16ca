#pragma once

#include "ecs/CoreTypes.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

// [GAMEPLAY_AGENT] Player input model
// Action parameters are a closed union keyed by action, so every consumer
// handles every action explicitly

namespace BassBall {

enum class Action : uint8_t {
    MOVE = 0,
    PASS = 1,
    SHOOT = 2,
    TACKLE = 3,
    SPRINT = 4,
    SKILL = 5
};

inline const char* actionToString(Action action) {
    switch (action) {
        case Action::MOVE: return "MOVE";
        case Action::PASS: return "PASS";
        case Action::SHOOT: return "SHOOT";
        case Action::TACKLE: return "TACKLE";
        case Action::SPRINT: return "SPRINT";
        case Action::SKILL: return "SKILL";
        default: return "UNKNOWN";
    }
}

// Case-sensitive; nullopt for anything outside the action set
[[nodiscard]] std::optional<Action> actionFromString(std::string_view name);

// ============================================================================
// ACTION PARAMETERS
// ============================================================================

// Direction on each axis, [-1, 1]
struct MoveParams {
    float x{0.0f};
    float y{0.0f};
};

// Kick strength, [0, 100]
struct PassParams {
    float power{0.0f};
};

struct ShootParams {
    float power{0.0f};
};

struct TackleParams {
    PlayerId targetId;
};

// Sprint carries no parameters; direction comes from the last MOVE
struct SprintParams {};

struct SkillParams {
    std::string skillId;
};

// Alternative index matches the Action tag
using ActionParams = std::variant<MoveParams, PassParams, ShootParams,
                                  TackleParams, SprintParams, SkillParams>;

[[nodiscard]] inline Action actionOf(const ActionParams& params) {
    return static_cast<Action>(params.index());
}

// [SECURITY_AGENT] Per-action bounds shared by the input gate and the
// replay integrity check
[[nodiscard]] bool validateActionParams(const ActionParams& params);

// ============================================================================
// PLAYER INPUT
// ============================================================================

struct PlayerInput {
    PlayerId playerId;
    uint32_t tick{0};        // Strictly increasing per player
    uint64_t timestamp{0};   // Client wall clock, milliseconds
    ActionParams params{MoveParams{}};

    [[nodiscard]] Action action() const { return actionOf(params); }
};

} // namespace BassBall
