#pragma once

#include "ecs/CoreTypes.hpp"
#include "game/InputTypes.hpp"
#include "physics/CollisionConfig.hpp"
#include <entt/entt.hpp>
#include <glm/glm.hpp>
#include <cstdint>

// [PHYSICS_AGENT] Kinematic player movement and ball handling
// Turns accepted inputs into velocities, integrates players and ball one
// tick at a time and keeps everything on the pitch

namespace BassBall {

class MovementSystem {
public:
    static constexpr float MAX_SPEED = Constants::MAX_PLAYER_SPEED;
    static constexpr float SPRINT_MULT = Constants::SPRINT_SPEED_MULTIPLIER;
    static constexpr float ACCELERATION = Constants::ACCELERATION;
    static constexpr float DT = Constants::DT_SECONDS;

    // Share of full kick speed a pass gets at the same power
    static constexpr float PASS_SPEED_FACTOR = 0.6f;

    enum class InputEffect : uint8_t {
        NONE = 0,       // Accepted but nothing moved (SKILL, out-of-reach kick)
        STEERED = 1,    // Intent updated
        KICKED = 2,     // Ball velocity replaced
        LUNGED = 3      // Tackle burst toward the target
    };

public:
    explicit MovementSystem(const CollisionConfig& config = CollisionConfig{});

    // Applies one accepted input to the player entity
    InputEffect applyInput(Registry& registry, EntityID player, const PlayerInput& input);

    // One tick: steer players from their intent, integrate, decay the ball
    // and clamp to the field. Sent-off players stand still
    void update(Registry& registry);

    // Ball within reach of the player's capsule
    [[nodiscard]] bool canReachBall(const PlayerState& player, const BallState& ball) const;

    // Sets the ball moving along direction at a speed set by power (0-100)
    bool kick(const PlayerState& player, BallState& ball,
              const glm::vec2& direction, float power, float speedFactor) const;

    void clampToField(glm::vec2& position) const;

    // Facing used for kicks: intent, then velocity, then straight up
    [[nodiscard]] static glm::vec2 heading(const PlayerState& player, const MovementIntent* intent);

private:
    void steer(PlayerState& player, MovementIntent& intent);
    void integrate(glm::vec2& position, const glm::vec2& velocity);
    void applyFriction(glm::vec2& velocity);
    void applyBallFriction(glm::vec2& velocity);

    CollisionConfig config_;
};

} // namespace BassBall
