// [PHYSICS_AGENT] Kinematic player controller and ball handling

#include "physics/MovementSystem.hpp"
#include "physics/VectorMath.hpp"
#include <algorithm>
#include <cmath>
#include <type_traits>
#include <variant>

namespace BassBall {

MovementSystem::MovementSystem(const CollisionConfig& config)
    : config_(config) {}

// ============================================================================
// INPUTS
// ============================================================================

MovementSystem::InputEffect MovementSystem::applyInput(Registry& registry, EntityID player,
                                                       const PlayerInput& input) {
    PlayerState* state = registry.try_get<PlayerState>(player);
    if (!state || state->isSentOff()) {
        return InputEffect::NONE;
    }
    MovementIntent& intent = registry.get_or_emplace<MovementIntent>(player);

    return std::visit([&](const auto& p) -> InputEffect {
        using T = std::decay_t<decltype(p)>;

        if constexpr (std::is_same_v<T, MoveParams>) {
            intent.direction = VectorMath::clampLength(glm::vec2(p.x, p.y), 1.0f);
            intent.sprinting = false;
            return InputEffect::STEERED;
        } else if constexpr (std::is_same_v<T, SprintParams>) {
            intent.sprinting = state->stamina > 0.0f;
            return InputEffect::STEERED;
        } else if constexpr (std::is_same_v<T, PassParams> || std::is_same_v<T, ShootParams>) {
            auto balls = registry.view<BallState>();
            if (balls.begin() == balls.end()) {
                return InputEffect::NONE;
            }
            BallState& ball = balls.get<BallState>(*balls.begin());
            const float factor = std::is_same_v<T, PassParams> ? PASS_SPEED_FACTOR : 1.0f;
            return kick(*state, ball, heading(*state, &intent), p.power, factor)
                ? InputEffect::KICKED
                : InputEffect::NONE;
        } else if constexpr (std::is_same_v<T, TackleParams>) {
            // Burst toward the target when close enough to contest
            const float reach = config_.playerCapsuleRadius * 2.0f + Constants::KICK_REACH;
            auto view = registry.view<PlayerState>();
            for (auto entity : view) {
                const PlayerState& target = view.get<PlayerState>(entity);
                if (target.id != p.targetId || entity == player) {
                    continue;
                }
                const glm::vec2 toTarget = target.position - state->position;
                if (VectorMath::length(toTarget) > reach) {
                    return InputEffect::NONE;
                }
                state->velocity = VectorMath::normalizeOr(toTarget, heading(*state, &intent)) * MAX_SPEED;
                return InputEffect::LUNGED;
            }
            return InputEffect::NONE;
        } else {
            static_assert(std::is_same_v<T, SkillParams>, "unhandled action parameters");
            return InputEffect::NONE;
        }
    }, input.params);
}

bool MovementSystem::canReachBall(const PlayerState& player, const BallState& ball) const {
    const float reach = config_.playerCapsuleRadius + config_.ballRadius + Constants::KICK_REACH;
    return VectorMath::lengthSq(ball.position - player.position) <= reach * reach;
}

bool MovementSystem::kick(const PlayerState& player, BallState& ball,
                          const glm::vec2& direction, float power, float speedFactor) const {
    if (!canReachBall(player, ball)) {
        return false;
    }

    const float clampedPower = std::clamp(power, Constants::POWER_MIN, Constants::POWER_MAX);
    const float speed = Constants::MAX_KICK_SPEED * speedFactor * (clampedPower / Constants::POWER_MAX);
    ball.velocity = VectorMath::normalizeOr(direction, VectorMath::UP) * speed;
    return true;
}

glm::vec2 MovementSystem::heading(const PlayerState& player, const MovementIntent* intent) {
    if (intent && VectorMath::lengthSq(intent->direction) > 0.0f) {
        return VectorMath::normalize(intent->direction);
    }
    return VectorMath::normalizeOr(player.velocity, VectorMath::UP);
}

// ============================================================================
// TICK
// ============================================================================

void MovementSystem::update(Registry& registry) {
    auto players = registry.view<PlayerState>();
    for (auto entity : players) {
        PlayerState& player = players.get<PlayerState>(entity);
        if (player.isSentOff()) {
            player.velocity = glm::vec2(0.0f);
            continue;
        }

        if (MovementIntent* intent = registry.try_get<MovementIntent>(entity)) {
            steer(player, *intent);
        } else {
            applyFriction(player.velocity);
        }

        integrate(player.position, player.velocity);
        clampToField(player.position);
    }

    auto balls = registry.view<BallState>();
    for (auto entity : balls) {
        BallState& ball = balls.get<BallState>(entity);
        integrate(ball.position, ball.velocity);
        applyBallFriction(ball.velocity);
        clampToField(ball.position);
    }
}

void MovementSystem::steer(PlayerState& player, MovementIntent& intent) {
    const bool moving = VectorMath::lengthSq(intent.direction) > 0.0f;

    if (!moving) {
        applyFriction(player.velocity);
    } else {
        const bool sprinting = intent.sprinting && player.stamina > 0.0f;
        const float targetSpeed = MAX_SPEED * (sprinting ? SPRINT_MULT : 1.0f);
        const glm::vec2 targetVel = intent.direction * targetSpeed;

        // Smooth acceleration (kinematic)
        player.velocity = glm::mix(player.velocity, targetVel, ACCELERATION * DT);
    }

    if (moving && intent.sprinting) {
        player.stamina -= Constants::SPRINT_STAMINA_PER_TICK;
        if (player.stamina <= 0.0f) {
            player.stamina = 0.0f;
            intent.sprinting = false;
        }
    } else {
        player.stamina = std::min(Constants::MAX_STAMINA,
                                  player.stamina + Constants::STAMINA_RECOVERY_PER_TICK);
    }
}

void MovementSystem::integrate(glm::vec2& position, const glm::vec2& velocity) {
    position += velocity * DT;
}

void MovementSystem::applyFriction(glm::vec2& velocity) {
    // ~15% slowdown per tick at 60Hz
    constexpr float FRICTION_FACTOR = 0.85f;
    constexpr float MIN_VELOCITY = 0.01f;

    velocity *= FRICTION_FACTOR;
    if (VectorMath::length(velocity) < MIN_VELOCITY) {
        velocity = glm::vec2(0.0f);
    }
}

void MovementSystem::applyBallFriction(glm::vec2& velocity) {
    velocity *= Constants::BALL_FRICTION;
    if (VectorMath::length(velocity) < Constants::MIN_BALL_SPEED) {
        velocity = glm::vec2(0.0f);
    }
}

void MovementSystem::clampToField(glm::vec2& position) const {
    const glm::vec2 halfExtent(config_.fieldWidth * 0.5f, config_.fieldHeight * 0.5f);
    position = VectorMath::clampToRect(position, -halfExtent, halfExtent);
}

} // namespace BassBall
