// [PHYSICS_AGENT] Collision resolution

#include "physics/CollisionResolver.hpp"

namespace BassBall {

glm::vec2 CollisionResolver::separationVector(const CollisionResult& collision,
                                              const CollisionConfig& config) {
    return collision.normal * (collision.penetration * 0.5f + config.separationEpsilon);
}

void CollisionResolver::resolvePlayerBall(const CollisionResult& collision,
                                          PlayerState& player, BallState& ball,
                                          const CollisionConfig& config) {
    if (!collision.collided || collision.type != CollisionType::PLAYER_BALL) {
        return;
    }

    const glm::vec2 separation = separationVector(collision, config);
    player.position -= separation;
    ball.position += separation;
}

void CollisionResolver::resolvePlayerPlayer(const CollisionResult& collision,
                                            PlayerState& a, PlayerState& b,
                                            const CollisionConfig& config) {
    if (!collision.collided || collision.type != CollisionType::PLAYER_PLAYER) {
        return;
    }

    const glm::vec2 separation = separationVector(collision, config);
    a.position -= separation;
    b.position += separation;

    // Equal masses: what a loses, b gains
    if (collision.momentumTransfer) {
        a.velocity -= *collision.momentumTransfer;
        b.velocity += *collision.momentumTransfer;
    }
}

} // namespace BassBall
