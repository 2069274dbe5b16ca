#pragma once

#include "physics/CollisionDetector.hpp"
#include <glm/glm.hpp>

// [PHYSICS_AGENT] Positional correction and momentum exchange
// One separation step per call; the collision system calls it repeatedly
// to settle a tick

namespace BassBall {

class CollisionResolver {
public:
    // Push along the normal applied to each side: half the penetration
    // plus the separation epsilon
    [[nodiscard]] static glm::vec2 separationVector(const CollisionResult& collision,
                                                    const CollisionConfig& config);

    // Moves player and ball only; velocities untouched
    static void resolvePlayerBall(const CollisionResult& collision,
                                  PlayerState& player, BallState& ball,
                                  const CollisionConfig& config);

    // Moves both players symmetrically and, when the result carries a
    // momentum transfer, moves it from a's velocity to b's
    static void resolvePlayerPlayer(const CollisionResult& collision,
                                    PlayerState& a, PlayerState& b,
                                    const CollisionConfig& config);
};

} // namespace BassBall
