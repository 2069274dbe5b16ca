// [PHYSICS_AGENT] Narrow-phase collision tests
// Capsule-vs-circle for player/ball, circle-vs-circle for player/player

#include "physics/CollisionDetector.hpp"
#include "physics/VectorMath.hpp"
#include <algorithm>
#include <cmath>

namespace BassBall {

CollisionResult CollisionDetector::detectCapsuleCircle(
    const glm::vec2& capsuleCenter, float capsuleRadius, float capsuleHalfHeight,
    const glm::vec2& circleCenter, float circleRadius) {

    CollisionResult result;

    // Closest point on the capsule axis
    const glm::vec2 axisPoint(
        capsuleCenter.x,
        std::clamp(circleCenter.y,
                   capsuleCenter.y - capsuleHalfHeight,
                   capsuleCenter.y + capsuleHalfHeight)
    );

    const glm::vec2 delta = circleCenter - axisPoint;
    const float distanceSq = VectorMath::lengthSq(delta);
    const float minDistance = capsuleRadius + circleRadius;

    if (distanceSq >= minDistance * minDistance) {
        return result;
    }

    const float distance = std::sqrt(distanceSq);

    // Coincident centres: tie-break straight up
    const glm::vec2 normal = distance > 0.0f ? delta / distance : VectorMath::UP;

    result.collided = true;
    result.type = CollisionType::PLAYER_BALL;
    result.penetration = minDistance - distance;
    result.normal = normal;
    // Middle of the overlap region
    result.contactPoint = axisPoint + normal * (capsuleRadius - result.penetration * 0.5f);
    return result;
}

CollisionResult CollisionDetector::detectCircleCircle(
    const glm::vec2& centerA, float radiusA,
    const glm::vec2& centerB, float radiusB) {

    CollisionResult result;

    const glm::vec2 delta = centerB - centerA;
    const float distanceSq = VectorMath::lengthSq(delta);
    const float minDistance = radiusA + radiusB;

    if (distanceSq >= minDistance * minDistance) {
        return result;
    }

    const float distance = std::sqrt(distanceSq);
    const glm::vec2 normal = distance > 0.0f ? delta / distance : VectorMath::UP;

    result.collided = true;
    result.type = CollisionType::PLAYER_PLAYER;
    result.penetration = minDistance - distance;
    result.normal = normal;
    result.contactPoint = centerA + normal * (radiusA - result.penetration * 0.5f);
    return result;
}

CollisionResult CollisionDetector::detectPlayerBall(
    const PlayerState& player, const BallState& ball, const CollisionConfig& config) {

    CollisionResult result = detectCapsuleCircle(
        player.position, config.playerCapsuleRadius, config.capsuleHalfHeight(),
        ball.position, config.ballRadius);

    if (result.collided) {
        result.entity1Id = player.id;
    }
    return result;
}

CollisionResult CollisionDetector::detectPlayerPlayer(
    const PlayerState& a, const PlayerState& b, const CollisionConfig& config) {

    CollisionResult result = detectCircleCircle(
        a.position, config.playerCapsuleRadius,
        b.position, config.playerCapsuleRadius);

    if (!result.collided) {
        return result;
    }

    // Overlapping but separating pairs are left alone
    const glm::vec2 relativeVelocity = b.velocity - a.velocity;
    const float velocityAlongNormal = glm::dot(relativeVelocity, result.normal);
    if (velocityAlongNormal >= 0.0f) {
        return CollisionResult{};
    }

    result.entity1Id = a.id;
    result.entity2Id = b.id;

    // Positive here because the pair is closing
    const float impulse = impulseMagnitude(velocityAlongNormal, config.restitution);
    const float cappedMagnitude = std::min(impulse, config.momentumTransferCap);

    result.impulseMagnitude = impulse;
    // Equal-mass split
    result.momentumTransfer = result.normal * (cappedMagnitude * 0.5f);

    // The player contributing more closing speed is the one challenging
    const float closingA = glm::dot(a.velocity, result.normal);
    const float closingB = -glm::dot(b.velocity, result.normal);
    const bool aChallenges = closingA >= closingB;
    const PlayerState& challenger = aChallenges ? a : b;
    const PlayerState& challenged = aChallenges ? b : a;

    const bool fromBehind = isOutsideForwardCone(challenged, challenger, config.foulContactAngle);
    result.foulType = classifyFoul(impulse, fromBehind, config);
    result.foulTriggered = result.foulType != FoulType::NONE;
    if (result.foulTriggered) {
        result.offenderId = challenger.id;
    }

    return result;
}

FoulType CollisionDetector::classifyFoul(float impulse, bool outsideForwardCone,
                                         const CollisionConfig& config) {
    const float threshold = config.foulForceThreshold;

    if (impulse > threshold * Constants::DANGEROUS_PLAY_MULTIPLIER) {
        return FoulType::DANGEROUS_PLAY;
    }
    if (outsideForwardCone && impulse > threshold * Constants::TACKLE_FROM_BEHIND_MULTIPLIER) {
        return FoulType::TACKLE;
    }
    if (impulse > threshold) {
        return FoulType::COLLISION;
    }
    return FoulType::NONE;
}

bool CollisionDetector::isOutsideForwardCone(const PlayerState& player,
                                             const PlayerState& other,
                                             float coneHalfAngle) {
    const glm::vec2 heading = VectorMath::normalize(player.velocity);
    const glm::vec2 toOther = VectorMath::normalize(other.position - player.position);

    if (VectorMath::lengthSq(heading) == 0.0f || VectorMath::lengthSq(toOther) == 0.0f) {
        return false;
    }

    return glm::dot(heading, toOther) < std::cos(coneHalfAngle);
}

} // namespace BassBall
