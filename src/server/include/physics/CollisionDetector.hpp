#pragma once

#include "ecs/CoreTypes.hpp"
#include "physics/CollisionConfig.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>

// [PHYSICS_AGENT] Narrow-phase collision tests
// Pure functions: no state, no allocation, never throw

namespace BassBall {

enum class CollisionType : uint8_t {
    NONE = 0,
    PLAYER_BALL = 1,
    PLAYER_PLAYER = 2
};

enum class FoulType : uint8_t {
    NONE = 0,
    TACKLE = 1,          // Yellow: reckless contact from outside the forward cone
    COLLISION = 2,       // Yellow: excessive force
    DANGEROUS_PLAY = 3   // Red
};

enum class CardSeverity : uint8_t {
    YELLOW = 0,
    RED = 1
};

inline const char* collisionTypeToString(CollisionType type) {
    switch (type) {
        case CollisionType::NONE: return "none";
        case CollisionType::PLAYER_BALL: return "player-ball";
        case CollisionType::PLAYER_PLAYER: return "player-player";
        default: return "unknown";
    }
}

inline const char* foulTypeToString(FoulType type) {
    switch (type) {
        case FoulType::NONE: return "none";
        case FoulType::TACKLE: return "tackle";
        case FoulType::COLLISION: return "collision";
        case FoulType::DANGEROUS_PLAY: return "dangerous-play";
        default: return "unknown";
    }
}

inline const char* cardSeverityToString(CardSeverity severity) {
    return severity == CardSeverity::RED ? "red" : "yellow";
}

// [PHYSICS_AGENT] Outcome of one pair test, consumed within the tick
struct CollisionResult {
    bool collided{false};
    CollisionType type{CollisionType::NONE};
    PlayerId entity1Id;
    PlayerId entity2Id;           // Empty for player-ball
    float penetration{0.0f};
    glm::vec2 contactPoint{0.0f};
    glm::vec2 normal{0.0f};       // Unit, from entity 1 toward entity 2 (or ball)

    // Player-player only
    std::optional<glm::vec2> momentumTransfer;
    float impulseMagnitude{0.0f};  // Uncapped
    bool foulTriggered{false};
    FoulType foulType{FoulType::NONE};
    PlayerId offenderId;           // Player who closed in harder
};

class CollisionDetector {
public:
    // [PHYSICS_AGENT] Capsule (vertical axis through capsuleCenter) vs circle
    // Geometry only; ids are left empty
    [[nodiscard]] static CollisionResult detectCapsuleCircle(
        const glm::vec2& capsuleCenter, float capsuleRadius, float capsuleHalfHeight,
        const glm::vec2& circleCenter, float circleRadius);

    // [PHYSICS_AGENT] Plain overlap test between two circles, ignoring velocity
    [[nodiscard]] static CollisionResult detectCircleCircle(
        const glm::vec2& centerA, float radiusA,
        const glm::vec2& centerB, float radiusB);

    // Player capsule vs ball
    [[nodiscard]] static CollisionResult detectPlayerBall(
        const PlayerState& player, const BallState& ball, const CollisionConfig& config);

    // Player vs player: overlapping AND closing, with impulse and foul
    // classification filled in
    [[nodiscard]] static CollisionResult detectPlayerPlayer(
        const PlayerState& a, const PlayerState& b, const CollisionConfig& config);

    // Impulse along the normal for a relative normal velocity (negative when closing)
    [[nodiscard]] static float impulseMagnitude(float velocityAlongNormal, float restitution) {
        return -(1.0f + restitution) * velocityAlongNormal;
    }

    // outsideForwardCone: the challenger came from outside the challenged
    // player's forward cone
    [[nodiscard]] static FoulType classifyFoul(float impulse, bool outsideForwardCone,
                                               const CollisionConfig& config);

    // True when other sits outside player's forward cone. A stationary
    // player has no heading, so nothing is outside its cone
    [[nodiscard]] static bool isOutsideForwardCone(const PlayerState& player,
                                                   const PlayerState& other,
                                                   float coneHalfAngle);
};

} // namespace BassBall
