#pragma once

#include "Constants.hpp"
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <optional>

// [PHYSICS_AGENT] Tunable collision parameters
// Immutable for the lifetime of a match; validated once when a
// CollisionSystem is constructed

namespace BassBall {

struct CollisionConfig {
    // ========================================================================
    // SHAPES
    // ========================================================================

    // Player capsule (vertical axis of length height, swept by radius)
    float playerCapsuleRadius = Constants::PLAYER_CAPSULE_RADIUS;
    float playerCapsuleHeight = Constants::PLAYER_CAPSULE_HEIGHT;

    float ballRadius = Constants::BALL_RADIUS;

    // ========================================================================
    // FIELD (centred on the origin)
    // ========================================================================

    float fieldWidth = Constants::FIELD_WIDTH;
    float fieldHeight = Constants::FIELD_HEIGHT;

    // ========================================================================
    // RESOLUTION
    // ========================================================================

    // Penetration left after a settled tick
    float maxPenetration = Constants::MAX_PENETRATION;

    // Extra push per side so resolved pairs do not re-trigger next pass
    float separationEpsilon = Constants::SEPARATION_EPSILON;

    // Passes over the full collision set per tick, at most
    // MAX_RESOLUTION_PASSES. Settling continues past this count while
    // penetration is above maxPenetration, up to the same cap
    uint32_t resolutionPasses = Constants::RESOLUTION_PASSES;

    // ========================================================================
    // PLAYER CONTACT
    // ========================================================================

    // Bounciness used for the impulse magnitude
    float restitution = Constants::RESTITUTION;

    // Upper bound of the impulse actually exchanged between two players
    float momentumTransferCap = Constants::MOMENTUM_TRANSFER_CAP;

    // Impulse magnitude above which contact is a foul
    float foulForceThreshold = Constants::FOUL_FORCE_THRESHOLD;

    // Half-angle of a player's forward cone (radians)
    float foulContactAngle = Constants::FOUL_CONTACT_ANGLE;

    // Returns one message per problem, empty when the config is usable
    [[nodiscard]] std::vector<std::string> validate() const;

    [[nodiscard]] bool isValid() const { return validate().empty(); }

    // Throws std::invalid_argument listing every problem
    void validateOrThrow() const;

    [[nodiscard]] float capsuleHalfHeight() const { return playerCapsuleHeight * 0.5f; }

    // ========================================================================
    // PRESETS
    // ========================================================================

    // More forgiving contact, more momentum exchanged
    [[nodiscard]] static CollisionConfig arcade();

    // Strict separation, more fouls
    [[nodiscard]] static CollisionConfig realistic();

    // Defaults
    [[nodiscard]] static CollisionConfig competitive();

    [[nodiscard]] static CollisionConfig debug();

    // Preset by name ("arcade", "realistic", "competitive", "debug")
    [[nodiscard]] static std::optional<CollisionConfig> fromPresetName(std::string_view name);
};

// [PHYSICS_AGENT] Overlays keys present in json onto base
// Throws nlohmann::json::exception on type mismatches
[[nodiscard]] CollisionConfig collisionConfigFromJson(const nlohmann::json& json,
                                                      const CollisionConfig& base = CollisionConfig{});

[[nodiscard]] nlohmann::json collisionConfigToJson(const CollisionConfig& config);

} // namespace BassBall
