#pragma once

#include "ecs/CoreTypes.hpp"
#include "physics/CollisionConfig.hpp"
#include "physics/CollisionDetector.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <vector>

// [PHYSICS_AGENT] Per-tick collision driver
// Enumerates every pair in player-id order, settles them over several
// resolution passes and records one event per collided pair

namespace BassBall {

// [PHYSICS_AGENT] Persisted replay record, one per collided pair per tick
struct CollisionEvent {
    uint32_t tick{0};
    CollisionType type{CollisionType::NONE};
    PlayerId entity1Id;
    PlayerId entity2Id;           // Empty for player-ball
    glm::vec2 contactPoint{0.0f};
    glm::vec2 normal{0.0f};
    float impulse{0.0f};          // Uncapped impulse magnitude, 0 for player-ball
    bool foulTriggered{false};
    FoulType foulType{FoulType::NONE};
    PlayerId offenderId;
};

// [PHYSICS_AGENT] Discipline record handed to foul handling
struct FoulRecord {
    uint32_t tick{0};
    PlayerId playerId;
    FoulType foulType{FoulType::NONE};
    CardSeverity severity{CardSeverity::YELLOW};
};

struct CollisionStats {
    uint32_t playerBallCollisions{0};
    uint32_t playerPlayerCollisions{0};
    uint32_t foulsTriggered{0};

    [[nodiscard]] uint32_t totalCollisions() const {
        return playerBallCollisions + playerPlayerCollisions;
    }
};

struct CollisionTickReport {
    std::vector<CollisionEvent> events;
    std::vector<FoulRecord> fouls;
    // Deepest overlap among the tick's pairs after the last pass
    float residualPenetration{0.0f};
};

class CollisionSystem {
public:
    // Throws std::invalid_argument if config fails validation
    explicit CollisionSystem(const CollisionConfig& config = CollisionConfig{});

    // Runs one tick over every PlayerState and the BallState in registry
    CollisionTickReport processTick(Registry& registry, uint32_t tick);

    // Append-only log of every event since construction or clearLog()
    [[nodiscard]] const std::vector<CollisionEvent>& getCollisionLog() const { return collisionLog_; }
    void clearLog();

    [[nodiscard]] const CollisionStats& getStats() const { return stats_; }

    [[nodiscard]] const CollisionConfig& getConfig() const { return config_; }

    // Discipline record for a foul event, nullopt when none was triggered
    [[nodiscard]] static std::optional<FoulRecord> foulDetails(const CollisionEvent& event);

private:
    struct PlayerRef {
        EntityID entity;
        PlayerState* state;
    };

    struct Contact {
        CollisionResult detected;
        size_t first{0};   // Index into the sorted player list
        size_t second{0};  // Unused for player-ball
    };

    [[nodiscard]] std::vector<PlayerRef> collectPlayers(Registry& registry) const;

    // Re-measures a contact against current positions
    [[nodiscard]] CollisionResult remeasure(const Contact& contact,
                                            const std::vector<PlayerRef>& players,
                                            const BallState* ball) const;

    // Deepest overlap left among the tick's contacts
    [[nodiscard]] float measureResidual(const std::vector<Contact>& contacts,
                                        const std::vector<PlayerRef>& players,
                                        const BallState* ball) const;

    void clampToField(PlayerState& player) const;
    void clampToField(BallState& ball) const;

    [[nodiscard]] static CollisionEvent makeEvent(const CollisionResult& collision, uint32_t tick);

    CollisionConfig config_;
    std::vector<CollisionEvent> collisionLog_;
    CollisionStats stats_;
};

} // namespace BassBall
