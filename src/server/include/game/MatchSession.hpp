#pragma once

#include "ecs/CoreTypes.hpp"
#include "game/InputTypes.hpp"
#include "physics/CollisionConfig.hpp"
#include "physics/CollisionSystem.hpp"
#include "physics/MovementSystem.hpp"
#include "replay/MatchResult.hpp"
#include "security/InputValidator.hpp"
#include "security/MatchValidator.hpp"
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// [GAMEPLAY_AGENT] One match from kick-off to final whistle
// Owns the registry, the input gate and the physics systems. Everything
// runs on the caller's thread; an abort request is only observed between
// ticks so a tick is never published half-resolved

namespace BassBall {

// [GAMEPLAY_AGENT] Card actually shown after a foul
struct DisciplineRecord {
    uint32_t tick{0};
    PlayerId playerId;
    FoulType foulType{FoulType::NONE};
    CardSeverity card{CardSeverity::YELLOW};
    bool secondYellow{false};   // Red shown because of a second yellow
};

struct GoalRecord {
    uint32_t tick{0};
    TeamSide team{TeamSide::HOME};
    std::optional<PlayerId> scorerId;   // Empty for own goals
    std::optional<PlayerId> assistId;
};

struct PlayerMatchStats {
    uint32_t goals{0};
    uint32_t assists{0};
};

class MatchSession {
public:
    // Throws std::invalid_argument if either config fails validation
    explicit MatchSession(uint64_t seed,
                          const CollisionConfig& collisionConfig = CollisionConfig{},
                          const Security::InputGateConfig& gateConfig = Security::InputGateConfig{});

    MatchSession(const MatchSession&) = delete;
    MatchSession& operator=(const MatchSession&) = delete;

    // ========================================================================
    // SETUP
    // ========================================================================

    // Throws std::invalid_argument on a duplicate or empty id, std::logic_error
    // once the first tick has run
    EntityID addPlayer(const PlayerId& id, TeamSide team, const glm::vec2& position,
                       const SkillAttributes& skills = SkillAttributes{});

    // ========================================================================
    // MATCH LOOP
    // ========================================================================

    // [GAMEPLAY_AGENT] Gate an input at server time nowMs. Accepted inputs
    // join the replay stream and are applied on their tick
    Security::AdmissionResult submitInput(const PlayerInput& input, uint64_t nowMs);

    // Runs exactly one tick. Returns false without simulating when the match
    // is aborted, finalized or out of ticks
    bool step();

    // Runs up to `ticks` ticks; returns how many ran
    uint32_t run(uint32_t ticks);

    // Thread-safe; takes effect before the next tick
    void requestAbort() { abortRequested_.store(true); }

    // [GAMEPLAY_AGENT] Ends the match and produces the hashed result.
    // Idempotent: later calls return the same result
    const Replay::MatchResult& finalize();

    // ========================================================================
    // QUERIES
    // ========================================================================

    [[nodiscard]] uint32_t getTick() const { return tick_; }
    [[nodiscard]] uint64_t getSeed() const { return seed_; }
    [[nodiscard]] bool isAborted() const { return aborted_; }
    [[nodiscard]] bool isFinalized() const { return result_.has_value(); }
    [[nodiscard]] const Replay::Score& getScore() const { return score_; }
    [[nodiscard]] uint32_t getDurationMs() const;

    [[nodiscard]] Registry& getRegistry() { return registry_; }
    [[nodiscard]] const Registry& getRegistry() const { return registry_; }
    [[nodiscard]] const PlayerState* getPlayer(const PlayerId& id) const;
    [[nodiscard]] const BallState& getBall() const;

    [[nodiscard]] const CollisionSystem& getCollisionSystem() const { return collisionSystem_; }
    [[nodiscard]] const Security::InputValidator& getInputValidator() const { return inputValidator_; }
    [[nodiscard]] const std::vector<DisciplineRecord>& getDisciplineLog() const { return disciplineLog_; }
    [[nodiscard]] const std::vector<GoalRecord>& getGoals() const { return goals_; }

    // Box score and input stream for one player, ready for MatchValidator
    [[nodiscard]] Security::PlayerMatchRecord playerRecord(const PlayerId& id,
                                                           const std::string& matchId = {}) const;

private:
    struct PendingInput {
        uint64_t sequence{0};
        EntityID entity{entt::null};
        PlayerInput input;
    };

    void applyDueInputs();
    void applyDiscipline(const std::vector<FoulRecord>& fouls);
    void recordTouch(const PlayerId& id);
    void checkForGoal();
    void resetBall();

    uint64_t seed_;
    Registry registry_;
    EntityID ball_{entt::null};

    Security::InputValidator inputValidator_;
    MovementSystem movementSystem_;
    CollisionSystem collisionSystem_;

    std::unordered_map<PlayerId, EntityID> players_;
    std::vector<PendingInput> pending_;
    uint64_t nextSequence_{0};

    std::vector<PlayerInput> homeInputs_;
    std::vector<PlayerInput> awayInputs_;

    uint32_t tick_{0};
    std::atomic<bool> abortRequested_{false};
    bool aborted_{false};

    Replay::Score score_;
    std::vector<GoalRecord> goals_;
    std::unordered_map<PlayerId, PlayerMatchStats> stats_;
    std::optional<PlayerId> lastTouch_;
    std::optional<PlayerId> previousTouch_;

    std::vector<DisciplineRecord> disciplineLog_;
    std::optional<Replay::MatchResult> result_;
};

} // namespace BassBall
