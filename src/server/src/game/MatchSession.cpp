// [GAMEPLAY_AGENT] Match session - tick loop, discipline and scoring

#include "game/MatchSession.hpp"
#include "replay/ResultHasher.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <tuple>

namespace BassBall {

MatchSession::MatchSession(uint64_t seed, const CollisionConfig& collisionConfig,
                           const Security::InputGateConfig& gateConfig)
    : seed_(seed),
      inputValidator_(gateConfig),
      movementSystem_(collisionConfig),
      collisionSystem_(collisionConfig) {

    ball_ = registry_.create();
    registry_.emplace<BallState>(ball_);
}

// ============================================================================
// SETUP
// ============================================================================

EntityID MatchSession::addPlayer(const PlayerId& id, TeamSide team, const glm::vec2& position,
                                 const SkillAttributes& skills) {
    if (tick_ > 0 || result_) {
        throw std::logic_error("Cannot add player " + id + " after kick-off");
    }
    if (id.empty()) {
        throw std::invalid_argument("Player id must not be empty");
    }
    if (players_.count(id) > 0) {
        throw std::invalid_argument("Duplicate player id: " + id);
    }

    EntityID entity = registry_.create();
    PlayerState& state = registry_.emplace<PlayerState>(entity);
    state.id = id;
    state.team = team;
    state.position = position;
    state.skills = skills;
    movementSystem_.clampToField(state.position);

    players_[id] = entity;
    (void)inputValidator_.join(id);
    return entity;
}

// ============================================================================
// MATCH LOOP
// ============================================================================

Security::AdmissionResult MatchSession::submitInput(const PlayerInput& input, uint64_t nowMs) {
    Security::AdmissionResult result = inputValidator_.admit(input, nowMs);
    if (!result.accepted) {
        return result;
    }

    // The gate only knows players registered here, so the lookup cannot miss
    EntityID entity = players_.at(input.playerId);
    const PlayerState& state = registry_.get<PlayerState>(entity);

    if (state.team == TeamSide::HOME) {
        homeInputs_.push_back(input);
    } else {
        awayInputs_.push_back(input);
    }

    pending_.push_back(PendingInput{nextSequence_++, entity, input});
    return result;
}

bool MatchSession::step() {
    if (result_ || aborted_) {
        return false;
    }
    if (abortRequested_.load()) {
        aborted_ = true;
        std::cout << "[MATCH] Aborted at tick " << tick_ << std::endl;
        return false;
    }
    if (tick_ >= inputValidator_.getConfig().maxTick) {
        return false;
    }

    ++tick_;

    applyDueInputs();
    movementSystem_.update(registry_);

    CollisionTickReport report = collisionSystem_.processTick(registry_, tick_);
    for (const auto& event : report.events) {
        if (event.type == CollisionType::PLAYER_BALL) {
            recordTouch(event.entity1Id);
        }
    }
    applyDiscipline(report.fouls);

    checkForGoal();
    return true;
}

uint32_t MatchSession::run(uint32_t ticks) {
    uint32_t ran = 0;
    while (ran < ticks && step()) {
        ++ran;
    }
    return ran;
}

void MatchSession::applyDueInputs() {
    if (pending_.empty()) {
        return;
    }

    // Same-tick inputs apply in player-id order, then arrival order
    std::sort(pending_.begin(), pending_.end(), [](const PendingInput& a, const PendingInput& b) {
        return std::tie(a.input.tick, a.input.playerId, a.sequence) <
               std::tie(b.input.tick, b.input.playerId, b.sequence);
    });

    auto due = pending_.begin();
    for (; due != pending_.end() && due->input.tick <= tick_; ++due) {
        MovementSystem::InputEffect effect = movementSystem_.applyInput(registry_, due->entity, due->input);
        if (effect == MovementSystem::InputEffect::KICKED) {
            recordTouch(due->input.playerId);
        }
    }
    pending_.erase(pending_.begin(), due);
}

void MatchSession::applyDiscipline(const std::vector<FoulRecord>& fouls) {
    for (const auto& foul : fouls) {
        auto it = players_.find(foul.playerId);
        if (it == players_.end()) {
            continue;
        }
        PlayerState& player = registry_.get<PlayerState>(it->second);
        if (player.isSentOff()) {
            continue;
        }

        DisciplineRecord record;
        record.tick = foul.tick;
        record.playerId = foul.playerId;
        record.foulType = foul.foulType;
        record.card = foul.severity;

        if (foul.severity == CardSeverity::YELLOW) {
            player.yellowCards++;
            if (player.yellowCards >= 2) {
                record.card = CardSeverity::RED;
                record.secondYellow = true;
            }
        }

        disciplineLog_.push_back(record);

        if (record.card == CardSeverity::RED) {
            player.redCards++;
            player.velocity = glm::vec2(0.0f);
            registry_.remove<MovementIntent>(it->second);
            inputValidator_.leave(player.id);

            std::cout << "[MATCH] Player " << player.id << " sent off at tick " << foul.tick
                      << " (" << foulTypeToString(foul.foulType)
                      << (record.secondYellow ? ", second yellow" : "") << ")" << std::endl;
        }
    }
}

// ============================================================================
// SCORING
// ============================================================================

void MatchSession::recordTouch(const PlayerId& id) {
    if (lastTouch_ && *lastTouch_ == id) {
        return;
    }
    previousTouch_ = lastTouch_;
    lastTouch_ = id;
}

void MatchSession::checkForGoal() {
    const BallState& ball = registry_.get<BallState>(ball_);
    const CollisionConfig& config = collisionSystem_.getConfig();
    const float endLine = config.fieldWidth * 0.5f;

    if (std::abs(ball.position.x) < endLine ||
        std::abs(ball.position.y) > Constants::GOAL_WIDTH * 0.5f) {
        return;
    }

    GoalRecord goal;
    goal.tick = tick_;
    goal.team = ball.position.x > 0.0f ? TeamSide::HOME : TeamSide::AWAY;

    auto onScoringTeam = [&](const std::optional<PlayerId>& id) {
        if (!id) {
            return false;
        }
        const PlayerState* player = getPlayer(*id);
        return player && player->team == goal.team;
    };

    if (onScoringTeam(lastTouch_)) {
        goal.scorerId = lastTouch_;
        stats_[*lastTouch_].goals++;
        if (onScoringTeam(previousTouch_)) {
            goal.assistId = previousTouch_;
            stats_[*previousTouch_].assists++;
        }
    }

    if (goal.team == TeamSide::HOME) {
        score_.home++;
    } else {
        score_.away++;
    }
    goals_.push_back(goal);

    std::cout << "[MATCH] Goal for " << teamSideToString(goal.team) << " at tick " << tick_
              << " (" << goal.scorerId.value_or("own goal") << ") score "
              << score_.home << "-" << score_.away << std::endl;

    resetBall();
}

void MatchSession::resetBall() {
    BallState& ball = registry_.get<BallState>(ball_);
    ball.position = glm::vec2(0.0f);
    ball.velocity = glm::vec2(0.0f);
    lastTouch_.reset();
    previousTouch_.reset();
}

// ============================================================================
// FINALIZE
// ============================================================================

const Replay::MatchResult& MatchSession::finalize() {
    if (result_) {
        return *result_;
    }

    Replay::MatchResult result;
    result.seed = seed_;
    result.score = score_;
    result.durationMs = getDurationMs();
    result.homeInputs = homeInputs_;
    result.awayInputs = awayInputs_;
    result.resultHash = Replay::ResultHasher::computeHash(result);

    pending_.clear();
    inputValidator_.endMatch();
    result_ = std::move(result);

    std::cout << "[MATCH] Finalized after " << tick_ << " ticks, score "
              << score_.home << "-" << score_.away << ", hash " << result_->resultHash << std::endl;
    return *result_;
}

// ============================================================================
// QUERIES
// ============================================================================

uint32_t MatchSession::getDurationMs() const {
    return static_cast<uint32_t>(static_cast<uint64_t>(tick_) * 1000 / Constants::TICK_RATE_HZ);
}

const PlayerState* MatchSession::getPlayer(const PlayerId& id) const {
    auto it = players_.find(id);
    if (it == players_.end()) {
        return nullptr;
    }
    return registry_.try_get<PlayerState>(it->second);
}

const BallState& MatchSession::getBall() const {
    return registry_.get<BallState>(ball_);
}

Security::PlayerMatchRecord MatchSession::playerRecord(const PlayerId& id,
                                                       const std::string& matchId) const {
    const PlayerState* player = getPlayer(id);
    if (!player) {
        throw std::invalid_argument("Unknown player: " + id);
    }

    Security::PlayerMatchRecord record;
    record.matchId = matchId;
    record.durationMinutes = static_cast<uint32_t>(std::lround(getDurationMs() / 60000.0));
    record.homeScore = score_.home;
    record.awayScore = score_.away;
    record.playerTeam = player->team;

    auto stats = stats_.find(id);
    if (stats != stats_.end()) {
        record.playerGoals = stats->second.goals;
        record.playerAssists = stats->second.assists;
    }

    const auto& stream = player->team == TeamSide::HOME ? homeInputs_ : awayInputs_;
    for (const auto& input : stream) {
        if (input.playerId == id) {
            record.inputs.push_back(input);
        }
    }
    return record;
}

} // namespace BassBall
