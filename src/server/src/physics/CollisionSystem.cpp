// [PHYSICS_AGENT] Per-tick collision orchestration
// Pair order is pinned to player id so independent replays agree

#include "physics/CollisionSystem.hpp"
#include "physics/CollisionResolver.hpp"
#include "physics/VectorMath.hpp"
#include <algorithm>
#include <iostream>

namespace BassBall {

CollisionSystem::CollisionSystem(const CollisionConfig& config)
    : config_(config) {
    config_.validateOrThrow();
}

void CollisionSystem::clearLog() {
    collisionLog_.clear();
}

std::vector<CollisionSystem::PlayerRef> CollisionSystem::collectPlayers(Registry& registry) const {
    std::vector<PlayerRef> players;

    auto view = registry.view<PlayerState>();
    for (auto entity : view) {
        PlayerState& state = view.get<PlayerState>(entity);
        if (state.isSentOff()) {
            continue;
        }
        players.push_back(PlayerRef{entity, &state});
    }

    // Registry iteration order is not part of the replay contract
    std::sort(players.begin(), players.end(), [](const PlayerRef& lhs, const PlayerRef& rhs) {
        return lhs.state->id < rhs.state->id;
    });
    return players;
}

CollisionResult CollisionSystem::remeasure(const Contact& contact,
                                           const std::vector<PlayerRef>& players,
                                           const BallState* ball) const {
    const PlayerState& first = *players[contact.first].state;

    if (contact.detected.type == CollisionType::PLAYER_BALL) {
        return CollisionDetector::detectCapsuleCircle(
            first.position, config_.playerCapsuleRadius, config_.capsuleHalfHeight(),
            ball->position, config_.ballRadius);
    }

    const PlayerState& second = *players[contact.second].state;
    return CollisionDetector::detectCircleCircle(
        first.position, config_.playerCapsuleRadius,
        second.position, config_.playerCapsuleRadius);
}

float CollisionSystem::measureResidual(const std::vector<Contact>& contacts,
                                       const std::vector<PlayerRef>& players,
                                       const BallState* ball) const {
    float residual = 0.0f;
    for (const Contact& contact : contacts) {
        const CollisionResult current = remeasure(contact, players, ball);
        if (current.collided) {
            residual = std::max(residual, current.penetration);
        }
    }
    return residual;
}

CollisionTickReport CollisionSystem::processTick(Registry& registry, uint32_t tick) {
    CollisionTickReport report;

    std::vector<PlayerRef> players = collectPlayers(registry);

    BallState* ball = nullptr;
    auto ballView = registry.view<BallState>();
    if (ballView.begin() != ballView.end()) {
        ball = &ballView.get<BallState>(*ballView.begin());
    }

    // ========================================================================
    // DETECTION: player-ball first, then player-player
    // ========================================================================

    std::vector<Contact> contacts;

    if (ball) {
        for (size_t i = 0; i < players.size(); ++i) {
            CollisionResult result = CollisionDetector::detectPlayerBall(*players[i].state, *ball, config_);
            if (result.collided) {
                contacts.push_back(Contact{std::move(result), i, i});
            }
        }
    }

    for (size_t i = 0; i < players.size(); ++i) {
        for (size_t j = i + 1; j < players.size(); ++j) {
            CollisionResult result = CollisionDetector::detectPlayerPlayer(
                *players[i].state, *players[j].state, config_);
            if (result.collided) {
                contacts.push_back(Contact{std::move(result), i, j});
            }
        }
    }

    // ========================================================================
    // RESOLUTION: every pass re-measures the current geometry. Detected
    // momentum is exchanged once, on the first pass. After the configured
    // passes, settling continues while penetration exceeds tolerance
    // ========================================================================

    for (uint32_t pass = 0; pass < Constants::MAX_RESOLUTION_PASSES; ++pass) {
        if (pass >= config_.resolutionPasses &&
            measureResidual(contacts, players, ball) <= config_.maxPenetration) {
            break;
        }

        bool corrected = false;

        for (const Contact& contact : contacts) {
            CollisionResult current = remeasure(contact, players, ball);
            if (!current.collided || current.penetration <= 0.0f) {
                continue;
            }
            if (pass == 0) {
                current.momentumTransfer = contact.detected.momentumTransfer;
            }

            PlayerState& first = *players[contact.first].state;
            if (current.type == CollisionType::PLAYER_BALL) {
                CollisionResolver::resolvePlayerBall(current, first, *ball, config_);
            } else {
                CollisionResolver::resolvePlayerPlayer(current, first, *players[contact.second].state, config_);
            }
            corrected = true;
        }

        if (!corrected) {
            break;
        }
    }

    for (const PlayerRef& player : players) {
        clampToField(*player.state);
    }
    if (ball) {
        clampToField(*ball);
    }

    report.residualPenetration = measureResidual(contacts, players, ball);

    if (report.residualPenetration > config_.maxPenetration) {
        std::cerr << "[COLLISION] Tick " << tick << " settled with penetration "
                  << report.residualPenetration << " (tolerance "
                  << config_.maxPenetration << ")\n";
    }

    // ========================================================================
    // EVENTS
    // ========================================================================

    report.events.reserve(contacts.size());
    for (const Contact& contact : contacts) {
        CollisionEvent event = makeEvent(contact.detected, tick);

        if (event.type == CollisionType::PLAYER_BALL) {
            stats_.playerBallCollisions++;
        } else {
            stats_.playerPlayerCollisions++;
        }

        if (auto foul = foulDetails(event)) {
            stats_.foulsTriggered++;
            report.fouls.push_back(*foul);
        }

        collisionLog_.push_back(event);
        report.events.push_back(std::move(event));
    }

    return report;
}

void CollisionSystem::clampToField(PlayerState& player) const {
    const glm::vec2 halfExtent(config_.fieldWidth * 0.5f, config_.fieldHeight * 0.5f);
    player.position = VectorMath::clampToRect(player.position, -halfExtent, halfExtent);
}

void CollisionSystem::clampToField(BallState& ball) const {
    const glm::vec2 halfExtent(config_.fieldWidth * 0.5f, config_.fieldHeight * 0.5f);
    ball.position = VectorMath::clampToRect(ball.position, -halfExtent, halfExtent);
}

CollisionEvent CollisionSystem::makeEvent(const CollisionResult& collision, uint32_t tick) {
    CollisionEvent event;
    event.tick = tick;
    event.type = collision.type;
    event.entity1Id = collision.entity1Id;
    event.entity2Id = collision.entity2Id;
    event.contactPoint = collision.contactPoint;
    event.normal = collision.normal;
    event.impulse = collision.impulseMagnitude;
    event.foulTriggered = collision.foulTriggered;
    event.foulType = collision.foulType;
    event.offenderId = collision.offenderId;
    return event;
}

std::optional<FoulRecord> CollisionSystem::foulDetails(const CollisionEvent& event) {
    if (!event.foulTriggered) {
        return std::nullopt;
    }

    FoulRecord record;
    record.tick = event.tick;
    record.playerId = event.offenderId.empty() ? event.entity1Id : event.offenderId;
    record.foulType = event.foulType;
    record.severity = event.foulType == FoulType::DANGEROUS_PLAY
        ? CardSeverity::RED
        : CardSeverity::YELLOW;
    return record;
}

} // namespace BassBall
