// [GAMEPLAY_AGENT] Match session tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "game/MatchSession.hpp"
#include "replay/InMemoryReplayStore.hpp"
#include "replay/ReplayVerifier.hpp"
#include "replay/ResultHasher.hpp"
#include <memory>
#include <stdexcept>

using namespace BassBall;
using Catch::Approx;

namespace {

constexpr uint64_t T0 = 50000;

uint64_t clockAt(uint32_t tick) {
    return T0 + static_cast<uint64_t>(tick) * 17;
}

PlayerInput makeInput(const char* player, uint32_t tick, ActionParams params) {
    PlayerInput input;
    input.playerId = player;
    input.tick = tick;
    input.timestamp = clockAt(tick);
    input.params = std::move(params);
    return input;
}

Security::AdmissionResult submit(MatchSession& session, const char* player, uint32_t tick,
                                 ActionParams params) {
    return session.submitInput(makeInput(player, tick, std::move(params)), clockAt(tick));
}

void setMotion(MatchSession& session, EntityID entity, glm::vec2 position, glm::vec2 velocity) {
    PlayerState& player = session.getRegistry().get<PlayerState>(entity);
    player.position = position;
    player.velocity = velocity;
}

} // namespace

TEST_CASE("MatchSession roster", "[match]") {
    MatchSession session(7);
    session.addPlayer("h1", TeamSide::HOME, glm::vec2(-10.0f, 0.0f));
    session.addPlayer("a1", TeamSide::AWAY, glm::vec2(10.0f, 0.0f));

    REQUIRE(session.getInputValidator().getPlayerCount() == 2);
    REQUIRE(session.getPlayer("h1") != nullptr);
    REQUIRE(session.getPlayer("h1")->team == TeamSide::HOME);
    REQUIRE(session.getPlayer("nobody") == nullptr);

    SECTION("Ids must be unique and non-empty") {
        REQUIRE_THROWS_AS(session.addPlayer("h1", TeamSide::AWAY, glm::vec2(0.0f)), std::invalid_argument);
        REQUIRE_THROWS_AS(session.addPlayer("", TeamSide::AWAY, glm::vec2(0.0f)), std::invalid_argument);
    }

    SECTION("Spawn points are clamped to the pitch") {
        session.addPlayer("h2", TeamSide::HOME, glm::vec2(-500.0f, 90.0f));
        REQUIRE(session.getPlayer("h2")->position.x == Approx(-60.0f));
        REQUIRE(session.getPlayer("h2")->position.y == Approx(40.0f));
    }

    SECTION("No joining after kick-off") {
        REQUIRE(session.step());
        REQUIRE_THROWS_AS(session.addPlayer("late", TeamSide::HOME, glm::vec2(0.0f)), std::logic_error);
    }
}

TEST_CASE("MatchSession input flow", "[match]") {
    MatchSession session(7);
    session.addPlayer("h1", TeamSide::HOME, glm::vec2(-10.0f, 0.0f));
    session.addPlayer("a1", TeamSide::AWAY, glm::vec2(10.0f, 0.0f));

    REQUIRE(submit(session, "h1", 1, MoveParams{1.0f, 0.0f}).accepted);
    REQUIRE(submit(session, "a1", 1, MoveParams{-1.0f, 0.0f}).accepted);

    SECTION("Unknown players are rejected and not recorded") {
        auto result = submit(session, "ghost", 1, MoveParams{});
        REQUIRE_FALSE(result.accepted);
        REQUIRE(result.reason == Security::RejectReason::UNKNOWN_PLAYER);

        const auto& replay = session.finalize();
        REQUIRE(replay.homeInputs.size() == 1);
        REQUIRE(replay.awayInputs.size() == 1);
    }

    SECTION("Rejected inputs never reach the replay") {
        REQUIRE_FALSE(submit(session, "h1", 1, MoveParams{0.0f, 1.0f}).accepted);
        REQUIRE_FALSE(submit(session, "a1", 2, MoveParams{3.0f, 0.0f}).accepted);
        REQUIRE(session.finalize().totalInputs() == 2);
    }

    SECTION("Inputs apply on their tick") {
        REQUIRE(session.run(30) == 30);
        REQUIRE(session.getTick() == 30);
        REQUIRE(session.getPlayer("h1")->position.x > -10.0f);
        REQUIRE(session.getPlayer("a1")->position.x < 10.0f);
    }

    SECTION("Future inputs wait for their tick") {
        REQUIRE(submit(session, "h1", 20, MoveParams{0.0f, 1.0f}).accepted);
        session.run(10);
        REQUIRE(session.getPlayer("h1")->position.y == Approx(0.0f));
        session.run(20);
        REQUIRE(session.getPlayer("h1")->position.y > 0.0f);
    }
}

TEST_CASE("MatchSession stops on request", "[match]") {
    Security::InputGateConfig gate;
    gate.maxTick = 10;
    MatchSession session(7, CollisionConfig{}, gate);
    session.addPlayer("h1", TeamSide::HOME, glm::vec2(-10.0f, 0.0f));

    SECTION("Last tick reached") {
        REQUIRE(session.run(50) == 10);
        REQUIRE(session.getTick() == 10);
        REQUIRE_FALSE(session.step());
    }

    SECTION("Abort between ticks") {
        session.run(3);
        session.requestAbort();

        REQUIRE_FALSE(session.step());
        REQUIRE(session.isAborted());
        REQUIRE(session.getTick() == 3);
        REQUIRE(session.run(5) == 0);
    }
}

TEST_CASE("MatchSession scoring", "[match]") {
    MatchSession session(11);
    session.addPlayer("h1", TeamSide::HOME, glm::vec2(57.5f, 0.6f));
    session.addPlayer("h2", TeamSide::HOME, glm::vec2(57.5f, -0.6f));
    session.addPlayer("a1", TeamSide::AWAY, glm::vec2(-30.0f, 20.0f));

    SECTION("Kick into the far goal credits scorer and assist") {
        BallState& ball = session.getRegistry().get<BallState>(
            *session.getRegistry().view<BallState>().begin());
        ball.position = glm::vec2(58.0f, 0.0f);

        // Face the goal, then both kick on the same tick: h1 first by id
        REQUIRE(submit(session, "h1", 1, MoveParams{1.0f, 0.0f}).accepted);
        REQUIRE(submit(session, "h2", 1, MoveParams{1.0f, 0.0f}).accepted);
        REQUIRE(submit(session, "h1", 2, PassParams{50.0f}).accepted);
        REQUIRE(submit(session, "h2", 2, ShootParams{100.0f}).accepted);

        session.run(20);

        REQUIRE(session.getScore().home == 1);
        REQUIRE(session.getScore().away == 0);
        REQUIRE(session.getGoals().size() == 1);

        const GoalRecord& goal = session.getGoals()[0];
        REQUIRE(goal.team == TeamSide::HOME);
        REQUIRE(goal.scorerId == PlayerId("h2"));
        REQUIRE(goal.assistId == PlayerId("h1"));

        // Ball goes back to the centre spot
        REQUIRE(session.getBall().position.x == Approx(0.0f));
        REQUIRE(session.getBall().position.y == Approx(0.0f));

        auto scorer = session.playerRecord("h2", "m1");
        REQUIRE(scorer.matchId == "m1");
        REQUIRE(scorer.playerGoals == 1);
        REQUIRE(scorer.playerAssists == 0);
        REQUIRE(scorer.inputs.size() == 2);
        REQUIRE(scorer.teamScore() == 1);

        auto assister = session.playerRecord("h1");
        REQUIRE(assister.playerGoals == 0);
        REQUIRE(assister.playerAssists == 1);

        REQUIRE(session.playerRecord("a1").opponentScore() == 1);
    }

    SECTION("Untouched ball into the home goal counts for away without a scorer") {
        BallState& ball = session.getRegistry().get<BallState>(
            *session.getRegistry().view<BallState>().begin());
        ball.position = glm::vec2(-59.9f, 1.0f);
        ball.velocity = glm::vec2(-30.0f, 0.0f);

        session.step();

        REQUIRE(session.getScore().away == 1);
        REQUIRE(session.getGoals().size() == 1);
        REQUIRE_FALSE(session.getGoals()[0].scorerId.has_value());
        REQUIRE_FALSE(session.getGoals()[0].assistId.has_value());
    }

    SECTION("Wide of the post is no goal") {
        BallState& ball = session.getRegistry().get<BallState>(
            *session.getRegistry().view<BallState>().begin());
        ball.position = glm::vec2(-59.9f, 10.0f);
        ball.velocity = glm::vec2(-30.0f, 0.0f);

        session.step();
        REQUIRE(session.getGoals().empty());
    }

    REQUIRE_THROWS_AS(session.playerRecord("nobody"), std::invalid_argument);
}

TEST_CASE("MatchSession discipline", "[match]") {
    SECTION("Dangerous play is a straight red") {
        MatchSession session(3);
        EntityID a = session.addPlayer("a", TeamSide::HOME, glm::vec2(-0.5f, 10.0f));
        EntityID b = session.addPlayer("b", TeamSide::AWAY, glm::vec2(0.5f, 10.0f));
        setMotion(session, a, glm::vec2(-0.5f, 10.0f), glm::vec2(20.0f, 0.0f));
        setMotion(session, b, glm::vec2(0.5f, 10.0f), glm::vec2(-20.0f, 0.0f));

        REQUIRE(session.step());

        REQUIRE(session.getDisciplineLog().size() == 1);
        const DisciplineRecord& record = session.getDisciplineLog()[0];
        REQUIRE(record.card == CardSeverity::RED);
        REQUIRE(record.foulType == FoulType::DANGEROUS_PLAY);
        REQUIRE_FALSE(record.secondYellow);

        const PlayerState* offender = session.getPlayer(record.playerId);
        REQUIRE(offender->isSentOff());
        REQUIRE(offender->velocity.x == Approx(0.0f));

        // Evicted from the gate
        REQUIRE(session.getInputValidator().getPlayerCount() == 1);
        auto rejected = submit(session, record.playerId.c_str(), 5, MoveParams{1.0f, 0.0f});
        REQUIRE(rejected.reason == Security::RejectReason::UNKNOWN_PLAYER);
    }

    SECTION("Second yellow becomes a red") {
        CollisionConfig config;
        config.foulForceThreshold = 40.0f;
        MatchSession session(3, config);
        EntityID a = session.addPlayer("a", TeamSide::HOME, glm::vec2(-0.5f, 10.0f));
        EntityID b = session.addPlayer("b", TeamSide::AWAY, glm::vec2(0.5f, 10.0f));

        // "a" closes faster, so "a" is the offender both times
        setMotion(session, a, glm::vec2(-0.5f, 10.0f), glm::vec2(24.0f, 0.0f));
        setMotion(session, b, glm::vec2(0.5f, 10.0f), glm::vec2(-16.0f, 0.0f));
        session.step();

        REQUIRE(session.getDisciplineLog().size() == 1);
        REQUIRE(session.getDisciplineLog()[0].playerId == "a");
        REQUIRE(session.getDisciplineLog()[0].card == CardSeverity::YELLOW);
        REQUIRE_FALSE(session.getPlayer("a")->isSentOff());

        setMotion(session, a, glm::vec2(-0.5f, 10.0f), glm::vec2(24.0f, 0.0f));
        setMotion(session, b, glm::vec2(0.5f, 10.0f), glm::vec2(-16.0f, 0.0f));
        session.step();

        REQUIRE(session.getDisciplineLog().size() == 2);
        const DisciplineRecord& second = session.getDisciplineLog()[1];
        REQUIRE(second.playerId == "a");
        REQUIRE(second.card == CardSeverity::RED);
        REQUIRE(second.secondYellow);
        REQUIRE(session.getPlayer("a")->isSentOff());
        REQUIRE(session.getPlayer("a")->yellowCards == 2);
        REQUIRE_FALSE(session.getPlayer("b")->isSentOff());
    }
}

TEST_CASE("MatchSession finalize", "[match]") {
    MatchSession session(99);
    session.addPlayer("h1", TeamSide::HOME, glm::vec2(-10.0f, 0.0f));
    session.addPlayer("a1", TeamSide::AWAY, glm::vec2(10.0f, 0.0f));

    REQUIRE(submit(session, "h1", 1, MoveParams{1.0f, 0.0f}).accepted);
    REQUIRE(submit(session, "a1", 4, SprintParams{}).accepted);
    session.run(120);

    const Replay::MatchResult& result = session.finalize();

    REQUIRE(session.isFinalized());
    REQUIRE(result.seed == 99);
    REQUIRE(result.durationMs == 2000);
    REQUIRE(result.homeInputs.size() == 1);
    REQUIRE(result.awayInputs.size() == 1);
    REQUIRE(result.resultHash == Replay::ResultHasher::computeHash(result));

    SECTION("Idempotent") {
        const Replay::MatchResult& again = session.finalize();
        REQUIRE(&again == &result);
        REQUIRE(again.resultHash == result.resultHash);
    }

    SECTION("Nothing runs or joins afterwards") {
        REQUIRE_FALSE(session.step());
        REQUIRE(session.getTick() == 120);
        REQUIRE(session.getInputValidator().getPlayerCount() == 0);
        REQUIRE_FALSE(submit(session, "h1", 121, MoveParams{}).accepted);
        REQUIRE_THROWS_AS(session.addPlayer("late", TeamSide::HOME, glm::vec2(0.0f)), std::logic_error);
    }

    SECTION("Player records feed the plausibility check") {
        auto record = session.playerRecord("h1");
        REQUIRE(record.durationMinutes == 0);
        REQUIRE(record.inputs.size() == 1);
        REQUIRE(record.inputs[0].playerId == "h1");
    }
}

TEST_CASE("MatchSession replay with interleaved teammates verifies", "[match][replay]") {
    MatchSession session(31);
    session.addPlayer("home-1", TeamSide::HOME, glm::vec2(-10.0f, 5.0f));
    session.addPlayer("home-2", TeamSide::HOME, glm::vec2(-10.0f, -5.0f));
    session.addPlayer("away-1", TeamSide::AWAY, glm::vec2(10.0f, 0.0f));

    // home-2 was sampled earlier but reached the gate second
    PlayerInput first = makeInput("home-1", 1, MoveParams{1.0f, 0.0f});
    first.timestamp = 1005;
    PlayerInput second = makeInput("home-2", 1, MoveParams{1.0f, 0.0f});
    second.timestamp = 1000;
    REQUIRE(session.submitInput(first, 1005).accepted);
    REQUIRE(session.submitInput(second, 1005).accepted);
    session.run(60);

    const Replay::MatchResult& result = session.finalize();
    REQUIRE(result.homeInputs.size() == 2);
    REQUIRE(result.homeInputs[0].timestamp > result.homeInputs[1].timestamp);

    auto store = std::make_shared<Replay::InMemoryReplayStore>();
    store->storeReplay("interleaved", result);
    store->storeAuthoritativeHash("interleaved", result.resultHash);

    // Short scripted match; only ordering and hashing are under test
    Replay::VerifierConfig config;
    config.minDurationMs = 0;
    config.minInputsPerSecond = 0.0f;
    config.initialBackoffMs = 1;
    Replay::ReplayVerifier verifier(store, config);

    Replay::VerificationResult verification = verifier.verify("interleaved");
    REQUIRE(verification.mismatch == Replay::MismatchType::NONE);
    REQUIRE(verification.valid);
}
