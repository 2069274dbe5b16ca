// [SECURITY_AGENT] Input admission gate unit tests

#include <catch2/catch_test_macros.hpp>
#include "security/InputValidator.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <vector>

using namespace BassBall;
using namespace BassBall::Security;

namespace {

constexpr uint64_t T0 = 10000;

PlayerInput move(const char* id, uint32_t tick, uint64_t timestamp) {
    PlayerInput input;
    input.playerId = id;
    input.tick = tick;
    input.timestamp = timestamp;
    input.params = MoveParams{0.5f, -0.5f};
    return input;
}

} // namespace

TEST_CASE("InputValidator accepts a well-behaved stream", "[security][input]") {
    InputValidator validator;
    validator.join("p1");

    // Human-ish spacing: never regular enough to look scripted
    const uint64_t gaps[] = {5, 30, 12, 48};
    uint64_t now = T0;

    for (uint32_t tick = 1; tick <= 200; ++tick) {
        now += gaps[tick % 4];
        AdmissionResult result = validator.admit(move("p1", tick, now), now);
        REQUIRE(result.accepted);
        REQUIRE(result.reason == RejectReason::NONE);
    }

    REQUIRE(validator.getSuspicion("p1") == 0);
    REQUIRE(validator.getLastAcceptedTick("p1") == 200u);
    REQUIRE(validator.getTotalAccepted() == 200);
    REQUIRE(validator.getTotalRejected() == 0);
}

TEST_CASE("InputValidator tick ordering", "[security][input]") {
    InputValidator validator;
    validator.join("p1");

    REQUIRE(validator.admit(move("p1", 5, T0), T0).accepted);

    SECTION("Repeated tick") {
        AdmissionResult result = validator.admit(move("p1", 5, T0 + 20), T0 + 20);
        REQUIRE_FALSE(result.accepted);
        REQUIRE(result.reason == RejectReason::TICK_NOT_INCREASING);
        REQUIRE(result.suspicion == 1);
    }

    SECTION("Older tick") {
        AdmissionResult result = validator.admit(move("p1", 3, T0 + 20), T0 + 20);
        REQUIRE(result.reason == RejectReason::TICK_NOT_INCREASING);
    }

    SECTION("Rejected inputs do not move the last accepted tick") {
        (void)validator.admit(move("p1", 2, T0 + 20), T0 + 20);
        REQUIRE(validator.getLastAcceptedTick("p1") == 5u);
        REQUIRE(validator.admit(move("p1", 6, T0 + 40), T0 + 40).accepted);
    }

    SECTION("Tick beyond the end of the match") {
        AdmissionResult result = validator.admit(
            move("p1", Constants::MAX_MATCH_TICKS + 1, T0 + 20), T0 + 20);
        REQUIRE(result.reason == RejectReason::TICK_OUT_OF_RANGE);

        REQUIRE(validator.admit(move("p1", Constants::MAX_MATCH_TICKS, T0 + 40), T0 + 40).accepted);
    }
}

TEST_CASE("InputValidator timestamp window", "[security][input]") {
    InputValidator validator;
    validator.join("p1");

    SECTION("Future timestamp") {
        AdmissionResult result = validator.admit(move("p1", 1, T0 + 1), T0);
        REQUIRE(result.reason == RejectReason::FUTURE_TIMESTAMP);
    }

    SECTION("Oldest timestamp still inside the window") {
        REQUIRE(validator.admit(move("p1", 1, T0 - 200), T0).accepted);
    }

    SECTION("Stale timestamp") {
        AdmissionResult result = validator.admit(move("p1", 1, T0 - 201), T0);
        REQUIRE(result.reason == RejectReason::STALE_TIMESTAMP);
    }
}

TEST_CASE("InputValidator parameter bounds", "[security][input]") {
    InputValidator validator;
    validator.join("p1");

    PlayerInput input = move("p1", 1, T0);

    SECTION("Move axis out of range") {
        input.params = MoveParams{1.5f, 0.0f};
        REQUIRE(validator.admit(input, T0).reason == RejectReason::INVALID_PARAMETERS);
    }

    SECTION("Shot power out of range") {
        input.params = ShootParams{101.0f};
        REQUIRE(validator.admit(input, T0).reason == RejectReason::INVALID_PARAMETERS);
    }

    SECTION("Tackle needs a target") {
        input.params = TackleParams{};
        REQUIRE(validator.admit(input, T0).reason == RejectReason::INVALID_PARAMETERS);
    }

    SECTION("Skill needs an id") {
        input.params = SkillParams{};
        REQUIRE(validator.admit(input, T0).reason == RejectReason::INVALID_PARAMETERS);
    }

    SECTION("Boundary values are fine") {
        input.params = PassParams{100.0f};
        REQUIRE(validator.admit(input, T0).accepted);
    }
}

TEST_CASE("InputValidator rate limit", "[security][input]") {
    InputValidator validator;
    validator.join("p1");

    const uint64_t times[] = {0, 1, 9, 10, 20, 21, 35, 36, 50, 51};
    uint32_t tick = 0;
    for (uint64_t offset : times) {
        AdmissionResult result = validator.admit(move("p1", ++tick, T0 + offset), T0 + offset);
        REQUIRE(result.accepted);
    }

    AdmissionResult limited = validator.admit(move("p1", ++tick, T0 + 60), T0 + 60);
    REQUIRE_FALSE(limited.accepted);
    REQUIRE(limited.reason == RejectReason::RATE_LIMITED);

    // Once the oldest acceptance leaves the window there is room again
    REQUIRE(validator.admit(move("p1", ++tick, T0 + 101), T0 + 101).accepted);
}

TEST_CASE("InputValidator bot pattern", "[security][input]") {
    InputValidator validator;
    validator.join("p1");

    SECTION("Metronomic input is flagged") {
        for (uint32_t i = 0; i < 4; ++i) {
            REQUIRE(validator.admit(move("p1", i + 1, T0 + i * 100), T0 + i * 100).accepted);
        }
        AdmissionResult result = validator.admit(move("p1", 5, T0 + 400), T0 + 400);
        REQUIRE(result.reason == RejectReason::BOT_PATTERN);
    }

    SECTION("Small jitter does not hide a script") {
        const uint64_t times[] = {0, 101, 199, 300};
        uint32_t tick = 0;
        for (uint64_t offset : times) {
            REQUIRE(validator.admit(move("p1", ++tick, T0 + offset), T0 + offset).accepted);
        }
        REQUIRE(validator.admit(move("p1", ++tick, T0 + 401), T0 + 401).reason == RejectReason::BOT_PATTERN);
    }

    SECTION("Too few inputs to judge") {
        for (uint32_t i = 0; i < 4; ++i) {
            REQUIRE(validator.admit(move("p1", i + 1, T0 + i * 100), T0 + i * 100).accepted);
        }
        REQUIRE(validator.getSuspicion("p1") == 0);
    }
}

TEST_CASE("InputValidator escalation", "[security][input]") {
    InputValidator validator;
    validator.join("p1");

    std::vector<PlayerId> escalated;
    RejectReason lastReason = RejectReason::NONE;
    validator.setOnEscalation([&](const PlayerId& id, uint32_t suspicion, RejectReason reason) {
        escalated.push_back(id);
        lastReason = reason;
        REQUIRE(suspicion == Constants::SUSPICION_ESCALATION_THRESHOLD);
    });

    for (uint32_t i = 0; i < 4; ++i) {
        AdmissionResult result = validator.admit(move("p1", 1, T0 + 10), T0);
        REQUIRE_FALSE(result.escalated);
    }
    REQUIRE_FALSE(validator.isEscalated("p1"));

    AdmissionResult fifth = validator.admit(move("p1", 1, T0 + 10), T0);
    REQUIRE(fifth.escalated);
    REQUIRE(fifth.suspicion == 5);
    REQUIRE(validator.isEscalated("p1"));
    REQUIRE(escalated.size() == 1);
    REQUIRE(escalated[0] == "p1");
    REQUIRE(lastReason == RejectReason::FUTURE_TIMESTAMP);

    // Escalation fires once per player
    AdmissionResult sixth = validator.admit(move("p1", 1, T0 + 10), T0);
    REQUIRE_FALSE(sixth.escalated);
    REQUIRE(escalated.size() == 1);
    REQUIRE(validator.getSuspicion("p1") == 6);
}

TEST_CASE("InputValidator player lifecycle", "[security][input]") {
    InputValidator validator;

    SECTION("Unknown players are rejected") {
        AdmissionResult result = validator.admit(move("ghost", 1, T0), T0);
        REQUIRE(result.reason == RejectReason::UNKNOWN_PLAYER);
        REQUIRE(validator.getTotalRejected() == 1);
    }

    SECTION("Join is idempotent") {
        PlayerHandle first = validator.join("p1");
        PlayerHandle second = validator.join("p1");
        REQUIRE(first == second);
        REQUIRE(validator.getPlayerCount() == 1);
        REQUIRE(validator.handleOf("p1") == first);
    }

    SECTION("State is per player") {
        validator.join("p1");
        validator.join("p2");
        REQUIRE(validator.admit(move("p1", 10, T0), T0).accepted);
        REQUIRE(validator.admit(move("p2", 1, T0), T0).accepted);
        REQUIRE(validator.getLastAcceptedTick("p1") == 10u);
        REQUIRE(validator.getLastAcceptedTick("p2") == 1u);
    }

    SECTION("Leaving evicts the state") {
        validator.join("p1");
        (void)validator.admit(move("p1", 1, T0 + 5), T0);
        REQUIRE(validator.leave("p1"));
        REQUIRE_FALSE(validator.leave("p1"));
        REQUIRE(validator.getSuspicion("p1") == 0);
        REQUIRE(validator.admit(move("p1", 2, T0), T0).reason == RejectReason::UNKNOWN_PLAYER);
    }

    SECTION("Handles die with the match") {
        PlayerHandle handle = validator.join("p1");
        validator.endMatch();
        REQUIRE(validator.getPlayerCount() == 0);
        REQUIRE_FALSE(validator.handleOf("p1").has_value());
        REQUIRE(validator.admit(handle, move("p1", 1, T0), T0).reason == RejectReason::UNKNOWN_PLAYER);
    }
}

TEST_CASE("InputGateConfig validation", "[security][input][config]") {
    SECTION("Defaults") {
        InputGateConfig config;
        REQUIRE(config.validate().empty());
        REQUIRE(config.timestampWindowMs == 200);
        REQUIRE(config.maxTick == 108000);
        REQUIRE(config.maxInputsPerWindow == 10);
    }

    SECTION("Zero windows are rejected at construction") {
        InputGateConfig config;
        config.rateWindowMs = 0;
        REQUIRE_THROWS_AS(InputValidator(config), std::invalid_argument);
    }

    SECTION("A single bot gap is meaningless") {
        InputGateConfig config;
        config.botPatternGaps = 1;
        REQUIRE(config.validate().size() == 1);
    }

    SECTION("JSON overlay") {
        nlohmann::json doc = {{"maxTick", 3600}, {"escalationThreshold", 3}};
        InputGateConfig config = inputGateConfigFromJson(doc);
        REQUIRE(config.maxTick == 3600);
        REQUIRE(config.escalationThreshold == 3);
        REQUIRE(config.rateWindowMs == Constants::INPUT_RATE_WINDOW_MS);
    }
}
