// [PHYSICS_AGENT] Collision orchestration unit tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "physics/CollisionSystem.hpp"
#include "physics/VectorMath.hpp"

using namespace BassBall;
using Catch::Approx;

namespace {

EntityID addPlayer(Registry& registry, const char* id, glm::vec2 position,
                   glm::vec2 velocity = glm::vec2(0.0f)) {
    EntityID entity = registry.create();
    PlayerState& player = registry.emplace<PlayerState>(entity);
    player.id = id;
    player.position = position;
    player.velocity = velocity;
    return entity;
}

EntityID addBall(Registry& registry, glm::vec2 position) {
    EntityID entity = registry.create();
    registry.emplace<BallState>(entity).position = position;
    return entity;
}

} // namespace

TEST_CASE("CollisionSystem settles player-ball contact", "[collision][system]") {
    CollisionSystem system;
    Registry registry;

    EntityID player = addPlayer(registry, "p1", glm::vec2(0.0f));
    EntityID ball = addBall(registry, glm::vec2(0.3f, 0.0f));

    CollisionTickReport report = system.processTick(registry, 7);

    REQUIRE(report.events.size() == 1);
    const CollisionEvent& event = report.events[0];
    REQUIRE(event.tick == 7);
    REQUIRE(event.type == CollisionType::PLAYER_BALL);
    REQUIRE(event.entity1Id == "p1");
    REQUIRE(event.normal.x == Approx(1.0f));
    REQUIRE(event.impulse == 0.0f);
    REQUIRE_FALSE(event.foulTriggered);

    REQUIRE(report.fouls.empty());
    REQUIRE(report.residualPenetration <= system.getConfig().maxPenetration);

    const glm::vec2 gap = registry.get<BallState>(ball).position - registry.get<PlayerState>(player).position;
    REQUIRE(VectorMath::length(gap) >= Approx(0.51f));

    REQUIRE(system.getStats().playerBallCollisions == 1);
    REQUIRE(system.getCollisionLog().size() == 1);
}

TEST_CASE("CollisionSystem records fouls", "[collision][system]") {
    CollisionSystem system;
    Registry registry;

    EntityID a = addPlayer(registry, "a", glm::vec2(0.0f), glm::vec2(20.0f, 0.0f));
    EntityID b = addPlayer(registry, "b", glm::vec2(0.5f, 0.0f), glm::vec2(-20.0f, 0.0f));

    CollisionTickReport report = system.processTick(registry, 1);

    REQUIRE(report.events.size() == 1);
    REQUIRE(report.events[0].type == CollisionType::PLAYER_PLAYER);
    REQUIRE(report.events[0].impulse == Approx(56.0f));
    REQUIRE(report.events[0].foulType == FoulType::DANGEROUS_PLAY);

    REQUIRE(report.fouls.size() == 1);
    REQUIRE(report.fouls[0].playerId == "a");
    REQUIRE(report.fouls[0].severity == CardSeverity::RED);
    REQUIRE(report.fouls[0].tick == 1);

    SECTION("Momentum exchanged is capped") {
        REQUIRE(registry.get<PlayerState>(a).velocity.x == Approx(19.75f));
        REQUIRE(registry.get<PlayerState>(b).velocity.x == Approx(-19.75f));
    }

    SECTION("Stats count the foul") {
        const CollisionStats& stats = system.getStats();
        REQUIRE(stats.playerPlayerCollisions == 1);
        REQUIRE(stats.foulsTriggered == 1);
        REQUIRE(stats.totalCollisions() == 1);
    }

    SECTION("The log is append-only until cleared") {
        system.processTick(registry, 2);
        REQUIRE(system.getCollisionLog().size() >= 1);
        system.clearLog();
        REQUIRE(system.getCollisionLog().empty());
    }
}

TEST_CASE("CollisionSystem foul details", "[collision][system]") {
    CollisionEvent event;
    event.tick = 42;
    event.entity1Id = "a";
    event.entity2Id = "b";

    SECTION("No foul, no record") {
        REQUIRE_FALSE(CollisionSystem::foulDetails(event).has_value());
    }

    SECTION("Collision foul is a yellow for the offender") {
        event.foulTriggered = true;
        event.foulType = FoulType::COLLISION;
        event.offenderId = "b";

        auto record = CollisionSystem::foulDetails(event);
        REQUIRE(record.has_value());
        REQUIRE(record->playerId == "b");
        REQUIRE(record->severity == CardSeverity::YELLOW);
        REQUIRE(record->tick == 42);
    }

    SECTION("Tackle without an offender falls back to the first entity") {
        event.foulTriggered = true;
        event.foulType = FoulType::TACKLE;

        auto record = CollisionSystem::foulDetails(event);
        REQUIRE(record->playerId == "a");
        REQUIRE(record->severity == CardSeverity::YELLOW);
    }
}

TEST_CASE("CollisionSystem skips sent-off players", "[collision][system]") {
    CollisionSystem system;
    Registry registry;

    EntityID a = addPlayer(registry, "a", glm::vec2(0.0f), glm::vec2(5.0f, 0.0f));
    addPlayer(registry, "b", glm::vec2(0.5f, 0.0f));
    registry.get<PlayerState>(a).redCards = 1;

    CollisionTickReport report = system.processTick(registry, 1);

    REQUIRE(report.events.empty());
    REQUIRE(registry.get<PlayerState>(a).position.x == 0.0f);
}

TEST_CASE("CollisionSystem clamps to the field", "[collision][system]") {
    CollisionSystem system;
    Registry registry;

    EntityID player = addPlayer(registry, "p1", glm::vec2(100.0f, -55.0f));
    EntityID ball = addBall(registry, glm::vec2(-70.0f, 10.0f));

    system.processTick(registry, 1);

    REQUIRE(registry.get<PlayerState>(player).position.x == Approx(60.0f));
    REQUIRE(registry.get<PlayerState>(player).position.y == Approx(-40.0f));
    REQUIRE(registry.get<BallState>(ball).position.x == Approx(-60.0f));
    REQUIRE(registry.get<BallState>(ball).position.y == Approx(10.0f));
}

TEST_CASE("CollisionSystem converges over several passes", "[collision][system]") {
    CollisionSystem system;
    Registry registry;

    // Three players squeezed together and closing from both sides
    EntityID a = addPlayer(registry, "a", glm::vec2(-0.3f, 0.0f), glm::vec2(1.0f, 0.0f));
    EntityID b = addPlayer(registry, "b", glm::vec2(0.0f, 0.0f));
    EntityID c = addPlayer(registry, "c", glm::vec2(0.3f, 0.0f), glm::vec2(-1.0f, 0.0f));

    CollisionTickReport report = system.processTick(registry, 1);

    REQUIRE(report.events.size() == 3);
    for (const auto& event : report.events) {
        REQUIRE(event.type == CollisionType::PLAYER_PLAYER);
    }

    // Three passes leave ~0.02 here; settling runs one more
    REQUIRE(report.residualPenetration <= system.getConfig().maxPenetration);

    const float diameter = system.getConfig().playerCapsuleRadius * 2.0f;
    const float ab = registry.get<PlayerState>(b).position.x - registry.get<PlayerState>(a).position.x;
    const float bc = registry.get<PlayerState>(c).position.x - registry.get<PlayerState>(b).position.x;
    REQUIRE(ab >= diameter - system.getConfig().maxPenetration);
    REQUIRE(bc >= diameter - system.getConfig().maxPenetration);

    // Each contact exchanged its capped momentum once, however many passes ran
    REQUIRE(registry.get<PlayerState>(a).velocity.x == Approx(0.5f));
    REQUIRE(registry.get<PlayerState>(b).velocity.x == Approx(0.0f).margin(1e-6));
    REQUIRE(registry.get<PlayerState>(c).velocity.x == Approx(-0.5f));
}

TEST_CASE("CollisionSystem order does not depend on entity creation", "[collision][system]") {
    auto run = [](bool reversed) {
        CollisionSystem system;
        Registry registry;

        if (reversed) {
            addPlayer(registry, "c", glm::vec2(5.3f, 0.0f), glm::vec2(-3.0f, 0.0f));
            addPlayer(registry, "b", glm::vec2(5.0f, 0.0f), glm::vec2(2.0f, 0.0f));
            addPlayer(registry, "a", glm::vec2(0.0f, 0.0f));
        } else {
            addPlayer(registry, "a", glm::vec2(0.0f, 0.0f));
            addPlayer(registry, "b", glm::vec2(5.0f, 0.0f), glm::vec2(2.0f, 0.0f));
            addPlayer(registry, "c", glm::vec2(5.3f, 0.0f), glm::vec2(-3.0f, 0.0f));
        }
        addBall(registry, glm::vec2(0.2f, 0.0f));

        CollisionTickReport report = system.processTick(registry, 3);
        std::vector<std::string> order;
        for (const auto& event : report.events) {
            order.push_back(event.entity1Id + "/" + event.entity2Id);
        }
        return order;
    };

    std::vector<std::string> forward = run(false);
    std::vector<std::string> backward = run(true);

    REQUIRE(forward.size() == 2);
    REQUIRE(forward == backward);
    REQUIRE(forward[0] == "a/");
    REQUIRE(forward[1] == "b/c");
}
