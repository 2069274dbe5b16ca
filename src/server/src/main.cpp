// BassBall core - command line tool
// [REPLAY_AGENT] Verifies stored or exported match replays and runs
// scripted demo matches through the full simulation pipeline

#include "Constants.hpp"
#include "game/MatchSession.hpp"
#include "physics/CollisionConfig.hpp"
#include "replay/InMemoryReplayStore.hpp"
#include "replay/MatchResult.hpp"
#include "replay/RedisReplayStore.hpp"
#include "replay/ReplayVerifier.hpp"
#include "security/InputGateConfig.hpp"
#include "security/MatchValidator.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <random>
#include <sstream>
#include <string>

using namespace BassBall;

namespace {

struct ToolOptions {
    std::string replayFile;
    std::string matchId;
    std::string expectedHash;
    std::string redisHost{"127.0.0.1"};
    uint16_t redisPort{static_cast<uint16_t>(Constants::REDIS_DEFAULT_PORT)};
    std::string configFile;
    std::string preset;
    uint32_t simulateSeconds{0};
    uint64_t seed{1};
    std::string outputFile;
};

void printUsage(const char* programName) {
    std::cout << "BassBall core v" << Constants::VERSION << " (" << Constants::ENGINE_VERSION << ")\n"
              << "Usage: " << programName << " [options]\n"
              << "\nVerification:\n"
              << "  --replay-file <path>  Verify a replay document offline\n"
              << "  --expected-hash <hex> Authoritative hash for --replay-file (default: declared hash)\n"
              << "  --match-id <id>       Verify a replay stored in Redis\n"
              << "  --redis-host <host>   Redis host (default: 127.0.0.1)\n"
              << "  --redis-port <num>    Redis port (default: 6379)\n"
              << "\nSimulation:\n"
              << "  --simulate <seconds>  Run a scripted 2v2 demo match\n"
              << "  --seed <num>          Match seed (default: 1)\n"
              << "  --output <path>       Write the finished replay document\n"
              << "\nConfiguration:\n"
              << "  --preset <name>       Collision preset (arcade, realistic, competitive, debug)\n"
              << "  --config <path>       JSON file with \"collision\" and \"inputGate\" overrides\n"
              << "  --help, -h            Show this help\n";
}

std::string readFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void loadConfigs(const ToolOptions& options, CollisionConfig& collision,
                 Security::InputGateConfig& gate) {
    if (!options.preset.empty()) {
        auto preset = CollisionConfig::fromPresetName(options.preset);
        if (!preset) {
            throw std::invalid_argument("Unknown collision preset: " + options.preset);
        }
        collision = *preset;
    }

    if (!options.configFile.empty()) {
        nlohmann::json doc = nlohmann::json::parse(readFile(options.configFile));
        if (doc.contains("collision")) {
            collision = collisionConfigFromJson(doc["collision"], collision);
        }
        if (doc.contains("inputGate")) {
            gate = Security::inputGateConfigFromJson(doc["inputGate"], gate);
        }
    }

    collision.validateOrThrow();
    gate.validateOrThrow();
}

// ============================================================================
// VERIFY
// ============================================================================

int runVerification(const ToolOptions& options) {
    std::shared_ptr<Replay::ReplayStore> store;
    std::string matchId = options.matchId;

    if (!options.replayFile.empty()) {
        Replay::MatchResult replay = Replay::parseMatchResult(readFile(options.replayFile));
        if (matchId.empty()) {
            matchId = "local";
        }

        auto memory = std::make_shared<Replay::InMemoryReplayStore>();
        memory->storeAuthoritativeHash(matchId,
            options.expectedHash.empty() ? replay.resultHash : options.expectedHash);
        memory->storeReplay(matchId, replay);
        store = memory;

        std::cout << "[REPLAY] Loaded " << options.replayFile << " ("
                  << replay.totalInputs() << " inputs)\n";
    } else {
        Replay::RedisStoreConfig redis;
        redis.host = options.redisHost;
        redis.port = options.redisPort;
        store = std::make_shared<Replay::RedisReplayStore>(redis);

        std::cout << "[REPLAY] Using Redis at " << redis.host << ":" << redis.port << "\n";
    }

    Replay::ReplayVerifier verifier(store);
    Replay::VerificationResult result = verifier.verify(matchId);
    std::cout << Replay::ReplayVerifier::generateReport(result);

    return result.valid ? 0 : 2;
}

// ============================================================================
// SIMULATE
// ============================================================================

int runSimulation(const ToolOptions& options) {
    CollisionConfig collision;
    Security::InputGateConfig gate;
    loadConfigs(options, collision, gate);

    MatchSession session(options.seed, collision, gate);
    session.addPlayer("home-1", TeamSide::HOME, glm::vec2(-10.0f, 5.0f));
    session.addPlayer("home-2", TeamSide::HOME, glm::vec2(-10.0f, -5.0f));
    session.addPlayer("away-1", TeamSide::AWAY, glm::vec2(10.0f, 5.0f));
    session.addPlayer("away-2", TeamSide::AWAY, glm::vec2(10.0f, -5.0f));

    const char* ids[] = {"home-1", "home-2", "away-1", "away-2"};
    std::mt19937_64 rng(options.seed);
    std::uniform_int_distribution<uint32_t> interval(4, 9);
    std::uniform_int_distribution<uint32_t> jitter(0, 7);
    uint32_t nextInputTick[4] = {1, 2, 3, 4};

    const uint32_t totalTicks = options.simulateSeconds * Constants::TICK_RATE_HZ;
    uint64_t rejected = 0;

    for (uint32_t tick = 1; tick <= totalTicks; ++tick) {
        const uint64_t nowMs = static_cast<uint64_t>(tick) * 1000 / Constants::TICK_RATE_HZ;

        for (size_t i = 0; i < 4; ++i) {
            if (tick != nextInputTick[i]) {
                continue;
            }
            nextInputTick[i] = tick + interval(rng);

            const PlayerState* player = session.getPlayer(ids[i]);
            if (!player || player->isSentOff()) {
                continue;
            }

            const BallState& ball = session.getBall();
            const glm::vec2 toBall = ball.position - player->position;
            const float goalX = (player->team == TeamSide::HOME ? 0.5f : -0.5f) * collision.fieldWidth;

            PlayerInput input;
            input.playerId = ids[i];
            input.tick = tick;
            // Sampled on the client a few milliseconds before it arrives
            input.timestamp = nowMs - jitter(rng);

            const float reach = collision.playerCapsuleRadius + collision.ballRadius + Constants::KICK_REACH;
            if (glm::length(toBall) <= reach) {
                input.params = ShootParams{70.0f};
            } else {
                // Approach from behind the ball relative to the target goal
                glm::vec2 aim = ball.position - glm::vec2(goalX, 0.0f);
                glm::vec2 spot = ball.position + (glm::length(aim) > 0.0f ? glm::normalize(aim) : glm::vec2(0.0f)) * 0.5f;
                glm::vec2 dir = spot - player->position;
                if (glm::length(dir) > 1.0f) {
                    dir = glm::normalize(dir);
                }
                input.params = MoveParams{dir.x, dir.y};
            }

            Security::AdmissionResult admission = session.submitInput(input, nowMs);
            if (!admission.accepted) {
                ++rejected;
            }
        }

        if (!session.step()) {
            break;
        }
    }

    const Replay::MatchResult& result = session.finalize();
    const CollisionStats& stats = session.getCollisionSystem().getStats();

    std::cout << "\n========================================\n";
    std::cout << "Demo match finished\n";
    std::cout << "========================================\n";
    std::cout << "Ticks: " << session.getTick() << " (" << result.durationMs << " ms)\n";
    std::cout << "Score: " << result.score.home << " - " << result.score.away << "\n";
    std::cout << "Inputs accepted: " << result.totalInputs() << ", rejected: " << rejected << "\n";
    std::cout << "Collisions: " << stats.playerBallCollisions << " player-ball, "
              << stats.playerPlayerCollisions << " player-player, "
              << stats.foulsTriggered << " fouls\n";
    std::cout << "Cards shown: " << session.getDisciplineLog().size() << "\n";
    std::cout << "Result hash: " << result.resultHash << "\n\n";

    for (const char* id : ids) {
        Security::PlayerMatchRecord record = session.playerRecord(id, "demo");
        Security::ValidationResult validation = Security::MatchValidator::validateMatch(record, {});
        std::cout << id << ": " << record.playerGoals << "G " << record.playerAssists
                  << "A, plausibility " << validation.score << "/100"
                  << (validation.isValid ? "" : " (flagged)") << "\n";
    }

    if (!options.outputFile.empty()) {
        std::ofstream out(options.outputFile);
        if (!out) {
            throw std::runtime_error("Cannot write " + options.outputFile);
        }
        out << Replay::serializeMatchResult(result) << "\n";
        std::cout << "\n[REPLAY] Wrote " << options.outputFile << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        ToolOptions options;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--replay-file" && i + 1 < argc) {
                options.replayFile = argv[++i];
            } else if (arg == "--expected-hash" && i + 1 < argc) {
                options.expectedHash = argv[++i];
            } else if (arg == "--match-id" && i + 1 < argc) {
                options.matchId = argv[++i];
            } else if (arg == "--redis-host" && i + 1 < argc) {
                options.redisHost = argv[++i];
            } else if (arg == "--redis-port" && i + 1 < argc) {
                options.redisPort = static_cast<uint16_t>(std::atoi(argv[++i]));
            } else if (arg == "--config" && i + 1 < argc) {
                options.configFile = argv[++i];
            } else if (arg == "--preset" && i + 1 < argc) {
                options.preset = argv[++i];
            } else if (arg == "--simulate" && i + 1 < argc) {
                options.simulateSeconds = static_cast<uint32_t>(std::atoi(argv[++i]));
            } else if (arg == "--seed" && i + 1 < argc) {
                options.seed = std::strtoull(argv[++i], nullptr, 10);
            } else if (arg == "--output" && i + 1 < argc) {
                options.outputFile = argv[++i];
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }

        if (options.simulateSeconds > 0) {
            return runSimulation(options);
        }
        if (!options.replayFile.empty() || !options.matchId.empty()) {
            return runVerification(options);
        }

        printUsage(argv[0]);
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "\nFatal error: " << e.what() << "\n";
        return 1;
    }
}
