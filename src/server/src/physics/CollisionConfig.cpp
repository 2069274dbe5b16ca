// [PHYSICS_AGENT] Collision configuration validation, presets and JSON overlay

#include "physics/CollisionConfig.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace BassBall {

namespace {

void requireFinite(std::vector<std::string>& problems, const char* name, float value) {
    if (!std::isfinite(value)) {
        problems.push_back(std::string(name) + " must be finite");
    }
}

void requirePositive(std::vector<std::string>& problems, const char* name, float value) {
    if (std::isfinite(value) && value <= 0.0f) {
        problems.push_back(std::string(name) + " must be > 0");
    }
}

void requireNonNegative(std::vector<std::string>& problems, const char* name, float value) {
    if (std::isfinite(value) && value < 0.0f) {
        problems.push_back(std::string(name) + " must be >= 0");
    }
}

template<typename T>
void overlay(const nlohmann::json& json, const char* key, T& field) {
    auto it = json.find(key);
    if (it != json.end()) {
        field = it->template get<T>();
    }
}

} // namespace

std::vector<std::string> CollisionConfig::validate() const {
    std::vector<std::string> problems;

    requireFinite(problems, "playerCapsuleRadius", playerCapsuleRadius);
    requireFinite(problems, "playerCapsuleHeight", playerCapsuleHeight);
    requireFinite(problems, "ballRadius", ballRadius);
    requireFinite(problems, "fieldWidth", fieldWidth);
    requireFinite(problems, "fieldHeight", fieldHeight);
    requireFinite(problems, "maxPenetration", maxPenetration);
    requireFinite(problems, "separationEpsilon", separationEpsilon);
    requireFinite(problems, "restitution", restitution);
    requireFinite(problems, "momentumTransferCap", momentumTransferCap);
    requireFinite(problems, "foulForceThreshold", foulForceThreshold);
    requireFinite(problems, "foulContactAngle", foulContactAngle);

    requirePositive(problems, "playerCapsuleRadius", playerCapsuleRadius);
    requirePositive(problems, "ballRadius", ballRadius);
    requirePositive(problems, "fieldWidth", fieldWidth);
    requirePositive(problems, "fieldHeight", fieldHeight);

    requireNonNegative(problems, "playerCapsuleHeight", playerCapsuleHeight);
    requireNonNegative(problems, "maxPenetration", maxPenetration);
    requireNonNegative(problems, "separationEpsilon", separationEpsilon);
    requireNonNegative(problems, "restitution", restitution);
    requireNonNegative(problems, "momentumTransferCap", momentumTransferCap);
    requireNonNegative(problems, "foulForceThreshold", foulForceThreshold);
    requireNonNegative(problems, "foulContactAngle", foulContactAngle);

    if (resolutionPasses == 0 || resolutionPasses > Constants::MAX_RESOLUTION_PASSES) {
        problems.push_back("resolutionPasses must be in [1, " +
                           std::to_string(Constants::MAX_RESOLUTION_PASSES) + "]");
    }

    return problems;
}

void CollisionConfig::validateOrThrow() const {
    const auto problems = validate();
    if (problems.empty()) {
        return;
    }

    std::ostringstream message;
    message << "Invalid collision config:";
    for (const auto& problem : problems) {
        message << " " << problem << ";";
    }
    throw std::invalid_argument(message.str());
}

CollisionConfig CollisionConfig::arcade() {
    CollisionConfig config;
    config.foulForceThreshold = 35.0f;
    config.momentumTransferCap = 0.8f;
    config.maxPenetration = 0.02f;
    return config;
}

CollisionConfig CollisionConfig::realistic() {
    CollisionConfig config;
    config.foulForceThreshold = 18.0f;
    config.momentumTransferCap = 0.3f;
    config.maxPenetration = 0.005f;
    return config;
}

CollisionConfig CollisionConfig::competitive() {
    CollisionConfig config;
    config.foulForceThreshold = 25.0f;
    config.momentumTransferCap = 0.5f;
    config.maxPenetration = 0.01f;
    return config;
}

CollisionConfig CollisionConfig::debug() {
    CollisionConfig config;
    config.foulForceThreshold = 20.0f;
    config.momentumTransferCap = 0.4f;
    config.maxPenetration = 0.008f;
    return config;
}

std::optional<CollisionConfig> CollisionConfig::fromPresetName(std::string_view name) {
    if (name == "arcade") return arcade();
    if (name == "realistic") return realistic();
    if (name == "competitive") return competitive();
    if (name == "debug") return debug();
    return std::nullopt;
}

CollisionConfig collisionConfigFromJson(const nlohmann::json& json, const CollisionConfig& base) {
    CollisionConfig config = base;

    overlay(json, "playerCapsuleRadius", config.playerCapsuleRadius);
    overlay(json, "playerCapsuleHeight", config.playerCapsuleHeight);
    overlay(json, "ballRadius", config.ballRadius);
    overlay(json, "fieldWidth", config.fieldWidth);
    overlay(json, "fieldHeight", config.fieldHeight);
    overlay(json, "maxPenetration", config.maxPenetration);
    overlay(json, "separationEpsilon", config.separationEpsilon);
    overlay(json, "resolutionPasses", config.resolutionPasses);
    overlay(json, "restitution", config.restitution);
    overlay(json, "momentumTransferCap", config.momentumTransferCap);
    overlay(json, "foulForceThreshold", config.foulForceThreshold);
    overlay(json, "foulContactAngle", config.foulContactAngle);

    return config;
}

nlohmann::json collisionConfigToJson(const CollisionConfig& config) {
    return nlohmann::json{
        {"playerCapsuleRadius", config.playerCapsuleRadius},
        {"playerCapsuleHeight", config.playerCapsuleHeight},
        {"ballRadius", config.ballRadius},
        {"fieldWidth", config.fieldWidth},
        {"fieldHeight", config.fieldHeight},
        {"maxPenetration", config.maxPenetration},
        {"separationEpsilon", config.separationEpsilon},
        {"resolutionPasses", config.resolutionPasses},
        {"restitution", config.restitution},
        {"momentumTransferCap", config.momentumTransferCap},
        {"foulForceThreshold", config.foulForceThreshold},
        {"foulContactAngle", config.foulContactAngle}
    };
}

} // namespace BassBall
