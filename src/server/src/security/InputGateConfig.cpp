#include "security/InputGateConfig.hpp"
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace BassBall {
namespace Security {

namespace {

void requireNonZero(std::vector<std::string>& problems, const char* name, uint32_t value) {
    if (value == 0) {
        problems.push_back(std::string(name) + " must be > 0");
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

std::vector<std::string> InputGateConfig::validate() const {
    std::vector<std::string> problems;

    requireNonZero(problems, "timestampWindowMs", timestampWindowMs);
    requireNonZero(problems, "maxTick", maxTick);
    requireNonZero(problems, "rateWindowMs", rateWindowMs);
    requireNonZero(problems, "maxInputsPerWindow", maxInputsPerWindow);
    requireNonZero(problems, "escalationThreshold", escalationThreshold);

    // A single gap has nothing to be regular against
    if (botPatternGaps < 2) {
        problems.push_back("botPatternGaps must be >= 2");
    }

    return problems;
}

void InputGateConfig::validateOrThrow() const {
    const auto problems = validate();
    if (problems.empty()) {
        return;
    }

    std::ostringstream message;
    message << "Invalid input gate config:";
    for (const auto& problem : problems) {
        message << " " << problem << ";";
    }
    throw std::invalid_argument(message.str());
}

InputGateConfig inputGateConfigFromJson(const nlohmann::json& json, const InputGateConfig& base) {
    InputGateConfig config = base;

    overlay(json, "timestampWindowMs", config.timestampWindowMs);
    overlay(json, "maxTick", config.maxTick);
    overlay(json, "rateWindowMs", config.rateWindowMs);
    overlay(json, "maxInputsPerWindow", config.maxInputsPerWindow);
    overlay(json, "botPatternGaps", config.botPatternGaps);
    overlay(json, "botPatternToleranceMs", config.botPatternToleranceMs);
    overlay(json, "escalationThreshold", config.escalationThreshold);

    return config;
}

} // namespace Security
} // namespace BassBall
