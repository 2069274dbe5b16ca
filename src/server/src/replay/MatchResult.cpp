// [REPLAY_AGENT] Replay document encoding

#include "replay/MatchResult.hpp"
#include <nlohmann/json.hpp>
#include <type_traits>
#include <variant>

namespace BassBall {
namespace Replay {

namespace {

nlohmann::json paramsToJson(const ActionParams& params) {
    return std::visit([](const auto& p) -> nlohmann::json {
        using T = std::decay_t<decltype(p)>;

        if constexpr (std::is_same_v<T, MoveParams>) {
            return {{"x", p.x}, {"y", p.y}};
        } else if constexpr (std::is_same_v<T, PassParams> || std::is_same_v<T, ShootParams>) {
            return {{"power", p.power}};
        } else if constexpr (std::is_same_v<T, TackleParams>) {
            return {{"targetId", p.targetId}};
        } else if constexpr (std::is_same_v<T, SprintParams>) {
            return nlohmann::json::object();
        } else {
            static_assert(std::is_same_v<T, SkillParams>, "unhandled action parameters");
            return {{"skillId", p.skillId}};
        }
    }, params);
}

ActionParams paramsFromJson(Action action, const nlohmann::json& params) {
    switch (action) {
        case Action::MOVE:
            return MoveParams{params.at("x").get<float>(), params.at("y").get<float>()};
        case Action::PASS:
            return PassParams{params.at("power").get<float>()};
        case Action::SHOOT:
            return ShootParams{params.at("power").get<float>()};
        case Action::TACKLE:
            return TackleParams{params.at("targetId").get<std::string>()};
        case Action::SPRINT:
            return SprintParams{};
        case Action::SKILL:
            return SkillParams{params.at("skillId").get<std::string>()};
    }
    throw ReplayFormatError("unhandled action tag");
}

std::vector<PlayerInput> streamFromJson(const nlohmann::json& stream) {
    if (!stream.is_array()) {
        throw ReplayFormatError("input stream is not an array");
    }

    std::vector<PlayerInput> inputs;
    inputs.reserve(stream.size());
    for (const auto& entry : stream) {
        inputs.push_back(inputFromJson(entry));
    }
    return inputs;
}

nlohmann::json streamToJson(const std::vector<PlayerInput>& inputs) {
    nlohmann::json stream = nlohmann::json::array();
    for (const auto& input : inputs) {
        stream.push_back(inputToJson(input));
    }
    return stream;
}

} // anonymous namespace

nlohmann::json inputToJson(const PlayerInput& input) {
    return nlohmann::json{
        {"playerId", input.playerId},
        {"tick", input.tick},
        {"timestamp", input.timestamp},
        {"action", actionToString(input.action())},
        {"params", paramsToJson(input.params)}
    };
}

PlayerInput inputFromJson(const nlohmann::json& json) {
    try {
        PlayerInput input;
        input.playerId = json.at("playerId").get<std::string>();
        input.tick = json.at("tick").get<uint32_t>();
        input.timestamp = json.at("timestamp").get<uint64_t>();

        const auto name = json.at("action").get<std::string>();
        const auto action = actionFromString(name);
        if (!action) {
            throw ReplayFormatError("unknown action '" + name + "'");
        }

        static const nlohmann::json noParams = nlohmann::json::object();
        auto params = json.find("params");
        input.params = paramsFromJson(*action, params != json.end() ? *params : noParams);
        return input;
    } catch (const nlohmann::json::exception& e) {
        throw ReplayFormatError(std::string("malformed input: ") + e.what());
    }
}

nlohmann::json matchResultToJson(const MatchResult& result) {
    return nlohmann::json{
        {"seed", result.seed},
        {"engineVersion", result.engineVersion},
        {"score", {{"home", result.score.home}, {"away", result.score.away}}},
        {"durationMs", result.durationMs},
        {"inputs", {{"home", streamToJson(result.homeInputs)},
                    {"away", streamToJson(result.awayInputs)}}},
        {"resultHash", result.resultHash}
    };
}

MatchResult matchResultFromJson(const nlohmann::json& json) {
    try {
        MatchResult result;
        result.seed = json.at("seed").get<uint64_t>();
        result.engineVersion = json.at("engineVersion").get<std::string>();
        result.score.home = json.at("score").at("home").get<uint32_t>();
        result.score.away = json.at("score").at("away").get<uint32_t>();
        result.durationMs = json.at("durationMs").get<uint32_t>();
        result.homeInputs = streamFromJson(json.at("inputs").at("home"));
        result.awayInputs = streamFromJson(json.at("inputs").at("away"));
        result.resultHash = json.value("resultHash", std::string{});
        return result;
    } catch (const nlohmann::json::exception& e) {
        throw ReplayFormatError(std::string("malformed replay: ") + e.what());
    }
}

std::string serializeMatchResult(const MatchResult& result) {
    return matchResultToJson(result).dump();
}

MatchResult parseMatchResult(std::string_view text) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw ReplayFormatError(std::string("replay is not valid JSON: ") + e.what());
    }
    return matchResultFromJson(json);
}

} // namespace Replay
} // namespace BassBall
