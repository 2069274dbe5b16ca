#include "game/InputTypes.hpp"
#include <cmath>
#include <type_traits>

namespace BassBall {

namespace {

bool inRange(float value, float min, float max) {
    return std::isfinite(value) && value >= min && value <= max;
}

bool validPower(float power) {
    return inRange(power, Constants::POWER_MIN, Constants::POWER_MAX);
}

} // anonymous namespace

std::optional<Action> actionFromString(std::string_view name) {
    if (name == "MOVE") return Action::MOVE;
    if (name == "PASS") return Action::PASS;
    if (name == "SHOOT") return Action::SHOOT;
    if (name == "TACKLE") return Action::TACKLE;
    if (name == "SPRINT") return Action::SPRINT;
    if (name == "SKILL") return Action::SKILL;
    return std::nullopt;
}

bool validateActionParams(const ActionParams& params) {
    return std::visit([](const auto& p) -> bool {
        using T = std::decay_t<decltype(p)>;

        if constexpr (std::is_same_v<T, MoveParams>) {
            return inRange(p.x, Constants::MOVE_AXIS_MIN, Constants::MOVE_AXIS_MAX) &&
                   inRange(p.y, Constants::MOVE_AXIS_MIN, Constants::MOVE_AXIS_MAX);
        } else if constexpr (std::is_same_v<T, PassParams> || std::is_same_v<T, ShootParams>) {
            return validPower(p.power);
        } else if constexpr (std::is_same_v<T, TackleParams>) {
            return !p.targetId.empty();
        } else if constexpr (std::is_same_v<T, SprintParams>) {
            return true;
        } else {
            static_assert(std::is_same_v<T, SkillParams>, "unhandled action parameters");
            return !p.skillId.empty();
        }
    }, params);
}

} // namespace BassBall
