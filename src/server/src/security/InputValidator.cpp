// [SECURITY_AGENT] Input admission gate
// Checks run cheapest first; the first failing check names the rejection

#include "security/InputValidator.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>

namespace BassBall {
namespace Security {

InputValidator::InputValidator(const InputGateConfig& config)
    : config_(config) {
    config_.validateOrThrow();
    historyCapacity_ = std::max<size_t>(config_.maxInputsPerWindow, config_.botPatternGaps);
}

// ============================================================================
// LIFECYCLE
// ============================================================================

PlayerHandle InputValidator::join(const PlayerId& playerId) {
    auto it = handles_.find(playerId);
    if (it != handles_.end()) {
        return it->second;
    }

    const PlayerHandle handle = arena_.create();
    arena_.emplace<GateState>(handle, GateState{playerId});
    handles_.emplace(playerId, handle);
    return handle;
}

bool InputValidator::leave(const PlayerId& playerId) {
    auto it = handles_.find(playerId);
    if (it == handles_.end()) {
        return false;
    }

    arena_.destroy(it->second);
    handles_.erase(it);
    return true;
}

void InputValidator::endMatch() {
    arena_.clear();
    handles_.clear();
}

std::optional<PlayerHandle> InputValidator::handleOf(const PlayerId& playerId) const {
    auto it = handles_.find(playerId);
    if (it == handles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// ADMISSION
// ============================================================================

AdmissionResult InputValidator::admit(const PlayerInput& input, uint64_t nowMs) {
    auto it = handles_.find(input.playerId);
    if (it == handles_.end()) {
        ++totalRejected_;
        return AdmissionResult{false, RejectReason::UNKNOWN_PLAYER, 0, false};
    }
    return admit(it->second, input, nowMs);
}

AdmissionResult InputValidator::admit(PlayerHandle handle, const PlayerInput& input, uint64_t nowMs) {
    GateState* state = arena_.valid(handle) ? arena_.try_get<GateState>(handle) : nullptr;
    if (!state) {
        ++totalRejected_;
        return AdmissionResult{false, RejectReason::UNKNOWN_PLAYER, 0, false};
    }

    AdmissionResult result;
    result.reason = check(*state, input, nowMs);

    if (result.reason == RejectReason::NONE) {
        result.accepted = true;
        state->lastAcceptedTick = input.tick;
        state->acceptanceTimes.push_back(nowMs);
        while (state->acceptanceTimes.size() > historyCapacity_) {
            state->acceptanceTimes.pop_front();
        }
        result.suspicion = state->suspicion;
        ++totalAccepted_;
        return result;
    }

    ++totalRejected_;
    state->suspicion++;
    result.suspicion = state->suspicion;

    if (!state->escalated && state->suspicion >= config_.escalationThreshold) {
        state->escalated = true;
        result.escalated = true;

        std::cerr << "[INPUT_GATE] Player " << state->playerId << " escalated after "
                  << state->suspicion << " rejections (last: "
                  << rejectReasonToString(result.reason) << ")\n";

        if (onEscalation_) {
            onEscalation_(state->playerId, state->suspicion, result.reason);
        }
    }

    return result;
}

RejectReason InputValidator::check(const GateState& state, const PlayerInput& input,
                                   uint64_t nowMs) const {
    if (input.timestamp > nowMs) {
        return RejectReason::FUTURE_TIMESTAMP;
    }
    if (input.timestamp + config_.timestampWindowMs < nowMs) {
        return RejectReason::STALE_TIMESTAMP;
    }

    if (state.lastAcceptedTick && input.tick <= *state.lastAcceptedTick) {
        return RejectReason::TICK_NOT_INCREASING;
    }
    if (input.tick > config_.maxTick) {
        return RejectReason::TICK_OUT_OF_RANGE;
    }

    if (!validateActionParams(input.params)) {
        return RejectReason::INVALID_PARAMETERS;
    }

    if (exceedsRate(state, nowMs)) {
        return RejectReason::RATE_LIMITED;
    }

    if (looksScripted(state, nowMs)) {
        return RejectReason::BOT_PATTERN;
    }

    return RejectReason::NONE;
}

bool InputValidator::exceedsRate(const GateState& state, uint64_t nowMs) const {
    const auto& times = state.acceptanceTimes;
    if (times.size() < config_.maxInputsPerWindow) {
        return false;
    }

    // Oldest of the last maxInputsPerWindow acceptances still inside the window
    const uint64_t oldest = times[times.size() - config_.maxInputsPerWindow];
    return oldest + config_.rateWindowMs > nowMs;
}

bool InputValidator::looksScripted(const GateState& state, uint64_t nowMs) const {
    const auto& times = state.acceptanceTimes;
    const size_t gapCount = config_.botPatternGaps;
    if (times.size() < gapCount) {
        return false;
    }

    // Gaps between the last gapCount acceptances and the candidate
    std::vector<double> gaps;
    gaps.reserve(gapCount);
    uint64_t previous = times[times.size() - gapCount];
    for (size_t i = times.size() - gapCount + 1; i < times.size(); ++i) {
        gaps.push_back(static_cast<double>(times[i]) - static_cast<double>(previous));
        previous = times[i];
    }
    gaps.push_back(static_cast<double>(nowMs) - static_cast<double>(previous));

    double mean = 0.0;
    for (double gap : gaps) {
        mean += gap;
    }
    mean /= static_cast<double>(gaps.size());

    const double tolerance = static_cast<double>(config_.botPatternToleranceMs);
    return std::all_of(gaps.begin(), gaps.end(), [&](double gap) {
        return std::abs(gap - mean) <= tolerance;
    });
}

// ============================================================================
// QUERIES
// ============================================================================

const InputValidator::GateState* InputValidator::find(const PlayerId& playerId) const {
    auto it = handles_.find(playerId);
    if (it == handles_.end()) {
        return nullptr;
    }
    return arena_.try_get<GateState>(it->second);
}

uint32_t InputValidator::getSuspicion(const PlayerId& playerId) const {
    const GateState* state = find(playerId);
    return state ? state->suspicion : 0;
}

std::optional<uint32_t> InputValidator::getLastAcceptedTick(const PlayerId& playerId) const {
    const GateState* state = find(playerId);
    return state ? state->lastAcceptedTick : std::nullopt;
}

bool InputValidator::isEscalated(const PlayerId& playerId) const {
    const GateState* state = find(playerId);
    return state && state->escalated;
}

} // namespace Security
} // namespace BassBall
