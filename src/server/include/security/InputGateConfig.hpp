#pragma once
#include "Constants.hpp"
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <string>
#include <vector>

// [SECURITY_AGENT] Tunable input admission parameters
// Fixed for the lifetime of a match

namespace BassBall {
namespace Security {

struct InputGateConfig {
    // ========================================================================
    // TIMING
    // ========================================================================

    // Accepted timestamps lie in [now - window, now]
    uint32_t timestampWindowMs = Constants::INPUT_TIMESTAMP_WINDOW_MS;

    // Highest tick a match can reach (30 minutes at 60 Hz)
    uint32_t maxTick = Constants::MAX_MATCH_TICKS;

    // ========================================================================
    // RATE LIMITING
    // ========================================================================

    // Trailing window for the rate check (milliseconds)
    uint32_t rateWindowMs = Constants::INPUT_RATE_WINDOW_MS;

    // Accepted inputs allowed inside one rate window
    uint32_t maxInputsPerWindow = Constants::MAX_INPUTS_PER_RATE_WINDOW;

    // ========================================================================
    // BOT HEURISTIC
    // ========================================================================

    // Inter-arrival gaps inspected, ending at the candidate input
    uint32_t botPatternGaps = Constants::BOT_PATTERN_MIN_GAPS;

    // Every gap within this distance of their mean reads as scripted
    uint32_t botPatternToleranceMs = Constants::BOT_PATTERN_TOLERANCE_MS;

    // ========================================================================
    // ESCALATION
    // ========================================================================

    // Rejections before the caller is told to act
    uint32_t escalationThreshold = Constants::SUSPICION_ESCALATION_THRESHOLD;

    [[nodiscard]] std::vector<std::string> validate() const;

    // Throws std::invalid_argument listing every problem
    void validateOrThrow() const;
};

// Overlays keys present in json onto base
[[nodiscard]] InputGateConfig inputGateConfigFromJson(const nlohmann::json& json,
                                                      const InputGateConfig& base = InputGateConfig{});

} // namespace Security
} // namespace BassBall
