#pragma once

#include "ecs/CoreTypes.hpp"
#include "game/InputTypes.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

// [SECURITY_AGENT] Post-match statistical plausibility scoring
// Stateless: works on one player's box score and input stream plus that
// player's earlier matches, independent of the physics

namespace BassBall {
namespace Security {

enum class IssueSeverity : uint8_t {
    LOW = 0,
    MEDIUM = 1,
    HIGH = 2,
    CRITICAL = 3
};

inline const char* issueSeverityToString(IssueSeverity severity) {
    switch (severity) {
        case IssueSeverity::LOW: return "LOW";
        case IssueSeverity::MEDIUM: return "MEDIUM";
        case IssueSeverity::HIGH: return "HIGH";
        case IssueSeverity::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

enum class MatchOutcome : uint8_t {
    WIN = 0,
    LOSS = 1,
    DRAW = 2
};

// [SECURITY_AGENT] One match from a single player's point of view
struct PlayerMatchRecord {
    std::string matchId;
    uint32_t durationMinutes{90};
    uint32_t homeScore{0};
    uint32_t awayScore{0};
    TeamSide playerTeam{TeamSide::HOME};
    uint32_t playerGoals{0};
    uint32_t playerAssists{0};

    // The player's accepted inputs, in submission order
    std::vector<PlayerInput> inputs;

    [[nodiscard]] uint32_t teamScore() const {
        return playerTeam == TeamSide::HOME ? homeScore : awayScore;
    }
    [[nodiscard]] uint32_t opponentScore() const {
        return playerTeam == TeamSide::HOME ? awayScore : homeScore;
    }
    [[nodiscard]] MatchOutcome outcome() const;
};

struct ValidationIssue {
    std::string type;
    IssueSeverity severity{IssueSeverity::LOW};
    std::string message;
    std::optional<double> threshold;
    std::optional<double> actual;
};

// True when the check family raised nothing that counts against it
// A family fails when it raised a critical/high finding. Comparison never
// raises issues, so it fails on any trend finding
struct ChecksSummary {
    bool reasonableness{true};
    bool consistency{true};
    bool anomaly{true};
    bool comparison{true};
    bool tickBased{true};
};

struct ValidationResult {
    bool isValid{true};          // No issues (warnings allowed)
    uint32_t score{100};         // 0-100
    std::vector<ValidationIssue> issues;    // Critical/high findings
    std::vector<ValidationIssue> warnings;  // Medium/low and comparison findings
    ChecksSummary checksSummary;
};

class MatchValidator {
public:
    // Inputs allowed per tick bucket
    static constexpr uint32_t TICK_BUCKET_SIZE = 12;
    static constexpr uint32_t MAX_INPUTS_PER_TICK_BUCKET = 5;

    // Prior matches the anomaly statistics are computed over
    static constexpr size_t ANOMALY_WINDOW = 10;

    // Prior matches required before trends are compared
    static constexpr size_t COMPARISON_MIN_HISTORY = 10;

    // [SECURITY_AGENT] Score one match. history holds the same player's
    // earlier matches, most recent first
    [[nodiscard]] static ValidationResult validateMatch(
        const PlayerMatchRecord& match,
        std::span<const PlayerMatchRecord> history = {});

    // Score < 70, any critical issue, or more than one high issue
    [[nodiscard]] static bool isSuspicious(const ValidationResult& result);

    [[nodiscard]] static uint32_t calculateScore(const std::vector<ValidationIssue>& issues,
                                                 const std::vector<ValidationIssue>& warnings);

    [[nodiscard]] static std::string generateReport(const ValidationResult& result);

    // ========================================================================
    // CHECK FAMILIES (each returns every finding, unrouted)
    // ========================================================================

    [[nodiscard]] static std::vector<ValidationIssue> checkTickRates(std::span<const PlayerInput> inputs);
    [[nodiscard]] static std::vector<ValidationIssue> checkTickMonotonicity(std::span<const PlayerInput> inputs);
    [[nodiscard]] static std::vector<ValidationIssue> checkTimestampOrdering(std::span<const PlayerInput> inputs);

    [[nodiscard]] static std::vector<ValidationIssue> checkReasonableness(const PlayerMatchRecord& match);
    [[nodiscard]] static std::vector<ValidationIssue> checkConsistency(const PlayerMatchRecord& match);

    [[nodiscard]] static std::vector<ValidationIssue> checkAnomalies(
        const PlayerMatchRecord& match, std::span<const PlayerMatchRecord> history);

    [[nodiscard]] static std::vector<ValidationIssue> checkComparison(
        const PlayerMatchRecord& match, std::span<const PlayerMatchRecord> history);
};

} // namespace Security
} // namespace BassBall
