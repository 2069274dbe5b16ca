// [SECURITY_AGENT] Match plausibility checks and scoring

#include "security/MatchValidator.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>

namespace BassBall {
namespace Security {

namespace {

bool isIssueSeverity(IssueSeverity severity) {
    return severity == IssueSeverity::CRITICAL || severity == IssueSeverity::HIGH;
}

bool hasIssueSeverity(const std::vector<ValidationIssue>& findings) {
    return std::any_of(findings.begin(), findings.end(), [](const ValidationIssue& finding) {
        return isIssueSeverity(finding.severity);
    });
}

// Critical/high become issues, everything else a warning
void route(std::vector<ValidationIssue>&& findings, ValidationResult& result) {
    for (auto& finding : findings) {
        if (isIssueSeverity(finding.severity)) {
            result.issues.push_back(std::move(finding));
        } else {
            result.warnings.push_back(std::move(finding));
        }
    }
}

ValidationIssue makeIssue(std::string type, IssueSeverity severity, std::string message,
                          std::optional<double> threshold = std::nullopt,
                          std::optional<double> actual = std::nullopt) {
    return ValidationIssue{std::move(type), severity, std::move(message), threshold, actual};
}

std::string formatFixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

struct Moments {
    double mean{0.0};
    double stdDev{0.0};
};

template<typename Getter>
Moments moments(std::span<const PlayerMatchRecord> matches, Getter get) {
    Moments result;
    if (matches.empty()) {
        return result;
    }

    for (const auto& match : matches) {
        result.mean += get(match);
    }
    result.mean /= static_cast<double>(matches.size());

    double variance = 0.0;
    for (const auto& match : matches) {
        const double delta = get(match) - result.mean;
        variance += delta * delta;
    }
    variance /= static_cast<double>(matches.size());
    result.stdDev = std::sqrt(variance);
    return result;
}

// Sigma below this would turn one-goal differences into huge z-scores
constexpr double MIN_STD_DEV = 0.1;

void checkZScore(std::vector<ValidationIssue>& findings, const char* type, const char* noun,
                 double value, const Moments& stats) {
    const double z = (value - stats.mean) / std::max(stats.stdDev, MIN_STD_DEV);
    if (std::abs(z) <= 3.0) {
        return;
    }

    findings.push_back(makeIssue(
        type,
        std::abs(z) > 4.0 ? IssueSeverity::HIGH : IssueSeverity::MEDIUM,
        "Current match (" + formatFixed(value, 0) + " " + noun + ") is " +
            formatFixed(std::abs(z), 1) + " standard deviations from player average (" +
            formatFixed(stats.mean, 1) + ")",
        std::round(stats.mean + 3.0 * stats.stdDev),
        value));
}

} // anonymous namespace

MatchOutcome PlayerMatchRecord::outcome() const {
    if (teamScore() > opponentScore()) return MatchOutcome::WIN;
    if (teamScore() < opponentScore()) return MatchOutcome::LOSS;
    return MatchOutcome::DRAW;
}

// ============================================================================
// ENTRY POINTS
// ============================================================================

ValidationResult MatchValidator::validateMatch(const PlayerMatchRecord& match,
                                               std::span<const PlayerMatchRecord> history) {
    ValidationResult result;
    const std::span<const PlayerInput> inputs(match.inputs);

    // Input stream shape
    auto tickRates = checkTickRates(inputs);
    auto monotonic = checkTickMonotonicity(inputs);
    auto timestamps = checkTimestampOrdering(inputs);
    result.checksSummary.tickBased = !hasIssueSeverity(tickRates) &&
                                     !hasIssueSeverity(monotonic) &&
                                     !hasIssueSeverity(timestamps);
    route(std::move(tickRates), result);
    route(std::move(monotonic), result);
    route(std::move(timestamps), result);

    auto reasonableness = checkReasonableness(match);
    result.checksSummary.reasonableness = !hasIssueSeverity(reasonableness);
    route(std::move(reasonableness), result);

    auto consistency = checkConsistency(match);
    result.checksSummary.consistency = !hasIssueSeverity(consistency);
    route(std::move(consistency), result);

    if (!history.empty()) {
        auto anomalies = checkAnomalies(match, history);
        result.checksSummary.anomaly = !hasIssueSeverity(anomalies);
        route(std::move(anomalies), result);
    }

    // Trends are advisory only; any trend clears the comparison flag
    if (history.size() >= COMPARISON_MIN_HISTORY) {
        auto comparison = checkComparison(match, history);
        result.checksSummary.comparison = comparison.empty();
        for (auto& finding : comparison) {
            result.warnings.push_back(std::move(finding));
        }
    }

    result.score = calculateScore(result.issues, result.warnings);
    result.isValid = result.issues.empty();
    return result;
}

bool MatchValidator::isSuspicious(const ValidationResult& result) {
    const auto critical = std::count_if(result.issues.begin(), result.issues.end(),
        [](const ValidationIssue& issue) { return issue.severity == IssueSeverity::CRITICAL; });
    const auto high = std::count_if(result.issues.begin(), result.issues.end(),
        [](const ValidationIssue& issue) { return issue.severity == IssueSeverity::HIGH; });

    return result.score < 70 || critical > 0 || high > 1;
}

uint32_t MatchValidator::calculateScore(const std::vector<ValidationIssue>& issues,
                                        const std::vector<ValidationIssue>& warnings) {
    int32_t score = 100;

    for (const auto& issue : issues) {
        switch (issue.severity) {
            case IssueSeverity::CRITICAL: score -= 25; break;
            case IssueSeverity::HIGH: score -= 15; break;
            case IssueSeverity::MEDIUM: score -= 8; break;
            case IssueSeverity::LOW: score -= 3; break;
        }
    }

    // Critical warnings cannot occur; they would count as high
    for (const auto& warning : warnings) {
        switch (warning.severity) {
            case IssueSeverity::CRITICAL:
            case IssueSeverity::HIGH: score -= 5; break;
            case IssueSeverity::MEDIUM: score -= 3; break;
            case IssueSeverity::LOW: score -= 1; break;
        }
    }

    return static_cast<uint32_t>(std::max(0, score));
}

// ============================================================================
// INPUT STREAM CHECKS
// ============================================================================

std::vector<ValidationIssue> MatchValidator::checkTickRates(std::span<const PlayerInput> inputs) {
    std::map<uint32_t, uint32_t> buckets;
    for (const auto& input : inputs) {
        buckets[input.tick / TICK_BUCKET_SIZE]++;
    }

    std::vector<ValidationIssue> findings;
    for (const auto& [bucket, count] : buckets) {
        if (count > MAX_INPUTS_PER_TICK_BUCKET) {
            findings.push_back(makeIssue(
                "tick_rate_limit_violated", IssueSeverity::HIGH,
                "Tick bucket " + std::to_string(bucket) + ": " + std::to_string(count) +
                    " inputs (max " + std::to_string(MAX_INPUTS_PER_TICK_BUCKET) + ")",
                MAX_INPUTS_PER_TICK_BUCKET, count));
        }
    }
    return findings;
}

std::vector<ValidationIssue> MatchValidator::checkTickMonotonicity(std::span<const PlayerInput> inputs) {
    std::vector<ValidationIssue> findings;
    for (size_t i = 1; i < inputs.size(); ++i) {
        if (inputs[i].tick <= inputs[i - 1].tick) {
            findings.push_back(makeIssue(
                "tick_not_monotonic", IssueSeverity::CRITICAL,
                "Tick " + std::to_string(inputs[i].tick) + " is not greater than previous tick " +
                    std::to_string(inputs[i - 1].tick)));
        }
    }
    return findings;
}

std::vector<ValidationIssue> MatchValidator::checkTimestampOrdering(std::span<const PlayerInput> inputs) {
    std::vector<ValidationIssue> findings;
    for (size_t i = 1; i < inputs.size(); ++i) {
        if (inputs[i].timestamp <= inputs[i - 1].timestamp) {
            findings.push_back(makeIssue(
                "timestamp_not_monotonic", IssueSeverity::HIGH,
                "Timestamp " + std::to_string(inputs[i].timestamp) +
                    " is not greater than previous " + std::to_string(inputs[i - 1].timestamp)));
        }
    }
    return findings;
}

// ============================================================================
// BOX SCORE CHECKS
// ============================================================================

std::vector<ValidationIssue> MatchValidator::checkReasonableness(const PlayerMatchRecord& match) {
    std::vector<ValidationIssue> findings;
    const uint32_t duration = match.durationMinutes;

    if (duration < 45 || duration > 120) {
        findings.push_back(makeIssue(
            "unrealistic_duration",
            duration < 30 || duration > 150 ? IssueSeverity::HIGH : IssueSeverity::LOW,
            "Match duration " + std::to_string(duration) + "' is unusual. Typical: 45-120 minutes",
            90.0, duration));
    }

    // About three goals per started 45 minutes
    const uint32_t maxGoals = ((duration + 44) / 45) * 3;
    const uint32_t totalGoals = match.homeScore + match.awayScore;
    if (totalGoals > maxGoals) {
        findings.push_back(makeIssue(
            "excessive_goals",
            totalGoals > maxGoals * 2 ? IssueSeverity::HIGH : IssueSeverity::MEDIUM,
            "Total goals " + std::to_string(totalGoals) + " seems high for a " +
                std::to_string(duration) + "' match",
            maxGoals, totalGoals));
    }

    if (match.playerGoals > match.teamScore()) {
        findings.push_back(makeIssue(
            "impossible_contribution", IssueSeverity::CRITICAL,
            "Player goals (" + std::to_string(match.playerGoals) + ") exceed team score (" +
                std::to_string(match.teamScore()) + ")",
            match.teamScore(), match.playerGoals));
    }

    if (match.playerAssists > 10) {
        findings.push_back(makeIssue(
            "excessive_assists",
            match.playerAssists > 15 ? IssueSeverity::HIGH : IssueSeverity::MEDIUM,
            std::to_string(match.playerAssists) + " assists seems unrealistic for a " +
                std::to_string(duration) + "' match",
            10.0, match.playerAssists));
    }

    if (match.playerGoals == 0 && match.playerAssists > 5) {
        findings.push_back(makeIssue(
            "unlikely_assists_no_goals", IssueSeverity::MEDIUM,
            std::to_string(match.playerAssists) + " assists with 0 goals is statistically unlikely",
            5.0, match.playerAssists));
    }

    return findings;
}

std::vector<ValidationIssue> MatchValidator::checkConsistency(const PlayerMatchRecord& match) {
    std::vector<ValidationIssue> findings;
    const double minutes = std::max<uint32_t>(match.durationMinutes, 1);

    const double homePace = match.homeScore / minutes;
    const double awayPace = match.awayScore / minutes;
    if (homePace > 0.5) {
        findings.push_back(makeIssue(
            "unrealistic_scoring_pace", IssueSeverity::HIGH,
            "Home team scoring pace (" + formatFixed(homePace, 2) + "/min) is unrealistic",
            0.5, homePace));
    }
    if (awayPace > 0.5) {
        findings.push_back(makeIssue(
            "unrealistic_scoring_pace", IssueSeverity::HIGH,
            "Away team scoring pace (" + formatFixed(awayPace, 2) + "/min) is unrealistic",
            0.5, awayPace));
    }

    const uint32_t teamScore = match.teamScore();
    if (teamScore == 0) {
        return findings;
    }

    const uint32_t contribution = match.playerGoals + match.playerAssists;
    const double ratio = static_cast<double>(contribution) / teamScore;
    if (ratio > 0.9) {
        findings.push_back(makeIssue(
            "excessive_player_contribution", IssueSeverity::MEDIUM,
            "Player contributed " + formatFixed(ratio * 100.0, 0) + "% of team's goals",
            90.0, std::round(ratio * 100.0)));
    }

    if (contribution == 0 && match.outcome() == MatchOutcome::WIN &&
        teamScore - match.opponentScore() > 2) {
        findings.push_back(makeIssue(
            "unlikely_no_contribution", IssueSeverity::LOW,
            "No goals or assists in a " + std::to_string(teamScore) + "-" +
                std::to_string(match.opponentScore()) + " win is unlikely but possible"));
    }

    return findings;
}

// ============================================================================
// HISTORY CHECKS
// ============================================================================

std::vector<ValidationIssue> MatchValidator::checkAnomalies(const PlayerMatchRecord& match,
                                                            std::span<const PlayerMatchRecord> history) {
    std::vector<ValidationIssue> findings;
    if (history.empty()) {
        return findings;
    }

    const auto recent = history.first(std::min(history.size(), ANOMALY_WINDOW));

    const Moments goals = moments(recent, [](const PlayerMatchRecord& m) {
        return static_cast<double>(m.playerGoals);
    });
    const Moments assists = moments(recent, [](const PlayerMatchRecord& m) {
        return static_cast<double>(m.playerAssists);
    });
    const Moments duration = moments(recent, [](const PlayerMatchRecord& m) {
        return static_cast<double>(m.durationMinutes);
    });

    checkZScore(findings, "anomalous_goal_performance", "goals", match.playerGoals, goals);
    checkZScore(findings, "anomalous_assist_performance", "assists", match.playerAssists, assists);

    const double durationDelta = std::abs(static_cast<double>(match.durationMinutes) - duration.mean);
    if (durationDelta > duration.mean * 0.5) {
        findings.push_back(makeIssue(
            "anomalous_duration", IssueSeverity::LOW,
            "Match duration " + std::to_string(match.durationMinutes) +
                "' differs significantly from average " + formatFixed(duration.mean, 0) + "'",
            duration.mean, match.durationMinutes));
    }

    return findings;
}

std::vector<ValidationIssue> MatchValidator::checkComparison(const PlayerMatchRecord& match,
                                                             std::span<const PlayerMatchRecord> history) {
    std::vector<ValidationIssue> findings;
    if (history.size() < COMPARISON_MIN_HISTORY) {
        return findings;
    }

    // Recent five is this match plus the four before it
    std::vector<const PlayerMatchRecord*> all;
    all.reserve(10);
    all.push_back(&match);
    for (size_t i = 0; i < 9; ++i) {
        all.push_back(&history[i]);
    }

    double recentGoals = 0.0;
    double earlierGoals = 0.0;
    uint32_t recentWins = 0;
    uint32_t earlierWins = 0;
    for (size_t i = 0; i < all.size(); ++i) {
        const bool isRecent = i < 5;
        (isRecent ? recentGoals : earlierGoals) += all[i]->playerGoals;
        if (all[i]->outcome() == MatchOutcome::WIN) {
            (isRecent ? recentWins : earlierWins)++;
        }
    }
    recentGoals /= 5.0;
    earlierGoals /= 5.0;

    const double improvement = recentGoals - earlierGoals;
    if (improvement > 3.0) {
        findings.push_back(makeIssue(
            "sudden_performance_spike", IssueSeverity::MEDIUM,
            "Recent performance (" + formatFixed(recentGoals, 1) + " goals avg) up " +
                formatFixed(improvement, 1) + " from earlier (" + formatFixed(earlierGoals, 1) + ")",
            3.0, improvement));
    }

    if (recentWins >= 4 && earlierWins <= 2) {
        findings.push_back(makeIssue(
            "unusual_win_streak", IssueSeverity::LOW,
            "Recent wins (" + std::to_string(recentWins) + "/5) contrast with earlier (" +
                std::to_string(earlierWins) + "/5)"));
    }

    return findings;
}

// ============================================================================
// REPORTING
// ============================================================================

std::string MatchValidator::generateReport(const ValidationResult& result) {
    std::ostringstream oss;

    oss << "VALIDATION REPORT\n";
    oss << "=================\n";
    oss << "Score: " << result.score << "/100\n";
    oss << "Status: " << (result.isValid ? "VALID" : "INVALID") << "\n";
    oss << "Suspicious: " << (isSuspicious(result) ? "YES" : "NO") << "\n\n";

    if (!result.issues.empty()) {
        oss << "ISSUES (" << result.issues.size() << "):\n";
        for (const auto& issue : result.issues) {
            oss << "  [" << issueSeverityToString(issue.severity) << "] " << issue.type << "\n";
            oss << "  " << issue.message << "\n";
            if (issue.threshold && issue.actual) {
                oss << "  Expected <= " << *issue.threshold << ", got " << *issue.actual << "\n";
            }
            oss << "\n";
        }
    }

    if (!result.warnings.empty()) {
        oss << "WARNINGS (" << result.warnings.size() << "):\n";
        for (const auto& warning : result.warnings) {
            oss << "  [" << issueSeverityToString(warning.severity) << "] " << warning.type << "\n";
            oss << "  " << warning.message << "\n\n";
        }
    }

    const auto mark = [](bool passed) { return passed ? "PASS" : "FAIL"; };
    oss << "CHECKS SUMMARY:\n";
    oss << "  Reasonableness: " << mark(result.checksSummary.reasonableness) << "\n";
    oss << "  Consistency: " << mark(result.checksSummary.consistency) << "\n";
    oss << "  Anomaly Detection: " << mark(result.checksSummary.anomaly) << "\n";
    oss << "  Comparative Analysis: " << mark(result.checksSummary.comparison) << "\n";
    oss << "  Input Stream: " << mark(result.checksSummary.tickBased) << "\n";

    return oss.str();
}

} // namespace Security
} // namespace BassBall
