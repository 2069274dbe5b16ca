// [REPLAY_AGENT] Replay verification pipeline

#include "replay/ReplayVerifier.hpp"
#include "replay/ResultHasher.hpp"
#include <algorithm>
#include <chrono>
#include <cctype>
#include <cmath>
#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace BassBall {
namespace Replay {

namespace {

std::string normalizeHash(std::string hash) {
    std::transform(hash.begin(), hash.end(), hash.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (hash.rfind("0x", 0) != 0) {
        hash.insert(0, "0x");
    }
    return hash;
}

// A team stream interleaves teammates in acceptance order; ordering is
// only required within each player's own inputs
void checkStreamIntegrity(const char* side, const std::vector<PlayerInput>& inputs,
                          const VerifierConfig& config, std::vector<std::string>& findings) {
    std::map<PlayerId, const PlayerInput*> previous;

    for (size_t i = 0; i < inputs.size(); ++i) {
        const PlayerInput& input = inputs[i];
        const std::string where = std::string(side) + "[" + std::to_string(i) + "]";

        auto last = previous.find(input.playerId);
        if (last != previous.end()) {
            if (input.timestamp <= last->second->timestamp) {
                findings.push_back(where + ": " + input.playerId + " timestamp " +
                                   std::to_string(input.timestamp) + " not after " +
                                   std::to_string(last->second->timestamp));
            }
            if (input.tick <= last->second->tick) {
                findings.push_back(where + ": " + input.playerId + " tick " +
                                   std::to_string(input.tick) + " not after " +
                                   std::to_string(last->second->tick));
            }
        }
        previous[input.playerId] = &input;

        if (input.tick > config.maxTick) {
            findings.push_back(where + ": tick " + std::to_string(input.tick) +
                               " outside [0, " + std::to_string(config.maxTick) + "]");
        }
        if (!validateActionParams(input.params)) {
            findings.push_back(where + ": " + actionToString(input.action()) +
                               " parameters out of range");
        }
    }
}

// Standard deviation of inter-input gaps against their mean
bool isBursty(const std::vector<uint64_t>& timestamps, float factor) {
    if (timestamps.size() < 3) {
        return false;
    }

    std::vector<double> gaps;
    gaps.reserve(timestamps.size() - 1);
    for (size_t i = 1; i < timestamps.size(); ++i) {
        gaps.push_back(static_cast<double>(timestamps[i]) -
                       static_cast<double>(timestamps[i - 1]));
    }

    double mean = 0.0;
    for (double gap : gaps) {
        mean += gap;
    }
    mean /= static_cast<double>(gaps.size());

    double variance = 0.0;
    for (double gap : gaps) {
        variance += (gap - mean) * (gap - mean);
    }
    variance /= static_cast<double>(gaps.size());

    return std::sqrt(variance) > mean * factor;
}

// Players in one stream whose own input timing is bursty
void checkBurstiness(const char* side, const std::vector<PlayerInput>& inputs,
                     float factor, std::vector<std::string>& findings) {
    std::map<PlayerId, std::vector<uint64_t>> byPlayer;
    for (const auto& input : inputs) {
        byPlayer[input.playerId].push_back(input.timestamp);
    }

    for (const auto& [playerId, timestamps] : byPlayer) {
        if (isBursty(timestamps, factor)) {
            findings.push_back(std::string(side) + " player " + playerId + " input timing is bursty");
        }
    }
}

} // anonymous namespace

// ============================================================================
// CONFIG
// ============================================================================

std::vector<std::string> VerifierConfig::validate() const {
    std::vector<std::string> problems;

    if (maxTick == 0) problems.push_back("maxTick must be > 0");
    if (!std::isfinite(minInputsPerSecond) || minInputsPerSecond < 0.0f) {
        problems.push_back("minInputsPerSecond must be finite and >= 0");
    }
    if (minDurationMs > maxDurationMs) {
        problems.push_back("minDurationMs must be <= maxDurationMs");
    }
    if (!std::isfinite(burstinessFactor) || burstinessFactor <= 0.0f) {
        problems.push_back("burstinessFactor must be finite and > 0");
    }
    if (fetchMaxAttempts == 0) problems.push_back("fetchMaxAttempts must be >= 1");

    return problems;
}

void VerifierConfig::validateOrThrow() const {
    const auto problems = validate();
    if (problems.empty()) {
        return;
    }

    std::ostringstream message;
    message << "Invalid verifier config:";
    for (const auto& problem : problems) {
        message << " " << problem << ";";
    }
    throw std::invalid_argument(message.str());
}

// ============================================================================
// VERIFIER
// ============================================================================

ReplayVerifier::ReplayVerifier(std::shared_ptr<ReplayStore> store, const VerifierConfig& config)
    : store_(std::move(store))
    , config_(config) {
    if (!store_) {
        throw std::invalid_argument("ReplayVerifier requires a store");
    }
    config_.validateOrThrow();
}

template<typename Fetch>
auto ReplayVerifier::fetchWithRetry(const char* what, const std::string& matchId,
                                    VerificationDetails& details, Fetch fetch) -> decltype(fetch()) {
    uint32_t backoffMs = config_.initialBackoffMs;

    for (uint32_t attempt = 1; ; ++attempt) {
        details.storeAttempts++;
        try {
            return fetch();
        } catch (const StoreError& e) {
            if (attempt >= config_.fetchMaxAttempts) {
                throw;
            }
            std::cerr << "[REPLAY] " << what << " fetch for " << matchId << " failed (attempt "
                      << attempt << "/" << config_.fetchMaxAttempts << "): " << e.what()
                      << "; retrying in " << backoffMs << "ms" << std::endl;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(backoffMs));
        backoffMs *= 2;
    }
}

VerificationResult ReplayVerifier::verify(const std::string& matchId) {
    VerificationResult result;
    result.matchId = matchId;

    try {
        // Gate 1: replay
        auto replay = fetchWithRetry("replay", matchId, result.details, [&] {
            return store_->fetchReplay(matchId);
        });
        if (!replay) {
            result.mismatch = MismatchType::MISSING_REPLAY;
            std::cerr << "[REPLAY] " << matchId << ": no replay recorded" << std::endl;
            return result;
        }

        result.details.inputCount = replay->totalInputs();
        result.details.durationMs = replay->durationMs;
        result.details.score = replay->score;
        result.details.declaredHash = replay->resultHash;

        // Gate 2: local hash
        result.computedHash = ResultHasher::computeHash(*replay);

        // Gate 3: authoritative hash
        auto authoritative = fetchWithRetry("hash", matchId, result.details, [&] {
            return store_->fetchAuthoritativeHash(matchId);
        });
        if (!authoritative) {
            result.mismatch = MismatchType::VERIFICATION_ERROR;
            result.details.error = "no authoritative hash published";
            std::cerr << "[REPLAY] " << matchId << ": no authoritative hash" << std::endl;
            return result;
        }
        result.authoritativeHash = normalizeHash(*authoritative);

        // Gate 4: equality
        if (result.computedHash != result.authoritativeHash) {
            result.mismatch = MismatchType::HASH_MISMATCH;
            std::cerr << "[REPLAY] " << matchId << ": hash mismatch (computed "
                      << result.computedHash << ", authoritative "
                      << result.authoritativeHash << ")" << std::endl;
            return result;
        }

        // Gate 5: integrity
        result.details.findings = checkInputIntegrity(*replay, config_);
        if (!result.details.findings.empty()) {
            result.mismatch = MismatchType::INVALID_INPUTS;
            std::cerr << "[REPLAY] " << matchId << ": " << result.details.findings.size()
                      << " malformed inputs" << std::endl;
            return result;
        }

        // Gate 6: fraud
        result.details.findings = checkFraud(*replay, config_);
        if (!result.details.findings.empty()) {
            result.mismatch = MismatchType::FRAUD_DETECTED;
            std::cerr << "[REPLAY] " << matchId << ": fraud heuristics triggered ("
                      << result.details.findings.front() << ")" << std::endl;
            return result;
        }

        result.valid = true;
        std::cout << "[REPLAY] " << matchId << " verified " << result.computedHash << std::endl;
    } catch (const std::exception& e) {
        result.valid = false;
        result.mismatch = MismatchType::VERIFICATION_ERROR;
        result.details.error = e.what();
        std::cerr << "[REPLAY] " << matchId << ": verification error: " << e.what() << std::endl;
    }

    return result;
}

std::future<VerificationResult> ReplayVerifier::verifyAsync(std::string matchId) {
    // The worker owns its own verifier; the store outlives this one through the shared_ptr
    return std::async(std::launch::async, [worker = ReplayVerifier(store_, config_),
                                           id = std::move(matchId)]() mutable {
        return worker.verify(id);
    });
}

std::vector<std::string> ReplayVerifier::checkInputIntegrity(const MatchResult& result,
                                                             const VerifierConfig& config) {
    std::vector<std::string> findings;
    checkStreamIntegrity("home", result.homeInputs, config, findings);
    checkStreamIntegrity("away", result.awayInputs, config, findings);
    return findings;
}

std::vector<std::string> ReplayVerifier::checkFraud(const MatchResult& result,
                                                    const VerifierConfig& config) {
    std::vector<std::string> findings;

    if (result.score.home > config.maxGoalsPerTeam || result.score.away > config.maxGoalsPerTeam) {
        findings.push_back("implausible score " + std::to_string(result.score.home) + "-" +
                           std::to_string(result.score.away) + " (max " +
                           std::to_string(config.maxGoalsPerTeam) + " per team)");
    }

    const double expectedMinimum = result.durationSeconds() * config.minInputsPerSecond;
    if (static_cast<double>(result.totalInputs()) < expectedMinimum) {
        findings.push_back(std::to_string(result.totalInputs()) + " inputs for " +
                           std::to_string(result.durationMs) + "ms (expected at least " +
                           std::to_string(static_cast<uint64_t>(std::ceil(expectedMinimum))) + ")");
    }

    // One player cannot act twice in the same millisecond, whichever stream
    std::map<PlayerId, std::set<uint64_t>> seen;
    size_t duplicates = 0;
    for (const auto* stream : {&result.homeInputs, &result.awayInputs}) {
        for (const auto& input : *stream) {
            if (!seen[input.playerId].insert(input.timestamp).second) {
                duplicates++;
            }
        }
    }
    if (duplicates > 0) {
        findings.push_back(std::to_string(duplicates) + " duplicate input timestamps");
    }

    if (result.durationMs < config.minDurationMs || result.durationMs > config.maxDurationMs) {
        findings.push_back("duration " + std::to_string(result.durationMs) + "ms outside [" +
                           std::to_string(config.minDurationMs) + ", " +
                           std::to_string(config.maxDurationMs) + "]");
    }

    checkBurstiness("home", result.homeInputs, config.burstinessFactor, findings);
    checkBurstiness("away", result.awayInputs, config.burstinessFactor, findings);

    return findings;
}

std::string ReplayVerifier::generateReport(const VerificationResult& result) {
    std::ostringstream oss;

    oss << "REPLAY VERIFICATION REPORT\n";
    oss << "==========================\n";
    oss << "Match: " << result.matchId << "\n";
    oss << "Status: " << (result.valid ? "VERIFIED" : "FAILED") << "\n";
    oss << "Mismatch: " << mismatchTypeToString(result.mismatch) << "\n";
    oss << "Computed hash: " << (result.computedHash.empty() ? "-" : result.computedHash) << "\n";
    oss << "Authoritative hash: "
        << (result.authoritativeHash.empty() ? "-" : result.authoritativeHash) << "\n";
    oss << "Inputs: " << result.details.inputCount << "\n";
    oss << "Duration: " << result.details.durationMs << "ms\n";
    oss << "Score: " << result.details.score.home << "-" << result.details.score.away << "\n";
    oss << "Store attempts: " << result.details.storeAttempts << "\n";

    if (!result.details.error.empty()) {
        oss << "Error: " << result.details.error << "\n";
    }

    if (!result.details.findings.empty()) {
        oss << "\nFINDINGS (" << result.details.findings.size() << "):\n";
        for (const auto& finding : result.details.findings) {
            oss << "  - " << finding << "\n";
        }
    }

    return oss.str();
}

} // namespace Replay
} // namespace BassBall
