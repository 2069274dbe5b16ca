#pragma once

#include "Constants.hpp"
#include "replay/MatchResult.hpp"
#include "replay/ReplayStore.hpp"
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <vector>

// [REPLAY_AGENT] Multi-gate replay verification
// Gates run in order and the first failure decides the outcome:
//   1. replay fetch         MISSING_REPLAY
//   2. local hash
//   3. authoritative hash   VERIFICATION_ERROR when unavailable
//   4. hash equality        HASH_MISMATCH
//   5. input integrity      INVALID_INPUTS
//   6. fraud heuristics     FRAUD_DETECTED
// Store failures never escape; they come back as VERIFICATION_ERROR

namespace BassBall {
namespace Replay {

enum class MismatchType : uint8_t {
    NONE = 0,
    MISSING_REPLAY = 1,
    HASH_MISMATCH = 2,
    INVALID_INPUTS = 3,
    FRAUD_DETECTED = 4,
    VERIFICATION_ERROR = 5
};

inline const char* mismatchTypeToString(MismatchType type) {
    switch (type) {
        case MismatchType::NONE: return "NONE";
        case MismatchType::MISSING_REPLAY: return "MISSING_REPLAY";
        case MismatchType::HASH_MISMATCH: return "HASH_MISMATCH";
        case MismatchType::INVALID_INPUTS: return "INVALID_INPUTS";
        case MismatchType::FRAUD_DETECTED: return "FRAUD_DETECTED";
        case MismatchType::VERIFICATION_ERROR: return "VERIFICATION_ERROR";
        default: return "UNKNOWN";
    }
}

struct VerifierConfig {
    // Integrity
    uint32_t maxTick = Constants::MAX_MATCH_TICKS;

    // Fraud heuristics
    uint32_t maxGoalsPerTeam = Constants::MAX_PLAUSIBLE_GOALS;
    float minInputsPerSecond = Constants::MIN_INPUTS_PER_SECOND;
    uint32_t minDurationMs = Constants::MIN_MATCH_DURATION_MS;
    uint32_t maxDurationMs = Constants::MAX_MATCH_DURATION_MS;
    // Gap standard deviation above this multiple of the mean gap is burst input
    float burstinessFactor = 2.0f;

    // Store access
    uint32_t fetchMaxAttempts = Constants::FETCH_MAX_ATTEMPTS;
    uint32_t initialBackoffMs = Constants::FETCH_INITIAL_BACKOFF_MS;

    [[nodiscard]] std::vector<std::string> validate() const;

    // Throws std::invalid_argument listing every problem
    void validateOrThrow() const;
};

struct VerificationDetails {
    size_t inputCount{0};
    uint32_t durationMs{0};
    Score score;
    std::string declaredHash;          // resultHash carried by the replay itself
    std::vector<std::string> findings; // Integrity or fraud findings, in check order
    std::string error;                 // Set for VERIFICATION_ERROR
    uint32_t storeAttempts{0};         // Total store calls including retries
};

struct VerificationResult {
    std::string matchId;
    bool valid{false};
    std::string computedHash;
    std::string authoritativeHash;
    MismatchType mismatch{MismatchType::NONE};
    VerificationDetails details;
};

class ReplayVerifier {
public:
    // Throws std::invalid_argument if config fails validation or store is null
    explicit ReplayVerifier(std::shared_ptr<ReplayStore> store,
                            const VerifierConfig& config = VerifierConfig{});

    // [REPLAY_AGENT] Run every gate for one match. Never throws
    [[nodiscard]] VerificationResult verify(const std::string& matchId);

    // Same as verify() on a worker thread; safe to destroy this verifier before get()
    [[nodiscard]] std::future<VerificationResult> verifyAsync(std::string matchId);

    // Gate 5 on its own; empty when every stream is well formed
    [[nodiscard]] static std::vector<std::string> checkInputIntegrity(
        const MatchResult& result, const VerifierConfig& config);

    // Gate 6 on its own; empty when nothing looks fabricated
    [[nodiscard]] static std::vector<std::string> checkFraud(
        const MatchResult& result, const VerifierConfig& config);

    [[nodiscard]] static std::string generateReport(const VerificationResult& result);

    [[nodiscard]] const VerifierConfig& getConfig() const { return config_; }

private:
    // Retries StoreError with exponential backoff; rethrows the last one
    template<typename Fetch>
    auto fetchWithRetry(const char* what, const std::string& matchId,
                        VerificationDetails& details, Fetch fetch) -> decltype(fetch());

    std::shared_ptr<ReplayStore> store_;
    VerifierConfig config_;
};

} // namespace Replay
} // namespace BassBall
