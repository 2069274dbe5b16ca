#pragma once

#include "ecs/CoreTypes.hpp"
#include "game/InputTypes.hpp"
#include "security/InputGateConfig.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <unordered_map>

// [SECURITY_AGENT] Per-match input admission gate
// Every input passes here before it can touch the simulation or the replay
// log. Rejections are silent to the simulation: the input is dropped and
// the player's suspicion counter goes up

namespace BassBall {
namespace Security {

enum class RejectReason : uint8_t {
    NONE = 0,
    UNKNOWN_PLAYER = 1,       // Never joined, or already evicted
    STALE_TIMESTAMP = 2,      // Older than the timestamp window
    FUTURE_TIMESTAMP = 3,     // Ahead of the server clock
    TICK_NOT_INCREASING = 4,  // <= last accepted tick
    TICK_OUT_OF_RANGE = 5,    // Beyond the match's last tick
    INVALID_PARAMETERS = 6,   // Action parameters out of bounds
    RATE_LIMITED = 7,         // Too many inputs in the rate window
    BOT_PATTERN = 8           // Inter-arrival gaps too regular
};

inline const char* rejectReasonToString(RejectReason reason) {
    switch (reason) {
        case RejectReason::NONE: return "NONE";
        case RejectReason::UNKNOWN_PLAYER: return "UNKNOWN_PLAYER";
        case RejectReason::STALE_TIMESTAMP: return "STALE_TIMESTAMP";
        case RejectReason::FUTURE_TIMESTAMP: return "FUTURE_TIMESTAMP";
        case RejectReason::TICK_NOT_INCREASING: return "TICK_NOT_INCREASING";
        case RejectReason::TICK_OUT_OF_RANGE: return "TICK_OUT_OF_RANGE";
        case RejectReason::INVALID_PARAMETERS: return "INVALID_PARAMETERS";
        case RejectReason::RATE_LIMITED: return "RATE_LIMITED";
        case RejectReason::BOT_PATTERN: return "BOT_PATTERN";
        default: return "UNKNOWN";
    }
}

struct AdmissionResult {
    bool accepted{false};
    RejectReason reason{RejectReason::NONE};
    uint32_t suspicion{0};    // Player's counter after this call
    bool escalated{false};    // This rejection brought the counter to the threshold
};

// Arena handle for one player's gate state
using PlayerHandle = entt::entity;

// [SECURITY_AGENT] Called once per player when suspicion reaches the
// escalation threshold; flag/disconnect policy belongs to the caller
using EscalationCallback = std::function<void(const PlayerId& playerId,
    uint32_t suspicion, RejectReason lastReason)>;

class InputValidator {
public:
    // Throws std::invalid_argument if config fails validation
    explicit InputValidator(const InputGateConfig& config = InputGateConfig{});

    // Non-copyable: handles are only meaningful for the issuing instance
    InputValidator(const InputValidator&) = delete;
    InputValidator& operator=(const InputValidator&) = delete;

    // ========================================================================
    // LIFECYCLE
    // ========================================================================

    // Creates gate state for a player; joining twice returns the same handle
    PlayerHandle join(const PlayerId& playerId);

    // Evicts one player's state. Returns false if the player was unknown
    bool leave(const PlayerId& playerId);

    // Evicts every player; handles issued before are invalid afterwards
    void endMatch();

    [[nodiscard]] std::optional<PlayerHandle> handleOf(const PlayerId& playerId) const;

    // ========================================================================
    // ADMISSION
    // ========================================================================

    // [SECURITY_AGENT] Admit or reject one input at server time nowMs
    [[nodiscard]] AdmissionResult admit(PlayerHandle handle, const PlayerInput& input, uint64_t nowMs);

    // Looks the player up by input.playerId
    [[nodiscard]] AdmissionResult admit(const PlayerInput& input, uint64_t nowMs);

    // ========================================================================
    // QUERIES
    // ========================================================================

    [[nodiscard]] uint32_t getSuspicion(const PlayerId& playerId) const;
    [[nodiscard]] std::optional<uint32_t> getLastAcceptedTick(const PlayerId& playerId) const;
    [[nodiscard]] bool isEscalated(const PlayerId& playerId) const;
    [[nodiscard]] size_t getPlayerCount() const { return handles_.size(); }

    [[nodiscard]] uint64_t getTotalAccepted() const { return totalAccepted_; }
    [[nodiscard]] uint64_t getTotalRejected() const { return totalRejected_; }

    void setOnEscalation(EscalationCallback cb) { onEscalation_ = std::move(cb); }

    [[nodiscard]] const InputGateConfig& getConfig() const { return config_; }

private:
    // [SECURITY_AGENT] One player's admission history, stored in the arena
    struct GateState {
        PlayerId playerId;
        std::optional<uint32_t> lastAcceptedTick;
        std::deque<uint64_t> acceptanceTimes;  // Oldest first, bounded
        uint32_t suspicion{0};
        bool escalated{false};
    };

    [[nodiscard]] RejectReason check(const GateState& state, const PlayerInput& input,
                                     uint64_t nowMs) const;

    [[nodiscard]] bool exceedsRate(const GateState& state, uint64_t nowMs) const;
    [[nodiscard]] bool looksScripted(const GateState& state, uint64_t nowMs) const;

    [[nodiscard]] const GateState* find(const PlayerId& playerId) const;

    InputGateConfig config_;
    size_t historyCapacity_{0};

    entt::registry arena_;
    std::unordered_map<PlayerId, PlayerHandle> handles_;

    EscalationCallback onEscalation_;

    uint64_t totalAccepted_{0};
    uint64_t totalRejected_{0};
};

} // namespace Security
} // namespace BassBall
