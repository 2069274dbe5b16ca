#pragma once

#include "Constants.hpp"
#include "game/InputTypes.hpp"
#include <nlohmann/json_fwd.hpp>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// [REPLAY_AGENT] Finalized match record
// Immutable once produced; the unit submitted for validation and
// verification and the document stored for replays

namespace BassBall {
namespace Replay {

// [REPLAY_AGENT] Replay document could not be read
class ReplayFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Score {
    uint32_t home{0};
    uint32_t away{0};

    [[nodiscard]] uint32_t total() const { return home + away; }
};

struct MatchResult {
    uint64_t seed{0};
    std::string engineVersion{Constants::ENGINE_VERSION};
    Score score;
    uint32_t durationMs{0};

    // Accepted inputs per team, in acceptance order
    std::vector<PlayerInput> homeInputs;
    std::vector<PlayerInput> awayInputs;

    // "0x" + 64 lowercase hex digits
    std::string resultHash;

    [[nodiscard]] size_t totalInputs() const { return homeInputs.size() + awayInputs.size(); }
    [[nodiscard]] double durationSeconds() const { return durationMs / 1000.0; }
};

// ============================================================================
// JSON
// ============================================================================

[[nodiscard]] nlohmann::json inputToJson(const PlayerInput& input);

// Throws ReplayFormatError on missing keys, wrong types or unknown actions
[[nodiscard]] PlayerInput inputFromJson(const nlohmann::json& json);

[[nodiscard]] nlohmann::json matchResultToJson(const MatchResult& result);

// Throws ReplayFormatError
[[nodiscard]] MatchResult matchResultFromJson(const nlohmann::json& json);

// Text form used by stores and files
[[nodiscard]] std::string serializeMatchResult(const MatchResult& result);

// Throws ReplayFormatError, including for text that is not JSON
[[nodiscard]] MatchResult parseMatchResult(std::string_view text);

} // namespace Replay
} // namespace BassBall
