#pragma once

#include "replay/MatchResult.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

// [REPLAY_AGENT] Reproducible match result digest
// SHA-256 over a canonical little-endian encoding of the match, so any
// third party holding the same seed, engine version and input streams
// derives the same value bit for bit

namespace BassBall {
namespace Replay {

using Digest = std::array<uint8_t, 32>;

class ResultHasher {
public:
    // Leading bytes of every encoding
    static constexpr char MAGIC[4] = {'B', 'B', 'R', '1'};

    // Canonical byte encoding; resultHash itself is not part of it
    [[nodiscard]] static std::vector<uint8_t> encode(const MatchResult& result);

    [[nodiscard]] static Digest digest(std::span<const uint8_t> bytes);

    // "0x" + 64 lowercase hex digits
    [[nodiscard]] static std::string computeHash(const MatchResult& result);

    [[nodiscard]] static std::string toHex(const Digest& digest);
};

} // namespace Replay
} // namespace BassBall
