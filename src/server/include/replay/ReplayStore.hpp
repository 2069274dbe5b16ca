#pragma once

#include "replay/MatchResult.hpp"
#include <optional>
#include <stdexcept>
#include <string>

// [REPLAY_AGENT] Source of recorded replays and authoritative hashes

namespace BassBall {
namespace Replay {

// [REPLAY_AGENT] Store could not be reached or answered garbage
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ReplayStore {
public:
    virtual ~ReplayStore() = default;

    // nullopt when no replay is recorded for matchId
    // Throws StoreError on transport failure, ReplayFormatError on a bad document
    [[nodiscard]] virtual std::optional<MatchResult> fetchReplay(const std::string& matchId) = 0;

    // nullopt when no authoritative hash is published for matchId
    // Throws StoreError on transport failure
    [[nodiscard]] virtual std::optional<std::string> fetchAuthoritativeHash(const std::string& matchId) = 0;

    // Throws StoreError on transport failure
    virtual void storeReplay(const std::string& matchId, const MatchResult& result) = 0;
    virtual void storeAuthoritativeHash(const std::string& matchId, const std::string& hash) = 0;
};

// [REPLAY_AGENT] Key naming conventions
namespace ReplayKeys {
    inline std::string replay(const std::string& matchId) {
        return "match:" + matchId + ":replay";
    }

    inline std::string hash(const std::string& matchId) {
        return "match:" + matchId + ":hash";
    }
}

} // namespace Replay
} // namespace BassBall
