#pragma once

#include "replay/ReplayStore.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// [REPLAY_AGENT] Process-local replay store
// Backs offline verification of replay files and stands in for Redis in
// tests. failNextCalls() makes the following fetches throw StoreError

namespace BassBall {
namespace Replay {

class InMemoryReplayStore : public ReplayStore {
public:
    [[nodiscard]] std::optional<MatchResult> fetchReplay(const std::string& matchId) override;
    [[nodiscard]] std::optional<std::string> fetchAuthoritativeHash(const std::string& matchId) override;

    void storeReplay(const std::string& matchId, const MatchResult& result) override;
    void storeAuthoritativeHash(const std::string& matchId, const std::string& hash) override;

    // Simulated outage: the next `count` fetches throw StoreError
    void failNextCalls(uint32_t count);

    [[nodiscard]] uint32_t getFetchCount() const;

private:
    void maybeFail(const std::string& matchId);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, MatchResult> replays_;
    std::unordered_map<std::string, std::string> hashes_;
    uint32_t pendingFailures_{0};
    uint32_t fetchCount_{0};
};

} // namespace Replay
} // namespace BassBall
