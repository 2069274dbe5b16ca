#include "replay/InMemoryReplayStore.hpp"

namespace BassBall {
namespace Replay {

void InMemoryReplayStore::maybeFail(const std::string& matchId) {
    fetchCount_++;
    if (pendingFailures_ > 0) {
        pendingFailures_--;
        throw StoreError("store unavailable while fetching " + matchId);
    }
}

std::optional<MatchResult> InMemoryReplayStore::fetchReplay(const std::string& matchId) {
    std::lock_guard<std::mutex> lock(mutex_);
    maybeFail(matchId);

    auto it = replays_.find(matchId);
    if (it == replays_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> InMemoryReplayStore::fetchAuthoritativeHash(const std::string& matchId) {
    std::lock_guard<std::mutex> lock(mutex_);
    maybeFail(matchId);

    auto it = hashes_.find(matchId);
    if (it == hashes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryReplayStore::storeReplay(const std::string& matchId, const MatchResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    replays_[matchId] = result;
}

void InMemoryReplayStore::storeAuthoritativeHash(const std::string& matchId, const std::string& hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    hashes_[matchId] = hash;
}

void InMemoryReplayStore::failNextCalls(uint32_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    pendingFailures_ = count;
}

uint32_t InMemoryReplayStore::getFetchCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetchCount_;
}

} // namespace Replay
} // namespace BassBall
