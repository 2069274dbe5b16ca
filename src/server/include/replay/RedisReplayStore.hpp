#pragma once

#include "Constants.hpp"
#include "replay/ReplayStore.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

// [DATABASE_AGENT] Redis-backed replay store
// One blocking connection, opened lazily and dropped on any error so the
// next call reconnects. Safe to share between verifier threads

struct redisContext;

namespace BassBall {
namespace Replay {

struct RedisStoreConfig {
    std::string host{"127.0.0.1"};
    uint16_t port{static_cast<uint16_t>(Constants::REDIS_DEFAULT_PORT)};
    uint32_t connectTimeoutMs{Constants::REDIS_CONNECTION_TIMEOUT_MS};
    uint32_t commandTimeoutMs{Constants::REDIS_CONNECTION_TIMEOUT_MS};
};

class RedisReplayStore : public ReplayStore {
public:
    explicit RedisReplayStore(RedisStoreConfig config = RedisStoreConfig{});
    ~RedisReplayStore() override;

    RedisReplayStore(const RedisReplayStore&) = delete;
    RedisReplayStore& operator=(const RedisReplayStore&) = delete;

    [[nodiscard]] std::optional<MatchResult> fetchReplay(const std::string& matchId) override;
    [[nodiscard]] std::optional<std::string> fetchAuthoritativeHash(const std::string& matchId) override;

    void storeReplay(const std::string& matchId, const MatchResult& result) override;
    void storeAuthoritativeHash(const std::string& matchId, const std::string& hash) override;

    [[nodiscard]] bool isConnected() const;

    [[nodiscard]] uint64_t getCommandsSent() const { return commandsSent_; }
    [[nodiscard]] uint64_t getCommandsFailed() const { return commandsFailed_; }

private:
    struct ContextDeleter {
        void operator()(redisContext* ctx) const;
    };
    using ContextPtr = std::unique_ptr<redisContext, ContextDeleter>;

    // Caller holds mutex_
    redisContext* connection();

    // GET; nullopt on a nil reply
    std::optional<std::string> get(const std::string& key);
    void set(const std::string& key, std::string_view value);

    [[noreturn]] void fail(const std::string& what);

    RedisStoreConfig config_;
    mutable std::mutex mutex_;
    ContextPtr ctx_;

    std::atomic<uint64_t> commandsSent_{0};
    std::atomic<uint64_t> commandsFailed_{0};
};

} // namespace Replay
} // namespace BassBall
