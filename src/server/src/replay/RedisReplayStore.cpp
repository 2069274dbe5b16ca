// [DATABASE_AGENT] Redis replay store implementation

#include "replay/RedisReplayStore.hpp"
#include <hiredis/hiredis.h>
#include <iostream>

namespace BassBall {
namespace Replay {

namespace {

timeval toTimeval(uint32_t ms) {
    timeval tv;
    tv.tv_sec = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    return tv;
}

struct ReplyDeleter {
    void operator()(redisReply* reply) const {
        if (reply) {
            freeReplyObject(reply);
        }
    }
};
using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

} // anonymous namespace

void RedisReplayStore::ContextDeleter::operator()(redisContext* ctx) const {
    if (ctx) {
        redisFree(ctx);
    }
}

RedisReplayStore::RedisReplayStore(RedisStoreConfig config)
    : config_(std::move(config)) {}

RedisReplayStore::~RedisReplayStore() = default;

bool RedisReplayStore::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ctx_ && ctx_->err == 0;
}

redisContext* RedisReplayStore::connection() {
    if (ctx_ && ctx_->err == 0) {
        return ctx_.get();
    }
    ctx_.reset();

    ContextPtr ctx(redisConnectWithTimeout(config_.host.c_str(), config_.port,
                                           toTimeval(config_.connectTimeoutMs)));
    if (!ctx) {
        fail("failed to allocate context");
    }
    if (ctx->err) {
        fail(std::string("connection error: ") + ctx->errstr);
    }

    if (redisSetTimeout(ctx.get(), toTimeval(config_.commandTimeoutMs)) != REDIS_OK) {
        fail("failed to set command timeout");
    }
    redisEnableKeepAlive(ctx.get());

    std::cout << "[REDIS] Connected to " << config_.host << ":" << config_.port << std::endl;
    ctx_ = std::move(ctx);
    return ctx_.get();
}

void RedisReplayStore::fail(const std::string& what) {
    commandsFailed_++;
    ctx_.reset();
    std::cerr << "[REDIS] " << config_.host << ":" << config_.port << " " << what << std::endl;
    throw StoreError("redis " + config_.host + ":" + std::to_string(config_.port) + " " + what);
}

std::optional<std::string> RedisReplayStore::get(const std::string& key) {
    redisContext* ctx = connection();
    commandsSent_++;

    ReplyPtr reply(static_cast<redisReply*>(
        redisCommand(ctx, "GET %b", key.data(), key.size())));

    if (!reply) {
        fail(std::string("GET failed: ") + (ctx->errstr[0] ? ctx->errstr : "no reply"));
    }
    if (reply->type == REDIS_REPLY_NIL) {
        return std::nullopt;
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        fail("GET error: " + std::string(reply->str, reply->len));
    }
    if (reply->type != REDIS_REPLY_STRING) {
        fail("GET returned unexpected reply type");
    }
    return std::string(reply->str, reply->len);
}

void RedisReplayStore::set(const std::string& key, std::string_view value) {
    redisContext* ctx = connection();
    commandsSent_++;

    ReplyPtr reply(static_cast<redisReply*>(
        redisCommand(ctx, "SET %b %b", key.data(), key.size(), value.data(), value.size())));

    if (!reply) {
        fail(std::string("SET failed: ") + (ctx->errstr[0] ? ctx->errstr : "no reply"));
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        fail("SET error: " + std::string(reply->str, reply->len));
    }
}

std::optional<MatchResult> RedisReplayStore::fetchReplay(const std::string& matchId) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto document = get(ReplayKeys::replay(matchId));
    if (!document) {
        return std::nullopt;
    }
    return parseMatchResult(*document);
}

std::optional<std::string> RedisReplayStore::fetchAuthoritativeHash(const std::string& matchId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return get(ReplayKeys::hash(matchId));
}

void RedisReplayStore::storeReplay(const std::string& matchId, const MatchResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    set(ReplayKeys::replay(matchId), serializeMatchResult(result));
}

void RedisReplayStore::storeAuthoritativeHash(const std::string& matchId, const std::string& hash) {
    std::lock_guard<std::mutex> lock(mutex_);
    set(ReplayKeys::hash(matchId), hash);
}

} // namespace Replay
} // namespace BassBall
