// [REPLAY_AGENT] Result hash encoding
// Layout: magic, seed u64, engine version, score u32 x2, duration u32,
// home stream, away stream. Integers little-endian, strings u32
// length-prefixed, floats as IEEE-754 bit patterns

#include "replay/ResultHasher.hpp"
#include <openssl/sha.h>
#include <cstring>
#include <type_traits>
#include <variant>

namespace BassBall {
namespace Replay {

namespace {

class ByteWriter {
public:
    void u8(uint8_t value) { bytes_.push_back(value); }

    void u32(uint32_t value) {
        for (int shift = 0; shift < 32; shift += 8) {
            bytes_.push_back(static_cast<uint8_t>(value >> shift));
        }
    }

    void u64(uint64_t value) {
        for (int shift = 0; shift < 64; shift += 8) {
            bytes_.push_back(static_cast<uint8_t>(value >> shift));
        }
    }

    void f32(float value) {
        static_assert(sizeof(float) == sizeof(uint32_t), "IEEE-754 single precision required");
        uint32_t bits = 0;
        std::memcpy(&bits, &value, sizeof(bits));
        u32(bits);
    }

    void str(const std::string& value) {
        u32(static_cast<uint32_t>(value.size()));
        bytes_.insert(bytes_.end(), value.begin(), value.end());
    }

    void raw(const char* data, size_t size) {
        bytes_.insert(bytes_.end(), data, data + size);
    }

    [[nodiscard]] std::vector<uint8_t> take() { return std::move(bytes_); }

private:
    std::vector<uint8_t> bytes_;
};

void writeParams(ByteWriter& writer, const ActionParams& params) {
    std::visit([&writer](const auto& p) {
        using T = std::decay_t<decltype(p)>;

        if constexpr (std::is_same_v<T, MoveParams>) {
            writer.f32(p.x);
            writer.f32(p.y);
        } else if constexpr (std::is_same_v<T, PassParams> || std::is_same_v<T, ShootParams>) {
            writer.f32(p.power);
        } else if constexpr (std::is_same_v<T, TackleParams>) {
            writer.str(p.targetId);
        } else if constexpr (std::is_same_v<T, SprintParams>) {
            // No payload
        } else {
            static_assert(std::is_same_v<T, SkillParams>, "unhandled action parameters");
            writer.str(p.skillId);
        }
    }, params);
}

void writeStream(ByteWriter& writer, const std::vector<PlayerInput>& inputs) {
    writer.u32(static_cast<uint32_t>(inputs.size()));
    for (const auto& input : inputs) {
        writer.str(input.playerId);
        writer.u32(input.tick);
        writer.u64(input.timestamp);
        writer.u8(static_cast<uint8_t>(input.action()));
        writeParams(writer, input.params);
    }
}

} // anonymous namespace

std::vector<uint8_t> ResultHasher::encode(const MatchResult& result) {
    ByteWriter writer;
    writer.raw(MAGIC, sizeof(MAGIC));
    writer.u64(result.seed);
    writer.str(result.engineVersion);
    writer.u32(result.score.home);
    writer.u32(result.score.away);
    writer.u32(result.durationMs);
    writeStream(writer, result.homeInputs);
    writeStream(writer, result.awayInputs);
    return writer.take();
}

Digest ResultHasher::digest(std::span<const uint8_t> bytes) {
    Digest out{};
    SHA256(bytes.data(), bytes.size(), out.data());
    return out;
}

std::string ResultHasher::computeHash(const MatchResult& result) {
    const auto bytes = encode(result);
    return toHex(digest(bytes));
}

std::string ResultHasher::toHex(const Digest& digest) {
    static const char* digits = "0123456789abcdef";

    std::string hex = "0x";
    hex.reserve(2 + digest.size() * 2);
    for (uint8_t byte : digest) {
        hex.push_back(digits[(byte >> 4) & 0xF]);
        hex.push_back(digits[byte & 0xF]);
    }
    return hex;
}

} // namespace Replay
} // namespace BassBall
