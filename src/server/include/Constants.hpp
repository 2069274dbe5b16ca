#pragma once

#include <cstdint>
#include <cstddef>

// [ALL-AGENTS] Global constants for the BassBall match core
// All magic numbers MUST be defined here, not scattered in code

namespace BassBall {
namespace Constants {

// ============================================================================
// ENGINE IDENTITY
// ============================================================================

// [REPLAY_AGENT] Part of every result hash - bump on any behavioural change
inline constexpr const char* ENGINE_VERSION = "bassball-core/1.0.0";
inline constexpr const char* VERSION = "1.0.0";

// ============================================================================
// TIMING
// ============================================================================

// [PHYSICS_AGENT] Tick rate and timing
inline constexpr uint32_t TICK_RATE_HZ = 60;
inline constexpr float DT_SECONDS = 1.0f / TICK_RATE_HZ;

// 30 minute cap @ 60Hz
inline constexpr uint32_t MAX_MATCH_MINUTES = 30;
inline constexpr uint32_t MAX_MATCH_TICKS = MAX_MATCH_MINUTES * 60 * TICK_RATE_HZ;  // 108000

// ============================================================================
// PHYSICS CONSTANTS
// ============================================================================

// [PHYSICS_AGENT] Collision shapes (meters)
inline constexpr float PLAYER_CAPSULE_RADIUS = 0.4f;
inline constexpr float PLAYER_CAPSULE_HEIGHT = 1.8f;
inline constexpr float BALL_RADIUS = 0.11f;

// [PHYSICS_AGENT] Pitch, centred on the origin
inline constexpr float FIELD_WIDTH = 120.0f;
inline constexpr float FIELD_HEIGHT = 80.0f;
inline constexpr float GOAL_WIDTH = 7.32f;                   // centred on each end line

// [PHYSICS_AGENT] Resolution
inline constexpr float MAX_PENETRATION = 0.01f;
inline constexpr float SEPARATION_EPSILON = 0.001f;
inline constexpr uint32_t RESOLUTION_PASSES = 3;
inline constexpr uint32_t MAX_RESOLUTION_PASSES = 16;          // settling cap per tick
inline constexpr float RESTITUTION = 0.4f;
inline constexpr float MOMENTUM_TRANSFER_CAP = 0.5f;

// [PHYSICS_AGENT] Fouls
inline constexpr float FOUL_FORCE_THRESHOLD = 25.0f;
inline constexpr float FOUL_CONTACT_ANGLE = 0.7f;           // radians (~40 deg)
inline constexpr float DANGEROUS_PLAY_MULTIPLIER = 1.5f;
inline constexpr float TACKLE_FROM_BEHIND_MULTIPLIER = 0.7f;

// [PHYSICS_AGENT] Movement
inline constexpr float MAX_PLAYER_SPEED = 7.0f;              // m/s
inline constexpr float SPRINT_SPEED_MULTIPLIER = 1.5f;
inline constexpr float MAX_SPRINT_SPEED = MAX_PLAYER_SPEED * SPRINT_SPEED_MULTIPLIER;
inline constexpr float ACCELERATION = 10.0f;                 // blend rate per second
inline constexpr float SPRINT_STAMINA_PER_TICK = 0.05f;
inline constexpr float STAMINA_RECOVERY_PER_TICK = 0.01f;
inline constexpr float MAX_STAMINA = 100.0f;

// [PHYSICS_AGENT] Ball handling
inline constexpr float KICK_REACH = 0.3f;                    // beyond touching distance
inline constexpr float MAX_KICK_SPEED = 30.0f;               // m/s at power 100
inline constexpr float BALL_FRICTION = 0.985f;               // per tick
inline constexpr float MIN_BALL_SPEED = 0.01f;

// ============================================================================
// INPUT GATE
// ============================================================================

// [SECURITY_AGENT] Admission window and rate limiting
inline constexpr uint32_t INPUT_TIMESTAMP_WINDOW_MS = 200;
inline constexpr uint32_t INPUT_RATE_WINDOW_MS = 100;
inline constexpr uint32_t MAX_INPUTS_PER_RATE_WINDOW = 10;
inline constexpr uint32_t BOT_PATTERN_MIN_GAPS = 4;
inline constexpr uint32_t BOT_PATTERN_TOLERANCE_MS = 3;
inline constexpr uint32_t SUSPICION_ESCALATION_THRESHOLD = 5;

// [SECURITY_AGENT] Action parameter bounds
inline constexpr float MOVE_AXIS_MIN = -1.0f;
inline constexpr float MOVE_AXIS_MAX = 1.0f;
inline constexpr float POWER_MIN = 0.0f;
inline constexpr float POWER_MAX = 100.0f;

// ============================================================================
// REPLAY VERIFICATION
// ============================================================================

// [REPLAY_AGENT] Fraud heuristics
inline constexpr uint32_t MAX_PLAUSIBLE_GOALS = 20;
inline constexpr float MIN_INPUTS_PER_SECOND = 5.0f;         // half of the ~10/s norm
inline constexpr uint32_t MIN_MATCH_DURATION_MS = 60000;     // 1 minute
inline constexpr uint32_t MAX_MATCH_DURATION_MS = 6000000;   // 100 minutes

// [REPLAY_AGENT] Store access
inline constexpr uint32_t REDIS_DEFAULT_PORT = 6379;
inline constexpr uint32_t REDIS_CONNECTION_TIMEOUT_MS = 500;
inline constexpr uint32_t FETCH_MAX_ATTEMPTS = 3;
inline constexpr uint32_t FETCH_INITIAL_BACKOFF_MS = 50;

} // namespace Constants
} // namespace BassBall
