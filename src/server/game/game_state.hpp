// SPDX-License-Identifier: Apache-2.0
// game_state.hpp - Entities and the root GameState aggregate of the arena simulation.
#pragma once

#include "server/game/map_model.hpp"

#include <box2d/box2d.h>

#include <array>
#include <cstdint>
#include <deque>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace astro::game {

enum class PowerUpType : uint8_t
{
    AmmoBoost,
    SplitShot,
    SpeedBoost,
    MineTrap,
    Shield,
    RapidFire,
    GhostMode,
    MegaBullet,
    TeleportDash,
    ReverseControls
};

inline constexpr std::array<PowerUpType, 10> kAllPowerUpTypes{
    PowerUpType::AmmoBoost,
    PowerUpType::SplitShot,
    PowerUpType::SpeedBoost,
    PowerUpType::MineTrap,
    PowerUpType::Shield,
    PowerUpType::RapidFire,
    PowerUpType::GhostMode,
    PowerUpType::MegaBullet,
    PowerUpType::TeleportDash,
    PowerUpType::ReverseControls};

const char *power_up_name(PowerUpType type);

enum class RoundPhase : uint8_t
{
    Waiting,
    Playing,
    Ended
};

const char *phase_name(RoundPhase phase);

// Charge-based effects never expire by time.
inline constexpr uint64_t kNoExpiry = std::numeric_limits<uint64_t>::max();

struct ActiveEffect
{
    PowerUpType type{PowerUpType::AmmoBoost};
    uint64_t expires_at_ms{kNoExpiry};
    uint32_t mega_bullets_remaining{0}; // MegaBullet only
};

struct Player
{
    std::string id;
    std::string name;
    b2Vec2 position{0.f, 0.f};
    b2Vec2 velocity{0.f, 0.f};
    float rotation{0.f}; // radians in [0, 2pi)
    std::string color;
    uint32_t score{0};
    uint32_t ammo{0};
    bool is_alive{true};
    bool is_thrust_active{false};
    uint64_t turn_start_time_ms{0}; // rotation ramp origin
    uint64_t last_reload_time_ms{0};
    std::vector<ActiveEffect> active_effects; // pickup order
    // Charge counters; zero means the player holds none.
    uint32_t shield_hits{0};
    uint32_t dash_charges{0};
    uint32_t mines_available{0};

    bool has_effect(PowerUpType type) const;
    ActiveEffect *find_effect(PowerUpType type);
};

struct Bullet
{
    std::string id;
    std::string player_id; // owner, never hit by its own bullets
    b2Vec2 position{0.f, 0.f};
    b2Vec2 velocity{0.f, 0.f};
    uint64_t spawn_time_ms{0};
    bool is_mega{false};
};

struct PowerUp
{
    std::string id;
    PowerUpType type{PowerUpType::AmmoBoost};
    b2Vec2 position{0.f, 0.f};
    uint64_t spawn_time_ms{0};
};

struct Mine
{
    std::string id;
    std::string player_id; // owner, immune to its own mines
    b2Vec2 position{0.f, 0.f};
    uint64_t spawn_time_ms{0};
};

struct PickupNotice
{
    PowerUpType type{PowerUpType::AmmoBoost};
    b2Vec2 position{0.f, 0.f};
    uint64_t timestamp_ms{0};
};

enum class KillCause : uint8_t
{
    Bullet,
    Mine
};

struct KillEvent
{
    std::string victim_id;
    std::string killer_id;
    KillCause cause{KillCause::Bullet};
};

struct GameState
{
    std::vector<Player> players; // join order; iteration order decides host handover and ties
    std::vector<Bullet> bullets;
    std::vector<PowerUp> power_ups;
    std::vector<Mine> mines;
    MapModel map; // current round's blocks
    std::deque<PickupNotice> recent_pickups;
    std::optional<uint64_t> round_end_time_ms;
    bool is_round_active{false};
    RoundPhase phase{RoundPhase::Waiting};
    std::optional<std::string> host_player_id;
    // Deaths recorded during the current tick; drained by the simulation after physics and effects.
    std::vector<KillEvent> kill_events;
    uint64_t next_entity_seq{1};

    Player *find_player(std::string_view id);
    const Player *find_player(std::string_view id) const;
    std::string next_id(std::string_view prefix);
};

// Colour assigned to the n-th joining player (15 well separated hues, wraps around).
std::string player_color(size_t index);

} // namespace astro::game
