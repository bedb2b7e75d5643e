// SPDX-License-Identifier: Apache-2.0
// tuning.hpp - Gameplay constants. Distances are pixels, velocities pixels per tick, times milliseconds.
#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>

namespace astro::game {

struct GameTuning
{
    // Ship kinematics
    float ship_size{30.f}; // nose to tail
    float acceleration{0.15f};
    float max_speed{5.f};
    float friction{0.98f};
    float turn_speed{0.03f}; // radians per tick when rotation starts
    float turn_speed_max{0.12f};
    uint64_t turn_ramp_ms{3000}; // time to reach turn_speed_max
    float wall_bounce_damping{0.7f};
    float restitution{0.6f}; // ship-ship collisions
    // Weapons
    float bullet_speed{8.f};
    float bullet_radius{3.f};
    uint64_t bullet_lifetime_ms{3000};
    float mega_bullet_radius{6.f};
    float mega_bullet_speed_multiplier{1.5f};
    float split_shot_spread_rad{0.2618f}; // 15 degrees either side
    uint32_t clip_size{3};
    uint64_t reload_ms{2000};
    uint64_t respawn_delay_ms{2000};
    // Power-up economy
    float power_up_radius{20.f};
    uint64_t power_up_lifetime_ms{15000};
    uint64_t power_up_spawn_interval_ms{5000};
    uint32_t max_power_ups{3};
    uint32_t power_up_spawn_attempts{20};
    uint64_t pickup_notice_ttl_ms{3000};
    size_t max_pickup_notices{32};
    // Effect parameters
    uint64_t ammo_boost_ms{20000};
    uint32_t ammo_boost_size{8};
    float ammo_boost_reload_multiplier{0.5f};
    uint64_t split_shot_ms{15000};
    uint64_t speed_boost_ms{15000};
    float speed_boost_multiplier{1.5f};
    float speed_boost_acceleration_multiplier{1.5f};
    uint64_t rapid_fire_ms{15000};
    float rapid_fire_reload_multiplier{0.4f};
    uint64_t ghost_mode_ms{10000};
    uint64_t reverse_controls_ms{8000};
    uint32_t shield_max_hits{3};
    uint32_t mega_bullet_count{5};
    uint32_t mine_trap_count{3};
    float mine_radius{12.f};
    float mine_explosion_radius{100.f};
    uint64_t mine_lifetime_ms{30000};
    uint32_t dash_charges{3};
    float dash_distance{200.f};
    float dash_min_speed{0.1f};
    // Spawn placement
    uint32_t spawn_attempts{30};
    float emergency_spawn_x{90.f};
    float emergency_spawn_y{90.f};

    // Collision circle enclosing the ship triangle.
    float ship_radius() const
    {
        float wing = std::sqrt((ship_size * 0.6f) * (ship_size * 0.6f) + (ship_size * 0.5f) * (ship_size * 0.5f));
        return ship_size > wing ? ship_size : wing;
    }

    // Minimum allowed distance between two ship centres.
    float collision_distance() const { return ship_radius() * 2.f; }
};

} // namespace astro::game
