// SPDX-License-Identifier: Apache-2.0
#include "server/config.hpp"

#include <stdexcept>

namespace astro::cfg {

namespace {

template <typename T>
void read(const YAML::Node &node, const char *key, T &out)
{
    if (node[key]) {
        out = node[key].as<T>();
    }
}

void read_tuning(const YAML::Node &g, astro::game::GameTuning &t)
{
    read(g, "ship_size", t.ship_size);
    read(g, "acceleration", t.acceleration);
    read(g, "max_speed", t.max_speed);
    read(g, "friction", t.friction);
    read(g, "turn_speed", t.turn_speed);
    read(g, "turn_speed_max", t.turn_speed_max);
    read(g, "turn_ramp_ms", t.turn_ramp_ms);
    read(g, "wall_bounce_damping", t.wall_bounce_damping);
    read(g, "restitution", t.restitution);
    read(g, "bullet_speed", t.bullet_speed);
    read(g, "bullet_radius", t.bullet_radius);
    read(g, "bullet_lifetime_ms", t.bullet_lifetime_ms);
    read(g, "clip_size", t.clip_size);
    read(g, "reload_ms", t.reload_ms);
    read(g, "respawn_delay_ms", t.respawn_delay_ms);
    read(g, "power_up_lifetime_ms", t.power_up_lifetime_ms);
    read(g, "power_up_spawn_interval_ms", t.power_up_spawn_interval_ms);
    read(g, "max_power_ups", t.max_power_ups);
    read(g, "mine_lifetime_ms", t.mine_lifetime_ms);
    read(g, "mine_explosion_radius", t.mine_explosion_radius);
    read(g, "shield_max_hits", t.shield_max_hits);
    read(g, "mega_bullet_count", t.mega_bullet_count);
    read(g, "dash_distance", t.dash_distance);
}

} // namespace

astro::game::SimulationConfig ServerConfig::simulation() const
{
    astro::game::SimulationConfig sc;
    sc.tuning = tuning;
    sc.round_duration_ms = round_duration_ms;
    sc.max_players = max_players;
    sc.fixed_seed = fixed_seed;
    return sc;
}

ServerConfig parse_config(const YAML::Node &root)
{
    ServerConfig cfg;
    read(root, "listen_port", cfg.listen_port);
    read(root, "metrics_port", cfg.metrics_port);
    read(root, "tick_rate", cfg.tick_rate);
    read(root, "heartbeat_timeout_seconds", cfg.heartbeat_timeout_seconds);
    read(root, "round_duration_ms", cfg.round_duration_ms);
    read(root, "max_players", cfg.max_players);
    read(root, "log_level", cfg.log_level);
    read(root, "log_json", cfg.log_json);
    if (const auto maps = root["maps"]) {
        read(maps, "dir", cfg.maps_dir);
        read(maps, "names", cfg.map_names);
        read(maps, "grid_width", cfg.grid_width);
        read(maps, "grid_height", cfg.grid_height);
        read(maps, "block_size", cfg.block_size);
    }
    if (root["fixed_seed"]) {
        cfg.fixed_seed = root["fixed_seed"].as<uint32_t>();
    }
    if (const auto gameplay = root["gameplay"]) {
        read_tuning(gameplay, cfg.tuning);
    }
    if (cfg.tick_rate == 0) {
        throw std::runtime_error("tick_rate must be positive");
    }
    if (cfg.max_players == 0) {
        throw std::runtime_error("max_players must be positive");
    }
    if (cfg.map_names.empty()) {
        throw std::runtime_error("maps.names must list at least one map");
    }
    if (cfg.grid_width <= 0 || cfg.grid_height <= 0 || cfg.block_size <= 0.f) {
        throw std::runtime_error("map grid dimensions must be positive");
    }
    return cfg;
}

ServerConfig load_config(const std::string &path)
{
    return parse_config(YAML::LoadFile(path));
}

} // namespace astro::cfg
