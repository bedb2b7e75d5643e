// SPDX-License-Identifier: Apache-2.0
// config.hpp - Server configuration loaded from YAML.
#pragma once

#include "server/game/simulation.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace astro::cfg {

struct ServerConfig
{
    uint16_t listen_port{40001};
    uint16_t metrics_port{0}; // 0 disables /metrics and /health
    uint32_t tick_rate{60};
    uint32_t heartbeat_timeout_seconds{15};
    uint64_t round_duration_ms{150000};
    uint32_t max_players{15};
    std::string log_level{"info"};
    bool log_json{false};
    std::string maps_dir{"maps"};
    std::vector<std::string> map_names{"open", "pillars", "four_corners", "crossroads", "bunkers"};
    int32_t grid_width{48};
    int32_t grid_height{27};
    float block_size{40.f};
    std::optional<uint32_t> fixed_seed;
    astro::game::GameTuning tuning;

    astro::game::SimulationConfig simulation() const;
};

// Throws YAML::Exception on malformed documents and std::runtime_error on invalid values.
ServerConfig parse_config(const YAML::Node &root);
ServerConfig load_config(const std::string &path);

} // namespace astro::cfg
