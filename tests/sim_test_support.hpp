// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "arena.pb.h"
#include "server/game/map_model.hpp"
#include "server/game/simulation.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace astro::test {

// Captures everything the simulation emits.
struct RecordingEgress final : public astro::game::Egress
{
    std::vector<astro::ServerMessage> displays;
    std::vector<std::pair<std::string, astro::ServerMessage>> personal;
    std::vector<astro::ServerMessage> broadcast;

    void to_displays(const astro::ServerMessage &msg) override { displays.push_back(msg); }
    void to_player(const std::string &player_id, const astro::ServerMessage &msg) override
    {
        personal.emplace_back(player_id, msg);
    }
    void to_all(const astro::ServerMessage &msg) override { broadcast.push_back(msg); }

    void clear()
    {
        displays.clear();
        personal.clear();
        broadcast.clear();
    }

    size_t count_broadcast(astro::ServerMessage::PayloadCase c) const
    {
        return static_cast<size_t>(
            std::count_if(broadcast.begin(), broadcast.end(), [c](const auto &m) { return m.payload_case() == c; }));
    }

    size_t count_displays(astro::ServerMessage::PayloadCase c) const
    {
        return static_cast<size_t>(
            std::count_if(displays.begin(), displays.end(), [c](const auto &m) { return m.payload_case() == c; }));
    }
};

// 48x27 grid of 40px blocks built from ASCII rows ('#' = block).
inline astro::game::MapModel map_from_rows(const std::string &name, const std::vector<std::string> &rows)
{
    std::ostringstream oss;
    for (const auto &r : rows)
        oss << r << "\n";
    std::istringstream in(oss.str());
    return astro::game::parse_ascii_map(name, in, 48, 27, 40.f);
}

inline std::shared_ptr<astro::game::MapCatalog> open_catalog()
{
    auto catalog = std::make_shared<astro::game::MapCatalog>();
    catalog->add(astro::game::MapModel{});
    return catalog;
}

inline astro::game::SimulationConfig test_config()
{
    astro::game::SimulationConfig cfg;
    cfg.fixed_seed = 7;
    cfg.round_duration_ms = 60000;
    return cfg;
}

inline astro::InputEvent input(const std::string &player_id, astro::InputAction action, int64_t ts = 1)
{
    astro::InputEvent ev;
    ev.set_player_id(player_id);
    ev.set_action(action);
    ev.set_timestamp_ms(ts);
    return ev;
}

inline astro::game::Player make_player(const std::string &id, float x, float y)
{
    astro::game::Player p;
    p.id = id;
    p.name = id;
    p.position = {x, y};
    p.ammo = 3;
    return p;
}

inline bool near(float a, float b, float eps = 1e-3f)
{
    return std::fabs(a - b) <= eps;
}

} // namespace astro::test
