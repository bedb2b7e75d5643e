// SPDX-License-Identifier: Apache-2.0
#include "server/config.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

static bool rejects(const char *doc)
{
    try {
        (void)astro::cfg::parse_config(YAML::Load(doc));
    } catch (const std::runtime_error &) {
        return true;
    }
    return false;
}

int main()
{
    // Defaults when keys are absent.
    {
        auto cfg = astro::cfg::parse_config(YAML::Load("{}"));
        assert(cfg.listen_port == 40001);
        assert(cfg.tick_rate == 60);
        assert(cfg.max_players == 15);
        assert(cfg.round_duration_ms == 150000);
        assert(cfg.map_names.size() == 5);
        assert(!cfg.fixed_seed);
        assert(cfg.tuning.clip_size == 3);
    }

    // Overrides, nested sections and the derived simulation settings.
    {
        auto cfg = astro::cfg::parse_config(YAML::Load(R"(
listen_port: 5000
tick_rate: 30
max_players: 4
round_duration_ms: 90000
fixed_seed: 42
log_level: debug
maps:
  dir: /tmp/maps
  names: [open]
  block_size: 20
gameplay:
  clip_size: 5
  max_speed: 7.5
  respawn_delay_ms: 1000
)"));
        assert(cfg.listen_port == 5000);
        assert(cfg.tick_rate == 30);
        assert(cfg.log_level == "debug");
        assert(cfg.maps_dir == "/tmp/maps");
        assert(cfg.map_names.size() == 1 && cfg.map_names[0] == "open");
        assert(cfg.block_size == 20.f);
        assert(cfg.grid_width == 48);
        auto sim = cfg.simulation();
        assert(sim.max_players == 4);
        assert(sim.round_duration_ms == 90000);
        assert(sim.fixed_seed == 42u);
        assert(sim.tuning.clip_size == 5);
        assert(sim.tuning.max_speed == 7.5f);
        assert(sim.tuning.respawn_delay_ms == 1000);
        assert(sim.tuning.reload_ms == 2000);
    }

    // Invalid values
    assert(rejects("tick_rate: 0"));
    assert(rejects("max_players: 0"));
    assert(rejects("maps: {names: []}"));
    assert(rejects("maps: {grid_width: 0}"));
    assert(!rejects("tick_rate: 20"));

    // Type errors surface as YAML exceptions.
    {
        bool threw = false;
        try {
            (void)astro::cfg::parse_config(YAML::Load("tick_rate: fast"));
        } catch (const YAML::Exception &) {
            threw = true;
        }
        assert(threw);
    }

    // Shipped configuration loads.
    {
        auto cfg = astro::cfg::load_config(ASTRO_SOURCE_DIR "/config/server.yaml");
        assert(cfg.tick_rate == 60);
        assert(cfg.metrics_port == 9100);
        assert(cfg.map_names.size() == 5);
    }

    std::cout << "unit_config OK" << std::endl;
    return 0;
}
