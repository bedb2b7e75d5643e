// SPDX-License-Identifier: Apache-2.0
// simulation.hpp - Round lifecycle, per-tick sequencing and network egress of the arena.
#pragma once

#include "arena.pb.h"
#include "server/game/effects.hpp"
#include "server/game/input_handler.hpp"
#include "server/game/map_model.hpp"
#include "server/game/physics.hpp"
#include "server/game/sim_context.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace astro::game {

// Outbound channel. Implementations must only enqueue; the simulation never waits on delivery.
class Egress
{
public:
    virtual ~Egress() = default;
    virtual void to_displays(const astro::ServerMessage &msg) = 0;
    virtual void to_player(const std::string &player_id, const astro::ServerMessage &msg) = 0;
    virtual void to_all(const astro::ServerMessage &msg) = 0;
};

struct SimulationConfig
{
    GameTuning tuning;
    uint64_t round_duration_ms{150000};
    uint32_t max_players{15};
    std::optional<uint32_t> fixed_seed; // unset: seeded from std::random_device
};

class Simulation
{
public:
    // Throws std::runtime_error when the catalog holds no maps.
    Simulation(SimulationConfig cfg, std::shared_ptr<const MapCatalog> maps, Egress &egress);

    // Returns the new player id, or std::nullopt when the room is full.
    std::optional<std::string> join(const std::string &name, uint64_t now_ms);
    bool leave(const std::string &player_id);
    bool handle_input(const astro::InputEvent &ev, uint64_t now_ms);
    // WAITING -> PLAYING, host only.
    bool start_round(const std::string &requester_id, uint64_t now_ms);
    // ENDED -> PLAYING, any connected player; scores restart at zero.
    bool reset_round(const std::string &requester_id, uint64_t now_ms);
    // One fixed step. Never throws.
    void tick(uint64_t now_ms);

    astro::MapSync current_map_sync() const;
    const GameState &state() const { return ctx_.state; }
    SimContext &context() { return ctx_; }
    PhysicsEngine &physics() { return physics_; }
    EffectManager &effects() { return effects_; }
    uint64_t server_tick() const { return server_tick_; }
    // Player ids that received a personal update during the last broadcast.
    const std::vector<std::string> &last_personal_sends() const { return personal_sent_; }

private:
    void begin_round(uint64_t now_ms);
    void end_round();
    void reload_ammo(uint64_t now_ms);
    void publish_kills(uint64_t now_ms);
    void schedule_respawn(const std::string &player_id, uint64_t now_ms);
    void respawn(const std::string &player_id, uint64_t now_ms);
    void prune_pickups(uint64_t now_ms);
    void broadcast();
    void update_gauges() const;
    b2Vec2 find_spawn_position();
    float random_heading();

    SimulationConfig cfg_;
    std::shared_ptr<const MapCatalog> maps_;
    Egress &egress_;
    SimContext ctx_;
    PhysicsEngine physics_;
    EffectManager effects_;
    InputHandler input_;
    uint64_t server_tick_{0};
    uint64_t player_seq_{0};
    // Serialized PersonalState last delivered to each player; a differing view marks the player dirty.
    std::unordered_map<std::string, std::string> last_sent_personal_;
    std::vector<std::string> personal_sent_;
};

} // namespace astro::game
