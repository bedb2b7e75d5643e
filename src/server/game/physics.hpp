// SPDX-License-Identifier: Apache-2.0
// physics.hpp - Ship/bullet integration and collision resolution against the block grid.
#pragma once

#include "server/game/map_model.hpp"
#include "server/game/sim_context.hpp"

#include <box2d/box2d.h>

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace astro::game {

inline constexpr float kTwoPi = 6.28318530718f;

// Wraps an angle into [0, 2pi).
float wrap_angle(float radians);
// Wraps a position around the field edges.
void wrap_to_field(b2Vec2 &p, float field_width, float field_height);

struct WallContact
{
    b2Vec2 normal{0.f, 0.f}; // points from the block towards the circle
    float separation{0.f};
};

class PhysicsEngine
{
public:
    PhysicsEngine();

    // Must be called whenever the round's map changes.
    void rebuild_spatial_index(const MapModel &map);
    void update(SimContext &ctx, uint64_t now_ms);

    // Pure queries against the current index.
    bool is_obstructed(b2Vec2 center, float radius) const;
    std::optional<WallContact> wall_contact(b2Vec2 center, float radius) const;
    size_t indexed_blocks() const { return indexed_blocks_; }

private:
    void integrate_ships(SimContext &ctx, uint64_t now_ms) const;
    void integrate_bullets(SimContext &ctx, uint64_t now_ms) const;
    void resolve_bullet_hits(SimContext &ctx) const;
    void resolve_ship_contacts(SimContext &ctx) const;

    static uint64_t cell_key(int32_t x, int32_t y)
    {
        return (static_cast<uint64_t>(static_cast<uint32_t>(x)) << 32) | static_cast<uint32_t>(y);
    }

    std::unordered_map<uint64_t, std::vector<Block>> grid_;
    size_t indexed_blocks_{0};
    int32_t grid_width_{0};
    int32_t grid_height_{0};
    float block_size_{1.f};
    float field_width_{0.f};
    float field_height_{0.f};
    b2Polygon block_shape_{};
};

} // namespace astro::game
