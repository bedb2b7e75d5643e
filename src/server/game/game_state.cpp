// SPDX-License-Identifier: Apache-2.0
#include "server/game/game_state.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace astro::game {

const char *power_up_name(PowerUpType type)
{
    switch (type) {
        case PowerUpType::AmmoBoost:
            return "AMMO_BOOST";
        case PowerUpType::SplitShot:
            return "SPLIT_SHOT";
        case PowerUpType::SpeedBoost:
            return "SPEED_BOOST";
        case PowerUpType::MineTrap:
            return "MINE_TRAP";
        case PowerUpType::Shield:
            return "SHIELD";
        case PowerUpType::RapidFire:
            return "RAPID_FIRE";
        case PowerUpType::GhostMode:
            return "GHOST_MODE";
        case PowerUpType::MegaBullet:
            return "MEGA_BULLET";
        case PowerUpType::TeleportDash:
            return "TELEPORT_DASH";
        case PowerUpType::ReverseControls:
            return "REVERSE_CONTROLS";
    }
    return "UNKNOWN";
}

const char *phase_name(RoundPhase phase)
{
    switch (phase) {
        case RoundPhase::Waiting:
            return "WAITING";
        case RoundPhase::Playing:
            return "PLAYING";
        case RoundPhase::Ended:
            return "ENDED";
    }
    return "UNKNOWN";
}

bool Player::has_effect(PowerUpType type) const
{
    return std::any_of(
        active_effects.begin(), active_effects.end(), [type](const ActiveEffect &e) { return e.type == type; });
}

ActiveEffect *Player::find_effect(PowerUpType type)
{
    auto it = std::find_if(
        active_effects.begin(), active_effects.end(), [type](const ActiveEffect &e) { return e.type == type; });
    return it == active_effects.end() ? nullptr : &*it;
}

Player *GameState::find_player(std::string_view id)
{
    auto it = std::find_if(players.begin(), players.end(), [id](const Player &p) { return p.id == id; });
    return it == players.end() ? nullptr : &*it;
}

const Player *GameState::find_player(std::string_view id) const
{
    auto it = std::find_if(players.begin(), players.end(), [id](const Player &p) { return p.id == id; });
    return it == players.end() ? nullptr : &*it;
}

std::string GameState::next_id(std::string_view prefix)
{
    std::string id(prefix);
    id += std::to_string(next_entity_seq++);
    return id;
}

namespace {

float hue_to_channel(float p, float q, float t)
{
    if (t < 0.f)
        t += 1.f;
    if (t > 1.f)
        t -= 1.f;
    if (t < 1.f / 6.f)
        return p + (q - p) * 6.f * t;
    if (t < 1.f / 2.f)
        return q;
    if (t < 2.f / 3.f)
        return p + (q - p) * (2.f / 3.f - t) * 6.f;
    return p;
}

} // namespace

std::string player_color(size_t index)
{
    // Full saturation, medium lightness; 34 degree steps starting at 10 degrees.
    float h = static_cast<float>((10 + (index % 15) * 34) % 360) / 360.f;
    const float s = 1.f;
    const float l = 0.5f;
    float q = l < 0.5f ? l * (1.f + s) : l + s - l * s;
    float p = 2.f * l - q;
    auto to_byte = [](float c) { return static_cast<unsigned>(std::lround(std::clamp(c, 0.f, 1.f) * 255.f)); };
    char buf[8];
    std::snprintf(
        buf,
        sizeof(buf),
        "#%02X%02X%02X",
        to_byte(hue_to_channel(p, q, h + 1.f / 3.f)),
        to_byte(hue_to_channel(p, q, h)),
        to_byte(hue_to_channel(p, q, h - 1.f / 3.f)));
    return buf;
}

} // namespace astro::game
