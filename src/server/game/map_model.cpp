// SPDX-License-Identifier: Apache-2.0
#include "server/game/map_model.hpp"

#include "common/logger.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace astro::game {

MapModel parse_ascii_map(std::string name, std::istream &in, int32_t grid_width, int32_t grid_height, float block_size)
{
    MapModel map;
    map.name = std::move(name);
    map.grid_width = grid_width;
    map.grid_height = grid_height;
    map.block_size = block_size;
    std::string line;
    int32_t y = 0;
    while (y < grid_height && std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        int32_t limit = std::min<int32_t>(grid_width, static_cast<int32_t>(line.size()));
        for (int32_t x = 0; x < limit; ++x) {
            if (line[static_cast<size_t>(x)] == '#') {
                map.blocks.push_back(Block{x, y});
            }
        }
        ++y;
    }
    return map;
}

MapCatalog MapCatalog::load_directory(
    const std::string &dir,
    const std::vector<std::string> &names,
    int32_t grid_width,
    int32_t grid_height,
    float block_size)
{
    MapCatalog catalog;
    for (const auto &name : names) {
        std::string path = dir + "/" + name + ".txt";
        std::ifstream in(path);
        if (!in) {
            astro::log::warn("[maps] cannot read {} (skipped)", path);
            continue;
        }
        MapModel map = parse_ascii_map(name, in, grid_width, grid_height, block_size);
        astro::log::info("[maps] loaded {} blocks={}", name, map.blocks.size());
        catalog.add(std::move(map));
    }
    if (catalog.empty()) {
        throw std::runtime_error("no maps could be loaded from " + dir);
    }
    return catalog;
}

void MapCatalog::add(MapModel map)
{
    maps_.push_back(std::move(map));
}

const MapModel &MapCatalog::pick_random(std::mt19937 &rng) const
{
    if (maps_.empty()) {
        throw std::runtime_error("map catalog is empty");
    }
    std::uniform_int_distribution<size_t> dist(0, maps_.size() - 1);
    return maps_[dist(rng)];
}

const MapModel *MapCatalog::find(std::string_view name) const
{
    for (const auto &m : maps_) {
        if (m.name == name) {
            return &m;
        }
    }
    return nullptr;
}

std::vector<std::string> MapCatalog::names() const
{
    std::vector<std::string> out;
    out.reserve(maps_.size());
    for (const auto &m : maps_) {
        out.push_back(m.name);
    }
    return out;
}

} // namespace astro::game
