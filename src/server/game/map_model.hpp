// SPDX-License-Identifier: Apache-2.0
// map_model.hpp - Block grid maps and the catalog rounds pick from.
#pragma once

#include <cstdint>
#include <iosfwd>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace astro::game {

struct Block
{
    int32_t grid_x{0};
    int32_t grid_y{0};

    bool operator==(const Block &) const = default;
};

struct MapModel
{
    std::string name{"open"};
    int32_t grid_width{48};
    int32_t grid_height{27};
    float block_size{40.f};
    std::vector<Block> blocks;

    float field_width() const { return static_cast<float>(grid_width) * block_size; }
    float field_height() const { return static_cast<float>(grid_height) * block_size; }
};

// Parses an ASCII layout where '#' marks a block. Rows and columns beyond the grid are ignored.
MapModel parse_ascii_map(std::string name, std::istream &in, int32_t grid_width, int32_t grid_height, float block_size);

class MapCatalog
{
public:
    // Loads <dir>/<name>.txt for every name; unreadable files are skipped with a warning.
    // Throws std::runtime_error when nothing could be loaded.
    static MapCatalog load_directory(
        const std::string &dir,
        const std::vector<std::string> &names,
        int32_t grid_width,
        int32_t grid_height,
        float block_size);

    void add(MapModel map);
    // Throws std::runtime_error on an empty catalog.
    const MapModel &pick_random(std::mt19937 &rng) const;
    const MapModel *find(std::string_view name) const;
    std::vector<std::string> names() const;
    size_t size() const { return maps_.size(); }
    bool empty() const { return maps_.empty(); }

private:
    std::vector<MapModel> maps_;
};

} // namespace astro::game
