/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file neighbor_resolver.cpp
#include "geoindex/gis/neighbor_resolver.hpp"
#include "geoindex/gis/geohash_codec.hpp"
#include <algorithm>
#include <stdexcept>

namespace geoindex::gis
{
    /// @brief Unit steps {lat, lon} for every direction, in `direction` order.
    static constexpr std::array<std::array<int, 2u>, direction_count> direction_offsets {{
        {+1, 0},  // n
        {+1, +1}, // ne
        {0, +1},  // e
        {-1, +1}, // se
        {-1, 0},  // s
        {-1, -1}, // sw
        {0, -1},  // w
        {+1, -1}, // nw
    }};

    double neighbor_resolver::wrap_longitude(const double lon) noexcept
    {
        if (lon > 180.0)
            return lon - 360.0;
        if (lon < -180.0)
            return lon + 360.0;
        return lon;
    }

    std::string neighbor_resolver::step(const bounding_box& cell, const direction dir, const int precision) noexcept(false)
    {
        const auto& offset = direction_offsets[static_cast<std::size_t>(dir)];
        const coordinate center {cell.center()};
        const double height {cell.max_lat - cell.min_lat};
        const double width {cell.max_lon - cell.min_lon};

        const coordinate target {std::clamp(center.lat + offset[0] * height, -90.0, 90.0), wrap_longitude(center.lon + offset[1] * width)};
        return geohash_codec::encode(target, precision);
    }

    neighbor_map neighbor_resolver::neighbors(const std::string_view hash) noexcept(false)
    {
        const bounding_box cell {geohash_codec::decode_bounding_box(hash)};
        const int precision {static_cast<int>(hash.size())};

        neighbor_map result {};
        for (const direction dir: all_directions)
            result[dir] = step(cell, dir, precision);
        return result;
    }

    std::string neighbor_resolver::neighbor(const std::string_view hash, const direction dir) noexcept(false)
    {
        return step(geohash_codec::decode_bounding_box(hash), dir, static_cast<int>(hash.size()));
    }

    std::string neighbor_resolver::neighbor(const std::string_view hash, const std::string_view direction_name) noexcept(false)
    {
        const std::optional<direction> dir {parse_direction(direction_name)};
        if (!dir.has_value())
            throw std::invalid_argument("unknown neighbor direction \"" + std::string(direction_name) + "\", expected one of n/ne/e/se/s/sw/w/nw");

        return neighbor(hash, *dir);
    }

} // namespace geoindex::gis
