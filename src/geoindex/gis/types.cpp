/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file types.cpp
#include "geoindex/gis/types.hpp"
#include <type_traits>

namespace geoindex::gis
{
    static constexpr std::array<std::string_view, direction_count> direction_names {"n", "ne", "e", "se", "s", "sw", "w", "nw"};

    std::string_view to_string(const direction dir) noexcept
    {
        return direction_names[static_cast<std::size_t>(dir)];
    }

    std::optional<direction> parse_direction(const std::string_view name) noexcept
    {
        for (std::size_t i {}; i < direction_count; ++i)
            if (direction_names[i] == name)
                return all_directions[i];

        return {};
    }

    std::string_view geometry_type_name(const geometry& geom) noexcept
    {
        return std::visit(
            [](const auto& g) -> std::string_view
            {
                using T = std::decay_t<decltype(g)>;
                if constexpr (std::is_same_v<T, point>)
                    return "Point";
                else if constexpr (std::is_same_v<T, multi_point>)
                    return "MultiPoint";
                else if constexpr (std::is_same_v<T, line_string>)
                    return "LineString";
                else if constexpr (std::is_same_v<T, multi_line_string>)
                    return "MultiLineString";
                else if constexpr (std::is_same_v<T, polygon_geometry>)
                    return "Polygon";
                else
                    return "MultiPolygon";
            },
            geom);
    }

} // namespace geoindex::gis
