/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file types.hpp
#pragma once
#ifndef PCH
    #include "geoindex/gis/bounding_box.hpp"
    #include "geoindex/gis/geometry.hpp"
    #include <array>
    #include <cstdint>
    #include <optional>
    #include <set>
    #include <stdexcept>
    #include <string>
    #include <string_view>
    #include <vector>
#endif

namespace geoindex::gis
{
    /// @brief An ordered, duplicate-free set of geohashes, all of the same precision.
    using hash_set = std::set<std::string>;

    /// @brief Thrown by a cell enumeration that observed a stop request. Partial results are discarded.
    class enumeration_cancelled: public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /// @brief A simple ring of vertices, implicitly closed. A repeated closing vertex is allowed.
    using polygon = std::vector<coordinate>;

    /// @brief Compass directions on the geohash grid.
    enum class direction : std::uint8_t
    {
        n,
        ne,
        e,
        se,
        s,
        sw,
        w,
        nw
    };

    inline constexpr std::size_t direction_count {8u};

    inline constexpr std::array<direction, direction_count> all_directions {direction::n,  direction::ne, direction::e,  direction::se,
                                                                           direction::s,  direction::sw, direction::w,  direction::nw};

    /// @brief Lowercase compass name of a direction ("n", "ne", ...).
    std::string_view to_string(direction dir) noexcept;

    /// @brief Parses a lowercase compass name.
    /// @return The direction, or an empty optional if the name is not one of the eight compass names.
    std::optional<direction> parse_direction(std::string_view name) noexcept;

    /// @brief The eight cells surrounding a geohash, indexed by direction.
    struct neighbor_map
    {
        std::array<std::string, direction_count> cells {};

        const std::string& operator[](const direction dir) const noexcept { return cells[static_cast<std::size_t>(dir)]; }
        std::string& operator[](const direction dir) noexcept { return cells[static_cast<std::size_t>(dir)]; }

        bool operator==(const neighbor_map&) const = default;
    };

    /// @brief Angular size of a geohash cell of a given precision.
    struct cell_dimensions
    {
        /// @brief Height of the cell in degrees of latitude.
        double lat_height {};
        /// @brief Width of the cell in degrees of longitude.
        double lon_width {};
    };

    /// @brief Holds input data required for a parallel task that covers a feature with geohashes.
    /// This structure is designed to be passed by value or moved into a task.
    struct task_input_data
    {
        /// @brief Name of the feature, read from the configured name column or synthesized.
        std::string feature_name {};
        /// @brief The feature geometry, already expressed in WGS84 longitude/latitude.
        geometry geom {};
        /// @brief Geohash precision to cover the geometry with.
        int precision {};
    };

    /// @brief Holds the result produced by a parallel geohash covering task.
    struct task_result
    {
        /// @brief The name of the feature, corresponding to `task_input_data::feature_name`.
        std::string feature_name {};
        /// @brief The WGS84 bounding box of the feature geometry.
        bounding_box bbox {};
        /// @brief Mean of the exterior ring vertices of the first polygon.
        position center {};
        /// @brief Cells touching or covering the feature.
        hash_set cells {};
    };

} // namespace geoindex::gis
