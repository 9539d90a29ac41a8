/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file neighbor_resolver.hpp
#pragma once
#ifndef PCH
    #include "geoindex/gis/types.hpp"
    #include <string>
    #include <string_view>
#endif

namespace geoindex::gis
{
    /// @brief Finds the cells adjacent to a geohash at the same precision.
    /// Neighbors are found by moving one full cell height/width from the cell center and re-encoding.
    /// Edge policy: longitude wraps at +/-180 degrees, so the cell east of the last column is in the first
    /// column; latitude is clamped at +/-90 degrees, so the north neighbor of a top-row cell (and the south
    /// neighbor of a bottom-row cell) is the cell itself.
    class neighbor_resolver
    {
    public:
        /// @brief All eight neighbors of a geohash.
        /// @throws std::invalid_argument If `hash` is not a valid geohash.
        static neighbor_map neighbors(std::string_view hash) noexcept(false);

        /// @brief The neighbor of a geohash in one direction.
        /// @throws std::invalid_argument If `hash` is not a valid geohash.
        static std::string neighbor(std::string_view hash, direction dir) noexcept(false);

        /// @brief The neighbor of a geohash in the direction named by a compass string ("n", "ne", ..., "nw").
        /// @throws std::invalid_argument If `hash` is not a valid geohash or `direction_name` is unknown.
        static std::string neighbor(std::string_view hash, std::string_view direction_name) noexcept(false);

    private:
        /// @brief Re-encodes the point one cell away from the center of `cell` in direction `dir`.
        static std::string step(const bounding_box& cell, direction dir, int precision) noexcept(false);

        /// @brief Brings a longitude that overshot the antimeridian back into [-180, 180].
        static double wrap_longitude(double lon) noexcept;
    };

} // namespace geoindex::gis
