/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file reprojector.hpp
#pragma once
#ifndef PCH
    #include "geoindex/crs/crs_registry.hpp"
    #include "geoindex/gis/geometry.hpp"
#endif

namespace geoindex::crs
{
    /// @brief CRS tag carried by every successfully reprojected collection.
    inline constexpr std::string_view target_crs_code {"EPSG:4326"};

    /// @brief Converts every position of a geometry tree with `definition`, keeping the shape of the tree.
    /// @throws transform_error If any position fails to convert.
    gis::geometry transform_geometry(const gis::geometry& geom, const crs_definition& definition) noexcept(false);

    /// @brief Reprojects a collection to WGS84 longitude/latitude, best effort.
    /// Positions are converted with the definition `registry` holds for `collection.crs`, and the result is tagged
    /// with `target_crs_code`. When the collection declares no CRS the input is returned as is. When the CRS is
    /// unknown or any conversion fails, a warning is written to std::cerr and an unchanged copy is returned.
    gis::feature_collection reproject(const gis::feature_collection& collection, const crs_registry& registry);

} // namespace geoindex::crs
