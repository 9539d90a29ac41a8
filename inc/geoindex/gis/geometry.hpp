/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file geometry.hpp
#pragma once
#ifndef PCH
    #include <map>
    #include <optional>
    #include <string>
    #include <string_view>
    #include <variant>
    #include <vector>
#endif

namespace geoindex::gis
{
    /// @brief A raw coordinate pair in GeoJSON order: x is longitude (or easting), y is latitude (or northing).
    /// The unit depends on the CRS of the collection that owns it.
    struct position
    {
        double x {};
        double y {};

        bool operator==(const position&) const = default;
    };

    using linear_ring = std::vector<position>;

    struct point
    {
        position coordinates {};

        bool operator==(const point&) const = default;
    };

    struct multi_point
    {
        std::vector<position> coordinates {};

        bool operator==(const multi_point&) const = default;
    };

    struct line_string
    {
        std::vector<position> coordinates {};

        bool operator==(const line_string&) const = default;
    };

    struct multi_line_string
    {
        std::vector<std::vector<position>> coordinates {};

        bool operator==(const multi_line_string&) const = default;
    };

    /// @brief A polygon made of rings; the first ring is the exterior, the others are holes.
    struct polygon_geometry
    {
        std::vector<linear_ring> rings {};

        bool operator==(const polygon_geometry&) const = default;
    };

    struct multi_polygon
    {
        std::vector<polygon_geometry> polygons {};

        bool operator==(const multi_polygon&) const = default;
    };

    /// @brief Tagged geometry tree. The alternative held plays the role of the GeoJSON "type" member.
    using geometry = std::variant<point, multi_point, line_string, multi_line_string, polygon_geometry, multi_polygon>;

    /// @brief A geometry together with its identifying name and free-form string properties.
    struct feature
    {
        std::string name {};
        std::map<std::string, std::string> properties {};
        geometry geom {};

        bool operator==(const feature&) const = default;
    };

    /// @brief A list of features sharing one coordinate reference system.
    struct feature_collection
    {
        /// @brief Name of the CRS the coordinates are expressed in (e.g. "EPSG:3857"); empty when undeclared.
        std::optional<std::string> crs {};
        std::vector<feature> features {};

        bool operator==(const feature_collection&) const = default;
    };

    /// @brief GeoJSON type name of the alternative held by `geom` ("Point", "Polygon", ...).
    std::string_view geometry_type_name(const geometry& geom) noexcept;

} // namespace geoindex::gis
