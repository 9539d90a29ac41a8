/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file reprojector.cpp
#include "geoindex/crs/reprojector.hpp"
#include "geoindex/crs/errors.hpp"
#include <exception>
#include <iostream>
#include <type_traits>

namespace geoindex::crs
{
    static std::vector<gis::position> transform_positions(const std::vector<gis::position>& positions, const crs_definition& definition) noexcept(false)
    {
        std::vector<gis::position> result {};
        result.reserve(positions.size());
        for (const gis::position& p: positions)
            result.push_back(definition.to_wgs84(p));
        return result;
    }

    static gis::polygon_geometry transform_polygon(const gis::polygon_geometry& polygon_geom, const crs_definition& definition) noexcept(false)
    {
        gis::polygon_geometry result {};
        result.rings.reserve(polygon_geom.rings.size());
        for (const gis::linear_ring& ring: polygon_geom.rings)
            result.rings.push_back(transform_positions(ring, definition));
        return result;
    }

    gis::geometry transform_geometry(const gis::geometry& geom, const crs_definition& definition) noexcept(false)
    {
        return std::visit(
            [&definition](const auto& g) -> gis::geometry
            {
                using T = std::decay_t<decltype(g)>;
                if constexpr (std::is_same_v<T, gis::point>)
                    return gis::point {definition.to_wgs84(g.coordinates)};
                else if constexpr (std::is_same_v<T, gis::multi_point> || std::is_same_v<T, gis::line_string>)
                    return T {transform_positions(g.coordinates, definition)};
                else if constexpr (std::is_same_v<T, gis::multi_line_string>)
                {
                    gis::multi_line_string result {};
                    result.coordinates.reserve(g.coordinates.size());
                    for (const auto& line: g.coordinates)
                        result.coordinates.push_back(transform_positions(line, definition));
                    return result;
                }
                else if constexpr (std::is_same_v<T, gis::polygon_geometry>)
                    return transform_polygon(g, definition);
                else
                {
                    gis::multi_polygon result {};
                    result.polygons.reserve(g.polygons.size());
                    for (const gis::polygon_geometry& part: g.polygons)
                        result.polygons.push_back(transform_polygon(part, definition));
                    return result;
                }
            },
            geom);
    }

    gis::feature_collection reproject(const gis::feature_collection& collection, const crs_registry& registry)
    {
        if (!collection.crs || collection.crs->empty())
            return collection;

        try
        {
            const crs_definition& definition {registry.at(*collection.crs)};

            gis::feature_collection result {std::string(target_crs_code), {}};
            result.features.reserve(collection.features.size());
            for (const gis::feature& f: collection.features)
                result.features.push_back({f.name, f.properties, transform_geometry(f.geom, definition)});

            return result;
        }
        catch (const std::exception& e)
        {
            std::cerr << "Warning: Reprojection from " << *collection.crs << " failed, keeping the original coordinates: " << e.what()
                      << std::endl;
        }

        return collection;
    }

} // namespace geoindex::crs
