/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file geometry_processor.cpp
#include "geoindex/gis/geometry_processor.hpp"
#include <stdexcept>
#include <type_traits>

namespace geoindex::gis
{
    // Updates a given bounding box with a sequence of positions.
    void geometry_processor::update_bbox_from_coordinates(bounding_box& bb, const std::vector<position>& positions) noexcept
    {
        for (const position& p: positions)
            bb.update(p.y, p.x);
    }

    // Processes a single polygon, including its rings.
    void geometry_processor::process_single_polygon_for_bbox(bounding_box& bbox, const polygon_geometry& polygon_geom) noexcept
    {
        for (const linear_ring& ring: polygon_geom.rings)
            update_bbox_from_coordinates(bbox, ring);
    }

    // Calculates the bounding box for any geometry alternative.
    bounding_box geometry_processor::calculate_for_geometry(const geometry& geom) noexcept
    {
        bounding_box bbox {}; // Initialize an empty, invalid bounding box
        std::visit(
            [&bbox](const auto& g)
            {
                using T = std::decay_t<decltype(g)>;
                if constexpr (std::is_same_v<T, point>)
                    bbox.update(g.coordinates.y, g.coordinates.x);
                else if constexpr (std::is_same_v<T, multi_point> || std::is_same_v<T, line_string>)
                    update_bbox_from_coordinates(bbox, g.coordinates);
                else if constexpr (std::is_same_v<T, multi_line_string>)
                {
                    for (const auto& line: g.coordinates)
                        update_bbox_from_coordinates(bbox, line);
                }
                else if constexpr (std::is_same_v<T, polygon_geometry>)
                    process_single_polygon_for_bbox(bbox, g);
                else
                {
                    // The top-level geometry is a MultiPolygon. Its parts are individual Polygons.
                    for (const polygon_geometry& part: g.polygons)
                        process_single_polygon_for_bbox(bbox, part);
                }
            },
            geom);

        return bbox;
    }

    bounding_box geometry_processor::calculate_for_collection(const feature_collection& collection) noexcept
    {
        bounding_box bbox {};
        for (const feature& f: collection.features)
        {
            const bounding_box part {calculate_for_geometry(f.geom)};
            if (part.is_valid)
            {
                bbox.update(part.min_lat, part.min_lon);
                bbox.update(part.max_lat, part.max_lon);
            }
        }
        return bbox;
    }

    polygon geometry_processor::to_polygon(const polygon_geometry& polygon_geom) noexcept(false)
    {
        polygon ring {};
        if (polygon_geom.rings.empty())
            return ring;

        const linear_ring& exterior {polygon_geom.rings.front()};
        ring.reserve(exterior.size());
        for (const position& p: exterior)
            ring.push_back({p.y, p.x});
        return ring;
    }

    std::vector<polygon> geometry_processor::to_polygons(const geometry& geom) noexcept(false)
    {
        std::vector<polygon> rings {};
        if (const auto* const single = std::get_if<polygon_geometry>(&geom))
            rings.push_back(to_polygon(*single));
        else if (const auto* const multi = std::get_if<multi_polygon>(&geom))
        {
            rings.reserve(multi->polygons.size());
            for (const polygon_geometry& part: multi->polygons)
                rings.push_back(to_polygon(part));
        }
        return rings;
    }

    position geometry_processor::centroid(const std::vector<position>& positions) noexcept(false)
    {
        if (positions.empty())
            throw std::invalid_argument("cannot compute the centroid of an empty sequence");

        const double count {static_cast<double>(positions.size())};
        position sum {};
        for (const position& p: positions)
        {
            sum.x += p.x / count;
            sum.y += p.y / count;
        }
        return sum;
    }

    position geometry_processor::find_center(const feature_collection& collection) noexcept(false)
    {
        if (collection.features.empty())
            throw std::invalid_argument("cannot find the center of an empty feature collection");

        return find_center(collection.features.front().geom);
    }

    position geometry_processor::find_center(const geometry& geom) noexcept(false)
    {
        const polygon_geometry* exterior_owner {std::get_if<polygon_geometry>(&geom)};
        if (const auto* const multi = std::get_if<multi_polygon>(&geom); (multi != nullptr) && !multi->polygons.empty())
            exterior_owner = &multi->polygons.front();

        if ((exterior_owner == nullptr) || exterior_owner->rings.empty())
            throw std::invalid_argument("geometry is not a Polygon or MultiPolygon with an exterior ring");

        return centroid(exterior_owner->rings.front());
    }

} // namespace geoindex::gis
