/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file geometry_processor.hpp
#pragma once
#ifndef PCH
    #include "geoindex/gis/types.hpp"
    #include <vector>
#endif

namespace geoindex::gis
{
    /// @brief A stateless utility class for walking geometry trees expressed in WGS84 longitude/latitude.
    /// It computes extents and centers and extracts the exterior rings the polygon indexer works on.
    class geometry_processor
    {
    public:
        /// @brief Calculates the bounding box of every position in a geometry.
        /// @param geom The geometry; positions are read as x = longitude, y = latitude.
        /// @return A `bounding_box` representing the calculated extent. The `is_valid` flag of the
        ///         returned box is false when the geometry holds no position.
        static bounding_box calculate_for_geometry(const geometry& geom) noexcept;

        /// @brief Calculates the bounding box of a whole collection.
        static bounding_box calculate_for_collection(const feature_collection& collection) noexcept;

        /// @brief Converts the exterior ring of a polygon into a latitude/longitude ring.
        /// Interior rings (holes) are not part of the result.
        static polygon to_polygon(const polygon_geometry& polygon_geom) noexcept(false);

        /// @brief Exterior rings of a Polygon or of every member of a MultiPolygon.
        /// @return An empty vector for non-polygonal geometries.
        static std::vector<polygon> to_polygons(const geometry& geom) noexcept(false);

        /// @brief Arithmetic mean of a sequence of positions.
        /// @throws std::invalid_argument If `positions` is empty.
        static position centroid(const std::vector<position>& positions) noexcept(false);

        /// @brief Center of a collection: the centroid of the exterior ring of its first feature, or of the
        /// first polygon's exterior ring when that feature is a MultiPolygon.
        /// @throws std::invalid_argument If the collection is empty or its first feature is not polygonal.
        static position find_center(const feature_collection& collection) noexcept(false);

        /// @brief Center of a single Polygon or MultiPolygon, computed as for a collection.
        /// @throws std::invalid_argument If the geometry is not polygonal or has no exterior ring.
        static position find_center(const geometry& geom) noexcept(false);

    private:
        /// @brief Updates a given bounding box with a sequence of positions.
        /// @param bb The `bounding_box` object to be updated (passed by reference).
        /// @param positions Positions read as x = longitude, y = latitude.
        static void update_bbox_from_coordinates(bounding_box& bb, const std::vector<position>& positions) noexcept;

        /// @brief Processes a single polygon, including its rings, and updates the bounding box.
        static void process_single_polygon_for_bbox(bounding_box& bbox, const polygon_geometry& polygon_geom) noexcept;
    };

} // namespace geoindex::gis
