/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file bounding_box_indexer.hpp
#pragma once
#ifndef PCH
    #include "geoindex/gis/types.hpp"
    #include <functional>
    #include <stop_token>
    #include <string>
#endif

namespace geoindex::gis
{
    /// @brief Enumerates the geohash cells of a fixed precision that intersect a latitude/longitude rectangle.
    class bounding_box_indexer
    {
    public:
        /// @brief Collects every cell whose bounds intersect `box` (edges included).
        /// The walk starts at the cell containing the south-west corner, moves east along each row and north
        /// from row to row, and stops as soon as a stepped cell leaves the box. Walks never cross the
        /// antimeridian or go past a pole.
        /// @param box A valid box with `min_lat <= max_lat` and `min_lon <= max_lon`, within coordinate ranges.
        /// @param precision Geohash length of the result. Must be positive.
        /// @throws std::invalid_argument If `precision` is not positive or `box` is not well formed.
        static hash_set enumerate(const bounding_box& box, int precision) noexcept(false);

        /// @brief Cancellable variant of `enumerate`. The stop token is polled once per row.
        /// @throws enumeration_cancelled If a stop was requested before the walk completed.
        static hash_set enumerate(const bounding_box& box, int precision, const std::stop_token& stop) noexcept(false);

        /// @brief Walks the same rows as `enumerate`, south to north, handing each row to `on_row` as soon as it is built.
        /// Exceptions thrown by `on_row` end the walk and propagate to the caller.
        /// @throws std::invalid_argument If `precision` is not positive or `box` is not well formed.
        static void walk_rows(const bounding_box& box, int precision, const std::function<void(hash_set&& row)>& on_row) noexcept(false);

    private:
        /// @brief Inserts the cells of one row, from `row_start` eastwards, into `cells`.
        static void collect_row(const std::string& row_start, const bounding_box& box, hash_set& cells) noexcept(false);
    };

} // namespace geoindex::gis
