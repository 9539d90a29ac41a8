/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file bounding_box_indexer.cpp
#include "geoindex/gis/bounding_box_indexer.hpp"
#include "geoindex/gis/geohash_codec.hpp"
#include "geoindex/gis/neighbor_resolver.hpp"
#include <sstream>
#include <stdexcept>
#include <utility>

namespace geoindex::gis
{
    void bounding_box_indexer::collect_row(const std::string& row_start, const bounding_box& box, hash_set& cells) noexcept(false)
    {
        std::string current {row_start};
        bounding_box current_bounds {geohash_codec::decode_bounding_box(current)};
        while (true)
        {
            cells.insert(current);

            std::string next {neighbor_resolver::neighbor(current, direction::e)};
            const bounding_box next_bounds {geohash_codec::decode_bounding_box(next)};
            // A step that lands further west has wrapped around the antimeridian.
            if ((next_bounds.min_lon <= current_bounds.min_lon) || !next_bounds.intersects(box))
                break;

            current = std::move(next);
            current_bounds = next_bounds;
        }
    }

    void bounding_box_indexer::walk_rows(const bounding_box& box, const int precision,
                                         const std::function<void(hash_set&& row)>& on_row) noexcept(false)
    {
        geohash_codec::validate_precision(precision);
        if (!box.is_well_formed())
        {
            std::ostringstream oss {};
            oss << "bounding box " << box << " is not well formed";
            throw std::invalid_argument(oss.str());
        }

        std::string row_start {geohash_codec::encode({box.min_lat, box.min_lon}, precision)};
        while (true)
        {
            hash_set row {};
            collect_row(row_start, box, row);
            on_row(std::move(row));

            std::string next_row {neighbor_resolver::neighbor(row_start, direction::n)};
            // Latitude is clamped at the pole, so the north neighbor of the top row is the row itself.
            if ((next_row == row_start) || !geohash_codec::decode_bounding_box(next_row).intersects(box))
                break;

            row_start = std::move(next_row);
        }
    }

    hash_set bounding_box_indexer::enumerate(const bounding_box& box, const int precision, const std::stop_token& stop) noexcept(false)
    {
        hash_set cells {};
        walk_rows(box, precision,
                  [&cells, &stop](hash_set&& row)
                  {
                      if (stop.stop_requested())
                          throw enumeration_cancelled("bounding box enumeration cancelled");
                      cells.merge(row);
                  });
        return cells;
    }

    hash_set bounding_box_indexer::enumerate(const bounding_box& box, const int precision) noexcept(false)
    {
        return enumerate(box, precision, std::stop_token {});
    }

} // namespace geoindex::gis
