/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file polygon_indexer.cpp
#include "geoindex/gis/polygon_indexer.hpp"
#include "geoindex/gis/bounding_box_indexer.hpp"
#include "geoindex/gis/geohash_codec.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace geoindex::gis
{
    /// Largest distance, in degrees, of a vertex from the line through the others for the ring to count as collinear.
    static constexpr double collinear_tolerance_degrees {1e-9};

    polygon polygon_indexer::normalize_ring(const polygon& ring) noexcept(false)
    {
        polygon result {};
        result.reserve(ring.size());
        for (const coordinate& vertex: ring)
        {
            if (!vertex.is_valid())
            {
                std::ostringstream oss {};
                oss << "polygon vertex " << vertex << " is not a valid coordinate";
                throw std::invalid_argument(oss.str());
            }
            if (result.empty() || (result.back() != vertex))
                result.push_back(vertex);
        }
        // Drop the explicit closing vertex, the ring is closed implicitly.
        while ((result.size() > 1u) && (result.front() == result.back()))
            result.pop_back();

        std::vector<std::pair<double, double>> distinct {};
        distinct.reserve(result.size());
        for (const coordinate& vertex: result)
            distinct.emplace_back(vertex.lat, vertex.lon);
        std::sort(distinct.begin(), distinct.end());
        distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());
        if (distinct.size() < 3u)
            throw std::invalid_argument("polygon needs at least 3 distinct vertices, got " + std::to_string(distinct.size()));

        // Cross products are taken relative to the first vertex.
        const coordinate& origin {result.front()};
        const coordinate* farthest {&origin};
        double farthest_squared {};
        for (const coordinate& vertex: result)
        {
            const double d_lat {vertex.lat - origin.lat};
            const double d_lon {vertex.lon - origin.lon};
            const double squared {d_lat * d_lat + d_lon * d_lon};
            if (squared > farthest_squared)
            {
                farthest_squared = squared;
                farthest = &vertex;
            }
        }

        const double axis_lat {farthest->lat - origin.lat};
        const double axis_lon {farthest->lon - origin.lon};
        const double axis_length {std::sqrt(farthest_squared)};
        const bool collinear {std::all_of(result.cbegin(), result.cend(),
                                          [&](const coordinate& vertex)
                                          {
                                              const double cross {axis_lon * (vertex.lat - origin.lat) - axis_lat * (vertex.lon - origin.lon)};
                                              return std::abs(cross) <= collinear_tolerance_degrees * axis_length;
                                          })};
        if (collinear)
            throw std::invalid_argument("polygon vertices are collinear, the ring encloses no area");

        return result;
    }

    bool polygon_indexer::contains(const polygon& ring, const coordinate& point) noexcept
    {
        bool inside {};
        if (ring.empty())
            return inside;

        for (std::size_t i {}, j {ring.size() - 1u}; i < ring.size(); j = i++)
        {
            const coordinate& a {ring[i]};
            const coordinate& b {ring[j]};
            if ((a.lat > point.lat) != (b.lat > point.lat))
            {
                const double crossing_lon {a.lon + (point.lat - a.lat) * (b.lon - a.lon) / (b.lat - a.lat)};
                if (point.lon < crossing_lon)
                    inside = !inside;
            }
        }
        return inside;
    }

    bool polygon_indexer::segment_touches_box(const coordinate& a, const coordinate& b, const bounding_box& box) noexcept
    {
        double t_enter {0.0};
        double t_exit {1.0};
        // Narrows [t_enter, t_exit] to the part of the segment on the inner side of one box edge.
        const auto clip = [&t_enter, &t_exit](const double denominator, const double numerator) noexcept
        {
            if (denominator == 0.0)
                return numerator >= 0.0; // parallel to the edge: inside or outside as a whole

            const double t {numerator / denominator};
            if (denominator < 0.0)
            {
                if (t > t_exit)
                    return false;
                t_enter = std::max(t_enter, t);
            }
            else
            {
                if (t < t_enter)
                    return false;
                t_exit = std::min(t_exit, t);
            }
            return true;
        };

        const double d_lon {b.lon - a.lon};
        const double d_lat {b.lat - a.lat};
        return clip(-d_lon, a.lon - box.min_lon) && clip(d_lon, box.max_lon - a.lon) && clip(-d_lat, a.lat - box.min_lat) &&
               clip(d_lat, box.max_lat - a.lat);
    }

    bool polygon_indexer::edges_touch(const polygon& ring, const bounding_box& cell) noexcept
    {
        if (ring.empty())
            return false;

        for (std::size_t i {}, j {ring.size() - 1u}; i < ring.size(); j = i++)
            if (segment_touches_box(ring[j], ring[i], cell))
                return true;

        return false;
    }

    void polygon_indexer::collect_cells(const polygon& ring, const int precision, const std::stop_token& stop, hash_set& cells) noexcept(false)
    {
        bounding_box extent {};
        for (const coordinate& vertex: ring)
            extent.update(vertex.lat, vertex.lon);

        // Rows are refined as the walk produces them, so a stop request never waits for the whole candidate set.
        bounding_box_indexer::walk_rows(extent, precision,
                                        [&ring, &stop, &cells](hash_set&& row)
                                        {
                                            for (const std::string& candidate: row)
                                            {
                                                if (stop.stop_requested())
                                                    throw enumeration_cancelled("polygon enumeration cancelled");

                                                if (cells.contains(candidate))
                                                    continue;

                                                const bounding_box cell {geohash_codec::decode_bounding_box(candidate)};
                                                if (contains(ring, cell.center()) || edges_touch(ring, cell))
                                                    cells.insert(candidate);
                                            }
                                        });
    }

    hash_set polygon_indexer::enumerate(const polygon& ring, const int precision, std::stop_token stop) noexcept(false)
    {
        geohash_codec::validate_precision(precision);
        const polygon normalized {normalize_ring(ring)};

        hash_set cells {};
        collect_cells(normalized, precision, stop, cells);
        return cells;
    }

    hash_set polygon_indexer::enumerate(const polygon& ring, const int precision) noexcept(false)
    {
        return enumerate(ring, precision, std::stop_token {});
    }

    hash_set polygon_indexer::enumerate(const std::vector<polygon>& rings, const int precision, std::stop_token stop) noexcept(false)
    {
        geohash_codec::validate_precision(precision);
        if (rings.empty())
            throw std::invalid_argument("no polygon to enumerate");

        std::vector<polygon> normalized {};
        normalized.reserve(rings.size());
        for (const polygon& ring: rings)
            normalized.push_back(normalize_ring(ring));

        hash_set cells {};
        for (const polygon& ring: normalized)
            collect_cells(ring, precision, stop, cells);
        return cells;
    }

    std::future<hash_set> polygon_indexer::enumerate_async(thread_pool& pool, polygon ring, const int precision,
                                                           std::stop_token stop) noexcept(false)
    {
        geohash_codec::validate_precision(precision);
        polygon normalized {normalize_ring(ring)};

        return pool.enqueue_task(
            [normalized = std::move(normalized), precision, stop = std::move(stop)]()
            {
                hash_set cells {};
                collect_cells(normalized, precision, stop, cells);
                return cells;
            });
    }

} // namespace geoindex::gis
