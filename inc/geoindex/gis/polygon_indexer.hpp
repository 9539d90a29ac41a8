/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file polygon_indexer.hpp
#pragma once
#ifndef PCH
    #include "geoindex/gis/types.hpp"
    #include "geoindex/thread_pool.hpp"
    #include <future>
    #include <stop_token>
    #include <vector>
#endif

namespace geoindex::gis
{
    /// @brief Enumerates the geohash cells of a fixed precision that touch or cover a simple polygon.
    /// Candidates come from the polygon's bounding box; a candidate is kept when its center lies inside the ring
    /// (even-odd rule) or when any ring edge touches the cell rectangle. Cells that only partially overlap the
    /// polygon are therefore part of the result.
    class polygon_indexer
    {
    public:
        /// @brief Covers a ring with cells of length `precision`.
        /// @param ring At least three distinct vertices that are not all collinear. Closing vertex optional.
        /// Self-intersecting rings are accepted.
        /// @param precision Geohash length of the result. Must be positive.
        /// @throws std::invalid_argument If `precision` is not positive, a vertex is not a valid coordinate,
        ///         or the ring is degenerate.
        static hash_set enumerate(const polygon& ring, int precision) noexcept(false);

        /// @brief Cancellable variant of `enumerate`. The stop token is polled once per candidate row and
        /// between candidate cells.
        /// @throws enumeration_cancelled If a stop was requested before the enumeration completed.
        static hash_set enumerate(const polygon& ring, int precision, std::stop_token stop) noexcept(false);

        /// @brief Union of the coverings of several rings (e.g. the exterior rings of a multipolygon).
        /// @throws std::invalid_argument If `rings` is empty or any ring is invalid.
        /// @throws enumeration_cancelled If a stop was requested before the enumeration completed.
        static hash_set enumerate(const std::vector<polygon>& rings, int precision, std::stop_token stop = {}) noexcept(false);

        /// @brief Runs `enumerate` on a worker of `pool`.
        /// Arguments are validated before the task is queued, so invalid input throws here; cancellation is
        /// reported through the returned future.
        /// @throws std::invalid_argument On invalid input.
        /// @throws std::runtime_error If `pool` is stopping.
        static std::future<hash_set> enumerate_async(thread_pool& pool, polygon ring, int precision,
                                                     std::stop_token stop = {}) noexcept(false);

        /// @brief Point-in-polygon test using the even-odd rule (ray cast towards increasing longitude).
        static bool contains(const polygon& ring, const coordinate& point) noexcept;

        /// @brief Tests whether any edge of the implicitly closed ring touches `cell` (edges included).
        static bool edges_touch(const polygon& ring, const bounding_box& cell) noexcept;

        /// @brief Removes the closing vertex and consecutive duplicates, then checks the ring is usable.
        /// @throws std::invalid_argument If a vertex is invalid, fewer than three distinct vertices remain,
        ///         or all vertices lie on one straight line.
        static polygon normalize_ring(const polygon& ring) noexcept(false);

    private:
        /// @brief Enumeration over an already normalized ring.
        static void collect_cells(const polygon& ring, int precision, const std::stop_token& stop, hash_set& cells) noexcept(false);

        /// @brief Liang-Barsky clip of the segment [a, b] against `box`.
        static bool segment_touches_box(const coordinate& a, const coordinate& b, const bounding_box& box) noexcept;
    };

} // namespace geoindex::gis
