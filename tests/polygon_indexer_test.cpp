/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file polygon_indexer_test.cpp
#include "geoindex/gis/bounding_box_indexer.hpp"
#include "geoindex/gis/geohash_codec.hpp"
#include "geoindex/gis/polygon_indexer.hpp"
#include <algorithm>
#include <chrono>
#include <gtest/gtest.h>
#include <stdexcept>
#include <stop_token>
#include <thread>

namespace geoindex::gis
{
    namespace
    {
        bounding_box extent_of(const polygon& ring)
        {
            bounding_box box {};
            for (const coordinate& vertex: ring)
                box.update(vertex.lat, vertex.lon);
            return box;
        }

        // Precision-1 cells are 45 x 45 degrees: s, t, w along the bottom row and u, v, y above them.
        const polygon l_shape {{5.0, 5.0}, {5.0, 130.0}, {40.0, 130.0}, {40.0, 40.0}, {85.0, 40.0}, {85.0, 5.0}};
    } // namespace

    TEST(PolygonIndexer, TriangleInsideOneCell)
    {
        const polygon triangle {{56.5, 10.0}, {56.5, 11.0}, {57.5, 10.5}};
        const hash_set cells {polygon_indexer::enumerate(triangle, 3)};
        EXPECT_EQ(cells.size(), 1u);
        EXPECT_EQ(cells, hash_set {"u4p"});
    }

    TEST(PolygonIndexer, ConcaveRingSkipsNotch)
    {
        EXPECT_EQ(polygon_indexer::enumerate(l_shape, 1), (hash_set {"s", "t", "u", "w"}));
        EXPECT_EQ(bounding_box_indexer::enumerate(extent_of(l_shape), 1).size(), 6u);
    }

    TEST(PolygonIndexer, PartialOverlapIsIncluded)
    {
        // The sliver crosses s and t without covering either center.
        const polygon sliver {{1.0, 1.0}, {1.0, 50.0}, {2.0, 1.0}};
        EXPECT_EQ(polygon_indexer::enumerate(sliver, 1), (hash_set {"s", "t"}));
    }

    TEST(PolygonIndexer, BoundaryContactIsIncluded)
    {
        const polygon cell_s {{0.0, 0.0}, {0.0, 45.0}, {45.0, 45.0}, {45.0, 0.0}, {0.0, 0.0}};
        EXPECT_EQ(polygon_indexer::enumerate(cell_s, 1), (hash_set {"s", "t", "u", "v"}));
    }

    TEST(PolygonIndexer, ResultIsSubsetOfBoundingBoxCover)
    {
        const polygon rings[] {
            l_shape,
            {{48.85, 2.25}, {48.90, 2.42}, {48.82, 2.47}, {48.80, 2.30}},
            {{-33.9, 18.3}, {-33.8, 18.6}, {-34.2, 18.5}},
            {{10.0, 10.0}, {12.0, 14.0}, {10.0, 14.0}, {12.0, 10.0}}, // self-intersecting bow tie
        };
        for (const polygon& ring: rings)
            for (int precision {1}; precision <= 5; ++precision)
            {
                const hash_set cells {polygon_indexer::enumerate(ring, precision)};
                const hash_set candidates {bounding_box_indexer::enumerate(extent_of(ring), precision)};
                EXPECT_FALSE(cells.empty());
                EXPECT_TRUE(std::includes(candidates.begin(), candidates.end(), cells.begin(), cells.end())) << "precision " << precision;
            }
    }

    TEST(PolygonIndexer, ClosingVertexIsOptional)
    {
        polygon closed {l_shape};
        closed.push_back(l_shape.front());
        EXPECT_EQ(polygon_indexer::enumerate(closed, 2), polygon_indexer::enumerate(l_shape, 2));
        EXPECT_EQ(polygon_indexer::normalize_ring(closed), l_shape);
    }

    TEST(PolygonIndexer, RejectsDegenerateRings)
    {
        EXPECT_THROW(polygon_indexer::enumerate(polygon {}, 3), std::invalid_argument);
        EXPECT_THROW(polygon_indexer::enumerate(polygon {{1.0, 1.0}, {2.0, 2.0}, {1.0, 1.0}}, 3), std::invalid_argument);
        EXPECT_THROW(polygon_indexer::enumerate(polygon {{1.0, 1.0}, {2.0, 2.0}, {3.0, 3.0}}, 3), std::invalid_argument); // collinear
        EXPECT_THROW(polygon_indexer::enumerate(polygon {{1.0, 1.0}, {1.0, 1.0}, {1.0, 1.0}, {1.0, 1.0}}, 3), std::invalid_argument);
        EXPECT_THROW(polygon_indexer::enumerate(polygon {{1.0, 1.0}, {2.0, 2.0}, {95.0, 3.0}}, 3), std::invalid_argument);
        EXPECT_THROW(polygon_indexer::enumerate(l_shape, 0), std::invalid_argument);
    }

    TEST(PolygonIndexer, SelfIntersectingRingIsAccepted)
    {
        // The lobes of a bow tie have opposite orientation, so its signed area is zero.
        const polygon bow_tie {{10.0, 10.0}, {12.0, 14.0}, {10.0, 14.0}, {12.0, 10.0}};
        EXPECT_NO_THROW(polygon_indexer::normalize_ring(bow_tie));

        const hash_set cells {polygon_indexer::enumerate(bow_tie, 3)};
        EXPECT_FALSE(cells.empty());
        EXPECT_TRUE(cells.contains(geohash_codec::encode({11.0, 11.0}, 3)));
    }

    TEST(PolygonIndexer, CollinearRingNearAntimeridianIsRejected)
    {
        const polygon tiny_line {{89.0, 179.0}, {89.0000001, 179.0000001}, {89.0000002, 179.0000002}};
        EXPECT_THROW(polygon_indexer::normalize_ring(tiny_line), std::invalid_argument);

        const polygon tiny_triangle {{89.0, 179.0}, {89.0000001, 179.0000001}, {89.0, 179.0000002}};
        EXPECT_NO_THROW(polygon_indexer::normalize_ring(tiny_triangle));
    }

    TEST(PolygonIndexer, UnionOfRings)
    {
        const polygon triangle {{56.5, 10.0}, {56.5, 11.0}, {57.5, 10.5}};
        const polygon sliver {{1.0, 1.0}, {1.0, 50.0}, {2.0, 1.0}};

        hash_set expected {polygon_indexer::enumerate(triangle, 2)};
        expected.merge(polygon_indexer::enumerate(sliver, 2));
        EXPECT_EQ(polygon_indexer::enumerate(std::vector<polygon> {triangle, sliver}, 2), expected);

        EXPECT_THROW(polygon_indexer::enumerate(std::vector<polygon> {}, 2), std::invalid_argument);
        EXPECT_THROW(polygon_indexer::enumerate(std::vector<polygon> {triangle, polygon {}}, 2), std::invalid_argument);
    }

    TEST(PolygonIndexer, ContainsUsesEvenOddRule)
    {
        EXPECT_TRUE(polygon_indexer::contains(l_shape, {20.0, 20.0}));
        EXPECT_TRUE(polygon_indexer::contains(l_shape, {60.0, 20.0}));
        EXPECT_FALSE(polygon_indexer::contains(l_shape, {60.0, 60.0}));
        EXPECT_FALSE(polygon_indexer::contains(polygon {}, {0.0, 0.0}));
    }

    TEST(PolygonIndexer, CancelledBeforeStart)
    {
        std::stop_source source {};
        source.request_stop();
        EXPECT_THROW(polygon_indexer::enumerate(l_shape, 3, source.get_token()), enumeration_cancelled);
        EXPECT_THROW(polygon_indexer::enumerate(std::vector<polygon> {l_shape}, 3, source.get_token()), enumeration_cancelled);
    }

    TEST(PolygonIndexer, AsyncMatchesBlocking)
    {
        thread_pool pool {2u};
        std::future<hash_set> pending {polygon_indexer::enumerate_async(pool, l_shape, 3)};
        EXPECT_EQ(pending.get(), polygon_indexer::enumerate(l_shape, 3));
    }

    TEST(PolygonIndexer, AsyncReportsCancellationThroughFuture)
    {
        thread_pool pool {1u};
        std::stop_source source {};
        source.request_stop();

        std::future<hash_set> pending {polygon_indexer::enumerate_async(pool, l_shape, 3, source.get_token())};
        EXPECT_THROW(pending.get(), enumeration_cancelled);
    }

    TEST(PolygonIndexer, AsyncStopsWhileRunning)
    {
        using namespace std::chrono_literals;

        // Millions of candidate cells, far more than can be walked before the stop request.
        const polygon square {{0.0, 0.0}, {0.0, 40.0}, {40.0, 40.0}, {40.0, 0.0}};
        thread_pool pool {1u};
        std::stop_source source {};

        std::future<hash_set> pending {polygon_indexer::enumerate_async(pool, square, 6, source.get_token())};
        std::this_thread::sleep_for(50ms);
        source.request_stop();

        ASSERT_EQ(pending.wait_for(5s), std::future_status::ready);
        EXPECT_THROW(pending.get(), enumeration_cancelled);
    }

    TEST(PolygonIndexer, AsyncValidatesBeforeQueueing)
    {
        thread_pool pool {1u};
        EXPECT_THROW(polygon_indexer::enumerate_async(pool, polygon {{1.0, 1.0}, {2.0, 2.0}}, 3), std::invalid_argument);
        EXPECT_THROW(polygon_indexer::enumerate_async(pool, l_shape, -1), std::invalid_argument);
    }

} // namespace geoindex::gis
