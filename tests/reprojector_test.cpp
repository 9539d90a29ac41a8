/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file reprojector_test.cpp
#include "geoindex/crs/errors.hpp"
#include "geoindex/crs/reprojector.hpp"
#include <gtest/gtest.h>

namespace geoindex::crs
{
    namespace
    {
        gis::feature_collection web_mercator_square()
        {
            const gis::linear_ring ring {{0.0, 0.0}, {20037508.342789244, 0.0}, {20037508.342789244, 5621521.486192066}, {0.0, 0.0}};
            return {"EPSG:3857",
                    {{"square", {{"kind", "test"}}, gis::polygon_geometry {{ring}}},
                     {"point", {}, gis::point {{-13627665.271218073, 4547675.354340866}}}}};
        }
    } // namespace

    TEST(Reprojector, ConvertsAndTagsCollection)
    {
        const gis::feature_collection result {reproject(web_mercator_square(), crs_registry::with_builtin_definitions())};
        ASSERT_EQ(result.crs, std::optional<std::string> {"EPSG:4326"});
        ASSERT_EQ(result.features.size(), 2u);
        EXPECT_EQ(result.features[0].name, "square");
        EXPECT_EQ(result.features[0].properties.at("kind"), "test");

        const auto& ring {std::get<gis::polygon_geometry>(result.features[0].geom).rings.at(0)};
        ASSERT_EQ(ring.size(), 4u);
        EXPECT_NEAR(ring[1].x, 180.0, 1e-7);
        EXPECT_NEAR(ring[2].y, 45.0, 1e-7);
        EXPECT_EQ(ring[0], ring[3]);

        const gis::position& point {std::get<gis::point>(result.features[1].geom).coordinates};
        EXPECT_NEAR(point.x, -122.4194, 1e-7);
        EXPECT_NEAR(point.y, 37.7749, 1e-7);
    }

    TEST(Reprojector, UndeclaredCrsIsReturnedAsIs)
    {
        gis::feature_collection input {web_mercator_square()};
        input.crs.reset();
        EXPECT_EQ(reproject(input, crs_registry::with_builtin_definitions()), input);
    }

    TEST(Reprojector, UnknownCrsFallsBackToInput)
    {
        const gis::feature_collection input {web_mercator_square()};
        EXPECT_EQ(reproject(input, crs_registry {}), input);
    }

    TEST(Reprojector, FailedConversionFallsBackToInput)
    {
        const gis::feature_collection input {"EPSG:4326", {{"bad", {}, gis::line_string {{{0.0, 0.0}, {10.0, 95.0}}}}}};
        EXPECT_EQ(reproject(input, crs_registry::with_builtin_definitions()), input);
    }

    TEST(Reprojector, TransformGeometryKeepsTreeShape)
    {
        const crs_definition wgs84 {crs_definition::wgs84()};
        const gis::geometry multi {gis::multi_polygon {{gis::polygon_geometry {{{{1.0, 1.0}, {2.0, 1.0}, {2.0, 2.0}, {1.0, 1.0}}}},
                                                        gis::polygon_geometry {{{{5.0, 5.0}, {6.0, 5.0}, {5.0, 6.0}, {5.0, 5.0}}}}}}};
        const gis::geometry converted {transform_geometry(multi, wgs84)};
        ASSERT_TRUE(std::holds_alternative<gis::multi_polygon>(converted));
        EXPECT_EQ(std::get<gis::multi_polygon>(converted).polygons.size(), 2u);
        EXPECT_EQ(gis::geometry_type_name(converted), "MultiPolygon");

        const gis::geometry lines {gis::multi_line_string {{{{0.0, 0.0}, {1.0, 1.0}}, {{2.0, 2.0}}}}};
        EXPECT_EQ(std::get<gis::multi_line_string>(transform_geometry(lines, wgs84)).coordinates.size(), 2u);

        EXPECT_THROW(transform_geometry(gis::point {{0.0, -91.0}}, wgs84), transform_error);
    }

} // namespace geoindex::crs
