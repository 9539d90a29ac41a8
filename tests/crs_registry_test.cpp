/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file crs_registry_test.cpp
#include "geoindex/crs/crs_registry.hpp"
#include "geoindex/crs/errors.hpp"
#include <gtest/gtest.h>

namespace geoindex::crs
{
    TEST(CrsRegistry, NormalizesCodes)
    {
        EXPECT_EQ(crs_registry::normalize_code("EPSG:3857"), "EPSG:3857");
        EXPECT_EQ(crs_registry::normalize_code("  epsg:3857 "), "EPSG:3857");
        EXPECT_EQ(crs_registry::normalize_code("urn:ogc:def:crs:EPSG::3857"), "EPSG:3857");
        EXPECT_EQ(crs_registry::normalize_code("urn:ogc:def:crs:EPSG:6.18:3:25832"), "EPSG:25832");
        EXPECT_EQ(crs_registry::normalize_code("urn:ogc:def:crs:OGC:1.3:CRS84"), "EPSG:4326");
        EXPECT_EQ(crs_registry::normalize_code("CRS84"), "EPSG:4326");
        EXPECT_EQ(crs_registry::normalize_code("wgs84"), "EPSG:4326");
        EXPECT_EQ(crs_registry::normalize_code(""), "");
    }

    TEST(CrsRegistry, BuiltinDefinitions)
    {
        const crs_registry registry {crs_registry::with_builtin_definitions()};
        EXPECT_EQ(registry.size(), 139u);

        for (const char* const code: {"EPSG:4326", "EPSG:4258", "EPSG:4269", "EPSG:3857", "EPSG:900913", "EPSG:3395", "EPSG:32601",
                                      "EPSG:32660", "EPSG:32701", "EPSG:32760", "EPSG:25828", "EPSG:25838", "EPSG:2154", "EPSG:27700"})
            EXPECT_TRUE(registry.contains(code)) << code;

        EXPECT_FALSE(registry.contains("EPSG:32661"));
        EXPECT_FALSE(registry.contains("EPSG:25827"));
        EXPECT_TRUE(registry.at("OGC:CRS84").is_geographic());
        EXPECT_EQ(registry.at("urn:ogc:def:crs:EPSG::32633").inverse_projection().name(), "tmerc");
        EXPECT_EQ(registry.at("EPSG:2154").inverse_projection().name(), "lcc");
    }

    TEST(CrsRegistry, UnknownCodes)
    {
        const crs_registry registry {crs_registry::with_builtin_definitions()};
        EXPECT_EQ(registry.find("EPSG:999999"), nullptr);
        EXPECT_THROW(registry.at("EPSG:999999"), unsupported_crs_error);
        EXPECT_THROW(crs_registry {}.at("EPSG:4326"), unsupported_crs_error);
        EXPECT_TRUE(crs_registry {}.empty());
    }

    TEST(CrsRegistry, AddReplacesExistingEntry)
    {
        crs_registry registry {};
        registry.add("epsg:31467", "+proj=tmerc +lat_0=0 +lon_0=9 +k=1 +x_0=3500000 +y_0=0 +datum=potsdam +units=m");
        ASSERT_TRUE(registry.contains("EPSG:31467"));
        EXPECT_EQ(registry.at("EPSG:31467").inverse_projection().name(), "tmerc");

        registry.add("EPSG:31467", crs_definition::wgs84());
        EXPECT_EQ(registry.size(), 1u);
        EXPECT_TRUE(registry.at("EPSG:31467").is_geographic());

        EXPECT_THROW(registry.add("EPSG:1", "+proj=stere"), unsupported_crs_error);
        EXPECT_EQ(registry.size(), 1u);
    }

    TEST(CrsRegistry, BuiltinConversions)
    {
        const crs_registry registry {crs_registry::with_builtin_definitions()};

        const gis::position san_francisco {registry.at("EPSG:3857").to_wgs84({-13627665.271218073, 4547675.354340866})};
        EXPECT_NEAR(san_francisco.x, -122.4194, 1e-7);
        EXPECT_NEAR(san_francisco.y, 37.7749, 1e-7);

        const gis::position paris {registry.at("EPSG:2154").to_wgs84({652469.0227091359, 6862035.259420077})};
        EXPECT_NEAR(paris.x, 2.3522, 1e-7);
        EXPECT_NEAR(paris.y, 48.8566, 1e-7);

        const gis::position trieste {registry.at("EPSG:32633").to_wgs84({358379.5037793147, 4995635.242173965})};
        EXPECT_NEAR(trieste.x, 13.2, 1e-7);
        EXPECT_NEAR(trieste.y, 45.1, 1e-7);
    }

} // namespace geoindex::crs
