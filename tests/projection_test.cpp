/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file projection_test.cpp
#include "geoindex/crs/errors.hpp"
#include "geoindex/crs/projection.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <numbers>

namespace geoindex::crs
{
    namespace
    {
        constexpr double deg {std::numbers::pi / 180.0};
        constexpr double tolerance_degrees {1e-7};

        projection_parameters utm_zone(const int zone, const bool south)
        {
            projection_parameters parameters {};
            parameters.lon_0 = ((zone - 1) * 6 - 180 + 3) * deg;
            parameters.scale_factor = 0.9996;
            parameters.false_easting = 500000.0;
            parameters.false_northing = south ? 10000000.0 : 0.0;
            return parameters;
        }

        void expect_degrees(const geodetic_point& actual, const double lat, const double lon)
        {
            EXPECT_NEAR(actual.lat / deg, lat, tolerance_degrees);
            EXPECT_NEAR(actual.lon / deg, lon, tolerance_degrees);
        }
    } // namespace

    TEST(Projection, FactoryNames)
    {
        EXPECT_EQ(projection::create("longlat", {}, wgs84_ellipsoid)->name(), "longlat");
        EXPECT_EQ(projection::create("latlong", {}, wgs84_ellipsoid)->name(), "longlat");
        EXPECT_EQ(projection::create("merc", {}, wgs84_ellipsoid)->name(), "merc");
        EXPECT_EQ(projection::create("utm", utm_zone(33, false), wgs84_ellipsoid)->name(), "tmerc");

        projection_parameters conic {};
        conic.lat_1 = 45.0 * deg;
        conic.has_lat_1 = true;
        EXPECT_EQ(projection::create("lcc", conic, wgs84_ellipsoid)->name(), "lcc");

        EXPECT_TRUE(projection::create("longlat", {}, wgs84_ellipsoid)->is_geographic());
        EXPECT_FALSE(projection::create("merc", {}, wgs84_ellipsoid)->is_geographic());

        EXPECT_THROW(projection::create("stere", {}, wgs84_ellipsoid), unsupported_crs_error);
        EXPECT_THROW(projection::create("", {}, wgs84_ellipsoid), unsupported_crs_error);
    }

    TEST(Projection, LongLatConvertsDegrees)
    {
        const longlat_projection geographic {};
        expect_degrees(geographic.inverse(10.5, -33.25), -33.25, 10.5);
        EXPECT_THROW(geographic.inverse(0.0, 90.5), transform_error);
        EXPECT_THROW(geographic.inverse(std::nan(""), 0.0), transform_error);
    }

    TEST(Projection, TransverseMercatorUtmNorth)
    {
        const transverse_mercator_projection zone_33 {utm_zone(33, false), wgs84_ellipsoid};
        expect_degrees(zone_33.inverse(534325.167454961, 5761156.236174925), 52.0, 15.5);
        expect_degrees(zone_33.inverse(358379.5037793147, 4995635.242173965), 45.1, 13.2);
        expect_degrees(zone_33.inverse(611544.041976742, 6653097.436054439), 60.0, 17.0);
        expect_degrees(zone_33.inverse(500000.0, 0.0), 0.0, 15.0);
    }

    TEST(Projection, TransverseMercatorUtmSouth)
    {
        const transverse_mercator_projection zone_34s {utm_zone(34, true), wgs84_ellipsoid};
        expect_degrees(zone_34s.inverse(259583.2216423371, 6245888.045384651), -33.9, 18.4);
    }

    TEST(Projection, TransverseMercatorRejectsPolarOverflow)
    {
        const transverse_mercator_projection zone_33 {utm_zone(33, false), wgs84_ellipsoid};
        EXPECT_THROW(zone_33.inverse(500000.0, 10500000.0), transform_error);
    }

    TEST(Projection, SphericalWebMercator)
    {
        const mercator_projection web {{}, ellipsoid::from_axes(6378137.0, 6378137.0)};
        expect_degrees(web.inverse(0.0, 5621521.486192066), 45.0, 0.0);
        expect_degrees(web.inverse(20037508.342789244, 0.0), 0.0, 180.0);
        expect_degrees(web.inverse(-13627665.271218073, 4547675.354340866), 37.7749, -122.4194);
    }

    TEST(Projection, LambertConformalConicTwoParallels)
    {
        // Lambert-93
        projection_parameters parameters {};
        parameters.lat_0 = 46.5 * deg;
        parameters.lon_0 = 3.0 * deg;
        parameters.lat_1 = 49.0 * deg;
        parameters.lat_2 = 44.0 * deg;
        parameters.has_lat_1 = true;
        parameters.has_lat_2 = true;
        parameters.false_easting = 700000.0;
        parameters.false_northing = 6600000.0;

        const ellipsoid grs80 {*ellipsoid::find("GRS80")};
        const lambert_conformal_conic_projection lambert_93 {parameters, grs80};
        expect_degrees(lambert_93.inverse(700000.0, 6600000.0), 46.5, 3.0);
        expect_degrees(lambert_93.inverse(652469.0227091359, 6862035.259420077), 48.8566, 2.3522);
    }

    TEST(Projection, IsometricLatitudeOnSphere)
    {
        const double lat {0.5};
        EXPECT_NEAR(latitude_from_isometric(std::tan(std::numbers::pi / 4.0 - lat / 2.0), 0.0), lat, 1e-12);
        EXPECT_NEAR(latitude_from_isometric(1.0, wgs84_ellipsoid.eccentricity()), 0.0, 1e-12);
    }

} // namespace geoindex::crs
