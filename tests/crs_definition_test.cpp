/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file crs_definition_test.cpp
#include "geoindex/crs/crs_definition.hpp"
#include "geoindex/crs/errors.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace geoindex::crs
{
    namespace
    {
        constexpr double tolerance_degrees {1e-7};
    } // namespace

    TEST(CrsDefinition, Wgs84IsIdentity)
    {
        const crs_definition wgs84 {crs_definition::wgs84()};
        EXPECT_TRUE(wgs84.is_geographic());
        const gis::position converted {wgs84.to_wgs84({10.40744, 57.64911})};
        EXPECT_NEAR(converted.x, 10.40744, 1e-12);
        EXPECT_NEAR(converted.y, 57.64911, 1e-12);

        EXPECT_THROW(wgs84.to_wgs84({0.0, 91.0}), transform_error);
    }

    TEST(CrsDefinition, ParsesUtmZone)
    {
        const crs_definition utm {crs_definition::from_proj4("+proj=utm +zone=33 +datum=WGS84 +units=m +no_defs")};
        EXPECT_FALSE(utm.is_geographic());
        EXPECT_EQ(utm.inverse_projection().name(), "tmerc");
        EXPECT_EQ(utm.shape(), wgs84_ellipsoid);

        const gis::position converted {utm.to_wgs84({534325.167454961, 5761156.236174925})};
        EXPECT_NEAR(converted.x, 15.5, tolerance_degrees);
        EXPECT_NEAR(converted.y, 52.0, tolerance_degrees);

        const crs_definition south {crs_definition::from_proj4("+proj=utm +zone=34 +south +ellps=WGS84 +units=m")};
        const gis::position cape_town {south.to_wgs84({259583.2216423371, 6245888.045384651})};
        EXPECT_NEAR(cape_town.x, 18.4, tolerance_degrees);
        EXPECT_NEAR(cape_town.y, -33.9, tolerance_degrees);
    }

    TEST(CrsDefinition, AppliesHelmertShift)
    {
        const crs_definition osgb {crs_definition::from_proj4("+proj=tmerc +lat_0=49 +lon_0=-2 +k=0.9996012717 +x_0=400000 "
                                                              "+y_0=-100000 +ellps=airy "
                                                              "+towgs84=446.448,-125.157,542.06,0.15,0.247,0.842,-20.489 +units=m")};
        ASSERT_TRUE(osgb.datum_shift().has_value());

        const gis::position charing_cross {osgb.to_wgs84({530034.0, 180381.0})};
        EXPECT_NEAR(charing_cross.x, -0.12772400545987164, 1e-6);
        EXPECT_NEAR(charing_cross.y, 51.50740692963873, 1e-6);

        const gis::position origin {osgb.to_wgs84({400000.0, -100000.0})};
        EXPECT_NEAR(origin.x, -2.001307468891372, 1e-6);
        EXPECT_NEAR(origin.y, 49.00077078519793, 1e-6);

        // Same grid without the shift stays on the Airy ellipsoid.
        const crs_definition unshifted {crs_definition::from_proj4("+proj=tmerc +lat_0=49 +lon_0=-2 +k=0.9996012717 +x_0=400000 "
                                                                   "+y_0=-100000 +ellps=airy +units=m")};
        EXPECT_FALSE(unshifted.datum_shift().has_value());
        const gis::position airy {unshifted.to_wgs84({400000.0, -100000.0})};
        EXPECT_NEAR(airy.x, -2.0, tolerance_degrees);
        EXPECT_NEAR(airy.y, 49.0, tolerance_degrees);
    }

    TEST(CrsDefinition, DatumResolution)
    {
        EXPECT_TRUE(crs_definition::from_proj4("+proj=longlat +datum=NAD83").datum_shift().has_value());
        EXPECT_FALSE(crs_definition::from_proj4("+proj=longlat +datum=NAD27").datum_shift().has_value());
        EXPECT_TRUE(crs_definition::from_proj4("+proj=longlat +ellps=WGS84").datum_shift().has_value());
        EXPECT_FALSE(crs_definition::from_proj4("+proj=longlat +ellps=intl").datum_shift().has_value());

        // An explicit towgs84 wins over the datum's shift regardless of order.
        const crs_definition custom {crs_definition::from_proj4("+proj=longlat +towgs84=1,2,3 +datum=OSGB36")};
        ASSERT_TRUE(custom.datum_shift().has_value());
        EXPECT_EQ(custom.datum_shift()->values[0], 1.0);
        EXPECT_EQ(custom.datum_shift()->values[3], 0.0);
        EXPECT_EQ(custom.shape(), *ellipsoid::find("airy"));
    }

    TEST(CrsDefinition, EllipsoidOverrides)
    {
        const crs_definition sphere {crs_definition::from_proj4("+proj=merc +a=6378137 +b=6378137")};
        EXPECT_TRUE(sphere.shape().is_sphere());

        const crs_definition radius {crs_definition::from_proj4("+proj=longlat +R=6371000")};
        EXPECT_EQ(radius.shape().semi_major_axis, 6371000.0);
        EXPECT_TRUE(radius.shape().is_sphere());

        const crs_definition flattened {crs_definition::from_proj4("+proj=longlat +a=6378388 +rf=297")};
        EXPECT_EQ(flattened.shape(), *ellipsoid::find("intl"));
    }

    TEST(CrsDefinition, UnitsScaleProjectedCoordinates)
    {
        EXPECT_EQ(crs_definition::from_proj4("+proj=merc +units=ft").to_meter(), 0.3048);
        EXPECT_DOUBLE_EQ(crs_definition::from_proj4("+proj=merc +units=us-ft").to_meter(), 1200.0 / 3937.0);
        EXPECT_EQ(crs_definition::from_proj4("+proj=merc +to_meter=1000").to_meter(), 1000.0);

        const crs_definition in_km {crs_definition::from_proj4("+proj=utm +zone=33 +datum=WGS84 +units=km")};
        const gis::position converted {in_km.to_wgs84({534.325167454961, 5761.156236174925})};
        EXPECT_NEAR(converted.x, 15.5, tolerance_degrees);
        EXPECT_NEAR(converted.y, 52.0, tolerance_degrees);
    }

    TEST(CrsDefinition, RejectsMalformedDefinitions)
    {
        EXPECT_THROW(crs_definition::from_proj4(""), std::invalid_argument);
        EXPECT_THROW(crs_definition::from_proj4("+ellps=WGS84"), std::invalid_argument);
        EXPECT_THROW(crs_definition::from_proj4("proj=merc"), std::invalid_argument);
        EXPECT_THROW(crs_definition::from_proj4("+proj=merc +ellps=unknown"), std::invalid_argument);
        EXPECT_THROW(crs_definition::from_proj4("+proj=merc +datum=unknown"), std::invalid_argument);
        EXPECT_THROW(crs_definition::from_proj4("+proj=merc +towgs84=1,2"), std::invalid_argument);
        EXPECT_THROW(crs_definition::from_proj4("+proj=merc +towgs84=1,2,3,4,5,6,7,8"), std::invalid_argument);
        EXPECT_THROW(crs_definition::from_proj4("+proj=merc +lon_0=east"), std::invalid_argument);
        EXPECT_THROW(crs_definition::from_proj4("+proj=merc +units=furlong"), std::invalid_argument);
        EXPECT_THROW(crs_definition::from_proj4("+proj=utm"), std::invalid_argument);
        EXPECT_THROW(crs_definition::from_proj4("+proj=utm +zone=61"), std::invalid_argument);
        EXPECT_THROW(crs_definition::from_proj4("+proj=utm +zone=3.5"), std::invalid_argument);
        EXPECT_THROW(crs_definition::from_proj4("+proj=stere +lat_0=90"), unsupported_crs_error);

        EXPECT_THROW((crs_definition {wgs84_ellipsoid, std::nullopt, 1.0, nullptr}), std::invalid_argument);
        EXPECT_THROW((crs_definition {wgs84_ellipsoid, std::nullopt, 0.0, std::make_shared<longlat_projection>()}), std::invalid_argument);
    }

    TEST(CrsDefinition, IgnoresUnknownKeys)
    {
        const crs_definition web {crs_definition::from_proj4("+proj=merc +a=6378137 +b=6378137 +nadgrids=@null +wktext +no_defs +type=crs")};
        EXPECT_EQ(web.inverse_projection().name(), "merc");
    }

} // namespace geoindex::crs
