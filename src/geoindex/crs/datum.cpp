/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file datum.cpp
#include "geoindex/crs/datum.hpp"
#include <cmath>
#include <numbers>

namespace geoindex::crs
{
    static constexpr double arc_seconds_to_radians {std::numbers::pi / (180.0 * 3600.0)};
    static constexpr int geodetic_iterations {10};

    struct named_ellipsoid
    {
        std::string_view name;
        ellipsoid shape;
    };

    static constexpr named_ellipsoid known_ellipsoids[] {
        {"WGS84", {6378137.0, 298.257223563}},
        {"GRS80", {6378137.0, 298.257222101}},
        {"WGS72", {6378135.0, 298.26}},
        {"intl", {6378388.0, 297.0}},
        {"airy", {6377563.396, 299.3249646}},
        {"mod_airy", {6377340.189, 299.3249646}},
        {"bessel", {6377397.155, 299.1528128}},
        {"clrk66", {6378206.4, 294.9786982138982}},
        {"clrk80", {6378249.145, 293.4663}},
        {"clrk80ign", {6378249.2, 293.4660212936269}},
        {"krass", {6378245.0, 298.3}},
        {"sphere", {6370997.0, 0.0}},
    };

    struct named_datum
    {
        std::string_view name;
        std::string_view ellipsoid_name;
        std::optional<helmert_parameters> to_wgs84;
    };

    static const named_datum known_datums[] {
        {"WGS84", "WGS84", helmert_parameters {}},
        {"NAD83", "GRS80", helmert_parameters {}},
        {"NAD27", "clrk66", std::nullopt}, // grid based shift, not supported
        {"GGRS87", "GRS80", helmert_parameters {{-199.87, 74.79, 246.62, 0.0, 0.0, 0.0, 0.0}}},
        {"potsdam", "bessel", helmert_parameters {{598.1, 73.7, 418.2, 0.202, 0.045, -2.455, 6.7}}},
        {"carthage", "clrk80ign", helmert_parameters {{-263.0, 6.0, 431.0, 0.0, 0.0, 0.0, 0.0}}},
        {"hermannskogel", "bessel", helmert_parameters {{577.326, 90.129, 463.919, 5.137, 1.474, 5.297, 2.4232}}},
        {"ire65", "mod_airy", helmert_parameters {{482.530, -130.596, 564.557, -1.042, -0.214, -0.631, 8.15}}},
        {"nzgd49", "intl", helmert_parameters {{59.47, -5.04, 187.44, 0.47, -0.1, 1.024, -4.5993}}},
        {"OSGB36", "airy", helmert_parameters {{446.448, -125.157, 542.060, 0.1502, 0.2470, 0.8421, -20.4894}}},
    };

    double ellipsoid::eccentricity_squared() const noexcept
    {
        const double f {flattening()};
        return f * (2.0 - f);
    }

    double ellipsoid::eccentricity() const noexcept
    {
        return std::sqrt(eccentricity_squared());
    }

    ellipsoid ellipsoid::from_axes(const double a, const double b) noexcept
    {
        return {a, (a == b) ? 0.0 : (a / (a - b))};
    }

    std::optional<ellipsoid> ellipsoid::find(const std::string_view name) noexcept
    {
        for (const named_ellipsoid& entry: known_ellipsoids)
            if (entry.name == name)
                return entry.shape;

        return {};
    }

    std::optional<datum_definition> datum_definition::find(const std::string_view name) noexcept
    {
        for (const named_datum& entry: known_datums)
            if (entry.name == name)
                return datum_definition {*ellipsoid::find(entry.ellipsoid_name), entry.to_wgs84};

        return {};
    }

    bool helmert_parameters::is_zero() const noexcept
    {
        for (const double value: values)
            if (value != 0.0)
                return false;

        return true;
    }

    geocentric_point helmert_parameters::apply(const geocentric_point& source) const noexcept
    {
        const double rx {values[3] * arc_seconds_to_radians};
        const double ry {values[4] * arc_seconds_to_radians};
        const double rz {values[5] * arc_seconds_to_radians};
        const double scale {1.0 + values[6] / 1e6};

        return {scale * (source.x - rz * source.y + ry * source.z) + values[0],
                scale * (rz * source.x + source.y - rx * source.z) + values[1],
                scale * (-ry * source.x + rx * source.y + source.z) + values[2]};
    }

    geocentric_point to_geocentric(const geodetic_point& point, const ellipsoid& shape) noexcept
    {
        const double e2 {shape.eccentricity_squared()};
        const double sin_lat {std::sin(point.lat)};
        const double cos_lat {std::cos(point.lat)};
        const double prime_vertical {shape.semi_major_axis / std::sqrt(1.0 - e2 * sin_lat * sin_lat)};

        return {(prime_vertical + point.height) * cos_lat * std::cos(point.lon), (prime_vertical + point.height) * cos_lat * std::sin(point.lon),
                (prime_vertical * (1.0 - e2) + point.height) * sin_lat};
    }

    geodetic_point to_geodetic(const geocentric_point& point, const ellipsoid& shape) noexcept
    {
        const double a {shape.semi_major_axis};
        const double e2 {shape.eccentricity_squared()};
        const double p {std::hypot(point.x, point.y)};
        const double lon {std::atan2(point.y, point.x)};

        // On the polar axis the iteration below is undefined.
        if (p < 1e-9)
        {
            const double lat {std::copysign(std::numbers::pi / 2.0, point.z)};
            return {lon, lat, std::abs(point.z) - shape.semi_minor_axis()};
        }

        double lat {std::atan2(point.z, p * (1.0 - e2))};
        double height {};
        for (int i {}; i < geodetic_iterations; ++i)
        {
            const double sin_lat {std::sin(lat)};
            const double prime_vertical {a / std::sqrt(1.0 - e2 * sin_lat * sin_lat)};
            height = p / std::cos(lat) - prime_vertical;
            lat = std::atan2(point.z, p * (1.0 - e2 * prime_vertical / (prime_vertical + height)));
        }

        return {lon, lat, height};
    }

} // namespace geoindex::crs
