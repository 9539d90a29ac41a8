/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file datum.hpp
#pragma once
#ifndef PCH
    #include <array>
    #include <optional>
    #include <string_view>
#endif

namespace geoindex::crs
{
    /// @brief A reference ellipsoid. A sphere has an inverse flattening of zero.
    struct ellipsoid
    {
        double semi_major_axis {};
        double inverse_flattening {};

        double flattening() const noexcept { return (inverse_flattening == 0.0) ? 0.0 : (1.0 / inverse_flattening); }
        double eccentricity_squared() const noexcept;
        double eccentricity() const noexcept;
        double semi_minor_axis() const noexcept { return semi_major_axis * (1.0 - flattening()); }
        bool is_sphere() const noexcept { return inverse_flattening == 0.0; }

        /// @brief Builds an ellipsoid from its two semi-axes.
        static ellipsoid from_axes(double a, double b) noexcept;

        /// @brief Looks up a PROJ ellipsoid name ("WGS84", "GRS80", "intl", "airy", "bessel", "clrk66", "krass", ...).
        static std::optional<ellipsoid> find(std::string_view name) noexcept;

        bool operator==(const ellipsoid&) const = default;
    };

    inline constexpr ellipsoid wgs84_ellipsoid {6378137.0, 298.257223563};

    /// @brief Earth-centered, earth-fixed cartesian coordinates in metres.
    struct geocentric_point
    {
        double x {};
        double y {};
        double z {};
    };

    /// @brief Geodetic coordinates in radians with ellipsoidal height in metres.
    struct geodetic_point
    {
        double lon {};
        double lat {};
        double height {};
    };

    /// @brief Seven-parameter Helmert transformation to WGS84 in the PROJ `towgs84` convention
    /// (position vector rotation): translations in metres, rotations in arc-seconds, scale in ppm.
    struct helmert_parameters
    {
        std::array<double, 7u> values {};

        bool is_zero() const noexcept;

        /// @brief Applies the transformation to a geocentric point on the source datum.
        geocentric_point apply(const geocentric_point& source) const noexcept;

        bool operator==(const helmert_parameters&) const = default;
    };

    /// @brief Translation/rotation/scale and ellipsoid of a named PROJ datum ("WGS84", "NAD83", "OSGB36", ...).
    struct datum_definition
    {
        ellipsoid shape {};
        std::optional<helmert_parameters> to_wgs84 {};

        /// @brief Looks up a PROJ datum name.
        static std::optional<datum_definition> find(std::string_view name) noexcept;
    };

    /// @brief Converts geodetic coordinates on `shape` to geocentric coordinates.
    geocentric_point to_geocentric(const geodetic_point& point, const ellipsoid& shape) noexcept;

    /// @brief Converts geocentric coordinates to geodetic coordinates on `shape` (iterative).
    geodetic_point to_geodetic(const geocentric_point& point, const ellipsoid& shape) noexcept;

} // namespace geoindex::crs
