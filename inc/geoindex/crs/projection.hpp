/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file projection.hpp
#pragma once
#ifndef PCH
    #include "geoindex/crs/datum.hpp"
    #include <memory>
    #include <string_view>
#endif

namespace geoindex::crs
{
    /// @brief Parameters shared by the supported map projections. Angles are in radians, offsets in metres.
    struct projection_parameters
    {
        double lat_0 {};
        double lon_0 {};
        double lat_1 {};
        double lat_2 {};
        double lat_ts {};
        double scale_factor {1.0};
        double false_easting {};
        double false_northing {};
        bool has_lat_1 {};
        bool has_lat_2 {};
    };

    /// @brief Inverse map projection: projected metres to geodetic radians on the projection's ellipsoid.
    class projection
    {
    public:
        projection() = default;

        projection(const projection&) = delete;
        projection& operator=(const projection&) = delete;
        projection(projection&&) = delete;
        projection& operator=(projection&&) = delete;

        virtual ~projection() = default;

        /// @brief Unprojects a point.
        /// @param easting Projected x in metres (degrees for `longlat`).
        /// @param northing Projected y in metres (degrees for `longlat`).
        /// @return Longitude/latitude in radians, height zero.
        /// @throws transform_error If the point is outside the projection's domain.
        virtual geodetic_point inverse(double easting, double northing) const noexcept(false) = 0;

        /// @brief True when the input coordinates are already longitude/latitude degrees.
        virtual bool is_geographic() const noexcept { return false; }

        /// @brief PROJ name of the projection ("longlat", "merc", "tmerc", "lcc").
        virtual std::string_view name() const noexcept = 0;

        /// @brief Creates the projection named by a PROJ `+proj=` value.
        /// `utm` is accepted as a transverse Mercator whose parameters were already derived from the zone.
        /// @throws unsupported_crs_error If the projection is not supported.
        static std::unique_ptr<projection> create(std::string_view proj_name, const projection_parameters& parameters,
                                                  const ellipsoid& shape) noexcept(false);
    };

    /// @brief Geographic coordinates: degrees in, radians out.
    class longlat_projection final: public projection
    {
    public:
        geodetic_point inverse(double easting, double northing) const noexcept(false) override;
        bool is_geographic() const noexcept override { return true; }
        std::string_view name() const noexcept override { return "longlat"; }
    };

    /// @brief Normal Mercator on an ellipsoid or a sphere (the latter gives the Web Mercator of EPSG:3857).
    class mercator_projection final: public projection
    {
    public:
        mercator_projection(const projection_parameters& parameters, const ellipsoid& shape) noexcept;

        geodetic_point inverse(double easting, double northing) const noexcept(false) override;
        std::string_view name() const noexcept override { return "merc"; }

    private:
        projection_parameters parameters_;
        ellipsoid shape_;
        double scale_ {}; /// k0, derived from lat_ts when given
    };

    /// @brief Transverse Mercator (Snyder series), also used for UTM zones.
    class transverse_mercator_projection final: public projection
    {
    public:
        transverse_mercator_projection(const projection_parameters& parameters, const ellipsoid& shape) noexcept;

        geodetic_point inverse(double easting, double northing) const noexcept(false) override;
        std::string_view name() const noexcept override { return "tmerc"; }

    private:
        /// @brief Meridional arc length from the equator to `lat`.
        double meridian_distance(double lat) const noexcept;

        projection_parameters parameters_;
        ellipsoid shape_;
        double origin_distance_ {}; /// meridian distance of lat_0
    };

    /// @brief Lambert Conformal Conic with one or two standard parallels.
    class lambert_conformal_conic_projection final: public projection
    {
    public:
        /// @throws transform_error If the standard parallels do not define a cone.
        lambert_conformal_conic_projection(const projection_parameters& parameters, const ellipsoid& shape) noexcept(false);

        geodetic_point inverse(double easting, double northing) const noexcept(false) override;
        std::string_view name() const noexcept override { return "lcc"; }

    private:
        double isometric_t(double lat) const noexcept;

        projection_parameters parameters_;
        ellipsoid shape_;
        double cone_constant_ {}; /// n
        double cone_factor_ {};   /// F
        double origin_radius_ {}; /// rho0
    };

    /// @brief Latitude from the isometric function t (Snyder 7-9), iterated to convergence.
    /// @throws transform_error If the iteration does not converge.
    double latitude_from_isometric(double t, double eccentricity) noexcept(false);

} // namespace geoindex::crs
