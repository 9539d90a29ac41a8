/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file projection.cpp
#include "geoindex/crs/projection.hpp"
#include "geoindex/crs/errors.hpp"
#include <cmath>
#include <numbers>
#include <string>

namespace geoindex::crs
{
    static constexpr double half_pi {std::numbers::pi / 2.0};
    static constexpr double degrees_to_radians {std::numbers::pi / 180.0};
    static constexpr int max_latitude_iterations {15};
    static constexpr double latitude_convergence {1e-12};

    double latitude_from_isometric(const double t, const double eccentricity) noexcept(false)
    {
        const double half_e {eccentricity / 2.0};
        double lat {half_pi - 2.0 * std::atan(t)};
        for (int i {}; i < max_latitude_iterations; ++i)
        {
            const double e_sin {eccentricity * std::sin(lat)};
            const double next {half_pi - 2.0 * std::atan(t * std::pow((1.0 - e_sin) / (1.0 + e_sin), half_e))};
            if (std::abs(next - lat) <= latitude_convergence)
                return next;
            lat = next;
        }
        throw transform_error("latitude iteration did not converge");
    }

    std::unique_ptr<projection> projection::create(const std::string_view proj_name, const projection_parameters& parameters,
                                                   const ellipsoid& shape) noexcept(false)
    {
        if ((proj_name == "longlat") || (proj_name == "latlong") || (proj_name == "lonlat") || (proj_name == "latlon"))
            return std::make_unique<longlat_projection>();
        if (proj_name == "merc")
            return std::make_unique<mercator_projection>(parameters, shape);
        if ((proj_name == "tmerc") || (proj_name == "utm"))
            return std::make_unique<transverse_mercator_projection>(parameters, shape);
        if (proj_name == "lcc")
            return std::make_unique<lambert_conformal_conic_projection>(parameters, shape);

        throw unsupported_crs_error("unsupported projection \"" + std::string(proj_name) + '"');
    }

    geodetic_point longlat_projection::inverse(const double easting, const double northing) const noexcept(false)
    {
        if (!std::isfinite(easting) || !std::isfinite(northing) || (std::abs(northing) > 90.0))
            throw transform_error("geographic coordinate out of range");

        return {easting * degrees_to_radians, northing * degrees_to_radians, 0.0};
    }

    // k0 follows lat_ts when it is given (Snyder 7-8 generalized to the ellipsoid).
    mercator_projection::mercator_projection(const projection_parameters& parameters, const ellipsoid& shape) noexcept:
        parameters_ {parameters},
        shape_ {shape},
        scale_ {parameters.scale_factor}
    {
        if (parameters_.lat_ts != 0.0)
        {
            const double sin_ts {std::sin(parameters_.lat_ts)};
            scale_ = std::cos(parameters_.lat_ts) / std::sqrt(1.0 - shape_.eccentricity_squared() * sin_ts * sin_ts);
        }
    }

    geodetic_point mercator_projection::inverse(const double easting, const double northing) const noexcept(false)
    {
        const double radius {shape_.semi_major_axis * scale_};
        const double x {(easting - parameters_.false_easting) / radius};
        const double y {(northing - parameters_.false_northing) / radius};
        if (!std::isfinite(x) || !std::isfinite(y))
            throw transform_error("mercator coordinate is not finite");

        return {x + parameters_.lon_0, latitude_from_isometric(std::exp(-y), shape_.eccentricity()), 0.0};
    }

    transverse_mercator_projection::transverse_mercator_projection(const projection_parameters& parameters, const ellipsoid& shape) noexcept:
        parameters_ {parameters},
        shape_ {shape}
    {
        origin_distance_ = meridian_distance(parameters_.lat_0);
    }

    double transverse_mercator_projection::meridian_distance(const double lat) const noexcept
    {
        const double e2 {shape_.eccentricity_squared()};
        const double e4 {e2 * e2};
        const double e6 {e4 * e2};
        return shape_.semi_major_axis *
               ((1.0 - e2 / 4.0 - 3.0 * e4 / 64.0 - 5.0 * e6 / 256.0) * lat - (3.0 * e2 / 8.0 + 3.0 * e4 / 32.0 + 45.0 * e6 / 1024.0) * std::sin(2.0 * lat) +
                (15.0 * e4 / 256.0 + 45.0 * e6 / 1024.0) * std::sin(4.0 * lat) - (35.0 * e6 / 3072.0) * std::sin(6.0 * lat));
    }

    // Snyder, Map Projections: A Working Manual, equations 8-18 to 8-25 (footpoint latitude series).
    geodetic_point transverse_mercator_projection::inverse(const double easting, const double northing) const noexcept(false)
    {
        const double a {shape_.semi_major_axis};
        const double e2 {shape_.eccentricity_squared()};
        const double k0 {parameters_.scale_factor};

        const double arc {origin_distance_ + (northing - parameters_.false_northing) / k0};
        const double mu {arc / (a * (1.0 - e2 / 4.0 - 3.0 * e2 * e2 / 64.0 - 5.0 * e2 * e2 * e2 / 256.0))};
        const double root {std::sqrt(1.0 - e2)};
        const double e1 {(1.0 - root) / (1.0 + root)};
        const double e1_2 {e1 * e1};
        const double e1_3 {e1_2 * e1};
        const double e1_4 {e1_3 * e1};
        const double footpoint {mu + (3.0 * e1 / 2.0 - 27.0 * e1_3 / 32.0) * std::sin(2.0 * mu) +
                                (21.0 * e1_2 / 16.0 - 55.0 * e1_4 / 32.0) * std::sin(4.0 * mu) + (151.0 * e1_3 / 96.0) * std::sin(6.0 * mu) +
                                (1097.0 * e1_4 / 512.0) * std::sin(8.0 * mu)};

        if (!std::isfinite(footpoint) || (std::abs(footpoint) >= half_pi))
            throw transform_error("transverse mercator northing outside the projection domain");

        const double sin_fp {std::sin(footpoint)};
        const double cos_fp {std::cos(footpoint)};
        const double tan_fp {std::tan(footpoint)};
        const double ep2 {e2 / (1.0 - e2)};
        const double c1 {ep2 * cos_fp * cos_fp};
        const double t1 {tan_fp * tan_fp};
        const double denominator {1.0 - e2 * sin_fp * sin_fp};
        const double n1 {a / std::sqrt(denominator)};
        const double r1 {a * (1.0 - e2) / std::pow(denominator, 1.5)};
        const double d {(easting - parameters_.false_easting) / (n1 * k0)};
        const double d2 {d * d};
        const double d4 {d2 * d2};
        const double d6 {d4 * d2};

        const double lat {footpoint - (n1 * tan_fp / r1) * (d2 / 2.0 - (5.0 + 3.0 * t1 + 10.0 * c1 - 4.0 * c1 * c1 - 9.0 * ep2) * d4 / 24.0 +
                                                            (61.0 + 90.0 * t1 + 298.0 * c1 + 45.0 * t1 * t1 - 252.0 * ep2 - 3.0 * c1 * c1) * d6 / 720.0)};
        const double lon {parameters_.lon_0 + (d - (1.0 + 2.0 * t1 + c1) * d2 * d / 6.0 +
                                               (5.0 - 2.0 * c1 + 28.0 * t1 - 3.0 * c1 * c1 + 8.0 * ep2 + 24.0 * t1 * t1) * d4 * d / 120.0) /
                                                  cos_fp};

        if (!std::isfinite(lat) || !std::isfinite(lon))
            throw transform_error("transverse mercator inverse produced a non-finite result");

        return {lon, lat, 0.0};
    }

    double lambert_conformal_conic_projection::isometric_t(const double lat) const noexcept
    {
        const double e {shape_.eccentricity()};
        const double e_sin {e * std::sin(lat)};
        return std::tan(std::numbers::pi / 4.0 - lat / 2.0) / std::pow((1.0 - e_sin) / (1.0 + e_sin), e / 2.0);
    }

    // Snyder 15-1 to 15-10. With a single standard parallel the cone constant is sin(lat_1).
    lambert_conformal_conic_projection::lambert_conformal_conic_projection(const projection_parameters& parameters,
                                                                           const ellipsoid& shape) noexcept(false):
        parameters_ {parameters},
        shape_ {shape}
    {
        if (!parameters_.has_lat_1)
            parameters_.lat_1 = parameters_.lat_0;
        if (!parameters_.has_lat_2)
            parameters_.lat_2 = parameters_.lat_1;

        const double e2 {shape_.eccentricity_squared()};
        const auto m = [e2](const double lat) { return std::cos(lat) / std::sqrt(1.0 - e2 * std::sin(lat) * std::sin(lat)); };

        const double m1 {m(parameters_.lat_1)};
        const double t1 {isometric_t(parameters_.lat_1)};
        if (std::abs(parameters_.lat_1 - parameters_.lat_2) > 1e-10)
            cone_constant_ = (std::log(m1) - std::log(m(parameters_.lat_2))) / (std::log(t1) - std::log(isometric_t(parameters_.lat_2)));
        else
            cone_constant_ = std::sin(parameters_.lat_1);

        if ((cone_constant_ == 0.0) || !std::isfinite(cone_constant_))
            throw transform_error("standard parallels do not define a conic projection");

        cone_factor_ = m1 / (cone_constant_ * std::pow(t1, cone_constant_));
        origin_radius_ = shape_.semi_major_axis * parameters_.scale_factor * cone_factor_ * std::pow(isometric_t(parameters_.lat_0), cone_constant_);
    }

    geodetic_point lambert_conformal_conic_projection::inverse(const double easting, const double northing) const noexcept(false)
    {
        const double sign {(cone_constant_ < 0.0) ? -1.0 : 1.0};
        const double dx {easting - parameters_.false_easting};
        const double dy {origin_radius_ - (northing - parameters_.false_northing)};
        const double radius {sign * std::hypot(dx, dy)};
        const double theta {std::atan2(sign * dx, sign * dy)};
        const double lon {theta / cone_constant_ + parameters_.lon_0};

        if (radius == 0.0)
            return {lon, sign * half_pi, 0.0};

        const double t {std::pow(radius / (shape_.semi_major_axis * parameters_.scale_factor * cone_factor_), 1.0 / cone_constant_)};
        if (!std::isfinite(t))
            throw transform_error("lambert conformal conic coordinate outside the projection domain");

        return {lon, latitude_from_isometric(t, shape_.eccentricity()), 0.0};
    }

} // namespace geoindex::crs
