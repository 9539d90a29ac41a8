/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file crs_definition.hpp
#pragma once
#ifndef PCH
    #include "geoindex/crs/datum.hpp"
    #include "geoindex/crs/projection.hpp"
    #include "geoindex/gis/geometry.hpp"
    #include <memory>
    #include <optional>
    #include <string_view>
#endif

namespace geoindex::crs
{
    /// @brief A coordinate reference system that can be converted to WGS84 longitude/latitude.
    /// Copies share the immutable projection object.
    class crs_definition
    {
    public:
        /// @param shape Ellipsoid of the source datum.
        /// @param to_wgs84 Helmert shift to WGS84; empty when the datum is treated as coincident with WGS84.
        /// @param to_meter Factor converting projected units to metres (ignored for geographic systems).
        /// @param inverse Projection used to unproject the source coordinates. Must not be null.
        /// @throws std::invalid_argument If `inverse` is null or `to_meter` is not a positive finite number.
        crs_definition(const ellipsoid& shape, const std::optional<helmert_parameters>& to_wgs84, double to_meter,
                       std::shared_ptr<const projection> inverse) noexcept(false);

        /// @brief Parses a PROJ.4 definition such as "+proj=utm +zone=33 +datum=WGS84 +units=m +no_defs".
        /// Supported keys: proj, zone, south, ellps, datum, a, b, rf, R, towgs84, lat_0, lon_0, lat_1, lat_2,
        /// lat_ts, k, k_0, x_0, y_0, units, to_meter. Other keys (no_defs, wktext, nadgrids, type, ...) are ignored.
        /// @throws std::invalid_argument If the string is malformed, lacks `+proj` or names an unknown ellipsoid/datum.
        /// @throws unsupported_crs_error If the projection is not supported.
        static crs_definition from_proj4(std::string_view definition) noexcept(false);

        /// @brief Geographic WGS84 (EPSG:4326).
        static crs_definition wgs84() noexcept(false);

        /// @brief Converts one position to WGS84 longitude/latitude degrees.
        /// @throws transform_error If the position is outside the projection domain or the result is not finite.
        gis::position to_wgs84(const gis::position& source) const noexcept(false);

        bool is_geographic() const noexcept { return projection_->is_geographic(); }

        const ellipsoid& shape() const noexcept { return shape_; }
        const std::optional<helmert_parameters>& datum_shift() const noexcept { return to_wgs84_; }
        double to_meter() const noexcept { return to_meter_; }
        const projection& inverse_projection() const noexcept { return *projection_; }

    private:
        ellipsoid shape_;
        std::optional<helmert_parameters> to_wgs84_;
        double to_meter_;
        std::shared_ptr<const projection> projection_;
    };

} // namespace geoindex::crs
