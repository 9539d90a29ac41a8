/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file crs_definition.cpp
#include "geoindex/crs/crs_definition.hpp"
#include "geoindex/crs/errors.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <numbers>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace geoindex::crs
{
    static constexpr double degrees_to_radians {std::numbers::pi / 180.0};
    static constexpr double radians_to_degrees {180.0 / std::numbers::pi};
    static constexpr double degree_tolerance {1e-9};

    namespace
    {
        struct proj4_token
        {
            std::string_view key;
            std::optional<std::string_view> value;
        };

        std::vector<proj4_token> tokenize(const std::string_view definition) noexcept(false)
        {
            std::vector<proj4_token> tokens {};
            std::size_t pos {};
            while (pos < definition.size())
            {
                if ((definition[pos] == ' ') || (definition[pos] == '\t') || (definition[pos] == '\n') || (definition[pos] == '\r'))
                {
                    ++pos;
                    continue;
                }

                std::size_t end {definition.find_first_of(" \t\n\r", pos)};
                if (end == std::string_view::npos)
                    end = definition.size();

                const std::string_view word {definition.substr(pos, end - pos)};
                pos = end;
                if ((word.size() < 2u) || (word.front() != '+'))
                    throw std::invalid_argument("malformed PROJ.4 token \"" + std::string(word) + '"');

                const std::size_t equals {word.find('=')};
                if (equals == std::string_view::npos)
                    tokens.push_back({word.substr(1u), std::nullopt});
                else
                    tokens.push_back({word.substr(1u, equals - 1u), word.substr(equals + 1u)});
            }
            return tokens;
        }

        double parse_number(const std::string_view key, const std::optional<std::string_view>& text) noexcept(false)
        {
            if (!text || text->empty())
                throw std::invalid_argument("PROJ.4 parameter +" + std::string(key) + " requires a value");

            const char* const first {text->data()};
            const char* const last {first + text->size()};
            double value {};
            // from_chars rejects a leading '+', which PROJ strings occasionally carry.
            const char* const start {(*first == '+') ? first + 1 : first};
            const auto [ptr, ec] = std::from_chars(start, last, value);
            if ((ec != std::errc()) || (ptr != last) || !std::isfinite(value))
                throw std::invalid_argument("invalid numeric value for +" + std::string(key) + ": \"" + std::string(*text) + '"');

            return value;
        }

        helmert_parameters parse_helmert(const std::optional<std::string_view>& text) noexcept(false)
        {
            if (!text)
                throw std::invalid_argument("PROJ.4 parameter +towgs84 requires a value");

            helmert_parameters result {};
            std::size_t count {};
            std::string_view rest {*text};
            while (true)
            {
                const std::size_t comma {rest.find(',')};
                if (count == result.values.size())
                    throw std::invalid_argument("+towgs84 takes 3 or 7 values");

                result.values[count++] = parse_number("towgs84", rest.substr(0u, comma));
                if (comma == std::string_view::npos)
                    break;
                rest.remove_prefix(comma + 1u);
            }

            if ((count != 3u) && (count != 7u))
                throw std::invalid_argument("+towgs84 takes 3 or 7 values");

            return result;
        }

        double unit_to_meter(const std::string_view unit) noexcept(false)
        {
            if (unit == "m")
                return 1.0;
            if (unit == "km")
                return 1000.0;
            if (unit == "ft")
                return 0.3048;
            if (unit == "us-ft")
                return 1200.0 / 3937.0;

            throw std::invalid_argument("unsupported PROJ.4 unit \"" + std::string(unit) + '"');
        }
    } // namespace

    crs_definition::crs_definition(const ellipsoid& shape, const std::optional<helmert_parameters>& to_wgs84, const double to_meter,
                                   std::shared_ptr<const projection> inverse) noexcept(false):
        shape_ {shape},
        to_wgs84_ {to_wgs84},
        to_meter_ {to_meter},
        projection_ {std::move(inverse)}
    {
        if (projection_ == nullptr)
            throw std::invalid_argument("a CRS definition requires a projection");
        if (!std::isfinite(to_meter_) || (to_meter_ <= 0.0))
            throw std::invalid_argument("unit factor must be a positive number");
    }

    crs_definition crs_definition::from_proj4(const std::string_view definition) noexcept(false)
    {
        std::optional<std::string_view> proj_name {};
        std::optional<ellipsoid> shape {};
        std::optional<helmert_parameters> to_wgs84 {};
        bool datum_given {};
        projection_parameters parameters {};
        double to_meter {1.0};
        int zone {};
        bool south {};

        std::optional<double> semi_major {}, semi_minor {}, inverse_flattening {};

        for (const proj4_token& token: tokenize(definition))
        {
            const std::string_view key {token.key};
            if (key == "proj")
            {
                if (!token.value || token.value->empty())
                    throw std::invalid_argument("+proj requires a value");
                proj_name = *token.value;
            }
            else if (key == "ellps")
            {
                if (!token.value || !(shape = ellipsoid::find(*token.value)))
                    throw std::invalid_argument("unknown ellipsoid \"" + std::string(token.value.value_or("")) + '"');
            }
            else if (key == "datum")
            {
                const std::optional<datum_definition> datum {token.value ? datum_definition::find(*token.value) : std::nullopt};
                if (!datum)
                    throw std::invalid_argument("unknown datum \"" + std::string(token.value.value_or("")) + '"');
                shape = datum->shape;
                if (!to_wgs84)
                    to_wgs84 = datum->to_wgs84;
                datum_given = true;
            }
            else if (key == "towgs84")
                to_wgs84 = parse_helmert(token.value);
            else if (key == "a")
                semi_major = parse_number(key, token.value);
            else if (key == "b")
                semi_minor = parse_number(key, token.value);
            else if (key == "rf")
                inverse_flattening = parse_number(key, token.value);
            else if (key == "R")
            {
                semi_major = parse_number(key, token.value);
                semi_minor = semi_major;
            }
            else if (key == "zone")
            {
                const double value {parse_number(key, token.value)};
                if ((value < 1.0) || (value > 60.0) || (value != std::floor(value)))
                    throw std::invalid_argument("UTM zone must be an integer between 1 and 60");
                zone = static_cast<int>(value);
            }
            else if (key == "south")
                south = true;
            else if (key == "lat_0")
                parameters.lat_0 = parse_number(key, token.value) * degrees_to_radians;
            else if (key == "lon_0")
                parameters.lon_0 = parse_number(key, token.value) * degrees_to_radians;
            else if (key == "lat_1")
            {
                parameters.lat_1 = parse_number(key, token.value) * degrees_to_radians;
                parameters.has_lat_1 = true;
            }
            else if (key == "lat_2")
            {
                parameters.lat_2 = parse_number(key, token.value) * degrees_to_radians;
                parameters.has_lat_2 = true;
            }
            else if (key == "lat_ts")
                parameters.lat_ts = parse_number(key, token.value) * degrees_to_radians;
            else if ((key == "k") || (key == "k_0"))
                parameters.scale_factor = parse_number(key, token.value);
            else if (key == "x_0")
                parameters.false_easting = parse_number(key, token.value);
            else if (key == "y_0")
                parameters.false_northing = parse_number(key, token.value);
            else if (key == "units")
            {
                if (!token.value)
                    throw std::invalid_argument("+units requires a value");
                to_meter = unit_to_meter(*token.value);
            }
            else if (key == "to_meter")
                to_meter = parse_number(key, token.value);
        }

        if (!proj_name)
            throw std::invalid_argument("PROJ.4 definition has no +proj parameter");

        ellipsoid resolved {shape.value_or(wgs84_ellipsoid)};
        if (semi_major)
        {
            resolved.semi_major_axis = *semi_major;
            if (semi_minor)
                resolved = ellipsoid::from_axes(*semi_major, *semi_minor);
        }
        else if (semi_minor)
            resolved = ellipsoid::from_axes(resolved.semi_major_axis, *semi_minor);
        if (inverse_flattening)
            resolved.inverse_flattening = *inverse_flattening;

        if (!(resolved.semi_major_axis > 0.0) || (resolved.inverse_flattening < 0.0))
            throw std::invalid_argument("invalid ellipsoid parameters");

        // Without a datum or towgs84, WGS84 is assumed only when the ellipsoid is WGS84 itself.
        if (!to_wgs84 && !datum_given && (resolved == wgs84_ellipsoid))
            to_wgs84 = helmert_parameters {};

        if (*proj_name == "utm")
        {
            if (zone == 0)
                throw std::invalid_argument("+proj=utm requires +zone");
            parameters.lat_0 = 0.0;
            parameters.lon_0 = ((zone - 1) * 6 - 180 + 3) * degrees_to_radians;
            parameters.scale_factor = 0.9996;
            parameters.false_easting = 500000.0;
            parameters.false_northing = south ? 10000000.0 : 0.0;
        }

        return crs_definition {resolved, to_wgs84, to_meter, projection::create(*proj_name, parameters, resolved)};
    }

    crs_definition crs_definition::wgs84() noexcept(false)
    {
        return crs_definition {wgs84_ellipsoid, helmert_parameters {}, 1.0, std::make_shared<longlat_projection>()};
    }

    gis::position crs_definition::to_wgs84(const gis::position& source) const noexcept(false)
    {
        const double scale {is_geographic() ? 1.0 : to_meter_};
        geodetic_point geodetic {projection_->inverse(source.x * scale, source.y * scale)};

        if (to_wgs84_ && !to_wgs84_->is_zero())
            geodetic = to_geodetic(to_wgs84_->apply(to_geocentric(geodetic, shape_)), wgs84_ellipsoid);

        double lon {geodetic.lon * radians_to_degrees};
        const double lat {geodetic.lat * radians_to_degrees};
        if (!std::isfinite(lon) || !std::isfinite(lat) || (std::abs(lat) > 90.0 + degree_tolerance))
            throw transform_error("coordinate transformation produced an invalid result");

        // Round-off on the antimeridian is not a wrap.
        if (lon > 180.0 + degree_tolerance)
            lon -= 360.0;
        else if (lon < -180.0 - degree_tolerance)
            lon += 360.0;

        return {std::clamp(lon, -180.0, 180.0), std::clamp(lat, -90.0, 90.0)};
    }

} // namespace geoindex::crs
