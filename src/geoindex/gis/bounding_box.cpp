/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file bounding_box.cpp
#include "geoindex/gis/bounding_box.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>

namespace geoindex::gis
{
    bool coordinate::is_valid() const noexcept
    {
        return std::isfinite(lat) && std::isfinite(lon) && (lat >= -90.0) && (lat <= 90.0) && (lon >= -180.0) && (lon <= 180.0);
    }

    bounding_box::bounding_box(const double south, const double west, const double north, const double east) noexcept:
        min_lat {south},
        min_lon {west},
        max_lat {north},
        max_lon {east},
        is_valid {true}
    {
    }

    void bounding_box::update(const double lat, const double lon) noexcept
    {
        min_lat = std::min(min_lat, lat);
        min_lon = std::min(min_lon, lon);
        max_lat = std::max(max_lat, lat);
        max_lon = std::max(max_lon, lon);
        is_valid = true;
    }

    bool bounding_box::intersects(const bounding_box& other) const noexcept
    {
        if (!is_valid || !other.is_valid)
            return false;

        return (min_lat <= other.max_lat) && (other.min_lat <= max_lat) && (min_lon <= other.max_lon) && (other.min_lon <= max_lon);
    }

    bool bounding_box::contains(const coordinate& point) const noexcept
    {
        return is_valid && (point.lat >= min_lat) && (point.lat <= max_lat) && (point.lon >= min_lon) && (point.lon <= max_lon);
    }

    coordinate bounding_box::center() const noexcept
    {
        return {(min_lat + max_lat) / 2.0, (min_lon + max_lon) / 2.0};
    }

    bool bounding_box::is_well_formed() const noexcept
    {
        return is_valid && coordinate {min_lat, min_lon}.is_valid() && coordinate {max_lat, max_lon}.is_valid() && (min_lat <= max_lat) &&
               (min_lon <= max_lon);
    }

    void bounding_box::write_to_stream(std::ostream& os) const noexcept(false)
    {
        if (!is_valid)
        {
            os << invalid_bbox_csv_marker;
            return;
        }

        const std::ios_base::fmtflags original_flags {os.flags()};
        const std::streamsize original_precision {os.precision()};

        os << std::fixed << std::setprecision(csv_coordinate_precision) << min_lat << "," << min_lon << "," << max_lat << "," << max_lon;

        os.flags(original_flags);
        os.precision(original_precision);
    }

    std::ostream& operator<<(std::ostream& os, const coordinate& point)
    {
        return os << '(' << point.lat << ", " << point.lon << ')';
    }

    std::ostream& operator<<(std::ostream& os, const bounding_box& box)
    {
        if (!box.is_valid)
            return os << "[invalid]";

        return os << '[' << box.min_lat << ", " << box.min_lon << " - " << box.max_lat << ", " << box.max_lon << ']';
    }

} // namespace geoindex::gis
