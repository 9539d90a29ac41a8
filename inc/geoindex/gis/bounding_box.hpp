/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file bounding_box.hpp
#pragma once
#ifndef PCH
    #include <iosfwd>
    #include <limits>
#endif

namespace geoindex::gis
{
    /// @brief A geographic position in decimal degrees.
    struct coordinate
    {
        /// @brief Latitude, valid range [-90, 90].
        double lat {};
        /// @brief Longitude, valid range [-180, 180].
        double lon {};

        /// @brief Checks that both components are finite and inside their valid ranges.
        bool is_valid() const noexcept;

        bool operator==(const coordinate&) const = default;
    };

    /// @brief Represents an axis-aligned latitude/longitude rectangle.
    /// Boxes never wrap across the antimeridian, so `min_lon <= max_lon` always holds for a valid box.
    struct bounding_box
    {
        /// @brief Southern edge.
        double min_lat {std::numeric_limits<double>::max()};
        /// @brief Western edge.
        double min_lon {std::numeric_limits<double>::max()};
        /// @brief Northern edge.
        double max_lat {std::numeric_limits<double>::lowest()};
        /// @brief Eastern edge.
        double max_lon {std::numeric_limits<double>::lowest()};
        /// @brief Flag indicating whether the bounding box contains valid data.
        /// An invalid bounding box typically means it has not been updated with any coordinates.
        bool is_valid {};

        /// @brief String representation for an invalid bounding box when writing to CSV.
        static constexpr char const* invalid_bbox_csv_marker {",,,"};
        /// @brief Default precision used when writing coordinate values to a CSV stream.
        static constexpr int csv_coordinate_precision {6};

        /// @brief Default constructor. Creates an empty, invalid box.
        bounding_box() noexcept = default;

        /// @brief Creates a valid box from its four edges. The edges are taken as given.
        bounding_box(double south, double west, double north, double east) noexcept;

        /// @brief Updates the bounding box to include a given point.
        /// If the bounding box is currently invalid, its extent is set to this point.
        /// @param lat Latitude of the point to include.
        /// @param lon Longitude of the point to include.
        void update(double lat, double lon) noexcept;

        /// @brief Tests whether two boxes share at least one point (edges included).
        bool intersects(const bounding_box& other) const noexcept;

        /// @brief Tests whether a coordinate lies inside the box (edges included).
        bool contains(const coordinate& point) const noexcept;

        /// @brief Midpoint of the box.
        coordinate center() const noexcept;

        /// @brief Checks the ordering invariant and that every edge is a finite, in-range coordinate.
        bool is_well_formed() const noexcept;

        /// @brief Writes the bounding box to an output stream in CSV format: "min_lat,min_lon,max_lat,max_lon".
        /// If the bounding box is invalid (is_valid is false), it writes the `invalid_bbox_csv_marker`.
        /// @param os The output stream to write the formatted string to.
        /// @throws std::ios_base::failure On stream write errors if stream exceptions are enabled for `os`.
        void write_to_stream(std::ostream& os) const noexcept(false);

        bool operator==(const bounding_box&) const = default;
    };

    std::ostream& operator<<(std::ostream& os, const coordinate& point);
    std::ostream& operator<<(std::ostream& os, const bounding_box& box);

} // namespace geoindex::gis
