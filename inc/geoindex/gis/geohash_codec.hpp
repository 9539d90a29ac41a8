/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file geohash_codec.hpp
#pragma once
#ifndef PCH
    #include "geoindex/gis/types.hpp"
    #include <string>
    #include <string_view>
    #include <vector>
#endif

namespace geoindex::gis
{
    /// @brief Stateless conversions between coordinates and base-32 geohash strings.
    /// A geohash of length N is the result of 5*N alternating bisections of the longitude range [-180, 180]
    /// (first bit) and the latitude range [-90, 90]. Every bisection keeps the upper half when the value is
    /// greater than or equal to the midpoint, so cell edges belong to the cell to their north/east.
    class geohash_codec
    {
    public:
        /// @brief The geohash alphabet. The index of a character is its 5-bit value.
        static constexpr std::string_view alphabet {"0123456789bcdefghjkmnpqrstuvwxyz"};
        /// @brief Number of bits carried by one geohash character.
        static constexpr int bits_per_char {5};

        /// @brief Encodes a coordinate into a geohash of the requested length.
        /// @param point The coordinate to encode. Must be finite and within [-90, 90] x [-180, 180].
        /// @param precision Number of characters of the result. Must be positive.
        /// @return The geohash of the cell containing `point`.
        /// @throws std::invalid_argument If `precision` is not positive or `point` is not a valid coordinate.
        static std::string encode(const coordinate& point, int precision) noexcept(false);

        /// @brief Decodes a geohash into the center of its cell.
        /// @throws std::invalid_argument If `hash` is empty or contains a character outside `alphabet`.
        static coordinate decode(std::string_view hash) noexcept(false);

        /// @brief Decodes a geohash into the bounds of its cell.
        /// @throws std::invalid_argument If `hash` is empty or contains a character outside `alphabet`.
        static bounding_box decode_bounding_box(std::string_view hash) noexcept(false);

        /// @brief Elementwise `decode_bounding_box`, preserving order.
        /// @throws std::invalid_argument On the first malformed hash.
        static std::vector<bounding_box> decode_bounding_boxes(const std::vector<std::string>& hashes) noexcept(false);

        /// @brief Elementwise `decode`, preserving order.
        /// @throws std::invalid_argument On the first malformed hash.
        static std::vector<coordinate> decode_all(const std::vector<std::string>& hashes) noexcept(false);

        /// @brief Angular size of the cells of a given precision.
        /// @throws std::invalid_argument If `precision` is not positive.
        static cell_dimensions cell_size(int precision) noexcept(false);

        /// @brief Checks that `hash` is non-empty and made only of alphabet characters.
        static bool is_valid(std::string_view hash) noexcept;

        /// @brief Throws std::invalid_argument if `precision` is not positive.
        static void validate_precision(int precision) noexcept(false);
    };

} // namespace geoindex::gis
