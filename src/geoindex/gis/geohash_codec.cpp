/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file geohash_codec.cpp
#include "geoindex/gis/geohash_codec.hpp"
#include <array>
#include <cmath>
#include <cstdint>
#include <sstream>
#include <stdexcept>

namespace geoindex::gis
{
    static constexpr double min_latitude {-90.0};
    static constexpr double max_latitude {90.0};
    static constexpr double min_longitude {-180.0};
    static constexpr double max_longitude {180.0};

    /// @brief Builds the table mapping an ASCII character to its 5-bit value, or -1 when it is not part of the alphabet.
    static constexpr std::array<std::int8_t, 128u> make_decode_table() noexcept
    {
        std::array<std::int8_t, 128u> table {};
        table.fill(-1);
        for (std::size_t i {}; i < geohash_codec::alphabet.size(); ++i)
            table[static_cast<unsigned char>(geohash_codec::alphabet[i])] = static_cast<std::int8_t>(i);
        return table;
    }

    static constexpr std::array<std::int8_t, 128u> decode_table {make_decode_table()};

    static int char_value(const char c) noexcept
    {
        const auto index = static_cast<unsigned char>(c);
        return (index < decode_table.size()) ? decode_table[index] : -1;
    }

    void geohash_codec::validate_precision(const int precision) noexcept(false)
    {
        if (precision <= 0)
            throw std::invalid_argument("geohash precision must be positive, got " + std::to_string(precision));
    }

    bool geohash_codec::is_valid(const std::string_view hash) noexcept
    {
        if (hash.empty())
            return false;

        for (const char c: hash)
            if (char_value(c) < 0)
                return false;

        return true;
    }

    // Encodes a coordinate into a geohash of the requested length.
    std::string geohash_codec::encode(const coordinate& point, const int precision) noexcept(false)
    {
        validate_precision(precision);
        if (!point.is_valid())
        {
            std::ostringstream oss {};
            oss << "cannot encode invalid coordinate " << point;
            throw std::invalid_argument(oss.str());
        }

        std::string hash {};
        hash.reserve(static_cast<std::size_t>(precision));

        double lat_low {min_latitude}, lat_high {max_latitude};
        double lon_low {min_longitude}, lon_high {max_longitude};
        bool is_lon_bit {true}; // the first bit always refines longitude
        int bit_count {};
        unsigned char_bits {};

        while (hash.size() < static_cast<std::size_t>(precision))
        {
            char_bits <<= 1u;
            if (is_lon_bit)
            {
                const double mid {(lon_low + lon_high) / 2.0};
                if (point.lon >= mid)
                {
                    char_bits |= 1u;
                    lon_low = mid;
                }
                else
                    lon_high = mid;
            }
            else
            {
                const double mid {(lat_low + lat_high) / 2.0};
                if (point.lat >= mid)
                {
                    char_bits |= 1u;
                    lat_low = mid;
                }
                else
                    lat_high = mid;
            }
            is_lon_bit = !is_lon_bit;

            if (++bit_count == bits_per_char)
            {
                hash.push_back(alphabet[char_bits]);
                bit_count = {};
                char_bits = {};
            }
        }

        return hash;
    }

    // Decodes a geohash into the bounds of its cell.
    bounding_box geohash_codec::decode_bounding_box(const std::string_view hash) noexcept(false)
    {
        if (hash.empty())
            throw std::invalid_argument("cannot decode an empty geohash");

        double lat_low {min_latitude}, lat_high {max_latitude};
        double lon_low {min_longitude}, lon_high {max_longitude};
        bool is_lon_bit {true};

        for (const char c: hash)
        {
            const int value {char_value(c)};
            if (value < 0)
                throw std::invalid_argument("invalid character '" + std::string(1u, c) + "' in geohash \"" + std::string(hash) + '"');

            for (int shift {bits_per_char - 1}; shift >= 0; --shift)
            {
                const bool upper_half {((value >> shift) & 1) != 0};
                if (is_lon_bit)
                {
                    const double mid {(lon_low + lon_high) / 2.0};
                    (upper_half ? lon_low : lon_high) = mid;
                }
                else
                {
                    const double mid {(lat_low + lat_high) / 2.0};
                    (upper_half ? lat_low : lat_high) = mid;
                }
                is_lon_bit = !is_lon_bit;
            }
        }

        return {lat_low, lon_low, lat_high, lon_high};
    }

    coordinate geohash_codec::decode(const std::string_view hash) noexcept(false)
    {
        return decode_bounding_box(hash).center();
    }

    std::vector<bounding_box> geohash_codec::decode_bounding_boxes(const std::vector<std::string>& hashes) noexcept(false)
    {
        std::vector<bounding_box> boxes {};
        boxes.reserve(hashes.size());
        for (const auto& hash: hashes)
            boxes.push_back(decode_bounding_box(hash));
        return boxes;
    }

    std::vector<coordinate> geohash_codec::decode_all(const std::vector<std::string>& hashes) noexcept(false)
    {
        std::vector<coordinate> points {};
        points.reserve(hashes.size());
        for (const auto& hash: hashes)
            points.push_back(decode(hash));
        return points;
    }

    // Longitude receives the extra bit when the total bit count is odd.
    cell_dimensions geohash_codec::cell_size(const int precision) noexcept(false)
    {
        validate_precision(precision);
        const int total_bits {precision * bits_per_char};
        const int lon_bits {(total_bits + 1) / 2};
        const int lat_bits {total_bits / 2};
        return {(max_latitude - min_latitude) / std::ldexp(1.0, lat_bits), (max_longitude - min_longitude) / std::ldexp(1.0, lon_bits)};
    }

} // namespace geoindex::gis
