/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file errors.hpp
#pragma once
#ifndef PCH
    #include <stdexcept>
#endif

namespace geoindex::crs
{
    /// @brief A CRS code is missing from the lookup table, or a definition uses an unsupported projection.
    class unsupported_crs_error: public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /// @brief A coordinate could not be transformed (outside the projection domain or a non-finite result).
    class transform_error: public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

} // namespace geoindex::crs
