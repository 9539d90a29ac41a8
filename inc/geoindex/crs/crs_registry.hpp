/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file crs_registry.hpp
#pragma once
#ifndef PCH
    #include "geoindex/crs/crs_definition.hpp"
    #include <string>
    #include <string_view>
    #include <unordered_map>
#endif

namespace geoindex::crs
{
    /// @brief Lookup table from CRS codes ("EPSG:3857") to definitions.
    /// Codes are normalized on insertion and lookup, so "epsg:3857" and "urn:ogc:def:crs:EPSG::3857" find the same entry.
    /// A registry is filled once and then only read; concurrent reads are safe.
    class crs_registry
    {
    public:
        /// @brief Adds or replaces a definition.
        void add(std::string_view code, const crs_definition& definition) noexcept(false);

        /// @brief Adds or replaces a definition given as a PROJ.4 string.
        /// @throws std::invalid_argument, unsupported_crs_error As `crs_definition::from_proj4`.
        void add(std::string_view code, std::string_view proj4) noexcept(false);

        /// @return The definition, or nullptr when the code is unknown.
        const crs_definition* find(std::string_view code) const noexcept(false);

        /// @throws unsupported_crs_error When the code is unknown.
        const crs_definition& at(std::string_view code) const noexcept(false);

        bool contains(std::string_view code) const noexcept(false) { return find(code) != nullptr; }
        std::size_t size() const noexcept { return definitions_.size(); }
        bool empty() const noexcept { return definitions_.empty(); }

        /// @brief Canonical form of a CRS name: upper-case "AUTHORITY:CODE", with OGC URNs reduced to that form
        /// and CRS84/WGS84 aliases mapped to "EPSG:4326".
        static std::string normalize_code(std::string_view code) noexcept(false);

        /// @brief A registry holding the geographic WGS84/ETRS89/NAD83 systems, the Mercator variants, the UTM zones
        /// on WGS84 and ETRS89, Lambert-93 and the British National Grid.
        static crs_registry with_builtin_definitions() noexcept(false);

    private:
        std::unordered_map<std::string, crs_definition> definitions_;
    };

} // namespace geoindex::crs
