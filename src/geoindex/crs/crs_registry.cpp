/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file crs_registry.cpp
#include "geoindex/crs/crs_registry.hpp"
#include "geoindex/crs/errors.hpp"
#include <algorithm>
#include <cctype>

namespace geoindex::crs
{
    static constexpr std::string_view ogc_urn_prefix {"URN:OGC:DEF:CRS:"};

    void crs_registry::add(const std::string_view code, const crs_definition& definition) noexcept(false)
    {
        definitions_.insert_or_assign(normalize_code(code), definition);
    }

    void crs_registry::add(const std::string_view code, const std::string_view proj4) noexcept(false)
    {
        add(code, crs_definition::from_proj4(proj4));
    }

    const crs_definition* crs_registry::find(const std::string_view code) const noexcept(false)
    {
        const auto it = definitions_.find(normalize_code(code));
        return (it == definitions_.end()) ? nullptr : &it->second;
    }

    const crs_definition& crs_registry::at(const std::string_view code) const noexcept(false)
    {
        if (const crs_definition* const definition = find(code))
            return *definition;

        throw unsupported_crs_error("unknown CRS \"" + std::string(code) + '"');
    }

    std::string crs_registry::normalize_code(const std::string_view code) noexcept(false)
    {
        const std::size_t first {code.find_first_not_of(" \t")};
        if (first == std::string_view::npos)
            return {};
        const std::size_t last {code.find_last_not_of(" \t")};

        std::string result {code.substr(first, last - first + 1u)};
        std::transform(result.begin(), result.end(), result.begin(), [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });

        // urn:ogc:def:crs:<authority>:<version>:<code>, the version may be empty
        if (result.starts_with(ogc_urn_prefix))
        {
            const std::string_view rest {std::string_view(result).substr(ogc_urn_prefix.size())};
            const std::size_t authority_end {rest.find(':')};
            const std::size_t code_start {rest.rfind(':')};
            if ((authority_end != std::string_view::npos) && (code_start + 1u < rest.size()))
                result = std::string(rest.substr(0u, authority_end)) + ':' + std::string(rest.substr(code_start + 1u));
        }

        if ((result == "OGC:CRS84") || (result == "CRS84") || (result == "WGS84") || (result == "EPSG:WGS84"))
            return "EPSG:4326";

        return result;
    }

    crs_registry crs_registry::with_builtin_definitions() noexcept(false)
    {
        crs_registry registry {};

        registry.add("EPSG:4326", crs_definition::wgs84());
        registry.add("EPSG:4258", "+proj=longlat +ellps=GRS80 +towgs84=0,0,0,0,0,0,0 +no_defs");
        registry.add("EPSG:4269", "+proj=longlat +datum=NAD83 +no_defs");

        static constexpr std::string_view web_mercator {
            "+proj=merc +a=6378137 +b=6378137 +lat_ts=0 +lon_0=0 +x_0=0 +y_0=0 +k=1 +units=m +nadgrids=@null +wktext +no_defs"};
        registry.add("EPSG:3857", web_mercator);
        registry.add("EPSG:900913", web_mercator);
        registry.add("EPSG:3395", "+proj=merc +lon_0=0 +k=1 +x_0=0 +y_0=0 +datum=WGS84 +units=m +no_defs");

        for (int zone {1}; zone <= 60; ++zone)
        {
            const std::string zone_text {std::to_string(zone)};
            registry.add("EPSG:" + std::to_string(32600 + zone), "+proj=utm +zone=" + zone_text + " +datum=WGS84 +units=m +no_defs");
            registry.add("EPSG:" + std::to_string(32700 + zone), "+proj=utm +zone=" + zone_text + " +south +datum=WGS84 +units=m +no_defs");
        }

        // ETRS89 / UTM zones 28N to 38N
        for (int zone {28}; zone <= 38; ++zone)
            registry.add("EPSG:" + std::to_string(25800 + zone),
                         "+proj=utm +zone=" + std::to_string(zone) + " +ellps=GRS80 +towgs84=0,0,0,0,0,0,0 +units=m +no_defs");

        registry.add("EPSG:2154", "+proj=lcc +lat_1=49 +lat_2=44 +lat_0=46.5 +lon_0=3 +x_0=700000 +y_0=6600000 +ellps=GRS80 "
                                  "+towgs84=0,0,0,0,0,0,0 +units=m +no_defs");
        registry.add("EPSG:27700", "+proj=tmerc +lat_0=49 +lon_0=-2 +k=0.9996012717 +x_0=400000 +y_0=-100000 +ellps=airy "
                                   "+towgs84=446.448,-125.157,542.06,0.15,0.247,0.842,-20.489 +units=m +no_defs");

        return registry;
    }

} // namespace geoindex::crs
