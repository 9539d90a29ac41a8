/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file app_config.hpp
#pragma once
#ifndef PCH
    #include <cstdint>
    #include <string>
    #include <string_view>
#endif

namespace geoindex::gis
{
    /// @brief Settings of the `fgb_geohash` tool, filled from the command line.
    struct app_config
    {
        static constexpr int default_precision {6};
        static constexpr std::string_view default_name_column {"name"};

        /// @brief Path to the input FlatGeobuf file.
        std::string input_path {};
        /// @brief Path to the output CSV file.
        std::string output_path {};
        /// @brief Geohash precision used to cover each feature.
        int precision {default_precision};
        /// @brief Number of worker threads.
        std::uint32_t threads {1u};
        /// @brief Property holding the feature name.
        std::string name_column {default_name_column};

        /// @brief True when both positional paths were given.
        bool is_complete() const noexcept { return !input_path.empty() && !output_path.empty(); }
    };

    /// @brief `std::thread::hardware_concurrency() - 1`, at least one.
    std::uint32_t default_thread_count() noexcept;

    /// @brief Parses `<input.fgb> <output.csv> [-p|--precision N] [-t|--threads N] [-n|--name-column NAME]`.
    /// Invalid numeric values are reported as warnings on std::cerr and the default is kept. A thread count
    /// below one is raised to one. Superfluous positional arguments are reported and ignored.
    /// @param argc The argument count from main().
    /// @param argv The argument vector from main().
    /// @param default_threads Thread count used when `-t` is absent or invalid.
    app_config parse_command_line(int argc, const char* const argv[], std::uint32_t default_threads) noexcept(false);

    /// @brief One-line usage text.
    std::string usage_text(std::string_view program_name) noexcept(false);

} // namespace geoindex::gis
