/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file app_config.cpp
#include "geoindex/gis/app_config.hpp"
#include <iostream>
#include <stdexcept>
#include <thread>

namespace geoindex::gis
{
    // Parses a positive integer option value, keeping `fallback` when the text is not a number.
    static int parse_int_option(const std::string_view option, const std::string& text, const int fallback)
    {
        try
        {
            std::size_t consumed {};
            const int value {std::stoi(text, &consumed)};
            if (consumed == text.size())
                return value;

            std::cerr << "Warning: Invalid value for " << option << ": " << text << ". Using default (" << fallback << ")." << std::endl;
        }
        catch (const std::invalid_argument&)
        {
            std::cerr << "Warning: Invalid value for " << option << ": " << text << ". Using default (" << fallback << ")." << std::endl;
        }
        catch (const std::out_of_range&)
        {
            std::cerr << "Warning: Value out of range for " << option << ": " << text << ". Using default (" << fallback << ")."
                      << std::endl;
        }

        return fallback;
    }

    std::uint32_t default_thread_count() noexcept
    {
        const std::uint32_t num_cores {std::thread::hardware_concurrency()};
        return (num_cores > 1u) ? (num_cores - 1u) : 1u;
    }

    app_config parse_command_line(const int argc, const char* const argv[], const std::uint32_t default_threads) noexcept(false)
    {
        app_config config {};
        config.threads = (default_threads > 0u) ? default_threads : 1u;

        for (int i {1}; i < argc; ++i)
        {
            const std::string arg {argv[i]};
            const bool is_precision {(arg == "-p") || (arg == "--precision")};
            const bool is_threads {(arg == "-t") || (arg == "--threads")};
            const bool is_name_column {(arg == "-n") || (arg == "--name-column")};

            if (is_precision || is_threads || is_name_column)
            {
                if ((i + 1) >= argc)
                {
                    std::cerr << "Warning: Missing value for " << arg << ". Using default." << std::endl;
                    break;
                }

                const std::string value {argv[++i]};
                if (is_precision)
                {
                    const int precision {parse_int_option(arg, value, app_config::default_precision)};
                    if (precision > 0)
                        config.precision = precision;
                    else
                        std::cerr << "Warning: Precision must be positive, got " << precision << ". Using default ("
                                  << app_config::default_precision << ")." << std::endl;
                }
                else if (is_threads)
                {
                    const int threads {parse_int_option(arg, value, static_cast<int>(config.threads))};
                    config.threads = (threads > 0) ? static_cast<std::uint32_t>(threads) : 1u;
                }
                else
                    config.name_column = value;
            }
            else if (config.input_path.empty())
                config.input_path = arg;
            else if (config.output_path.empty())
                config.output_path = arg;
            else
                std::cerr << "Warning: Unknown or superfluous argument: " << arg << std::endl;
        }

        return config;
    }

    std::string usage_text(const std::string_view program_name) noexcept(false)
    {
        return "Usage: " + std::string(program_name.empty() ? "fgb_geohash" : program_name) +
               " <input.fgb> <output.csv> [-p|--precision N] [-t|--threads N] [-n|--name-column NAME]";
    }

} // namespace geoindex::gis
