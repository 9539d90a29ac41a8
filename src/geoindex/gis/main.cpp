/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file main.cpp
#include "geoindex/gis/app_config.hpp"
#include "geoindex/gis/flatgeobuf_processor.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

namespace geoindex::gis
{
    /// @brief Main application logic, encapsulated within the `geoindex::gis` namespace.
    /// Parses the command line, loads the built-in CRS definitions and runs the `flatgeobuf_processor`.
    /// @param argc The command line argument count passed from `::main`.
    /// @param argv The command line argument vector passed from `::main`.
    /// @return 0 on success, 1 on usage or processing failure, 2 on a fatal error.
    static int run_application(const int argc, const char* const argv[])
    {
        const std::string_view program_name {((argc > 0) && (argv[0] != nullptr)) ? argv[0] : ""};
        const app_config config {parse_command_line(argc, argv, default_thread_count())};

        if (!config.is_complete())
        {
            std::cerr << "Error: Input and output file paths must be specified." << std::endl;
            std::cerr << usage_text(program_name) << std::endl;
            std::cerr << "  Defaults: precision " << app_config::default_precision << ", threads " << default_thread_count()
                      << ", name column '" << app_config::default_name_column << "'." << std::endl;
            return 1;
        }

        try
        {
            flatgeobuf_processor processor {config, crs::crs_registry::with_builtin_definitions()};
            return processor.process_features() ? 0 : 1;
        }
        catch (const std::exception& e)
        {
            std::cerr << "Fatal error: " << e.what() << std::endl;
            return 2;
        }
    }

} // namespace geoindex::gis

/// @brief Global main function, the entry point of the program.
/// This function delegates all application logic to `geoindex::gis::run_application`.
int main(const int argc, const char* argv[])
{
    try
    {
        return geoindex::gis::run_application(argc, argv);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal error: " << e.what() << std::endl;
    }

    return 2;
}
