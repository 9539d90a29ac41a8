/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file flatgeobuf_processor.hpp
#pragma once
#ifndef PCH
    #include "flatgeobuf/feature_generated.h"
    #include "geoindex/crs/crs_registry.hpp"
    #include "geoindex/gis/app_config.hpp"
    #include "geoindex/gis/types.hpp"
    #include "geoindex/thread_pool.hpp"
    #include <fstream>
    #include <future>
    #include <map>
    #include <optional>
    #include <string>
    #include <string_view>
    #include <vector>
#endif

namespace geoindex::gis
{
    // Type aliases for FlatGeobuf enums
    using FgbColumnType = FlatGeobuf::ColumnType;
    using FgbGeometryType = FlatGeobuf::GeometryType;

    /// @brief Reads a FlatGeobuf file of Polygon/MultiPolygon features, reprojects each feature to WGS84,
    /// covers it with geohashes on a thread pool and writes one CSV row per feature.
    class flatgeobuf_processor
    {
    public:
        /// @brief Constructs the processor.
        /// @param config Paths, precision, thread count and name column.
        /// @param registry CRS definitions used to reproject the input.
        flatgeobuf_processor(const app_config& config, crs::crs_registry registry) noexcept(false);

        /// @brief Executes the workflow of reading, covering and writing.
        /// @return True on success, false on controlled failure (e.g., file format error).
        bool process_features() noexcept(false);

    private:
        /// @brief Loads the entire FGB file into an internal buffer.
        /// @return True if successful, false if file cannot be read or is too small.
        bool initialize_file_buffer() noexcept(false);

        /// @brief Parses the FGB header from the buffer and validates it.
        /// @param[out] out_fbs_header Pointer to store the parsed FlatBuffer Header.
        /// @param[out] out_header_actual_size Size of the header read from the file.
        /// @return True if header is valid and parsed, false otherwise.
        bool parse_and_validate_header(const FlatGeobuf::Header*& out_fbs_header, std::uint32_t& out_header_actual_size) noexcept;

        /// @brief CRS name declared by the header ("EPSG:2154"), or empty when the header declares none.
        static std::optional<std::string> declared_crs(const FlatGeobuf::Header* fbs_header) noexcept(false);

        /// @brief Walks the features after the header (and optional index), submitting one covering task each.
        bool submit_feature_tasks(const FlatGeobuf::Header* fbs_header, std::size_t initial_offset) noexcept(false);

        /// @brief Waits for the covering tasks in submission order and writes their rows.
        /// Failed features are reported and skipped.
        /// @return False if the output stream failed.
        bool collect_and_write_results(std::ofstream& output_file) noexcept(false);

        /// @brief Decodes a FlatGeobuf geometry into the geometry tree.
        /// @param fbs_geometry The geometry table; null yields an empty optional.
        /// @param fallback_type Type to assume when the geometry itself does not name one.
        /// @return The polygonal geometry, or an empty optional for other geometry types.
        static std::optional<geometry> decode_geometry(const FlatGeobuf::Geometry* fbs_geometry, FgbGeometryType fallback_type) noexcept(false);

        /// @brief Rings of one FlatGeobuf polygon, split at its `ends` offsets.
        static polygon_geometry decode_polygon(const FlatGeobuf::Geometry* fbs_geometry) noexcept(false);

        /// @brief Reads all properties of a feature as strings keyed by column name.
        std::map<std::string, std::string> read_properties(const FlatGeobuf::Feature* fbs_feature,
                                                           const FlatGeobuf::Header* fbs_header) const noexcept(false);

        /// @brief Reads one property value from the properties blob and converts it to a string.
        /// @param[out] bytes_read_for_value Bytes occupied by the value, zero if it could not be read.
        std::string read_property_value_at_offset(FgbColumnType col_type, const std::uint8_t* properties_data_start,
                                                  flatbuffers::uoffset_t value_offset_in_blob, flatbuffers::uoffset_t properties_blob_size,
                                                  flatbuffers::uoffset_t& bytes_read_for_value) const noexcept(false);

        /// @brief Prints basic information from the FGB header to standard output.
        void print_header_info(const FlatGeobuf::Header* fbs_header) const noexcept;

        /// @brief Writes the CSV header row.
        void write_csv_header(std::ofstream& out_file) const noexcept(false);

        /// @brief Writes one CSV row.
        void write_csv_row(std::ofstream& out_file, const task_result& result) const noexcept(false);

        /// @brief Loads the content of a file into a byte buffer.
        std::vector<std::uint8_t> load_file_to_buffer(const std::string& file_path) const noexcept(false);

        /// @brief Covers one feature; runs on a worker thread.
        /// @throws std::invalid_argument If the geometry is not a valid WGS84 polygon.
        static task_result process_single_feature_task(task_input_data task_data) noexcept(false);

        static constexpr std::uint64_t progress_report_interval_ {1000u}; /// Interval for reporting progress
        static constexpr char csv_delimiter_ {','};
        static constexpr char csv_hash_separator_ {' '};                  /// Separates the geohashes inside their column.
        static constexpr std::string_view csv_newline_ {"\n"};
        static constexpr std::string_view name_fallback_prefix_ {"Feature_"};
        static constexpr std::uint32_t min_fgb_file_size_ {12u}; /// Minimum valid FGB file size (8 magic + 4 header_size).

        const app_config config_;
        const crs::crs_registry registry_;
        thread_pool thread_pool_;
        std::vector<std::uint8_t> fgb_buffer_ {};
        std::vector<std::future<task_result>> processing_futures_ {};
        std::uint64_t feature_submission_count_ {};
        std::uint64_t skipped_feature_count_ {};
        std::optional<std::string> source_crs_ {};
    };

} // namespace geoindex::gis
