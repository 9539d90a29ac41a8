/// Copyright (c) 2025 - present KMX Systems. All rights reserved.
/// @file flatgeobuf_processor.cpp
#include "geoindex/gis/flatgeobuf_processor.hpp"
#include "flatgeobuf/packedrtree.h" // For PackedRTree::size, if spatial index is present
#include "geoindex/crs/reprojector.hpp"
#include "geoindex/gis/geometry_processor.hpp"
#include "geoindex/gis/polygon_indexer.hpp"
#include <array>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace geoindex::gis
{
    // Precision for floating-point properties when converted to string.
    static constexpr int property_double_precision {15};

    /// @brief Reads a scalar value from a byte pointer and converts it to a string.
    template <typename T>
    static std::string read_scalar_as_string(const std::uint8_t* value_ptr, const flatbuffers::uoffset_t remaining_size,
                                             flatbuffers::uoffset_t& bytes_read) noexcept(false)
    {
        bytes_read = {};
        if (sizeof(T) > remaining_size)
            return {};

        bytes_read = sizeof(T);
        const T value {::flatbuffers::ReadScalar<T>(value_ptr)};
        if constexpr (std::is_floating_point_v<T>)
        {
            std::ostringstream oss {};
            oss << std::setprecision(property_double_precision) << value;
            return oss.str();
        }
        // int8_t/uint8_t would otherwise print as characters
        else if constexpr (sizeof(T) == 1u)
            return std::to_string(static_cast<int>(value));
        else
            return std::to_string(value);
    }

    /// @brief Writes a string to a CSV stream, quoting it when it holds a delimiter, quote or newline.
    static void write_csv_escaped_string(std::ofstream& out_file, const std::string& value) noexcept(false)
    {
        static constexpr char quote_char {'"'};
        static constexpr std::string_view escaped_quote {"\"\""};

        if (value.find_first_of(",\"\n") == std::string::npos)
        {
            out_file << value;
            return;
        }

        out_file << quote_char;
        for (const char c: value)
            if (c == quote_char)
                out_file << escaped_quote;
            else
                out_file << c;
        out_file << quote_char;
    }

    flatgeobuf_processor::flatgeobuf_processor(const app_config& config, crs::crs_registry registry) noexcept(false):
        config_ {config},
        registry_ {std::move(registry)},
        thread_pool_ {config.threads}
    {
        std::cout << "Thread pool initialized with " << thread_pool_.size() << " threads.\n";
    }

    bool flatgeobuf_processor::initialize_file_buffer() noexcept(false)
    {
        fgb_buffer_.clear();
        processing_futures_.clear();
        feature_submission_count_ = {};
        skipped_feature_count_ = {};
        source_crs_ = {};

        fgb_buffer_ = load_file_to_buffer(config_.input_path);

        if (fgb_buffer_.size() < min_fgb_file_size_)
        {
            std::cerr << "Error: FGB file is too small, empty, or could not be read." << std::endl;
            return false;
        }

        return true;
    }

    bool flatgeobuf_processor::parse_and_validate_header(const FlatGeobuf::Header*& out_fbs_header,
                                                         std::uint32_t& out_header_actual_size) noexcept
    {
        // "fgb" 3 "fgb" 0; the fourth byte is the major version.
        static constexpr std::array<std::uint8_t, 8u> expected_magic_bytes {0x66u, 0x67u, 0x62u, 0x03u, 0x66u, 0x67u, 0x62u, 0x00u};

        if (std::memcmp(fgb_buffer_.data(), expected_magic_bytes.data(), expected_magic_bytes.size()) != 0)
        {
            std::cerr << "Error: File is not a valid FlatGeobuf format (magic bytes mismatch)." << std::endl;
            return false;
        }

        const std::size_t header_offset {expected_magic_bytes.size() + sizeof(std::uint32_t)};
        out_header_actual_size = ::flatbuffers::ReadScalar<std::uint32_t>(fgb_buffer_.data() + expected_magic_bytes.size());
        if ((header_offset + out_header_actual_size) > fgb_buffer_.size())
        {
            std::cerr << "Error: File is too small to contain the full header as declared." << std::endl;
            return false;
        }

        flatbuffers::Verifier verifier {fgb_buffer_.data() + header_offset, out_header_actual_size};
        if (!FlatGeobuf::VerifyHeaderBuffer(verifier))
        {
            std::cerr << "Error: Could not parse FlatGeobuf header." << std::endl;
            return false;
        }

        out_fbs_header = FlatGeobuf::GetHeader(fgb_buffer_.data() + header_offset);
        return out_fbs_header != nullptr;
    }

    std::optional<std::string> flatgeobuf_processor::declared_crs(const FlatGeobuf::Header* const fbs_header) noexcept(false)
    {
        const FlatGeobuf::Crs* const fbs_crs {fbs_header->crs()};
        if (fbs_crs == nullptr)
            return {};

        const std::string org {(fbs_crs->org() != nullptr) ? fbs_crs->org()->str() : std::string {"EPSG"}};
        if ((fbs_crs->code_string() != nullptr) && (fbs_crs->code_string()->size() > 0u))
            return org + ':' + fbs_crs->code_string()->str();
        if (fbs_crs->code() > 0)
            return org + ':' + std::to_string(fbs_crs->code());

        return {};
    }

    polygon_geometry flatgeobuf_processor::decode_polygon(const FlatGeobuf::Geometry* const fbs_geometry) noexcept(false)
    {
        polygon_geometry result {};
        const auto* const xy {fbs_geometry->xy()};
        if ((xy == nullptr) || (xy->size() < 2u))
            return result;

        const flatbuffers::uoffset_t position_count {xy->size() / 2u};
        const auto read_ring = [xy](const flatbuffers::uoffset_t first, const flatbuffers::uoffset_t last)
        {
            linear_ring ring {};
            ring.reserve(last - first);
            for (flatbuffers::uoffset_t i {first}; i < last; ++i)
                ring.push_back({xy->Get(2u * i), xy->Get(2u * i + 1u)});
            return ring;
        };

        const auto* const ends {fbs_geometry->ends()};
        if ((ends == nullptr) || (ends->size() == 0u))
        {
            result.rings.push_back(read_ring(0u, position_count));
            return result;
        }

        flatbuffers::uoffset_t start {};
        for (const std::uint32_t end: *ends)
        {
            if ((end <= start) || (end > position_count))
                throw std::invalid_argument("corrupt ring offsets in FlatGeobuf polygon");
            result.rings.push_back(read_ring(start, end));
            start = end;
        }
        return result;
    }

    std::optional<geometry> flatgeobuf_processor::decode_geometry(const FlatGeobuf::Geometry* const fbs_geometry,
                                                                  const FgbGeometryType fallback_type) noexcept(false)
    {
        if (fbs_geometry == nullptr)
            return {};

        const FgbGeometryType type {(fbs_geometry->type() != FgbGeometryType::Unknown) ? fbs_geometry->type() : fallback_type};
        if (type == FgbGeometryType::Polygon)
            return decode_polygon(fbs_geometry);

        if (type == FgbGeometryType::MultiPolygon)
        {
            multi_polygon result {};
            if (const auto* const parts = fbs_geometry->parts())
            {
                result.polygons.reserve(parts->size());
                for (const FlatGeobuf::Geometry* const part: *parts)
                    if (part != nullptr)
                        result.polygons.push_back(decode_polygon(part));
            }
            // A multipolygon with a single part may be stored flat.
            else
                result.polygons.push_back(decode_polygon(fbs_geometry));
            return result;
        }

        return {};
    }

    bool flatgeobuf_processor::submit_feature_tasks(const FlatGeobuf::Header* const fbs_header, const std::size_t initial_offset) noexcept(false)
    {
        std::size_t current_offset {initial_offset};
        const std::uint64_t features_to_process {fbs_header->features_count()};
        const FgbGeometryType header_geom_type {fbs_header->geometry_type()};

        if (features_to_process > 0u)
            processing_futures_.reserve(features_to_process);

        // Features are read until the end of the buffer; a zero count in the header means unknown.
        for (std::uint64_t i {}; current_offset < fgb_buffer_.size(); ++i)
        {
            if ((current_offset + sizeof(std::uint32_t)) > fgb_buffer_.size())
            {
                std::cerr << "Warning: Unexpected end of file while expecting feature " << (i + 1u) << " length." << std::endl;
                return false;
            }

            const std::uint32_t feature_fbs_buffer_size {::flatbuffers::ReadScalar<std::uint32_t>(fgb_buffer_.data() + current_offset)};
            if ((current_offset + sizeof(std::uint32_t) + feature_fbs_buffer_size) > fgb_buffer_.size())
            {
                std::cerr << "Warning: Unexpected end of file or corrupt feature size for feature " << (i + 1u) << std::endl;
                return false;
            }

            const std::uint8_t* const feature_data {fgb_buffer_.data() + current_offset};
            current_offset += (sizeof(std::uint32_t) + feature_fbs_buffer_size);

            flatbuffers::Verifier verifier {feature_data, sizeof(std::uint32_t) + feature_fbs_buffer_size};
            if (!FlatGeobuf::VerifySizePrefixedFeatureBuffer(verifier))
            {
                std::cerr << "Warning: Could not parse feature " << (i + 1u) << ". Skipping." << std::endl;
                ++skipped_feature_count_;
                continue;
            }
            const FlatGeobuf::Feature* const fbs_feature {FlatGeobuf::GetSizePrefixedFeature(feature_data)};

            feature current {};
            current.properties = read_properties(fbs_feature, fbs_header);
            if (const auto it = current.properties.find(config_.name_column); (it != current.properties.end()) && !it->second.empty())
                current.name = it->second;
            else
                current.name = std::string(name_fallback_prefix_) + std::to_string(i + 1u);

            std::optional<geometry> decoded {};
            try
            {
                decoded = decode_geometry(fbs_feature->geometry(), header_geom_type);
            }
            catch (const std::invalid_argument& e)
            {
                std::cerr << "Warning: Feature '" << current.name << "': " << e.what() << ". Skipping." << std::endl;
                ++skipped_feature_count_;
                continue;
            }

            if (!decoded)
            {
                std::cerr << "Warning: Feature '" << current.name << "' has no Polygon/MultiPolygon geometry. Skipping." << std::endl;
                ++skipped_feature_count_;
                continue;
            }
            current.geom = std::move(*decoded);

            // Reprojection falls back to the source coordinates and reports the failure itself.
            feature_collection collection {source_crs_, {}};
            collection.features.push_back(std::move(current));
            feature_collection wgs84 {crs::reproject(collection, registry_)};

            ++feature_submission_count_;
            task_input_data task_data {std::move(wgs84.features.front().name), std::move(wgs84.features.front().geom), config_.precision};
            processing_futures_.push_back(thread_pool_.enqueue_task(&flatgeobuf_processor::process_single_feature_task, std::move(task_data)));

            if ((feature_submission_count_ % progress_report_interval_) == 0u)
                std::cout << "Submitted " << feature_submission_count_
                          << (features_to_process > 0u ? (" / " + std::to_string(features_to_process)) : "") << " features...\r"
                          << std::flush;
        }

        std::cout << "\nAll " << feature_submission_count_ << " features submitted. Collecting results...\n";
        return true;
    }

    bool flatgeobuf_processor::collect_and_write_results(std::ofstream& output_file) noexcept(false)
    {
        std::uint64_t features_written_count {};
        for (auto& fut: processing_futures_)
        {
            try
            {
                write_csv_row(output_file, fut.get());
                ++features_written_count;

                if (((features_written_count % progress_report_interval_) == 0u) || (features_written_count == feature_submission_count_))
                    std::cout << "Written " << features_written_count << " / " << feature_submission_count_ << " results to CSV...\r"
                              << std::flush;
            }
            catch (const std::invalid_argument& e)
            {
                std::cerr << "\nWarning: Skipping a feature that could not be covered: " << e.what() << std::endl;
                ++skipped_feature_count_;
            }
        }

        std::cout << "\nWrote " << features_written_count << " features, skipped " << skipped_feature_count_ << "." << std::endl;
        return static_cast<bool>(output_file);
    }

    bool flatgeobuf_processor::process_features() noexcept(false)
    {
        if (!initialize_file_buffer())
            return false;

        const FlatGeobuf::Header* fbs_header {};
        std::uint32_t header_fbs_actual_size {};
        if (!parse_and_validate_header(fbs_header, header_fbs_actual_size))
            return false;

        print_header_info(fbs_header);

        const FgbGeometryType header_geom_type {fbs_header->geometry_type()};
        if ((header_geom_type != FgbGeometryType::Polygon) && (header_geom_type != FgbGeometryType::MultiPolygon) &&
            (header_geom_type != FgbGeometryType::Unknown))
        {
            std::cerr << "Error: This tool is designed for Polygon/MultiPolygon FGB files. Found: "
                      << FlatGeobuf::EnumNameGeometryType(header_geom_type) << std::endl;
            return false;
        }

        source_crs_ = declared_crs(fbs_header);
        if (!source_crs_)
            std::cerr << "Warning: The file declares no CRS. Coordinates are used as WGS84 longitude/latitude." << std::endl;
        else if (!registry_.contains(*source_crs_))
        {
            // Reported once here instead of once per feature by the reprojector.
            std::cerr << "Warning: CRS " << *source_crs_ << " is not known. Coordinates are used as they are." << std::endl;
            source_crs_.reset();
        }
        else
            std::cout << "Info: Reprojecting from " << *source_crs_ << " to " << crs::target_crs_code << "." << std::endl;

        std::size_t current_offset_after_header {8u + sizeof(std::uint32_t) + header_fbs_actual_size};
        if ((fbs_header->index_node_size() > 0u) && (fbs_header->features_count() > 0u))
            current_offset_after_header += FlatGeobuf::PackedRTree::size(fbs_header->features_count(), fbs_header->index_node_size());

        std::ofstream output_file {config_.output_path};
        if (!output_file.is_open())
        {
            std::cerr << "Error: Could not open CSV file for writing: " << config_.output_path << std::endl;
            return false;
        }

        write_csv_header(output_file);

        if (!submit_feature_tasks(fbs_header, current_offset_after_header))
            std::cerr << "Warning: Feature submission stopped early; writing the features read so far." << std::endl;

        if (!collect_and_write_results(output_file))
        {
            std::cerr << "Error: Writing to " << config_.output_path << " failed." << std::endl;
            return false;
        }

        std::cout << "Output written to: " << config_.output_path << std::endl;
        return true;
    }

    std::vector<std::uint8_t> flatgeobuf_processor::load_file_to_buffer(const std::string& file_path) const noexcept(false)
    {
        std::ifstream file_stream {file_path, std::ios::binary | std::ios::ate};
        if (!file_stream)
            throw std::runtime_error("Cannot open file: " + file_path);

        const std::streamsize size {file_stream.tellg()};
        if (size == 0)
            return {};
        if (size < 0)
            throw std::runtime_error("Invalid file size reported for: " + file_path);

        file_stream.seekg(0, std::ios::beg);
        std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
        if (!file_stream.read(reinterpret_cast<char*>(buffer.data()), size))
            throw std::runtime_error("Error reading file into buffer: " + file_path);

        return buffer;
    }

    std::string flatgeobuf_processor::read_property_value_at_offset(const FgbColumnType col_type, const std::uint8_t* const properties_data_start,
                                                                    const flatbuffers::uoffset_t value_offset_in_blob,
                                                                    const flatbuffers::uoffset_t properties_blob_size,
                                                                    flatbuffers::uoffset_t& bytes_read_for_value) const noexcept(false)
    {
        bytes_read_for_value = {};
        if (value_offset_in_blob >= properties_blob_size)
            return {};

        const std::uint8_t* const value_ptr {properties_data_start + value_offset_in_blob};
        const flatbuffers::uoffset_t remaining {properties_blob_size - value_offset_in_blob};

        switch (col_type)
        {
            case FgbColumnType::Byte:
                return read_scalar_as_string<std::int8_t>(value_ptr, remaining, bytes_read_for_value);
            case FgbColumnType::UByte:
                return read_scalar_as_string<std::uint8_t>(value_ptr, remaining, bytes_read_for_value);
            case FgbColumnType::Bool:
            {
                const std::string raw {read_scalar_as_string<std::uint8_t>(value_ptr, remaining, bytes_read_for_value)};
                return raw.empty() ? std::string {} : ((raw == "0") ? "false" : "true");
            }
            case FgbColumnType::Short:
                return read_scalar_as_string<std::int16_t>(value_ptr, remaining, bytes_read_for_value);
            case FgbColumnType::UShort:
                return read_scalar_as_string<std::uint16_t>(value_ptr, remaining, bytes_read_for_value);
            case FgbColumnType::Int:
                return read_scalar_as_string<std::int32_t>(value_ptr, remaining, bytes_read_for_value);
            case FgbColumnType::UInt:
                return read_scalar_as_string<std::uint32_t>(value_ptr, remaining, bytes_read_for_value);
            case FgbColumnType::Long:
                return read_scalar_as_string<std::int64_t>(value_ptr, remaining, bytes_read_for_value);
            case FgbColumnType::ULong:
                return read_scalar_as_string<std::uint64_t>(value_ptr, remaining, bytes_read_for_value);
            case FgbColumnType::Float:
                return read_scalar_as_string<float>(value_ptr, remaining, bytes_read_for_value);
            case FgbColumnType::Double:
                return read_scalar_as_string<double>(value_ptr, remaining, bytes_read_for_value);
            default:
            {
                // String, Json, DateTime and Binary are stored as uint32_t length followed by the bytes.
                if (sizeof(std::uint32_t) > remaining)
                    return {};
                const std::uint32_t len {::flatbuffers::ReadScalar<std::uint32_t>(value_ptr)};
                if ((sizeof(std::uint32_t) + len) > remaining)
                {
                    std::cerr << "Warning: Property declared length " << len << " exceeds the available data." << std::endl;
                    return {};
                }
                bytes_read_for_value = sizeof(std::uint32_t) + len;
                if (col_type == FgbColumnType::Binary)
                    return {};
                return std::string(reinterpret_cast<const char*>(value_ptr + sizeof(std::uint32_t)), len);
            }
        }
    }

    std::map<std::string, std::string> flatgeobuf_processor::read_properties(const FlatGeobuf::Feature* const fbs_feature,
                                                                             const FlatGeobuf::Header* const fbs_header) const noexcept(false)
    {
        std::map<std::string, std::string> properties {};
        if ((fbs_feature->properties() == nullptr) || (fbs_header->columns() == nullptr))
            return properties;

        const auto* const columns {fbs_header->columns()};
        const std::uint8_t* const blob {fbs_feature->properties()->data()};
        const flatbuffers::uoffset_t blob_size {fbs_feature->properties()->size()};
        flatbuffers::uoffset_t offset {};

        // Properties are stored as (uint16_t column_index, value) pairs.
        while ((offset + sizeof(std::uint16_t)) <= blob_size)
        {
            const std::uint16_t column_index {::flatbuffers::ReadScalar<std::uint16_t>(blob + offset)};
            offset += sizeof(std::uint16_t);

            const FlatGeobuf::Column* const column {(column_index < columns->size()) ? columns->Get(column_index) : nullptr};
            if (column == nullptr)
            {
                std::cerr << "Warning: Corrupt property column index " << column_index << " encountered for feature." << std::endl;
                break;
            }

            flatbuffers::uoffset_t bytes_read {};
            std::string value {read_property_value_at_offset(column->type(), blob, offset, blob_size, bytes_read)};
            if (bytes_read == 0u)
                break;
            offset += bytes_read;

            if (column->name() != nullptr)
                properties.insert_or_assign(column->name()->str(), std::move(value));
        }

        return properties;
    }

    void flatgeobuf_processor::print_header_info(const FlatGeobuf::Header* const fbs_header) const noexcept
    {
        std::cout << "Processing FGB file: " << ((fbs_header->name() != nullptr) ? fbs_header->name()->c_str() : "") << std::endl;
        std::cout << "Header Geometry Type: " << FlatGeobuf::EnumNameGeometryType(fbs_header->geometry_type()) << std::endl;
        std::cout << "Feature count (from header): " << fbs_header->features_count() << std::endl;
        std::cout << "Geohash precision: " << config_.precision << std::endl;
    }

    void flatgeobuf_processor::write_csv_header(std::ofstream& out_file) const noexcept(false)
    {
        out_file << "name" << csv_delimiter_ << "center_lat" << csv_delimiter_ << "center_lon" << csv_delimiter_ << "min_lat" << csv_delimiter_
                 << "min_lon" << csv_delimiter_ << "max_lat" << csv_delimiter_ << "max_lon" << csv_delimiter_ << "precision" << csv_delimiter_
                 << "cell_count" << csv_delimiter_ << "geohashes" << csv_newline_;
    }

    void flatgeobuf_processor::write_csv_row(std::ofstream& out_file, const task_result& result) const noexcept(false)
    {
        write_csv_escaped_string(out_file, result.feature_name);
        out_file << csv_delimiter_;

        const std::ios_base::fmtflags original_flags {out_file.flags()};
        const std::streamsize original_precision {out_file.precision()};
        out_file << std::fixed << std::setprecision(bounding_box::csv_coordinate_precision) << result.center.y << csv_delimiter_
                 << result.center.x;
        out_file.flags(original_flags);
        out_file.precision(original_precision);
        out_file << csv_delimiter_;

        result.bbox.write_to_stream(out_file);
        out_file << csv_delimiter_ << config_.precision << csv_delimiter_ << result.cells.size() << csv_delimiter_;

        bool first {true};
        for (const std::string& cell: result.cells)
        {
            if (!first)
                out_file << csv_hash_separator_;
            out_file << cell;
            first = false;
        }
        out_file << csv_newline_;
    }

    task_result flatgeobuf_processor::process_single_feature_task(task_input_data task_data) noexcept(false)
    {
        task_result result {};
        result.bbox = geometry_processor::calculate_for_geometry(task_data.geom);
        result.center = geometry_processor::find_center(task_data.geom);
        result.cells = polygon_indexer::enumerate(geometry_processor::to_polygons(task_data.geom), task_data.precision);
        result.feature_name = std::move(task_data.feature_name);
        return result;
    }

} // namespace geoindex::gis
