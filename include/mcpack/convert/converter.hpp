#pragma once

/// @file converter.hpp
/// @brief Directory-level entry points and the full migration pipeline
///
/// Every entry point takes the ConverterConfig for the run; the config
/// carries the optional progress sink and cancellation token.

#include "fwd.hpp"
#include "archive.hpp"
#include "report.hpp"

#include <mcpack/core/error.hpp>

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace mcpack_convert {

// =============================================================================
// Entry Points
// =============================================================================

/// Classify and convert custom model data overrides (output not normalized)
[[nodiscard]] mcpack_core::Result<ConversionReport> convert_custom_model_data(
    const std::filesystem::path& input_dir,
    const std::filesystem::path& output_dir,
    const ConverterConfig& config);

/// Relocate files of a converted tree in place
[[nodiscard]] mcpack_core::Result<ConversionReport> normalize_folder_structure(
    const std::filesystem::path& output_dir,
    const ConverterConfig& config);

/// Classify and convert overrides into standalone item models
[[nodiscard]] mcpack_core::Result<ConversionReport> convert_item_model(
    const std::filesystem::path& input_dir,
    const std::filesystem::path& output_dir,
    const ConverterConfig& config);

/// Archive a finished output directory
[[nodiscard]] mcpack_core::Result<ArchiveSummary> build_archive(
    const std::filesystem::path& output_dir,
    const std::filesystem::path& destination_zip,
    const ConverterConfig& config);

// =============================================================================
// Pipeline
// =============================================================================

enum class ConversionMode : std::uint8_t {
    CustomModelData,  ///< Rewrite overrides to a dispatch encoding, then normalize
    ItemModel,        ///< One standalone model per override
};

/// Get mode name as used on the command line
[[nodiscard]] const char* conversion_mode_name(ConversionMode mode);

/// Parse "cmd" or "item-model"
[[nodiscard]] std::optional<ConversionMode> parse_conversion_mode(std::string_view name);

/// "converted_YYYYmmdd_HHMMSS.zip" for the given local time
[[nodiscard]] std::string default_archive_name(std::time_t when);

struct PipelineRequest {
    ConversionMode mode = ConversionMode::CustomModelData;
    std::filesystem::path input;        ///< Pack folder or .zip
    std::filesystem::path destination;  ///< Final archive path
    std::filesystem::path work_dir;     ///< Staging root, absent or empty (empty path = fresh temp directory)
    bool keep_work_dir = false;
};

struct PipelineResult {
    ConversionReport report;
    ArchiveSummary archive;
};

/// Stage, convert, normalize, validate and archive
///
/// The work directory is cleaned up afterwards unless keep_work_dir is set;
/// a caller-supplied one is emptied rather than removed. A work_dir that
/// already holds files is rejected with InvalidState.
/// No archive exists at the destination unless the whole run succeeded.
[[nodiscard]] mcpack_core::Result<PipelineResult> run_pipeline(
    const PipelineRequest& request,
    const ConverterConfig& config);

} // namespace mcpack_convert
