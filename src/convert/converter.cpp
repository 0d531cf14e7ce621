/// @file converter.cpp
/// @brief Entry points and pipeline

#include <mcpack/convert/converter.hpp>
#include <mcpack/convert/cmd_converter.hpp>
#include <mcpack/convert/config.hpp>
#include <mcpack/convert/item_model_converter.hpp>
#include <mcpack/convert/normalizer.hpp>
#include <mcpack/convert/resolver.hpp>
#include <mcpack/convert/resource_tree.hpp>
#include <mcpack/core/log.hpp>

#include <atomic>
#include <chrono>
#include <vector>

namespace mcpack_convert {

namespace fs = std::filesystem;

namespace {

/// Validate and write a converted tree
mcpack_core::Result<void> finish_output(
    const ResourceTree& output,
    const fs::path& output_dir,
    const ConverterConfig& config) {

    ReferenceResolver resolver(output, config.allow_vanilla_references);
    auto valid = resolver.validate_tree();
    if (!valid) {
        return valid;
    }
    return output.write_to(output_dir, config);
}

/// Cleans up the work directory when the pipeline ends
///
/// A directory the caller created beforehand is emptied, never removed.
class WorkDirectory {
public:
    WorkDirectory(fs::path path, bool keep) : m_path(std::move(path)), m_keep(keep) {
        std::error_code ec;
        m_preexisting = fs::exists(m_path, ec);
    }

    ~WorkDirectory() {
        if (m_keep || m_path.empty()) {
            return;
        }
        std::error_code ec;
        if (m_preexisting) {
            std::vector<fs::path> children;
            for (const auto& entry : fs::directory_iterator(m_path, ec)) {
                children.push_back(entry.path());
            }
            for (const auto& child : children) {
                if (ec) {
                    break;
                }
                fs::remove_all(child, ec);
            }
        } else {
            fs::remove_all(m_path, ec);
        }
        if (ec) {
            mcpack_core::convert_logger()->warn("Could not clean up {}: {}", m_path.string(), ec.message());
        }
    }

    WorkDirectory(const WorkDirectory&) = delete;
    WorkDirectory& operator=(const WorkDirectory&) = delete;

    [[nodiscard]] const fs::path& path() const noexcept { return m_path; }

private:
    fs::path m_path;
    bool m_keep;
    bool m_preexisting = false;
};

/// A caller-supplied work directory must be absent or empty
mcpack_core::Result<void> check_work_dir(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return mcpack_core::Ok();
    }
    if (!fs::is_directory(path, ec)) {
        return mcpack_core::Err(mcpack_core::Error(mcpack_core::ErrorCode::InvalidState,
            "Work directory is not a directory: " + path.string()));
    }
    if (!fs::is_empty(path, ec) || ec) {
        return mcpack_core::Err(mcpack_core::Error(mcpack_core::ErrorCode::InvalidState,
            "Work directory is not empty: " + path.string()));
    }
    return mcpack_core::Ok();
}

fs::path fresh_work_dir() {
    static std::atomic<std::uint64_t> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return fs::temp_directory_path() /
        ("mcpack_" + std::to_string(stamp) + "_" + std::to_string(counter.fetch_add(1)));
}

} // anonymous namespace

// =============================================================================
// Entry Points
// =============================================================================

mcpack_core::Result<ConversionReport> convert_custom_model_data(
    const fs::path& input_dir,
    const fs::path& output_dir,
    const ConverterConfig& config) {

    auto input = ResourceTree::load(input_dir, config);
    if (!input) {
        return mcpack_core::Err<ConversionReport>(input.error());
    }

    ConversionReport report;
    CustomModelDataConverter converter(config);
    auto output = converter.convert(*input, report);
    if (!output) {
        return mcpack_core::Err<ConversionReport>(output.error());
    }

    auto written = finish_output(*output, output_dir, config);
    if (!written) {
        return mcpack_core::Err<ConversionReport>(written.error());
    }

    mcpack_core::convert_logger()->info("{}", report.summary());
    return mcpack_core::Ok(std::move(report));
}

mcpack_core::Result<ConversionReport> normalize_folder_structure(
    const fs::path& output_dir,
    const ConverterConfig& config) {

    ConversionReport report;
    FolderStructureNormalizer normalizer(config);
    auto result = normalizer.normalize_directory(output_dir, report);
    if (!result) {
        return mcpack_core::Err<ConversionReport>(result.error());
    }
    return mcpack_core::Ok(std::move(report));
}

mcpack_core::Result<ConversionReport> convert_item_model(
    const fs::path& input_dir,
    const fs::path& output_dir,
    const ConverterConfig& config) {

    auto input = ResourceTree::load(input_dir, config);
    if (!input) {
        return mcpack_core::Err<ConversionReport>(input.error());
    }

    ConversionReport report;
    ReferenceResolver resolver(*input, config.allow_vanilla_references);
    ItemModelConverter converter(config, resolver);
    auto output = converter.convert(report);
    if (!output) {
        return mcpack_core::Err<ConversionReport>(output.error());
    }

    auto written = finish_output(*output, output_dir, config);
    if (!written) {
        return mcpack_core::Err<ConversionReport>(written.error());
    }

    mcpack_core::convert_logger()->info("{}", report.summary());
    return mcpack_core::Ok(std::move(report));
}

mcpack_core::Result<ArchiveSummary> build_archive(
    const fs::path& output_dir,
    const fs::path& destination_zip,
    const ConverterConfig& config) {

    ArchiveBuilder builder(config);
    return builder.build_directory(output_dir, destination_zip);
}

// =============================================================================
// Pipeline
// =============================================================================

const char* conversion_mode_name(ConversionMode mode) {
    switch (mode) {
        case ConversionMode::CustomModelData: return "cmd";
        case ConversionMode::ItemModel: return "item-model";
        default: return "unknown";
    }
}

std::optional<ConversionMode> parse_conversion_mode(std::string_view name) {
    if (name == "cmd" || name == "custom_model_data" || name == "custom-model-data") {
        return ConversionMode::CustomModelData;
    }
    if (name == "item-model" || name == "item_model") {
        return ConversionMode::ItemModel;
    }
    return std::nullopt;
}

std::string default_archive_name(std::time_t when) {
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &when);
#else
    localtime_r(&when, &local);
#endif
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "converted_%Y%m%d_%H%M%S.zip", &local);
    return buffer;
}

mcpack_core::Result<PipelineResult> run_pipeline(
    const PipelineRequest& request,
    const ConverterConfig& config) {

    MCPACK_LOG_SCOPE("migration pipeline");
    auto logger = mcpack_core::convert_logger();

    auto checked = config.validate();
    if (!checked) {
        return mcpack_core::Err<PipelineResult>(checked.error());
    }

    if (!request.work_dir.empty()) {
        auto usable = check_work_dir(request.work_dir);
        if (!usable) {
            return mcpack_core::Err<PipelineResult>(usable.error());
        }
    }

    WorkDirectory work(request.work_dir.empty() ? fresh_work_dir() : request.work_dir,
                       request.keep_work_dir);
    const fs::path staging = work.path() / "input";
    const fs::path output = work.path() / "output";

    logger->info("Migrating {} ({} mode)", request.input.string(), conversion_mode_name(request.mode));

    // Stage
    std::error_code ec;
    mcpack_core::Result<std::size_t> staged = mcpack_core::Err<std::size_t>(
        mcpack_core::Error(mcpack_core::ErrorCode::NotFound, "Input not found: " + request.input.string()));
    if (fs::is_directory(request.input, ec)) {
        staged = stage_directory(request.input, staging, config);
    } else if (fs::is_regular_file(request.input, ec)) {
        staged = stage_archive(request.input, staging, config);
    }
    if (!staged) {
        return mcpack_core::Err<PipelineResult>(staged.error());
    }

    // Convert
    PipelineResult result;
    auto converted = request.mode == ConversionMode::ItemModel
        ? convert_item_model(staging, output, config)
        : convert_custom_model_data(staging, output, config);
    if (!converted) {
        return mcpack_core::Err<PipelineResult>(converted.error());
    }
    result.report.merge(*converted);

    // Normalize
    if (request.mode == ConversionMode::CustomModelData) {
        auto normalized = normalize_folder_structure(output, config);
        if (!normalized) {
            return mcpack_core::Err<PipelineResult>(normalized.error());
        }
        result.report.merge(*normalized);
    }

    // Archive
    auto archived = build_archive(output, request.destination, config);
    if (!archived) {
        return mcpack_core::Err<PipelineResult>(archived.error());
    }
    result.archive = std::move(*archived);

    logger->info("Migration finished: {}", result.report.summary());
    return mcpack_core::Ok(std::move(result));
}

} // namespace mcpack_convert
