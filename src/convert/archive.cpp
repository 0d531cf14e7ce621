/// @file archive.cpp
/// @brief Archive builder and staging implementation (libzip)

#include <mcpack/convert/archive.hpp>
#include <mcpack/convert/config.hpp>
#include <mcpack/convert/report.hpp>
#include <mcpack/core/log.hpp>

#include <zip.h>

#include <memory>

namespace mcpack_convert {

namespace fs = std::filesystem;

namespace {

struct ZipDiscard {
    void operator()(zip_t* archive) const noexcept { zip_discard(archive); }
};

struct ZipFileClose {
    void operator()(zip_file_t* file) const noexcept { zip_fclose(file); }
};

using ZipHandle = std::unique_ptr<zip_t, ZipDiscard>;
using ZipFileHandle = std::unique_ptr<zip_file_t, ZipFileClose>;

std::string zip_open_error(int code) {
    zip_error_t error;
    zip_error_init_with_code(&error, code);
    std::string message = zip_error_strerror(&error);
    zip_error_fini(&error);
    return message;
}

/// Entry lies below an ignored directory or is itself ignored
bool is_ignored_entry(const std::string& name, const ConverterConfig& config) {
    std::size_t segment_start = 0;
    for (std::size_t i = 0; i <= name.size(); ++i) {
        if (i == name.size() || name[i] == '/') {
            if (i > segment_start && config.is_ignored_name(name.substr(segment_start, i - segment_start))) {
                return true;
            }
            segment_start = i + 1;
        }
    }
    return false;
}

} // anonymous namespace

// =============================================================================
// ArchiveBuilder
// =============================================================================

ArchiveBuilder::ArchiveBuilder(const ConverterConfig& config)
    : m_config(config)
{
}

fs::path ArchiveBuilder::partial_path(const fs::path& destination) {
    fs::path part = destination;
    part += ".part";
    return part;
}

mcpack_core::Result<ArchiveSummary> ArchiveBuilder::build(
    const ResourceTree& tree,
    const fs::path& destination) const {

    MCPACK_LOG_SCOPE("archive build");
    auto logger = mcpack_core::archive_logger();

    if (tree.empty()) {
        return mcpack_core::Err<ArchiveSummary>(mcpack_core::Error(mcpack_core::ErrorCode::InvalidState,
            "Nothing to archive for " + destination.string()));
    }

    std::error_code ec;
    if (destination.has_parent_path()) {
        fs::create_directories(destination.parent_path(), ec);
        if (ec) {
            return mcpack_core::Err<ArchiveSummary>(
                mcpack_core::AssetError::io(destination.string(), ec.message()));
        }
    }

    const fs::path part = partial_path(destination);
    fs::remove(part, ec);

    int open_error = 0;
    ZipHandle archive(zip_open(part.string().c_str(), ZIP_CREATE | ZIP_TRUNCATE, &open_error));
    if (!archive) {
        return mcpack_core::Err<ArchiveSummary>(
            mcpack_core::AssetError::io(destination.string(), zip_open_error(open_error)));
    }

    auto fail = [&](mcpack_core::Error error) {
        archive.reset();
        std::error_code ignored;
        fs::remove(part, ignored);
        logger->error("Archive {} not written: {}", destination.string(), error.message());
        return mcpack_core::Err<ArchiveSummary>(std::move(error));
    };

    const zip_int32_t method = m_config.compression_level == 0 ? ZIP_CM_STORE : ZIP_CM_DEFLATE;
    Checkpoint checkpoint(m_config, "Archiving " + destination.string(), tree.size());

    for (const auto& [path, bytes] : tree.entries()) {
        auto safe = check_relative_path(path);
        if (!safe) {
            return fail(safe.error());
        }

        zip_source_t* source = zip_source_buffer(archive.get(), bytes.data(), bytes.size(), 0);
        if (!source) {
            return fail(mcpack_core::AssetError::io(path, zip_strerror(archive.get())));
        }

        zip_int64_t index = zip_file_add(archive.get(), path.c_str(), source, ZIP_FL_ENC_UTF_8);
        if (index < 0) {
            zip_source_free(source);
            return fail(mcpack_core::AssetError::io(path, zip_strerror(archive.get())));
        }

        const auto entry = static_cast<zip_uint64_t>(index);
        if (zip_set_file_compression(archive.get(), entry, method,
                static_cast<zip_uint32_t>(m_config.compression_level)) != 0 ||
            zip_file_set_dostime(archive.get(), entry, k_dos_time, k_dos_date, 0) != 0 ||
            zip_file_set_external_attributes(archive.get(), entry, 0, ZIP_OPSYS_UNIX,
                k_unix_mode << 16) != 0) {
            return fail(mcpack_core::AssetError::io(path, zip_strerror(archive.get())));
        }

        auto step = checkpoint.advance();
        if (!step) {
            return fail(step.error());
        }
    }

    zip_t* raw = archive.release();
    if (zip_close(raw) != 0) {
        std::string message = zip_strerror(raw);
        zip_discard(raw);
        return fail(mcpack_core::AssetError::io(destination.string(), message));
    }

    fs::rename(part, destination, ec);
    if (ec) {
        return fail(mcpack_core::AssetError::io(destination.string(), ec.message()));
    }

    ArchiveSummary summary;
    summary.destination = destination;
    summary.entries = tree.size();
    summary.bytes = fs::file_size(destination, ec);

    logger->info("Wrote {} ({} entries, {} bytes)", destination.string(), summary.entries, summary.bytes);
    return mcpack_core::Ok(std::move(summary));
}

mcpack_core::Result<ArchiveSummary> ArchiveBuilder::build_directory(
    const fs::path& root,
    const fs::path& destination) const {

    auto tree = ResourceTree::load(root, m_config);
    if (!tree) {
        return mcpack_core::Err<ArchiveSummary>(tree.error());
    }
    return build(*tree, destination);
}

// =============================================================================
// Staging
// =============================================================================

mcpack_core::Result<ResourceTree> read_archive(
    const fs::path& path,
    const ConverterConfig& config) {

    auto logger = mcpack_core::archive_logger();

    int open_error = 0;
    ZipHandle archive(zip_open(path.string().c_str(), ZIP_RDONLY, &open_error));
    if (!archive) {
        return mcpack_core::Err<ResourceTree>(
            mcpack_core::AssetError::io(path.string(), zip_open_error(open_error)));
    }

    const zip_int64_t count = zip_get_num_entries(archive.get(), 0);
    if (count < 0) {
        return mcpack_core::Err<ResourceTree>(
            mcpack_core::AssetError::io(path.string(), zip_strerror(archive.get())));
    }

    // Validate every name before extracting anything
    std::vector<std::pair<zip_uint64_t, std::string>> names;
    names.reserve(static_cast<std::size_t>(count));
    for (zip_int64_t i = 0; i < count; ++i) {
        zip_stat_t stat;
        zip_stat_init(&stat);
        if (zip_stat_index(archive.get(), static_cast<zip_uint64_t>(i), 0, &stat) != 0 ||
            !(stat.valid & ZIP_STAT_NAME)) {
            return mcpack_core::Err<ResourceTree>(
                mcpack_core::AssetError::io(path.string(), zip_strerror(archive.get())));
        }

        std::string name = stat.name;
        auto safe = check_relative_path(name);
        if (!safe) {
            logger->error("Rejected archive {}: {}", path.string(), safe.error().message());
            return mcpack_core::Err<ResourceTree>(safe.error());
        }
        for (auto& c : name) {
            if (c == '\\') {
                c = '/';
            }
        }
        names.emplace_back(static_cast<zip_uint64_t>(i), std::move(name));
    }

    ResourceTree tree;
    Checkpoint checkpoint(config, "Extracting " + path.string(), names.size());

    for (const auto& [index, name] : names) {
        const bool skip = name.back() == '/' || is_ignored_entry(name, config);
        if (!skip) {
            zip_stat_t stat;
            zip_stat_init(&stat);
            if (zip_stat_index(archive.get(), index, 0, &stat) != 0) {
                return mcpack_core::Err<ResourceTree>(
                    mcpack_core::AssetError::io(name, zip_strerror(archive.get())));
            }

            ZipFileHandle file(zip_fopen_index(archive.get(), index, 0));
            if (!file) {
                return mcpack_core::Err<ResourceTree>(
                    mcpack_core::AssetError::io(name, zip_strerror(archive.get())));
            }

            std::string bytes(static_cast<std::size_t>(stat.size), '\0');
            zip_uint64_t offset = 0;
            while (offset < stat.size) {
                zip_int64_t n = zip_fread(file.get(), bytes.data() + offset, stat.size - offset);
                if (n <= 0) {
                    return mcpack_core::Err<ResourceTree>(
                        mcpack_core::AssetError::io(name, "short read"));
                }
                offset += static_cast<zip_uint64_t>(n);
            }

            auto put = tree.put(name, std::move(bytes));
            if (!put) {
                return mcpack_core::Err<ResourceTree>(put.error());
            }
        }

        auto step = checkpoint.advance();
        if (!step) {
            return mcpack_core::Err<ResourceTree>(step.error());
        }
    }

    logger->debug("Read {} files from {}", tree.size(), path.string());
    return mcpack_core::Ok(std::move(tree));
}

mcpack_core::Result<std::size_t> stage_directory(
    const fs::path& source,
    const fs::path& staging,
    const ConverterConfig& config) {

    auto tree = ResourceTree::load(source, config);
    if (!tree) {
        return mcpack_core::Err<std::size_t>(tree.error());
    }
    auto written = tree->write_to(staging, config);
    if (!written) {
        return mcpack_core::Err<std::size_t>(written.error());
    }
    mcpack_core::archive_logger()->info("Staged {} files from {}", tree->size(), source.string());
    return mcpack_core::Ok(tree->size());
}

mcpack_core::Result<std::size_t> stage_archive(
    const fs::path& archive,
    const fs::path& staging,
    const ConverterConfig& config) {

    auto tree = read_archive(archive, config);
    if (!tree) {
        return mcpack_core::Err<std::size_t>(tree.error());
    }
    auto written = tree->write_to(staging, config);
    if (!written) {
        return mcpack_core::Err<std::size_t>(written.error());
    }
    mcpack_core::archive_logger()->info("Staged {} files from {}", tree->size(), archive.string());
    return mcpack_core::Ok(tree->size());
}

} // namespace mcpack_convert
