#pragma once

/// @file archive.hpp
/// @brief Deterministic ZIP output and input staging
///
/// Archives are written with sorted entries, fixed DOS timestamps and fixed
/// attributes so that identical trees give byte-identical files. The archive
/// is built next to its destination as `<dest>.part` and renamed on success.

#include "fwd.hpp"
#include "resource_tree.hpp"

#include <mcpack/core/error.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace mcpack_convert {

/// Outcome of a finished archive
struct ArchiveSummary {
    std::filesystem::path destination;
    std::size_t entries = 0;
    std::uintmax_t bytes = 0;
};

// =============================================================================
// ArchiveBuilder
// =============================================================================

class ArchiveBuilder {
public:
    /// 1980-01-01 00:00:00 in MS-DOS date/time format
    static constexpr std::uint16_t k_dos_date = (0 << 9) | (1 << 5) | 1;
    static constexpr std::uint16_t k_dos_time = 0;

    /// Regular file, rw-r--r--
    static constexpr std::uint32_t k_unix_mode = 0100644;

    explicit ArchiveBuilder(const ConverterConfig& config);

    /// Write a tree to a ZIP file
    ///
    /// Nothing is left at the destination (or its .part sibling) on failure
    /// or cancellation.
    [[nodiscard]] mcpack_core::Result<ArchiveSummary> build(
        const ResourceTree& tree,
        const std::filesystem::path& destination) const;

    /// Load a directory and archive it
    [[nodiscard]] mcpack_core::Result<ArchiveSummary> build_directory(
        const std::filesystem::path& root,
        const std::filesystem::path& destination) const;

    /// Temporary path used while building
    [[nodiscard]] static std::filesystem::path partial_path(const std::filesystem::path& destination);

private:
    const ConverterConfig& m_config;
};

// =============================================================================
// Input Staging
// =============================================================================

/// Read every file entry of a ZIP archive into a tree
///
/// All entry names are validated before any content is read; an unsafe
/// name fails with PathSecurityError. Directory entries and entries below
/// ignored directories are skipped.
[[nodiscard]] mcpack_core::Result<ResourceTree> read_archive(
    const std::filesystem::path& archive,
    const ConverterConfig& config);

/// Copy an input folder into a staging directory
///
/// @return Number of files staged
[[nodiscard]] mcpack_core::Result<std::size_t> stage_directory(
    const std::filesystem::path& source,
    const std::filesystem::path& staging,
    const ConverterConfig& config);

/// Extract an input archive into a staging directory
///
/// @return Number of files staged
[[nodiscard]] mcpack_core::Result<std::size_t> stage_archive(
    const std::filesystem::path& archive,
    const std::filesystem::path& staging,
    const ConverterConfig& config);

} // namespace mcpack_convert
