#pragma once

/// @file config.hpp
/// @brief Converter configuration threaded through every entry point
///
/// A ConverterConfig is a plain value: each conversion run gets its own, so
/// concurrent runs (and tests) never share toggles. The progress sink and
/// cancellation token are non-owning and may be null.

#include "fwd.hpp"
#include <mcpack/core/error.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace mcpack_convert {

// =============================================================================
// DispatchEncoding table
// =============================================================================

/// Get encoding name as used in config files and on the command line
[[nodiscard]] const char* dispatch_encoding_name(DispatchEncoding encoding);

/// Parse "predicate", "select" or "range_dispatch"
[[nodiscard]] std::optional<DispatchEncoding> parse_dispatch_encoding(std::string_view name);

/// Oldest game version the encoding applies to
[[nodiscard]] const char* dispatch_encoding_min_version(DispatchEncoding encoding);

/// Whether the encoding produces items/ descriptors (1.21.4 layout)
[[nodiscard]] constexpr bool uses_item_descriptors(DispatchEncoding encoding) {
    return encoding != DispatchEncoding::Predicate;
}

// =============================================================================
// ConverterConfig
// =============================================================================

struct ConverterConfig {
    /// Custom-model-data target encoding
    DispatchEncoding encoding = DispatchEncoding::RangeDispatch;

    /// Item-model mode: also emit items/<name>_<cmd>.json per variant
    bool emit_variant_item_models = true;

    /// minecraft: identifiers missing from the pack resolve to game assets
    bool allow_vanilla_references = true;

    /// Directory names never traversed
    std::vector<std::string> ignored_directories = {".git", ".svn", ".hg"};

    /// Skip files and directories starting with '.'
    bool skip_hidden_files = true;

    /// Indentation for rewritten JSON (-1 = compact)
    int json_indent = 4;

    /// Deflate level for archive entries (0-9)
    int compression_level = 9;

    /// Optional progress sink (not owned)
    ProgressSink* progress = nullptr;

    /// Optional cancellation token (not owned)
    const CancellationToken* cancellation = nullptr;

    /// Progress sink to use, never null
    [[nodiscard]] ProgressSink& progress_sink() const;

    /// Whether a directory or file name is excluded from traversal
    [[nodiscard]] bool is_ignored_name(const std::string& name) const;

    /// Check value ranges
    [[nodiscard]] mcpack_core::Result<void> validate() const;

    /// Load settings from a JSON file (unknown keys ignored)
    [[nodiscard]] static mcpack_core::Result<ConverterConfig> load_json(
        const std::filesystem::path& path);

    /// Parse settings from JSON text over the defaults
    [[nodiscard]] static mcpack_core::Result<ConverterConfig> from_json_string(
        const std::string& json_str,
        const std::filesystem::path& source_path = {});
};

// =============================================================================
// Command Line
// =============================================================================

/// Collect --key=value, --key value and --flag arguments
///
/// Keys listed in flags never consume the next argument and map to "true".
/// "-h" is read as "help". A bare argument that no option consumed is an
/// InvalidArgument error.
[[nodiscard]] mcpack_core::Result<std::map<std::string, std::string>> parse_command_line(
    const std::vector<std::string>& args,
    const std::set<std::string>& flags);

} // namespace mcpack_convert
