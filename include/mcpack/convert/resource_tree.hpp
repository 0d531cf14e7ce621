#pragma once

/// @file resource_tree.hpp
/// @brief In-memory resource pack tree
///
/// A ResourceTree maps forward-slash relative paths to file bytes. The map is
/// ordered, so every traversal (conversion, writing, archiving) sees the same
/// sequence regardless of filesystem directory order.

#include "fwd.hpp"
#include <mcpack/core/error.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mcpack_convert {

/// Reject absolute, drive-qualified and ".."-containing relative paths
[[nodiscard]] mcpack_core::Result<void> check_relative_path(std::string_view relative_path);

/// Serialize JSON the way every rewritten asset is written
[[nodiscard]] std::string serialize_json(const nlohmann::json& value, int indent);

/// Parse asset JSON, failing with AssetError::malformed
[[nodiscard]] mcpack_core::Result<nlohmann::json> parse_json(
    const std::string& bytes, const std::string& path);

// =============================================================================
// ResourceTree
// =============================================================================

class ResourceTree {
public:
    using EntryMap = std::map<std::string, std::string>;

    ResourceTree() = default;

    // Movable, copyable on request only
    ResourceTree(ResourceTree&&) = default;
    ResourceTree& operator=(ResourceTree&&) = default;
    ResourceTree(const ResourceTree&) = default;
    ResourceTree& operator=(const ResourceTree&) = default;

    // =========================================================================
    // Disk I/O
    // =========================================================================

    /// Read every file under root, honoring ignored directories and hidden files
    [[nodiscard]] static mcpack_core::Result<ResourceTree> load(
        const std::filesystem::path& root,
        const ConverterConfig& config);

    /// Write every entry under root, one atomic temp-and-rename per file
    [[nodiscard]] mcpack_core::Result<void> write_to(
        const std::filesystem::path& root,
        const ConverterConfig& config) const;

    /// Make root match this tree given its previous content
    ///
    /// New and changed files are written first; paths present in `previous`
    /// but not here are deleted afterwards, then empty directories pruned.
    /// @return Number of deleted files
    [[nodiscard]] mcpack_core::Result<std::size_t> sync_to(
        const std::filesystem::path& root,
        const ResourceTree& previous,
        const ConverterConfig& config) const;

    // =========================================================================
    // Entries
    // =========================================================================

    [[nodiscard]] bool contains(const std::string& path) const {
        return m_entries.count(path) > 0;
    }

    /// Get bytes for a path, nullptr if absent
    [[nodiscard]] const std::string* find(const std::string& path) const;

    /// Insert or replace an entry
    [[nodiscard]] mcpack_core::Result<void> put(const std::string& path, std::string bytes);

    /// Insert or replace an entry with serialized JSON
    [[nodiscard]] mcpack_core::Result<void> put_json(
        const std::string& path, const nlohmann::json& value, int indent);

    /// Parse an entry as JSON
    [[nodiscard]] mcpack_core::Result<nlohmann::json> read_json(const std::string& path) const;

    /// Remove an entry
    bool remove(const std::string& path);

    [[nodiscard]] const EntryMap& entries() const noexcept { return m_entries; }
    [[nodiscard]] std::vector<std::string> paths() const;
    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }

    bool operator==(const ResourceTree& other) const = default;

private:
    EntryMap m_entries;
};

} // namespace mcpack_convert
