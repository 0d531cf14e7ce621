/// @file resource_tree.cpp
/// @brief Resource tree loading, writing and synchronization

#include <mcpack/convert/resource_tree.hpp>
#include <mcpack/convert/config.hpp>
#include <mcpack/convert/report.hpp>
#include <mcpack/core/log.hpp>

#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>

namespace mcpack_convert {

namespace fs = std::filesystem;

// =============================================================================
// Helpers
// =============================================================================

mcpack_core::Result<void> check_relative_path(std::string_view relative_path) {
    const std::string entry(relative_path);

    if (relative_path.empty()) {
        return mcpack_core::Err(mcpack_core::PathSecurityError::absolute_path(entry));
    }
    if (relative_path.front() == '/' || relative_path.front() == '\\') {
        return mcpack_core::Err(mcpack_core::PathSecurityError::absolute_path(entry));
    }
    // Drive-qualified ("C:foo", "C:\foo")
    if (relative_path.size() >= 2 && relative_path[1] == ':') {
        return mcpack_core::Err(mcpack_core::PathSecurityError::absolute_path(entry));
    }

    std::size_t segment_start = 0;
    for (std::size_t i = 0; i <= relative_path.size(); ++i) {
        if (i == relative_path.size() || relative_path[i] == '/' || relative_path[i] == '\\') {
            if (relative_path.substr(segment_start, i - segment_start) == "..") {
                return mcpack_core::Err(mcpack_core::PathSecurityError::parent_traversal(entry));
            }
            segment_start = i + 1;
        }
    }

    return mcpack_core::Ok();
}

std::string serialize_json(const nlohmann::json& value, int indent) {
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

mcpack_core::Result<nlohmann::json> parse_json(const std::string& bytes, const std::string& path) {
    try {
        return mcpack_core::Ok(nlohmann::json::parse(bytes, nullptr, true, true));
    } catch (const nlohmann::json::parse_error& e) {
        return mcpack_core::Err<nlohmann::json>(mcpack_core::AssetError::malformed(path, e.what()));
    }
}

namespace {

mcpack_core::Result<std::string> read_file(const fs::path& path, const std::string& relative) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return mcpack_core::Err<std::string>(
            mcpack_core::AssetError::io(relative, "cannot open for reading"));
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return mcpack_core::Err<std::string>(
            mcpack_core::AssetError::io(relative, "read failed"));
    }
    return mcpack_core::Ok(buffer.str());
}

/// Write to a hidden sibling then rename over the target
mcpack_core::Result<void> write_file_atomic(
    const fs::path& target, const std::string& bytes, const std::string& relative) {

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return mcpack_core::Err(mcpack_core::AssetError::io(relative, ec.message()));
    }

    fs::path temp = target.parent_path() / ("." + target.filename().string() + ".tmp");
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return mcpack_core::Err(mcpack_core::AssetError::io(relative, "cannot open for writing"));
        }
        file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        if (!file) {
            file.close();
            fs::remove(temp, ec);
            return mcpack_core::Err(mcpack_core::AssetError::io(relative, "write failed"));
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return mcpack_core::Err(mcpack_core::AssetError::io(relative, ec.message()));
    }

    return mcpack_core::Ok();
}

/// Remove now-empty parent directories of a relative path, never root itself
void prune_empty_parents(const fs::path& root, const std::string& relative) {
    std::error_code ec;
    fs::path rel = fs::path(relative).parent_path();
    while (!rel.empty()) {
        fs::path dir = root / rel;
        if (!fs::is_directory(dir, ec) || !fs::is_empty(dir, ec)) {
            break;
        }
        fs::remove(dir, ec);
        if (ec) {
            break;
        }
        rel = rel.parent_path();
    }
}

} // anonymous namespace

// =============================================================================
// ResourceTree: Disk I/O
// =============================================================================

mcpack_core::Result<ResourceTree> ResourceTree::load(
    const fs::path& root,
    const ConverterConfig& config) {

    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return mcpack_core::Err<ResourceTree>(
            mcpack_core::Error(mcpack_core::ErrorCode::NotFound,
                "Directory not found: " + root.string()));
    }

    if (!fs::is_directory(root, ec)) {
        return mcpack_core::Err<ResourceTree>(
            mcpack_core::Error(mcpack_core::ErrorCode::InvalidArgument,
                "Path is not a directory: " + root.string()));
    }

    // Collect first so progress has a total
    std::vector<std::pair<std::string, fs::path>> files;
    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        return mcpack_core::Err<ResourceTree>(
            mcpack_core::AssetError::io(root.string(), ec.message()));
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return mcpack_core::Err<ResourceTree>(
                mcpack_core::AssetError::io(root.string(), ec.message()));
        }
        const auto& entry = *it;
        const auto name = entry.path().filename().string();

        if (entry.is_directory(ec)) {
            if (config.is_ignored_name(name)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(ec) || config.is_ignored_name(name)) {
            continue;
        }

        auto relative = entry.path().lexically_relative(root).generic_string();
        files.emplace_back(std::move(relative), entry.path());
    }

    std::sort(files.begin(), files.end());

    ResourceTree tree;
    Checkpoint checkpoint(config, "Reading " + root.string(), files.size());

    for (const auto& [relative, path] : files) {
        auto bytes = read_file(path, relative);
        if (!bytes) {
            return mcpack_core::Err<ResourceTree>(bytes.error());
        }
        tree.m_entries.emplace(relative, std::move(*bytes));

        auto step = checkpoint.advance();
        if (!step) {
            return mcpack_core::Err<ResourceTree>(step.error());
        }
    }

    mcpack_core::convert_logger()->debug("Loaded {} files from {}", tree.size(), root.string());
    return mcpack_core::Ok(std::move(tree));
}

mcpack_core::Result<void> ResourceTree::write_to(
    const fs::path& root,
    const ConverterConfig& config) const {

    auto result = sync_to(root, ResourceTree{}, config);
    if (!result) {
        return mcpack_core::Err(result.error());
    }
    return mcpack_core::Ok();
}

mcpack_core::Result<std::size_t> ResourceTree::sync_to(
    const fs::path& root,
    const ResourceTree& previous,
    const ConverterConfig& config) const {

    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        return mcpack_core::Err<std::size_t>(
            mcpack_core::AssetError::io(root.string(), ec.message()));
    }

    Checkpoint checkpoint(config, "Writing " + root.string(), m_entries.size());

    for (const auto& [relative, bytes] : m_entries) {
        auto safe = check_relative_path(relative);
        if (!safe) {
            return mcpack_core::Err<std::size_t>(safe.error());
        }

        const std::string* old_bytes = previous.find(relative);
        if (!old_bytes || *old_bytes != bytes) {
            auto written = write_file_atomic(root / fs::path(relative), bytes, relative);
            if (!written) {
                return mcpack_core::Err<std::size_t>(written.error());
            }
        }

        auto step = checkpoint.advance();
        if (!step) {
            return mcpack_core::Err<std::size_t>(step.error());
        }
    }

    std::size_t deleted = 0;
    for (const auto& [relative, bytes] : previous.m_entries) {
        if (contains(relative)) {
            continue;
        }
        fs::path stale = root / fs::path(relative);
        fs::remove(stale, ec);
        if (ec) {
            return mcpack_core::Err<std::size_t>(
                mcpack_core::AssetError::io(relative, ec.message()));
        }
        prune_empty_parents(root, relative);
        ++deleted;
    }

    return mcpack_core::Ok(deleted);
}

// =============================================================================
// ResourceTree: Entries
// =============================================================================

const std::string* ResourceTree::find(const std::string& path) const {
    auto it = m_entries.find(path);
    return it != m_entries.end() ? &it->second : nullptr;
}

mcpack_core::Result<void> ResourceTree::put(const std::string& path, std::string bytes) {
    auto safe = check_relative_path(path);
    if (!safe) {
        return safe;
    }
    m_entries[path] = std::move(bytes);
    return mcpack_core::Ok();
}

mcpack_core::Result<void> ResourceTree::put_json(
    const std::string& path, const nlohmann::json& value, int indent) {
    return put(path, serialize_json(value, indent));
}

mcpack_core::Result<nlohmann::json> ResourceTree::read_json(const std::string& path) const {
    const std::string* bytes = find(path);
    if (!bytes) {
        return mcpack_core::Err<nlohmann::json>(
            mcpack_core::Error(mcpack_core::ErrorCode::NotFound, "No such file in tree: " + path));
    }
    return parse_json(*bytes, path);
}

bool ResourceTree::remove(const std::string& path) {
    return m_entries.erase(path) > 0;
}

std::vector<std::string> ResourceTree::paths() const {
    std::vector<std::string> result;
    result.reserve(m_entries.size());
    for (const auto& [path, bytes] : m_entries) {
        result.push_back(path);
    }
    return result;
}

} // namespace mcpack_convert
