/// @file resource_id.cpp
/// @brief Resource identifier parsing and asset path mapping

#include <mcpack/convert/resource_id.hpp>

#include <algorithm>

namespace mcpack_convert {

namespace {

struct KindLayout {
    AssetKind kind;
    std::string_view directory;
    std::string_view extension;
};

constexpr KindLayout k_layouts[] = {
    {AssetKind::Model, "models", ".json"},
    {AssetKind::Texture, "textures", ".png"},
    {AssetKind::ItemDefinition, "items", ".json"},
};

const KindLayout& layout_for(AssetKind kind) {
    for (const auto& layout : k_layouts) {
        if (layout.kind == kind) {
            return layout;
        }
    }
    return k_layouts[0];
}

bool is_identifier_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.';
}

} // anonymous namespace

// =============================================================================
// ResourceIdentifier
// =============================================================================

mcpack_core::Result<ResourceIdentifier> ResourceIdentifier::parse(
    std::string_view text,
    std::string_view default_namespace) {

    ResourceIdentifier id;
    auto colon = text.find(':');
    if (colon == std::string_view::npos) {
        id.ns = std::string(default_namespace);
        id.path = std::string(text);
    } else {
        id.ns = std::string(text.substr(0, colon));
        id.path = std::string(text.substr(colon + 1));
    }

    if (!is_valid_namespace(id.ns) || !is_valid_path(id.path)) {
        return mcpack_core::Err<ResourceIdentifier>(
            mcpack_core::ReferenceError::malformed(std::string(text)));
    }

    return mcpack_core::Ok(std::move(id));
}

bool ResourceIdentifier::is_valid_namespace(std::string_view ns) {
    return !ns.empty() && std::all_of(ns.begin(), ns.end(), is_identifier_char);
}

bool ResourceIdentifier::is_valid_path(std::string_view path) {
    if (path.empty() || path.front() == '/' || path.back() == '/') {
        return false;
    }
    std::size_t segment_start = 0;
    for (std::size_t i = 0; i <= path.size(); ++i) {
        if (i == path.size() || path[i] == '/') {
            auto segment = path.substr(segment_start, i - segment_start);
            if (segment.empty() || segment == "." || segment == "..") {
                return false;
            }
            segment_start = i + 1;
        } else if (!is_identifier_char(path[i])) {
            return false;
        }
    }
    return true;
}

// =============================================================================
// AssetKey
// =============================================================================

std::string AssetKey::to_path() const {
    return asset_path(kind, id);
}

std::string AssetKey::to_string() const {
    return std::string(asset_kind_name(kind)) + " " + id.to_string();
}

const char* asset_kind_name(AssetKind kind) {
    switch (kind) {
        case AssetKind::Model: return "model";
        case AssetKind::Texture: return "texture";
        case AssetKind::ItemDefinition: return "item";
        default: return "unknown";
    }
}

std::string asset_path(AssetKind kind, const ResourceIdentifier& id) {
    const auto& layout = layout_for(kind);
    std::string path = "assets/";
    path += id.ns;
    path += '/';
    path += layout.directory;
    path += '/';
    path += id.path;
    path += layout.extension;
    return path;
}

std::optional<AssetKey> identify_path(std::string_view relative_path) {
    constexpr std::string_view prefix = "assets/";
    if (relative_path.substr(0, prefix.size()) != prefix) {
        return std::nullopt;
    }

    auto rest = relative_path.substr(prefix.size());
    auto ns_end = rest.find('/');
    if (ns_end == std::string_view::npos) {
        return std::nullopt;
    }
    auto ns = rest.substr(0, ns_end);
    rest = rest.substr(ns_end + 1);

    for (const auto& layout : k_layouts) {
        if (rest.size() <= layout.directory.size() + 1 + layout.extension.size()) {
            continue;
        }
        if (rest.substr(0, layout.directory.size()) != layout.directory ||
            rest[layout.directory.size()] != '/') {
            continue;
        }
        auto tail = rest.substr(layout.directory.size() + 1);
        if (tail.substr(tail.size() - layout.extension.size()) != layout.extension) {
            continue;
        }
        auto path = tail.substr(0, tail.size() - layout.extension.size());
        if (!ResourceIdentifier::is_valid_namespace(ns) || !ResourceIdentifier::is_valid_path(path)) {
            return std::nullopt;
        }
        return AssetKey{layout.kind, ResourceIdentifier{std::string(ns), std::string(path)}};
    }

    return std::nullopt;
}

bool is_builtin_model(const ResourceIdentifier& id) {
    return id.ns == k_default_namespace && id.path.rfind("builtin/", 0) == 0;
}

} // namespace mcpack_convert
