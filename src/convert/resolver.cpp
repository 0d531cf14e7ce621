/// @file resolver.cpp
/// @brief Reference resolver implementation

#include <mcpack/convert/resolver.hpp>
#include <mcpack/convert/resource_tree.hpp>
#include <mcpack/core/log.hpp>

namespace mcpack_convert {

namespace {

/// Escape a key for use in a JSON pointer
std::string escape_pointer_token(const std::string& token) {
    std::string out;
    out.reserve(token.size());
    for (char c : token) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out += c;
        }
    }
    return out;
}

/// "minecraft:model" and "model" name the same descriptor type
std::string descriptor_type(const nlohmann::json& node) {
    auto it = node.find("type");
    if (it == node.end() || !it->is_string()) {
        return {};
    }
    auto type = it->get<std::string>();
    constexpr std::string_view prefix = "minecraft:";
    if (type.rfind(prefix, 0) == 0) {
        type.erase(0, prefix.size());
    }
    return type;
}

void collect_descriptor_references(
    const nlohmann::json& node, const std::string& pointer, std::vector<Reference>& out) {

    if (node.is_object()) {
        const auto type = descriptor_type(node);
        if (type == "model") {
            auto it = node.find("model");
            if (it != node.end() && it->is_string()) {
                out.push_back(Reference{AssetKind::Model, it->get<std::string>(), pointer + "/model"});
            }
        } else if (type == "special") {
            auto it = node.find("base");
            if (it != node.end() && it->is_string()) {
                out.push_back(Reference{AssetKind::Model, it->get<std::string>(), pointer + "/base"});
            }
        }

        for (auto it = node.begin(); it != node.end(); ++it) {
            if (it->is_structured()) {
                collect_descriptor_references(*it, pointer + "/" + escape_pointer_token(it.key()), out);
            }
        }
    } else if (node.is_array()) {
        for (std::size_t i = 0; i < node.size(); ++i) {
            if (node[i].is_structured()) {
                collect_descriptor_references(node[i], pointer + "/" + std::to_string(i), out);
            }
        }
    }
}

void collect_model_references(const nlohmann::json& j, std::vector<Reference>& out) {
    auto parent = j.find("parent");
    if (parent != j.end() && parent->is_string()) {
        out.push_back(Reference{AssetKind::Model, parent->get<std::string>(), "/parent"});
    }

    auto textures = j.find("textures");
    if (textures != j.end() && textures->is_object()) {
        for (auto it = textures->begin(); it != textures->end(); ++it) {
            if (!it->is_string()) {
                continue;
            }
            auto value = it->get<std::string>();
            // "#name" refers to another texture variable
            if (value.empty() || value.front() == '#') {
                continue;
            }
            out.push_back(Reference{AssetKind::Texture, value,
                "/textures/" + escape_pointer_token(it.key())});
        }
    }

    auto overrides = j.find("overrides");
    if (overrides != j.end() && overrides->is_array()) {
        for (std::size_t i = 0; i < overrides->size(); ++i) {
            const auto& entry = (*overrides)[i];
            if (!entry.is_object()) {
                continue;
            }
            auto model = entry.find("model");
            if (model != entry.end() && model->is_string()) {
                out.push_back(Reference{AssetKind::Model, model->get<std::string>(),
                    "/overrides/" + std::to_string(i) + "/model"});
            }
        }
    }
}

} // anonymous namespace

// =============================================================================
// Reference Extraction
// =============================================================================

std::vector<Reference> extract_references(const nlohmann::json& j, AssetKind file_kind) {
    std::vector<Reference> refs;
    if (!j.is_object()) {
        return refs;
    }
    if (file_kind == AssetKind::Model) {
        collect_model_references(j, refs);
    } else if (file_kind == AssetKind::ItemDefinition) {
        collect_descriptor_references(j, "", refs);
    }
    return refs;
}

std::size_t rewrite_references(
    nlohmann::json& j,
    AssetKind file_kind,
    const std::function<std::optional<std::string>(const Reference&)>& rewrite) {

    std::size_t count = 0;
    for (const auto& ref : extract_references(j, file_kind)) {
        auto replacement = rewrite(ref);
        if (!replacement || *replacement == ref.text) {
            continue;
        }
        j[nlohmann::json::json_pointer(ref.pointer)] = *replacement;
        ++count;
    }
    return count;
}

// =============================================================================
// ReferenceIndex
// =============================================================================

const std::set<std::string>& ReferenceIndex::dependents(const AssetKey& key) const {
    static const std::set<std::string> empty;
    auto it = m_dependents.find(key);
    return it != m_dependents.end() ? it->second : empty;
}

// =============================================================================
// ReferenceResolver
// =============================================================================

ReferenceResolver::ReferenceResolver(const ResourceTree& tree, bool allow_vanilla_references)
    : m_tree(tree)
    , m_allow_vanilla(allow_vanilla_references)
{
}

bool ReferenceResolver::is_external(const ResourceIdentifier& id, AssetKind kind) const {
    if (kind == AssetKind::Model && is_builtin_model(id)) {
        return true;
    }
    return m_allow_vanilla && id.ns == k_default_namespace;
}

mcpack_core::Result<ResolvedReference> ReferenceResolver::resolve(
    const ResourceIdentifier& id,
    AssetKind kind,
    const std::string& referrer) const {

    ResolvedReference resolved;
    resolved.key = AssetKey{kind, id};
    resolved.path = asset_path(kind, id);
    resolved.in_tree = m_tree.contains(resolved.path);

    if (!resolved.in_tree && !is_external(id, kind)) {
        return mcpack_core::Err<ResolvedReference>(
            mcpack_core::ReferenceError::unresolved(
                std::string(asset_kind_name(kind)) + " " + id.to_string(), referrer));
    }

    return mcpack_core::Ok(std::move(resolved));
}

mcpack_core::Result<ResolvedReference> ReferenceResolver::resolve(
    std::string_view text,
    AssetKind kind,
    const std::string& referrer,
    std::string_view default_namespace) const {

    auto id = ResourceIdentifier::parse(text, default_namespace);
    if (!id) {
        return mcpack_core::Err<ResolvedReference>(
            mcpack_core::ReferenceError::malformed(std::string(text), referrer));
    }
    return resolve(*id, kind, referrer);
}

std::optional<AssetKey> ReferenceResolver::identify(const std::string& path) const {
    if (!m_tree.contains(path)) {
        return std::nullopt;
    }
    return identify_path(path);
}

mcpack_core::Result<nlohmann::json> ReferenceResolver::load_json(const ResolvedReference& ref) const {
    return m_tree.read_json(ref.path);
}

ReferenceIndex ReferenceResolver::build_index() const {
    ReferenceIndex index;

    for (const auto& [path, bytes] : m_tree.entries()) {
        auto key = identify_path(path);
        if (!key || key->kind == AssetKind::Texture) {
            continue;
        }
        auto json = parse_json(bytes, path);
        if (!json) {
            continue;
        }
        for (const auto& ref : extract_references(*json, key->kind)) {
            auto id = ResourceIdentifier::parse(ref.text);
            if (id) {
                index.add(AssetKey{ref.kind, std::move(*id)}, path);
            }
        }
    }

    mcpack_core::convert_logger()->debug("Reference index: {} referenced assets", index.size());
    return index;
}

mcpack_core::Result<void> ReferenceResolver::validate_tree() const {
    std::size_t checked = 0;

    for (const auto& [path, bytes] : m_tree.entries()) {
        auto key = identify_path(path);
        if (!key || key->kind == AssetKind::Texture) {
            continue;
        }
        auto json = parse_json(bytes, path);
        if (!json) {
            continue;
        }
        for (const auto& ref : extract_references(*json, key->kind)) {
            auto resolved = resolve(ref.text, ref.kind, path);
            if (!resolved) {
                mcpack_core::convert_logger()->error("{}", resolved.error().message());
                return mcpack_core::Err(resolved.error());
            }
            ++checked;
        }
    }

    mcpack_core::convert_logger()->debug("Validated {} references", checked);
    return mcpack_core::Ok();
}

} // namespace mcpack_convert
