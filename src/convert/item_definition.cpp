/// @file item_definition.cpp
/// @brief Legacy item definition parsing

#include <mcpack/convert/item_definition.hpp>
#include <mcpack/convert/classifier.hpp>
#include <mcpack/convert/report.hpp>
#include <mcpack/convert/resolver.hpp>
#include <mcpack/core/log.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>

namespace mcpack_convert {

namespace {

constexpr const char* k_cmd_key = "custom_model_data";

/// Integer value of a predicate number; floats are accepted when integral
bool read_integer(const nlohmann::json& value, std::int64_t& out) {
    if (value.is_number_unsigned()) {
        const auto u = value.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return false;
        }
        out = static_cast<std::int64_t>(u);
        return true;
    }
    if (value.is_number_integer()) {
        out = value.get<std::int64_t>();
        return true;
    }
    if (value.is_number_float()) {
        double d = value.get<double>();
        if (std::isfinite(d) && std::floor(d) == d &&
            d >= -9.2e18 && d <= 9.2e18) {
            out = static_cast<std::int64_t>(d);
            return true;
        }
    }
    return false;
}

} // anonymous namespace

mcpack_core::Result<ItemDefinition> ItemDefinition::parse(
    const ResourceIdentifier& id,
    const std::string& source_path,
    const nlohmann::json& legacy) {

    if (!legacy.is_object()) {
        return mcpack_core::Err<ItemDefinition>(
            mcpack_core::AssetError::malformed(source_path, "expected a JSON object"));
    }

    ItemDefinition def;
    def.m_id = id;
    def.m_source_path = source_path;
    def.m_base = legacy;
    def.m_base.erase("overrides");

    auto overrides = legacy.find("overrides");
    if (overrides == legacy.end()) {
        return mcpack_core::Ok(std::move(def));
    }
    if (!overrides->is_array()) {
        return mcpack_core::Err<ItemDefinition>(
            mcpack_core::AssetError::malformed(source_path, "overrides is not an array"));
    }

    std::map<std::int64_t, std::size_t> seen;

    for (std::size_t i = 0; i < overrides->size(); ++i) {
        const auto& entry = (*overrides)[i];
        const std::string where = def.location(i);

        if (!entry.is_object()) {
            return mcpack_core::Err<ItemDefinition>(
                mcpack_core::AssetError::malformed(where, "override is not an object"));
        }

        auto predicate = entry.find("predicate");
        const bool simple = predicate != entry.end() && predicate->is_object() &&
                            predicate->size() == 1 && predicate->contains(k_cmd_key);
        if (!simple) {
            def.m_compound.push_back(CompoundOverride{i, entry});
            continue;
        }

        PredicateOverride ov;
        ov.index = i;
        if (!read_integer((*predicate)[k_cmd_key], ov.value)) {
            return mcpack_core::Err<ItemDefinition>(
                mcpack_core::AssetError::malformed(where, "custom_model_data is not an integer"));
        }

        auto model = entry.find("model");
        if (model == entry.end() || !model->is_string()) {
            return mcpack_core::Err<ItemDefinition>(
                mcpack_core::AssetError::malformed(where, "override has no model"));
        }
        auto model_id = ResourceIdentifier::parse(model->get<std::string>());
        if (!model_id) {
            return mcpack_core::Err<ItemDefinition>(
                mcpack_core::AssetError::malformed(where,
                    "invalid model identifier '" + model->get<std::string>() + "'"));
        }
        ov.model = std::move(*model_id);

        auto [it, inserted] = seen.emplace(ov.value, i);
        if (!inserted) {
            return mcpack_core::Err<ItemDefinition>(
                mcpack_core::ConflictError::ambiguous_predicate(
                    std::to_string(ov.value), def.location(it->second), where));
        }

        def.m_overrides.push_back(std::move(ov));
    }

    return mcpack_core::Ok(std::move(def));
}

ResourceIdentifier ItemDefinition::item_id() const {
    constexpr std::string_view prefix = "item/";
    std::string path = m_id.path;
    if (path.rfind(prefix, 0) == 0) {
        path.erase(0, prefix.size());
    }
    return ResourceIdentifier{m_id.ns, path};
}

ResourceIdentifier ItemDefinition::variant_id(std::int64_t value) const {
    return m_id.with_suffix("_" + std::to_string(value));
}

std::string ItemDefinition::location(std::size_t index) const {
    return m_source_path + "#overrides[" + std::to_string(index) + "]";
}

ItemDefinition ItemDefinition::without(const std::vector<std::size_t>& indices) const {
    auto dropped = [&](std::size_t index) {
        return std::find(indices.begin(), indices.end(), index) != indices.end();
    };

    ItemDefinition copy = *this;
    copy.m_overrides.erase(
        std::remove_if(copy.m_overrides.begin(), copy.m_overrides.end(),
            [&](const PredicateOverride& ov) { return dropped(ov.index); }),
        copy.m_overrides.end());
    copy.m_compound.erase(
        std::remove_if(copy.m_compound.begin(), copy.m_compound.end(),
            [&](const CompoundOverride& ov) { return dropped(ov.index); }),
        copy.m_compound.end());
    return copy;
}

nlohmann::json ItemDefinition::to_legacy_json() const {
    // Merge both lists back into source order
    std::map<std::size_t, nlohmann::json> ordered;
    for (const auto& ov : m_overrides) {
        ordered.emplace(ov.index, nlohmann::json{
            {"predicate", {{k_cmd_key, ov.value}}},
            {"model", ov.model.to_string()},
        });
    }
    for (const auto& ov : m_compound) {
        ordered.emplace(ov.index, ov.entry);
    }

    nlohmann::json out = m_base;
    auto list = nlohmann::json::array();
    for (auto& [index, entry] : ordered) {
        list.push_back(std::move(entry));
    }
    if (!list.empty()) {
        out["overrides"] = std::move(list);
    }
    return out;
}

// =============================================================================
// Preparation
// =============================================================================

mcpack_core::Result<std::optional<ItemDefinition>> prepare_item_definition(
    const ClassifiedAsset& asset,
    const ReferenceResolver& resolver,
    ConversionReport& report) {

    auto logger = mcpack_core::convert_logger();

    auto parsed = ItemDefinition::parse(asset.key.id, asset.path, asset.json);
    if (!parsed) {
        if (!parsed.error().is<mcpack_core::AssetError>()) {
            return mcpack_core::Err<std::optional<ItemDefinition>>(parsed.error());
        }
        logger->warn("{}", parsed.error().message());
        report.add_issue(asset.path, parsed.error().message());
        return mcpack_core::Ok(std::optional<ItemDefinition>{});
    }

    std::vector<std::size_t> dangling;
    auto drop = [&](std::size_t index, const std::string& message) {
        logger->warn("Skipping override: {}", message);
        report.add_issue(asset.path, message);
        ++report.overrides_dropped;
        dangling.push_back(index);
    };

    for (const auto& ov : parsed->overrides()) {
        auto resolved = resolver.resolve(ov.model, AssetKind::Model, parsed->location(ov.index));
        if (!resolved) {
            drop(ov.index, resolved.error().message());
        }
    }

    // Compound overrides are written back verbatim, so their model must resolve too
    for (const auto& ov : parsed->compound_overrides()) {
        auto model = ov.entry.find("model");
        if (model == ov.entry.end() || !model->is_string()) {
            continue;
        }
        auto resolved = resolver.resolve(model->get<std::string>(), AssetKind::Model,
            parsed->location(ov.index));
        if (!resolved) {
            drop(ov.index, resolved.error().message());
        }
    }

    if (dangling.empty()) {
        return mcpack_core::Ok(std::optional<ItemDefinition>{std::move(*parsed)});
    }
    return mcpack_core::Ok(std::optional<ItemDefinition>{parsed->without(dangling)});
}

} // namespace mcpack_convert
