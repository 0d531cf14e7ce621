/// @file classifier.cpp
/// @brief Asset classifier implementation

#include <mcpack/convert/classifier.hpp>
#include <mcpack/convert/resource_tree.hpp>
#include <mcpack/core/log.hpp>

#include <cctype>

namespace mcpack_convert {

namespace {

bool has_json_extension(const std::string& path) {
    constexpr std::string_view ext = ".json";
    if (path.size() < ext.size()) {
        return false;
    }
    std::string tail = path.substr(path.size() - ext.size());
    for (auto& c : tail) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return tail == ext;
}

bool is_under_item_models(const AssetKey& key) {
    return key.kind == AssetKind::Model && key.id.path.rfind("item/", 0) == 0;
}

} // anonymous namespace

const char* asset_class_name(AssetClass cls) {
    switch (cls) {
        case AssetClass::LegacyItemDefinition: return "legacy item definition";
        case AssetClass::Model: return "model";
        case AssetClass::ItemDefinition: return "item definition";
        case AssetClass::Skipped: return "skipped";
        case AssetClass::Malformed: return "malformed";
        default: return "unknown";
    }
}

// =============================================================================
// Shape Checks
// =============================================================================

bool AssetClassifier::has_custom_model_data_overrides(const nlohmann::json& j) {
    if (!j.is_object()) {
        return false;
    }
    auto it = j.find("overrides");
    if (it == j.end() || !it->is_array()) {
        return false;
    }
    for (const auto& entry : *it) {
        if (!entry.is_object()) {
            continue;
        }
        auto predicate = entry.find("predicate");
        if (predicate != entry.end() && predicate->is_object() &&
            predicate->contains("custom_model_data")) {
            return true;
        }
    }
    return false;
}

bool AssetClassifier::is_item_descriptor_shape(const nlohmann::json& j) {
    if (!j.is_object()) {
        return false;
    }
    auto it = j.find("model");
    return it != j.end() && it->is_object();
}

// =============================================================================
// Classification
// =============================================================================

AssetClass AssetClassifier::classify(
    const std::string& path,
    const std::string& bytes,
    nlohmann::json* out_json,
    std::string* out_error) const {

    if (!has_json_extension(path)) {
        return AssetClass::Skipped;
    }

    auto parsed = parse_json(bytes, path);
    if (!parsed) {
        if (out_error) {
            *out_error = parsed.error().message();
        }
        return AssetClass::Malformed;
    }

    auto key = identify_path(path);
    if (!key || !parsed->is_object()) {
        return AssetClass::Skipped;
    }

    AssetClass cls = AssetClass::Skipped;
    if (key->kind == AssetKind::Model) {
        if (is_under_item_models(*key) && has_custom_model_data_overrides(*parsed)) {
            cls = AssetClass::LegacyItemDefinition;
        } else {
            cls = AssetClass::Model;
        }
    } else if (key->kind == AssetKind::ItemDefinition && is_item_descriptor_shape(*parsed)) {
        cls = AssetClass::ItemDefinition;
    }

    if (cls != AssetClass::Skipped && out_json) {
        *out_json = std::move(*parsed);
    }
    return cls;
}

ClassifiedTree AssetClassifier::classify_tree(
    const ResourceTree& tree,
    ConversionReport& report) const {

    ClassifiedTree result;
    auto logger = mcpack_core::convert_logger();

    for (const auto& [path, bytes] : tree.entries()) {
        ++report.files_scanned;

        nlohmann::json json;
        std::string error;
        AssetClass cls = classify(path, bytes, &json, &error);
        logger->trace("{}: {}", path, asset_class_name(cls));

        switch (cls) {
            case AssetClass::LegacyItemDefinition:
                result.item_definitions.push_back(ClassifiedAsset{path, *identify_path(path), std::move(json)});
                break;
            case AssetClass::Model:
                result.models.push_back(ClassifiedAsset{path, *identify_path(path), std::move(json)});
                break;
            case AssetClass::ItemDefinition:
                result.modern_items.push_back(ClassifiedAsset{path, *identify_path(path), std::move(json)});
                break;
            case AssetClass::Malformed:
                logger->warn("Skipping malformed JSON {}", path);
                result.malformed.push_back(AssetIssue{path, error});
                report.add_issue(path, error);
                ++report.files_skipped;
                break;
            case AssetClass::Skipped:
                result.skipped.push_back(path);
                ++report.files_skipped;
                break;
        }
    }

    logger->info("Classified {} files: {} item definitions, {} models, {} item descriptors, {} skipped, {} malformed",
        report.files_scanned, result.item_definitions.size(), result.models.size(),
        result.modern_items.size(), result.skipped.size(), result.malformed.size());

    return result;
}

} // namespace mcpack_convert
