/// @file config.cpp
/// @brief Converter configuration implementation

#include <mcpack/convert/config.hpp>
#include <mcpack/convert/report.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace mcpack_convert {

// =============================================================================
// DispatchEncoding
// =============================================================================

const char* dispatch_encoding_name(DispatchEncoding encoding) {
    switch (encoding) {
        case DispatchEncoding::Predicate: return "predicate";
        case DispatchEncoding::Select: return "select";
        case DispatchEncoding::RangeDispatch: return "range_dispatch";
        default: return "unknown";
    }
}

std::optional<DispatchEncoding> parse_dispatch_encoding(std::string_view name) {
    if (name == "predicate") return DispatchEncoding::Predicate;
    if (name == "select") return DispatchEncoding::Select;
    if (name == "range_dispatch" || name == "range-dispatch") return DispatchEncoding::RangeDispatch;
    return std::nullopt;
}

const char* dispatch_encoding_min_version(DispatchEncoding encoding) {
    switch (encoding) {
        case DispatchEncoding::Predicate: return "1.14";
        case DispatchEncoding::Select: return "1.21.4";
        case DispatchEncoding::RangeDispatch: return "1.21.4";
        default: return "unknown";
    }
}

// =============================================================================
// JSON Parsing Helpers
// =============================================================================

namespace {

mcpack_core::Error type_error(const std::string& key, const char* expected) {
    return mcpack_core::Error(mcpack_core::ErrorCode::ParseError,
        "Config key '" + key + "' must be " + expected);
}

} // anonymous namespace

// =============================================================================
// ConverterConfig
// =============================================================================

ProgressSink& ConverterConfig::progress_sink() const {
    return progress ? *progress : NullProgressSink::instance();
}

bool ConverterConfig::is_ignored_name(const std::string& name) const {
    if (skip_hidden_files && !name.empty() && name.front() == '.') {
        return true;
    }
    return std::find(ignored_directories.begin(), ignored_directories.end(), name)
        != ignored_directories.end();
}

mcpack_core::Result<void> ConverterConfig::validate() const {
    if (compression_level < 0 || compression_level > 9) {
        return mcpack_core::Err(mcpack_core::Error(mcpack_core::ErrorCode::InvalidArgument,
            "compression_level must be between 0 and 9, got " + std::to_string(compression_level)));
    }
    if (json_indent < -1 || json_indent > 8) {
        return mcpack_core::Err(mcpack_core::Error(mcpack_core::ErrorCode::InvalidArgument,
            "json_indent must be between -1 and 8, got " + std::to_string(json_indent)));
    }
    return mcpack_core::Ok();
}

mcpack_core::Result<ConverterConfig> ConverterConfig::load_json(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return mcpack_core::Err<ConverterConfig>(
            mcpack_core::Error(mcpack_core::ErrorCode::NotFound,
                "Config file not found: " + path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return mcpack_core::Err<ConverterConfig>(
            mcpack_core::Error(mcpack_core::ErrorCode::IOError,
                "Failed to open config file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json_string(buffer.str(), path);
}

mcpack_core::Result<ConverterConfig> ConverterConfig::from_json_string(
    const std::string& json_str,
    const std::filesystem::path& source_path) {

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return mcpack_core::Err<ConverterConfig>(
            mcpack_core::Error(mcpack_core::ErrorCode::ParseError,
                "JSON parse error in " + source_path.string() + ": " + e.what()));
    }

    if (!j.is_object()) {
        return mcpack_core::Err<ConverterConfig>(
            mcpack_core::Error(mcpack_core::ErrorCode::ParseError,
                "Config root must be an object"));
    }

    ConverterConfig config;

    if (j.contains("encoding")) {
        if (!j["encoding"].is_string()) {
            return mcpack_core::Err<ConverterConfig>(type_error("encoding", "a string"));
        }
        auto name = j["encoding"].get<std::string>();
        auto encoding = parse_dispatch_encoding(name);
        if (!encoding) {
            return mcpack_core::Err<ConverterConfig>(
                mcpack_core::Error(mcpack_core::ErrorCode::ParseError,
                    "Unknown encoding '" + name + "'"));
        }
        config.encoding = *encoding;
    }

    if (j.contains("emit_variant_item_models")) {
        if (!j["emit_variant_item_models"].is_boolean()) {
            return mcpack_core::Err<ConverterConfig>(type_error("emit_variant_item_models", "a boolean"));
        }
        config.emit_variant_item_models = j["emit_variant_item_models"].get<bool>();
    }

    if (j.contains("allow_vanilla_references")) {
        if (!j["allow_vanilla_references"].is_boolean()) {
            return mcpack_core::Err<ConverterConfig>(type_error("allow_vanilla_references", "a boolean"));
        }
        config.allow_vanilla_references = j["allow_vanilla_references"].get<bool>();
    }

    if (j.contains("skip_hidden_files")) {
        if (!j["skip_hidden_files"].is_boolean()) {
            return mcpack_core::Err<ConverterConfig>(type_error("skip_hidden_files", "a boolean"));
        }
        config.skip_hidden_files = j["skip_hidden_files"].get<bool>();
    }

    if (j.contains("ignored_directories")) {
        const auto& dirs = j["ignored_directories"];
        if (!dirs.is_array()) {
            return mcpack_core::Err<ConverterConfig>(type_error("ignored_directories", "an array of strings"));
        }
        config.ignored_directories.clear();
        for (const auto& dir : dirs) {
            if (!dir.is_string()) {
                return mcpack_core::Err<ConverterConfig>(type_error("ignored_directories", "an array of strings"));
            }
            config.ignored_directories.push_back(dir.get<std::string>());
        }
    }

    if (j.contains("json_indent")) {
        if (!j["json_indent"].is_number_integer()) {
            return mcpack_core::Err<ConverterConfig>(type_error("json_indent", "an integer"));
        }
        config.json_indent = j["json_indent"].get<int>();
    }

    if (j.contains("compression_level")) {
        if (!j["compression_level"].is_number_integer()) {
            return mcpack_core::Err<ConverterConfig>(type_error("compression_level", "an integer"));
        }
        config.compression_level = j["compression_level"].get<int>();
    }

    auto valid = config.validate();
    if (!valid) {
        return mcpack_core::Err<ConverterConfig>(valid.error());
    }

    return mcpack_core::Ok(std::move(config));
}

// =============================================================================
// Command Line
// =============================================================================

mcpack_core::Result<std::map<std::string, std::string>> parse_command_line(
    const std::vector<std::string>& args,
    const std::set<std::string>& flags) {

    using Options = std::map<std::string, std::string>;
    Options out;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (arg == "-h") {
            out["help"] = "true";
            continue;
        }
        if (arg.rfind("--", 0) != 0 || arg.size() == 2) {
            return mcpack_core::Err<Options>(mcpack_core::Error(mcpack_core::ErrorCode::InvalidArgument,
                "Unexpected argument: " + arg));
        }

        std::string key_value = arg.substr(2);
        auto eq_pos = key_value.find('=');

        if (eq_pos != std::string::npos) {
            out[key_value.substr(0, eq_pos)] = key_value.substr(eq_pos + 1);
        } else if (flags.count(key_value) > 0) {
            out[key_value] = "true";
        } else if (i + 1 < args.size() && args[i + 1].rfind("-", 0) != 0) {
            out[key_value] = args[++i];
        } else {
            out[key_value] = "true";
        }
    }
    return mcpack_core::Ok(std::move(out));
}

} // namespace mcpack_convert
