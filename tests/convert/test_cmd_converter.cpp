// mcpack_convert CustomModelDataConverter tests

#include <catch2/catch_test_macros.hpp>
#include <mcpack/convert/cmd_converter.hpp>
#include <mcpack/convert/config.hpp>
#include <mcpack/convert/report.hpp>
#include <mcpack/convert/resolver.hpp>

#include "test_support.hpp"

using namespace mcpack_convert;

namespace {

const std::string k_stick_model = "assets/minecraft/models/item/stick.json";
const std::string k_stick_item = "assets/minecraft/items/stick.json";

} // anonymous namespace

TEST_CASE("CMD conversion to range_dispatch", "[convert][cmd]") {
    ConverterConfig config;
    config.encoding = DispatchEncoding::RangeDispatch;
    CustomModelDataConverter converter(config);

    auto input = mcpack_test::stick_tree();
    ConversionReport report;
    auto output = converter.convert(input, report);
    REQUIRE(output);

    SECTION("descriptor dispatches on thresholds with the old model as fallback") {
        auto descriptor = output->read_json(k_stick_item);
        REQUIRE(descriptor);
        REQUIRE(*descriptor == nlohmann::json::parse(R"({
            "model": {
                "type": "minecraft:range_dispatch",
                "property": "minecraft:custom_model_data",
                "index": 0,
                "entries": [
                    {"threshold": 1001, "model": {"type": "minecraft:model", "model": "minecraft:item/stick_blue"}},
                    {"threshold": 1002, "model": {"type": "minecraft:model", "model": "minecraft:item/stick_red"}}
                ],
                "fallback": {"type": "minecraft:model", "model": "minecraft:item/stick"}
            }
        })"));
    }

    SECTION("legacy model keeps everything but its overrides") {
        auto model = output->read_json(k_stick_model);
        REQUIRE(model);
        REQUIRE_FALSE(model->contains("overrides"));
        REQUIRE((*model)["parent"] == "item/handheld");
        REQUIRE((*model)["textures"]["layer0"] == "item/stick");
    }

    SECTION("other files are carried over unchanged") {
        REQUIRE(*output->find("pack.mcmeta") == *input.find("pack.mcmeta"));
        REQUIRE(*output->find("assets/minecraft/textures/item/stick_blue.png") ==
                *input.find("assets/minecraft/textures/item/stick_blue.png"));
        REQUIRE(output->size() == input.size() + 1);
    }

    SECTION("report counters") {
        REQUIRE(report.files_rewritten == 2);
        REQUIRE(report.files_copied == input.size() - 1);
        REQUIRE(report.overrides_dropped == 0);
        REQUIRE_FALSE(report.has_issues());
    }

    SECTION("output references resolve") {
        ReferenceResolver resolver(*output, true);
        REQUIRE(resolver.validate_tree());
    }
}

TEST_CASE("CMD conversion to select", "[convert][cmd]") {
    ConverterConfig config;
    config.encoding = DispatchEncoding::Select;
    CustomModelDataConverter converter(config);

    ConversionReport report;
    auto output = converter.convert(mcpack_test::stick_tree(), report);
    REQUIRE(output);

    auto descriptor = output->read_json(k_stick_item);
    REQUIRE(descriptor);
    const auto& model = (*descriptor)["model"];
    REQUIRE(model["type"] == "minecraft:select");
    REQUIRE(model["cases"].size() == 2);
    REQUIRE(model["cases"][0]["when"] == nlohmann::json::array({"1001"}));
    REQUIRE(model["cases"][1]["model"]["model"] == "minecraft:item/stick_red");
    REQUIRE(model["fallback"]["model"] == "minecraft:item/stick");
}

TEST_CASE("CMD conversion to predicates", "[convert][cmd]") {
    ConverterConfig config;
    config.encoding = DispatchEncoding::Predicate;
    CustomModelDataConverter converter(config);

    auto input = mcpack_test::stick_tree();
    REQUIRE(input.put(k_stick_model, R"({
        "parent": "item/handheld",
        "overrides": [
            {"predicate": {"custom_model_data": 1001.0}, "model": "item/stick_blue"},
            {"predicate": {"custom_model_data": 1002, "pulling": 1}, "model": "item/stick_red"}
        ]
    })"));

    ConversionReport report;
    auto output = converter.convert(input, report);
    REQUIRE(output);

    REQUIRE_FALSE(output->contains(k_stick_item));
    auto model = output->read_json(k_stick_model);
    REQUIRE(model);
    REQUIRE((*model)["overrides"].size() == 2);
    REQUIRE((*model)["overrides"][0]["predicate"]["custom_model_data"] == 1001);
    REQUIRE((*model)["overrides"][0]["model"] == "minecraft:item/stick_blue");
    REQUIRE((*model)["overrides"][1]["predicate"]["pulling"] == 1);

    REQUIRE(report.files_rewritten == 1);
    REQUIRE(report.overrides_dropped == 0);
}

TEST_CASE("CMD conversion drops dangling predicate overrides", "[convert][cmd]") {
    ConverterConfig config;
    config.encoding = DispatchEncoding::Predicate;
    CustomModelDataConverter converter(config);

    auto input = mcpack_test::stick_tree();
    REQUIRE(input.put(k_stick_model, R"({
        "parent": "item/handheld",
        "overrides": [
            {"predicate": {"custom_model_data": 1}, "model": "mypack:item/missing_a"},
            {"predicate": {"custom_model_data": 2, "damage": 0.5}, "model": "mypack:item/missing_b"},
            {"predicate": {"custom_model_data": 3, "damage": 0.25}, "model": "item/stick_red"}
        ]
    })"));

    ConversionReport report;
    auto output = converter.convert(input, report);
    REQUIRE(output);
    REQUIRE(report.overrides_dropped == 2);
    REQUIRE(report.issues.size() == 2);

    auto model = output->read_json(k_stick_model);
    REQUIRE(model);
    REQUIRE((*model)["overrides"].size() == 1);
    REQUIRE((*model)["overrides"][0]["model"] == "item/stick_red");

    ReferenceResolver resolver(*output, config.allow_vanilla_references);
    REQUIRE(resolver.validate_tree());
}

TEST_CASE("CMD conversion edge cases", "[convert][cmd]") {
    ConverterConfig config;
    CustomModelDataConverter converter(config);
    auto input = mcpack_test::stick_tree();
    ConversionReport report;

    SECTION("compound predicates are dropped for descriptor encodings") {
        REQUIRE(input.put(k_stick_model, R"({
            "overrides": [
                {"predicate": {"custom_model_data": 1001}, "model": "item/stick_blue"},
                {"predicate": {"custom_model_data": 1002, "damage": 0.5}, "model": "item/stick_red"}
            ]
        })"));

        auto output = converter.convert(input, report);
        REQUIRE(output);
        auto descriptor = output->read_json(k_stick_item);
        REQUIRE(descriptor);
        REQUIRE((*descriptor)["model"]["entries"].size() == 1);
        REQUIRE(report.overrides_dropped == 1);
        REQUIRE(report.issues.size() == 1);
    }

    SECTION("dangling overrides are skipped") {
        config.allow_vanilla_references = false;
        REQUIRE(input.remove("assets/minecraft/models/item/stick_red.json"));

        auto output = converter.convert(input, report);
        REQUIRE(output);
        auto descriptor = output->read_json(k_stick_item);
        REQUIRE(descriptor);
        REQUIRE((*descriptor)["model"]["entries"].size() == 1);
        REQUIRE((*descriptor)["model"]["entries"][0]["threshold"] == 1001);
        REQUIRE(report.overrides_dropped == 1);
    }

    SECTION("existing items/ descriptor is a duplicate") {
        REQUIRE(input.put(k_stick_item, R"({"model": {"type": "minecraft:model", "model": "item/stick"}})"));

        auto output = converter.convert(input, report);
        REQUIRE(output.is_err());
        const auto* conflict = output.error().as<mcpack_core::ConflictError>();
        REQUIRE(conflict != nullptr);
        REQUIRE(conflict->kind == mcpack_core::ConflictError::Kind::DuplicateVariant);
        REQUIRE(output.error().message().find(k_stick_item) != std::string::npos);
    }

    SECTION("malformed JSON is copied through and reported") {
        REQUIRE(input.put("assets/minecraft/models/item/broken.json", "{ nope"));

        auto output = converter.convert(input, report);
        REQUIRE(output);
        REQUIRE(*output->find("assets/minecraft/models/item/broken.json") == "{ nope");
        REQUIRE(report.issues.size() == 1);
        REQUIRE(report.files_skipped >= 1);
    }

    SECTION("cancellation stops the run") {
        CancellationToken token;
        token.cancel();
        config.cancellation = &token;

        auto output = converter.convert(input, report);
        REQUIRE(output.is_err());
        REQUIRE(output.error().code() == mcpack_core::ErrorCode::Cancelled);
    }
}
