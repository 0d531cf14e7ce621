// mcpack_convert ReferenceResolver tests

#include <catch2/catch_test_macros.hpp>
#include <mcpack/convert/resolver.hpp>
#include <mcpack/convert/resource_tree.hpp>

#include "test_support.hpp"

#include <algorithm>

using namespace mcpack_convert;

TEST_CASE("Reference extraction", "[convert][resolver]") {
    SECTION("model parent, textures and overrides") {
        auto model = nlohmann::json::parse(mcpack_test::legacy_stick_json());
        model["textures"]["particle"] = "#layer0";

        auto refs = extract_references(model, AssetKind::Model);
        REQUIRE(refs.size() == 4);

        REQUIRE(refs[0].kind == AssetKind::Model);
        REQUIRE(refs[0].text == "item/handheld");
        REQUIRE(refs[0].pointer == "/parent");

        REQUIRE(refs[1].kind == AssetKind::Texture);
        REQUIRE(refs[1].text == "item/stick");
        REQUIRE(refs[1].pointer == "/textures/layer0");

        REQUIRE(refs[2].pointer == "/overrides/0/model");
        REQUIRE(refs[3].text == "item/stick_red");
    }

    SECTION("nested item descriptor nodes") {
        auto descriptor = nlohmann::json::parse(R"({
            "model": {
                "type": "minecraft:range_dispatch",
                "property": "minecraft:custom_model_data",
                "entries": [
                    {"threshold": 1, "model": {"type": "minecraft:model", "model": "item/a"}},
                    {"threshold": 2, "model": {"type": "special", "base": "item/chest",
                                               "model": {"type": "minecraft:chest"}}}
                ],
                "fallback": {"type": "model", "model": "mypack:item/b"}
            }
        })");

        auto refs = extract_references(descriptor, AssetKind::ItemDefinition);
        REQUIRE(refs.size() == 3);

        std::vector<std::string> texts;
        for (const auto& ref : refs) {
            REQUIRE(ref.kind == AssetKind::Model);
            REQUIRE(descriptor.at(nlohmann::json::json_pointer(ref.pointer)) == ref.text);
            texts.push_back(ref.text);
        }
        std::sort(texts.begin(), texts.end());
        REQUIRE(texts == std::vector<std::string>{"item/a", "item/chest", "mypack:item/b"});
    }

    SECTION("non-object JSON has no references") {
        REQUIRE(extract_references(nlohmann::json::array(), AssetKind::Model).empty());
    }
}

TEST_CASE("Reference rewriting", "[convert][resolver]") {
    auto model = nlohmann::json::parse(R"({
        "parent": "mypack:custom/base",
        "textures": {"layer0": "mypack:custom/ruby", "layer/1": "mypack:custom/other"}
    })");

    auto count = rewrite_references(model, AssetKind::Model,
        [](const Reference& ref) -> std::optional<std::string> {
            if (ref.kind == AssetKind::Model && ref.text == "mypack:custom/base") {
                return std::string("mypack:item/custom/base");
            }
            if (ref.kind == AssetKind::Texture && ref.text == "mypack:custom/other") {
                return std::string("mypack:item/other");
            }
            return std::nullopt;
        });

    REQUIRE(count == 2);
    REQUIRE(model["parent"] == "mypack:item/custom/base");
    REQUIRE(model["textures"]["layer0"] == "mypack:custom/ruby");
    REQUIRE(model["textures"]["layer/1"] == "mypack:item/other");
}

TEST_CASE("Reference resolution", "[convert][resolver]") {
    auto tree = mcpack_test::stick_tree();
    REQUIRE(tree.put("assets/mypack/models/custom/gem.json", "{}"));

    SECTION("implicit and explicit namespaces resolve identically") {
        ReferenceResolver resolver(tree, false);
        auto implicit = resolver.resolve("item/stick_blue", AssetKind::Model);
        auto explicit_ref = resolver.resolve("minecraft:item/stick_blue", AssetKind::Model);
        REQUIRE(implicit);
        REQUIRE(explicit_ref);
        REQUIRE(implicit->key == explicit_ref->key);
        REQUIRE(implicit->path == "assets/minecraft/models/item/stick_blue.json");
        REQUIRE(implicit->in_tree);
    }

    SECTION("textures resolve to png files") {
        ReferenceResolver resolver(tree, false);
        auto texture = resolver.resolve("item/stick_blue", AssetKind::Texture);
        REQUIRE(texture);
        REQUIRE(texture->path == "assets/minecraft/textures/item/stick_blue.png");
    }

    SECTION("missing custom namespace asset is unresolved") {
        ReferenceResolver resolver(tree, true);
        auto missing = resolver.resolve("mypack:custom/missing", AssetKind::Model, "assets/x.json");
        REQUIRE(missing.is_err());
        REQUIRE(missing.error().code() == mcpack_core::ErrorCode::NotFound);
        REQUIRE(missing.error().message().find("assets/x.json") != std::string::npos);
    }

    SECTION("vanilla references depend on configuration") {
        ReferenceResolver lenient(tree, true);
        auto vanilla = lenient.resolve("item/diamond", AssetKind::Model);
        REQUIRE(vanilla);
        REQUIRE_FALSE(vanilla->in_tree);

        ReferenceResolver strict(tree, false);
        REQUIRE(strict.resolve("item/diamond", AssetKind::Model).is_err());
    }

    SECTION("builtin models always resolve") {
        ReferenceResolver strict(tree, false);
        auto builtin = strict.resolve("builtin/generated", AssetKind::Model);
        REQUIRE(builtin);
        REQUIRE_FALSE(builtin->in_tree);
    }

    SECTION("malformed identifier") {
        ReferenceResolver resolver(tree, true);
        auto bad = resolver.resolve("My Pack:thing", AssetKind::Model);
        REQUIRE(bad.is_err());
        REQUIRE(bad.error().code() == mcpack_core::ErrorCode::InvalidArgument);
    }

    SECTION("identify and load") {
        ReferenceResolver resolver(tree, true);
        auto key = resolver.identify("assets/mypack/models/custom/gem.json");
        REQUIRE(key.has_value());
        REQUIRE(key->id.to_string() == "mypack:custom/gem");
        REQUIRE_FALSE(resolver.identify("assets/mypack/models/custom/absent.json").has_value());

        auto ref = resolver.resolve("item/stick_red", AssetKind::Model);
        REQUIRE(ref);
        auto json = resolver.load_json(*ref);
        REQUIRE(json);
        REQUIRE((*json)["parent"] == "item/generated");
    }
}

TEST_CASE("Reference index", "[convert][resolver]") {
    auto tree = mcpack_test::stick_tree();
    REQUIRE(tree.put("assets/minecraft/models/item/stick_green.json", R"({"parent": "item/stick_blue"})"));
    REQUIRE(tree.put("assets/minecraft/models/item/broken.json", "{"));

    ReferenceResolver resolver(tree, true);
    auto index = resolver.build_index();

    AssetKey blue{AssetKind::Model, ResourceIdentifier{"minecraft", "item/stick_blue"}};
    const auto& dependents = index.dependents(blue);
    REQUIRE(dependents == std::set<std::string>{
        "assets/minecraft/models/item/stick.json",
        "assets/minecraft/models/item/stick_green.json",
    });

    AssetKey texture{AssetKind::Texture, ResourceIdentifier{"minecraft", "item/stick_blue"}};
    REQUIRE(index.is_referenced(texture));

    AssetKey unused{AssetKind::Model, ResourceIdentifier{"minecraft", "item/stick_green"}};
    REQUIRE_FALSE(index.is_referenced(unused));
    REQUIRE(index.dependents(unused).empty());
}

TEST_CASE("Tree validation", "[convert][resolver]") {
    auto tree = mcpack_test::stick_tree();

    SECTION("complete tree validates with vanilla references") {
        ReferenceResolver resolver(tree, true);
        REQUIRE(resolver.validate_tree());
    }

    SECTION("first dangling reference is reported") {
        REQUIRE(tree.put("assets/mypack/items/gem.json",
            R"({"model": {"type": "minecraft:model", "model": "mypack:item/gem"}})"));
        ReferenceResolver resolver(tree, true);

        auto result = resolver.validate_tree();
        REQUIRE(result.is_err());
        REQUIRE(result.error().is<mcpack_core::ReferenceError>());
        REQUIRE(result.error().message().find("assets/mypack/items/gem.json") != std::string::npos);
    }

    SECTION("malformed files are not inspected") {
        REQUIRE(tree.put("assets/mypack/models/item/broken.json", "{ \"parent\": \"mypack:nothing\""));
        ReferenceResolver resolver(tree, true);
        REQUIRE(resolver.validate_tree());
    }
}
