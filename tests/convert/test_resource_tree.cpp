// mcpack_convert ResourceTree tests

#include <catch2/catch_test_macros.hpp>
#include <mcpack/convert/config.hpp>
#include <mcpack/convert/report.hpp>
#include <mcpack/convert/resource_tree.hpp>

#include "test_support.hpp"

using namespace mcpack_convert;
using mcpack_test::TempDir;

TEST_CASE("check_relative_path", "[convert][tree]") {
    SECTION("accepts ordinary relative paths") {
        REQUIRE(check_relative_path("assets/minecraft/models/item/stick.json"));
        REQUIRE(check_relative_path("pack.mcmeta"));
        REQUIRE(check_relative_path("a/..b/c"));
    }

    SECTION("rejects traversal") {
        auto result = check_relative_path("assets/../../evil.txt");
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == mcpack_core::ErrorCode::PermissionDenied);
        REQUIRE(result.error().as<mcpack_core::PathSecurityError>()->kind ==
                mcpack_core::PathSecurityError::Kind::ParentTraversal);
        REQUIRE_FALSE(check_relative_path(".."));
        REQUIRE_FALSE(check_relative_path("a\\..\\b"));
    }

    SECTION("rejects absolute and drive-qualified paths") {
        REQUIRE_FALSE(check_relative_path("/etc/passwd"));
        REQUIRE_FALSE(check_relative_path("\\windows\\system32"));
        REQUIRE_FALSE(check_relative_path("C:\\pack\\a.json"));
        REQUIRE_FALSE(check_relative_path("c:a.json"));
        REQUIRE_FALSE(check_relative_path(""));
    }
}

TEST_CASE("ResourceTree entries", "[convert][tree]") {
    ResourceTree tree;

    SECTION("put and find") {
        REQUIRE(tree.put("b.txt", "2"));
        REQUIRE(tree.put("a.txt", "1"));
        REQUIRE(tree.size() == 2);
        REQUIRE(*tree.find("a.txt") == "1");
        REQUIRE(tree.find("c.txt") == nullptr);
        REQUIRE(tree.paths() == std::vector<std::string>{"a.txt", "b.txt"});
    }

    SECTION("put rejects unsafe paths") {
        REQUIRE_FALSE(tree.put("../a.txt", "x"));
        REQUIRE(tree.empty());
    }

    SECTION("json round trip uses sorted keys and a trailing newline") {
        nlohmann::json value = {{"zeta", 1}, {"alpha", {{"b", 2}, {"a", 1}}}};
        REQUIRE(tree.put_json("x.json", value, 2));
        const std::string& bytes = *tree.find("x.json");
        REQUIRE(bytes.back() == '\n');
        REQUIRE(bytes.find("alpha") < bytes.find("zeta"));

        auto parsed = tree.read_json("x.json");
        REQUIRE(parsed);
        REQUIRE(*parsed == value);
    }

    SECTION("read_json of a missing or malformed entry") {
        REQUIRE(tree.read_json("missing.json").error().code() == mcpack_core::ErrorCode::NotFound);
        REQUIRE(tree.put("bad.json", "{ not json"));
        REQUIRE(tree.read_json("bad.json").error().code() == mcpack_core::ErrorCode::ParseError);
    }

    SECTION("comments are tolerated when parsing") {
        auto parsed = parse_json("{ // note\n \"a\": 1 }", "c.json");
        REQUIRE(parsed);
        REQUIRE((*parsed)["a"] == 1);
    }
}

TEST_CASE("ResourceTree disk I/O", "[convert][tree]") {
    TempDir dir;
    ConverterConfig config;

    mcpack_test::write_file(dir / "pack/assets/minecraft/models/item/stick.json", "{}");
    mcpack_test::write_file(dir / "pack/pack.mcmeta", "{}");
    mcpack_test::write_file(dir / "pack/.git/HEAD", "ref: refs/heads/main");
    mcpack_test::write_file(dir / "pack/.DS_Store", "junk");
    mcpack_test::write_file(dir / "pack/assets/.hidden/x.json", "{}");

    SECTION("load skips version control and hidden files") {
        auto tree = ResourceTree::load(dir / "pack", config);
        REQUIRE(tree);
        REQUIRE(tree->paths() == std::vector<std::string>{
            "assets/minecraft/models/item/stick.json",
            "pack.mcmeta",
        });
    }

    SECTION("hidden files are kept when configured") {
        config.skip_hidden_files = false;
        auto tree = ResourceTree::load(dir / "pack", config);
        REQUIRE(tree);
        REQUIRE(tree->contains(".DS_Store"));
        REQUIRE_FALSE(tree->contains(".git/HEAD"));
    }

    SECTION("load of a missing directory") {
        auto tree = ResourceTree::load(dir / "nope", config);
        REQUIRE(tree.error().code() == mcpack_core::ErrorCode::NotFound);
    }

    SECTION("write then load gives the same tree") {
        auto tree = ResourceTree::load(dir / "pack", config);
        REQUIRE(tree);
        REQUIRE(tree->write_to(dir / "copy", config));

        auto copy = ResourceTree::load(dir / "copy", config);
        REQUIRE(copy);
        REQUIRE(*copy == *tree);
    }

    SECTION("sync removes stale files and empty directories") {
        auto previous = ResourceTree::load(dir / "pack", config);
        REQUIRE(previous);

        ResourceTree next = *previous;
        REQUIRE(next.put("assets/minecraft/items/stick.json",
                         *next.find("assets/minecraft/models/item/stick.json")));
        REQUIRE(next.remove("assets/minecraft/models/item/stick.json"));

        auto deleted = next.sync_to(dir / "pack", *previous, config);
        REQUIRE(deleted);
        REQUIRE(*deleted == 1);
        REQUIRE(std::filesystem::exists(dir / "pack/assets/minecraft/items/stick.json"));
        REQUIRE_FALSE(std::filesystem::exists(dir / "pack/assets/minecraft/models"));
        REQUIRE(std::filesystem::exists(dir / "pack/pack.mcmeta"));
    }
}

TEST_CASE("ResourceTree progress and cancellation", "[convert][tree][progress]") {
    TempDir dir;
    for (int i = 0; i < 5; ++i) {
        mcpack_test::write_file(dir / ("pack/file_" + std::to_string(i) + ".txt"), "x");
    }

    mcpack_test::RecordingSink sink;
    ConverterConfig config;
    config.progress = &sink;

    SECTION("completed count increases monotonically") {
        auto tree = ResourceTree::load(dir / "pack", config);
        REQUIRE(tree);
        REQUIRE_FALSE(sink.messages.empty());
        REQUIRE(sink.reports.back() == std::make_pair(std::size_t{5}, std::size_t{5}));
        for (std::size_t i = 1; i < sink.reports.size(); ++i) {
            REQUIRE(sink.reports[i].first >= sink.reports[i - 1].first);
        }
    }

    SECTION("cancelled load stops with Cancelled") {
        CancellationToken token;
        token.cancel();
        config.cancellation = &token;

        auto tree = ResourceTree::load(dir / "pack", config);
        REQUIRE(tree.is_err());
        REQUIRE(tree.error().code() == mcpack_core::ErrorCode::Cancelled);
    }
}
