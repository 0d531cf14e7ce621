// mcpack_convert configuration, report and checkpoint tests

#include <catch2/catch_test_macros.hpp>
#include <mcpack/convert/config.hpp>
#include <mcpack/convert/report.hpp>

#include "test_support.hpp"

#include <set>

using namespace mcpack_convert;

TEST_CASE("Dispatch encoding names", "[convert][config]") {
    REQUIRE(parse_dispatch_encoding("predicate") == DispatchEncoding::Predicate);
    REQUIRE(parse_dispatch_encoding("select") == DispatchEncoding::Select);
    REQUIRE(parse_dispatch_encoding("range_dispatch") == DispatchEncoding::RangeDispatch);
    REQUIRE(parse_dispatch_encoding("range-dispatch") == DispatchEncoding::RangeDispatch);
    REQUIRE_FALSE(parse_dispatch_encoding("Select").has_value());

    REQUIRE(std::string(dispatch_encoding_name(DispatchEncoding::RangeDispatch)) == "range_dispatch");
    REQUIRE(std::string(dispatch_encoding_min_version(DispatchEncoding::Predicate)) == "1.14");
    REQUIRE(std::string(dispatch_encoding_min_version(DispatchEncoding::Select)) == "1.21.4");

    REQUIRE_FALSE(uses_item_descriptors(DispatchEncoding::Predicate));
    REQUIRE(uses_item_descriptors(DispatchEncoding::Select));
}

TEST_CASE("ConverterConfig defaults", "[convert][config]") {
    ConverterConfig config;

    REQUIRE(config.encoding == DispatchEncoding::RangeDispatch);
    REQUIRE(config.emit_variant_item_models);
    REQUIRE(config.allow_vanilla_references);
    REQUIRE(config.json_indent == 4);
    REQUIRE(config.compression_level == 9);
    REQUIRE(config.validate());

    SECTION("ignored names") {
        REQUIRE(config.is_ignored_name(".git"));
        REQUIRE(config.is_ignored_name(".DS_Store"));
        REQUIRE_FALSE(config.is_ignored_name("assets"));

        config.skip_hidden_files = false;
        REQUIRE(config.is_ignored_name(".svn"));
        REQUIRE_FALSE(config.is_ignored_name(".DS_Store"));
    }

    SECTION("null progress sink is usable") {
        config.progress_sink().message("nothing");
        config.progress_sink().report(1, 2);
        SUCCEED();
    }
}

TEST_CASE("ConverterConfig from JSON", "[convert][config]") {
    SECTION("overrides selected keys") {
        auto config = ConverterConfig::from_json_string(R"({
            "encoding": "select",
            "emit_variant_item_models": false,
            "ignored_directories": ["build"],
            "json_indent": -1,
            "compression_level": 0,
            "future_option": true
        })");
        REQUIRE(config);
        REQUIRE(config->encoding == DispatchEncoding::Select);
        REQUIRE_FALSE(config->emit_variant_item_models);
        REQUIRE(config->ignored_directories == std::vector<std::string>{"build"});
        REQUIRE(config->json_indent == -1);
        REQUIRE(config->compression_level == 0);
        REQUIRE(config->allow_vanilla_references);
    }

    SECTION("wrong types are parse errors") {
        auto config = ConverterConfig::from_json_string(R"({"compression_level": "high"})");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == mcpack_core::ErrorCode::ParseError);
        REQUIRE(config.error().message().find("compression_level") != std::string::npos);

        REQUIRE(ConverterConfig::from_json_string(R"({"ignored_directories": [1]})").error().code() ==
                mcpack_core::ErrorCode::ParseError);
        REQUIRE(ConverterConfig::from_json_string(R"({"encoding": "fancy"})").error().code() ==
                mcpack_core::ErrorCode::ParseError);
        REQUIRE(ConverterConfig::from_json_string("[]").error().code() ==
                mcpack_core::ErrorCode::ParseError);
        REQUIRE(ConverterConfig::from_json_string("{ nope").error().code() ==
                mcpack_core::ErrorCode::ParseError);
    }

    SECTION("out of range values are invalid arguments") {
        auto config = ConverterConfig::from_json_string(R"({"compression_level": 12})");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == mcpack_core::ErrorCode::InvalidArgument);
    }
}

TEST_CASE("ConverterConfig from file", "[convert][config]") {
    mcpack_test::TempDir dir;

    SECTION("missing file") {
        auto config = ConverterConfig::load_json(dir / "missing.json");
        REQUIRE(config.error().code() == mcpack_core::ErrorCode::NotFound);
    }

    SECTION("existing file") {
        mcpack_test::write_file(dir / "mcpack.json", R"({"encoding": "predicate"})");
        auto config = ConverterConfig::load_json(dir / "mcpack.json");
        REQUIRE(config);
        REQUIRE(config->encoding == DispatchEncoding::Predicate);
    }
}

TEST_CASE("ConversionReport", "[convert][report]") {
    ConversionReport first;
    first.files_scanned = 3;
    first.files_rewritten = 1;
    first.add_issue("a.json", "bad");

    ConversionReport second;
    second.files_scanned = 2;
    second.files_relocated = 1;
    second.references_rewritten = 4;

    first.merge(second);
    REQUIRE(first.files_scanned == 5);
    REQUIRE(first.files_relocated == 1);
    REQUIRE(first.has_issues());

    auto summary = first.summary();
    REQUIRE(summary.find("scanned=5") != std::string::npos);
    REQUIRE(summary.find("references_rewritten=4") != std::string::npos);
    REQUIRE(summary.find("issues=1") != std::string::npos);
}

TEST_CASE("Checkpoint", "[convert][report][progress]") {
    mcpack_test::RecordingSink sink;
    ConverterConfig config;
    config.progress = &sink;

    SECTION("reports phase and counts, never past total") {
        Checkpoint checkpoint(config, "Phase", 2);
        REQUIRE(checkpoint.advance());
        REQUIRE(checkpoint.advance());
        REQUIRE(checkpoint.advance());

        REQUIRE(sink.messages == std::vector<std::string>{"Phase"});
        REQUIRE(sink.reports.front().first == 0);
        REQUIRE(sink.reports.back().first == 2);
        REQUIRE(checkpoint.completed() == 2);
    }

    SECTION("cancellation from outside") {
        CancellationToken token;
        config.cancellation = &token;

        Checkpoint checkpoint(config, "Phase", 3);
        REQUIRE(checkpoint.advance());
        token.cancel();
        auto step = checkpoint.advance();
        REQUIRE(step.is_err());
        REQUIRE(step.error().code() == mcpack_core::ErrorCode::Cancelled);

        token.reset();
        REQUIRE(checkpoint.check());
    }
}

TEST_CASE("Command line parsing", "[convert][config][cli]") {
    const std::set<std::string> flags = {"help", "no-variant-items", "keep-work-dir"};

    SECTION("values in both spellings") {
        auto options = parse_command_line({"--mode=cmd", "--input", "pack.zip", "-h"}, flags);
        REQUIRE(options);
        REQUIRE(options->at("mode") == "cmd");
        REQUIRE(options->at("input") == "pack.zip");
        REQUIRE(options->at("help") == "true");
    }

    SECTION("flags never take the next argument") {
        auto options = parse_command_line({"--keep-work-dir", "--no-variant-items", "--input", "pack"}, flags);
        REQUIRE(options);
        REQUIRE(options->at("keep-work-dir") == "true");
        REQUIRE(options->at("no-variant-items") == "true");
        REQUIRE(options->at("input") == "pack");

        auto stray = parse_command_line({"--keep-work-dir", "pack"}, flags);
        REQUIRE(stray.is_err());
        REQUIRE(stray.error().code() == mcpack_core::ErrorCode::InvalidArgument);
        REQUIRE(stray.error().message().find("pack") != std::string::npos);
    }

    SECTION("trailing option without a value") {
        auto options = parse_command_line({"--mode"}, flags);
        REQUIRE(options);
        REQUIRE(options->at("mode") == "true");
    }
}
