/// @file main.cpp
/// @brief mcpack-migrate entry point - migrates custom_model_data resource packs
///
/// Stages a pack folder or .zip, converts it in the requested mode and writes
/// converted_<timestamp>.zip into the output directory.
///
/// Exit codes: 0 success, 1 conversion failure, 2 usage error.

#include <mcpack/convert/convert.hpp>
#include <mcpack/core/log.hpp>

#include <algorithm>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int k_exit_ok = 0;
constexpr int k_exit_failure = 1;
constexpr int k_exit_usage = 2;

mcpack_convert::CancellationToken g_cancel;

void handle_interrupt(int) {
    g_cancel.cancel();
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " --mode=cmd|item-model --input=<dir|zip> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --mode <mode>           cmd (custom model data) or item-model\n"
              << "  --input <path>          Resource pack folder or .zip\n"
              << "  --output-dir <dir>      Where converted_<timestamp>.zip is written (default: .)\n"
              << "  --encoding <name>       range_dispatch (default), select or predicate\n"
              << "  --config <file.json>    Converter settings; flags override the file\n"
              << "  --log-level <level>     trace, debug, info, warn, error\n"
              << "  --log-file <file>       Also write the run's log to <file>\n"
              << "  --no-variant-items      Item-model mode: no items/<name>_<cmd>.json\n"
              << "  --keep-work-dir         Keep the staging directory\n"
              << "  -h, --help              Show this help\n";
}

} // anonymous namespace

int main(int argc, char** argv) {
    static const std::set<std::string> flags = {"help", "no-variant-items", "keep-work-dir"};
    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = mcpack_convert::parse_command_line(args, flags);
    if (!parsed) {
        std::cerr << parsed.error().message() << "\n";
        print_usage(argv[0]);
        return k_exit_usage;
    }
    auto& options = *parsed;

    if (options.count("help")) {
        print_usage(argv[0]);
        return k_exit_ok;
    }

    static const char* const known[] = {
        "mode", "input", "output-dir", "encoding", "config", "log-level", "log-file", "no-variant-items", "keep-work-dir",
    };
    for (const auto& [key, value] : options) {
        if (std::find(std::begin(known), std::end(known), key) == std::end(known)) {
            std::cerr << "Unknown option: --" << key << "\n";
            print_usage(argv[0]);
            return k_exit_usage;
        }
    }

    // Logging first so config loading is visible
    mcpack_core::LogConfig log_config;
    if (auto it = options.find("log-level"); it != options.end()) {
        auto level = mcpack_core::parse_log_level(it->second);
        if (!level) {
            std::cerr << "Invalid log level: " << it->second << "\n";
            return k_exit_usage;
        }
        log_config.level = *level;
    }
    if (auto it = options.find("log-file"); it != options.end()) {
        log_config.log_file = it->second;
    }
    if (auto logging = mcpack_core::configure_logging(log_config); !logging) {
        std::cerr << mcpack_core::build_error_chain(logging.error()) << "\n";
        return k_exit_usage;
    }

    auto mode_it = options.find("mode");
    auto input_it = options.find("input");
    if (mode_it == options.end() || input_it == options.end()) {
        std::cerr << "Error: --mode and --input are required.\n\n";
        print_usage(argv[0]);
        return k_exit_usage;
    }

    auto mode = mcpack_convert::parse_conversion_mode(mode_it->second);
    if (!mode) {
        std::cerr << "Invalid mode: " << mode_it->second << "\n";
        return k_exit_usage;
    }

    // Config file, then flags
    mcpack_convert::ConverterConfig config;
    if (auto it = options.find("config"); it != options.end()) {
        auto loaded = mcpack_convert::ConverterConfig::load_json(it->second);
        if (!loaded) {
            MCPACK_LOG_ERROR("{}", mcpack_core::build_error_chain(loaded.error()));
            return k_exit_usage;
        }
        config = std::move(*loaded);
    }

    if (auto it = options.find("encoding"); it != options.end()) {
        auto encoding = mcpack_convert::parse_dispatch_encoding(it->second);
        if (!encoding) {
            std::cerr << "Invalid encoding: " << it->second << "\n";
            return k_exit_usage;
        }
        config.encoding = *encoding;
    }
    if (auto it = options.find("no-variant-items"); it != options.end()) {
        config.emit_variant_item_models = it->second != "true";
    }

    auto valid = config.validate();
    if (!valid) {
        MCPACK_LOG_ERROR("{}", mcpack_core::build_error_chain(valid.error()));
        return k_exit_usage;
    }

    mcpack_convert::LogProgressSink progress;
    config.progress = &progress;
    config.cancellation = &g_cancel;
    std::signal(SIGINT, handle_interrupt);

    fs::path output_dir = ".";
    if (auto it = options.find("output-dir"); it != options.end()) {
        output_dir = it->second;
    }

    mcpack_convert::PipelineRequest request;
    request.mode = *mode;
    request.input = input_it->second;
    request.destination = output_dir / mcpack_convert::default_archive_name(std::time(nullptr));
    request.keep_work_dir = options.count("keep-work-dir") > 0 && options["keep-work-dir"] == "true";

    auto result = mcpack_convert::run_pipeline(request, config);
    if (!result) {
        MCPACK_LOG_ERROR("Migration failed: {}", mcpack_core::build_error_chain(result.error()));
        mcpack_core::shutdown_logging();
        return k_exit_failure;
    }

    for (const auto& issue : result->report.issues) {
        MCPACK_LOG_WARN("{}: {}", issue.path, issue.message);
    }
    MCPACK_LOG_INFO("Wrote {} ({} entries)", result->archive.destination.string(), result->archive.entries);

    mcpack_core::shutdown_logging();
    return k_exit_ok;
}
