/// @file log.cpp
/// @brief Shared-sink logger registry for mcpack_core

#include <mcpack/core/log.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <map>
#include <mutex>
#include <vector>

namespace mcpack_core {

namespace {

constexpr const char* k_console_pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
constexpr const char* k_file_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";
constexpr const char* k_default_logger = "mcpack";

struct LoggerRegistry {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    std::vector<spdlog::sink_ptr> sinks;
    spdlog::level::level_enum level = spdlog::level::info;
    bool configured = false;
};

LoggerRegistry& registry() {
    static LoggerRegistry reg;
    return reg;
}

spdlog::sink_ptr make_console_sink(bool color) {
    spdlog::sink_ptr sink;
    if (color) {
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    }
    sink->set_pattern(k_console_pattern);
    return sink;
}

/// Default sinks before configure_logging runs (caller holds the lock)
void ensure_sinks(LoggerRegistry& reg) {
    if (!reg.configured && reg.sinks.empty()) {
        reg.sinks.push_back(make_console_sink(true));
    }
}

std::shared_ptr<spdlog::logger> create_logger(LoggerRegistry& reg, const std::string& name) {
    ensure_sinks(reg);
    auto logger = std::make_shared<spdlog::logger>(name, reg.sinks.begin(), reg.sinks.end());
    logger->set_level(reg.level);
    reg.loggers[name] = logger;
    return logger;
}

} // anonymous namespace

// =============================================================================
// Configuration
// =============================================================================

Result<void> configure_logging(const LogConfig& config) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    std::vector<spdlog::sink_ptr> sinks;
    if (config.console_enabled) {
        sinks.push_back(make_console_sink(config.color));
    }

    std::optional<Error> file_error;
    if (!config.log_file.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                config.log_file.string(), config.truncate_log_file);
            file_sink->set_pattern(k_file_pattern);
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            file_error = Error(AssetError::io(config.log_file.string(), e.what()));
        }
    }

    reg.sinks = std::move(sinks);
    reg.level = config.level;
    reg.configured = true;

    for (auto& [name, logger] : reg.loggers) {
        logger->sinks() = reg.sinks;
        logger->set_level(reg.level);
    }

    // spdlog::info and the MCPACK_LOG_* macros go through the same sinks
    auto fallback = reg.loggers.find(k_default_logger);
    auto default_logger = fallback != reg.loggers.end()
        ? fallback->second
        : create_logger(reg, k_default_logger);
    spdlog::set_default_logger(default_logger);
    spdlog::set_level(reg.level);

    if (file_error) {
        return Err(std::move(*file_error));
    }
    return Ok();
}

// =============================================================================
// Named Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        return it->second;
    }
    return create_logger(reg, name);
}

std::shared_ptr<spdlog::logger> convert_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("mcpack_convert");
    return logger;
}

std::shared_ptr<spdlog::logger> archive_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("mcpack_archive");
    return logger;
}

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.level = level;
    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(level);
    }
    spdlog::set_level(level);
}

spdlog::level::level_enum get_global_log_level() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.level;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Phase Scope
// =============================================================================

LogScope::LogScope(std::string phase, std::shared_ptr<spdlog::logger> logger)
    : m_phase(std::move(phase))
    , m_logger(std::move(logger))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->debug("{}: started", m_phase);
}

LogScope::~LogScope() {
    m_logger->debug("{}: finished in {} ms", m_phase, elapsed_ms());
}

long long LogScope::elapsed_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - m_start).count();
}

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
}

void shutdown_logging() {
    flush_all_loggers();

    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.loggers.clear();
    reg.sinks.clear();
    reg.configured = false;
    spdlog::shutdown();
}

} // namespace mcpack_core
