#pragma once

/// @file log.hpp
/// @brief Logging for migration runs
///
/// All mcpack loggers write through one set of sinks: stderr and, when
/// configured, a per-run log file. Call configure_logging once at startup;
/// loggers created before that are re-pointed at the new sinks.

#include "error.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

// =============================================================================
// Logging Macros
// =============================================================================

#define MCPACK_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define MCPACK_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define MCPACK_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define MCPACK_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define MCPACK_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define MCPACK_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace mcpack_core {

// =============================================================================
// Configuration
// =============================================================================

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    bool console_enabled = true;
    bool color = true;
    /// Copy of the run's log; empty for none
    std::filesystem::path log_file;
    /// Start the file fresh instead of appending
    bool truncate_log_file = true;
};

/// Install sinks and level for every mcpack logger
///
/// Fails with IOError when the log file cannot be opened; console logging
/// is still configured in that case.
[[nodiscard]] Result<void> configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger sharing the configured sinks
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Classifier, resolver, converters and normalizer
std::shared_ptr<spdlog::logger> convert_logger();

/// Staging and archive building
std::shared_ptr<spdlog::logger> archive_logger();

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);

[[nodiscard]] spdlog::level::level_enum get_global_log_level();

/// Parse a level name ("warning" and "err" are accepted aliases)
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

[[nodiscard]] const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Phase Scope
// =============================================================================

/// Logs start and elapsed time of a phase at debug level
class LogScope {
public:
    explicit LogScope(std::string phase, std::shared_ptr<spdlog::logger> logger = convert_logger());
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

    /// Milliseconds since the scope opened
    [[nodiscard]] long long elapsed_ms() const;

private:
    std::string m_phase;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define MCPACK_LOG_SCOPE_CAT2(a, b) a##b
#define MCPACK_LOG_SCOPE_CAT(a, b) MCPACK_LOG_SCOPE_CAT2(a, b)
#define MCPACK_LOG_SCOPE(phase) ::mcpack_core::LogScope MCPACK_LOG_SCOPE_CAT(mcpack_log_scope_, __LINE__)(phase)

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Flush, drop every mcpack logger and release the sinks
void shutdown_logging();

} // namespace mcpack_core
