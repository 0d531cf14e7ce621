#pragma once

/// @file report.hpp
/// @brief Conversion counters, progress reporting and cancellation
///
/// The core calls a ProgressSink synchronously at per-file checkpoints and
/// polls a CancellationToken at the same points. Both are owned by the caller.

#include "fwd.hpp"
#include <mcpack/core/error.hpp>

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

namespace mcpack_convert {

// =============================================================================
// ConversionReport
// =============================================================================

/// A recoverable per-asset problem
struct AssetIssue {
    std::string path;
    std::string message;
};

/// Running counters for one conversion phase
struct ConversionReport {
    std::size_t files_scanned = 0;
    std::size_t files_rewritten = 0;
    std::size_t variants_generated = 0;
    std::size_t files_skipped = 0;
    std::size_t files_copied = 0;
    std::size_t overrides_dropped = 0;
    std::size_t files_relocated = 0;
    std::size_t references_rewritten = 0;
    std::vector<AssetIssue> issues;

    /// Record a recoverable problem
    void add_issue(std::string path, std::string message) {
        issues.push_back(AssetIssue{std::move(path), std::move(message)});
    }

    [[nodiscard]] bool has_issues() const noexcept { return !issues.empty(); }

    /// Add another phase's counters to this one
    void merge(const ConversionReport& other);

    /// One-line summary for logs
    [[nodiscard]] std::string summary() const;
};

// =============================================================================
// ProgressSink
// =============================================================================

/// Capability interface for incremental progress
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    /// Items processed so far out of total
    virtual void report(std::size_t completed, std::size_t total) = 0;

    /// Phase or status text
    virtual void message(const std::string& text) = 0;
};

/// Sink that discards everything
class NullProgressSink : public ProgressSink {
public:
    void report(std::size_t, std::size_t) override {}
    void message(const std::string&) override {}

    /// Shared instance used when the caller supplies none
    static NullProgressSink& instance();
};

/// Sink that forwards to the convert logger
///
/// Counts are logged at debug level, except every `step`-th item and the
/// last one which are logged at info.
class LogProgressSink : public ProgressSink {
public:
    explicit LogProgressSink(std::size_t step = 250) : m_step(step == 0 ? 1 : step) {}

    void report(std::size_t completed, std::size_t total) override;
    void message(const std::string& text) override;

private:
    std::size_t m_step;
};

// =============================================================================
// CancellationToken
// =============================================================================

/// Cooperative cancellation flag, safe to set from another thread
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept { m_cancelled.store(true, std::memory_order_relaxed); }
    void reset() noexcept { m_cancelled.store(false, std::memory_order_relaxed); }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return m_cancelled.load(std::memory_order_relaxed);
    }

private:
    std::atomic<bool> m_cancelled{false};
};

// =============================================================================
// Checkpoint
// =============================================================================

/// Per-file checkpoint: reports progress, then checks cancellation
///
/// Guarantees `completed` never decreases within one phase.
class Checkpoint {
public:
    Checkpoint(const ConverterConfig& config, std::string phase, std::size_t total);

    /// Mark one more item done; Err(Cancelled) when the run was cancelled
    [[nodiscard]] mcpack_core::Result<void> advance();

    /// Check cancellation without advancing
    [[nodiscard]] mcpack_core::Result<void> check() const;

    [[nodiscard]] std::size_t completed() const noexcept { return m_completed; }
    [[nodiscard]] std::size_t total() const noexcept { return m_total; }

private:
    ProgressSink& m_sink;
    const CancellationToken* m_cancel;
    std::string m_phase;
    std::size_t m_completed = 0;
    std::size_t m_total;
};

} // namespace mcpack_convert
