/// @file report.cpp
/// @brief Conversion report, progress sinks and checkpoints

#include <mcpack/convert/report.hpp>
#include <mcpack/convert/config.hpp>
#include <mcpack/core/log.hpp>

#include <sstream>

namespace mcpack_convert {

// =============================================================================
// ConversionReport
// =============================================================================

void ConversionReport::merge(const ConversionReport& other) {
    files_scanned += other.files_scanned;
    files_rewritten += other.files_rewritten;
    variants_generated += other.variants_generated;
    files_skipped += other.files_skipped;
    files_copied += other.files_copied;
    overrides_dropped += other.overrides_dropped;
    files_relocated += other.files_relocated;
    references_rewritten += other.references_rewritten;
    issues.insert(issues.end(), other.issues.begin(), other.issues.end());
}

std::string ConversionReport::summary() const {
    std::ostringstream oss;
    oss << "scanned=" << files_scanned
        << " rewritten=" << files_rewritten
        << " variants=" << variants_generated
        << " copied=" << files_copied
        << " skipped=" << files_skipped;
    if (overrides_dropped > 0) {
        oss << " dropped_overrides=" << overrides_dropped;
    }
    if (files_relocated > 0) {
        oss << " relocated=" << files_relocated
            << " references_rewritten=" << references_rewritten;
    }
    if (!issues.empty()) {
        oss << " issues=" << issues.size();
    }
    return oss.str();
}

// =============================================================================
// Progress Sinks
// =============================================================================

NullProgressSink& NullProgressSink::instance() {
    static NullProgressSink sink;
    return sink;
}

void LogProgressSink::report(std::size_t completed, std::size_t total) {
    if (completed == total || completed % m_step == 0) {
        mcpack_core::convert_logger()->info("{}/{}", completed, total);
    } else {
        mcpack_core::convert_logger()->debug("{}/{}", completed, total);
    }
}

void LogProgressSink::message(const std::string& text) {
    mcpack_core::convert_logger()->info("{}", text);
}

// =============================================================================
// Checkpoint
// =============================================================================

Checkpoint::Checkpoint(const ConverterConfig& config, std::string phase, std::size_t total)
    : m_sink(config.progress_sink())
    , m_cancel(config.cancellation)
    , m_phase(std::move(phase))
    , m_total(total)
{
    m_sink.message(m_phase);
    m_sink.report(0, m_total);
}

mcpack_core::Result<void> Checkpoint::advance() {
    if (m_completed < m_total) {
        ++m_completed;
    }
    m_sink.report(m_completed, m_total);
    return check();
}

mcpack_core::Result<void> Checkpoint::check() const {
    if (m_cancel && m_cancel->is_cancelled()) {
        return mcpack_core::Err(mcpack_core::Error(mcpack_core::ErrorCode::Cancelled,
            m_phase + " cancelled after " + std::to_string(m_completed) + " of " +
            std::to_string(m_total) + " files"));
    }
    return mcpack_core::Ok();
}

} // namespace mcpack_convert
