#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for mcpack_core module

#include <cstdint>

namespace mcpack_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
class Error;

template<typename T, typename E = Error>
class Result;

struct AssetError;
struct ReferenceError;
struct ConflictError;
struct PathSecurityError;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace mcpack_core
