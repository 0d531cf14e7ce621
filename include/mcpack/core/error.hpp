#pragma once

/// @file error.hpp
/// @brief Error handling types for mcpack_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>

namespace mcpack_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// Coarse category of a failure, stable across error kinds
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,          // Missing input, asset or referenced model
    AlreadyExists,     // Generated identifier or target path already taken
    InvalidArgument,   // Bad option value or malformed identifier
    InvalidState,      // Operation makes no sense for the current tree
    IOError,           // Filesystem or archive failure
    ParseError,        // JSON that does not parse or has the wrong shape
    ValidationError,   // Well-formed input that contradicts itself
    PermissionDenied,  // Archive entry tries to leave the staging directory
    Cancelled,         // Caller asked the run to stop
};

/// Name of an error code as printed in error chains
[[nodiscard]] const char* error_code_name(ErrorCode code);

// =============================================================================
// Error Kinds
// =============================================================================

/// Errors tied to a single file of a resource tree
struct AssetError {
    enum class Kind : std::uint8_t {
        Malformed,  // JSON did not parse or has the wrong shape
        Io,         // Read/write/rename failed
    };

    Kind kind;
    std::string message;
    std::string path;

    [[nodiscard]] ErrorCode code() const noexcept {
        return kind == Kind::Malformed ? ErrorCode::ParseError : ErrorCode::IOError;
    }

    [[nodiscard]] const std::string& subject() const noexcept { return path; }

    [[nodiscard]] static AssetError malformed(const std::string& path, const std::string& reason) {
        return AssetError{Kind::Malformed, "Malformed asset '" + path + "': " + reason, path};
    }

    [[nodiscard]] static AssetError io(const std::string& path, const std::string& reason) {
        return AssetError{Kind::Io, "I/O failure on '" + path + "': " + reason, path};
    }
};

/// Resource identifier resolution errors
struct ReferenceError {
    enum class Kind : std::uint8_t {
        Unresolved,  // Identifier does not map to any asset
        Malformed,   // Identifier text is not a valid namespace:path
    };

    Kind kind;
    std::string message;
    std::string identifier;
    std::string referrer;  // File holding the reference, may be empty

    [[nodiscard]] ErrorCode code() const noexcept {
        return kind == Kind::Unresolved ? ErrorCode::NotFound : ErrorCode::InvalidArgument;
    }

    [[nodiscard]] const std::string& subject() const noexcept { return identifier; }

    [[nodiscard]] static ReferenceError unresolved(const std::string& id, const std::string& from = {}) {
        std::string msg = "Unresolved reference: " + id;
        if (!from.empty()) {
            msg += " (referenced from " + from + ")";
        }
        return ReferenceError{Kind::Unresolved, msg, id, from};
    }

    [[nodiscard]] static ReferenceError malformed(const std::string& id, const std::string& from = {}) {
        std::string msg = "Malformed resource identifier: '" + id + "'";
        if (!from.empty()) {
            msg += " (in " + from + ")";
        }
        return ReferenceError{Kind::Malformed, msg, id, from};
    }
};

/// Two sources claiming the same identifier or path
struct ConflictError {
    enum class Kind : std::uint8_t {
        DuplicateVariant,    // Two sources generate the same identifier
        AmbiguousPredicate,  // Same custom model data value listed twice
        PathCollision,       // Relocation target already occupied
    };

    Kind kind;
    std::string message;
    std::string identifier;
    std::string first_source;
    std::string second_source;

    /// Contradicting predicates are a validation failure, the rest are clashes
    [[nodiscard]] ErrorCode code() const noexcept {
        return kind == Kind::AmbiguousPredicate ? ErrorCode::ValidationError : ErrorCode::AlreadyExists;
    }

    [[nodiscard]] const std::string& subject() const noexcept { return identifier; }

    [[nodiscard]] static ConflictError duplicate_variant(
        const std::string& id, const std::string& first, const std::string& second) {
        return ConflictError{Kind::DuplicateVariant,
            "Duplicate variant '" + id + "' generated by " + first + " and " + second,
            id, first, second};
    }

    [[nodiscard]] static ConflictError ambiguous_predicate(
        const std::string& value, const std::string& first, const std::string& second) {
        return ConflictError{Kind::AmbiguousPredicate,
            "Ambiguous custom_model_data " + value + " in " + first + " and " + second,
            value, first, second};
    }

    [[nodiscard]] static ConflictError path_collision(
        const std::string& target, const std::string& first, const std::string& second) {
        return ConflictError{Kind::PathCollision,
            "Cannot move " + second + " to '" + target + "': occupied by " + first,
            target, first, second};
    }
};

/// Unsafe archive entry names
struct PathSecurityError {
    enum class Kind : std::uint8_t {
        ParentTraversal,  // Contains a ".." segment
        AbsolutePath,     // Rooted or drive-qualified
    };

    Kind kind;
    std::string message;
    std::string entry;

    [[nodiscard]] ErrorCode code() const noexcept { return ErrorCode::PermissionDenied; }

    [[nodiscard]] const std::string& subject() const noexcept { return entry; }

    [[nodiscard]] static PathSecurityError parent_traversal(const std::string& entry) {
        return PathSecurityError{Kind::ParentTraversal,
            "Archive entry escapes the staging directory: " + entry, entry};
    }

    [[nodiscard]] static PathSecurityError absolute_path(const std::string& entry) {
        return PathSecurityError{Kind::AbsolutePath,
            "Archive entry uses an absolute path: " + entry, entry};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        AssetError,
        ReferenceError,
        ConflictError,
        PathSecurityError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(AssetError err) : m_code(err.code()), m_error(std::move(err)) {}
    Error(ReferenceError err) : m_code(err.code()), m_error(std::move(err)) {}
    Error(ConflictError err) : m_code(err.code()), m_error(std::move(err)) {}
    Error(PathSecurityError err) : m_code(err.code()), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Asset path, identifier or archive entry the error is about; empty for plain messages
    [[nodiscard]] std::string subject() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return {};
            } else {
                return err.subject();
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries, sorted by key
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Value of a fallible operation: either T or the error that stopped it
///
/// Accessing the side that is not held is undefined; test with operator bool
/// or is_err() first.
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_state(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : m_state(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_state.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return m_state.index() == 1; }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] T& value() & { return *std::get_if<0>(&m_state); }
    [[nodiscard]] const T& value() const& { return *std::get_if<0>(&m_state); }
    [[nodiscard]] T&& value() && { return std::move(*std::get_if<0>(&m_state)); }

    [[nodiscard]] E& error() & { return *std::get_if<1>(&m_state); }
    [[nodiscard]] const E& error() const& { return *std::get_if<1>(&m_state); }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(*this).value(); }

    [[nodiscard]] T* operator->() { return std::get_if<0>(&m_state); }
    [[nodiscard]] const T* operator->() const { return std::get_if<0>(&m_state); }

private:
    std::variant<T, E> m_state;
};

/// Outcome of an operation that only reports failure
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() = default;
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return !m_error.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return m_error.has_value(); }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] E& error() & { return *m_error; }
    [[nodiscard]] const E& error() const& { return *m_error; }

private:
    std::optional<E> m_error;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with kind details and context
std::string build_error_chain(const Error& error);

} // namespace mcpack_core
