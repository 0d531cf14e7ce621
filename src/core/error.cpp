/// @file error.cpp
/// @brief Error code names and error chain formatting for mcpack_core

#include <mcpack/core/error.hpp>
#include <sstream>

namespace mcpack_core {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

// =============================================================================
// Error Chain
// =============================================================================

namespace {

const char* kind_label(const AssetError& err) {
    return err.kind == AssetError::Kind::Malformed ? "MalformedAsset" : "AssetIOError";
}

const char* kind_label(const ReferenceError& err) {
    return err.kind == ReferenceError::Kind::Unresolved ? "ReferenceError" : "MalformedIdentifier";
}

const char* kind_label(const ConflictError& err) {
    switch (err.kind) {
        case ConflictError::Kind::DuplicateVariant: return "DuplicateVariantError";
        case ConflictError::Kind::AmbiguousPredicate: return "AmbiguousPredicateError";
        case ConflictError::Kind::PathCollision: return "PathCollisionError";
    }
    return "ConflictError";
}

const char* kind_label(const PathSecurityError&) {
    return "PathSecurityError";
}

void write_details(std::ostringstream& oss, const ReferenceError& err) {
    if (!err.referrer.empty()) {
        oss << "\n  referrer: " << err.referrer;
    }
}

void write_details(std::ostringstream& oss, const ConflictError& err) {
    if (!err.first_source.empty()) {
        oss << "\n  first: " << err.first_source;
    }
    if (!err.second_source.empty()) {
        oss << "\n  second: " << err.second_source;
    }
}

template<typename T>
void write_details(std::ostringstream&, const T&) {}

} // anonymous namespace

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;
    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else {
            oss << "[" << kind_label(err) << "] " << err.message;
            if (!err.subject().empty()) {
                oss << "\n  subject: " << err.subject();
            }
            write_details(oss, err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }
    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<std::size_t, Error>;
template class Result<std::string, Error>;

} // namespace mcpack_core
