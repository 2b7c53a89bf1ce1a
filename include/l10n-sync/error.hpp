/// @file error.hpp
/// @brief Error types for the l10n-sync library.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace l10n_sync {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    canonicalization_error,  ///< UIDA key input outside the canonical value subset.
    malformed_payload,       ///< A delta payload or filter could not be decoded.
    integrity_error,         ///< A chunk or object hash did not match.
    session_expired,         ///< The session TTL has passed.
    session_not_found,       ///< No session with the given id.
    invalid_session_state,   ///< Operation not allowed in the session's state.
    concurrent_commit,       ///< Optimistic commit check kept failing.
    config_error,            ///< Invalid configuration value.
    transport_error,         ///< The peer could not be reached or replied badly.
    storage_error,           ///< A persistent store could not be read or written.
    resource_busy,           ///< A named lock is held by another owner.
    object_not_found,        ///< No content object with the requested Cid.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::canonicalization_error: return "canonicalization_error";
        case ErrorKind::malformed_payload:      return "malformed_payload";
        case ErrorKind::integrity_error:        return "integrity_error";
        case ErrorKind::session_expired:        return "session_expired";
        case ErrorKind::session_not_found:      return "session_not_found";
        case ErrorKind::invalid_session_state:  return "invalid_session_state";
        case ErrorKind::concurrent_commit:      return "concurrent_commit";
        case ErrorKind::config_error:           return "config_error";
        case ErrorKind::transport_error:        return "transport_error";
        case ErrorKind::storage_error:          return "storage_error";
        case ErrorKind::resource_busy:          return "resource_busy";
        case ErrorKind::object_not_found:       return "object_not_found";
    }
    return "unknown";
}

/// Where an error happened, so a transfer can be resumed.
struct ErrorContext {
    std::string session_id;                  ///< Empty when not session-scoped.
    std::string cid;                         ///< Textual CID, empty when not object-scoped.
    std::optional<std::size_t> chunk_index;  ///< Set for chunk-level failures.

    auto operator==(const ErrorContext&) const -> bool = default;
};

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;        ///< The category of this error.
    std::string message;   ///< A human-readable description.
    ErrorContext context;  ///< Session/object/chunk the error refers to.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg, ErrorContext ctx = {})
        : kind{k}, message{std::move(msg)}, context{std::move(ctx)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception carrying an Error. Thrown only for conditions the caller
/// cannot treat as an ordinary result (merge conflicts are never thrown).
class SyncError : public std::runtime_error {
public:
    explicit SyncError(Error err)
        : std::runtime_error{err.message}, error_{std::move(err)} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }
    auto context() const noexcept -> const ErrorContext& { return error_.context; }

private:
    Error error_;
};

/// UIDA input rejected before hashing.
class CanonicalizationError : public SyncError {
public:
    explicit CanonicalizationError(std::string msg)
        : SyncError{Error{ErrorKind::canonicalization_error, std::move(msg)}} {}
};

/// A delta payload is corrupt or truncated. The whole payload is rejected.
class MalformedPayloadError : public SyncError {
public:
    explicit MalformedPayloadError(std::string msg, ErrorContext ctx = {})
        : SyncError{Error{ErrorKind::malformed_payload, std::move(msg), std::move(ctx)}} {}
};

/// A chunk or reassembled object failed hash verification.
class IntegrityError : public SyncError {
public:
    explicit IntegrityError(std::string msg, ErrorContext ctx = {})
        : SyncError{Error{ErrorKind::integrity_error, std::move(msg), std::move(ctx)}} {}
};

/// The session is past its TTL; the client must handshake again.
class SessionExpiredError : public SyncError {
public:
    explicit SessionExpiredError(std::string session_id)
        : SyncError{Error{ErrorKind::session_expired,
                          "session " + session_id + " has expired",
                          ErrorContext{.session_id = session_id}}} {}
};

class SessionNotFoundError : public SyncError {
public:
    explicit SessionNotFoundError(std::string session_id)
        : SyncError{Error{ErrorKind::session_not_found,
                          "unknown session " + session_id,
                          ErrorContext{.session_id = session_id}}} {}
};

class InvalidSessionStateError : public SyncError {
public:
    InvalidSessionStateError(std::string session_id, std::string msg)
        : SyncError{Error{ErrorKind::invalid_session_state, std::move(msg),
                          ErrorContext{.session_id = std::move(session_id)}}} {}
};

/// The optimistic base check failed more times than the retry budget allows.
class ConcurrentCommitError : public SyncError {
public:
    ConcurrentCommitError(std::string session_id, std::string msg)
        : SyncError{Error{ErrorKind::concurrent_commit, std::move(msg),
                          ErrorContext{.session_id = std::move(session_id)}}} {}
};

class ConfigError : public SyncError {
public:
    explicit ConfigError(std::string msg)
        : SyncError{Error{ErrorKind::config_error, std::move(msg)}} {}
};

class TransportError : public SyncError {
public:
    explicit TransportError(std::string msg, ErrorContext ctx = {})
        : SyncError{Error{ErrorKind::transport_error, std::move(msg), std::move(ctx)}} {}
};

class StorageError : public SyncError {
public:
    explicit StorageError(std::string msg)
        : SyncError{Error{ErrorKind::storage_error, std::move(msg)}} {}
};

class ResourceBusyError : public SyncError {
public:
    ResourceBusyError(std::string name, std::string holder)
        : SyncError{Error{ErrorKind::resource_busy,
                          "lock " + name + " is held by " + holder}} {}
};

class ObjectNotFoundError : public SyncError {
public:
    explicit ObjectNotFoundError(std::string msg, ErrorContext ctx = {})
        : SyncError{Error{ErrorKind::object_not_found, std::move(msg), std::move(ctx)}} {}
};

}  // namespace l10n_sync
