#pragma once

#include <string>
#include <string_view>

namespace atrium {

/**
 * ErrorKind - Classifies a failure so callers can decide between retrying,
 * surfacing it verbatim, or halting.
 */
enum class ErrorKind {
    TransientHarvest,  // network / remote unavailable, retried with backoff
    Protocol,          // malformed harvest payload, halts the sync source
    Validation,        // bad caller input, never retried
    NotFound,          // stale id
    Conflict,          // concurrent structural mutation, caller may retry
    Indexing,          // search backend unavailable, retried by the indexer
    NotAuthorized,
    Storage            // any other database failure
};

/**
 * ValidationRule - The specific rule a Validation error violated.
 */
enum class ValidationRule {
    None,
    NameEmpty,
    PathEmpty,
    PathTooShort,
    ControlChar,
    Whitespace,
    IllegalChar,
    ReservedLeadingChar,
    SiblingCollision,
    NotAPermutation,
    IndexOutOfRange,
    RootImmutable,
    InvalidValue
};

[[nodiscard]] constexpr std::string_view kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TransientHarvest: return "TransientHarvestError";
        case ErrorKind::Protocol: return "ProtocolError";
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Conflict: return "ConflictError";
        case ErrorKind::Indexing: return "IndexingError";
        case ErrorKind::NotAuthorized: return "NotAuthorized";
        case ErrorKind::Storage: return "StorageError";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view rule_name(ValidationRule rule) {
    switch (rule) {
        case ValidationRule::None: return "none";
        case ValidationRule::NameEmpty: return "name-must-not-be-empty";
        case ValidationRule::PathEmpty: return "path-must-not-be-empty";
        case ValidationRule::PathTooShort: return "path-too-short";
        case ValidationRule::ControlChar: return "no-control-in-path";
        case ValidationRule::Whitespace: return "no-space-in-path";
        case ValidationRule::IllegalChar: return "illegal-chars-in-path";
        case ValidationRule::ReservedLeadingChar: return "reserved-char-in-path";
        case ValidationRule::SiblingCollision: return "path-collision";
        case ValidationRule::NotAPermutation: return "not-a-permutation";
        case ValidationRule::IndexOutOfRange: return "index-out-of-range";
        case ValidationRule::RootImmutable: return "root-immutable";
        case ValidationRule::InvalidValue: return "invalid-value";
    }
    return "unknown";
}

/**
 * Error - A failure with a kind, a human readable message and an optional
 * numeric code (the SQLite result code for storage errors).
 */
struct Error {
    ErrorKind kind{ErrorKind::Storage};
    std::string message;
    int code{0};
    ValidationRule rule{ValidationRule::None};

    Error() = default;
    explicit Error(std::string msg, int c = 0)
        : message(std::move(msg)), code(c) {}
    Error(ErrorKind k, std::string msg, int c = 0)
        : kind(k), message(std::move(msg)), code(c) {}

    [[nodiscard]] static Error validation(ValidationRule rule, std::string msg) {
        Error e{ErrorKind::Validation, std::move(msg)};
        e.rule = rule;
        return e;
    }

    [[nodiscard]] static Error not_found(std::string msg) {
        return Error{ErrorKind::NotFound, std::move(msg)};
    }

    [[nodiscard]] static Error conflict(std::string msg) {
        return Error{ErrorKind::Conflict, std::move(msg)};
    }

    [[nodiscard]] static Error not_authorized(std::string msg) {
        return Error{ErrorKind::NotAuthorized, std::move(msg)};
    }

    [[nodiscard]] static Error transient(std::string msg, int http_status = 0) {
        return Error{ErrorKind::TransientHarvest, std::move(msg), http_status};
    }

    [[nodiscard]] static Error protocol(std::string msg, int http_status = 0) {
        return Error{ErrorKind::Protocol, std::move(msg), http_status};
    }

    [[nodiscard]] static Error indexing(std::string msg) {
        return Error{ErrorKind::Indexing, std::move(msg)};
    }

    /**
     * Retryable errors are handled internally with backoff and never reach
     * a Mutation API caller.
     */
    [[nodiscard]] bool is_retryable() const noexcept {
        return kind == ErrorKind::TransientHarvest || kind == ErrorKind::Indexing ||
               kind == ErrorKind::Conflict;
    }

    /** "<Kind>: <message>" */
    [[nodiscard]] std::string describe() const {
        std::string out(kind_name(kind));
        if (kind == ErrorKind::Validation && rule != ValidationRule::None) {
            out += " [";
            out += rule_name(rule);
            out += "]";
        }
        out += ": ";
        out += message;
        return out;
    }

    bool operator==(const Error& other) const {
        return kind == other.kind && message == other.message && code == other.code &&
               rule == other.rule;
    }
};

} // namespace atrium
