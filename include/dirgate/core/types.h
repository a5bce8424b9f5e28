// DIRGATE - Core Types
// Copyright (c) 2024 DIRGATE Developers
// MIT License
//
// Value types shared by the guards, the search engine, the store and
// the gateway.

#ifndef DIRGATE_CORE_TYPES_H
#define DIRGATE_CORE_TYPES_H

#include "dirgate/util/time.h"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace dirgate {

// ============================================================================
// Operations and Error Kinds
// ============================================================================

/// Gateway operations subject to rate limiting
enum class OperationKind {
    List,
    Search,
    Upload,
    Download,
    Copy,
    Move
};

/// Lowercase name ("list", "search", ...)
const char* OperationKindToString(OperationKind kind);

/// Failure taxonomy reported at the gateway boundary
enum class ErrorKind {
    None,
    InvalidInput,   // Reason is returned to the caller verbatim
    NotFound,
    AccessDenied,   // Outside the root or an OS permission failure
    RateLimited,
    Internal        // Detail is logged; caller sees a generic message
};

const char* ErrorKindToString(ErrorKind kind);

// ============================================================================
// File Entry
// ============================================================================

/// One directory entry as reported to clients. Directories have size 0.
struct FileEntry {
    std::string name;
    std::string absolutePath;
    uint64_t sizeBytes{0};
    util::SystemTimePoint lastModified;
    bool isDirectory{false};
};

// ============================================================================
// Operation Result
// ============================================================================

/**
 * Outcome of a gateway operation. No exception crosses the gateway; every
 * failure is folded into an ErrorKind plus a caller-safe message.
 */
template<typename T>
class OperationResult {
public:
    static OperationResult Ok(T value) {
        OperationResult result;
        result.value_.emplace(std::move(value));
        return result;
    }

    static OperationResult Fail(ErrorKind kind, std::string message) {
        OperationResult result;
        result.error_ = kind == ErrorKind::None ? ErrorKind::Internal : kind;
        result.message_ = std::move(message);
        return result;
    }

    bool IsOk() const { return error_ == ErrorKind::None; }
    explicit operator bool() const { return IsOk(); }

    /// @throws std::logic_error on a failed result
    const T& Value() const {
        if (!value_) {
            throw std::logic_error(std::string("OperationResult::Value on failure: ") + message_);
        }
        return *value_;
    }

    ErrorKind Error() const { return error_; }
    const std::string& Message() const { return message_; }

private:
    OperationResult() = default;

    std::optional<T> value_;
    ErrorKind error_{ErrorKind::None};
    std::string message_;
};

} // namespace dirgate

#endif // DIRGATE_CORE_TYPES_H
