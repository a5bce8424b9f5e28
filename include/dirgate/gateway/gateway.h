// DIRGATE - File Access Gateway
// Copyright (c) 2024 DIRGATE Developers
// MIT License
//
// Entry point for every client operation. Each call is rate limited, its
// arguments are validated by the guards, and only then does it reach the
// search engine or the file store. Failures come back as OperationResult
// values; no exception leaves the gateway.

#ifndef DIRGATE_GATEWAY_GATEWAY_H
#define DIRGATE_GATEWAY_GATEWAY_H

#include "dirgate/core/types.h"
#include "dirgate/gateway/options.h"
#include "dirgate/search/tree_search.h"
#include "dirgate/security/path_guard.h"
#include "dirgate/security/rate_limiter.h"
#include "dirgate/security/term_guard.h"
#include "dirgate/security/upload_guard.h"
#include "dirgate/store/file_store.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace dirgate {
namespace gateway {

/// Message returned for Internal failures
constexpr const char* INTERNAL_ERROR_MESSAGE = "Internal server error";

/// Message returned when a caller exceeds its rate limit
constexpr const char* RATE_LIMITED_MESSAGE = "Rate limit exceeded. Please try again later.";

// ============================================================================
// Operation Payloads
// ============================================================================

struct ListPayload {
    std::string directory;
    std::vector<FileEntry> entries;
};

struct SearchParams {
    std::string path;
    std::string term;
    bool includeSubdirectories{true};
    std::optional<size_t> maxResults;   // Capped at the configured limit
};

struct SearchPayload {
    std::string directory;
    std::vector<FileEntry> entries;
    bool truncated{false};
    bool timedOut{false};
    size_t skippedDirectories{0};
    size_t vanishedDirectories{0};
    std::string message;
};

struct DownloadPayload {
    std::vector<uint8_t> data;
    std::string fileName;
    std::string contentType;
};

struct UploadParams {
    std::string directory;
    std::string fileName;
    std::string contentType;
    std::vector<uint8_t> data;
};

struct UploadPayload {
    std::string fileName;     // Sanitized name actually written
    uint64_t sizeBytes{0};
    std::string path;
};

struct TransferPayload {
    std::string destination;  // Final location of the file
};

// ============================================================================
// Gateway
// ============================================================================

class Gateway {
public:
    /**
     * @param limiter Shared across the process; must outlive the gateway
     * @throws std::invalid_argument if the options are unusable
     */
    Gateway(const GatewayOptions& options, security::RateLimiter& limiter);

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    /// List a directory; an empty path lists the root
    OperationResult<ListPayload> List(const std::string& callerId, const std::string& path);

    /// The configured root. Not rate limited.
    std::string DefaultPath() const;

    OperationResult<SearchPayload> Search(const std::string& callerId, const SearchParams& params);

    OperationResult<DownloadPayload> Download(const std::string& callerId, const std::string& path);

    OperationResult<UploadPayload> Upload(const std::string& callerId, const UploadParams& params);

    OperationResult<TransferPayload> Copy(const std::string& callerId,
                                          const std::string& sourcePath,
                                          const std::string& destinationPath);

    OperationResult<TransferPayload> Move(const std::string& callerId,
                                          const std::string& sourcePath,
                                          const std::string& destinationPath);

    const GatewayOptions& Options() const { return options_; }

private:
    template<typename T>
    OperationResult<T> Guarded(const std::string& callerId, OperationKind operation,
                               const std::function<OperationResult<T>()>& body);

    OperationResult<TransferPayload> Transfer(const std::string& callerId,
                                              OperationKind operation,
                                              const std::string& sourcePath,
                                              const std::string& destinationPath);

    /// Map a PathGuard rejection to InvalidInput or AccessDenied and log it
    template<typename T>
    OperationResult<T> RejectPath(const std::string& callerId, OperationKind operation,
                                  const std::string& input, const std::string& reason,
                                  const std::string& prefix = "");

    GatewayOptions options_;
    security::RateLimiter& limiter_;
    security::PathGuard pathGuard_;
    security::UploadGuard uploadGuard_;
    security::TermGuard termGuard_;
    search::TreeSearchEngine searchEngine_;
    store::FileStore store_;
};

} // namespace gateway
} // namespace dirgate

#endif // DIRGATE_GATEWAY_GATEWAY_H
