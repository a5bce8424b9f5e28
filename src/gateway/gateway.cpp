// DIRGATE - File Access Gateway Implementation
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#include "dirgate/gateway/gateway.h"

#include "dirgate/util/fs.h"
#include "dirgate/util/logging.h"

#include <algorithm>

namespace dirgate {
namespace gateway {

namespace {

constexpr const char* DOWNLOAD_CONTENT_TYPE = "application/octet-stream";

/// Upload rejections worth a security warning rather than a debug line
bool IsSecurityRejection(const std::string& reason) {
    return reason == "File type not allowed for security reasons" ||
           reason == "File contains potentially malicious content";
}

} // namespace

Gateway::Gateway(const GatewayOptions& options, security::RateLimiter& limiter)
    : options_(options),
      limiter_(limiter),
      pathGuard_(options.PathGuardConfig()),
      uploadGuard_(options.UploadGuardConfig()),
      termGuard_(options.TermGuardConfig()),
      store_(options.maxPathLength) {
    LOG_INFO(util::LogCategory::GATEWAY) << "Gateway serving " << pathGuard_.RootString();
}

std::string Gateway::DefaultPath() const {
    return pathGuard_.RootString();
}

// ============================================================================
// Shared Plumbing
// ============================================================================

template<typename T>
OperationResult<T> Gateway::Guarded(const std::string& callerId, OperationKind operation,
                                    const std::function<OperationResult<T>()>& body) {
    if (!limiter_.Permit(callerId, operation)) {
        return OperationResult<T>::Fail(ErrorKind::RateLimited, RATE_LIMITED_MESSAGE);
    }

    try {
        return body();
    } catch (const store::StoreError& e) {
        if (e.Kind() == ErrorKind::Internal) {
            LOG_ERROR(util::LogCategory::GATEWAY) << OperationKindToString(operation)
                                                  << " failed for " << callerId << ": " << e.what();
            return OperationResult<T>::Fail(ErrorKind::Internal, INTERNAL_ERROR_MESSAGE);
        }
        LOG_WARN(util::LogCategory::GATEWAY) << OperationKindToString(operation) << " failed for "
                                             << callerId << " (" << ErrorKindToString(e.Kind())
                                             << "): " << e.what();
        return OperationResult<T>::Fail(e.Kind(), e.what());
    } catch (const std::exception& e) {
        LOG_ERROR(util::LogCategory::GATEWAY) << "Unexpected error in "
                                              << OperationKindToString(operation) << " for "
                                              << callerId << ": " << e.what();
        return OperationResult<T>::Fail(ErrorKind::Internal, INTERNAL_ERROR_MESSAGE);
    }
}

template<typename T>
OperationResult<T> Gateway::RejectPath(const std::string& callerId, OperationKind operation,
                                       const std::string& input, const std::string& reason,
                                       const std::string& prefix) {
    bool outside = reason == security::OUTSIDE_ROOT_REASON;
    bool traversal = security::PathGuard::HasTraversalSignature(input);

    if (outside || traversal) {
        LOG_WARN(util::LogCategory::SECURITY) << "Path rejected for " << callerId << " ("
                                              << OperationKindToString(operation) << "): "
                                              << reason << ": " << input;
    } else {
        LOG_DEBUG(util::LogCategory::GATEWAY) << "Invalid path from " << callerId << ": " << reason;
    }

    return OperationResult<T>::Fail(outside ? ErrorKind::AccessDenied : ErrorKind::InvalidInput,
                                    prefix + reason);
}

// ============================================================================
// Operations
// ============================================================================

OperationResult<ListPayload> Gateway::List(const std::string& callerId, const std::string& path) {
    return Guarded<ListPayload>(callerId, OperationKind::List, [&]() {
        auto dir = path.empty()
            ? ValidationOutcome<security::ResolvedPath>::Valid(pathGuard_.Root())
            : pathGuard_.Validate(path);
        if (!dir) {
            return RejectPath<ListPayload>(callerId, OperationKind::List, path, dir.Reason());
        }

        LOG_DEBUG(util::LogCategory::GATEWAY) << "Listing " << dir.Value().String()
                                              << " for " << callerId;

        ListPayload payload;
        payload.directory = dir.Value().String();
        payload.entries = store_.List(dir.Value());
        return OperationResult<ListPayload>::Ok(std::move(payload));
    });
}

OperationResult<SearchPayload> Gateway::Search(const std::string& callerId,
                                               const SearchParams& params) {
    return Guarded<SearchPayload>(callerId, OperationKind::Search, [&]() {
        auto term = termGuard_.Validate(params.term);
        if (!term) {
            LOG_DEBUG(util::LogCategory::GATEWAY) << "Invalid search term from " << callerId
                                                  << ": " << term.Reason();
            return OperationResult<SearchPayload>::Fail(ErrorKind::InvalidInput, term.Reason());
        }

        auto dir = pathGuard_.Validate(params.path);
        if (!dir) {
            return RejectPath<SearchPayload>(callerId, OperationKind::Search, params.path,
                                             dir.Reason());
        }

        if (params.maxResults && *params.maxResults == 0) {
            return OperationResult<SearchPayload>::Fail(ErrorKind::InvalidInput,
                                                        "maxResults must be greater than zero");
        }

        if (!util::fs::IsDirectory(dir.Value().ToPath())) {
            return OperationResult<SearchPayload>::Fail(
                ErrorKind::NotFound, "Directory '" + dir.Value().String() + "' does not exist");
        }

        search::SearchRequest request(dir.Value(), term.Value());
        request.includeSubdirectories = params.includeSubdirectories;
        request.maxResults = std::min(params.maxResults.value_or(options_.searchMaxResults),
                                      options_.searchMaxResults);
        request.maxDepth = options_.searchMaxDepth;
        request.timeBudget = options_.searchTimeBudget;

        LOG_DEBUG(util::LogCategory::GATEWAY) << "Searching " << request.root.String()
                                              << " for '" << request.term << "' (caller "
                                              << callerId << ")";

        search::SearchResult result = searchEngine_.Search(request);

        SearchPayload payload;
        payload.directory = dir.Value().String();
        payload.entries = std::move(result.entries);
        payload.truncated = result.truncated;
        payload.timedOut = result.timedOut;
        payload.skippedDirectories = result.skippedDirectories;
        payload.vanishedDirectories = result.vanishedDirectories;
        payload.message = std::move(result.message);
        return OperationResult<SearchPayload>::Ok(std::move(payload));
    });
}

OperationResult<DownloadPayload> Gateway::Download(const std::string& callerId,
                                                   const std::string& path) {
    return Guarded<DownloadPayload>(callerId, OperationKind::Download, [&]() {
        auto file = pathGuard_.Validate(path);
        if (!file) {
            return RejectPath<DownloadPayload>(callerId, OperationKind::Download, path,
                                               file.Reason());
        }

        DownloadPayload payload;
        payload.data = store_.Read(file.Value());
        payload.fileName = file.Value().Filename();
        payload.contentType = DOWNLOAD_CONTENT_TYPE;

        LOG_INFO(util::LogCategory::GATEWAY) << callerId << " downloaded " << file.Value().String()
                                             << " (" << payload.data.size() << " bytes)";
        return OperationResult<DownloadPayload>::Ok(std::move(payload));
    });
}

OperationResult<UploadPayload> Gateway::Upload(const std::string& callerId,
                                               const UploadParams& params) {
    return Guarded<UploadPayload>(callerId, OperationKind::Upload, [&]() {
        auto upload = uploadGuard_.Validate(params.fileName, params.contentType, params.data);
        if (!upload) {
            if (IsSecurityRejection(upload.Reason())) {
                LOG_WARN(util::LogCategory::SECURITY) << "Upload rejected for " << callerId << ": "
                                                      << upload.Reason() << ": " << params.fileName;
            } else {
                LOG_DEBUG(util::LogCategory::GATEWAY) << "Invalid upload from " << callerId
                                                      << ": " << upload.Reason();
            }
            return OperationResult<UploadPayload>::Fail(ErrorKind::InvalidInput, upload.Reason());
        }

        auto dir = pathGuard_.Validate(params.directory);
        if (!dir) {
            return RejectPath<UploadPayload>(callerId, OperationKind::Upload, params.directory,
                                             dir.Reason());
        }

        util::fs::Path written = store_.Write(dir.Value(), upload.Value().sanitizedFileName,
                                              params.data);

        LOG_INFO(util::LogCategory::GATEWAY) << callerId << " uploaded "
                                             << upload.Value().sanitizedFileName << " to "
                                             << dir.Value().String() << ", "
                                             << upload.Value().sizeBytes << " bytes";

        UploadPayload payload;
        payload.fileName = upload.Value().sanitizedFileName;
        payload.sizeBytes = upload.Value().sizeBytes;
        payload.path = written.String();
        return OperationResult<UploadPayload>::Ok(std::move(payload));
    });
}

OperationResult<TransferPayload> Gateway::Copy(const std::string& callerId,
                                               const std::string& sourcePath,
                                               const std::string& destinationPath) {
    return Transfer(callerId, OperationKind::Copy, sourcePath, destinationPath);
}

OperationResult<TransferPayload> Gateway::Move(const std::string& callerId,
                                               const std::string& sourcePath,
                                               const std::string& destinationPath) {
    return Transfer(callerId, OperationKind::Move, sourcePath, destinationPath);
}

OperationResult<TransferPayload> Gateway::Transfer(const std::string& callerId,
                                                   OperationKind operation,
                                                   const std::string& sourcePath,
                                                   const std::string& destinationPath) {
    return Guarded<TransferPayload>(callerId, operation, [&]() {
        auto source = pathGuard_.Validate(sourcePath);
        if (!source) {
            return RejectPath<TransferPayload>(callerId, operation, sourcePath, source.Reason(),
                                               "Source path error: ");
        }

        auto destination = pathGuard_.Validate(destinationPath);
        if (!destination) {
            return RejectPath<TransferPayload>(callerId, operation, destinationPath,
                                               destination.Reason(), "Destination path error: ");
        }

        TransferPayload payload;
        if (operation == OperationKind::Move) {
            payload.destination = store_.Move(source.Value(), destination.Value()).String();
        } else {
            store_.Copy(source.Value(), destination.Value());
            payload.destination = destination.Value().String();
        }

        LOG_INFO(util::LogCategory::GATEWAY) << callerId << " " << OperationKindToString(operation)
                                             << " " << source.Value().String() << " -> "
                                             << payload.destination;
        return OperationResult<TransferPayload>::Ok(std::move(payload));
    });
}

} // namespace gateway
} // namespace dirgate
