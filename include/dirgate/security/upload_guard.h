// DIRGATE - Upload Guard
// Copyright (c) 2024 DIRGATE Developers
// MIT License
//
// Checks an incoming upload before anything is written:
// - Payload presence and size limit
// - File name sanitization
// - Dangerous and allow-listed extensions
// - Declared content type against the extension
// - A scan of the leading bytes for script and shell markers

#ifndef DIRGATE_SECURITY_UPLOAD_GUARD_H
#define DIRGATE_SECURITY_UPLOAD_GUARD_H

#include "dirgate/core/outcome.h"

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace dirgate {
namespace security {

/// Default upload limit (10 MiB)
constexpr uint64_t DEFAULT_MAX_FILE_SIZE = 10 * 1024 * 1024;

/// Number of leading bytes inspected for malicious markers
constexpr size_t CONTENT_SCAN_BYTES = 8192;

/// Longest file name produced by sanitization
constexpr size_t MAX_FILE_NAME_LENGTH = 255;

/// An upload that passed every check
struct ValidatedUpload {
    std::string sanitizedFileName;
    uint64_t sizeBytes{0};
};

class UploadGuard {
public:
    struct Config {
        uint64_t maxFileSize{DEFAULT_MAX_FILE_SIZE};
        /// Empty allows any extension that is not dangerous
        std::vector<std::string> allowedExtensions;
    };

    UploadGuard();
    explicit UploadGuard(const Config& config);

    /**
     * Validate an upload. Checks run in a fixed order and stop at the
     * first failure, so an oversized payload is never scanned.
     *
     * @param content Stream positioned at the start of the payload
     */
    ValidationOutcome<ValidatedUpload> Validate(const std::string& fileName,
                                                const std::string& contentType,
                                                uint64_t sizeBytes,
                                                std::istream& content) const;

    /// Convenience overload for an in-memory payload
    ValidationOutcome<ValidatedUpload> Validate(const std::string& fileName,
                                                const std::string& contentType,
                                                const std::vector<uint8_t>& content) const;

    /**
     * Replace characters that are unsafe in file names, strip leading and
     * trailing dots and spaces, and replace empty or reserved device names
     * with a timestamped name.
     *
     * @return Empty only when the input is empty or whitespace
     */
    static std::string SanitizeFileName(const std::string& fileName);

    /// Lowercase extension including the dot
    static std::string LowerExtension(const std::string& fileName);

    static bool IsDangerousExtension(const std::string& lowerExtension);
    static bool IsReservedDeviceName(const std::string& fileName);

    /// Lowercase media type with parameters removed
    static std::string NormalizeContentType(const std::string& contentType);

    /// False if the extension maps to known types and contentType is not one
    static bool ContentTypeMatches(const std::string& lowerExtension,
                                   const std::string& normalizedType);

    uint64_t MaxFileSize() const { return config_.maxFileSize; }

private:
    enum class ScanResult { Clean, Malicious, Unreadable };

    static ScanResult ScanContent(std::istream& content);

    Config config_;
};

} // namespace security
} // namespace dirgate

#endif // DIRGATE_SECURITY_UPLOAD_GUARD_H
