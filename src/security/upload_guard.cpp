// DIRGATE - Upload Guard Implementation
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#include "dirgate/security/upload_guard.h"

#include "dirgate/util/fs.h"
#include "dirgate/util/time.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <sstream>

namespace dirgate {
namespace security {

namespace {

const std::set<std::string> DANGEROUS_EXTENSIONS = {
    ".exe", ".bat", ".cmd", ".com", ".pif", ".scr", ".vbs", ".js", ".jar",
    ".ps1", ".sh", ".php", ".asp", ".aspx", ".jsp", ".py", ".pl", ".rb"
};

const std::set<std::string> RESERVED_NAMES = {
    "CON", "PRN", "AUX", "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"
};

const std::map<std::string, std::set<std::string>> CONTENT_TYPES = {
    {".txt",  {"text/plain"}},
    {".csv",  {"text/csv", "text/plain"}},
    {".json", {"application/json", "text/plain"}},
    {".pdf",  {"application/pdf"}},
    {".jpg",  {"image/jpeg"}},
    {".jpeg", {"image/jpeg"}},
    {".png",  {"image/png"}},
    {".gif",  {"image/gif"}},
    {".zip",  {"application/zip", "application/x-zip-compressed"}},
    {".doc",  {"application/msword"}},
    {".docx", {"application/vnd.openxmlformats-officedocument.wordprocessingml.document"}},
};

const char* const MALICIOUS_MARKERS[] = {
    "<script", "javascript:", "vbscript:", "onload=", "onerror=",
    "<?php", "<%", "eval(", "exec(", "system(",
    "cmd.exe", "powershell", "/bin/sh"
};

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string ToUpper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

bool IsBlank(const std::string& str) {
    return std::all_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

bool IsUnsafeNameChar(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (uc < 0x20 || uc == 0x7F) {
        return true;
    }
    switch (c) {
        case '<': case '>': case ':': case '"': case '/':
        case '\\': case '|': case '?': case '*':
            return true;
        default:
            return false;
    }
}

std::string TrimDotsAndSpaces(const std::string& str) {
    size_t start = str.find_first_not_of(". ");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(". ");
    return str.substr(start, end - start + 1);
}

/// Allow-list entries are compared lowercase with a leading dot
std::string NormalizeExtension(const std::string& ext) {
    std::string lower = ToLower(ext);
    if (!lower.empty() && lower[0] != '.') {
        lower.insert(lower.begin(), '.');
    }
    return lower;
}

} // namespace

UploadGuard::UploadGuard() : UploadGuard(Config{}) {}

UploadGuard::UploadGuard(const Config& config) : config_(config) {
    for (auto& ext : config_.allowedExtensions) {
        ext = NormalizeExtension(ext);
    }
}

std::string UploadGuard::LowerExtension(const std::string& fileName) {
    return ToLower(util::fs::Path(fileName).Extension());
}

bool UploadGuard::IsDangerousExtension(const std::string& lowerExtension) {
    return DANGEROUS_EXTENSIONS.count(lowerExtension) != 0;
}

bool UploadGuard::IsReservedDeviceName(const std::string& fileName) {
    return RESERVED_NAMES.count(ToUpper(util::fs::Path(fileName).Stem())) != 0;
}

std::string UploadGuard::NormalizeContentType(const std::string& contentType) {
    std::string type = contentType.substr(0, contentType.find(';'));
    size_t start = type.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = type.find_last_not_of(" \t");
    return ToLower(type.substr(start, end - start + 1));
}

bool UploadGuard::ContentTypeMatches(const std::string& lowerExtension,
                                     const std::string& normalizedType) {
    auto it = CONTENT_TYPES.find(lowerExtension);
    if (it == CONTENT_TYPES.end()) {
        return true;
    }
    return it->second.count(normalizedType) != 0;
}

std::string UploadGuard::SanitizeFileName(const std::string& fileName) {
    if (IsBlank(fileName)) {
        return "";
    }

    std::string sanitized = fileName;
    std::replace_if(sanitized.begin(), sanitized.end(), IsUnsafeNameChar, '_');
    sanitized = TrimDotsAndSpaces(sanitized);

    if (sanitized.empty() || IsReservedDeviceName(sanitized)) {
        std::string extension = sanitized.empty()
            ? util::fs::Path(fileName).Extension()
            : util::fs::Path(sanitized).Extension();
        // A raw extension may still carry separators or control characters
        std::replace_if(extension.begin(), extension.end(), IsUnsafeNameChar, '_');
        sanitized = util::FormatUTC(util::GetSystemTime(), "file_%Y%m%d_%H%M%S") + extension;
    }

    if (sanitized.size() > MAX_FILE_NAME_LENGTH) {
        std::string extension = util::fs::Path(sanitized).Extension();
        if (extension.size() >= MAX_FILE_NAME_LENGTH) {
            sanitized.resize(MAX_FILE_NAME_LENGTH);
        } else {
            std::string stem = sanitized.substr(0, sanitized.size() - extension.size());
            sanitized = stem.substr(0, MAX_FILE_NAME_LENGTH - extension.size()) + extension;
        }
    }

    return sanitized;
}

UploadGuard::ScanResult UploadGuard::ScanContent(std::istream& content) {
    if (!content) {
        return ScanResult::Unreadable;
    }

    std::string buffer(CONTENT_SCAN_BYTES, '\0');
    content.read(&buffer[0], static_cast<std::streamsize>(buffer.size()));
    if (content.bad()) {
        return ScanResult::Unreadable;
    }
    buffer.resize(static_cast<size_t>(content.gcount()));

    std::string lower = ToLower(buffer);
    for (const char* marker : MALICIOUS_MARKERS) {
        if (lower.find(marker) != std::string::npos) {
            return ScanResult::Malicious;
        }
    }
    return ScanResult::Clean;
}

ValidationOutcome<ValidatedUpload> UploadGuard::Validate(const std::string& fileName,
                                                         const std::string& contentType,
                                                         uint64_t sizeBytes,
                                                         std::istream& content) const {
    using Outcome = ValidationOutcome<ValidatedUpload>;

    if (sizeBytes == 0) {
        return Outcome::Invalid("No file provided");
    }

    if (sizeBytes > config_.maxFileSize) {
        return Outcome::Invalid("File too large (max " +
                                std::to_string(config_.maxFileSize / (1024 * 1024)) + " MB)");
    }

    std::string sanitized = SanitizeFileName(fileName);
    if (sanitized.empty()) {
        return Outcome::Invalid("Invalid file name");
    }

    std::string extension = LowerExtension(sanitized);
    if (IsDangerousExtension(extension)) {
        return Outcome::Invalid("File type not allowed for security reasons");
    }

    if (!config_.allowedExtensions.empty() &&
        std::find(config_.allowedExtensions.begin(), config_.allowedExtensions.end(),
                  extension) == config_.allowedExtensions.end()) {
        return Outcome::Invalid("File type not in allowed list");
    }

    std::string type = NormalizeContentType(contentType);
    if (type.empty()) {
        return Outcome::Invalid("Missing content type");
    }
    if (!ContentTypeMatches(extension, type)) {
        return Outcome::Invalid("File content does not match extension");
    }

    switch (ScanContent(content)) {
        case ScanResult::Malicious:
            return Outcome::Invalid("File contains potentially malicious content");
        case ScanResult::Unreadable:
            return Outcome::Invalid("File could not be scanned");
        case ScanResult::Clean:
            break;
    }

    return Outcome::Valid(ValidatedUpload{sanitized, sizeBytes});
}

ValidationOutcome<ValidatedUpload> UploadGuard::Validate(const std::string& fileName,
                                                         const std::string& contentType,
                                                         const std::vector<uint8_t>& content) const {
    // Only the scanned prefix needs to be streamed
    size_t prefix = std::min(content.size(), CONTENT_SCAN_BYTES);
    std::istringstream stream(std::string(content.begin(), content.begin() + prefix));
    return Validate(fileName, contentType, content.size(), stream);
}

} // namespace security
} // namespace dirgate
