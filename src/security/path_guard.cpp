// DIRGATE - Path Guard Implementation
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#include "dirgate/security/path_guard.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace dirgate {
namespace security {

namespace {

std::string Trim(const std::string& str) {
    const char* whitespace = " \t\r\n\v\f";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string ToPosixSeparators(std::string path) {
    std::replace(path.begin(), path.end(), '\\', '/');
    return path;
}

} // namespace

PathGuard::PathGuard(const Config& config)
    : maxPathLength_(config.maxPathLength) {
    std::string root = ToPosixSeparators(Trim(config.root));
    if (root.empty()) {
        throw std::invalid_argument("PathGuard root must not be empty");
    }

    util::fs::Path rootPath(root);
    if (!rootPath.IsAbsolute()) {
        rootPath = util::fs::CurrentPath() / rootPath;
    }

    root_ = rootPath.Normalize().String();
    rootLower_ = ToLower(root_);
}

bool PathGuard::HasTraversalSignature(const std::string& path) {
    for (size_t pos = path.find(".."); pos != std::string::npos; pos = path.find("..", pos + 1)) {
        bool before = pos > 0 && (path[pos - 1] == '/' || path[pos - 1] == '\\');
        bool after = pos + 2 < path.size() && (path[pos + 2] == '/' || path[pos + 2] == '\\');
        if (before || after) {
            return true;
        }
    }
    return false;
}

bool PathGuard::HasControlCharacters(const std::string& path) {
    return std::any_of(path.begin(), path.end(), [](char c) {
        unsigned char uc = static_cast<unsigned char>(c);
        return (uc < 0x20 && uc != '\t') || uc == 0x7F;
    });
}

ValidationOutcome<ResolvedPath> PathGuard::Validate(const std::string& inputPath) const {
    using Outcome = ValidationOutcome<ResolvedPath>;

    std::string trimmed = Trim(inputPath);
    if (trimmed.empty()) {
        return Outcome::Invalid("Path cannot be empty");
    }

    if (HasTraversalSignature(trimmed)) {
        return Outcome::Invalid("Invalid path: path traversal detected");
    }

    if (HasControlCharacters(trimmed)) {
        return Outcome::Invalid("Invalid path: contains illegal characters");
    }

    util::fs::Path candidate(ToPosixSeparators(trimmed));
    if (!candidate.IsAbsolute()) {
        candidate = util::fs::Path(root_) / candidate;
    }
    std::string normalized = candidate.Normalize().String();

    // Containment on a component boundary, ignoring case
    std::string lower = ToLower(normalized);
    bool inside = lower == rootLower_;
    if (!inside && lower.compare(0, rootLower_.size(), rootLower_) == 0) {
        inside = rootLower_ == "/" || lower[rootLower_.size()] == '/';
    }
    if (!inside) {
        return Outcome::Invalid(OUTSIDE_ROOT_REASON);
    }

    // Respell the matched prefix as the configured root
    std::string resolved = root_ + normalized.substr(root_.size());

    if (resolved.size() > maxPathLength_) {
        return Outcome::Invalid("Path too long (max " + std::to_string(maxPathLength_) +
                                " characters)");
    }

    return Outcome::Valid(ResolvedPath(std::move(resolved), root_));
}

} // namespace security
} // namespace dirgate
