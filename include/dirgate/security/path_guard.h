// DIRGATE - Path Guard
// Copyright (c) 2024 DIRGATE Developers
// MIT License
//
// Validates client-supplied paths against traversal and the configured
// root. Validation is lexical only; it never touches the filesystem.

#ifndef DIRGATE_SECURITY_PATH_GUARD_H
#define DIRGATE_SECURITY_PATH_GUARD_H

#include "dirgate/core/outcome.h"
#include "dirgate/util/fs.h"

#include <cstddef>
#include <string>

namespace dirgate {
namespace security {

/// Default maximum length of a normalized path
constexpr size_t DEFAULT_MAX_PATH_LENGTH = 260;

/// Rejection reason for paths that normalize to a location outside the root
constexpr const char* OUTSIDE_ROOT_REASON = "Access denied: path outside allowed directory";

class PathGuard;

// ============================================================================
// Resolved Path
// ============================================================================

/**
 * Absolute, normalized path that was inside the root when it was validated.
 * Only PathGuard creates these, and they are not meant to outlive a request.
 */
class ResolvedPath {
public:
    const std::string& String() const { return path_; }
    util::fs::Path ToPath() const { return util::fs::Path(path_); }

    /// The root this path was validated against
    const std::string& Root() const { return root_; }

    bool IsRoot() const { return path_ == root_; }

    /// Last component; empty for "/"
    std::string Filename() const { return ToPath().Filename(); }

    bool operator==(const ResolvedPath& other) const { return path_ == other.path_; }
    bool operator!=(const ResolvedPath& other) const { return path_ != other.path_; }

private:
    friend class PathGuard;
    ResolvedPath(std::string path, std::string root)
        : path_(std::move(path)), root_(std::move(root)) {}

    std::string path_;
    std::string root_;
};

// ============================================================================
// Path Guard
// ============================================================================

class PathGuard {
public:
    struct Config {
        std::string root;
        size_t maxPathLength{DEFAULT_MAX_PATH_LENGTH};
    };

    /**
     * @param config root may be relative (resolved against the working
     *               directory) and may use '\' separators
     * @throws std::invalid_argument if the root is empty
     */
    explicit PathGuard(const Config& config);

    /**
     * Validate a client path.
     *
     * Relative input is resolved against the root. A prefix that matches
     * the root case-insensitively is rewritten to the root's spelling.
     */
    ValidationOutcome<ResolvedPath> Validate(const std::string& inputPath) const;

    /// The root itself as a ResolvedPath
    ResolvedPath Root() const { return ResolvedPath(root_, root_); }

    /// Normalized absolute root
    const std::string& RootString() const { return root_; }

    size_t MaxPathLength() const { return maxPathLength_; }

    /// True if the raw string contains ".." next to '/' or '\'
    static bool HasTraversalSignature(const std::string& path);

    /// True for NUL and control characters other than tab
    static bool HasControlCharacters(const std::string& path);

private:
    std::string root_;
    std::string rootLower_;
    size_t maxPathLength_;
};

} // namespace security
} // namespace dirgate

#endif // DIRGATE_SECURITY_PATH_GUARD_H
