// DIRGATE - Filesystem Utilities
// Copyright (c) 2024 DIRGATE Developers
// MIT License
//
// Thin POSIX filesystem layer:
// - Lexical path manipulation
// - File status and directory iteration that report errno
// - Copy, rename and directory creation
// - RAII temporary directories for tests and staging
//
// Functions returning bool leave errno describing the failure.

#ifndef DIRGATE_UTIL_FS_H
#define DIRGATE_UTIL_FS_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace dirgate {
namespace util {
namespace fs {

constexpr char PATH_SEPARATOR = '/';

// ============================================================================
// Path Type
// ============================================================================

/// Lexical POSIX path. The string is stored verbatim.
class Path {
public:
    Path() = default;
    Path(const std::string& path) : path_(path) {}
    Path(const char* path) : path_(path ? path : "") {}

    const std::string& String() const { return path_; }
    const char* CStr() const { return path_.c_str(); }

    bool Empty() const { return path_.empty(); }
    bool IsAbsolute() const { return !path_.empty() && path_[0] == PATH_SEPARATOR; }

    /// Parent directory ("/" for top-level entries, empty for bare names)
    Path Parent() const;

    /// Last component
    std::string Filename() const;

    /// Filename without extension
    std::string Stem() const;

    /// Extension including the dot; empty for dotfiles and names ending in '.'
    std::string Extension() const;

    Path& Append(const Path& other);
    Path operator/(const Path& other) const;

    /// Resolve "." and ".." and collapse repeated separators
    Path Normalize() const;

    /**
     * Path of this relative to base, lexically.
     * @return Empty path when this is not base or nested under it
     */
    Path RelativeTo(const Path& base) const;

    bool operator==(const Path& other) const { return path_ == other.path_; }
    bool operator!=(const Path& other) const { return path_ != other.path_; }
    bool operator<(const Path& other) const { return path_ < other.path_; }

private:
    std::string path_;
};

// ============================================================================
// File Status
// ============================================================================

enum class FileType {
    None,
    Regular,
    Directory,
    Symlink,
    Other
};

struct FileStatus {
    FileType type{FileType::None};
    uint64_t size{0};
    std::chrono::system_clock::time_point modifiedTime;

    bool Exists() const { return type != FileType::None; }
    bool IsFile() const { return type == FileType::Regular; }
    bool IsDirectory() const { return type == FileType::Directory; }
    bool IsSymlink() const { return type == FileType::Symlink; }
};

/// Status following symlinks; type None (with errno set) on failure
FileStatus Status(const Path& path);

/// Status of the link itself
FileStatus SymlinkStatus(const Path& path);

bool Exists(const Path& path);
bool IsFile(const Path& path);
bool IsDirectory(const Path& path);

// ============================================================================
// Directory Iteration
// ============================================================================

struct DirectoryEntry {
    Path path;
    std::string name;
    FileType type{FileType::None};     // Type of the target for symlinks
    bool isSymlink{false};
    uint64_t size{0};
    std::chrono::system_clock::time_point modifiedTime;
};

/**
 * Visit the entries of a directory one at a time.
 * Entries that disappear while being examined are skipped.
 *
 * @param visitor Return false to stop early
 * @return 0 on success, otherwise the errno from opening or reading
 */
int ForEachEntry(const Path& directory,
                 const std::function<bool(const DirectoryEntry&)>& visitor);

/// Collect all entries; error receives 0 or errno
std::vector<DirectoryEntry> ListDirectory(const Path& directory, int& error);

// ============================================================================
// File Operations
// ============================================================================

/// Copy file contents; overwrite replaces an existing destination
bool CopyFile(const Path& from, const Path& to, bool overwrite = false);

bool Rename(const Path& from, const Path& to);
bool RemoveFile(const Path& path);

/// Remove a tree without following symlinks
bool RemoveAll(const Path& path);

bool CreateDirectory(const Path& path);

/// Create a directory and any missing parents; true if it already exists
bool CreateDirectories(const Path& path);

bool ReadFileBytes(const Path& path, std::vector<uint8_t>& out);
bool WriteFile(const Path& path, const uint8_t* data, size_t size);
bool WriteFile(const Path& path, const std::string& content);

// ============================================================================
// Path Queries
// ============================================================================

Path CurrentPath();

/// realpath(3); empty on failure
Path CanonicalPath(const Path& path);

Path TempDirectoryPath();

/// mkdtemp under the temp directory, normalized; empty on failure
Path CreateTempDirectory(const std::string& prefix = "dirgate_");

/// Temporary directory removed with its contents on destruction
class TempDirectory {
public:
    TempDirectory();
    explicit TempDirectory(const std::string& prefix);
    ~TempDirectory();

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;
    TempDirectory(TempDirectory&& other) noexcept;
    TempDirectory& operator=(TempDirectory&& other) noexcept;

    const Path& GetPath() const { return path_; }
    bool IsValid() const { return !path_.Empty(); }

private:
    Path path_;
};

} // namespace fs
} // namespace util
} // namespace dirgate

#endif // DIRGATE_UTIL_FS_H
