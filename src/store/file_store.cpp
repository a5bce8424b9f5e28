// DIRGATE - File Store Implementation
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#include "dirgate/store/file_store.h"

#include "dirgate/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>

namespace dirgate {
namespace store {

namespace {

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

} // namespace

StoreError StoreError::FromErrno(int error, const std::string& context) {
    std::string detail = context + ": " + std::strerror(error);
    switch (error) {
        case ENOENT:
        case ENOTDIR:
            return StoreError(ErrorKind::NotFound, detail);
        case EACCES:
        case EPERM:
        case EROFS:
            return StoreError(ErrorKind::AccessDenied, detail);
        case EISDIR:
        case ENAMETOOLONG:
            return StoreError(ErrorKind::InvalidInput, detail);
        default:
            return StoreError(ErrorKind::Internal, detail);
    }
}

// ============================================================================
// Listing and Reading
// ============================================================================

std::vector<FileEntry> FileStore::List(const security::ResolvedPath& directory) const {
    util::fs::Path dir = directory.ToPath();
    if (!util::fs::IsDirectory(dir)) {
        throw StoreError(ErrorKind::NotFound, "Directory '" + dir.String() + "' does not exist");
    }

    int error = 0;
    std::vector<util::fs::DirectoryEntry> raw = util::fs::ListDirectory(dir, error);
    if (error != 0) {
        throw StoreError::FromErrno(error, "Cannot read directory '" + dir.String() + "'");
    }

    std::vector<FileEntry> entries;
    entries.reserve(raw.size());
    for (const auto& item : raw) {
        FileEntry entry;
        entry.name = item.name;
        entry.absolutePath = item.path.String();
        entry.isDirectory = item.type == util::fs::FileType::Directory;
        entry.sizeBytes = entry.isDirectory ? 0 : item.size;
        entry.lastModified = item.modifiedTime;
        entries.push_back(std::move(entry));
    }

    std::sort(entries.begin(), entries.end(), [](const FileEntry& a, const FileEntry& b) {
        if (a.isDirectory != b.isDirectory) {
            return a.isDirectory;
        }
        std::string la = ToLower(a.name);
        std::string lb = ToLower(b.name);
        return la != lb ? la < lb : a.name < b.name;
    });

    LOG_DEBUG(util::LogCategory::STORE) << "Listed " << entries.size() << " entries in " << dir.String();
    return entries;
}

std::vector<uint8_t> FileStore::Read(const security::ResolvedPath& file) const {
    util::fs::Path path = file.ToPath();
    if (!util::fs::IsFile(path)) {
        throw StoreError(ErrorKind::NotFound, "File '" + path.String() + "' not found");
    }

    std::vector<uint8_t> data;
    if (!util::fs::ReadFileBytes(path, data)) {
        throw StoreError::FromErrno(errno, "Cannot read '" + path.String() + "'");
    }
    return data;
}

// ============================================================================
// Writing, Copying and Moving
// ============================================================================

void FileStore::EnsureParentDirectory(const util::fs::Path& path) {
    util::fs::Path parent = path.Parent();
    if (parent.Empty() || util::fs::IsDirectory(parent)) {
        return;
    }
    if (!util::fs::CreateDirectories(parent)) {
        throw StoreError::FromErrno(errno, "Cannot create directory '" + parent.String() + "'");
    }
    LOG_DEBUG(util::LogCategory::STORE) << "Created directory " << parent.String();
}

util::fs::Path FileStore::Write(const security::ResolvedPath& directory,
                                const std::string& fileName,
                                const std::vector<uint8_t>& data) const {
    if (fileName.empty() || fileName == "." || fileName == ".." ||
        fileName.find('/') != std::string::npos) {
        throw StoreError(ErrorKind::InvalidInput, "Invalid file name");
    }

    util::fs::Path dir = directory.ToPath();
    if (!util::fs::IsDirectory(dir)) {
        throw StoreError(ErrorKind::NotFound, "Directory '" + dir.String() + "' does not exist");
    }

    util::fs::Path target = dir / util::fs::Path(fileName);
    if (!util::fs::WriteFile(target, data.data(), data.size())) {
        throw StoreError::FromErrno(errno, "Cannot write '" + target.String() + "'");
    }

    LOG_INFO(util::LogCategory::STORE) << "Wrote " << data.size() << " bytes to " << target.String();
    return target;
}

void FileStore::Copy(const security::ResolvedPath& source,
                     const security::ResolvedPath& destination) const {
    util::fs::Path from = source.ToPath();
    util::fs::Path to = destination.ToPath();

    if (!util::fs::IsFile(from)) {
        throw StoreError(ErrorKind::NotFound, "Source file '" + from.String() + "' not found");
    }
    if (util::fs::IsDirectory(to)) {
        throw StoreError(ErrorKind::InvalidInput, "Destination is a directory");
    }
    if (from == to) {
        // Truncating the destination would destroy the source
        throw StoreError(ErrorKind::InvalidInput, "Source and destination are the same file");
    }

    EnsureParentDirectory(to);

    if (!util::fs::CopyFile(from, to, true)) {
        throw StoreError::FromErrno(errno, "Cannot copy '" + from.String() + "' to '" +
                                               to.String() + "'");
    }

    LOG_INFO(util::LogCategory::STORE) << "Copied " << from.String() << " to " << to.String();
}

util::fs::Path FileStore::Move(const security::ResolvedPath& source,
                               const security::ResolvedPath& destination) const {
    util::fs::Path from = source.ToPath();
    util::fs::Path to = destination.ToPath();

    if (!util::fs::IsFile(from)) {
        throw StoreError(ErrorKind::NotFound, "Source file '" + from.String() + "' not found");
    }
    if (util::fs::IsDirectory(to)) {
        to = to / util::fs::Path(from.Filename());
        if (to.String().size() > maxPathLength_) {
            throw StoreError(ErrorKind::InvalidInput, "Path too long (max " +
                             std::to_string(maxPathLength_) + " characters)");
        }
    }
    if (from == to) {
        return to;
    }

    EnsureParentDirectory(to);

    if (!util::fs::Rename(from, to)) {
        if (errno != EXDEV) {
            throw StoreError::FromErrno(errno, "Cannot move '" + from.String() + "' to '" +
                                                   to.String() + "'");
        }

        // Different filesystems: copy, then remove the original
        if (!util::fs::CopyFile(from, to, true)) {
            throw StoreError::FromErrno(errno, "Cannot copy '" + from.String() + "' to '" +
                                                   to.String() + "'");
        }
        if (!util::fs::RemoveFile(from)) {
            throw StoreError::FromErrno(errno, "Copied to '" + to.String() +
                                                   "' but cannot remove '" + from.String() + "'");
        }
    }

    LOG_INFO(util::LogCategory::STORE) << "Moved " << from.String() << " to " << to.String();
    return to;
}

} // namespace store
} // namespace dirgate
