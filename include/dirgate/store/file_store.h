// DIRGATE - File Store
// Copyright (c) 2024 DIRGATE Developers
// MIT License
//
// Filesystem operations on validated paths. I/O faults are reported by
// throwing StoreError; the gateway turns them into operation results.

#ifndef DIRGATE_STORE_FILE_STORE_H
#define DIRGATE_STORE_FILE_STORE_H

#include "dirgate/core/types.h"
#include "dirgate/security/path_guard.h"
#include "dirgate/util/fs.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace dirgate {
namespace store {

/// I/O failure carrying the error kind to report
class StoreError : public std::runtime_error {
public:
    StoreError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind Kind() const { return kind_; }

    /// Build from an errno value: ENOENT maps to NotFound, EACCES to AccessDenied
    static StoreError FromErrno(int error, const std::string& context);

private:
    ErrorKind kind_;
};

class FileStore {
public:
    FileStore() = default;

    /// @param maxPathLength Limit for paths the store composes itself
    explicit FileStore(size_t maxPathLength) : maxPathLength_(maxPathLength) {}

    /// Directory entries, directories first, then by name ignoring case
    std::vector<FileEntry> List(const security::ResolvedPath& directory) const;

    std::vector<uint8_t> Read(const security::ResolvedPath& file) const;

    /**
     * Create or replace directory/fileName.
     * @param fileName A single path component, already sanitized
     * @return Path of the written file
     */
    util::fs::Path Write(const security::ResolvedPath& directory,
                         const std::string& fileName,
                         const std::vector<uint8_t>& data) const;

    /// Copy a file, creating missing parents and replacing an existing file
    void Copy(const security::ResolvedPath& source,
              const security::ResolvedPath& destination) const;

    /**
     * Move a file. A destination that is an existing directory receives the
     * source's name, and the composed path must still fit maxPathLength.
     * Moving a file onto itself does nothing.
     * @return Final location of the file
     */
    util::fs::Path Move(const security::ResolvedPath& source,
                        const security::ResolvedPath& destination) const;

private:
    static void EnsureParentDirectory(const util::fs::Path& path);

    size_t maxPathLength_{security::DEFAULT_MAX_PATH_LENGTH};
};

} // namespace store
} // namespace dirgate

#endif // DIRGATE_STORE_FILE_STORE_H
