// DIRGATE - Filesystem Utilities Implementation
// Copyright (c) 2024 DIRGATE Developers
// MIT License

#include "dirgate/util/fs.h"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <memory>

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace dirgate {
namespace util {
namespace fs {

namespace {

/// Closes a file descriptor without clobbering errno
class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() {
        if (fd_ >= 0) {
            int saved = errno;
            ::close(fd_);
            errno = saved;
        }
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    /// Close explicitly so that write errors reported by close() are seen
    bool Close() {
        int fd = fd_;
        fd_ = -1;
        return ::close(fd) == 0;
    }

private:
    int fd_;
};

struct DirCloser {
    void operator()(DIR* dir) const {
        int saved = errno;
        closedir(dir);
        errno = saved;
    }
};

using DirHandle = std::unique_ptr<DIR, DirCloser>;

FileType TypeFromMode(mode_t mode) {
    if (S_ISREG(mode)) return FileType::Regular;
    if (S_ISDIR(mode)) return FileType::Directory;
    if (S_ISLNK(mode)) return FileType::Symlink;
    return FileType::Other;
}

FileStatus StatusFromStat(const struct stat& st) {
    FileStatus status;
    status.type = TypeFromMode(st.st_mode);
    status.size = static_cast<uint64_t>(st.st_size);
    status.modifiedTime = std::chrono::system_clock::from_time_t(st.st_mtime);
    return status;
}

bool WriteAll(int fd, const uint8_t* data, size_t size) {
    size_t written = 0;
    while (written < size) {
        ssize_t n = ::write(fd, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

} // namespace

// ============================================================================
// Path
// ============================================================================

Path Path::Parent() const {
    size_t pos = path_.find_last_of(PATH_SEPARATOR);
    if (pos == std::string::npos) {
        return Path();
    }
    if (pos == 0) {
        return Path(std::string(1, PATH_SEPARATOR));
    }
    return Path(path_.substr(0, pos));
}

std::string Path::Filename() const {
    size_t pos = path_.find_last_of(PATH_SEPARATOR);
    return pos == std::string::npos ? path_ : path_.substr(pos + 1);
}

std::string Path::Extension() const {
    std::string name = Filename();
    size_t pos = name.find_last_of('.');
    if (pos == std::string::npos || pos == 0 || pos + 1 == name.size()) {
        return "";
    }
    return name.substr(pos);
}

std::string Path::Stem() const {
    std::string name = Filename();
    return name.substr(0, name.size() - Extension().size());
}

Path& Path::Append(const Path& other) {
    if (other.path_.empty()) {
        return *this;
    }
    if (path_.empty() || other.IsAbsolute()) {
        path_ = other.path_;
        return *this;
    }
    if (path_.back() != PATH_SEPARATOR) {
        path_ += PATH_SEPARATOR;
    }
    path_ += other.path_;
    return *this;
}

Path Path::operator/(const Path& other) const {
    Path result(*this);
    result.Append(other);
    return result;
}

Path Path::Normalize() const {
    if (path_.empty()) {
        return Path();
    }

    bool absolute = IsAbsolute();
    std::vector<std::string> components;

    size_t start = 0;
    while (start <= path_.size()) {
        size_t end = path_.find(PATH_SEPARATOR, start);
        if (end == std::string::npos) {
            end = path_.size();
        }
        std::string component = path_.substr(start, end - start);
        start = end + 1;

        if (component.empty() || component == ".") {
            continue;
        }
        if (component == "..") {
            if (!components.empty() && components.back() != "..") {
                components.pop_back();
            } else if (!absolute) {
                components.push_back("..");
            }
            continue;
        }
        components.push_back(std::move(component));
    }

    if (components.empty()) {
        return absolute ? Path(std::string(1, PATH_SEPARATOR)) : Path(".");
    }

    std::string result;
    for (const auto& component : components) {
        if (absolute || !result.empty()) {
            result += PATH_SEPARATOR;
        }
        result += component;
    }
    return Path(result);
}

Path Path::RelativeTo(const Path& base) const {
    std::string self = Normalize().String();
    std::string root = base.Normalize().String();

    if (self == root) {
        return Path(".");
    }
    if (root == "/") {
        return self.size() > 1 && self[0] == PATH_SEPARATOR ? Path(self.substr(1)) : Path();
    }
    if (self.size() > root.size() &&
        self.compare(0, root.size(), root) == 0 &&
        self[root.size()] == PATH_SEPARATOR) {
        return Path(self.substr(root.size() + 1));
    }
    return Path();
}

// ============================================================================
// File Status
// ============================================================================

FileStatus Status(const Path& path) {
    struct stat st;
    if (::stat(path.CStr(), &st) != 0) {
        return FileStatus{};
    }
    return StatusFromStat(st);
}

FileStatus SymlinkStatus(const Path& path) {
    struct stat st;
    if (::lstat(path.CStr(), &st) != 0) {
        return FileStatus{};
    }
    return StatusFromStat(st);
}

bool Exists(const Path& path) {
    return Status(path).Exists();
}

bool IsFile(const Path& path) {
    return Status(path).IsFile();
}

bool IsDirectory(const Path& path) {
    return Status(path).IsDirectory();
}

// ============================================================================
// Directory Iteration
// ============================================================================

int ForEachEntry(const Path& directory,
                 const std::function<bool(const DirectoryEntry&)>& visitor) {
    DirHandle dir(::opendir(directory.CStr()));
    if (!dir) {
        return errno;
    }

    while (true) {
        errno = 0;
        struct dirent* ent = ::readdir(dir.get());
        if (ent == nullptr) {
            return errno;
        }

        std::string name = ent->d_name;
        if (name == "." || name == "..") {
            continue;
        }

        DirectoryEntry entry;
        entry.path = directory / Path(name);
        entry.name = name;

        struct stat st;
        if (::lstat(entry.path.CStr(), &st) != 0) {
            // Removed between readdir and lstat
            continue;
        }

        if (S_ISLNK(st.st_mode)) {
            entry.isSymlink = true;
            struct stat target;
            if (::stat(entry.path.CStr(), &target) == 0) {
                st = target;
            }
        }

        FileStatus status = StatusFromStat(st);
        entry.type = status.type;
        entry.size = status.size;
        entry.modifiedTime = status.modifiedTime;

        if (!visitor(entry)) {
            return 0;
        }
    }
}

std::vector<DirectoryEntry> ListDirectory(const Path& directory, int& error) {
    std::vector<DirectoryEntry> entries;
    error = ForEachEntry(directory, [&entries](const DirectoryEntry& entry) {
        entries.push_back(entry);
        return true;
    });
    return entries;
}

// ============================================================================
// File Operations
// ============================================================================

bool CopyFile(const Path& from, const Path& to, bool overwrite) {
    FdGuard src(::open(from.CStr(), O_RDONLY | O_CLOEXEC));
    if (!src.Valid()) {
        return false;
    }

    int flags = O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC;
    if (!overwrite) {
        flags |= O_EXCL;
    }
    FdGuard dst(::open(to.CStr(), flags, 0644));
    if (!dst.Valid()) {
        return false;
    }

    uint8_t buffer[64 * 1024];
    while (true) {
        ssize_t n = ::read(src.Get(), buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) {
            break;
        }
        if (!WriteAll(dst.Get(), buffer, static_cast<size_t>(n))) {
            return false;
        }
    }

    return dst.Close();
}

bool Rename(const Path& from, const Path& to) {
    return ::rename(from.CStr(), to.CStr()) == 0;
}

bool RemoveFile(const Path& path) {
    return ::unlink(path.CStr()) == 0;
}

bool RemoveAll(const Path& path) {
    FileStatus status = SymlinkStatus(path);
    if (!status.Exists()) {
        return errno == ENOENT;
    }

    if (!status.IsDirectory()) {
        return RemoveFile(path);
    }

    int error = 0;
    auto entries = ListDirectory(path, error);
    if (error != 0) {
        errno = error;
        return false;
    }
    for (const auto& entry : entries) {
        if (!RemoveAll(entry.path)) {
            return false;
        }
    }
    return ::rmdir(path.CStr()) == 0;
}

bool CreateDirectory(const Path& path) {
    return ::mkdir(path.CStr(), 0755) == 0;
}

bool CreateDirectories(const Path& path) {
    if (path.Empty()) {
        errno = ENOENT;
        return false;
    }

    FileStatus status = Status(path);
    if (status.Exists()) {
        if (!status.IsDirectory()) {
            errno = ENOTDIR;
            return false;
        }
        return true;
    }

    Path parent = path.Parent();
    if (!parent.Empty() && parent != path && !CreateDirectories(parent)) {
        return false;
    }

    if (CreateDirectory(path)) {
        return true;
    }
    // Lost a race with another creator
    return errno == EEXIST && IsDirectory(path);
}

bool ReadFileBytes(const Path& path, std::vector<uint8_t>& out) {
    FdGuard fd(::open(path.CStr(), O_RDONLY | O_CLOEXEC));
    if (!fd.Valid()) {
        return false;
    }

    struct stat st;
    if (::fstat(fd.Get(), &st) != 0) {
        return false;
    }
    if (S_ISDIR(st.st_mode)) {
        errno = EISDIR;
        return false;
    }

    out.clear();
    out.reserve(static_cast<size_t>(st.st_size));

    uint8_t buffer[64 * 1024];
    while (true) {
        ssize_t n = ::read(fd.Get(), buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) {
            return true;
        }
        out.insert(out.end(), buffer, buffer + n);
    }
}

bool WriteFile(const Path& path, const uint8_t* data, size_t size) {
    FdGuard fd(::open(path.CStr(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
    if (!fd.Valid()) {
        return false;
    }
    if (!WriteAll(fd.Get(), data, size)) {
        return false;
    }
    return fd.Close();
}

bool WriteFile(const Path& path, const std::string& content) {
    return WriteFile(path, reinterpret_cast<const uint8_t*>(content.data()), content.size());
}

// ============================================================================
// Path Queries
// ============================================================================

Path CurrentPath() {
    char buf[PATH_MAX];
    if (::getcwd(buf, sizeof(buf)) == nullptr) {
        return Path();
    }
    return Path(buf);
}

Path CanonicalPath(const Path& path) {
    char buf[PATH_MAX];
    if (::realpath(path.CStr(), buf) == nullptr) {
        return Path();
    }
    return Path(buf);
}

Path TempDirectoryPath() {
    const char* tmpdir = std::getenv("TMPDIR");
    if (tmpdir && *tmpdir) {
        return Path(tmpdir);
    }
    return Path("/tmp");
}

Path CreateTempDirectory(const std::string& prefix) {
    std::string pattern = (TempDirectoryPath() / Path(prefix + "XXXXXX")).String();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    if (::mkdtemp(buf.data()) == nullptr) {
        return Path();
    }
    return Path(std::string(buf.data())).Normalize();
}

// ============================================================================
// TempDirectory
// ============================================================================

TempDirectory::TempDirectory() : TempDirectory("dirgate_") {}

TempDirectory::TempDirectory(const std::string& prefix)
    : path_(CreateTempDirectory(prefix)) {}

TempDirectory::~TempDirectory() {
    if (!path_.Empty()) {
        RemoveAll(path_);
    }
}

TempDirectory::TempDirectory(TempDirectory&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_ = Path();
}

TempDirectory& TempDirectory::operator=(TempDirectory&& other) noexcept {
    if (this != &other) {
        if (!path_.Empty()) {
            RemoveAll(path_);
        }
        path_ = std::move(other.path_);
        other.path_ = Path();
    }
    return *this;
}

} // namespace fs
} // namespace util
} // namespace dirgate
