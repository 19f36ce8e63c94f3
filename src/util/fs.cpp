// ETHWALLET - Filesystem Utilities Implementation
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include "ethwallet/util/fs.h"
#include "ethwallet/core/random.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <dirent.h>
#include <fcntl.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ethwallet {
namespace util {
namespace fs {

// ============================================================================
// Path Implementation
// ============================================================================

Path::Path(const std::string& path) : path_(path) {}

Path::Path(const char* path) : path_(path ? path : "") {}

bool Path::IsAbsolute() const {
    return !path_.empty() && path_[0] == PATH_SEPARATOR;
}

Path Path::Parent() const {
    if (path_.empty()) return Path();

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
    if (path_.empty()) return "";

    size_t pos = path_.find_last_of(PATH_SEPARATOR);
    if (pos == std::string::npos) {
        return path_;
    }
    return path_.substr(pos + 1);
}

std::string Path::Extension() const {
    std::string name = Filename();
    if (name.empty() || name == "." || name == "..") {
        return "";
    }

    size_t pos = name.find_last_of('.');
    if (pos == std::string::npos || pos == 0) {
        return "";
    }
    return name.substr(pos);
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

// ============================================================================
// File Status
// ============================================================================

bool Exists(const Path& path) {
    struct stat st;
    return stat(path.CStr(), &st) == 0;
}

bool IsRegularFile(const Path& path) {
    struct stat st;
    return stat(path.CStr(), &st) == 0 && S_ISREG(st.st_mode);
}

bool IsDirectory(const Path& path) {
    struct stat st;
    return stat(path.CStr(), &st) == 0 && S_ISDIR(st.st_mode);
}

uint64_t FileSize(const Path& path) {
    struct stat st;
    if (stat(path.CStr(), &st) != 0) return 0;
    return static_cast<uint64_t>(st.st_size);
}

int FilePermissions(const Path& path) {
    struct stat st;
    if (stat(path.CStr(), &st) != 0) return -1;
    return static_cast<int>(st.st_mode & 0777);
}

// ============================================================================
// File Operations
// ============================================================================

bool RemoveFile(const Path& path) {
    return std::remove(path.CStr()) == 0;
}

bool RemoveAll(const Path& path) {
    if (!Exists(path)) {
        return true;
    }

    if (IsDirectory(path)) {
        for (const auto& entry : ListDirectory(path)) {
            if (!RemoveAll(entry)) {
                return false;
            }
        }
        return rmdir(path.CStr()) == 0;
    }

    return RemoveFile(path);
}

bool CreateDirectory(const Path& path) {
    return mkdir(path.CStr(), 0700) == 0;
}

bool CreateDirectories(const Path& path) {
    if (path.Empty()) return false;
    if (Exists(path)) return IsDirectory(path);

    Path parent = path.Parent();
    if (!parent.Empty() && !Exists(parent)) {
        if (!CreateDirectories(parent)) {
            return false;
        }
    }

    return CreateDirectory(path);
}

std::vector<Path> ListDirectory(const Path& path) {
    std::vector<Path> results;

    DIR* dir = opendir(path.CStr());
    if (!dir) return results;

    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        if (name == "." || name == "..") continue;
        results.push_back(path / name);
    }
    closedir(dir);

    return results;
}

// ============================================================================
// File Content Operations
// ============================================================================

std::string ReadFile(const Path& path) {
    std::ifstream file(path.String(), std::ios::binary);
    if (!file) return "";

    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

bool SecureWriteFile(const Path& path, const uint8_t* data, size_t size) {
    // Create with restrictive permissions from the start
    int fd = open(path.CStr(), O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR);
    if (fd < 0) return false;

    size_t written = 0;
    while (written < size) {
        ssize_t result = write(fd, data + written, size - written);
        if (result < 0) {
            close(fd);
            return false;
        }
        written += static_cast<size_t>(result);
    }

    // A pre-existing file keeps its old mode through O_CREAT
    bool ok = fchmod(fd, S_IRUSR | S_IWUSR) == 0;
    ok = fsync(fd) == 0 && ok;
    ok = close(fd) == 0 && ok;
    return ok;
}

bool SecureWriteFile(const Path& path, const std::string& content) {
    return SecureWriteFile(path, reinterpret_cast<const uint8_t*>(content.data()),
                           content.size());
}

// ============================================================================
// Special Directories
// ============================================================================

Path TempDirectoryPath() {
    const char* tmpdir = getenv("TMPDIR");
    if (tmpdir && *tmpdir) return Path(tmpdir);
    return Path("/tmp");
}

Path HomeDirectory() {
    const char* home = getenv("HOME");
    if (home && *home) return Path(home);

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) return Path(pw->pw_dir);

    return Path();
}

Path ExpandUser(const Path& path) {
    const std::string& str = path.String();
    if (str.empty() || str[0] != '~') {
        return path;
    }

    Path home = HomeDirectory();
    if (home.Empty()) return path;

    if (str.length() == 1) {
        return home;
    }

    if (str[1] == PATH_SEPARATOR) {
        return home / str.substr(2);
    }

    return path;
}

// ============================================================================
// Temporary Directories
// ============================================================================

namespace {
    std::string GenerateRandomString(size_t length) {
        static const char chars[] = "abcdefghijklmnopqrstuvwxyz0123456789";

        std::string result;
        result.reserve(length);
        for (size_t i = 0; i < length; ++i) {
            result += chars[GetRandInt(sizeof(chars) - 1)];
        }
        return result;
    }
}

Path CreateTempDirectory(const std::string& prefix) {
    Path tempDir = TempDirectoryPath();

    for (int i = 0; i < 100; ++i) {
        Path path = tempDir / (prefix + GenerateRandomString(10));
        if (!Exists(path) && CreateDirectory(path)) {
            return path;
        }
    }

    return Path();
}

TempDirectory::TempDirectory() : path_(CreateTempDirectory()) {}

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

Path TempDirectory::Release() {
    Path result = path_;
    path_ = Path();
    return result;
}

} // namespace fs
} // namespace util
} // namespace ethwallet
