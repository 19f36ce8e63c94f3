// ETHWALLET - Filesystem Utilities
// Copyright (c) 2024 ETHWALLET Developers
// MIT License
//
// Provides filesystem utilities:
// - Path manipulation
// - Whole-file reads and owner-only writes
// - Directory creation and removal
// - RAII temporary directories

#ifndef ETHWALLET_UTIL_FS_H
#define ETHWALLET_UTIL_FS_H

#include <cstdint>
#include <string>
#include <vector>

namespace ethwallet {
namespace util {
namespace fs {

/// Preferred path separator
constexpr char PATH_SEPARATOR = '/';

// ============================================================================
// Path Type
// ============================================================================

/// POSIX path representation
class Path {
public:
    /// Default constructor (empty path)
    Path() = default;

    /// Construct from string
    Path(const std::string& path);
    Path(const char* path);

    /// Get path as string
    const std::string& String() const { return path_; }
    const char* CStr() const { return path_.c_str(); }

    /// Check if path is empty
    bool Empty() const { return path_.empty(); }

    /// Check if path is absolute
    bool IsAbsolute() const;

    /// Get parent directory
    Path Parent() const;

    /// Get filename (last component)
    std::string Filename() const;

    /// Get extension (including dot)
    std::string Extension() const;

    /// Append path component
    Path& Append(const Path& other);

    /// Append with operator/
    Path operator/(const Path& other) const;
    Path& operator/=(const Path& other) { return Append(other); }

    bool operator==(const Path& other) const { return path_ == other.path_; }
    bool operator!=(const Path& other) const { return path_ != other.path_; }

private:
    std::string path_;
};

// ============================================================================
// File Status
// ============================================================================

/// Check if path exists
bool Exists(const Path& path);

/// Check if path is a regular file
bool IsRegularFile(const Path& path);

/// Check if path is a directory
bool IsDirectory(const Path& path);

/// Get file size (0 if missing)
uint64_t FileSize(const Path& path);

/// Permission bits of a file (-1 if missing)
int FilePermissions(const Path& path);

// ============================================================================
// File Operations
// ============================================================================

/// Remove a file
bool RemoveFile(const Path& path);

/// Remove a directory tree
bool RemoveAll(const Path& path);

/// Create a single directory (mode 0700)
bool CreateDirectory(const Path& path);

/// Create a directory and any missing parents
bool CreateDirectories(const Path& path);

/// List the direct children of a directory
std::vector<Path> ListDirectory(const Path& path);

// ============================================================================
// File Content Operations
// ============================================================================

/// Read entire file; returns empty string if unreadable
std::string ReadFile(const Path& path);

/// Write a file readable only by its owner (0600), flushed to disk
bool SecureWriteFile(const Path& path, const uint8_t* data, size_t size);
bool SecureWriteFile(const Path& path, const std::string& content);

// ============================================================================
// Special Directories
// ============================================================================

/// Get system temporary directory
Path TempDirectoryPath();

/// Get home directory
Path HomeDirectory();

/// Expand a leading "~" to the home directory
Path ExpandUser(const Path& path);

// ============================================================================
// Temporary Directories
// ============================================================================

/// Create a uniquely named directory under TempDirectoryPath()
Path CreateTempDirectory(const std::string& prefix = "ethwallet_");

/// RAII temporary directory (deleted recursively on destruction)
class TempDirectory {
public:
    TempDirectory();
    explicit TempDirectory(const std::string& prefix);
    ~TempDirectory();

    // Non-copyable but movable
    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;
    TempDirectory(TempDirectory&& other) noexcept;
    TempDirectory& operator=(TempDirectory&& other) noexcept;

    /// Get path
    const Path& GetPath() const { return path_; }

    /// Check if creation succeeded
    bool IsValid() const { return !path_.Empty(); }

    /// Release ownership (directory is kept)
    Path Release();

private:
    Path path_;
};

} // namespace fs
} // namespace util
} // namespace ethwallet

#endif // ETHWALLET_UTIL_FS_H
