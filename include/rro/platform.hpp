#pragma once

#include <optional>
#include <string>
#include <vector>

namespace rro {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// Move an already written file into place (fsync + rename + fsync(dir))
AtomicWriteResult atomic_publish_file(const std::string& temp_path, const std::string& final_path);

// Create a directory (and parents) with fsync on parent
AtomicWriteResult atomic_create_directory(const std::string& path);

// Temporary sibling name for a path ("<path>.tmp.<8 hex>")
std::string make_temp_filename(const std::string& base);

// ============================================================================
// Path Utilities
// ============================================================================

std::string get_parent_directory(const std::string& path);

std::string join_path(const std::string& base, const std::string& rel);

// Absolute form of a path (lexically normalized, not resolved)
std::string absolute_path(const std::string& path);

bool path_exists(const std::string& path);

bool is_directory(const std::string& path);

bool is_regular_file(const std::string& path);

bool is_executable_file(const std::string& path);

// Remove a directory recursively
bool remove_directory(const std::string& path);

// Remove a file; missing files count as removed
bool remove_file(const std::string& path);

// ============================================================================
// Scoped Path
// ============================================================================

// Removes the path (recursively) when the scope ends
class ScopedPath {
public:
    explicit ScopedPath(std::string path) : path_(std::move(path)) {}
    ~ScopedPath();

    ScopedPath(const ScopedPath&) = delete;
    ScopedPath& operator=(const ScopedPath&) = delete;

    const std::string& path() const { return path_; }

    // Stop tracking the path; it will not be removed
    void release() { path_.clear(); }

private:
    std::string path_;
};

// ============================================================================
// Search Path
// ============================================================================

// Split a colon-delimited search path, dropping empty entries
std::vector<std::string> split_search_path(const std::string& path_env);

// First executable named `name` in the search path, if any
std::optional<std::string> find_in_search_path(const std::string& name,
                                               const std::string& path_env);

// Same, against the process PATH
std::optional<std::string> find_executable(const std::string& name);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// Milliseconds since the Unix epoch
long long current_time_millis();

std::string generate_uuid();

// ============================================================================
// Digest
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;
};

// SHA-256 of a file's contents, lowercase hex
HashResult compute_sha256(const std::string& file_path);

} // namespace rro
