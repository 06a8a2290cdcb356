#pragma once

#include <expected>
#include <string>
#include <string_view>

// Owns one uniquely named file on disk and removes it when destroyed.
// The file is created atomically (mkstemps), so two requests can never be
// handed the same path.
class TempFile {
public:
    // Creates <dir>/<prefix>XXXXXX<suffix>. prefix and suffix must not
    // contain path separators; callers pass them through sanitize_suffix().
    static std::expected<TempFile, std::string>
        create(const std::string& dir, std::string_view prefix, std::string_view suffix);

    TempFile() = default;
    ~TempFile();

    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }
    bool empty() const { return path_.empty(); }

    // Removes the file if it still exists. Safe to call any number of times.
    // Returns false only if the file existed and could not be removed.
    bool remove();

private:
    explicit TempFile(std::string path) : path_(std::move(path)) {}

    std::string path_;
};

// Reduces an untrusted upload filename to something safe to embed in a
// temp file name: last path component only, [A-Za-z0-9._-], no leading dots,
// at most 64 bytes. Never returns an empty string.
std::string sanitize_suffix(std::string_view filename);
