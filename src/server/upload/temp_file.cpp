#include "upload/temp_file.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <format>
#include <print>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr size_t kMaxSuffixBytes = 64;

bool is_safe_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
}

} // namespace

std::expected<TempFile, std::string>
TempFile::create(const std::string& dir, std::string_view prefix, std::string_view suffix) {
    std::string path = (fs::path(dir) / prefix).string();
    path += "XXXXXX";
    path += suffix;

    // mkstemps needs a mutable char*
    std::vector<char> tmpl(path.begin(), path.end());
    tmpl.push_back('\0');

    int fd = ::mkstemps(tmpl.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        return std::unexpected(std::format("mkstemps({}) failed: {}", path, std::strerror(errno)));
    }
    ::close(fd);

    return TempFile(std::string(tmpl.data()));
}

TempFile::~TempFile() {
    remove();
}

TempFile::TempFile(TempFile&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

bool TempFile::remove() {
    if (path_.empty()) return true;

    std::error_code ec;
    if (fs::exists(path_, ec)) {
        fs::remove(path_, ec);
        if (ec) {
            std::println(stderr, "tempfile: could not remove {}: {}", path_, ec.message());
            return false;
        }
    }
    path_.clear();
    return true;
}

std::string sanitize_suffix(std::string_view filename) {
    auto sep = filename.find_last_of("/\\");
    if (sep != std::string_view::npos) {
        filename.remove_prefix(sep + 1);
    }

    std::string out;
    out.reserve(filename.size());
    for (char c : filename) {
        out.push_back(is_safe_char(c) ? c : '_');
    }

    auto first = out.find_first_not_of('.');
    out.erase(0, first == std::string::npos ? out.size() : first);

    if (out.size() > kMaxSuffixBytes) {
        // Keep the tail so the extension survives.
        out.erase(0, out.size() - kMaxSuffixBytes);
        first = out.find_first_not_of('.');
        out.erase(0, first == std::string::npos ? out.size() : first);
    }

    if (out.empty()) out = "upload";
    return out;
}
