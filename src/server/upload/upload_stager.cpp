#include "upload/upload_stager.hpp"

#include <print>
#include <utility>

UploadStager::UploadStager(std::string temp_dir, std::string field_name)
    : temp_dir_(std::move(temp_dir)), field_name_(std::move(field_name)) {}

bool UploadStager::begin_part(const std::string& name, const std::string& filename) {
    if (out_.is_open()) out_.close();
    in_target_ = false;

    // Only the first part carrying the field is staged.
    if (name != field_name_ || upload_) return true;

    auto file = TempFile::create(temp_dir_, "upload_", "_" + sanitize_suffix(filename));
    if (!file) {
        error_ = file.error();
        std::println(stderr, "upload: {}", error_);
        return false;
    }

    out_.open(file->path(), std::ios::binary | std::ios::trunc);
    if (!out_.is_open()) {
        error_ = "could not open " + file->path() + " for writing";
        std::println(stderr, "upload: {}", error_);
        return false;
    }

    upload_ = StagedUpload{
        .filename = filename,
        .file = std::move(*file),
        .bytes = 0,
    };
    in_target_ = true;
    return true;
}

bool UploadStager::append(const char* data, size_t len) {
    if (!in_target_) return true;

    out_.write(data, static_cast<std::streamsize>(len));
    if (!out_) {
        error_ = "write to " + upload_->file.path() + " failed";
        std::println(stderr, "upload: {}", error_);
        return false;
    }
    upload_->bytes += len;
    return true;
}

std::optional<StagedUpload> UploadStager::take() {
    if (out_.is_open()) {
        out_.close();
        if (!out_ && upload_) {
            error_ = "closing " + upload_->file.path() + " failed";
            std::println(stderr, "upload: {}", error_);
        }
    }
    in_target_ = false;
    return std::exchange(upload_, std::nullopt);
}
