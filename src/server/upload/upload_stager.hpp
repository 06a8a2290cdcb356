#pragma once

#include "upload/temp_file.hpp"

#include <cstddef>
#include <fstream>
#include <optional>
#include <string>

// One request's uploaded file, staged on disk. Destroying it deletes the file.
struct StagedUpload {
    std::string filename;   // as sent by the client; echo only, never a path
    TempFile file;
    size_t bytes = 0;
};

// Receives multipart parts as they stream in and writes the one named
// field_name to a temp file. Nothing is created on disk until that part
// starts, so a request without a file leaves no trace.
class UploadStager {
public:
    explicit UploadStager(std::string temp_dir, std::string field_name = "file");

    UploadStager(const UploadStager&) = delete;
    UploadStager& operator=(const UploadStager&) = delete;

    // Part header callback. Returns false if the temp file could not be created.
    bool begin_part(const std::string& name, const std::string& filename);

    // Part content callback. Data for parts other than the target is dropped.
    bool append(const char* data, size_t len);

    // Closes the temp file and hands it over. Empty if no file part arrived.
    std::optional<StagedUpload> take();

    bool failed() const { return !error_.empty(); }
    const std::string& error() const { return error_; }

private:
    std::string temp_dir_;
    std::string field_name_;

    bool in_target_ = false;
    std::optional<StagedUpload> upload_;
    std::ofstream out_;
    std::string error_;
};
