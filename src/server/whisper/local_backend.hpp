#pragma once

#include "backend.hpp"

#include <memory>
#include <string>

struct whisper_context;

// In-process whisper.cpp. The model is loaded once and never modified
// afterwards; every call runs on its own whisper_state, so one backend
// serves any number of workers.
class LocalBackend : public WhisperBackend {
public:
    struct Options {
        std::string model_path;
        std::string language = "auto";
        int threads = 4;
    };

    // Returns nullptr if the model cannot be loaded.
    static std::unique_ptr<LocalBackend> load(Options opts);

    ~LocalBackend() override;

    LocalBackend(const LocalBackend&) = delete;
    LocalBackend& operator=(const LocalBackend&) = delete;

    std::expected<TranscriptResult, std::string>
        transcribe(const std::string& wav_path) override;

private:
    LocalBackend(Options opts, whisper_context* ctx);

    Options opts_;
    whisper_context* const ctx_;
};
